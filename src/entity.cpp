#include "entity.hpp"

#include <algorithm>
#include <utility>

const char* entityKindName(EntityKind k) {
    switch (k) {
        case EntityKind::Object: return "OBJECT";
        case EntityKind::Context: return "CONTEXT";
        case EntityKind::Actor: return "ACTOR";
        case EntityKind::Guard: return "GUARD";
        default: return "THING";
    }
}

Entity::Entity(EntityKind k, std::string n, std::string descr)
    : AttributeStore(std::move(n), std::move(descr)), kind(k) {}

const AttrValue* Entity::get(const std::string& key) const {
    if (const AttrValue* v = getLocal(key)) return v;
    if (parent) return parent->get(key);
    return nullptr;
}

Entity* Entity::addObject(std::unique_ptr<Entity> item) {
    if (!item) return nullptr;
    for (const auto& o : objects) {
        if (o.get() == item.get()) {
            // Already ours: keep the one stored copy alive.
            return item.release();
        }
    }
    objects.push_back(std::move(item));
    return objects.back().get();
}

bool isConcealed(const Entity& e) {
    int v = 0;
    return e.readInt("RESISTANCE.SEARCH", v) && v > 0;
}

bool isFound(const Entity& e) {
    int v = 0;
    return e.readInt("SEARCH", v) && v > 0;
}

std::vector<Entity*> Entity::getObjects(bool hidden) const {
    std::vector<Entity*> out;
    for (const auto& o : objects) {
        const bool concealed = isConcealed(*o);
        const bool found = isFound(*o);
        if (hidden) {
            if (concealed && !found) out.push_back(o.get());
        } else {
            if (found || !concealed) out.push_back(o.get());
        }
    }
    return out;
}

Entity* Entity::getObject(const std::string& n) const {
    for (const auto& o : objects) {
        if (o->name.find(n) != std::string::npos) return o.get();
    }
    return nullptr;
}

void Entity::addMember(Entity* member) {
    if (!member) return;
    if (std::find(party.begin(), party.end(), member) == party.end()) party.push_back(member);
}

void Entity::addNpc(Entity* npc) {
    if (!npc) return;
    if (std::find(npcs.begin(), npcs.end(), npc) == npcs.end()) npcs.push_back(npc);
}

Entity* Entity::summon(std::unique_ptr<Entity> npc) {
    if (!npc) return nullptr;
    Entity* raw = npc.get();
    summoned.push_back(std::move(npc));
    raw->context = this;
    addNpc(raw);
    return raw;
}

std::unique_ptr<Entity> makeObject(std::string name, std::string description) {
    return std::make_unique<Entity>(EntityKind::Object, std::move(name), std::move(description));
}

std::unique_ptr<Entity> makeContext(std::string name, std::string description, Entity* parent) {
    auto c = std::make_unique<Entity>(EntityKind::Context, std::move(name), std::move(description));
    c->parent = parent;
    return c;
}

std::unique_ptr<Entity> makeActor(std::string name, std::string description) {
    return std::make_unique<Entity>(EntityKind::Actor, std::move(name), std::move(description));
}

std::unique_ptr<Entity> makeGuard(std::string name, std::string description) {
    auto g = std::make_unique<Entity>(EntityKind::Guard, std::move(name), std::move(description));
    g->set(ATTR_MAX_LIFE, 16);
    g->set(ATTR_LIFE, 16);
    g->set("ACCURACY", 10);
    g->set("EVASION", 40);
    g->set("EVASION.slash", 20);   // slashes are harder to dodge
    g->set("PROTECTION", 2);       // cheap armor
    g->set(ATTR_REINFORCEMENTS, 0);

    auto sword = makeObject("sword");
    sword->set(ATTR_ACTIONS, "ATTACK.slash");
    sword->set("DAMAGE.slash", "D6");
    g->weapon = std::move(sword);
    return g;
}
