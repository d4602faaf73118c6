#include "scenario.hpp"

#include "action.hpp"
#include "capabilities.hpp"
#include "entity.hpp"
#include "entity_loader.hpp"
#include "npc.hpp"

#include <filesystem>
#include <ostream>
#include <sstream>

namespace {

bool loadInto(const Settings& s, const std::string& file, Entity& e, std::ostream& diag, std::string* err) {
    const std::string path = dataPath(s, file);
    std::string warnings;
    if (!loadEntityFile(path, e, &warnings)) {
        if (err) *err = "cannot read " + path;
        return false;
    }
    if (!warnings.empty()) diag << path << ":\n" << warnings;
    return true;
}

std::string attrText(const AttributeStore& e, const std::string& key) {
    const AttrValue* v = e.get(key);
    return v ? v->text() : std::string("none");
}

void printIndented(std::ostream& out, const std::string& text) {
    std::istringstream lines(text);
    std::string line;
    while (std::getline(lines, line)) out << "    " << line << "\n";
}

bool failed(const ActionResult& r, std::string* err) {
    if (!r.aborted()) return false;
    if (err) *err = r.error;
    return true;
}

// Reads a scroll (or similar single-action object) on oneself.
bool useOnSelf(Entity& hero, Entity& local, const std::string& item, const std::string& attr, RNG& rng,
               std::ostream& out, std::string* err) {
    Entity* scroll = hero.getObject(item);
    if (!scroll) {
        out << "\n" << hero.name << " has no " << item << "\n";
        return true;
    }
    std::vector<ActionDescriptor> actions = possibleActions(*scroll);
    if (actions.empty()) {
        out << "\n" << scroll->label() << " does nothing\n";
        return true;
    }

    out << "\n" << hero.name << " reads " << scroll->label() << "\n";
    ActionResult r = act(actions.front(), hero, hero, &local, rng);
    if (failed(r, err)) return false;
    printIndented(out, r.text);
    out << "    " << hero.name << " now has " << attrText(hero, attr) << " " << attr << "\n";
    return true;
}

} // namespace

std::string dataPath(const Settings& settings, const std::string& file) {
    const std::filesystem::path p(file);
    if (p.is_absolute() || settings.dataDir.empty()) return p.string();
    return (std::filesystem::path(settings.dataDir) / p).string();
}

bool runScenario(const Settings& settings, RNG& rng, std::ostream& out, std::ostream& diag, std::string* err) {
    // A town square within a village.
    auto village = makeContext("Snaefelness", "village on north end of island");
    auto local = makeContext("context", "", village.get());
    if (!loadInto(settings, settings.contextFile, *local, diag, err)) return false;
    out << "In the " << local->name << " in " << village->name << " (" << village->description << ")\n\n";

    auto hero = makeActor();
    if (!loadInto(settings, settings.heroFile, *hero, diag, err)) return false;
    hero->context = local.get();
    local->addMember(hero.get());

    auto guard = makeGuard();
    if (!loadInto(settings, settings.guardFile, *guard, diag, err)) return false;
    guard->context = local.get();
    local->addNpc(guard.get());

    out << "    party:\n";
    for (const Entity* p : local->party) out << "\t" << p->name << " ... " << p->description << "\n";
    out << "\n    NPCs:\n";
    for (const Entity* p : local->npcs) out << "\t" << p->name << " ... " << p->description << "\n";
    out << "\n    undiscovered objects:\n";
    for (const Entity* o : local->getObjects(true)) out << "\t" << o->name << " ... " << o->description << "\n";
    out << "\n";

    // Whatever the location itself affords (e.g. SEARCH).
    for (ActionDescriptor& action : possibleActions(*local)) {
        if (settings.echoValues) out << "  " << action.describe() << "\n";
        ActionResult r = takeAction(*hero, action, *local, rng);
        if (failed(r, err)) return false;
        out << hero->name << " tries to " << action.verb << "(power=" << attrText(*hero, "POWER." + action.verb)
            << ") in " << local->name << "\n";
        printIndented(out, r.text);
        out << "\n";
    }

    const std::vector<Entity*> stillHidden = local->getObjects(true);
    if (stillHidden.empty()) {
        out << "after which ... no hidden objects remain\n";
    } else {
        out << "after which ... undiscovered objects:\n";
        for (const Entity* o : stillHidden) out << "\t" << o->name << " ... " << o->description << "\n";
    }

    // Every interaction the guard offers.
    auto talk = interactions(*guard, *hero);
    for (ActionDescriptor& action : possibleActions(*talk)) {
        if (settings.echoValues) out << "  " << action.describe() << "\n";
        ActionResult r = takeAction(*hero, action, *guard, rng);
        if (failed(r, err)) return false;
        out << "\n" << hero->name << " uses " << action.verb << " interaction on " << guard->name << "\n";
        printIndented(out, r.text);
        out << "    " << guard->name << "." << action.verb << " = " << attrText(*guard, action.verb) << "\n";
    }

    // The hero's own actions, tried on the guard.
    for (ActionDescriptor& action : possibleActions(*hero)) {
        if (settings.echoValues) out << "  " << action.describe() << "\n";
        ActionResult r = takeAction(*hero, action, *guard, rng);
        if (failed(r, err)) return false;
        out << "\n" << hero->name << " tries to " << action.verb << " " << guard->name << "\n";
        printIndented(out, r.text);
        out << "    " << guard->name << "." << action.verb << " = " << attrText(*guard, action.verb) << "\n";
    }
    out << "\n";

    if (!settings.combat) return true;

    // The hero takes up a sword and they fight to the death.
    Entity* weapon = hero->getObject("sword");
    if (!weapon) {
        if (err) *err = hero->name + " has no sword";
        return false;
    }
    std::vector<ActionDescriptor> attacks = possibleActions(*weapon);
    if (attacks.empty()) {
        if (err) *err = weapon->name + " offers no actions";
        return false;
    }

    Entity* target = guard.get();
    int rounds = 0;
    int life = 0;
    while (target && hero->readInt(ATTR_LIFE, life) && life > 0 && rounds < settings.maxRounds) {
        ++rounds;
        ActionDescriptor& attack = attacks[static_cast<size_t>(rng.range(0, static_cast<int>(attacks.size()) - 1))];
        if (settings.echoValues) out << "  " << attack.describe() << "\n";
        ActionResult r = takeAction(*hero, attack, *target, rng);
        if (failed(r, err)) return false;
        out << "\n" << hero->name << " uses " << weapon->name << " to " << attack.verb << " " << target->name
            << ", delivered=" << attrText(attack, "HIT_POINTS") << "\n";
        printIndented(out, r.text);

        // Every NPC still standing gets a turn; the first one is next round's target.
        target = nullptr;
        for (size_t i = 0; i < local->npcs.size(); ++i) {
            Entity* npc = local->npcs[i];
            if (npc->incapacitated) continue;
            ActionResult t = takeTurn(*npc, rng);
            if (failed(t, err)) return false;
            out << "\n" << t.text << "\n";
            if (!target) target = npc;
        }
    }

    out << "\nAfter the combat:\n";
    out << "    " << hero->name << " has " << attrText(*hero, ATTR_LIFE) << " LIFE\n";
    for (const Entity* npc : local->npcs) {
        if (npc->alive) out << "    " << npc->name << " has " << attrText(*npc, ATTR_LIFE) << " LIFE\n";
        else out << "    " << npc->name << " is dead\n";
    }

    if (!useOnSelf(*hero, *local, "CLW", ATTR_LIFE, rng, out, err)) return false;

    // The guard turns the hero's own poisoned dagger on them until it lands.
    if (Entity* dagger = hero->getObject("Dagger")) {
        out << "\n" << hero->name << " attacked by " << dagger->label() << "\n";
        std::vector<ActionDescriptor> stabs = possibleActions(*dagger);
        for (int tries = 0; !stabs.empty() && tries < settings.maxRounds; ++tries) {
            ActionResult r = act(stabs.front(), *guard, *hero, local.get(), rng);
            if (failed(r, err)) return false;
            printIndented(out, r.text);
            for (const char* attr : {"PHYSICAL.POISON", "MENTAL.FEAR"}) {
                if (hero->has(attr)) out << "    " << hero->name << " now has " << attrText(*hero, attr) << " of " << attr << "\n";
            }
            if (r.success) break;
        }
    }

    return useOnSelf(*hero, *local, "Courage", "MENTAL.FEAR", rng, out, err);
}
