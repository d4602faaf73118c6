#pragma once

#include "attributes.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

// What an entity is decides how it responds to incoming actions
// (see defense.hpp for the per-kind handler chains).
enum class EntityKind : uint8_t {
    Object = 0,  // weapons, scrolls, furniture: generic resistance only
    Context,     // locations; delegate attribute lookups to their parent
    Actor,       // characters; mitigate attacks with EVASION/PROTECTION/LIFE
    Guard,       // NPC fighter; counter-targets attackers, calls for help
};

const char* entityKindName(EntityKind k);

// Well-known attribute names.
inline const char* const ATTR_LIFE = "LIFE";
inline const char* const ATTR_MAX_LIFE = "HP";
inline const char* const ATTR_ACTIONS = "ACTIONS";
inline const char* const ATTR_INTERACTIONS = "INTERACTIONS";
inline const char* const ATTR_REINFORCEMENTS = "reinforcements";

struct Entity : AttributeStore {
    explicit Entity(EntityKind k = EntityKind::Object, std::string name = "object", std::string description = "");

    EntityKind kind = EntityKind::Object;

    // Owned objects (inventory, or the contents of a location), in insertion order.
    std::vector<std::unique_ptr<Entity>> objects;

    // --- Context fields ---
    // Attribute lookups that miss locally continue here. Never a cycle.
    Entity* parent = nullptr;
    std::vector<Entity*> party;  // player-controlled members (not owned)
    std::vector<Entity*> npcs;   // non-player members (not owned)
    std::vector<std::unique_ptr<Entity>> summoned; // NPCs that arrived during play

    // --- Actor fields ---
    Entity* context = nullptr;
    bool alive = true;
    bool incapacitated = false;

    // --- Guard fields ---
    Entity* target = nullptr;  // who to hit on our next turn
    std::unique_ptr<Entity> weapon;  // wielded, not part of `objects`
    bool helpArrived = false;

    const AttrValue* get(const std::string& key) const override;

    bool isActor() const { return kind == EntityKind::Actor || kind == EntityKind::Guard; }

    // Takes ownership. Returns the stored object, or the existing one if it
    // was already ours.
    Entity* addObject(std::unique_ptr<Entity> item);

    // Visible objects (found or never concealed), or with hidden=true the
    // concealed ones that have not been found yet.
    std::vector<Entity*> getObjects(bool hidden = false) const;

    // First owned object whose name contains `name`.
    Entity* getObject(const std::string& name) const;

    void addMember(Entity* member);
    void addNpc(Entity* npc);

    // Takes ownership of an entity created during play and registers it as
    // one of our NPCs.
    Entity* summon(std::unique_ptr<Entity> npc);
};

bool isConcealed(const Entity& e);
bool isFound(const Entity& e);

std::unique_ptr<Entity> makeObject(std::string name, std::string description = "");
std::unique_ptr<Entity> makeContext(std::string name = "context", std::string description = "", Entity* parent = nullptr);
std::unique_ptr<Entity> makeActor(std::string name = "actor", std::string description = "");

// A low-level fighter with a sword. The sword is held in `weapon` and is not
// one of the guard's objects. All defaults can be overridden after
// construction (or by loading a definition file into it).
std::unique_ptr<Entity> makeGuard(std::string name = "guard", std::string description = "");
