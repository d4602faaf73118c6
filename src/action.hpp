#pragma once

#include "attributes.hpp"
#include "rng.hpp"

#include <string>
#include <vector>

struct Entity;

// A verb such as "ATTACK.slash" split into its parts.
struct VerbParts {
    std::string verb;     // the full token
    std::string base;     // before the first '.'
    std::string subType;  // segment after the first '.', empty if none
    bool attack = false;  // base segment contains ATTACK

    bool hasSubType() const { return !subType.empty(); }
};

VerbParts splitVerb(const std::string& verb);

// Splits a compound verb ("ATTACK.one+MENTAL.two") into its sub-verbs.
std::vector<std::string> splitCompoundVerb(const std::string& verb);

// A requested action. The modifier attributes (ACCURACY, DAMAGE, POWER,
// STACKS) may hold one value per consuming sub-verb as a comma list.
struct ActionDescriptor : AttributeStore {
    ActionDescriptor(const AttributeStore* source, std::string verb);

    const AttributeStore* source = nullptr;  // weapon/spell/scroll; not owned
    std::string verb;

    std::string sourceName() const;

    // "ATTACK.slash (ACCURACY=10%, DAMAGE=D6)"
    std::string describe() const;
};

// Immutable view of one sub-verb of an action, with the values the
// initiator computed for it. This is what the target sees.
struct SubAction {
    VerbParts parts;
    const AttributeStore* source = nullptr;
    int toHit = 0;
    int hitPoints = 0;  // attacks
    int total = 0;      // conditions: signed stack count

    const std::string& verb() const { return parts.verb; }
    std::string sourceName() const;
};

struct ActionResult {
    bool success = false;
    std::string text;
    std::string error;                 // non-empty: resolution was aborted
    std::vector<SubAction> deliveries; // sub-verbs that reached the target

    bool aborted() const { return !error.empty(); }
};

// Initiator-side values. Each returns false (with err) on a malformed
// formula or a non-integer bonus.
bool computeAccuracy(const VerbParts& v, const std::string* base, const Entity& initiator, int& out, std::string* err);
bool computeDamage(const VerbParts& v, const std::string* base, const Entity& initiator, RNG& rng, int& out, std::string* err);
bool computePower(const VerbParts& v, const std::string* base, const Entity& initiator, int& out, std::string* err);
bool computeStacks(const VerbParts& v, const std::string* base, const Entity& initiator, RNG& rng, int& out, std::string* err);

// Resolves the action sub-verb by sub-verb against the target, stopping at
// the first sub-verb the target rejects. When it returns, the descriptor's
// TO_HIT and HIT_POINTS/TOTAL hold the values of the last delivery.
ActionResult act(ActionDescriptor& action, Entity& initiator, Entity& target, Entity* context, RNG& rng);

// act() with the actor as initiator, in the actor's current context.
ActionResult takeAction(Entity& actor, ActionDescriptor& action, Entity& target, RNG& rng);
