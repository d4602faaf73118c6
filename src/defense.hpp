#pragma once

#include "action.hpp"
#include "rng.hpp"

#include <vector>

struct Entity;
struct DefenseCall;

// One link of a defense chain. Returns true when it produced the final
// result in `out`, false to hand the action to the next stage.
using DefenseStage = bool (*)(DefenseCall& call, ActionResult& out);

// State for one incoming sub-action while it walks a chain.
struct DefenseCall {
    Entity& self;
    const SubAction& action;
    Entity& initiator;
    Entity* context;
    RNG& rng;

    const std::vector<DefenseStage>& chain;
    size_t index = 0;

    // Runs the remaining stages (after the current one) and returns their
    // result. Lets a stage wrap the more generic behavior.
    ActionResult next();
};

// Stages, most specific first.
bool contextSearchStage(DefenseCall& call, ActionResult& out);
bool attackMitigationStage(DefenseCall& call, ActionResult& out);
bool genericResistanceStage(DefenseCall& call, ActionResult& out);

// The ordered stage list for a kind of entity.
const std::vector<DefenseStage>& defenseChainFor(const Entity& e);

// Receives one sub-action on behalf of `self`.
ActionResult acceptAction(Entity& self, const SubAction& action, Entity& initiator, Entity* context, RNG& rng);
