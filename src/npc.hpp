#pragma once

#include "action.hpp"
#include "defense.hpp"
#include "rng.hpp"

struct Entity;

// Guard-specific front of the defense chain. Lets the rest of the chain
// resolve the action first, then (for a survived ATTACK) marks the attacker
// as the guard's target and may summon one reinforcement into the context.
bool guardReactionStage(DefenseCall& call, ActionResult& out);

// Gives an entity its turn. Guards with a living target attack it with a
// randomly chosen action of their weapon; everyone else takes no action.
ActionResult takeTurn(Entity& self, RNG& rng);
