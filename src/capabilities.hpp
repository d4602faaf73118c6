#pragma once

#include "action.hpp"

#include <memory>
#include <vector>

struct Entity;

// The actions an object (or actor, or context) currently offers, one per
// entry of its comma-separated ACTIONS attribute.
//
// For every sub-verb of a compound entry:
//   attacks:    ACCURACY = ACCURACY + ACCURACY.<subtype>          (summed)
//               DAMAGE   = DAMAGE.<subtype>, else DAMAGE, else 0  (not summed)
//   conditions: POWER    = POWER + POWER.<verb>                   (summed)
//               STACKS   = STACKS.<verb>, else STACKS, else 1     (not summed)
// and the per-sub-verb values are joined with commas in sub-verb order.
//
// Dice formulas are not added together: a sub-type formula replaces the
// base one.
std::vector<ActionDescriptor> possibleActions(const Entity& provider);

// Interaction actions an NPC offers to `requester`: a transient object whose
// ACTIONS are the NPC's INTERACTIONS, each as a VERBAL.<verb>.
std::unique_ptr<Entity> interactions(const Entity& npc, const Entity& requester);
