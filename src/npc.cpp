#include "npc.hpp"

#include "capabilities.hpp"
#include "entity.hpp"

#include <sstream>
#include <utility>

bool guardReactionStage(DefenseCall& call, ActionResult& out) {
    Entity& self = call.self;
    if (call.context) self.context = call.context;

    out = call.next();
    if (out.aborted() || call.action.parts.base != "ATTACK") return true;

    int life = 0;
    if (!self.readInt(ATTR_LIFE, life, &out.error)) return true;
    if (life <= 0 || !self.alive) return true;

    // Counter-attack on our next turn.
    self.target = &call.initiator;

    int reinforcements = 0;
    if (!self.readInt(ATTR_REINFORCEMENTS, reinforcements, &out.error)) return true;
    if (reinforcements <= 0 || self.helpArrived) return true;

    out.text += "\n    " + self.name + " calls for help";
    if (d100(call.rng) > reinforcements) return true;

    if (!self.context) {
        out.text += ", but nobody is near enough to hear";
        return true;
    }

    auto helper = makeGuard(self.name + " (reinforcement)", "answered a call for help");
    helper->target = &call.initiator;
    Entity* arrived = self.context->summon(std::move(helper));
    out.text += ", and " + arrived->name + " arrives";
    self.helpArrived = true;
    return true;
}

ActionResult takeTurn(Entity& self, RNG& rng) {
    ActionResult r;
    if (self.incapacitated) {
        r.text = self.name + " is in no condition to act";
        return r;
    }

    if (self.kind == EntityKind::Guard && self.target && !self.target->alive) {
        self.target = nullptr;
    }
    if (self.kind != EntityKind::Guard || !self.target || !self.weapon) {
        r.text = self.name + " takes no action";
        return r;
    }

    std::vector<ActionDescriptor> actions = possibleActions(*self.weapon);
    if (actions.empty()) {
        r.text = self.name + " takes no action";
        return r;
    }

    ActionDescriptor& attack = actions[static_cast<size_t>(rng.range(0, static_cast<int>(actions.size()) - 1))];
    ActionResult hit = takeAction(self, attack, *self.target, rng);

    const AttrValue* delivered = attack.get("HIT_POINTS");
    std::ostringstream ss;
    ss << self.name << " uses " << self.weapon->name << " to " << attack.verb << " " << self.target->name
       << ", delivered=" << (delivered ? delivered->text() : std::string("none"))
       << "\n    " << hit.text;
    hit.text = ss.str();
    return hit;
}
