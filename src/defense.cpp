#include "defense.hpp"

#include "entity.hpp"
#include "npc.hpp"

#include <cstdlib>
#include <sstream>

namespace {

std::string contextName(const Entity* context) {
    return context ? context->name : std::string("nowhere");
}

ActionResult runChain(DefenseCall& call, size_t from) {
    for (size_t i = from; i < call.chain.size(); ++i) {
        call.index = i;
        ActionResult out;
        if (call.chain[i](call, out)) return out;
    }

    ActionResult none;
    none.text = call.self.name + " ignores " + call.action.verb();
    return none;
}

// Sums base, base-verb and sub-type values of a defensive attribute,
// e.g. RESISTANCE + RESISTANCE.MENTAL + RESISTANCE.MENTAL.FEAR.
bool sumLayered(const Entity& self, const std::string& attr, const VerbParts& v, bool includeBase, int& out, std::string* err) {
    out = 0;
    int term = 0;
    if (!self.readInt(attr, term, err)) return false;
    out += term;

    std::string key = attr;
    if (includeBase) {
        key += "." + v.base;
        if (!self.readInt(key, term, err)) return false;
        out += term;
    }
    if (v.hasSubType()) {
        if (!self.readInt(key + "." + v.subType, term, err)) return false;
        out += term;
    }
    return true;
}

} // namespace

ActionResult DefenseCall::next() {
    const size_t here = index;
    ActionResult r = runChain(*this, here + 1);
    index = here;
    return r;
}

bool contextSearchStage(DefenseCall& call, ActionResult& out) {
    if (call.self.kind != EntityKind::Context || call.action.verb() != "SEARCH") return false;

    bool foundAny = false;
    for (const auto& thing : call.self.objects) {
        if (!isConcealed(*thing)) continue;

        ActionResult r = acceptAction(*thing, call.action, call.initiator, call.context, call.rng);
        if (r.success) foundAny = true;
        if (!r.text.empty()) {
            if (!out.text.empty()) out.text += "\n    ";
            out.text += r.text;
        }
        if (r.aborted()) {
            out.error = r.error;
            out.success = false;
            return true;
        }
    }

    if (out.text.empty()) out.text = call.initiator.name + " finds nothing hidden in " + call.self.name;
    out.success = foundAny;
    return true;
}

bool attackMitigationStage(DefenseCall& call, ActionResult& out) {
    const SubAction& a = call.action;
    if (a.parts.base != "ATTACK") return false;

    Entity& self = call.self;
    int evasion = 0;
    if (!sumLayered(self, "EVASION", a.parts, false, evasion, &out.error)) return true;

    // Anything short of a sure hit needs a percentile roll under the margin.
    const int toHit = a.toHit - evasion;
    if (toHit < 100 && d100(call.rng) > toHit) {
        std::ostringstream ss;
        ss << self.name << " evades " << a.sourceName() << " " << a.verb()
           << " (TO_HIT=" << a.toHit << ", EVASION=" << evasion << ")";
        out.success = false;
        out.text = ss.str();
        return true;
    }

    int protection = 0;
    if (!sumLayered(self, "PROTECTION", a.parts, false, protection, &out.error)) return true;

    if (protection >= a.hitPoints) {
        std::ostringstream ss;
        ss << self.name << "'s protection absorbs all damage from " << a.verb()
           << " (DAMAGE=" << a.hitPoints << ", PROTECTION=" << protection << ")";
        out.success = false;
        out.text = ss.str();
        return true;
    }

    int oldLife = 0;
    if (!self.readInt(ATTR_LIFE, oldLife, &out.error)) return true;
    const int taken = a.hitPoints - protection;
    const int newLife = oldLife - taken;
    self.set(ATTR_LIFE, newLife);

    std::ostringstream ss;
    ss << self.name << " hit by " << a.verb() << " (TO_HIT=" << a.toHit << ", DAMAGE=" << a.hitPoints << ")"
       << " from " << call.initiator.name << " using " << a.sourceName()
       << " for " << a.hitPoints << "-" << protection << " life-points in " << contextName(call.context)
       << "\n    " << self.name << " life: " << oldLife << " - " << taken << " = " << newLife;

    if (newLife <= 0) {
        ss << ", and is killed";
        self.alive = false;
        self.incapacitated = true;
    }

    out.success = true;
    out.text = ss.str();
    return true;
}

bool genericResistanceStage(DefenseCall& call, ActionResult& out) {
    const SubAction& a = call.action;
    Entity& self = call.self;

    int resistance = 0;
    if (!sumLayered(self, "RESISTANCE", a.parts, true, resistance, &out.error)) return true;

    const int power = a.toHit - resistance;
    if (power <= 0) {
        std::ostringstream ss;
        ss << self.name << " resists " << a.sourceName() << " " << a.verb()
           << " (TO_HIT=" << a.toHit << ", RESISTANCE=" << resistance << ")";
        out.success = false;
        out.text = ss.str();
        return true;
    }

    // Every stack is resisted on its own.
    const int incoming = std::abs(a.total);
    int received = 0;
    for (int i = 0; i < incoming; ++i) {
        if (d100(call.rng) <= power) ++received;
    }

    // A zero total counts as negative (nothing to add).
    const int sgn = (a.total > 0) ? 1 : -1;
    if (received > 0) {
        int have = 0;
        if (!self.readInt(a.verb(), have, &out.error)) return true;
        int updated = have + sgn * received;

        // LIFE can never be raised beyond HP.
        if (a.verb() == ATTR_LIFE && self.has(ATTR_MAX_LIFE)) {
            int maxLife = 0;
            if (!self.readInt(ATTR_MAX_LIFE, maxLife, &out.error)) return true;
            if (updated > maxLife) updated = maxLife;
        }
        self.set(a.verb(), updated);
    }

    std::ostringstream ss;
    ss << self.name << " resists " << (incoming - received) << "/" << incoming << " stacks of "
       << (sgn > 0 ? "" : "(negative) ") << a.verb()
       << " (TO_HIT=" << a.toHit << ", STACKS=" << a.total << ")"
       << " from " << call.initiator.name << " in " << contextName(call.context);

    out.success = received > 0;
    out.text = ss.str();
    return true;
}

const std::vector<DefenseStage>& defenseChainFor(const Entity& e) {
    static const std::vector<DefenseStage> objectChain = {&genericResistanceStage};
    static const std::vector<DefenseStage> contextChain = {&contextSearchStage, &genericResistanceStage};
    static const std::vector<DefenseStage> actorChain = {&attackMitigationStage, &genericResistanceStage};
    static const std::vector<DefenseStage> guardChain = {&guardReactionStage, &attackMitigationStage, &genericResistanceStage};

    switch (e.kind) {
        case EntityKind::Context: return contextChain;
        case EntityKind::Actor: return actorChain;
        case EntityKind::Guard: return guardChain;
        case EntityKind::Object:
        default: return objectChain;
    }
}

ActionResult acceptAction(Entity& self, const SubAction& action, Entity& initiator, Entity* context, RNG& rng) {
    DefenseCall call{self, action, initiator, context, rng, defenseChainFor(self)};
    return runChain(call, 0);
}
