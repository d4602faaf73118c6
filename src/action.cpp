#include "action.hpp"

#include "common.hpp"
#include "defense.hpp"
#include "dice.hpp"
#include "entity.hpp"

#include <optional>
#include <sstream>

namespace {

using Slots = std::vector<std::optional<std::string>>;

const std::string* slotAt(const Slots& s, size_t i) {
    if (i >= s.size() || !s[i]) return nullptr;
    return &*s[i];
}

// Expands a modifier attribute into one slot per consuming sub-verb.
bool expandList(const ActionDescriptor& action, const std::string& key, size_t consumers, Slots& out, std::string* err) {
    out.clear();
    if (consumers == 0) return true;

    const AttrValue* v = action.get(key);
    if (!v) {
        out.assign(consumers, std::nullopt);
        return true;
    }

    const std::vector<std::string> items = v->items();
    if (items.size() == 1) {
        out.assign(consumers, items.front());
        return true;
    }
    if (items.size() != consumers) {
        if (err) {
            std::ostringstream ss;
            ss << "arity mismatch: " << action.verb << " " << key << " has " << items.size()
               << " values for " << consumers << " sub-verbs";
            *err = ss.str();
        }
        return false;
    }
    for (const std::string& item : items) out.push_back(item);
    return true;
}

bool baseInt(const VerbParts& v, const char* what, const std::string* base, int& out, std::string* err) {
    out = 0;
    if (!base) return true;
    if (parseStrictInt(trim(*base), out)) return true;
    if (err) *err = v.verb + ": " + what + " '" + *base + "' is not an integer";
    return false;
}

// Rolls the initiator's formula attribute, if it has one.
bool rollBonus(const Entity& initiator, const std::string& key, RNG& rng, int& out, std::string* err) {
    out = 0;
    const AttrValue* v = initiator.get(key);
    if (!v) return true;
    return rollFormula(rng, v->text(), out, err);
}

void recordDelivery(ActionDescriptor& action, const SubAction& sub) {
    action.set("TO_HIT", sub.toHit);
    if (sub.parts.attack) {
        action.set("HIT_POINTS", sub.hitPoints);
    } else {
        action.set("TOTAL", sub.total);
    }
}

} // namespace

VerbParts splitVerb(const std::string& verb) {
    VerbParts p;
    p.verb = verb;
    const size_t dot = verb.find('.');
    if (dot == std::string::npos) {
        p.base = verb;
    } else {
        p.base = verb.substr(0, dot);
        const size_t next = verb.find('.', dot + 1);
        p.subType = verb.substr(dot + 1, next == std::string::npos ? std::string::npos : next - dot - 1);
    }
    p.attack = p.base.find("ATTACK") != std::string::npos;
    return p;
}

std::vector<std::string> splitCompoundVerb(const std::string& verb) {
    return splitOn(verb, '+');
}

ActionDescriptor::ActionDescriptor(const AttributeStore* src, std::string v)
    : AttributeStore(v), source(src), verb(std::move(v)) {
    // Non-attacks deliver one stack unless told otherwise.
    if (verb.find("ATTACK") == std::string::npos) set("STACKS", "1");
}

std::string ActionDescriptor::sourceName() const {
    return source ? source->name : std::string("nothing");
}

std::string ActionDescriptor::describe() const {
    auto show = [&](const char* key) {
        const AttrValue* v = get(key);
        return v ? v->text() : std::string("none");
    };
    std::ostringstream ss;
    if (verb.find("ATTACK") != std::string::npos) {
        ss << verb << " (ACCURACY=" << show("ACCURACY") << "%, DAMAGE=" << show("DAMAGE") << ")";
    } else {
        ss << verb << " (POWER=" << show("POWER") << "%, STACKS=" << show("STACKS") << ")";
    }
    return ss.str();
}

std::string SubAction::sourceName() const {
    return source ? source->name : std::string("nothing");
}

bool computeAccuracy(const VerbParts& v, const std::string* base, const Entity& initiator, int& out, std::string* err) {
    int accuracy = 0;
    if (!baseInt(v, "ACCURACY", base, accuracy, err)) return false;

    int bonus = 0;
    if (!initiator.readInt("ACCURACY", bonus, err)) return false;
    accuracy += bonus;

    if (v.hasSubType()) {
        if (!initiator.readInt("ACCURACY." + v.subType, bonus, err)) return false;
        accuracy += bonus;
    }

    out = accuracy;
    return true;
}

bool computeDamage(const VerbParts& v, const std::string* base, const Entity& initiator, RNG& rng, int& out, std::string* err) {
    int damage = 0;
    if (base && !rollFormula(rng, *base, damage, err)) return false;

    int bonus = 0;
    if (!rollBonus(initiator, "DAMAGE", rng, bonus, err)) return false;
    damage += bonus;

    if (v.hasSubType()) {
        if (!rollBonus(initiator, "DAMAGE." + v.subType, rng, bonus, err)) return false;
        damage += bonus;
    }

    out = damage;
    return true;
}

bool computePower(const VerbParts& v, const std::string* base, const Entity& initiator, int& out, std::string* err) {
    int power = 0;
    if (!baseInt(v, "POWER", base, power, err)) return false;

    int bonus = 0;
    if (!initiator.readInt("POWER." + v.base, bonus, err)) return false;
    power += bonus;

    if (v.hasSubType()) {
        if (!initiator.readInt("POWER." + v.base + "." + v.subType, bonus, err)) return false;
        power += bonus;
    }

    out = power;
    return true;
}

bool computeStacks(const VerbParts& v, const std::string* base, const Entity& initiator, RNG& rng, int& out, std::string* err) {
    // Unlike damage, a missing base means one stack.
    int stacks = 1;
    if (base && !rollFormula(rng, *base, stacks, err)) return false;

    int bonus = 0;
    if (!rollBonus(initiator, "STACKS." + v.base, rng, bonus, err)) return false;
    stacks += bonus;

    if (v.hasSubType()) {
        if (!rollBonus(initiator, "STACKS." + v.base + "." + v.subType, rng, bonus, err)) return false;
        stacks += bonus;
    }

    out = stacks;
    return true;
}

ActionResult act(ActionDescriptor& action, Entity& initiator, Entity& target, Entity* context, RNG& rng) {
    ActionResult result;

    std::vector<VerbParts> verbs;
    size_t attacks = 0;
    size_t conditions = 0;
    for (const std::string& token : splitCompoundVerb(action.verb)) {
        if (token.empty()) {
            result.error = "empty sub-verb in '" + action.verb + "'";
            return result;
        }
        verbs.push_back(splitVerb(token));
        if (verbs.back().attack) ++attacks;
        else ++conditions;
    }

    Slots accuracies, damages, powers, stacks;
    if (!expandList(action, "ACCURACY", attacks, accuracies, &result.error) ||
        !expandList(action, "DAMAGE", attacks, damages, &result.error) ||
        !expandList(action, "POWER", conditions, powers, &result.error) ||
        !expandList(action, "STACKS", conditions, stacks, &result.error)) {
        return result;
    }

    size_t attackIdx = 0;
    size_t conditionIdx = 0;
    for (const VerbParts& v : verbs) {
        SubAction sub;
        sub.parts = v;
        sub.source = action.source;

        bool ok = true;
        if (v.attack) {
            int accuracy = 0;
            ok = computeAccuracy(v, slotAt(accuracies, attackIdx), initiator, accuracy, &result.error) &&
                 computeDamage(v, slotAt(damages, attackIdx), initiator, rng, sub.hitPoints, &result.error);
            sub.toHit = 100 + accuracy;
            ++attackIdx;
        } else {
            int power = 0;
            ok = computePower(v, slotAt(powers, conditionIdx), initiator, power, &result.error) &&
                 computeStacks(v, slotAt(stacks, conditionIdx), initiator, rng, sub.total, &result.error);
            sub.toHit = 100 + power;
            ++conditionIdx;
        }
        if (!ok) {
            result.success = false;
            break;
        }

        ActionResult r = acceptAction(target, sub, initiator, context, rng);
        result.deliveries.push_back(sub);
        if (!r.text.empty()) {
            if (!result.text.empty()) result.text += "\n";
            result.text += r.text;
        }
        if (r.aborted()) {
            result.error = r.error;
            result.success = false;
            break;
        }

        result.success = r.success;
        if (!r.success) break;
    }

    if (!result.deliveries.empty()) recordDelivery(action, result.deliveries.back());
    return result;
}

ActionResult takeAction(Entity& actor, ActionDescriptor& action, Entity& target, RNG& rng) {
    return act(action, actor, target, actor.context, rng);
}
