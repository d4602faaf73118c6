#include "capabilities.hpp"

#include "common.hpp"
#include "entity.hpp"

namespace {

int intOrZero(const Entity& e, const std::string& key) {
    const AttrValue* v = e.get(key);
    int out = 0;
    if (v && v->toInt(out)) return out;
    return 0;
}

std::string textOr(const Entity& e, const std::string& key, const std::string& fallback) {
    const AttrValue* v = e.get(key);
    return v ? v->text() : fallback;
}

} // namespace

std::vector<ActionDescriptor> possibleActions(const Entity& provider) {
    std::vector<ActionDescriptor> actions;
    const AttrValue* verbs = provider.get(ATTR_ACTIONS);
    if (!verbs) return actions;

    const int baseAccuracy = intOrZero(provider, "ACCURACY");
    const int basePower = intOrZero(provider, "POWER");
    const std::string baseDamage = textOr(provider, "DAMAGE", "0");
    const std::string baseStacks = textOr(provider, "STACKS", "1");

    for (const std::string& entry : splitOn(verbs->text(), ',')) {
        const std::string compound = trim(entry);
        if (compound.empty()) continue;

        ActionDescriptor action(&provider, compound);

        std::vector<std::string> accuracies, damages, powers, stacks;
        for (const std::string& token : splitCompoundVerb(compound)) {
            const VerbParts v = splitVerb(token);
            if (v.attack) {
                int accuracy = baseAccuracy;
                std::string damage = baseDamage;
                if (v.hasSubType()) {
                    accuracy += intOrZero(provider, "ACCURACY." + v.subType);
                    damage = textOr(provider, "DAMAGE." + v.subType, baseDamage);
                }
                accuracies.push_back(std::to_string(accuracy));
                damages.push_back(damage);
            } else {
                powers.push_back(std::to_string(basePower + intOrZero(provider, "POWER." + token)));
                stacks.push_back(textOr(provider, "STACKS." + token, baseStacks));
            }
        }

        if (!accuracies.empty()) action.set("ACCURACY", joinWith(accuracies, ","));
        if (!damages.empty()) action.set("DAMAGE", joinWith(damages, ","));
        if (!powers.empty()) action.set("POWER", joinWith(powers, ","));
        if (!stacks.empty()) action.set("STACKS", joinWith(stacks, ","));

        actions.push_back(std::move(action));
    }
    return actions;
}

std::unique_ptr<Entity> interactions(const Entity& npc, const Entity& requester) {
    auto out = makeObject("interactions w/" + requester.name);

    std::vector<std::string> verbs;
    if (const AttrValue* v = npc.get(ATTR_INTERACTIONS)) {
        for (const std::string& verb : splitOn(v->text(), ',')) {
            const std::string t = trim(verb);
            if (!t.empty()) verbs.push_back("VERBAL." + t);
        }
    }
    out->set(ATTR_ACTIONS, joinWith(verbs, ","));
    return out;
}
