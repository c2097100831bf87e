#include "modules/ProminenceEvolution.h"

#include <algorithm>
#include "kernel/Queries.h"
#include "kernel/Random.h"

namespace {
std::size_t degreeOf(const std::unordered_map<std::string, std::size_t>& degree, const std::string& id) {
    auto it = degree.find(id);
    return it != degree.end() ? it->second : 0;
}
}

SystemResult ProminenceEvolution::apply(WorldGraph& graph, double eraModifier, std::mt19937_64& rng) {
    const auto degree = buildDegreeTable(graph);
    SystemResult result;
    int risen = 0;
    int faded = 0;

    auto shift = [&](const Entity& e, int delta) {
        const Prominence next = adjustProminence(e.prominence, delta);
        if (next == e.prominence) return;
        result.modify(e.id, EntityChanges{}.withProminence(next));
        (delta > 0 ? risen : faded)++;
    };
    auto gainRoll = [&](double base) { return chance(std::min(1.0, base * eraModifier), rng); };

    for (const Entity* e : graph.getEntities()) {
        const int level = prominenceValue(e->prominence);
        const auto connections = static_cast<int>(degreeOf(degree, e->id));

        if (e->kind == "npc") {
            // The dead keep their fame; legends are built on it
            if (e->status != "alive") continue;
            const int roleBonus = (e->subtype == "hero" || e->subtype == "mayor") ? 2 : 0;
            if (connections + roleBonus >= (level + 1) * 6) {
                if (gainRoll(cfg_.npcGainChance)) shift(*e, 1);
            } else if (connections < level * 2 && chance(cfg_.npcDecayChance, rng)) {
                shift(*e, -1);
            }
        } else if (e->kind == "location") {
            const int typeBonus = (e->subtype == "colony" || e->subtype == "anomaly") ? 3 : 0;
            if (connections + typeBonus >= (level + 1) * 5 && gainRoll(cfg_.locationGainChance)) {
                shift(*e, 1);
            } else if (connections < level * 2 && chance(cfg_.locationDecayChance, rng)) {
                shift(*e, -1);
            }
        } else if (e->kind == "faction") {
            const auto core = getRelated(graph, e->id, "member_of", Direction::Incoming,
                                         RelatedOptions{cfg_.factionCoreStrength, std::nullopt, false});
            int memberProminence = 0;
            for (const Entity* member : core) {
                memberProminence += prominenceValue(member->prominence);
            }
            if (!core.empty() && memberProminence > level * static_cast<int>(core.size())) {
                shift(*e, 1);
            }
        } else if (e->kind == "abilities") {
            const auto practitioners = static_cast<int>(
                getRelated(graph, e->id, "practitioner_of", Direction::Incoming).size());
            if (practitioners > (level + 1) * 3 && gainRoll(cfg_.abilityGainChance)) {
                shift(*e, 1);
            } else if (practitioners < level && chance(cfg_.abilityDecayChance, rng)) {
                shift(*e, -1);
            }
        } else if (e->kind == "rules") {
            const int statusBonus = e->status == "enacted" ? 3 : 0;
            if (connections + statusBonus > (level + 1) * 4 && gainRoll(cfg_.ruleGainChance)) {
                shift(*e, 1);
            } else if (connections == 0 && e->status != "enacted" && chance(cfg_.ruleDecayChance, rng)) {
                shift(*e, -1);
            }
        }
    }

    if (result.modifications.empty()) {
        return SystemResult::none(name() + ": reputations unchanged");
    }
    result.description = name() + ": " + std::to_string(risen) + " rise, " + std::to_string(faded) + " fade";
    return result;
}
