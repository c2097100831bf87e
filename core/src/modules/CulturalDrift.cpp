#include "modules/CulturalDrift.h"

#include <algorithm>
#include <map>
#include "kernel/Queries.h"
#include "kernel/Random.h"

namespace {
// At least two factions among the residents and none with a strict majority
// of the affiliated ones.
bool residentsDiverge(const MembershipIndex& index, const std::vector<const Entity*>& residents) {
    std::map<std::string, int> perFaction;
    int affiliated = 0;
    for (const Entity* npc : residents) {
        auto it = index.factions.find(npc->id);
        if (it == index.factions.end() || it->second.empty()) continue;
        ++affiliated;
        for (const auto& faction : it->second) {
            ++perFaction[faction];
        }
    }
    if (perFaction.size() < 2) return false;
    const auto largest = std::max_element(perFaction.begin(), perFaction.end(),
                                          [](const auto& a, const auto& b) { return a.second < b.second; });
    return largest->second * 2 <= affiliated;
}
}

SystemResult CulturalDrift::apply(WorldGraph& graph, double eraModifier, std::mt19937_64& rng) {
    if (!rollProbability(cfg_.throttleChance, eraModifier, rng)) {
        return dormant();
    }

    const MembershipIndex index = buildMembershipIndex(graph);
    SystemResult result;
    int diverged = 0;
    int reconciled = 0;
    int adopted = 0;

    for (const Entity* colony : graph.findEntities({std::string("location"), std::string("colony"), std::nullopt})) {
        const auto residents = getResidents(graph, colony->id);
        const bool divergent = residentsDiverge(index, residents);
        const bool tagged = colony->tags.has("divergent");
        if (divergent && !tagged) {
            result.modify(colony->id, EntityChanges{}.withFlag("divergent"));
            ++diverged;
        } else if (!divergent && tagged) {
            result.modify(colony->id, EntityChanges{}.withoutTag("divergent"));
            ++reconciled;
        }

        if (colony->culture.empty()) continue;
        for (const Entity* npc : residents) {
            if (npc->status != "alive" || npc->culture == colony->culture) continue;
            if (!rollProbability(cfg_.adoptionChance, eraModifier, rng)) continue;
            EntityChanges changes;
            changes.culture = colony->culture;
            result.modify(npc->id, changes);
            ++adopted;
        }
    }

    const double tension = cfg_.tensionOnDivergence * diverged + cfg_.tensionOnReconcile * reconciled;
    if (tension != 0.0) {
        result.adjustPressure("cultural_tension", tension);
    }
    if (result.empty()) {
        return SystemResult::none(name() + ": cultures hold steady");
    }
    result.description = name() + ": " + std::to_string(diverged) + " colonies diverge, " +
                         std::to_string(adopted) + " residents assimilate";
    return result;
}
