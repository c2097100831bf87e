#include "modules/ResourceFlow.h"

#include "kernel/Queries.h"
#include "kernel/Random.h"

bool ResourceFlow::hasResourceAccess(const WorldGraph& graph, const std::string& locationId) {
    for (const Entity* neighbour : getRelated(graph, locationId, "adjacent_to", Direction::Both)) {
        if (neighbour->tags.has("resource")) return true;
    }
    return false;
}

SystemResult ResourceFlow::apply(WorldGraph& graph, double eraModifier, std::mt19937_64& rng) {
    if (!rollProbability(cfg_.throttleChance, eraModifier, rng)) {
        return dormant();
    }

    SystemResult result;
    int waned = 0;
    int recovered = 0;

    for (const Entity* colony : graph.findEntities({std::string("location"), std::string("colony"), std::nullopt})) {
        const bool supplied = hasResourceAccess(graph, colony->id);
        if (colony->status == "thriving" && !supplied) {
            if (getResidents(graph, colony->id).size() <= cfg_.crowdingThreshold) continue;
            if (!rollProbability(cfg_.waneChance, eraModifier, rng)) continue;
            result.modify(colony->id, EntityChanges{}.withStatus("waning").withFlag("starving"));
            ++waned;
        } else if (colony->status == "waning" && supplied) {
            if (!rollProbability(cfg_.recoveryChance, eraModifier, rng)) continue;
            result.modify(colony->id, EntityChanges{}.withStatus("thriving").withoutTag("starving"));
            ++recovered;
        }
    }

    if (waned == 0 && recovered == 0) {
        return SystemResult::none(name() + ": supplies steady");
    }
    const double scarcity = cfg_.scarcityPerWane * waned + cfg_.scarcityPerRecovery * recovered;
    if (scarcity != 0.0) {
        result.adjustPressure("resource_scarcity", scarcity);
    }
    result.description = name() + ": " + std::to_string(waned) + " colonies starve, " +
                         std::to_string(recovered) + " recover";
    return result;
}
