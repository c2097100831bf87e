#include "modules/ConflictContagion.h"

#include <algorithm>
#include <set>
#include <utility>
#include <vector>
#include "kernel/Queries.h"
#include "kernel/Random.h"

namespace {
bool isAliveNpc(const Entity* e) {
    return e && e->kind == "npc" && e->status == "alive";
}
}

SystemResult ConflictContagion::apply(WorldGraph& graph, double eraModifier, std::mt19937_64& rng) {
    if (!rollProbability(cfg_.throttleChance, eraModifier, rng)) {
        return dormant();
    }

    const double conflict = graph.getPressure("conflict");
    const double spreadChance =
        std::min(cfg_.maxSpreadChance, cfg_.baseSpreadChance * (1.0 + conflict / 100.0));

    // Snapshot the feuds first; new enmities this tick do not spread further.
    std::vector<std::pair<std::string, std::string>> feuds;
    for (const auto& rel : graph.relationships()) {
        if (rel.kind != "enemy_of" || rel.status != RelationshipStatus::Active) continue;
        if (!isAliveNpc(graph.getEntity(rel.src)) || !isAliveNpc(graph.getEntity(rel.dst))) continue;
        feuds.emplace_back(rel.src, rel.dst);
    }

    SystemResult result;
    std::set<std::pair<std::string, std::string>> proposed;
    std::set<std::string> enlisted;
    std::size_t spread = 0;

    for (const auto& [origin, enemy] : feuds) {
        if (spread >= cfg_.maxSpreadPerTick) break;

        std::vector<const Entity*> loyal = getRelated(graph, origin, "follower_of", Direction::Incoming);
        for (const Entity* ally : getRelated(graph, origin, "ally_of", Direction::Both)) {
            loyal.push_back(ally);
        }

        for (const Entity* supporter : loyal) {
            if (spread >= cfg_.maxSpreadPerTick) break;
            if (!isAliveNpc(supporter) || supporter->id == enemy) continue;
            if (hasRelationship(graph, supporter->id, enemy, "enemy_of")) continue;
            if (proposed.count({supporter->id, enemy}) || enlisted.count(supporter->id)) continue;
            if (!graph.canFormRelationship(supporter->id, "enemy_of", cfg_.enmityCooldown)) continue;
            if (!areRelationshipsCompatible(graph, supporter->id, enemy, "enemy_of")) continue;
            if (!rollProbability(spreadChance, eraModifier, rng)) continue;

            result.relateOnCooldown("enemy_of", supporter->id, enemy, CooldownScope::Source);
            proposed.insert({supporter->id, enemy});
            enlisted.insert(supporter->id);
            ++spread;
        }
    }

    if (spread == 0) {
        return SystemResult::none(name() + ": feuds stay contained");
    }
    result.adjustPressure("conflict", cfg_.conflictPerSpread * static_cast<double>(spread));
    result.description = name() + ": " + std::to_string(spread) + " feuds spread";
    return result;
}
