#include "modules/AllianceFormation.h"

#include <algorithm>
#include <set>
#include <vector>
#include "kernel/Queries.h"
#include "kernel/Random.h"

namespace {
std::set<std::string> enemiesOf(const WorldGraph& graph, const std::string& factionId) {
    std::set<std::string> enemies;
    for (const char* kind : {"at_war_with", "enemy_of"}) {
        for (const Entity* e : getRelated(graph, factionId, kind, Direction::Both)) {
            if (e->kind == "faction") enemies.insert(e->id);
        }
    }
    return enemies;
}
}

SystemResult AllianceFormation::apply(WorldGraph& graph, double eraModifier, std::mt19937_64& rng) {
    std::vector<const Entity*> factions;
    for (const Entity* f : graph.findEntities({std::string("faction"), std::nullopt, std::nullopt})) {
        if (f->status != "dissolved") factions.push_back(f);
    }
    if (factions.size() < 2) {
        return SystemResult::none(name() + ": too few factions");
    }

    std::vector<std::set<std::string>> enemies;
    enemies.reserve(factions.size());
    for (const Entity* f : factions) {
        enemies.push_back(enemiesOf(graph, f->id));
    }

    SystemResult result;
    std::size_t formed = 0;
    for (std::size_t i = 0; i < factions.size(); ++i) {
        for (std::size_t j = i + 1; j < factions.size(); ++j) {
            const std::string& a = factions[i]->id;
            const std::string& b = factions[j]->id;
            if (enemies[i].count(b) || enemies[j].count(a)) continue;
            if (getFactionRelationship(graph, a, b) == FactionStance::Allied) continue;

            const bool commonEnemy = std::any_of(enemies[i].begin(), enemies[i].end(),
                                                 [&](const std::string& x) { return enemies[j].count(x) > 0; });
            if (!commonEnemy) continue;
            if (!areRelationshipsCompatible(graph, a, b, "allied_with")) continue;
            if (!rollProbability(cfg_.allianceBaseChance, eraModifier, rng)) continue;

            result.relate("allied_with", a, b);
            ++formed;
        }
    }

    if (formed == 0) {
        return SystemResult::none(name() + ": no alliances formed");
    }
    result.adjustPressure("stability", cfg_.stabilityPerAlliance * static_cast<double>(formed));
    result.description = name() + ": " + std::to_string(formed) + " alliances formed";
    return result;
}
