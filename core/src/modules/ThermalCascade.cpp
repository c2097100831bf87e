#include "modules/ThermalCascade.h"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <map>
#include <vector>
#include "kernel/Queries.h"
#include "kernel/Random.h"

std::string ThermalCascade::formatTemperature(double t) {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%.3f", std::clamp(t, 0.0, 1.0));
    return buf;
}

SystemResult ThermalCascade::apply(WorldGraph& graph, double eraModifier, std::mt19937_64& rng) {
    if (cfg_.interval == 0 || graph.tick() % cfg_.interval != 0) {
        return dormant();
    }

    const auto locations = graph.findEntities({std::string("location"), std::nullopt, std::nullopt});
    SystemResult result;

    // Diffusion step computed from the old field only
    std::map<std::string, double> updated;
    for (const Entity* loc : locations) {
        const double current = temperature(*loc);
        const auto neighbours = getRelated(graph, loc->id, "adjacent_to", Direction::Both);
        if (neighbours.empty()) {
            updated[loc->id] = current;
            continue;
        }
        double laplacian = 0.0;
        for (const Entity* n : neighbours) {
            laplacian += temperature(*n) - current;
        }
        laplacian /= static_cast<double>(neighbours.size());
        updated[loc->id] = std::clamp(current + cfg_.alpha * laplacian, 0.0, 1.0);
    }

    std::vector<const Entity*> refuges;
    for (const Entity* loc : locations) {
        const double t = updated[loc->id];
        if (t >= cfg_.temperateLow && t <= cfg_.temperateHigh) refuges.push_back(loc);
    }

    std::size_t events = 0;
    for (const Entity* loc : locations) {
        const double before = temperature(*loc);
        const double after = updated[loc->id];
        const bool warming = after > before;
        if (std::abs(after - before) > 1e-9 && std::abs(after - 0.5) > 0.05) {
            result.modify(loc->id, EntityChanges{}.withTag("temp", formatTemperature(after)));
        }

        if (loc->subtype == "colony" && loc->status == "waning" &&
            after >= cfg_.temperateLow && after <= cfg_.temperateHigh &&
            rollProbability(std::min(0.95, cfg_.recoveryChance * eraModifier), eraModifier, rng)) {
            EntityChanges recovered;
            recovered.status = "thriving";
            recovered.description = loc->description + " Stabilizing temperatures let the colony recover.";
            result.modify(loc->id, recovered);
        }

        if (std::abs(after - 0.5) < cfg_.excursion) continue;
        ++events;

        if (loc->subtype == "colony" && loc->status == "thriving" &&
            (after > cfg_.hotColony || after < cfg_.coldColony)) {
            EntityChanges waning;
            waning.status = "waning";
            waning.description = loc->description + (after > 0.5 ? " Warming ice threatens its foundations."
                                                                 : " Extreme cold makes survival difficult.");
            result.modify(loc->id, waning);
        }

        if (after > cfg_.hotMigration || after < cfg_.coldMigration) {
            std::vector<const Entity*> alive;
            for (const Entity* npc : getResidents(graph, loc->id)) {
                if (npc->status == "alive") alive.push_back(npc);
            }
            std::vector<const Entity*> destinations;
            for (const Entity* r : refuges) {
                if (r->id != loc->id) destinations.push_back(r);
            }
            if (!destinations.empty()) {
                for (const Entity* migrant : pickMultiple(alive, cfg_.maxMigrants, rng)) {
                    if (!graph.canFormRelationship(migrant->id, "resident_of", cfg_.migrationCooldown)) continue;
                    if (!rollProbability(std::min(0.95, cfg_.migrationChance * eraModifier), eraModifier, rng)) continue;
                    const Entity* refuge = pickRandom(destinations, rng);
                    result.archive(migrant->id, loc->id, "resident_of");
                    result.relateOnCooldown("resident_of", migrant->id, refuge->id, CooldownScope::Source);
                    result.modify(migrant->id, EntityChanges{}.withTag("migrated_from", loc->id));
                }
            }
        }

        // Thawing ice gives up forgotten techniques
        if (warming && after > cfg_.warmDiscovery &&
            rollProbability(std::min(0.95, cfg_.rediscoveryChance * eraModifier), eraModifier, rng)) {
            const auto abilities = graph.findEntities({std::string("abilities"), std::nullopt, std::string("active")});
            if (!abilities.empty()) {
                const Entity* ability = pickRandom(abilities, rng);
                if (!hasRelationship(graph, ability->id, loc->id, "manifests_at")) {
                    result.relate("manifests_at", ability->id, loc->id);
                }
            }
        }
    }

    if (events > 2) {
        result.adjustPressure("conflict", 5.0);
        result.adjustPressure("stability", -10.0);
    }
    if (result.empty()) {
        return SystemResult::none(name() + ": temperatures stabilizing");
    }
    result.description = name() + ": " + std::to_string(events) + " locations at thermal extremes";
    return result;
}
