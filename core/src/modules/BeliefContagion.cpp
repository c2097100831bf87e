#include "modules/BeliefContagion.h"

#include <algorithm>
#include <unordered_set>
#include <vector>
#include "kernel/Queries.h"
#include "kernel/Random.h"

namespace {
bool hasTrait(const Entity& npc, const char* a, const char* b) {
    return npc.tags.has(a) || npc.tags.has(b);
}
}

SystemResult BeliefContagion::apply(WorldGraph& graph, double eraModifier, std::mt19937_64& rng) {
    const auto proposed = graph.findEntities({std::string("rules"), std::nullopt, std::string("proposed")});
    if (proposed.empty()) {
        return SystemResult::none(name() + ": no ideological movements active");
    }
    const auto npcs = graph.findEntities({std::string("npc"), std::nullopt, std::string("alive")});
    if (npcs.empty()) {
        return SystemResult::none(name() + ": nobody to persuade");
    }

    const RelatedOptions strongTies{cfg_.contactMinStrength, std::nullopt, false};
    SystemResult result;
    int shifts = 0;
    bool enacted = false;

    for (const Entity* rule : proposed) {
        const std::string belief = beliefTag(rule->id);
        const std::string immunity = immunityTag(rule->id);

        // Infected at the start of this tick: tag or an explicit believer_of
        std::unordered_set<std::string> carriers;
        for (const Entity* npc : npcs) {
            if (npc->tags.has(belief)) {
                carriers.insert(npc->id);
            } else if (hasRelationship(graph, npc->id, rule->id, "believer_of")) {
                carriers.insert(npc->id);
                result.modify(npc->id, EntityChanges{}.withFlag(belief));
            }
        }
        std::size_t infected = carriers.size();

        // Transmission
        for (const Entity* npc : npcs) {
            if (carriers.count(npc->id) || npc->tags.has(immunity)) continue;

            std::vector<const Entity*> contacts = getRelated(graph, npc->id, "follower_of", Direction::Both, strongTies);
            for (const Entity* faction : getRelated(graph, npc->id, "member_of", Direction::Outgoing, strongTies)) {
                for (const Entity* member : getRelated(graph, faction->id, "member_of", Direction::Incoming, strongTies)) {
                    if (member->id != npc->id) contacts.push_back(member);
                }
            }
            const auto exposures = std::count_if(contacts.begin(), contacts.end(),
                                                 [&](const Entity* c) { return carriers.count(c->id) > 0; });
            if (exposures == 0) continue;

            double resistance = 0.0;
            if (hasTrait(*npc, "traditional", "conservative")) resistance = cfg_.resistanceWeight;
            if (hasTrait(*npc, "radical", "innovator")) resistance = -0.2;

            const double p = std::min(0.95, cfg_.transmissionRate * static_cast<double>(exposures) *
                                                (1.0 - resistance) * eraModifier);
            if (rollProbability(p, eraModifier, rng)) {
                result.modify(npc->id, EntityChanges{}.withFlag(belief));
                ++infected;
                ++shifts;
            }
        }

        // Recovery
        for (const Entity* npc : npcs) {
            if (!carriers.count(npc->id)) continue;
            const double tradition = hasTrait(*npc, "traditional", "conservative") ? cfg_.traditionWeight : 0.0;
            const double p = std::min(0.95, cfg_.recoveryRate * (1.0 + tradition) * eraModifier);
            if (rollProbability(p, eraModifier, rng)) {
                result.modify(npc->id, EntityChanges{}.withoutTag(belief).withFlag(immunity));
                --infected;
                ++shifts;
            }
        }

        const double adoption = static_cast<double>(infected) / static_cast<double>(npcs.size());
        if (adoption >= cfg_.enactmentThreshold) {
            EntityChanges changes;
            changes.status = "enacted";
            changes.prominence = std::max(rule->prominence, Prominence::Recognized);
            changes.description = rule->description + " It has spread widely and is now established tradition.";
            result.modify(rule->id, changes);
            enacted = true;
        } else if (adoption <= cfg_.forgetThreshold && graph.tick() >= rule->createdAt + cfg_.forgetAfter) {
            EntityChanges changes;
            changes.status = "forgotten";
            changes.description = rule->description + " It failed to gain traction.";
            result.modify(rule->id, changes);
        }
    }

    if (enacted) {
        result.adjustPressure("cultural_tension", -10.0);
        result.adjustPressure("stability", 5.0);
    }
    if (result.empty()) {
        return SystemResult::none(name() + ": belief systems remain stable");
    }
    result.description = name() + ": " + std::to_string(shifts) + " NPCs shift beliefs";
    return result;
}
