#include "modules/SuccessionVacuum.h"

#include <algorithm>
#include <set>
#include <vector>
#include "kernel/Queries.h"
#include "kernel/Random.h"

SystemResult SuccessionVacuum::apply(WorldGraph& graph, double eraModifier, std::mt19937_64& rng) {
    if (!rollProbability(cfg_.throttleChance, eraModifier, rng)) {
        return dormant();
    }

    std::vector<const Entity*> leaderless;
    for (const Entity* faction : graph.findEntities({std::string("faction"), std::nullopt, std::string("active")})) {
        const auto leaders = getRelated(graph, faction->id, "leader_of", Direction::Incoming);
        const bool anyAlive = std::any_of(leaders.begin(), leaders.end(),
                                          [](const Entity* l) { return l->status == "alive"; });
        if (!leaders.empty() && !anyAlive) leaderless.push_back(faction);
    }
    if (leaderless.empty()) {
        return SystemResult::none(name() + ": all factions have stable leadership");
    }

    SystemResult result;
    std::set<std::string> rivalsClaimed;
    auto canRival = [&](const std::string& a, const std::string& b, const std::string& kind) {
        return !hasRelationship(graph, a, b, kind) && areRelationshipsCompatible(graph, a, b, kind) &&
               graph.canFormRelationship(a, kind, cfg_.rivalryCooldown);
    };

    for (const Entity* faction : leaderless) {
        std::vector<const Entity*> eligible;
        for (const Entity* npc : getRelated(graph, faction->id, "member_of", Direction::Incoming,
                                            RelatedOptions{cfg_.claimantMinStrength, std::nullopt, false})) {
            if (npc->status == "alive" && npc->prominence >= Prominence::Recognized) {
                eligible.push_back(npc);
            }
        }

        EntityChanges waning;
        waning.status = "waning";
        if (eligible.size() < 2) {
            waning.description = faction->description + " With no clear successor, its influence fades.";
            result.modify(faction->id, waning);
            continue;
        }

        const std::size_t claimantCount = std::min<std::size_t>(3, eligible.size());
        const auto claimants = pickMultiple(eligible, claimantCount, rng);
        const double rivalry = std::min(0.95, cfg_.rivalryChance * eraModifier);
        for (std::size_t i = 0; i < claimants.size(); ++i) {
            for (std::size_t j = i + 1; j < claimants.size(); ++j) {
                const std::string& a = claimants[i]->id;
                const std::string& b = claimants[j]->id;
                if (rivalsClaimed.count(a) || !canRival(a, b, "rival_of")) continue;
                if (!rollProbability(rivalry, eraModifier, rng)) continue;
                result.relateOnCooldown("rival_of", a, b, CooldownScope::Source);
                rivalsClaimed.insert(a);
            }
        }

        // Supporters of the first two claimants may come to blows
        if (chance(cfg_.escalationChance, rng)) {
            const auto first = getRelated(graph, claimants[0]->id, "follower_of", Direction::Incoming);
            const auto second = getRelated(graph, claimants[1]->id, "follower_of", Direction::Incoming);
            if (!first.empty() && !second.empty()) {
                const Entity* s1 = pickRandom(first, rng);
                const Entity* s2 = pickRandom(second, rng);
                if (s1 != s2 && canRival(s1->id, s2->id, "enemy_of") &&
                    rollProbability(std::min(0.95, cfg_.conflictChance * eraModifier), eraModifier, rng)) {
                    result.relateOnCooldown("enemy_of", s1->id, s2->id, CooldownScope::Source);
                }
            }
        }

        std::vector<const Entity*> edicts;
        for (const Entity* rule : getRelated(graph, faction->id, "originated_in", Direction::Incoming)) {
            if (rule->kind == "rules" && rule->status == "enacted") edicts.push_back(rule);
        }
        for (const Entity* rule : pickMultiple(edicts, 2, rng)) {
            if (!rollProbability(std::min(0.95, cfg_.repealChance * eraModifier), eraModifier, rng)) continue;
            EntityChanges repeal;
            repeal.status = "repealed";
            repeal.description = rule->description + " Repealed during a succession crisis.";
            result.modify(rule->id, repeal);
        }

        waning.description = faction->description + " A succession crisis threatens to tear it apart.";
        result.modify(faction->id, waning);
        result.adjustPressure("stability", cfg_.stabilityPerCrisis);
        result.adjustPressure("conflict", cfg_.conflictPerCrisis);
    }

    result.description = name() + ": " + std::to_string(leaderless.size()) + " factions face a leadership vacuum";
    return result;
}
