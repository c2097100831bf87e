#include "modules/RelationshipFormation.h"

#include <algorithm>
#include <map>
#include <tuple>
#include <vector>
#include "kernel/Queries.h"
#include "kernel/Random.h"

namespace {
struct Proposal {
    std::string src;
    std::string dst;
    std::string kind;
};

// Stance between the NPCs' factions: shared beats allied beats enemy.
struct PairStance {
    bool shared = false;
    bool allied = false;
    bool enemy = false;
    bool bothAffiliated = false;
};

PairStance stanceBetween(const WorldGraph& graph, const MembershipIndex& index,
                         const std::string& a, const std::string& b) {
    PairStance stance;
    auto fa = index.factions.find(a);
    auto fb = index.factions.find(b);
    if (fa == index.factions.end() || fb == index.factions.end()) {
        return stance;
    }
    stance.bothAffiliated = true;
    for (const auto& x : fa->second) {
        for (const auto& y : fb->second) {
            if (x == y) {
                stance.shared = true;
                continue;
            }
            switch (getFactionRelationship(graph, x, y)) {
                case FactionStance::Allied: stance.allied = true; break;
                case FactionStance::Enemy: stance.enemy = true; break;
                case FactionStance::Neutral: break;
            }
        }
    }
    return stance;
}
}

std::uint64_t RelationshipFormation::cooldownFor(const std::string& kind) const {
    auto it = cfg_.cooldowns.find(kind);
    return it != cfg_.cooldowns.end() ? it->second : 0;
}

SystemResult RelationshipFormation::apply(WorldGraph& graph, double eraModifier, std::mt19937_64& rng) {
    if (!rollProbability(cfg_.throttleChance, eraModifier, rng)) {
        return dormant();
    }

    const MembershipIndex index = buildMembershipIndex(graph);

    // Alive NPCs grouped by residence, in id order
    std::map<std::string, std::vector<const Entity*>> byLocation;
    for (const Entity* npc : graph.findEntities({std::string("npc"), std::nullopt, std::string("alive")})) {
        if (const std::string* loc = index.locationOf(npc->id)) {
            byLocation[*loc].push_back(npc);
        }
    }

    SystemResult result;
    std::vector<Proposal> proposed;

    auto compatible = [&](const std::string& a, const std::string& b, const std::string& kind) {
        if (!areRelationshipsCompatible(graph, a, b, kind)) return false;
        return std::none_of(proposed.begin(), proposed.end(), [&](const Proposal& p) {
            const bool samePair = (p.src == a && p.dst == b) || (p.src == b && p.dst == a);
            return samePair && kindsContradict(p.kind, kind);
        });
    };

    // Cooldowns land at commit; within this batch an endpoint forms each kind once
    auto claimed = [&](const std::string& id, const std::string& kind) {
        return std::any_of(proposed.begin(), proposed.end(), [&](const Proposal& p) {
            return p.kind == kind && (p.src == id || p.dst == id);
        });
    };

    auto tryForm = [&](const Entity* a, const Entity* b, const std::string& kind, double probability) {
        if (hasRelationship(graph, a->id, b->id, kind)) return;
        const std::uint64_t cooldown = cooldownFor(kind);
        if (!graph.canFormRelationship(a->id, kind, cooldown) ||
            !graph.canFormRelationship(b->id, kind, cooldown)) {
            return;
        }
        if (cooldown > 0 && (claimed(a->id, kind) || claimed(b->id, kind))) return;
        if (!compatible(a->id, b->id, kind)) return;
        if (!chance(probability, rng)) return;

        result.relateOnCooldown(kind, a->id, b->id);
        proposed.push_back(Proposal{a->id, b->id, kind});
    };

    for (const auto& [locationId, residents] : byLocation) {
        for (std::size_t i = 0; i < residents.size(); ++i) {
            for (std::size_t j = i + 1; j < residents.size(); ++j) {
                const Entity* a = residents[i];
                const Entity* b = residents[j];
                const double balancing = (getConnectionWeight(*a) + getConnectionWeight(*b)) / 2.0;
                const PairStance stance = stanceBetween(graph, index, a->id, b->id);

                // Loyalty within a faction or alliance; some of it sours into rivalry
                if (stance.shared || stance.allied) {
                    const double factor = stance.shared ? 2.0 : 1.2;
                    const double p = std::min(cfg_.maxChance, cfg_.loyaltyBaseChance * factor * balancing);
                    const std::string kind = uniform01(rng) < cfg_.rivalShare ? "rival_of" : "follower_of";
                    tryForm(a, b, kind, p);
                }

                // Enmity across factions
                if (!stance.shared && stance.bothAffiliated) {
                    const double factor = stance.enemy ? 3.0 : (stance.allied ? 0.0 : 0.3);
                    const double p = std::min(cfg_.maxChance, cfg_.enmityBaseChance * factor * balancing);
                    if (p > 0.0) tryForm(a, b, "enemy_of", p);
                }

                // Romance, rarely across enemy lines
                double romance = 0.7;
                if (stance.shared) romance = 3.0;
                else if (stance.allied) romance = 1.5;
                else if (stance.enemy) romance = 0.05;
                const double p = std::min(cfg_.maxChance, cfg_.romanceBaseChance * romance * balancing);
                tryForm(a, b, "lover_of", p);
            }
        }
    }

    if (result.relationships.empty()) {
        return SystemResult::none(name() + ": no new bonds");
    }
    result.description = name() + ": " + std::to_string(result.relationships.size()) + " new bonds";
    return result;
}
