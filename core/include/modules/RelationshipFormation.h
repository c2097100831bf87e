#ifndef RELATIONSHIP_FORMATION_H
#define RELATIONSHIP_FORMATION_H

#include <cstdint>
#include <map>
#include <string>
#include "modules/SimulationSystem.h"

// Social bonds between alive NPCs sharing a location. Each NPC is weighted by
// inverse degree so isolated NPCs catch up with hubs; faction stance scales
// the loyalty, enmity and romance chances. A bond forms only when it is new,
// both NPCs are off cooldown for that kind, and nothing between the pair
// contradicts it.
class RelationshipFormation : public SimulationSystem {
public:
    struct Config {
        double throttleChance = 0.3;
        double loyaltyBaseChance = 0.2;
        double enmityBaseChance = 0.2;
        double romanceBaseChance = 0.05;
        double rivalShare = 0.25;          // loyalty rolls that become rivalry
        double maxChance = 0.95;
        std::map<std::string, std::uint64_t> cooldowns = {
            {"follower_of", 5}, {"rival_of", 5}, {"enemy_of", 8}, {"lover_of", 15}
        };
    };

    RelationshipFormation() : RelationshipFormation(Config{}) {}
    explicit RelationshipFormation(const Config& cfg)
        : SimulationSystem("relationship_formation", "Relationship Formation"), cfg_(cfg) {}

    SystemResult apply(WorldGraph& graph, double eraModifier, std::mt19937_64& rng) override;

    std::uint64_t cooldownFor(const std::string& kind) const;

private:
    Config cfg_;
};

#endif
