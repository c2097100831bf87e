#ifndef ALLIANCE_FORMATION_H
#define ALLIANCE_FORMATION_H

#include "modules/SimulationSystem.h"

// Factions sharing a common enemy band together. Never allies with a faction
// it is already fighting.
class AllianceFormation : public SimulationSystem {
public:
    struct Config {
        double allianceBaseChance = 0.5;
        double stabilityPerAlliance = 5.0;
    };

    AllianceFormation() : AllianceFormation(Config{}) {}
    explicit AllianceFormation(const Config& cfg)
        : SimulationSystem("alliance_formation", "Strategic Alliances"), cfg_(cfg) {}

    SystemResult apply(WorldGraph& graph, double eraModifier, std::mt19937_64& rng) override;

private:
    Config cfg_;
};

#endif
