#ifndef SUCCESSION_VACUUM_H
#define SUCCESSION_VACUUM_H

#include <cstdint>
#include "modules/SimulationSystem.h"

// An active faction whose every leader is dead falls into crisis. Two or
// three core members claim the seat and turn on each other; the faction
// wanes and edicts that originated in it may be repealed.
class SuccessionVacuum : public SimulationSystem {
public:
    struct Config {
        double throttleChance = 0.2;
        double claimantMinStrength = 0.7;
        double rivalryChance = 0.7;
        double escalationChance = 0.3;
        double conflictChance = 0.5;
        double repealChance = 0.4;
        std::uint64_t rivalryCooldown = 8;
        double stabilityPerCrisis = -15.0;
        double conflictPerCrisis = 10.0;
    };

    SuccessionVacuum() : SuccessionVacuum(Config{}) {}
    explicit SuccessionVacuum(const Config& cfg)
        : SimulationSystem("succession_vacuum", "Leadership Crisis"), cfg_(cfg) {}

    SystemResult apply(WorldGraph& graph, double eraModifier, std::mt19937_64& rng) override;

private:
    Config cfg_;
};

#endif
