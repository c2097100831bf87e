#ifndef CONFLICT_CONTAGION_H
#define CONFLICT_CONTAGION_H

#include <cstddef>
#include <cstdint>
#include "modules/SimulationSystem.h"

// Feuds spread along loyalty: followers and allies of an NPC inherit its
// enemies. Spread probability rises with the conflict pressure.
class ConflictContagion : public SimulationSystem {
public:
    struct Config {
        double throttleChance = 0.25;
        double baseSpreadChance = 0.15;
        double maxSpreadChance = 0.5;
        double conflictPerSpread = 2.0;
        std::size_t maxSpreadPerTick = 5;
        std::uint64_t enmityCooldown = 8;
    };

    ConflictContagion() : ConflictContagion(Config{}) {}
    explicit ConflictContagion(const Config& cfg)
        : SimulationSystem("conflict_contagion", "Conflict Contagion"), cfg_(cfg) {}

    SystemResult apply(WorldGraph& graph, double eraModifier, std::mt19937_64& rng) override;

private:
    Config cfg_;
};

#endif
