#ifndef LEGEND_CRYSTALLIZATION_H
#define LEGEND_CRYSTALLIZATION_H

#include <cstdint>
#include "modules/SimulationSystem.h"

// Long-dead renowned NPCs pass into legend: status "legend", prominence
// mythic, their home renamed after them, and a memorial rule that
// commemorates them.
class LegendCrystallization : public SimulationSystem {
public:
    struct Config {
        double throttleChance = 0.2;
        std::uint64_t crystallizationAge = 50;   // ticks since death
    };

    LegendCrystallization() : LegendCrystallization(Config{}) {}
    explicit LegendCrystallization(const Config& cfg)
        : SimulationSystem("legend_crystallization", "Legend Formation"), cfg_(cfg) {}

    SystemResult apply(WorldGraph& graph, double eraModifier, std::mt19937_64& rng) override;

private:
    Config cfg_;
};

#endif
