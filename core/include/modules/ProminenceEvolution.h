#ifndef PROMINENCE_EVOLUTION_H
#define PROMINENCE_EVOLUTION_H

#include "modules/SimulationSystem.h"

// Connection-driven fame. Thresholds scale with the current prominence level
// so each step up is harder than the last; under-connected entities fade.
class ProminenceEvolution : public SimulationSystem {
public:
    struct Config {
        double npcGainChance = 0.3;
        double npcDecayChance = 0.7;
        double locationGainChance = 0.4;
        double locationDecayChance = 0.5;
        double abilityGainChance = 0.35;
        double abilityDecayChance = 0.4;
        double ruleGainChance = 0.3;
        double ruleDecayChance = 0.5;
        double factionCoreStrength = 0.6;
    };

    ProminenceEvolution() : ProminenceEvolution(Config{}) {}
    explicit ProminenceEvolution(const Config& cfg)
        : SimulationSystem("prominence_evolution", "Prominence Evolution"), cfg_(cfg) {}

    SystemResult apply(WorldGraph& graph, double eraModifier, std::mt19937_64& rng) override;

private:
    Config cfg_;
};

#endif
