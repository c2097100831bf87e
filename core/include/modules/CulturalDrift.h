#ifndef CULTURAL_DRIFT_H
#define CULTURAL_DRIFT_H

#include "modules/SimulationSystem.h"

// Colonies whose residents answer to several factions, none holding a
// majority, drift apart ("divergent" tag). Residents slowly take on the
// culture of the place they live.
class CulturalDrift : public SimulationSystem {
public:
    struct Config {
        double throttleChance = 0.2;
        double adoptionChance = 0.1;
        double tensionOnDivergence = 1.5;
        double tensionOnReconcile = -1.0;
    };

    CulturalDrift() : CulturalDrift(Config{}) {}
    explicit CulturalDrift(const Config& cfg)
        : SimulationSystem("cultural_drift", "Cultural Drift"), cfg_(cfg) {}

    SystemResult apply(WorldGraph& graph, double eraModifier, std::mt19937_64& rng) override;

private:
    Config cfg_;
};

#endif
