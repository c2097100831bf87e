#ifndef RELATIONSHIP_DECAY_H
#define RELATIONSHIP_DECAY_H

#include "modules/SimulationSystem.h"

// Per-tick weakening of non-structural bonds. Proximity and shared faction
// slow the decay; strength never drops below the floor here (culling removes
// what is left).
class RelationshipDecay : public SimulationSystem {
public:
    struct Config {
        double narrativeRate = 0.01;
        double socialRate = 0.02;
        double spatialRate = 0.05;
        double conflictRate = 0.005;
        double proximityFactor = 0.5;
        double sharedFactionFactor = 0.7;
        double floor = 0.1;
    };

    RelationshipDecay() : RelationshipDecay(Config{}) {}
    explicit RelationshipDecay(const Config& cfg)
        : SimulationSystem("relationship_decay", "Relationship Decay"), cfg_(cfg) {}

    SystemResult apply(WorldGraph& graph, double eraModifier, std::mt19937_64& rng) override;

    // Base per-tick rate for a kind; 0 for kinds that do not decay.
    double baseRate(const std::string& kind) const;

private:
    Config cfg_;
};

#endif
