#ifndef RELATIONSHIP_REINFORCEMENT_H
#define RELATIONSHIP_REINFORCEMENT_H

#include "modules/SimulationSystem.h"

// Bonds strengthen through structure, proximity, shared faction and shared
// enemies.
class RelationshipReinforcement : public SimulationSystem {
public:
    struct Config {
        double structuralBonus = 0.02;
        double proximityBonus = 0.03;
        double sharedFactionBonus = 0.02;
        double sharedConflictBonus = 0.05;
        double cap = 1.0;
    };

    RelationshipReinforcement() : RelationshipReinforcement(Config{}) {}
    explicit RelationshipReinforcement(const Config& cfg)
        : SimulationSystem("relationship_reinforcement", "Relationship Bonding"), cfg_(cfg) {}

    SystemResult apply(WorldGraph& graph, double eraModifier, std::mt19937_64& rng) override;

private:
    Config cfg_;
};

#endif
