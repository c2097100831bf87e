#ifndef RELATIONSHIP_CULLING_H
#define RELATIONSHIP_CULLING_H

#include <cstdint>
#include "modules/SimulationSystem.h"

// Cleanup pass, last in the tick order. Removes social/political bonds that
// decayed below the cull threshold after their grace period, and relationships
// whose endpoints no longer exist.
class RelationshipCulling : public SimulationSystem {
public:
    struct Config {
        double cullThreshold = 0.15;
        std::uint64_t gracePeriod = 20;
        std::uint64_t interval = 5;
    };

    RelationshipCulling() : RelationshipCulling(Config{}) {}
    explicit RelationshipCulling(const Config& cfg)
        : SimulationSystem("relationship_culling", "Relationship Maintenance"), cfg_(cfg) {}

    SystemResult apply(WorldGraph& graph, double eraModifier, std::mt19937_64& rng) override;

private:
    Config cfg_;
};

#endif
