#ifndef RESOURCE_FLOW_H
#define RESOURCE_FLOW_H

#include <cstddef>
#include "modules/SimulationSystem.h"

// Colonies live off adjacent resource sites (locations tagged "resource").
// Crowded colonies with no resource neighbour wane; waning colonies that
// gain access recover.
class ResourceFlow : public SimulationSystem {
public:
    struct Config {
        double throttleChance = 0.3;
        std::size_t crowdingThreshold = 3;   // residents above this need supply
        double waneChance = 0.3;
        double recoveryChance = 0.3;
        double scarcityPerWane = 3.0;
        double scarcityPerRecovery = -2.0;
    };

    ResourceFlow() : ResourceFlow(Config{}) {}
    explicit ResourceFlow(const Config& cfg)
        : SimulationSystem("resource_flow", "Resource Flow"), cfg_(cfg) {}

    SystemResult apply(WorldGraph& graph, double eraModifier, std::mt19937_64& rng) override;

    static bool hasResourceAccess(const WorldGraph& graph, const std::string& locationId);

private:
    Config cfg_;
};

#endif
