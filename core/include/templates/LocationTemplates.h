#ifndef LOCATION_TEMPLATES_H
#define LOCATION_TEMPLATES_H

#include <cstddef>
#include <optional>
#include <string>
#include <vector>
#include "templates/EmergentDiscovery.h"
#include "templates/GrowthTemplate.h"

// Settlers leave a thriving colony and found a new one nearby. The new
// colony's coordinates come from the domain's spatial placement service, so
// it is created directly in the graph during expand (batch.precreated).
class ColonyFounding : public GrowthTemplate {
public:
    struct Config {
        double target = 10.0;            // colonies
        std::size_t minResidents = 3;
        std::size_t founders = 3;
        double quietChance = 0.3;
        double crowdedPerColony = 8.0;   // npcs per colony that forces expansion
    };

    ColonyFounding() : ColonyFounding(Config{}) {}
    explicit ColonyFounding(const Config& cfg)
        : GrowthTemplate("colony_founding", "Colony Founding", "location"), cfg_(cfg) {}

    bool canApply(const WorldGraph& graph, std::mt19937_64& rng) const override;
    std::vector<const Entity*> findTargets(const WorldGraph& graph) const override;
    // Throws ConfigurationError when the graph has no schema or the schema
    // offers no spatial placement.
    TemplateResult expand(WorldGraph& graph, const Entity* target, std::mt19937_64& rng) override;

private:
    Config cfg_;
};

// Shared shape of the emergent discoveries: an explorer (the target) finds a
// location themed by the current world state. The location is linked with
// explorer_of/discovered_by and a two-way adjacent_to to a place the explorer
// knows, and the discovery counters are advanced.
class LocationDiscoveryTemplate : public GrowthTemplate {
public:
    LocationDiscoveryTemplate(std::string id, std::string name, DiscoveryConfig cfg,
                              std::vector<std::string> explorerPreference);

    std::vector<const Entity*> findTargets(const WorldGraph& graph) const override;

    const DiscoveryConfig& discoveryConfig() const { return cfg_; }

protected:
    struct Discovery {
        LocationTheme theme;
        std::string description;
        std::string status = "unspoiled";
        Prominence prominence = Prominence::Marginal;
    };

    // Builds the batch; the new location is pending index 0.
    TemplateResult discover(WorldGraph& graph, const Entity& explorer, const Discovery& discovery,
                            std::mt19937_64& rng) const;

    DiscoveryConfig cfg_;

private:
    std::vector<std::string> preference_;
};

class ResourceLocationDiscovery : public LocationDiscoveryTemplate {
public:
    explicit ResourceLocationDiscovery(const DiscoveryConfig& cfg = DiscoveryConfig{})
        : LocationDiscoveryTemplate("resource_location_discovery", "Resource Location Discovery", cfg,
                                    {"hero", "outlaw", "merchant"}) {}

    bool canApply(const WorldGraph& graph, std::mt19937_64& rng) const override;
    TemplateResult expand(WorldGraph& graph, const Entity* target, std::mt19937_64& rng) override;
};

class StrategicLocationDiscovery : public LocationDiscoveryTemplate {
public:
    explicit StrategicLocationDiscovery(const DiscoveryConfig& cfg = DiscoveryConfig{})
        : LocationDiscoveryTemplate("strategic_location_discovery", "Strategic Location Discovery", cfg,
                                    {"hero", "outlaw", "mayor"}) {}

    bool canApply(const WorldGraph& graph, std::mt19937_64& rng) const override;
    TemplateResult expand(WorldGraph& graph, const Entity* target, std::mt19937_64& rng) override;
};

class MysticalLocationDiscovery : public LocationDiscoveryTemplate {
public:
    explicit MysticalLocationDiscovery(const DiscoveryConfig& cfg = DiscoveryConfig{})
        : LocationDiscoveryTemplate("mystical_location_discovery", "Mystical Location Discovery", cfg,
                                    {"hero", "outlaw"}) {}

    bool canApply(const WorldGraph& graph, std::mt19937_64& rng) const override;
    TemplateResult expand(WorldGraph& graph, const Entity* target, std::mt19937_64& rng) override;
};

#endif
