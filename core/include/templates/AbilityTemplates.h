#ifndef ABILITY_TEMPLATES_H
#define ABILITY_TEMPLATES_H

#include <cstddef>
#include "templates/GrowthTemplate.h"

// Heroes discover magic near anomalies. Very high instability makes discovery
// less likely rather than more.
class MagicDiscovery : public GrowthTemplate {
public:
    struct Config {
        double target = 15.0;            // magic abilities
        double minInstability = 10.0;
        double anomalyFreeInstability = 30.0;
        double volatileAbove = 70.0;
        double volatileChance = 0.4;
        std::size_t maxDiscoveriesPerHero = 2;
    };

    MagicDiscovery() : MagicDiscovery(Config{}) {}
    explicit MagicDiscovery(const Config& cfg)
        : GrowthTemplate("magic_discovery", "Magical Discovery", "abilities"), cfg_(cfg) {}

    bool canApply(const WorldGraph& graph, std::mt19937_64& rng) const override;
    std::vector<const Entity*> findTargets(const WorldGraph& graph) const override;
    TemplateResult expand(WorldGraph& graph, const Entity* target, std::mt19937_64& rng) override;

private:
    Config cfg_;
};

// A faction that controls territory develops a technology, usually building
// on one it already practises.
class TechInnovation : public GrowthTemplate {
public:
    struct Config {
        double target = 15.0;            // technologies
    };

    TechInnovation() : TechInnovation(Config{}) {}
    explicit TechInnovation(const Config& cfg)
        : GrowthTemplate("tech_innovation", "Technological Breakthrough", "abilities"), cfg_(cfg) {}

    bool canApply(const WorldGraph& graph, std::mt19937_64& rng) const override;
    std::vector<const Entity*> findTargets(const WorldGraph& graph) const override;
    TemplateResult expand(WorldGraph& graph, const Entity* target, std::mt19937_64& rng) override;

private:
    Config cfg_;
};

#endif
