#ifndef RULES_TEMPLATES_H
#define RULES_TEMPLATES_H

#include <cstddef>
#include "templates/GrowthTemplate.h"

// A charismatic NPC champions a new ideology. It starts out "proposed" with a
// handful of believers and is left to belief contagion to spread or fade.
class IdeologyEmergence : public GrowthTemplate {
public:
    struct Config {
        std::size_t minAliveNpcs = 10;
        double tensionThreshold = 30.0;
        double unstableBelow = 40.0;
        double unstableChance = 0.3;
        std::size_t followerBelievers = 5;
        std::size_t memberBelievers = 3;
    };

    IdeologyEmergence() : IdeologyEmergence(Config{}) {}
    explicit IdeologyEmergence(const Config& cfg)
        : GrowthTemplate("ideology_emergence", "Ideological Movement", "rules"), cfg_(cfg) {}

    bool canApply(const WorldGraph& graph, std::mt19937_64& rng) const override;
    std::vector<const Entity*> findTargets(const WorldGraph& graph) const override;
    TemplateResult expand(WorldGraph& graph, const Entity* target, std::mt19937_64& rng) override;

private:
    Config cfg_;
};

#endif
