#ifndef FACTION_TEMPLATES_H
#define FACTION_TEMPLATES_H

#include <cstddef>
#include "templates/GrowthTemplate.h"

// A member breaks away from its faction and leads a splinter group that is
// at war with the parent. A change of faction subtype counts as a radical
// split and widens the ideological distance on split_from.
class FactionSplinter : public GrowthTemplate {
public:
    struct Config {
        double target = 30.0;            // factions
        std::size_t minMembers = 2;
        double tensionThreshold = 25.0;
        double quietChance = 0.2;
        double newLeaderHeroChance = 0.5;
    };

    FactionSplinter() : FactionSplinter(Config{}) {}
    explicit FactionSplinter(const Config& cfg)
        : GrowthTemplate("faction_splinter", "Faction Splinter", "faction"), cfg_(cfg) {}

    bool canApply(const WorldGraph& graph, std::mt19937_64& rng) const override;
    std::vector<const Entity*> findTargets(const WorldGraph& graph) const override;
    TemplateResult expand(WorldGraph& graph, const Entity* target, std::mt19937_64& rng) override;

private:
    Config cfg_;
};

// A secretive cult gathers around an anomaly or its neighbours: a new
// prophet leads it and unaffiliated locals join.
class CultFormation : public GrowthTemplate {
public:
    struct Config {
        double target = 10.0;            // cults
        std::size_t cultists = 3;
    };

    CultFormation() : CultFormation(Config{}) {}
    explicit CultFormation(const Config& cfg)
        : GrowthTemplate("cult_formation", "Cult Formation", "faction"), cfg_(cfg) {}

    bool canApply(const WorldGraph& graph, std::mt19937_64& rng) const override;
    std::vector<const Entity*> findTargets(const WorldGraph& graph) const override;
    TemplateResult expand(WorldGraph& graph, const Entity* target, std::mt19937_64& rng) override;

private:
    Config cfg_;
};

#endif
