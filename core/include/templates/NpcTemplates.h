#ifndef NPC_TEMPLATES_H
#define NPC_TEMPLATES_H

#include <cstddef>
#include "templates/GrowthTemplate.h"

// A hero rises in a colony. Conflict encourages heroes up to a point;
// beyond `suppressAbove` it suppresses them to damp runaway feedback.
class HeroEmergence : public GrowthTemplate {
public:
    struct Config {
        double target = 10.0;            // heroes
        double minConflict = 20.0;
        double suppressAbove = 80.0;
        double suppressedChance = 0.3;
        double quietChance = 0.2;
        std::size_t maxFollowers = 2;
    };

    HeroEmergence() : HeroEmergence(Config{}) {}
    explicit HeroEmergence(const Config& cfg)
        : GrowthTemplate("hero_emergence", "Hero Emergence", "npc"), cfg_(cfg) {}

    bool canApply(const WorldGraph& graph, std::mt19937_64& rng) const override;
    std::vector<const Entity*> findTargets(const WorldGraph& graph) const override;
    TemplateResult expand(WorldGraph& graph, const Entity* target, std::mt19937_64& rng) override;

private:
    Config cfg_;
};

// A family of 5-8 joins an active faction. Traditional/radical traits are
// settled by a short Metropolis walk on a 1-D Ising chain with
// anti-ferromagnetic coupling, so neighbours in birth order tend to differ;
// differing neighbours may become rivals.
class KinshipConstellation : public GrowthTemplate {
public:
    struct Config {
        std::size_t maxNpcs = 100;
        int minFamily = 5;
        int maxFamily = 8;
        double coupling = -0.5;          // J
        double field = 0.3;              // |h|; sign follows the faction's tradition
        double temperature = 1.0;
        int sweeps = 50;
        double rivalChance = 0.4;
        double loverChance = 0.5;
    };

    KinshipConstellation() : KinshipConstellation(Config{}) {}
    explicit KinshipConstellation(const Config& cfg)
        : GrowthTemplate("kinship_constellation", "Kinship Constellation", "npc"), cfg_(cfg) {}

    bool canApply(const WorldGraph& graph, std::mt19937_64& rng) const override;
    std::vector<const Entity*> findTargets(const WorldGraph& graph) const override;
    TemplateResult expand(WorldGraph& graph, const Entity* target, std::mt19937_64& rng) override;

private:
    Config cfg_;
};

// A well-known NPC near an anomaly disappears. The victim is weighted by
// proximity to anomalies and prominence; loved ones begin searching.
class MysteriousVanishing : public GrowthTemplate {
public:
    struct Config {
        double activationChance = 0.1;
        std::size_t maxSearchers = 3;
    };

    MysteriousVanishing() : MysteriousVanishing(Config{}) {}
    explicit MysteriousVanishing(const Config& cfg)
        : GrowthTemplate("mysterious_vanishing", "Mysterious Vanishing", "location"), cfg_(cfg) {}

    bool canApply(const WorldGraph& graph, std::mt19937_64& rng) const override;
    std::vector<const Entity*> findTargets(const WorldGraph& graph) const override;
    TemplateResult expand(WorldGraph& graph, const Entity* target, std::mt19937_64& rng) override;

private:
    Config cfg_;
};

#endif
