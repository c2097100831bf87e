#ifndef BELIEF_CONTAGION_H
#define BELIEF_CONTAGION_H

#include <cstdint>
#include <string>
#include "modules/SimulationSystem.h"

// SIR spread of proposed ideologies through follower and faction contacts.
// Infection is the NPC tag "belief:<rule>", immunity "immune:<rule>". A rule
// adopted by enough of the living population is enacted; one that never
// catches on is forgotten.
class BeliefContagion : public SimulationSystem {
public:
    struct Config {
        double transmissionRate = 0.15;   // beta, per infected contact
        double recoveryRate = 0.03;       // gamma
        double resistanceWeight = 0.3;
        double traditionWeight = 0.5;
        double contactMinStrength = 0.3;
        double enactmentThreshold = 0.2;
        double forgetThreshold = 0.05;
        std::uint64_t forgetAfter = 20;   // ticks since proposal
    };

    BeliefContagion() : BeliefContagion(Config{}) {}
    explicit BeliefContagion(const Config& cfg)
        : SimulationSystem("belief_contagion", "Belief Contagion"), cfg_(cfg) {}

    SystemResult apply(WorldGraph& graph, double eraModifier, std::mt19937_64& rng) override;

    static std::string beliefTag(const std::string& ruleId) { return "belief:" + ruleId; }
    static std::string immunityTag(const std::string& ruleId) { return "immune:" + ruleId; }

private:
    Config cfg_;
};

#endif
