#ifndef SIMULATION_SYSTEM_H
#define SIMULATION_SYSTEM_H

#include <random>
#include <string>
#include <utility>
#include "kernel/Mutation.h"
#include "kernel/WorldGraph.h"

// Tick-scoped rule over existing state. apply() may adjust relationship
// strengths directly; everything else it wants goes into the returned batch,
// which the engine commits before the next system runs.
class SimulationSystem {
public:
    SimulationSystem(std::string id, std::string name) : id_(std::move(id)), name_(std::move(name)) {}
    virtual ~SimulationSystem() = default;

    const std::string& id() const { return id_; }
    const std::string& name() const { return name_; }

    virtual SystemResult apply(WorldGraph& graph, double eraModifier, std::mt19937_64& rng) = 0;

protected:
    SystemResult dormant() const { return SystemResult::none(name_ + ": dormant"); }

private:
    std::string id_;
    std::string name_;
};

#endif
