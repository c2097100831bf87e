#ifndef ENGINE_H
#define ENGINE_H

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <random>
#include <string>
#include <vector>
#include "kernel/Domain.h"
#include "kernel/Era.h"
#include "kernel/Mutation.h"
#include "kernel/Pressures.h"
#include "kernel/WorldGraph.h"
#include "modules/SimulationSystem.h"
#include "templates/GrowthTemplate.h"
#include "utils/EventLog.h"
#include "utils/Validation.h"

// ---------- Tuning Constants ----------
// Growth pacing and consolidation. These shape how fast the world fills in
// and how much of it is forgotten along the way.
namespace TuningConstants {
    // Growth target per epoch
    constexpr std::size_t kMinGrowthTarget = 3;
    constexpr std::size_t kMaxGrowthTarget = 25;
    constexpr double kGrowthVariance = 0.3;         // +/- fraction applied to the epoch target
    constexpr double kTemplateOversample = 3.0;     // template attempts per wanted entity
    constexpr double kDeficitWeight = 2.5;          // template weight gain per unit of kind deficit

    // Prune and consolidate (epoch end)
    constexpr std::uint64_t kPruneAge = 50;
    constexpr std::size_t kPruneMinConnections = 2;
    constexpr std::uint64_t kNaturalDeathAge = 80;
    constexpr double kNaturalDeathChance = 0.3;

    // Growth monitoring
    constexpr double kGrowthWarnRate = 30.0;        // relationships per tick
    constexpr std::size_t kGrowthWarnMinSamples = 10;
    constexpr std::size_t kAggressiveSystemRelationships = 500;
    constexpr std::uint64_t kAggressiveWarnInterval = 20;
}

// ---------- Configuration ----------
struct EngineConfig {
    std::uint64_t seed = 42;
    std::uint64_t maxTicks = 500;
    std::uint32_t ticksPerEpoch = 10;
    std::uint32_t epochsPerEra = 2;
    double targetEntitiesPerKind = 30.0;
    std::vector<std::string> entityKinds = {"npc", "faction", "rules", "abilities", "location"};
    std::size_t maxRelationshipsPerTick = 0;    // 0 = unbounded
    std::size_t growthWindow = 20;              // ticks in the rolling growth average
    double maxPressureStep = 10.0;              // per-epoch pressure change limit
    std::size_t eventLogCapacity = 0;           // 0 = unbounded
    bool verbose = false;
};

struct SeedRelationship {
    std::string kind;
    std::string src;
    std::string dst;
    std::optional<double> strength;
    std::optional<double> distance;
};

// Everything the domain supplies for a run. Seed entities must carry ids so
// seed relationships can name them.
struct WorldSetup {
    std::shared_ptr<const DomainSchema> schema;
    std::vector<EntitySpec> entities;
    std::vector<SeedRelationship> relationships;
    std::map<std::string, double> initialPressures;   // overrides PressureDefinition::initial
    std::vector<Era> eras;
    std::vector<PressureDefinition> pressures;
};

// ---------- World Engine ----------
// Owns the graph for one run and drives it tick by tick: systems in
// registration order, then the growth phase, then pressure bookkeeping.
// Each tick either completes or throws; abort() takes effect between ticks.
class WorldEngine {
public:
    WorldEngine(const EngineConfig& cfg, WorldSetup setup);

    void addTemplate(std::unique_ptr<GrowthTemplate> tmpl);
    void addSystem(std::unique_ptr<SimulationSystem> system);

    // Lifecycle
    void step();
    void stepN(int n);
    void run();
    void abort() { aborted_ = true; }
    void reset();
    bool shouldContinue() const;
    bool aborted() const { return aborted_; }

    ValidationReport validate() const;

    // Access
    const WorldGraph& graph() const { return graph_; }
    WorldGraph& graphMut() { return graph_; }
    EventLog& eventLog() { return event_log_; }
    const EventLog& eventLog() const { return event_log_; }
    const EngineConfig& config() const { return cfg_; }
    const std::vector<Era>& eras() const { return setup_.eras; }
    const Era& currentEra() const;
    std::size_t epoch() const { return epoch_; }
    std::size_t totalEpochs() const { return setup_.eras.size() * cfg_.epochsPerEra; }
    std::size_t epochGrowthTarget() const { return epoch_target_; }
    std::size_t templateCount() const { return templates_.size(); }
    std::size_t systemCount() const { return systems_.size(); }
    std::mt19937_64& rng() { return rng_; }

    // Metrics (lightweight for logging)
    struct Metrics {
        std::uint64_t tick = 0;
        std::size_t epoch = 0;
        std::string era;
        std::size_t entities = 0;
        std::size_t relationships = 0;
        std::size_t historicalRelationships = 0;
        double averageGrowth = 0.0;
        std::map<std::string, std::size_t> entitiesByKind;
        std::map<std::string, double> pressures;
    };
    Metrics computeMetrics() const;

private:
    void beginEpoch();
    void endEpoch();
    void runSystems();
    void runGrowth();
    void updatePressures();
    void pruneAndConsolidate();
    void monitorGrowth();
    std::size_t computeGrowthTarget();
    double kindDeficit(const std::string& kind) const;

    // Commits within the remaining per-tick relationship budget.
    CommitOutcome commit(const MutationBatch& batch);

    EngineConfig cfg_;
    WorldSetup setup_;
    WorldGraph graph_;
    EventLog event_log_;
    std::mt19937_64 rng_;
    std::vector<std::unique_ptr<GrowthTemplate>> templates_;
    std::vector<std::unique_ptr<SimulationSystem>> systems_;

    std::size_t epoch_ = 0;
    std::size_t epoch_target_ = 0;
    std::size_t epoch_created_ = 0;
    std::size_t tick_relationships_ = 0;
    bool budget_warned_ = false;
    std::map<std::string, std::size_t> system_relationships_;
    std::map<std::string, std::uint64_t> system_warned_at_;
    std::atomic<bool> aborted_{false};
};

#endif
