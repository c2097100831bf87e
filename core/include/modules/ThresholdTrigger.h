#ifndef THRESHOLD_TRIGGER_H
#define THRESHOLD_TRIGGER_H

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "modules/SimulationSystem.h"

// Data-driven observe-then-tag system. Entities passing the filter and every
// condition are grouped into clusters; each cluster that reaches the minimum
// size receives the configured actions. Detection stays here, reaction lives
// in templates that look for the resulting tags.

enum class ConditionType : std::uint8_t {
    RelationshipCount = 0,   // relationships of `relationshipKind` in `direction` within [min, max]
    RelationshipExists = 1,  // one such relationship whose other end matches targetKind/targetStatus
    EntityStatus = 2,
    TagExists = 3,
    TagAbsent = 4,
    PressureAbove = 5,
    PressureBelow = 6,
    TimeSinceUpdate = 7,     // tick - updatedAt >= ticks
    ConnectionCount = 8      // all relationships, both directions, within [min, max]
};

struct TriggerCondition {
    ConditionType type = ConditionType::RelationshipCount;
    std::string relationshipKind;          // empty = any kind
    Direction direction = Direction::Both;
    std::optional<std::size_t> min;
    std::optional<std::size_t> max;
    std::string targetKind;
    std::string targetStatus;
    std::string value;                     // status or tag key
    std::string pressure;
    double threshold = 0.0;
    std::uint64_t ticks = 0;
};

enum class ActionType : std::uint8_t {
    SetTag = 0,
    SetClusterTag = 1,       // key = shared "cluster_N" id
    RemoveTag = 2,
    ModifyPressure = 3,      // once per cluster
    CreateRelationship = 4   // between every pair of cluster members
};

struct TriggerAction {
    ActionType type = ActionType::SetTag;
    std::string key;
    std::string value;                     // empty = boolean flag
    std::string pressure;
    double delta = 0.0;
    std::string relationshipKind;
    std::optional<double> strength;
};

enum class ClusterMode : std::uint8_t {
    Individual = 0,
    AllMatching = 1,
    ByRelationship = 2       // union-find over shared relationship endpoints
};

class ThresholdTrigger : public SimulationSystem {
public:
    struct Config {
        std::string id;
        std::string name;
        EntityCriteria filter;
        std::vector<TriggerCondition> conditions;
        ClusterMode clusterMode = ClusterMode::Individual;
        std::string clusterRelationshipKind;   // by_relationship; empty = any kind
        std::size_t minClusterSize = 1;
        double throttleChance = 1.0;
        std::string cooldownTag;               // entities carrying it are skipped
        std::vector<TriggerAction> actions;
    };

    explicit ThresholdTrigger(const Config& cfg);

    SystemResult apply(WorldGraph& graph, double eraModifier, std::mt19937_64& rng) override;

    // Entities passing the filter, cooldown tag and all conditions, in id order.
    std::vector<const Entity*> findMatches(const WorldGraph& graph) const;
    std::vector<std::vector<const Entity*>> buildClusters(const WorldGraph& graph,
                                                          const std::vector<const Entity*>& matches) const;

private:
    bool passes(const WorldGraph& graph, const Entity& entity, const TriggerCondition& condition) const;

    Config cfg_;
};

#endif
