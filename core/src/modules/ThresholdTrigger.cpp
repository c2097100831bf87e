#include "modules/ThresholdTrigger.h"

#include <map>
#include <numeric>
#include <stdexcept>
#include <unordered_map>
#include <utility>
#include "kernel/Queries.h"
#include "kernel/Random.h"

namespace {
bool inBounds(std::size_t n, const std::optional<std::size_t>& lo, const std::optional<std::size_t>& hi) {
    if (lo && n < *lo) return false;
    if (hi && n > *hi) return false;
    return true;
}

// Path-halving union-find over dense indices.
class DisjointSet {
public:
    explicit DisjointSet(std::size_t n) : parent_(n) { std::iota(parent_.begin(), parent_.end(), 0); }

    std::size_t find(std::size_t x) {
        while (parent_[x] != x) {
            parent_[x] = parent_[parent_[x]];
            x = parent_[x];
        }
        return x;
    }

    void unite(std::size_t a, std::size_t b) {
        a = find(a);
        b = find(b);
        if (a == b) return;
        // Lower index wins so roots are stable across runs
        if (b < a) std::swap(a, b);
        parent_[b] = a;
    }

private:
    std::vector<std::size_t> parent_;
};
}

ThresholdTrigger::ThresholdTrigger(const Config& cfg)
    : SimulationSystem(cfg.id, cfg.name), cfg_(cfg) {
    if (cfg_.id.empty()) {
        throw std::invalid_argument("threshold trigger requires an id");
    }
    if (cfg_.minClusterSize == 0) {
        throw std::invalid_argument("threshold trigger " + cfg_.id + ": minClusterSize must be >= 1 (got 0)");
    }
}

bool ThresholdTrigger::passes(const WorldGraph& graph, const Entity& entity,
                              const TriggerCondition& condition) const {
    switch (condition.type) {
        case ConditionType::RelationshipCount: {
            std::size_t n = 0;
            for (const Relationship* rel : graph.getEntityRelationships(entity.id, condition.direction)) {
                if (condition.relationshipKind.empty() || rel->kind == condition.relationshipKind) ++n;
            }
            return inBounds(n, condition.min, condition.max);
        }
        case ConditionType::RelationshipExists: {
            for (const Relationship* rel : graph.getEntityRelationships(entity.id, condition.direction)) {
                if (!condition.relationshipKind.empty() && rel->kind != condition.relationshipKind) continue;
                const std::string& otherId = rel->src == entity.id ? rel->dst : rel->src;
                const Entity* other = graph.getEntity(otherId);
                if (!other) continue;
                if (!condition.targetKind.empty() && other->kind != condition.targetKind) continue;
                if (!condition.targetStatus.empty() && other->status != condition.targetStatus) continue;
                return true;
            }
            return false;
        }
        case ConditionType::EntityStatus:
            return entity.status == condition.value;
        case ConditionType::TagExists:
            return entity.tags.has(condition.value);
        case ConditionType::TagAbsent:
            return !entity.tags.has(condition.value);
        case ConditionType::PressureAbove:
            return graph.getPressure(condition.pressure) > condition.threshold;
        case ConditionType::PressureBelow:
            return graph.getPressure(condition.pressure) < condition.threshold;
        case ConditionType::TimeSinceUpdate:
            return graph.tick() >= entity.updatedAt + condition.ticks;
        case ConditionType::ConnectionCount:
            return inBounds(connectionCount(graph, entity.id), condition.min, condition.max);
    }
    return false;
}

std::vector<const Entity*> ThresholdTrigger::findMatches(const WorldGraph& graph) const {
    std::vector<const Entity*> matches;
    for (const Entity* e : graph.findEntities(cfg_.filter)) {
        if (!cfg_.cooldownTag.empty() && e->tags.has(cfg_.cooldownTag)) continue;
        bool ok = true;
        for (const auto& condition : cfg_.conditions) {
            if (!passes(graph, *e, condition)) {
                ok = false;
                break;
            }
        }
        if (ok) matches.push_back(e);
    }
    return matches;
}

std::vector<std::vector<const Entity*>> ThresholdTrigger::buildClusters(
    const WorldGraph& graph, const std::vector<const Entity*>& matches) const {
    std::vector<std::vector<const Entity*>> clusters;
    switch (cfg_.clusterMode) {
        case ClusterMode::Individual:
            for (const Entity* e : matches) clusters.push_back({e});
            return clusters;
        case ClusterMode::AllMatching:
            if (!matches.empty()) clusters.push_back(matches);
            return clusters;
        case ClusterMode::ByRelationship:
            break;
    }

    std::unordered_map<std::string, std::size_t> index;
    for (std::size_t i = 0; i < matches.size(); ++i) index.emplace(matches[i]->id, i);

    DisjointSet sets(matches.size());
    // Non-matching endpoint -> first matching entity seen touching it
    std::unordered_map<std::string, std::size_t> anchor;
    auto join = [&](std::size_t member, const std::string& otherId) {
        auto direct = index.find(otherId);
        if (direct != index.end()) {
            sets.unite(member, direct->second);
            return;
        }
        auto [it, inserted] = anchor.emplace(otherId, member);
        if (!inserted) sets.unite(member, it->second);
    };

    for (const auto& rel : graph.relationships()) {
        if (!cfg_.clusterRelationshipKind.empty() && rel.kind != cfg_.clusterRelationshipKind) continue;
        auto src = index.find(rel.src);
        auto dst = index.find(rel.dst);
        if (src != index.end()) join(src->second, rel.dst);
        if (dst != index.end() && src == index.end()) join(dst->second, rel.src);
    }

    std::map<std::size_t, std::vector<const Entity*>> byRoot;
    for (std::size_t i = 0; i < matches.size(); ++i) {
        byRoot[sets.find(i)].push_back(matches[i]);
    }
    for (auto& [root, members] : byRoot) {
        clusters.push_back(std::move(members));
    }
    return clusters;
}

SystemResult ThresholdTrigger::apply(WorldGraph& graph, double eraModifier, std::mt19937_64& rng) {
    if (cfg_.throttleChance < 1.0 && !rollProbability(cfg_.throttleChance, eraModifier, rng)) {
        return dormant();
    }

    const auto matches = findMatches(graph);
    if (matches.empty()) {
        return SystemResult::none(name() + ": no entities meet the conditions");
    }

    SystemResult result;
    std::size_t fired = 0;
    for (const auto& cluster : buildClusters(graph, matches)) {
        if (cluster.size() < cfg_.minClusterSize) continue;
        ++fired;

        std::string clusterId;
        for (const auto& action : cfg_.actions) {
            switch (action.type) {
                case ActionType::SetTag:
                case ActionType::SetClusterTag:
                case ActionType::RemoveTag: {
                    if (action.type == ActionType::SetClusterTag && clusterId.empty()) {
                        clusterId = graph.generateId("cluster");
                    }
                    for (const Entity* member : cluster) {
                        EntityChanges changes;
                        if (action.type == ActionType::RemoveTag) {
                            changes.withoutTag(action.key);
                        } else if (action.type == ActionType::SetClusterTag) {
                            changes.withTag(action.key, clusterId);
                        } else if (action.value.empty()) {
                            changes.withFlag(action.key);
                        } else {
                            changes.withTag(action.key, action.value);
                        }
                        result.modify(member->id, changes);
                    }
                    break;
                }
                case ActionType::ModifyPressure:
                    result.adjustPressure(action.pressure, action.delta);
                    break;
                case ActionType::CreateRelationship:
                    for (std::size_t i = 0; i < cluster.size(); ++i) {
                        for (std::size_t j = i + 1; j < cluster.size(); ++j) {
                            const std::string& a = cluster[i]->id;
                            const std::string& b = cluster[j]->id;
                            if (hasRelationship(graph, a, b, action.relationshipKind)) continue;
                            if (!areRelationshipsCompatible(graph, a, b, action.relationshipKind)) continue;
                            result.relate(action.relationshipKind, a, b, action.strength);
                        }
                    }
                    break;
            }
        }
    }

    if (fired == 0) {
        return SystemResult::none(name() + ": no cluster reached size " + std::to_string(cfg_.minClusterSize));
    }
    result.description = name() + ": " + std::to_string(fired) + " clusters triggered";
    return result;
}
