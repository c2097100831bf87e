#ifndef GROWTH_TEMPLATE_H
#define GROWTH_TEMPLATE_H

#include <random>
#include <string>
#include <utility>
#include <vector>
#include "kernel/Mutation.h"
#include "kernel/WorldGraph.h"

// Rule that grows the world. canApply gates, findTargets proposes subjects,
// expand builds a batch whose relationships may point at pending entities.
// An unmet precondition yields an empty batch with a reason; only a missing
// required capability (ConfigurationError) throws.
class GrowthTemplate {
public:
    GrowthTemplate(std::string id, std::string name, std::string producesKind)
        : id_(std::move(id)), name_(std::move(name)), produces_kind_(std::move(producesKind)) {}
    virtual ~GrowthTemplate() = default;

    const std::string& id() const { return id_; }
    const std::string& name() const { return name_; }
    // Entity kind this template mainly creates (drives deficit weighting).
    const std::string& producesKind() const { return produces_kind_; }

    virtual bool canApply(const WorldGraph& graph, std::mt19937_64& rng) const = 0;
    virtual std::vector<const Entity*> findTargets(const WorldGraph& graph) const = 0;
    virtual TemplateResult expand(WorldGraph& graph, const Entity* target, std::mt19937_64& rng) = 0;

    static constexpr double kOvershoot = 1.5;

protected:
    // Soft cap: existing (kind, subtype) count against target x overshoot.
    static bool saturated(const WorldGraph& graph, const std::string& kind, const std::string& subtype,
                          double target, double overshoot = kOvershoot) {
        return static_cast<double>(graph.getEntityCount(kind, subtype)) >= target * overshoot;
    }

    // First non-empty bucket in subtype preference order.
    static std::vector<const Entity*> preferSubtypes(const std::vector<const Entity*>& candidates,
                                                     const std::vector<std::string>& order) {
        for (const auto& subtype : order) {
            std::vector<const Entity*> bucket;
            for (const Entity* e : candidates) {
                if (e->subtype == subtype) bucket.push_back(e);
            }
            if (!bucket.empty()) return bucket;
        }
        return {};
    }

private:
    std::string id_;
    std::string name_;
    std::string produces_kind_;
};

#endif
