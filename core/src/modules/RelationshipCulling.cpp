#include "modules/RelationshipCulling.h"

SystemResult RelationshipCulling::apply(WorldGraph& graph, double /*eraModifier*/, std::mt19937_64& /*rng*/) {
    const std::uint64_t interval = cfg_.interval == 0 ? 1 : cfg_.interval;
    if (graph.tick() % interval != 0) {
        return dormant();
    }

    const std::uint64_t now = graph.tick();
    std::size_t dangling = 0;
    std::size_t weak = 0;
    graph.removeRelationshipsIf([&](const Relationship& rel) {
        if (!graph.hasEntity(rel.src) || !graph.hasEntity(rel.dst)) {
            ++dangling;
            return true;
        }
        if (rel.status == RelationshipStatus::Historical) return false;
        const bool cullable = rel.category == RelationshipCategory::Social ||
                              rel.category == RelationshipCategory::Political;
        if (!cullable || rel.strength >= cfg_.cullThreshold) return false;
        if (now - rel.createdAt < cfg_.gracePeriod) return false;
        ++weak;
        return true;
    });

    if (weak == 0 && dangling == 0) {
        return SystemResult::none(name() + ": nothing to cull");
    }
    return SystemResult::none(name() + ": culled " + std::to_string(weak) + " weak and " +
                              std::to_string(dangling) + " dangling relationships");
}
