#include "modules/RelationshipDecay.h"

#include <algorithm>
#include <unordered_set>
#include "kernel/Queries.h"

namespace {
const std::unordered_set<std::string> kNarrativeKinds = {
    "commemorates", "searching_for", "champion_of", "believer_of", "last_seen_at", "seeks"
};
const std::unordered_set<std::string> kSocialKinds = {
    "friend_of", "lover_of", "follower_of", "mentor_of", "family_of", "ally_of"
};
const std::unordered_set<std::string> kSpatialKinds = {
    "located_at", "manifests_at", "explorer_of", "occupies"
};
const std::unordered_set<std::string> kConflictKinds = {
    "enemy_of", "rival_of", "at_war_with"
};
}

double RelationshipDecay::baseRate(const std::string& kind) const {
    if (categoryForKind(kind) == RelationshipCategory::ImmutableFact) return 0.0;
    if (kSocialKinds.count(kind)) return cfg_.socialRate;
    if (kConflictKinds.count(kind)) return cfg_.conflictRate;
    if (kSpatialKinds.count(kind)) return cfg_.spatialRate;
    if (kNarrativeKinds.count(kind)) return cfg_.narrativeRate;
    return 0.0;
}

SystemResult RelationshipDecay::apply(WorldGraph& graph, double eraModifier, std::mt19937_64& /*rng*/) {
    const MembershipIndex index = buildMembershipIndex(graph);

    const std::size_t weakened = graph.adjustRelationships([&](Relationship& rel) {
        if (rel.status == RelationshipStatus::Historical) return false;
        double rate = baseRate(rel.kind) * eraModifier;
        if (rate <= 0.0 || rel.strength <= cfg_.floor) return false;
        if (index.sameLocation(rel.src, rel.dst)) rate *= cfg_.proximityFactor;
        if (index.shareFaction(rel.src, rel.dst)) rate *= cfg_.sharedFactionFactor;
        rel.strength = std::max(cfg_.floor, rel.strength - rate);
        return true;
    });

    if (weakened == 0) {
        return dormant();
    }
    return SystemResult::none("Bonds fade with time (" + std::to_string(weakened) + " weakened)");
}
