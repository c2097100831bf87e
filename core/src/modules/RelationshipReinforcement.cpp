#include "modules/RelationshipReinforcement.h"

#include <algorithm>
#include <unordered_map>
#include <unordered_set>
#include "kernel/Queries.h"

namespace {
const std::unordered_set<std::string> kNarrativeKinds = {
    "member_of", "leader_of", "practitioner_of", "originated_in", "founded_by", "discoverer_of"
};
const std::unordered_set<std::string> kSpatialKinds = {
    "resident_of", "located_at", "adjacent_to", "contains", "contained_by", "slumbers_beneath", "manifests_at"
};

bool shareEnemy(const std::unordered_map<std::string, std::vector<std::string>>& enemies,
                const std::string& a, const std::string& b) {
    auto ia = enemies.find(a);
    auto ib = enemies.find(b);
    if (ia == enemies.end() || ib == enemies.end()) return false;
    return std::any_of(ia->second.begin(), ia->second.end(), [&](const std::string& e) {
        return std::find(ib->second.begin(), ib->second.end(), e) != ib->second.end();
    });
}
}

SystemResult RelationshipReinforcement::apply(WorldGraph& graph, double eraModifier, std::mt19937_64& /*rng*/) {
    const MembershipIndex index = buildMembershipIndex(graph);
    std::unordered_map<std::string, std::vector<std::string>> enemies;
    for (const auto& rel : graph.relationships()) {
        if (rel.kind == "enemy_of") enemies[rel.src].push_back(rel.dst);
    }

    const std::size_t reinforced = graph.adjustRelationships([&](Relationship& rel) {
        if (rel.status == RelationshipStatus::Historical || rel.strength >= cfg_.cap) return false;
        if (!graph.hasEntity(rel.src) || !graph.hasEntity(rel.dst)) return false;

        double bonus = 0.0;
        const bool spatial = kSpatialKinds.count(rel.kind) > 0;
        if (spatial || kNarrativeKinds.count(rel.kind)) {
            bonus += cfg_.structuralBonus;
        }
        if (!spatial) {
            if (index.sameLocation(rel.src, rel.dst)) bonus += cfg_.proximityBonus;
            if (index.shareFaction(rel.src, rel.dst)) bonus += cfg_.sharedFactionBonus;
            if (shareEnemy(enemies, rel.src, rel.dst)) bonus += cfg_.sharedConflictBonus;
        }
        bonus *= eraModifier;
        if (bonus <= 0.0) return false;
        rel.strength = std::min(cfg_.cap, rel.strength + bonus);
        return true;
    });

    if (reinforced == 0) {
        return SystemResult::none("Relationship bonding dormant");
    }
    return SystemResult::none("Bonds strengthen through shared experiences (" +
                              std::to_string(reinforced) + " reinforced)");
}
