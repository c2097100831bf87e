#include "kernel/Relationship.h"

#include <unordered_map>

namespace {
const std::unordered_map<std::string, double>& strengthTable() {
    static const std::unordered_map<std::string, double> table = {
        // Structural
        {"member_of", 1.0}, {"leader_of", 1.0},
        {"practitioner_of", 0.9}, {"originated_in", 0.9}, {"founded_by", 0.9}, {"mastered_by", 0.9},
        {"split_from", 0.8},
        // Political and commemorative
        {"controls", 0.7}, {"commemorates", 0.7}, {"ally_of", 0.7}, {"enemy_of", 0.7},
        {"stronghold_of", 0.7}, {"supersedes", 0.7}, {"at_war_with", 0.7}, {"allied_with", 0.7},
        {"follower_of", 0.6}, {"manifests_at", 0.6}, {"adherent_of", 0.6}, {"derived_from", 0.6},
        // Social
        {"friend_of", 0.5}, {"rival_of", 0.5}, {"mentor_of", 0.5}, {"family_of", 0.5},
        {"lover_of", 0.5}, {"weaponized_by", 0.5}, {"kept_secret_by", 0.5},
        {"related_to", 0.5}, {"inspired_by", 0.5},
        // Spatial
        {"resident_of", 0.3}, {"located_at", 0.3}, {"slumbers_beneath", 0.3},
        {"discovered_by", 0.2}, {"adjacent_to", 0.2}, {"contains", 0.2}, {"contained_by", 0.2}
    };
    return table;
}

const std::unordered_map<std::string, RelationshipCategory>& categoryTable() {
    static const std::unordered_map<std::string, RelationshipCategory> table = [] {
        std::unordered_map<std::string, RelationshipCategory> t;
        for (const char* k : {"derived_from", "related_to", "split_from", "supersedes", "inspired_by",
                              "adjacent_to", "contained_by", "part_of", "founded_by", "created_by",
                              "discovered_by"}) {
            t[k] = RelationshipCategory::ImmutableFact;
        }
        for (const char* k : {"trades_with", "at_war_with", "ally_of", "allied_with", "enemy_of",
                              "controls", "stronghold_of"}) {
            t[k] = RelationshipCategory::Political;
        }
        for (const char* k : {"member_of", "leader_of", "practitioner_of", "adherent_of",
                              "weaponized_by", "kept_secret_by"}) {
            t[k] = RelationshipCategory::Institutional;
        }
        return t;
    }();
    return table;
}

const std::unordered_map<std::string, std::pair<double, double>>& lineageTable() {
    static const std::unordered_map<std::string, std::pair<double, double>> table = {
        {"derived_from", {0.05, 0.6}},
        {"related_to", {0.3, 0.7}},
        {"split_from", {0.15, 0.8}},
        {"supersedes", {0.1, 0.5}},
        {"inspired_by", {0.3, 0.6}},
        {"part_of", {0.0, 0.3}},
        {"adjacent_to", {0.0, 0.5}},
        {"contains", {0.0, 0.3}},
        {"contained_by", {0.0, 0.3}}
    };
    return table;
}
}

bool operator==(const Relationship& a, const Relationship& b) {
    return a.kind == b.kind && a.src == b.src && a.dst == b.dst &&
           a.strength == b.strength && a.distance == b.distance &&
           a.category == b.category && a.status == b.status &&
           a.archivedAt == b.archivedAt && a.createdAt == b.createdAt;
}

double defaultStrength(const std::string& kind) {
    const auto& table = strengthTable();
    auto it = table.find(kind);
    return it != table.end() ? it->second : 0.5;
}

RelationshipCategory categoryForKind(const std::string& kind) {
    const auto& table = categoryTable();
    auto it = table.find(kind);
    return it != table.end() ? it->second : RelationshipCategory::Social;
}

bool isLineageKind(const std::string& kind) {
    return lineageTable().count(kind) > 0;
}

std::optional<std::pair<double, double>> lineageDistanceRange(const std::string& kind) {
    const auto& table = lineageTable();
    auto it = table.find(kind);
    if (it == table.end()) {
        return std::nullopt;
    }
    return it->second;
}

const char* categoryName(RelationshipCategory category) {
    switch (category) {
        case RelationshipCategory::Political: return "political";
        case RelationshipCategory::Social: return "social";
        case RelationshipCategory::Institutional: return "institutional";
        case RelationshipCategory::ImmutableFact: return "immutable_fact";
    }
    return "social";
}

const char* statusName(RelationshipStatus status) {
    return status == RelationshipStatus::Historical ? "historical" : "active";
}
