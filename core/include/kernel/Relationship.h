#ifndef RELATIONSHIP_H
#define RELATIONSHIP_H

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

enum class RelationshipCategory : std::uint8_t {
    Political = 0,
    Social = 1,
    Institutional = 2,
    ImmutableFact = 3
};

enum class RelationshipStatus : std::uint8_t {
    Active = 0,
    Historical = 1
};

// Directed, attributed edge. Identity is the (kind, src, dst) triple.
struct Relationship {
    std::string kind;
    std::string src;
    std::string dst;
    double strength = 0.5;                    // 0..1
    std::optional<double> distance;           // 0..1, lineage kinds only
    RelationshipCategory category = RelationshipCategory::Social;
    RelationshipStatus status = RelationshipStatus::Active;
    std::optional<std::uint64_t> archivedAt;
    std::uint64_t createdAt = 0;

    bool sameTriple(const std::string& k, const std::string& s, const std::string& d) const {
        return kind == k && src == s && dst == d;
    }
};

bool operator==(const Relationship& a, const Relationship& b);
inline bool operator!=(const Relationship& a, const Relationship& b) { return !(a == b); }

// Kind-derived defaults
double defaultStrength(const std::string& kind);
RelationshipCategory categoryForKind(const std::string& kind);
bool isLineageKind(const std::string& kind);
// Allowed distance range for a lineage kind (nullopt for other kinds).
std::optional<std::pair<double, double>> lineageDistanceRange(const std::string& kind);

const char* categoryName(RelationshipCategory category);
const char* statusName(RelationshipStatus status);

#endif
