#ifndef QUERIES_H
#define QUERIES_H

#include <cstddef>
#include <cstdint>
#include <optional>
#include <random>
#include <string>
#include <unordered_map>
#include <vector>
#include "kernel/WorldGraph.h"

// Read-only projections shared by templates and systems.

struct RelatedOptions {
    std::optional<double> minStrength;
    std::optional<double> maxStrength;
    bool sortByStrength = false;   // strongest first
};

enum class FactionStance : std::uint8_t {
    Allied = 0,
    Enemy = 1,
    Neutral = 2
};

// Entities on the other end of active `kind` relationships. Outgoing: id is src.
std::vector<const Entity*> getRelated(const WorldGraph& graph, const std::string& id,
                                      const std::string& kind, Direction direction,
                                      const RelatedOptions& options = {});

// Any kind when `kind` is empty.
bool hasRelationship(const WorldGraph& graph, const std::string& src, const std::string& dst,
                     const std::string& kind = "");
std::size_t connectionCount(const WorldGraph& graph, const std::string& id);
// Relationships touching each entity (both directions), one pass.
std::unordered_map<std::string, std::size_t> buildDegreeTable(const WorldGraph& graph);

const Entity* getLocation(const WorldGraph& graph, const std::string& entityId);
std::vector<const Entity*> getResidents(const WorldGraph& graph, const std::string& locationId);
std::vector<const Entity*> getFactionMembers(const WorldGraph& graph, const std::string& factionId);
const Entity* getFactionLeader(const WorldGraph& graph, const std::string& factionId);
std::vector<const Entity*> getFactions(const WorldGraph& graph, const std::string& npcId);

// Hop count ignoring direction; nullopt when unreachable within maxDepth.
std::optional<std::size_t> bfsDistance(const WorldGraph& graph, const std::string& from,
                                       const std::string& to, std::size_t maxDepth = 6);

// Centroid of the references that have coordinates.
std::optional<Point3> deriveCoordinates(const WorldGraph& graph, const std::vector<std::string>& referenceIds);

// Inverse-degree weight: isolated entities 3.0 down to hubs 0.2.
double getConnectionWeight(const Entity& entity);

FactionStance getFactionRelationship(const WorldGraph& graph, const std::string& factionA,
                                     const std::string& factionB);

// Residence and faction membership of every entity, built in one pass.
struct MembershipIndex {
    std::unordered_map<std::string, std::string> location;                  // resident_of
    std::unordered_map<std::string, std::vector<std::string>> factions;     // member_of

    const std::string* locationOf(const std::string& id) const;
    bool sameLocation(const std::string& a, const std::string& b) const;
    bool shareFaction(const std::string& a, const std::string& b) const;
};

MembershipIndex buildMembershipIndex(const WorldGraph& graph);

// Symmetric contradiction table (enemy_of vs lover_of, ...).
bool kindsContradict(const std::string& existingKind, const std::string& proposedKind);

// False when an existing relationship between the pair contradicts newKind.
bool areRelationshipsCompatible(const WorldGraph& graph, const std::string& src,
                                const std::string& dst, const std::string& newKind);

std::string generateEntityName(const WorldGraph& graph, const std::string& kind,
                               const std::string& subtype, std::mt19937_64& rng);
const std::vector<std::string>& themeWords(const WorldGraph& graph, const std::string& list);

#endif
