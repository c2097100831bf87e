#include "kernel/Queries.h"

#include <algorithm>
#include <deque>
#include <unordered_map>
#include <unordered_set>
#include "kernel/Domain.h"

namespace {
const std::unordered_map<std::string, std::vector<std::string>>& contradictionTable() {
    static const std::unordered_map<std::string, std::vector<std::string>> table = {
        {"enemy_of", {"lover_of", "follower_of", "ally_of", "allied_with"}},
        {"lover_of", {"enemy_of", "rival_of"}},
        {"rival_of", {"lover_of", "follower_of", "mentor_of"}},
        {"follower_of", {"enemy_of", "rival_of"}},
        {"at_war_with", {"allied_with"}},
        {"mentor_of", {"rival_of"}},
        {"searching_for", {"lover_of", "follower_of"}}
    };
    return table;
}

}

bool kindsContradict(const std::string& existingKind, const std::string& proposedKind) {
    const auto& table = contradictionTable();
    auto check = [&](const std::string& a, const std::string& b) {
        auto it = table.find(a);
        return it != table.end() && std::find(it->second.begin(), it->second.end(), b) != it->second.end();
    };
    return check(existingKind, proposedKind) || check(proposedKind, existingKind);
}

const std::string* MembershipIndex::locationOf(const std::string& id) const {
    auto it = location.find(id);
    return it != location.end() ? &it->second : nullptr;
}

bool MembershipIndex::sameLocation(const std::string& a, const std::string& b) const {
    const std::string* la = locationOf(a);
    const std::string* lb = locationOf(b);
    return la && lb && *la == *lb;
}

bool MembershipIndex::shareFaction(const std::string& a, const std::string& b) const {
    auto ia = factions.find(a);
    auto ib = factions.find(b);
    if (ia == factions.end() || ib == factions.end()) {
        return false;
    }
    for (const auto& f : ia->second) {
        if (std::find(ib->second.begin(), ib->second.end(), f) != ib->second.end()) {
            return true;
        }
    }
    return false;
}

MembershipIndex buildMembershipIndex(const WorldGraph& graph) {
    MembershipIndex index;
    for (const auto& rel : graph.relationships()) {
        if (rel.status == RelationshipStatus::Historical) continue;
        if (rel.kind == "resident_of") {
            index.location.emplace(rel.src, rel.dst);   // first residence wins
        } else if (rel.kind == "member_of") {
            index.factions[rel.src].push_back(rel.dst);
        }
    }
    return index;
}

std::vector<const Entity*> getRelated(const WorldGraph& graph, const std::string& id,
                                      const std::string& kind, Direction direction,
                                      const RelatedOptions& options) {
    std::vector<std::pair<const Entity*, double>> found;
    std::unordered_set<std::string> seen;
    for (const auto& rel : graph.relationships()) {
        if (rel.kind != kind || rel.status == RelationshipStatus::Historical) continue;
        if (options.minStrength && rel.strength < *options.minStrength) continue;
        if (options.maxStrength && rel.strength > *options.maxStrength) continue;

        const std::string* other = nullptr;
        if (rel.src == id && direction != Direction::Incoming) {
            other = &rel.dst;
        } else if (rel.dst == id && direction != Direction::Outgoing) {
            other = &rel.src;
        }
        if (!other || !seen.insert(*other).second) continue;
        if (const Entity* entity = graph.getEntity(*other)) {
            found.emplace_back(entity, rel.strength);
        }
    }
    if (options.sortByStrength) {
        std::stable_sort(found.begin(), found.end(),
                         [](const auto& a, const auto& b) { return a.second > b.second; });
    }
    std::vector<const Entity*> out;
    out.reserve(found.size());
    for (const auto& entry : found) {
        out.push_back(entry.first);
    }
    return out;
}

bool hasRelationship(const WorldGraph& graph, const std::string& src, const std::string& dst,
                     const std::string& kind) {
    if (!kind.empty()) {
        return graph.findRelationship(src, dst, kind) != nullptr;
    }
    return std::any_of(graph.relationships().begin(), graph.relationships().end(),
                       [&](const Relationship& r) { return r.src == src && r.dst == dst; });
}

std::size_t connectionCount(const WorldGraph& graph, const std::string& id) {
    return static_cast<std::size_t>(std::count_if(
        graph.relationships().begin(), graph.relationships().end(),
        [&](const Relationship& r) { return r.src == id || r.dst == id; }));
}

std::unordered_map<std::string, std::size_t> buildDegreeTable(const WorldGraph& graph) {
    std::unordered_map<std::string, std::size_t> degree;
    for (const auto& rel : graph.relationships()) {
        ++degree[rel.src];
        if (rel.dst != rel.src) ++degree[rel.dst];
    }
    return degree;
}

const Entity* getLocation(const WorldGraph& graph, const std::string& entityId) {
    auto related = getRelated(graph, entityId, "resident_of", Direction::Outgoing);
    return related.empty() ? nullptr : related.front();
}

std::vector<const Entity*> getResidents(const WorldGraph& graph, const std::string& locationId) {
    return getRelated(graph, locationId, "resident_of", Direction::Incoming);
}

std::vector<const Entity*> getFactionMembers(const WorldGraph& graph, const std::string& factionId) {
    return getRelated(graph, factionId, "member_of", Direction::Incoming);
}

const Entity* getFactionLeader(const WorldGraph& graph, const std::string& factionId) {
    auto leaders = getRelated(graph, factionId, "leader_of", Direction::Incoming);
    return leaders.empty() ? nullptr : leaders.front();
}

std::vector<const Entity*> getFactions(const WorldGraph& graph, const std::string& npcId) {
    return getRelated(graph, npcId, "member_of", Direction::Outgoing);
}

std::optional<std::size_t> bfsDistance(const WorldGraph& graph, const std::string& from,
                                       const std::string& to, std::size_t maxDepth) {
    if (from == to) {
        return 0;
    }
    std::unordered_map<std::string, std::vector<std::string>> adjacency;
    for (const auto& rel : graph.relationships()) {
        adjacency[rel.src].push_back(rel.dst);
        adjacency[rel.dst].push_back(rel.src);
    }

    std::unordered_set<std::string> visited{from};
    std::deque<std::pair<std::string, std::size_t>> frontier{{from, 0}};
    while (!frontier.empty()) {
        auto [current, depth] = frontier.front();
        frontier.pop_front();
        if (depth >= maxDepth) continue;
        for (const auto& next : adjacency[current]) {
            if (!visited.insert(next).second) continue;
            if (next == to) {
                return depth + 1;
            }
            frontier.emplace_back(next, depth + 1);
        }
    }
    return std::nullopt;
}

std::optional<Point3> deriveCoordinates(const WorldGraph& graph, const std::vector<std::string>& referenceIds) {
    Point3 sum;
    std::size_t count = 0;
    for (const auto& id : referenceIds) {
        const Entity* entity = graph.getEntity(id);
        if (!entity || !entity->coordinates) continue;
        sum.x += entity->coordinates->x;
        sum.y += entity->coordinates->y;
        sum.z += entity->coordinates->z;
        ++count;
    }
    if (count == 0) {
        return std::nullopt;
    }
    const double n = static_cast<double>(count);
    return Point3{sum.x / n, sum.y / n, sum.z / n};
}

double getConnectionWeight(const Entity& entity) {
    const std::size_t links = entity.links.size();
    if (links == 0) return 3.0;
    if (links <= 2) return 2.0;
    if (links <= 5) return 1.0;
    if (links <= 10) return 0.5;
    return 0.2;
}

FactionStance getFactionRelationship(const WorldGraph& graph, const std::string& factionA,
                                     const std::string& factionB) {
    auto between = [&](const std::string& kind) {
        return graph.findRelationship(factionA, factionB, kind) ||
               graph.findRelationship(factionB, factionA, kind);
    };
    if (between("at_war_with") || between("enemy_of")) {
        return FactionStance::Enemy;
    }
    if (between("allied_with")) {
        return FactionStance::Allied;
    }
    return FactionStance::Neutral;
}

bool areRelationshipsCompatible(const WorldGraph& graph, const std::string& src,
                                const std::string& dst, const std::string& newKind) {
    for (const auto& rel : graph.relationships()) {
        const bool samePair = (rel.src == src && rel.dst == dst) || (rel.src == dst && rel.dst == src);
        if (samePair && kindsContradict(rel.kind, newKind)) {
            return false;
        }
    }
    return true;
}

std::string generateEntityName(const WorldGraph& graph, const std::string& kind,
                               const std::string& subtype, std::mt19937_64& rng) {
    if (const DomainSchema* schema = graph.schema()) {
        return schema->generateName(kind, subtype, rng);
    }
    std::uniform_int_distribution<int> dist(100, 999);
    return (subtype.empty() ? kind : subtype) + " " + std::to_string(dist(rng));
}

const std::vector<std::string>& themeWords(const WorldGraph& graph, const std::string& list) {
    static const std::vector<std::string> kEmpty;
    if (const DomainSchema* schema = graph.schema()) {
        return schema->themeWords(list);
    }
    return kEmpty;
}
