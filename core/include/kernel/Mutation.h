#ifndef MUTATION_H
#define MUTATION_H

#include <cstddef>
#include <limits>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "kernel/Entity.h"

class WorldGraph;

// Either an entity already in the graph or an index into the pending arena of
// the batch being built. Strings convert implicitly to an existing-id ref.
class EntityRef {
public:
    EntityRef(const std::string& id) : id_(id) {}
    EntityRef(const char* id) : id_(id) {}

    static EntityRef pending(std::size_t index) {
        EntityRef ref("");
        ref.pending_ = index;
        return ref;
    }

    bool isPending() const { return pending_.has_value(); }
    std::size_t pendingIndex() const { return *pending_; }
    const std::string& id() const { return id_; }

    bool operator==(const EntityRef& other) const {
        return pending_ == other.pending_ && id_ == other.id_;
    }

private:
    std::string id_;
    std::optional<std::size_t> pending_;
};

// Endpoints whose formation cooldown for the kind starts when the
// relationship is committed.
enum class CooldownScope { None, Source, Both };

struct PendingRelationship {
    std::string kind;
    EntityRef src;
    EntityRef dst;
    std::optional<double> strength;
    std::optional<double> distance;
    CooldownScope cooldown = CooldownScope::None;
};

struct ArchivedRelationship {
    std::string src;
    std::string dst;
    std::string kind;
};

struct EntityModification {
    std::string id;
    EntityChanges changes;
};

// Proposed mutation produced by a growth template or a simulation system.
struct MutationBatch {
    std::vector<EntitySpec> entities;                 // pending arena
    std::vector<PendingRelationship> relationships;
    std::vector<EntityModification> modifications;
    std::vector<ArchivedRelationship> archives;        // existing relationships turned historical
    std::map<std::string, double> pressureChanges;    // summed deltas
    std::vector<std::string> precreated;              // ids added to the graph during expand
    bool discovery = false;                           // counts against the discovery gate once committed
    std::string description;

    EntityRef addEntity(EntitySpec spec);
    void relate(const std::string& kind, EntityRef src, EntityRef dst,
                std::optional<double> strength = std::nullopt,
                std::optional<double> distance = std::nullopt);
    void relateOnCooldown(const std::string& kind, EntityRef src, EntityRef dst,
                          CooldownScope scope = CooldownScope::Both);
    void modify(const std::string& id, EntityChanges changes);
    void archive(const std::string& src, const std::string& dst, const std::string& kind) {
        archives.push_back(ArchivedRelationship{src, dst, kind});
    }
    void adjustPressure(const std::string& id, double delta) { pressureChanges[id] += delta; }

    bool empty() const {
        return entities.empty() && relationships.empty() && modifications.empty() &&
               archives.empty() && pressureChanges.empty() && precreated.empty();
    }

    static MutationBatch none(const std::string& description) {
        MutationBatch batch;
        batch.description = description;
        return batch;
    }
};

using TemplateResult = MutationBatch;
using SystemResult = MutationBatch;

struct CommitOutcome {
    std::vector<std::string> createdIds;
    std::vector<Relationship> relationshipsCreated;
    std::vector<std::string> modifiedIds;
    std::size_t archived = 0;
    std::size_t rejected = 0;          // disallowed by the domain relationship matrix
    bool budgetExhausted = false;
};

// Pass 1 creates the pending entities in order; pass 2 resolves pending refs
// to the new ids and adds the relationships (at most relationshipBudget of
// them). Cooldowns and the discovery counter are recorded only for what
// actually lands. Pressure deltas are queued on the graph, not applied.
// Throws before touching the graph if a pending ref has no matching arena
// entry (std::out_of_range) or an entity spec cannot be created
// (std::invalid_argument). Entities created by a pass 1 that still fails
// are removed again before the exception propagates.
CommitOutcome commitMutation(WorldGraph& graph, const MutationBatch& batch,
                             std::size_t relationshipBudget = std::numeric_limits<std::size_t>::max());

#endif
