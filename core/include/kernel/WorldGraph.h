#ifndef WORLD_GRAPH_H
#define WORLD_GRAPH_H

#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "kernel/Entity.h"
#include "kernel/Pressures.h"
#include "kernel/Relationship.h"

class DomainSchema;

enum class Direction : std::uint8_t {
    Outgoing = 0,   // entity is src
    Incoming = 1,   // entity is dst
    Both = 2
};

// AND-combined filter; unset fields match anything.
struct EntityCriteria {
    std::optional<std::string> kind;
    std::optional<std::string> subtype;
    std::optional<std::string> status;
};

struct EraState {
    std::string id;
    std::string name;
};

struct DiscoveryState {
    double currentThreshold = 0.3;
    std::int64_t lastDiscoveryTick = -999;
    std::uint32_t discoveriesThisEpoch = 0;
};

struct GrowthMetrics {
    std::deque<std::int64_t> relationshipsPerTick;   // rolling window
    double averageGrowthRate = 0.0;
};

// Aggregate root of a run: entities, relationships, pressures and the
// bookkeeping state that templates and systems gate on.
//
// Every successful addRelationship writes the relationship to the global list
// and an identical copy to the source entity's links cache. All mutators
// below keep the two in step.
class WorldGraph {
public:
    WorldGraph() = default;

    // Domain type system (may be null in unit tests)
    void setSchema(const DomainSchema* schema) { schema_ = schema; }
    const DomainSchema* schema() const { return schema_; }

    // ---------- Entities ----------
    const Entity* getEntity(const std::string& id) const;
    Entity* getEntityMut(const std::string& id);
    bool hasEntity(const std::string& id) const { return entities_.count(id) > 0; }
    std::vector<const Entity*> getEntities() const;
    std::vector<const Entity*> findEntities(const EntityCriteria& criteria) const;
    std::size_t getEntityCount(const std::string& kind = "", const std::string& subtype = "") const;
    std::size_t entityCount() const { return entities_.size(); }
    const std::map<std::string, Entity>& entities() const { return entities_; }

    // Assigns an id when spec.id is empty; stamps createdAt/updatedAt.
    std::string createEntity(EntitySpec spec);
    bool updateEntity(const std::string& id, const EntityChanges& changes);
    // Removes the entity and every relationship touching it.
    bool deleteEntity(const std::string& id);
    std::string generateId(const std::string& prefix);

    // ---------- Relationships ----------
    // Returns false when (kind, src, dst) already exists. Missing endpoints are
    // accepted; dangling relationships are reported by validation.
    bool addRelationship(const std::string& kind, const std::string& src, const std::string& dst,
                         std::optional<double> strength = std::nullopt,
                         std::optional<double> distance = std::nullopt,
                         std::optional<RelationshipCategory> category = std::nullopt);
    bool removeRelationship(const std::string& src, const std::string& dst, const std::string& kind);
    bool archiveRelationship(const std::string& src, const std::string& dst, const std::string& kind);
    bool modifyRelationshipStrength(const std::string& src, const std::string& dst,
                                    const std::string& kind, double delta);
    bool setRelationshipStrength(const std::string& src, const std::string& dst,
                                 const std::string& kind, double value);
    std::size_t removeRelationshipsIf(const std::function<bool(const Relationship&)>& pred);
    // In-place pass over every relationship; fn returns true when it changed
    // strength/status, and the change is mirrored into the links cache.
    // fn must not change kind, src or dst.
    std::size_t adjustRelationships(const std::function<bool(Relationship&)>& fn);

    const Relationship* findRelationship(const std::string& src, const std::string& dst,
                                         const std::string& kind) const;
    std::vector<const Relationship*> getEntityRelationships(const std::string& id,
                                                            Direction direction = Direction::Both) const;
    const std::vector<Relationship>& relationships() const { return relationships_; }
    std::size_t relationshipCount() const { return relationships_.size(); }

    // ---------- Clock and bookkeeping ----------
    std::uint64_t tick() const { return tick_; }
    void advanceTick() { ++tick_; }

    const EraState& currentEra() const { return era_; }
    void setCurrentEra(const EraState& era) { era_ = era; }

    PressureController& pressures() { return pressures_; }
    const PressureController& pressures() const { return pressures_; }
    double getPressure(const std::string& id) const { return pressures_.get(id); }

    DiscoveryState& discoveryState() { return discovery_; }
    const DiscoveryState& discoveryState() const { return discovery_; }
    void recordDiscovery() {
        discovery_.lastDiscoveryTick = static_cast<std::int64_t>(tick_);
        ++discovery_.discoveriesThisEpoch;
    }

    GrowthMetrics& growthMetrics() { return growth_; }
    const GrowthMetrics& growthMetrics() const { return growth_; }

    // ---------- Relationship cooldowns ----------
    // True when no formation was recorded or at least `cooldown` ticks elapsed.
    bool canFormRelationship(const std::string& entityId, const std::string& kind,
                             std::uint64_t cooldown) const;
    void recordRelationshipFormation(const std::string& entityId, const std::string& kind);
    std::optional<std::uint64_t> lastFormation(const std::string& entityId, const std::string& kind) const;

private:
    void syncLink(const Relationship& rel);
    void eraseLink(const std::string& src, const std::string& dst, const std::string& kind);
    void touch(const std::string& id);
    void warnOnRelationshipCount(const Entity& src, const std::string& kind) const;

    const DomainSchema* schema_ = nullptr;
    std::map<std::string, Entity> entities_;
    std::vector<Relationship> relationships_;
    std::uint64_t tick_ = 0;
    std::uint64_t next_id_ = 0;
    EraState era_;
    PressureController pressures_;
    std::unordered_map<std::string, std::unordered_map<std::string, std::uint64_t>> cooldowns_;
    DiscoveryState discovery_;
    GrowthMetrics growth_;
};

#endif
