#include "kernel/WorldGraph.h"

#include <algorithm>
#include <iostream>
#include <iterator>
#include <stdexcept>

namespace {
// Soft per-(entity kind, relationship kind) limits; exceeding one only warns.
std::size_t relationshipWarningThreshold(const std::string& entityKind, const std::string& kind) {
    if (entityKind == "npc") {
        if (kind == "member_of") return 3;
        if (kind == "lover_of") return 2;
        return 5;
    }
    if (entityKind == "location") {
        if (kind == "resident_of") return 50;
        return 15;
    }
    if (entityKind == "faction") {
        return 20;
    }
    return 0;  // unlimited
}

double resolveDistance(const std::string& kind, std::optional<double> distance) {
    if (distance) {
        return std::clamp(*distance, 0.0, 1.0);
    }
    auto range = lineageDistanceRange(kind);
    return (range->first + range->second) / 2.0;
}
}

// ---------- Entities ----------

const Entity* WorldGraph::getEntity(const std::string& id) const {
    auto it = entities_.find(id);
    return it != entities_.end() ? &it->second : nullptr;
}

Entity* WorldGraph::getEntityMut(const std::string& id) {
    auto it = entities_.find(id);
    return it != entities_.end() ? &it->second : nullptr;
}

std::vector<const Entity*> WorldGraph::getEntities() const {
    std::vector<const Entity*> out;
    out.reserve(entities_.size());
    for (const auto& [id, entity] : entities_) {
        out.push_back(&entity);
    }
    return out;
}

std::vector<const Entity*> WorldGraph::findEntities(const EntityCriteria& criteria) const {
    std::vector<const Entity*> out;
    for (const auto& [id, entity] : entities_) {
        if (criteria.kind && entity.kind != *criteria.kind) continue;
        if (criteria.subtype && entity.subtype != *criteria.subtype) continue;
        if (criteria.status && entity.status != *criteria.status) continue;
        out.push_back(&entity);
    }
    return out;
}

std::size_t WorldGraph::getEntityCount(const std::string& kind, const std::string& subtype) const {
    if (kind.empty() && subtype.empty()) {
        return entities_.size();
    }
    std::size_t count = 0;
    for (const auto& [id, entity] : entities_) {
        if (!kind.empty() && entity.kind != kind) continue;
        if (!subtype.empty() && entity.subtype != subtype) continue;
        ++count;
    }
    return count;
}

std::string WorldGraph::generateId(const std::string& prefix) {
    std::string id;
    do {
        id = prefix + "_" + std::to_string(next_id_++);
    } while (entities_.count(id) > 0);
    return id;
}

std::string WorldGraph::createEntity(EntitySpec spec) {
    if (spec.kind.empty()) {
        throw std::invalid_argument("createEntity requires a kind (name '" + spec.name + "')");
    }
    std::string id = spec.id.empty() ? generateId(spec.kind) : spec.id;
    if (entities_.count(id) > 0) {
        throw std::invalid_argument("entity id already exists: " + id);
    }

    Entity entity;
    entity.id = id;
    entity.kind = std::move(spec.kind);
    entity.subtype = std::move(spec.subtype);
    entity.name = spec.name.empty() ? id : std::move(spec.name);
    entity.description = std::move(spec.description);
    entity.status = std::move(spec.status);
    entity.prominence = spec.prominence;
    entity.culture = std::move(spec.culture);
    entity.tags = std::move(spec.tags);
    entity.coordinates = spec.coordinates;
    entity.createdAt = tick_;
    entity.updatedAt = tick_;

    entities_.emplace(id, std::move(entity));
    return id;
}

bool WorldGraph::updateEntity(const std::string& id, const EntityChanges& changes) {
    Entity* entity = getEntityMut(id);
    if (!entity) {
        return false;
    }
    if (changes.subtype) entity->subtype = *changes.subtype;
    if (changes.name) entity->name = *changes.name;
    if (changes.description) entity->description = *changes.description;
    if (changes.status) entity->status = *changes.status;
    if (changes.culture) entity->culture = *changes.culture;
    if (changes.prominence) entity->prominence = *changes.prominence;
    if (changes.coordinates) entity->coordinates = changes.coordinates;
    for (const auto& key : changes.removeTags) {
        entity->tags.remove(key);
    }
    for (const auto& [key, value] : changes.setTags) {
        entity->tags.set(key, value);
    }
    entity->updatedAt = tick_;
    return true;
}

bool WorldGraph::deleteEntity(const std::string& id) {
    if (entities_.erase(id) == 0) {
        return false;
    }
    removeRelationshipsIf([&](const Relationship& rel) {
        return rel.src == id || rel.dst == id;
    });
    cooldowns_.erase(id);
    return true;
}

// ---------- Relationships ----------

bool WorldGraph::addRelationship(const std::string& kind, const std::string& src, const std::string& dst,
                                 std::optional<double> strength, std::optional<double> distance,
                                 std::optional<RelationshipCategory> category) {
    if (findRelationship(src, dst, kind)) {
        return false;
    }

    Relationship rel;
    rel.kind = kind;
    rel.src = src;
    rel.dst = dst;
    rel.strength = std::clamp(strength.value_or(defaultStrength(kind)), 0.0, 1.0);
    rel.category = category.value_or(categoryForKind(kind));
    rel.createdAt = tick_;
    if (isLineageKind(kind)) {
        rel.distance = resolveDistance(kind, distance);
    } else if (distance) {
        rel.distance = std::clamp(*distance, 0.0, 1.0);
    }

    relationships_.push_back(rel);
    if (Entity* srcEntity = getEntityMut(src)) {
        srcEntity->links.push_back(rel);
        warnOnRelationshipCount(*srcEntity, kind);
    }
    touch(src);
    touch(dst);
    return true;
}

bool WorldGraph::removeRelationship(const std::string& src, const std::string& dst, const std::string& kind) {
    auto it = std::find_if(relationships_.begin(), relationships_.end(),
                           [&](const Relationship& r) { return r.sameTriple(kind, src, dst); });
    if (it == relationships_.end()) {
        return false;
    }
    relationships_.erase(it);
    eraseLink(src, dst, kind);
    touch(src);
    touch(dst);
    return true;
}

bool WorldGraph::archiveRelationship(const std::string& src, const std::string& dst, const std::string& kind) {
    for (auto& rel : relationships_) {
        if (!rel.sameTriple(kind, src, dst)) continue;
        if (rel.status == RelationshipStatus::Historical) {
            return false;
        }
        rel.status = RelationshipStatus::Historical;
        rel.archivedAt = tick_;
        syncLink(rel);
        return true;
    }
    return false;
}

bool WorldGraph::modifyRelationshipStrength(const std::string& src, const std::string& dst,
                                            const std::string& kind, double delta) {
    const Relationship* rel = findRelationship(src, dst, kind);
    if (!rel) {
        return false;
    }
    return setRelationshipStrength(src, dst, kind, rel->strength + delta);
}

bool WorldGraph::setRelationshipStrength(const std::string& src, const std::string& dst,
                                         const std::string& kind, double value) {
    for (auto& rel : relationships_) {
        if (!rel.sameTriple(kind, src, dst)) continue;
        rel.strength = std::clamp(value, 0.0, 1.0);
        syncLink(rel);
        return true;
    }
    return false;
}

std::size_t WorldGraph::removeRelationshipsIf(const std::function<bool(const Relationship&)>& pred) {
    std::vector<Relationship> removed;
    auto keepEnd = std::stable_partition(relationships_.begin(), relationships_.end(),
                                         [&](const Relationship& r) { return !pred(r); });
    removed.assign(std::make_move_iterator(keepEnd), std::make_move_iterator(relationships_.end()));
    relationships_.erase(keepEnd, relationships_.end());
    for (const auto& rel : removed) {
        eraseLink(rel.src, rel.dst, rel.kind);
        touch(rel.src);
        touch(rel.dst);
    }
    return removed.size();
}

std::size_t WorldGraph::adjustRelationships(const std::function<bool(Relationship&)>& fn) {
    std::size_t changed = 0;
    for (auto& rel : relationships_) {
        const std::string kind = rel.kind;
        const std::string src = rel.src;
        const std::string dst = rel.dst;
        if (!fn(rel)) continue;
        if (!rel.sameTriple(kind, src, dst)) {
            throw std::logic_error("adjustRelationships may not change relationship identity (" +
                                   kind + ": " + src + " -> " + dst + ")");
        }
        rel.strength = std::clamp(rel.strength, 0.0, 1.0);
        syncLink(rel);
        ++changed;
    }
    return changed;
}

const Relationship* WorldGraph::findRelationship(const std::string& src, const std::string& dst,
                                                 const std::string& kind) const {
    for (const auto& rel : relationships_) {
        if (rel.sameTriple(kind, src, dst)) {
            return &rel;
        }
    }
    return nullptr;
}

std::vector<const Relationship*> WorldGraph::getEntityRelationships(const std::string& id,
                                                                    Direction direction) const {
    std::vector<const Relationship*> out;
    for (const auto& rel : relationships_) {
        const bool outgoing = rel.src == id;
        const bool incoming = rel.dst == id;
        if ((direction == Direction::Outgoing && outgoing) ||
            (direction == Direction::Incoming && incoming) ||
            (direction == Direction::Both && (outgoing || incoming))) {
            out.push_back(&rel);
        }
    }
    return out;
}

// ---------- Cooldowns ----------

bool WorldGraph::canFormRelationship(const std::string& entityId, const std::string& kind,
                                     std::uint64_t cooldown) const {
    auto last = lastFormation(entityId, kind);
    if (!last) {
        return true;
    }
    return tick_ - *last >= cooldown;
}

void WorldGraph::recordRelationshipFormation(const std::string& entityId, const std::string& kind) {
    cooldowns_[entityId][kind] = tick_;
}

std::optional<std::uint64_t> WorldGraph::lastFormation(const std::string& entityId,
                                                       const std::string& kind) const {
    auto entityIt = cooldowns_.find(entityId);
    if (entityIt == cooldowns_.end()) {
        return std::nullopt;
    }
    auto kindIt = entityIt->second.find(kind);
    if (kindIt == entityIt->second.end()) {
        return std::nullopt;
    }
    return kindIt->second;
}

// ---------- Internals ----------

void WorldGraph::syncLink(const Relationship& rel) {
    Entity* src = getEntityMut(rel.src);
    if (!src) {
        return;
    }
    for (auto& link : src->links) {
        if (link.sameTriple(rel.kind, rel.src, rel.dst)) {
            link = rel;
            return;
        }
    }
}

void WorldGraph::eraseLink(const std::string& src, const std::string& dst, const std::string& kind) {
    Entity* entity = getEntityMut(src);
    if (!entity) {
        return;
    }
    auto& links = entity->links;
    links.erase(std::remove_if(links.begin(), links.end(),
                               [&](const Relationship& l) { return l.sameTriple(kind, src, dst); }),
                links.end());
}

void WorldGraph::touch(const std::string& id) {
    if (Entity* entity = getEntityMut(id)) {
        entity->updatedAt = tick_;
    }
}

void WorldGraph::warnOnRelationshipCount(const Entity& src, const std::string& kind) const {
    const std::size_t threshold = relationshipWarningThreshold(src.kind, kind);
    if (threshold == 0) {
        return;
    }
    const auto count = static_cast<std::size_t>(std::count_if(
        src.links.begin(), src.links.end(), [&](const Relationship& l) { return l.kind == kind; }));
    if (count > threshold) {
        std::cerr << "[WARN] " << src.id << " (" << src.kind << ") has " << count << " "
                  << kind << " relationships (threshold " << threshold << ")\n";
    }
}
