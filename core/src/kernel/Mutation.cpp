#include "kernel/Mutation.h"

#include <iostream>
#include <set>
#include <stdexcept>
#include "kernel/Domain.h"
#include "kernel/WorldGraph.h"

EntityRef MutationBatch::addEntity(EntitySpec spec) {
    entities.push_back(std::move(spec));
    return EntityRef::pending(entities.size() - 1);
}

void MutationBatch::relate(const std::string& kind, EntityRef src, EntityRef dst,
                           std::optional<double> strength, std::optional<double> distance) {
    relationships.push_back(PendingRelationship{kind, std::move(src), std::move(dst), strength, distance});
}

void MutationBatch::relateOnCooldown(const std::string& kind, EntityRef src, EntityRef dst, CooldownScope scope) {
    PendingRelationship rel{kind, std::move(src), std::move(dst), std::nullopt, std::nullopt};
    rel.cooldown = scope;
    relationships.push_back(std::move(rel));
}

void MutationBatch::modify(const std::string& id, EntityChanges changes) {
    modifications.push_back(EntityModification{id, std::move(changes)});
}

namespace {
void checkRef(const EntityRef& ref, std::size_t arenaSize, const std::string& kind) {
    if (ref.isPending() && ref.pendingIndex() >= arenaSize) {
        throw std::out_of_range("relationship " + kind + " references pending entity " +
                                std::to_string(ref.pendingIndex()) + " (batch has " +
                                std::to_string(arenaSize) + ")");
    }
}

void checkSpecs(const WorldGraph& graph, const std::vector<EntitySpec>& specs) {
    std::set<std::string> explicitIds;
    for (std::size_t i = 0; i < specs.size(); ++i) {
        const EntitySpec& spec = specs[i];
        if (spec.kind.empty()) {
            throw std::invalid_argument("pending entity " + std::to_string(i) + " ('" + spec.name +
                                        "') has no kind");
        }
        if (spec.id.empty()) continue;
        if (graph.hasEntity(spec.id) || !explicitIds.insert(spec.id).second) {
            throw std::invalid_argument("pending entity " + std::to_string(i) + " reuses id " + spec.id);
        }
    }
}

const std::string& resolve(const EntityRef& ref, const std::vector<std::string>& newIds) {
    return ref.isPending() ? newIds[ref.pendingIndex()] : ref.id();
}
}

CommitOutcome commitMutation(WorldGraph& graph, const MutationBatch& batch, std::size_t relationshipBudget) {
    for (const auto& rel : batch.relationships) {
        checkRef(rel.src, batch.entities.size(), rel.kind);
        checkRef(rel.dst, batch.entities.size(), rel.kind);
    }
    checkSpecs(graph, batch.entities);

    CommitOutcome outcome;

    // Pass 1: pending arena -> real ids, all or nothing
    std::vector<std::string> newIds;
    newIds.reserve(batch.entities.size());
    try {
        for (const auto& spec : batch.entities) {
            newIds.push_back(graph.createEntity(spec));
        }
    } catch (const std::exception&) {
        for (const auto& id : newIds) {
            graph.deleteEntity(id);
        }
        throw;
    }
    outcome.createdIds = newIds;
    outcome.createdIds.insert(outcome.createdIds.end(), batch.precreated.begin(), batch.precreated.end());

    for (const auto& mod : batch.modifications) {
        if (graph.updateEntity(mod.id, mod.changes)) {
            outcome.modifiedIds.push_back(mod.id);
        }
    }

    for (const auto& old : batch.archives) {
        if (graph.archiveRelationship(old.src, old.dst, old.kind)) {
            ++outcome.archived;
        }
    }

    // Pass 2: relationships
    const DomainSchema* schema = graph.schema();
    for (const auto& pending : batch.relationships) {
        if (outcome.relationshipsCreated.size() >= relationshipBudget) {
            outcome.budgetExhausted = true;
            break;
        }
        const std::string& src = resolve(pending.src, newIds);
        const std::string& dst = resolve(pending.dst, newIds);
        const Entity* srcEntity = graph.getEntity(src);
        const Entity* dstEntity = graph.getEntity(dst);

        if (srcEntity && dstEntity) {
            if (schema && !schema->allowsRelationship(srcEntity->kind, pending.kind, dstEntity->kind)) {
                std::cerr << "[WARN] Relationship " << pending.kind << " not allowed between "
                          << srcEntity->kind << " and " << dstEntity->kind << " (" << src << " -> "
                          << dst << ")\n";
                ++outcome.rejected;
                continue;
            }
        } else {
            std::cerr << "[WARN] Dangling relationship " << pending.kind << ": " << src << " -> "
                      << dst << "\n";
        }

        if (graph.addRelationship(pending.kind, src, dst, pending.strength, pending.distance)) {
            outcome.relationshipsCreated.push_back(*graph.findRelationship(src, dst, pending.kind));
            if (pending.cooldown != CooldownScope::None) {
                graph.recordRelationshipFormation(src, pending.kind);
            }
            if (pending.cooldown == CooldownScope::Both) {
                graph.recordRelationshipFormation(dst, pending.kind);
            }
        }
    }

    if (batch.discovery && !newIds.empty()) {
        graph.recordDiscovery();
    }

    for (const auto& [pressure, delta] : batch.pressureChanges) {
        graph.pressures().queueDelta(pressure, delta);
    }
    return outcome;
}
