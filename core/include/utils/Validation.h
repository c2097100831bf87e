#ifndef VALIDATION_H
#define VALIDATION_H

#include <cstddef>
#include <string>
#include <vector>
#include "kernel/Domain.h"
#include "kernel/WorldGraph.h"

// Post-run structural checks. Read-only; failures are reported, never thrown.

struct ValidationResult {
    std::string name;
    bool passed = true;
    bool skipped = false;
    std::size_t failureCount = 0;
    std::string details;
    std::vector<std::string> failedEntities;   // entity ids
};

struct ValidationReport {
    std::size_t totalChecks = 0;
    std::size_t passed = 0;
    std::size_t failed = 0;
    std::vector<ValidationResult> results;

    bool allPassed() const { return failed == 0; }
    const ValidationResult* find(const std::string& name) const;
};

// Every entity has an outgoing link or an incoming relationship.
ValidationResult validateConnectedEntities(const WorldGraph& graph);
// Delegates to the domain validator; marked skipped when there is none.
ValidationResult validateEntityStructure(const WorldGraph& graph, const StructureValidator& validator);
// Both endpoints of every relationship exist.
ValidationResult validateRelationshipIntegrity(const WorldGraph& graph);
// links.size() equals the number of global relationships with src == id.
ValidationResult validateLinkSync(const WorldGraph& graph);

ValidationReport validateWorld(const WorldGraph& graph, const StructureValidator& validator = {});

#endif
