#ifndef DOMAIN_H
#define DOMAIN_H

#include <functional>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>
#include "kernel/Entity.h"

class WorldGraph;

// A required capability is missing from the domain configuration. Unlike an
// unmet world-state precondition this ends the run.
class ConfigurationError : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

struct StructureCheck {
    bool valid = true;
    std::vector<std::string> missing;
};

using StructureValidator = std::function<StructureCheck(const Entity&)>;

// Coordinate placement for new entities near a set of reference entities.
class SpatialPlacement {
public:
    virtual ~SpatialPlacement() = default;
    virtual Point3 place(const WorldGraph& graph, const std::vector<std::string>& referenceIds,
                         std::mt19937_64& rng) const = 0;
};

// Domain type system and content hooks injected into the core.
class DomainSchema {
public:
    virtual ~DomainSchema() = default;

    virtual std::vector<std::string> entityKinds() const = 0;

    // (srcKind, dstKind) -> allowed relationship kinds
    virtual bool allowsRelationship(const std::string& srcKind, const std::string& kind,
                                    const std::string& dstKind) const = 0;

    // Empty function when the domain does not check entity structure.
    virtual StructureValidator structureValidator() const { return {}; }

    virtual std::string generateName(const std::string& kind, const std::string& subtype,
                                     std::mt19937_64& rng) const = 0;

    // Named word list used by theme generators; empty when unknown.
    virtual const std::vector<std::string>& themeWords(const std::string& list) const = 0;

    virtual const SpatialPlacement* spatialPlacement() const { return nullptr; }
};

#endif
