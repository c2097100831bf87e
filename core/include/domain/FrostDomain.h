#ifndef FROST_DOMAIN_H
#define FROST_DOMAIN_H

#include <map>
#include <memory>
#include <random>
#include <set>
#include <string>
#include <tuple>
#include <vector>
#include "kernel/Domain.h"
#include "kernel/Engine.h"
#include "modules/ThresholdTrigger.h"
#include "templates/EmergentDiscovery.h"

// Ice-archipelago world: colonies on drifting bergs, factions quarrelling
// over krill grounds, and magic seeping up through the fissures.

// Scatters new settlements around the centroid of their reference entities.
class FrostPlacement : public SpatialPlacement {
public:
    explicit FrostPlacement(double spread = 15.0) : spread_(spread) {}

    Point3 place(const WorldGraph& graph, const std::vector<std::string>& referenceIds,
                 std::mt19937_64& rng) const override;

private:
    double spread_;
};

class FrostDomain : public DomainSchema {
public:
    FrostDomain();

    std::vector<std::string> entityKinds() const override;
    bool allowsRelationship(const std::string& srcKind, const std::string& kind,
                            const std::string& dstKind) const override;
    StructureValidator structureValidator() const override;
    std::string generateName(const std::string& kind, const std::string& subtype,
                             std::mt19937_64& rng) const override;
    const std::vector<std::string>& themeWords(const std::string& list) const override;
    const SpatialPlacement* spatialPlacement() const override { return &placement_; }

private:
    std::set<std::tuple<std::string, std::string, std::string>> allowed_;   // (src kind, kind, dst kind)
    std::map<std::string, std::vector<std::string>> themes_;
    FrostPlacement placement_;
};

std::vector<Era> frostEras();
std::vector<PressureDefinition> frostPressures();
DiscoveryConfig frostDiscoveryConfig();

// Factions at war with at least one other faction, grouped by who they fight.
ThresholdTrigger::Config warBrewingTrigger();

// Schema, seed graph, eras and pressures.
WorldSetup makeFrostWorld();

// Systems in their fixed run order, then the growth templates.
void registerFrostSystems(WorldEngine& engine);
void registerFrostTemplates(WorldEngine& engine);

#endif
