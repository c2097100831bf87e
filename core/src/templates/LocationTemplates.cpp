#include "templates/LocationTemplates.h"

#include <algorithm>
#include <string>
#include <utility>
#include "kernel/Domain.h"
#include "kernel/Queries.h"
#include "kernel/Random.h"

namespace {
std::vector<const Entity*> colonies(const WorldGraph& graph) {
    std::vector<const Entity*> out;
    for (const Entity* e : graph.findEntities({std::string("location"), std::string("colony"), std::nullopt})) {
        if (e->status != "abandoned") out.push_back(e);
    }
    return out;
}

// Places the explorer knows: home and its neighbours, else any location.
std::vector<const Entity*> knownLocations(const WorldGraph& graph, const Entity& explorer) {
    std::vector<const Entity*> out;
    if (const Entity* home = getLocation(graph, explorer.id)) {
        out.push_back(home);
        for (const Entity* near : getRelated(graph, home->id, "adjacent_to", Direction::Both)) {
            if (std::find(out.begin(), out.end(), near) == out.end()) out.push_back(near);
        }
    }
    if (out.empty()) out = graph.findEntities({std::string("location"), std::nullopt, std::nullopt});
    return out;
}
}

// ---------- ColonyFounding ----------

bool ColonyFounding::canApply(const WorldGraph& graph, std::mt19937_64& rng) const {
    const auto existing = colonies(graph);
    if (existing.empty()) return false;
    if (saturated(graph, "location", "colony", cfg_.target)) return false;
    if (findTargets(graph).empty()) return false;

    const double npcs = static_cast<double>(graph.getEntityCount("npc"));
    if (npcs / static_cast<double>(existing.size()) > cfg_.crowdedPerColony) return true;
    if (graph.getPressure("resource_scarcity") > 40.0) return true;
    return chance(cfg_.quietChance, rng);
}

std::vector<const Entity*> ColonyFounding::findTargets(const WorldGraph& graph) const {
    std::vector<const Entity*> out;
    for (const Entity* colony : colonies(graph)) {
        if (colony->status == "thriving" && getResidents(graph, colony->id).size() >= cfg_.minResidents) {
            out.push_back(colony);
        }
    }
    return out;
}

TemplateResult ColonyFounding::expand(WorldGraph& graph, const Entity* target, std::mt19937_64& rng) {
    const DomainSchema* schema = graph.schema();
    if (!schema) {
        throw ConfigurationError("colony_founding requires a domain schema");
    }
    const SpatialPlacement* placement = schema->spatialPlacement();
    if (!placement) {
        throw ConfigurationError("colony_founding requires a spatial placement service");
    }
    if (!target) {
        return TemplateResult::none("No thriving colony can spare settlers");
    }

    const std::string sourceId = target->id;
    const std::string sourceName = target->name;
    const std::string sourceCulture = target->culture;
    const auto founders = pickMultiple(getResidents(graph, sourceId), cfg_.founders, rng);

    EntitySpec colony;
    colony.kind = "location";
    colony.subtype = "colony";
    colony.name = generateEntityName(graph, "location", "colony", rng);
    colony.description = "A young colony founded by settlers from " + sourceName + ".";
    colony.status = "thriving";
    colony.culture = sourceCulture;
    colony.tags.setFlag("frontier");
    colony.coordinates = placement->place(graph, {sourceId}, rng);
    const std::string colonyName = colony.name;

    const std::string colonyId = graph.createEntity(std::move(colony));

    TemplateResult result;
    result.precreated.push_back(colonyId);
    result.relate("adjacent_to", colonyId, sourceId);
    result.relate("adjacent_to", sourceId, colonyId);
    for (const Entity* settler : founders) {
        result.archive(settler->id, sourceId, "resident_of");
        result.relate("resident_of", settler->id, colonyId);
    }
    result.adjustPressure("resource_scarcity", -2.0);
    result.description = colonyName + " is founded by " + std::to_string(founders.size()) +
                         " settlers from " + sourceName;
    return result;
}

// ---------- LocationDiscoveryTemplate ----------

LocationDiscoveryTemplate::LocationDiscoveryTemplate(std::string id, std::string name, DiscoveryConfig cfg,
                                                     std::vector<std::string> explorerPreference)
    : GrowthTemplate(std::move(id), std::move(name), "location"),
      cfg_(std::move(cfg)),
      preference_(std::move(explorerPreference)) {}

std::vector<const Entity*> LocationDiscoveryTemplate::findTargets(const WorldGraph& graph) const {
    return preferSubtypes(graph.findEntities({std::string("npc"), std::nullopt, cfg_.explorerActiveStatus}),
                          preference_);
}

TemplateResult LocationDiscoveryTemplate::discover(WorldGraph& graph, const Entity& explorer,
                                                   const Discovery& discovery, std::mt19937_64& rng) const {
    EntitySpec place;
    place.kind = "location";
    place.subtype = discovery.theme.subtype;
    place.name = themeDisplayName(discovery.theme.themeString);
    place.description = discovery.description;
    place.status = discovery.status;
    place.prominence = discovery.prominence;
    place.culture = explorer.culture;
    for (const auto& tag : discovery.theme.tags) {
        place.tags.setFlag(tag);
    }

    const auto known = knownLocations(graph, explorer);
    const Entity* neighbour = known.empty() ? nullptr : pickRandom(known, rng);
    if (neighbour) {
        place.coordinates = deriveCoordinates(graph, {neighbour->id});
    }

    TemplateResult result;
    const EntityRef ref = result.addEntity(std::move(place));
    result.relate("explorer_of", explorer.id, ref);
    result.relate("discovered_by", ref, explorer.id);
    if (neighbour) {
        result.relate("adjacent_to", ref, neighbour->id);
        result.relate("adjacent_to", neighbour->id, ref);
    }
    result.discovery = true;
    return result;
}

// ---------- ResourceLocationDiscovery ----------

bool ResourceLocationDiscovery::canApply(const WorldGraph& graph, std::mt19937_64& rng) const {
    if (!analyzeResourceDeficit(graph, cfg_, rng)) return false;
    return shouldDiscoverLocation(graph, cfg_, rng);
}

TemplateResult ResourceLocationDiscovery::expand(WorldGraph& graph, const Entity* target, std::mt19937_64& rng) {
    if (!target) {
        return TemplateResult::none("No eligible explorer found");
    }
    const auto deficit = analyzeResourceDeficit(graph, cfg_, rng);
    if (!deficit) {
        return TemplateResult::none("No resource deficit detected");
    }

    auto theme = generateResourceTheme(graph, *deficit, rng);
    if (!theme) {
        return TemplateResult::none("No resource theme words in this domain");
    }
    Discovery found;
    found.theme = std::move(*theme);
    found.description = "A resource-rich " + themeDisplayName(found.theme.themeString) +
                        " discovered to ease " + deficit->specific + " scarcity.";
    TemplateResult result = discover(graph, *target, found, rng);
    result.adjustPressure("resource_scarcity", -5.0);
    result.description = target->name + " discovered " + found.theme.themeString + " to address " +
                         resourceNeedName(deficit->primary) + " scarcity";
    return result;
}

// ---------- StrategicLocationDiscovery ----------

bool StrategicLocationDiscovery::canApply(const WorldGraph& graph, std::mt19937_64& rng) const {
    if (!analyzeConflictPatterns(graph)) return false;
    return shouldDiscoverLocation(graph, cfg_, rng);
}

TemplateResult StrategicLocationDiscovery::expand(WorldGraph& graph, const Entity* target, std::mt19937_64& rng) {
    if (!target) {
        return TemplateResult::none("No eligible scout found");
    }
    const auto conflict = analyzeConflictPatterns(graph);
    if (!conflict) {
        return TemplateResult::none("No active conflicts detected");
    }

    auto theme = generateStrategicTheme(graph, *conflict, rng);
    if (!theme) {
        return TemplateResult::none("No strategic theme words in this domain");
    }
    Discovery found;
    found.theme = std::move(*theme);
    found.description = "A " + themeDisplayName(found.theme.themeString) + " that offers an edge in " +
                        conflictTypeName(conflict->type) + " conflict.";
    found.prominence = Prominence::Recognized;

    // The scout's faction claims the position when it is a party to the conflict
    std::string claimant;
    for (const Entity* f : getFactions(graph, target->id)) {
        if (std::find(conflict->factions.begin(), conflict->factions.end(), f->id) != conflict->factions.end()) {
            claimant = f->id;
            break;
        }
    }
    if (claimant.empty() && !conflict->factions.empty()) {
        claimant = pickRandom(conflict->factions, rng);
    }

    TemplateResult result = discover(graph, *target, found, rng);
    if (!claimant.empty()) {
        result.relate("controls", claimant, EntityRef::pending(0));
    }
    result.description = target->name + " scouted " + found.theme.themeString + " amid " +
                         conflictTypeName(conflict->type) + " conflict";
    return result;
}

// ---------- MysticalLocationDiscovery ----------

bool MysticalLocationDiscovery::canApply(const WorldGraph& graph, std::mt19937_64& rng) const {
    if (!analyzeMagicPresence(graph, cfg_)) return false;
    return shouldDiscoverLocation(graph, cfg_, rng);
}

TemplateResult MysticalLocationDiscovery::expand(WorldGraph& graph, const Entity* target, std::mt19937_64& rng) {
    if (!target) {
        return TemplateResult::none("No eligible seeker found");
    }
    const auto magic = analyzeMagicPresence(graph, cfg_);
    if (!magic) {
        return TemplateResult::none("Magic is too quiet to reveal anything");
    }

    auto theme = generateMysticalTheme(graph, *magic, rng);
    if (!theme) {
        return TemplateResult::none("No mystical theme words in this domain");
    }
    Discovery found;
    found.theme = std::move(*theme);
    found.description = "A " + themeDisplayName(found.theme.themeString) + " where " +
                        manifestationName(magic->manifestation) + " magic wells up.";
    found.status = "active";
    found.prominence = magic->instability > 60.0 ? Prominence::Renowned : Prominence::Recognized;

    const auto abilities = graph.findEntities({std::string("abilities"), std::string("magic"), std::nullopt});
    TemplateResult result = discover(graph, *target, found, rng);
    for (const Entity* ability : pickMultiple(abilities, 2, rng)) {
        result.relate("manifests_at", ability->id, EntityRef::pending(0));
    }
    result.adjustPressure("magical_instability", 3.0);
    result.description = target->name + " uncovered " + found.theme.themeString;
    return result;
}
