#include "templates/EmergentDiscovery.h"

#include <algorithm>
#include <cctype>
#include <set>
#include "kernel/Queries.h"
#include "kernel/Random.h"

namespace {
bool contains(const std::vector<std::string>& list, const std::string& value) {
    return std::find(list.begin(), list.end(), value) != list.end();
}
}

const char* resourceNeedName(ResourceNeed need) {
    switch (need) {
        case ResourceNeed::Food: return "food";
        case ResourceNeed::Water: return "water";
        case ResourceNeed::Shelter: return "shelter";
        case ResourceNeed::Safety: return "safety";
    }
    return "food";
}

const char* conflictTypeName(ConflictType type) {
    switch (type) {
        case ConflictType::Territorial: return "territorial";
        case ConflictType::Ideological: return "ideological";
        case ConflictType::Resource: return "resource";
        case ConflictType::Defensive: return "defensive";
    }
    return "territorial";
}

const char* manifestationName(Manifestation m) {
    switch (m) {
        case Manifestation::Convergence: return "convergence";
        case Manifestation::Artifact: return "artifact";
        case Manifestation::Phenomenon: return "phenomenon";
        case Manifestation::Temple: return "temple";
    }
    return "phenomenon";
}

std::optional<ResourceAnalysis> analyzeResourceDeficit(const WorldGraph& graph, const DiscoveryConfig& cfg,
                                                       std::mt19937_64& rng) {
    std::vector<const Entity*> colonies;
    std::size_t npcs = 0;
    for (const auto& [id, e] : graph.entities()) {
        if (e.kind == "location" && contains(cfg.settlementSubtypes, e.subtype)) colonies.push_back(&e);
        if (e.kind == "npc") ++npcs;
    }
    if (colonies.empty()) return std::nullopt;

    std::vector<std::string> all;
    std::vector<std::string> struggling;
    std::size_t thriving = 0;
    for (const Entity* c : colonies) {
        all.push_back(c->id);
        if (contains(cfg.strugglingStatuses, c->status)) struggling.push_back(c->id);
        if (contains(cfg.thrivingStatuses, c->status)) ++thriving;
    }

    const double scarcity = graph.getPressure("resource_scarcity");
    if (struggling.size() > thriving) {
        return ResourceAnalysis{ResourceNeed::Food, scarcity, "fishing", struggling};
    }
    const double coloniesPerNpc = static_cast<double>(colonies.size()) / static_cast<double>(std::max<std::size_t>(npcs, 1));
    if (coloniesPerNpc < 0.1 && colonies.size() > 2) {
        return ResourceAnalysis{ResourceNeed::Water, 60.0, "fresh_water", all};
    }
    if (scarcity > 50.0) {
        const auto& foods = themeWords(graph, "food_resources");
        const std::string specific = foods.empty() ? std::string("food") : pickRandom(foods, rng);
        return ResourceAnalysis{ResourceNeed::Food, scarcity, specific, all};
    }
    return std::nullopt;
}

std::optional<ConflictAnalysis> analyzeConflictPatterns(const WorldGraph& graph) {
    const double conflict = graph.getPressure("conflict");
    if (conflict < 30.0) return std::nullopt;

    std::set<std::string> factions;
    std::size_t hostilities = 0;
    std::size_t raids = 0;
    for (const auto& rel : graph.relationships()) {
        if (rel.kind == "attacking") ++raids;
        if (rel.kind != "enemy_of" && rel.kind != "at_war_with") continue;
        ++hostilities;
        for (const std::string* id : {&rel.src, &rel.dst}) {
            const Entity* e = graph.getEntity(*id);
            if (e && e->kind == "faction") factions.insert(*id);
        }
    }
    if (hostilities == 0) return std::nullopt;

    ConflictAnalysis analysis;
    if (graph.getPressure("resource_scarcity") > 50.0) {
        analysis.type = ConflictType::Resource;
    } else if (graph.getPressure("cultural_tension") > 40.0) {
        analysis.type = ConflictType::Ideological;
    } else if (raids > 0) {
        analysis.type = ConflictType::Defensive;
    }
    analysis.intensity = conflict;
    analysis.factions.assign(factions.begin(), factions.end());
    analysis.needsAdvantage = raids > 2;
    return analysis;
}

std::optional<MagicAnalysis> analyzeMagicPresence(const WorldGraph& graph, const DiscoveryConfig& cfg) {
    const double instability = graph.getPressure("magical_instability");
    if (instability < 25.0) return std::nullopt;

    MagicAnalysis analysis;
    analysis.instability = instability;
    for (const auto& [id, e] : graph.entities()) {
        if (e.kind == "abilities" && e.subtype == "magic") analysis.existingMagic.push_back(e.name);
        if (e.kind == "location" && e.subtype == cfg.anomalySubtype) ++analysis.anomalyCount;
    }
    if (analysis.anomalyCount > 2) {
        analysis.manifestation = Manifestation::Convergence;
    } else if (analysis.existingMagic.size() > 3) {
        analysis.manifestation = Manifestation::Artifact;
    } else if (graph.currentEra().id == "expansion") {
        analysis.manifestation = Manifestation::Temple;
    }
    return analysis;
}

std::optional<LocationTheme> generateResourceTheme(const WorldGraph& graph, const ResourceAnalysis& analysis,
                                                   std::mt19937_64& rng) {
    const auto& depths = themeWords(graph, "depth:" + graph.currentEra().id);
    const auto& forms = themeWords(graph, "form:resource_site");
    if (depths.empty() || forms.empty()) return std::nullopt;
    const auto& resources = themeWords(graph, "resource:" + analysis.specific);

    const std::string depth = pickRandom(depths, rng);
    const std::string resource = resources.empty() ? analysis.specific : pickRandom(resources, rng);
    const std::string form = pickRandom(forms, rng);

    LocationTheme theme;
    theme.subtype = "geographic_feature";
    theme.themeString = depth + "_" + resource + "_" + form;
    theme.tags = {"resource", resourceNeedName(analysis.primary), analysis.specific, depth};
    theme.relatedTo = analysis.affectedColonies;
    return theme;
}

std::optional<LocationTheme> generateStrategicTheme(const WorldGraph& graph, const ConflictAnalysis& analysis,
                                                    std::mt19937_64& rng) {
    const auto& advantages = themeWords(graph, analysis.needsAdvantage ? "advantage" : "concealment");
    const auto& forms = themeWords(graph, std::string("form:") + conflictTypeName(analysis.type));
    if (advantages.empty() || forms.empty()) return std::nullopt;

    const std::string advantage = pickRandom(advantages, rng);
    const std::string form = pickRandom(forms, rng);

    LocationTheme theme;
    theme.subtype = "geographic_feature";
    theme.themeString = advantage + "_" + form;
    theme.tags = {"strategic", conflictTypeName(analysis.type), advantage};
    theme.relatedTo = analysis.factions;
    return theme;
}

std::optional<LocationTheme> generateMysticalTheme(const WorldGraph& graph, const MagicAnalysis& analysis,
                                                   std::mt19937_64& rng) {
    const auto& intensities = themeWords(graph, analysis.instability > 60.0 ? "intensity:wild" : "intensity:dormant");
    const auto& forms = themeWords(graph, std::string("form:") + manifestationName(analysis.manifestation));
    if (intensities.empty() || forms.empty()) return std::nullopt;

    const std::string intensity = pickRandom(intensities, rng);
    const std::string form = pickRandom(forms, rng);

    LocationTheme theme;
    theme.subtype = "anomaly";
    theme.themeString = intensity + "_" + form;
    theme.tags = {"mystical", manifestationName(analysis.manifestation), intensity};
    return theme;
}
