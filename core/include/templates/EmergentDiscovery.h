#ifndef EMERGENT_DISCOVERY_H
#define EMERGENT_DISCOVERY_H

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <random>
#include <string>
#include <vector>
#include "kernel/WorldGraph.h"

// World-state analysis behind the location discovery templates. Each analyzer
// returns nullopt when its condition does not hold; theme generators compose
// a new location's subtype, name stem and tags from the analysis, drawing
// words from the domain's theme lists.

struct DiscoveryConfig {
    std::vector<std::string> settlementSubtypes = {"colony"};
    std::vector<std::string> thrivingStatuses = {"thriving"};
    std::vector<std::string> strugglingStatuses = {"waning"};
    std::string anomalySubtype = "anomaly";
    std::size_t maxLocations = 40;
    std::uint32_t maxDiscoveriesPerEpoch = 2;
    std::int64_t minTicksBetweenDiscoveries = 3;
    std::vector<std::string> explorerSubtypes = {"hero", "outlaw"};
    std::string explorerActiveStatus = "alive";
    std::map<std::string, double> eraDiscoveryChance;   // era id -> chance; else discoveryState threshold
};

enum class ResourceNeed : std::uint8_t { Food = 0, Water = 1, Shelter = 2, Safety = 3 };
enum class ConflictType : std::uint8_t { Territorial = 0, Ideological = 1, Resource = 2, Defensive = 3 };
enum class Manifestation : std::uint8_t { Convergence = 0, Artifact = 1, Phenomenon = 2, Temple = 3 };

struct ResourceAnalysis {
    ResourceNeed primary = ResourceNeed::Food;
    double severity = 0.0;
    std::string specific;                      // e.g. "fishing", "fresh_water"
    std::vector<std::string> affectedColonies;
};

struct ConflictAnalysis {
    ConflictType type = ConflictType::Territorial;
    double intensity = 0.0;
    std::vector<std::string> factions;
    bool needsAdvantage = false;
};

struct MagicAnalysis {
    double instability = 0.0;
    std::vector<std::string> existingMagic;
    std::size_t anomalyCount = 0;
    Manifestation manifestation = Manifestation::Phenomenon;
};

struct LocationTheme {
    std::string subtype;
    std::string themeString;                   // e.g. "deep_krill_channel"
    std::vector<std::string> tags;
    std::vector<std::string> relatedTo;
};

const char* resourceNeedName(ResourceNeed need);
const char* conflictTypeName(ConflictType type);
const char* manifestationName(Manifestation m);

std::optional<ResourceAnalysis> analyzeResourceDeficit(const WorldGraph& graph, const DiscoveryConfig& cfg,
                                                       std::mt19937_64& rng);
std::optional<ConflictAnalysis> analyzeConflictPatterns(const WorldGraph& graph);
std::optional<MagicAnalysis> analyzeMagicPresence(const WorldGraph& graph, const DiscoveryConfig& cfg);

// nullopt when the domain supplies no words for a required list.
std::optional<LocationTheme> generateResourceTheme(const WorldGraph& graph, const ResourceAnalysis& analysis,
                                                   std::mt19937_64& rng);
std::optional<LocationTheme> generateStrategicTheme(const WorldGraph& graph, const ConflictAnalysis& analysis,
                                                    std::mt19937_64& rng);
std::optional<LocationTheme> generateMysticalTheme(const WorldGraph& graph, const MagicAnalysis& analysis,
                                                   std::mt19937_64& rng);

// Entity cap, cooldown since the last discovery, per-epoch limit, an active
// explorer, then an era-weighted roll. Checks run in that order and the roll
// is only drawn when every gate passes.
bool shouldDiscoverLocation(const WorldGraph& graph, const DiscoveryConfig& cfg, std::mt19937_64& rng);

// "deep_krill_channel" -> "Deep Krill Channel"
std::string themeDisplayName(const std::string& themeString);

#endif
