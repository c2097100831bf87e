#ifndef THERMAL_CASCADE_H
#define THERMAL_CASCADE_H

#include <cstddef>
#include <cstdint>
#include <string>
#include "modules/SimulationSystem.h"

// Heat diffusion over adjacent_to edges. Temperature lives in the location
// tag "temp" (0..1, default 0.5). Every `interval` ticks:
//   T' = T + alpha * mean(T_neighbour - T)
// Locations whose new temperature lies at least `excursion` away from the
// temperate midpoint raise thermal events: colony status flips, resident
// migration toward temperate refuges, and ability rediscovery on warming.
class ThermalCascade : public SimulationSystem {
public:
    struct Config {
        std::uint64_t interval = 5;
        double alpha = 0.1;
        double excursion = 0.3;
        double hotColony = 0.8;
        double coldColony = 0.2;
        double temperateLow = 0.3;
        double temperateHigh = 0.7;
        double recoveryChance = 0.3;
        double hotMigration = 0.85;
        double coldMigration = 0.15;
        std::size_t maxMigrants = 2;
        std::uint64_t migrationCooldown = 10;
        double migrationChance = 0.5;
        double rediscoveryChance = 0.1;
        double warmDiscovery = 0.6;
    };

    ThermalCascade() : ThermalCascade(Config{}) {}
    explicit ThermalCascade(const Config& cfg)
        : SimulationSystem("thermal_cascade", "Thermal Cascade"), cfg_(cfg) {}

    SystemResult apply(WorldGraph& graph, double eraModifier, std::mt19937_64& rng) override;

    static double temperature(const Entity& location) { return location.tags.getNumber("temp", 0.5); }
    static std::string formatTemperature(double t);

private:
    Config cfg_;
};

#endif
