#ifndef PRESSURES_H
#define PRESSURES_H

#include <functional>
#include <map>
#include <string>

class WorldGraph;

// Named global scalar (conflict, resource_scarcity, ...). growth() is sampled
// once per epoch; decay is subtracted each epoch.
struct PressureDefinition {
    std::string id;
    std::string name;
    double initial = 0.0;
    double decay = 0.0;
    std::function<double(const WorldGraph&)> growth;
};

// Clamped pressure map. Deltas queued during a tick are summed and applied
// together so the order in which systems propose them does not matter.
class PressureController {
public:
    static constexpr double kMinPressure = 0.0;
    static constexpr double kMaxPressure = 100.0;

    double get(const std::string& id) const;
    bool has(const std::string& id) const { return values_.count(id) > 0; }
    void set(const std::string& id, double value);
    void applyDelta(const std::string& id, double delta);

    void queueDelta(const std::string& id, double delta);
    void applyPending();
    bool hasPending() const { return !pending_.empty(); }
    double pendingDelta(const std::string& id) const;

    void clear();
    const std::map<std::string, double>& values() const { return values_; }

private:
    static double clampPressure(double value);

    std::map<std::string, double> values_;
    std::map<std::string, double> pending_;
};

#endif
