#include "kernel/Random.h"

#include <algorithm>
#include <cmath>
#include <numeric>

double uniform01(std::mt19937_64& rng) {
    std::uniform_real_distribution<double> dist(0.0, 1.0);
    return dist(rng);
}

bool chance(double probability, std::mt19937_64& rng) {
    if (probability <= 0.0) return false;
    if (probability >= 1.0) return true;
    return uniform01(rng) < probability;
}

int randomInt(int lo, int hi, std::mt19937_64& rng) {
    if (hi < lo) std::swap(lo, hi);
    std::uniform_int_distribution<int> dist(lo, hi);
    return dist(rng);
}

double randomRange(double lo, double hi, std::mt19937_64& rng) {
    return lo + (hi - lo) * uniform01(rng);
}

double scaledProbability(double baseProbability, double modifier) {
    if (baseProbability <= 0.0) return 0.0;
    if (baseProbability >= 1.0) return 1.0;
    if (modifier <= 0.0) return 0.5;  // odds^0 == 1
    const double odds = baseProbability / (1.0 - baseProbability);
    const double scaled = std::pow(odds, modifier);
    if (std::isinf(scaled)) return 1.0;
    return scaled / (1.0 + scaled);
}

bool rollProbability(double baseProbability, double modifier, std::mt19937_64& rng) {
    return chance(scaledProbability(baseProbability, modifier), rng);
}

std::size_t weightedIndex(const std::vector<double>& weights, std::mt19937_64& rng) {
    const double total = std::accumulate(weights.begin(), weights.end(), 0.0,
                                         [](double acc, double w) { return acc + std::max(0.0, w); });
    if (total <= 0.0) {
        return weights.size();
    }
    double roll = uniform01(rng) * total;
    for (std::size_t i = 0; i < weights.size(); ++i) {
        const double w = std::max(0.0, weights[i]);
        if (w <= 0.0) continue;
        roll -= w;
        if (roll <= 0.0) {
            return i;
        }
    }
    // Rounding: fall back to the last positive weight
    for (std::size_t i = weights.size(); i-- > 0;) {
        if (weights[i] > 0.0) return i;
    }
    return weights.size();
}
