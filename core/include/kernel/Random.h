#ifndef RANDOM_H
#define RANDOM_H

#include <algorithm>
#include <cstddef>
#include <random>
#include <stdexcept>
#include <utility>
#include <vector>

// Every random draw in a run goes through the engine's generator so a seed
// reproduces the whole world.

double uniform01(std::mt19937_64& rng);
bool chance(double probability, std::mt19937_64& rng);
int randomInt(int lo, int hi, std::mt19937_64& rng);           // inclusive
double randomRange(double lo, double hi, std::mt19937_64& rng);

// Odds-ratio scaling: odds = p/(1-p), scaled = odds^modifier. modifier 1 keeps
// p. A modifier above 1 pushes p away from 0.5 (higher above it, lower below
// it) and a modifier below 1 pulls p toward 0.5. The result stays in [0,1].
double scaledProbability(double baseProbability, double modifier);
bool rollProbability(double baseProbability, double modifier, std::mt19937_64& rng);

// Index drawn proportional to weight; weights.size() when the total is not positive.
std::size_t weightedIndex(const std::vector<double>& weights, std::mt19937_64& rng);

template <typename T>
const T& pickRandom(const std::vector<T>& items, std::mt19937_64& rng) {
    if (items.empty()) {
        throw std::invalid_argument("pickRandom called with no candidates");
    }
    std::uniform_int_distribution<std::size_t> dist(0, items.size() - 1);
    return items[dist(rng)];
}

// Up to `count` distinct items (partial Fisher-Yates).
template <typename T>
std::vector<T> pickMultiple(const std::vector<T>& items, std::size_t count, std::mt19937_64& rng) {
    std::vector<T> pool(items);
    const std::size_t n = std::min(count, pool.size());
    for (std::size_t i = 0; i < n; ++i) {
        std::uniform_int_distribution<std::size_t> dist(i, pool.size() - 1);
        std::swap(pool[i], pool[dist(rng)]);
    }
    pool.resize(n);
    return pool;
}

#endif
