#include "utils.hpp"
#include <vector>       // For std::discrete_distribution inputs

std::map<TileType, double> makeKindBag(int kind_count) {
    std::map<TileType, double> bag;
    if (kind_count < MIN_KIND_COUNT) kind_count = MIN_KIND_COUNT;
    if (kind_count > MAX_KIND_COUNT) kind_count = MAX_KIND_COUNT;

    const double weight = 1.0 / kind_count;
    for (int k = 0; k < kind_count; ++k) {
        bag[static_cast<TileType>(static_cast<int>(FIRST_KIND) + k)] = weight;
    }
    return bag;
}

TileType pickKindFromBag(const std::map<TileType, double>& bag, std::mt19937& rng_engine) {
    if (bag.empty()) {
        return FIRST_KIND; // Fallback so a hole is never refilled with None
    }

    std::vector<TileType> kinds;
    std::vector<double> probabilities;
    for (const auto& pair : bag) {
        kinds.push_back(pair.first);
        probabilities.push_back(pair.second);
    }

    std::discrete_distribution<> dist(probabilities.begin(), probabilities.end());
    return kinds[dist(rng_engine)];
}
