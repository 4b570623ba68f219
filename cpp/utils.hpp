#ifndef UTILS_HPP
#define UTILS_HPP

#include "grid_defs.hpp" // For TileType
#include <map>           // For the kind bag
#include <random>        // For tile generation

// Builds the 'bag' of kinds a new tile may take and their probabilities.
// Every one of the first kind_count real kinds gets the same weight.
std::map<TileType, double> makeKindBag(int kind_count);

// Picks a kind from the bag according to its weights.
TileType pickKindFromBag(const std::map<TileType, double>& bag, std::mt19937& rng_engine);

#endif // UTILS_HPP
