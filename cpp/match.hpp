#ifndef MATCH_HPP
#define MATCH_HPP

#include "tile_grid.hpp" // For TileGrid, TileType
#include <iostream>
#include <string>
#include <vector>

// Pretty-printer for the grid. Slots listed in highlights (e.g. hints) are
// wrapped in brackets.
void printGrid(const TileGrid& grid, std::ostream& out = std::cout,
               const std::vector<int>& highlights = std::vector<int>());

// Human-readable kind name, e.g. "Red". None prints as "None".
std::string tileKindName(TileType type);

// One-letter symbol for compact grid dumps; '.' for None.
char tileKindSymbol(TileType type);

#endif // MATCH_HPP
