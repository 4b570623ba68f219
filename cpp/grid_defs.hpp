#ifndef GRID_DEFS_HPP
#define GRID_DEFS_HPP

#include <cstdint>
#include <vector>

// The tile kinds a grid slot can hold. None marks a hole left by a claimed match.
enum class TileType : int {
    None   = 0,
    Red    = 1,
    Yellow = 2,
    Green  = 3,
    Blue   = 4,
    Purple = 5,
    Max    = 6  // one past the last real kind
};

const TileType FIRST_KIND = TileType::Red;

// A single slot's content. The grid is an ordered, row-major list of these.
struct Tile {
    TileType type = TileType::None;
    bool matched = false;  // set by match detection, cleared when claimed
    bool checked = false;  // set once the sweep has evaluated this slot
    std::uint64_t id = 0;  // identity only, unique per grid lifetime
};

using Grid = std::vector<Tile>;

struct GridCoord {
    int x;
    int y;
};

// === Grid Configuration ===
const int INVALID_INDEX = -1;  // Returned for out-of-range coordinates or unknown tiles
const int MIN_GRID_SIZE = 3;   // Width and height are clamped to at least this
const int DEFAULT_WIDTH = 7;
const int DEFAULT_HEIGHT = 6;
const int MIN_KIND_COUNT = 2;
const int MAX_KIND_COUNT = static_cast<int>(TileType::Max) - static_cast<int>(FIRST_KIND);
// ==========================

#endif // GRID_DEFS_HPP
