#ifndef TILE_GRID_HPP
#define TILE_GRID_HPP

#include "grid_defs.hpp" // For Tile, Grid, TileType, INVALID_INDEX
#include <functional>
#include <map>
#include <random>       // For std::mt19937
#include <vector>

// Supplies the kind of each newly generated tile. Defaults to a uniform draw
// over the grid's kinds.
using KindSource = std::function<TileType()>;

// Totals reported by one full resolve-and-settle pass.
struct CascadeResult {
    int matched = 0; // tiles cleared over every round
    int chains = 0;  // consecutive rounds beyond the first
};

// The TileGrid manages a width x height grid of tiles. It swaps tiles, finds
// and clears matches, lets the remaining tiles fall and refills the top row,
// and can list every swap that would currently produce a match.
//
// All operations are synchronous. The working flags on each Tile (matched,
// checked) are only left set by the stepwise detect_matches/claim_matches
// calls; everything else leaves them cleared.
class TileGrid {
public:
    TileGrid(int width = DEFAULT_WIDTH, int height = DEFAULT_HEIGHT,
             unsigned int seed = std::random_device{}(), int kind_count = MAX_KIND_COUNT);

    // Rebuilds the grid with fresh random tiles until it has no matches and at
    // least one legal move. Width and height below 3 are clamped to 3.
    void initialize(int width, int height);

    void seed(unsigned int value);
    // Replaces the kind generator; an empty source restores the random default.
    void set_kind_source(KindSource source) { kind_source_ = source; }
    void set_verbose(bool verbose) { verbose_ = verbose; }

    int width() const { return width_; }
    int height() const { return height_; }
    int size() const { return static_cast<int>(grid_.size()); }
    int kind_count() const { return kind_count_; }

    // Exchanges two slots. Does nothing if either index is out of range.
    void swap(int index, int index2);

    const Tile* get_tile(int index) const;
    const Tile* get_tile(int x, int y) const;

    int index_of(int x, int y) const;
    // Linear scan for the slot currently holding this tile.
    int index_of(const Tile& tile) const;
    GridCoord coords_of(int index) const;
    GridCoord coords_of(const Tile& tile) const;

    bool is_adjacent(int index, int index2) const;

    // Sets one tile's kind and clears its flags.
    void reset_tile(int index, TileType type = TileType::None);
    void reset_tile(int x, int y, TileType type = TileType::None);

    // Row-major kind values, one per slot.
    std::vector<int> get_flat_state() const;
    bool set_state_from_flat(const std::vector<int>& kinds);

    // --- Match resolution (match.cpp) ---
    void detect_matches();
    int claim_matches();
    void clear_flags();
    int gravity_substep();
    void settle();
    CascadeResult run_cascade(bool count_scores = true);

    bool has_any_match() const;
    bool would_match(int index) const;
    bool would_match(int x, int y) const;

    // Every neighbour index whose swap with some slot would produce a match.
    std::vector<int> find_candidate_moves();
    bool is_solvable();

private:
    void check_centered_match(int index);
    TileType random_kind();

    Grid grid_;
    int width_ = DEFAULT_WIDTH;
    int height_ = DEFAULT_HEIGHT;
    int kind_count_ = MAX_KIND_COUNT;
    std::uint64_t next_id_ = 1;
    bool verbose_ = false;
    std::map<TileType, double> kind_bag_;
    KindSource kind_source_;
    std::mt19937 rng_engine_;
};

#endif // TILE_GRID_HPP
