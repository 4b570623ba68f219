#ifndef GAME_HPP
#define GAME_HPP

#include "grid_defs.hpp" // For DEFAULT_WIDTH, DEFAULT_HEIGHT
#include "tile_grid.hpp" // For TileGrid, CascadeResult
#include <random>
#include <vector>

enum class MoveStatus {
    Accepted,
    OutOfBounds,
    NotAdjacent,
    NoMatch
};

struct MoveResult {
    MoveStatus status = MoveStatus::NoMatch;
    int matched = 0;
    int chains = 0;
};

// A play session over one TileGrid: validates a player's swap, resolves it,
// and undoes it when it would not produce a match.
class Game {
public:
    Game(int width = DEFAULT_WIDTH, int height = DEFAULT_HEIGHT,
         unsigned int seed = std::random_device{}(), int kind_count = MAX_KIND_COUNT);
    void reset();

    MoveResult make_move(int from, int to);
    std::vector<int> get_hints();
    bool is_game_over();

    std::vector<int> get_flat_state() const;
    bool set_full_game_state_from_flat(const std::vector<int>& flat_board_data);

    int moves_made() const { return moves_made_; }
    int total_matched() const { return total_matched_; }

    const TileGrid& grid() const { return grid_; }
    void set_verbose(bool verbose);

private:
    TileGrid grid_;
    int moves_made_ = 0;
    int total_matched_ = 0;
    bool verbose_ = false;
};

#endif // GAME_HPP
