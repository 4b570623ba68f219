#include "match.hpp"
#include <algorithm>
#include <iomanip>

// Pretty-printer (tight ASCII), top row first.
void printGrid(const TileGrid& grid, std::ostream& out, const std::vector<int>& highlights) {
    for (int y = 0; y < grid.height(); ++y) {
        for (int x = 0; x < grid.width(); ++x) {
            int index = grid.index_of(x, y);
            const Tile* tile = grid.get_tile(index);
            char symbol = tile ? tileKindSymbol(tile->type) : '?';
            if (std::find(highlights.begin(), highlights.end(), index) != highlights.end())
                out << std::setw(2) << '[' << symbol << ']';
            else
                out << std::setw(3) << symbol << ' ';
        }
        out << '\n';
    }
    out << std::string(grid.width() * 4, '-') << '\n';
    for (int x = 0; x < grid.width(); ++x)
        out << std::setw(3) << x << ' ';
    out << "\n\n";
}

std::string tileKindName(TileType type) {
    switch (type) {
    case TileType::Red:    return "Red";
    case TileType::Yellow: return "Yellow";
    case TileType::Green:  return "Green";
    case TileType::Blue:   return "Blue";
    case TileType::Purple: return "Purple";
    default:               return "None";
    }
}

char tileKindSymbol(TileType type) {
    switch (type) {
    case TileType::Red:    return 'R';
    case TileType::Yellow: return 'Y';
    case TileType::Green:  return 'G';
    case TileType::Blue:   return 'B';
    case TileType::Purple: return 'P';
    default:               return '.';
    }
}

// --- TileGrid match resolution ---

void TileGrid::detect_matches() {
    for (int i = 0; i < size(); ++i) {
        if (!grid_[i].checked) {
            check_centered_match(i);
        }
    }
}

// Only looks at the four immediate neighbours. Runs longer than three are
// still fully marked because every slot of the run gets its turn as a centre.
void TileGrid::check_centered_match(int index) {
    int y = index / width_;
    int x = index % width_;

    Tile& this_tile = grid_[index];
    this_tile.checked = true;
    if (this_tile.type == TileType::None) {
        return; // holes never match
    }
    int above = index_of(x, y - 1);
    int below = index_of(x, y + 1);
    int left = index_of(x - 1, y);
    int right = index_of(x + 1, y);

    if (above != INVALID_INDEX && grid_[above].type == this_tile.type
        && below != INVALID_INDEX && grid_[below].type == this_tile.type) {
        this_tile.matched = true;
        grid_[above].matched = true;
        grid_[below].matched = true;
    }

    if (left != INVALID_INDEX && grid_[left].type == this_tile.type
        && right != INVALID_INDEX && grid_[right].type == this_tile.type) {
        this_tile.matched = true;
        grid_[left].matched = true;
        grid_[right].matched = true;
    }
}

int TileGrid::claim_matches() {
    int tiles_matched = 0;
    for (Tile& tile : grid_) {
        if (tile.matched) {
            ++tiles_matched;
            tile.type = TileType::None;
            tile.matched = false;
            tile.checked = false;
        }
    }
    return tiles_matched;
}

void TileGrid::clear_flags() {
    for (Tile& tile : grid_) {
        tile.matched = false;
        tile.checked = false;
    }
}

// One gravity pass from the bottom-right slot up. A hole swaps with the tile
// above it; a hole in the top row gets a fresh random kind. Returns the holes
// still left after the pass.
int TileGrid::gravity_substep() {
    int holes_in_grid = 0;
    for (int i = size() - 1; i >= 0; --i) {
        if (grid_[i].type != TileType::None) continue;

        int y = i / width_;
        int x = i % width_;
        if (y == 0) {
            grid_[i].type = random_kind();
        } else {
            swap(i, index_of(x, y - 1));
            if (grid_[i].type == TileType::None) {
                ++holes_in_grid;
            }
        }
    }
    return holes_in_grid;
}

void TileGrid::settle() {
    while (gravity_substep() > 0) {
    }
}

CascadeResult TileGrid::run_cascade(bool count_scores) {
    CascadeResult result;
    int matches = 0;
    int chains = -1; // first matches don't count as a chain
    do {
        detect_matches();
        matches = claim_matches();
        if (count_scores && matches > 0) {
            result.matched += matches;
            ++chains;
            result.chains = chains;
        }
        clear_flags();
        settle();
    } while (matches > 0);

    if (verbose_ && result.matched > 0) {
        std::cout << "[GRID_DEBUG] Cascade cleared " << result.matched
                  << " tiles, chains=" << result.chains << std::endl;
    }
    return result;
}

bool TileGrid::has_any_match() const {
    for (const Tile& tile : grid_) {
        if (tile.matched) {
            return true;
        }
    }
    return false;
}

bool TileGrid::would_match(int x, int y) const {
    return would_match(index_of(x, y));
}

// Unlike the sweep, this checks one slot in isolation, so it also looks two
// slots out in each direction to catch the tile sitting at the end of a run.
bool TileGrid::would_match(int index) const {
    if (index < 0 || index >= size()) {
        return false;
    }

    int y = index / width_;
    int x = index % width_;
    TileType type = grid_[index].type;
    if (type == TileType::None) {
        return false;
    }

    auto same_kind = [&](int nx, int ny) {
        const Tile* other = get_tile(nx, ny);
        return other != nullptr && other->type == type;
    };

    if (same_kind(x, y - 1) && same_kind(x, y + 1)) return true;
    if (same_kind(x - 1, y) && same_kind(x + 1, y)) return true;

    if (same_kind(x, y - 1) && same_kind(x, y - 2)) return true;
    if (same_kind(x, y + 1) && same_kind(x, y + 2)) return true;
    if (same_kind(x - 1, y) && same_kind(x - 2, y)) return true;
    if (same_kind(x + 1, y) && same_kind(x + 2, y)) return true;

    return false;
}

std::vector<int> TileGrid::find_candidate_moves() {
    std::vector<int> solutions;

    for (int i = 0; i < size(); ++i) {
        int y = i / width_;
        int x = i % width_;

        // Up, down, left, right.
        const int neighbours[4] = {
            index_of(x, y - 1),
            index_of(x, y + 1),
            index_of(x - 1, y),
            index_of(x + 1, y)
        };

        for (int neighbour : neighbours) {
            if (neighbour == INVALID_INDEX) continue;

            swap(i, neighbour);
            bool match = would_match(i);
            swap(i, neighbour); // unswap
            if (match) {
                solutions.push_back(neighbour);
            }
        }
    }
    return solutions;
}

bool TileGrid::is_solvable() {
    return !find_candidate_moves().empty();
}
