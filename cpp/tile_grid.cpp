#include "tile_grid.hpp"
#include "utils.hpp"     // For makeKindBag, pickKindFromBag
#include <iostream>
#include <utility>      // For std::swap

TileGrid::TileGrid(int width, int height, unsigned int seed, int kind_count)
    : rng_engine_(seed) {
    if (kind_count < MIN_KIND_COUNT) kind_count = MIN_KIND_COUNT;
    if (kind_count > MAX_KIND_COUNT) kind_count = MAX_KIND_COUNT;
    kind_count_ = kind_count;
    kind_bag_ = makeKindBag(kind_count_);
    initialize(width, height);
}

void TileGrid::initialize(int width, int height) {
    width_ = (width < MIN_GRID_SIZE) ? MIN_GRID_SIZE : width;
    height_ = (height < MIN_GRID_SIZE) ? MIN_GRID_SIZE : height;

    int attempts = 0;
    do {
        attempts++;
        if (verbose_ && attempts > 1) {
            std::cout << "[GRID_DEBUG] Board had no legal move, regenerating. Attempt=" << attempts << std::endl;
        }

        // Fresh tiles each attempt; ids keep counting so stale references never resolve.
        grid_.assign(width_ * height_, Tile());
        for (Tile& tile : grid_) {
            tile.id = next_id_++;
            tile.type = random_kind();
        }

        run_cascade(false); // Clear accidental initial matches and settle.
    } while (!is_solvable());

    if (verbose_) {
        std::cout << "[GRID_DEBUG] Initialized " << width_ << "x" << height_
                  << " grid after " << attempts << " attempt(s)." << std::endl;
    }
}

void TileGrid::seed(unsigned int value) {
    rng_engine_.seed(value);
}

TileType TileGrid::random_kind() {
    if (kind_source_) {
        TileType type = kind_source_();
        int kind = static_cast<int>(type);
        int first = static_cast<int>(FIRST_KIND);
        if (kind >= first && kind < first + kind_count_) {
            return type;
        }
    }
    return pickKindFromBag(kind_bag_, rng_engine_);
}

void TileGrid::swap(int index, int index2) {
    if (index < 0 || index >= size() || index2 < 0 || index2 >= size()) {
        return;
    }
    std::swap(grid_[index], grid_[index2]);
}

const Tile* TileGrid::get_tile(int index) const {
    if (index < 0 || index >= size()) {
        return nullptr;
    }
    return &grid_[index];
}

const Tile* TileGrid::get_tile(int x, int y) const {
    return get_tile(index_of(x, y));
}

int TileGrid::index_of(int x, int y) const {
    if (x < 0 || x >= width_ || y < 0 || y >= height_) {
        return INVALID_INDEX;
    }
    return y * width_ + x;
}

int TileGrid::index_of(const Tile& tile) const {
    for (int i = 0; i < size(); ++i) {
        if (grid_[i].id == tile.id) {
            return i;
        }
    }
    return INVALID_INDEX;
}

GridCoord TileGrid::coords_of(int index) const {
    if (index < 0 || index >= size()) {
        return GridCoord{INVALID_INDEX, INVALID_INDEX};
    }
    return GridCoord{index % width_, index / width_};
}

GridCoord TileGrid::coords_of(const Tile& tile) const {
    return coords_of(index_of(tile));
}

bool TileGrid::is_adjacent(int index, int index2) const {
    if (index < 0 || index >= size() || index2 < 0 || index2 >= size()) {
        return false;
    }
    int y = index / width_;
    int x = index % width_;
    return index2 == index_of(x - 1, y)
        || index2 == index_of(x + 1, y)
        || index2 == index_of(x, y - 1)
        || index2 == index_of(x, y + 1);
}

void TileGrid::reset_tile(int index, TileType type) {
    if (index < 0 || index >= size()) {
        return;
    }
    Tile& tile = grid_[index];
    tile.matched = false;
    tile.checked = false;
    tile.type = type;
}

void TileGrid::reset_tile(int x, int y, TileType type) {
    reset_tile(index_of(x, y), type);
}

std::vector<int> TileGrid::get_flat_state() const {
    std::vector<int> flat_state;
    flat_state.reserve(grid_.size());
    for (const Tile& tile : grid_) {
        flat_state.push_back(static_cast<int>(tile.type));
    }
    return flat_state;
}

bool TileGrid::set_state_from_flat(const std::vector<int>& kinds) {
    if (kinds.size() != grid_.size()) {
        std::cerr << "Error: Invalid flat state size in set_state_from_flat. Expected "
                  << grid_.size() << ", got " << kinds.size() << "." << std::endl;
        return false;
    }
    for (int kind : kinds) {
        if (kind < static_cast<int>(TileType::None) || kind >= static_cast<int>(TileType::Max)) {
            std::cerr << "Error: Invalid tile kind " << kind << " in set_state_from_flat." << std::endl;
            return false;
        }
    }

    for (int i = 0; i < size(); ++i) {
        reset_tile(i, static_cast<TileType>(kinds[i]));
    }
    return true;
}
