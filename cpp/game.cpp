#include "game.hpp"
#include <iostream>

Game::Game(int width, int height, unsigned int seed, int kind_count)
    : grid_(width, height, seed, kind_count) {
}

void Game::reset() {
    grid_.initialize(grid_.width(), grid_.height());
    moves_made_ = 0;
    total_matched_ = 0;
}

MoveResult Game::make_move(int from, int to) {
    MoveResult result;
    if (grid_.get_tile(from) == nullptr || grid_.get_tile(to) == nullptr) {
        result.status = MoveStatus::OutOfBounds;
        return result;
    }
    if (!grid_.is_adjacent(from, to)) {
        result.status = MoveStatus::NotAdjacent;
        return result;
    }

    grid_.swap(from, to);
    if (!grid_.would_match(from) && !grid_.would_match(to)) {
        grid_.swap(from, to); // Undo, the swap didn't line anything up.
        if (verbose_) {
            std::cout << "[GAME_DEBUG] No matches. From=" << from << ", To=" << to << std::endl;
        }
        result.status = MoveStatus::NoMatch;
        return result;
    }

    CascadeResult cascade = grid_.run_cascade(true);
    result.status = MoveStatus::Accepted;
    result.matched = cascade.matched;
    result.chains = cascade.chains;

    moves_made_++;
    total_matched_ += cascade.matched;
    if (verbose_) {
        std::cout << "[GAME_DEBUG] Matches: " << result.matched << ", Chains: " << result.chains << std::endl;
    }
    return result;
}

std::vector<int> Game::get_hints() {
    return grid_.find_candidate_moves();
}

bool Game::is_game_over() {
    return !grid_.is_solvable();
}

std::vector<int> Game::get_flat_state() const {
    return grid_.get_flat_state();
}

bool Game::set_full_game_state_from_flat(const std::vector<int>& flat_board_data) {
    return grid_.set_state_from_flat(flat_board_data);
}

void Game::set_verbose(bool verbose) {
    verbose_ = verbose;
    grid_.set_verbose(verbose);
}
