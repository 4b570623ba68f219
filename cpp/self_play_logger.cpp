#include "game.hpp"      // For Game, MoveResult
#include "match.hpp"     // For printGrid
#include "grid_defs.hpp" // For DEFAULT_WIDTH, DEFAULT_HEIGHT

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <random>
#include <sstream>
#include <string>
#include <vector>

const int MAX_MOVES_PER_EPISODE = 50;

// Serializes the grid kinds to a flat, row-major JSON array string.
std::string serializeStateFlat(const std::vector<int>& state) {
    std::ostringstream oss;
    oss << "[";
    for (size_t i = 0; i < state.size(); ++i) {
        if (i > 0) oss << ",";
        oss << state[i];
    }
    oss << "]";
    return oss.str();
}

// Hints only name the slot to swap into, so try its neighbours until one of
// them forms the move. Rejected tries undo themselves inside make_move.
MoveResult playHint(Game& game, int hint, int& from_out) {
    const TileGrid& grid = game.grid();
    GridCoord c = grid.coords_of(hint);
    const int neighbours[4] = {
        grid.index_of(c.x, c.y - 1),
        grid.index_of(c.x, c.y + 1),
        grid.index_of(c.x - 1, c.y),
        grid.index_of(c.x + 1, c.y)
    };

    MoveResult result;
    for (int from : neighbours) {
        if (from == INVALID_INDEX) continue;
        result = game.make_move(from, hint);
        if (result.status == MoveStatus::Accepted) {
            from_out = from;
            return result;
        }
    }
    from_out = INVALID_INDEX;
    return result;
}

int main(int argc, char** argv) {
    int num_episodes = 100;
    unsigned int seed = std::random_device{}();
    std::string output_file_path = "data/self_play.jsonl";

    if (argc > 1) num_episodes = std::atoi(argv[1]);
    if (argc > 2) seed = static_cast<unsigned int>(std::strtoul(argv[2], nullptr, 10));
    if (argc > 3) output_file_path = argv[3];
    bool verbose = argc > 4 && std::string(argv[4]) == "-v";

    std::ofstream outfile(output_file_path);
    if (!outfile.is_open()) {
        std::cerr << "Error: Could not open " << output_file_path << " for writing." << std::endl;
        std::cerr << "Please ensure the output directory exists relative to the executable's CWD." << std::endl;
        return 1;
    }

    std::mt19937 rng_engine(seed); // Picks among the hints
    Game game(DEFAULT_WIDTH, DEFAULT_HEIGHT, seed);
    game.set_verbose(verbose);

    long total_moves_logged = 0;
    long total_matched_all_episodes = 0;
    int best_chain = 0;

    for (int i = 0; i < num_episodes; ++i) {
        game.reset();
        if (i == 0) {
            printGrid(game.grid(), std::cout, game.get_hints());
        }

        for (int step = 0; step < MAX_MOVES_PER_EPISODE; ++step) {
            std::vector<int> hints = game.get_hints();
            if (hints.empty()) {
                break;
            }

            std::string state_before_str = serializeStateFlat(game.get_flat_state());
            std::uniform_int_distribution<size_t> pick(0, hints.size() - 1);
            int to = hints[pick(rng_engine)];
            int from = INVALID_INDEX;
            MoveResult result = playHint(game, to, from);
            if (result.status != MoveStatus::Accepted) {
                std::cout << "[WARNING] Hint " << to << " did not produce a move. Ending episode early." << std::endl;
                break;
            }
            if (result.chains > best_chain) best_chain = result.chains;

            bool done = game.is_game_over();
            outfile << "{";
            outfile << "\"state\":" << state_before_str << ",";
            outfile << "\"action\":[" << from << "," << to << "],";
            outfile << "\"matched\":" << result.matched << ",";
            outfile << "\"chains\":" << result.chains << ",";
            outfile << "\"next_state\":" << serializeStateFlat(game.get_flat_state()) << ",";
            outfile << "\"done\":" << (done ? "true" : "false");
            outfile << "}\n";
            total_moves_logged++;

            if (done) {
                break;
            }
        }
        total_matched_all_episodes += game.total_matched();
        std::cout << "Episode " << i + 1 << "/" << num_episodes << " finished. Matched: " << game.total_matched()
                  << ", Moves in episode: " << game.moves_made() << std::endl;
    }

    outfile.close();
    std::cout << "\nSelf-play complete." << std::endl;
    std::cout << "Seed: " << seed << std::endl;
    std::cout << "Total moves logged: " << total_moves_logged << std::endl;
    std::cout << "Longest chain: " << best_chain << std::endl;
    if (num_episodes > 0) {
        double avg_matched = static_cast<double>(total_matched_all_episodes) / num_episodes;
        std::cout << "Average tiles matched per episode: " << avg_matched << std::endl;
    }
    std::cout << "Data saved to " << output_file_path << std::endl;
    return 0;
}
