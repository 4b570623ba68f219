#undef NDEBUG
#include <algorithm>
#include <cassert>
#include <iostream>
#include <sstream>
#include <vector>

#include "grid_defs.hpp"
#include "match.hpp"
#include "tile_grid.hpp"

namespace {

const int N = static_cast<int>(TileType::None);
const int R = static_cast<int>(TileType::Red);
const int Y = static_cast<int>(TileType::Yellow);
const int G = static_cast<int>(TileType::Green);
const int B = static_cast<int>(TileType::Blue);
const int P = static_cast<int>(TileType::Purple);

bool FlagsClear(const TileGrid& grid) {
    for (int i = 0; i < grid.size(); ++i) {
        const Tile* tile = grid.get_tile(i);
        if (tile->matched || tile->checked) return false;
    }
    return true;
}

bool HasHoles(const TileGrid& grid) {
    for (int kind : grid.get_flat_state()) {
        if (kind == N) return true;
    }
    return false;
}

// Refills cycle Red, Yellow, Green, Blue, Purple so cascades are predictable.
KindSource CyclingSource() {
    int next = 0;
    return [next]() mutable {
        TileType type = static_cast<TileType>(static_cast<int>(FIRST_KIND) + next);
        next = (next + 1) % MAX_KIND_COUNT;
        return type;
    };
}

TileGrid MakeGrid(int width, int height, const std::vector<int>& state) {
    TileGrid grid(width, height, /*seed=*/1);
    bool ok = grid.set_state_from_flat(state);
    assert(ok);
    (void)ok;
    grid.set_kind_source(CyclingSource());
    return grid;
}

void TestWouldMatchAtEndOfRun() {
    TileGrid grid = MakeGrid(3, 3, {
        R, B, Y,
        G, R, R,
        Y, G, B});
    assert(!grid.would_match(0));
    assert(!grid.would_match(3));

    grid.swap(0, 3);  // Red drops into (0,1), becoming the left end of a row run.
    assert(grid.would_match(3));
    assert(grid.would_match(0, 1));
    assert(grid.would_match(4));  // centre of the same run
    assert(!grid.would_match(0));
}

void TestWouldMatchVerticalEnds() {
    TileGrid grid = MakeGrid(3, 4, {
        G, R, B,
        Y, G, R,
        B, G, Y,
        R, B, P});
    assert(!grid.would_match(1));
    grid.swap(0, 1);  // Green lands on top of the column-1 pair.
    assert(grid.would_match(1));

    TileGrid bottom = MakeGrid(3, 4, {
        R, G, B,
        Y, G, R,
        B, Y, Y,
        R, G, P});
    assert(!bottom.would_match(7));
    bottom.swap(7, 10);  // Green lifted into (1,2), under the pair.
    assert(bottom.would_match(7));
    assert(!bottom.would_match(10));
}

void TestWouldMatchOutOfRange() {
    TileGrid grid(3, 3, /*seed=*/2);
    assert(!grid.would_match(-1));
    assert(!grid.would_match(9));
    assert(!grid.would_match(3, 0));
}

void TestSweepMarksLongRuns() {
    TileGrid grid = MakeGrid(4, 3, {
        R, R, R, R,
        Y, G, B, Y,
        G, B, Y, G});
    grid.detect_matches();
    assert(grid.has_any_match());
    for (int i = 0; i < grid.size(); ++i) {
        assert(grid.get_tile(i)->checked);
        assert(grid.get_tile(i)->matched == (i < 4));
    }

    assert(grid.claim_matches() == 4);
    std::vector<int> state = grid.get_flat_state();
    for (int i = 0; i < 4; ++i) assert(state[i] == N);
    assert(!grid.has_any_match());

    grid.clear_flags();
    assert(FlagsClear(grid));
    grid.settle();
    assert(!HasHoles(grid));
}

void TestClaimWithoutMatchesIsZero() {
    TileGrid grid = MakeGrid(3, 3, {
        R, Y, G,
        B, P, R,
        Y, G, B});
    grid.detect_matches();
    assert(!grid.has_any_match());
    assert(grid.claim_matches() == 0);
    grid.clear_flags();
    assert(FlagsClear(grid));
}

void TestGravitySubstepMovesHolesUp() {
    TileGrid grid = MakeGrid(3, 3, {
        Y, G, B,
        N, B, Y,
        N, R, G});
    Tile falling = *grid.get_tile(0);

    int substeps = 0;
    int holes = 0;
    do {
        holes = grid.gravity_substep();
        ++substeps;
    } while (holes > 0);

    assert(substeps == 2);
    assert(substeps <= grid.height());
    assert(!HasHoles(grid));
    assert(grid.index_of(falling) == 6);

    std::vector<int> state = grid.get_flat_state();
    assert(state[6] == Y);
    assert(state[1] == G && state[2] == B);
    assert(state[4] == B && state[5] == Y);
    assert(state[7] == R && state[8] == G);
}

void TestSettleTerminatesWithinHeight() {
    TileGrid grid = MakeGrid(3, 5, {
        R, N, Y,
        G, N, B,
        Y, N, R,
        B, N, G,
        R, N, Y});
    int substeps = 0;
    while (grid.gravity_substep() > 0) {
        ++substeps;
        assert(substeps <= grid.height());
    }
    assert(!HasHoles(grid));

    TileGrid random_grid(6, 6, /*seed=*/31);
    for (int i = 0; i < random_grid.size(); i += 2) {
        random_grid.reset_tile(i);
    }
    random_grid.settle();
    assert(!HasHoles(random_grid));
    assert(FlagsClear(random_grid));
}

void TestSingleRoundIsNotAChain() {
    TileGrid grid = MakeGrid(3, 3, {
        G, B, Y,
        Y, G, B,
        R, R, R});
    CascadeResult result = grid.run_cascade(true);
    assert(result.matched == 3);
    assert(result.chains == 0);

    std::vector<int> expected = {
        G, Y, R,
        G, B, Y,
        Y, G, B};
    assert(grid.get_flat_state() == expected);
    assert(FlagsClear(grid));
}

void TestTwoRoundsCountOneChain() {
    TileGrid grid = MakeGrid(3, 3, {
        G, B, Y,
        G, Y, B,
        R, R, R});
    CascadeResult result = grid.run_cascade(true);
    assert(result.matched == 6);
    assert(result.chains == 1);
    assert(!HasHoles(grid));
    assert(FlagsClear(grid));

    std::vector<int> expected = {
        R, Y, R,
        P, B, Y,
        B, Y, B};
    assert(grid.get_flat_state() == expected);
}

void TestCascadeWithoutScoring() {
    TileGrid grid = MakeGrid(3, 3, {
        G, B, Y,
        G, Y, B,
        R, R, R});
    CascadeResult result = grid.run_cascade(false);
    assert(result.matched == 0);
    assert(result.chains == 0);
    assert(!HasHoles(grid));
    assert(FlagsClear(grid));
}

void TestUndoneSwapMatchesNothing() {
    std::vector<int> state = {
        R, Y, G,
        B, P, R,
        Y, G, B};
    TileGrid grid = MakeGrid(3, 3, state);
    grid.swap(0, 1);
    CascadeResult result = grid.run_cascade(true);
    grid.swap(0, 1);
    assert(result.matched == 0);
    assert(result.chains == 0);
    assert(grid.get_flat_state() == state);
    assert(FlagsClear(grid));
}

void TestNoLegalMoves() {
    // No kind appears three times, so no swap can ever line up three.
    TileGrid grid = MakeGrid(3, 3, {
        R, Y, G,
        B, P, R,
        Y, G, B});
    assert(grid.find_candidate_moves().empty());
    assert(!grid.is_solvable());
    assert(FlagsClear(grid));
}

void TestCandidateMovesKeepDuplicates() {
    TileGrid grid = MakeGrid(3, 3, {
        G, R, G,
        Y, G, B,
        G, Y, G});
    std::vector<int> before = grid.get_flat_state();
    std::vector<int> moves = grid.find_candidate_moves();
    // Green at 4 completes the top row from slot 1 and the bottom row from slot 7.
    assert(std::count(moves.begin(), moves.end(), 4) >= 2);
    assert(grid.is_solvable());
    assert(grid.get_flat_state() == before);
}

void TestCandidateMovesPointAtRealMoves() {
    TileGrid grid = MakeGrid(3, 3, {
        R, B, Y,
        G, R, R,
        Y, G, B});
    std::vector<int> moves = grid.find_candidate_moves();
    assert(std::find(moves.begin(), moves.end(), 0) != moves.end());

    for (int to : moves) {
        bool found = false;
        for (int from = 0; from < grid.size() && !found; ++from) {
            if (!grid.is_adjacent(from, to)) continue;
            grid.swap(from, to);
            found = grid.would_match(from);
            grid.swap(from, to);
        }
        assert(found);
    }
}

void TestHolesNeverMatch() {
    TileGrid grid = MakeGrid(3, 3, {
        N, N, N,
        R, Y, G,
        B, P, R});
    assert(!grid.would_match(0));
    assert(!grid.would_match(1, 0));
    assert(grid.find_candidate_moves().empty());

    grid.detect_matches();
    assert(!grid.has_any_match());
    grid.clear_flags();

    CascadeResult result = grid.run_cascade(true);
    assert(result.matched == 0);
    assert(result.chains == 0);
    assert(!HasHoles(grid));
    assert(FlagsClear(grid));
}

void TestRefillsStayWithinKindCount() {
    TileGrid grid(3, 3, /*seed=*/1, /*kind_count=*/2);
    bool ok = grid.set_state_from_flat({
        G, B, Y,
        Y, G, B,
        R, R, R});
    assert(ok);
    (void)ok;
    grid.set_kind_source([]() { return TileType::Purple; });

    CascadeResult result = grid.run_cascade(true);
    assert(result.matched >= 3);
    for (int kind : grid.get_flat_state()) {
        assert(kind != P);
    }
    // Only Red and Yellow can come back from the bag.
    std::vector<int> state = grid.get_flat_state();
    for (int i = 0; i < 3; ++i) {
        assert(state[i] == R || state[i] == Y);
    }
    assert(!HasHoles(grid));
}

void TestPrintGrid() {
    TileGrid grid = MakeGrid(3, 3, {
        R, Y, G,
        B, P, R,
        Y, G, N});
    std::ostringstream out;
    printGrid(grid, out, {4});
    std::string text = out.str();
    assert(text.find("  R   Y   G ") != std::string::npos);
    assert(text.find(" [P]") != std::string::npos);
    assert(text.find("  .") != std::string::npos);
    assert(tileKindName(TileType::Purple) == "Purple");
    assert(tileKindSymbol(TileType::None) == '.');
}

}  // namespace

int main() {
    TestWouldMatchAtEndOfRun();
    TestWouldMatchVerticalEnds();
    TestWouldMatchOutOfRange();
    TestSweepMarksLongRuns();
    TestClaimWithoutMatchesIsZero();
    TestGravitySubstepMovesHolesUp();
    TestSettleTerminatesWithinHeight();
    TestSingleRoundIsNotAChain();
    TestTwoRoundsCountOneChain();
    TestCascadeWithoutScoring();
    TestUndoneSwapMatchesNothing();
    TestNoLegalMoves();
    TestCandidateMovesKeepDuplicates();
    TestCandidateMovesPointAtRealMoves();
    TestHolesNeverMatch();
    TestRefillsStayWithinKindCount();
    TestPrintGrid();
    std::cout << "All cascade tests passed.\n";
    return 0;
}
