#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include "game.hpp"
#include "grid_defs.hpp"
#include "tile_grid.hpp"
#include <random>

namespace py = pybind11;

// No seed from Python means a fresh random one, as with the C++ default.
static unsigned int resolveSeed(const py::object& seed) {
    if (seed.is_none()) {
        return std::random_device{}();
    }
    return seed.cast<unsigned int>();
}

PYBIND11_MODULE(_match3_engine, m) {
    m.doc() = "Pybind11 bindings for the C++ match-3 grid engine";

    m.attr("INVALID_INDEX") = py::int_(INVALID_INDEX);
    m.attr("DEFAULT_WIDTH") = py::int_(DEFAULT_WIDTH);
    m.attr("DEFAULT_HEIGHT") = py::int_(DEFAULT_HEIGHT);

    py::enum_<TileType>(m, "TileType")
        .value("None_", TileType::None)
        .value("Red", TileType::Red)
        .value("Yellow", TileType::Yellow)
        .value("Green", TileType::Green)
        .value("Blue", TileType::Blue)
        .value("Purple", TileType::Purple);

    py::enum_<MoveStatus>(m, "MoveStatus")
        .value("Accepted", MoveStatus::Accepted)
        .value("OutOfBounds", MoveStatus::OutOfBounds)
        .value("NotAdjacent", MoveStatus::NotAdjacent)
        .value("NoMatch", MoveStatus::NoMatch);

    py::class_<CascadeResult>(m, "CascadeResult")
        .def_readonly("matched", &CascadeResult::matched)
        .def_readonly("chains", &CascadeResult::chains);

    py::class_<MoveResult>(m, "MoveResult")
        .def_readonly("status", &MoveResult::status)
        .def_readonly("matched", &MoveResult::matched)
        .def_readonly("chains", &MoveResult::chains);

    py::class_<TileGrid>(m, "TileGrid")
        .def(py::init([](int width, int height, py::object seed, int kind_count) {
                 return TileGrid(width, height, resolveSeed(seed), kind_count);
             }),
             py::arg("width") = DEFAULT_WIDTH, py::arg("height") = DEFAULT_HEIGHT,
             py::arg("seed") = py::none(), py::arg("kind_count") = MAX_KIND_COUNT)
        .def("initialize", &TileGrid::initialize, "Rebuilds a solvable, match-free grid.",
             py::arg("width"), py::arg("height"))
        .def_property_readonly("width", &TileGrid::width)
        .def_property_readonly("height", &TileGrid::height)
        .def("swap", &TileGrid::swap, "Swaps two slots; no-op on invalid indices.",
             py::arg("index"), py::arg("index2"))
        .def("run_cascade", &TileGrid::run_cascade, "Resolves matches and gravity until stable.",
             py::arg("count_scores") = true)
        .def("would_match", py::overload_cast<int>(&TileGrid::would_match, py::const_), py::arg("index"))
        .def("is_adjacent", &TileGrid::is_adjacent, py::arg("index"), py::arg("index2"))
        .def("index_of", py::overload_cast<int, int>(&TileGrid::index_of, py::const_), py::arg("x"), py::arg("y"))
        .def("find_candidate_moves", &TileGrid::find_candidate_moves,
             "Lists every neighbour index whose swap would produce a match.")
        .def("is_solvable", &TileGrid::is_solvable)
        .def("get_flat_state", &TileGrid::get_flat_state, "Returns the row-major list of tile kinds.")
        .def("set_state_from_flat", &TileGrid::set_state_from_flat, py::arg("kinds"));

    py::class_<Game>(m, "Game")
        .def(py::init([](int width, int height, py::object seed, int kind_count) {
                 return Game(width, height, resolveSeed(seed), kind_count);
             }),
             py::arg("width") = DEFAULT_WIDTH, py::arg("height") = DEFAULT_HEIGHT,
             py::arg("seed") = py::none(), py::arg("kind_count") = MAX_KIND_COUNT)
        .def("reset", &Game::reset, "Rebuilds the grid and clears the session counters.")
        .def("make_move", &Game::make_move, "Swaps two adjacent slots and resolves the result.",
             py::arg("from_index"), py::arg("to_index"))
        .def("get_hints", &Game::get_hints, "Returns the candidate move indices.")
        .def("is_game_over", &Game::is_game_over, "True when no swap can produce a match.")
        .def("get_flat_state", &Game::get_flat_state)
        .def("set_full_game_state_from_flat", &Game::set_full_game_state_from_flat,
             "Sets every tile kind from a flat row-major list.", py::arg("flat_board_data"))
        .def_property_readonly("moves_made", &Game::moves_made)
        .def_property_readonly("total_matched", &Game::total_matched)
        .def_property_readonly("width", [](const Game& game) { return game.grid().width(); })
        .def_property_readonly("height", [](const Game& game) { return game.grid().height(); });
}
