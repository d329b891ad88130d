/**
 * pymazeworld — Python bindings for the MazeWorld navigation core
 *
 * Exposes Grid, the maze generators, PathSolver, MazeEnv, TimeLimit and the
 * environment registry via pybind11. reset()/step() follow the usual
 * (observation, info) / (observation, reward, terminated, truncated, info)
 * tuple layout, with the observation as a 2-D numpy uint8 array.
 */

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/numpy.h>

#include "maze/errors.h"
#include "maze/grid.h"
#include "maze/action.h"
#include "maze/maze_generator.h"
#include "maze/path_solver.h"
#include "engine/environment.h"
#include "engine/maze_source.h"
#include "engine/maze_env.h"
#include "engine/time_limit.h"
#include "engine/maze_registry.h"
#include "engine/batch_rollout.h"

#include <optional>
#include <utility>
#include <vector>

namespace py = pybind11;
using namespace mazeworld;

// Helper: observation → (height, width) numpy array
static py::array_t<uint8_t> obs_to_numpy(const Observation& obs) {
    return py::array_t<uint8_t>(
        {static_cast<py::ssize_t>(obs.height), static_cast<py::ssize_t>(obs.width)},
        obs.cells.data()
    );
}

// Helper: grid → (height, width) numpy array, 1 = wall
static py::array_t<uint8_t> grid_to_numpy(const Grid& grid) {
    py::array_t<uint8_t> out({static_cast<py::ssize_t>(grid.height()),
                              static_cast<py::ssize_t>(grid.width())});
    auto buf = out.mutable_unchecked<2>();
    for (py::ssize_t r = 0; r < buf.shape(0); ++r) {
        for (py::ssize_t c = 0; c < buf.shape(1); ++c) {
            buf(r, c) = static_cast<uint8_t>(grid.at(static_cast<int>(r), static_cast<int>(c)));
        }
    }
    return out;
}

static Grid grid_from_numpy(py::array_t<int64_t, py::array::c_style | py::array::forcecast> arr) {
    if (arr.ndim() != 2) {
        throw ConfigurationError("maze map must be a 2-D array");
    }
    auto buf = arr.unchecked<2>();
    Grid grid(static_cast<size_t>(buf.shape(0)), static_cast<size_t>(buf.shape(1)),
              CellState::FLOOR);
    for (py::ssize_t r = 0; r < buf.shape(0); ++r) {
        for (py::ssize_t c = 0; c < buf.shape(1); ++c) {
            if (buf(r, c) != 0) grid.set(static_cast<int>(r), static_cast<int>(c), CellState::WALL);
        }
    }
    return grid;
}

static py::tuple pos_tuple(const Position& p) { return py::make_tuple(p.row, p.col); }

static py::dict info_to_dict(const StepInfo& info) {
    py::dict d;
    d["distance"] = info.distance;
    d["agent"]    = pos_tuple(info.agent);
    d["target"]   = pos_tuple(info.target);
    return d;
}

static py::tuple reset_to_tuple(const ResetResult& r) {
    return py::make_tuple(obs_to_numpy(r.observation), info_to_dict(r.info));
}

// (obs, reward, terminated, truncated, info)
static py::tuple step_to_tuple(const StepResult& r) {
    return py::make_tuple(obs_to_numpy(r.observation), r.reward,
                          r.terminated, r.truncated, info_to_dict(r.info));
}

PYBIND11_MODULE(pymazeworld, m) {
    m.doc() = "MazeWorld maze navigation core Python bindings";

    // =========================================================================
    // Errors
    // =========================================================================
    auto maze_error = py::register_exception<MazeError>(m, "MazeError", PyExc_RuntimeError);
    auto config_error = py::register_exception<ConfigurationError>(m, "ConfigurationError",
                                                                   maze_error.ptr());
    py::register_exception<ShapeMismatchError>(m, "ShapeMismatchError", config_error.ptr());
    py::register_exception<InvalidActionError>(m, "InvalidActionError", maze_error.ptr());
    py::register_exception<EpisodeStateError>(m, "EpisodeStateError", maze_error.ptr());
    py::register_exception<SolverConsistencyError>(m, "SolverConsistencyError", maze_error.ptr());
    py::register_exception<UnknownEnvironmentError>(m, "UnknownEnvironmentError", maze_error.ptr());

    // =========================================================================
    // Grid
    // =========================================================================
    py::enum_<CellState>(m, "CellState")
        .value("FLOOR", CellState::FLOOR)
        .value("WALL",  CellState::WALL);

    py::class_<Position>(m, "Position")
        .def(py::init<>())
        .def(py::init([](int row, int col) { return Position{row, col}; }),
             py::arg("row"), py::arg("col"))
        .def_readwrite("row", &Position::row)
        .def_readwrite("col", &Position::col)
        .def("__eq__", &Position::operator==)
        .def("__repr__", [](const Position& p) { return "Position" + to_string(p); });

    py::class_<Grid>(m, "Grid", "Wall/floor maze grid")
        .def(py::init<size_t, size_t, CellState>(),
             py::arg("height"), py::arg("width"), py::arg("fill") = CellState::WALL)
        .def_static("from_rows", &Grid::from_rows, py::arg("rows"))
        .def_static("from_numpy", &grid_from_numpy, py::arg("maze_map"),
                    "Build a grid from an int array (non-zero = wall)")
        .def("height", &Grid::height)
        .def("width",  &Grid::width)
        .def("at", [](const Grid& g, int r, int c) { return g.at(r, c); })
        .def("set", [](Grid& g, int r, int c, CellState s) { g.set(r, c, s); })
        .def("count", &Grid::count)
        .def("to_numpy", &grid_to_numpy, "Return the grid as a uint8 array (1 = wall)")
        .def("to_string", &Grid::to_string)
        .def("__eq__", &Grid::operator==);

    // =========================================================================
    // Generators
    // =========================================================================
    m.def("generate_wilson_maze", [](int height, int width, uint32_t seed) {
        std::mt19937 rng(seed);
        return WilsonMazeGenerator().generate(height, width, rng);
    }, "Perfect maze interior (no outer wall) via Wilson's algorithm",
       py::arg("height"), py::arg("width"), py::arg("seed"));

    m.def("generate_density_maze",
          [](int height, int width, float complexity, float density, uint32_t seed) {
        std::mt19937 rng(seed);
        return DensityMazeGenerator().generate(height, width, complexity, density, rng);
    }, "Legacy density/complexity maze (framed, not necessarily perfect)",
       py::arg("height"), py::arg("width"), py::arg("complexity") = 0.75f,
       py::arg("density") = 0.75f, py::arg("seed") = 0u);

    m.def("add_border", &add_border, py::arg("interior"));

    // =========================================================================
    // PathSolver
    // =========================================================================
    m.def("action_to_direction", []() {
        py::list out;
        for (const auto& d : kActionToDirection) out.append(py::make_tuple(d.drow, d.dcol));
        return out;
    });

    m.def("maze_dijkstra_solver",
          [](const Grid& grid, const Position& start, const Position& goal,
             const std::optional<std::vector<std::pair<int, int>>>& motions) {
        if (!motions) return PathSolver().solve(grid, start, goal);
        std::vector<Direction> table;
        for (const auto& d : *motions) table.push_back(Direction{d.first, d.second});
        return PathSolver(std::move(table)).solve(grid, start, goal);
    }, "Shortest action sequence from start to goal, or None if unreachable.\n"
       "motions: optional list of (drow, dcol); action i moves by motions[i]",
       py::arg("grid"), py::arg("start"), py::arg("goal"), py::arg("motions") = py::none());

    // =========================================================================
    // Environments
    // =========================================================================
    py::enum_<MazeAlgorithm>(m, "MazeAlgorithm")
        .value("WILSON",  MazeAlgorithm::WILSON)
        .value("DENSITY", MazeAlgorithm::DENSITY);

    py::enum_<EpisodeState>(m, "EpisodeState")
        .value("IDLE",       EpisodeState::IDLE)
        .value("RUNNING",    EpisodeState::RUNNING)
        .value("TERMINATED", EpisodeState::TERMINATED);

    py::class_<RandomMazeConfig>(m, "RandomMazeConfig")
        .def(py::init<>())
        .def_readwrite("width",      &RandomMazeConfig::width)
        .def_readwrite("height",     &RandomMazeConfig::height)
        .def_readwrite("algorithm",  &RandomMazeConfig::algorithm)
        .def_readwrite("complexity", &RandomMazeConfig::complexity)
        .def_readwrite("density",    &RandomMazeConfig::density);

    py::class_<Environment>(m, "Environment", "Maze environment base class")
        .def("reset", [](Environment& e, py::object seed) {
            if (seed.is_none()) return reset_to_tuple(e.reset());
            return reset_to_tuple(e.reset_with_seed(seed.cast<uint32_t>()));
        }, py::arg("seed") = py::none())
        .def("step", [](Environment& e, int action) { return step_to_tuple(e.step(action)); },
             py::arg("action"))
        .def("maze_map", [](const Environment& e) { return grid_to_numpy(e.grid()); })
        .def("grid",   &Environment::grid, py::return_value_policy::reference_internal)
        .def("agent",  &Environment::agent)
        .def("target", &Environment::target)
        .def("width",  &Environment::width)
        .def("height", &Environment::height)
        .def("to_string", &Environment::to_string);

    py::class_<MazeEnv, Environment>(m, "MazeEnv", "Maze navigation state machine")
        .def(py::init([](const Grid& grid, const Position& agent, const Position& target) {
            MazeEnvConfig cfg;
            cfg.height = static_cast<int>(grid.height());
            cfg.width  = static_cast<int>(grid.width());
            return std::make_unique<MazeEnv>(
                cfg, std::make_unique<FixedMazeSource>(grid, agent, target));
        }), py::arg("grid"), py::arg("agent"), py::arg("target"),
            "Environment over a fixed hand-authored layout")
        .def(py::init([](const RandomMazeConfig& mcfg) {
            MazeEnvConfig cfg;
            cfg.height = mcfg.height;
            cfg.width  = mcfg.width;
            return std::make_unique<MazeEnv>(cfg, std::make_unique<RandomMazeSource>(mcfg));
        }), py::arg("config"), "Environment over freshly generated random mazes")
        .def("state", &MazeEnv::state)
        .def("previous_agent", &MazeEnv::previous_agent);

    py::class_<TimeLimit, Environment>(m, "TimeLimit", "Episode-length wrapper")
        .def("elapsed_steps",     &TimeLimit::elapsed_steps)
        .def("max_episode_steps", &TimeLimit::max_episode_steps);

    m.def("registered_envs", []() {
        std::vector<std::string> ids;
        for (const auto& spec : registered_envs()) ids.push_back(spec.id);
        return ids;
    });
    m.def("make", [](const std::string& id) { return make_env(id); }, py::arg("env_id"));

    // =========================================================================
    // Batched oracle rollouts
    // =========================================================================
    py::class_<RolloutResult>(m, "RolloutResult")
        .def_readonly("seed",           &RolloutResult::seed)
        .def_readonly("solved",         &RolloutResult::solved)
        .def_readonly("reached_target", &RolloutResult::reached_target)
        .def_readonly("truncated",      &RolloutResult::truncated)
        .def_readonly("n_actions",      &RolloutResult::n_actions)
        .def_readonly("shortest_path",  &RolloutResult::shortest_path)
        .def_readonly("episode_return", &RolloutResult::episode_return)
        .def_readonly("error",          &RolloutResult::error);

    m.def("run_oracle_rollouts", &run_oracle_rollouts,
          py::arg("env_id"), py::arg("seeds"),
          py::call_guard<py::gil_scoped_release>());

    m.def("version", []() { return "0.1.0"; });
}
