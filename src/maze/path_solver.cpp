#include "maze/path_solver.h"
#include "maze/errors.h"
#include <algorithm>
#include <functional>
#include <limits>
#include <queue>
#include <sstream>
#include <utility>

namespace mazeworld {

namespace {
constexpr size_t kNoPredecessor = std::numeric_limits<size_t>::max();
constexpr size_t kUnreached     = std::numeric_limits<size_t>::max();
} // namespace

PathSolver::PathSolver()
    : motions_(kActionToDirection.begin(), kActionToDirection.end())
{}

PathSolver::PathSolver(std::vector<Direction> motions)
    : motions_(std::move(motions))
{}

MazeGraph PathSolver::build_graph(const Grid& grid) const {
    MazeGraph g;
    g.n_nodes = grid.size();
    g.offsets.assign(g.n_nodes + 1, 0);

    for (size_t i = 0; i < g.n_nodes; ++i) {
        g.offsets[i] = g.targets.size();
        Position p = grid.position_of(i);
        if (grid.is_wall(p)) continue;
        for (const auto& m : motions_) {
            Position next = p + m;
            // is_floor() is false out of bounds
            if (grid.is_floor(next)) {
                g.targets.push_back(grid.index(next.row, next.col));
            }
        }
    }
    g.offsets[g.n_nodes] = g.targets.size();
    return g;
}

int PathSolver::action_between(const Position& from, const Position& to) const {
    Direction d{to.row - from.row, to.col - from.col};
    for (size_t i = 0; i < motions_.size(); ++i) {
        if (motions_[i] == d) return static_cast<int>(i);
    }
    std::ostringstream ss;
    ss << "no motion matches displacement (" << d.drow << ", " << d.dcol
       << ") from " << to_string(from) << " to " << to_string(to);
    throw SolverConsistencyError(ss.str());
}

std::optional<ActionSequence> PathSolver::solve(const Grid& grid, const Position& start,
                                                const Position& goal) const {
    if (!grid.in_bounds(start) || !grid.in_bounds(goal)) {
        std::ostringstream ss;
        ss << "solver endpoints " << to_string(start) << " -> " << to_string(goal)
           << " outside " << grid.height() << "x" << grid.width() << " grid";
        throw ConfigurationError(ss.str());
    }
    if (grid.is_wall(start) || grid.is_wall(goal)) return std::nullopt;

    const MazeGraph graph = build_graph(grid);
    const size_t src = grid.index(start.row, start.col);
    const size_t dst = grid.index(goal.row, goal.col);

    // Dijkstra with lazy deletion
    std::vector<size_t> dist(graph.n_nodes, kUnreached);
    std::vector<size_t> pred(graph.n_nodes, kNoPredecessor);
    using Entry = std::pair<size_t, size_t>;  // (distance, node)
    std::priority_queue<Entry, std::vector<Entry>, std::greater<Entry>> open;

    dist[src] = 0;
    open.push({0, src});
    while (!open.empty()) {
        auto [d, u] = open.top();
        open.pop();
        if (d > dist[u]) continue;
        if (u == dst) break;
        for (size_t e = graph.offsets[u]; e < graph.offsets[u + 1]; ++e) {
            size_t v = graph.targets[e];
            if (d + 1 < dist[v]) {
                dist[v] = d + 1;
                pred[v] = u;
                open.push({d + 1, v});
            }
        }
    }

    // Backtrack goal → start
    ActionSequence actions;
    size_t cur = dst;
    while (cur != src) {
        if (pred[cur] == kNoPredecessor) return std::nullopt;
        actions.push_back(action_between(grid.position_of(pred[cur]), grid.position_of(cur)));
        cur = pred[cur];
    }
    std::reverse(actions.begin(), actions.end());
    return actions;
}

} // namespace mazeworld
