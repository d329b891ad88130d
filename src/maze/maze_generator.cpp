#include "maze/maze_generator.h"
#include "maze/errors.h"
#include <limits>
#include <sstream>
#include <unordered_map>
#include <vector>

namespace mazeworld {

namespace {

constexpr size_t kNotQueued = std::numeric_limits<size_t>::max();

Position advance(const Position& p, const Direction& d, int stride) {
    return Position{p.row + stride * d.drow, p.col + stride * d.dcol};
}

} // namespace

// =============================================================================
// Wilson's algorithm
// =============================================================================

Grid WilsonMazeGenerator::generate(int height, int width, std::mt19937& rng) const {
    if (height <= 0 || width <= 0) {
        std::ostringstream ss;
        ss << "maze interior must be positive, got " << height << "x" << width;
        throw ConfigurationError(ss.str());
    }

    // Only odd shapes
    const int h = 2 * (height / 2) + 1;
    const int w = 2 * (width / 2) + 1;
    Grid grid(static_cast<size_t>(h), static_cast<size_t>(w), CellState::WALL);

    // Lattice nodes live on even (row, col). slot[] tracks where each node sits
    // inside `unvisited` so removal is a swap with the back.
    std::vector<size_t> unvisited;
    std::vector<size_t> slot(grid.size(), kNotQueued);
    std::vector<uint8_t> visited(grid.size(), 0);
    for (int r = 0; r < h; r += 2) {
        for (int c = 0; c < w; c += 2) {
            size_t i = grid.index(r, c);
            slot[i] = unvisited.size();
            unvisited.push_back(i);
        }
    }

    auto remove_unvisited = [&](size_t cell) {
        size_t i = slot[cell];
        if (i == kNotQueued) return;
        size_t last = unvisited.back();
        unvisited[i] = last;
        slot[last] = i;
        unvisited.pop_back();
        slot[cell] = kNotQueued;
    };
    auto pick_unvisited = [&]() {
        std::uniform_int_distribution<size_t> pick(0, unvisited.size() - 1);
        return unvisited[pick(rng)];
    };
    auto stride_in_bounds = [&](const Position& p, int dir) {
        return grid.in_bounds(advance(p, kDirections[dir], 2));
    };

    // Step 1: seed the tree with one random node
    size_t root = pick_unvisited();
    remove_unvisited(root);
    visited[root] = 1;
    grid.set(grid.position_of(root), CellState::FLOOR);

    std::uniform_int_distribution<int> pick_dir(0, 3);
    std::unordered_map<size_t, int> path;  // node → direction taken the last time we left it

    while (!unvisited.empty()) {
        path.clear();
        const size_t first = pick_unvisited();

        // Random walk until the tree is hit. Overwriting path[node] on a
        // revisit erases the loop closed by that revisit.
        Position current = grid.position_of(first);
        while (true) {
            int dir = pick_dir(rng);
            while (!stride_in_bounds(current, dir)) {
                dir = pick_dir(rng);
            }
            path[grid.index(current.row, current.col)] = dir;
            current = advance(current, kDirections[dir], 2);
            if (visited[grid.index(current.row, current.col)]) break;
        }

        // Replay the loop-erased walk and carve it into the tree
        current = grid.position_of(first);
        while (true) {
            size_t ci = grid.index(current.row, current.col);
            visited[ci] = 1;
            remove_unvisited(ci);
            grid.set(current, CellState::FLOOR);

            const Direction& d = kDirections[path.at(ci)];
            grid.set(advance(current, d, 1), CellState::FLOOR);  // crossed wall

            current = advance(current, d, 2);
            if (visited[grid.index(current.row, current.col)]) break;
        }
    }

    return grid;
}

Grid add_border(const Grid& interior) {
    Grid out(interior.height() + 2, interior.width() + 2, CellState::WALL);
    for (size_t r = 0; r < interior.height(); ++r) {
        for (size_t c = 0; c < interior.width(); ++c) {
            out.set(static_cast<int>(r) + 1, static_cast<int>(c) + 1,
                    interior.at(static_cast<int>(r), static_cast<int>(c)));
        }
    }
    return out;
}

// =============================================================================
// Legacy density / complexity generator
// =============================================================================

Grid DensityMazeGenerator::generate(int height, int width, float complexity, float density,
                                    std::mt19937& rng) const {
    if (height < 3 || width < 3 || height % 2 == 0 || width % 2 == 0) {
        std::ostringstream ss;
        ss << "width/height must be odd and >= 3, got " << height << "x" << width;
        throw ConfigurationError(ss.str());
    }
    if (!(complexity >= 0.0f && complexity <= 1.0f) || !(density >= 0.0f && density <= 1.0f)) {
        std::ostringstream ss;
        ss << "complexity/density must be in [0, 1], got "
           << complexity << "/" << density;
        throw ConfigurationError(ss.str());
    }

    const int h = height;
    const int w = width;
    // Scale relative to maze size
    const int n_extend = static_cast<int>(complexity * (5 * (h + w)));
    const int n_walls  = static_cast<int>(density * ((h / 2) * (w / 2)));

    Grid grid(static_cast<size_t>(h), static_cast<size_t>(w), CellState::FLOOR);
    for (int c = 0; c < w; ++c) {
        grid.set(0, c, CellState::WALL);
        grid.set(h - 1, c, CellState::WALL);
    }
    for (int r = 0; r < h; ++r) {
        grid.set(r, 0, CellState::WALL);
        grid.set(r, w - 1, CellState::WALL);
    }

    std::uniform_int_distribution<int> pick_x(0, w / 2);
    std::uniform_int_distribution<int> pick_y(0, h / 2);
    std::vector<Position> neighbours;
    neighbours.reserve(4);

    for (int i = 0; i < n_walls; ++i) {
        int x = pick_x(rng) * 2;
        int y = pick_y(rng) * 2;
        grid.set(y, x, CellState::WALL);
        for (int j = 0; j < n_extend; ++j) {
            neighbours.clear();
            if (x > 1)     neighbours.push_back({y, x - 2});
            if (x < w - 2) neighbours.push_back({y, x + 2});
            if (y > 1)     neighbours.push_back({y - 2, x});
            if (y < h - 2) neighbours.push_back({y + 2, x});
            if (neighbours.empty()) continue;

            std::uniform_int_distribution<size_t> pick(0, neighbours.size() - 1);
            Position next = neighbours[pick(rng)];
            if (grid.at(next) == CellState::FLOOR) {
                grid.set(next, CellState::WALL);
                grid.set(next.row + (y - next.row) / 2, next.col + (x - next.col) / 2,
                         CellState::WALL);
                x = next.col;
                y = next.row;
            }
        }
    }

    return grid;
}

} // namespace mazeworld
