#include "maze/grid.h"
#include "maze/errors.h"
#include <algorithm>
#include <cstdlib>
#include <sstream>

namespace mazeworld {

int manhattan_distance(const Position& a, const Position& b) {
    return std::abs(a.row - b.row) + std::abs(a.col - b.col);
}

std::string to_string(const Position& p) {
    std::ostringstream ss;
    ss << '(' << p.row << ", " << p.col << ')';
    return ss.str();
}

Grid::Grid(size_t height, size_t width, CellState fill)
    : height_(height)
    , width_(width)
    , cells_(height * width, fill)
{}

Grid Grid::from_rows(const std::vector<std::string>& rows) {
    if (rows.empty()) {
        throw ConfigurationError("grid layout has no rows");
    }
    size_t w = rows.front().size();
    Grid grid(rows.size(), w, CellState::FLOOR);
    for (size_t r = 0; r < rows.size(); ++r) {
        if (rows[r].size() != w) {
            std::ostringstream ss;
            ss << "grid layout row " << r << " has " << rows[r].size()
               << " columns, expected " << w;
            throw ConfigurationError(ss.str());
        }
        for (size_t c = 0; c < w; ++c) {
            switch (rows[r][c]) {
                case '#': grid.cells_[grid.index((int)r, (int)c)] = CellState::WALL;  break;
                case '.': grid.cells_[grid.index((int)r, (int)c)] = CellState::FLOOR; break;
                default: {
                    std::ostringstream ss;
                    ss << "grid layout has unknown cell '" << rows[r][c]
                       << "' at " << r << "," << c;
                    throw ConfigurationError(ss.str());
                }
            }
        }
    }
    return grid;
}

CellState Grid::at(int row, int col) const {
    if (!in_bounds(row, col)) return CellState::WALL;
    return cells_[index(row, col)];
}

void Grid::set(int row, int col, CellState state) {
    if (in_bounds(row, col)) {
        cells_[index(row, col)] = state;
    }
}

size_t Grid::count(CellState state) const {
    return static_cast<size_t>(std::count(cells_.begin(), cells_.end(), state));
}

std::string Grid::to_string() const {
    std::ostringstream ss;
    for (size_t r = 0; r < height_; ++r) {
        for (size_t c = 0; c < width_; ++c) {
            ss << (cells_[r * width_ + c] == CellState::WALL ? '#' : '.');
        }
        ss << '\n';
    }
    return ss.str();
}

} // namespace mazeworld
