#pragma once
/**
 * Grid — 迷宫网格 (墙壁/地板)
 *
 * 数据模型:
 *   - Grid      : height × width 的 CellState 数组, 行优先 [row * width + col]
 *   - Position  : (row, col), 0 起始
 *   - Direction : 整数位移 (drow, dcol), 与动作表一一对应
 *
 * 约定:
 *   越界格子视为 WALL (与 GridWorld::cell() 相同), 调用方无需自己做边界检查。
 *   网格尺寸生成后不可变; set() 只改格子状态。
 *
 * 文本格式 (from_rows / to_string):
 *   '#' = WALL, '.' = FLOOR
 */

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace mazeworld {

enum class CellState : uint8_t {
    FLOOR = 0,
    WALL  = 1
};

struct Direction {
    int drow = 0;
    int dcol = 0;

    bool operator==(const Direction& rhs) const { return drow == rhs.drow && dcol == rhs.dcol; }
    bool operator!=(const Direction& rhs) const { return !(*this == rhs); }
};

struct Position {
    int row = 0;
    int col = 0;

    bool operator==(const Position& rhs) const { return row == rhs.row && col == rhs.col; }
    bool operator!=(const Position& rhs) const { return !(*this == rhs); }

    Position operator+(const Direction& d) const { return Position{row + d.drow, col + d.dcol}; }
};

/** L1 (Manhattan) 距离 */
int manhattan_distance(const Position& a, const Position& b);

std::string to_string(const Position& p);

class Grid {
public:
    Grid() = default;
    Grid(size_t height, size_t width, CellState fill = CellState::WALL);

    /** 从文本行构造 ('#' 墙, '.' 地板); 行长不一致或未知字符抛 ConfigurationError */
    static Grid from_rows(const std::vector<std::string>& rows);

    size_t height() const { return height_; }
    size_t width()  const { return width_; }
    size_t size()   const { return cells_.size(); }
    bool   empty()  const { return cells_.empty(); }

    bool in_bounds(int row, int col) const {
        return row >= 0 && row < (int)height_ && col >= 0 && col < (int)width_;
    }
    bool in_bounds(const Position& p) const { return in_bounds(p.row, p.col); }

    CellState at(int row, int col) const;
    CellState at(const Position& p) const { return at(p.row, p.col); }

    /** 越界写入静默忽略 */
    void set(int row, int col, CellState state);
    void set(const Position& p, CellState state) { set(p.row, p.col, state); }

    bool is_wall(const Position& p) const  { return at(p) == CellState::WALL; }
    bool is_floor(const Position& p) const { return at(p) == CellState::FLOOR; }

    size_t count(CellState state) const;

    /** 行优先原始数据 (绑定层/测试用) */
    const std::vector<CellState>& cells() const { return cells_; }

    size_t index(int row, int col) const { return static_cast<size_t>(row) * width_ + col; }
    Position position_of(size_t index) const {
        return Position{static_cast<int>(index / width_), static_cast<int>(index % width_)};
    }

    std::string to_string() const;

    bool operator==(const Grid& rhs) const {
        return height_ == rhs.height_ && width_ == rhs.width_ && cells_ == rhs.cells_;
    }
    bool operator!=(const Grid& rhs) const { return !(*this == rhs); }

private:
    size_t height_ = 0;
    size_t width_  = 0;
    std::vector<CellState> cells_;  // row-major [row * width + col]
};

} // namespace mazeworld
