#pragma once
/**
 * Action — 离散动作与位移表
 *
 *   0 = RIGHT ( 0, +1)
 *   1 = UP    (-1,  0)
 *   2 = LEFT  ( 0, -1)
 *   3 = DOWN  (+1,  0)
 *
 * 表在整个程序生命周期内固定, 以动作编号为下标。
 * MazeEnv 与 PathSolver 共用这张表, 所以求解器输出可以直接喂给 step()。
 */

#include "maze/grid.h"
#include <array>
#include <cstdint>

namespace mazeworld {

enum class Action : uint8_t {
    RIGHT = 0,
    UP    = 1,
    LEFT  = 2,
    DOWN  = 3
};

inline constexpr int kNumActions = 4;

inline constexpr std::array<Direction, kNumActions> kActionToDirection = {{
    {0, 1},    // right
    {-1, 0},   // up
    {0, -1},   // left
    {1, 0}     // down
}};

inline bool is_valid_action(int action) { return action >= 0 && action < kNumActions; }

inline const char* action_name(int action) {
    switch (action) {
        case 0: return "right";
        case 1: return "up";
        case 2: return "left";
        case 3: return "down";
        default: return "?";
    }
}

} // namespace mazeworld
