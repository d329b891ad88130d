#pragma once
/**
 * MazeGenerator — 随机迷宫生成
 *
 * WilsonMazeGenerator (默认):
 *   Wilson 环擦除随机游走 (loop-erased random walk)。
 *   偶数坐标 (row, col 均为偶数) 是格点, 其余格子是格点之间的墙。
 *   结果是格点上的均匀随机生成树 → 完美迷宫:
 *     - 任意两个地板格之间恰好一条简单路径
 *     - 无环, 全连通
 *     - 地板数 = 格点数 + (格点数 - 1)
 *   与 DFS 挖掘相比没有 "长走廊" 偏置。
 *
 *   generate() 的 height/width 是内部尺寸 (不含外框), 自动取 2*(n/2)+1。
 *   add_border() 加一圈墙 → 格点坐标变为奇数, 可直接交给 MazeEnv。
 *
 * DensityMazeGenerator (旧版):
 *   反复随机 "长墙" 的密度/复杂度生成器, 直接产出带外框的网格。
 *   地板保持连通, 但 *不保证* 完美迷宫 (可能有环)。
 *   complexity / density ∈ [0, 1]。
 *
 * RNG 由调用方传入, 生成器本身不持有随机状态:
 *   相同种子 → 相同网格。
 */

#include "maze/grid.h"
#include <array>
#include <random>

namespace mazeworld {

class WilsonMazeGenerator {
public:
    /** 随机游走方向表: 右, 下, 左, 上 (步长 2 落在格点上, 步长 1 是被打通的墙) */
    static constexpr std::array<Direction, 4> kDirections = {{
        {0, 1}, {1, 0}, {0, -1}, {-1, 0}
    }};

    /** 生成内部迷宫 (不含外框); height/width ≤ 0 抛 ConfigurationError */
    Grid generate(int height, int width, std::mt19937& rng) const;
};

/** 外围加一圈 WALL: (h, w) → (h + 2, w + 2) */
Grid add_border(const Grid& interior);

class DensityMazeGenerator {
public:
    /**
     * 生成带外框的迷宫 (height × width 均须为奇数)
     * @param complexity  每面墙最多延伸的步数比例 [0, 1]
     * @param density     墙的条数比例 [0, 1]
     */
    Grid generate(int height, int width, float complexity, float density,
                  std::mt19937& rng) const;
};

} // namespace mazeworld
