#pragma once
/**
 * PathSolver — 最短动作序列求解 (迷宫 oracle)
 *
 * 流程:
 *   1. build_graph(): 所有可通行格子为节点, 每个合法动作 (不越界且落在地板上)
 *      一条有向边, 权重 1。邻接表按 CSR 存储。
 *   2. Dijkstra 从起点出发, 记录前驱 (权重全为 1, 等价于 BFS)。
 *   3. 从终点沿前驱回溯到起点; 前驱未设置 → 不可达, 返回 std::nullopt。
 *   4. 每一步位移在动作表里精确匹配回动作编号;
 *      匹配不到说明动作表与建图不一致 → SolverConsistencyError。
 *
 * 不可达是正常结果 (任意外部网格都可能出现), 不抛异常。
 * Wilson 迷宫全连通, 对生成器产出的网格永远有解。
 */

#include "maze/action.h"
#include "maze/grid.h"
#include <cstddef>
#include <optional>
#include <vector>

namespace mazeworld {

using ActionSequence = std::vector<int>;

/** CSR 邻接: 节点 i 的出边为 targets[offsets[i] .. offsets[i+1]) */
struct MazeGraph {
    size_t n_nodes = 0;
    std::vector<size_t> offsets;
    std::vector<size_t> targets;

    size_t n_edges() const { return targets.size(); }
};

class PathSolver {
public:
    PathSolver();
    explicit PathSolver(std::vector<Direction> motions);

    MazeGraph build_graph(const Grid& grid) const;

    /**
     * 起点 → 终点的最短动作序列 (起点即终点时为空序列)
     * start/goal 越界抛 ConfigurationError; 落在墙上视为不可达。
     */
    std::optional<ActionSequence> solve(const Grid& grid, const Position& start,
                                        const Position& goal) const;

    /** 相邻两格之间的动作编号; 位移不在动作表中抛 SolverConsistencyError */
    int action_between(const Position& from, const Position& to) const;

    const std::vector<Direction>& motions() const { return motions_; }

private:
    std::vector<Direction> motions_;
};

} // namespace mazeworld
