#pragma once
/**
 * Environment — 抽象迷宫环境接口
 *
 * 定义 agent 与迷宫的交互协议:
 *   - reset() / reset_with_seed() : 开始新回合, 返回初始观测 + info
 *   - step(action)                : 离散动作 {0,1,2,3} → 观测/奖赏/终止/截断
 *   - grid/agent/target           : 只读快照 (求解器/渲染/日志用)
 *
 * 观测编码 (唯一, 全配置固定):
 *   单张网格, 行优先 uint8_t:
 *     0 = 地板, 1 = 墙, 2 = agent, 3 = 目标, 4 = agent 位于目标上
 *
 * 实现:
 *   - MazeEnv   : 导航状态机 (迷宫由 MazeSource 提供)
 *   - TimeLimit : 回合步数上限包装 (截断)
 */

#include "maze/grid.h"
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace mazeworld {

enum class ObjectId : uint8_t {
    EMPTY           = 0,
    WALL            = 1,
    AGENT           = 2,
    TARGET          = 3,
    AGENT_ON_TARGET = 4
};

struct Observation {
    size_t height = 0;
    size_t width  = 0;
    std::vector<uint8_t> cells;   // row-major [row * width + col]

    uint8_t at(int row, int col) const {
        return cells[static_cast<size_t>(row) * width + col];
    }
};

struct StepInfo {
    int      distance = 0;   // L1 distance agent → target
    Position agent;
    Position target;
};

struct ResetResult {
    Observation observation;
    StepInfo    info;
};

struct StepResult {
    Observation observation;
    double reward    = 0.0;
    bool  terminated = false;
    bool  truncated  = false;
    StepInfo info;
};

class Environment {
public:
    virtual ~Environment() = default;

    // --- Lifecycle ---
    /** 不换种子: 从当前随机状态继续 */
    virtual ResetResult reset() = 0;
    /** 用 seed 重新播种后开始新回合 (可复现) */
    virtual ResetResult reset_with_seed(uint32_t seed) = 0;

    // --- Motor ---
    /** action ∉ {0,1,2,3} 抛 InvalidActionError; 回合未运行抛 EpisodeStateError */
    virtual StepResult step(int action) = 0;

    // --- Snapshots ---
    virtual const Grid& grid() const = 0;
    virtual Position agent() const = 0;
    virtual Position target() const = 0;
    virtual size_t width() const = 0;
    virtual size_t height() const = 0;

    /** 文本表示 (调试) */
    virtual std::string to_string() const = 0;
};

} // namespace mazeworld
