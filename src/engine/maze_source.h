#pragma once
/**
 * MazeSource — 迷宫产出策略 (组合代替继承)
 *
 * MazeEnv 在每次 reset() 时调用 produce(rng), 得到 (网格, 起点, 目标)。
 * MazeEnv 不关心迷宫从哪来, 只校验尺寸与配置一致。
 *
 * 实现:
 *   - FixedMazeSource    : 手写固定布局, 每回合相同
 *   - RandomMazeSource   : Wilson 完美迷宫 (默认) 或旧版密度生成器
 *                          起点 (1, 1), 目标 (height-2, width-2)
 *   - CallbackMazeSource : 任意可调用对象
 *
 * RNG 由 MazeEnv 持有并按引用传入, MazeSource 不保存随机状态。
 */

#include "maze/grid.h"
#include <cstdint>
#include <functional>
#include <random>

namespace mazeworld {

struct MazeLayout {
    Grid     grid;
    Position agent;
    Position target;
};

/** width/height 须为奇数且 ≥ 3, 否则抛 ConfigurationError */
void validate_maze_shape(int height, int width);

class MazeSource {
public:
    virtual ~MazeSource() = default;
    virtual MazeLayout produce(std::mt19937& rng) = 0;
};

class FixedMazeSource : public MazeSource {
public:
    FixedMazeSource(Grid grid, Position agent, Position target);

    MazeLayout produce(std::mt19937& rng) override;

private:
    MazeLayout layout_;
};

enum class MazeAlgorithm : uint8_t {
    WILSON  = 0,   // perfect maze (uniform spanning tree)
    DENSITY = 1,   // legacy wall-growing generator, cycles possible
};

struct RandomMazeConfig {
    int width  = 11;     // columns, including the outer wall
    int height = 11;     // rows, including the outer wall
    MazeAlgorithm algorithm = MazeAlgorithm::WILSON;

    // DENSITY only
    float complexity = 0.75f;
    float density    = 0.75f;
};

class RandomMazeSource : public MazeSource {
public:
    explicit RandomMazeSource(const RandomMazeConfig& cfg = {});

    MazeLayout produce(std::mt19937& rng) override;

    const RandomMazeConfig& config() const { return cfg_; }

private:
    RandomMazeConfig cfg_;
};

class CallbackMazeSource : public MazeSource {
public:
    using Callback = std::function<MazeLayout(std::mt19937&)>;

    explicit CallbackMazeSource(Callback fn);

    MazeLayout produce(std::mt19937& rng) override { return fn_(rng); }

private:
    Callback fn_;
};

} // namespace mazeworld
