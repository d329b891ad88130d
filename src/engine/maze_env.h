#pragma once
/**
 * MazeEnv — 迷宫导航状态机
 *
 * 状态:
 *   IDLE ──reset()──→ RUNNING ──到达目标──→ TERMINATED
 *   reset() 在任意状态都合法; step() 只在 RUNNING 合法。
 *
 * step(action) 解析顺序:
 *   1. 候选位置 = agent + 动作位移
 *   2. 候选是墙 → 不动, 奖赏 -1 (碰撞惩罚)
 *   3. 否则移动 (记录上一位置); 到达目标 → +1 且终止, 否则 -0.01 (步成本)
 *   4. truncated 永远为 false (步数上限由 TimeLimit 负责)
 *
 * 迷宫来源通过构造时注入的 MazeSource 决定 (固定布局 / 随机生成)。
 * 每个实例持有自己的 std::mt19937, 实例之间不共享随机状态, 可以各自在不同线程运行。
 *
 * 使用方式:
 *   MazeEnv env(cfg, std::make_unique<RandomMazeSource>(maze_cfg));
 *   auto r = env.reset_with_seed(42);
 *   auto s = env.step(static_cast<int>(Action::RIGHT));
 */

#include "engine/environment.h"
#include "engine/maze_source.h"
#include "maze/action.h"
#include <array>
#include <memory>
#include <optional>
#include <random>

namespace mazeworld {

enum class EpisodeState : uint8_t {
    IDLE       = 0,
    RUNNING    = 1,
    TERMINATED = 2
};

struct MazeEnvConfig {
    int width  = 11;   // columns (odd)
    int height = 11;   // rows (odd)
};

class MazeEnv : public Environment {
public:
    static constexpr double kGoalReward       =  1.0;
    static constexpr double kStepCost         = -0.01;
    static constexpr double kCollisionPenalty = -1.0;

    /** width/height 非奇数抛 ConfigurationError */
    MazeEnv(const MazeEnvConfig& cfg, std::unique_ptr<MazeSource> source);

    // --- Environment interface ---
    ResetResult reset() override;
    ResetResult reset_with_seed(uint32_t seed) override;

    StepResult step(int action) override;

    const Grid& grid() const override { return grid_; }
    Position agent() const override { return agent_; }
    Position target() const override { return target_; }
    size_t width() const override { return static_cast<size_t>(cfg_.width); }
    size_t height() const override { return static_cast<size_t>(cfg_.height); }

    std::string to_string() const override;

    // --- MazeEnv-specific ---
    Observation observe() const;
    StepInfo info() const;

    /** 上一步移动前的位置; reset 后为空, 碰撞不更新 */
    const std::optional<Position>& previous_agent() const { return prev_agent_; }
    EpisodeState state() const { return state_; }

    /** 动作 → 位移 (固定表, 以动作编号为下标) */
    static const std::array<Direction, kNumActions>& action_to_direction() {
        return kActionToDirection;
    }

private:
    ResetResult begin_episode();

    MazeEnvConfig cfg_;
    std::unique_ptr<MazeSource> source_;
    std::mt19937 rng_;

    Grid grid_;
    Position agent_;
    Position target_;
    std::optional<Position> prev_agent_;
    EpisodeState state_ = EpisodeState::IDLE;
};

} // namespace mazeworld
