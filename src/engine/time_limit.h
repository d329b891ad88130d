#pragma once
/**
 * TimeLimit — 回合步数上限包装
 *
 * 步数计数器归这里所有, 不在 MazeEnv 里:
 *   - reset() 清零计数
 *   - 每次 step() 计数 +1; 达到 max_episode_steps 且未终止 → truncated = true
 *   - 终止或截断之后再 step() 抛 EpisodeStateError, 须先 reset()
 *
 * 其余接口一行代理到被包装的环境。
 * 被包装环境的特有功能 (observe/previous_agent) 通过 env() 下转型访问。
 */

#include "engine/environment.h"
#include <cstdint>
#include <memory>

namespace mazeworld {

class TimeLimit : public Environment {
public:
    TimeLimit(std::unique_ptr<Environment> env, uint32_t max_episode_steps);

    // --- Environment interface ---
    ResetResult reset() override;
    ResetResult reset_with_seed(uint32_t seed) override;

    StepResult step(int action) override;

    const Grid& grid() const override;
    Position agent() const override;
    Position target() const override;
    size_t width() const override;
    size_t height() const override;

    std::string to_string() const override;

    // --- TimeLimit-specific ---
    uint32_t elapsed_steps() const { return elapsed_steps_; }
    uint32_t max_episode_steps() const { return max_episode_steps_; }

    Environment& env() { return *env_; }
    const Environment& env() const { return *env_; }

private:
    std::unique_ptr<Environment> env_;
    uint32_t max_episode_steps_;
    uint32_t elapsed_steps_ = 0;
    bool     done_ = false;
};

} // namespace mazeworld
