#pragma once
/**
 * batch_rollout — 批量 oracle 回合
 *
 * 每个种子一个独立回合:
 *   make_env(id) → reset_with_seed(seed) → PathSolver 求解 → 逐步回放
 *
 * 每个回合自己持有 MazeEnv 与 RNG, 回合之间无共享状态,
 * 定义 MAZEWORLD_OPENMP 时用 OpenMP 并行 (schedule(dynamic))。
 * 结果顺序与 seeds 一致, 与线程数无关。
 */

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace mazeworld {

struct RolloutResult {
    uint32_t seed           = 0;
    bool     solved         = false;   // solver found a path
    bool     reached_target = false;   // replay ended with agent on target
    bool     truncated      = false;
    size_t   n_actions      = 0;       // steps actually taken
    size_t   shortest_path  = 0;       // solver path length
    double   episode_return = 0.0;
    std::string error;                 // exception message, empty on success
};

struct RolloutSummary {
    size_t n_episodes      = 0;
    size_t n_reached       = 0;
    size_t n_errors        = 0;
    float  mean_path       = 0.0f;
    double mean_return     = 0.0;

    float success_rate() const {
        return n_episodes ? static_cast<float>(n_reached) / n_episodes : 0.0f;
    }
};

std::vector<RolloutResult> run_oracle_rollouts(const std::string& env_id,
                                               const std::vector<uint32_t>& seeds);

/**
 * 通用批量执行: 对每个种子调用 episode(seed)
 * episode 抛出的异常不会离开并行区, 记录在对应结果的 error 中
 */
std::vector<RolloutResult> run_rollouts(const std::vector<uint32_t>& seeds,
                                        const std::function<RolloutResult(uint32_t)>& episode);

/** 并行回合可用的线程数 (未启用 OpenMP 时为 1) */
int rollout_thread_count();

RolloutSummary summarize(const std::vector<RolloutResult>& results);

} // namespace mazeworld
