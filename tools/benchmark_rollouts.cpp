/**
 * benchmark_rollouts — 批量 oracle 回合基准
 *
 * Usage: benchmark_rollouts [env_id] [episodes]
 *   defaults: RandomMaze-21x21-v0, 64 episodes (seeds 0..episodes-1)
 *
 * 每个回合独立持有环境与 RNG; 用 MAZEWORLD_OPENMP 构建时并行运行。
 */

#include "engine/batch_rollout.h"
#include "maze/errors.h"
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <numeric>
#include <string>
#include <vector>

#ifdef _WIN32
#include <windows.h>
#endif

int main(int argc, char* argv[]) {
#ifdef _WIN32
    SetConsoleOutputCP(65001);
#endif
    using namespace mazeworld;
    using Clock = std::chrono::steady_clock;

    std::string env_id = "RandomMaze-21x21-v0";
    size_t n_episodes = 64;
    if (argc >= 2) env_id = argv[1];
    if (argc >= 3) n_episodes = static_cast<size_t>(std::atoi(argv[2]));

    std::vector<uint32_t> seeds(n_episodes);
    std::iota(seeds.begin(), seeds.end(), 0u);

    printf("=== Oracle rollouts: %s, %zu episodes, %d threads ===\n\n",
           env_id.c_str(), n_episodes, rollout_thread_count());

    std::vector<RolloutResult> results;
    auto t0 = Clock::now();
    try {
        results = run_oracle_rollouts(env_id, seeds);
    } catch (const MazeError& e) {
        fprintf(stderr, "Error: %s\n", e.what());
        return 1;
    }
    double secs = std::chrono::duration<double>(Clock::now() - t0).count();

    for (const auto& r : results) {
        if (!r.error.empty()) {
            printf("  seed=%4u | error: %s\n", r.seed, r.error.c_str());
        } else if (!r.reached_target) {
            printf("  seed=%4u | path=%4zu steps=%4zu %s\n", r.seed, r.shortest_path,
                   r.n_actions, r.truncated ? "TRUNCATED" : "UNSOLVED");
        }
    }

    RolloutSummary s = summarize(results);
    printf("  success: %zu/%zu (%.1f%%)  errors: %zu\n", s.n_reached, s.n_episodes,
           s.success_rate() * 100.0f, s.n_errors);
    printf("  mean path: %.1f actions  mean return: %.3f\n", s.mean_path, s.mean_return);
    printf("  wall time: %.3fs (%.2f ms/episode)\n", secs,
           n_episodes ? secs * 1000.0 / n_episodes : 0.0);

    return s.n_reached == s.n_episodes ? 0 : 1;
}
