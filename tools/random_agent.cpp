/**
 * random_agent — 随机策略跑一个回合
 *
 * Usage: random_agent [env_id] [seed]
 *   defaults: RandomMaze-11x11-v0, seed 1
 *
 * 均匀随机动作直到终止或截断, 输出回合得分与最终迷宫。
 */

#include "engine/maze_env.h"
#include "engine/maze_registry.h"
#include "maze/action.h"
#include "maze/errors.h"
#include <cstdio>
#include <cstdlib>
#include <random>
#include <string>

#ifdef _WIN32
#include <windows.h>
#endif

int main(int argc, char* argv[]) {
#ifdef _WIN32
    SetConsoleOutputCP(65001);
#endif
    using namespace mazeworld;

    std::string env_id = "RandomMaze-11x11-v0";
    uint32_t seed = 1;
    if (argc >= 2) env_id = argv[1];
    if (argc >= 3) seed = static_cast<uint32_t>(std::atoi(argv[2]));

    try {
        auto env = make_env(env_id);
        ResetResult start = env->reset_with_seed(seed);

        printf("=== Random agent: %s (seed=%u) ===\n", env_id.c_str(), seed);
        printf("  agent=%s target=%s distance=%d\n\n",
               to_string(start.info.agent).c_str(),
               to_string(start.info.target).c_str(),
               start.info.distance);

        std::mt19937 policy_rng(seed);
        std::uniform_int_distribution<int> pick(0, kNumActions - 1);

        double score = 0.0;
        int collisions = 0;
        bool terminated = false, truncated = false;
        while (!(terminated || truncated)) {
            StepResult r = env->step(pick(policy_rng));
            score += r.reward;
            if (r.reward == MazeEnv::kCollisionPenalty) collisions++;
            terminated = r.terminated;
            truncated  = r.truncated;
        }

        printf("%s\n", env->to_string().c_str());
        printf("  steps=%u collisions=%d score=%.2f %s\n",
               env->elapsed_steps(), collisions, score,
               terminated ? "(reached target)" : "(truncated)");
    } catch (const MazeError& e) {
        fprintf(stderr, "Error: %s\n", e.what());
        return 1;
    }
    return 0;
}
