/**
 * solve_maze — 生成迷宫并用 PathSolver 求最短动作序列
 *
 * Usage: solve_maze [size] [seed] [--density]
 *   defaults: 21, seed 0, Wilson generator
 *
 * 输出: 迷宫, 动作序列, 以及在 MazeEnv 中回放的结果。
 */

#include "engine/maze_env.h"
#include "maze/errors.h"
#include "maze/path_solver.h"
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <string>

#ifdef _WIN32
#include <windows.h>
#endif

int main(int argc, char* argv[]) {
#ifdef _WIN32
    SetConsoleOutputCP(65001);
#endif
    using namespace mazeworld;

    int size = 21;
    uint32_t seed = 0;
    bool density = false;
    int positional = 0;
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--density") == 0) {
            density = true;
        } else if (positional == 0) {
            size = std::atoi(argv[i]);
            positional++;
        } else if (positional == 1) {
            seed = static_cast<uint32_t>(std::atoi(argv[i]));
            positional++;
        }
    }

    try {
        RandomMazeConfig mcfg;
        mcfg.width = size;
        mcfg.height = size;
        mcfg.algorithm = density ? MazeAlgorithm::DENSITY : MazeAlgorithm::WILSON;

        MazeEnvConfig cfg;
        cfg.width = size;
        cfg.height = size;
        MazeEnv env(cfg, std::make_unique<RandomMazeSource>(mcfg));
        ResetResult start = env.reset_with_seed(seed);

        printf("=== %dx%d %s maze (seed=%u) ===\n\n", size, size,
               density ? "density" : "Wilson", seed);
        printf("%s\n", env.to_string().c_str());

        PathSolver solver;
        auto actions = solver.solve(env.grid(), start.info.agent, start.info.target);
        if (!actions) {
            printf("  target %s unreachable from %s\n",
                   to_string(start.info.target).c_str(),
                   to_string(start.info.agent).c_str());
            return 2;
        }

        std::string moves;
        for (int a : *actions) moves += action_name(a)[0];
        printf("  shortest path: %zu actions (L1 distance %d)\n", actions->size(),
               start.info.distance);
        printf("  %s\n\n", moves.c_str());

        double score = 0.0;
        bool terminated = false;
        for (int a : *actions) {
            StepResult r = env.step(a);
            score += r.reward;
            terminated = r.terminated;
        }
        printf("%s\n", env.to_string().c_str());
        printf("  replay: terminated=%s score=%.2f\n", terminated ? "yes" : "no", score);
    } catch (const MazeError& e) {
        fprintf(stderr, "Error: %s\n", e.what());
        return 1;
    }
    return 0;
}
