#include "engine/batch_rollout.h"
#include "engine/maze_registry.h"
#include "maze/errors.h"
#include "maze/path_solver.h"
#include <exception>

#ifdef MAZEWORLD_OPENMP
#include <omp.h>
#endif

namespace mazeworld {

namespace {

RolloutResult run_one(const EnvSpec& spec, uint32_t seed) {
    RolloutResult res;
    res.seed = seed;

    auto env = make_env(spec);
    ResetResult start = env->reset_with_seed(seed);

    PathSolver solver;
    auto actions = solver.solve(env->grid(), start.info.agent, start.info.target);
    if (!actions) return res;

    res.solved = true;
    res.shortest_path = actions->size();
    for (int a : *actions) {
        StepResult r = env->step(a);
        res.n_actions++;
        res.episode_return += r.reward;
        if (r.terminated || r.truncated) {
            res.truncated = r.truncated;
            break;
        }
    }
    res.reached_target = (env->agent() == env->target());
    return res;
}

} // namespace

std::vector<RolloutResult> run_oracle_rollouts(const std::string& env_id,
                                               const std::vector<uint32_t>& seeds) {
    const EnvSpec& spec = find_env_spec(env_id);
    return run_rollouts(seeds, [&spec](uint32_t seed) { return run_one(spec, seed); });
}

std::vector<RolloutResult> run_rollouts(const std::vector<uint32_t>& seeds,
                                        const std::function<RolloutResult(uint32_t)>& episode) {
    std::vector<RolloutResult> results(seeds.size());

    int n = static_cast<int>(seeds.size());
#ifdef MAZEWORLD_OPENMP
    #pragma omp parallel for schedule(dynamic)
#endif
    for (int i = 0; i < n; ++i) {
        // Exceptions must not cross the OpenMP region; record them per episode.
        try {
            results[i] = episode(seeds[i]);
        } catch (const MazeError& e) {
            results[i].seed  = seeds[i];
            results[i].error = e.what();
        } catch (const std::exception& e) {
            results[i].seed  = seeds[i];
            results[i].error = std::string("internal error: ") + e.what();
        }
    }
    return results;
}

int rollout_thread_count() {
#ifdef MAZEWORLD_OPENMP
    return omp_get_max_threads();
#else
    return 1;
#endif
}

RolloutSummary summarize(const std::vector<RolloutResult>& results) {
    RolloutSummary s;
    s.n_episodes = results.size();
    size_t n_ok = 0;
    for (const auto& r : results) {
        if (!r.error.empty()) { s.n_errors++; continue; }
        if (r.reached_target) s.n_reached++;
        s.mean_path   += static_cast<float>(r.shortest_path);
        s.mean_return += r.episode_return;
        n_ok++;
    }
    if (n_ok > 0) {
        s.mean_path   /= static_cast<float>(n_ok);
        s.mean_return /= static_cast<double>(n_ok);
    }
    return s;
}

} // namespace mazeworld
