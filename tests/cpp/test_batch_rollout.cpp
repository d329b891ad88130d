/**
 * test_batch_rollout.cpp — 批量 oracle 回合测试
 *
 * 验证:
 * 1. 所有种子都被求解并到达目标, 回报 = 1 - 0.01 × (步数 - 1)
 * 2. 结果顺序与种子一致, 两次运行完全相同 (与线程调度无关)
 * 3. 未知环境 id 报错; summarize() 统计
 * 4. 回合内抛出的任何 std::exception 都记录为该回合的错误
 */

#include "engine/batch_rollout.h"
#include "maze/errors.h"
#include "test_utils.h"

#include <cmath>
#include <cstdio>
#include <numeric>
#include <new>
#include <stdexcept>
#include <vector>

using namespace mazeworld;

static int g_pass = 0, g_fail = 0;

#define TEST_ASSERT(cond, msg) do { \
    if (!(cond)) { \
        printf("  [FAIL] %s (line %d)\n", msg, __LINE__); \
        g_fail++; return; \
    } \
} while(0)

// =========================================================================
// Test 1: 全部求解
// =========================================================================
static void test_all_solved() {
    printf("\n--- Test 1: Oracle solves every seed ---\n");

    std::vector<uint32_t> seeds(24);
    std::iota(seeds.begin(), seeds.end(), 100u);
    auto results = run_oracle_rollouts("RandomMaze-15x15-v0", seeds);

    TEST_ASSERT(results.size() == seeds.size(), "one result per seed");
    for (size_t i = 0; i < results.size(); ++i) {
        const auto& r = results[i];
        TEST_ASSERT(r.error.empty(), "no errors");
        TEST_ASSERT(r.seed == seeds[i], "results in seed order");
        TEST_ASSERT(r.solved && r.reached_target, "target reached");
        TEST_ASSERT(!r.truncated, "well within the step limit");
        TEST_ASSERT(r.n_actions == r.shortest_path, "every solver action was taken");
        double expected = 1.0 - 0.01 * static_cast<double>(r.n_actions - 1);
        TEST_ASSERT(std::fabs(r.episode_return - expected) < 1e-9, "return = goal + step costs");
    }
    printf("  threads available: %d\n", rollout_thread_count());

    printf("  [PASS]\n"); g_pass++;
}

// =========================================================================
// Test 2: 可复现
// =========================================================================
static void test_reproducible() {
    printf("\n--- Test 2: Reproducible batches ---\n");

    std::vector<uint32_t> seeds = {5, 1, 9, 5, 42, 0, 17};
    auto a = run_oracle_rollouts("RandomMaze-21x21-v0", seeds);
    auto b = run_oracle_rollouts("RandomMaze-21x21-v0", seeds);
    TEST_ASSERT(a.size() == b.size(), "same size");
    for (size_t i = 0; i < a.size(); ++i) {
        TEST_ASSERT(a[i].seed == b[i].seed, "same seed order");
        TEST_ASSERT(a[i].shortest_path == b[i].shortest_path, "same path length");
    }
    TEST_ASSERT(a[0].shortest_path == a[3].shortest_path, "repeated seed, same maze");

    printf("  [PASS]\n"); g_pass++;
}

// =========================================================================
// Test 3: 错误与统计
// =========================================================================
static void test_errors_and_summary() {
    printf("\n--- Test 3: Errors + summary ---\n");

    bool threw = false;
    try { run_oracle_rollouts("NoSuchMaze-v0", {1, 2}); }
    catch (const UnknownEnvironmentError&) { threw = true; }
    TEST_ASSERT(threw, "unknown env rejected before any episode runs");

    TEST_ASSERT(run_oracle_rollouts("RandomMaze-11x11-v0", {}).empty(), "no seeds, no results");

    std::vector<RolloutResult> results(4);
    for (size_t i = 0; i < results.size(); ++i) {
        results[i].seed = static_cast<uint32_t>(i);
        results[i].solved = true;
        results[i].reached_target = (i != 2);
        results[i].shortest_path = 10 * (i + 1);
        results[i].episode_return = 1.0;
    }
    results[3].error = "boom";

    RolloutSummary s = summarize(results);
    TEST_ASSERT(s.n_episodes == 4, "4 episodes");
    TEST_ASSERT(s.n_errors == 1, "1 error");
    TEST_ASSERT(s.n_reached == 2, "errors are not counted as reached");
    TEST_ASSERT(std::fabs(s.mean_path - 20.0f) < 1e-4f, "mean over non-error episodes");
    TEST_ASSERT(std::fabs(s.success_rate() - 0.5f) < 1e-4f, "success rate");

    printf("  [PASS]\n"); g_pass++;
}

// =========================================================================
// Test 4: 回合内异常
// =========================================================================
static void test_episode_exceptions() {
    printf("\n--- Test 4: Exceptions inside episodes ---\n");

    std::vector<uint32_t> seeds(12);
    std::iota(seeds.begin(), seeds.end(), 0u);
    auto results = run_rollouts(seeds, [](uint32_t seed) {
        if (seed % 3 == 1) throw std::bad_alloc();
        if (seed % 3 == 2) throw ConfigurationError("bad layout");
        RolloutResult r;
        r.seed = seed;
        r.solved = r.reached_target = true;
        return r;
    });

    TEST_ASSERT(results.size() == seeds.size(), "one result per seed");
    for (size_t i = 0; i < results.size(); ++i) {
        const auto& r = results[i];
        TEST_ASSERT(r.seed == seeds[i], "seed recorded even on error");
        if (i % 3 == 0) {
            TEST_ASSERT(r.error.empty() && r.reached_target, "normal episode kept");
        } else if (i % 3 == 1) {
            TEST_ASSERT(r.error.find("internal error") == 0, "bad_alloc recorded");
        } else {
            TEST_ASSERT(r.error == "bad layout", "MazeError message recorded");
        }
    }
    TEST_ASSERT(summarize(results).n_errors == 8, "8 failed episodes");

    printf("  [PASS]\n"); g_pass++;
}

int main() {
    init_test_console();
    printf("=== Batch Rollout Tests ===\n");

    test_all_solved();
    test_reproducible();
    test_errors_and_summary();
    test_episode_exceptions();

    printf("\n=== Results: %d passed, %d failed ===\n", g_pass, g_fail);
    return g_fail > 0 ? 1 : 0;
}
