/**
 * test_path_solver.cpp — PathSolver 测试
 *
 * 验证:
 * 1. 建图: 节点/边数
 * 2. 空地图最短路径长度 + 起点即终点
 * 3. 不可达 → std::nullopt (不是异常)
 * 4. 端点越界 → ConfigurationError; 位移无对应动作 → SolverConsistencyError
 * 5. 自定义动作表: 输出编号按该表解释
 * 6. Wilson 迷宫: 长度 = BFS 距离, 在 MazeEnv 中回放必定到达目标
 */

#include "maze/errors.h"
#include "maze/maze_generator.h"
#include "maze/path_solver.h"
#include "engine/maze_env.h"
#include "test_utils.h"

#include <cstdio>
#include <memory>

using namespace mazeworld;
using namespace test_maze;

static int g_pass = 0, g_fail = 0;

#define TEST_ASSERT(cond, msg) do { \
    if (!(cond)) { \
        printf("  [FAIL] %s (line %d)\n", msg, __LINE__); \
        g_fail++; return; \
    } \
} while(0)

static Grid open_room() {
    return Grid::from_rows({
        "#######",
        "#.....#",
        "#.....#",
        "#.....#",
        "#######",
    });
}

static Position walk(Position p, const ActionSequence& actions,
                     const std::vector<Direction>& motions) {
    for (int a : actions) p = p + motions[a];
    return p;
}

// =========================================================================
// Test 1: 建图
// =========================================================================
static void test_build_graph() {
    printf("\n--- Test 1: Graph construction ---\n");

    PathSolver solver;
    Grid g = Grid::from_rows({
        "#####",
        "#...#",
        "#...#",
        "#...#",
        "#####",
    });
    MazeGraph graph = solver.build_graph(g);
    TEST_ASSERT(graph.n_nodes == 25, "one node slot per cell");
    // 3x3 open block: 12 adjacent pairs, both directions
    TEST_ASSERT(graph.n_edges() == 24, "24 directed edges");

    size_t centre = g.index(2, 2);
    TEST_ASSERT(graph.offsets[centre + 1] - graph.offsets[centre] == 4, "centre has 4 moves");
    size_t corner = g.index(1, 1);
    TEST_ASSERT(graph.offsets[corner + 1] - graph.offsets[corner] == 2, "corner has 2 moves");
    size_t wall = g.index(0, 0);
    TEST_ASSERT(graph.offsets[wall + 1] == graph.offsets[wall], "walls have no edges");

    printf("  [PASS]\n"); g_pass++;
}

// =========================================================================
// Test 2: 空地图
// =========================================================================
static void test_open_room() {
    printf("\n--- Test 2: Open room ---\n");

    PathSolver solver;
    Grid g = open_room();

    auto actions = solver.solve(g, {1, 1}, {3, 5});
    TEST_ASSERT(actions.has_value(), "path exists");
    TEST_ASSERT(actions->size() == 6, "shortest = 2 down + 4 right");
    TEST_ASSERT(walk({1, 1}, *actions, solver.motions()) == (Position{3, 5}),
                "actions lead to goal");
    for (int a : *actions) {
        TEST_ASSERT(a == static_cast<int>(Action::RIGHT) || a == static_cast<int>(Action::DOWN),
                    "only right/down used");
    }

    auto none = solver.solve(g, {2, 3}, {2, 3});
    TEST_ASSERT(none.has_value() && none->empty(), "start == goal -> empty sequence");

    printf("  [PASS]\n"); g_pass++;
}

// =========================================================================
// Test 3: 不可达
// =========================================================================
static void test_unreachable() {
    printf("\n--- Test 3: Unreachable goal ---\n");

    PathSolver solver;
    Grid g = Grid::from_rows({
        "#######",
        "#..#..#",
        "#..#..#",
        "#..#..#",
        "#######",
    });
    TEST_ASSERT(!solver.solve(g, {1, 1}, {3, 5}).has_value(), "walled-off goal -> nullopt");
    TEST_ASSERT(solver.solve(g, {1, 1}, {3, 2}).has_value(), "same side still reachable");
    TEST_ASSERT(!solver.solve(g, {1, 1}, {2, 3}).has_value(), "goal on a wall -> nullopt");
    TEST_ASSERT(!solver.solve(g, {0, 0}, {1, 1}).has_value(), "start on a wall -> nullopt");

    printf("  [PASS]\n"); g_pass++;
}

// =========================================================================
// Test 4: 错误
// =========================================================================
static void test_errors() {
    printf("\n--- Test 4: Errors ---\n");

    PathSolver solver;
    Grid g = open_room();

    bool threw = false;
    try { (void)solver.solve(g, {1, 1}, {9, 9}); } catch (const ConfigurationError&) { threw = true; }
    TEST_ASSERT(threw, "goal outside grid rejected");

    threw = false;
    try { (void)solver.solve(g, {-1, 0}, {1, 1}); } catch (const ConfigurationError&) { threw = true; }
    TEST_ASSERT(threw, "start outside grid rejected");

    TEST_ASSERT(solver.action_between({2, 2}, {2, 3}) == static_cast<int>(Action::RIGHT),
                "(0,+1) -> right");
    TEST_ASSERT(solver.action_between({2, 2}, {1, 2}) == static_cast<int>(Action::UP),
                "(-1,0) -> up");

    threw = false;
    try { (void)solver.action_between({2, 2}, {3, 3}); } catch (const SolverConsistencyError&) { threw = true; }
    TEST_ASSERT(threw, "diagonal displacement has no action");

    printf("  [PASS]\n"); g_pass++;
}

// =========================================================================
// Test 5: 自定义动作表
// =========================================================================
static void test_custom_motions() {
    printf("\n--- Test 5: Custom motion table ---\n");

    // down, left, up, right
    std::vector<Direction> motions = {{1, 0}, {0, -1}, {-1, 0}, {0, 1}};
    PathSolver solver(motions);
    Grid g = open_room();

    auto actions = solver.solve(g, {3, 5}, {3, 1});
    TEST_ASSERT(actions.has_value() && actions->size() == 4, "4 moves left");
    for (int a : *actions) TEST_ASSERT(a == 1, "left is index 1 in this table");

    printf("  [PASS]\n"); g_pass++;
}

// =========================================================================
// Test 6: Wilson 迷宫 + 回放
// =========================================================================
static void test_wilson_mazes() {
    printf("\n--- Test 6: Generated mazes ---\n");

    PathSolver solver;
    const int sizes[] = {11, 15, 21};
    int total_actions = 0;

    for (int size : sizes) {
        for (uint32_t seed = 0; seed < 8; ++seed) {
            RandomMazeConfig mcfg;
            mcfg.width = size; mcfg.height = size;
            MazeEnvConfig cfg;
            cfg.width = size; cfg.height = size;
            MazeEnv env(cfg, std::make_unique<RandomMazeSource>(mcfg));
            ResetResult start = env.reset_with_seed(seed);

            auto actions = solver.solve(env.grid(), start.info.agent, start.info.target);
            TEST_ASSERT(actions.has_value(), "perfect maze always solvable");
            TEST_ASSERT((int)actions->size() ==
                        bfs_distance(env.grid(), start.info.agent, start.info.target),
                        "length equals graph distance");
            TEST_ASSERT((int)actions->size() >= start.info.distance,
                        "never shorter than L1 distance");

            StepResult last;
            for (size_t i = 0; i < actions->size(); ++i) {
                last = env.step((*actions)[i]);
                TEST_ASSERT(last.reward != MazeEnv::kCollisionPenalty, "oracle never bumps a wall");
                TEST_ASSERT(last.terminated == (i + 1 == actions->size()),
                            "terminates exactly on the last action");
            }
            TEST_ASSERT(env.agent() == env.target(), "agent ends on target");
            TEST_ASSERT(last.reward == MazeEnv::kGoalReward, "final reward +1");
            total_actions += static_cast<int>(actions->size());
        }
    }
    printf("  24 mazes solved, %d actions total\n", total_actions);

    // Same seed -> same maze -> same solution
    RandomMazeConfig mcfg;
    mcfg.width = 21; mcfg.height = 21;
    MazeEnvConfig cfg;
    cfg.width = 21; cfg.height = 21;
    MazeEnv a(cfg, std::make_unique<RandomMazeSource>(mcfg));
    MazeEnv b(cfg, std::make_unique<RandomMazeSource>(mcfg));
    a.reset_with_seed(99);
    b.reset_with_seed(99);
    TEST_ASSERT(solver.solve(a.grid(), a.agent(), a.target()) ==
                solver.solve(b.grid(), b.agent(), b.target()),
                "identical seed -> identical solution");

    printf("  [PASS]\n"); g_pass++;
}

int main() {
    init_test_console();
    printf("=== PathSolver Tests ===\n");

    test_build_graph();
    test_open_room();
    test_unreachable();
    test_errors();
    test_custom_motions();
    test_wilson_mazes();

    printf("\n=== Results: %d passed, %d failed ===\n", g_pass, g_fail);
    return g_fail > 0 ? 1 : 0;
}
