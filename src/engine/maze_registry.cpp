#include "engine/maze_registry.h"
#include "engine/maze_env.h"
#include "maze/errors.h"

namespace mazeworld {

namespace {

EnvSpec random_maze_spec(int size, uint32_t max_steps) {
    EnvSpec spec;
    spec.id = "RandomMaze-" + std::to_string(size) + "x" + std::to_string(size) + "-v0";
    spec.maze.width  = size;
    spec.maze.height = size;
    spec.maze.algorithm = MazeAlgorithm::WILSON;
    spec.max_episode_steps = max_steps;
    return spec;
}

} // namespace

const std::vector<EnvSpec>& registered_envs() {
    static const std::vector<EnvSpec> specs = {
        random_maze_spec(11,  200),
        random_maze_spec(15,  200),
        random_maze_spec(21,  400),
        random_maze_spec(31,  400),
        random_maze_spec(51,  500),
        random_maze_spec(101, 1000),
    };
    return specs;
}

const EnvSpec& find_env_spec(const std::string& id) {
    for (const auto& spec : registered_envs()) {
        if (spec.id == id) return spec;
    }
    throw UnknownEnvironmentError("no registered environment named '" + id + "'");
}

std::unique_ptr<TimeLimit> make_env(const std::string& id) {
    return make_env(find_env_spec(id));
}

std::unique_ptr<TimeLimit> make_env(const EnvSpec& spec) {
    MazeEnvConfig cfg;
    cfg.width  = spec.maze.width;
    cfg.height = spec.maze.height;
    auto env = std::make_unique<MazeEnv>(cfg, std::make_unique<RandomMazeSource>(spec.maze));
    return std::make_unique<TimeLimit>(std::move(env), spec.max_episode_steps);
}

} // namespace mazeworld
