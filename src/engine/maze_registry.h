#pragma once
/**
 * maze_registry — 预置迷宫环境
 *
 *   id                      尺寸       max_episode_steps
 *   RandomMaze-11x11-v0     11×11      200
 *   RandomMaze-15x15-v0     15×15      200
 *   RandomMaze-21x21-v0     21×21      400
 *   RandomMaze-31x31-v0     31×31      400
 *   RandomMaze-51x51-v0     51×51      500
 *   RandomMaze-101x101-v0   101×101    1000
 *
 * 全部使用 Wilson 完美迷宫, 起点 (1,1), 目标 (h-2, w-2)。
 * make_env() 返回 TimeLimit 包装后的 MazeEnv。
 */

#include "engine/maze_source.h"
#include "engine/time_limit.h"
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace mazeworld {

struct EnvSpec {
    std::string      id;
    RandomMazeConfig maze;
    uint32_t         max_episode_steps = 200;
};

const std::vector<EnvSpec>& registered_envs();

/** 未注册的 id 抛 UnknownEnvironmentError */
const EnvSpec& find_env_spec(const std::string& id);

std::unique_ptr<TimeLimit> make_env(const std::string& id);
std::unique_ptr<TimeLimit> make_env(const EnvSpec& spec);

} // namespace mazeworld
