#pragma once
/**
 * errors — MazeWorld 异常类型
 *
 * 所有错误都从 MazeError 派生, 调用方可以统一捕获:
 *   - ConfigurationError     : 尺寸/参数/端点非法 (构造或 reset 时)
 *   - ShapeMismatchError     : MazeSource 产出的网格尺寸与配置不符
 *   - InvalidActionError     : step() 收到 {0,1,2,3} 之外的动作
 *   - EpisodeStateError      : 非 RUNNING 状态下调用 step()
 *   - SolverConsistencyError : 求解器位移无法映射回动作 (内部不变量被破坏)
 *   - UnknownEnvironmentError: 注册表里没有该环境 id
 *
 * "目标不可达" 不是异常: solve_maze() 返回 std::nullopt。
 */

#include <stdexcept>
#include <string>

namespace mazeworld {

class MazeError : public std::runtime_error {
public:
    explicit MazeError(const std::string& what) : std::runtime_error(what) {}
};

class ConfigurationError : public MazeError {
public:
    explicit ConfigurationError(const std::string& what) : MazeError(what) {}
};

class ShapeMismatchError : public ConfigurationError {
public:
    explicit ShapeMismatchError(const std::string& what) : ConfigurationError(what) {}
};

class InvalidActionError : public MazeError {
public:
    explicit InvalidActionError(const std::string& what) : MazeError(what) {}
};

class EpisodeStateError : public MazeError {
public:
    explicit EpisodeStateError(const std::string& what) : MazeError(what) {}
};

class SolverConsistencyError : public MazeError {
public:
    explicit SolverConsistencyError(const std::string& what) : MazeError(what) {}
};

class UnknownEnvironmentError : public MazeError {
public:
    explicit UnknownEnvironmentError(const std::string& what) : MazeError(what) {}
};

} // namespace mazeworld
