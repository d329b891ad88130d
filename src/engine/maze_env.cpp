#include "engine/maze_env.h"
#include "maze/errors.h"
#include <sstream>
#include <utility>

namespace mazeworld {

MazeEnv::MazeEnv(const MazeEnvConfig& cfg, std::unique_ptr<MazeSource> source)
    : cfg_(cfg)
    , source_(std::move(source))
    , rng_(std::random_device{}())
{
    validate_maze_shape(cfg_.height, cfg_.width);
    if (!source_) {
        throw ConfigurationError("MazeEnv needs a MazeSource");
    }
}

// =============================================================================
// Lifecycle
// =============================================================================

ResetResult MazeEnv::reset() {
    return begin_episode();
}

ResetResult MazeEnv::reset_with_seed(uint32_t seed) {
    rng_.seed(seed);
    return begin_episode();
}

ResetResult MazeEnv::begin_episode() {
    // 先结束旧 episode：produce() 或校验失败时不得残留 RUNNING 状态
    state_ = EpisodeState::IDLE;
    prev_agent_.reset();

    MazeLayout layout = source_->produce(rng_);

    if (layout.grid.height() != height() || layout.grid.width() != width()) {
        std::ostringstream ss;
        ss << "shape of generated maze doesn't match the configured maze:"
           << " generated " << layout.grid.height() << "x" << layout.grid.width()
           << ", configured height " << cfg_.height << " and width " << cfg_.width;
        throw ShapeMismatchError(ss.str());
    }
    if (!layout.grid.is_floor(layout.agent) || !layout.grid.is_floor(layout.target)) {
        std::ostringstream ss;
        ss << "agent " << mazeworld::to_string(layout.agent)
           << " and target " << mazeworld::to_string(layout.target)
           << " must be floor cells inside the maze";
        throw ConfigurationError(ss.str());
    }

    grid_   = std::move(layout.grid);
    agent_  = layout.agent;
    target_ = layout.target;
    state_ = EpisodeState::RUNNING;

    return ResetResult{observe(), info()};
}

// =============================================================================
// Motor
// =============================================================================

StepResult MazeEnv::step(int action) {
    if (!is_valid_action(action)) {
        std::ostringstream ss;
        ss << "invalid action " << action << ", expected 0.." << (kNumActions - 1);
        throw InvalidActionError(ss.str());
    }
    if (state_ != EpisodeState::RUNNING) {
        throw EpisodeStateError(state_ == EpisodeState::IDLE
            ? "step() called before reset()"
            : "step() called after the episode terminated, call reset()");
    }

    StepResult result;
    Position next = agent_ + kActionToDirection[action];

    if (grid_.is_wall(next)) {
        result.reward = kCollisionPenalty;
    } else {
        prev_agent_ = agent_;
        agent_ = next;
        if (agent_ == target_) {
            result.reward = kGoalReward;
            result.terminated = true;
            state_ = EpisodeState::TERMINATED;
        } else {
            result.reward = kStepCost;
        }
    }

    result.truncated   = false;
    result.observation = observe();
    result.info        = info();
    return result;
}

// =============================================================================
// Snapshots
// =============================================================================

Observation MazeEnv::observe() const {
    Observation obs;
    obs.height = grid_.height();
    obs.width  = grid_.width();
    obs.cells.resize(grid_.size());
    for (size_t i = 0; i < grid_.size(); ++i) {
        obs.cells[i] = static_cast<uint8_t>(grid_.cells()[i] == CellState::WALL
                                            ? ObjectId::WALL : ObjectId::EMPTY);
    }
    if (state_ == EpisodeState::IDLE) return obs;

    if (agent_ != target_) {
        obs.cells[grid_.index(agent_.row, agent_.col)]   = static_cast<uint8_t>(ObjectId::AGENT);
        obs.cells[grid_.index(target_.row, target_.col)] = static_cast<uint8_t>(ObjectId::TARGET);
    } else {
        obs.cells[grid_.index(agent_.row, agent_.col)] =
            static_cast<uint8_t>(ObjectId::AGENT_ON_TARGET);
    }
    return obs;
}

StepInfo MazeEnv::info() const {
    return StepInfo{manhattan_distance(agent_, target_), agent_, target_};
}

std::string MazeEnv::to_string() const {
    std::ostringstream ss;
    for (int r = 0; r < (int)grid_.height(); ++r) {
        for (int c = 0; c < (int)grid_.width(); ++c) {
            Position p{r, c};
            if (state_ != EpisodeState::IDLE && p == agent_) {
                ss << (agent_ == target_ ? '*' : 'A');
            } else if (state_ != EpisodeState::IDLE && p == target_) {
                ss << 'T';
            } else {
                ss << (grid_.is_wall(p) ? '#' : '.');
            }
        }
        ss << '\n';
    }
    return ss.str();
}

} // namespace mazeworld
