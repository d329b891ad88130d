#include "engine/time_limit.h"
#include "maze/errors.h"
#include <utility>

namespace mazeworld {

TimeLimit::TimeLimit(std::unique_ptr<Environment> env, uint32_t max_episode_steps)
    : env_(std::move(env))
    , max_episode_steps_(max_episode_steps)
{
    if (!env_) {
        throw ConfigurationError("TimeLimit needs an environment to wrap");
    }
    if (max_episode_steps_ == 0) {
        throw ConfigurationError("max_episode_steps must be positive");
    }
}

// --- Lifecycle ---

ResetResult TimeLimit::reset() {
    done_ = true;
    ResetResult r = env_->reset();
    elapsed_steps_ = 0;
    done_ = false;
    return r;
}

ResetResult TimeLimit::reset_with_seed(uint32_t seed) {
    done_ = true;
    ResetResult r = env_->reset_with_seed(seed);
    elapsed_steps_ = 0;
    done_ = false;
    return r;
}

// --- Motor ---

StepResult TimeLimit::step(int action) {
    if (done_) {
        throw EpisodeStateError("episode is over (terminated or truncated), call reset()");
    }
    StepResult r = env_->step(action);
    elapsed_steps_++;
    if (elapsed_steps_ >= max_episode_steps_ && !r.terminated) {
        r.truncated = true;
    }
    done_ = r.terminated || r.truncated;
    return r;
}

// --- Snapshots ---

const Grid& TimeLimit::grid() const { return env_->grid(); }
Position TimeLimit::agent() const { return env_->agent(); }
Position TimeLimit::target() const { return env_->target(); }
size_t TimeLimit::width() const { return env_->width(); }
size_t TimeLimit::height() const { return env_->height(); }

std::string TimeLimit::to_string() const { return env_->to_string(); }

} // namespace mazeworld
