#include "engine/maze_source.h"
#include "maze/errors.h"
#include "maze/maze_generator.h"
#include <sstream>
#include <utility>

namespace mazeworld {

void validate_maze_shape(int height, int width) {
    if (height < 3 || width < 3 || height % 2 == 0 || width % 2 == 0) {
        std::ostringstream ss;
        ss << "width/height of maze should be odd and >= 3, got "
           << width << "x" << height;
        throw ConfigurationError(ss.str());
    }
}

// =============================================================================
// FixedMazeSource
// =============================================================================

FixedMazeSource::FixedMazeSource(Grid grid, Position agent, Position target)
    : layout_{std::move(grid), agent, target}
{}

MazeLayout FixedMazeSource::produce(std::mt19937& /*rng*/) {
    return layout_;
}

// =============================================================================
// RandomMazeSource
// =============================================================================

RandomMazeSource::RandomMazeSource(const RandomMazeConfig& cfg)
    : cfg_(cfg)
{
    validate_maze_shape(cfg_.height, cfg_.width);
    if (cfg_.algorithm == MazeAlgorithm::DENSITY) {
        if (!(cfg_.complexity >= 0.0f && cfg_.complexity <= 1.0f) ||
            !(cfg_.density >= 0.0f && cfg_.density <= 1.0f)) {
            std::ostringstream ss;
            ss << "maze complexity/density must be in [0, 1], got "
               << cfg_.complexity << "/" << cfg_.density;
            throw ConfigurationError(ss.str());
        }
    }
}

MazeLayout RandomMazeSource::produce(std::mt19937& rng) {
    MazeLayout layout;
    switch (cfg_.algorithm) {
        case MazeAlgorithm::WILSON: {
            // Interior lattice at even coords → odd coords once framed
            WilsonMazeGenerator gen;
            layout.grid = add_border(gen.generate(cfg_.height - 2, cfg_.width - 2, rng));
            break;
        }
        case MazeAlgorithm::DENSITY: {
            DensityMazeGenerator gen;
            layout.grid = gen.generate(cfg_.height, cfg_.width,
                                       cfg_.complexity, cfg_.density, rng);
            break;
        }
    }
    layout.agent  = Position{1, 1};
    layout.target = Position{static_cast<int>(layout.grid.height()) - 2,
                             static_cast<int>(layout.grid.width()) - 2};
    return layout;
}

// =============================================================================
// CallbackMazeSource
// =============================================================================

CallbackMazeSource::CallbackMazeSource(Callback fn)
    : fn_(std::move(fn))
{
    if (!fn_) {
        throw ConfigurationError("CallbackMazeSource needs a callable");
    }
}

} // namespace mazeworld
