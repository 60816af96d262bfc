/**
 * @file BuiltinAnimations.h
 * @brief Loader for the compiled-in animation set
 */

#pragma once

#include "../plugins/AnimationRegistry.h"

namespace cosmicled {
namespace effects {

/// Name of the animation activated at startup
constexpr const char* DEFAULT_ANIMATION = "cosmic";

/**
 * @brief Register cosmic, waves, shimmer, symmetry, parametric_waves, solid
 * @return Number of animations registered
 */
uint8_t registerBuiltinAnimations(plugins::AnimationRegistry& registry);

} // namespace effects
} // namespace cosmicled
