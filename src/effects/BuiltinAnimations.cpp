/**
 * @file BuiltinAnimations.cpp
 * @brief Compiled-in animation registration
 */

#include "BuiltinAnimations.h"
#include "ieffect/CosmicAnimation.h"
#include "ieffect/WavesAnimation.h"
#include "ieffect/ShimmerAnimation.h"
#include "ieffect/SymmetryAnimation.h"
#include "ieffect/ParametricWavesAnimation.h"
#include "ieffect/SolidAnimation.h"
#include "ieffect/MatrixTestAnimation.h"

#include <memory>

#define CL_LOG_TAG "Builtins"
#include "../utils/Log.h"

namespace cosmicled {
namespace effects {

uint8_t registerBuiltinAnimations(plugins::AnimationRegistry& registry) {
    uint8_t registered = 0;

    if (registry.add(std::make_unique<ieffect::CosmicAnimation>())) registered++;
    if (registry.add(std::make_unique<ieffect::WavesAnimation>())) registered++;
    if (registry.add(std::make_unique<ieffect::ShimmerAnimation>())) registered++;
    if (registry.add(std::make_unique<ieffect::SymmetryAnimation>())) registered++;
    if (registry.add(std::make_unique<ieffect::ParametricWavesAnimation>())) registered++;
    if (registry.add(std::make_unique<ieffect::SolidAnimation>())) registered++;
    if (registry.add(std::make_unique<ieffect::MatrixTestAnimation>())) registered++;

    CL_LOGI("Registered %u built-in animations", registered);
    return registered;
}

} // namespace effects
} // namespace cosmicled
