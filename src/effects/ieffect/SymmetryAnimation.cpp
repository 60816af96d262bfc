/**
 * @file SymmetryAnimation.cpp
 * @brief Symmetry implementation
 */

#include "SymmetryAnimation.h"

#include <FastLED.h>
#include <cmath>

namespace cosmicled {
namespace effects {
namespace ieffect {

bool SymmetryAnimation::init(plugins::RenderContext& ctx) {
    (void)ctx;
    return true;
}

bool SymmetryAnimation::render(render::FrameBuffer& frame, const plugins::RenderContext& ctx) {
    // Distances are measured to pixel centres so even sizes mirror exactly
    const float centerX = ctx.width * 0.5f;
    const float centerY = ctx.height * 0.5f;
    const float phase = static_cast<float>(ctx.frameIndex) * 0.05f * ctx.speed;
    const uint8_t level = static_cast<uint8_t>(255.0f * ctx.intensity);

    for (uint16_t y = 0; y < ctx.height; y++) {
        const float dy = fabsf(y - centerY + 0.5f);
        for (uint16_t x = 0; x < ctx.width; x++) {
            const float dx = fabsf(x - centerX + 0.5f);
            const float distance = sqrtf(dx * dx + dy * dy);
            const float wave = sinf(distance * ctx.scale - phase);
            frame[ctx.xy(x, y)] = ctx.paletteColor((wave + 1.0f) * 0.5f, level);
        }
    }
    return true;
}

void SymmetryAnimation::cleanup() {
}

const plugins::AnimationMetadata& SymmetryAnimation::getMetadata() const {
    static plugins::AnimationMetadata meta{
        "symmetry",
        "Mirrored radial rings",
        plugins::AnimationCategory::GEOMETRIC,
        1
    };
    return meta;
}

} // namespace ieffect
} // namespace effects
} // namespace cosmicled
