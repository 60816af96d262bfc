/**
 * @file WavesAnimation.cpp
 * @brief Waves implementation
 */

#include "WavesAnimation.h"

#include <FastLED.h>
#include <cmath>

namespace cosmicled {
namespace effects {
namespace ieffect {

bool WavesAnimation::init(plugins::RenderContext& ctx) {
    (void)ctx;
    return true;
}

bool WavesAnimation::render(render::FrameBuffer& frame, const plugins::RenderContext& ctx) {
    const float f = static_cast<float>(ctx.frameIndex) * ctx.speed;
    const float k = ctx.scale;
    const uint8_t level = static_cast<uint8_t>(255.0f * ctx.intensity);

    for (uint16_t y = 0; y < ctx.height; y++) {
        const float wave2 = sinf(y * 0.3f * k + f * 0.04f);
        for (uint16_t x = 0; x < ctx.width; x++) {
            const float wave1 = sinf(x * 0.3f * k + f * 0.03f);
            const float wave3 = sinf((x + y) * 0.2f * k + f * 0.02f);
            const float combined = (wave1 + wave2 + wave3) / 3.0f;
            frame[ctx.xy(x, y)] = ctx.paletteColor((combined + 1.0f) * 0.5f, level);
        }
    }
    return true;
}

void WavesAnimation::cleanup() {
}

const plugins::AnimationMetadata& WavesAnimation::getMetadata() const {
    static plugins::AnimationMetadata meta{
        "waves",
        "Interfering sine waves",
        plugins::AnimationCategory::WAVE,
        1
    };
    return meta;
}

} // namespace ieffect
} // namespace effects
} // namespace cosmicled
