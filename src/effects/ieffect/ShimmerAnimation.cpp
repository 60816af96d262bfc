/**
 * @file ShimmerAnimation.cpp
 * @brief Shimmer implementation
 */

#include "ShimmerAnimation.h"

#include <FastLED.h>
#include <cmath>

namespace cosmicled {
namespace effects {
namespace ieffect {

ShimmerAnimation::ShimmerAnimation()
    : m_seed(DEFAULT_SEED)
{
}

bool ShimmerAnimation::init(plugins::RenderContext& ctx) {
    (void)ctx;
    m_seed = DEFAULT_SEED;
    return true;
}

// Same LCG as FastLED's random16(), kept per instance
uint8_t ShimmerAnimation::nextRandom8() {
    m_seed = static_cast<uint16_t>(m_seed * 2053U + 13849U);
    return static_cast<uint8_t>((m_seed & 0xFF) + (m_seed >> 8));
}

bool ShimmerAnimation::render(render::FrameBuffer& frame, const plugins::RenderContext& ctx) {
    const CRGB base = ctx.paletteColor(0.5f);
    const float phase = static_cast<float>(ctx.frameIndex) * 0.05f * ctx.speed;
    const uint32_t count = ctx.pixelCount();

    for (uint32_t i = 0; i < count; i++) {
        const float sparkle = nextRandom8() / 255.0f;
        const float wave = (sinf(phase + i * 0.1f) + 1.0f) * 0.5f;
        float level = (sparkle * 0.7f + wave * 0.3f) * ctx.intensity;
        if (level > 1.0f) level = 1.0f;

        CRGB px = base;
        px.nscale8(static_cast<uint8_t>(level * 255.0f));
        frame[i] = px;
    }
    return true;
}

void ShimmerAnimation::cleanup() {
    // PRNG state is reset on the next init()
}

const plugins::AnimationMetadata& ShimmerAnimation::getMetadata() const {
    static plugins::AnimationMetadata meta{
        "shimmer",
        "Sparkling palette midpoint",
        plugins::AnimationCategory::SPARKLE,
        1
    };
    return meta;
}

} // namespace ieffect
} // namespace effects
} // namespace cosmicled
