/**
 * @file CosmicAnimation.cpp
 * @brief Cosmic flow implementation
 */

#include "CosmicAnimation.h"

#include <FastLED.h>
#include <cmath>
#include <cstring>

namespace cosmicled {
namespace effects {
namespace ieffect {

namespace {

const plugins::AnimationParameter kParameters[] = {
    {"wave_speed", "Wave Speed", 0.01f, 0.5f, 0.05f},
    {"color_speed", "Color Speed", 0.001f, 0.1f, 0.02f},
    {"wave_scale", "Wave Scale", 0.1f, 1.0f, 0.3f},
};

} // namespace

CosmicAnimation::CosmicAnimation()
    : m_waveSpeed(kParameters[0].defaultValue)
    , m_colorSpeed(kParameters[1].defaultValue)
    , m_waveScale(kParameters[2].defaultValue)
{
}

bool CosmicAnimation::init(plugins::RenderContext& ctx) {
    (void)ctx;
    return true;
}

bool CosmicAnimation::render(render::FrameBuffer& frame, const plugins::RenderContext& ctx) {
    const float f = static_cast<float>(ctx.frameIndex);
    const float t = f * m_waveSpeed * ctx.speed;
    const float colorPhase = f * m_colorSpeed * ctx.speed;
    const uint8_t value = static_cast<uint8_t>(255.0f * ctx.intensity);

    for (uint16_t y = 0; y < ctx.height; y++) {
        const float waveY = cosf(t + y * m_waveScale) * 0.5f + 0.5f;
        for (uint16_t x = 0; x < ctx.width; x++) {
            const float waveX = sinf(t + x * m_waveScale) * 0.5f + 0.5f;
            const float combined = (waveX + waveY) * 0.5f;
            float hue = fmodf(combined + colorPhase, 1.0f);
            if (hue < 0.0f) hue += 1.0f;
            frame[ctx.xy(x, y)] = CHSV(static_cast<uint8_t>(hue * 255.0f), 255, value);
        }
    }
    return true;
}

void CosmicAnimation::cleanup() {
    // No resources to free
}

const plugins::AnimationMetadata& CosmicAnimation::getMetadata() const {
    static plugins::AnimationMetadata meta{
        "cosmic",
        "Flowing hue waves",
        plugins::AnimationCategory::AMBIENT,
        1
    };
    return meta;
}

uint8_t CosmicAnimation::getParameterCount() const {
    return static_cast<uint8_t>(sizeof(kParameters) / sizeof(kParameters[0]));
}

const plugins::AnimationParameter* CosmicAnimation::getParameter(uint8_t index) const {
    if (index >= getParameterCount()) return nullptr;
    return &kParameters[index];
}

bool CosmicAnimation::setParameter(const char* name, float value) {
    if (!name) return false;
    if (std::strcmp(name, "wave_speed") == 0) { m_waveSpeed = kParameters[0].constrain(value); return true; }
    if (std::strcmp(name, "color_speed") == 0) { m_colorSpeed = kParameters[1].constrain(value); return true; }
    if (std::strcmp(name, "wave_scale") == 0) { m_waveScale = kParameters[2].constrain(value); return true; }
    return false;
}

float CosmicAnimation::getParameter(const char* name) const {
    if (!name) return 0.0f;
    if (std::strcmp(name, "wave_speed") == 0) return m_waveSpeed;
    if (std::strcmp(name, "color_speed") == 0) return m_colorSpeed;
    if (std::strcmp(name, "wave_scale") == 0) return m_waveScale;
    return 0.0f;
}

} // namespace ieffect
} // namespace effects
} // namespace cosmicled
