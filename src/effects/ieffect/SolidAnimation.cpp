/**
 * @file SolidAnimation.cpp
 * @brief Solid fill implementation
 */

#include "SolidAnimation.h"

#include <FastLED.h>
#include <algorithm>
#include <cstring>

namespace cosmicled {
namespace effects {
namespace ieffect {

namespace {

const plugins::AnimationParameter kParameters[] = {
    {"position", "Palette Position", 0.0f, 1.0f, 0.0f},
};

} // namespace

SolidAnimation::SolidAnimation()
    : m_position(kParameters[0].defaultValue)
{
}

bool SolidAnimation::init(plugins::RenderContext& ctx) {
    (void)ctx;
    return true;
}

CRGB SolidAnimation::colorFor(const plugins::RenderContext& ctx, float position) {
    float intensity = ctx.intensity;
    if (intensity < 0.0f) intensity = 0.0f;
    if (intensity > 1.0f) intensity = 1.0f;
    return ctx.paletteColor(position, static_cast<uint8_t>(intensity * 255.0f));
}

bool SolidAnimation::render(render::FrameBuffer& frame, const plugins::RenderContext& ctx) {
    std::fill(frame.begin(), frame.end(), colorFor(ctx, m_position));
    return true;
}

void SolidAnimation::cleanup() {
}

const plugins::AnimationMetadata& SolidAnimation::getMetadata() const {
    static plugins::AnimationMetadata meta{
        "solid",
        "Single palette colour",
        plugins::AnimationCategory::UTILITY,
        1
    };
    return meta;
}

uint8_t SolidAnimation::getParameterCount() const {
    return static_cast<uint8_t>(sizeof(kParameters) / sizeof(kParameters[0]));
}

const plugins::AnimationParameter* SolidAnimation::getParameter(uint8_t index) const {
    if (index >= getParameterCount()) return nullptr;
    return &kParameters[index];
}

bool SolidAnimation::setParameter(const char* name, float value) {
    if (!name) return false;
    if (std::strcmp(name, "position") == 0) { m_position = kParameters[0].constrain(value); return true; }
    return false;
}

float SolidAnimation::getParameter(const char* name) const {
    if (!name) return 0.0f;
    if (std::strcmp(name, "position") == 0) return m_position;
    return 0.0f;
}

} // namespace ieffect
} // namespace effects
} // namespace cosmicled
