/**
 * @file ParametricWavesAnimation.cpp
 * @brief Parametric waves implementation
 */

#include "ParametricWavesAnimation.h"

#include <FastLED.h>
#include <cmath>
#include <cstring>

namespace cosmicled {
namespace effects {
namespace ieffect {

namespace {

const plugins::AnimationParameter kParameters[] = {
    {"wave_count", "Wave Count", 1.0f, 8.0f, 3.0f, plugins::AnimationParameterType::INT},
    {"wave_amplitude", "Wave Amplitude", 0.1f, 3.0f, 1.0f},
    {"phase_shift", "Phase Shift", 0.0f, 2.0f, 0.5f},
    {"color_shift", "Color Shift", 0.1f, 5.0f, 1.0f},
    {"interference", "Interference", 0.0f, 1.0f, 0.3f},
};

constexpr float kPi = 3.14159265f;

} // namespace

ParametricWavesAnimation::ParametricWavesAnimation()
    : m_waveCount(static_cast<uint8_t>(kParameters[0].defaultValue))
    , m_waveAmplitude(kParameters[1].defaultValue)
    , m_phaseShift(kParameters[2].defaultValue)
    , m_colorShift(kParameters[3].defaultValue)
    , m_interference(kParameters[4].defaultValue)
{
}

bool ParametricWavesAnimation::init(plugins::RenderContext& ctx) {
    (void)ctx;
    return true;
}

bool ParametricWavesAnimation::render(render::FrameBuffer& frame, const plugins::RenderContext& ctx) {
    const float f = static_cast<float>(ctx.frameIndex);
    const float fs = f * ctx.speed;
    const float k = ctx.scale;
    const float hueOffset = sinf(f * 0.01f * m_colorShift) * 0.3f;
    const float norm = 2.0f + m_interference;
    const uint8_t level = static_cast<uint8_t>(255.0f * ctx.intensity);

    for (uint16_t y = 0; y < ctx.height; y++) {
        for (uint16_t x = 0; x < ctx.width; x++) {
            float waveSum = 0.0f;
            for (uint8_t w = 0; w < m_waveCount; w++) {
                const float freq = 0.2f + w * 0.1f;
                const float phase = w * m_phaseShift * kPi;
                const float h = sinf(x * freq * k + fs * 0.02f + phase);
                const float v = sinf(y * freq * k + fs * 0.03f + phase);
                const float d = sinf((x + y) * freq * 0.7f * k + fs * 0.025f + phase);
                waveSum += (h + v + d * m_interference) / norm * m_waveAmplitude;
            }
            const float combined = waveSum / m_waveCount;
            // paletteColor() clamps to [0, 1]
            frame[ctx.xy(x, y)] = ctx.paletteColor((combined + 1.0f) * 0.5f + hueOffset, level);
        }
    }
    return true;
}

void ParametricWavesAnimation::cleanup() {
}

const plugins::AnimationMetadata& ParametricWavesAnimation::getMetadata() const {
    static plugins::AnimationMetadata meta{
        "parametric_waves",
        "Tunable multi-wave interference",
        plugins::AnimationCategory::WAVE,
        1
    };
    return meta;
}

uint8_t ParametricWavesAnimation::getParameterCount() const {
    return static_cast<uint8_t>(sizeof(kParameters) / sizeof(kParameters[0]));
}

const plugins::AnimationParameter* ParametricWavesAnimation::getParameter(uint8_t index) const {
    if (index >= getParameterCount()) return nullptr;
    return &kParameters[index];
}

bool ParametricWavesAnimation::setParameter(const char* name, float value) {
    if (!name) return false;
    if (std::strcmp(name, "wave_count") == 0) {
        m_waveCount = static_cast<uint8_t>(kParameters[0].constrain(value));
        return true;
    }
    if (std::strcmp(name, "wave_amplitude") == 0) { m_waveAmplitude = kParameters[1].constrain(value); return true; }
    if (std::strcmp(name, "phase_shift") == 0) { m_phaseShift = kParameters[2].constrain(value); return true; }
    if (std::strcmp(name, "color_shift") == 0) { m_colorShift = kParameters[3].constrain(value); return true; }
    if (std::strcmp(name, "interference") == 0) { m_interference = kParameters[4].constrain(value); return true; }
    return false;
}

float ParametricWavesAnimation::getParameter(const char* name) const {
    if (!name) return 0.0f;
    if (std::strcmp(name, "wave_count") == 0) return static_cast<float>(m_waveCount);
    if (std::strcmp(name, "wave_amplitude") == 0) return m_waveAmplitude;
    if (std::strcmp(name, "phase_shift") == 0) return m_phaseShift;
    if (std::strcmp(name, "color_shift") == 0) return m_colorShift;
    if (std::strcmp(name, "interference") == 0) return m_interference;
    return 0.0f;
}

} // namespace ieffect
} // namespace effects
} // namespace cosmicled
