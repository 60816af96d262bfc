/**
 * @file ParametricWavesAnimation.h
 * @brief Parametric waves - N horizontal/vertical/diagonal wave triples
 *
 * Each wave w has frequency 0.2 + 0.1w and phase w * phase_shift * pi.
 * The diagonal component is weighted by `interference`. A slow sinusoidal
 * palette drift is driven by `color_shift`.
 */

#pragma once

#include "../../plugins/api/IAnimation.h"

namespace cosmicled {
namespace effects {
namespace ieffect {

class ParametricWavesAnimation : public plugins::IAnimation {
public:
    ParametricWavesAnimation();
    ~ParametricWavesAnimation() override = default;

    bool init(plugins::RenderContext& ctx) override;
    bool render(render::FrameBuffer& frame, const plugins::RenderContext& ctx) override;
    void cleanup() override;
    const plugins::AnimationMetadata& getMetadata() const override;

    uint8_t getParameterCount() const override;
    const plugins::AnimationParameter* getParameter(uint8_t index) const override;
    bool setParameter(const char* name, float value) override;
    float getParameter(const char* name) const override;

private:
    uint8_t m_waveCount;
    float m_waveAmplitude;
    float m_phaseShift;
    float m_colorShift;
    float m_interference;
};

} // namespace ieffect
} // namespace effects
} // namespace cosmicled
