/**
 * @file CosmicAnimation.h
 * @brief Cosmic flow - crossed sin/cos waves driving a rotating hue
 *
 * Default animation. Hue is taken straight from the colour wheel rather
 * than the palette.
 */

#pragma once

#include "../../plugins/api/IAnimation.h"

namespace cosmicled {
namespace effects {
namespace ieffect {

class CosmicAnimation : public plugins::IAnimation {
public:
    CosmicAnimation();
    ~CosmicAnimation() override = default;

    bool init(plugins::RenderContext& ctx) override;
    bool render(render::FrameBuffer& frame, const plugins::RenderContext& ctx) override;
    void cleanup() override;
    const plugins::AnimationMetadata& getMetadata() const override;

    uint8_t getParameterCount() const override;
    const plugins::AnimationParameter* getParameter(uint8_t index) const override;
    bool setParameter(const char* name, float value) override;
    float getParameter(const char* name) const override;

private:
    float m_waveSpeed;
    float m_colorSpeed;
    float m_waveScale;
};

} // namespace ieffect
} // namespace effects
} // namespace cosmicled
