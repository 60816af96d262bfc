/**
 * @file SolidAnimation.h
 * @brief Solid fill from the palette
 *
 * Also the conductor's fallback colour source when no good frame exists yet.
 */

#pragma once

#include "../../plugins/api/IAnimation.h"

namespace cosmicled {
namespace effects {
namespace ieffect {

class SolidAnimation : public plugins::IAnimation {
public:
    SolidAnimation();
    ~SolidAnimation() override = default;

    bool init(plugins::RenderContext& ctx) override;
    bool render(render::FrameBuffer& frame, const plugins::RenderContext& ctx) override;
    void cleanup() override;
    const plugins::AnimationMetadata& getMetadata() const override;

    uint8_t getParameterCount() const override;
    const plugins::AnimationParameter* getParameter(uint8_t index) const override;
    bool setParameter(const char* name, float value) override;
    float getParameter(const char* name) const override;

    /**
     * @brief Colour used for a solid frame
     * @param position Palette position 0.0 - 1.0
     */
    static CRGB colorFor(const plugins::RenderContext& ctx, float position);

    /// Fallback colour: palette start at the context intensity
    static CRGB fallbackColor(const plugins::RenderContext& ctx) {
        return colorFor(ctx, 0.0f);
    }

private:
    float m_position;
};

} // namespace ieffect
} // namespace effects
} // namespace cosmicled
