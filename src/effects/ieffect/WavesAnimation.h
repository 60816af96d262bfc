/**
 * @file WavesAnimation.h
 * @brief Waves - three summed sine fields through the palette
 */

#pragma once

#include "../../plugins/api/IAnimation.h"

namespace cosmicled {
namespace effects {
namespace ieffect {

class WavesAnimation : public plugins::IAnimation {
public:
    WavesAnimation() = default;
    ~WavesAnimation() override = default;

    bool init(plugins::RenderContext& ctx) override;
    bool render(render::FrameBuffer& frame, const plugins::RenderContext& ctx) override;
    void cleanup() override;
    const plugins::AnimationMetadata& getMetadata() const override;
};

} // namespace ieffect
} // namespace effects
} // namespace cosmicled
