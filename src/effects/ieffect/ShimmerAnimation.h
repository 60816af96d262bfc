/**
 * @file ShimmerAnimation.h
 * @brief Shimmer - random sparkle over a slow wave on the palette midpoint
 *
 * Stateful: owns its PRNG. The seed is reset in init(), so every activation
 * replays the same sparkle sequence.
 */

#pragma once

#include "../../plugins/api/IAnimation.h"

namespace cosmicled {
namespace effects {
namespace ieffect {

class ShimmerAnimation : public plugins::IAnimation {
public:
    static constexpr uint16_t DEFAULT_SEED = 0x1D2B;

    ShimmerAnimation();
    ~ShimmerAnimation() override = default;

    bool init(plugins::RenderContext& ctx) override;
    bool render(render::FrameBuffer& frame, const plugins::RenderContext& ctx) override;
    void cleanup() override;
    const plugins::AnimationMetadata& getMetadata() const override;

    uint16_t seed() const { return m_seed; }

private:
    uint8_t nextRandom8();

    uint16_t m_seed;
};

} // namespace ieffect
} // namespace effects
} // namespace cosmicled
