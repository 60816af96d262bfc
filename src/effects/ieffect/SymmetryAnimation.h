/**
 * @file SymmetryAnimation.h
 * @brief Symmetry - radial waves expanding from the matrix centre
 */

#pragma once

#include "../../plugins/api/IAnimation.h"

namespace cosmicled {
namespace effects {
namespace ieffect {

class SymmetryAnimation : public plugins::IAnimation {
public:
    SymmetryAnimation() = default;
    ~SymmetryAnimation() override = default;

    bool init(plugins::RenderContext& ctx) override;
    bool render(render::FrameBuffer& frame, const plugins::RenderContext& ctx) override;
    void cleanup() override;
    const plugins::AnimationMetadata& getMetadata() const override;
};

} // namespace ieffect
} // namespace effects
} // namespace cosmicled
