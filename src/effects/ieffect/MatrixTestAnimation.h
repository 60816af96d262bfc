/**
 * @file MatrixTestAnimation.h
 * @brief Matrix test pattern for checking wiring and orientation
 *
 * Cycles through four patterns, 300 frames each:
 *   COLUMN_SWEEP - white column moving left to right over dim red rows
 *   ROW_SWEEP    - white row moving top to bottom over dim green columns
 *   CORNERS      - red (0,0), green (w-1,0), blue (0,h-1), white (w-1,h-1)
 *   WIRING_FILL  - palette fill in physical LED order, via the index map
 *
 * The "mode" parameter pins one pattern (0 = cycle).
 */

#pragma once

#include "../../plugins/api/IAnimation.h"

namespace cosmicled {
namespace effects {
namespace ieffect {

class MatrixTestAnimation : public plugins::IAnimation {
public:
    enum class Pattern : uint8_t {
        COLUMN_SWEEP = 0,
        ROW_SWEEP,
        CORNERS,
        WIRING_FILL
    };

    static constexpr uint32_t FRAMES_PER_PATTERN = 300;
    static constexpr uint8_t PATTERN_COUNT = 4;

    MatrixTestAnimation();
    ~MatrixTestAnimation() override = default;

    bool init(plugins::RenderContext& ctx) override;
    bool render(render::FrameBuffer& frame, const plugins::RenderContext& ctx) override;
    void cleanup() override;
    const plugins::AnimationMetadata& getMetadata() const override;

    uint8_t getParameterCount() const override;
    const plugins::AnimationParameter* getParameter(uint8_t index) const override;
    bool setParameter(const char* name, float value) override;
    float getParameter(const char* name) const override;

    /// Pattern shown on a frame, honouring a pinned mode
    Pattern patternFor(uint32_t frameIndex) const;

    static const CRGB CORNER_TOP_LEFT;
    static const CRGB CORNER_TOP_RIGHT;
    static const CRGB CORNER_BOTTOM_LEFT;
    static const CRGB CORNER_BOTTOM_RIGHT;

private:
    void renderColumnSweep(render::FrameBuffer& frame, const plugins::RenderContext& ctx) const;
    void renderRowSweep(render::FrameBuffer& frame, const plugins::RenderContext& ctx) const;
    void renderCorners(render::FrameBuffer& frame, const plugins::RenderContext& ctx) const;
    void renderWiringFill(render::FrameBuffer& frame, const plugins::RenderContext& ctx) const;

    uint8_t m_mode;
};

} // namespace ieffect
} // namespace effects
} // namespace cosmicled
