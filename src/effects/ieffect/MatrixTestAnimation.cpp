/**
 * @file MatrixTestAnimation.cpp
 * @brief Matrix test pattern implementation
 */

#include "MatrixTestAnimation.h"

#include <FastLED.h>
#include <algorithm>
#include <cstring>

namespace cosmicled {
namespace effects {
namespace ieffect {

namespace {

const plugins::AnimationParameter kParameters[] = {
    {"mode", "Pattern (0 = cycle)", 0.0f, 4.0f, 0.0f, plugins::AnimationParameterType::INT},
};

const CRGB kSweep(255, 255, 255);

uint8_t dimLevel(uint32_t position) {
    return static_cast<uint8_t>(std::min<uint32_t>(20 + position * 20, 255));
}

} // namespace

const CRGB MatrixTestAnimation::CORNER_TOP_LEFT(255, 0, 0);
const CRGB MatrixTestAnimation::CORNER_TOP_RIGHT(0, 255, 0);
const CRGB MatrixTestAnimation::CORNER_BOTTOM_LEFT(0, 0, 255);
const CRGB MatrixTestAnimation::CORNER_BOTTOM_RIGHT(255, 255, 255);

MatrixTestAnimation::MatrixTestAnimation()
    : m_mode(static_cast<uint8_t>(kParameters[0].defaultValue))
{
}

bool MatrixTestAnimation::init(plugins::RenderContext& ctx) {
    (void)ctx;
    return true;
}

MatrixTestAnimation::Pattern MatrixTestAnimation::patternFor(uint32_t frameIndex) const {
    if (m_mode > 0) {
        return static_cast<Pattern>(m_mode - 1);
    }
    return static_cast<Pattern>((frameIndex / FRAMES_PER_PATTERN) % PATTERN_COUNT);
}

bool MatrixTestAnimation::render(render::FrameBuffer& frame, const plugins::RenderContext& ctx) {
    if (ctx.width == 0 || ctx.height == 0) {
        return false;
    }

    switch (patternFor(ctx.frameIndex)) {
        case Pattern::COLUMN_SWEEP: renderColumnSweep(frame, ctx); break;
        case Pattern::ROW_SWEEP:    renderRowSweep(frame, ctx); break;
        case Pattern::CORNERS:      renderCorners(frame, ctx); break;
        case Pattern::WIRING_FILL:  renderWiringFill(frame, ctx); break;
    }
    return true;
}

void MatrixTestAnimation::renderColumnSweep(render::FrameBuffer& frame,
                                            const plugins::RenderContext& ctx) const {
    const uint16_t column = static_cast<uint16_t>(ctx.frameIndex % ctx.width);
    for (uint16_t y = 0; y < ctx.height; y++) {
        const CRGB row(dimLevel(y), 0, 0);
        for (uint16_t x = 0; x < ctx.width; x++) {
            frame[ctx.xy(x, y)] = (x == column) ? kSweep : row;
        }
    }
}

void MatrixTestAnimation::renderRowSweep(render::FrameBuffer& frame,
                                         const plugins::RenderContext& ctx) const {
    const uint16_t sweepRow = static_cast<uint16_t>(ctx.frameIndex % ctx.height);
    for (uint16_t y = 0; y < ctx.height; y++) {
        for (uint16_t x = 0; x < ctx.width; x++) {
            frame[ctx.xy(x, y)] = (y == sweepRow) ? kSweep : CRGB(0, dimLevel(x), 0);
        }
    }
}

void MatrixTestAnimation::renderCorners(render::FrameBuffer& frame,
                                        const plugins::RenderContext& ctx) const {
    const uint16_t right = ctx.width - 1;
    const uint16_t bottom = ctx.height - 1;

    // Faint position gradient so the panel edges are visible
    for (uint16_t y = 0; y < ctx.height; y++) {
        for (uint16_t x = 0; x < ctx.width; x++) {
            frame[ctx.xy(x, y)] = CRGB(static_cast<uint8_t>(x * 50 / ctx.width),
                                       static_cast<uint8_t>(y * 50 / ctx.height), 30);
        }
    }

    // Drawn in this order so a 1-wide or 1-high matrix keeps the last marker
    frame[ctx.xy(0, 0)] = CORNER_TOP_LEFT;
    frame[ctx.xy(right, 0)] = CORNER_TOP_RIGHT;
    frame[ctx.xy(0, bottom)] = CORNER_BOTTOM_LEFT;
    frame[ctx.xy(right, bottom)] = CORNER_BOTTOM_RIGHT;
}

void MatrixTestAnimation::renderWiringFill(render::FrameBuffer& frame,
                                           const plugins::RenderContext& ctx) const {
    const uint32_t count = ctx.pixelCount();
    const uint32_t fill = ctx.frameIndex % count;

    std::fill(frame.begin(), frame.end(), CRGB::Black);
    for (uint32_t physical = 0; physical <= fill; physical++) {
        // Without a map the buffer order stands in for the wiring order
        uint32_t logical = physical;
        uint16_t x = 0, y = 0;
        if (ctx.indexMap != nullptr && ctx.indexMap->toXY(physical, x, y)) {
            logical = ctx.xy(x, y);
        }
        frame[logical] = ctx.paletteColor(static_cast<float>(physical) / count);
    }
}

void MatrixTestAnimation::cleanup() {
}

const plugins::AnimationMetadata& MatrixTestAnimation::getMetadata() const {
    static plugins::AnimationMetadata meta{
        "matrix_test",
        "Wiring and orientation test pattern",
        plugins::AnimationCategory::UTILITY,
        1
    };
    return meta;
}

uint8_t MatrixTestAnimation::getParameterCount() const {
    return static_cast<uint8_t>(sizeof(kParameters) / sizeof(kParameters[0]));
}

const plugins::AnimationParameter* MatrixTestAnimation::getParameter(uint8_t index) const {
    if (index >= getParameterCount()) return nullptr;
    return &kParameters[index];
}

bool MatrixTestAnimation::setParameter(const char* name, float value) {
    if (!name) return false;
    if (std::strcmp(name, "mode") == 0) {
        m_mode = static_cast<uint8_t>(kParameters[0].constrain(value));
        return true;
    }
    return false;
}

float MatrixTestAnimation::getParameter(const char* name) const {
    if (!name) return 0.0f;
    if (std::strcmp(name, "mode") == 0) return static_cast<float>(m_mode);
    return 0.0f;
}

} // namespace ieffect
} // namespace effects
} // namespace cosmicled
