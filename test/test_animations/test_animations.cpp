/**
 * @file test_animations.cpp
 * @brief Unit tests for the animation registry and built-in animations
 */

#ifdef NATIVE_BUILD

#include <unity.h>
#include <cmath>
#include <cstring>
#include <memory>
#include <string>
#include "../../src/plugins/AnimationRegistry.h"
#include "../../src/effects/BuiltinAnimations.h"
#include "../../src/effects/ieffect/MatrixTestAnimation.h"
#include "../../src/effects/ieffect/ShimmerAnimation.h"
#include "../../src/effects/ieffect/SolidAnimation.h"
#include "../../src/palettes/Palettes.h"

using namespace cosmicled;
using namespace cosmicled::plugins;
using effects::ieffect::MatrixTestAnimation;
using effects::ieffect::ShimmerAnimation;
using effects::ieffect::SolidAnimation;

// ============================================================================
// Helpers
// ============================================================================

class NamedAnimation : public IAnimation {
public:
    explicit NamedAnimation(const std::string& name)
        : m_name(name), m_meta(m_name.c_str()) {}

    bool init(RenderContext& ctx) override { (void)ctx; return true; }
    bool render(render::FrameBuffer& frame, const RenderContext& ctx) override {
        (void)frame; (void)ctx; return true;
    }
    void cleanup() override {}
    const AnimationMetadata& getMetadata() const override { return m_meta; }

private:
    std::string m_name;
    AnimationMetadata m_meta;
};

static CRGBPalette16 s_palette;

static RenderContext makeContext(uint16_t w, uint16_t h) {
    RenderContext ctx;
    ctx.width = w;
    ctx.height = h;
    ctx.palette = &s_palette;
    return ctx;
}

void setUp(void) {
    s_palette = palettes::getPalette(0);
}

void tearDown(void) {}

// ============================================================================
// Registry
// ============================================================================

void test_builtins_register_by_name() {
    AnimationRegistry registry;
    TEST_ASSERT_EQUAL_UINT8(7, effects::registerBuiltinAnimations(registry));
    TEST_ASSERT_EQUAL_UINT8(7, registry.count());

    const char* names[] = {"cosmic", "waves", "shimmer", "symmetry", "parametric_waves", "solid",
                           "matrix_test"};
    for (const char* name : names) {
        IAnimation* anim = registry.find(name);
        TEST_ASSERT_NOT_NULL_MESSAGE(anim, name);
        TEST_ASSERT_EQUAL_STRING(name, anim->getMetadata().name);
    }
    TEST_ASSERT_TRUE(registry.contains(effects::DEFAULT_ANIMATION));
    TEST_ASSERT_NULL(registry.find("plasma"));
    TEST_ASSERT_NULL(registry.find(nullptr));
}

void test_registry_rejects_duplicates() {
    AnimationRegistry registry;
    effects::registerBuiltinAnimations(registry);
    TEST_ASSERT_EQUAL_UINT8(0, effects::registerBuiltinAnimations(registry));
    TEST_ASSERT_EQUAL_UINT8(7, registry.count());
    TEST_ASSERT_FALSE(registry.add(std::unique_ptr<IAnimation>(new NamedAnimation("cosmic"))));
}

void test_registry_rejects_bad_entries() {
    AnimationRegistry registry;
    TEST_ASSERT_FALSE(registry.add(nullptr));
    TEST_ASSERT_FALSE(registry.add(std::unique_ptr<IAnimation>(new NamedAnimation(""))));
    TEST_ASSERT_FALSE(registry.add(std::unique_ptr<IAnimation>(
        new NamedAnimation(std::string(limits::MAX_ANIMATION_NAME, 'x')))));
    TEST_ASSERT_EQUAL_UINT8(0, registry.count());
}

void test_registry_capacity() {
    AnimationRegistry registry;
    for (uint8_t i = 0; i < limits::MAX_ANIMATIONS; i++) {
        TEST_ASSERT_TRUE(registry.add(std::unique_ptr<IAnimation>(
            new NamedAnimation("anim_" + std::to_string(i)))));
    }
    TEST_ASSERT_FALSE(registry.add(std::unique_ptr<IAnimation>(new NamedAnimation("overflow"))));
    TEST_ASSERT_EQUAL_UINT8(limits::MAX_ANIMATIONS, registry.count());
    TEST_ASSERT_EQUAL_STRING("anim_0", registry.at(0)->getMetadata().name);
    TEST_ASSERT_NULL(registry.at(limits::MAX_ANIMATIONS));
}

// ============================================================================
// Built-ins
// ============================================================================

void test_every_builtin_renders_full_frame() {
    AnimationRegistry registry;
    effects::registerBuiltinAnimations(registry);
    RenderContext ctx = makeContext(12, 7);

    for (uint8_t i = 0; i < registry.count(); i++) {
        IAnimation* anim = registry.at(i);
        TEST_ASSERT_TRUE(anim->init(ctx));
        for (uint32_t f = 0; f < 5; f++) {
            ctx.frameIndex = f * 97;
            render::FrameBuffer frame(ctx.pixelCount(), CRGB::Black);
            TEST_ASSERT_TRUE_MESSAGE(anim->render(frame, ctx), anim->getMetadata().name);
            TEST_ASSERT_EQUAL_UINT32(ctx.pixelCount(), frame.size());
        }
        anim->cleanup();
    }
}

void test_builtins_light_something_at_full_intensity() {
    AnimationRegistry registry;
    effects::registerBuiltinAnimations(registry);
    RenderContext ctx = makeContext(8, 8);
    ctx.frameIndex = 10;

    for (uint8_t i = 0; i < registry.count(); i++) {
        IAnimation* anim = registry.at(i);
        anim->init(ctx);
        render::FrameBuffer frame(ctx.pixelCount(), CRGB::Black);
        anim->render(frame, ctx);

        bool lit = false;
        for (const CRGB& px : frame) {
            if (px.r || px.g || px.b) {
                lit = true;
                break;
            }
        }
        TEST_ASSERT_TRUE_MESSAGE(lit, anim->getMetadata().name);
    }
}

void test_cosmic_dark_at_zero_intensity() {
    AnimationRegistry registry;
    effects::registerBuiltinAnimations(registry);
    IAnimation* cosmic = registry.find("cosmic");
    RenderContext ctx = makeContext(6, 6);
    ctx.intensity = 0.0f;

    cosmic->init(ctx);
    render::FrameBuffer frame(ctx.pixelCount(), CRGB::White);
    cosmic->render(frame, ctx);
    for (const CRGB& px : frame) {
        TEST_ASSERT_TRUE(px == CRGB(0, 0, 0));
    }
}

void test_parameters_are_clamped() {
    AnimationRegistry registry;
    effects::registerBuiltinAnimations(registry);
    IAnimation* cosmic = registry.find("cosmic");

    TEST_ASSERT_EQUAL_UINT8(3, cosmic->getParameterCount());
    const AnimationParameter* p = cosmic->getParameter(static_cast<uint8_t>(0));
    TEST_ASSERT_EQUAL_STRING("wave_speed", p->name);
    TEST_ASSERT_FLOAT_WITHIN(1e-6f, 0.05f, cosmic->getParameter("wave_speed"));

    TEST_ASSERT_TRUE(cosmic->setParameter("wave_speed", 5.0f));
    TEST_ASSERT_FLOAT_WITHIN(1e-6f, 0.5f, cosmic->getParameter("wave_speed"));
    TEST_ASSERT_TRUE(cosmic->setParameter("wave_scale", -1.0f));
    TEST_ASSERT_FLOAT_WITHIN(1e-6f, 0.1f, cosmic->getParameter("wave_scale"));
    TEST_ASSERT_FALSE(cosmic->setParameter("nope", 1.0f));
    TEST_ASSERT_NULL(cosmic->getParameter(static_cast<uint8_t>(3)));
}

void test_integer_parameters_round() {
    AnimationRegistry registry;
    effects::registerBuiltinAnimations(registry);
    IAnimation* pw = registry.find("parametric_waves");

    TEST_ASSERT_EQUAL_UINT8(5, pw->getParameterCount());
    TEST_ASSERT_EQUAL_FLOAT(3.0f, pw->getParameter("wave_count"));
    pw->setParameter("wave_count", 2.6f);
    TEST_ASSERT_EQUAL_FLOAT(3.0f, pw->getParameter("wave_count"));
    pw->setParameter("wave_count", 5.4f);
    TEST_ASSERT_EQUAL_FLOAT(5.0f, pw->getParameter("wave_count"));
    pw->setParameter("wave_count", 20.0f);
    TEST_ASSERT_EQUAL_FLOAT(8.0f, pw->getParameter("wave_count"));
}

void test_parameter_constrain_nan_uses_default() {
    AnimationParameter p("x", "X", 0.0f, 2.0f, 0.5f);
    TEST_ASSERT_EQUAL_FLOAT(0.5f, p.constrain(NAN));
    TEST_ASSERT_EQUAL_FLOAT(2.0f, p.constrain(9.0f));
    TEST_ASSERT_EQUAL_FLOAT(1.25f, p.constrain(1.25f));
}

void test_shimmer_owns_its_seed() {
    ShimmerAnimation a;
    ShimmerAnimation b;
    RenderContext ctx = makeContext(5, 5);
    a.init(ctx);
    b.init(ctx);
    TEST_ASSERT_EQUAL_UINT16(ShimmerAnimation::DEFAULT_SEED, a.seed());

    render::FrameBuffer fa(25, CRGB::Black);
    render::FrameBuffer fb(25, CRGB::Black);
    a.render(fa, ctx);
    b.render(fb, ctx);
    TEST_ASSERT_TRUE(fa == fb);
    TEST_ASSERT_TRUE(a.seed() != ShimmerAnimation::DEFAULT_SEED);

    // Advancing one instance leaves the other alone
    const uint16_t before = b.seed();
    a.render(fa, ctx);
    TEST_ASSERT_EQUAL_UINT16(before, b.seed());

    a.cleanup();
    a.init(ctx);
    TEST_ASSERT_EQUAL_UINT16(ShimmerAnimation::DEFAULT_SEED, a.seed());
}

void test_solid_fills_and_falls_back() {
    SolidAnimation solid;
    RenderContext ctx = makeContext(4, 4);
    solid.init(ctx);

    render::FrameBuffer frame(16, CRGB::Black);
    solid.render(frame, ctx);
    const CRGB expected = SolidAnimation::colorFor(ctx, 0.0f);
    for (const CRGB& px : frame) {
        TEST_ASSERT_TRUE(px == expected);
    }
    TEST_ASSERT_TRUE(SolidAnimation::fallbackColor(ctx) == expected);

    // No palette: hue wheel start
    ctx.palette = nullptr;
    TEST_ASSERT_TRUE(SolidAnimation::fallbackColor(ctx) == CRGB(CHSV(0, 255, 255)));

    TEST_ASSERT_TRUE(solid.setParameter("position", 3.0f));
    TEST_ASSERT_EQUAL_FLOAT(1.0f, solid.getParameter("position"));
}

void test_matrix_test_marks_corners() {
    MatrixTestAnimation anim;
    RenderContext ctx = makeContext(5, 4);
    TEST_ASSERT_EQUAL_STRING("matrix_test", anim.getMetadata().name);
    TEST_ASSERT_TRUE(anim.getMetadata().category == AnimationCategory::UTILITY);

    // Third pattern of the cycle
    ctx.frameIndex = 2 * MatrixTestAnimation::FRAMES_PER_PATTERN + 7;
    TEST_ASSERT_TRUE(anim.patternFor(ctx.frameIndex) == MatrixTestAnimation::Pattern::CORNERS);

    render::FrameBuffer frame(ctx.pixelCount(), CRGB::Black);
    TEST_ASSERT_TRUE(anim.render(frame, ctx));
    TEST_ASSERT_TRUE(frame[ctx.xy(0, 0)] == MatrixTestAnimation::CORNER_TOP_LEFT);
    TEST_ASSERT_TRUE(frame[ctx.xy(4, 0)] == MatrixTestAnimation::CORNER_TOP_RIGHT);
    TEST_ASSERT_TRUE(frame[ctx.xy(0, 3)] == MatrixTestAnimation::CORNER_BOTTOM_LEFT);
    TEST_ASSERT_TRUE(frame[ctx.xy(4, 3)] == MatrixTestAnimation::CORNER_BOTTOM_RIGHT);
    // Interior pixels are the faint gradient, never a marker colour
    TEST_ASSERT_TRUE(frame[ctx.xy(2, 1)] == CRGB(20, 12, 30));

    // Pinned mode ignores the frame index
    TEST_ASSERT_TRUE(anim.setParameter("mode", 3.0f));
    ctx.frameIndex = 0;
    TEST_ASSERT_TRUE(anim.patternFor(ctx.frameIndex) == MatrixTestAnimation::Pattern::CORNERS);
}

void test_matrix_test_sweeps() {
    MatrixTestAnimation anim;
    RenderContext ctx = makeContext(6, 3);
    render::FrameBuffer frame(ctx.pixelCount(), CRGB::Black);

    anim.setParameter("mode", 1.0f);
    ctx.frameIndex = 8;  // column 2
    anim.render(frame, ctx);
    for (uint16_t y = 0; y < ctx.height; y++) {
        TEST_ASSERT_TRUE(frame[ctx.xy(2, y)] == CRGB(255, 255, 255));
        TEST_ASSERT_TRUE(frame[ctx.xy(3, y)] == CRGB(20 + y * 20, 0, 0));
    }

    anim.setParameter("mode", 2.0f);
    ctx.frameIndex = 4;  // row 1
    anim.render(frame, ctx);
    for (uint16_t x = 0; x < ctx.width; x++) {
        TEST_ASSERT_TRUE(frame[ctx.xy(x, 1)] == CRGB(255, 255, 255));
        TEST_ASSERT_TRUE(frame[ctx.xy(x, 0)] == CRGB(0, 20 + x * 20, 0));
    }
}

void test_matrix_test_fills_in_wiring_order() {
    MatrixTestAnimation anim;
    RenderContext ctx = makeContext(4, 3);
    render::IndexMap map(4, 3, config::WiringMode::SERPENTINE);
    ctx.indexMap = &map;
    anim.setParameter("mode", 4.0f);

    ctx.frameIndex = 5;  // physical LEDs 0..5 lit
    render::FrameBuffer frame(ctx.pixelCount(), CRGB::Black);
    anim.render(frame, ctx);

    for (uint32_t physical = 0; physical < ctx.pixelCount(); physical++) {
        uint16_t x = 0, y = 0;
        TEST_ASSERT_TRUE(map.toXY(physical, x, y));
        const CRGB& px = frame[ctx.xy(x, y)];
        const bool lit = px.r || px.g || px.b;
        TEST_ASSERT_EQUAL(physical <= 5, lit);
    }
    // Second row runs backwards on a serpentine: its rightmost pixel is LED 4
    TEST_ASSERT_TRUE(frame[ctx.xy(3, 1)].r || frame[ctx.xy(3, 1)].g || frame[ctx.xy(3, 1)].b);
    TEST_ASSERT_TRUE(frame[ctx.xy(0, 1)] == CRGB(0, 0, 0));
}

// ============================================================================
// Test Runner
// ============================================================================

int main() {
    UNITY_BEGIN();

    RUN_TEST(test_builtins_register_by_name);
    RUN_TEST(test_registry_rejects_duplicates);
    RUN_TEST(test_registry_rejects_bad_entries);
    RUN_TEST(test_registry_capacity);

    RUN_TEST(test_every_builtin_renders_full_frame);
    RUN_TEST(test_builtins_light_something_at_full_intensity);
    RUN_TEST(test_cosmic_dark_at_zero_intensity);
    RUN_TEST(test_parameters_are_clamped);
    RUN_TEST(test_integer_parameters_round);
    RUN_TEST(test_parameter_constrain_nan_uses_default);
    RUN_TEST(test_shimmer_owns_its_seed);
    RUN_TEST(test_solid_fills_and_falls_back);
    RUN_TEST(test_matrix_test_marks_corners);
    RUN_TEST(test_matrix_test_sweeps);
    RUN_TEST(test_matrix_test_fills_in_wiring_order);

    return UNITY_END();
}

#endif // NATIVE_BUILD
