/**
 * @file test_conductor.cpp
 * @brief Integration tests for the Conductor frame loop
 *
 * A recording driver injected through the driver factory logs every call
 * so ordering (shutdown before the replacement's first update) and
 * liveness under plugin faults can be checked directly.
 */

#ifdef NATIVE_BUILD

#include <unity.h>
#include <chrono>
#include <cstring>
#include <memory>
#include <thread>
#include <vector>
#include "../../src/core/actors/Conductor.h"
#include "../../src/effects/BuiltinAnimations.h"
#include "../../src/effects/ieffect/SolidAnimation.h"
#include "../../src/palettes/Palettes.h"

using namespace cosmicled;
using actors::Conductor;
using config::BackendType;
using config::Configuration;
using hal::DriverResult;
using hal::DriverState;

// ============================================================================
// Recording driver
// ============================================================================

enum class Call : uint8_t { INIT, UPDATE, BRIGHTNESS, CLEAR, SHUTDOWN, RECONFIGURE };

struct CallRecord {
    int driverId;
    Call call;
    uint32_t frameSize;
    CRGB firstPixel;
    uint32_t driverPixels;          // the driver's own pixel count at the call
};

struct DriverLog {
    std::vector<CallRecord> calls;
    int created = 0;
    bool failUpdates = false;       // applies to drivers created from now on

    int count(Call call, int driverId = -1) const {
        int n = 0;
        for (const CallRecord& c : calls) {
            if (c.call == call && (driverId < 0 || c.driverId == driverId)) n++;
        }
        return n;
    }

    int firstIndex(Call call, int driverId) const {
        for (size_t i = 0; i < calls.size(); i++) {
            if (calls[i].call == call && calls[i].driverId == driverId) return static_cast<int>(i);
        }
        return -1;
    }
};

class RecordingDriver : public hal::IMatrixDriver {
public:
    RecordingDriver(DriverLog& log, const config::SnapshotPtr& snapshot)
        : m_log(log), m_id(log.created++), m_snapshot(snapshot),
          m_failUpdates(log.failUpdates) {}

    bool init() override {
        record(Call::INIT);
        m_state = DriverState::LIVE;
        return true;
    }
    DriverResult update(const render::FrameBuffer& frame) override {
        CallRecord rec{m_id, Call::UPDATE, static_cast<uint32_t>(frame.size()),
                       frame.empty() ? CRGB(CRGB::Black) : frame[0],
                       m_snapshot->config.pixelCount()};
        m_log.calls.push_back(rec);
        if (m_state != DriverState::LIVE) return DriverResult::NOT_LIVE;
        if (m_failUpdates) return DriverResult::HARDWARE_ERROR;
        if (frame.size() != m_snapshot->config.pixelCount()) return DriverResult::SIZE_MISMATCH;
        m_stats.frameCount++;
        return DriverResult::OK;
    }
    DriverResult setBrightness(float value) override {
        (void)value;
        record(Call::BRIGHTNESS);
        return DriverResult::OK;
    }
    DriverResult clear() override {
        record(Call::CLEAR);
        return DriverResult::OK;
    }
    DriverResult shutdown() override {
        record(Call::SHUTDOWN);
        m_state = DriverState::SHUT_DOWN;
        return DriverResult::OK;
    }
    void reconfigure(const config::SnapshotPtr& snapshot) override {
        record(Call::RECONFIGURE);
        m_snapshot = snapshot;
    }

    DriverState state() const override { return m_state; }
    BackendType backend() const override { return m_snapshot->config.backend; }
    const hal::DriverCapabilities& capabilities() const override { return m_caps; }
    const hal::MatrixDriverStats& getStats() const override { return m_stats; }

private:
    void record(Call call) {
        m_log.calls.push_back(CallRecord{m_id, call, 0, CRGB(CRGB::Black),
                                         m_snapshot->config.pixelCount()});
    }

    DriverLog& m_log;
    int m_id;
    config::SnapshotPtr m_snapshot;
    bool m_failUpdates;
    DriverState m_state = DriverState::UNINITIALIZED;
    hal::DriverCapabilities m_caps;
    hal::MatrixDriverStats m_stats;
};

static Conductor::DriverFactory recordingFactory(DriverLog& log) {
    return [&log](const config::SnapshotPtr& snapshot) {
        std::unique_ptr<hal::IMatrixDriver> driver(new RecordingDriver(log, snapshot));
        driver->init();
        return driver;
    };
}

// ============================================================================
// Test animations
// ============================================================================

class ScriptedAnimation : public plugins::IAnimation {
public:
    ScriptedAnimation(const char* name, int goodFrames, bool refuseInit = false)
        : m_meta(name), m_goodFrames(goodFrames), m_refuseInit(refuseInit) {}

    bool init(plugins::RenderContext& ctx) override {
        (void)ctx;
        inits++;
        return !m_refuseInit;
    }
    bool render(render::FrameBuffer& frame, const plugins::RenderContext& ctx) override {
        (void)ctx;
        renders++;
        if (m_goodFrames >= 0 && renders > m_goodFrames) {
            return false;
        }
        std::fill(frame.begin(), frame.end(), CRGB(0, 0, 200));
        return true;
    }
    void cleanup() override { cleanups++; }
    const plugins::AnimationMetadata& getMetadata() const override { return m_meta; }

    int inits = 0;
    int renders = 0;
    int cleanups = 0;

private:
    plugins::AnimationMetadata m_meta;
    int m_goodFrames;       // -1: never fails
    bool m_refuseInit;
};

class ShrinkingAnimation : public plugins::IAnimation {
public:
    bool init(plugins::RenderContext& ctx) override { (void)ctx; return true; }
    bool render(render::FrameBuffer& frame, const plugins::RenderContext& ctx) override {
        (void)ctx;
        frame.clear();
        return true;
    }
    void cleanup() override {}
    const plugins::AnimationMetadata& getMetadata() const override {
        static plugins::AnimationMetadata meta("shrinking");
        return meta;
    }
};

// ============================================================================
// Fixtures
// ============================================================================

static Configuration fastConfig(uint16_t w, uint16_t h) {
    Configuration cfg;
    cfg.width = w;
    cfg.height = h;
    cfg.targetFps = 240;
    cfg.backend = BackendType::SIMULATION;
    return cfg;
}

static CRGB expectedFallback(const Configuration& cfg) {
    CRGBPalette16 palette = palettes::getPalette(cfg.paletteIndex);
    plugins::RenderContext ctx;
    ctx.palette = &palette;
    ctx.intensity = cfg.intensity;
    return effects::ieffect::SolidAnimation::fallbackColor(ctx);
}

void setUp(void) {}
void tearDown(void) {}

// ============================================================================
// Liveness under faults
// ============================================================================

void test_failing_plugin_keeps_updates_flowing() {
    DriverLog log;
    Configuration cfg = fastConfig(6, 4);
    config::ConfigStore store(cfg);
    plugins::AnimationRegistry registry;
    ScriptedAnimation* failing = new ScriptedAnimation("failing", 0);
    registry.add(std::unique_ptr<plugins::IAnimation>(failing));

    Conductor conductor(store, registry, recordingFactory(log));
    TEST_ASSERT_TRUE(conductor.requestAnimation("failing"));
    TEST_ASSERT_EQUAL_UINT32(20, conductor.runFor(20));

    TEST_ASSERT_EQUAL(20, log.count(Call::UPDATE));
    const CRGB fallback = expectedFallback(cfg);
    for (const CallRecord& c : log.calls) {
        if (c.call != Call::UPDATE) continue;
        TEST_ASSERT_EQUAL_UINT32(24, c.frameSize);
        TEST_ASSERT_TRUE(c.firstPixel == fallback);
    }

    actors::ConductorStats stats = conductor.getStats();
    TEST_ASSERT_EQUAL_UINT32(20, stats.pluginFaults);
    TEST_ASSERT_EQUAL_UINT32(20, stats.updates);
    TEST_ASSERT_EQUAL_STRING("failing", stats.currentAnimation);
    TEST_ASSERT_FALSE(conductor.isDriverFaulted());
}

void test_fault_substitutes_last_good_frame() {
    DriverLog log;
    config::ConfigStore store(fastConfig(4, 4));
    plugins::AnimationRegistry registry;
    registry.add(std::unique_ptr<plugins::IAnimation>(new ScriptedAnimation("flaky", 3)));

    Conductor conductor(store, registry, recordingFactory(log));
    conductor.requestAnimation("flaky");
    conductor.runFor(6);

    TEST_ASSERT_EQUAL(6, log.count(Call::UPDATE));
    for (const CallRecord& c : log.calls) {
        if (c.call == Call::UPDATE) {
            TEST_ASSERT_TRUE(c.firstPixel == CRGB(0, 0, 200));
        }
    }
    TEST_ASSERT_EQUAL_UINT32(3, conductor.getStats().pluginFaults);
}

void test_resized_buffer_is_a_plugin_fault() {
    DriverLog log;
    config::ConfigStore store(fastConfig(5, 5));
    plugins::AnimationRegistry registry;
    registry.add(std::unique_ptr<plugins::IAnimation>(new ShrinkingAnimation()));

    Conductor conductor(store, registry, recordingFactory(log));
    conductor.requestAnimation("shrinking");
    conductor.runFor(4);

    TEST_ASSERT_EQUAL_UINT32(4, conductor.getStats().pluginFaults);
    for (const CallRecord& c : log.calls) {
        if (c.call == Call::UPDATE) {
            TEST_ASSERT_EQUAL_UINT32(25, c.frameSize);
        }
    }
}

void test_empty_registry_renders_fallback() {
    DriverLog log;
    config::ConfigStore store(fastConfig(3, 3));
    plugins::AnimationRegistry registry;

    Conductor conductor(store, registry, recordingFactory(log));
    conductor.runFor(3);

    TEST_ASSERT_EQUAL(3, log.count(Call::UPDATE));
    TEST_ASSERT_EQUAL_UINT32(0, conductor.getStats().pluginFaults);
}

void test_update_failure_degrades_driver() {
    DriverLog log;
    log.failUpdates = true;
    config::ConfigStore store(fastConfig(4, 4));
    plugins::AnimationRegistry registry;
    effects::registerBuiltinAnimations(registry);

    Conductor conductor(store, registry, recordingFactory(log));
    conductor.runFor(5);

    // Two failed attempts on the recording driver, then the no-op sink
    TEST_ASSERT_EQUAL(2, log.count(Call::UPDATE, 0));
    TEST_ASSERT_EQUAL(1, log.count(Call::SHUTDOWN, 0));
    TEST_ASSERT_TRUE(conductor.isDriverFaulted());
    TEST_ASSERT_TRUE(conductor.getDriverState() == DriverState::DEGRADED);

    actors::ConductorStats stats = conductor.getStats();
    TEST_ASSERT_EQUAL_UINT32(1, stats.updateRetries);
    TEST_ASSERT_EQUAL_UINT32(1, stats.degradations);
    TEST_ASSERT_EQUAL_UINT32(5, stats.updates);
    TEST_ASSERT_EQUAL_UINT32(5, stats.frames);

    // A healthy rebuild clears the fault
    log.failUpdates = false;
    conductor.requestDriverRebuild();
    conductor.runFor(2);
    TEST_ASSERT_FALSE(conductor.isDriverFaulted());
    TEST_ASSERT_TRUE(conductor.getDriverState() == DriverState::LIVE);
    TEST_ASSERT_EQUAL(2, log.count(Call::UPDATE, 1));
}

// ============================================================================
// Configuration changes
// ============================================================================

void test_backend_swap_shuts_down_before_next_update() {
    DriverLog log;
    config::ConfigStore store(fastConfig(8, 8));
    plugins::AnimationRegistry registry;
    effects::registerBuiltinAnimations(registry);

    Conductor conductor(store, registry, recordingFactory(log));
    conductor.runFor(3);

    Configuration next = store.get()->config;
    next.backend = BackendType::STRIP;
    TEST_ASSERT_TRUE(conductor.replaceConfig(next).ok());
    conductor.runFor(3);

    TEST_ASSERT_EQUAL(2, log.created);
    const int shutdownOld = log.firstIndex(Call::SHUTDOWN, 0);
    const int initNew = log.firstIndex(Call::INIT, 1);
    const int updateNew = log.firstIndex(Call::UPDATE, 1);
    TEST_ASSERT_TRUE(shutdownOld >= 0);
    TEST_ASSERT_TRUE(updateNew >= 0);
    TEST_ASSERT_TRUE(shutdownOld < initNew);
    TEST_ASSERT_TRUE(shutdownOld < updateNew);

    // No update reached the old driver after its shutdown
    for (size_t i = shutdownOld; i < log.calls.size(); i++) {
        TEST_ASSERT_FALSE(log.calls[i].driverId == 0 && log.calls[i].call == Call::UPDATE);
    }
    TEST_ASSERT_EQUAL(3, log.count(Call::UPDATE, 1));

    actors::ConductorStats stats = conductor.getStats();
    TEST_ASSERT_EQUAL_UINT32(1, stats.driverRebuilds);
    TEST_ASSERT_TRUE(stats.backend == BackendType::STRIP);
}

void test_geometry_change_resizes_frames() {
    DriverLog log;
    config::ConfigStore store(fastConfig(4, 4));
    plugins::AnimationRegistry registry;
    effects::registerBuiltinAnimations(registry);

    Conductor conductor(store, registry, recordingFactory(log));
    conductor.runFor(2);

    Configuration next = store.get()->config;
    next.width = 10;
    next.height = 3;
    conductor.replaceConfig(next);
    conductor.runFor(2);

    TEST_ASSERT_EQUAL(2, log.created);
    for (const CallRecord& c : log.calls) {
        if (c.call == Call::UPDATE) {
            TEST_ASSERT_EQUAL_UINT32(c.driverId == 0 ? 16 : 30, c.frameSize);
        }
    }
    TEST_ASSERT_EQUAL_UINT32(30, conductor.getPoolStats().pixelCount);
}

void test_tone_change_reconfigures_in_place() {
    DriverLog log;
    config::ConfigStore store(fastConfig(4, 4));
    plugins::AnimationRegistry registry;
    effects::registerBuiltinAnimations(registry);

    Conductor conductor(store, registry, recordingFactory(log));
    conductor.runFor(2);

    Configuration next = store.get()->config;
    next.brightness = 0.9f;
    next.gamma = 1.8f;
    next.wiring = config::WiringMode::LINEAR;
    conductor.replaceConfig(next);
    conductor.runFor(2);

    TEST_ASSERT_EQUAL(1, log.created);
    TEST_ASSERT_EQUAL(1, log.count(Call::RECONFIGURE));
    TEST_ASSERT_EQUAL(0, log.count(Call::SHUTDOWN));
    TEST_ASSERT_EQUAL_UINT32(0, conductor.getStats().driverRebuilds);
}

void test_invalid_config_is_rejected() {
    DriverLog log;
    config::ConfigStore store(fastConfig(4, 4));
    plugins::AnimationRegistry registry;
    effects::registerBuiltinAnimations(registry);

    Conductor conductor(store, registry, recordingFactory(log));
    conductor.runFor(1);

    Configuration bad = store.get()->config;
    bad.width = 0;
    config::ConfigResult r = conductor.replaceConfig(bad);
    TEST_ASSERT_FALSE(r.ok());
    TEST_ASSERT_EQUAL_STRING("width", r.field);

    conductor.runFor(2);
    TEST_ASSERT_EQUAL(1, log.created);
    TEST_ASSERT_EQUAL_UINT16(4, store.get()->config.width);
}

// ============================================================================
// Plugin switching
// ============================================================================

void test_default_animation_is_active() {
    config::ConfigStore store(fastConfig(4, 4));
    plugins::AnimationRegistry registry;
    effects::registerBuiltinAnimations(registry);

    Conductor conductor(store, registry);
    conductor.runFor(1);
    TEST_ASSERT_EQUAL_STRING(effects::DEFAULT_ANIMATION, conductor.getStats().currentAnimation);
}

void test_switch_runs_cleanup_then_init() {
    DriverLog log;
    config::ConfigStore store(fastConfig(4, 4));
    plugins::AnimationRegistry registry;
    ScriptedAnimation* first = new ScriptedAnimation("first", -1);
    ScriptedAnimation* second = new ScriptedAnimation("second", -1);
    registry.add(std::unique_ptr<plugins::IAnimation>(first));
    registry.add(std::unique_ptr<plugins::IAnimation>(second));

    Conductor conductor(store, registry, recordingFactory(log));
    conductor.requestAnimation("first");
    conductor.runFor(2);
    TEST_ASSERT_EQUAL(1, first->inits);
    TEST_ASSERT_EQUAL(2, first->renders);

    TEST_ASSERT_FALSE(conductor.requestAnimation("missing"));
    TEST_ASSERT_TRUE(conductor.requestAnimation("second"));
    conductor.runFor(3);

    TEST_ASSERT_EQUAL(1, first->cleanups);
    TEST_ASSERT_EQUAL(2, first->renders);
    TEST_ASSERT_EQUAL(1, second->inits);
    TEST_ASSERT_EQUAL(3, second->renders);
    TEST_ASSERT_EQUAL_STRING("second", conductor.getStats().currentAnimation);
}

void test_refused_init_reverts_to_previous() {
    DriverLog log;
    config::ConfigStore store(fastConfig(4, 4));
    plugins::AnimationRegistry registry;
    ScriptedAnimation* good = new ScriptedAnimation("good", -1);
    ScriptedAnimation* refusing = new ScriptedAnimation("refusing", -1, true);
    registry.add(std::unique_ptr<plugins::IAnimation>(good));
    registry.add(std::unique_ptr<plugins::IAnimation>(refusing));

    Conductor conductor(store, registry, recordingFactory(log));
    conductor.requestAnimation("good");
    conductor.runFor(1);
    conductor.requestAnimation("refusing");
    conductor.runFor(2);

    TEST_ASSERT_EQUAL(1, refusing->inits);
    TEST_ASSERT_EQUAL(0, refusing->renders);
    TEST_ASSERT_EQUAL(2, good->inits);
    TEST_ASSERT_EQUAL(3, good->renders);
    TEST_ASSERT_EQUAL_STRING("good", conductor.getStats().currentAnimation);
}

// ============================================================================
// Lifecycle
// ============================================================================

void test_pause_skips_render_and_update() {
    DriverLog log;
    config::ConfigStore store(fastConfig(4, 4));
    plugins::AnimationRegistry registry;
    effects::registerBuiltinAnimations(registry);

    Conductor conductor(store, registry, recordingFactory(log));
    conductor.runFor(2);
    conductor.pause();
    TEST_ASSERT_TRUE(conductor.isPaused());
    conductor.runFor(3);
    TEST_ASSERT_EQUAL(2, log.count(Call::UPDATE));

    actors::ConductorStats stats = conductor.getStats();
    TEST_ASSERT_EQUAL_UINT32(5, stats.cycles);
    TEST_ASSERT_EQUAL_UINT32(2, stats.frames);
    TEST_ASSERT_TRUE(stats.paused);

    conductor.resume();
    conductor.runFor(1);
    TEST_ASSERT_EQUAL(3, log.count(Call::UPDATE));
}

void test_restart_resets_frame_index() {
    config::ConfigStore store(fastConfig(4, 4));
    plugins::AnimationRegistry registry;
    effects::registerBuiltinAnimations(registry);

    Conductor conductor(store, registry);
    conductor.runFor(5);
    TEST_ASSERT_EQUAL_UINT32(5, conductor.getStats().frameIndex);
    conductor.restart();
    conductor.runFor(1);
    TEST_ASSERT_EQUAL_UINT32(1, conductor.getStats().frameIndex);
}

void test_frame_index_wraps() {
    TEST_ASSERT_EQUAL_UINT32(1, Conductor::nextFrameIndex(0));
    TEST_ASSERT_EQUAL_UINT32(Conductor::MAX_FRAME_INDEX,
                             Conductor::nextFrameIndex(Conductor::MAX_FRAME_INDEX - 1));
    TEST_ASSERT_EQUAL_UINT32(0, Conductor::nextFrameIndex(Conductor::MAX_FRAME_INDEX));
}

void test_thread_start_stop_shuts_driver_down() {
    DriverLog log;
    config::ConfigStore store(fastConfig(4, 4));
    plugins::AnimationRegistry registry;
    effects::registerBuiltinAnimations(registry);

    Conductor conductor(store, registry, recordingFactory(log));
    TEST_ASSERT_TRUE(conductor.start());
    TEST_ASSERT_TRUE(conductor.isRunning());
    TEST_ASSERT_FALSE(conductor.start());
    TEST_ASSERT_EQUAL_UINT32(0, conductor.runFor(1));

    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    conductor.stop();

    TEST_ASSERT_FALSE(conductor.isRunning());
    TEST_ASSERT_TRUE(conductor.getDriverState() == DriverState::SHUT_DOWN);
    TEST_ASSERT_TRUE(log.count(Call::UPDATE) > 0);

    // Shutdown is the last call; clear comes right before it
    TEST_ASSERT_TRUE(log.calls.back().call == Call::SHUTDOWN);
    TEST_ASSERT_TRUE(log.calls[log.calls.size() - 2].call == Call::CLEAR);
}

void test_changes_from_another_thread_keep_frames_sized() {
    DriverLog log;
    config::ConfigStore store(fastConfig(8, 4));
    plugins::AnimationRegistry registry;
    effects::registerBuiltinAnimations(registry);

    Conductor conductor(store, registry, recordingFactory(log));
    TEST_ASSERT_TRUE(conductor.start());

    const char* animations[] = {"cosmic", "solid", "matrix_test", "shimmer"};
    int rejected = 0;
    std::thread writer([&]() {
        for (int i = 0; i < 120; i++) {
            Configuration next = store.get()->config;
            if (i % 2 == 0) {
                // Geometry: rebuilds the driver
                next.width = (i % 4 == 0) ? 5 : 8;
                next.height = (i % 4 == 0) ? 6 : 4;
            } else {
                // Tone: reconfigures in place
                next.gamma = (i % 4 == 1) ? 1.8f : 2.4f;
                next.brightness = (i % 4 == 1) ? 0.5f : 0.9f;
            }
            if (!conductor.replaceConfig(next).ok()) rejected++;
            if (!conductor.requestAnimation(animations[i % 4])) rejected++;
            std::this_thread::sleep_for(std::chrono::microseconds(500));
        }
    });
    writer.join();
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    conductor.stop();

    TEST_ASSERT_EQUAL(0, rejected);
    TEST_ASSERT_FALSE(conductor.isRunning());
    TEST_ASSERT_TRUE(log.count(Call::UPDATE) > 0);
    TEST_ASSERT_TRUE(log.created > 1);

    // Every frame a driver saw matched that driver's geometry
    for (const CallRecord& c : log.calls) {
        if (c.call == Call::UPDATE) {
            TEST_ASSERT_EQUAL_UINT32(c.driverPixels, c.frameSize);
        }
    }
    TEST_ASSERT_EQUAL(log.created, log.count(Call::SHUTDOWN));
    TEST_ASSERT_EQUAL_UINT32(0, conductor.getStats().pluginFaults);
    TEST_ASSERT_TRUE(log.calls.back().call == Call::SHUTDOWN);
    TEST_ASSERT_TRUE(log.calls[log.calls.size() - 2].call == Call::CLEAR);
    TEST_ASSERT_TRUE(conductor.getDriverState() == DriverState::SHUT_DOWN);
}

void test_end_to_end_thirty_fps() {
    Configuration cfg;
    cfg.width = 8;
    cfg.height = 8;
    cfg.wiring = config::WiringMode::SERPENTINE;
    cfg.targetFps = 30;
    cfg.backend = BackendType::SIMULATION;
    config::ConfigStore store(cfg);

    plugins::AnimationRegistry registry;
    effects::registerBuiltinAnimations(registry);

    Conductor conductor(store, registry);
    TEST_ASSERT_TRUE(conductor.requestAnimation("solid"));
    TEST_ASSERT_EQUAL_UINT32(100, conductor.runFor(100));

    hardware::PerformanceStats perf = conductor.getPerformance();
    TEST_ASSERT_TRUE(perf.fps >= 25.0f);
    TEST_ASSERT_TRUE(perf.fps <= 35.0f);
    TEST_ASSERT_EQUAL_UINT32(0, perf.droppedFrames);
    TEST_ASSERT_EQUAL_UINT32(100, perf.totalFrames);

    actors::ConductorStats stats = conductor.getStats();
    TEST_ASSERT_EQUAL_UINT32(100, stats.updates);
    TEST_ASSERT_EQUAL_UINT32(0, stats.pluginFaults);
    TEST_ASSERT_TRUE(stats.driverState == DriverState::LIVE);
    TEST_ASSERT_EQUAL_UINT32(0, conductor.getPoolStats().overflows);
}

// ============================================================================
// Test Runner
// ============================================================================

int main() {
    UNITY_BEGIN();

    RUN_TEST(test_failing_plugin_keeps_updates_flowing);
    RUN_TEST(test_fault_substitutes_last_good_frame);
    RUN_TEST(test_resized_buffer_is_a_plugin_fault);
    RUN_TEST(test_empty_registry_renders_fallback);
    RUN_TEST(test_update_failure_degrades_driver);

    RUN_TEST(test_backend_swap_shuts_down_before_next_update);
    RUN_TEST(test_geometry_change_resizes_frames);
    RUN_TEST(test_tone_change_reconfigures_in_place);
    RUN_TEST(test_invalid_config_is_rejected);

    RUN_TEST(test_default_animation_is_active);
    RUN_TEST(test_switch_runs_cleanup_then_init);
    RUN_TEST(test_refused_init_reverts_to_previous);

    RUN_TEST(test_pause_skips_render_and_update);
    RUN_TEST(test_restart_resets_frame_index);
    RUN_TEST(test_frame_index_wraps);
    RUN_TEST(test_thread_start_stop_shuts_driver_down);
    RUN_TEST(test_changes_from_another_thread_keep_frames_sized);
    RUN_TEST(test_end_to_end_thirty_fps);

    return UNITY_END();
}

#endif // NATIVE_BUILD
