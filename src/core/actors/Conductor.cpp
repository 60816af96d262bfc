// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file Conductor.cpp
 * @brief Frame loop implementation
 */

#include "Conductor.h"
#include "../../hal/led/MatrixDriverFactory.h"
#include "../../effects/BuiltinAnimations.h"
#include "../../effects/ieffect/SolidAnimation.h"
#include "../../palettes/Palettes.h"
#include "../../config/features.h"
#include "../../config/chip_config.h"

#include <cstring>
#include <utility>

#if !defined(NATIVE_BUILD) && FEATURE_CORE_PINNING
#include <esp_pthread.h>
#endif

#define CL_LOG_TAG "Conductor"
#include "../../utils/Log.h"

namespace cosmicled {
namespace actors {

// ============================================================================
// Construction
// ============================================================================

Conductor::Conductor(config::ConfigStore& store, plugins::AnimationRegistry& registry)
    : Conductor(store, registry, DriverFactory())
{
}

Conductor::Conductor(config::ConfigStore& store, plugins::AnimationRegistry& registry,
                     DriverFactory factory)
    : m_store(store)
    , m_registry(registry)
    , m_factory(std::move(factory))
    , m_snapshot(store.get())
    , m_pool(store.get()->config.pixelCount(), limits::FRAME_POOL_CAPACITY)
{
    if (!m_factory) {
        m_factory = [](const config::SnapshotPtr& snapshot) {
            return hal::createMatrixDriver(snapshot);
        };
    }
    if (!m_store.subscribe(&Conductor::onConfigChanged, this)) {
        CL_LOGW("Config subscription failed; changes require restart");
    }
}

Conductor::~Conductor() {
    stop();
    m_store.unsubscribe(&Conductor::onConfigChanged, this);
}

// ============================================================================
// Lifecycle
// ============================================================================

bool Conductor::start() {
    if (m_running.load() || m_thread.joinable()) {
        CL_LOGW("Already running");
        return false;
    }

    prepare();
    m_shutdownRequested = false;
    m_running = true;

#if !defined(NATIVE_BUILD) && FEATURE_CORE_PINNING
    esp_pthread_cfg_t threadCfg = esp_pthread_get_default_config();
    threadCfg.thread_name = "Conductor";
    threadCfg.stack_size = 8192;
    threadCfg.prio = 5;
    if (m_driver->capabilities().reservedCore) {
        threadCfg.pin_to_core = chip::RENDER_CORE;
        CL_LOGI("Pinning to core %u", chip::RENDER_CORE);
    }
    esp_pthread_set_cfg(&threadCfg);
#endif

    // The loop owns m_snapshot once the thread exists
    CL_LOGI("Starting: %dx%d @ %d FPS", static_cast<int>(m_snapshot->config.width),
            static_cast<int>(m_snapshot->config.height),
            static_cast<int>(m_snapshot->config.targetFps));
    m_thread = std::thread(&Conductor::threadMain, this);
    return true;
}

void Conductor::stop() {
    if (m_thread.joinable()) {
        CL_LOGI("Stopping...");
        m_shutdownRequested = true;
        m_thread.join();
        CL_LOGI("Stopped");
        return;
    }

    // runFor() callers: nothing to join, release the output here
    if (m_prepared) {
        shutdownOutput();
    }
}

uint32_t Conductor::runFor(uint32_t cycles) {
    if (m_running.load()) {
        return 0;
    }

    prepare();
    m_shutdownRequested = false;

    uint32_t executed = 0;
    while (executed < cycles && runCycle()) {
        executed++;
    }
    return executed;
}

void Conductor::pause() {
    if (!m_paused.exchange(true)) {
        CL_LOGI("Paused");
    }
}

void Conductor::resume() {
    if (m_paused.exchange(false)) {
        CL_LOGI("Resumed");
    }
}

void Conductor::restart() {
    std::lock_guard<std::mutex> lock(m_pendingMutex);
    m_pending.restart = true;
}

void Conductor::threadMain() {
    while (runCycle()) {
    }
    // Never leave the hardware mid-write
    shutdownOutput();
    m_running = false;
}

/**
 * Build the first driver and pick the initial animation. Runs on the
 * calling thread before the loop thread exists.
 */
void Conductor::prepare() {
    if (m_prepared) {
        return;
    }

    m_snapshot = m_store.get();
    m_pool.resize(m_snapshot->config.pixelCount());
    m_perf.begin(m_snapshot->config.targetFps);
    m_palette = palettes::getPalette(m_snapshot->config.paletteIndex);
    m_frameIndex = 0;
    m_startTime = Clock::now();
    m_lastRender = m_startTime;

    m_driver = m_factory(m_snapshot);
    if (!m_driver) {
        m_driver = hal::createFallbackDriver(m_snapshot, m_snapshot->config.backend);
    }
    m_driverFaulted = (m_driver->state() == hal::DriverState::DEGRADED);
    m_driverState = static_cast<uint8_t>(m_driver->state());

    bool animationQueued;
    {
        std::lock_guard<std::mutex> lock(m_pendingMutex);
        animationQueued = m_pending.hasAnimation;
    }
    if (!animationQueued && m_active == nullptr) {
        const char* initial = effects::DEFAULT_ANIMATION;
        if (!m_registry.contains(initial) && m_registry.count() > 0) {
            initial = m_registry.at(0)->getMetadata().name;
        }
        switchAnimation(initial);
    }

    m_prepared = true;
    publishStats();
}

// ============================================================================
// Control Plane
// ============================================================================

config::ConfigResult Conductor::replaceConfig(const config::Configuration& next) {
    return m_store.replace(next);
}

void Conductor::onConfigChanged(const config::SnapshotPtr& snapshot,
                                const config::ConfigChange& change, void* userData) {
    (void)change;  // re-derived against the loop's own snapshot at apply time
    Conductor* self = static_cast<Conductor*>(userData);
    std::lock_guard<std::mutex> lock(self->m_pendingMutex);
    self->m_pending.snapshot = snapshot;
}

bool Conductor::requestAnimation(const char* name) {
    if (!m_registry.contains(name)) {
        CL_LOGW("Unknown animation '%s'", name ? name : "(null)");
        return false;
    }
    std::lock_guard<std::mutex> lock(m_pendingMutex);
    strncpy(m_pending.animation, name, sizeof(m_pending.animation) - 1);
    m_pending.animation[sizeof(m_pending.animation) - 1] = '\0';
    m_pending.hasAnimation = true;
    return true;
}

void Conductor::requestDriverRebuild() {
    std::lock_guard<std::mutex> lock(m_pendingMutex);
    m_pending.rebuildDriver = true;
}

// ============================================================================
// Loop
// ============================================================================

bool Conductor::runCycle() {
    // 1. Cycle start / cooperative cancellation
    const Clock::time_point cycleStart = Clock::now();
    if (m_shutdownRequested.load()) {
        return false;
    }

    // 2. Pending configuration, driver and plugin changes
    applyPendingChange();

    const bool paused = m_paused.load();
    if (!paused) {
        // 3. Acquire
        render::FrameBufferPtr buffer = m_pool.acquire();

        // 4. Render (faults substituted inside)
        plugins::RenderContext ctx = buildContext(cycleStart);
        renderFrame(*buffer, ctx);

        // 5. Output
        pushFrame(*buffer);

        // 6. Release
        m_pool.release(std::move(buffer));

        m_lastRender = cycleStart;
        m_frameIndex = nextFrameIndex(m_frameIndex);
        m_stats.frames++;
    }
    m_stats.cycles++;

    // 7. Pace; an overrun proceeds immediately with no catch-up
    const Clock::time_point deadline =
        cycleStart + std::chrono::microseconds(m_snapshot->config.frameIntervalUs());
    if (Clock::now() < deadline) {
        std::this_thread::sleep_until(deadline);
    }

    // 8. Record the full cycle time (work plus pacing)
    const auto cycleUs = std::chrono::duration_cast<std::chrono::microseconds>(
        Clock::now() - cycleStart).count();
    m_perf.record(static_cast<uint32_t>(cycleUs));

    m_stats.paused = paused;
    publishStats();
    return true;
}

void Conductor::applyPendingChange() {
    PendingChange change;
    {
        std::lock_guard<std::mutex> lock(m_pendingMutex);
        change = m_pending;
        m_pending = PendingChange();
    }

    if (change.restart) {
        m_frameIndex = 0;
        m_startTime = Clock::now();
        m_lastRender = m_startTime;
        CL_LOGI("Restarted frame index");
    }

    if (change.snapshot) {
        const bool backendChanged = change.snapshot->config.affectsBackend(m_snapshot->config);
        applySnapshot(change.snapshot);
        if (backendChanged || change.rebuildDriver) {
            rebuildDriver();
        } else {
            m_driver->reconfigure(m_snapshot);
            m_driver->setBrightness(m_snapshot->config.brightness);
        }
    } else if (change.rebuildDriver) {
        rebuildDriver();
    }

    if (change.hasAnimation) {
        switchAnimation(change.animation);
    }
}

void Conductor::applySnapshot(const config::SnapshotPtr& snapshot) {
    const config::Configuration& prev = m_snapshot->config;
    const config::Configuration& next = snapshot->config;

    if (next.pixelCount() != prev.pixelCount()) {
        m_pool.resize(next.pixelCount());
        m_lastGood.clear();
    }
    if (next.targetFps != prev.targetFps) {
        m_perf.setTargetFps(next.targetFps);
    }
    if (next.paletteIndex != prev.paletteIndex) {
        m_palette = palettes::getPalette(next.paletteIndex);
    }
    m_snapshot = snapshot;
}

void Conductor::rebuildDriver() {
    // The previous frame's buffer is already back in the pool here
    if (m_driver) {
        m_driver->shutdown();
        m_driver.reset();
    }

    m_driver = m_factory(m_snapshot);
    if (!m_driver) {
        m_driver = hal::createFallbackDriver(m_snapshot, m_snapshot->config.backend);
    }
    m_stats.driverRebuilds++;

    const hal::DriverState state = m_driver->state();
    m_driverState = static_cast<uint8_t>(state);
    // A live rebuild clears an earlier fault
    m_driverFaulted = (state != hal::DriverState::LIVE);

    CL_LOGI("Driver rebuilt: %s (%s)", config::backendName(m_driver->backend()),
            hal::driverStateName(state));
}

void Conductor::switchAnimation(const char* name) {
    plugins::IAnimation* next = m_registry.find(name);
    if (next == nullptr) {
        CL_LOGW("Invalid animation '%s'", name);
        return;
    }
    if (next == m_active) {
        return;
    }

    plugins::IAnimation* prev = m_active;
    if (prev != nullptr) {
        CL_LOGI("Animation cleanup: %s", prev->getMetadata().name);
        prev->cleanup();
    }

    plugins::RenderContext initCtx = buildContext(Clock::now());
    if (!next->init(initCtx)) {
        // Initialization failed - revert to previous animation
        CL_LOGW("Animation '%s' init failed, reverting to '%s'", name,
                prev ? prev->getMetadata().name : "(none)");
        if (prev != nullptr && !prev->init(initCtx)) {
            CL_LOGW("Previous animation failed to re-init, using fallback colour");
            prev = nullptr;
        }
        m_active = prev;
        return;
    }

    m_active = next;
    CL_LOGI("Animation changed: %s -> " CL_CLR_GREEN "%s" CL_ANSI_RESET,
            prev ? prev->getMetadata().name : "(none)", next->getMetadata().name);
}

plugins::RenderContext Conductor::buildContext(Clock::time_point now) {
    const config::Configuration& cfg = m_snapshot->config;
    plugins::RenderContext ctx;

    ctx.frameIndex = m_frameIndex;
    ctx.elapsedSeconds = std::chrono::duration<float>(now - m_startTime).count();
    ctx.deltaSeconds = std::chrono::duration<float>(now - m_lastRender).count();
    ctx.width = cfg.width;
    ctx.height = cfg.height;
    ctx.brightness = cfg.brightness;
    ctx.gamma = cfg.gamma;
    ctx.palette = &m_palette;
    ctx.speed = cfg.speed;
    ctx.scale = cfg.scale;
    ctx.intensity = cfg.intensity;
    ctx.gammaTable = m_snapshot->gamma.get();
    ctx.indexMap = m_snapshot->indexMap.get();
    return ctx;
}

void Conductor::renderFrame(render::FrameBuffer& buffer, const plugins::RenderContext& ctx) {
    const size_t expected = ctx.pixelCount();

    bool ok = false;
    if (m_active != nullptr) {
        ok = m_active->render(buffer, ctx);
        // Emptying or resizing the buffer violates the contract
        if (ok && (buffer.empty() || buffer.size() != expected)) {
            ok = false;
        }

        if (!ok) {
            m_stats.pluginFaults++;
            CL_LOG_THROTTLE(m_lastFaultLog, 1000,
                CL_LOGW("Plugin fault in '%s' (frame %u, %u total)",
                        m_active->getMetadata().name,
                        static_cast<unsigned>(ctx.frameIndex),
                        static_cast<unsigned>(m_stats.pluginFaults)));
        }
    }

    if (ok) {
        m_lastGood.assign(buffer.begin(), buffer.end());
        return;
    }

    // Substitute: previous good frame, else a solid fallback colour
    if (m_lastGood.size() == expected) {
        buffer.assign(m_lastGood.begin(), m_lastGood.end());
    } else {
        buffer.assign(expected, effects::ieffect::SolidAnimation::fallbackColor(ctx));
    }
}

void Conductor::pushFrame(const render::FrameBuffer& buffer) {
    hal::DriverResult result = m_driver->update(buffer);
    if (result == hal::DriverResult::OK) {
        m_stats.updates++;
        return;
    }

    // Retry once immediately
    m_stats.updateRetries++;
    CL_LOGW("Driver update failed (%s), retrying", hal::driverResultName(result));
    result = m_driver->update(buffer);
    if (result == hal::DriverResult::OK) {
        m_stats.updates++;
        return;
    }

    degradeDriver();
    if (m_driver->update(buffer) == hal::DriverResult::OK) {
        m_stats.updates++;
    }
}

void Conductor::degradeDriver() {
    const config::BackendType backend = m_driver->backend();
    CL_LOGW("Driver %s failed twice, switching to no-op sink", config::backendName(backend));

    m_driver->shutdown();
    m_driver.reset();
    m_driver = hal::createFallbackDriver(m_snapshot, backend);

    m_stats.degradations++;
    m_driverState = static_cast<uint8_t>(m_driver->state());
    m_driverFaulted = true;
}

void Conductor::shutdownOutput() {
    if (m_driver) {
        m_driver->clear();
        m_driver->shutdown();
        m_driverState = static_cast<uint8_t>(m_driver->state());
    }
    if (m_active != nullptr) {
        m_active->cleanup();
        m_active = nullptr;
    }
    m_prepared = false;
    publishStats();
}

void Conductor::publishStats() {
    m_stats.frameIndex = m_frameIndex;
    if (m_driver) {
        m_stats.backend = m_driver->backend();
        m_stats.driverState = m_driver->state();
        m_stats.capabilities = m_driver->capabilities();
    }
    const char* name = (m_active != nullptr) ? m_active->getMetadata().name : "";
    strncpy(m_stats.currentAnimation, name, sizeof(m_stats.currentAnimation) - 1);
    m_stats.currentAnimation[sizeof(m_stats.currentAnimation) - 1] = '\0';

    std::lock_guard<std::mutex> lock(m_statsMutex);
    m_publishedStats = m_stats;
}

ConductorStats Conductor::getStats() const {
    std::lock_guard<std::mutex> lock(m_statsMutex);
    return m_publishedStats;
}

} // namespace actors
} // namespace cosmicled
