// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file Conductor.h
 * @brief Frame loop: render, push to the driver, pace, apply changes
 *
 * The Conductor owns the matrix driver, the frame buffer pool and the
 * performance monitor. One dedicated thread runs the loop; every driver
 * call happens on that thread.
 *
 * Cycle:
 *   1. Cycle start; exit if a stop was requested
 *   2. Apply the pending change (config snapshot, driver rebuild, plugin)
 *   3. Acquire a buffer from the pool
 *   4. Render through the active animation (fault -> substitute frame)
 *   5. driver->update() (retry once, then degrade to the no-op sink)
 *   6. Release the buffer
 *   7. Pace to the frame deadline (no catch-up on overrun)
 *   8. Record the cycle time in the performance monitor
 *
 * Control-plane calls (replaceConfig, requestAnimation, requestDriverRebuild)
 * come from other threads. They only fill a single pending-change slot;
 * the loop consumes it at step 2, never mid-frame. Within one cycle the
 * latest request wins per field.
 *
 * Observers read copies: getPerformance(), getStats(), isDriverFaulted(),
 * getDriverState().
 */

#pragma once

#include "../config/ConfigStore.h"
#include "../render/FrameBufferPool.h"
#include "../../hal/led/IMatrixDriver.h"
#include "../../hardware/PerformanceMonitor.h"
#include "../../plugins/AnimationRegistry.h"
#include "../../config/limits.h"

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>

namespace cosmicled {
namespace actors {

/**
 * @brief Loop statistics for observers
 */
struct ConductorStats {
    uint32_t cycles = 0;            ///< Loop iterations (paused ones included)
    uint32_t frames = 0;            ///< Frames rendered (substituted ones included)
    uint32_t frameIndex = 0;        ///< Index of the next frame
    uint32_t updates = 0;           ///< Successful driver updates
    uint32_t updateRetries = 0;     ///< First-attempt update failures
    uint32_t pluginFaults = 0;      ///< Frames replaced after a plugin failure
    uint32_t driverRebuilds = 0;    ///< Driver constructions after the first
    uint32_t degradations = 0;      ///< Swaps to the no-op sink after update failures
    config::BackendType backend = config::BackendType::SIMULATION;
    hal::DriverState driverState = hal::DriverState::UNINITIALIZED;
    hal::DriverCapabilities capabilities;
    bool paused = false;
    char currentAnimation[limits::MAX_ANIMATION_NAME] = {0};
};

class Conductor {
public:
    using DriverFactory =
        std::function<std::unique_ptr<hal::IMatrixDriver>(const config::SnapshotPtr&)>;

    /// Frame index wraps to 0 after this value
    static constexpr uint32_t MAX_FRAME_INDEX = 0x7FFFFFFFUL;

    /**
     * @param store Configuration source (subscribed for changes)
     * @param registry Animations available for requestAnimation()
     */
    Conductor(config::ConfigStore& store, plugins::AnimationRegistry& registry);

    /**
     * @param factory Returns an initialized driver for a snapshot; a null
     *        result is replaced by the no-op sink (default:
     *        hal::createMatrixDriver)
     */
    Conductor(config::ConfigStore& store, plugins::AnimationRegistry& registry,
              DriverFactory factory);

    ~Conductor();

    Conductor(const Conductor&) = delete;
    Conductor& operator=(const Conductor&) = delete;

    // ==================== Lifecycle ====================

    /**
     * @brief Start the loop on its own thread
     *
     * On ESP32 the thread is pinned to chip::RENDER_CORE when the driver
     * reports a reserved core.
     * @return false if already running
     */
    bool start();

    /**
     * @brief Stop the loop, blank and shut down the driver
     *
     * Cooperative: the loop exits at the start of its next cycle. Blocks
     * until the thread has exited. Safe to call when not running.
     */
    void stop();

    /**
     * @brief Run cycles on the calling thread
     * @return Cycles executed (0 if the loop thread is running)
     */
    uint32_t runFor(uint32_t cycles);

    /// Keep pacing and applying changes, but neither render nor update
    void pause();
    void resume();

    /// Reset the frame index and elapsed time at the next cycle
    void restart();

    bool isRunning() const { return m_running.load(); }
    bool isPaused() const { return m_paused.load(); }

    // ==================== Control Plane ====================

    /**
     * @brief Validate and publish a configuration
     *
     * Forwards to ConfigStore::replace(); an accepted snapshot reaches the
     * loop at its next step 2.
     */
    config::ConfigResult replaceConfig(const config::Configuration& next);

    /**
     * @brief Switch animation between frames
     * @return false if the name is not registered
     */
    bool requestAnimation(const char* name);

    /// Rebuild the driver from the current snapshot (e.g. after a fault)
    void requestDriverRebuild();

    // ==================== Observability ====================

    hardware::PerformanceStats getPerformance() const { return m_perf.snapshot(); }
    ConductorStats getStats() const;
    render::PoolStats getPoolStats() const { return m_pool.getStats(); }
    bool isDriverFaulted() const { return m_driverFaulted.load(); }
    hal::DriverState getDriverState() const {
        return static_cast<hal::DriverState>(m_driverState.load());
    }

    /// Next frame index after `index`
    static uint32_t nextFrameIndex(uint32_t index) {
        return (index >= MAX_FRAME_INDEX) ? 0 : index + 1;
    }

private:
    using Clock = std::chrono::steady_clock;

    /**
     * @brief Single-slot pending change, latest wins per field
     */
    struct PendingChange {
        config::SnapshotPtr snapshot;
        bool rebuildDriver = false;
        bool restart = false;
        bool hasAnimation = false;
        char animation[limits::MAX_ANIMATION_NAME] = {0};
    };

    static void onConfigChanged(const config::SnapshotPtr& snapshot,
                                const config::ConfigChange& change, void* userData);

    void threadMain();
    void prepare();
    bool runCycle();

    void applyPendingChange();
    void rebuildDriver();
    void switchAnimation(const char* name);
    void applySnapshot(const config::SnapshotPtr& snapshot);

    plugins::RenderContext buildContext(Clock::time_point now);
    void renderFrame(render::FrameBuffer& buffer, const plugins::RenderContext& ctx);
    void pushFrame(const render::FrameBuffer& buffer);
    void degradeDriver();
    void shutdownOutput();
    void publishStats();

    // Collaborators
    config::ConfigStore& m_store;
    plugins::AnimationRegistry& m_registry;
    DriverFactory m_factory;

    // Loop-owned state (conductor thread only)
    config::SnapshotPtr m_snapshot;
    std::unique_ptr<hal::IMatrixDriver> m_driver;
    render::FrameBufferPool m_pool;
    hardware::PerformanceMonitor m_perf;
    plugins::IAnimation* m_active = nullptr;
    CRGBPalette16 m_palette;
    render::FrameBuffer m_lastGood;
    uint32_t m_frameIndex = 0;
    Clock::time_point m_startTime;
    Clock::time_point m_lastRender;
    bool m_prepared = false;
    uint32_t m_lastFaultLog = 0;
    ConductorStats m_stats;

    // Pending change slot
    mutable std::mutex m_pendingMutex;
    PendingChange m_pending;

    // Published for observers
    mutable std::mutex m_statsMutex;
    ConductorStats m_publishedStats;
    std::atomic<bool> m_driverFaulted{false};
    std::atomic<uint8_t> m_driverState{static_cast<uint8_t>(hal::DriverState::UNINITIALIZED)};

    // Thread control
    std::thread m_thread;
    std::atomic<bool> m_running{false};
    std::atomic<bool> m_paused{false};
    std::atomic<bool> m_shutdownRequested{false};
};

} // namespace actors
} // namespace cosmicled
