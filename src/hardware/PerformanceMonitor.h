// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file PerformanceMonitor.h
 * @brief Rolling-window frame statistics for CosmicLED
 *
 * Usage:
 * @code
 * cosmicled::hardware::PerformanceMonitor perfMon;
 * perfMon.begin(30);  // Target 30 FPS
 *
 * // In the conductor loop, once per cycle
 * perfMon.record(cycleUs);
 *
 * // From any observer thread
 * PerformanceStats stats = perfMon.snapshot();
 * @endcode
 */

#ifndef COSMICLED_HARDWARE_PERFORMANCE_MONITOR_H
#define COSMICLED_HARDWARE_PERFORMANCE_MONITOR_H

#include <chrono>
#include <cstdint>
#include <mutex>

namespace cosmicled {
namespace hardware {

/**
 * @brief Performance statistics for observers
 *
 * Everything here is derived on read from the sample window.
 */
struct PerformanceStats {
    float fps = 0.0f;                 ///< 1 / average frame time over the window
    float instantFps = 0.0f;          ///< 1 / most recent frame time
    uint32_t avgFrameTimeUs = 0;      ///< Window average
    uint32_t minFrameTimeUs = 0;      ///< Window minimum
    uint32_t maxFrameTimeUs = 0;      ///< Window maximum
    uint32_t droppedFrames = 0;       ///< Total dropped frames
    uint32_t totalFrames = 0;         ///< Total frames recorded
    uint32_t uptimeMs = 0;            ///< Since begin()
    uint8_t windowSamples = 0;        ///< Samples currently in the window
};

/**
 * @brief Rolling-window performance monitor
 *
 * Features:
 * - Fixed circular window of HISTORY_SIZE frame durations
 * - Dropped frame detection (> 2x target frame time, i.e. the frame
 *   overran its slot by more than one full interval)
 * - Derived metrics computed in snapshot(), never stored
 *
 * Thread Safety:
 * - record() is called from the conductor thread only
 * - snapshot() may be called from any thread; it copies the window under a
 *   short lock and computes outside it
 */
class PerformanceMonitor {
public:
    // History buffer size
    static constexpr uint8_t HISTORY_SIZE = 60;

    PerformanceMonitor() = default;

    /**
     * @brief Reset all counters and set the target frame rate
     * @param targetFPS Target frame rate (default 30)
     */
    void begin(uint16_t targetFPS = 30);

    /**
     * @brief Change the target without clearing history
     */
    void setTargetFps(uint16_t targetFPS);

    /**
     * @brief Append one frame duration
     * @param frameTimeUs Cycle duration in microseconds
     */
    void record(uint32_t frameTimeUs);

    /**
     * @brief Copy of the current statistics
     */
    PerformanceStats snapshot() const;

    uint32_t getTargetFrameTimeUs() const;

private:
    using Clock = std::chrono::steady_clock;

    mutable std::mutex m_mutex;

    uint32_t m_history[HISTORY_SIZE] = {0};
    uint8_t m_historyIndex = 0;
    uint8_t m_historyCount = 0;

    uint32_t m_targetFrameTime = 33333;   ///< Microseconds
    uint32_t m_frameCount = 0;
    uint32_t m_droppedFrames = 0;
    Clock::time_point m_startTime = Clock::now();
};

} // namespace hardware
} // namespace cosmicled

#endif // COSMICLED_HARDWARE_PERFORMANCE_MONITOR_H
