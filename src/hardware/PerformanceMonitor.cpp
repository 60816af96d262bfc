/**
 * @file PerformanceMonitor.cpp
 * @brief Implementation of PerformanceMonitor for CosmicLED
 */

#include "PerformanceMonitor.h"

#define CL_LOG_TAG "Perf"
#include "../utils/Log.h"

namespace cosmicled {
namespace hardware {

void PerformanceMonitor::begin(uint16_t targetFPS) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_targetFrameTime = 1000000UL / (targetFPS > 0 ? targetFPS : 1);  // Convert to microseconds
    m_frameCount = 0;
    m_droppedFrames = 0;
    m_historyIndex = 0;
    m_historyCount = 0;
    for (uint8_t i = 0; i < HISTORY_SIZE; i++) {
        m_history[i] = 0;
    }
    m_startTime = Clock::now();

    CL_LOGI("Performance Monitor initialized (target %u FPS)", targetFPS);
}

void PerformanceMonitor::setTargetFps(uint16_t targetFPS) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_targetFrameTime = 1000000UL / (targetFPS > 0 ? targetFPS : 1);
}

void PerformanceMonitor::record(uint32_t frameTimeUs) {
    std::lock_guard<std::mutex> lock(m_mutex);

    m_history[m_historyIndex] = frameTimeUs;
    m_historyIndex = static_cast<uint8_t>((m_historyIndex + 1) % HISTORY_SIZE);
    if (m_historyCount < HISTORY_SIZE) {
        m_historyCount++;
    }
    m_frameCount++;

    // Dropped: overran the slot by more than one full frame interval
    if (frameTimeUs > m_targetFrameTime * 2) {
        m_droppedFrames++;
    }
}

PerformanceStats PerformanceMonitor::snapshot() const {
    uint32_t window[HISTORY_SIZE];
    uint8_t count;
    uint8_t newest;
    PerformanceStats stats;

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        count = m_historyCount;
        newest = static_cast<uint8_t>((m_historyIndex + HISTORY_SIZE - 1) % HISTORY_SIZE);
        for (uint8_t i = 0; i < HISTORY_SIZE; i++) {
            window[i] = m_history[i];
        }
        stats.droppedFrames = m_droppedFrames;
        stats.totalFrames = m_frameCount;
        stats.uptimeMs = static_cast<uint32_t>(
            std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - m_startTime).count());
    }

    stats.windowSamples = count;
    if (count == 0) {
        return stats;
    }

    // Samples occupy slots [0, count) until the window wraps
    uint64_t sum = 0;
    uint32_t minTime = UINT32_MAX;
    uint32_t maxTime = 0;
    for (uint8_t i = 0; i < count; i++) {
        const uint32_t t = window[i];
        sum += t;
        if (t < minTime) minTime = t;
        if (t > maxTime) maxTime = t;
    }

    stats.avgFrameTimeUs = static_cast<uint32_t>(sum / count);
    stats.minFrameTimeUs = minTime;
    stats.maxFrameTimeUs = maxTime;
    stats.fps = (stats.avgFrameTimeUs > 0) ? 1000000.0f / static_cast<float>(stats.avgFrameTimeUs) : 0.0f;
    stats.instantFps = (window[newest] > 0) ? 1000000.0f / static_cast<float>(window[newest]) : 0.0f;
    return stats;
}

uint32_t PerformanceMonitor::getTargetFrameTimeUs() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_targetFrameTime;
}

} // namespace hardware
} // namespace cosmicled
