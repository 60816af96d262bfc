// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file FrameBufferPool.cpp
 * @brief Bounded frame buffer pool with overflow accounting
 */

#include "FrameBufferPool.h"

#include <algorithm>

#define CL_LOG_TAG "Pool"
#include "../../utils/Log.h"

namespace cosmicled {
namespace render {

FrameBufferPool::FrameBufferPool(uint32_t pixelCount, uint8_t capacity)
    : m_pixelCount(pixelCount)
    , m_capacity(capacity > 0 ? capacity : 1)
{
    m_free.reserve(m_capacity);
    for (uint8_t i = 0; i < m_capacity; i++) {
        m_free.push_back(FrameBufferPtr(new FrameBuffer(m_pixelCount, CRGB::Black)));
    }
}

FrameBufferPtr FrameBufferPool::acquire() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_stats.acquires++;
        if (!m_free.empty()) {
            FrameBufferPtr buffer = std::move(m_free.back());
            m_free.pop_back();
            return buffer;
        }
        m_stats.overflows++;
        CL_LOG_THROTTLE(m_lastOverflowLog, 1000,
            CL_LOGW("Pool exhausted, allocating overflow buffer (%u total overflows)",
                    static_cast<unsigned>(m_stats.overflows)));
    }
    // Allocate outside the lock; the caller owns it exclusively either way
    return FrameBufferPtr(new FrameBuffer(pixelCount(), CRGB::Black));
}

void FrameBufferPool::release(FrameBufferPtr buffer) {
    if (!buffer) {
        return;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    m_stats.releases++;

    if (m_free.size() >= m_capacity || buffer->size() != m_pixelCount) {
        m_stats.discards++;
        return;  // unique_ptr frees it
    }

    std::fill(buffer->begin(), buffer->end(), CRGB(CRGB::Black));
    m_free.push_back(std::move(buffer));
}

void FrameBufferPool::resize(uint32_t pixelCount) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (pixelCount == m_pixelCount) {
        return;
    }

    CL_LOGI("Resizing frame buffers: %u -> %u pixels",
            static_cast<unsigned>(m_pixelCount), static_cast<unsigned>(pixelCount));
    m_pixelCount = pixelCount;
    for (auto& buffer : m_free) {
        buffer->assign(m_pixelCount, CRGB::Black);
    }
}

uint32_t FrameBufferPool::pixelCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_pixelCount;
}

PoolStats FrameBufferPool::getStats() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    PoolStats stats = m_stats;
    stats.freeBuffers = static_cast<uint8_t>(m_free.size());
    stats.capacity = m_capacity;
    stats.pixelCount = m_pixelCount;
    return stats;
}

} // namespace render
} // namespace cosmicled
