// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file FrameBufferPool.h
 * @brief Bounded pool of reusable frame buffers
 *
 * acquire() hands out exclusive ownership (unique_ptr), so the same buffer
 * can never be held by two callers. release() clears to black and keeps the
 * buffer for reuse until the pool is back at capacity.
 *
 * When the pool is empty, acquire() allocates instead of blocking. That is a
 * PoolOverflow: counted in PoolStats and logged (rate-limited).
 *
 * Thread Safety:
 * - acquire()/release()/resize()/getStats() take a short internal mutex
 */

#pragma once

#include "FrameBuffer.h"

#include <cstdint>
#include <mutex>
#include <vector>

namespace cosmicled {
namespace render {

struct PoolStats {
    uint32_t acquires = 0;
    uint32_t releases = 0;
    uint32_t overflows = 0;     ///< Allocations past capacity
    uint32_t discards = 0;      ///< Buffers freed on release (full or stale)
    uint8_t freeBuffers = 0;
    uint8_t capacity = 0;
    uint32_t pixelCount = 0;
};

class FrameBufferPool {
public:
    /**
     * @param pixelCount Length of every buffer (width * height)
     * @param capacity Buffers kept in steady state
     */
    FrameBufferPool(uint32_t pixelCount, uint8_t capacity);

    FrameBufferPool(const FrameBufferPool&) = delete;
    FrameBufferPool& operator=(const FrameBufferPool&) = delete;

    /**
     * @brief Take a zeroed buffer of pixelCount() pixels
     *
     * Never blocks and never returns null.
     */
    FrameBufferPtr acquire();

    /**
     * @brief Return a buffer
     *
     * The buffer is cleared to black. It is freed instead of kept when the
     * pool already holds capacity buffers or its length does not match the
     * current pixel count.
     */
    void release(FrameBufferPtr buffer);

    /**
     * @brief Change the buffer length after a geometry change
     *
     * Free buffers are reallocated at the new size. Buffers still held by
     * callers are discarded when they come back.
     */
    void resize(uint32_t pixelCount);

    uint32_t pixelCount() const;
    uint8_t capacity() const { return m_capacity; }
    PoolStats getStats() const;

private:
    mutable std::mutex m_mutex;
    std::vector<FrameBufferPtr> m_free;
    uint32_t m_pixelCount;
    const uint8_t m_capacity;
    PoolStats m_stats;
    uint32_t m_lastOverflowLog = 0;
};

} // namespace render
} // namespace cosmicled
