// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file LookupTables.h
 * @brief Gamma and index-map lookup tables with a memoizing cache
 *
 * Both tables are pure functions of their inputs:
 * - GammaTable: (depth, gamma) -> corrected intensity per input level
 * - IndexMap:   (width, height, wiring) -> linear buffer index per (x, y)
 *
 * Tables are immutable once built and shared by pointer. LookupTables keeps
 * the most recently used entries so that re-publishing an unchanged
 * configuration returns the same table instance (no rebuild).
 *
 * Thread Safety:
 * - Table objects are immutable and safe to read from any thread
 * - LookupTables::gamma()/indexMap() lock an internal mutex; they are called
 *   from ConfigStore::replace(), never from the render path
 */

#pragma once

#include "../config/Configuration.h"

#include <cstdint>
#include <cstddef>
#include <memory>
#include <mutex>
#include <vector>

namespace cosmicled {
namespace render {

// ============================================================================
// Gamma Table
// ============================================================================

/**
 * @brief Gamma correction table for one (depth, gamma) pair
 *
 * values[i] = round((i / max) ^ gamma * max), clamped to [0, max],
 * where max = 2^depth - 1.
 */
class GammaTable {
public:
    static constexpr uint8_t MIN_DEPTH = 1;
    static constexpr uint8_t MAX_DEPTH = 16;

    GammaTable(uint8_t depth, float gamma);

    uint8_t depth() const { return m_depth; }
    float gamma() const { return m_gamma; }
    uint16_t maxValue() const { return m_max; }
    size_t size() const { return m_values.size(); }

    /// Corrected value for an input level in [0, 2^depth)
    uint16_t operator[](size_t i) const { return m_values[i]; }

    /**
     * @brief Correct an 8-bit channel through this table
     *
     * The input is rescaled to the table depth, corrected, and rescaled back
     * to 8 bits. For depth < 8 this also quantizes to the output depth.
     */
    uint8_t apply8(uint8_t v) const { return m_lut8[v]; }

private:
    uint8_t m_depth;
    float m_gamma;
    uint16_t m_max;
    std::vector<uint16_t> m_values;
    uint8_t m_lut8[256];
};

// ============================================================================
// Index Map
// ============================================================================

/**
 * @brief Logical (x, y) to physical buffer index mapping
 *
 * Linear:     index = y * width + x
 * Serpentine: index = y * width + (y even ? x : width - 1 - x)
 */
class IndexMap {
public:
    IndexMap(uint16_t width, uint16_t height, config::WiringMode wiring);

    uint16_t width() const { return m_width; }
    uint16_t height() const { return m_height; }
    config::WiringMode wiring() const { return m_wiring; }
    uint32_t size() const { return static_cast<uint32_t>(m_forward.size()); }

    /// Physical index for a coordinate; caller guarantees x < width, y < height
    uint16_t toIndex(uint16_t x, uint16_t y) const {
        return m_forward[static_cast<uint32_t>(y) * m_width + x];
    }

    /// Physical index for a logical (row-major) pixel position
    uint16_t physical(uint32_t logical) const { return m_forward[logical]; }

    /**
     * @brief Inverse mapping
     * @return false if index is out of range
     */
    bool toXY(uint32_t index, uint16_t& x, uint16_t& y) const;

private:
    uint16_t m_width;
    uint16_t m_height;
    config::WiringMode m_wiring;
    std::vector<uint16_t> m_forward;   ///< logical -> physical
    std::vector<uint16_t> m_inverse;   ///< physical -> logical
};

using GammaTablePtr = std::shared_ptr<const GammaTable>;
using IndexMapPtr = std::shared_ptr<const IndexMap>;

/**
 * @brief Pure serpentine/linear index formula (no table)
 */
inline uint32_t serpentineIndex(uint16_t x, uint16_t y, uint16_t width, config::WiringMode mode) {
    const uint32_t row = static_cast<uint32_t>(y) * width;
    if (mode == config::WiringMode::SERPENTINE && (y & 1U)) {
        return row + (width - 1U - x);
    }
    return row + x;
}

// ============================================================================
// Cache
// ============================================================================

struct LookupStats {
    uint32_t gammaBuilds = 0;
    uint32_t gammaHits = 0;
    uint32_t mapBuilds = 0;
    uint32_t mapHits = 0;
};

/**
 * @brief Memoizing factory for gamma tables and index maps
 *
 * Keeps up to limits::LOOKUP_CACHE_ENTRIES of each kind; the least recently
 * used entry is evicted. Evicted tables stay alive while any snapshot still
 * references them.
 */
class LookupTables {
public:
    LookupTables();

    GammaTablePtr gamma(uint8_t depth, float gamma);
    IndexMapPtr indexMap(uint16_t width, uint16_t height, config::WiringMode wiring);

    LookupStats getStats() const;

    /// Drop all cached entries (stats are kept)
    void clear();

private:
    struct GammaEntry {
        GammaTablePtr table;
        uint32_t lastUse = 0;
    };
    struct MapEntry {
        IndexMapPtr map;
        uint32_t lastUse = 0;
    };

    mutable std::mutex m_mutex;
    std::vector<GammaEntry> m_gammaEntries;
    std::vector<MapEntry> m_mapEntries;
    uint32_t m_useCounter;
    LookupStats m_stats;
};

} // namespace render
} // namespace cosmicled
