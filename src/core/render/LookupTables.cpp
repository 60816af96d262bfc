// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file LookupTables.cpp
 * @brief Gamma/index table construction and LRU cache
 */

#include "LookupTables.h"
#include "../../config/limits.h"

#include <algorithm>
#include <cmath>

#define CL_LOG_TAG "LookupTables"
#include "../../utils/Log.h"

namespace cosmicled {
namespace render {

// ============================================================================
// GammaTable
// ============================================================================

GammaTable::GammaTable(uint8_t depth, float gamma)
    : m_depth(std::min<uint8_t>(std::max<uint8_t>(depth, MIN_DEPTH), MAX_DEPTH))
    , m_gamma(gamma)
    , m_max(static_cast<uint16_t>((1UL << m_depth) - 1UL))
{
    const uint32_t count = 1UL << m_depth;
    m_values.resize(count);

    const double maxF = static_cast<double>(m_max);
    for (uint32_t i = 0; i < count; ++i) {
        const double normalized = static_cast<double>(i) / maxF;
        double corrected = std::round(std::pow(normalized, static_cast<double>(gamma)) * maxF);
        if (corrected < 0.0) corrected = 0.0;
        if (corrected > maxF) corrected = maxF;
        m_values[i] = static_cast<uint16_t>(corrected);
    }

    // 8-bit view: rescale input to table depth, correct, rescale back
    for (uint32_t v = 0; v < 256; ++v) {
        uint32_t idx;
        if (m_depth == 8) {
            idx = v;
        } else if (m_depth < 8) {
            idx = v >> (8 - m_depth);
        } else {
            idx = (v * m_max + 127U) / 255U;
        }
        const uint32_t out = m_values[idx];
        if (m_depth == 8) {
            m_lut8[v] = static_cast<uint8_t>(out);
        } else {
            m_lut8[v] = static_cast<uint8_t>((out * 255U + m_max / 2U) / m_max);
        }
    }
}

// ============================================================================
// IndexMap
// ============================================================================

IndexMap::IndexMap(uint16_t width, uint16_t height, config::WiringMode wiring)
    : m_width(width)
    , m_height(height)
    , m_wiring(wiring)
{
    const uint32_t count = static_cast<uint32_t>(width) * height;
    m_forward.resize(count);
    m_inverse.resize(count);

    for (uint16_t y = 0; y < height; ++y) {
        for (uint16_t x = 0; x < width; ++x) {
            const uint32_t logical = static_cast<uint32_t>(y) * width + x;
            const uint32_t physical = serpentineIndex(x, y, width, wiring);
            m_forward[logical] = static_cast<uint16_t>(physical);
            m_inverse[physical] = static_cast<uint16_t>(logical);
        }
    }
}

bool IndexMap::toXY(uint32_t index, uint16_t& x, uint16_t& y) const {
    if (index >= m_inverse.size()) {
        return false;
    }
    const uint32_t logical = m_inverse[index];
    x = static_cast<uint16_t>(logical % m_width);
    y = static_cast<uint16_t>(logical / m_width);
    return true;
}

// ============================================================================
// LookupTables
// ============================================================================

LookupTables::LookupTables()
    : m_useCounter(0)
{
    m_gammaEntries.reserve(limits::LOOKUP_CACHE_ENTRIES);
    m_mapEntries.reserve(limits::LOOKUP_CACHE_ENTRIES);
}

GammaTablePtr LookupTables::gamma(uint8_t depth, float gamma) {
    std::lock_guard<std::mutex> lock(m_mutex);
    ++m_useCounter;

    for (auto& entry : m_gammaEntries) {
        if (entry.table->depth() == depth && entry.table->gamma() == gamma) {
            entry.lastUse = m_useCounter;
            m_stats.gammaHits++;
            return entry.table;
        }
    }

    GammaTablePtr table = std::make_shared<const GammaTable>(depth, gamma);
    m_stats.gammaBuilds++;
    CL_LOGD("Gamma table built: depth=%u gamma=%.2f (%u entries)",
            depth, gamma, static_cast<unsigned>(table->size()));

    if (m_gammaEntries.size() < limits::LOOKUP_CACHE_ENTRIES) {
        m_gammaEntries.push_back(GammaEntry{table, m_useCounter});
    } else {
        auto oldest = std::min_element(m_gammaEntries.begin(), m_gammaEntries.end(),
            [](const GammaEntry& a, const GammaEntry& b) { return a.lastUse < b.lastUse; });
        *oldest = GammaEntry{table, m_useCounter};
    }
    return table;
}

IndexMapPtr LookupTables::indexMap(uint16_t width, uint16_t height, config::WiringMode wiring) {
    std::lock_guard<std::mutex> lock(m_mutex);
    ++m_useCounter;

    for (auto& entry : m_mapEntries) {
        if (entry.map->width() == width && entry.map->height() == height &&
            entry.map->wiring() == wiring) {
            entry.lastUse = m_useCounter;
            m_stats.mapHits++;
            return entry.map;
        }
    }

    IndexMapPtr map = std::make_shared<const IndexMap>(width, height, wiring);
    m_stats.mapBuilds++;
    CL_LOGD("Index map built: %ux%u %s", width, height, config::wiringName(wiring));

    if (m_mapEntries.size() < limits::LOOKUP_CACHE_ENTRIES) {
        m_mapEntries.push_back(MapEntry{map, m_useCounter});
    } else {
        auto oldest = std::min_element(m_mapEntries.begin(), m_mapEntries.end(),
            [](const MapEntry& a, const MapEntry& b) { return a.lastUse < b.lastUse; });
        *oldest = MapEntry{map, m_useCounter};
    }
    return map;
}

LookupStats LookupTables::getStats() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_stats;
}

void LookupTables::clear() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_gammaEntries.clear();
    m_mapEntries.clear();
}

} // namespace render
} // namespace cosmicled
