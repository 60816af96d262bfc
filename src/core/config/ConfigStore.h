// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file ConfigStore.h
 * @brief Immutable configuration snapshots with atomic swap
 *
 * Architecture:
 * - The active snapshot is a shared_ptr<const ConfigSnapshot>
 * - get() is a lock-free atomic load; the caller keeps the snapshot alive
 *   for as long as it holds the pointer (in-flight frames stay valid)
 * - replace() validates, resolves lookup tables through the cache, then
 *   atomically stores the new snapshot
 * - Subscribers are notified after the swap with a change set
 *
 * Usage:
 *   ConfigStore store;
 *   auto snap = store.get();
 *   uint16_t w = snap->config.width;
 *
 *   Configuration next = snap->config;
 *   next.brightness = 0.8f;
 *   ConfigResult r = store.replace(next);
 *   if (!r.ok()) { ... r.errorMsg ... }
 */

#pragma once

#include "Configuration.h"
#include "../render/LookupTables.h"

#include <cstdint>
#include <memory>
#include <mutex>

namespace cosmicled {
namespace config {

/**
 * @brief Configuration plus the lookup tables derived from it
 */
struct ConfigSnapshot {
    Configuration config;
    render::GammaTablePtr gamma;      ///< (outputDepthBits, gamma)
    render::IndexMapPtr indexMap;     ///< (width, height, wiring)
    uint32_t version = 0;             ///< Increments on every accepted replace
};

using SnapshotPtr = std::shared_ptr<const ConfigSnapshot>;

/**
 * @brief Which groups of fields differ between two snapshots
 */
struct ConfigChange {
    bool backendChanged = false;      ///< Driver must be rebuilt
    bool geometryChanged = false;     ///< width/height/wiring
    bool toneChanged = false;         ///< brightness/gamma
    bool timingChanged = false;       ///< target frame rate
    bool tuningChanged = false;       ///< speed/scale/intensity/palette

    bool any() const {
        return backendChanged || geometryChanged || toneChanged ||
               timingChanged || tuningChanged;
    }

    static ConfigChange between(const Configuration& prev, const Configuration& next);
};

/// Change callback: new snapshot, change set, user pointer
using ConfigChangeCallback = void(*)(const SnapshotPtr& snapshot,
                                     const ConfigChange& change,
                                     void* userData);

class ConfigStore {
public:
    static constexpr uint8_t MAX_SUBSCRIBERS = 8;

    /**
     * @brief Construct with an initial configuration
     *
     * An invalid initial configuration is logged and replaced by the
     * default preset so that get() never returns null.
     */
    explicit ConfigStore(const Configuration& initial = Configuration());

    /**
     * @brief Current snapshot (wait-free for the caller, never null)
     */
    SnapshotPtr get() const;

    /**
     * @brief Validate and publish a new configuration
     * @return ConfigResult; on INVALID the active snapshot is unchanged
     */
    ConfigResult replace(const Configuration& next);

    // ==================== Subscription ====================

    /**
     * Subscribers run on the replacing thread after the swap, outside the
     * read path. Keep them short: the conductor only queues the change.
     */
    bool subscribe(ConfigChangeCallback callback, void* userData);
    bool unsubscribe(ConfigChangeCallback callback, void* userData);
    uint8_t getSubscriberCount() const;

    // ==================== Diagnostics ====================

    uint32_t getVersion() const;
    render::LookupStats getLookupStats() const { return m_tables.getStats(); }

private:
    SnapshotPtr buildSnapshot(const Configuration& cfg, uint32_t version);

    struct Subscriber {
        ConfigChangeCallback callback = nullptr;
        void* userData = nullptr;
    };

    SnapshotPtr m_active;                 ///< Accessed via std::atomic_load/store
    mutable std::mutex m_writeMutex;      ///< Serializes replace() and subscriptions
    render::LookupTables m_tables;

    Subscriber m_subscribers[MAX_SUBSCRIBERS];
    uint8_t m_subscriberCount = 0;
};

} // namespace config
} // namespace cosmicled
