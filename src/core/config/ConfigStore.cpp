// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file ConfigStore.cpp
 * @brief Validate-then-swap configuration publishing
 */

#include "ConfigStore.h"

#include <atomic>

#define CL_LOG_TAG "ConfigStore"
#include "../../utils/Log.h"

namespace cosmicled {
namespace config {

ConfigChange ConfigChange::between(const Configuration& prev, const Configuration& next) {
    ConfigChange change;
    change.backendChanged = prev.affectsBackend(next);
    change.geometryChanged = prev.width != next.width ||
                             prev.height != next.height ||
                             prev.wiring != next.wiring;
    change.toneChanged = prev.brightness != next.brightness ||
                         prev.gamma != next.gamma;
    change.timingChanged = prev.targetFps != next.targetFps;
    change.tuningChanged = prev.speed != next.speed ||
                           prev.scale != next.scale ||
                           prev.intensity != next.intensity ||
                           prev.paletteIndex != next.paletteIndex;
    return change;
}

// ==================== Constructor ====================

ConfigStore::ConfigStore(const Configuration& initial) {
    ConfigResult result = validate(initial);
    if (result.ok()) {
        m_active = buildSnapshot(initial, 1);
    } else {
        CL_LOGW("Initial configuration rejected (%s), using defaults", result.errorMsg);
        m_active = buildSnapshot(Configuration::stripPreset(), 1);
    }
}

// ==================== Query ====================

SnapshotPtr ConfigStore::get() const {
    return std::atomic_load(&m_active);
}

uint32_t ConfigStore::getVersion() const {
    return get()->version;
}

// ==================== Command ====================

ConfigResult ConfigStore::replace(const Configuration& next) {
    ConfigResult result = validate(next);
    if (!result.ok()) {
        CL_LOGW("Rejected configuration: %s", result.errorMsg);
        return result;
    }

    std::lock_guard<std::mutex> lock(m_writeMutex);

    SnapshotPtr previous = std::atomic_load(&m_active);
    SnapshotPtr snapshot = buildSnapshot(next, previous->version + 1);
    ConfigChange change = ConfigChange::between(previous->config, next);

    std::atomic_store(&m_active, snapshot);

    if (change.backendChanged) {
        CL_LOGI("Configuration v%u: backend %s %ux%u (driver rebuild)",
                static_cast<unsigned>(snapshot->version),
                backendName(next.backend), next.width, next.height);
    } else {
        CL_LOGD("Configuration v%u published", static_cast<unsigned>(snapshot->version));
    }

    if (change.any()) {
        for (uint8_t i = 0; i < m_subscriberCount; i++) {
            m_subscribers[i].callback(snapshot, change, m_subscribers[i].userData);
        }
    }

    return result;
}

SnapshotPtr ConfigStore::buildSnapshot(const Configuration& cfg, uint32_t version) {
    auto snapshot = std::make_shared<ConfigSnapshot>();
    snapshot->config = cfg;
    snapshot->gamma = m_tables.gamma(cfg.outputDepthBits(), cfg.gamma);
    snapshot->indexMap = m_tables.indexMap(cfg.width, cfg.height, cfg.wiring);
    snapshot->version = version;
    return snapshot;
}

// ==================== Subscription ====================

bool ConfigStore::subscribe(ConfigChangeCallback callback, void* userData) {
    if (callback == nullptr) {
        return false;
    }

    std::lock_guard<std::mutex> lock(m_writeMutex);
    if (m_subscriberCount >= MAX_SUBSCRIBERS) {
        return false;
    }
    for (uint8_t i = 0; i < m_subscriberCount; i++) {
        if (m_subscribers[i].callback == callback && m_subscribers[i].userData == userData) {
            return false;  // Already subscribed
        }
    }

    m_subscribers[m_subscriberCount].callback = callback;
    m_subscribers[m_subscriberCount].userData = userData;
    m_subscriberCount++;
    return true;
}

bool ConfigStore::unsubscribe(ConfigChangeCallback callback, void* userData) {
    if (callback == nullptr) {
        return false;
    }

    std::lock_guard<std::mutex> lock(m_writeMutex);
    for (uint8_t i = 0; i < m_subscriberCount; i++) {
        if (m_subscribers[i].callback == callback && m_subscribers[i].userData == userData) {
            // Shift remaining subscribers down
            for (uint8_t j = i; j + 1 < m_subscriberCount; j++) {
                m_subscribers[j] = m_subscribers[j + 1];
            }
            m_subscriberCount--;
            m_subscribers[m_subscriberCount] = Subscriber();
            return true;
        }
    }
    return false;
}

uint8_t ConfigStore::getSubscriberCount() const {
    std::lock_guard<std::mutex> lock(m_writeMutex);
    return m_subscriberCount;
}

} // namespace config
} // namespace cosmicled
