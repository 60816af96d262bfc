#include "SimulationDriver.h"
#include "FrameComposer.h"

#include <algorithm>

#define CL_LOG_TAG "SimDriver"
#include "../../utils/Log.h"

namespace cosmicled {
namespace hal {

SimulationDriver::SimulationDriver(const config::SnapshotPtr& snapshot, bool degraded,
                                   config::BackendType standInFor)
    : m_snapshot(snapshot)
    , m_degraded(degraded)
    , m_standInFor(standInFor)
{
}

SimulationDriver::~SimulationDriver() {
    shutdown();
}

bool SimulationDriver::init() {
    if (m_state != DriverState::UNINITIALIZED || !m_snapshot) {
        return false;
    }

    m_pixels.assign(m_snapshot->config.pixelCount(), CRGB::Black);
    m_brightness = brightnessTo8(m_snapshot->config.brightness);
    m_stats.currentBrightness = m_brightness;
    m_state = m_degraded ? DriverState::DEGRADED : DriverState::LIVE;

    if (m_degraded) {
        CL_LOGW("No-op sink standing in for %s backend (%u pixels)",
                config::backendName(m_standInFor), static_cast<unsigned>(m_pixels.size()));
    } else {
        CL_LOGI("Simulation sink: %dx%d", static_cast<int>(m_snapshot->config.width),
                static_cast<int>(m_snapshot->config.height));
    }
    return true;
}

DriverResult SimulationDriver::update(const render::FrameBuffer& frame) {
    if (m_state != DriverState::LIVE && m_state != DriverState::DEGRADED) {
        m_stats.rejectedUpdates++;
        return DriverResult::NOT_LIVE;
    }
    if (frame.size() != m_pixels.size()) {
        m_stats.rejectedUpdates++;
        return DriverResult::SIZE_MISMATCH;
    }

    uint32_t start = driverMicros();
    composeFrame(frame, *m_snapshot->gamma, *m_snapshot->indexMap, m_brightness, m_pixels.data());
    recordUpdateTiming(m_stats, driverMicros() - start);
    return DriverResult::OK;
}

DriverResult SimulationDriver::setBrightness(float value) {
    if (m_state == DriverState::SHUT_DOWN) {
        return DriverResult::NOT_LIVE;
    }
    m_brightness = brightnessTo8(value);
    m_stats.currentBrightness = m_brightness;
    return DriverResult::OK;
}

DriverResult SimulationDriver::clear() {
    if (m_state != DriverState::LIVE && m_state != DriverState::DEGRADED) {
        return DriverResult::NOT_LIVE;
    }
    std::fill(m_pixels.begin(), m_pixels.end(), CRGB(CRGB::Black));
    return DriverResult::OK;
}

DriverResult SimulationDriver::shutdown() {
    if (m_state == DriverState::SHUT_DOWN) {
        return DriverResult::OK;
    }
    m_state = DriverState::SHUT_DOWN;
    return DriverResult::OK;
}

void SimulationDriver::reconfigure(const config::SnapshotPtr& snapshot) {
    if (snapshot && m_snapshot && snapshot->config.pixelCount() == m_snapshot->config.pixelCount()) {
        m_snapshot = snapshot;
    }
}

} // namespace hal
} // namespace cosmicled
