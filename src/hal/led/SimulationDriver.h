/**
 * @file SimulationDriver.h
 * @brief In-memory matrix sink (headless runs and degraded fallback)
 *
 * Composes every frame exactly like a hardware backend would (gamma, index
 * map, brightness) into a pixel array that tests and tools can inspect.
 * Constructed with degraded=true it stands in for a backend whose hardware
 * is unavailable and reports DriverState::DEGRADED.
 */

#pragma once

#include "IMatrixDriver.h"

#include <vector>

namespace cosmicled {
namespace hal {

class SimulationDriver : public IMatrixDriver {
public:
    /**
     * @param snapshot Configuration and tables for this driver's lifetime
     * @param degraded Report DEGRADED instead of LIVE after init()
     * @param standInFor Backend this sink replaces (for reporting)
     */
    SimulationDriver(const config::SnapshotPtr& snapshot, bool degraded,
                     config::BackendType standInFor = config::BackendType::SIMULATION);
    ~SimulationDriver() override;

    bool init() override;
    DriverResult update(const render::FrameBuffer& frame) override;
    DriverResult setBrightness(float value) override;
    DriverResult clear() override;
    DriverResult shutdown() override;
    void reconfigure(const config::SnapshotPtr& snapshot) override;

    DriverState state() const override { return m_state; }
    config::BackendType backend() const override { return m_standInFor; }
    const DriverCapabilities& capabilities() const override { return m_caps; }
    const MatrixDriverStats& getStats() const override { return m_stats; }

    /// Composed output (physical order, post-gamma, post-brightness)
    const std::vector<CRGB>& pixels() const { return m_pixels; }

private:
    config::SnapshotPtr m_snapshot;
    bool m_degraded;
    config::BackendType m_standInFor;
    DriverState m_state = DriverState::UNINITIALIZED;
    DriverCapabilities m_caps;
    MatrixDriverStats m_stats;
    uint8_t m_brightness = 255;
    std::vector<CRGB> m_pixels;
};

} // namespace hal
} // namespace cosmicled
