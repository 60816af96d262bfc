/**
 * @file StripDriver.h
 * @brief Addressable strip backend (WS2812 via FastLED)
 *
 * Each update() writes gamma-corrected pixels into the FastLED output array
 * in physical (wiring) order and issues a single FastLED.show(). Brightness
 * is FastLED's global scale.
 *
 * A rebuilt driver reuses the one FastLED controller; shutdown() detaches it
 * (zero length) so nothing stale is clocked out.
 */

#pragma once

#include "IMatrixDriver.h"

namespace cosmicled {
namespace hal {

/**
 * @brief FastLED controller bookkeeping shared by every StripDriver
 */
struct StripBusStats {
    uint32_t registrations = 0;     ///< FastLED.addLeds() calls; at most one per process
    uint16_t attachedLeds = 0;      ///< Length the controller currently clocks out
};

class StripDriver : public IMatrixDriver {
public:
    explicit StripDriver(const config::SnapshotPtr& snapshot);
    ~StripDriver() override;

    /**
     * @return false if the strip exceeds the channel limit
     *         (limits::MAX_STRIP_LEDS); the factory then falls back
     */
    bool init() override;
    DriverResult update(const render::FrameBuffer& frame) override;
    DriverResult setBrightness(float value) override;
    DriverResult clear() override;
    DriverResult shutdown() override;
    void reconfigure(const config::SnapshotPtr& snapshot) override;

    DriverState state() const override { return m_state; }
    config::BackendType backend() const override { return config::BackendType::STRIP; }
    const DriverCapabilities& capabilities() const override { return m_caps; }
    const MatrixDriverStats& getStats() const override { return m_stats; }

    /// Output array in physical order (pre-brightness)
    const CRGB* leds() const { return m_leds; }
    uint16_t ledCount() const { return m_ledCount; }

    static StripBusStats busStats();

private:
    config::SnapshotPtr m_snapshot;
    DriverState m_state = DriverState::UNINITIALIZED;
    DriverCapabilities m_caps;
    MatrixDriverStats m_stats;
    CRGB* m_leds = nullptr;
    uint16_t m_ledCount = 0;
    uint8_t m_brightness = 0;
};

} // namespace hal
} // namespace cosmicled
