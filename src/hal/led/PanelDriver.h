/**
 * @file PanelDriver.h
 * @brief HUB75 scan panel backend (ESP32-HUB75-MatrixPanel-I2S-DMA)
 *
 * Double-buffered: update() draws into the off-screen DMA buffer and then
 * flips it on-screen at the next vertical sync. The flip runs on every
 * update while the driver is LIVE; it is the tear-free handoff.
 *
 * Panel geometry: chainLength panels across, parallelChains rows of panels
 * down. The DMA library sees all panels as one serial chain of
 * (chainLength * parallelChains) panels, each (width / chainLength) x
 * (height / parallelChains); logical rows of panels are laid end to end.
 *
 * Without FEATURE_HUB75_DMA (or on a native build) the two canvases live in
 * memory and the flip swaps them.
 *
 * Tone: composeFrame() applies the snapshot's gamma table, so the library
 * must be built with NO_CIE1931 or every channel is corrected twice.
 */

#pragma once

#include "IMatrixDriver.h"
#include "CapabilityProbe.h"
#include "../../config/features.h"

#include <vector>

#if FEATURE_HUB75_DMA && !defined(NATIVE_BUILD)
class MatrixPanel_I2S_DMA;
#endif

namespace cosmicled {
namespace hal {

/**
 * @brief DMA library settings derived from backend parameters
 */
struct PanelTiming {
    uint32_t clockHz = 0;           ///< I2S output clock
    uint8_t colorDepthBits = 0;     ///< Bit planes per channel (setPixelColorDepthBits)
    uint8_t latchBlanking = 0;      ///< OE blanking cycles around latch
};

class PanelDriver : public IMatrixDriver {
public:
    /// Slowdown 0 (fastest) .. 4 (slowest) picks the clock; the pulse jumper tightens blanking
    static PanelTiming timingFor(const config::BackendParams& params, bool dedicatedPulse);

    PanelDriver(const config::SnapshotPtr& snapshot, const ProbeSet& probes);
    ~PanelDriver() override;

    bool init() override;
    DriverResult update(const render::FrameBuffer& frame) override;
    DriverResult setBrightness(float value) override;
    DriverResult clear() override;
    DriverResult shutdown() override;
    void reconfigure(const config::SnapshotPtr& snapshot) override;

    DriverState state() const override { return m_state; }
    config::BackendType backend() const override { return config::BackendType::PANEL; }
    const DriverCapabilities& capabilities() const override { return m_caps; }
    const MatrixDriverStats& getStats() const override { return m_stats; }

    /// Settings handed to the DMA library by init()
    const PanelTiming& timing() const { return m_timing; }

    /// Canvas currently on screen (physical order)
    const std::vector<CRGB>& frontCanvas() const { return m_canvas[m_front]; }

    /// Position in the serial DMA chain for a physical matrix coordinate
    static void chainPosition(uint16_t x, uint16_t y, uint16_t width,
                              uint16_t panelHeight, uint16_t& chainX, uint16_t& chainY) {
        const uint16_t panelRow = y / panelHeight;
        chainX = static_cast<uint16_t>(panelRow * width + x);
        chainY = static_cast<uint16_t>(y % panelHeight);
    }

private:
    void flip();

    config::SnapshotPtr m_snapshot;
    ProbeSet m_probes;
    DriverState m_state = DriverState::UNINITIALIZED;
    DriverCapabilities m_caps;
    PanelTiming m_timing;
    MatrixDriverStats m_stats;
    uint8_t m_brightness = 0;

    std::vector<CRGB> m_canvas[2];
    uint8_t m_front = 0;
    uint16_t m_panelHeight = 0;

#if FEATURE_HUB75_DMA && !defined(NATIVE_BUILD)
    MatrixPanel_I2S_DMA* m_panel = nullptr;
#endif
};

} // namespace hal
} // namespace cosmicled
