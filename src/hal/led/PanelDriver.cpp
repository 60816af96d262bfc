#include "PanelDriver.h"
#include "FrameComposer.h"

#include <algorithm>

#if FEATURE_HUB75_DMA && !defined(NATIVE_BUILD)
#ifndef NO_CIE1931
#error "Build ESP32-HUB75-MatrixPanel-I2S-DMA with NO_CIE1931: gamma comes from the snapshot's GammaTable"
#endif
#include <ESP32-HUB75-MatrixPanel-I2S-DMA.h>
#endif

#define CL_LOG_TAG "PanelDriver"
#include "../../utils/Log.h"

namespace cosmicled {
namespace hal {

namespace {

// I2S clocks the library supports, fastest first (HUB75_I2S_CFG::clk_speed)
constexpr uint32_t CLOCK_STEPS_HZ[] = {20000000, 15000000, 10000000, 8000000};
constexpr uint8_t CLOCK_STEP_COUNT = sizeof(CLOCK_STEPS_HZ) / sizeof(CLOCK_STEPS_HZ[0]);

// Latch blanking in clock cycles: tight with the pulse jumper, wide without
constexpr uint8_t LATCH_BLANKING_PULSE = 1;
constexpr uint8_t LATCH_BLANKING_CONSERVATIVE = 4;

} // namespace

PanelTiming PanelDriver::timingFor(const config::BackendParams& params, bool dedicatedPulse) {
    PanelTiming timing;
    uint8_t step = 0;
    if (params.slowdown > 0) {
        step = (params.slowdown >= CLOCK_STEP_COUNT) ? static_cast<uint8_t>(CLOCK_STEP_COUNT - 1)
                                                     : static_cast<uint8_t>(params.slowdown);
    }
    timing.clockHz = CLOCK_STEPS_HZ[step];
    timing.colorDepthBits = static_cast<uint8_t>(params.colorDepthBits);
    timing.latchBlanking = dedicatedPulse ? LATCH_BLANKING_PULSE : LATCH_BLANKING_CONSERVATIVE;
    return timing;
}

PanelDriver::PanelDriver(const config::SnapshotPtr& snapshot, const ProbeSet& probes)
    : m_snapshot(snapshot)
    , m_probes(probes)
{
}

PanelDriver::~PanelDriver() {
    shutdown();
}

bool PanelDriver::init() {
    if (m_state != DriverState::UNINITIALIZED || !m_snapshot) {
        return false;
    }

    const config::Configuration& cfg = m_snapshot->config;
    const config::BackendParams& p = cfg.params;

    m_caps = probeCapabilities(m_probes, p.hardwarePulse);
    m_caps.doubleBuffered = true;

    const uint16_t panelWidth = static_cast<uint16_t>(cfg.width / p.chainLength);
    m_panelHeight = static_cast<uint16_t>(cfg.height / p.parallelChains);
    m_timing = timingFor(p, m_caps.dedicatedPulse);

    m_canvas[0].assign(cfg.pixelCount(), CRGB::Black);
    m_canvas[1].assign(cfg.pixelCount(), CRGB::Black);
    m_front = 0;

#if FEATURE_HUB75_DMA && !defined(NATIVE_BUILD)
    HUB75_I2S_CFG mxconfig(panelWidth, m_panelHeight,
                           static_cast<uint16_t>(p.chainLength * p.parallelChains));
    mxconfig.double_buff = true;
    mxconfig.clkphase = false;
    mxconfig.i2sspeed = static_cast<HUB75_I2S_CFG::clk_speed>(m_timing.clockHz);
    mxconfig.latch_blanking = m_timing.latchBlanking;
    mxconfig.setPixelColorDepthBits(m_timing.colorDepthBits);

    m_panel = new MatrixPanel_I2S_DMA(mxconfig);
    if (!m_panel->begin()) {
        delete m_panel;
        m_panel = nullptr;
        CL_LOGE("HUB75 DMA init failed (%ux%u x%u panels)", panelWidth, m_panelHeight,
                static_cast<unsigned>(p.chainLength * p.parallelChains));
        return false;
    }
    m_panel->clearScreen();
    m_panel->flipDMABuffer();
    m_panel->clearScreen();
#endif

    m_state = DriverState::LIVE;
    setBrightness(cfg.brightness);

    CL_LOGI("Panel init: %ux%u (%ux%u panels, chain %u, parallel %u), depth %u, clock %u kHz, latch %u",
            static_cast<unsigned>(cfg.width), static_cast<unsigned>(cfg.height),
            panelWidth, m_panelHeight,
            static_cast<unsigned>(p.chainLength), static_cast<unsigned>(p.parallelChains),
            m_timing.colorDepthBits, static_cast<unsigned>(m_timing.clockHz / 1000),
            m_timing.latchBlanking);
    CL_LOGI("Capabilities: pulse=%s reserved_core=%s",
            m_caps.dedicatedPulse ? "on" : "off", m_caps.reservedCore ? "yes" : "no");
    return true;
}

DriverResult PanelDriver::update(const render::FrameBuffer& frame) {
    if (m_state != DriverState::LIVE) {
        m_stats.rejectedUpdates++;
        return DriverResult::NOT_LIVE;
    }
    std::vector<CRGB>& back = m_canvas[m_front ^ 1];
    if (frame.size() != back.size()) {
        m_stats.rejectedUpdates++;
        return DriverResult::SIZE_MISMATCH;
    }

    uint32_t start = driverMicros();

    // Brightness is applied by the DMA engine (setBrightness8), not here
    composeFrame(frame, *m_snapshot->gamma, *m_snapshot->indexMap, 255, back.data());

#if FEATURE_HUB75_DMA && !defined(NATIVE_BUILD)
    if (m_panel == nullptr) {
        m_stats.rejectedUpdates++;
        return DriverResult::HARDWARE_ERROR;
    }
    const uint16_t width = m_snapshot->config.width;
    const uint32_t count = static_cast<uint32_t>(back.size());
    for (uint32_t i = 0; i < count; ++i) {
        uint16_t chainX;
        uint16_t chainY;
        chainPosition(static_cast<uint16_t>(i % width), static_cast<uint16_t>(i / width),
                      width, m_panelHeight, chainX, chainY);
        const CRGB& px = back[i];
        m_panel->drawPixelRGB888(chainX, chainY, px.r, px.g, px.b);
    }
#endif

    flip();
    recordUpdateTiming(m_stats, driverMicros() - start);
    return DriverResult::OK;
}

void PanelDriver::flip() {
#if FEATURE_HUB75_DMA && !defined(NATIVE_BUILD)
    m_panel->flipDMABuffer();
#endif
    m_front ^= 1;
    m_stats.bufferSwaps++;
}

DriverResult PanelDriver::setBrightness(float value) {
    if (m_state != DriverState::LIVE) {
        return DriverResult::NOT_LIVE;
    }
    m_brightness = brightnessTo8(value);
    m_stats.currentBrightness = m_brightness;
#if FEATURE_HUB75_DMA && !defined(NATIVE_BUILD)
    if (m_panel == nullptr) {
        return DriverResult::HARDWARE_ERROR;
    }
    m_panel->setBrightness8(m_brightness);
#endif
    return DriverResult::OK;
}

DriverResult PanelDriver::clear() {
    if (m_state != DriverState::LIVE) {
        return DriverResult::NOT_LIVE;
    }
    std::fill(m_canvas[m_front ^ 1].begin(), m_canvas[m_front ^ 1].end(), CRGB(CRGB::Black));
#if FEATURE_HUB75_DMA && !defined(NATIVE_BUILD)
    if (m_panel == nullptr) {
        return DriverResult::HARDWARE_ERROR;
    }
    m_panel->clearScreen();
#endif
    flip();
    return DriverResult::OK;
}

DriverResult PanelDriver::shutdown() {
    if (m_state == DriverState::SHUT_DOWN) {
        return DriverResult::OK;
    }
#if FEATURE_HUB75_DMA && !defined(NATIVE_BUILD)
    if (m_panel != nullptr) {
        m_panel->clearScreen();
        m_panel->flipDMABuffer();
        m_panel->clearScreen();
        delete m_panel;
        m_panel = nullptr;
    }
#endif
    if (m_state == DriverState::LIVE) {
        CL_LOGI("Panel released (%u frames, %u swaps)",
                static_cast<unsigned>(m_stats.frameCount),
                static_cast<unsigned>(m_stats.bufferSwaps));
    }
    m_state = DriverState::SHUT_DOWN;
    return DriverResult::OK;
}

void PanelDriver::reconfigure(const config::SnapshotPtr& snapshot) {
    if (snapshot && m_snapshot &&
        !snapshot->config.affectsBackend(m_snapshot->config)) {
        m_snapshot = snapshot;
    }
}

} // namespace hal
} // namespace cosmicled
