#include "StripDriver.h"
#include "FrameComposer.h"
#include "../../config/chip_config.h"
#include "../../config/limits.h"

#include <cstring>

#define CL_LOG_TAG "StripDriver"
#include "../../utils/Log.h"

namespace cosmicled {
namespace hal {

namespace {
// FastLED keeps a pointer to this array for the program lifetime; only one
// StripDriver is live at a time.
CRGB s_stripLeds[limits::MAX_STRIP_LEDS];

// FastLED has no way to remove a controller. It is registered once for the
// whole array and every later driver re-points it with setLeds().
#ifndef NATIVE_BUILD
CLEDController* s_controller = nullptr;
#endif
StripBusStats s_bus;

void attachController(CRGB* leds, uint16_t count) {
    if (s_bus.registrations == 0) {
#ifndef NATIVE_BUILD
        constexpr uint8_t kStripPin = chip::gpio::STRIP_DATA;
        s_controller = &FastLED.addLeds<WS2812, kStripPin, GRB>(s_stripLeds, limits::MAX_STRIP_LEDS);
#endif
        s_bus.registrations++;
    }
#ifndef NATIVE_BUILD
    s_controller->setLeds(leds, count);
#endif
    s_bus.attachedLeds = count;
}

void detachController() {
#ifndef NATIVE_BUILD
    if (s_controller != nullptr) {
        s_controller->setLeds(s_stripLeds, 0);
    }
#endif
    s_bus.attachedLeds = 0;
}
} // namespace

StripBusStats StripDriver::busStats() {
    return s_bus;
}

StripDriver::StripDriver(const config::SnapshotPtr& snapshot)
    : m_snapshot(snapshot)
{
}

StripDriver::~StripDriver() {
    shutdown();
}

bool StripDriver::init() {
    if (m_state != DriverState::UNINITIALIZED || !m_snapshot) {
        return false;
    }

    const uint32_t count = m_snapshot->config.pixelCount();
    if (count > limits::MAX_STRIP_LEDS) {
        CL_LOGE("Strip LED count exceeds max (%u > %u)",
                static_cast<unsigned>(count), limits::MAX_STRIP_LEDS);
        return false;
    }

    m_ledCount = static_cast<uint16_t>(count);
    m_leds = s_stripLeds;
    memset(m_leds, 0, sizeof(CRGB) * m_ledCount);

    attachController(m_leds, m_ledCount);
#ifndef NATIVE_BUILD
    FastLED.setCorrection(TypicalLEDStrip);
    FastLED.setDither(1);
    FastLED.setMaxRefreshRate(0, true);
    FastLED.clear(true);
#endif

    m_state = DriverState::LIVE;
    setBrightness(m_snapshot->config.brightness);
    CL_LOGI("FastLED init: %u LEDs (%ux%u %s) on GPIO %u", m_ledCount,
            static_cast<unsigned>(m_snapshot->config.width),
            static_cast<unsigned>(m_snapshot->config.height),
            config::wiringName(m_snapshot->config.wiring), chip::gpio::STRIP_DATA);
    return true;
}

DriverResult StripDriver::update(const render::FrameBuffer& frame) {
    if (m_state != DriverState::LIVE) {
        m_stats.rejectedUpdates++;
        return DriverResult::NOT_LIVE;
    }
    if (frame.size() != m_ledCount) {
        m_stats.rejectedUpdates++;
        return DriverResult::SIZE_MISMATCH;
    }

    uint32_t start = driverMicros();
    composeFrame(frame, *m_snapshot->gamma, *m_snapshot->indexMap, 255, m_leds);
#ifndef NATIVE_BUILD
    FastLED.show();
#endif
    recordUpdateTiming(m_stats, driverMicros() - start);
    return DriverResult::OK;
}

DriverResult StripDriver::setBrightness(float value) {
    if (m_state != DriverState::LIVE) {
        return DriverResult::NOT_LIVE;
    }
    m_brightness = brightnessTo8(value);
    m_stats.currentBrightness = m_brightness;
#ifndef NATIVE_BUILD
    FastLED.setBrightness(m_brightness);
#endif
    return DriverResult::OK;
}

DriverResult StripDriver::clear() {
    if (m_state != DriverState::LIVE) {
        return DriverResult::NOT_LIVE;
    }
    memset(m_leds, 0, sizeof(CRGB) * m_ledCount);
#ifndef NATIVE_BUILD
    FastLED.show();
#endif
    return DriverResult::OK;
}

DriverResult StripDriver::shutdown() {
    if (m_state == DriverState::SHUT_DOWN) {
        return DriverResult::OK;
    }
    if (m_state == DriverState::LIVE) {
#ifndef NATIVE_BUILD
        FastLED.clear(true);
#endif
        detachController();
        CL_LOGI("Strip released (%u frames)", static_cast<unsigned>(m_stats.frameCount));
    }
    m_state = DriverState::SHUT_DOWN;
    return DriverResult::OK;
}

void StripDriver::reconfigure(const config::SnapshotPtr& snapshot) {
    if (snapshot && snapshot->config.pixelCount() == m_ledCount) {
        m_snapshot = snapshot;
    }
}

} // namespace hal
} // namespace cosmicled
