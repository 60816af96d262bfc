/**
 * @file IMatrixDriver.h
 * @brief Hardware abstraction interface for pixel matrix output
 *
 * One interface over a closed set of backends (config::BackendType):
 * - StripDriver:      addressable strip via FastLED
 * - PanelDriver:      HUB75 scan panel via I2S DMA, double-buffered
 * - SimulationDriver: in-memory sink, also the degraded fallback
 *
 * Instances are created only by createMatrixDriver() (MatrixDriverFactory.h).
 * All methods are called from the conductor thread only.
 */

#pragma once

#include <cstdint>
#include <FastLED.h>

#include "../../core/config/ConfigStore.h"
#include "../../core/render/FrameBuffer.h"

namespace cosmicled {
namespace hal {

/**
 * @brief Result of a driver operation
 */
enum class DriverResult : uint8_t {
    OK = 0,
    NOT_LIVE,           ///< Driver is uninitialized or shut down
    SIZE_MISMATCH,      ///< Frame length != width * height
    HARDWARE_ERROR      ///< Output handle lost or refused the frame
};

/**
 * @brief Driver lifecycle
 *
 * UNINITIALIZED -> LIVE | DEGRADED -> SHUT_DOWN (terminal)
 */
enum class DriverState : uint8_t {
    UNINITIALIZED = 0,
    LIVE,
    DEGRADED,           ///< No-op sink standing in for unavailable hardware
    SHUT_DOWN
};

/**
 * @brief Optional hardware capabilities detected at construction
 */
struct DriverCapabilities {
    bool dedicatedPulse = false;    ///< Hardware pulse / latch blanking timing active
    bool reservedCore = false;      ///< A core free of the network stack exists
    bool doubleBuffered = false;    ///< Off-screen canvas with vsync swap
};

/**
 * @brief Driver statistics
 */
struct MatrixDriverStats {
    uint32_t frameCount = 0;        ///< Successful updates
    uint32_t rejectedUpdates = 0;   ///< Updates that returned non-OK
    uint32_t lastUpdateUs = 0;      ///< Last update() duration in microseconds
    uint32_t avgUpdateUs = 0;       ///< Average update() duration
    uint32_t maxUpdateUs = 0;       ///< Maximum update() duration
    uint32_t bufferSwaps = 0;       ///< Canvas flips (double-buffered backends)
    uint8_t currentBrightness = 0;  ///< Current brightness (0-255)
};

/**
 * @brief Abstract interface for matrix output
 */
class IMatrixDriver {
public:
    virtual ~IMatrixDriver() = default;

    /**
     * @brief Acquire the hardware handle
     * @return true if the driver is LIVE (or DEGRADED for a fallback sink)
     */
    virtual bool init() = 0;

    /**
     * @brief Push one logical frame to the output
     *
     * Applies the snapshot's gamma table and index map. The frame is read
     * only; ownership stays with the caller.
     */
    virtual DriverResult update(const render::FrameBuffer& frame) = 0;

    /**
     * @brief Set global brightness
     * @param value 0.0 - 1.0 (clamped)
     */
    virtual DriverResult setBrightness(float value) = 0;

    /**
     * @brief Blank the output
     */
    virtual DriverResult clear() = 0;

    /**
     * @brief Release hardware resources (idempotent)
     */
    virtual DriverResult shutdown() = 0;

    /**
     * @brief Adopt new lookup tables without rebuilding
     *
     * Only valid for snapshots where !affectsBackend(); geometry is fixed
     * for the lifetime of a driver.
     */
    virtual void reconfigure(const config::SnapshotPtr& snapshot) = 0;

    virtual DriverState state() const = 0;
    virtual config::BackendType backend() const = 0;
    virtual const DriverCapabilities& capabilities() const = 0;
    virtual const MatrixDriverStats& getStats() const = 0;
};

const char* driverStateName(DriverState state);
const char* driverResultName(DriverResult result);

} // namespace hal
} // namespace cosmicled
