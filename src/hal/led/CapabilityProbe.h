/**
 * @file CapabilityProbe.h
 * @brief Bounded, non-destructive detection of optional panel capabilities
 *
 * Two capabilities are probed when a panel driver is constructed:
 * - Dedicated pulse: a jumper between PULSE_PROBE_OUT and PULSE_PROBE_IN
 *   marks a board wired for hardware latch/OE pulse timing
 * - Reserved core: a CPU core that the network stack does not use
 *
 * Neither is required. Every probe runs with a timeout; an ERROR or TIMEOUT
 * outcome is reported as "capability absent".
 */

#pragma once

#include <atomic>
#include <cstdint>

#include "IMatrixDriver.h"

namespace cosmicled {
namespace hal {

enum class ProbeOutcome : uint8_t {
    PRESENT = 0,
    ABSENT,
    ERROR,      ///< Probe could not decide
    TIMEOUT     ///< Probe did not return within timeoutMs
};

/// Set once the caller has stopped waiting; a probe must not touch hardware after that
using ProbeFn = ProbeOutcome (*)(const std::atomic<bool>& cancelled);

/**
 * @brief Probe functions and timeout (injectable for tests)
 */
struct ProbeSet {
    ProbeFn dedicatedPulse = nullptr;
    ProbeFn reservedCore = nullptr;
    uint32_t timeoutMs = 50;
};

/// Built-in probes for this board
ProbeSet defaultProbes();

ProbeOutcome probeDedicatedPulse(const std::atomic<bool>& cancelled);
ProbeOutcome probeReservedCore(const std::atomic<bool>& cancelled);

/**
 * @brief Run one probe on a worker thread and wait at most timeoutMs
 *
 * A probe that overruns keeps running detached with its cancel flag set, so
 * it stops before its next GPIO write. Its late result is dropped.
 */
ProbeOutcome runProbe(ProbeFn probe, uint32_t timeoutMs);

/**
 * @brief Detect capabilities for a panel
 * @param probes Probe set
 * @param pulseRequested Configuration asked for hardware pulse timing
 * @param outcomes Optional [2] array receiving raw outcomes (pulse, core)
 */
DriverCapabilities probeCapabilities(const ProbeSet& probes, bool pulseRequested,
                                     ProbeOutcome* outcomes = nullptr);

const char* probeOutcomeName(ProbeOutcome outcome);

} // namespace hal
} // namespace cosmicled
