/**
 * @file MatrixDriverFactory.h
 * @brief Factory for matrix drivers with degraded fallback
 *
 * createMatrixDriver() is the only place a backend is chosen. It always
 * returns an initialized driver: if the requested backend cannot acquire its
 * hardware, a SimulationDriver in DEGRADED state stands in for it.
 */

#pragma once

#include "IMatrixDriver.h"
#include "CapabilityProbe.h"

#include <memory>

namespace cosmicled {
namespace hal {

/**
 * @brief Build and initialize the driver for snapshot->config.backend
 * @return Initialized driver (LIVE, or DEGRADED fallback); never null
 */
std::unique_ptr<IMatrixDriver> createMatrixDriver(const config::SnapshotPtr& snapshot);

/**
 * @brief As above with explicit capability probes (panel backend)
 */
std::unique_ptr<IMatrixDriver> createMatrixDriver(const config::SnapshotPtr& snapshot,
                                                  const ProbeSet& probes);

/**
 * @brief No-op sink in DEGRADED state for the given snapshot
 *
 * Failing to build this is a programming error and terminates the process.
 */
std::unique_ptr<IMatrixDriver> createFallbackDriver(const config::SnapshotPtr& snapshot,
                                                    config::BackendType standInFor);

} // namespace hal
} // namespace cosmicled
