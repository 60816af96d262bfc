#include "MatrixDriverFactory.h"
#include "StripDriver.h"
#include "PanelDriver.h"
#include "SimulationDriver.h"

#include <cstdlib>
#include <new>

#define CL_LOG_TAG "DriverFactory"
#include "../../utils/Log.h"

namespace cosmicled {
namespace hal {

std::unique_ptr<IMatrixDriver> createMatrixDriver(const config::SnapshotPtr& snapshot) {
    return createMatrixDriver(snapshot, defaultProbes());
}

std::unique_ptr<IMatrixDriver> createMatrixDriver(const config::SnapshotPtr& snapshot,
                                                  const ProbeSet& probes) {
    const config::BackendType backend = snapshot->config.backend;
    std::unique_ptr<IMatrixDriver> driver;

    switch (backend) {
        case config::BackendType::STRIP:
            driver.reset(new (std::nothrow) StripDriver(snapshot));
            break;
        case config::BackendType::PANEL:
            driver.reset(new (std::nothrow) PanelDriver(snapshot, probes));
            break;
        case config::BackendType::SIMULATION:
            driver.reset(new (std::nothrow) SimulationDriver(snapshot, false));
            break;
    }

    if (driver && driver->init()) {
        return driver;
    }

    CL_LOGW("%s backend unavailable, driver degraded", config::backendName(backend));
    if (driver) {
        driver->shutdown();
        driver.reset();
    }
    return createFallbackDriver(snapshot, backend);
}

std::unique_ptr<IMatrixDriver> createFallbackDriver(const config::SnapshotPtr& snapshot,
                                                    config::BackendType standInFor) {
    std::unique_ptr<IMatrixDriver> fallback(
        new (std::nothrow) SimulationDriver(snapshot, true, standInFor));
    if (!fallback || !fallback->init()) {
        CL_LOGE("FATAL: cannot construct fallback sink");
        abort();
    }
    return fallback;
}

} // namespace hal
} // namespace cosmicled
