#include "CapabilityProbe.h"
#include "../../config/chip_config.h"

#include <chrono>
#include <future>
#include <memory>
#include <thread>

#ifndef NATIVE_BUILD
#include <Arduino.h>
#endif

#define CL_LOG_TAG "Probe"
#include "../../utils/Log.h"

namespace cosmicled {
namespace hal {

ProbeSet defaultProbes() {
    ProbeSet probes;
    probes.dedicatedPulse = &probeDedicatedPulse;
    probes.reservedCore = &probeReservedCore;
    return probes;
}

ProbeOutcome probeDedicatedPulse(const std::atomic<bool>& cancelled) {
#ifndef NATIVE_BUILD
    constexpr uint8_t out = chip::gpio::PULSE_PROBE_OUT;
    constexpr uint8_t in = chip::gpio::PULSE_PROBE_IN;

    if (cancelled.load()) {
        return ProbeOutcome::TIMEOUT;
    }
    pinMode(out, OUTPUT);
    pinMode(in, INPUT_PULLDOWN);

    if (cancelled.load()) {
        pinMode(out, INPUT);
        return ProbeOutcome::TIMEOUT;
    }
    digitalWrite(out, HIGH);
    delayMicroseconds(20);
    const int high = digitalRead(in);

    if (cancelled.load()) {
        pinMode(out, INPUT);
        return ProbeOutcome::TIMEOUT;
    }
    digitalWrite(out, LOW);
    delayMicroseconds(20);
    const int low = digitalRead(in);

    // Leave both pins floating again
    pinMode(out, INPUT);
    pinMode(in, INPUT);

    if (high == HIGH && low == LOW) {
        return ProbeOutcome::PRESENT;
    }
    if (high == LOW && low == LOW) {
        return ProbeOutcome::ABSENT;
    }
    return ProbeOutcome::ERROR;  // stuck high or noisy line
#else
    (void)cancelled;
    return ProbeOutcome::ABSENT;
#endif
}

ProbeOutcome probeReservedCore(const std::atomic<bool>& cancelled) {
    (void)cancelled;  // reads only
#ifndef NATIVE_BUILD
    return (chip::CPU_CORES > 1) ? ProbeOutcome::PRESENT : ProbeOutcome::ABSENT;
#else
    const unsigned cores = std::thread::hardware_concurrency();
    if (cores == 0) {
        return ProbeOutcome::ERROR;  // not computable on this host
    }
    return (cores > 1) ? ProbeOutcome::PRESENT : ProbeOutcome::ABSENT;
#endif
}

ProbeOutcome runProbe(ProbeFn probe, uint32_t timeoutMs) {
    if (probe == nullptr) {
        return ProbeOutcome::ABSENT;
    }

    auto promise = std::make_shared<std::promise<ProbeOutcome>>();
    auto cancelled = std::make_shared<std::atomic<bool>>(false);
    std::future<ProbeOutcome> result = promise->get_future();

    std::thread worker([promise, cancelled, probe]() {
        promise->set_value(probe(*cancelled));
    });
    worker.detach();

    if (result.wait_for(std::chrono::milliseconds(timeoutMs)) != std::future_status::ready) {
        cancelled->store(true);
        return ProbeOutcome::TIMEOUT;
    }
    return result.get();
}

DriverCapabilities probeCapabilities(const ProbeSet& probes, bool pulseRequested,
                                     ProbeOutcome* outcomes) {
    DriverCapabilities caps;

    ProbeOutcome pulse = ProbeOutcome::ABSENT;
    if (pulseRequested) {
        pulse = runProbe(probes.dedicatedPulse, probes.timeoutMs);
    }
    ProbeOutcome core = runProbe(probes.reservedCore, probes.timeoutMs);

    if (pulse == ProbeOutcome::ERROR || pulse == ProbeOutcome::TIMEOUT) {
        CL_LOGW("Pulse probe %s, using conservative timing", probeOutcomeName(pulse));
    }
    if (core == ProbeOutcome::ERROR || core == ProbeOutcome::TIMEOUT) {
        CL_LOGW("Core probe %s, not pinning", probeOutcomeName(core));
    }

    caps.dedicatedPulse = (pulse == ProbeOutcome::PRESENT);
    caps.reservedCore = (core == ProbeOutcome::PRESENT);

    if (outcomes != nullptr) {
        outcomes[0] = pulse;
        outcomes[1] = core;
    }
    return caps;
}

const char* probeOutcomeName(ProbeOutcome outcome) {
    switch (outcome) {
        case ProbeOutcome::PRESENT: return "present";
        case ProbeOutcome::ABSENT:  return "absent";
        case ProbeOutcome::ERROR:   return "error";
        case ProbeOutcome::TIMEOUT: return "timeout";
    }
    return "unknown";
}

} // namespace hal
} // namespace cosmicled
