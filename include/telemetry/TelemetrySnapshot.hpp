#pragma once

#include <cstdint>
#include "telemetry/TelemetryTypes.hpp"

namespace Loom::Core {

struct TelemetrySnapshot {
    // --- Demand ---
    uint64_t requested;   // permits issued by poll()

    // --- Poll attempts ---
    uint64_t started;
    uint64_t completed;   // includes failed
    uint64_t failed;
    uint64_t abandoned;   // raced out by shutdown, permit returned
    uint64_t discarded;   // finished after the buffer closed

    // --- Concurrency ---
    uint32_t in_flight;
    uint32_t peak_in_flight;

    BufferState state;
    uint64_t uptime_ms;
};

} // namespace Loom::Core
