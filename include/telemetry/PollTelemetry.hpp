#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>

#include "telemetry/TelemetryTypes.hpp"
#include "telemetry/TelemetrySnapshot.hpp"

namespace Loom::Core {

struct PollTelemetry {
    // Demand counters
    std::atomic<uint64_t> polls_requested{0};

    // Attempt counters
    std::atomic<uint64_t> polls_started{0};
    std::atomic<uint64_t> polls_completed{0};
    std::atomic<uint64_t> polls_failed{0};
    std::atomic<uint64_t> polls_abandoned{0};
    std::atomic<uint64_t> results_discarded{0};

    // Concurrency gauges
    std::atomic<uint32_t> in_flight{0};
    std::atomic<uint32_t> peak_in_flight{0};

    std::atomic<BufferState> state{BufferState::RUNNING};

    std::chrono::steady_clock::time_point started_at;

    void record_attempt_started();
    void record_attempt_finished(bool failed);
    void record_attempt_abandoned();

    PollTelemetry();
    [[nodiscard]] TelemetrySnapshot snapshot() const;
};

// One-line summary for logs
std::string describe(const TelemetrySnapshot& snap);

} // namespace Loom::Core
