// © 2026 Beatrix Zselezny. All rights reserved.
// Loom Workflow Core

#include "telemetry/PollTelemetry.hpp"
#include <sstream>

namespace Loom::Core {

const char* bufferStateName(BufferState state) {
    switch (state) {
        case BufferState::RUNNING:  return "RUNNING";
        case BufferState::DRAINING: return "DRAINING";
        case BufferState::STOPPED:  return "STOPPED";
    }
    return "UNKNOWN";
}

PollTelemetry::PollTelemetry()
    : started_at(std::chrono::steady_clock::now())
{
}

void PollTelemetry::record_attempt_started() {
    polls_started++;
    uint32_t now = ++in_flight;

    // Peak only ever grows
    uint32_t peak = peak_in_flight.load();
    while (now > peak && !peak_in_flight.compare_exchange_weak(peak, now)) {
    }
}

void PollTelemetry::record_attempt_finished(bool failed) {
    in_flight--;
    polls_completed++;
    if (failed) polls_failed++;
}

void PollTelemetry::record_attempt_abandoned() {
    in_flight--;
    polls_abandoned++;
}

TelemetrySnapshot PollTelemetry::snapshot() const {
    TelemetrySnapshot snap{};

    snap.requested = polls_requested.load();

    snap.started   = polls_started.load();
    snap.completed = polls_completed.load();
    snap.failed    = polls_failed.load();
    snap.abandoned = polls_abandoned.load();
    snap.discarded = results_discarded.load();

    snap.in_flight      = in_flight.load();
    snap.peak_in_flight = peak_in_flight.load();

    snap.state = state.load();

    snap.uptime_ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started_at
        ).count();

    return snap;
}

std::string describe(const TelemetrySnapshot& snap) {
    std::ostringstream out;
    out << "state=" << bufferStateName(snap.state)
        << " requested=" << snap.requested
        << " started=" << snap.started
        << " completed=" << snap.completed
        << " failed=" << snap.failed
        << " abandoned=" << snap.abandoned
        << " discarded=" << snap.discarded
        << " peak_in_flight=" << snap.peak_in_flight
        << " uptime_ms=" << snap.uptime_ms;
    return out.str();
}

} // namespace Loom::Core
