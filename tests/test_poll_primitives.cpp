#include "core/ShutdownSignal.hpp"
#include "pollers/DemandGate.hpp"
#include "pollers/PollResult.hpp"
#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>

using Loom::Core::ShutdownSignal;
using namespace Loom::Pollers;
using namespace std::chrono_literals;

static void test_shutdown_signal_fires_once() {
    ShutdownSignal signal;
    assert(!signal.isSet());

    std::atomic<int> first{0};
    std::atomic<int> second{0};
    signal.onShutdown([&] { first++; });
    signal.onShutdown([&] { second++; });
    assert(first.load() == 0);

    signal.notify();
    signal.notify();
    assert(signal.isSet());
    assert(first.load() == 1);
    assert(second.load() == 1);

    // Late listeners see the flag that is already set
    std::atomic<int> late{0};
    signal.onShutdown([&] { late++; });
    assert(late.load() == 1);
}

static void test_demand_gate_counts_permits() {
    DemandGate gate;
    ShutdownSignal shutdown;
    assert(gate.available() == 0);

    gate.release(3);
    assert(gate.available() == 3);
    assert(gate.acquire(shutdown));
    assert(gate.acquire(shutdown));
    assert(gate.available() == 1);
    assert(gate.acquire(shutdown));
    assert(gate.available() == 0);

    gate.release(0);
    assert(gate.available() == 0);
}

static void test_demand_gate_blocks_until_release() {
    DemandGate gate;
    ShutdownSignal shutdown;

    std::atomic<bool> acquired{false};
    std::thread waiter([&] {
        assert(gate.acquire(shutdown));
        acquired = true;
    });

    std::this_thread::sleep_for(30ms);
    assert(!acquired.load());

    gate.release();
    waiter.join();
    assert(acquired.load());
    assert(gate.available() == 0);
}

static void test_demand_gate_shutdown_wins() {
    DemandGate gate;
    ShutdownSignal shutdown;
    shutdown.onShutdown([&] { gate.wake(); });

    std::atomic<bool> result{true};
    std::thread waiter([&] { result = gate.acquire(shutdown); });

    std::this_thread::sleep_for(30ms);
    shutdown.notify();
    waiter.join();
    assert(!result.load());

    // Even with permits available nothing is taken after shutdown
    gate.release(2);
    assert(!gate.acquire(shutdown));
    assert(gate.available() == 2);
}

static void test_poll_error_conversion() {
    PollError fromFailure = PollError::fromException(
        std::make_exception_ptr(PollFailure(PollError{StatusCode::DEADLINE_EXCEEDED, "long poll timed out"})));
    assert(fromFailure.code == StatusCode::DEADLINE_EXCEEDED);
    assert(fromFailure.message == "long poll timed out");

    PollError fromStd = PollError::fromException(std::make_exception_ptr(std::runtime_error("broken pipe")));
    assert(fromStd.code == StatusCode::INTERNAL);
    assert(fromStd.message == "broken pipe");
    assert(fromStd.describe() == "INTERNAL: broken pipe");

    PollError fromOther = PollError::fromException(std::make_exception_ptr(17));
    assert(fromOther.code == StatusCode::UNKNOWN);

    PollResult<std::string> good(std::string("task"));
    assert(good.ok());
    assert(good.value() == "task");

    PollResult<std::string> bad(PollError{StatusCode::UNAVAILABLE, "no route"});
    assert(!bad.ok());
    assert(std::string(statusCodeName(bad.error().code)) == "UNAVAILABLE");
}

int main() {
    test_shutdown_signal_fires_once();
    test_demand_gate_counts_permits();
    test_demand_gate_blocks_until_release();
    test_demand_gate_shutdown_wins();
    test_poll_error_conversion();

    std::cout << "Poll primitives test PASSED\n";
    return 0;
}
