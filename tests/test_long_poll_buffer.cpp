#include "pollers/LongPollBuffer.hpp"
#include "pollers/TaskBuffers.hpp"
#include "core/SimulatedGateway.hpp"
#include <atomic>
#include <cassert>
#include <chrono>
#include <functional>
#include <iostream>
#include <memory>
#include <mutex>
#include <set>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace Loom::Pollers;
using namespace std::chrono_literals;

using IntBuffer = LongPollBuffer<int>;

// Shared with poll operations that may still be running on timer threads
struct PollProbe {
    std::atomic<int> invocations{0};
    std::atomic<int> current{0};
    std::atomic<int> peak{0};
    std::atomic<int> next{0};
};

static IntBuffer::PollFn slowPoll(std::shared_ptr<PollProbe> probe, std::chrono::milliseconds latency) {
    return [probe, latency]() {
        probe->invocations++;
        int now = ++probe->current;
        int peak = probe->peak.load();
        while (now > peak && !probe->peak.compare_exchange_weak(peak, now)) {
        }

        return rxcpp::observable<>::timer(latency, rxcpp::observe_on_new_thread())
            .map([probe](auto) {
                probe->current--;
                return PollResult<int>(probe->next++);
            })
            .as_dynamic();
    };
}

static bool waitFor(const std::function<bool()>& pred, std::chrono::milliseconds timeout = 2000ms) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!pred()) {
        if (std::chrono::steady_clock::now() > deadline) return false;
        std::this_thread::sleep_for(5ms);
    }
    return true;
}

static rxcpp::composite_subscription firedInterrupt() {
    rxcpp::composite_subscription interrupt;
    interrupt.unsubscribe();
    return interrupt;
}

static void test_concurrency_capped_by_pollers() {
    auto probe = std::make_shared<PollProbe>();
    IntBuffer buffer(slowPoll(probe, 30ms), 3, 8);

    std::mutex seenMutex;
    std::set<int> seen;

    std::vector<std::thread> callers;
    for (int i = 0; i < 8; ++i) {
        callers.emplace_back([&] {
            auto r = buffer.poll();
            assert(r && r->ok());
            std::lock_guard<std::mutex> lock(seenMutex);
            seen.insert(r->value());
        });
    }
    for (auto& t : callers) t.join();

    assert(seen.size() == 8);
    assert(probe->invocations.load() == 8);
    assert(probe->peak.load() >= 1 && probe->peak.load() <= 3);

    auto snap = buffer.getTelemetrySnapshot();
    assert(snap.requested == 8);
    assert(snap.started == 8);
    assert(snap.peak_in_flight <= 3);

    buffer.shutdown();
    std::cout << "  concurrency capped (peak=" << probe->peak.load() << ")\n";
}

static void test_serial_polling_runs_one_at_a_time() {
    auto probe = std::make_shared<PollProbe>();
    IntBuffer buffer(slowPoll(probe, 10ms), 4, 8);

    for (int i = 1; i <= 5; ++i) {
        auto r = buffer.poll();
        assert(r && r->ok());
        assert(probe->invocations.load() == i);
    }
    assert(probe->peak.load() == 1);

    buffer.shutdown();
    assert(probe->invocations.load() == 5);
    std::cout << "  serial polling follows demand\n";
}

static void test_buffered_results_survive_shutdown() {
    std::atomic<int> next{0};
    IntBuffer buffer([&next]() {
        return rxcpp::observable<>::just(PollResult<int>(next++)).as_dynamic();
    }, 2, 4);

    // Interrupted calls leave their demand issued; the results land in the buffer.
    for (int i = 0; i < 3; ++i) {
        auto attempt = buffer.poll(firedInterrupt());
        assert(attempt.status == PopStatus::INTERRUPTED);
        assert(!attempt.result);
    }
    assert(waitFor([&] { return buffer.getTelemetrySnapshot().completed == 3; }));
    std::this_thread::sleep_for(50ms);

    buffer.shutdown();
    assert(buffer.getTelemetrySnapshot().state == Loom::Core::BufferState::STOPPED);

    std::set<int> drained;
    for (int i = 0; i < 3; ++i) {
        auto r = buffer.poll();
        assert(r && r->ok());
        drained.insert(r->value());
    }
    assert(drained == (std::set<int>{0, 1, 2}));
    assert(!buffer.poll());
    std::cout << "  buffered results drain after shutdown\n";
}

static void test_interrupts_do_not_outrun_demand() {
    auto probe = std::make_shared<PollProbe>();
    IntBuffer buffer(slowPoll(probe, 100ms), 1, 1);

    std::atomic<int> interrupted{0};
    std::vector<std::thread> callers;
    for (int i = 0; i < 10; ++i) {
        callers.emplace_back([&] {
            auto attempt = buffer.poll(firedInterrupt());
            if (attempt.status == PopStatus::INTERRUPTED) interrupted++;
        });
    }
    for (auto& t : callers) t.join();
    assert(interrupted.load() == 10);

    // One slow poller, one buffer slot: the second result blocks the loop.
    assert(waitFor([&] { return buffer.getTelemetrySnapshot().completed == 2; }));
    std::this_thread::sleep_for(150ms);
    int invocations = probe->invocations.load();
    assert(invocations == 2);

    // The blocked result is dropped by shutdown, not raised
    buffer.shutdown();
    auto snap = buffer.getTelemetrySnapshot();
    assert(snap.discarded == 1);
    assert(snap.in_flight == 0);
    assert(snap.state == Loom::Core::BufferState::STOPPED);
    assert(buffer.outstandingDemand() == 8);
    assert(probe->invocations.load() == 2);

    auto first = buffer.poll();
    assert(first && first->ok() && first->value() == 0);
    std::cout << "  10 interrupted polls, " << invocations << " invocations\n";
}

static void test_errors_are_forwarded_and_polling_continues() {
    std::atomic<int> call{0};
    IntBuffer buffer([&call]() -> rxcpp::observable<PollResult<int>> {
        switch (call++) {
            case 0:
                return rxcpp::observable<>::just(
                    PollResult<int>(PollError{StatusCode::UNAVAILABLE, "server down"})).as_dynamic();
            case 1:
                return rxcpp::observable<>::error<PollResult<int>>(std::runtime_error("stream reset")).as_dynamic();
            case 2:
                throw std::runtime_error("dial failed");
            default:
                return rxcpp::observable<>::just(PollResult<int>(42)).as_dynamic();
        }
    }, 1, 2);

    auto r1 = buffer.poll();
    assert(r1 && !r1->ok());
    assert(r1->error().code == StatusCode::UNAVAILABLE);
    assert(r1->error().message == "server down");

    bool threw = false;
    try {
        (void)r1->value();
    } catch (const PollFailure& e) {
        threw = true;
        assert(e.error().code == StatusCode::UNAVAILABLE);
    }
    assert(threw);

    auto r2 = buffer.poll();
    assert(r2 && !r2->ok());
    assert(r2->error().code == StatusCode::INTERNAL);
    assert(r2->error().message == "stream reset");

    auto r3 = buffer.poll();
    assert(r3 && !r3->ok());
    assert(r3->error().message == "dial failed");

    auto r4 = buffer.poll();
    assert(r4 && r4->ok() && r4->value() == 42);

    auto snap = buffer.getTelemetrySnapshot();
    assert(snap.completed == 4);
    assert(snap.failed == 3);
    std::cout << "  errors forwarded\n";
}

static void test_poll_after_notify_shutdown_ends() {
    IntBuffer buffer([]() { return rxcpp::observable<>::never<PollResult<int>>().as_dynamic(); }, 2, 2);

    buffer.notifyShutdown();
    auto r = buffer.poll();
    assert(!r);

    auto attempt = buffer.poll(rxcpp::composite_subscription());
    assert(attempt.status == PopStatus::CLOSED);
    std::cout << "  poll after notifyShutdown returns nothing\n";
}

static void test_abandoned_attempt_returns_its_permit() {
    IntBuffer buffer([]() { return rxcpp::observable<>::never<PollResult<int>>().as_dynamic(); }, 1, 1);

    auto attempt = buffer.poll(firedInterrupt());
    assert(attempt.status == PopStatus::INTERRUPTED);
    assert(waitFor([&] { return buffer.getTelemetrySnapshot().started == 1; }));
    assert(buffer.outstandingDemand() == 0);

    buffer.shutdown();
    buffer.shutdown();

    auto snap = buffer.getTelemetrySnapshot();
    assert(snap.abandoned == 1);
    assert(snap.in_flight == 0);
    assert(buffer.outstandingDemand() == 1);
    std::cout << "  abandoned attempt returns its permit\n";
}

static void test_task_buffer_factories() {
    auto gateway = std::make_shared<Loom::Core::SimulatedGateway>(10ms);

    auto wft = newWorkflowTaskBuffer(gateway, "orders", 2, 4);
    assert(wft->getName() == "LongPollBuffer:wft:orders");
    auto task = wft->poll();
    assert(task && task->ok());
    assert(task->value().taskToken.rfind("orders/wft/", 0) == 0);
    assert(!task->value().workflowExecution.workflowId.empty());

    auto at = newActivityTaskBuffer(gateway, "orders", 1, 2);
    auto activity = at->poll();
    assert(activity && activity->ok());
    assert(activity->value().activityType == "simulated-activity");
    assert(activity->value().input.size() == 1);

    wft->shutdown();
    at->shutdown();
    assert(gateway->workflowPollCount() >= 1);
    assert(gateway->activityPollCount() >= 1);

    bool threw = false;
    try {
        newWorkflowTaskBuffer(nullptr, "orders", 1, 1);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);
    std::cout << "  task buffer factories\n";
}

static void test_invalid_construction() {
    auto never = []() { return rxcpp::observable<>::never<PollResult<int>>().as_dynamic(); };

    int failures = 0;
    try { IntBuffer b(never, 0, 1); } catch (const std::invalid_argument&) { failures++; }
    try { IntBuffer b(never, 1, 0); } catch (const std::invalid_argument&) { failures++; }
    try { IntBuffer b(IntBuffer::PollFn(), 1, 1); } catch (const std::invalid_argument&) { failures++; }
    assert(failures == 3);
    std::cout << "  invalid construction rejected\n";
}

int main() {
    LoomUtils::setLogLevel(LoomUtils::LogLevel::WARN);

    test_concurrency_capped_by_pollers();
    test_serial_polling_runs_one_at_a_time();
    test_buffered_results_survive_shutdown();
    test_interrupts_do_not_outrun_demand();
    test_errors_are_forwarded_and_polling_continues();
    test_poll_after_notify_shutdown_ends();
    test_abandoned_attempt_returns_its_permit();
    test_task_buffer_factories();
    test_invalid_construction();

    std::cout << "LongPollBuffer test PASSED\n";
    return 0;
}
