// © 2026 Beatrix Zselezny. All rights reserved.
// Loom Workflow Core
// Long Poll Buffer: demand-gated pool of concurrent long-poll loops

#ifndef LOOM_LONG_POLL_BUFFER_HPP
#define LOOM_LONG_POLL_BUFFER_HPP

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>
#include "rxcpp/rx.hpp"

#include "core/ShutdownSignal.hpp"
#include "pollers/BoundedBuffer.hpp"
#include "pollers/DemandGate.hpp"
#include "pollers/PollResult.hpp"
#include "telemetry/PollTelemetry.hpp"
#include "utils/Log.hpp"

namespace Loom::Pollers {

    /**
     * @brief Outcome of an interruptible poll.
     * result is set only when status == PopStatus::ITEM.
     */
    template <typename T>
    struct PollAttempt {
        PopStatus status;
        std::optional<PollResult<T>> result;
    };

    /**
     * @brief Keeps up to K long polls running, but only as many as callers asked for.
     *
     * Every poll() call adds one permit. A fixed set of poller threads turns
     * permits into poll attempts and parks the results in a bounded buffer, so
     * wire-level concurrency is capped by K no matter how many callers wait.
     *
     * Calling poll() serially, waiting for each result, therefore polls one at
     * a time even with K > 1. Calling it from N threads at once polls up to
     * min(N, K) at once. Results come back in completion order, not in the
     * order the demand was issued.
     */
    template <typename T>
    class LongPollBuffer {
    public:
        using PollFn = std::function<rxcpp::observable<PollResult<T>>()>;

        LongPollBuffer(PollFn pollFn, size_t concurrentPollers, size_t bufferSize,
                       std::string name = "LongPollBuffer")
            : name(std::move(name)),
              pollFn(std::move(pollFn)),
              buffered(bufferSize) {
            if (concurrentPollers == 0) {
                throw std::invalid_argument("LongPollBuffer needs at least one poller");
            }
            if (!this->pollFn) {
                throw std::invalid_argument("LongPollBuffer needs a poll function");
            }

            for (size_t i = 0; i < concurrentPollers; ++i) {
                slots.push_back(std::make_shared<PollerSlot>());
            }

            // Wakes every place a poller can be parked: waiting for demand, or
            // waiting on an in-flight attempt.
            shutdownSignal.onShutdown([this] {
                demand.wake();
                for (auto& slot : slots) slot->wake();
            });

            livePollers.store(concurrentPollers);
            workers.reserve(concurrentPollers);
            try {
                for (size_t i = 0; i < concurrentPollers; ++i) {
                    workers.emplace_back(&LongPollBuffer::pollLoop, this, i, slots[i]);
                }
            } catch (...) {
                // The destructor will not run; stop whatever did start.
                shutdown();
                throw;
            }

            LoomUtils::logDebug(this->name, "started " + std::to_string(concurrentPollers) +
                                " pollers, buffer size " + std::to_string(buffered.capacity()));
        }

        ~LongPollBuffer() {
            shutdown();
        }

        LongPollBuffer(const LongPollBuffer&) = delete;
        LongPollBuffer& operator=(const LongPollBuffer&) = delete;

        /**
         * @brief Requests one poll and waits for one buffered result.
         * @return std::nullopt once the buffer is shut down and drained.
         */
        std::optional<PollResult<T>> poll() {
            requestOne();
            return buffered.pop();
        }

        /**
         * @brief poll() raced against an interrupt token.
         *
         * The permit stays issued when the wait is interrupted: the demand is
         * still outstanding, and the result it produces waits in the buffer for
         * the next caller.
         */
        PollAttempt<T> poll(rxcpp::composite_subscription interrupt) {
            requestOne();

            std::optional<PollResult<T>> result;
            PopStatus status = buffered.pop(result, interrupt);
            return PollAttempt<T>{status, std::move(result)};
        }

        // Does not wait for the pollers; they exit on their next wake-up.
        void notifyShutdown() {
            if (shutdownSignal.isSet()) return;

            setState(Loom::Core::BufferState::DRAINING);
            shutdownSignal.notify();
        }

        /**
         * @brief Stops and joins every poller. Safe to call more than once.
         * Results buffered before the call can still be drained with poll().
         */
        void shutdown() {
            notifyShutdown();

            // Releases pollers blocked on a full buffer; what they hold is discarded.
            buffered.close();

            std::lock_guard<std::mutex> lock(joinMutex);
            for (auto& worker : workers) {
                if (worker.joinable()) worker.join();
            }

            if (telemetry.state.load() != Loom::Core::BufferState::STOPPED) {
                setState(Loom::Core::BufferState::STOPPED);
                LoomUtils::logDebug(name, "shut down: " + Loom::Core::describe(telemetry.snapshot()));
            }
        }

        // Permits issued by poll() that no poller has taken yet
        size_t outstandingDemand() const { return demand.available(); }

        [[nodiscard]] Loom::Core::TelemetrySnapshot getTelemetrySnapshot() const {
            return telemetry.snapshot();
        }

        const std::string& getName() const { return name; }

    private:
        // Per-poller wait point for the attempt in flight
        struct PollerSlot {
            std::mutex mtx;
            std::condition_variable cv;

            void wake() {
                { std::lock_guard<std::mutex> lock(mtx); }
                cv.notify_all();
            }
        };

        // Written by the poll operation's callbacks, possibly after the poller gave up
        struct PendingPoll {
            std::optional<PollResult<T>> result;
        };

        void requestOne() {
            telemetry.polls_requested++;
            demand.release(1);
        }

        void setState(Loom::Core::BufferState next) {
            telemetry.state.store(next);
        }

        void pollLoop(size_t index, std::shared_ptr<PollerSlot> slot) {
            const std::string tag = name + "#" + std::to_string(index);

            while (true) {
                if (shutdownSignal.isSet()) break;

                if (!demand.acquire(shutdownSignal)) continue;

                std::optional<PollResult<T>> result = awaitAttempt(slot);
                if (!result) {
                    // Shutdown raced ahead of the attempt. The demand was never
                    // met, so the permit goes back.
                    demand.release(1);
                    LoomUtils::logDebug(tag, "abandoned in-flight poll on shutdown");
                    continue;
                }

                if (!buffered.push(std::move(*result))) {
                    telemetry.results_discarded++;
                    LoomUtils::logDebug(tag, "buffer closed, discarding poll result");
                }
            }

            LoomUtils::logDebug(tag, "exiting");

            // Last one out closes the buffer, so waiting callers see the end.
            if (livePollers.fetch_sub(1) == 1) {
                buffered.close();
            }
        }

        // Runs one attempt; std::nullopt when shutdown fired before it finished.
        std::optional<PollResult<T>> awaitAttempt(const std::shared_ptr<PollerSlot>& slot) {
            auto pending = std::make_shared<PendingPoll>();

            auto deliver = [slot, pending](PollResult<T> r) {
                {
                    std::lock_guard<std::mutex> lock(slot->mtx);
                    if (pending->result) return;
                    pending->result.emplace(std::move(r));
                }
                slot->cv.notify_all();
            };

            telemetry.record_attempt_started();

            rxcpp::composite_subscription attempt;
            try {
                pollFn().subscribe(
                    attempt,
                    [deliver](PollResult<T> r) { deliver(std::move(r)); },
                    [deliver](std::exception_ptr ep) { deliver(PollResult<T>(PollError::fromException(ep))); },
                    [deliver]() {
                        deliver(PollResult<T>(PollError{StatusCode::INTERNAL,
                                                        "poll completed without a response"}));
                    });
            } catch (...) {
                deliver(PollResult<T>(PollError::fromException(std::current_exception())));
            }

            std::unique_lock<std::mutex> lock(slot->mtx);
            slot->cv.wait(lock, [&] { return pending->result.has_value() || shutdownSignal.isSet(); });

            if (!pending->result) {
                lock.unlock();
                attempt.unsubscribe();
                telemetry.record_attempt_abandoned();
                return std::nullopt;
            }

            std::optional<PollResult<T>> result = std::move(pending->result);
            lock.unlock();

            attempt.unsubscribe();
            telemetry.record_attempt_finished(!result->ok());
            return result;
        }

        // --- Identity ---
        const std::string name;
        const PollFn pollFn;

        // --- Coordination ---
        DemandGate demand;
        BoundedBuffer<PollResult<T>> buffered;
        Loom::Core::PollTelemetry telemetry;

        // --- Pollers ---
        std::vector<std::shared_ptr<PollerSlot>> slots;
        std::vector<std::thread> workers;
        std::atomic<size_t> livePollers{0};
        std::mutex joinMutex;

        Loom::Core::ShutdownSignal shutdownSignal;
    };
}

#endif // LOOM_LONG_POLL_BUFFER_HPP
