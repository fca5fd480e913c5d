// © 2026 Beatrix Zselezny. All rights reserved.
// Loom Workflow Core
// Shutdown Signal: monotonic broadcast flag shared by every poller loop

#ifndef LOOM_SHUTDOWN_SIGNAL_HPP
#define LOOM_SHUTDOWN_SIGNAL_HPP

#include <atomic>
#include <functional>
#include <mutex>
#include "rxcpp/rx.hpp"

namespace Loom::Core {

    /**
     * @brief Single-writer, multi-reader flag that only ever goes false -> true.
     *
     * The value lives in a behavior subject, so a listener registered after the
     * flip still sees it. Readers on hot paths use isSet(), which never takes
     * the subject's lock.
     */
    class ShutdownSignal {
    private:
        // --- State ---
        std::atomic<bool> raised{false};
        std::mutex publishMutex;

        rxcpp::subjects::behavior<bool> state;
        rxcpp::composite_subscription lifetime;

    public:
        ShutdownSignal();
        ~ShutdownSignal();

        ShutdownSignal(const ShutdownSignal&) = delete;
        ShutdownSignal& operator=(const ShutdownSignal&) = delete;

        // Idempotent, never blocks on listeners other than the ones it runs inline.
        void notify();

        bool isSet() const { return raised.load(std::memory_order_acquire); }

        /**
         * @brief Runs the callback once, on the thread that calls notify().
         * If the flag is already set the callback runs before this returns.
         */
        void onShutdown(std::function<void()> callback);
    };
}

#endif // LOOM_SHUTDOWN_SIGNAL_HPP
