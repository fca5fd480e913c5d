// © 2026 Beatrix Zselezny. All rights reserved.
// Loom Workflow Core

#include "core/ShutdownSignal.hpp"

namespace Loom::Core {

    ShutdownSignal::ShutdownSignal() : state(false) {}

    ShutdownSignal::~ShutdownSignal() {
        if (lifetime.is_subscribed()) {
            lifetime.unsubscribe();
        }
    }

    void ShutdownSignal::notify() {
        std::lock_guard<std::mutex> lock(publishMutex);
        if (raised.exchange(true, std::memory_order_acq_rel)) return;

        // The atomic is already true here, so a listener woken by on_next
        // re-checks its predicate and sees the flip.
        state.get_subscriber().on_next(true);
    }

    void ShutdownSignal::onShutdown(std::function<void()> callback) {
        // take(1) completes its own subscription; a shared one would cut off
        // the listeners registered after it.
        rxcpp::composite_subscription registration;
        lifetime.add(registration);

        state.get_observable()
            .filter([](bool value) { return value; })
            .take(1)
            .subscribe(registration, [callback](bool) { callback(); });
    }

} // namespace Loom::Core
