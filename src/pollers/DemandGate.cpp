// © 2026 Beatrix Zselezny. All rights reserved.
// Loom Workflow Core

#include "pollers/DemandGate.hpp"
#include "core/ShutdownSignal.hpp"

namespace Loom::Pollers {

    void DemandGate::release(size_t count) {
        if (count == 0) return;
        {
            std::lock_guard<std::mutex> lock(mtx);
            permits += count;
        }
        if (count == 1) cv.notify_one();
        else cv.notify_all();
    }

    bool DemandGate::acquire(const Loom::Core::ShutdownSignal& shutdown) {
        std::unique_lock<std::mutex> lock(mtx);
        cv.wait(lock, [&] { return permits > 0 || shutdown.isSet(); });

        if (shutdown.isSet()) return false;
        --permits;
        return true;
    }

    void DemandGate::wake() {
        // Taking the lock orders this after any waiter's predicate check.
        { std::lock_guard<std::mutex> lock(mtx); }
        cv.notify_all();
    }

    size_t DemandGate::available() const {
        std::lock_guard<std::mutex> lock(mtx);
        return permits;
    }
}
