// © 2026 Beatrix Zselezny. All rights reserved.
// Loom Workflow Core

#ifndef LOOM_DEMAND_GATE_HPP
#define LOOM_DEMAND_GATE_HPP

#include <condition_variable>
#include <cstddef>
#include <mutex>

namespace Loom::Core {
    class ShutdownSignal;
}

namespace Loom::Pollers {

    /**
     * @brief Counts outstanding demand for poll results.
     *
     * Each permit is one request a caller made and nobody has started polling
     * for yet. A permit is taken by exactly one poller.
     */
    class DemandGate {
    public:
        DemandGate() = default;

        DemandGate(const DemandGate&) = delete;
        DemandGate& operator=(const DemandGate&) = delete;

        void release(size_t count = 1);

        /**
         * @brief Blocks until a permit can be taken or shutdown is raised.
         * @return true with one permit taken, false when shutdown won (nothing taken).
         */
        bool acquire(const Loom::Core::ShutdownSignal& shutdown);

        // Makes blocked acquirers re-check the shutdown signal
        void wake();

        size_t available() const;

    private:
        mutable std::mutex mtx;
        std::condition_variable cv;
        size_t permits = 0;
    };
}

#endif // LOOM_DEMAND_GATE_HPP
