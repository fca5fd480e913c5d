// © 2026 Beatrix Zselezny. All rights reserved.
// Loom Workflow Core

#ifndef LOOM_SIMULATED_GATEWAY_HPP
#define LOOM_SIMULATED_GATEWAY_HPP

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>

#include "pollers/ServerGateway.hpp"

namespace Loom::Core {

    /**
     * @brief Stand-in dispatch server: every poll succeeds after a fixed latency.
     * Tasks are numbered per kind in the order the polls were issued.
     */
    class SimulatedGateway final : public Loom::Pollers::IServerGateway {
    public:
        explicit SimulatedGateway(std::chrono::milliseconds latency);

        rxcpp::observable<Loom::Pollers::PollResult<Loom::Pollers::PollWorkflowTaskQueueResponse>>
            pollWorkflowTask(const std::string& taskQueue) override;

        rxcpp::observable<Loom::Pollers::PollResult<Loom::Pollers::PollActivityTaskQueueResponse>>
            pollActivityTask(const std::string& taskQueue) override;

        uint64_t workflowPollCount() const { return workflowPolls.load(); }
        uint64_t activityPollCount() const { return activityPolls.load(); }

    private:
        template <typename Response>
        rxcpp::observable<Loom::Pollers::PollResult<Response>> respondLater(Response response) const;

        const std::chrono::milliseconds latency;
        std::atomic<uint64_t> workflowPolls{0};
        std::atomic<uint64_t> activityPolls{0};
    };
}

#endif // LOOM_SIMULATED_GATEWAY_HPP
