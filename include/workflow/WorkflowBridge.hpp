// © 2026 Beatrix Zselezny. All rights reserved.
// Loom Workflow Core

#ifndef LOOM_WORKFLOW_BRIDGE_HPP
#define LOOM_WORKFLOW_BRIDGE_HPP

#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <vector>
#include "rxcpp/rx.hpp"

#include "workflow/WorkflowFetcher.hpp"

namespace Loom::Workflow {

    /**
     * @brief Fetcher fed by the language side's task completions.
     *
     * Each batch on the incoming stream is the output of one iteration.
     * Batches are handed out in arrival order; fetching blocks until one is
     * there. Once the stream ends with nothing buffered, fetching yields a
     * single NoCommandsFromLang.
     */
    class WorkflowBridge final : public WorkflowFetcher {
    public:
        explicit WorkflowBridge(rxcpp::observable<std::vector<WFCommand>> incomingCommands);
        ~WorkflowBridge() override;

        WorkflowBridge(const WorkflowBridge&) = delete;
        WorkflowBridge& operator=(const WorkflowBridge&) = delete;

        std::vector<WFCommand> fetchWorkflowIterationOutput() override;

    private:
        // Shared with the subscription, which may outlive a fetch in progress
        struct Inbox {
            std::mutex mtx;
            std::condition_variable cv;
            std::deque<std::vector<WFCommand>> batches;
            bool closed = false;
        };

        std::shared_ptr<Inbox> inbox;
        rxcpp::composite_subscription lifetime;
    };
}

#endif // LOOM_WORKFLOW_BRIDGE_HPP
