// © 2026 Beatrix Zselezny. All rights reserved.
// Loom Workflow Core
// Driven Workflow: pending inbound jobs and outbound commands of one execution

#ifndef LOOM_DRIVEN_WORKFLOW_HPP
#define LOOM_DRIVEN_WORKFLOW_HPP

#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "workflow/ActivationJobs.hpp"
#include "workflow/WorkflowFetcher.hpp"

namespace Loom::Workflow {

    /**
     * @brief Stands in for an actual workflow implementation.
     *
     * Queues the jobs that must reach the workflow and fetches its output
     * through the wrapped fetcher. Being a WorkflowFetcher itself, it can be
     * layered under logging or test wrappers.
     */
    class DrivenWorkflow final : public WorkflowFetcher {
    public:
        // Throws std::invalid_argument on a null fetcher
        explicit DrivenWorkflow(std::unique_ptr<WorkflowFetcher> fetcher);

        /**
         * @brief Queues the start job and records the started attributes.
         * @return false if the workflow was already started; nothing is queued
         *         and the first attributes are kept.
         */
        [[nodiscard]] bool start(std::string workflowId,
                                 uint64_t randomnessSeed,
                                 WorkflowExecutionStartedEventAttributes attribs);

        // Attributes of the first accepted start(); std::nullopt until then.
        // A rejected second start() never replaces them.
        std::optional<WorkflowExecutionStartedEventAttributes> getStartedAttrs() const;

        void sendJob(WorkflowActivationJob job);

        bool hasPendingJobs() const;

        // Takes every queued job, oldest first, leaving the queue empty
        std::vector<WorkflowActivationJob> drainJobs();

        void signal(SignalWorkflow signal);
        void cancel(CancelWorkflow cancellation);

        std::vector<WFCommand> fetchWorkflowIterationOutput() override;

    private:
        mutable std::mutex jobsMutex;
        std::optional<WorkflowExecutionStartedEventAttributes> startedAttrs;
        std::deque<WorkflowActivationJob> outgoingJobs;

        std::unique_ptr<WorkflowFetcher> fetcher;
    };
}

#endif // LOOM_DRIVEN_WORKFLOW_HPP
