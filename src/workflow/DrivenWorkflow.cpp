// © 2026 Beatrix Zselezny. All rights reserved.
// Loom Workflow Core

#include "workflow/DrivenWorkflow.hpp"
#include "utils/Log.hpp"
#include <iterator>
#include <stdexcept>
#include <utility>

namespace Loom::Workflow {

    DrivenWorkflow::DrivenWorkflow(std::unique_ptr<WorkflowFetcher> fetcher)
        : fetcher(std::move(fetcher)) {
        if (!this->fetcher) {
            throw std::invalid_argument("DrivenWorkflow needs a workflow fetcher");
        }
    }

    bool DrivenWorkflow::start(std::string workflowId,
                               uint64_t randomnessSeed,
                               WorkflowExecutionStartedEventAttributes attribs) {
        std::lock_guard<std::mutex> lock(jobsMutex);
        if (startedAttrs) {
            LoomUtils::logWarn("DrivenWorkflow", "start ignored, " + workflowId +
                               " already started with run_id=" + startedAttrs->originalExecutionRunId);
            return false;
        }

        LoomUtils::logDebug("DrivenWorkflow", "start run_id=" + attribs.originalExecutionRunId);

        outgoingJobs.emplace_back(startWorkflowFromAttribs(attribs, std::move(workflowId), randomnessSeed));
        startedAttrs = std::move(attribs);
        return true;
    }

    std::optional<WorkflowExecutionStartedEventAttributes> DrivenWorkflow::getStartedAttrs() const {
        std::lock_guard<std::mutex> lock(jobsMutex);
        return startedAttrs;
    }

    void DrivenWorkflow::sendJob(WorkflowActivationJob job) {
        std::lock_guard<std::mutex> lock(jobsMutex);
        outgoingJobs.push_back(std::move(job));
    }

    bool DrivenWorkflow::hasPendingJobs() const {
        std::lock_guard<std::mutex> lock(jobsMutex);
        return !outgoingJobs.empty();
    }

    std::vector<WorkflowActivationJob> DrivenWorkflow::drainJobs() {
        std::deque<WorkflowActivationJob> taken;
        {
            std::lock_guard<std::mutex> lock(jobsMutex);
            taken.swap(outgoingJobs);
        }
        return std::vector<WorkflowActivationJob>(std::make_move_iterator(taken.begin()),
                                                  std::make_move_iterator(taken.end()));
    }

    void DrivenWorkflow::signal(SignalWorkflow signal) {
        sendJob(std::move(signal));
    }

    void DrivenWorkflow::cancel(CancelWorkflow cancellation) {
        sendJob(std::move(cancellation));
    }

    std::vector<WFCommand> DrivenWorkflow::fetchWorkflowIterationOutput() {
        return fetcher->fetchWorkflowIterationOutput();
    }
}
