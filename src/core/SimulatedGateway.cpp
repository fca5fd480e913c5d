// © 2026 Beatrix Zselezny. All rights reserved.
// Loom Workflow Core

#include "core/SimulatedGateway.hpp"
#include "utils/Log.hpp"

namespace Loom::Core {

    using Loom::Pollers::PollActivityTaskQueueResponse;
    using Loom::Pollers::PollResult;
    using Loom::Pollers::PollWorkflowTaskQueueResponse;

    SimulatedGateway::SimulatedGateway(std::chrono::milliseconds latency)
        : latency(latency) {}

    template <typename Response>
    rxcpp::observable<PollResult<Response>> SimulatedGateway::respondLater(Response response) const {
        // The timer thread plays the server holding the long poll open.
        return rxcpp::observable<>::timer(latency, rxcpp::observe_on_new_thread())
            .map([response](auto) { return PollResult<Response>(response); })
            .as_dynamic();
    }

    rxcpp::observable<PollResult<PollWorkflowTaskQueueResponse>>
    SimulatedGateway::pollWorkflowTask(const std::string& taskQueue) {
        uint64_t n = ++workflowPolls;
        LoomUtils::logDebug("SimulatedGateway", "workflow poll #" + std::to_string(n) + " on " + taskQueue);

        PollWorkflowTaskQueueResponse task;
        task.taskToken = taskQueue + "/wft/" + std::to_string(n);
        task.workflowExecution.workflowId = "wf-" + std::to_string(n);
        task.workflowExecution.runId = "run-" + std::to_string(n);
        task.workflowType = "simulated-workflow";
        task.startedEventId = 3;

        return respondLater(std::move(task));
    }

    rxcpp::observable<PollResult<PollActivityTaskQueueResponse>>
    SimulatedGateway::pollActivityTask(const std::string& taskQueue) {
        uint64_t n = ++activityPolls;
        LoomUtils::logDebug("SimulatedGateway", "activity poll #" + std::to_string(n) + " on " + taskQueue);

        PollActivityTaskQueueResponse task;
        task.taskToken = taskQueue + "/at/" + std::to_string(n);
        task.workflowExecution.workflowId = "wf-" + std::to_string(n);
        task.workflowExecution.runId = "run-" + std::to_string(n);
        task.activityId = std::to_string(n);
        task.activityType = "simulated-activity";
        task.input.push_back(Payload{{{"encoding", "json/plain"}}, "{\"n\":" + std::to_string(n) + "}"});

        return respondLater(std::move(task));
    }

} // namespace Loom::Core
