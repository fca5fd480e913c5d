// © 2026 Beatrix Zselezny. All rights reserved.
// Loom Workflow Core

#ifndef LOOM_SERVER_GATEWAY_HPP
#define LOOM_SERVER_GATEWAY_HPP

#include <cstdint>
#include <string>
#include <vector>
#include "rxcpp/rx.hpp"

#include "core/Payload.hpp"
#include "pollers/PollResult.hpp"

namespace Loom::Pollers {

    struct WorkflowExecution {
        std::string workflowId;
        std::string runId;
    };

    /**
     * @brief A workflow task handed out by the dispatch server.
     * Only the fields the core routes on; history stays with the replay engine.
     */
    struct PollWorkflowTaskQueueResponse {
        std::string taskToken;
        WorkflowExecution workflowExecution;
        std::string workflowType;
        int64_t previousStartedEventId = 0;
        int64_t startedEventId = 0;
        int32_t attempt = 1;
    };

    struct PollActivityTaskQueueResponse {
        std::string taskToken;
        WorkflowExecution workflowExecution;
        std::string activityId;
        std::string activityType;
        std::vector<Loom::Core::Payload> input;
        int32_t attempt = 1;
    };

    /**
     * @brief The long-poll RPCs of the task-dispatch service.
     *
     * Each call starts one poll and returns an observable that emits exactly
     * one result. Implementations must tolerate concurrent calls.
     */
    class IServerGateway {
    public:
        virtual ~IServerGateway() = default;

        virtual rxcpp::observable<PollResult<PollWorkflowTaskQueueResponse>>
            pollWorkflowTask(const std::string& taskQueue) = 0;

        virtual rxcpp::observable<PollResult<PollActivityTaskQueueResponse>>
            pollActivityTask(const std::string& taskQueue) = 0;
    };
}

#endif // LOOM_SERVER_GATEWAY_HPP
