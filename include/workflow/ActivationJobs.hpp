// © 2026 Beatrix Zselezny. All rights reserved.
// Loom Workflow Core
// Activation jobs: inbound work delivered to one workflow execution

#ifndef LOOM_ACTIVATION_JOBS_HPP
#define LOOM_ACTIVATION_JOBS_HPP

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "core/Payload.hpp"

namespace Loom::Workflow {

    using Loom::Core::Payload;

    /**
     * @brief Start-time metadata of an execution, read off its first history event.
     */
    struct WorkflowExecutionStartedEventAttributes {
        std::string workflowType;
        std::string taskQueue;
        std::vector<Payload> input;
        std::string originalExecutionRunId;
        std::string firstExecutionRunId;
        std::string identity;
        int32_t attempt = 1;
        std::optional<std::chrono::milliseconds> workflowRunTimeout;

        bool operator==(const WorkflowExecutionStartedEventAttributes&) const = default;
    };

    // --- Job variants ---

    struct StartWorkflow {
        std::string workflowType;
        std::string workflowId;
        std::vector<Payload> arguments;
        uint64_t randomnessSeed = 0;

        bool operator==(const StartWorkflow&) const = default;
    };

    struct FireTimer {
        std::string timerId;

        bool operator==(const FireTimer&) const = default;
    };

    struct UpdateRandomSeed {
        uint64_t randomnessSeed = 0;

        bool operator==(const UpdateRandomSeed&) const = default;
    };

    struct QueryWorkflow {
        std::string queryId;
        std::string queryType;
        std::vector<Payload> arguments;

        bool operator==(const QueryWorkflow&) const = default;
    };

    struct CancelWorkflow {
        std::vector<Payload> details;

        bool operator==(const CancelWorkflow&) const = default;
    };

    struct SignalWorkflow {
        std::string signalName;
        std::vector<Payload> input;
        std::string identity;

        bool operator==(const SignalWorkflow&) const = default;
    };

    enum class ActivityStatus { COMPLETED, FAILED, CANCELLED };

    struct ResolveActivity {
        std::string activityId;
        ActivityStatus status = ActivityStatus::COMPLETED;
        std::optional<Payload> result;
        std::string failure;

        bool operator==(const ResolveActivity&) const = default;
    };

    using WorkflowActivationJob = std::variant<
        StartWorkflow,
        FireTimer,
        UpdateRandomSeed,
        QueryWorkflow,
        CancelWorkflow,
        SignalWorkflow,
        ResolveActivity>;

    StartWorkflow startWorkflowFromAttribs(
        const WorkflowExecutionStartedEventAttributes& attribs,
        std::string workflowId,
        uint64_t randomnessSeed);

    // Variant name, for logs
    const char* jobName(const WorkflowActivationJob& job);
}

#endif // LOOM_ACTIVATION_JOBS_HPP
