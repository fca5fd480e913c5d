// © 2026 Beatrix Zselezny. All rights reserved.
// Loom Workflow Core

#ifndef LOOM_WORKFLOW_COMMANDS_HPP
#define LOOM_WORKFLOW_COMMANDS_HPP

#include <chrono>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "core/Payload.hpp"

namespace Loom::Workflow {

    using Loom::Core::Payload;

    // The language side finished an iteration without producing anything
    struct NoCommandsFromLang {
        bool operator==(const NoCommandsFromLang&) const = default;
    };

    struct ScheduleActivity {
        std::string activityId;
        std::string activityType;
        std::string taskQueue;
        std::vector<Payload> arguments;
        std::chrono::milliseconds scheduleToCloseTimeout{0};

        bool operator==(const ScheduleActivity&) const = default;
    };

    struct StartTimer {
        std::string timerId;
        std::chrono::milliseconds startToFireTimeout{0};

        bool operator==(const StartTimer&) const = default;
    };

    struct CancelTimer {
        std::string timerId;

        bool operator==(const CancelTimer&) const = default;
    };

    struct CompleteWorkflowExecution {
        std::optional<Payload> result;

        bool operator==(const CompleteWorkflowExecution&) const = default;
    };

    struct FailWorkflowExecution {
        std::string failure;

        bool operator==(const FailWorkflowExecution&) const = default;
    };

    struct QueryResponse {
        std::string queryId;
        std::optional<Payload> answer;
        std::string failure;

        bool operator==(const QueryResponse&) const = default;
    };

    /**
     * @brief Outbound intent produced by one iteration of workflow code.
     * The core only stores and forwards these.
     */
    using WFCommand = std::variant<
        NoCommandsFromLang,
        ScheduleActivity,
        StartTimer,
        CancelTimer,
        CompleteWorkflowExecution,
        FailWorkflowExecution,
        QueryResponse>;

    const char* commandName(const WFCommand& command);
}

#endif // LOOM_WORKFLOW_COMMANDS_HPP
