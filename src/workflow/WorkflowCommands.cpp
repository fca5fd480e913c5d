#include "workflow/WorkflowCommands.hpp"

namespace Loom::Workflow {

    namespace {
        struct CommandNamer {
            const char* operator()(const NoCommandsFromLang&) const { return "NoCommandsFromLang"; }
            const char* operator()(const ScheduleActivity&) const { return "ScheduleActivity"; }
            const char* operator()(const StartTimer&) const { return "StartTimer"; }
            const char* operator()(const CancelTimer&) const { return "CancelTimer"; }
            const char* operator()(const CompleteWorkflowExecution&) const { return "CompleteWorkflowExecution"; }
            const char* operator()(const FailWorkflowExecution&) const { return "FailWorkflowExecution"; }
            const char* operator()(const QueryResponse&) const { return "QueryResponse"; }
        };
    }

    const char* commandName(const WFCommand& command) {
        return std::visit(CommandNamer{}, command);
    }
}
