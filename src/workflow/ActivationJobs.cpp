// © 2026 Beatrix Zselezny. All rights reserved.
// Loom Workflow Core

#include "workflow/ActivationJobs.hpp"
#include <utility>

namespace Loom::Workflow {

    StartWorkflow startWorkflowFromAttribs(
        const WorkflowExecutionStartedEventAttributes& attribs,
        std::string workflowId,
        uint64_t randomnessSeed) {
        return StartWorkflow{
            .workflowType   = attribs.workflowType,
            .workflowId     = std::move(workflowId),
            .arguments      = attribs.input,
            .randomnessSeed = randomnessSeed
        };
    }

    namespace {
        struct JobNamer {
            const char* operator()(const StartWorkflow&) const { return "StartWorkflow"; }
            const char* operator()(const FireTimer&) const { return "FireTimer"; }
            const char* operator()(const UpdateRandomSeed&) const { return "UpdateRandomSeed"; }
            const char* operator()(const QueryWorkflow&) const { return "QueryWorkflow"; }
            const char* operator()(const CancelWorkflow&) const { return "CancelWorkflow"; }
            const char* operator()(const SignalWorkflow&) const { return "SignalWorkflow"; }
            const char* operator()(const ResolveActivity&) const { return "ResolveActivity"; }
        };
    }

    const char* jobName(const WorkflowActivationJob& job) {
        return std::visit(JobNamer{}, job);
    }
}
