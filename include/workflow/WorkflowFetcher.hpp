// © 2026 Beatrix Zselezny. All rights reserved.
// Loom Workflow Core

#ifndef LOOM_WORKFLOW_FETCHER_HPP
#define LOOM_WORKFLOW_FETCHER_HPP

#include <vector>
#include "workflow/WorkflowCommands.hpp"

namespace Loom::Workflow {

    /**
     * @brief Source of the commands produced by running (or mocking) workflow code.
     *
     * Workflow code runs on the language side, driven by the activations it
     * receives, so the core cannot iterate it directly. Implementations either
     * buffer what the language side reports or produce it on demand.
     */
    class WorkflowFetcher {
    public:
        virtual ~WorkflowFetcher() = default;

        /**
         * @brief Commands produced by the most recent iteration.
         * Blocks until the implementation has output ready.
         */
        virtual std::vector<WFCommand> fetchWorkflowIterationOutput() = 0;
    };
}

#endif // LOOM_WORKFLOW_FETCHER_HPP
