// © 2026 Beatrix Zselezny. All rights reserved.
// Loom Workflow Core

#include "workflow/WorkflowBridge.hpp"
#include "pollers/PollResult.hpp"
#include "utils/Log.hpp"
#include <utility>

namespace Loom::Workflow {

    WorkflowBridge::WorkflowBridge(rxcpp::observable<std::vector<WFCommand>> incomingCommands)
        : inbox(std::make_shared<Inbox>()) {

        auto box = inbox;
        auto closeInbox = [box]() {
            {
                std::lock_guard<std::mutex> lock(box->mtx);
                box->closed = true;
            }
            box->cv.notify_all();
        };

        incomingCommands.subscribe(
            lifetime,
            [box](std::vector<WFCommand> batch) {
                {
                    std::lock_guard<std::mutex> lock(box->mtx);
                    box->batches.push_back(std::move(batch));
                }
                box->cv.notify_one();
            },
            [closeInbox](std::exception_ptr ep) {
                LoomUtils::logError("WorkflowBridge", "command stream failed: " +
                                    Loom::Pollers::PollError::fromException(ep).message);
                closeInbox();
            },
            closeInbox);
    }

    WorkflowBridge::~WorkflowBridge() {
        if (lifetime.is_subscribed()) {
            lifetime.unsubscribe();
        }
    }

    std::vector<WFCommand> WorkflowBridge::fetchWorkflowIterationOutput() {
        std::unique_lock<std::mutex> lock(inbox->mtx);
        inbox->cv.wait(lock, [this] { return !inbox->batches.empty() || inbox->closed; });

        if (inbox->batches.empty()) {
            return {NoCommandsFromLang{}};
        }

        std::vector<WFCommand> batch = std::move(inbox->batches.front());
        inbox->batches.pop_front();
        return batch;
    }
}
