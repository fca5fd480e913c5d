// © 2026 Beatrix Zselezny. All rights reserved.
// Loom Workflow Core

#include "pollers/TaskBuffers.hpp"
#include <stdexcept>

namespace Loom::Pollers {

    namespace {
        void requireGateway(const std::shared_ptr<IServerGateway>& gateway) {
            if (!gateway) {
                throw std::invalid_argument("Task buffer needs a server gateway");
            }
        }
    }

    std::unique_ptr<PollWorkflowTaskBuffer> newWorkflowTaskBuffer(
        std::shared_ptr<IServerGateway> gateway,
        std::string taskQueue,
        size_t concurrentPollers,
        size_t bufferSize) {
        requireGateway(gateway);
        std::string name = "LongPollBuffer:wft:" + taskQueue;

        return std::make_unique<PollWorkflowTaskBuffer>(
            [gateway, taskQueue]() { return gateway->pollWorkflowTask(taskQueue); },
            concurrentPollers,
            bufferSize,
            std::move(name));
    }

    std::unique_ptr<PollActivityTaskBuffer> newActivityTaskBuffer(
        std::shared_ptr<IServerGateway> gateway,
        std::string taskQueue,
        size_t concurrentPollers,
        size_t bufferSize) {
        requireGateway(gateway);
        std::string name = "LongPollBuffer:at:" + taskQueue;

        return std::make_unique<PollActivityTaskBuffer>(
            [gateway, taskQueue]() { return gateway->pollActivityTask(taskQueue); },
            concurrentPollers,
            bufferSize,
            std::move(name));
    }
}
