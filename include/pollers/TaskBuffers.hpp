// © 2026 Beatrix Zselezny. All rights reserved.
// Loom Workflow Core

#ifndef LOOM_TASK_BUFFERS_HPP
#define LOOM_TASK_BUFFERS_HPP

#include <cstddef>
#include <memory>
#include <string>

#include "pollers/LongPollBuffer.hpp"
#include "pollers/ServerGateway.hpp"

namespace Loom::Pollers {

    using PollWorkflowTaskBuffer = LongPollBuffer<PollWorkflowTaskQueueResponse>;
    using PollActivityTaskBuffer = LongPollBuffer<PollActivityTaskQueueResponse>;

    // Binds the gateway and queue name into the buffer's poll function.
    std::unique_ptr<PollWorkflowTaskBuffer> newWorkflowTaskBuffer(
        std::shared_ptr<IServerGateway> gateway,
        std::string taskQueue,
        size_t concurrentPollers,
        size_t bufferSize);

    std::unique_ptr<PollActivityTaskBuffer> newActivityTaskBuffer(
        std::shared_ptr<IServerGateway> gateway,
        std::string taskQueue,
        size_t concurrentPollers,
        size_t bufferSize);
}

#endif // LOOM_TASK_BUFFERS_HPP
