#ifndef LOOM_WORKER_CONFIG_HPP
#define LOOM_WORKER_CONFIG_HPP

#include <chrono>
#include <cstddef>
#include <string>

#include "utils/ConfigTemplates.hpp"
#include "utils/Log.hpp"

namespace LoomUtils {

    struct WorkerConfig {
        std::string taskQueue = LoomTemplates::DEFAULT_TASK_QUEUE;

        size_t maxConcurrentWftPolls = LoomTemplates::DEFAULT_MAX_CONCURRENT_WFT_POLLS;
        size_t wftBufferSize         = LoomTemplates::DEFAULT_WFT_BUFFER_SIZE;
        size_t maxConcurrentAtPolls  = LoomTemplates::DEFAULT_MAX_CONCURRENT_AT_POLLS;
        size_t atBufferSize          = LoomTemplates::DEFAULT_AT_BUFFER_SIZE;

        std::chrono::milliseconds simulatedLatency = LoomTemplates::DEFAULT_SIMULATED_LATENCY;
        size_t demoTasks = LoomTemplates::DEFAULT_DEMO_TASKS;

        LogLevel logLevel = LogLevel::INFO;

        // Throws std::invalid_argument on zero or too many pollers, zero buffers,
        // or an empty queue name
        void validate() const;
    };

    /**
     * @brief Builds a WorkerConfig from command-line flags.
     *
     *   --task-queue NAME   --wft-pollers N   --wft-buffer N
     *   --at-pollers N      --at-buffer N     --latency-ms N
     *   --tasks N           --log-level silent|warn|info|debug
     *   --verbose           --quiet
     *
     * Throws std::invalid_argument for unknown flags, missing values and bad numbers.
     */
    WorkerConfig parseWorkerArgs(int argc, char* argv[]);

    std::string usage(const std::string& program);
}

#endif
