#ifndef LOOM_CONFIGTEMPLATES_HPP
#define LOOM_CONFIGTEMPLATES_HPP

#include <chrono>
#include <cstddef>
#include <string>

namespace LoomTemplates {

    // Task queue polled when none is given
    inline const std::string DEFAULT_TASK_QUEUE = "default";

    // Workflow-task pollers: wire concurrency cap and buffered results
    inline constexpr size_t DEFAULT_MAX_CONCURRENT_WFT_POLLS = 5;
    inline constexpr size_t DEFAULT_WFT_BUFFER_SIZE = DEFAULT_MAX_CONCURRENT_WFT_POLLS * 2;

    // Upper bound on either poller count; each poller is a thread
    inline constexpr size_t MAX_CONCURRENT_POLLS = 1024;

    // Activity-task pollers
    inline constexpr size_t DEFAULT_MAX_CONCURRENT_AT_POLLS = 5;
    inline constexpr size_t DEFAULT_AT_BUFFER_SIZE = DEFAULT_MAX_CONCURRENT_AT_POLLS * 2;

    // Simulated gateway (demo only)
    inline constexpr std::chrono::milliseconds DEFAULT_SIMULATED_LATENCY{50};
    inline constexpr size_t DEFAULT_DEMO_TASKS = 3;
}

#endif
