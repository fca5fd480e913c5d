#include "utils/WorkerConfig.hpp"
#include <cassert>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

using namespace LoomUtils;

static WorkerConfig parse(std::vector<std::string> args) {
    std::vector<char*> argv;
    static char program[] = "loom_worker";
    argv.push_back(program);
    for (auto& a : args) argv.push_back(a.data());
    return parseWorkerArgs(static_cast<int>(argv.size()), argv.data());
}

static bool rejects(std::vector<std::string> args) {
    try {
        parse(std::move(args));
    } catch (const std::invalid_argument&) {
        return true;
    }
    return false;
}

static void test_defaults() {
    WorkerConfig config = parse({});
    assert(config.taskQueue == LoomTemplates::DEFAULT_TASK_QUEUE);
    assert(config.maxConcurrentWftPolls == LoomTemplates::DEFAULT_MAX_CONCURRENT_WFT_POLLS);
    assert(config.wftBufferSize == LoomTemplates::DEFAULT_WFT_BUFFER_SIZE);
    assert(config.maxConcurrentAtPolls == LoomTemplates::DEFAULT_MAX_CONCURRENT_AT_POLLS);
    assert(config.atBufferSize == LoomTemplates::DEFAULT_AT_BUFFER_SIZE);
    assert(config.simulatedLatency == LoomTemplates::DEFAULT_SIMULATED_LATENCY);
    assert(config.demoTasks == LoomTemplates::DEFAULT_DEMO_TASKS);
    assert(config.logLevel == LogLevel::INFO);
}

static void test_flags() {
    WorkerConfig config = parse({"--task-queue", "orders", "--wft-pollers", "3", "--at-pollers", "1",
                                 "--at-buffer", "7", "--latency-ms", "5", "--tasks", "10", "--verbose"});
    assert(config.taskQueue == "orders");
    assert(config.maxConcurrentWftPolls == 3);
    assert(config.wftBufferSize == 6);
    assert(config.maxConcurrentAtPolls == 1);
    assert(config.atBufferSize == 7);
    assert(config.simulatedLatency.count() == 5);
    assert(config.demoTasks == 10);
    assert(config.logLevel == LogLevel::DEBUG);

    assert(parse({"--quiet"}).logLevel == LogLevel::WARN);
    assert(parse({"--log-level", "silent"}).logLevel == LogLevel::SILENT);
}

static void test_rejections() {
    assert(rejects({"--bogus"}));
    assert(rejects({"--wft-pollers"}));
    assert(rejects({"--wft-pollers", "two"}));
    assert(rejects({"--wft-pollers", "-1"}));
    assert(rejects({"--wft-pollers", "0"}));
    assert(rejects({"--at-buffer", "0"}));
    assert(rejects({"--task-queue", ""}));
    assert(rejects({"--log-level", "loud"}));
    assert(rejects({"--tasks", "99999999999999999999999"}));

    // Large enough that doubling into a buffer size would wrap
    assert(rejects({"--wft-pollers", "18446744073709551615"}));
    assert(rejects({"--at-pollers", std::to_string(LoomTemplates::MAX_CONCURRENT_POLLS + 1)}));
    assert(parse({"--at-pollers", std::to_string(LoomTemplates::MAX_CONCURRENT_POLLS)}).atBufferSize ==
           LoomTemplates::MAX_CONCURRENT_POLLS * 2);
}

int main() {
    test_defaults();
    test_flags();
    test_rejections();

    std::cout << "WorkerConfig test PASSED\n";
    return 0;
}
