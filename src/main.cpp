#include <functional>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>
#include "rxcpp/rx.hpp"

#include "core/SimulatedGateway.hpp"
#include "pollers/TaskBuffers.hpp"
#include "utils/Log.hpp"
#include "utils/WorkerConfig.hpp"
#include "workflow/DrivenWorkflow.hpp"
#include "workflow/WorkflowBridge.hpp"

using namespace Loom;

namespace {

    Workflow::WorkflowExecutionStartedEventAttributes attribsFor(
        const Pollers::PollWorkflowTaskQueueResponse& task, const std::string& taskQueue) {
        Workflow::WorkflowExecutionStartedEventAttributes attribs;
        attribs.workflowType = task.workflowType;
        attribs.taskQueue = taskQueue;
        attribs.originalExecutionRunId = task.workflowExecution.runId;
        attribs.firstExecutionRunId = task.workflowExecution.runId;
        attribs.identity = "loom_worker";
        attribs.attempt = task.attempt;
        return attribs;
    }

    // One activation round trip: jobs out to the lang side, commands back.
    void driveWorkflowTask(const Pollers::PollWorkflowTaskQueueResponse& task,
                           const std::string& taskQueue) {
        const std::string tag = "Workflow:" + task.workflowExecution.workflowId;

        rxcpp::subjects::subject<std::vector<Workflow::WFCommand>> lang;
        Workflow::DrivenWorkflow workflow(
            std::make_unique<Workflow::WorkflowBridge>(lang.get_observable()));

        uint64_t seed = std::hash<std::string>{}(task.workflowExecution.runId);
        if (!workflow.start(task.workflowExecution.workflowId, seed, attribsFor(task, taskQueue))) {
            LoomUtils::logWarn(tag, "already started, skipping task " + task.taskToken);
            return;
        }

        for (const auto& job : workflow.drainJobs()) {
            LoomUtils::logInfo(tag, std::string("job -> lang: ") + Workflow::jobName(job));
        }

        auto langOut = lang.get_subscriber();
        langOut.on_next(std::vector<Workflow::WFCommand>{
            Workflow::CompleteWorkflowExecution{Core::Payload{{{"encoding", "json/plain"}}, "\"done\""}}});
        langOut.on_completed();

        for (const auto& command : workflow.fetchWorkflowIterationOutput()) {
            LoomUtils::logInfo(tag, std::string("command <- lang: ") + Workflow::commandName(command));
        }
    }
}

int main(int argc, char* argv[]) {
    LoomUtils::WorkerConfig config;
    try {
        config = LoomUtils::parseWorkerArgs(argc, argv);
    } catch (const std::invalid_argument& e) {
        std::cerr << "ERROR: " << e.what() << "\n" << LoomUtils::usage(argv[0]) << std::endl;
        return 1;
    }
    LoomUtils::setLogLevel(config.logLevel);

    std::cout << "--- LOOM WORKER - task queue '" << config.taskQueue << "' ---" << std::endl;

    auto gateway = std::make_shared<Core::SimulatedGateway>(config.simulatedLatency);

    auto wftBuffer = Pollers::newWorkflowTaskBuffer(
        gateway, config.taskQueue, config.maxConcurrentWftPolls, config.wftBufferSize);
    auto atBuffer = Pollers::newActivityTaskBuffer(
        gateway, config.taskQueue, config.maxConcurrentAtPolls, config.atBufferSize);

    // --- Workflow tasks ---
    for (size_t i = 0; i < config.demoTasks; ++i) {
        auto polled = wftBuffer->poll();
        if (!polled) break;

        if (!polled->ok()) {
            LoomUtils::logWarn(wftBuffer->getName(), "poll failed: " + polled->error().describe());
            continue;
        }
        LoomUtils::logInfo(wftBuffer->getName(), "got task " + polled->value().taskToken);
        driveWorkflowTask(polled->value(), config.taskQueue);
    }

    // --- Activity task ---
    auto activity = atBuffer->poll();
    if (activity && activity->ok()) {
        LoomUtils::logInfo(atBuffer->getName(), "got activity " + activity->value().activityId +
                           " (" + activity->value().activityType + ")");
    } else if (activity) {
        LoomUtils::logWarn(atBuffer->getName(), "poll failed: " + activity->error().describe());
    }

    wftBuffer->shutdown();
    atBuffer->shutdown();

    std::cout << "[" << wftBuffer->getName() << "] " << Core::describe(wftBuffer->getTelemetrySnapshot()) << std::endl;
    std::cout << "[" << atBuffer->getName() << "] " << Core::describe(atBuffer->getTelemetrySnapshot()) << std::endl;
    std::cout << "[Gateway] workflow polls: " << gateway->workflowPollCount()
              << ", activity polls: " << gateway->activityPollCount() << std::endl;

    std::cout << "\n[SUCCESS] Worker stopped cleanly." << std::endl;
    return 0;
}
