#include "utils/WorkerConfig.hpp"
#include <cctype>
#include <stdexcept>

namespace LoomUtils {

    namespace {
        size_t parseCount(const std::string& flag, const std::string& value) {
            if (value.empty()) {
                throw std::invalid_argument(flag + " expects a number");
            }
            for (unsigned char c : value) {
                if (!std::isdigit(c)) {
                    throw std::invalid_argument(flag + " expects a number, got '" + value + "'");
                }
            }
            try {
                return static_cast<size_t>(std::stoull(value));
            } catch (const std::out_of_range&) {
                throw std::invalid_argument(flag + " value out of range: " + value);
            }
        }

        void requirePollerCounts(const WorkerConfig& config) {
            if (config.maxConcurrentWftPolls == 0 || config.maxConcurrentAtPolls == 0) {
                throw std::invalid_argument("poller counts must be at least 1");
            }
            if (config.maxConcurrentWftPolls > LoomTemplates::MAX_CONCURRENT_POLLS ||
                config.maxConcurrentAtPolls > LoomTemplates::MAX_CONCURRENT_POLLS) {
                throw std::invalid_argument("poller counts must be at most " +
                                            std::to_string(LoomTemplates::MAX_CONCURRENT_POLLS));
            }
        }
    }

    void WorkerConfig::validate() const {
        if (taskQueue.empty()) {
            throw std::invalid_argument("task queue name must not be empty");
        }
        requirePollerCounts(*this);
        if (wftBufferSize == 0 || atBufferSize == 0) {
            throw std::invalid_argument("buffer sizes must be at least 1");
        }
    }

    WorkerConfig parseWorkerArgs(int argc, char* argv[]) {
        WorkerConfig config;

        // Buffer sizes follow the poller counts unless given explicitly
        bool wftBufferSet = false;
        bool atBufferSet = false;

        for (int i = 1; i < argc; ++i) {
            std::string arg(argv[i]);

            auto next = [&]() -> std::string {
                if (i + 1 >= argc) {
                    throw std::invalid_argument(arg + " needs a value");
                }
                return std::string(argv[++i]);
            };

            if (arg == "--task-queue") {
                config.taskQueue = next();
            } else if (arg == "--wft-pollers") {
                config.maxConcurrentWftPolls = parseCount(arg, next());
            } else if (arg == "--wft-buffer") {
                config.wftBufferSize = parseCount(arg, next());
                wftBufferSet = true;
            } else if (arg == "--at-pollers") {
                config.maxConcurrentAtPolls = parseCount(arg, next());
            } else if (arg == "--at-buffer") {
                config.atBufferSize = parseCount(arg, next());
                atBufferSet = true;
            } else if (arg == "--latency-ms") {
                config.simulatedLatency = std::chrono::milliseconds(parseCount(arg, next()));
            } else if (arg == "--tasks") {
                config.demoTasks = parseCount(arg, next());
            } else if (arg == "--log-level") {
                config.logLevel = parseLogLevel(next());
            } else if (arg == "--verbose") {
                config.logLevel = LogLevel::DEBUG;
            } else if (arg == "--quiet") {
                config.logLevel = LogLevel::WARN;
            } else {
                throw std::invalid_argument("Unknown argument: " + arg);
            }
        }

        // Bounded before the default buffer sizes are derived from them
        requirePollerCounts(config);
        if (!wftBufferSet) config.wftBufferSize = config.maxConcurrentWftPolls * 2;
        if (!atBufferSet) config.atBufferSize = config.maxConcurrentAtPolls * 2;

        config.validate();
        return config;
    }

    std::string usage(const std::string& program) {
        return "Usage: " + program +
               " [--task-queue NAME] [--wft-pollers N] [--wft-buffer N]"
               " [--at-pollers N] [--at-buffer N] [--latency-ms N] [--tasks N]"
               " [--log-level silent|warn|info|debug] [--verbose] [--quiet]";
    }
}
