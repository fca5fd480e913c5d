// © 2026 Beatrix Zselezny. All rights reserved.
// Loom Workflow Core
// Poll results: a task, or the error the poll operation reported

#ifndef LOOM_POLL_RESULT_HPP
#define LOOM_POLL_RESULT_HPP

#include <exception>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

namespace Loom::Pollers {

    /**
     * @brief Status codes of the task-dispatch service (gRPC numbering).
     */
    enum class StatusCode {
        OK = 0,
        CANCELLED = 1,
        UNKNOWN = 2,
        INVALID_ARGUMENT = 3,
        DEADLINE_EXCEEDED = 4,
        NOT_FOUND = 5,
        ALREADY_EXISTS = 6,
        PERMISSION_DENIED = 7,
        RESOURCE_EXHAUSTED = 8,
        FAILED_PRECONDITION = 9,
        ABORTED = 10,
        OUT_OF_RANGE = 11,
        UNIMPLEMENTED = 12,
        INTERNAL = 13,
        UNAVAILABLE = 14,
        DATA_LOSS = 15,
        UNAUTHENTICATED = 16
    };

    const char* statusCodeName(StatusCode code);

    struct PollError {
        StatusCode code = StatusCode::UNKNOWN;
        std::string message;

        /**
         * @brief Converts whatever a poll operation threw into an error value.
         * A PollFailure keeps its own error; other std::exceptions become INTERNAL.
         */
        static PollError fromException(std::exception_ptr error);

        std::string describe() const;
    };

    /**
     * @brief Thrown when a caller reads the task out of a failed result.
     */
    class PollFailure : public std::runtime_error {
    public:
        explicit PollFailure(PollError error);
        const PollError& error() const noexcept { return pollError; }

    private:
        PollError pollError;
    };

    template <typename T>
    class PollResult {
    public:
        PollResult(T task) : outcome(std::in_place_index<0>, std::move(task)) {}
        PollResult(PollError error) : outcome(std::in_place_index<1>, std::move(error)) {}

        bool ok() const { return outcome.index() == 0; }

        const T& value() const {
            if (!ok()) throw PollFailure(std::get<1>(outcome));
            return std::get<0>(outcome);
        }

        T& value() {
            if (!ok()) throw PollFailure(std::get<1>(outcome));
            return std::get<0>(outcome);
        }

        // Only meaningful when !ok()
        const PollError& error() const { return std::get<1>(outcome); }

    private:
        std::variant<T, PollError> outcome;
    };
}

#endif // LOOM_POLL_RESULT_HPP
