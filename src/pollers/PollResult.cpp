// © 2026 Beatrix Zselezny. All rights reserved.
// Loom Workflow Core

#include "pollers/PollResult.hpp"

namespace Loom::Pollers {

    const char* statusCodeName(StatusCode code) {
        switch (code) {
            case StatusCode::OK:                  return "OK";
            case StatusCode::CANCELLED:           return "CANCELLED";
            case StatusCode::UNKNOWN:             return "UNKNOWN";
            case StatusCode::INVALID_ARGUMENT:    return "INVALID_ARGUMENT";
            case StatusCode::DEADLINE_EXCEEDED:   return "DEADLINE_EXCEEDED";
            case StatusCode::NOT_FOUND:           return "NOT_FOUND";
            case StatusCode::ALREADY_EXISTS:      return "ALREADY_EXISTS";
            case StatusCode::PERMISSION_DENIED:   return "PERMISSION_DENIED";
            case StatusCode::RESOURCE_EXHAUSTED:  return "RESOURCE_EXHAUSTED";
            case StatusCode::FAILED_PRECONDITION: return "FAILED_PRECONDITION";
            case StatusCode::ABORTED:             return "ABORTED";
            case StatusCode::OUT_OF_RANGE:        return "OUT_OF_RANGE";
            case StatusCode::UNIMPLEMENTED:       return "UNIMPLEMENTED";
            case StatusCode::INTERNAL:            return "INTERNAL";
            case StatusCode::UNAVAILABLE:         return "UNAVAILABLE";
            case StatusCode::DATA_LOSS:           return "DATA_LOSS";
            case StatusCode::UNAUTHENTICATED:     return "UNAUTHENTICATED";
        }
        return "UNKNOWN";
    }

    PollError PollError::fromException(std::exception_ptr error) {
        if (!error) {
            return PollError{StatusCode::UNKNOWN, "poll failed without an exception"};
        }
        try {
            std::rethrow_exception(error);
        } catch (const PollFailure& failure) {
            return failure.error();
        } catch (const std::exception& e) {
            return PollError{StatusCode::INTERNAL, e.what()};
        } catch (...) {
            // Non-std exception types carry no message we can read
            return PollError{StatusCode::UNKNOWN, "poll operation threw a non-standard exception"};
        }
    }

    std::string PollError::describe() const {
        return std::string(statusCodeName(code)) + ": " + message;
    }

    PollFailure::PollFailure(PollError error)
        : std::runtime_error(error.describe()), pollError(std::move(error)) {}
}
