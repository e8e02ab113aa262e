#include "xLoad/status.h"

namespace xload {

const char* errorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::SUCCESS:               return "SUCCESS";
        case ErrorCode::ERR_CANCELLED:         return "ERR_CANCELLED";
        case ErrorCode::ERR_DEADLINE_EXCEEDED: return "ERR_DEADLINE_EXCEEDED";
        case ErrorCode::ERR_UNAVAILABLE:       return "ERR_UNAVAILABLE";
        case ErrorCode::ERR_TIMED_OUT:         return "ERR_TIMED_OUT";
        case ErrorCode::ERR_BUSY:              return "ERR_BUSY";
        case ErrorCode::ERR_NETWORK:           return "ERR_NETWORK";
        case ErrorCode::ERR_INVALID_ARGUMENT:  return "ERR_INVALID_ARGUMENT";
        case ErrorCode::ERR_NOT_FOUND:         return "ERR_NOT_FOUND";
        case ErrorCode::ERR_ALREADY_EXISTS:    return "ERR_ALREADY_EXISTS";
        case ErrorCode::ERR_IO_FAILED:         return "ERR_IO_FAILED";
        case ErrorCode::ERR_CORRUPTION:        return "ERR_CORRUPTION";
        case ErrorCode::ERR_SCHEMA_MISMATCH:   return "ERR_SCHEMA_MISMATCH";
        case ErrorCode::ERR_UNSUPPORTED:       return "ERR_UNSUPPORTED";
        case ErrorCode::ERR_INTERNAL:          return "ERR_INTERNAL";
        default: return "UNKNOWN";
    }
}

std::string Status::toString() const {
    if (ok()) {
        return "SUCCESS";
    }
    std::string result = errorCodeName(code_);
    if (!message_.empty()) {
        result += ": ";
        result += message_;
    }
    return result;
}

Status Status::annotate(const std::string& context) const {
    if (ok()) {
        return *this;
    }
    if (message_.empty()) {
        return Status(code_, context);
    }
    return Status(code_, context + ": " + message_);
}

bool isRetryableError(const Status& status) {
    switch (status.code()) {
        case ErrorCode::ERR_UNAVAILABLE:
        case ErrorCode::ERR_TIMED_OUT:
        case ErrorCode::ERR_BUSY:
        case ErrorCode::ERR_NETWORK:
            return true;
        default:
            return false;
    }
}

}  // namespace xload
