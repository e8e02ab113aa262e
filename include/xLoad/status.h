#ifndef XLOAD_STATUS_H_
#define XLOAD_STATUS_H_

#include <string>
#include <utility>

namespace xload {

// ============================================================================
// Status - error code plus message, returned by value
// ============================================================================

/// Error codes shared by the delivery layer and all backends
enum class ErrorCode {
    SUCCESS = 0,
    ERR_CANCELLED,           // Caller cancelled the context
    ERR_DEADLINE_EXCEEDED,   // Caller's deadline passed
    ERR_UNAVAILABLE,         // Backend temporarily unreachable
    ERR_TIMED_OUT,           // Backend-side timeout
    ERR_BUSY,                // Backend resource locked or overloaded
    ERR_NETWORK,             // Transport failure
    ERR_INVALID_ARGUMENT,
    ERR_NOT_FOUND,
    ERR_ALREADY_EXISTS,
    ERR_IO_FAILED,
    ERR_CORRUPTION,
    ERR_SCHEMA_MISMATCH,
    ERR_UNSUPPORTED,
    ERR_INTERNAL
};

/// Human-readable name for an error code
const char* errorCodeName(ErrorCode code);

class Status {
public:
    Status() : code_(ErrorCode::SUCCESS) {}
    Status(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    static Status OK() { return Status(); }

    bool ok() const { return code_ == ErrorCode::SUCCESS; }
    ErrorCode code() const { return code_; }
    const std::string& message() const { return message_; }

    /// "ERR_BUSY: database is locked"
    std::string toString() const;

    /// Prefix the message with context, keeping the cause code
    Status annotate(const std::string& context) const;

private:
    ErrorCode code_;
    std::string message_;
};

/// Shared retry classification: true only for transient backend failures.
/// Cancellation and deadline errors are never retryable.
bool isRetryableError(const Status& status);

}  // namespace xload

#endif  // XLOAD_STATUS_H_
