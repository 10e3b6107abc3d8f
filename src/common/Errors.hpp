#pragma once

#include <chrono>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace kvault::common {

enum class ErrorKind {
    // Transport
    Timeout,
    ConnectionFailed,
    ProtocolError,
    // Response
    ClientError,
    RateLimited,
    ServerError,
    // Validation
    BoundaryMismatch,
    SchemaInvalid,
    IntegrityCheckFailed,
    // Exhaustion
    AllBackendsFailed,
    CircuitOpen,
};

const char* errorKindToString(ErrorKind kind) noexcept;

// Timeout, connection failure, server error and rate limiting are the only
// kinds a retry may help with.
bool isRetryable(ErrorKind kind) noexcept;

class FetchError : public std::runtime_error {
public:
    FetchError(ErrorKind kind, const std::string& message, std::string backend = {});

    ErrorKind kind() const noexcept { return kind_; }
    const std::string& backend() const noexcept { return backend_; }
    bool retryable() const noexcept { return isRetryable(kind_); }

private:
    ErrorKind kind_;
    std::string backend_;
};

class TransportError : public FetchError {
public:
    TransportError(ErrorKind kind, const std::string& message, std::string backend = {});
};

class ResponseError : public FetchError {
public:
    ResponseError(unsigned status,
                  const std::string& message,
                  std::string backend = {},
                  std::optional<std::chrono::milliseconds> retryAfter = std::nullopt);

    unsigned status() const noexcept { return status_; }
    const std::optional<std::chrono::milliseconds>& retryAfter() const noexcept { return retryAfter_; }

    static ErrorKind kindForStatus(unsigned status) noexcept;

private:
    unsigned status_;
    std::optional<std::chrono::milliseconds> retryAfter_;
};

class ValidationError : public FetchError {
public:
    ValidationError(ErrorKind kind, const std::string& message, std::string backend = {});
};

class ExhaustionError : public FetchError {
public:
    ExhaustionError(ErrorKind kind,
                    const std::string& message,
                    std::vector<std::string> attemptedBackends,
                    std::string lastError);

    // The message without the attempted/last-error suffix what() carries.
    const std::string& reason() const noexcept { return reason_; }
    const std::vector<std::string>& attemptedBackends() const noexcept { return attemptedBackends_; }
    const std::string& lastError() const noexcept { return lastError_; }

private:
    std::string reason_;
    std::vector<std::string> attemptedBackends_;
    std::string lastError_;
};

}  // namespace kvault::common
