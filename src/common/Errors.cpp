#include "common/Errors.hpp"

#include <sstream>
#include <utility>

namespace kvault::common {
namespace {

std::string withBackend(const std::string& backend, const std::string& message) {
    if (backend.empty()) {
        return message;
    }
    return "[" + backend + "] " + message;
}

std::string describeExhaustion(const std::string& message,
                               const std::vector<std::string>& attempted,
                               const std::string& lastError) {
    std::ostringstream oss;
    oss << message << " (attempted=";
    for (std::size_t i = 0; i < attempted.size(); ++i) {
        if (i > 0) {
            oss << ',';
        }
        oss << attempted[i];
    }
    oss << ')';
    if (!lastError.empty()) {
        oss << " last error: " << lastError;
    }
    return oss.str();
}

}  // namespace

const char* errorKindToString(ErrorKind kind) noexcept {
    switch (kind) {
    case ErrorKind::Timeout:
        return "Timeout";
    case ErrorKind::ConnectionFailed:
        return "ConnectionFailed";
    case ErrorKind::ProtocolError:
        return "ProtocolError";
    case ErrorKind::ClientError:
        return "ClientError";
    case ErrorKind::RateLimited:
        return "RateLimited";
    case ErrorKind::ServerError:
        return "ServerError";
    case ErrorKind::BoundaryMismatch:
        return "BoundaryMismatch";
    case ErrorKind::SchemaInvalid:
        return "SchemaInvalid";
    case ErrorKind::IntegrityCheckFailed:
        return "IntegrityCheckFailed";
    case ErrorKind::AllBackendsFailed:
        return "AllBackendsFailed";
    case ErrorKind::CircuitOpen:
        return "CircuitOpen";
    }
    return "Unknown";
}

bool isRetryable(ErrorKind kind) noexcept {
    switch (kind) {
    case ErrorKind::Timeout:
    case ErrorKind::ConnectionFailed:
    case ErrorKind::ServerError:
    case ErrorKind::RateLimited:
        return true;
    default:
        return false;
    }
}

FetchError::FetchError(ErrorKind kind, const std::string& message, std::string backend)
    : std::runtime_error(withBackend(backend, message)), kind_(kind), backend_(std::move(backend)) {}

TransportError::TransportError(ErrorKind kind, const std::string& message, std::string backend)
    : FetchError(kind, message, std::move(backend)) {}

ResponseError::ResponseError(unsigned status,
                             const std::string& message,
                             std::string backend,
                             std::optional<std::chrono::milliseconds> retryAfter)
    : FetchError(kindForStatus(status), message, std::move(backend)),
      status_(status),
      retryAfter_(retryAfter) {}

ErrorKind ResponseError::kindForStatus(unsigned status) noexcept {
    // 418 is the escalation Binance applies to clients that ignore 429.
    if (status == 429U || status == 418U) {
        return ErrorKind::RateLimited;
    }
    if (status >= 500U) {
        return ErrorKind::ServerError;
    }
    return ErrorKind::ClientError;
}

ValidationError::ValidationError(ErrorKind kind, const std::string& message, std::string backend)
    : FetchError(kind, message, std::move(backend)) {}

ExhaustionError::ExhaustionError(ErrorKind kind,
                                 const std::string& message,
                                 std::vector<std::string> attemptedBackends,
                                 std::string lastError)
    : FetchError(kind, describeExhaustion(message, attemptedBackends, lastError)),
      reason_(message),
      attemptedBackends_(std::move(attemptedBackends)),
      lastError_(std::move(lastError)) {}

}  // namespace kvault::common
