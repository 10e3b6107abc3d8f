#pragma once

#include <chrono>
#include <optional>
#include <string>

#include "infra/http/Transport.hpp"

namespace infra::http {

// Retry-After in delta-seconds form. HTTP-date values are not used by the
// backends we talk to and yield nullopt.
std::optional<std::chrono::milliseconds> parseRetryAfter(const HttpResponse& response);

// Throws kvault::common::ResponseError for any non-2xx status.
void ensureSuccess(const HttpResponse& response, const std::string& backend, const std::string& what);

}  // namespace infra::http
