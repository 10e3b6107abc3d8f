#include "infra/http/ResponseClassifier.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

#include "common/Errors.hpp"

namespace infra::http {
namespace {

constexpr std::size_t kMaxBodyExcerpt = 200;

std::string excerpt(const std::string& body) {
    std::string text = body.substr(0, kMaxBodyExcerpt);
    std::replace_if(text.begin(), text.end(), [](unsigned char c) { return std::iscntrl(c) != 0; }, ' ');
    if (body.size() > kMaxBodyExcerpt) {
        text += "...";
    }
    return text;
}

}  // namespace

std::optional<std::chrono::milliseconds> parseRetryAfter(const HttpResponse& response) {
    const auto value = response.header("Retry-After");
    if (!value || value->empty()) {
        return std::nullopt;
    }
    if (!std::all_of(value->begin(), value->end(), [](unsigned char c) { return std::isdigit(c) != 0; }) ||
        value->size() > 9) {
        return std::nullopt;
    }
    return std::chrono::milliseconds{std::stoll(*value) * 1000};
}

void ensureSuccess(const HttpResponse& response, const std::string& backend, const std::string& what) {
    if (response.ok()) {
        return;
    }
    std::ostringstream oss;
    oss << what << " returned HTTP " << response.status;
    if (!response.body.empty()) {
        oss << ": " << excerpt(response.body);
    }
    throw kvault::common::ResponseError(response.status, oss.str(), backend, parseRetryAfter(response));
}

}  // namespace infra::http
