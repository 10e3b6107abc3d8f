#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace infra::http {

enum class Method { Get, Head };

const char* methodName(Method method) noexcept;

using HeaderList = std::vector<std::pair<std::string, std::string>>;
using QueryParams = std::vector<std::pair<std::string, std::string>>;

struct HttpRequest {
    Method method = Method::Get;
    std::string url;
    QueryParams params;
    HeaderList headers;
    std::chrono::milliseconds timeout{10'000};
};

struct HttpResponse {
    unsigned status = 0U;
    HeaderList headers;
    std::string body;

    // Case-insensitive lookup of the first header with this name.
    std::optional<std::string> header(std::string_view name) const;
    bool ok() const noexcept { return status >= 200U && status < 300U; }
};

// One network backend. Implementations translate every library failure into
// kvault::common::TransportError; an HTTP error status is not a failure at
// this level and comes back as a normal response.
class ITransport {
public:
    virtual ~ITransport() = default;

    virtual const std::string& id() const noexcept = 0;
    virtual void open() = 0;
    virtual void close() = 0;
    virtual HttpResponse request(const HttpRequest& request) = 0;
};

std::string urlEncode(std::string_view value);
// Appends the encoded params to the URL's query string.
std::string composeUrl(const std::string& url, const QueryParams& params);

}  // namespace infra::http
