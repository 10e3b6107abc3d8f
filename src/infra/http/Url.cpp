#include "infra/http/Url.hpp"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>

#include "common/Errors.hpp"
#include "infra/http/Transport.hpp"

namespace infra::http {
namespace {

using kvault::common::ErrorKind;
using kvault::common::TransportError;

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

bool iequals(std::string_view lhs, std::string_view rhs) {
    return lhs.size() == rhs.size() &&
           std::equal(lhs.begin(), lhs.end(), rhs.begin(), [](unsigned char a, unsigned char b) {
               return std::tolower(a) == std::tolower(b);
           });
}

std::string defaultPort(const std::string& scheme) {
    return scheme == "https" ? "443" : "80";
}

}  // namespace

const char* methodName(Method method) noexcept {
    switch (method) {
    case Method::Get:
        return "GET";
    case Method::Head:
        return "HEAD";
    }
    return "GET";
}

std::optional<std::string> HttpResponse::header(std::string_view name) const {
    for (const auto& [key, value] : headers) {
        if (iequals(key, name)) {
            return value;
        }
    }
    return std::nullopt;
}

std::string urlEncode(std::string_view value) {
    std::ostringstream out;
    out << std::uppercase << std::hex;
    for (const unsigned char c : value) {
        if (std::isalnum(c) != 0 || c == '-' || c == '_' || c == '.' || c == '~') {
            out << static_cast<char>(c);
        } else {
            out << '%' << std::setw(2) << std::setfill('0') << static_cast<int>(c);
        }
    }
    return out.str();
}

std::string composeUrl(const std::string& url, const QueryParams& params) {
    if (params.empty()) {
        return url;
    }
    std::string composed = url;
    char separator = composed.find('?') == std::string::npos ? '?' : '&';
    for (const auto& [key, value] : params) {
        composed.push_back(separator);
        composed += urlEncode(key);
        composed.push_back('=');
        composed += urlEncode(value);
        separator = '&';
    }
    return composed;
}

std::string Url::origin() const {
    std::string result = scheme + "://" + host;
    if (port != defaultPort(scheme)) {
        result += ":" + port;
    }
    return result;
}

std::string Url::str() const {
    return origin() + target;
}

Url Url::parse(const std::string& text) {
    const auto schemeEnd = text.find("://");
    if (schemeEnd == std::string::npos) {
        throw TransportError(ErrorKind::ProtocolError, "URL without scheme: " + text);
    }

    Url url;
    url.scheme = toLower(text.substr(0, schemeEnd));
    if (url.scheme != "http" && url.scheme != "https") {
        throw TransportError(ErrorKind::ProtocolError, "Unsupported URL scheme: " + url.scheme);
    }

    const auto authorityStart = schemeEnd + 3;
    const auto pathStart = text.find_first_of("/?", authorityStart);
    std::string authority = text.substr(authorityStart, pathStart == std::string::npos
                                                            ? std::string::npos
                                                            : pathStart - authorityStart);
    if (authority.empty()) {
        throw TransportError(ErrorKind::ProtocolError, "URL missing host: " + text);
    }
    if (authority.find('@') != std::string::npos) {
        throw TransportError(ErrorKind::ProtocolError, "Credentials in URL are not supported: " + text);
    }

    const auto colon = authority.rfind(':');
    if (colon != std::string::npos) {
        url.port = authority.substr(colon + 1);
        authority.resize(colon);
        if (url.port.empty() || !std::all_of(url.port.begin(), url.port.end(), [](unsigned char c) {
                return std::isdigit(c) != 0;
            })) {
            throw TransportError(ErrorKind::ProtocolError, "Invalid port in URL: " + text);
        }
    } else {
        url.port = defaultPort(url.scheme);
    }
    url.host = toLower(authority);

    if (pathStart == std::string::npos) {
        url.target = "/";
    } else {
        url.target = text.substr(pathStart);
        if (url.target.front() == '?') {
            url.target.insert(url.target.begin(), '/');
        }
    }
    const auto fragment = url.target.find('#');
    if (fragment != std::string::npos) {
        url.target.resize(fragment);
    }
    return url;
}

Url Url::resolve(const std::string& location) const {
    if (location.empty()) {
        throw TransportError(ErrorKind::ProtocolError, "Redirect response missing Location header");
    }
    if (location.find("://") != std::string::npos) {
        return parse(location);
    }
    if (location.rfind("//", 0) == 0) {
        return parse(scheme + ":" + location);
    }

    Url next = *this;
    if (location.front() == '/') {
        next.target = location;
    } else {
        const auto query = target.find('?');
        const std::string path = target.substr(0, query);
        next.target = path.substr(0, path.rfind('/') + 1) + location;
    }
    return next;
}

}  // namespace infra::http
