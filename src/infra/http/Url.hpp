#pragma once

#include <string>

namespace infra::http {

struct Url {
    std::string scheme;  // "http" or "https"
    std::string host;
    std::string port;
    std::string target;  // path plus query, always starting with '/'

    bool secure() const noexcept { return scheme == "https"; }
    std::string origin() const;
    std::string str() const;

    // Throws TransportError{ProtocolError} for anything but absolute http(s) URLs.
    static Url parse(const std::string& text);

    // Resolves a Location header against this URL.
    Url resolve(const std::string& location) const;
};

}  // namespace infra::http
