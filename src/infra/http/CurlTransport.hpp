#pragma once

#include <cstddef>
#include <mutex>
#include <string>
#include <vector>

#include <curl/curl.h>

#include "infra/http/Transport.hpp"

namespace infra::http {

// libcurl easy-handle transport. Handles are reused across requests so curl's
// per-handle connection cache keeps sockets alive between pages.
class CurlTransport final : public ITransport {
public:
    struct Config {
        std::string id = "curl";
        bool verifyPeer = true;
        std::size_t maxIdleHandles = 4;
        long maxRedirects = 5;
        std::string userAgent = "KlineVault/1.0";
    };

    CurlTransport();
    explicit CurlTransport(Config config);
    ~CurlTransport() override;

    CurlTransport(const CurlTransport&) = delete;
    CurlTransport& operator=(const CurlTransport&) = delete;

    const std::string& id() const noexcept override { return config_.id; }
    void open() override;
    void close() override;
    HttpResponse request(const HttpRequest& request) override;

private:
    CURL* acquireHandle();
    void releaseHandle(CURL* handle);

    Config config_;
    std::mutex mutex_;
    bool open_{false};
    std::vector<CURL*> idleHandles_;
};

}  // namespace infra::http
