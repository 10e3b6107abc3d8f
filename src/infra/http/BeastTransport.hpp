#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include <boost/asio/ssl/context.hpp>

#include "infra/http/Transport.hpp"
#include "infra/http/Url.hpp"

namespace infra::http {

// HTTP/1.1 client on Boost.Beast with TLS through OpenSSL. Connections are
// kept alive and pooled per origin; every operation runs on the calling
// thread against the connection's own io_context, bounded by the request
// timeout.
class BeastTransport final : public ITransport {
public:
    struct Config {
        std::string id = "beast";
        bool verifyPeer = true;
        std::size_t maxIdlePerOrigin = 4;
        std::size_t maxBodyBytes = 512U * 1024U * 1024U;
        int maxRedirects = 5;
        std::string userAgent = "KlineVault/1.0";
    };

    BeastTransport();
    explicit BeastTransport(Config config);
    ~BeastTransport() override;

    BeastTransport(const BeastTransport&) = delete;
    BeastTransport& operator=(const BeastTransport&) = delete;

    const std::string& id() const noexcept override { return config_.id; }
    void open() override;
    void close() override;
    HttpResponse request(const HttpRequest& request) override;

    std::size_t idleConnections() const;

private:
    struct Connection;

    std::unique_ptr<Connection> acquire(const Url& url, std::chrono::milliseconds timeout);
    void release(std::unique_ptr<Connection> connection);
    void connect(Connection& connection, const Url& url, std::chrono::milliseconds timeout);
    HttpResponse exchange(Connection& connection,
                          const Url& url,
                          const HttpRequest& request,
                          bool& keepAlive);
    HttpResponse performOnce(const Url& url, const HttpRequest& request);

    Config config_;
    boost::asio::ssl::context sslContext_;
    mutable std::mutex mutex_;
    bool open_{false};
    std::unordered_map<std::string, std::vector<std::unique_ptr<Connection>>> idle_;
};

}  // namespace infra::http
