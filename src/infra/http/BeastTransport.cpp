#include "infra/http/BeastTransport.hpp"

#include <sstream>
#include <utility>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>

#include <openssl/err.h>

#include "common/Errors.hpp"
#include "common/Log.hpp"

namespace infra::http {
namespace {

namespace beast = boost::beast;
namespace bhttp = beast::http;
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
using tcp = net::ip::tcp;

using kvault::common::ErrorKind;
using kvault::common::TransportError;

enum class Phase { Resolve, Connect, Handshake, Write, Read };

const char* phaseName(Phase phase) {
    switch (phase) {
    case Phase::Resolve:
        return "DNS resolution";
    case Phase::Connect:
        return "connect";
    case Phase::Handshake:
        return "TLS handshake";
    case Phase::Write:
        return "write";
    case Phase::Read:
        return "read";
    }
    return "request";
}

bool isTimeout(const beast::error_code& ec) {
    return ec == beast::error::timeout || ec == net::error::timed_out || ec == net::error::operation_aborted;
}

bool isConnectionLoss(const beast::error_code& ec) {
    return ec == net::error::eof || ec == net::error::connection_reset || ec == net::error::broken_pipe ||
           ec == net::error::connection_aborted || ec == bhttp::error::end_of_stream ||
           ec == ssl::error::stream_truncated;
}

TransportError translate(const beast::error_code& ec, Phase phase, const Url& url, const std::string& backend) {
    std::ostringstream oss;
    oss << phaseName(phase) << " error for " << url.str() << ": " << ec.message();

    if (isTimeout(ec)) {
        return TransportError(ErrorKind::Timeout, oss.str(), backend);
    }
    if (phase == Phase::Resolve || phase == Phase::Connect || isConnectionLoss(ec)) {
        return TransportError(ErrorKind::ConnectionFailed, oss.str(), backend);
    }
    return TransportError(ErrorKind::ProtocolError, oss.str(), backend);
}

void runToCompletion(net::io_context& ioc) {
    ioc.restart();
    ioc.run();
}

bool isRedirect(unsigned status) {
    return status == 301U || status == 302U || status == 303U || status == 307U || status == 308U;
}

std::string originKey(const Url& url) {
    return url.scheme + "://" + url.host + ":" + url.port;
}

}  // namespace

struct BeastTransport::Connection {
    explicit Connection(std::string originKey) : key(std::move(originKey)) {}

    std::string key;
    bool reused{false};
    net::io_context ioc;
    std::unique_ptr<beast::ssl_stream<beast::tcp_stream>> tls;
    std::unique_ptr<beast::tcp_stream> plain;
    beast::flat_buffer buffer;

    beast::tcp_stream& lowest() { return tls ? beast::get_lowest_layer(*tls) : *plain; }

    void shutdown() {
        beast::error_code ec;
        if (tls || plain) {
            auto& socket = lowest().socket();
            if (socket.is_open()) {
                socket.shutdown(tcp::socket::shutdown_both, ec);
                socket.close(ec);
            }
        }
    }
};

BeastTransport::BeastTransport() : BeastTransport(Config{}) {}

BeastTransport::BeastTransport(Config config)
    : config_(std::move(config)), sslContext_(ssl::context::tls_client) {
    if (config_.verifyPeer) {
        sslContext_.set_default_verify_paths();
        sslContext_.set_verify_mode(ssl::verify_peer);
    } else {
        sslContext_.set_verify_mode(ssl::verify_none);
    }
}

BeastTransport::~BeastTransport() {
    close();
}

void BeastTransport::open() {
    std::lock_guard<std::mutex> lock(mutex_);
    open_ = true;
}

void BeastTransport::close() {
    std::unordered_map<std::string, std::vector<std::unique_ptr<Connection>>> drained;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        open_ = false;
        drained.swap(idle_);
    }
    for (auto& [key, connections] : drained) {
        for (auto& connection : connections) {
            connection->shutdown();
        }
    }
}

std::size_t BeastTransport::idleConnections() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t total = 0;
    for (const auto& [key, connections] : idle_) {
        total += connections.size();
    }
    return total;
}

std::unique_ptr<BeastTransport::Connection> BeastTransport::acquire(const Url& url,
                                                                    std::chrono::milliseconds timeout) {
    const auto key = originKey(url);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!open_) {
            throw TransportError(ErrorKind::ProtocolError, "transport is closed", config_.id);
        }
        auto it = idle_.find(key);
        if (it != idle_.end() && !it->second.empty()) {
            auto connection = std::move(it->second.back());
            it->second.pop_back();
            connection->reused = true;
            return connection;
        }
    }

    auto connection = std::make_unique<Connection>(key);
    connect(*connection, url, timeout);
    return connection;
}

void BeastTransport::release(std::unique_ptr<Connection> connection) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!open_) {
        connection->shutdown();
        return;
    }
    auto& pool = idle_[connection->key];
    if (pool.size() >= config_.maxIdlePerOrigin) {
        connection->shutdown();
        return;
    }
    connection->buffer.clear();
    pool.push_back(std::move(connection));
}

void BeastTransport::connect(Connection& connection, const Url& url, std::chrono::milliseconds timeout) {
    beast::error_code ec;

    tcp::resolver resolver(connection.ioc);
    tcp::resolver::results_type endpoints;
    net::steady_timer resolveTimer(connection.ioc);
    resolveTimer.expires_after(timeout);
    resolveTimer.async_wait([&resolver](const beast::error_code& timerEc) {
        if (!timerEc) {
            resolver.cancel();
        }
    });
    resolver.async_resolve(url.host, url.port,
                           [&](const beast::error_code& resolveEc, tcp::resolver::results_type results) {
                               ec = resolveEc;
                               endpoints = std::move(results);
                               resolveTimer.cancel();
                           });
    runToCompletion(connection.ioc);
    if (ec) {
        throw translate(ec, Phase::Resolve, url, config_.id);
    }

    if (url.secure()) {
        connection.tls = std::make_unique<beast::ssl_stream<beast::tcp_stream>>(connection.ioc, sslContext_);
        if (!SSL_set_tlsext_host_name(connection.tls->native_handle(), url.host.c_str())) {
            const unsigned long err = ::ERR_get_error();
            const char* reason = err != 0 ? ::ERR_reason_error_string(err) : nullptr;
            std::ostringstream oss;
            oss << "failed to set SNI hostname '" << url.host << "'";
            if (reason != nullptr) {
                oss << ": " << reason;
            }
            throw TransportError(ErrorKind::ProtocolError, oss.str(), config_.id);
        }
        if (config_.verifyPeer) {
            connection.tls->set_verify_callback(ssl::host_name_verification(url.host));
        }
    } else {
        connection.plain = std::make_unique<beast::tcp_stream>(connection.ioc);
    }

    auto& lowest = connection.lowest();
    lowest.expires_after(timeout);
    lowest.async_connect(endpoints, [&ec](const beast::error_code& connectEc, const tcp::endpoint&) {
        ec = connectEc;
    });
    runToCompletion(connection.ioc);
    if (ec) {
        throw translate(ec, Phase::Connect, url, config_.id);
    }

    if (connection.tls) {
        lowest.expires_after(timeout);
        connection.tls->async_handshake(ssl::stream_base::client,
                                        [&ec](const beast::error_code& handshakeEc) { ec = handshakeEc; });
        runToCompletion(connection.ioc);
        if (ec) {
            throw translate(ec, Phase::Handshake, url, config_.id);
        }
    }
    LOG_DEBUG("[" << config_.id << "] connected to " << url.origin());
}

HttpResponse BeastTransport::exchange(Connection& connection,
                                      const Url& url,
                                      const HttpRequest& request,
                                      bool& keepAlive) {
    const auto verb = request.method == Method::Head ? bhttp::verb::head : bhttp::verb::get;
    bhttp::request<bhttp::empty_body> req{verb, url.target, 11};
    req.set(bhttp::field::host, url.port == (url.secure() ? "443" : "80") ? url.host : url.host + ":" + url.port);
    req.set(bhttp::field::user_agent, config_.userAgent);
    req.set(bhttp::field::accept, "*/*");
    for (const auto& [name, value] : request.headers) {
        req.set(name, value);
    }
    req.keep_alive(true);

    beast::error_code ec;
    auto& lowest = connection.lowest();

    lowest.expires_after(request.timeout);
    auto onWrite = [&ec](const beast::error_code& writeEc, std::size_t) { ec = writeEc; };
    if (connection.tls) {
        bhttp::async_write(*connection.tls, req, onWrite);
    } else {
        bhttp::async_write(*connection.plain, req, onWrite);
    }
    runToCompletion(connection.ioc);
    if (ec) {
        throw translate(ec, Phase::Write, url, config_.id);
    }

    bhttp::response_parser<bhttp::string_body> parser;
    parser.body_limit(config_.maxBodyBytes);
    if (request.method == Method::Head) {
        parser.skip(true);
    }

    lowest.expires_after(request.timeout);
    auto onRead = [&ec](const beast::error_code& readEc, std::size_t) { ec = readEc; };
    if (connection.tls) {
        bhttp::async_read(*connection.tls, connection.buffer, parser, onRead);
    } else {
        bhttp::async_read(*connection.plain, connection.buffer, parser, onRead);
    }
    runToCompletion(connection.ioc);
    if (ec) {
        throw translate(ec, Phase::Read, url, config_.id);
    }

    auto message = parser.release();
    keepAlive = message.keep_alive();

    HttpResponse response;
    response.status = static_cast<unsigned>(message.result_int());
    for (const auto& field : message.base()) {
        response.headers.emplace_back(std::string(field.name_string()), std::string(field.value()));
    }
    response.body = std::move(message.body());
    return response;
}

HttpResponse BeastTransport::performOnce(const Url& url, const HttpRequest& request) {
    // A pooled connection may have been closed by the server while idle; such
    // a failure is retried once on a fresh connection.
    for (int attempt = 0;; ++attempt) {
        auto connection = acquire(url, request.timeout);
        const bool reused = connection->reused;
        bool keepAlive = false;
        try {
            auto response = exchange(*connection, url, request, keepAlive);
            if (keepAlive) {
                release(std::move(connection));
            } else {
                connection->shutdown();
            }
            return response;
        } catch (const TransportError& ex) {
            connection->shutdown();
            if (reused && attempt == 0 && ex.kind() == ErrorKind::ConnectionFailed) {
                LOG_DEBUG("[" << config_.id << "] stale pooled connection to " << url.origin()
                              << ", reconnecting: " << ex.what());
                continue;
            }
            throw;
        }
    }
}

HttpResponse BeastTransport::request(const HttpRequest& request) {
    if (request.timeout.count() <= 0) {
        throw TransportError(ErrorKind::Timeout, "request timeout must be positive", config_.id);
    }

    auto url = Url::parse(composeUrl(request.url, request.params));
    for (int redirects = 0; redirects <= config_.maxRedirects; ++redirects) {
        auto response = performOnce(url, request);
        if (!isRedirect(response.status)) {
            return response;
        }

        const auto location = response.header("Location").value_or(std::string{});
        auto next = url.resolve(location);
        if (url.secure() && !next.secure()) {
            throw TransportError(ErrorKind::ProtocolError,
                                 "insecure redirect from " + url.str() + " to " + next.str(), config_.id);
        }
        LOG_DEBUG("[" << config_.id << "] redirect " << response.status << " " << url.str() << " -> "
                      << next.str());
        url = std::move(next);
    }
    throw TransportError(ErrorKind::ProtocolError, "too many redirects for " + request.url, config_.id);
}

}  // namespace infra::http
