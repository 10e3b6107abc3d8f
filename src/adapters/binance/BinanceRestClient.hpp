#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <memory>
#include <string>

#include "core/Clock.hpp"
#include "domain/exchange/IKlineSource.hpp"
#include "infra/http/Transport.hpp"

namespace adapters::binance {

// Base URL and klines path of the REST API for a market.
struct RestEndpoint {
    std::string baseUrl;
    std::string klinesPath;
};

RestEndpoint rest_endpoint(domain::MarketType market);

// Incremental backend: the public klines endpoint, paginated. Windows are
// forwarded exactly as received; the server's edge handling is authoritative.
class BinanceRestClient final : public domain::IKlineSource {
public:
    static constexpr std::size_t kMaxLimit = 1000;

    struct Config {
        std::string id = "rest";
        domain::MarketType market = domain::MarketType::Spot;
        // Overrides the market's default host, e.g. for a test server.
        std::string baseUrl;
        std::size_t pageLimit = kMaxLimit;
        std::chrono::milliseconds requestTimeout{10'000};
        int weightBudgetPerMinute = 1200;
        double weightThreshold = 0.9;
        std::chrono::milliseconds throttlePause{2'000};
    };

    BinanceRestClient(std::shared_ptr<infra::http::ITransport> transport,
                      std::shared_ptr<core::Clock> clock,
                      Config config);
    ~BinanceRestClient() override = default;

    const std::string& id() const noexcept override { return config_.id; }
    bool supportsInterval(domain::Interval interval) const noexcept override;

    domain::BarSequence fetchKlines(const std::string& symbol,
                                    domain::Interval interval,
                                    domain::TimestampMs startTime,
                                    domain::TimestampMs endTime,
                                    const core::Deadline& deadline) override;

    // Request weight the server reported on the last response.
    int usedWeight() const noexcept { return usedWeight_.load(std::memory_order_relaxed); }

    // Parses one klines page. Throws ValidationError{SchemaInvalid}.
    static domain::BarSequence parseKlines(const std::string& body);

private:
    void trackWeight(const infra::http::HttpResponse& response);
    void throttleIfNeeded(const core::Deadline& deadline);

    std::shared_ptr<infra::http::ITransport> transport_;
    std::shared_ptr<core::Clock> clock_;
    Config config_;
    std::string klinesUrl_;
    std::atomic<int> usedWeight_{0};
};

}  // namespace adapters::binance
