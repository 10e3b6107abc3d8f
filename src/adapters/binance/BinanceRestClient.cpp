#include "adapters/binance/BinanceRestClient.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

#include <boost/json.hpp>

#include "adapters/binance/IntervalMap.hpp"
#include "common/Errors.hpp"
#include "common/Log.hpp"
#include "core/TimeUtils.h"
#include "infra/http/ResponseClassifier.hpp"

namespace {

using kvault::common::ErrorKind;
using kvault::common::ValidationError;

std::int64_t json_to_int64(const boost::json::value& value) {
    if (value.is_int64()) {
        return value.as_int64();
    }
    if (value.is_uint64()) {
        return static_cast<std::int64_t>(value.as_uint64());
    }
    if (value.is_double()) {
        return static_cast<std::int64_t>(std::llround(value.as_double()));
    }
    if (value.is_string()) {
        const std::string str{value.as_string().c_str()};
        try {
            return std::stoll(str);
        } catch (const std::exception& ex) {
            throw ValidationError(ErrorKind::SchemaInvalid,
                                  "Failed to parse integer value: " + str + ", error: " + ex.what());
        }
    }
    throw ValidationError(ErrorKind::SchemaInvalid, "Unsupported JSON type for integer conversion");
}

double json_to_double(const boost::json::value& value) {
    if (value.is_double()) {
        return value.as_double();
    }
    if (value.is_int64()) {
        return static_cast<double>(value.as_int64());
    }
    if (value.is_uint64()) {
        return static_cast<double>(value.as_uint64());
    }
    if (value.is_string()) {
        const std::string str{value.as_string().c_str()};
        try {
            return std::stod(str);
        } catch (const std::exception& ex) {
            throw ValidationError(ErrorKind::SchemaInvalid,
                                  "Failed to parse floating value: " + str + ", error: " + ex.what());
        }
    }
    throw ValidationError(ErrorKind::SchemaInvalid, "Unsupported JSON type for floating conversion");
}

}  // namespace

namespace adapters::binance {

RestEndpoint rest_endpoint(domain::MarketType market) {
    switch (market) {
    case domain::MarketType::Spot:
        return RestEndpoint{"https://api.binance.com", "/api/v3/klines"};
    case domain::MarketType::FuturesUsdt:
        return RestEndpoint{"https://fapi.binance.com", "/fapi/v1/klines"};
    case domain::MarketType::FuturesCoin:
        return RestEndpoint{"https://dapi.binance.com", "/dapi/v1/klines"};
    }
    throw std::invalid_argument("Unknown market type");
}

BinanceRestClient::BinanceRestClient(std::shared_ptr<infra::http::ITransport> transport,
                                     std::shared_ptr<core::Clock> clock,
                                     Config config)
    : transport_(std::move(transport)), clock_(std::move(clock)), config_(std::move(config)) {
    if (!transport_ || !clock_) {
        throw std::invalid_argument("BinanceRestClient requires a transport and a clock");
    }
    config_.pageLimit = std::clamp<std::size_t>(config_.pageLimit == 0 ? kMaxLimit : config_.pageLimit, 1,
                                                kMaxLimit);
    const auto endpoint = rest_endpoint(config_.market);
    klinesUrl_ = (config_.baseUrl.empty() ? endpoint.baseUrl : config_.baseUrl) + endpoint.klinesPath;
}

domain::BarSequence BinanceRestClient::parseKlines(const std::string& body) {
    boost::json::value json;
    try {
        json = boost::json::parse(body);
    } catch (const std::exception& ex) {
        throw ValidationError(ErrorKind::SchemaInvalid, std::string{"Failed to parse Binance response: "} + ex.what());
    }

    if (!json.is_array()) {
        throw ValidationError(ErrorKind::SchemaInvalid, "Unexpected Binance response type (expected array)");
    }

    domain::BarSequence bars;
    const auto& outer = json.as_array();
    bars.reserve(outer.size());
    for (const auto& row_value : outer) {
        if (!row_value.is_array()) {
            throw ValidationError(ErrorKind::SchemaInvalid, "Unexpected Binance kline row type");
        }
        const auto& row = row_value.as_array();
        if (row.size() < 7) {
            throw ValidationError(ErrorKind::SchemaInvalid, "Incomplete Binance kline row");
        }

        domain::Bar bar{};
        bar.openTime = core::normalizeEpochMs(json_to_int64(row.at(0)));
        bar.open = json_to_double(row.at(1));
        bar.high = json_to_double(row.at(2));
        bar.low = json_to_double(row.at(3));
        bar.close = json_to_double(row.at(4));
        bar.volume = json_to_double(row.at(5));
        bar.closeTime = core::normalizeEpochMs(json_to_int64(row.at(6)));
        if (row.size() > 7) {
            bar.quoteVolume = json_to_double(row.at(7));
        }
        if (row.size() > 8) {
            bar.trades = static_cast<domain::TradeCount>(json_to_int64(row.at(8)));
        }
        if (row.size() > 10) {
            bar.takerBuyBaseVolume = json_to_double(row.at(9));
            bar.takerBuyQuoteVolume = json_to_double(row.at(10));
        }
        bars.push_back(bar);
    }
    return bars;
}

bool BinanceRestClient::supportsInterval(domain::Interval interval) const noexcept {
    return is_supported_interval(interval);
}

domain::BarSequence BinanceRestClient::fetchKlines(const std::string& symbol,
                                                   domain::Interval interval,
                                                   domain::TimestampMs startTime,
                                                   domain::TimestampMs endTime,
                                                   const core::Deadline& deadline) {
    if (symbol.empty()) {
        throw std::invalid_argument("BinanceRestClient: symbol must not be empty");
    }
    const std::string interval_literal = binance_interval(interval);

    domain::BarSequence result;
    domain::TimestampMs current_start = startTime;
    std::size_t pages = 0;

    while (current_start <= endTime) {
        const auto timeout = deadline.clamp(*clock_, config_.requestTimeout);
        if (timeout.count() <= 0) {
            throw kvault::common::TransportError(ErrorKind::Timeout,
                                                 "deadline exceeded while paging klines for " + symbol, config_.id);
        }

        infra::http::HttpRequest request;
        request.url = klinesUrl_;
        request.params = {{"symbol", symbol},
                          {"interval", interval_literal},
                          {"startTime", std::to_string(current_start)},
                          {"endTime", std::to_string(endTime)},
                          {"limit", std::to_string(config_.pageLimit)}};
        request.timeout = timeout;

        LOG_DEBUG("Binance REST " << symbol << ' ' << interval_literal << " startTime=" << current_start
                                  << " endTime=" << endTime << " limit=" << config_.pageLimit);

        const auto response = transport_->request(request);
        trackWeight(response);
        infra::http::ensureSuccess(response, config_.id, "Binance klines " + symbol + " " + interval_literal);

        const auto page = parseKlines(response.body);
        ++pages;
        if (page.empty()) {
            break;
        }

        domain::TimestampMs last_close = 0;
        for (const auto& bar : page) {
            if (!result.empty() && bar.openTime <= result.back().openTime) {
                continue;
            }
            result.push_back(bar);
            last_close = bar.closeTime;
        }

        if (page.size() < config_.pageLimit || last_close == 0) {
            break;
        }
        current_start = last_close + 1;
        if (current_start <= endTime) {
            throttleIfNeeded(deadline);
        }
    }

    LOG_DEBUG("Binance REST " << symbol << ' ' << interval_literal << " returned " << result.size() << " bars in "
                              << pages << " page(s)");
    return result;
}

void BinanceRestClient::trackWeight(const infra::http::HttpResponse& response) {
    auto header = response.header("X-MBX-USED-WEIGHT-1M");
    if (!header) {
        header = response.header("X-MBX-USED-WEIGHT");
    }
    if (!header) {
        return;
    }
    try {
        usedWeight_.store(std::stoi(*header), std::memory_order_relaxed);
    } catch (const std::exception&) {
        LOG_DEBUG("Ignoring malformed used-weight header '" << *header << "'");
    }
}

void BinanceRestClient::throttleIfNeeded(const core::Deadline& deadline) {
    const double threshold = static_cast<double>(config_.weightBudgetPerMinute) * config_.weightThreshold;
    const int weight = usedWeight();
    if (static_cast<double>(weight) <= threshold) {
        return;
    }
    const auto pause = deadline.clamp(*clock_, config_.throttlePause);
    LOG_WARN("Binance used weight " << weight << "/" << config_.weightBudgetPerMinute << ", pausing "
                                    << pause.count() << " ms before next page");
    clock_->sleepFor(pause);
}

}  // namespace adapters::binance
