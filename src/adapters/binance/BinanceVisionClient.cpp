#include "adapters/binance/BinanceVisionClient.hpp"

#include <stdexcept>
#include <utility>

#include "adapters/binance/IntervalMap.hpp"
#include "adapters/binance/VisionArchive.hpp"
#include "common/Checksum.hpp"
#include "common/Errors.hpp"
#include "common/Log.hpp"
#include "core/TimeUtils.h"
#include "infra/http/ResponseClassifier.hpp"

namespace adapters::binance {

using kvault::common::ErrorKind;

BinanceVisionClient::BinanceVisionClient(std::shared_ptr<infra::http::ITransport> transport,
                                         std::shared_ptr<core::Clock> clock,
                                         std::shared_ptr<const core::boundary::BoundaryValidator> validator,
                                         Config config)
    : transport_(std::move(transport)),
      clock_(std::move(clock)),
      validator_(std::move(validator)),
      config_(std::move(config)) {
    if (!transport_ || !clock_ || !validator_) {
        throw std::invalid_argument("BinanceVisionClient requires a transport, a clock and a boundary validator");
    }
    while (!config_.baseUrl.empty() && config_.baseUrl.back() == '/') {
        config_.baseUrl.pop_back();
    }
}

bool BinanceVisionClient::supportsInterval(domain::Interval interval) const noexcept {
    return is_supported_interval(interval);
}

domain::BarSequence BinanceVisionClient::fetchKlines(const std::string& symbol,
                                                     domain::Interval interval,
                                                     domain::TimestampMs startTime,
                                                     domain::TimestampMs endTime,
                                                     const core::Deadline& deadline) {
    if (symbol.empty()) {
        throw std::invalid_argument("BinanceVisionClient: symbol must not be empty");
    }
    if (!supportsInterval(interval)) {
        throw std::invalid_argument("BinanceVisionClient: unsupported interval " + domain::to_string(interval));
    }
    const auto resolved = validator_->resolveBoundaries(startTime, endTime, interval);
    if (resolved.empty()) {
        return {};
    }

    const auto lastDay = core::dateOf(resolved.lastOpen);
    domain::BarSequence rows;
    for (auto day = core::dateOf(resolved.firstOpen); !(lastDay < day); day = core::addDays(day, 1)) {
        auto bars = fetchDay(symbol, interval, day, deadline);
        rows.insert(rows.end(), bars.begin(), bars.end());
    }
    return validator_->clip(rows, startTime, endTime, interval);
}

domain::BarSequence BinanceVisionClient::fetchDay(const std::string& symbol,
                                                  domain::Interval interval,
                                                  const domain::CalendarDate& date,
                                                  const core::Deadline& deadline) {
    const auto url = vision::daily_url(config_.baseUrl, config_.market, symbol, interval, date);
    const auto csv = vision::extract_csv(download(url, deadline));
    auto bars = vision::parse_kline_csv(csv);
    LOG_DEBUG("Binance Vision " << symbol << ' ' << binance_interval(interval) << ' ' << core::formatIsoDate(date)
                                << ": " << bars.size() << " rows");
    return bars;
}

domain::BarSequence BinanceVisionClient::fetchMonth(const std::string& symbol,
                                                    domain::Interval interval,
                                                    int year,
                                                    int month,
                                                    const core::Deadline& deadline) {
    if (month < 1 || month > 12) {
        throw std::invalid_argument("BinanceVisionClient: month out of range: " + std::to_string(month));
    }
    const auto url = vision::monthly_url(config_.baseUrl, config_.market, symbol, interval, year, month);
    const auto csv = vision::extract_csv(download(url, deadline));
    auto bars = vision::parse_kline_csv(csv);
    LOG_DEBUG("Binance Vision " << symbol << ' ' << binance_interval(interval) << ' '
                                << core::formatMonth(year, month) << ": " << bars.size() << " rows");
    return bars;
}

std::string BinanceVisionClient::download(const std::string& url, const core::Deadline& deadline) {
    auto get = [&](const std::string& target) {
        const auto timeout = deadline.clamp(*clock_, config_.requestTimeout);
        if (timeout.count() <= 0) {
            throw kvault::common::TransportError(ErrorKind::Timeout, "deadline exceeded before GET " + target,
                                                 config_.id);
        }
        infra::http::HttpRequest request;
        request.url = target;
        request.timeout = timeout;
        auto response = transport_->request(request);
        infra::http::ensureSuccess(response, config_.id, "GET " + target);
        return std::move(response.body);
    };

    auto archive = get(url);
    if (!config_.verifyChecksum) {
        return archive;
    }

    const auto expected = vision::parse_checksum(get(url + ".CHECKSUM"));
    const auto actual = kvault::common::sha256Hex(archive);
    if (actual != expected) {
        throw kvault::common::ValidationError(ErrorKind::IntegrityCheckFailed,
                                              "SHA-256 mismatch for " + url + ": expected " + expected + ", got " +
                                                  actual,
                                              config_.id);
    }
    return archive;
}

}  // namespace adapters::binance
