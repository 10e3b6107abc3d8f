#pragma once

#include <chrono>
#include <memory>
#include <string>

#include "core/Clock.hpp"
#include "core/boundary/BoundaryValidator.hpp"
#include "domain/exchange/IKlineSource.hpp"
#include "infra/http/Transport.hpp"

namespace adapters::binance {

// Archive backend: daily and monthly kline zips from data.binance.vision.
//
// A window is served by downloading every day it touches and clipping the
// rows with the boundary validator, so the result matches what the REST
// backend would have returned for the same [startTime, endTime]. A day that
// is not published yet comes back as ResponseError{ClientError, 404}.
class BinanceVisionClient final : public domain::IArchiveSource {
public:
    struct Config {
        std::string id = "vision";
        domain::MarketType market = domain::MarketType::Spot;
        std::string baseUrl = "https://data.binance.vision";
        bool verifyChecksum = true;
        std::chrono::milliseconds requestTimeout{60'000};
    };

    BinanceVisionClient(std::shared_ptr<infra::http::ITransport> transport,
                        std::shared_ptr<core::Clock> clock,
                        std::shared_ptr<const core::boundary::BoundaryValidator> validator,
                        Config config);
    ~BinanceVisionClient() override = default;

    const std::string& id() const noexcept override { return config_.id; }
    bool supportsInterval(domain::Interval interval) const noexcept override;

    domain::BarSequence fetchKlines(const std::string& symbol,
                                    domain::Interval interval,
                                    domain::TimestampMs startTime,
                                    domain::TimestampMs endTime,
                                    const core::Deadline& deadline) override;

    // Every row of one daily archive, unclipped.
    domain::BarSequence fetchDay(const std::string& symbol,
                                 domain::Interval interval,
                                 const domain::CalendarDate& date,
                                 const core::Deadline& deadline);

    // Every row of one monthly archive, unclipped.
    domain::BarSequence fetchMonth(const std::string& symbol,
                                   domain::Interval interval,
                                   int year,
                                   int month,
                                   const core::Deadline& deadline) override;

private:
    std::string download(const std::string& url, const core::Deadline& deadline);

    std::shared_ptr<infra::http::ITransport> transport_;
    std::shared_ptr<core::Clock> clock_;
    std::shared_ptr<const core::boundary::BoundaryValidator> validator_;
    Config config_;
};

}  // namespace adapters::binance
