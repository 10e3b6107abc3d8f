#include <cstdio>
#include <cstdlib>
#include <exception>
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "adapters/binance/BinanceRestClient.hpp"
#include "adapters/binance/BinanceVisionClient.hpp"
#include "adapters/duckdb/DuckCacheStore.hpp"
#include "common/Config.hpp"
#include "common/Errors.hpp"
#include "common/Log.hpp"
#include "core/Clock.hpp"
#include "core/TimeUtils.h"
#include "core/app/SourceOrchestrator.hpp"
#include "core/boundary/BoundaryValidator.hpp"
#include "domain/exchange/IKlineSource.hpp"
#include "infra/http/TransportRegistry.hpp"
#include "infra/http/TransportSelector.hpp"

namespace {

constexpr int kExitFetchError = 2;

void onTerminate() {
    if (auto eptr = std::current_exception()) {
        try {
            std::rethrow_exception(eptr);
        } catch (const std::exception& ex) {
            std::fprintf(stderr, "std::terminate: %s\n", ex.what());
        } catch (...) {
            std::fprintf(stderr, "std::terminate: unknown exception\n");
        }
    } else {
        std::fprintf(stderr, "std::terminate without current_exception\n");
    }
    std::_Exit(1);
}

domain::SourceOverride sourceOverrideFor(const std::string& source) {
    if (source == "rest") {
        return domain::SourceOverride::Incremental;
    }
    if (source == "vision") {
        return domain::SourceOverride::Archive;
    }
    if (source == "cache") {
        return domain::SourceOverride::CacheOnly;
    }
    if (source == "refresh") {
        return domain::SourceOverride::Refresh;
    }
    return domain::SourceOverride::Auto;
}

domain::TimestampMs parseTimeArg(const std::string& text, const char* flag, domain::TimestampMs nowMs) {
    if (text.empty()) {
        throw std::runtime_error(std::string{flag} + " is required");
    }
    if (const auto parsed = core::parseTimestamp(text, nowMs)) {
        return *parsed;
    }
    throw std::runtime_error(std::string{"Invalid value for "} + flag + ": " + text);
}

std::shared_ptr<infra::http::ITransport> buildTransport(const kvault::common::Config& config) {
    infra::http::TransportRegistry registry;
    std::vector<std::shared_ptr<infra::http::ITransport>> transports;
    for (const auto& id : config.transports) {
        transports.push_back(registry.create(id));
    }
    const auto strategy =
        infra::http::selectionStrategyFromLabel(config.transportStrategy).value_or(infra::http::SelectionStrategy::Single);
    if (transports.size() == 1 && strategy == infra::http::SelectionStrategy::Single) {
        return transports.front();
    }
    return std::make_shared<infra::http::TransportSelector>(std::move(transports), strategy);
}

void printBars(const domain::BarSequence& bars) {
    std::cout << "open_time,open,high,low,close,volume,close_time,quote_volume,trades,"
                 "taker_buy_base_volume,taker_buy_quote_volume\n";
    std::cout << std::setprecision(15);
    for (const auto& bar : bars) {
        std::cout << bar.openTime << ',' << bar.open << ',' << bar.high << ',' << bar.low << ',' << bar.close << ','
                  << bar.volume << ',' << bar.closeTime << ',' << bar.quoteVolume << ',' << bar.trades << ','
                  << bar.takerBuyBaseVolume << ',' << bar.takerBuyQuoteVolume << '\n';
    }
}

int validateRange(core::app::SourceOrchestrator& orchestrator,
                  const kvault::common::Config& config,
                  domain::Interval interval,
                  domain::TimestampMs from,
                  domain::TimestampMs to) {
    int invalid = 0;
    std::cout << "date,status,detail\n";
    const auto last = core::dateOf(to - 1);
    for (auto day = core::dateOf(from); !(last < day); day = core::addDays(day, 1)) {
        const auto result = orchestrator.validateCache(config.symbol, interval, day);
        if (result.status == domain::cache::ValidationResult::Status::Invalid) {
            ++invalid;
        }
        std::cout << core::formatIsoDate(day) << ',' << domain::cache::validation_status_label(result.status) << ",\""
                  << result.detail << "\"\n";
    }
    return invalid == 0 ? EXIT_SUCCESS : EXIT_FAILURE;
}

}  // namespace

int main(int argc, char** argv) {
    std::set_terminate(onTerminate);

    try {
        auto config = kvault::common::Config::fromArgs(argc, argv);
        kvault::log::setLevel(config.logLevel);

        LOG_INFO("Cache directory: " << config.cacheDir << " (market "
                                     << domain::market_type_label(config.marketType) << ")");
        LOG_DEBUG("Transports: " << config.transports.size() << " via " << config.transportStrategy
                                 << ", request deadline " << config.requestDeadline.count() << " ms");

        if (config.symbol.empty()) {
            LOG_ERR("--symbol is required");
            return EXIT_FAILURE;
        }
        const auto interval = domain::interval_from_string(config.interval);

        auto clock = core::SystemClock::shared();
        auto validator = std::make_shared<core::boundary::BoundaryValidator>();

        adapters::duckdb::DuckCacheStore::Config storeConfig;
        storeConfig.cacheDir = config.cacheDir;
        storeConfig.market = config.marketType;
        auto store = std::make_shared<adapters::duckdb::DuckCacheStore>(storeConfig, clock, validator);

        auto transport = buildTransport(config);

        adapters::binance::BinanceRestClient::Config restConfig;
        restConfig.market = config.marketType;
        restConfig.requestTimeout = config.httpTimeout;
        auto rest = std::make_shared<adapters::binance::BinanceRestClient>(transport, clock, restConfig);

        adapters::binance::BinanceVisionClient::Config visionConfig;
        visionConfig.market = config.marketType;
        auto vision = std::make_shared<adapters::binance::BinanceVisionClient>(transport, clock, validator, visionConfig);

        core::app::SourceOrchestrator orchestrator(config.orchestratorSettings(), store, validator, clock, {transport});
        orchestrator.registerBackend(rest->id(), core::app::BackendRole::Incremental, rest);
        orchestrator.registerBackend(vision->id(), vision);

        const auto nowMs = clock->nowMs();

        if (config.validateOnly) {
            const auto from = parseTimeArg(config.from, "--from", nowMs);
            const auto to = parseTimeArg(config.to, "--to", nowMs);
            if (from >= to) {
                LOG_ERR("--from must precede --to");
                return EXIT_FAILURE;
            }
            return validateRange(orchestrator, config, interval, from, to);
        }

        orchestrator.open();

        if (!config.warmMonth.empty()) {
            const auto month = core::parseDate(config.warmMonth + "-01");
            if (!month) {
                LOG_ERR("Invalid value for --warm-month: " << config.warmMonth << " (expected YYYY-MM)");
                return EXIT_FAILURE;
            }
            const auto written = orchestrator.warmMonth(config.symbol, interval, month->year, month->month);
            std::cout << written << '\n';
            return EXIT_SUCCESS;
        }

        const auto from = parseTimeArg(config.from, "--from", nowMs);
        const auto to = parseTimeArg(config.to, "--to", nowMs);
        if (from >= to) {
            LOG_ERR("--from must precede --to");
            return EXIT_FAILURE;
        }

        const auto bars = orchestrator.getData(config.symbol, domain::TimeWindow{from, to}, interval,
                                               sourceOverrideFor(config.source));
        printBars(bars);

        const auto snapshot = orchestrator.metrics().snapshot();
        for (const auto& [key, value] : snapshot.counters) {
            LOG_DEBUG("metric " << key << " = " << value);
        }
        LOG_INFO("Returned " << bars.size() << " bars for " << config.symbol << ' ' << config.interval);
    } catch (const kvault::common::ExhaustionError& ex) {
        LOG_ERR("Fetch failed (" << kvault::common::errorKindToString(ex.kind()) << "): " << ex.what()
                                 << "; last error: " << ex.lastError());
        return kExitFetchError;
    } catch (const kvault::common::FetchError& ex) {
        LOG_ERR("Fetch failed (" << kvault::common::errorKindToString(ex.kind()) << "): " << ex.what());
        return kExitFetchError;
    } catch (const std::exception& ex) {
        LOG_ERR("Fatal error: " << ex.what());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
