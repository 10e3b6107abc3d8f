#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

#include "common/Log.hpp"
#include "core/app/SourceOrchestrator.hpp"
#include "domain/Types.h"

namespace kvault::common {

struct Config {
    kvault::log::Level logLevel = kvault::log::Level::Info;
    std::string cacheDir = "./cache";
    domain::MarketType marketType = domain::MarketType::Spot;

    std::vector<std::string> transports{"beast"};
    std::string transportStrategy = "single";
    std::chrono::milliseconds httpTimeout{10'000};

    std::size_t retryMaxAttempts = 5;
    std::chrono::milliseconds retryBaseDelay{500};
    std::chrono::milliseconds retryMaxDelay{30'000};
    double retryJitter = 0.2;

    std::size_t breakerFailureThreshold = 5;
    std::chrono::milliseconds breakerRecoveryTimeout{60'000};
    std::size_t breakerHalfOpenMaxCalls = 2;

    std::chrono::milliseconds freshnessThreshold{30LL * 24 * 60 * 60 * 1000};
    std::chrono::milliseconds openPartitionFreshness{5 * 60 * 1000};
    std::chrono::milliseconds maxStaleness{90LL * 24 * 60 * 60 * 1000};
    std::chrono::milliseconds consolidationDelay{48 * 60 * 60 * 1000};
    std::chrono::milliseconds requestDeadline{120'000};

    bool calibrate = true;
    std::string probeSymbol = "BTCUSDT";
    std::string probeInterval = "1m";

    // kvault_fetch only; command line flags, never the environment.
    std::string symbol;
    std::string interval = "1h";
    std::string from;
    std::string to = "now";
    std::string source = "auto";
    bool validateOnly = false;
    std::string warmMonth;

    // Environment first, then --key value / --key=value flags. Throws
    // std::runtime_error naming the offending key. Creates cacheDir.
    static Config fromArgs(int argc, char** argv);

    core::app::OrchestratorSettings orchestratorSettings() const;
};

}  // namespace kvault::common
