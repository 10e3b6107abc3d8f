#include "common/Config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <sstream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

#include "adapters/binance/IntervalMap.hpp"
#include "domain/exchange/IKlineSource.hpp"
#include "infra/http/TransportSelector.hpp"

namespace kvault::common {
namespace {

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

std::string trim(std::string value) {
    auto isSpace = [](unsigned char ch) { return std::isspace(ch) != 0; };
    value.erase(value.begin(), std::find_if(value.begin(), value.end(), [&](unsigned char ch) {
                   return !isSpace(ch);
               }));
    value.erase(std::find_if(value.rbegin(), value.rend(), [&](unsigned char ch) {
                    return !isSpace(ch);
                }).base(),
                value.end());
    return value;
}

std::vector<std::string> parseCsvList(const std::string& value) {
    std::vector<std::string> parts;
    std::stringstream ss(value);
    std::string item;
    while (std::getline(ss, item, ',')) {
        auto trimmed = toLower(trim(item));
        if (!trimmed.empty()) {
            parts.push_back(std::move(trimmed));
        }
    }
    return parts;
}

std::chrono::milliseconds parseDurationMs(const std::string& value, const std::string& label, bool allowZero = false) {
    try {
        std::size_t consumed = 0;
        const auto parsed = std::stoll(value, &consumed);
        if (consumed != value.size() || parsed < 0 || (parsed == 0 && !allowZero)) {
            throw std::out_of_range("duration out of range");
        }
        return std::chrono::milliseconds{parsed};
    } catch (const std::exception&) {
        throw std::runtime_error("Invalid value for " + label + ": " + value);
    }
}

std::size_t parseCount(const std::string& value, const std::string& label) {
    try {
        std::size_t consumed = 0;
        const auto parsed = std::stoul(value, &consumed);
        if (consumed != value.size() || parsed == 0U) {
            throw std::out_of_range("count must be >= 1");
        }
        return static_cast<std::size_t>(parsed);
    } catch (const std::exception&) {
        throw std::runtime_error("Invalid value for " + label + ": " + value);
    }
}

double parseRatio(const std::string& value, const std::string& label) {
    try {
        std::size_t consumed = 0;
        const auto parsed = std::stod(value, &consumed);
        if (consumed != value.size() || parsed < 0.0 || parsed > 1.0) {
            throw std::out_of_range("ratio out of range");
        }
        return parsed;
    } catch (const std::exception&) {
        throw std::runtime_error("Invalid value for " + label + ": " + value);
    }
}

bool parseBool(const std::string& value, const std::string& label) {
    const auto normalized = toLower(value);
    if (normalized == "true" || normalized == "1" || normalized == "yes" || normalized == "on") {
        return true;
    }
    if (normalized == "false" || normalized == "0" || normalized == "no" || normalized == "off") {
        return false;
    }
    throw std::runtime_error("Invalid boolean for " + label + ": " + value);
}

kvault::log::Level parseLevel(const std::string& value, const std::string& label) {
    try {
        return kvault::log::levelFromString(toLower(value));
    } catch (const std::exception&) {
        throw std::runtime_error("Invalid value for " + label + ": " + value);
    }
}

domain::MarketType parseMarket(const std::string& value, const std::string& label) {
    if (const auto market = domain::market_type_from_label(value)) {
        return *market;
    }
    throw std::runtime_error("Invalid value for " + label + ": " + value + " (expected spot, um or cm)");
}

std::string parseStrategy(const std::string& value, const std::string& label) {
    if (const auto strategy = infra::http::selectionStrategyFromLabel(toLower(value))) {
        return infra::http::selectionStrategyLabel(*strategy);
    }
    throw std::runtime_error("Invalid value for " + label + ": " + value);
}

std::string parseSource(const std::string& value) {
    const auto normalized = toLower(value);
    if (normalized == "auto" || normalized == "rest" || normalized == "vision" || normalized == "cache" ||
        normalized == "refresh") {
        return normalized;
    }
    throw std::runtime_error("Invalid value for --source: " + value);
}

std::string valueFromArgs(int argc, char** argv, const std::string& key) {
    const std::string withEquals = key + '=';
    for (int i = 1; i < argc; ++i) {
        std::string arg{argv[i]};
        if (arg == key && i + 1 < argc) {
            return argv[i + 1];
        }
        if (arg.rfind(withEquals, 0) == 0) {
            return arg.substr(withEquals.size());
        }
    }
    return {};
}

bool hasFlag(int argc, char** argv, const std::string& key) {
    for (int i = 1; i < argc; ++i) {
        if (key == argv[i]) {
            return true;
        }
    }
    return false;
}

std::string envValue(const char* name) {
    const char* value = std::getenv(name);
    return value ? trim(value) : std::string{};
}

}  // namespace

Config Config::fromArgs(int argc, char** argv) {
    Config config{};

    // Each setting: environment variable, then flag.
    auto setting = [&](const char* env, const std::string& flag, auto&& apply) {
        if (auto value = envValue(env); !value.empty()) {
            apply(value, std::string{env});
        }
        if (auto value = trim(valueFromArgs(argc, argv, flag)); !value.empty()) {
            apply(value, flag);
        }
    };

    setting("LOG_LEVEL", "--log-level", [&](const std::string& v, const std::string& key) {
        config.logLevel = parseLevel(v, key);
    });
    setting("KVAULT_CACHE_DIR", "--cache-dir", [&](const std::string& v, const std::string&) {
        config.cacheDir = v;
    });
    setting("KVAULT_MARKET", "--market", [&](const std::string& v, const std::string& key) {
        config.marketType = parseMarket(v, key);
    });
    setting("KVAULT_TRANSPORTS", "--transports", [&](const std::string& v, const std::string& key) {
        auto list = parseCsvList(v);
        if (list.empty()) {
            throw std::runtime_error("Invalid value for " + key + ": empty transport list");
        }
        config.transports = std::move(list);
    });
    setting("KVAULT_TRANSPORT_STRATEGY", "--transport-strategy", [&](const std::string& v, const std::string& key) {
        config.transportStrategy = parseStrategy(v, key);
    });
    setting("HTTP_TIMEOUT_MS", "--http-timeout-ms", [&](const std::string& v, const std::string& key) {
        config.httpTimeout = parseDurationMs(v, key);
    });

    setting("RETRY_MAX_ATTEMPTS", "--retry-max-attempts", [&](const std::string& v, const std::string& key) {
        config.retryMaxAttempts = parseCount(v, key);
    });
    setting("RETRY_BASE_DELAY_MS", "--retry-base-delay-ms", [&](const std::string& v, const std::string& key) {
        config.retryBaseDelay = parseDurationMs(v, key, true);
    });
    setting("RETRY_MAX_DELAY_MS", "--retry-max-delay-ms", [&](const std::string& v, const std::string& key) {
        config.retryMaxDelay = parseDurationMs(v, key, true);
    });
    setting("RETRY_JITTER", "--retry-jitter", [&](const std::string& v, const std::string& key) {
        config.retryJitter = parseRatio(v, key);
    });

    setting("BREAKER_FAILURE_THRESHOLD", "--breaker-failure-threshold",
            [&](const std::string& v, const std::string& key) { config.breakerFailureThreshold = parseCount(v, key); });
    setting("BREAKER_RECOVERY_TIMEOUT_MS", "--breaker-recovery-timeout-ms",
            [&](const std::string& v, const std::string& key) {
                config.breakerRecoveryTimeout = parseDurationMs(v, key);
            });
    setting("BREAKER_HALF_OPEN_MAX_CALLS", "--breaker-half-open-max-calls",
            [&](const std::string& v, const std::string& key) { config.breakerHalfOpenMaxCalls = parseCount(v, key); });

    setting("CACHE_FRESHNESS_MS", "--cache-freshness-ms", [&](const std::string& v, const std::string& key) {
        config.freshnessThreshold = parseDurationMs(v, key);
    });
    setting("CACHE_OPEN_FRESHNESS_MS", "--cache-open-freshness-ms", [&](const std::string& v, const std::string& key) {
        config.openPartitionFreshness = parseDurationMs(v, key);
    });
    setting("CACHE_MAX_STALENESS_MS", "--cache-max-staleness-ms", [&](const std::string& v, const std::string& key) {
        config.maxStaleness = parseDurationMs(v, key);
    });
    setting("CONSOLIDATION_DELAY_MS", "--consolidation-delay-ms", [&](const std::string& v, const std::string& key) {
        config.consolidationDelay = parseDurationMs(v, key, true);
    });
    setting("REQUEST_DEADLINE_MS", "--deadline-ms", [&](const std::string& v, const std::string& key) {
        config.requestDeadline = parseDurationMs(v, key);
    });

    setting("KVAULT_CALIBRATE", "--calibrate", [&](const std::string& v, const std::string& key) {
        config.calibrate = parseBool(v, key);
    });
    setting("KVAULT_PROBE_SYMBOL", "--probe-symbol", [&](const std::string& v, const std::string&) {
        config.probeSymbol = v;
    });
    setting("KVAULT_PROBE_INTERVAL", "--probe-interval", [&](const std::string& v, const std::string& key) {
        if (!adapters::binance::is_supported_interval(domain::interval_from_label(v))) {
            throw std::runtime_error("Invalid value for " + key + ": " + v);
        }
        config.probeInterval = v;
    });

    if (auto symbolArg = trim(valueFromArgs(argc, argv, "--symbol")); !symbolArg.empty()) {
        std::transform(symbolArg.begin(), symbolArg.end(), symbolArg.begin(), [](unsigned char c) {
            return static_cast<char>(std::toupper(c));
        });
        config.symbol = std::move(symbolArg);
    }
    if (auto intervalArg = trim(valueFromArgs(argc, argv, "--interval")); !intervalArg.empty()) {
        if (!adapters::binance::is_supported_interval(domain::interval_from_label(intervalArg))) {
            throw std::runtime_error("Invalid value for --interval: " + intervalArg);
        }
        config.interval = intervalArg;
    }
    if (auto fromArg = trim(valueFromArgs(argc, argv, "--from")); !fromArg.empty()) {
        config.from = std::move(fromArg);
    }
    if (auto toArg = trim(valueFromArgs(argc, argv, "--to")); !toArg.empty()) {
        config.to = std::move(toArg);
    }
    if (auto sourceArg = trim(valueFromArgs(argc, argv, "--source")); !sourceArg.empty()) {
        config.source = parseSource(sourceArg);
    }
    if (auto warmArg = trim(valueFromArgs(argc, argv, "--warm-month")); !warmArg.empty()) {
        config.warmMonth = std::move(warmArg);
    }
    config.validateOnly = hasFlag(argc, argv, "--validate-only");

    if (config.retryMaxDelay < config.retryBaseDelay) {
        throw std::runtime_error("Invalid retry delays: RETRY_MAX_DELAY_MS is below RETRY_BASE_DELAY_MS");
    }
    if (config.maxStaleness < config.freshnessThreshold) {
        throw std::runtime_error("Invalid cache settings: CACHE_MAX_STALENESS_MS is below CACHE_FRESHNESS_MS");
    }

    const std::filesystem::path cachePath{config.cacheDir};
    std::error_code ec;
    std::filesystem::create_directories(cachePath, ec);
    if (ec) {
        throw std::runtime_error("Unable to create cache directory (" + cachePath.string() + "): " + ec.message());
    }

    return config;
}

core::app::OrchestratorSettings Config::orchestratorSettings() const {
    core::app::OrchestratorSettings settings;
    settings.policy.freshnessThreshold = freshnessThreshold;
    settings.policy.openPartitionFreshness = openPartitionFreshness;
    settings.policy.maxStaleness = maxStaleness;
    settings.policy.consolidationDelay = consolidationDelay;
    settings.retry.maxAttempts = retryMaxAttempts;
    settings.retry.baseDelay = retryBaseDelay;
    settings.retry.maxDelay = retryMaxDelay;
    settings.retry.jitter = retryJitter;
    settings.breaker.failureThreshold = breakerFailureThreshold;
    settings.breaker.recoveryTimeout = breakerRecoveryTimeout;
    settings.breaker.halfOpenMaxCalls = breakerHalfOpenMaxCalls;
    settings.requestDeadline = requestDeadline;
    settings.transportStrategy = transportStrategy;
    settings.calibrateOnOpen = calibrate;
    settings.probeSymbol = probeSymbol;
    settings.probeInterval = domain::interval_from_string(probeInterval);
    return settings;
}

}  // namespace kvault::common
