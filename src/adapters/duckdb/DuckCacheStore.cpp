#include "adapters/duckdb/DuckCacheStore.hpp"

#include <algorithm>
#include <cctype>
#include <cinttypes>
#include <cstdio>
#include <map>
#include <random>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <utility>

#include <duckdb.hpp>

#include "common/Checksum.hpp"
#include "common/Errors.hpp"
#include "common/Log.hpp"
#include "core/TimeUtils.h"
#include "domain/exchange/IKlineSource.hpp"

namespace fs = std::filesystem;

namespace adapters::duckdb {

using domain::cache::CacheEntry;
using domain::cache::CacheEntryInfo;
using domain::cache::ValidationResult;
using kvault::common::ErrorKind;
using kvault::common::ValidationError;

namespace {

constexpr auto kCreateBarsTable = R"SQL(
    CREATE TABLE bars (
        open_time BIGINT,
        open DOUBLE,
        high DOUBLE,
        low DOUBLE,
        close DOUBLE,
        volume DOUBLE,
        close_time BIGINT,
        quote_volume DOUBLE,
        trades BIGINT,
        taker_buy_base_volume DOUBLE,
        taker_buy_quote_volume DOUBLE
    )
)SQL";

std::string sqlQuote(const std::string& value) {
    std::string quoted{"'"};
    for (const char c : value) {
        if (c == '\'') {
            quoted.push_back('\'');
        }
        quoted.push_back(c);
    }
    quoted.push_back('\'');
    return quoted;
}

std::unique_ptr<::duckdb::MaterializedQueryResult> runQuery(::duckdb::Connection& connection,
                                                            const std::string& sql,
                                                            const std::string& what) {
    auto result = connection.Query(sql);
    if (!result || result->HasError()) {
        const std::string errorMessage = result ? result->GetError() : std::string{"unknown error"};
        throw std::runtime_error("DuckCacheStore: " + what + " failed: " + errorMessage);
    }
    return result;
}

void requireKey(const domain::Symbol& symbol, domain::Interval interval) {
    if (symbol.empty()) {
        throw std::invalid_argument("DuckCacheStore: symbol must not be empty");
    }
    const bool safe = std::all_of(symbol.begin(), symbol.end(), [](unsigned char c) {
        return std::isalnum(c) != 0 || c == '_' || c == '-';
    });
    if (!safe) {
        throw std::invalid_argument("DuckCacheStore: symbol contains unsupported characters: " + symbol);
    }
    if (!interval.dividesDay()) {
        throw std::invalid_argument("DuckCacheStore: interval must divide a day");
    }
}

std::string upper(const std::string& value) {
    std::string result{value};
    std::transform(result.begin(), result.end(), result.begin(), [](unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });
    return result;
}

std::int64_t footerInt(const std::map<std::string, std::string>& footer, const std::string& key) {
    const auto it = footer.find(key);
    if (it == footer.end()) {
        throw ValidationError(ErrorKind::IntegrityCheckFailed, "cache footer lacks '" + key + "'");
    }
    try {
        std::size_t consumed = 0;
        const auto value = std::stoll(it->second, &consumed);
        if (consumed != it->second.size()) {
            throw std::invalid_argument("trailing characters");
        }
        return value;
    } catch (const std::exception&) {
        throw ValidationError(ErrorKind::IntegrityCheckFailed,
                              "cache footer '" + key + "' is not an integer: " + it->second);
    }
}

std::string footerText(const std::map<std::string, std::string>& footer, const std::string& key) {
    const auto it = footer.find(key);
    if (it == footer.end()) {
        throw ValidationError(ErrorKind::IntegrityCheckFailed, "cache footer lacks '" + key + "'");
    }
    return it->second;
}

std::string renderFooter(const CacheEntryInfo& info,
                         const domain::Symbol& symbol,
                         domain::Interval interval,
                         const domain::CalendarDate& date) {
    const std::pair<const char*, std::string> entries[] = {
        {"kvault_version", "1"},
        {"symbol", symbol},
        {"interval", domain::to_string(interval)},
        {"date", core::formatIsoDate(date)},
        {"row_count", std::to_string(info.rowCount)},
        {"sha256", info.contentSha256},
        {"first_open", std::to_string(info.firstOpen)},
        {"last_open", std::to_string(info.lastOpen)},
        {"expected_count", std::to_string(info.expectedCount)},
        {"as_of", std::to_string(info.asOfMs)},
        {"written_at", std::to_string(info.writtenAtMs)},
        {"rules", info.boundaryRules},
        {"complete", info.complete ? "1" : "0"},
    };
    std::ostringstream oss;
    oss << '{';
    bool first = true;
    for (const auto& [key, value] : entries) {
        if (!first) {
            oss << ", ";
        }
        first = false;
        oss << key << ": " << sqlQuote(value);
    }
    oss << '}';
    return oss.str();
}

void keepColumns(domain::BarSequence& bars, const std::vector<std::string>& columns) {
    auto wanted = [&columns](std::string_view name) {
        return std::find(columns.begin(), columns.end(), name) != columns.end();
    };
    const bool open = wanted("open");
    const bool high = wanted("high");
    const bool low = wanted("low");
    const bool close = wanted("close");
    const bool volume = wanted("volume");
    const bool closeTime = wanted("close_time");
    const bool quoteVolume = wanted("quote_volume");
    const bool trades = wanted("trades");
    const bool takerBase = wanted("taker_buy_base_volume");
    const bool takerQuote = wanted("taker_buy_quote_volume");
    for (auto& bar : bars) {
        domain::Bar projected{};
        projected.openTime = bar.openTime;
        if (open) projected.open = bar.open;
        if (high) projected.high = bar.high;
        if (low) projected.low = bar.low;
        if (close) projected.close = bar.close;
        if (volume) projected.volume = bar.volume;
        if (closeTime) projected.closeTime = bar.closeTime;
        if (quoteVolume) projected.quoteVolume = bar.quoteVolume;
        if (trades) projected.trades = bar.trades;
        if (takerBase) projected.takerBuyBaseVolume = bar.takerBuyBaseVolume;
        if (takerQuote) projected.takerBuyQuoteVolume = bar.takerBuyQuoteVolume;
        bar = projected;
    }
}

}  // namespace

DuckCacheStore::DuckCacheStore(Config config,
                               std::shared_ptr<core::Clock> clock,
                               std::shared_ptr<const core::boundary::BoundaryValidator> validator)
    : config_(std::move(config)), clock_(std::move(clock)), validator_(std::move(validator)) {
    if (!clock_) {
        throw std::invalid_argument("DuckCacheStore requires a clock");
    }
    if (config_.cacheDir.empty()) {
        throw std::invalid_argument("DuckCacheStore: cache directory must not be empty");
    }
}

std::string DuckCacheStore::contentDigest(const domain::BarSequence& bars) {
    std::string canonical;
    canonical.reserve(bars.size() * 160);
    char line[512];
    for (const auto& bar : bars) {
        const int written = std::snprintf(line,
                                          sizeof(line),
                                          "%" PRId64 ",%.17g,%.17g,%.17g,%.17g,%.17g,%" PRId64 ",%.17g,%" PRId64
                                          ",%.17g,%.17g\n",
                                          bar.openTime,
                                          bar.open,
                                          bar.high,
                                          bar.low,
                                          bar.close,
                                          bar.volume,
                                          bar.closeTime,
                                          bar.quoteVolume,
                                          bar.trades,
                                          bar.takerBuyBaseVolume,
                                          bar.takerBuyQuoteVolume);
        if (written < 0 || static_cast<std::size_t>(written) >= sizeof(line)) {
            throw std::runtime_error("DuckCacheStore: failed to render bar for hashing");
        }
        canonical.append(line, static_cast<std::size_t>(written));
    }
    return kvault::common::sha256Hex(canonical);
}

fs::path DuckCacheStore::seriesDir(const domain::Symbol& symbol, domain::Interval interval) const {
    return config_.cacheDir / "binance" / domain::market_type_label(config_.market) / "klines" / "daily" /
           upper(symbol) / domain::to_string(interval);
}

fs::path DuckCacheStore::pathFor(const domain::Symbol& symbol,
                                 domain::Interval interval,
                                 const domain::CalendarDate& date) const {
    requireKey(symbol, interval);
    return seriesDir(symbol, interval) / (core::formatCompactDate(date) + ".parquet");
}

DuckCacheStore::KeyLock::KeyLock(DuckCacheStore& store, std::string key)
    : store_(store), key_(std::move(key)), mutex_(store_.acquireKey(key_)), lock_(*mutex_) {}

DuckCacheStore::KeyLock::~KeyLock() {
    lock_.unlock();
    mutex_.reset();
    store_.releaseKey(key_);
}

std::shared_ptr<std::mutex> DuckCacheStore::acquireKey(const std::string& key) {
    std::lock_guard<std::mutex> lock(keysMutex_);
    auto& slot = keyMutexes_[key];
    if (!slot) {
        slot = std::make_shared<std::mutex>();
    }
    return slot;
}

void DuckCacheStore::releaseKey(const std::string& key) {
    std::lock_guard<std::mutex> lock(keysMutex_);
    const auto it = keyMutexes_.find(key);
    // New holders only appear under keysMutex_, so a count of one is final.
    if (it != keyMutexes_.end() && it->second.use_count() == 1) {
        keyMutexes_.erase(it);
    }
}

std::size_t DuckCacheStore::lockedKeyCount() const {
    std::lock_guard<std::mutex> lock(keysMutex_);
    return keyMutexes_.size();
}

CacheEntryInfo DuckCacheStore::save(const domain::BarSequence& bars,
                                    const domain::Symbol& symbol,
                                    domain::Interval interval,
                                    const domain::CalendarDate& date) {
    return save(bars, symbol, interval, date, clock_->nowMs());
}

CacheEntryInfo DuckCacheStore::save(const domain::BarSequence& bars,
                                    const domain::Symbol& symbol,
                                    domain::Interval interval,
                                    const domain::CalendarDate& date,
                                    domain::TimestampMs asOfMs) {
    const auto path = pathFor(symbol, interval, date);
    const auto dayStart = core::dayStartMs(date);
    const auto dayEnd = dayStart + domain::kMillisPerDay;

    CacheEntryInfo info;
    info.rowCount = bars.size();
    info.asOfMs = asOfMs;
    info.complete = asOfMs >= dayEnd;
    info.boundaryRules = validator_ ? validator_->rules().signature() : std::string{};

    if (bars.empty()) {
        if (!config_.allowEmpty) {
            throw ValidationError(ErrorKind::SchemaInvalid, "refusing to cache an empty partition at " + path.string());
        }
    } else {
        if (const auto problem = core::boundary::BoundaryValidator::checkStructure(bars, interval)) {
            throw ValidationError(ErrorKind::SchemaInvalid, "refusing to cache " + path.string() + ": " + *problem);
        }
        if (bars.front().openTime < dayStart || bars.back().openTime >= dayEnd) {
            throw ValidationError(ErrorKind::BoundaryMismatch,
                                  "bars for " + core::formatIsoDate(date) + " fall outside that day");
        }
        info.firstOpen = bars.front().openTime;
        info.lastOpen = bars.back().openTime;
        info.expectedCount = static_cast<std::size_t>((info.lastOpen - info.firstOpen) / interval.ms + 1);

        if (validator_) {
            const auto expected = validator_->partitionBoundaries(date, interval, asOfMs);
            if (!expected || expected->firstOpen != info.firstOpen || expected->lastOpen != info.lastOpen ||
                expected->expectedCount != bars.size()) {
                std::ostringstream oss;
                oss << "partition " << path.string() << " holds " << bars.size() << " bars " << info.firstOpen
                    << ".." << info.lastOpen;
                if (expected) {
                    oss << ", expected " << expected->expectedCount << " bars " << expected->firstOpen << ".."
                        << expected->lastOpen;
                } else {
                    oss << ", expected none as of " << asOfMs;
                }
                throw ValidationError(ErrorKind::BoundaryMismatch, oss.str());
            }
        } else if (info.expectedCount != bars.size()) {
            throw ValidationError(ErrorKind::BoundaryMismatch,
                                  "partition " + path.string() + " has gaps: " + std::to_string(bars.size()) +
                                      " bars over " + std::to_string(info.expectedCount) + " slots");
        }
    }
    info.contentSha256 = contentDigest(bars);

    const KeyLock lock(*this, path.string());

    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);
    if (ec) {
        throw std::runtime_error("DuckCacheStore: unable to create directory '" + path.parent_path().string() +
                                 "': " + ec.message());
    }

    static thread_local std::mt19937_64 rng{std::random_device{}()};
    const auto tmpPath = path.string() + ".tmp-" + std::to_string(rng());
    info.writtenAtMs = clock_->nowMs();

    try {
        ::duckdb::DuckDB database(nullptr);
        ::duckdb::Connection connection(database);
        runQuery(connection, kCreateBarsTable, "create staging table");
        {
            ::duckdb::Appender appender(connection, "bars");
            for (const auto& bar : bars) {
                appender.AppendRow(static_cast<std::int64_t>(bar.openTime),
                                   bar.open,
                                   bar.high,
                                   bar.low,
                                   bar.close,
                                   bar.volume,
                                   static_cast<std::int64_t>(bar.closeTime),
                                   bar.quoteVolume,
                                   static_cast<std::int64_t>(bar.trades),
                                   bar.takerBuyBaseVolume,
                                   bar.takerBuyQuoteVolume);
            }
            appender.Close();
        }
        runQuery(connection,
                 "COPY (SELECT * FROM bars ORDER BY open_time) TO " + sqlQuote(tmpPath) +
                     " (FORMAT PARQUET, KV_METADATA " + renderFooter(info, upper(symbol), interval, date) + ")",
                 "write " + tmpPath);
        fs::rename(tmpPath, path);
    } catch (const std::exception&) {
        std::error_code removeEc;
        fs::remove(tmpPath, removeEc);
        throw;
    }

    LOG_DEBUG("Cached " << bars.size() << " bars at " << path.string() << (info.complete ? "" : " (open day)"));
    return info;
}

CacheEntry DuckCacheStore::readChecked(const fs::path& path,
                                       domain::Interval interval,
                                       const domain::CalendarDate& date) const {
    CacheEntry entry;
    std::map<std::string, std::string> footer;
    try {
        ::duckdb::DuckDB database(nullptr);
        ::duckdb::Connection connection(database);

        auto metadata = runQuery(connection,
                                 "SELECT decode(key), decode(value) FROM parquet_kv_metadata(" +
                                     sqlQuote(path.string()) + ")",
                                 "read footer of " + path.string());
        while (auto chunk = metadata->Fetch()) {
            const auto count = chunk->size();
            for (::duckdb::idx_t row = 0; row < count; ++row) {
                const auto key = chunk->GetValue(0, row);
                const auto value = chunk->GetValue(1, row);
                if (key.IsNull() || value.IsNull()) {
                    continue;
                }
                footer[key.GetValue<std::string>()] = value.GetValue<std::string>();
            }
        }

        auto rows = runQuery(connection,
                             "SELECT open_time, open, high, low, close, volume, close_time, quote_volume, trades, "
                             "taker_buy_base_volume, taker_buy_quote_volume FROM read_parquet(" +
                                 sqlQuote(path.string()) + ")",
                             "read rows of " + path.string());
        while (auto chunk = rows->Fetch()) {
            const auto count = chunk->size();
            for (::duckdb::idx_t row = 0; row < count; ++row) {
                domain::Bar bar{};
                bar.openTime = chunk->GetValue(0, row).GetValue<std::int64_t>();
                bar.open = chunk->GetValue(1, row).GetValue<double>();
                bar.high = chunk->GetValue(2, row).GetValue<double>();
                bar.low = chunk->GetValue(3, row).GetValue<double>();
                bar.close = chunk->GetValue(4, row).GetValue<double>();
                bar.volume = chunk->GetValue(5, row).GetValue<double>();
                bar.closeTime = chunk->GetValue(6, row).GetValue<std::int64_t>();
                bar.quoteVolume = chunk->GetValue(7, row).GetValue<double>();
                bar.trades = chunk->GetValue(8, row).GetValue<std::int64_t>();
                bar.takerBuyBaseVolume = chunk->GetValue(9, row).GetValue<double>();
                bar.takerBuyQuoteVolume = chunk->GetValue(10, row).GetValue<double>();
                entry.bars.push_back(bar);
            }
        }
    } catch (const ValidationError&) {
        throw;
    } catch (const std::exception& ex) {
        throw ValidationError(ErrorKind::IntegrityCheckFailed,
                              "unreadable cache partition " + path.string() + ": " + ex.what());
    }

    auto& info = entry.info;
    info.rowCount = static_cast<std::size_t>(footerInt(footer, "row_count"));
    info.contentSha256 = footerText(footer, "sha256");
    info.firstOpen = footerInt(footer, "first_open");
    info.lastOpen = footerInt(footer, "last_open");
    info.expectedCount = static_cast<std::size_t>(footerInt(footer, "expected_count"));
    info.asOfMs = footerInt(footer, "as_of");
    info.writtenAtMs = footerInt(footer, "written_at");
    info.boundaryRules = footerText(footer, "rules");
    info.complete = footerText(footer, "complete") == "1";

    checkAgainstFooter(entry.bars, info, interval, date);
    return entry;
}

void DuckCacheStore::checkAgainstFooter(const domain::BarSequence& bars,
                                        const CacheEntryInfo& info,
                                        domain::Interval interval,
                                        const domain::CalendarDate& date) const {
    const auto day = core::formatIsoDate(date);
    if (bars.size() != info.rowCount) {
        throw ValidationError(ErrorKind::IntegrityCheckFailed,
                              day + ": footer records " + std::to_string(info.rowCount) + " rows, file holds " +
                                  std::to_string(bars.size()));
    }
    if (contentDigest(bars) != info.contentSha256) {
        throw ValidationError(ErrorKind::IntegrityCheckFailed, day + ": content hash does not match footer");
    }

    if (bars.empty()) {
        if (!config_.allowEmpty) {
            throw ValidationError(ErrorKind::SchemaInvalid, day + ": cached partition is empty");
        }
        if (info.expectedCount != 0) {
            throw ValidationError(ErrorKind::BoundaryMismatch, day + ": footer expects bars but none are stored");
        }
        return;
    }

    if (const auto problem = core::boundary::BoundaryValidator::checkStructure(bars, interval)) {
        throw ValidationError(ErrorKind::SchemaInvalid, day + ": " + *problem);
    }
    if (bars.front().openTime != info.firstOpen || bars.back().openTime != info.lastOpen ||
        bars.size() != info.expectedCount) {
        throw ValidationError(ErrorKind::BoundaryMismatch,
                              day + ": stored bars " + std::to_string(bars.front().openTime) + ".." +
                                  std::to_string(bars.back().openTime) + " x" + std::to_string(bars.size()) +
                                  " disagree with footer " + std::to_string(info.firstOpen) + ".." +
                                  std::to_string(info.lastOpen) + " x" + std::to_string(info.expectedCount));
    }
    const auto dayStart = core::dayStartMs(date);
    if (info.firstOpen < dayStart || info.lastOpen >= dayStart + domain::kMillisPerDay) {
        throw ValidationError(ErrorKind::BoundaryMismatch, day + ": stored bars fall outside the day");
    }

    if (validator_) {
        const auto expected = validator_->partitionBoundaries(date, interval, info.asOfMs);
        if (!expected || expected->firstOpen != info.firstOpen || expected->lastOpen != info.lastOpen ||
            expected->expectedCount != info.expectedCount) {
            throw ValidationError(ErrorKind::BoundaryMismatch,
                                  day + ": stored boundaries disagree with the resolved partition as of " +
                                      core::formatTimestamp(info.asOfMs));
        }
    }
}

std::optional<CacheEntry> DuckCacheStore::load(const domain::Symbol& symbol,
                                               domain::Interval interval,
                                               const domain::CalendarDate& date,
                                               const std::vector<std::string>* columns) const {
    if (columns) {
        for (const auto& column : *columns) {
            if (std::find(kColumns.begin(), kColumns.end(), column) == kColumns.end()) {
                throw std::invalid_argument("DuckCacheStore: unknown column '" + column + "'");
            }
        }
    }

    const auto path = pathFor(symbol, interval, date);
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        return std::nullopt;
    }

    auto entry = readChecked(path, interval, date);
    if (columns) {
        keepColumns(entry.bars, *columns);
    }
    return entry;
}

ValidationResult DuckCacheStore::validate(const domain::Symbol& symbol,
                                          domain::Interval interval,
                                          const domain::CalendarDate& date) const {
    ValidationResult result;
    const auto path = pathFor(symbol, interval, date);
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        result.status = ValidationResult::Status::Missing;
        result.detail = path.string() + " does not exist";
        return result;
    }

    try {
        auto entry = readChecked(path, interval, date);
        result.status = ValidationResult::Status::Valid;
        result.detail = std::to_string(entry.bars.size()) + " bars";
        result.info = entry.info;
    } catch (const ValidationError& ex) {
        result.status = ValidationResult::Status::Invalid;
        result.error = ex.kind();
        result.detail = ex.what();
    }
    return result;
}

bool DuckCacheStore::remove(const domain::Symbol& symbol,
                            domain::Interval interval,
                            const domain::CalendarDate& date) {
    const auto path = pathFor(symbol, interval, date);
    const KeyLock lock(*this, path.string());

    std::error_code ec;
    const bool removed = fs::remove(path, ec);
    if (ec) {
        throw std::runtime_error("DuckCacheStore: unable to remove '" + path.string() + "': " + ec.message());
    }
    if (removed) {
        LOG_INFO("Removed cache partition " << path.string());
    }
    return removed;
}

std::vector<domain::CalendarDate> DuckCacheStore::listDates(const domain::Symbol& symbol,
                                                            domain::Interval interval) const {
    requireKey(symbol, interval);
    std::vector<domain::CalendarDate> dates;
    const auto dir = seriesDir(symbol, interval);
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        return dates;
    }
    for (fs::directory_iterator it{dir, ec}, end; !ec && it != end; it.increment(ec)) {
        const auto& file = it->path();
        if (file.extension() != ".parquet") {
            continue;
        }
        if (const auto date = core::parseDate(file.stem().string())) {
            dates.push_back(*date);
        }
    }
    if (ec) {
        throw std::runtime_error("DuckCacheStore: unable to list '" + dir.string() + "': " + ec.message());
    }
    std::sort(dates.begin(), dates.end());
    return dates;
}

}  // namespace adapters::duckdb
