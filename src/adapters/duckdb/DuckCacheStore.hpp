#pragma once

#include <array>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "core/Clock.hpp"
#include "core/boundary/BoundaryValidator.hpp"
#include "domain/cache/ICacheStore.hpp"

namespace adapters::duckdb {

// One Parquet file per (symbol, interval, UTC date), written through an
// in-memory DuckDB connection:
//   <cacheDir>/binance/<market>/klines/daily/<SYMBOL>/<interval>/<YYYYMMDD>.parquet
// The footer key/value metadata carries the row count, a SHA-256 of the rows
// and the boundaries expected at write time. Files are written beside their
// final name and renamed into place, so readers only ever see whole files.
class DuckCacheStore final : public domain::cache::ICacheStore {
public:
    static constexpr std::array<std::string_view, 11> kColumns{
        "open_time", "open", "high", "low", "close", "volume", "close_time",
        "quote_volume", "trades", "taker_buy_base_volume", "taker_buy_quote_volume"};

    struct Config {
        std::filesystem::path cacheDir{"./cache"};
        domain::MarketType market{domain::MarketType::Spot};
        // Accept empty partitions (a day with no trading).
        bool allowEmpty{false};
    };

    // validator may be null; boundary agreement is then checked against the
    // footer alone.
    DuckCacheStore(Config config,
                   std::shared_ptr<core::Clock> clock,
                   std::shared_ptr<const core::boundary::BoundaryValidator> validator);

    domain::cache::CacheEntryInfo save(const domain::BarSequence& bars,
                                       const domain::Symbol& symbol,
                                       domain::Interval interval,
                                       const domain::CalendarDate& date,
                                       domain::TimestampMs asOfMs) override;

    // Same as above with asOfMs taken from the clock.
    domain::cache::CacheEntryInfo save(const domain::BarSequence& bars,
                                       const domain::Symbol& symbol,
                                       domain::Interval interval,
                                       const domain::CalendarDate& date);

    // columns limits which fields are filled in; open_time is always present.
    // Throws std::invalid_argument for an unknown column name.
    std::optional<domain::cache::CacheEntry> load(const domain::Symbol& symbol,
                                                  domain::Interval interval,
                                                  const domain::CalendarDate& date,
                                                  const std::vector<std::string>* columns = nullptr) const override;

    domain::cache::ValidationResult validate(const domain::Symbol& symbol,
                                             domain::Interval interval,
                                             const domain::CalendarDate& date) const override;

    bool remove(const domain::Symbol& symbol, domain::Interval interval, const domain::CalendarDate& date) override;

    std::vector<domain::CalendarDate> listDates(const domain::Symbol& symbol, domain::Interval interval) const override;

    std::filesystem::path pathFor(const domain::Symbol& symbol,
                                  domain::Interval interval,
                                  const domain::CalendarDate& date) const;

    const Config& config() const noexcept { return config_; }

    // Hex SHA-256 over a fixed text rendering of every field of every bar.
    static std::string contentDigest(const domain::BarSequence& bars);

    // Partition paths currently held by a writer or remover.
    std::size_t lockedKeyCount() const;

private:
    // Serialises writers of one partition path. The path's slot is dropped
    // when its last holder leaves.
    class KeyLock {
    public:
        KeyLock(DuckCacheStore& store, std::string key);
        ~KeyLock();

        KeyLock(const KeyLock&) = delete;
        KeyLock& operator=(const KeyLock&) = delete;

    private:
        DuckCacheStore& store_;
        std::string key_;
        std::shared_ptr<std::mutex> mutex_;
        std::unique_lock<std::mutex> lock_;
    };

    std::filesystem::path seriesDir(const domain::Symbol& symbol, domain::Interval interval) const;
    std::shared_ptr<std::mutex> acquireKey(const std::string& key);
    void releaseKey(const std::string& key);

    domain::cache::CacheEntry readChecked(const std::filesystem::path& path,
                                          domain::Interval interval,
                                          const domain::CalendarDate& date) const;
    void checkAgainstFooter(const domain::BarSequence& bars,
                            const domain::cache::CacheEntryInfo& info,
                            domain::Interval interval,
                            const domain::CalendarDate& date) const;

    Config config_;
    std::shared_ptr<core::Clock> clock_;
    std::shared_ptr<const core::boundary::BoundaryValidator> validator_;

    mutable std::mutex keysMutex_;
    std::unordered_map<std::string, std::shared_ptr<std::mutex>> keyMutexes_;
};

}  // namespace adapters::duckdb
