#include <filesystem>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <duckdb.hpp>

#include "adapters/duckdb/DuckCacheStore.hpp"
#include "common/Errors.hpp"
#include "core/TimeUtils.h"
#include "core/boundary/BoundaryValidator.hpp"
#include "support/Fakes.hpp"

using adapters::duckdb::DuckCacheStore;
using domain::Interval;
using domain::TimestampMs;
using domain::cache::ValidationResult;
using kvault::common::ErrorKind;
using testsupport::run;

namespace {

constexpr TimestampMs kHour = 3'600'000;
// 2024-03-01T00:00:00Z
constexpr TimestampMs kDay = 1'709'251'200'000;
const Interval kH1{kHour};
const domain::CalendarDate kDate{2024, 3, 1};

struct StoreFixture {
    testsupport::TempDir dir{"kvault-cache"};
    std::shared_ptr<testsupport::ManualClock> clock =
        std::make_shared<testsupport::ManualClock>(kDay + 2 * domain::kMillisPerDay);
    std::shared_ptr<core::boundary::BoundaryValidator> validator =
        std::make_shared<core::boundary::BoundaryValidator>();

    DuckCacheStore store(bool withValidator = true) {
        DuckCacheStore::Config config;
        config.cacheDir = dir.path();
        return DuckCacheStore(config, clock, withValidator ? validator : nullptr);
    }
};

domain::BarSequence fullDay() {
    return testsupport::makeBars(kDay, kDay + domain::kMillisPerDay, kH1);
}

ErrorKind saveFailure(DuckCacheStore& store, const domain::BarSequence& bars, TimestampMs asOf) {
    try {
        store.save(bars, "BTCUSDT", kH1, kDate, asOf);
    } catch (const kvault::common::ValidationError& ex) {
        return ex.kind();
    }
    return ErrorKind::AllBackendsFailed;
}

ErrorKind loadFailure(const DuckCacheStore& store) {
    try {
        store.load("BTCUSDT", kH1, kDate);
    } catch (const kvault::common::ValidationError& ex) {
        return ex.kind();
    }
    return ErrorKind::AllBackendsFailed;
}

std::string sqlQuote(const std::string& value) {
    std::string quoted{"'"};
    for (const char c : value) {
        if (c == '\'') {
            quoted.push_back('\'');
        }
        quoted.push_back(c);
    }
    return quoted + "'";
}

// Rewrites the partition with doubled volumes but the original footer.
void tamperVolumes(const std::filesystem::path& path) {
    duckdb::DuckDB db(nullptr);
    duckdb::Connection con(db);
    auto meta = con.Query("SELECT decode(key), decode(value) FROM parquet_kv_metadata(" + sqlQuote(path.string()) + ")");
    if (!meta || meta->HasError()) {
        throw std::runtime_error("footer query failed");
    }
    std::string kv{"{"};
    for (duckdb::idx_t row = 0; row < meta->RowCount(); ++row) {
        if (kv.size() > 1) {
            kv += ", ";
        }
        kv += meta->GetValue(0, row).ToString() + ": " + sqlQuote(meta->GetValue(1, row).ToString());
    }
    kv += "}";

    const auto copy = path.string() + ".tampered";
    auto rewrite = con.Query("COPY (SELECT * REPLACE (volume * 2 AS volume) FROM read_parquet(" +
                             sqlQuote(path.string()) + ")) TO " + sqlQuote(copy) + " (FORMAT PARQUET, KV_METADATA " +
                             kv + ")");
    if (!rewrite || rewrite->HasError()) {
        throw std::runtime_error("rewrite failed: " + (rewrite ? rewrite->GetError() : std::string{}));
    }
    std::filesystem::rename(copy, path);
}

}  // namespace

int main() {
    run("full day saves and loads back unchanged", [] {
        StoreFixture fixture;
        auto store = fixture.store();
        const auto bars = fullDay();
        const auto info = store.save(bars, "btcusdt", kH1, kDate, fixture.clock->nowMs());
        EXPECT_EQ(info.rowCount, 24U);
        EXPECT_TRUE(info.complete);
        EXPECT_EQ(info.contentSha256, DuckCacheStore::contentDigest(bars));

        const auto expectedPath =
            fixture.dir.path() / "binance" / "spot" / "klines" / "daily" / "BTCUSDT" / "1h" / "20240301.parquet";
        EXPECT_TRUE(store.pathFor("BTCUSDT", kH1, kDate) == expectedPath);
        EXPECT_TRUE(std::filesystem::is_regular_file(expectedPath));

        const auto entry = store.load("BTCUSDT", kH1, kDate);
        EXPECT_TRUE(entry.has_value());
        EXPECT_EQ(entry->bars.size(), 24U);
        EXPECT_EQ(entry->bars.front().openTime, kDay);
        EXPECT_EQ(entry->bars.back().openTime, kDay + 23 * kHour);
        EXPECT_EQ(DuckCacheStore::contentDigest(entry->bars), info.contentSha256);
        EXPECT_EQ(entry->info.boundaryRules, fixture.validator->rules().signature());
        EXPECT_EQ(entry->info.asOfMs, fixture.clock->nowMs());

        const auto result = store.validate("BTCUSDT", kH1, kDate);
        EXPECT_TRUE(result.ok());
        EXPECT_EQ(std::string{domain::cache::validation_status_label(result.status)}, std::string{"VALID"});

        const auto dates = store.listDates("BTCUSDT", kH1);
        EXPECT_EQ(dates.size(), 1U);
        EXPECT_TRUE(dates.front() == kDate);
    });

    run("missing partitions", [] {
        StoreFixture fixture;
        auto store = fixture.store();
        EXPECT_TRUE(!store.load("BTCUSDT", kH1, kDate).has_value());
        EXPECT_TRUE(store.validate("BTCUSDT", kH1, kDate).status == ValidationResult::Status::Missing);
        EXPECT_TRUE(store.listDates("BTCUSDT", kH1).empty());
        EXPECT_TRUE(!store.remove("BTCUSDT", kH1, kDate));
    });

    run("bad partitions are refused on write", [] {
        StoreFixture fixture;
        auto store = fixture.store();
        const auto asOf = fixture.clock->nowMs();

        EXPECT_TRUE(saveFailure(store, {}, asOf) == ErrorKind::SchemaInvalid);

        auto gapped = fullDay();
        gapped.erase(gapped.begin() + 10);
        EXPECT_TRUE(saveFailure(store, gapped, asOf) == ErrorKind::BoundaryMismatch);

        auto truncated = fullDay();
        truncated.pop_back();
        EXPECT_TRUE(saveFailure(store, truncated, asOf) == ErrorKind::BoundaryMismatch);

        const auto nextDay = testsupport::makeBars(kDay + domain::kMillisPerDay, kDay + 2 * domain::kMillisPerDay, kH1);
        EXPECT_TRUE(saveFailure(store, nextDay, asOf) == ErrorKind::BoundaryMismatch);

        auto unordered = fullDay();
        std::swap(unordered[3], unordered[4]);
        EXPECT_TRUE(saveFailure(store, unordered, asOf) == ErrorKind::SchemaInvalid);

        EXPECT_TRUE(!store.load("BTCUSDT", kH1, kDate).has_value());
        EXPECT_THROWS(store.save(fullDay(), "BTC/USDT", kH1, kDate, asOf), std::invalid_argument);
        EXPECT_THROWS(store.save(fullDay(), "BTCUSDT", Interval{7 * kHour}, kDate, asOf), std::invalid_argument);
    });

    run("open day holds only closed bars", [] {
        StoreFixture fixture;
        auto store = fixture.store();
        const auto asOf = kDay + 5 * kHour + 30 * 60'000;
        const auto closed = testsupport::makeBars(kDay, kDay + 5 * kHour, kH1);
        const auto info = store.save(closed, "BTCUSDT", kH1, kDate, asOf);
        EXPECT_TRUE(!info.complete);
        EXPECT_EQ(info.expectedCount, 5U);

        const auto entry = store.load("BTCUSDT", kH1, kDate);
        EXPECT_TRUE(entry.has_value());
        EXPECT_TRUE(!entry->info.complete);
        EXPECT_EQ(entry->bars.size(), 5U);

        // A bar that had not closed yet is not accepted.
        const auto withOpenBar = testsupport::makeBars(kDay, kDay + 6 * kHour, kH1);
        EXPECT_TRUE(saveFailure(store, withOpenBar, asOf) == ErrorKind::BoundaryMismatch);
    });

    run("column projection", [] {
        StoreFixture fixture;
        auto store = fixture.store();
        store.save(fullDay(), "BTCUSDT", kH1, kDate);

        const std::vector<std::string> columns{"close", "volume"};
        const auto entry = store.load("BTCUSDT", kH1, kDate, &columns);
        EXPECT_TRUE(entry.has_value());
        EXPECT_EQ(entry->bars.size(), 24U);
        EXPECT_TRUE(entry->bars[3].close == fullDay()[3].close);
        EXPECT_TRUE(entry->bars[3].volume == 10.0);
        EXPECT_TRUE(entry->bars[3].open == 0.0);
        EXPECT_EQ(entry->bars[3].trades, 0);
        EXPECT_EQ(entry->bars[3].openTime, kDay + 3 * kHour);

        const std::vector<std::string> bogus{"close", "vwap"};
        EXPECT_THROWS(store.load("BTCUSDT", kH1, kDate, &bogus), std::invalid_argument);
    });

    run("truncated file is an integrity failure", [] {
        StoreFixture fixture;
        auto store = fixture.store();
        store.save(fullDay(), "BTCUSDT", kH1, kDate);
        const auto path = store.pathFor("BTCUSDT", kH1, kDate);
        const auto size = std::filesystem::file_size(path);
        std::filesystem::resize_file(path, size / 2);

        EXPECT_TRUE(loadFailure(store) == ErrorKind::IntegrityCheckFailed);
        const auto result = store.validate("BTCUSDT", kH1, kDate);
        EXPECT_TRUE(result.status == ValidationResult::Status::Invalid);
        EXPECT_TRUE(result.error == ErrorKind::IntegrityCheckFailed);
    });

    run("modified rows fail the content hash", [] {
        StoreFixture fixture;
        auto store = fixture.store();
        store.save(fullDay(), "BTCUSDT", kH1, kDate);
        tamperVolumes(store.pathFor("BTCUSDT", kH1, kDate));
        EXPECT_TRUE(loadFailure(store) == ErrorKind::IntegrityCheckFailed);
    });

    run("day partitions survive a change of edge rules", [] {
        StoreFixture fixture;
        auto store = fixture.store();
        store.save(fullDay(), "BTCUSDT", kH1, kDate);

        core::boundary::BoundaryRules shifted;
        shifted.start.onGridInclusive = false;
        fixture.validator->setRules(shifted);
        // Half-open day requests still resolve to the same 24 bars.
        EXPECT_TRUE(store.validate("BTCUSDT", kH1, kDate).ok());
    });

    run("remove deletes the partition", [] {
        StoreFixture fixture;
        auto store = fixture.store();
        store.save(fullDay(), "BTCUSDT", kH1, kDate);
        EXPECT_TRUE(store.remove("BTCUSDT", kH1, kDate));
        EXPECT_TRUE(!store.load("BTCUSDT", kH1, kDate).has_value());
    });

    run("store without a validator still rejects gaps", [] {
        StoreFixture fixture;
        auto store = fixture.store(false);
        auto gapped = fullDay();
        gapped.erase(gapped.begin() + 1);
        EXPECT_TRUE(saveFailure(store, gapped, fixture.clock->nowMs()) == ErrorKind::BoundaryMismatch);
        store.save(fullDay(), "BTCUSDT", kH1, kDate);
        EXPECT_TRUE(store.validate("BTCUSDT", kH1, kDate).ok());
        EXPECT_TRUE(store.validate("BTCUSDT", kH1, kDate).info->boundaryRules.empty());
    });

    run("concurrent writers leave one whole file", [] {
        StoreFixture fixture;
        auto store = fixture.store();
        const auto bars = fullDay();
        std::vector<std::thread> writers;
        for (int i = 0; i < 4; ++i) {
            writers.emplace_back([&store, &bars] { store.save(bars, "BTCUSDT", kH1, kDate); });
        }
        for (auto& writer : writers) {
            writer.join();
        }
        EXPECT_TRUE(store.validate("BTCUSDT", kH1, kDate).ok());
        std::size_t leftovers = 0;
        for (const auto& file : std::filesystem::directory_iterator(store.pathFor("BTCUSDT", kH1, kDate).parent_path())) {
            if (file.path().extension() != ".parquet") {
                ++leftovers;
            }
        }
        EXPECT_EQ(leftovers, 0U);
        EXPECT_EQ(store.lockedKeyCount(), 0U);
    });

    run("partition locks are released once writers finish", [] {
        StoreFixture fixture;
        auto store = fixture.store();
        for (int i = 0; i < 40; ++i) {
            const auto date = core::addDays(kDate, -i);
            const auto start = core::dayStartMs(date);
            store.save(testsupport::makeBars(start, start + domain::kMillisPerDay, kH1), "ETHUSDT", kH1, date);
        }
        EXPECT_EQ(store.listDates("ETHUSDT", kH1).size(), 40U);
        EXPECT_EQ(store.lockedKeyCount(), 0U);

        for (int i = 0; i < 40; i += 2) {
            EXPECT_TRUE(store.remove("ETHUSDT", kH1, core::addDays(kDate, -i)));
        }
        EXPECT_TRUE(!store.remove("ETHUSDT", kH1, core::addDays(kDate, -100)));
        EXPECT_EQ(store.listDates("ETHUSDT", kH1).size(), 20U);
        EXPECT_EQ(store.lockedKeyCount(), 0U);
    });

    return testsupport::finish("test_cache_store");
}
