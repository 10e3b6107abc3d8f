#include "core/app/FetchDecision.hpp"
#include "support/Fakes.hpp"

using core::app::BackendRole;
using core::app::DecisionInputs;
using core::app::FetchPolicy;
using core::app::decideFetch;
using domain::FetchDecision;
using domain::SourceOverride;
using domain::TimestampMs;
using testsupport::run;

namespace {

constexpr TimestampMs kMinute = 60'000;
constexpr TimestampMs kDayMs = domain::kMillisPerDay;
// 2024-03-01T00:00:00Z
constexpr TimestampMs kDay = 1'709'251'200'000;

DecisionInputs pastDay(TimestampMs daysAgo) {
    DecisionInputs in;
    in.partitionEndMs = kDay + kDayMs;
    in.nowMs = in.partitionEndMs + daysAgo * kDayMs;
    return in;
}

DecisionInputs withCache(DecisionInputs in, TimestampMs ageMs, bool complete = true) {
    in.cache.present = true;
    in.cache.valid = true;
    in.cache.complete = complete;
    in.cache.writtenAtMs = in.nowMs - ageMs;
    return in;
}

}  // namespace

int main() {
    const FetchPolicy policy;

    run("fresh entry is served from cache", [&policy] {
        const auto decision = decideFetch(withCache(pastDay(5), kDayMs), policy);
        EXPECT_TRUE(decision.decision == FetchDecision::UseCache);
        EXPECT_TRUE(!decision.primary.has_value());
    });

    run("missing entry of an old day goes to the archive first", [&policy] {
        const auto decision = decideFetch(pastDay(5), policy);
        EXPECT_TRUE(decision.decision == FetchDecision::FetchFresh);
        EXPECT_TRUE(decision.primary == BackendRole::Archive);
        EXPECT_TRUE(decision.alternate == BackendRole::Incremental);
        EXPECT_TRUE(!decision.staleFallbackAllowed);
    });

    run("recent day goes to the incremental backend first", [&policy] {
        auto in = pastDay(0);
        in.nowMs = in.partitionEndMs + 47 * 60 * kMinute;
        const auto decision = decideFetch(in, policy);
        EXPECT_TRUE(decision.primary == BackendRole::Incremental);
        EXPECT_TRUE(decision.alternate == BackendRole::Archive);

        in.nowMs = in.partitionEndMs + 48 * 60 * kMinute;
        EXPECT_TRUE(decideFetch(in, policy).primary == BackendRole::Archive);
    });

    run("aged entry is stale and may be served on failure", [&policy] {
        const auto decision = decideFetch(withCache(pastDay(40), 31 * kDayMs), policy);
        EXPECT_TRUE(decision.decision == FetchDecision::CacheStale);
        EXPECT_TRUE(decision.staleFallbackAllowed);
        EXPECT_TRUE(decision.primary == BackendRole::Archive);

        const auto ancient = decideFetch(withCache(pastDay(200), 100 * kDayMs), policy);
        EXPECT_TRUE(ancient.decision == FetchDecision::CacheStale);
        EXPECT_TRUE(!ancient.staleFallbackAllowed);
    });

    run("open partitions age out after minutes", [&policy] {
        auto in = pastDay(0);
        in.nowMs = in.partitionEndMs - 3 * 60 * kMinute;
        EXPECT_TRUE(decideFetch(withCache(in, 4 * kMinute, false), policy).decision == FetchDecision::UseCache);
        EXPECT_TRUE(decideFetch(withCache(in, 6 * kMinute, false), policy).decision == FetchDecision::CacheStale);
    });

    run("invalid entry is refetched", [&policy] {
        auto in = withCache(pastDay(5), kDayMs);
        in.cache.valid = false;
        const auto decision = decideFetch(in, policy);
        EXPECT_TRUE(decision.decision == FetchDecision::FetchFresh);
        EXPECT_TRUE(!decision.staleFallbackAllowed);
    });

    run("open circuit on the preferred backend turns into failover", [&policy] {
        auto in = pastDay(5);
        in.archiveAvailable = false;
        const auto decision = decideFetch(in, policy);
        EXPECT_TRUE(decision.decision == FetchDecision::Failover);
        EXPECT_TRUE(decision.primary == BackendRole::Incremental);
        EXPECT_TRUE(decision.alternate == BackendRole::Archive);

        auto stale = withCache(pastDay(40), 31 * kDayMs);
        stale.archiveAvailable = false;
        const auto staleDecision = decideFetch(stale, policy);
        EXPECT_TRUE(staleDecision.decision == FetchDecision::CacheStale);
        EXPECT_TRUE(staleDecision.primary == BackendRole::Incremental);
    });

    run("both circuits open keeps the preferred order", [&policy] {
        auto in = pastDay(5);
        in.archiveAvailable = false;
        in.incrementalAvailable = false;
        const auto decision = decideFetch(in, policy);
        EXPECT_TRUE(decision.decision == FetchDecision::FetchFresh);
        EXPECT_TRUE(decision.primary == BackendRole::Archive);
    });

    run("overrides", [&policy] {
        auto refresh = withCache(pastDay(5), kMinute);
        refresh.sourceOverride = SourceOverride::Refresh;
        const auto refreshed = decideFetch(refresh, policy);
        EXPECT_TRUE(refreshed.decision == FetchDecision::CacheStale);
        EXPECT_TRUE(refreshed.primary.has_value());

        auto cacheOnly = pastDay(5);
        cacheOnly.sourceOverride = SourceOverride::CacheOnly;
        const auto cached = decideFetch(cacheOnly, policy);
        EXPECT_TRUE(cached.decision == FetchDecision::UseCache);
        EXPECT_TRUE(!cached.primary.has_value());

        auto rest = pastDay(5);
        rest.sourceOverride = SourceOverride::Incremental;
        rest.incrementalAvailable = false;
        const auto forced = decideFetch(rest, policy);
        EXPECT_TRUE(forced.primary == BackendRole::Incremental);
        EXPECT_TRUE(!forced.alternate.has_value());
    });

    run("unregistered backends are skipped", [&policy] {
        auto in = pastDay(5);
        in.archiveRegistered = false;
        const auto decision = decideFetch(in, policy);
        EXPECT_TRUE(decision.primary == BackendRole::Incremental);
        EXPECT_TRUE(!decision.alternate.has_value());

        in.incrementalRegistered = false;
        EXPECT_TRUE(!decideFetch(in, policy).primary.has_value());
    });

    run("policy validation", [] {
        FetchPolicy bad;
        bad.maxStaleness = std::chrono::milliseconds{1};
        EXPECT_THROWS(bad.validate(), std::invalid_argument);
        FetchPolicy zero;
        zero.openPartitionFreshness = std::chrono::milliseconds{0};
        EXPECT_THROWS(zero.validate(), std::invalid_argument);
        FetchPolicy{}.validate();
    });

    return testsupport::finish("test_fetch_decision");
}
