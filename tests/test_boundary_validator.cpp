#include <optional>

#include "core/TimeUtils.h"
#include "core/boundary/BoundaryValidator.hpp"
#include "support/Fakes.hpp"

using core::boundary::BoundaryRules;
using core::boundary::BoundaryValidator;
using core::boundary::OffGridRounding;
using domain::Interval;
using domain::TimestampMs;
using testsupport::run;

namespace {

constexpr TimestampMs kHour = 3'600'000;
constexpr TimestampMs kMinute = 60'000;
// 2024-03-01T00:00:00Z
constexpr TimestampMs kDay = 1'709'251'200'000;

const Interval kH1{kHour};
const Interval kM1{kMinute};

// Source that answers like a backend following the given rules.
class RuleFollowingSource final : public domain::IKlineSource {
public:
    explicit RuleFollowingSource(BoundaryRules rules) : validator_(rules) {}

    const std::string& id() const noexcept override { return id_; }
    domain::BarSequence fetchKlines(const std::string&,
                                    Interval interval,
                                    TimestampMs startTime,
                                    TimestampMs endTime,
                                    const core::Deadline&) override {
        const auto expected = validator_.resolveBoundaries(startTime, endTime, interval);
        if (expected.empty()) {
            return {};
        }
        return testsupport::makeBars(expected.firstOpen, expected.lastOpen + 1, interval);
    }

private:
    std::string id_{"rules"};
    BoundaryValidator validator_;
};

}  // namespace

int main() {
    run("default rules include both on-grid edges", [] {
        BoundaryValidator validator;
        const auto resolved = validator.resolveBoundaries(kDay, kDay + 23 * kHour, kH1);
        EXPECT_EQ(resolved.firstOpen, kDay);
        EXPECT_EQ(resolved.lastOpen, kDay + 23 * kHour);
        EXPECT_EQ(resolved.expectedCount, 24U);
        EXPECT_EQ(resolved.effectiveStart, kDay);
        EXPECT_EQ(resolved.effectiveEnd, kDay + 23 * kHour);
    });

    run("off-grid edges snap inward under default rules", [] {
        BoundaryValidator validator;
        const auto resolved = validator.resolveBoundaries(kDay + 1, kDay + 3 * kHour - 1, kH1);
        EXPECT_EQ(resolved.firstOpen, kDay + kHour);
        EXPECT_EQ(resolved.lastOpen, kDay + 2 * kHour);
        EXPECT_EQ(resolved.expectedCount, 2U);
    });

    run("exclusive end drops the bar opening on it", [] {
        BoundaryRules rules;
        rules.end.onGridInclusive = false;
        BoundaryValidator validator(rules);
        const auto resolved = validator.resolveBoundaries(kDay, kDay + 24 * kHour, kH1);
        EXPECT_EQ(resolved.lastOpen, kDay + 23 * kHour);
        EXPECT_EQ(resolved.expectedCount, 24U);
        // The canonical form resolves to the same bars again.
        const auto again = validator.resolveBoundaries(resolved.effectiveStart, resolved.effectiveEnd, kH1);
        EXPECT_EQ(again.firstOpen, resolved.firstOpen);
        EXPECT_EQ(again.lastOpen, resolved.lastOpen);
    });

    run("the canonical form is a fixed point under every rule set", [] {
        const OffGridRounding roundings[] = {OffGridRounding::Up, OffGridRounding::Down};
        std::size_t checked = 0;
        for (const bool startInclusive : {true, false}) {
            for (const auto startRounding : roundings) {
                for (const bool endInclusive : {true, false}) {
                    for (const auto endRounding : roundings) {
                        BoundaryRules rules;
                        rules.start = {startInclusive, startRounding};
                        rules.end = {endInclusive, endRounding};
                        const BoundaryValidator validator(rules);

                        for (const auto interval : {kM1, kH1}) {
                            const auto step = interval.ms;
                            const TimestampMs offsets[] = {-step - 1, -step, -1, 0, 1, step / 2, step - 1, step, step + 1};
                            for (const auto startOffset : offsets) {
                                for (const auto endOffset : offsets) {
                                    const auto start = kDay + startOffset;
                                    const auto end = kDay + 3 * step + endOffset;
                                    if (!validator.isValidRange(start, end, interval)) {
                                        continue;
                                    }
                                    const auto once = validator.resolveBoundaries(start, end, interval);
                                    const auto twice =
                                        validator.resolveBoundaries(once.effectiveStart, once.effectiveEnd, interval);
                                    EXPECT_EQ(twice.firstOpen, once.firstOpen);
                                    EXPECT_EQ(twice.lastOpen, once.lastOpen);
                                    EXPECT_EQ(twice.expectedCount, once.expectedCount);
                                    EXPECT_EQ(twice.effectiveStart, once.effectiveStart);
                                    EXPECT_EQ(twice.effectiveEnd, once.effectiveEnd);
                                    ++checked;
                                }
                            }
                        }
                    }
                }
            }
        }
        EXPECT_TRUE(checked > 16U * 2U * 40U);
    });

    run("empty range resolves to zero bars", [] {
        BoundaryValidator validator;
        const auto resolved = validator.resolveBoundaries(kDay + 1, kDay + kHour - 1, kH1);
        EXPECT_TRUE(resolved.empty());
        EXPECT_TRUE(!validator.isValidRange(kDay + 1, kDay + kHour - 1, kH1));
        EXPECT_TRUE(!validator.isValidRange(kDay + kHour, kDay, kH1));
        EXPECT_TRUE(validator.isValidRange(kDay, kDay + kHour, kH1));
    });

    run("matchesExpectedRange is strict about gaps and edges", [] {
        BoundaryValidator validator;
        auto bars = testsupport::makeBars(kDay, kDay + 24 * kHour, kH1);
        EXPECT_TRUE(validator.matchesExpectedRange(bars, kDay, kDay + 23 * kHour, kH1));

        auto gapped = bars;
        gapped.erase(gapped.begin() + 5);
        EXPECT_TRUE(!validator.matchesExpectedRange(gapped, kDay, kDay + 23 * kHour, kH1));

        auto shortTail = bars;
        shortTail.pop_back();
        EXPECT_TRUE(!validator.matchesExpectedRange(shortTail, kDay, kDay + 23 * kHour, kH1));

        EXPECT_TRUE(validator.matchesExpectedRange({}, kDay + 1, kDay + 2, kH1));
    });

    run("clip keeps only bars the request selects", [] {
        BoundaryValidator validator;
        const auto bars = testsupport::makeBars(kDay, kDay + 24 * kHour, kH1);
        const auto clipped = validator.clip(bars, kDay + 2 * kHour, kDay + 4 * kHour + 5, kH1);
        EXPECT_EQ(clipped.size(), 3U);
        EXPECT_EQ(clipped.front().openTime, kDay + 2 * kHour);
        EXPECT_EQ(clipped.back().openTime, kDay + 4 * kHour);
    });

    run("requestFormFor treats the window as half-open", [] {
        BoundaryValidator validator;
        const auto form = validator.requestFormFor(domain::TimeWindow{kDay, kDay + domain::kMillisPerDay}, kH1);
        EXPECT_TRUE(form.has_value());
        EXPECT_EQ(form->firstOpen, kDay);
        EXPECT_EQ(form->lastOpen, kDay + 23 * kHour);
        EXPECT_EQ(form->expectedCount, 24U);

        const auto offGrid = validator.requestFormFor(domain::TimeWindow{kDay + 1, kDay + 2 * kHour + 1}, kH1);
        EXPECT_TRUE(offGrid.has_value());
        EXPECT_EQ(offGrid->firstOpen, kDay + kHour);
        EXPECT_EQ(offGrid->lastOpen, kDay + 2 * kHour);

        EXPECT_TRUE(!validator.requestFormFor(domain::TimeWindow{kDay + 1, kDay + kHour}, kH1).has_value());
        EXPECT_THROWS(validator.requestFormFor(domain::TimeWindow{kDay, kDay}, kH1), std::invalid_argument);
    });

    run("partitionBoundaries covers closed bars of the day only", [] {
        BoundaryValidator validator;
        const auto date = core::dateOf(kDay);

        const auto past = validator.partitionBoundaries(date, kH1, kDay + 3 * domain::kMillisPerDay);
        EXPECT_TRUE(past.has_value());
        EXPECT_EQ(past->expectedCount, 24U);

        const auto open = validator.partitionBoundaries(date, kH1, kDay + 5 * kHour + 30 * kMinute);
        EXPECT_TRUE(open.has_value());
        EXPECT_EQ(open->lastOpen, kDay + 4 * kHour);
        EXPECT_EQ(open->expectedCount, 5U);

        EXPECT_TRUE(!validator.partitionBoundaries(date, kH1, kDay + 10 * kMinute).has_value());
        EXPECT_TRUE(!validator.partitionBoundaries(date, kH1, kDay - kHour).has_value());
    });

    run("checkStructure reports the first problem", [] {
        auto bars = testsupport::makeBars(kDay, kDay + 4 * kHour, kH1);
        EXPECT_TRUE(!BoundaryValidator::checkStructure(bars, kH1).has_value());
        EXPECT_TRUE(BoundaryValidator::checkStructure({}, kH1).has_value());

        auto offGrid = bars;
        offGrid[1].openTime += 1;
        EXPECT_TRUE(BoundaryValidator::checkStructure(offGrid, kH1).has_value());

        auto unordered = bars;
        std::swap(unordered[1], unordered[2]);
        EXPECT_TRUE(BoundaryValidator::checkStructure(unordered, kH1).has_value());

        auto badOhlc = bars;
        badOhlc[2].low = badOhlc[2].high + 1.0;
        EXPECT_TRUE(BoundaryValidator::checkStructure(badOhlc, kH1).has_value());

        auto negative = bars;
        negative[3].volume = -1.0;
        EXPECT_TRUE(BoundaryValidator::checkStructure(negative, kH1).has_value());
    });

    run("calibrate learns exclusive start and rounding down", [] {
        BoundaryRules actual;
        actual.start.onGridInclusive = false;
        actual.end.offGrid = OffGridRounding::Up;
        RuleFollowingSource source(actual);
        testsupport::ManualClock clock(kDay + 10 * kMinute + 17);

        BoundaryValidator validator;
        EXPECT_TRUE(validator.calibrate(source, "BTCUSDT", kM1, clock, core::Deadline::unbounded()));
        EXPECT_TRUE(validator.rules() == actual);
        EXPECT_EQ(validator.rules().signature(), std::string{"start=excl/up;end=incl/up"});
    });

    run("calibrate keeps rules when the probe fails", [] {
        testsupport::ScriptedKlineSource source("down");
        source.failAlways(kvault::common::ErrorKind::ConnectionFailed);
        testsupport::ManualClock clock(kDay);
        BoundaryRules custom;
        custom.end.onGridInclusive = false;
        BoundaryValidator validator(custom);
        EXPECT_TRUE(!validator.calibrate(source, "BTCUSDT", kM1, clock, core::Deadline::unbounded()));
        EXPECT_TRUE(validator.rules() == custom);
    });

    return testsupport::finish("test_boundary_validator");
}
