#include <gtest/gtest.h>
#include "test_helpers.hpp"

using namespace calgrid;
using namespace calgrid_test;

class IntervalGeneratorTest : public ::testing::Test {
protected:
    static GeneratorConfig daily() { return GeneratorConfig::defaults(); }

    static GeneratorConfig weekly() {
        return GeneratorConfig::defaults().with_grouping(Grouping::per_week);
    }

    static GeneratorConfig monthly() {
        return GeneratorConfig::defaults().with_grouping(Grouping::per_month);
    }

    static IntervalList generate(const GeneratorConfig& config, const Instant& begin,
                                 const Instant& end) {
        auto result = get_intervals(config, begin, end);
        EXPECT_TRUE(result.has_value()) << result.error().message();
        return result.value_or(IntervalList{});
    }
};

// ==============================================================================
// Reference ranges
// ==============================================================================

TEST_F(IntervalGeneratorTest, DailyExtended) {
    auto intervals =
        generate(daily(), utc(2022, 6, 25, 8, 23, 45), utc(2022, 6, 27, 9, 31, 12));

    IntervalList expected{
        interval(utc(2022, 6, 25), utc_ms999(2022, 6, 25, 23, 59, 59)),
        interval(utc(2022, 6, 26), utc_ms999(2022, 6, 26, 23, 59, 59)),
        interval(utc(2022, 6, 27), utc_ms999(2022, 6, 27, 23, 59, 59)),
    };
    EXPECT_EQ(intervals, expected);
}

TEST_F(IntervalGeneratorTest, MonthlyWestOfUtc) {
    auto begin = local(2022, 6, 10, 12, 23, 45, -7 * HOUR);
    auto end = local(2022, 8, 26, 12, 23, 45, -7 * HOUR);
    auto intervals = generate(monthly().with_offset_west_secs(7 * HOUR), begin, end);

    IntervalList expected{
        interval(utc(2022, 6, 1, 7), utc_ms999(2022, 7, 1, 6, 59, 59)),
        interval(utc(2022, 7, 1, 7), utc_ms999(2022, 8, 1, 6, 59, 59)),
        interval(utc(2022, 8, 1, 7), utc_ms999(2022, 9, 1, 6, 59, 59)),
    };
    EXPECT_EQ(intervals, expected);
}

TEST_F(IntervalGeneratorTest, WeeklyEastOfUtcWithoutExtension) {
    auto config = weekly()
                      .with_precision(Duration::from_microseconds(1))
                      .with_offset_west_secs(-HOUR)
                      .without_extension();
    auto begin = utc(2022, 10, 2, 8, 23, 45);
    auto end = utc(2022, 10, 18, 8, 23, 45);
    auto intervals = generate(config, begin, end);

    IntervalList expected{
        interval(utc(2022, 10, 2, 23), utc(2022, 10, 9, 22, 59, 59, 999'999 * PICOS_PER_US)),
        interval(utc(2022, 10, 9, 23), utc(2022, 10, 16, 22, 59, 59, 999'999 * PICOS_PER_US)),
    };
    EXPECT_EQ(intervals, expected);
    EXPECT_GT(intervals.front().start, begin);
    EXPECT_LT(intervals.back().end, end);
}

TEST_F(IntervalGeneratorTest, ShorterThanOneUnitWithoutExtensionIsEmpty) {
    auto intervals = generate(daily().without_extension(), utc(2022, 6, 25, 8),
                              utc(2022, 6, 25, 20));
    EXPECT_TRUE(intervals.empty());
}

TEST_F(IntervalGeneratorTest, ShorterThanOneUnitExtendedIsOneInterval) {
    auto intervals = generate(daily(), utc(2022, 6, 25, 8), utc(2022, 6, 25, 20));
    ASSERT_EQ(intervals.size(), 1u);
    EXPECT_EQ(intervals[0], interval(utc(2022, 6, 25), utc_ms999(2022, 6, 25, 23, 59, 59)));
}

// ==============================================================================
// Range validation
// ==============================================================================

TEST_F(IntervalGeneratorTest, EndBeforeBeginIsInvalidRange) {
    auto result = get_intervals(daily(), utc(2022, 6, 27), utc(2022, 6, 25));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, TimeErrorCode::invalid_range);
}

TEST_F(IntervalGeneratorTest, EmptyRangeYieldsNoIntervals) {
    auto t = utc(2022, 6, 25, 8, 23, 45);
    EXPECT_TRUE(generate(daily(), t, t).empty());
    EXPECT_TRUE(generate(daily().without_extension(), t, t).empty());
}

TEST_F(IntervalGeneratorTest, EqualInstantsInDifferentOffsetsAreEmptyRange) {
    auto begin = local(2022, 9, 25, 1, 23, 45, 2 * HOUR);
    auto end = utc(2022, 9, 24, 23, 23, 45);
    EXPECT_TRUE(generate(daily(), begin, end).empty());
}

// ==============================================================================
// Extension modes
// ==============================================================================

TEST_F(IntervalGeneratorTest, ExtensionMatrix) {
    auto begin = utc(2022, 10, 29, 8, 23, 45);
    auto end = utc(2022, 11, 1, 8, 23, 45);

    auto neither = generate(daily().without_extension(), begin, end);
    ASSERT_EQ(neither.size(), 2u);
    EXPECT_EQ(neither.front().start, utc(2022, 10, 30));
    EXPECT_EQ(neither.back().end, utc_ms999(2022, 10, 31, 23, 59, 59));

    auto begin_only = generate(daily().without_extended_end(), begin, end);
    ASSERT_EQ(begin_only.size(), 3u);
    EXPECT_EQ(begin_only.front().start, utc(2022, 10, 29));
    EXPECT_EQ(begin_only.back().end, utc_ms999(2022, 10, 31, 23, 59, 59));

    auto end_only = generate(daily().without_extended_begin(), begin, end);
    ASSERT_EQ(end_only.size(), 3u);
    EXPECT_EQ(end_only.front().start, utc(2022, 10, 30));
    EXPECT_EQ(end_only.back().end, utc_ms999(2022, 11, 1, 23, 59, 59));

    auto both = generate(daily(), begin, end);
    ASSERT_EQ(both.size(), 4u);
    EXPECT_EQ(both.front().start, utc(2022, 10, 29));
    EXPECT_EQ(both.back().end, utc_ms999(2022, 11, 1, 23, 59, 59));
}

TEST_F(IntervalGeneratorTest, BeginOnBoundaryIsKeptWithoutExtension) {
    auto begin = utc(2022, 10, 30);
    auto end = utc(2022, 11, 2);

    auto intervals = generate(daily().without_extension(), begin, end);
    ASSERT_EQ(intervals.size(), 3u);
    EXPECT_EQ(intervals.front().start, begin);
    EXPECT_EQ(intervals.back().end, utc_ms999(2022, 11, 1, 23, 59, 59));
}

TEST_F(IntervalGeneratorTest, EndOnBoundaryWithExtendedEndAddsEnclosingUnit) {
    auto begin = utc(2022, 10, 30);
    auto end = utc(2022, 11, 2);

    auto intervals = generate(daily().without_extended_begin(), begin, end);
    ASSERT_EQ(intervals.size(), 4u);
    EXPECT_EQ(intervals.back().start, end);
    EXPECT_EQ(intervals.back().end, utc_ms999(2022, 11, 2, 23, 59, 59));
}

// ==============================================================================
// Precision
// ==============================================================================

TEST_F(IntervalGeneratorTest, PrecisionSetsIntervalEnd) {
    auto begin = utc(2022, 10, 29, 8, 23, 45);
    auto end = utc(2022, 11, 1, 8, 23, 45);

    struct Case {
        Duration precision;
        uint64_t end_picos;
    };
    const Case cases[] = {
        {Duration::from_milliseconds(1), 999 * PICOS_PER_MS},
        {Duration::from_microseconds(1), 999'999 * PICOS_PER_US},
        {Duration::from_nanoseconds(1), 999'999'999 * PICOS_PER_NS},
        {Duration::from_picoseconds(1), Instant::MAX_FRACTIONAL},
    };

    for (const auto& c : cases) {
        auto intervals = generate(daily().with_precision(c.precision).without_extension(),
                                  begin, end);
        ASSERT_EQ(intervals.size(), 2u);
        for (const auto& iv : intervals) {
            EXPECT_EQ(iv.end.picoseconds(), c.end_picos);
            EXPECT_EQ(iv.end.utc_seconds() % 86'400, 86'399);
        }
    }
}

TEST_F(IntervalGeneratorTest, PrecisionDoesNotAccumulate) {
    auto config = daily().with_precision(Duration::from_milliseconds(250));
    auto intervals = generate(config, utc(2022, 1, 1, 12), utc(2022, 12, 31, 12));
    ASSERT_EQ(intervals.size(), 365u);
    for (const auto& iv : intervals) {
        EXPECT_EQ(iv.start.utc_seconds() % 86'400, 0);
        EXPECT_EQ(iv.start.picoseconds(), 0u);
        EXPECT_EQ(iv.end.picoseconds(), 750 * PICOS_PER_MS);
    }
}

// ==============================================================================
// Calendar units
// ==============================================================================

TEST_F(IntervalGeneratorTest, HourlyExtended) {
    auto config = daily().with_grouping(Grouping::per_hour);
    auto intervals = generate(config, utc(2022, 6, 25, 8, 23, 45), utc(2022, 6, 25, 10));
    ASSERT_EQ(intervals.size(), 3u);
    EXPECT_EQ(intervals[0].start, utc(2022, 6, 25, 8));
    EXPECT_EQ(intervals[1].start, utc(2022, 6, 25, 9));
    EXPECT_EQ(intervals[2].start, utc(2022, 6, 25, 10));
    EXPECT_EQ(intervals[2].end, utc_ms999(2022, 6, 25, 10, 59, 59));
}

TEST_F(IntervalGeneratorTest, WeeksStartOnMonday) {
    auto intervals = generate(weekly(), utc(2022, 10, 4), utc(2022, 10, 18));
    ASSERT_EQ(intervals.size(), 3u);
    EXPECT_EQ(intervals[0].start, utc(2022, 10, 3));
    EXPECT_EQ(intervals[1].start, utc(2022, 10, 10));
    EXPECT_EQ(intervals[2].start, utc(2022, 10, 17));
    EXPECT_EQ(intervals[2].end, utc_ms999(2022, 10, 23, 23, 59, 59));
}

TEST_F(IntervalGeneratorTest, LeapFebruary) {
    auto intervals = generate(monthly(), utc(2024, 2, 10), utc(2024, 2, 20));
    ASSERT_EQ(intervals.size(), 1u);
    EXPECT_EQ(intervals[0], interval(utc(2024, 2, 1), utc_ms999(2024, 2, 29, 23, 59, 59)));
}

TEST_F(IntervalGeneratorTest, Quarters) {
    auto config = daily().with_grouping(Grouping::per_quarter);
    auto intervals = generate(config, utc(2022, 5, 15), utc(2022, 8, 1));

    IntervalList expected{
        interval(utc(2022, 4, 1), utc_ms999(2022, 6, 30, 23, 59, 59)),
        interval(utc(2022, 7, 1), utc_ms999(2022, 9, 30, 23, 59, 59)),
    };
    EXPECT_EQ(intervals, expected);
}

TEST_F(IntervalGeneratorTest, Years) {
    auto config = daily().with_grouping(Grouping::per_year);
    auto intervals = generate(config, utc(2020, 3, 1), utc(2021, 2, 1));

    IntervalList expected{
        interval(utc(2020, 1, 1), utc_ms999(2020, 12, 31, 23, 59, 59)),
        interval(utc(2021, 1, 1), utc_ms999(2021, 12, 31, 23, 59, 59)),
    };
    EXPECT_EQ(intervals, expected);
}

// ==============================================================================
// Offsets
// ==============================================================================

TEST_F(IntervalGeneratorTest, ResultsAreUtc) {
    auto begin = local(2022, 9, 25, 1, 23, 45, 2 * HOUR);
    auto end = local(2022, 9, 26, 1, 23, 45, 2 * HOUR);
    auto intervals = generate(daily(), begin, end);
    ASSERT_FALSE(intervals.empty());
    for (const auto& iv : intervals) {
        EXPECT_TRUE(iv.start.is_utc());
        EXPECT_TRUE(iv.end.is_utc());
    }
}

TEST_F(IntervalGeneratorTest, LocalDaysEastOfUtc) {
    auto begin = local(2022, 9, 25, 1, 23, 45, 2 * HOUR);
    auto end = local(2022, 9, 26, 1, 23, 45, 2 * HOUR);
    auto intervals = generate(daily().with_offset_west_secs(-2 * HOUR), begin, end);

    IntervalList expected{
        interval(utc(2022, 9, 24, 22), utc_ms999(2022, 9, 25, 21, 59, 59)),
        interval(utc(2022, 9, 25, 22), utc_ms999(2022, 9, 26, 21, 59, 59)),
    };
    EXPECT_EQ(intervals, expected);
}

// ==============================================================================
// Range limits
// ==============================================================================

TEST_F(IntervalGeneratorTest, UnrepresentableBoundaryFails) {
    auto result = get_intervals(daily(), utc(32767, 12, 31, 12), Instant::max());
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, TimeErrorCode::out_of_range);
}

TEST_F(IntervalGeneratorTest, LastYearHasNoRepresentableUpperBoundary) {
    // Deciding whether 32767 fits needs the start of 32768
    auto config = daily().with_grouping(Grouping::per_year).without_extended_end();
    auto result = get_intervals(config, utc(32766, 6, 1), utc(32767, 6, 1));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, TimeErrorCode::out_of_range);
}
