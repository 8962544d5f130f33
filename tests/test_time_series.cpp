#include <gtest/gtest.h>
#include "harness/time_series.hpp"

#include <cmath>
#include <limits>

static constexpr int64_t kSec = 1000000;
static const double kNaN = std::numeric_limits<double>::quiet_NaN();

// ─── TimeSeries ──────────────────────────────────────────────────────────────

TEST(TimeSeries, KeepsSuppliedOrder) {
    TimeSeries s({{"2024-01-03", 3.0}, {"2024-01-01", 1.0}, {"2024-01-02", 2.0}});
    ASSERT_EQ(s.size(), 3u);
    EXPECT_EQ(s.timestamps().front(), "2024-01-03");
    EXPECT_EQ(s.values(), (std::vector<double>{3.0, 1.0, 2.0}));
    EXPECT_EQ(s.at("2024-01-02"), 2.0);
    EXPECT_FALSE(s.at("2024-01-04").has_value());
}

TEST(TimeSeries, MixedOffsetsKeepSuppliedOrder) {
    // 08:00Z then 09:00Z, although the strings sort the other way
    TimeSeries s({{"2024-01-01T10:00:00+02:00", 1.0}, {"2024-01-01T09:00:00Z", 2.0}});
    EXPECT_EQ(s.values(), (std::vector<double>{1.0, 2.0}));
    EXPECT_EQ(s.at("2024-01-01T09:00:00Z"), 2.0);
}

// ─── Timestamp parsing ───────────────────────────────────────────────────────

TEST(ParseTimestamp, DateOnlyIsMidnightUtc) {
    EXPECT_EQ(parse_timestamp("1970-01-01"), 0);
    EXPECT_EQ(parse_timestamp("2000-03-01"), 951868800LL * kSec);
}

TEST(ParseTimestamp, DateTimeVariants) {
    const int64_t base = parse_timestamp("2024-01-02");
    EXPECT_EQ(parse_timestamp("2024-01-02T03:04:05Z"), base + (3 * 3600 + 4 * 60 + 5) * kSec);
    EXPECT_EQ(parse_timestamp("2024-01-02 03:04"), base + (3 * 3600 + 4 * 60) * kSec);
    EXPECT_EQ(parse_timestamp("2024-01-02T00:00:00.25"), base + kSec / 4);
    EXPECT_EQ(parse_timestamp("2024-01-02T00:00:00.1234567"), base + 123456);
}

TEST(ParseTimestamp, OffsetsNormalizeToUtc) {
    EXPECT_EQ(parse_timestamp("2024-01-02T02:00:00+02:00"), parse_timestamp("2024-01-02T00:00:00Z"));
    EXPECT_EQ(parse_timestamp("2024-01-01T19:30:00-0430"), parse_timestamp("2024-01-02T00:00:00Z"));
}

TEST(ParseTimestamp, DayMustExistInMonth) {
    EXPECT_THROW(parse_timestamp("2024-02-31"), std::invalid_argument);
    EXPECT_THROW(parse_timestamp("2023-02-29"), std::invalid_argument);
    EXPECT_THROW(parse_timestamp("2024-04-31T00:00:00Z"), std::invalid_argument);
    EXPECT_THROW(parse_timestamp("1900-02-29"), std::invalid_argument);
    EXPECT_EQ(parse_timestamp("2024-02-29") + 86400 * kSec, parse_timestamp("2024-03-01"));
    EXPECT_NO_THROW(parse_timestamp("2000-02-29"));
}

TEST(ParseTimestamp, Rejects) {
    for (const char* bad : {"", "t1", "2024-1-02", "2024-13-01", "2024-01-02T25:00", "2024-01-02T10:00:00.",
                            "2024-01-02T10:00:00 junk"}) {
        EXPECT_THROW(parse_timestamp(bad), std::invalid_argument) << bad;
    }
}

// ─── Tolerance parsing ───────────────────────────────────────────────────────

TEST(ParseTolerance, Units) {
    EXPECT_EQ(parse_tolerance("500ms"), 500000);
    EXPECT_EQ(parse_tolerance("30s"), 30 * kSec);
    EXPECT_EQ(parse_tolerance("5min"), 300 * kSec);
    EXPECT_EQ(parse_tolerance("2h"), 7200 * kSec);
    EXPECT_EQ(parse_tolerance("1d"), 86400 * kSec);
    EXPECT_EQ(parse_tolerance("1.5"), 1500000);
}

TEST(ParseTolerance, Rejects) {
    EXPECT_THROW(parse_tolerance("soon"), std::invalid_argument);
    EXPECT_THROW(parse_tolerance("5 fortnights"), std::invalid_argument);
    EXPECT_THROW(parse_tolerance("-1s"), std::invalid_argument);
}

// ─── Nearest alignment ───────────────────────────────────────────────────────

TEST(AlignNearest, ExactMatches) {
    TimeSeries a({{"2024-01-01", 1}, {"2024-01-02", 2}, {"2024-01-03", 3}});
    TimeSeries b({{"2024-01-01", 10}, {"2024-01-02", 20}, {"2024-01-03", 30}});
    auto r = align_nearest(a, b);
    EXPECT_EQ(r.time, (std::vector<std::string>{"2024-01-01", "2024-01-02", "2024-01-03"}));
    EXPECT_EQ(r.value2, (std::vector<double>{10, 20, 30}));
}

TEST(AlignNearest, NearestWithinDefaultTolerance) {
    // daily series against one shifted by 2h: median interval is a day
    TimeSeries a({{"2024-01-01T00:00:00Z", 1}, {"2024-01-02T00:00:00Z", 2}});
    TimeSeries b({{"2024-01-01T02:00:00Z", 10}, {"2024-01-02T02:00:00Z", 20}});
    auto r = align_nearest(a, b);
    EXPECT_EQ(r.value1, (std::vector<double>{1, 2}));
    EXPECT_EQ(r.value2, (std::vector<double>{10, 20}));
    EXPECT_EQ(r.time.front(), "2024-01-01T00:00:00Z");
}

TEST(AlignNearest, ExplicitToleranceDropsFarRows) {
    TimeSeries a({{"2024-01-01T00:00:00Z", 1}, {"2024-01-01T00:10:00Z", 2}});
    TimeSeries b({{"2024-01-01T00:00:20Z", 10}, {"2024-01-01T00:05:00Z", 20}});
    auto r = align_nearest(a, b, 30 * kSec);
    ASSERT_EQ(r.time.size(), 1u);
    EXPECT_EQ(r.value2[0], 10);
}

TEST(AlignNearest, TieGoesToEarlierPoint) {
    TimeSeries a({{"2024-01-01T00:01:00Z", 1}});
    TimeSeries b({{"2024-01-01T00:00:00Z", 10}, {"2024-01-01T00:02:00Z", 20}});
    auto r = align_nearest(a, b, 60 * kSec);
    ASSERT_EQ(r.value2.size(), 1u);
    EXPECT_EQ(r.value2[0], 10);
}

TEST(AlignNearest, DuplicateInstantsKeepFirst) {
    // same instant spelled two ways; the first supplied spelling wins
    TimeSeries a({{"2024-01-01T00:00:00Z", 1}});
    TimeSeries b({{"2024-01-01T00:00:00Z", 10}, {"2024-01-01T00:00:00+00:00", 20}});
    auto r = align_nearest(a, b, 0);
    ASSERT_EQ(r.value2.size(), 1u);
    EXPECT_EQ(r.value2[0], 10);
}

TEST(AlignNearest, NanRowsDropped) {
    TimeSeries a({{"2024-01-01", 1}, {"2024-01-02", kNaN}, {"2024-01-03", 3}});
    TimeSeries b({{"2024-01-01", 10}, {"2024-01-02", 20}, {"2024-01-03", kNaN}});
    auto r = align_nearest(a, b);
    EXPECT_EQ(r.time, (std::vector<std::string>{"2024-01-01"}));
}

TEST(AlignNearest, SinglePointsWithoutToleranceAreEmpty) {
    TimeSeries a({{"2024-01-01", 1}});
    TimeSeries b({{"2024-01-01", 2}});
    EXPECT_TRUE(align_nearest(a, b).time.empty());
    EXPECT_EQ(align_nearest(a, b, 0).time.size(), 1u);
}
