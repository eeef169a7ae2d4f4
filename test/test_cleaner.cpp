// Measurement cleaner: rolling median/MAD outlier damping and dropping.

#include "cleaner.h"
#include "errors.h"

#include <cmath>
#include <random>
#include <vector>

#include <gtest/gtest.h>

using namespace fmcal;

namespace {

std::vector<double> noisyFlat(int n, double level, double sd, unsigned seed) {
    std::mt19937 rng(seed);
    std::normal_distribution<double> noise(0.0, sd);
    std::vector<double> out(n);
    for (auto &v : out) v = level + noise(rng);
    return out;
}

// level +/- amp alternating: every rolling MAD is at least amp / 2 and no
// point deviates more than 2 amp from its median, so nothing is flagged.
std::vector<double> zigzag(int n, double level, double amp) {
    std::vector<double> out(n);
    for (int i = 0; i < n; ++i) out[i] = level + (i % 2 == 0 ? amp : -amp);
    return out;
}

}  // namespace

// ============================================================================
// Rolling median
// ============================================================================

TEST(RollingMedian, CenteredAndTrailingWindowsUseAvailablePoints) {
    const std::vector<double> x{1, 5, 2, 8, 3};
    const auto centered = rollingMedian(x, 3, true);
    EXPECT_DOUBLE_EQ(centered[0], 3.0);  // {1, 5}
    EXPECT_DOUBLE_EQ(centered[1], 2.0);  // {1, 5, 2}
    EXPECT_DOUBLE_EQ(centered[4], 5.5);  // {8, 3}

    const auto trailing = rollingMedian(x, 3, false);
    EXPECT_DOUBLE_EQ(trailing[0], 1.0);
    EXPECT_DOUBLE_EQ(trailing[2], 2.0);
    EXPECT_DOUBLE_EQ(trailing[4], 3.0);  // {2, 8, 3}
}

TEST(RollingMedian, SkipsMissingValues) {
    const std::vector<double> x{kMissing, kMissing, 4.0, kMissing};
    const auto m = rollingMedian(x, 3, true);
    EXPECT_TRUE(std::isnan(m[0]));
    EXPECT_DOUBLE_EQ(m[1], 4.0);
    EXPECT_DOUBLE_EQ(m[3], 4.0);
}

// ============================================================================
// Damp mode
// ============================================================================

TEST(Cleaner, DampBoundsASingleSpike) {
    std::vector<double> x = noisyFlat(30, 20.0, 0.1, 42);
    x[15] = 26.0;

    CleanerConfig cfg;
    const auto med = rollingMedian(x, cfg.window, cfg.centered);
    const auto mad = rollingMad(x, med, cfg);
    const CleanedSeries out = cleanSeries(x, cfg);

    EXPECT_TRUE(out.adjusted[15]);
    EXPECT_LT(out.values[15], 26.0);
    EXPECT_GT(out.values[15], med[15]);
    // Never farther than 2 k MAD from the median.
    EXPECT_LE(std::abs(out.values[15] - med[15]), 2.0 * cfg.k * mad[15] + 1e-12);
    EXPECT_EQ(out.values.size(), x.size());
}

TEST(Cleaner, DampLeavesInliersUntouched) {
    const std::vector<double> x = zigzag(40, 22.0, 0.1);
    const CleanedSeries out = cleanSeries(x, CleanerConfig());
    EXPECT_EQ(out.adjustedCount, 0u);
    for (size_t i = 0; i < x.size(); ++i) EXPECT_DOUBLE_EQ(out.values[i], x[i]);
}

// ============================================================================
// Drop mode
// ============================================================================

TEST(Cleaner, DropMissesExactlyTheSpike) {
    std::vector<double> x = zigzag(30, 20.0, 0.1);
    x[10] = 14.0;

    CleanerConfig cfg;
    cfg.mode = CleanMode::Drop;
    const CleanedSeries out = cleanSeries(x, cfg);
    ASSERT_EQ(out.adjustedCount, 1u);
    EXPECT_TRUE(std::isnan(out.values[10]));
    for (size_t i = 0; i < x.size(); ++i) {
        if (i != 10) EXPECT_DOUBLE_EQ(out.values[i], x[i]);
    }
}

TEST(Cleaner, DropCapKeepsTheLargestDeviations) {
    std::vector<double> x = zigzag(40, 20.0, 0.1);
    x[5] = 23.0;
    x[20] = 29.0;
    x[33] = 25.0;

    CleanerConfig cfg;
    cfg.mode = CleanMode::Drop;
    cfg.maxDropFraction = 1.0 / 40.0;  // one point
    const CleanedSeries capped = cleanSeries(x, cfg);
    EXPECT_EQ(capped.adjustedCount, 1u);
    EXPECT_TRUE(std::isnan(capped.values[20]));
    EXPECT_FALSE(std::isnan(capped.values[5]));

    cfg.maxDropFraction = 0.0;
    EXPECT_EQ(cleanSeries(x, cfg).adjustedCount, 0u);
}

// ============================================================================
// Gaps and flat windows
// ============================================================================

TEST(Cleaner, NeverFillsGenuineGaps) {
    std::vector<double> x = noisyFlat(20, 20.0, 0.1, 11);
    x[4] = kMissing;
    x[12] = kMissing;
    const CleanedSeries out = cleanSeries(x, CleanerConfig());
    EXPECT_TRUE(std::isnan(out.values[4]));
    EXPECT_TRUE(std::isnan(out.values[12]));
    EXPECT_FALSE(out.adjusted[4]);
}

TEST(Cleaner, FlatSeriesUsesMinimumMad) {
    std::vector<double> x(15, 20.0);
    CleanerConfig cfg;
    const auto med = rollingMedian(x, cfg.window, cfg.centered);
    const auto mad = rollingMad(x, med, cfg);
    for (double m : mad) EXPECT_DOUBLE_EQ(m, cfg.minMad);

    x[7] = 20.5;
    const CleanedSeries out = cleanSeries(x, cfg);
    EXPECT_TRUE(out.adjusted[7]);
    EXPECT_NEAR(out.values[7], 20.0, 2.0 * cfg.k * cfg.minMad + 1e-12);
}

TEST(Cleaner, CleansFatAndLeanIndependently) {
    std::vector<DailyObservation> recs(20);
    for (int i = 0; i < 20; ++i) {
        recs[i].date = Date::fromCivil(2024, 5, 1) + i;
        recs[i].rawFatMassKg = 20.0 + (i % 2 == 0 ? 0.1 : -0.1);
        recs[i].rawLeanMassKg = 60.0 + (i % 2 == 0 ? 0.1 : -0.1);
    }
    recs[8].rawLeanMassKg = 66.0;

    const auto cleaned = cleanObservations(recs, CleanerConfig());
    ASSERT_EQ(cleaned.size(), recs.size());
    EXPECT_TRUE(cleaned[8].leanAdjusted);
    EXPECT_FALSE(cleaned[8].fatAdjusted);
    EXPECT_EQ(cleaned[8].date, recs[8].date);
}

TEST(Cleaner, WindowCountsCalendarDaysNotRecords) {
    // Ten daily weigh-ins, then two more a month later at a new level.
    const std::vector<double> early = zigzag(10, 20.0, 0.05);
    std::vector<DailyObservation> recs;
    for (int i = 0; i < 10; ++i) {
        DailyObservation r;
        r.date = Date::fromCivil(2024, 5, 1) + i;
        r.rawFatMassKg = early[i];
        recs.push_back(r);
    }
    for (int i = 0; i < 2; ++i) {
        DailyObservation r;
        r.date = Date::fromCivil(2024, 5, 31) + i;
        r.rawFatMassKg = 23.0 + 0.1 * i;
        recs.push_back(r);
    }

    // Packed back to back, the first late reading looks like a spike.
    std::vector<double> packed;
    for (const auto &r : recs) packed.push_back(r.rawFatMassKg);
    EXPECT_TRUE(cleanSeries(packed, CleanerConfig()).adjusted[10]);

    // A week around it holds only the late readings.
    const auto cleaned = cleanObservations(recs, CleanerConfig());
    ASSERT_EQ(cleaned.size(), recs.size());
    for (const auto &c : cleaned) EXPECT_FALSE(c.fatAdjusted);
    EXPECT_DOUBLE_EQ(cleaned[10].fatMassKg, 23.0);
    EXPECT_DOUBLE_EQ(cleaned[11].fatMassKg, 23.1);
}

TEST(Cleaner, RejectsUnsortedRecords) {
    std::vector<DailyObservation> recs(2);
    recs[0].date = Date::fromCivil(2024, 5, 2);
    recs[1].date = Date::fromCivil(2024, 5, 1);
    EXPECT_THROW(cleanObservations(recs, CleanerConfig()), Error);
}

TEST(Cleaner, RejectsBadConfig) {
    CleanerConfig cfg;
    cfg.window = 0;
    EXPECT_THROW(cleanSeries({1.0, 2.0}, cfg), Error);
    cfg.window = 3;
    cfg.k = 0.0;
    EXPECT_THROW(cleanSeries({1.0, 2.0}, cfg), Error);
}
