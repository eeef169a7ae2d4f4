// Date-ordered holdout split and out-of-sample scoring.

#include "errors.h"
#include "holdout.h"
#include "synthetic.h"

#include <cmath>
#include <vector>

#include <gtest/gtest.h>

using namespace fmcal;

namespace {

const Date kStart = Date::fromCivil(2024, 1, 1);

// Inside the default bounds.
const ModelParams kTruth{9000.0, 0.3, 700.0, 12.0};

// Lays the windows end to end from kStart.
std::vector<Window> backToBack(std::vector<Window> windows) {
    Date at = kStart;
    for (Window &w : windows) {
        w.startDate = at;
        w.endDate = at + w.lengthDays;
        at = w.endDate;
    }
    return windows;
}

// `count` windows of `days` days starting on consecutive days.
std::vector<Window> rolling(int count, int days) {
    std::vector<Window> out;
    for (int i = 0; i < count; ++i) {
        Window w = synth::makeWindow(days, 2400.0 * days, 300.0 * days, 60.0, kTruth);
        w.startDate = kStart + i;
        w.endDate = w.startDate + days;
        out.push_back(w);
    }
    return out;
}

void expectDisjoint(const HoldoutSplit &split) {
    for (const Window &tr : split.train) {
        EXPECT_LE(tr.endDate, split.cutoff);
        for (const Window &te : split.test) EXPECT_GE(te.startDate, tr.endDate);
    }
    for (const Window &te : split.test) EXPECT_GE(te.startDate, split.cutoff);
}

}  // namespace

// ============================================================================
// Split
// ============================================================================

TEST(Holdout, BlocksSplitAtTheLatestUsableBoundary) {
    const auto windows = backToBack(synth::varietyWindows(kTruth, 8));
    const HoldoutSplit split = splitByDate(windows, HoldoutConfig());

    ASSERT_EQ(split.train.size(), 6u);
    ASSERT_EQ(split.test.size(), 2u);
    EXPECT_EQ(split.discarded, 0);
    EXPECT_EQ(split.cutoff, windows[5].endDate);
    EXPECT_EQ(split.test.front().startDate, windows[6].startDate);
    expectDisjoint(split);
}

TEST(Holdout, RollingWindowsStraddlingTheCutoffAreDropped) {
    const auto windows = rolling(43, 14);
    const HoldoutSplit split = splitByDate(windows, HoldoutConfig());

    EXPECT_EQ(split.cutoff, kStart + 32);
    EXPECT_EQ(split.train.size(), 19u);
    EXPECT_EQ(split.test.size(), 11u);
    EXPECT_EQ(split.discarded, 13);
    expectDisjoint(split);
}

TEST(Holdout, TooFewWindowsIsAnError) {
    EXPECT_THROW(splitByDate(backToBack(synth::varietyWindows(kTruth, 2)), HoldoutConfig()),
                 Error);
    // No cutoff among fifteen overlapping windows leaves four wholly after it.
    EXPECT_THROW(splitByDate(rolling(15, 14), HoldoutConfig()), Error);
    EXPECT_THROW(splitByDate({}, HoldoutConfig()), Error);

    HoldoutConfig cfg;
    cfg.testFraction = 0.0;
    EXPECT_THROW(splitByDate(backToBack(synth::varietyWindows(kTruth, 8)), cfg), Error);
}

// ============================================================================
// Scoring
// ============================================================================

TEST(Holdout, FitOnEarlierWindowsPredictsLaterOnes) {
    const auto windows = backToBack(synth::varietyWindows(kTruth, 16));
    const ModelParams prior{9500.0, 0.2, 800.0, 14.0};

    const HoldoutMetrics m = evaluateHoldout(windows, prior, HoldoutConfig(),
                                             EstimatorConfig(), ValidatorConfig());
    EXPECT_TRUE(m.evaluated);
    EXPECT_EQ(m.trainWindows, 12);
    EXPECT_EQ(m.testWindows, 4);
    EXPECT_EQ(m.cutoff, windows[11].endDate);
    EXPECT_NEAR(m.fittedMaeKg, 0.0, 1e-6);
    EXPECT_NEAR(m.fittedBiasKg, 0.0, 1e-6);
    EXPECT_GT(m.priorMaeKg, 0.1);
    EXPECT_GE(m.priorRmseKg, m.priorMaeKg);
}

TEST(Holdout, TestWindowsDoNotInfluenceTheFit) {
    auto windows = backToBack(synth::varietyWindows(kTruth, 16));
    const ModelParams prior{9500.0, 0.2, 800.0, 14.0};
    const HoldoutMetrics clean = evaluateHoldout(windows, prior, HoldoutConfig(),
                                                 EstimatorConfig(), ValidatorConfig());

    for (size_t i = 12; i < windows.size(); ++i) windows[i].deltaFatKg += 1.0;
    const HoldoutMetrics shifted = evaluateHoldout(windows, prior, HoldoutConfig(),
                                                   EstimatorConfig(), ValidatorConfig());
    // Same fit, so the whole shift shows up as test bias.
    EXPECT_NEAR(shifted.fittedBiasKg - clean.fittedBiasKg, 1.0, 1e-6);
    EXPECT_NEAR(shifted.fittedMaeKg, 1.0, 1e-6);
}
