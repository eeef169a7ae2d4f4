#ifndef FMCAL_HOLDOUT_H
#define FMCAL_HOLDOUT_H

#include <vector>

#include "date.h"
#include "estimator.h"
#include "params.h"
#include "validator.h"
#include "windows.h"

namespace fmcal {

struct HoldoutConfig {
    bool enabled = false;
    double testFraction = 0.25;  // share of windows wanted in the test set
    int minTrainWindows = 2;
    int minTestWindows = 1;
};

struct HoldoutSplit {
    Date cutoff;
    std::vector<Window> train;  // endDate <= cutoff
    std::vector<Window> test;   // startDate >= cutoff
    int discarded = 0;
};

// Splits by date so that no energy day falls in both sets. The cutoff is the
// latest window end date that still leaves the wanted number of test
// windows; windows straddling it are dropped. Throws Error when no cutoff
// satisfies the minimum counts.
HoldoutSplit splitByDate(const std::vector<Window> &windows, const HoldoutConfig &cfg);

// Fits on the training windows (with validation and fallback) and scores
// both the fitted parameters and `prior` on the test windows.
HoldoutMetrics evaluateHoldout(const std::vector<Window> &windows,
                               const ModelParams &prior, const HoldoutConfig &cfg,
                               const EstimatorConfig &estimator,
                               const ValidatorConfig &validator);

}  // namespace fmcal

#endif  // FMCAL_HOLDOUT_H
