#ifndef FMCAL_ESTIMATOR_H
#define FMCAL_ESTIMATOR_H

#include <vector>

#include <Eigen/Dense>

#include "budget.h"
#include "huber.h"
#include "params.h"
#include "windows.h"

namespace fmcal {

enum class FixedSet { None, Alpha, AlphaKLbm };

struct FitVariant {
    // Replace workout by its residual against intake (free alpha only).
    bool orthogonalize = true;
    // Fit k_LBM; when off it is held at the prior.
    bool leanTerm = true;
    FixedSet fixed = FixedSet::None;
};

struct EstimatorConfig {
    FitVariant variant;
    HuberConfig huber;
    int bootstrapResamples = 1000;
    unsigned bootstrapSeed = 42;
    double ciLowPercent = 2.5;
    double ciHighPercent = 97.5;
};

struct ParameterFit {
    ModelParams params;
    FitMetrics metrics;
    std::vector<double> predictedDeltaKg;
    double leanCenterKg = 0.0;
    double orthogonalSlope = 0.0;  // workout ~ intake, through the origin
    bool converged = false;
};

struct ConfidenceInterval {
    ModelParams lo;
    ModelParams hi;
    int requested = 0;
    int completed = 0;
    int failed = 0;
    bool truncated = false;
};

// Forward model evaluated per window, in kg.
std::vector<double> predictDelta(const std::vector<Window> &windows,
                                 const ModelParams &p);

// R^2, MAE, RMSE and bias of `p` on the windows. Leaves conditionNumber and
// iterations at zero.
FitMetrics evaluateFit(const std::vector<Window> &windows, const ModelParams &p);

// Ratio of extreme singular values; infinite when rank deficient or when
// there are fewer rows than columns.
double conditionNumber(const Eigen::MatrixXd &X);

// Robust fit of the configured variant. Parameters held fixed by the
// variant are taken from `prior`. Throws Error when there are no windows.
ParameterFit fitParameters(const std::vector<Window> &windows,
                           const ModelParams &prior, const EstimatorConfig &cfg);

// Percentile bootstrap over windows, deterministic for a given seed. Stops
// early once `budget` runs out.
ConfidenceInterval bootstrapIntervals(const std::vector<Window> &windows,
                                      const ModelParams &prior,
                                      const EstimatorConfig &cfg, RunBudget &budget);

// Energy density each window implies under `p`:
// (intake - (1 - C) workout - (BMR0 + kLbm lean) days) / dFat.
// Windows with no fat-mass change are skipped.
ImpliedAlphaStats impliedAlpha(const std::vector<Window> &windows,
                               const ModelParams &p);

}  // namespace fmcal

#endif  // FMCAL_ESTIMATOR_H
