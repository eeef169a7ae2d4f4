#ifndef FMCAL_DECOMPOSER_H
#define FMCAL_DECOMPOSER_H

#include <vector>

namespace fmcal {

struct DecomposerConfig {
    double fatHalfLifeDays = 90.0;
    double hydrationHalfLifeDays = 2.0;  // kept when the grid search finds nothing
    int hydrationLagDays = 1;
    double carbMassPerG = 0.0035;  // kg of water+glycogen per g of carbohydrate
    double huberDelta = 0.8;
    int maxIterations = 5;
    double tolerance = 1e-6;
    double maxHydrationCoef = 1.5;
    int minCorrPoints = 30;
    int minRegressionPoints = 10;
    bool searchHydration = true;
};

struct DecompositionResult {
    std::vector<double> trend;
    std::vector<double> hydration;  // already scaled by hydrationCoef
    std::vector<double> residual;
    std::vector<double> weight;
    double hydrationCoef = 0.0;
    double hydrationHalfLifeDays = 0.0;
    int hydrationLagDays = 0;
    double selectionCorr = 0.0;
    double interceptShiftKg = 0.0;
    double meanAbsResidualKg = 0.0;
    int iterations = 0;
    bool converged = false;
};

// Exponentially weighted mean, y[i] = a * x[i] + (1 - a) * y[i-1] with
// a = 1 - exp(-ln 2 / halfLife). Leading NaNs stay NaN; later NaNs carry the
// previous value.
std::vector<double> ewma(const std::vector<double> &x, double halfLifeDays);

// Carbohydrate-driven mass signal: EWMA of carbs * carbMassPerG, delayed by
// lagDays (head back-filled) and centred on zero.
std::vector<double> hydrationSignal(const std::vector<double> &carbohydrateG,
                                    double halfLifeDays, int lagDays,
                                    double carbMassPerG);

// Splits observed = trend + k_h * hydration + noise on a daily series with
// one entry per calendar day. Missing carbohydrate counts as zero.
DecompositionResult decompose(const std::vector<double> &observedKg,
                              const std::vector<double> &carbohydrateG,
                              const DecomposerConfig &cfg = DecomposerConfig());

}  // namespace fmcal

#endif  // FMCAL_DECOMPOSER_H
