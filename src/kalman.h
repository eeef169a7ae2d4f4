#ifndef FMCAL_KALMAN_H
#define FMCAL_KALMAN_H

#include <vector>

#include "date.h"
#include "observation.h"

namespace fmcal {

struct KalmanConfig {
    double processVariance = 0.0196;    // Q, kg^2 per elapsed day
    double measurementVariance = 2.89;  // R, kg^2
    bool smooth = false;                // run the RTS backward pass
};

struct FilterState {
    double x = kMissing;
    double p = kMissing;
    double predictedP = kMissing;
    double gain = 0.0;
    bool initialized = false;
    bool measured = false;
};

struct StateEstimate {
    Date date;
    double fatMassKg = kMissing;
    double varianceKg2 = kMissing;
    double predictedVarianceKg2 = kMissing;
    double gain = 0.0;
    bool measured = false;
    double smoothedKg = kMissing;
    double smoothedVarianceKg2 = kMissing;
};

// One predict/update step. `z` may be NaN. The first non-missing
// measurement initializes the state at x = z, P = R with gain 1.
FilterState kalmanStep(const FilterState &prev, double z, int gapDays,
                       const KalmanConfig &cfg);

// Folds kalmanStep over an ordered series; gaps are taken from the dates.
// Runs the backward pass when cfg.smooth is set. Throws NoMeasurementsError
// if every z is missing.
std::vector<StateEstimate> kalman(const std::vector<Date> &dates,
                                  const std::vector<double> &z,
                                  const KalmanConfig &cfg);

// Rauch-Tung-Striebel pass over a filtered series, in place.
void rtsSmooth(std::vector<StateEstimate> &estimates, const KalmanConfig &cfg);

struct FilterHealth {
    double minGain = 0.0;
    double maxGain = 0.0;
    bool gainInRange = true;
    bool gainNonIncreasing = true;
    bool varianceNonIncreasing = true;

    bool ok() const {
        return gainInRange && gainNonIncreasing && varianceNonIncreasing;
    }
};

// Gain within [0, 1]; gain and variance non-increasing across consecutive
// measured records sharing the same gap.
FilterHealth checkFilterHealth(const std::vector<StateEstimate> &estimates);

}  // namespace fmcal

#endif  // FMCAL_KALMAN_H
