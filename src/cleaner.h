#ifndef FMCAL_CLEANER_H
#define FMCAL_CLEANER_H

#include <cstddef>
#include <vector>

#include "observation.h"

namespace fmcal {

enum class CleanMode { Damp, Drop };

struct CleanerConfig {
    int window = 7;
    double k = 3.0;  // outlier threshold, in MADs
    CleanMode mode = CleanMode::Damp;
    bool centered = true;
    double maxDropFraction = 1.0;  // Drop mode only
    double minMad = 1e-6;          // used when no window has a non-zero MAD
};

struct CleanedSeries {
    std::vector<double> values;
    std::vector<bool> adjusted;
    std::size_t adjustedCount = 0;
};

// Median of the non-missing values in each window; NaN if there are none.
std::vector<double> rollingMedian(const std::vector<double> &x, int window,
                                  bool centered);

// Rolling MAD with zero entries replaced by the nearest non-zero one.
std::vector<double> rollingMad(const std::vector<double> &x,
                               const std::vector<double> &median,
                               const CleanerConfig &cfg);

CleanedSeries cleanSeries(const std::vector<double> &raw,
                          const CleanerConfig &cfg);

// Cleans fat and lean mass independently over the calendar-day series, so
// `window` counts days even when records skip some. Output is index-aligned
// with the input records, which must have strictly increasing dates.
std::vector<CleanedObservation> cleanObservations(
    const std::vector<DailyObservation> &records, const CleanerConfig &cfg);

}  // namespace fmcal

#endif  // FMCAL_CLEANER_H
