#ifndef FMCAL_WINDOWS_H
#define FMCAL_WINDOWS_H

#include <vector>

#include "date.h"
#include "decomposer.h"
#include "frame.h"
#include "kalman.h"

namespace fmcal {

enum class WindowMode { Anchored, Rolling, Blocks };
enum class FatSource { Filtered, Smoothed, Trend, Cleaned };

struct WindowConfig {
    WindowMode mode = WindowMode::Anchored;
    std::vector<int> lengthsDays{7, 14, 21, 28};
    int anchorStrideDays = 7;
    int lookbackDays = 3;
    int minValidDays = 10;  // clipped to the window length
    double maxDailyRateKg = 0.12;
    FatSource source = FatSource::Filtered;
};

// Energy days are [startDate, endDate); endDate is the closing weigh-in.
struct Window {
    Date startDate;
    Date endDate;
    int lengthDays = 0;
    Date startMeasuredDate;
    Date endMeasuredDate;
    double startFatKg = 0.0;
    double endFatKg = 0.0;
    double deltaFatKg = 0.0;
    double intakeSumKcal = 0.0;
    double workoutSumKcal = 0.0;
    double carbohydrateSumG = 0.0;
    double meanLeanKg = 0.0;
    int validFatDays = 0;
    int validLeanDays = 0;
};

// Per-day fat-mass values from the chosen source, aligned with the frame.
// `decomposition` is required for FatSource::Trend.
std::vector<double> fatSeries(const DailyFrame &frame,
                              const std::vector<StateEstimate> &estimates,
                              const DecompositionResult *decomposition,
                              FatSource source);

// Builds one window or throws DataGapError saying why it is not eligible.
Window buildWindow(const DailyFrame &frame, const std::vector<double> &fatKg,
                   const Date &start, int lengthDays, const WindowConfig &cfg);

// All eligible windows for the configured mode. Ineligible candidates are
// logged and skipped.
std::vector<Window> buildWindows(const DailyFrame &frame,
                                 const std::vector<double> &fatKg,
                                 const WindowConfig &cfg);

}  // namespace fmcal

#endif  // FMCAL_WINDOWS_H
