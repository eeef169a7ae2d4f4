#include "windows.h"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <string>

#include "errors.h"
#include "log.h"

namespace fmcal {

namespace {

// Latest day at or before `idx` (within the lookback) with a cleaned fat-mass
// measurement.
long measuredAtOrBefore(const DailyFrame &frame, long idx, int lookbackDays) {
    for (long i = idx; i >= 0 && i >= idx - lookbackDays; --i) {
        if (!std::isnan(frame.fatKg[i])) return i;
    }
    return -1;
}

std::string describe(const Date &start, int length) {
    return start.str() + "+" + std::to_string(length) + "d";
}

}  // namespace

std::vector<double> fatSeries(const DailyFrame &frame,
                              const std::vector<StateEstimate> &estimates,
                              const DecompositionResult *decomposition,
                              FatSource source) {
    const size_t n = frame.size();
    std::vector<double> out(n, kMissing);
    switch (source) {
    case FatSource::Cleaned:
        out = frame.fatKg;
        break;
    case FatSource::Trend:
        if (decomposition == nullptr || decomposition->trend.size() != n) {
            throw Error("Trend fat-mass source needs a decomposition of the frame");
        }
        out = decomposition->trend;
        break;
    case FatSource::Filtered:
    case FatSource::Smoothed:
        if (estimates.size() != n) {
            throw Error("State estimates are not aligned with the daily frame");
        }
        for (size_t i = 0; i < n; ++i) {
            out[i] = source == FatSource::Filtered ? estimates[i].fatMassKg
                                                   : estimates[i].smoothedKg;
        }
        break;
    }
    return out;
}

Window buildWindow(const DailyFrame &frame, const std::vector<double> &fatKg,
                   const Date &start, int lengthDays, const WindowConfig &cfg) {
    if (lengthDays < 1) throw Error("Window length must be at least one day");
    if (fatKg.size() != frame.size()) {
        throw Error("Fat-mass series is not aligned with the daily frame");
    }
    const long s = frame.indexOf(start);
    const long e = frame.indexOf(start + lengthDays);
    if (s < 0 || e < 0) {
        throw DataGapError(describe(start, lengthDays) + ": outside the data range");
    }

    Window w;
    w.startDate = start;
    w.endDate = start + lengthDays;
    w.lengthDays = lengthDays;

    const long ms = measuredAtOrBefore(frame, s, cfg.lookbackDays);
    const long me = measuredAtOrBefore(frame, e, cfg.lookbackDays);
    if (ms < 0 || me < 0) {
        throw DataGapError(describe(start, lengthDays) + ": no fat-mass reading within " +
                           std::to_string(cfg.lookbackDays) + " days of " +
                           (ms < 0 ? "start" : "end"));
    }
    w.startMeasuredDate = frame.dates[ms];
    w.endMeasuredDate = frame.dates[me];
    w.startFatKg = fatKg[ms];
    w.endFatKg = fatKg[me];
    if (std::isnan(w.startFatKg) || std::isnan(w.endFatKg)) {
        throw DataGapError(describe(start, lengthDays) + ": no fat-mass estimate at an endpoint");
    }
    w.deltaFatKg = w.endFatKg - w.startFatKg;

    int both = 0;
    double leanSum = 0.0;
    for (long i = s; i < e; ++i) {
        if (std::isnan(frame.intakeKcal[i])) {
            throw DataGapError(describe(start, lengthDays) + ": intake missing on " +
                               frame.dates[i].str());
        }
        const bool hasFat = !std::isnan(frame.fatKg[i]);
        const bool hasLean = !std::isnan(frame.leanKg[i]);
        w.validFatDays += hasFat;
        w.validLeanDays += hasLean;
        both += hasFat && hasLean;
        if (hasLean) leanSum += frame.leanKg[i];

        w.intakeSumKcal += frame.intakeKcal[i];
        w.workoutSumKcal += frame.workoutKcal[i];
        w.carbohydrateSumG += frame.carbohydrateG[i];
    }
    const int required = std::min(cfg.minValidDays, lengthDays);
    if (both < required) {
        throw DataGapError(describe(start, lengthDays) + ": " + std::to_string(both) +
                           " days with fat and lean mass, need " +
                           std::to_string(required));
    }
    w.meanLeanKg = leanSum / w.validLeanDays;

    const double rate = std::abs(w.deltaFatKg) / lengthDays;
    if (rate > cfg.maxDailyRateKg) {
        std::ostringstream msg;
        msg << describe(start, lengthDays) << ": fat-mass change of " << rate
            << " kg/day exceeds " << cfg.maxDailyRateKg;
        throw DataGapError(msg.str());
    }
    return w;
}

std::vector<Window> buildWindows(const DailyFrame &frame,
                                 const std::vector<double> &fatKg,
                                 const WindowConfig &cfg) {
    std::vector<Window> out;
    if (frame.empty()) return out;

    std::vector<int> lengths = cfg.lengthsDays;
    std::sort(lengths.begin(), lengths.end());
    lengths.erase(std::unique(lengths.begin(), lengths.end()), lengths.end());
    if (lengths.empty() || lengths.front() < 1) {
        throw Error("Window lengths must be positive");
    }

    int dropped = 0;
    auto attempt = [&](const Date &start, int length) {
        try {
            out.push_back(buildWindow(frame, fatKg, start, length, cfg));
            return true;
        } catch (const DataGapError &e) {
            log::debug(std::string("window dropped: ") + e.what());
            ++dropped;
            return false;
        }
    };

    const Date first = frame.first();
    const Date last = frame.last();
    switch (cfg.mode) {
    case WindowMode::Anchored: {
        if (cfg.anchorStrideDays < 1) throw Error("Anchor stride must be positive");
        for (Date end = last; end - first >= lengths.front(); end = end - cfg.anchorStrideDays) {
            for (int L : lengths) {
                if (end - L < first) break;
                if (attempt(end - L, L)) break;  // shortest eligible length wins
            }
        }
        // Anchors were visited newest first.
        std::sort(out.begin(), out.end(),
                  [](const Window &a, const Window &b) { return a.endDate < b.endDate; });
        break;
    }
    case WindowMode::Rolling:
        for (int L : lengths) {
            for (Date s = first; s + L <= last; s = s + 1) attempt(s, L);
        }
        break;
    case WindowMode::Blocks:
        for (int L : lengths) {
            for (Date s = first; s + L <= last; s = s + L) attempt(s, L);
        }
        break;
    }

    log::info("windows: " + std::to_string(out.size()) + " eligible, " +
              std::to_string(dropped) + " dropped");
    return out;
}

}  // namespace fmcal
