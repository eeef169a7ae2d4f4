#include "cleaner.h"

#include <algorithm>
#include <cmath>
#include <string>

#include "errors.h"
#include "log.h"

namespace fmcal {

namespace {

double medianOf(std::vector<double> &v) {
    if (v.empty()) return kMissing;
    const size_t mid = v.size() / 2;
    std::nth_element(v.begin(), v.begin() + mid, v.end());
    double hi = v[mid];
    if (v.size() % 2 == 1) return hi;
    double lo = *std::max_element(v.begin(), v.begin() + mid);
    return 0.5 * (lo + hi);
}

// Bounded compression of a deviation beyond the threshold: slope 1 at the
// threshold, never more than 2 * threshold from the median.
double dampDeviation(double dev, double threshold) {
    const double excess = (std::abs(dev) - threshold) / threshold;
    return std::copysign(threshold * (1.0 + std::tanh(excess)), dev);
}

}  // namespace

std::vector<double> rollingMedian(const std::vector<double> &x, int window,
                                  bool centered) {
    if (window < 1) throw Error("Rolling window must be at least 1");
    const long n = static_cast<long>(x.size());
    std::vector<double> out(x.size(), kMissing);
    std::vector<double> buf;
    buf.reserve(window);

    for (long i = 0; i < n; ++i) {
        const long lo = centered ? i - window / 2 : i - window + 1;
        const long hi = lo + window - 1;
        buf.clear();
        for (long j = std::max(0L, lo); j <= std::min(n - 1, hi); ++j) {
            if (!std::isnan(x[j])) buf.push_back(x[j]);
        }
        out[i] = medianOf(buf);
    }
    return out;
}

std::vector<double> rollingMad(const std::vector<double> &x,
                               const std::vector<double> &median,
                               const CleanerConfig &cfg) {
    std::vector<double> absDev(x.size());
    for (size_t i = 0; i < x.size(); ++i) {
        absDev[i] = std::abs(x[i] - median[i]);
    }
    std::vector<double> mad = rollingMedian(absDev, cfg.window, cfg.centered);

    // Flat windows: forward fill then back fill from non-zero neighbours.
    for (auto &m : mad) {
        if (!(m > 0.0)) m = kMissing;
    }
    double last = kMissing;
    for (auto &m : mad) {
        if (std::isnan(m)) m = last; else last = m;
    }
    last = kMissing;
    for (auto it = mad.rbegin(); it != mad.rend(); ++it) {
        if (std::isnan(*it)) *it = last; else last = *it;
    }
    for (auto &m : mad) {
        if (std::isnan(m)) m = cfg.minMad;
    }
    return mad;
}

CleanedSeries cleanSeries(const std::vector<double> &raw,
                          const CleanerConfig &cfg) {
    if (cfg.k <= 0) throw Error("Cleaner threshold k must be positive");

    CleanedSeries out;
    out.values = raw;
    out.adjusted.assign(raw.size(), false);

    const std::vector<double> med = rollingMedian(raw, cfg.window, cfg.centered);
    const std::vector<double> mad = rollingMad(raw, med, cfg);

    std::vector<size_t> outliers;
    for (size_t i = 0; i < raw.size(); ++i) {
        if (std::isnan(raw[i])) continue;
        const double dev = raw[i] - med[i];
        if (std::abs(dev) > cfg.k * mad[i]) outliers.push_back(i);
    }

    if (cfg.mode == CleanMode::Drop && cfg.maxDropFraction < 1.0) {
        const size_t present = std::count_if(
            raw.begin(), raw.end(), [](double v) { return !std::isnan(v); });
        const size_t cap = static_cast<size_t>(
            std::max(0.0, std::round(cfg.maxDropFraction * present)));
        if (outliers.size() > cap) {
            // Keep only the largest deviations.
            std::stable_sort(outliers.begin(), outliers.end(),
                             [&](size_t a, size_t b) {
                                 return std::abs(raw[a] - med[a]) >
                                        std::abs(raw[b] - med[b]);
                             });
            outliers.resize(cap);
            std::sort(outliers.begin(), outliers.end());
        }
    }

    for (size_t i : outliers) {
        if (cfg.mode == CleanMode::Drop) {
            out.values[i] = kMissing;
        } else {
            out.values[i] = med[i] + dampDeviation(raw[i] - med[i], cfg.k * mad[i]);
        }
        out.adjusted[i] = true;
    }
    out.adjustedCount = outliers.size();
    return out;
}

std::vector<CleanedObservation> cleanObservations(
    const std::vector<DailyObservation> &records, const CleanerConfig &cfg) {
    std::vector<CleanedObservation> out(records.size());
    if (records.empty()) return out;

    // The rolling window counts calendar days: records go onto a dense daily
    // grid first, absent days stay missing.
    const Date first = records.front().date;
    for (size_t i = 1; i < records.size(); ++i) {
        if (!(records[i - 1].date < records[i].date)) {
            throw Error("cleanObservations: records must have strictly increasing dates");
        }
    }
    const size_t days = static_cast<size_t>(records.back().date - first) + 1;
    std::vector<double> fat(days, kMissing), lean(days, kMissing);
    for (const DailyObservation &r : records) {
        fat[r.date - first] = r.rawFatMassKg;
        lean[r.date - first] = r.rawLeanMassKg;
    }
    const CleanedSeries f = cleanSeries(fat, cfg);
    const CleanedSeries l = cleanSeries(lean, cfg);

    for (size_t i = 0; i < records.size(); ++i) {
        const size_t d = records[i].date - first;
        out[i] = {records[i].date, f.values[d], l.values[d], f.adjusted[d],
                  l.adjusted[d]};
    }
    log::debug("cleaner: " + std::to_string(f.adjustedCount) +
               " fat-mass and " + std::to_string(l.adjustedCount) +
               " lean-mass points " +
               (cfg.mode == CleanMode::Drop ? "dropped" : "damped") + " of " +
               std::to_string(records.size()));
    return out;
}

}  // namespace fmcal
