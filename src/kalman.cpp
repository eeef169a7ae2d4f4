#include "kalman.h"

#include <algorithm>
#include <cmath>
#include <string>

#include "errors.h"
#include "log.h"

namespace fmcal {

FilterState kalmanStep(const FilterState &prev, double z, int gapDays,
                       const KalmanConfig &cfg) {
    const double Q = cfg.processVariance;
    const double R = cfg.measurementVariance;
    const bool present = !std::isnan(z);

    FilterState next;
    next.measured = present;

    if (!prev.initialized) {
        if (!present) return next;
        next.x = z;
        next.p = R;
        next.predictedP = R;
        next.gain = 1.0;
        next.initialized = true;
        return next;
    }

    next.initialized = true;
    const double xPred = prev.x;
    const double pPred = prev.p + gapDays * Q;
    next.predictedP = pPred;

    if (present) {
        const double K = pPred / (pPred + R);
        next.x = xPred + K * (z - xPred);
        next.p = (1.0 - K) * pPred;
        next.gain = K;
    } else {
        next.x = xPred;
        next.p = pPred;
        next.gain = 0.0;
    }
    return next;
}

std::vector<StateEstimate> kalman(const std::vector<Date> &dates,
                                  const std::vector<double> &z,
                                  const KalmanConfig &cfg) {
    if (dates.size() != z.size()) {
        throw Error("kalman: dates and measurements differ in length");
    }
    if (cfg.processVariance < 0 || cfg.measurementVariance <= 0) {
        throw Error("kalman: variances must be Q >= 0 and R > 0");
    }
    if (std::none_of(z.begin(), z.end(),
                     [](double v) { return !std::isnan(v); })) {
        throw NoMeasurementsError("No fat-mass measurements to filter");
    }

    std::vector<StateEstimate> out;
    out.reserve(z.size());
    FilterState state;
    for (size_t i = 0; i < z.size(); ++i) {
        const int gap = i == 0 ? 0 : dates[i] - dates[i - 1];
        if (gap < 0 || (i > 0 && gap == 0)) {
            throw Error("kalman: dates must be strictly increasing");
        }
        state = kalmanStep(state, z[i], gap, cfg);

        StateEstimate e;
        e.date = dates[i];
        e.fatMassKg = state.x;
        e.varianceKg2 = state.p;
        e.predictedVarianceKg2 = state.predictedP;
        e.gain = state.gain;
        e.measured = state.measured;
        out.push_back(e);
    }

    if (cfg.smooth) rtsSmooth(out, cfg);
    return out;
}

void rtsSmooth(std::vector<StateEstimate> &est, const KalmanConfig &cfg) {
    if (est.empty()) return;
    StateEstimate &last = est.back();
    last.smoothedKg = last.fatMassKg;
    last.smoothedVarianceKg2 = last.varianceKg2;

    for (int i = static_cast<int>(est.size()) - 2; i >= 0; --i) {
        StateEstimate &cur = est[i];
        const StateEstimate &nxt = est[i + 1];
        if (std::isnan(cur.fatMassKg)) continue;  // before the first reading

        const int gap = nxt.date - cur.date;
        const double pPred = cur.varianceKg2 + gap * cfg.processVariance;
        const double C = pPred > 0 ? cur.varianceKg2 / pPred : 0.0;

        cur.smoothedKg = cur.fatMassKg + C * (nxt.smoothedKg - cur.fatMassKg);
        cur.smoothedVarianceKg2 =
            cur.varianceKg2 + C * C * (nxt.smoothedVarianceKg2 - pPred);
    }
}

FilterHealth checkFilterHealth(const std::vector<StateEstimate> &est) {
    constexpr double tol = 1e-12;
    FilterHealth h;
    h.minGain = 1.0;
    h.maxGain = 0.0;
    bool any = false;

    for (size_t i = 0; i < est.size(); ++i) {
        if (std::isnan(est[i].fatMassKg)) continue;
        any = true;
        h.minGain = std::min(h.minGain, est[i].gain);
        h.maxGain = std::max(h.maxGain, est[i].gain);
        if (est[i].gain < 0.0 || est[i].gain > 1.0) h.gainInRange = false;

        if (i < 2 || !est[i].measured || !est[i - 1].measured) continue;
        if (std::isnan(est[i - 1].fatMassKg)) continue;
        const int gap = est[i].date - est[i - 1].date;
        const int prevGap = est[i - 1].date - est[i - 2].date;
        // The initializing record has no predict step to compare against.
        if (gap != prevGap || std::isnan(est[i - 2].fatMassKg)) continue;

        if (est[i].gain > est[i - 1].gain + tol) h.gainNonIncreasing = false;
        if (est[i].varianceKg2 > est[i - 1].varianceKg2 + tol) {
            h.varianceNonIncreasing = false;
        }
    }
    if (!any) h.minGain = 0.0;

    if (!h.ok()) {
        log::warn("Kalman diagnostics: gain in [" + std::to_string(h.minGain) +
                  ", " + std::to_string(h.maxGain) + "]" +
                  (h.gainNonIncreasing ? "" : ", gain increased") +
                  (h.varianceNonIncreasing ? "" : ", variance increased"));
    }
    return h;
}

}  // namespace fmcal
