#include "holdout.h"

#include <algorithm>
#include <cmath>
#include <sstream>

#include "errors.h"
#include "log.h"

namespace fmcal {

HoldoutSplit splitByDate(const std::vector<Window> &windows, const HoldoutConfig &cfg) {
    if (cfg.testFraction <= 0.0 || cfg.testFraction >= 1.0) {
        throw Error("Holdout test fraction must be in (0, 1)");
    }
    const int n = static_cast<int>(windows.size());
    const int wanted = std::max(cfg.minTestWindows,
                                static_cast<int>(std::lround(cfg.testFraction * n)));

    std::vector<Date> ends;
    for (const Window &w : windows) ends.push_back(w.endDate);
    std::sort(ends.begin(), ends.end());
    ends.erase(std::unique(ends.begin(), ends.end()), ends.end());

    for (auto it = ends.rbegin(); it != ends.rend(); ++it) {
        const Date cutoff = *it;
        int train = 0, test = 0;
        for (const Window &w : windows) {
            if (w.endDate <= cutoff) ++train;
            else if (w.startDate >= cutoff) ++test;
        }
        if (test < wanted) continue;
        if (train < cfg.minTrainWindows) break;

        HoldoutSplit split;
        split.cutoff = cutoff;
        for (const Window &w : windows) {
            if (w.endDate <= cutoff) split.train.push_back(w);
            else if (w.startDate >= cutoff) split.test.push_back(w);
            else ++split.discarded;
        }
        return split;
    }

    std::ostringstream msg;
    msg << "Cannot split " << n << " windows into " << cfg.minTrainWindows
        << "+ training and " << wanted << "+ non-overlapping test windows";
    throw Error(msg.str());
}

HoldoutMetrics evaluateHoldout(const std::vector<Window> &windows,
                               const ModelParams &prior, const HoldoutConfig &cfg,
                               const EstimatorConfig &estimator,
                               const ValidatorConfig &validator) {
    const HoldoutSplit split = splitByDate(windows, cfg);
    const ValidatedFit fit = fitAndValidate(split.train, prior, estimator, validator);
    const FitMetrics fitted = evaluateFit(split.test, fit.fit.params);
    const FitMetrics base = evaluateFit(split.test, prior);

    HoldoutMetrics m;
    m.evaluated = true;
    m.cutoff = split.cutoff;
    m.trainWindows = static_cast<int>(split.train.size());
    m.testWindows = static_cast<int>(split.test.size());
    m.discardedWindows = split.discarded;
    m.fittedMaeKg = fitted.maeKg;
    m.fittedRmseKg = fitted.rmseKg;
    m.fittedBiasKg = fitted.biasKg;
    m.priorMaeKg = base.maeKg;
    m.priorRmseKg = base.rmseKg;
    m.priorBiasKg = base.biasKg;

    std::ostringstream msg;
    msg << "holdout at " << split.cutoff << ": " << m.trainWindows << " train, "
        << m.testWindows << " test, " << m.discardedWindows << " dropped; test mae "
        << m.fittedMaeKg << " kg (prior " << m.priorMaeKg << " kg)";
    log::debug(msg.str());
    return m;
}

}  // namespace fmcal
