#include "decomposer.h"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <string>

#include "errors.h"
#include "huber.h"
#include "log.h"
#include "observation.h"

namespace fmcal {

namespace {

double nanMean(const std::vector<double> &v) {
    double sum = 0.0;
    int n = 0;
    for (double x : v) {
        if (std::isnan(x)) continue;
        sum += x;
        ++n;
    }
    return n > 0 ? sum / n : kMissing;
}

// Pearson correlation over indices where both are present.
double pairedCorr(const std::vector<double> &a, const std::vector<double> &b,
                  int &count) {
    double sa = 0, sb = 0;
    count = 0;
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::isnan(a[i]) || std::isnan(b[i])) continue;
        sa += a[i];
        sb += b[i];
        ++count;
    }
    if (count < 2) return kMissing;
    const double ma = sa / count, mb = sb / count;
    double sab = 0, saa = 0, sbb = 0;
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::isnan(a[i]) || std::isnan(b[i])) continue;
        sab += (a[i] - ma) * (b[i] - mb);
        saa += (a[i] - ma) * (a[i] - ma);
        sbb += (b[i] - mb) * (b[i] - mb);
    }
    if (saa <= 0 || sbb <= 0) return kMissing;
    return sab / std::sqrt(saa * sbb);
}

std::vector<double> minusScaled(const std::vector<double> &obs, double k,
                                const std::vector<double> &h) {
    std::vector<double> out(obs.size());
    for (size_t i = 0; i < obs.size(); ++i) out[i] = obs[i] - k * h[i];
    return out;
}

}  // namespace

std::vector<double> ewma(const std::vector<double> &x, double halfLifeDays) {
    if (!(halfLifeDays > 0)) throw Error("ewma: half-life must be positive");
    const double a = 1.0 - std::exp(-std::log(2.0) / halfLifeDays);
    std::vector<double> out(x.size(), kMissing);
    double s = kMissing;
    for (size_t i = 0; i < x.size(); ++i) {
        if (!std::isnan(x[i])) {
            s = std::isnan(s) ? x[i] : a * x[i] + (1.0 - a) * s;
        }
        out[i] = s;
    }
    return out;
}

std::vector<double> hydrationSignal(const std::vector<double> &carbohydrateG,
                                    double halfLifeDays, int lagDays,
                                    double carbMassPerG) {
    if (lagDays < 0) throw Error("hydrationSignal: lag must be non-negative");
    std::vector<double> mass(carbohydrateG.size());
    for (size_t i = 0; i < mass.size(); ++i) {
        const double g = carbohydrateG[i];
        mass[i] = (std::isnan(g) ? 0.0 : g) * carbMassPerG;
    }
    const std::vector<double> e = ewma(mass, halfLifeDays);

    std::vector<double> h(e.size());
    for (size_t i = 0; i < e.size(); ++i) {
        const size_t lag = static_cast<size_t>(lagDays);
        // Lagged head is back-filled with the first available value.
        h[i] = i >= lag ? e[i - lag] : (e.empty() ? 0.0 : e[0]);
    }
    const double mean = nanMean(h);
    if (!std::isnan(mean)) {
        for (auto &v : h) v -= mean;
    }
    return h;
}

DecompositionResult decompose(const std::vector<double> &obs,
                              const std::vector<double> &carbs,
                              const DecomposerConfig &cfg) {
    if (obs.size() != carbs.size()) {
        throw Error("decompose: observed and carbohydrate series differ in length");
    }
    if (cfg.maxIterations < 1) throw Error("decompose: maxIterations must be >= 1");

    DecompositionResult res;
    res.hydrationHalfLifeDays = cfg.hydrationHalfLifeDays;
    res.hydrationLagDays = cfg.hydrationLagDays;

    if (cfg.searchHydration) {
        const std::vector<double> trend0 = ewma(obs, cfg.fatHalfLifeDays);
        std::vector<double> detrended(obs.size());
        for (size_t i = 0; i < obs.size(); ++i) detrended[i] = obs[i] - trend0[i];

        for (double hl : {1.0, 2.0, 3.0}) {
            for (int lag : {0, 1, 2}) {
                const std::vector<double> h =
                    hydrationSignal(carbs, hl, lag, cfg.carbMassPerG);
                int n = 0;
                const double c = pairedCorr(h, detrended, n);
                if (n <= cfg.minCorrPoints || std::isnan(c)) continue;
                if (std::abs(c) > res.selectionCorr) {
                    res.selectionCorr = std::abs(c);
                    res.hydrationHalfLifeDays = hl;
                    res.hydrationLagDays = lag;
                }
            }
        }
    }

    const std::vector<double> h = hydrationSignal(
        carbs, res.hydrationHalfLifeDays, res.hydrationLagDays, cfg.carbMassPerG);

    HuberConfig huber;
    huber.epsilon = cfg.huberDelta;
    huber.estimateScale = false;

    res.weight.assign(obs.size(), 0.0);
    double k = 0.0;
    for (int it = 1; it <= cfg.maxIterations; ++it) {
        res.iterations = it;
        const std::vector<double> trend = ewma(minusScaled(obs, k, h), cfg.fatHalfLifeDays);

        std::vector<size_t> idx;
        std::vector<double> r;
        for (size_t i = 0; i < obs.size(); ++i) {
            const double v = obs[i] - trend[i];
            if (std::isnan(v) || std::isnan(h[i])) continue;
            idx.push_back(i);
            r.push_back(v);
        }
        if (static_cast<int>(idx.size()) < cfg.minRegressionPoints) {
            log::warn("decompose: only " + std::to_string(idx.size()) +
                      " valid points, hydration coefficient left at " +
                      std::to_string(k));
            break;
        }

        const double mean = nanMean(r);
        Eigen::MatrixXd X(idx.size(), 1);
        Eigen::VectorXd y(idx.size());
        for (size_t j = 0; j < idx.size(); ++j) {
            X(j, 0) = h[idx[j]];
            y[j] = r[j] - mean;
        }
        const HuberFit fit = huberRegression(X, y, huber);

        std::fill(res.weight.begin(), res.weight.end(), 0.0);
        for (size_t j = 0; j < idx.size(); ++j) res.weight[idx[j]] = fit.weights[j];

        double kNew = fit.beta[0];
        if (!std::isfinite(kNew)) kNew = 0.0;
        kNew = std::clamp(kNew, 0.0, cfg.maxHydrationCoef);
        const double step = std::abs(kNew - k);
        k = kNew;
        if (step < cfg.tolerance) {
            res.converged = true;
            break;
        }
    }
    if (!res.converged) {
        log::warn("decompose: no convergence after " +
                  std::to_string(res.iterations) + " iterations");
    }

    res.hydrationCoef = k;
    res.trend = ewma(minusScaled(obs, k, h), cfg.fatHalfLifeDays);
    res.hydration.resize(obs.size());
    res.residual.resize(obs.size());
    for (size_t i = 0; i < obs.size(); ++i) {
        res.hydration[i] = k * h[i];
        res.residual[i] = obs[i] - (res.trend[i] + res.hydration[i]);
    }
    res.interceptShiftKg = nanMean(res.residual);
    std::vector<double> absRes(res.residual.size());
    std::transform(res.residual.begin(), res.residual.end(), absRes.begin(),
                   [](double v) { return std::abs(v); });
    res.meanAbsResidualKg = nanMean(absRes);

    std::ostringstream msg;
    msg << "decompose: k_h=" << k << " hl=" << res.hydrationHalfLifeDays
        << "d lag=" << res.hydrationLagDays << "d |corr|=" << res.selectionCorr
        << " mean|resid|=" << res.meanAbsResidualKg;
    log::debug(msg.str());
    return res;
}

}  // namespace fmcal
