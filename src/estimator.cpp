#include "estimator.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <random>
#include <sstream>
#include <string>

#include "errors.h"
#include "log.h"

namespace fmcal {

namespace {

double percentile(std::vector<double> v, double pct) {
    if (v.empty()) return std::numeric_limits<double>::quiet_NaN();
    std::sort(v.begin(), v.end());
    const double pos = pct / 100.0 * (v.size() - 1);
    const size_t lo = static_cast<size_t>(std::floor(pos));
    const size_t hi = std::min(lo + 1, v.size() - 1);
    return v[lo] + (pos - lo) * (v[hi] - v[lo]);
}

bool allFinite(const ModelParams &p) {
    return std::isfinite(p.alpha) && std::isfinite(p.c) && std::isfinite(p.bmr0) &&
           std::isfinite(p.kLbm);
}

}  // namespace

std::vector<double> predictDelta(const std::vector<Window> &windows,
                                 const ModelParams &p) {
    std::vector<double> out;
    out.reserve(windows.size());
    for (const Window &w : windows) {
        const double net = w.intakeSumKcal - (1.0 - p.c) * w.workoutSumKcal -
                           (p.bmr0 + p.kLbm * w.meanLeanKg) * w.lengthDays;
        out.push_back(net / p.alpha);
    }
    return out;
}

FitMetrics evaluateFit(const std::vector<Window> &windows, const ModelParams &p) {
    FitMetrics m;
    m.windowCount = static_cast<int>(windows.size());
    if (windows.empty()) return m;

    const std::vector<double> pred = predictDelta(windows, p);
    const double n = windows.size();
    double mean = 0.0;
    for (const Window &w : windows) mean += w.deltaFatKg / n;

    double ssRes = 0.0, ssTot = 0.0, absSum = 0.0, biasSum = 0.0;
    for (size_t i = 0; i < windows.size(); ++i) {
        const double r = windows[i].deltaFatKg - pred[i];
        ssRes += r * r;
        ssTot += (windows[i].deltaFatKg - mean) * (windows[i].deltaFatKg - mean);
        absSum += std::abs(r);
        biasSum += r;
    }
    if (ssTot > 0) {
        m.r2 = 1.0 - ssRes / ssTot;
    } else {
        m.r2 = ssRes == 0.0 ? 1.0 : 0.0;
    }
    m.maeKg = absSum / n;
    m.rmseKg = std::sqrt(ssRes / n);
    m.biasKg = biasSum / n;
    return m;
}

double conditionNumber(const Eigen::MatrixXd &X) {
    constexpr double inf = std::numeric_limits<double>::infinity();
    if (X.size() == 0 || X.rows() < X.cols()) return inf;
    Eigen::JacobiSVD<Eigen::MatrixXd> svd(X);
    const Eigen::VectorXd &sv = svd.singularValues();
    const double smin = sv.minCoeff();
    if (!(smin > 0)) return inf;
    return sv.maxCoeff() / smin;
}

ParameterFit fitParameters(const std::vector<Window> &windows,
                           const ModelParams &prior, const EstimatorConfig &cfg) {
    using namespace Eigen;
    if (windows.empty()) throw Error("No windows to fit");

    const FitVariant &v = cfg.variant;
    const bool fixAlpha = v.fixed != FixedSet::None;
    const bool fitK = v.leanTerm && v.fixed != FixedSet::AlphaKLbm;
    const Index n = static_cast<Index>(windows.size());

    ParameterFit fit;
    for (const Window &w : windows) fit.leanCenterKg += w.meanLeanKg / n;
    const double center = fit.leanCenterKg;

    // Column order, free alpha: days, [days*(lean-center)], workout(resid), intake.
    // Fixed alpha: workout, days, [days*(lean-center)].
    const Index p = (fixAlpha ? 2 : 3) + (fitK ? 1 : 0);
    MatrixXd X(n, p);
    VectorXd y(n);

    for (Index i = 0; i < n; ++i) {
        const Window &w = windows[i];
        const double days = w.lengthDays;
        const double leanDays = w.meanLeanKg * days;
        if (!fixAlpha) {
            const double intake = w.intakeSumKcal - (fitK ? 0.0 : prior.kLbm * leanDays);
            Index j = 0;
            X(i, j++) = days;
            if (fitK) X(i, j++) = days * (w.meanLeanKg - center);
            X(i, j++) = w.workoutSumKcal;
            X(i, j) = intake;
            y[i] = w.deltaFatKg;
        } else {
            X(i, 0) = w.workoutSumKcal;
            X(i, 1) = days;
            if (fitK) X(i, 2) = days * (w.meanLeanKg - center);
            y[i] = prior.alpha * w.deltaFatKg - w.intakeSumKcal + w.workoutSumKcal +
                   (fitK ? 0.0 : prior.kLbm * leanDays);
        }
    }

    Index wCol = 0, iCol = 0;
    if (!fixAlpha) {
        iCol = p - 1;
        wCol = p - 2;
        if (v.orthogonalize) {
            const double ii = X.col(iCol).squaredNorm();
            fit.orthogonalSlope = ii > 0 ? X.col(wCol).dot(X.col(iCol)) / ii : 0.0;
            X.col(wCol) -= fit.orthogonalSlope * X.col(iCol);
        }
    }

    // Unit root-mean-square columns; the model has no intercept, so no centring.
    VectorXd scale(p);
    for (Index j = 0; j < p; ++j) {
        const double rms = std::sqrt(X.col(j).squaredNorm() / n);
        scale[j] = rms > 0 ? rms : 1.0;
    }
    const MatrixXd Xs = X * scale.cwiseInverse().asDiagonal();

    const HuberFit hf = huberRegression(Xs, y, cfg.huber);
    const VectorXd beta = hf.beta.cwiseQuotient(scale);
    fit.converged = hf.converged;

    ModelParams &out = fit.params;
    if (!fixAlpha) {
        const double bWork = beta[wCol];
        const double bIntake = beta[iCol] - fit.orthogonalSlope * bWork;
        out.alpha = 1.0 / bIntake;
        out.c = 1.0 + out.alpha * bWork;
        out.kLbm = fitK ? -out.alpha * beta[1] : prior.kLbm;
        out.bmr0 = -out.alpha * beta[0] - (fitK ? out.kLbm * center : 0.0);
    } else {
        out.alpha = prior.alpha;
        out.c = beta[0];
        out.kLbm = fitK ? -beta[2] : prior.kLbm;
        out.bmr0 = -beta[1] - (fitK ? out.kLbm * center : 0.0);
    }

    fit.metrics = evaluateFit(windows, out);
    fit.metrics.conditionNumber = conditionNumber(Xs);
    fit.metrics.iterations = hf.iterations;
    fit.predictedDeltaKg = predictDelta(windows, out);

    std::ostringstream msg;
    msg << "fit: alpha=" << out.alpha << " C=" << out.c << " BMR0=" << out.bmr0
        << " k_LBM=" << out.kLbm << " cond=" << fit.metrics.conditionNumber
        << " windows=" << n;
    log::debug(msg.str());
    return fit;
}

ConfidenceInterval bootstrapIntervals(const std::vector<Window> &windows,
                                      const ModelParams &prior,
                                      const EstimatorConfig &cfg, RunBudget &budget) {
    if (windows.empty()) throw Error("No windows to bootstrap");

    ConfidenceInterval ci;
    ci.requested = cfg.bootstrapResamples;

    std::mt19937 rng(cfg.bootstrapSeed);
    std::uniform_int_distribution<size_t> pick(0, windows.size() - 1);
    std::vector<double> alpha, c, bmr0, kLbm;
    std::vector<Window> sample(windows.size());

    for (int b = 0; b < cfg.bootstrapResamples; ++b) {
        if (!budget.tick()) {
            ci.truncated = true;
            break;
        }
        for (auto &w : sample) w = windows[pick(rng)];

        const ModelParams p = fitParameters(sample, prior, cfg).params;
        if (!allFinite(p)) {
            ++ci.failed;
            continue;
        }
        alpha.push_back(p.alpha);
        c.push_back(p.c);
        bmr0.push_back(p.bmr0);
        kLbm.push_back(p.kLbm);
        ++ci.completed;
    }

    ci.lo = {percentile(alpha, cfg.ciLowPercent), percentile(c, cfg.ciLowPercent),
             percentile(bmr0, cfg.ciLowPercent), percentile(kLbm, cfg.ciLowPercent)};
    ci.hi = {percentile(alpha, cfg.ciHighPercent), percentile(c, cfg.ciHighPercent),
             percentile(bmr0, cfg.ciHighPercent), percentile(kLbm, cfg.ciHighPercent)};

    if (ci.truncated) {
        log::warn("bootstrap stopped by the run budget after " +
                  std::to_string(ci.completed + ci.failed) + " of " +
                  std::to_string(ci.requested) + " resamples");
    }
    if (ci.failed > 0) {
        log::debug("bootstrap: " + std::to_string(ci.failed) +
                   " resamples gave non-finite parameters");
    }
    return ci;
}

ImpliedAlphaStats impliedAlpha(const std::vector<Window> &windows,
                               const ModelParams &p) {
    std::vector<double> values;
    for (const Window &w : windows) {
        if (w.deltaFatKg == 0.0) continue;
        const double net = w.intakeSumKcal - (1.0 - p.c) * w.workoutSumKcal -
                           (p.bmr0 + p.kLbm * w.meanLeanKg) * w.lengthDays;
        const double a = net / w.deltaFatKg;
        if (std::isfinite(a)) values.push_back(a);
    }
    ImpliedAlphaStats s;
    s.count = static_cast<int>(values.size());
    if (values.empty()) {
        s.min = s.median = s.max = std::numeric_limits<double>::quiet_NaN();
        return s;
    }
    s.min = *std::min_element(values.begin(), values.end());
    s.max = *std::max_element(values.begin(), values.end());
    s.median = percentile(values, 50.0);
    return s;
}

}  // namespace fmcal
