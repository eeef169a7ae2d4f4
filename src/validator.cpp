#include "validator.h"

#include <algorithm>
#include <cmath>
#include <sstream>

#include <Eigen/Dense>

#include "errors.h"
#include "log.h"

namespace fmcal {

namespace {

void checkRange(const char *name, double v, const Range &r,
                std::vector<std::string> &issues) {
    std::ostringstream msg;
    if (!std::isfinite(v)) {
        msg << name << " is not finite";
    } else if (!r.contains(v)) {
        msg << name << "=" << v << " outside [" << r.lo << ", " << r.hi << "]";
    } else {
        return;
    }
    issues.push_back(msg.str());
}

std::string join(const std::vector<std::string> &items) {
    std::string out;
    for (const auto &s : items) {
        if (!out.empty()) out += "; ";
        out += s;
    }
    return out;
}

}  // namespace

std::vector<std::string> plausibilityIssues(const ModelParams &p,
                                            const ParameterBounds &bounds) {
    std::vector<std::string> issues;
    if (std::isfinite(p.alpha) && p.alpha <= 0) {
        std::ostringstream msg;
        msg << "alpha=" << p.alpha << " is not positive";
        issues.push_back(msg.str());
    } else {
        checkRange("alpha", p.alpha, bounds.alpha, issues);
    }
    checkRange("C", p.c, bounds.c, issues);
    checkRange("BMR0", p.bmr0, bounds.bmr0, issues);
    checkRange("k_LBM", p.kLbm, bounds.kLbm, issues);
    return issues;
}

void validateFit(const ParameterFit &fit, const ValidatorConfig &cfg) {
    const double cond = fit.metrics.conditionNumber;
    if (!(cond <= cfg.maxConditionNumber)) {
        std::ostringstream msg;
        msg << "Design condition number " << cond << " exceeds "
            << cfg.maxConditionNumber;
        throw IllConditionedFitError(msg.str(), cond);
    }
    std::vector<std::string> issues = plausibilityIssues(fit.params, cfg.bounds);
    if (!issues.empty()) {
        const std::string what = "Implausible parameters: " + join(issues);
        throw ImplausibleParameterError(what, std::move(issues));
    }
}

ParameterFit constrainedFallback(const std::vector<Window> &windows,
                                 const ModelParams &prior,
                                 const ValidatorConfig &cfg) {
    using namespace Eigen;
    if (windows.empty()) {
        throw ImplausibleParameterError("Fallback has no windows to fit");
    }
    std::vector<std::string> priorIssues;
    checkRange("prior alpha", prior.alpha, cfg.bounds.alpha, priorIssues);
    checkRange("prior k_LBM", prior.kLbm, cfg.bounds.kLbm, priorIssues);
    if (!priorIssues.empty()) {
        const std::string what = "Fallback cannot hold " + join(priorIssues);
        throw ImplausibleParameterError(what, std::move(priorIssues));
    }

    // alpha*dFat - intake + workout + k*lean*days = C*workout - BMR0*days
    const Index n = static_cast<Index>(windows.size());
    MatrixXd A(n, 2);
    VectorXd y(n);
    for (Index i = 0; i < n; ++i) {
        const Window &w = windows[i];
        A(i, 0) = w.workoutSumKcal;
        A(i, 1) = -static_cast<double>(w.lengthDays);
        y[i] = prior.alpha * w.deltaFatKg - w.intakeSumKcal + w.workoutSumKcal +
               prior.kLbm * w.meanLeanKg * w.lengthDays;
    }

    // Solve for the deviation from the prior in bound-width units; the
    // minimum-norm solution leaves unidentified directions at the prior.
    const Vector2d prior2(prior.c, prior.bmr0);
    const Vector2d width(cfg.bounds.c.width() > 0 ? cfg.bounds.c.width() : 1.0,
                         cfg.bounds.bmr0.width() > 0 ? cfg.bounds.bmr0.width() : 1.0);
    const MatrixXd As = A * width.asDiagonal();
    const VectorXd r = y - A * prior2;
    const VectorXd step = As.completeOrthogonalDecomposition().solve(r);
    const Vector2d sol = prior2 + width.cwiseProduct(step);

    if (!std::isfinite(sol[0]) || !std::isfinite(sol[1])) {
        throw ImplausibleParameterError("Fallback produced non-finite C or BMR0");
    }

    ParameterFit fit;
    fit.params = prior;
    fit.params.c = std::clamp(sol[0], cfg.bounds.c.lo, cfg.bounds.c.hi);
    fit.params.bmr0 = std::clamp(sol[1], cfg.bounds.bmr0.lo, cfg.bounds.bmr0.hi);
    for (const Window &w : windows) fit.leanCenterKg += w.meanLeanKg / n;

    fit.metrics = evaluateFit(windows, fit.params);
    fit.metrics.conditionNumber = conditionNumber(As);
    fit.predictedDeltaKg = predictDelta(windows, fit.params);
    fit.converged = true;

    std::vector<std::string> issues = plausibilityIssues(fit.params, cfg.bounds);
    if (!issues.empty()) {
        const std::string what = "Fallback parameters implausible: " + join(issues);
        throw ImplausibleParameterError(what, std::move(issues));
    }
    return fit;
}

ValidatedFit fitAndValidate(const std::vector<Window> &windows,
                            const ModelParams &prior,
                            const EstimatorConfig &estimator,
                            const ValidatorConfig &cfg) {
    ValidatedFit out;
    out.fit = fitParameters(windows, prior, estimator);
    try {
        validateFit(out.fit, cfg);
        return out;
    } catch (const IllConditionedFitError &e) {
        out.reason = e.what();
    } catch (const ImplausibleParameterError &e) {
        out.reason = e.what();
    }

    log::warn(out.reason + "; using constrained fallback");
    out.fit = constrainedFallback(windows, prior, cfg);
    out.fallbackUsed = true;
    return out;
}

}  // namespace fmcal
