#include "workflow.h"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

#include "errors.h"
#include "estimator.h"
#include "log.h"

namespace fmcal {

double capValue(double prior, double fitted, double capFraction) {
    const double delta = fitted - prior;
    const double limit = capFraction * std::abs(prior);
    return prior + std::copysign(std::min(std::abs(delta), limit), delta);
}

ModelParams applyCaps(const ModelParams &prior, const ModelParams &fitted,
                      double capFraction) {
    ModelParams out;
    out.alpha = capValue(prior.alpha, fitted.alpha, capFraction);
    out.c = capValue(prior.c, fitted.c, capFraction);
    out.bmr0 = capValue(prior.bmr0, fitted.bmr0, capFraction);
    out.kLbm = capValue(prior.kLbm, fitted.kLbm, capFraction);
    return out;
}

void checkGuardrails(const FitMetrics &m, const WorkflowConfig &cfg) {
    std::vector<std::string> reasons;
    std::ostringstream os;
    os << std::fixed << std::setprecision(3);
    if (!(std::abs(m.biasKg) <= cfg.maxAbsBiasKg)) {
        os.str("");
        os << "|bias|=" << std::abs(m.biasKg) << ">" << cfg.maxAbsBiasKg;
        reasons.push_back(os.str());
    }
    if (m.windowCount < cfg.minWindows) {
        reasons.push_back("insufficient windows (" + std::to_string(m.windowCount) +
                          "<" + std::to_string(cfg.minWindows) + ")");
    }
    if (!(m.maeKg <= cfg.maxMaeKg)) {
        os.str("");
        os << "mae=" << m.maeKg << ">" << cfg.maxMaeKg;
        reasons.push_back(os.str());
    }
    if (reasons.empty()) return;

    std::string what;
    for (const auto &r : reasons) what += (what.empty() ? "" : "; ") + r;
    throw GuardrailViolation(what, std::move(reasons));
}

ParameterProposal buildProposal(const ParameterSet &base, const Date &asof,
                                const ValidatedFit &fit,
                                const std::vector<Window> &windows,
                                const WorkflowConfig &cfg,
                                const std::string &createdAt) {
    ParameterProposal p;
    p.asof = asof;
    p.baseVersion = base.versionId;
    p.prior = base.params;
    p.fitted = fit.fit.params;
    p.capFraction = cfg.capFraction;
    p.capped = applyCaps(p.prior, p.fitted, cfg.capFraction);
    p.fallbackUsed = fit.fallbackUsed;
    p.method = fit.fallbackUsed ? "constrained fallback (" + fit.reason + ")"
                                : "huber";
    p.metrics = fit.fit.metrics;
    p.metrics.windowCount = static_cast<int>(windows.size());
    p.impliedAlpha = impliedAlpha(windows, p.prior);
    p.createdAt = createdAt;

    try {
        checkGuardrails(p.metrics, cfg);
        p.capReason = "OK";
    } catch (const GuardrailViolation &e) {
        p.capReason = std::string("NO UPDATE: ") + e.what();
        log::warn("Guardrails tripped: " + std::string(e.what()));
    }
    return p;
}

}  // namespace fmcal
