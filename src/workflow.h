#ifndef FMCAL_WORKFLOW_H
#define FMCAL_WORKFLOW_H

#include <string>
#include <vector>

#include "params.h"
#include "validator.h"
#include "windows.h"

namespace fmcal {

struct WorkflowConfig {
    double capFraction = 0.03;
    double maxAbsBiasKg = 0.2;
    int minWindows = 2;
    double maxMaeKg = 1.0;
};

// prior + sign(fitted - prior) * min(|fitted - prior|, capFraction * |prior|)
double capValue(double prior, double fitted, double capFraction);
ModelParams applyCaps(const ModelParams &prior, const ModelParams &fitted,
                      double capFraction);

// Throws GuardrailViolation listing every tripped check.
void checkGuardrails(const FitMetrics &metrics, const WorkflowConfig &cfg);

// PENDING proposal against `base`. A guardrail trip is recorded in
// capReason as "NO UPDATE: ..." instead of failing.
ParameterProposal buildProposal(const ParameterSet &base, const Date &asof,
                                const ValidatedFit &fit,
                                const std::vector<Window> &windows,
                                const WorkflowConfig &cfg,
                                const std::string &createdAt);

}  // namespace fmcal

#endif  // FMCAL_WORKFLOW_H
