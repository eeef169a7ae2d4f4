#ifndef FMCAL_VALIDATOR_H
#define FMCAL_VALIDATOR_H

#include <string>
#include <vector>

#include "estimator.h"
#include "params.h"
#include "windows.h"

namespace fmcal {

struct ValidatorConfig {
    ParameterBounds bounds;
    double maxConditionNumber = 1e4;
};

// Bound violations, non-positive alpha and non-finite values, one message
// per problem. Empty when the set is plausible.
std::vector<std::string> plausibilityIssues(const ModelParams &p,
                                            const ParameterBounds &bounds);

// Throws IllConditionedFitError or ImplausibleParameterError.
void validateFit(const ParameterFit &fit, const ValidatorConfig &cfg);

// Holds alpha and k_LBM at the prior and solves the remaining two-parameter
// system for C and BMR0 as the smallest bound-scaled correction to the prior,
// then clips both to bounds. Throws ImplausibleParameterError when the
// result cannot be trusted.
ParameterFit constrainedFallback(const std::vector<Window> &windows,
                                 const ModelParams &prior,
                                 const ValidatorConfig &cfg);

struct ValidatedFit {
    ParameterFit fit;
    bool fallbackUsed = false;
    std::string reason;  // why the free fit was rejected
};

// Free fit, validation and, when needed, the fallback.
ValidatedFit fitAndValidate(const std::vector<Window> &windows,
                            const ModelParams &prior,
                            const EstimatorConfig &estimator,
                            const ValidatorConfig &cfg);

}  // namespace fmcal

#endif  // FMCAL_VALIDATOR_H
