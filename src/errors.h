#ifndef FMCAL_ERRORS_H
#define FMCAL_ERRORS_H

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace fmcal {

struct Error : std::runtime_error {
    using std::runtime_error::runtime_error;
};

struct ParseError : Error {
    using Error::Error;
};

// A single window lacks the data it needs. The window is dropped; the run
// goes on.
struct DataGapError : Error {
    using Error::Error;
};

// The series has no usable measurement at all. Fatal.
struct NoMeasurementsError : Error {
    using Error::Error;
};

struct IllConditionedFitError : Error {
    IllConditionedFitError(const std::string &what, double conditionNumber)
        : Error(what), conditionNumber(conditionNumber) {}
    double conditionNumber;
};

struct ImplausibleParameterError : Error {
    ImplausibleParameterError(const std::string &what,
                              std::vector<std::string> issues = {})
        : Error(what), issues(std::move(issues)) {}
    std::vector<std::string> issues;
};

// Bias / MAE / window-count checks tripped. The proposal is still written,
// with the reasons in cap_reason.
struct GuardrailViolation : Error {
    GuardrailViolation(const std::string &what, std::vector<std::string> reasons)
        : Error(what), reasons(std::move(reasons)) {}
    std::vector<std::string> reasons;
};

// Stale base version or a proposal that was already reviewed.
struct ApprovalConflictError : Error {
    using Error::Error;
};

struct BudgetExceededError : Error {
    using Error::Error;
};

struct StoreError : Error {
    using Error::Error;
};

}  // namespace fmcal

#endif  // FMCAL_ERRORS_H
