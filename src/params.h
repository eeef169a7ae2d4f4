#ifndef FMCAL_PARAMS_H
#define FMCAL_PARAMS_H

#include <string>
#include <vector>

#include "date.h"

namespace fmcal {

// Energy-balance model:
//   dFat = [intake - (1 - C) workout - (BMR0 + kLbm * lean) days] / alpha
struct ModelParams {
    double alpha = 9500.0;  // kcal per kg of fat mass
    double c = 0.25;        // fraction of workout energy compensated
    double bmr0 = 600.0;    // kcal/day
    double kLbm = 15.0;     // kcal/day per kg lean mass
};

struct FitMetrics {
    double r2 = 0.0;
    double maeKg = 0.0;
    double rmseKg = 0.0;
    double biasKg = 0.0;  // mean(observed - predicted)
    double conditionNumber = 0.0;
    int windowCount = 0;
    int iterations = 0;
};

struct ParameterSet {
    std::string versionId;
    Date effectiveStart;
    bool hasEnd = false;
    Date effectiveEnd;  // inclusive; meaningful only when hasEnd
    ModelParams params;
    FitMetrics metrics;
    std::string method;
    std::string approvedBy;
    std::string approvedAt;
    std::string sourceProposal;

    bool active() const { return !hasEnd; }
    bool covers(const Date &d) const {
        return effectiveStart <= d && (!hasEnd || d <= effectiveEnd);
    }
};

enum class ProposalStatus { Pending, Approved, Rejected };

const char *toString(ProposalStatus s);
ProposalStatus proposalStatusFromString(const std::string &s);

struct ImpliedAlphaStats {
    double min = 0.0;
    double median = 0.0;
    double max = 0.0;
    int count = 0;
};

// Out-of-sample check: parameters fitted on the earlier windows, scored on
// later windows that share no energy day with them.
struct HoldoutMetrics {
    bool evaluated = false;
    Date cutoff;  // training windows end on or before it, test windows start on or after
    int trainWindows = 0;
    int testWindows = 0;
    int discardedWindows = 0;  // straddle the cutoff
    double fittedMaeKg = 0.0;
    double fittedRmseKg = 0.0;
    double fittedBiasKg = 0.0;
    double priorMaeKg = 0.0;
    double priorRmseKg = 0.0;
    double priorBiasKg = 0.0;
};

struct ParameterProposal {
    std::string proposalId;
    Date asof;
    std::string baseVersion;
    ModelParams prior;
    ModelParams fitted;
    ModelParams capped;
    double capFraction = 0.03;
    std::string capReason;
    bool fallbackUsed = false;
    std::string method;
    FitMetrics metrics;
    ImpliedAlphaStats impliedAlpha;
    HoldoutMetrics holdout;
    ProposalStatus status = ProposalStatus::Pending;
    std::string reviewer;
    std::string notes;
    std::string reviewedAt;
    std::string createdAt;
};

enum class AuditAction { ChangeParams, Defer };

const char *toString(AuditAction a);
AuditAction auditActionFromString(const std::string &s);

struct AuditEntry {
    AuditAction action = AuditAction::Defer;
    std::string actor;
    std::string rationale;
    std::string proposalId;
    std::string previousVersion;
    std::string newVersion;
    std::string timestamp;
};

// Inclusive plausibility bounds for each parameter.
struct Range {
    double lo;
    double hi;
    bool contains(double v) const { return v >= lo && v <= hi; }
    double width() const { return hi - lo; }
};

struct ParameterBounds {
    Range alpha{8000.0, 10000.0};
    Range c{0.0, 0.5};
    Range bmr0{200.0, 1000.0};
    Range kLbm{2.0, 25.0};
};

}  // namespace fmcal

#endif  // FMCAL_PARAMS_H
