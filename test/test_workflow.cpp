// Proposal caps, guardrails and the versioned approval ledger.

#include "errors.h"
#include "estimator.h"
#include "memory_store.h"
#include "synthetic.h"
#include "workflow.h"

#include <string>
#include <vector>

#include <gtest/gtest.h>

using namespace fmcal;

namespace {

const ModelParams kTruth{9200.0, 0.3, 700.0, 12.0};

ParameterSet baseSet(const Date &start = Date::fromCivil(2024, 1, 1)) {
    ParameterSet s;
    s.effectiveStart = start;
    s.params = ModelParams();
    s.method = "seed";
    return s;
}

ParameterProposal pendingOn(const ParameterSet &base, const Date &asof) {
    ParameterProposal p;
    p.asof = asof;
    p.baseVersion = base.versionId;
    p.prior = base.params;
    p.fitted = kTruth;
    p.capped = applyCaps(p.prior, p.fitted, p.capFraction);
    p.capReason = "OK";
    p.method = "huber";
    return p;
}

ValidatedFit exactFit(const std::vector<Window> &windows) {
    ValidatedFit v;
    v.fit = fitParameters(windows, ModelParams(), EstimatorConfig());
    return v;
}

}  // namespace

// ============================================================================
// Caps
// ============================================================================

TEST(Caps, LimitsTheRelativeStep) {
    EXPECT_DOUBLE_EQ(capValue(9500.0, 12000.0, 0.03), 9785.0);
    EXPECT_DOUBLE_EQ(capValue(9500.0, 9400.0, 0.03), 9400.0);
    EXPECT_DOUBLE_EQ(capValue(0.25, 0.1, 0.03), 0.2425);
    EXPECT_DOUBLE_EQ(capValue(0.0, 0.1, 0.03), 0.0);
}

TEST(Caps, AppliesToEveryParameter) {
    const ModelParams prior;
    const ModelParams capped = applyCaps(prior, ModelParams{8000.0, 0.5, 900.0, 20.0}, 0.03);
    EXPECT_DOUBLE_EQ(capped.alpha, prior.alpha * 0.97);
    EXPECT_DOUBLE_EQ(capped.c, prior.c * 1.03);
    EXPECT_DOUBLE_EQ(capped.bmr0, prior.bmr0 * 1.03);
    EXPECT_DOUBLE_EQ(capped.kLbm, prior.kLbm * 1.03);
}

// ============================================================================
// Guardrails
// ============================================================================

TEST(Guardrails, PassWithinLimits) {
    FitMetrics m;
    m.biasKg = -0.19;
    m.maeKg = 0.9;
    m.windowCount = 2;
    EXPECT_NO_THROW(checkGuardrails(m, WorkflowConfig()));
}

TEST(Guardrails, ListEveryTrippedCheck) {
    FitMetrics m;
    m.biasKg = -0.3;
    m.maeKg = 1.5;
    m.windowCount = 1;
    try {
        checkGuardrails(m, WorkflowConfig());
        FAIL() << "expected GuardrailViolation";
    } catch (const GuardrailViolation &e) {
        ASSERT_EQ(e.reasons.size(), 3u);
        EXPECT_EQ(e.reasons[0], "|bias|=0.300>0.200");
        EXPECT_EQ(e.reasons[1], "insufficient windows (1<2)");
        EXPECT_EQ(e.reasons[2], "mae=1.500>1.000");
        EXPECT_EQ(std::string(e.what()),
                  "|bias|=0.300>0.200; insufficient windows (1<2); mae=1.500>1.000");
    }
}

// ============================================================================
// Proposal
// ============================================================================

TEST(Proposal, GoodFitIsCappedAndMarkedOk) {
    ParameterSet base = baseSet();
    base.versionId = "v2024_01_01";
    const auto windows = synth::varietyWindows(kTruth);
    const ParameterProposal p = buildProposal(base, Date::fromCivil(2024, 2, 1),
                                              exactFit(windows), windows, WorkflowConfig(),
                                              "2024-02-01T06:00:00Z");
    EXPECT_EQ(p.capReason, "OK");
    EXPECT_EQ(p.method, "huber");
    EXPECT_EQ(p.baseVersion, "v2024_01_01");
    EXPECT_EQ(p.status, ProposalStatus::Pending);
    EXPECT_NEAR(p.fitted.alpha, kTruth.alpha, 1e-3);
    EXPECT_DOUBLE_EQ(p.capped.alpha, 9500.0 * 0.97);
    EXPECT_DOUBLE_EQ(p.capped.bmr0, 600.0 * 1.03);
    EXPECT_EQ(p.metrics.windowCount, 12);
    EXPECT_EQ(p.impliedAlpha.count, 12);
    EXPECT_EQ(p.createdAt, "2024-02-01T06:00:00Z");
}

TEST(Proposal, GuardrailTripIsRecordedNotThrown) {
    const auto windows = synth::varietyWindows(kTruth, 1);
    ValidatedFit v;
    v.fit.params = kTruth;
    v.fallbackUsed = true;
    v.reason = "alpha out of range";
    const ParameterProposal p =
        buildProposal(baseSet(), Date::fromCivil(2024, 2, 1), v, windows, WorkflowConfig(), "");
    EXPECT_EQ(p.capReason, "NO UPDATE: insufficient windows (1<2)");
    EXPECT_EQ(p.method, "constrained fallback (alpha out of range)");
    EXPECT_TRUE(p.fallbackUsed);
}

// ============================================================================
// Ledger
// ============================================================================

TEST(Ledger, IdsAreSequentialAndDeduplicated) {
    Ledger l;
    EXPECT_EQ(nextProposalId(l), "p-000001");
    l.proposals.resize(41);
    EXPECT_EQ(nextProposalId(l), "p-000042");

    const Date d = Date::fromCivil(2024, 3, 5);
    EXPECT_EQ(nextVersionId(l, d), "v2024_03_05");
    ParameterSet s;
    s.versionId = "v2024_03_05";
    l.sets.push_back(s);
    EXPECT_EQ(nextVersionId(l, d), "v2024_03_05_2");
    s.versionId = "v2024_03_05_2";
    l.sets.push_back(s);
    EXPECT_EQ(nextVersionId(l, d), "v2024_03_05_3");
}

TEST(Ledger, FailedTransitionLeavesTheInputUntouched) {
    Ledger l = applySeed(Ledger(), baseSet());
    ParameterProposal p = pendingOn(l.sets[0], Date::fromCivil(2023, 12, 1));
    std::string id;
    l = applyProposal(l, p, &id);

    const Ledger before = l;
    EXPECT_THROW(applyApproval(l, id, "ana", "", "t", nullptr), ApprovalConflictError);
    EXPECT_EQ(l.sets.size(), before.sets.size());
    EXPECT_FALSE(l.sets[0].hasEnd);
    EXPECT_EQ(l.proposals[0].status, ProposalStatus::Pending);
    EXPECT_TRUE(l.audit.empty());
}

// ============================================================================
// Memory store workflow
// ============================================================================

TEST(MemoryStore, SeedOnlyOnce) {
    MemoryParameterStore store;
    EXPECT_FALSE(store.activeAt(Date::fromCivil(2024, 1, 1)).has_value());
    store.seed(baseSet());
    const auto active = store.activeAt(Date::fromCivil(2024, 6, 1));
    ASSERT_TRUE(active.has_value());
    EXPECT_EQ(active->versionId, "v2024_01_01");
    EXPECT_TRUE(active->active());
    EXPECT_FALSE(store.activeAt(Date::fromCivil(2023, 12, 31)).has_value());
    EXPECT_THROW(store.seed(baseSet()), StoreError);
}

TEST(MemoryStore, ApprovalPromotesAndClosesThePreviousSet) {
    MemoryParameterStore store;
    store.seed(baseSet());
    const ParameterSet seed = store.find("v2024_01_01");
    const Date asof = Date::fromCivil(2024, 2, 1);
    const std::string id = store.addProposal(pendingOn(seed, asof));
    EXPECT_EQ(id, "p-000001");
    EXPECT_EQ(store.proposal(id).status, ProposalStatus::Pending);

    const ParameterSet created = store.approve(id, "ana", "looks right", "2024-02-02T09:00:00Z");
    EXPECT_EQ(created.versionId, "v2024_02_01");
    EXPECT_EQ(created.effectiveStart, asof);
    EXPECT_EQ(created.sourceProposal, id);
    EXPECT_EQ(created.approvedBy, "ana");
    EXPECT_DOUBLE_EQ(created.params.alpha, store.proposal(id).capped.alpha);

    const ParameterSet closed = store.find("v2024_01_01");
    ASSERT_TRUE(closed.hasEnd);
    EXPECT_EQ(closed.effectiveEnd, asof - 1);
    EXPECT_EQ(store.activeAt(asof - 1)->versionId, "v2024_01_01");
    EXPECT_EQ(store.activeAt(asof)->versionId, "v2024_02_01");
    EXPECT_EQ(store.history().size(), 2u);

    const ParameterProposal reviewed = store.proposal(id);
    EXPECT_EQ(reviewed.status, ProposalStatus::Approved);
    EXPECT_EQ(reviewed.reviewer, "ana");
    EXPECT_EQ(reviewed.notes, "looks right");

    const auto audit = store.auditLog();
    ASSERT_EQ(audit.size(), 1u);
    EXPECT_EQ(audit[0].action, AuditAction::ChangeParams);
    EXPECT_EQ(audit[0].previousVersion, "v2024_01_01");
    EXPECT_EQ(audit[0].newVersion, "v2024_02_01");
    EXPECT_EQ(audit[0].rationale, "looks right");
}

TEST(MemoryStore, RejectionIsAuditedAndChangesNothingElse) {
    MemoryParameterStore store;
    store.seed(baseSet());
    const std::string id =
        store.addProposal(pendingOn(store.find("v2024_01_01"), Date::fromCivil(2024, 2, 1)));
    store.reject(id, "ben", "too few weigh-ins", "2024-02-02T09:00:00Z");

    EXPECT_EQ(store.proposal(id).status, ProposalStatus::Rejected);
    EXPECT_EQ(store.history().size(), 1u);
    EXPECT_TRUE(store.history()[0].active());
    const auto audit = store.auditLog();
    ASSERT_EQ(audit.size(), 1u);
    EXPECT_EQ(audit[0].action, AuditAction::Defer);
    EXPECT_EQ(audit[0].actor, "ben");
    EXPECT_TRUE(audit[0].newVersion.empty());
}

TEST(MemoryStore, ReviewingTwiceConflicts) {
    MemoryParameterStore store;
    store.seed(baseSet());
    const std::string id =
        store.addProposal(pendingOn(store.find("v2024_01_01"), Date::fromCivil(2024, 2, 1)));
    store.approve(id, "ana", "", "t1");
    EXPECT_THROW(store.approve(id, "ana", "", "t2"), ApprovalConflictError);
    EXPECT_THROW(store.reject(id, "ben", "", "t2"), ApprovalConflictError);
    EXPECT_EQ(store.auditLog().size(), 1u);
}

TEST(MemoryStore, StaleBaseVersionConflicts) {
    MemoryParameterStore store;
    store.seed(baseSet());
    const ParameterSet seed = store.find("v2024_01_01");
    const std::string first = store.addProposal(pendingOn(seed, Date::fromCivil(2024, 2, 1)));
    const std::string second = store.addProposal(pendingOn(seed, Date::fromCivil(2024, 3, 1)));
    EXPECT_EQ(second, "p-000002");

    store.approve(first, "ana", "", "t1");
    EXPECT_THROW(store.approve(second, "ana", "", "t2"), ApprovalConflictError);
    EXPECT_EQ(store.proposal(second).status, ProposalStatus::Pending);
    EXPECT_EQ(store.history().size(), 2u);
}

TEST(MemoryStore, UnknownIdsAreStoreErrors) {
    MemoryParameterStore store;
    store.seed(baseSet());
    EXPECT_THROW(store.find("v1999_01_01"), StoreError);
    EXPECT_THROW(store.proposal("p-000009"), StoreError);
    EXPECT_THROW(store.approve("p-000009", "ana", "", "t"), StoreError);
}
