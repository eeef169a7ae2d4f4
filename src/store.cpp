#include "store.h"

#include <algorithm>
#include <cstdio>

#include "errors.h"

namespace fmcal {

namespace {

std::vector<ParameterProposal>::iterator findProposal(Ledger &ledger,
                                                      const std::string &id) {
    auto it = std::find_if(ledger.proposals.begin(), ledger.proposals.end(),
                           [&](const ParameterProposal &p) { return p.proposalId == id; });
    if (it == ledger.proposals.end()) throw StoreError("Unknown proposal: " + id);
    return it;
}

void requirePending(const ParameterProposal &p) {
    if (p.status != ProposalStatus::Pending) {
        throw ApprovalConflictError("Proposal " + p.proposalId + " is already " +
                                    toString(p.status));
    }
}

bool versionTaken(const Ledger &ledger, const std::string &id) {
    return std::any_of(ledger.sets.begin(), ledger.sets.end(),
                       [&](const ParameterSet &s) { return s.versionId == id; });
}

}  // namespace

const ParameterSet *activeSetAt(const Ledger &ledger, const Date &d) {
    for (const ParameterSet &s : ledger.sets) {
        if (s.covers(d)) return &s;
    }
    return nullptr;
}

const ParameterSet *openSet(const Ledger &ledger) {
    for (const ParameterSet &s : ledger.sets) {
        if (s.active()) return &s;
    }
    return nullptr;
}

std::string nextVersionId(const Ledger &ledger, const Date &effectiveStart) {
    int y, m, d;
    effectiveStart.toCivil(y, m, d);
    char buf[32];
    std::snprintf(buf, sizeof(buf), "v%04d_%02d_%02d", y, m, d);
    const std::string base = buf;
    std::string id = base;
    for (int n = 2; versionTaken(ledger, id); ++n) {
        id = base + "_" + std::to_string(n);
    }
    return id;
}

std::string nextProposalId(const Ledger &ledger) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "p-%06zu", ledger.proposals.size() + 1);
    return buf;
}

Ledger applySeed(const Ledger &ledger, ParameterSet initial) {
    if (!ledger.sets.empty()) {
        throw StoreError("Store already holds parameter sets; seed only an empty store");
    }
    Ledger next = ledger;
    if (initial.versionId.empty()) {
        initial.versionId = nextVersionId(next, initial.effectiveStart);
    }
    initial.hasEnd = false;
    next.sets.push_back(initial);
    return next;
}

Ledger applyProposal(const Ledger &ledger, ParameterProposal proposal,
                     std::string *assignedId) {
    Ledger next = ledger;
    proposal.proposalId = nextProposalId(next);
    proposal.status = ProposalStatus::Pending;
    proposal.reviewer.clear();
    proposal.reviewedAt.clear();
    if (assignedId != nullptr) *assignedId = proposal.proposalId;
    next.proposals.push_back(proposal);
    return next;
}

Ledger applyApproval(const Ledger &ledger, const std::string &proposalId,
                     const std::string &reviewer, const std::string &notes,
                     const std::string &at, ParameterSet *created) {
    Ledger next = ledger;
    auto prop = findProposal(next, proposalId);
    requirePending(*prop);

    auto open = std::find_if(next.sets.begin(), next.sets.end(),
                             [](const ParameterSet &s) { return s.active(); });
    if (open == next.sets.end()) {
        throw ApprovalConflictError("No active parameter set to supersede");
    }
    if (open->versionId != prop->baseVersion) {
        throw ApprovalConflictError("Proposal " + proposalId + " was based on " +
                                    prop->baseVersion + " but " + open->versionId +
                                    " is now active");
    }
    if (prop->asof <= open->effectiveStart) {
        throw ApprovalConflictError("Proposal " + proposalId + " as-of " +
                                    prop->asof.str() + " does not follow " +
                                    open->versionId + " effective " +
                                    open->effectiveStart.str());
    }

    open->hasEnd = true;
    open->effectiveEnd = prop->asof - 1;

    ParameterSet set;
    set.versionId = nextVersionId(next, prop->asof);
    set.effectiveStart = prop->asof;
    set.params = prop->capped;
    set.metrics = prop->metrics;
    set.method = prop->method;
    set.approvedBy = reviewer;
    set.approvedAt = at;
    set.sourceProposal = proposalId;

    prop->status = ProposalStatus::Approved;
    prop->reviewer = reviewer;
    prop->notes = notes;
    prop->reviewedAt = at;

    AuditEntry entry;
    entry.action = AuditAction::ChangeParams;
    entry.actor = reviewer;
    entry.rationale = notes;
    entry.proposalId = proposalId;
    entry.previousVersion = open->versionId;
    entry.newVersion = set.versionId;
    entry.timestamp = at;

    next.sets.push_back(set);
    next.audit.push_back(entry);
    if (created != nullptr) *created = set;
    return next;
}

Ledger applyRejection(const Ledger &ledger, const std::string &proposalId,
                      const std::string &reviewer, const std::string &notes,
                      const std::string &at) {
    Ledger next = ledger;
    auto prop = findProposal(next, proposalId);
    requirePending(*prop);

    prop->status = ProposalStatus::Rejected;
    prop->reviewer = reviewer;
    prop->notes = notes;
    prop->reviewedAt = at;

    AuditEntry entry;
    entry.action = AuditAction::Defer;
    entry.actor = reviewer;
    entry.rationale = notes;
    entry.proposalId = proposalId;
    entry.previousVersion = prop->baseVersion;
    entry.timestamp = at;
    next.audit.push_back(entry);
    return next;
}

}  // namespace fmcal
