#ifndef FMCAL_STORE_H
#define FMCAL_STORE_H

#include <optional>
#include <string>
#include <vector>

#include "date.h"
#include "params.h"

namespace fmcal {

// Everything a parameter store persists.
struct Ledger {
    std::vector<ParameterSet> sets;
    std::vector<ParameterProposal> proposals;
    std::vector<AuditEntry> audit;
};

// Pure transitions on a ledger. Each returns the updated copy and leaves the
// input untouched, so a failed transition never leaves partial state.

const ParameterSet *activeSetAt(const Ledger &ledger, const Date &d);
const ParameterSet *openSet(const Ledger &ledger);

// "vYYYY_MM_DD", with "_2", "_3", ... appended while the id is taken.
std::string nextVersionId(const Ledger &ledger, const Date &effectiveStart);
// "p-000001", "p-000002", ...
std::string nextProposalId(const Ledger &ledger);

Ledger applySeed(const Ledger &ledger, ParameterSet initial);
Ledger applyProposal(const Ledger &ledger, ParameterProposal proposal,
                     std::string *assignedId);
Ledger applyApproval(const Ledger &ledger, const std::string &proposalId,
                     const std::string &reviewer, const std::string &notes,
                     const std::string &at, ParameterSet *created);
Ledger applyRejection(const Ledger &ledger, const std::string &proposalId,
                      const std::string &reviewer, const std::string &notes,
                      const std::string &at);

class ParameterStore {
public:
    virtual ~ParameterStore() = default;

    virtual std::optional<ParameterSet> activeAt(const Date &d) const = 0;
    // Throws StoreError for an unknown version.
    virtual ParameterSet find(const std::string &versionId) const = 0;
    virtual std::vector<ParameterSet> history() const = 0;
    // Inserts the first parameter set. Throws StoreError if any exist.
    virtual void seed(const ParameterSet &initial) = 0;

    // Stores a PENDING proposal and returns its assigned id.
    virtual std::string addProposal(const ParameterProposal &proposal) = 0;
    virtual ParameterProposal proposal(const std::string &proposalId) const = 0;
    virtual std::vector<ParameterProposal> proposals() const = 0;

    // Promotes a PENDING proposal whose base version is still active.
    // Throws ApprovalConflictError otherwise.
    virtual ParameterSet approve(const std::string &proposalId,
                                 const std::string &reviewer,
                                 const std::string &notes, const std::string &at) = 0;
    virtual void reject(const std::string &proposalId, const std::string &reviewer,
                        const std::string &notes, const std::string &at) = 0;

    virtual std::vector<AuditEntry> auditLog() const = 0;
};

}  // namespace fmcal

#endif  // FMCAL_STORE_H
