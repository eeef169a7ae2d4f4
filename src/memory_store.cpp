#include "memory_store.h"

#include "errors.h"

namespace fmcal {

std::optional<ParameterSet> MemoryParameterStore::activeAt(const Date &d) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const ParameterSet *s = activeSetAt(ledger_, d);
    if (s == nullptr) return std::nullopt;
    return *s;
}

ParameterSet MemoryParameterStore::find(const std::string &versionId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const ParameterSet &s : ledger_.sets) {
        if (s.versionId == versionId) return s;
    }
    throw StoreError("Unknown parameter version: " + versionId);
}

std::vector<ParameterSet> MemoryParameterStore::history() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ledger_.sets;
}

void MemoryParameterStore::seed(const ParameterSet &initial) {
    std::lock_guard<std::mutex> lock(mutex_);
    ledger_ = applySeed(ledger_, initial);
}

std::string MemoryParameterStore::addProposal(const ParameterProposal &proposal) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string id;
    ledger_ = applyProposal(ledger_, proposal, &id);
    return id;
}

ParameterProposal MemoryParameterStore::proposal(const std::string &proposalId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const ParameterProposal &p : ledger_.proposals) {
        if (p.proposalId == proposalId) return p;
    }
    throw StoreError("Unknown proposal: " + proposalId);
}

std::vector<ParameterProposal> MemoryParameterStore::proposals() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ledger_.proposals;
}

ParameterSet MemoryParameterStore::approve(const std::string &proposalId,
                                           const std::string &reviewer,
                                           const std::string &notes,
                                           const std::string &at) {
    std::lock_guard<std::mutex> lock(mutex_);
    ParameterSet created;
    ledger_ = applyApproval(ledger_, proposalId, reviewer, notes, at, &created);
    return created;
}

void MemoryParameterStore::reject(const std::string &proposalId,
                                  const std::string &reviewer, const std::string &notes,
                                  const std::string &at) {
    std::lock_guard<std::mutex> lock(mutex_);
    ledger_ = applyRejection(ledger_, proposalId, reviewer, notes, at);
}

std::vector<AuditEntry> MemoryParameterStore::auditLog() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ledger_.audit;
}

}  // namespace fmcal
