#ifndef FMCAL_MEMORY_STORE_H
#define FMCAL_MEMORY_STORE_H

#include <mutex>
#include <utility>

#include "store.h"

namespace fmcal {

// Process-local store; every operation holds one mutex.
class MemoryParameterStore : public ParameterStore {
public:
    MemoryParameterStore() = default;
    explicit MemoryParameterStore(Ledger ledger) : ledger_(std::move(ledger)) {}

    std::optional<ParameterSet> activeAt(const Date &d) const override;
    ParameterSet find(const std::string &versionId) const override;
    std::vector<ParameterSet> history() const override;
    void seed(const ParameterSet &initial) override;

    std::string addProposal(const ParameterProposal &proposal) override;
    ParameterProposal proposal(const std::string &proposalId) const override;
    std::vector<ParameterProposal> proposals() const override;

    ParameterSet approve(const std::string &proposalId, const std::string &reviewer,
                         const std::string &notes, const std::string &at) override;
    void reject(const std::string &proposalId, const std::string &reviewer,
                const std::string &notes, const std::string &at) override;

    std::vector<AuditEntry> auditLog() const override;

private:
    mutable std::mutex mutex_;
    Ledger ledger_;
};

}  // namespace fmcal

#endif  // FMCAL_MEMORY_STORE_H
