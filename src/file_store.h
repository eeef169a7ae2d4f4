#ifndef FMCAL_FILE_STORE_H
#define FMCAL_FILE_STORE_H

#include <filesystem>

#include "store.h"

namespace fmcal {

// Parameter store kept as three tab-separated tables: parameter_sets.tsv,
// proposals.tsv and audit.tsv. Each write produces a new generation
// directory (gen-000001, gen-000002, ...) holding all three tables, and the
// one-line CURRENT file names the live generation. Replacing CURRENT is the
// single rename that commits a write; the previous generation is then
// removed. Every operation holds the directory lock.
class FileParameterStore : public ParameterStore {
public:
    // Creates the directory if needed.
    explicit FileParameterStore(std::filesystem::path dir);

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

    const std::filesystem::path &directory() const { return dir_; }

private:
    // 0 for an empty store.
    int currentGeneration() const;
    Ledger load() const;
    void save(const Ledger &ledger) const;

    std::filesystem::path dir_;
};

}  // namespace fmcal

#endif  // FMCAL_FILE_STORE_H
