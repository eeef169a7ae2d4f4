#include "file_store.h"

#include <cstdio>

#include "errors.h"
#include "log.h"
#include "table.h"

namespace fmcal {

namespace fs = std::filesystem;

namespace {

const char *kSetsFile = "parameter_sets.tsv";
const char *kProposalsFile = "proposals.tsv";
const char *kAuditFile = "audit.tsv";
const char *kLockDir = ".lock";
const char *kCurrentFile = "CURRENT";

fs::path generationDir(const fs::path &dir, int generation) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "gen-%06d", generation);
    return dir / buf;
}

const char *kSetsHeader =
    "version\tstart\tend\talpha\tc\tbmr0\tk_lbm\tr2\tmae\trmse\tbias\tcond\t"
    "windows\titerations\tmethod\tapproved_by\tapproved_at\tsource_proposal";
constexpr size_t kSetsColumns = 18;

const char *kProposalsHeader =
    "id\tasof\tbase\tprior_alpha\tprior_c\tprior_bmr0\tprior_k_lbm\t"
    "fitted_alpha\tfitted_c\tfitted_bmr0\tfitted_k_lbm\t"
    "capped_alpha\tcapped_c\tcapped_bmr0\tcapped_k_lbm\tcap_fraction\tcap_reason\t"
    "fallback\tmethod\tr2\tmae\trmse\tbias\tcond\twindows\titerations\t"
    "implied_alpha_min\timplied_alpha_median\timplied_alpha_max\timplied_alpha_n\t"
    "status\treviewer\tnotes\treviewed_at\tcreated_at\t"
    "holdout_cutoff\tholdout_train\tholdout_test\tholdout_dropped\t"
    "holdout_mae\tholdout_rmse\tholdout_bias\t"
    "holdout_prior_mae\tholdout_prior_rmse\tholdout_prior_bias";
constexpr size_t kProposalsColumns = 45;

const char *kAuditHeader =
    "action\tactor\trationale\tproposal\tprevious_version\tnew_version\ttimestamp";
constexpr size_t kAuditColumns = 7;

using table::formatDouble;
using table::parseDouble;
using table::parseInt;

void putParams(table::Row &row, const ModelParams &p) {
    row.push_back(formatDouble(p.alpha));
    row.push_back(formatDouble(p.c));
    row.push_back(formatDouble(p.bmr0));
    row.push_back(formatDouble(p.kLbm));
}

ModelParams getParams(const table::Row &row, size_t at) {
    ModelParams p;
    p.alpha = parseDouble(row[at]);
    p.c = parseDouble(row[at + 1]);
    p.bmr0 = parseDouble(row[at + 2]);
    p.kLbm = parseDouble(row[at + 3]);
    return p;
}

void putMetrics(table::Row &row, const FitMetrics &m) {
    row.push_back(formatDouble(m.r2));
    row.push_back(formatDouble(m.maeKg));
    row.push_back(formatDouble(m.rmseKg));
    row.push_back(formatDouble(m.biasKg));
    row.push_back(formatDouble(m.conditionNumber));
    row.push_back(std::to_string(m.windowCount));
    row.push_back(std::to_string(m.iterations));
}

FitMetrics getMetrics(const table::Row &row, size_t at) {
    FitMetrics m;
    m.r2 = parseDouble(row[at]);
    m.maeKg = parseDouble(row[at + 1]);
    m.rmseKg = parseDouble(row[at + 2]);
    m.biasKg = parseDouble(row[at + 3]);
    m.conditionNumber = parseDouble(row[at + 4]);
    m.windowCount = parseInt(row[at + 5]);
    m.iterations = parseInt(row[at + 6]);
    return m;
}

Date getDate(const std::string &field) {
    try {
        return Date::parse(field);
    } catch (const ParseError &e) {
        throw StoreError(std::string("Bad date in table: ") + e.what());
    }
}

table::Row toRow(const ParameterSet &s) {
    table::Row row{s.versionId, s.effectiveStart.str(),
                   s.hasEnd ? s.effectiveEnd.str() : "-"};
    putParams(row, s.params);
    putMetrics(row, s.metrics);
    row.insert(row.end(), {s.method, s.approvedBy, s.approvedAt, s.sourceProposal});
    return row;
}

ParameterSet setFromRow(const table::Row &row) {
    ParameterSet s;
    s.versionId = row[0];
    s.effectiveStart = getDate(row[1]);
    s.hasEnd = row[2] != "-";
    if (s.hasEnd) s.effectiveEnd = getDate(row[2]);
    s.params = getParams(row, 3);
    s.metrics = getMetrics(row, 7);
    s.method = row[14];
    s.approvedBy = row[15];
    s.approvedAt = row[16];
    s.sourceProposal = row[17];
    return s;
}

table::Row toRow(const ParameterProposal &p) {
    table::Row row{p.proposalId, p.asof.str(), p.baseVersion};
    putParams(row, p.prior);
    putParams(row, p.fitted);
    putParams(row, p.capped);
    row.push_back(formatDouble(p.capFraction));
    row.push_back(p.capReason);
    row.push_back(p.fallbackUsed ? "1" : "0");
    row.push_back(p.method);
    putMetrics(row, p.metrics);
    row.push_back(formatDouble(p.impliedAlpha.min));
    row.push_back(formatDouble(p.impliedAlpha.median));
    row.push_back(formatDouble(p.impliedAlpha.max));
    row.push_back(std::to_string(p.impliedAlpha.count));
    row.insert(row.end(),
               {toString(p.status), p.reviewer, p.notes, p.reviewedAt, p.createdAt});

    const HoldoutMetrics &h = p.holdout;
    row.push_back(h.evaluated ? h.cutoff.str() : "-");
    row.push_back(std::to_string(h.trainWindows));
    row.push_back(std::to_string(h.testWindows));
    row.push_back(std::to_string(h.discardedWindows));
    for (double v : {h.fittedMaeKg, h.fittedRmseKg, h.fittedBiasKg, h.priorMaeKg,
                     h.priorRmseKg, h.priorBiasKg}) {
        row.push_back(formatDouble(v));
    }
    return row;
}

ParameterProposal proposalFromRow(const table::Row &row) {
    ParameterProposal p;
    p.proposalId = row[0];
    p.asof = getDate(row[1]);
    p.baseVersion = row[2];
    p.prior = getParams(row, 3);
    p.fitted = getParams(row, 7);
    p.capped = getParams(row, 11);
    p.capFraction = parseDouble(row[15]);
    p.capReason = row[16];
    p.fallbackUsed = row[17] == "1";
    p.method = row[18];
    p.metrics = getMetrics(row, 19);
    p.impliedAlpha.min = parseDouble(row[26]);
    p.impliedAlpha.median = parseDouble(row[27]);
    p.impliedAlpha.max = parseDouble(row[28]);
    p.impliedAlpha.count = parseInt(row[29]);
    try {
        p.status = proposalStatusFromString(row[30]);
    } catch (const ParseError &e) {
        throw StoreError(e.what());
    }
    p.reviewer = row[31];
    p.notes = row[32];
    p.reviewedAt = row[33];
    p.createdAt = row[34];

    HoldoutMetrics &h = p.holdout;
    h.evaluated = row[35] != "-";
    if (h.evaluated) h.cutoff = getDate(row[35]);
    h.trainWindows = parseInt(row[36]);
    h.testWindows = parseInt(row[37]);
    h.discardedWindows = parseInt(row[38]);
    h.fittedMaeKg = parseDouble(row[39]);
    h.fittedRmseKg = parseDouble(row[40]);
    h.fittedBiasKg = parseDouble(row[41]);
    h.priorMaeKg = parseDouble(row[42]);
    h.priorRmseKg = parseDouble(row[43]);
    h.priorBiasKg = parseDouble(row[44]);
    return p;
}

table::Row toRow(const AuditEntry &a) {
    return {toString(a.action), a.actor,           a.rationale, a.proposalId,
            a.previousVersion,  a.newVersion,      a.timestamp};
}

AuditEntry auditFromRow(const table::Row &row) {
    AuditEntry a;
    try {
        a.action = auditActionFromString(row[0]);
    } catch (const ParseError &e) {
        throw StoreError(e.what());
    }
    a.actor = row[1];
    a.rationale = row[2];
    a.proposalId = row[3];
    a.previousVersion = row[4];
    a.newVersion = row[5];
    a.timestamp = row[6];
    return a;
}

}  // namespace

FileParameterStore::FileParameterStore(fs::path dir) : dir_(std::move(dir)) {
    std::error_code ec;
    fs::create_directories(dir_, ec);
    if (ec) throw StoreError("Failed to create " + dir_.string() + ": " + ec.message());
}

int FileParameterStore::currentGeneration() const {
    const auto rows = table::read(dir_ / kCurrentFile, 1);
    if (rows.empty()) return 0;
    const int generation = parseInt(rows.front()[0]);
    if (rows.size() != 1 || generation < 1) {
        throw StoreError("Corrupt " + (dir_ / kCurrentFile).string());
    }
    return generation;
}

Ledger FileParameterStore::load() const {
    Ledger ledger;
    const int generation = currentGeneration();
    if (generation == 0) return ledger;

    const fs::path gen = generationDir(dir_, generation);
    if (!fs::is_directory(gen)) throw StoreError("Missing store generation " + gen.string());
    for (const auto &row : table::read(gen / kSetsFile, kSetsColumns)) {
        ledger.sets.push_back(setFromRow(row));
    }
    for (const auto &row : table::read(gen / kProposalsFile, kProposalsColumns)) {
        ledger.proposals.push_back(proposalFromRow(row));
    }
    for (const auto &row : table::read(gen / kAuditFile, kAuditColumns)) {
        ledger.audit.push_back(auditFromRow(row));
    }
    return ledger;
}

void FileParameterStore::save(const Ledger &ledger) const {
    std::vector<table::Row> sets, proposals, audit;
    for (const auto &s : ledger.sets) sets.push_back(toRow(s));
    for (const auto &p : ledger.proposals) proposals.push_back(toRow(p));
    for (const auto &a : ledger.audit) audit.push_back(toRow(a));

    // The tables of the next generation are invisible until CURRENT names
    // it, so a failure anywhere before that rename leaves the store as it was.
    const int current = currentGeneration();
    const fs::path next = generationDir(dir_, current + 1);
    std::error_code ec;
    fs::create_directories(next, ec);
    if (ec) throw StoreError("Failed to create " + next.string() + ": " + ec.message());
    table::writeAtomic(next / kSetsFile, kSetsHeader, sets);
    table::writeAtomic(next / kProposalsFile, kProposalsHeader, proposals);
    table::writeAtomic(next / kAuditFile, kAuditHeader, audit);

    table::writeAtomic(dir_ / kCurrentFile, "generation",
                       {{std::to_string(current + 1)}});

    if (current > 0) {
        const fs::path old = generationDir(dir_, current);
        fs::remove_all(old, ec);
        if (ec) log::warn("Failed to remove " + old.string() + ": " + ec.message());
    }
}

std::optional<ParameterSet> FileParameterStore::activeAt(const Date &d) const {
    table::DirectoryLock lock(dir_ / kLockDir);
    const Ledger ledger = load();
    const ParameterSet *s = activeSetAt(ledger, d);
    if (s == nullptr) return std::nullopt;
    return *s;
}

ParameterSet FileParameterStore::find(const std::string &versionId) const {
    for (const ParameterSet &s : history()) {
        if (s.versionId == versionId) return s;
    }
    throw StoreError("Unknown parameter version: " + versionId);
}

std::vector<ParameterSet> FileParameterStore::history() const {
    table::DirectoryLock lock(dir_ / kLockDir);
    return load().sets;
}

void FileParameterStore::seed(const ParameterSet &initial) {
    table::DirectoryLock lock(dir_ / kLockDir);
    save(applySeed(load(), initial));
}

std::string FileParameterStore::addProposal(const ParameterProposal &proposal) {
    table::DirectoryLock lock(dir_ / kLockDir);
    std::string id;
    save(applyProposal(load(), proposal, &id));
    return id;
}

ParameterProposal FileParameterStore::proposal(const std::string &proposalId) const {
    for (const ParameterProposal &p : proposals()) {
        if (p.proposalId == proposalId) return p;
    }
    throw StoreError("Unknown proposal: " + proposalId);
}

std::vector<ParameterProposal> FileParameterStore::proposals() const {
    table::DirectoryLock lock(dir_ / kLockDir);
    return load().proposals;
}

ParameterSet FileParameterStore::approve(const std::string &proposalId,
                                         const std::string &reviewer,
                                         const std::string &notes,
                                         const std::string &at) {
    table::DirectoryLock lock(dir_ / kLockDir);
    ParameterSet created;
    save(applyApproval(load(), proposalId, reviewer, notes, at, &created));
    return created;
}

void FileParameterStore::reject(const std::string &proposalId,
                                const std::string &reviewer, const std::string &notes,
                                const std::string &at) {
    table::DirectoryLock lock(dir_ / kLockDir);
    save(applyRejection(load(), proposalId, reviewer, notes, at));
}

std::vector<AuditEntry> FileParameterStore::auditLog() const {
    table::DirectoryLock lock(dir_ / kLockDir);
    return load().audit;
}

}  // namespace fmcal
