// Tab-separated tables, the file-backed parameter store and the series store.

#include "errors.h"
#include "file_store.h"
#include "series_store.h"
#include "table.h"

#include <cmath>
#include <filesystem>
#include <fstream>
#include <limits>
#include <string>

#include <gtest/gtest.h>

using namespace fmcal;
namespace fs = std::filesystem;

namespace {

class TempDir : public ::testing::Test {
protected:
    void SetUp() override {
        const auto *info = ::testing::UnitTest::GetInstance()->current_test_info();
        dir_ = fs::temp_directory_path() /
               (std::string("fmcal_") + info->test_suite_name() + "_" + info->name());
        fs::remove_all(dir_);
    }
    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    fs::path dir_;
};

ParameterSet seedSet() {
    ParameterSet s;
    s.effectiveStart = Date::fromCivil(2024, 1, 1);
    s.params = ModelParams{9400.0, 0.22, 650.0, 14.0};
    s.metrics.conditionNumber = std::numeric_limits<double>::infinity();
    s.method = "seed";
    return s;
}

ParameterProposal proposalOn(const std::string &base) {
    ParameterProposal p;
    p.asof = Date::fromCivil(2024, 2, 1);
    p.baseVersion = base;
    p.prior = seedSet().params;
    p.fitted = ModelParams{9123.456789, 0.3141592653589793, 701.25, 12.5};
    p.capped = ModelParams{9118.0, 0.2266, 669.5, 14.42};
    p.capReason = "NO UPDATE: mae=1.500>1.000";
    p.fallbackUsed = true;
    p.method = "constrained fallback (alpha=12000 outside [8000, 10000])";
    p.metrics.maeKg = 1.5;
    p.metrics.windowCount = 3;
    p.impliedAlpha = {8800.0, 9100.0, 9900.0, 3};
    p.createdAt = "2024-02-01T06:00:00Z";
    p.holdout.evaluated = true;
    p.holdout.cutoff = Date::fromCivil(2024, 1, 22);
    p.holdout.trainWindows = 3;
    p.holdout.testWindows = 1;
    p.holdout.fittedMaeKg = 0.0123;
    p.holdout.priorBiasKg = -0.25;
    return p;
}

}  // namespace

// ============================================================================
// Table format
// ============================================================================

TEST(Table, EscapesSeparators) {
    const std::string raw = "line one\nline\ttwo \\ done\r";
    const std::string esc = table::escape(raw);
    EXPECT_EQ(esc.find('\t'), std::string::npos);
    EXPECT_EQ(esc.find('\n'), std::string::npos);
    EXPECT_EQ(table::unescape(esc), raw);
}

TEST(Table, NumbersRoundTripExactly) {
    const double v = 0.1 + 0.2;
    EXPECT_EQ(table::parseDouble(table::formatDouble(v)), v);
    EXPECT_TRUE(std::isnan(table::parseDouble(table::formatDouble(kMissing))));
    EXPECT_THROW(table::parseDouble("12abc"), StoreError);
    EXPECT_THROW(table::parseInt(""), StoreError);
}

using TableFile = TempDir;

TEST_F(TableFile, MissingFileIsEmptyAndShortRowsAreRejected) {
    fs::create_directories(dir_);
    EXPECT_TRUE(table::read(dir_ / "absent.tsv", 3).empty());

    table::writeAtomic(dir_ / "t.tsv", "a\tb\tc", {{"1", "", "x\ty"}});
    const auto rows = table::read(dir_ / "t.tsv", 3);
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_EQ(rows[0][1], "");
    EXPECT_EQ(rows[0][2], "x\ty");
    EXPECT_FALSE(fs::exists(dir_ / "t.tsv.tmp"));

    EXPECT_THROW(table::read(dir_ / "t.tsv", 4), StoreError);
}

TEST_F(TableFile, LockIsExclusiveAndReleased) {
    fs::create_directories(dir_);
    const fs::path lock = dir_ / ".lock";
    {
        table::DirectoryLock held(lock);
        EXPECT_TRUE(fs::exists(lock));
        EXPECT_THROW((table::DirectoryLock{lock, 50}), StoreError);
    }
    EXPECT_FALSE(fs::exists(lock));
    EXPECT_NO_THROW((table::DirectoryLock{lock, 50}));
}

TEST_F(TableFile, LeftoverLockNamesItsOwnerAndHowToClearIt) {
    fs::create_directories(dir_);
    const fs::path lock = dir_ / ".lock";
    {
        table::DirectoryLock held(lock);
        std::ifstream in(lock / "owner");
        std::string owner;
        std::getline(in, owner);
        EXPECT_EQ(owner.rfind("pid ", 0), 0u);
    }

    // What a holder killed mid-write leaves behind.
    fs::create_directories(lock);
    std::ofstream(lock / "owner") << "pid 4242 since 2024-01-01T00:00:00Z\n";
    try {
        table::DirectoryLock blocked(lock, 50);
        FAIL() << "lock should be held";
    } catch (const StoreError &e) {
        const std::string msg = e.what();
        EXPECT_NE(msg.find("pid 4242"), std::string::npos);
        EXPECT_NE(msg.find("remove " + lock.string()), std::string::npos);
    }

    fs::remove_all(lock);
    EXPECT_NO_THROW((table::DirectoryLock{lock, 50}));
    EXPECT_FALSE(fs::exists(lock));
}

// ============================================================================
// File parameter store
// ============================================================================

using FileStore = TempDir;

TEST_F(FileStore, PersistsTheWholeWorkflow) {
    std::string id;
    {
        FileParameterStore store(dir_);
        store.seed(seedSet());
        id = store.addProposal(proposalOn("v2024_01_01"));
        EXPECT_EQ(id, "p-000001");
    }

    FileParameterStore reopened(dir_);
    const ParameterSet seed = reopened.find("v2024_01_01");
    EXPECT_DOUBLE_EQ(seed.params.c, 0.22);
    EXPECT_TRUE(std::isinf(seed.metrics.conditionNumber));
    EXPECT_TRUE(seed.active());

    const ParameterProposal p = reopened.proposal(id);
    const ParameterProposal want = proposalOn("v2024_01_01");
    EXPECT_EQ(p.status, ProposalStatus::Pending);
    EXPECT_EQ(p.asof, want.asof);
    EXPECT_EQ(p.capReason, want.capReason);
    EXPECT_EQ(p.method, want.method);
    EXPECT_TRUE(p.fallbackUsed);
    EXPECT_EQ(p.fitted.c, want.fitted.c);
    EXPECT_EQ(p.fitted.alpha, want.fitted.alpha);
    EXPECT_DOUBLE_EQ(p.capped.kLbm, 14.42);
    EXPECT_EQ(p.metrics.windowCount, 3);
    EXPECT_EQ(p.impliedAlpha.count, 3);
    EXPECT_DOUBLE_EQ(p.impliedAlpha.median, 9100.0);
    EXPECT_EQ(p.createdAt, want.createdAt);
    EXPECT_TRUE(p.holdout.evaluated);
    EXPECT_EQ(p.holdout.cutoff, want.holdout.cutoff);
    EXPECT_EQ(p.holdout.testWindows, 1);
    EXPECT_EQ(p.holdout.fittedMaeKg, want.holdout.fittedMaeKg);
    EXPECT_EQ(p.holdout.priorBiasKg, want.holdout.priorBiasKg);

    const std::string notes = "checked against\tthe log\nsecond line \\ ok";
    reopened.approve(id, "ana", notes, "2024-02-02T09:00:00Z");

    FileParameterStore again(dir_);
    const auto history = again.history();
    ASSERT_EQ(history.size(), 2u);
    EXPECT_TRUE(history[0].hasEnd);
    EXPECT_EQ(history[0].effectiveEnd, Date::fromCivil(2024, 1, 31));
    EXPECT_EQ(history[1].versionId, "v2024_02_01");
    EXPECT_EQ(again.activeAt(Date::fromCivil(2024, 2, 10))->versionId, "v2024_02_01");
    EXPECT_EQ(again.proposal(id).notes, notes);
    EXPECT_EQ(again.proposal(id).status, ProposalStatus::Approved);

    const auto audit = again.auditLog();
    ASSERT_EQ(audit.size(), 1u);
    EXPECT_EQ(audit[0].action, AuditAction::ChangeParams);
    EXPECT_EQ(audit[0].rationale, notes);
    EXPECT_FALSE(fs::exists(dir_ / ".lock"));
}

TEST_F(FileStore, ConflictsLeaveTheFilesUnchanged) {
    FileParameterStore store(dir_);
    store.seed(seedSet());
    const std::string id = store.addProposal(proposalOn("v1999_01_01"));

    EXPECT_THROW(store.approve(id, "ana", "", "t"), ApprovalConflictError);
    EXPECT_EQ(store.proposal(id).status, ProposalStatus::Pending);
    EXPECT_TRUE(store.auditLog().empty());
    EXPECT_THROW(store.seed(seedSet()), StoreError);

    store.reject(id, "ana", "stale", "t");
    EXPECT_EQ(FileParameterStore(dir_).proposal(id).status, ProposalStatus::Rejected);
}

TEST_F(FileStore, FailedWriteLeavesTheLedgerAsItWas) {
    FileParameterStore store(dir_);
    store.seed(seedSet());                                         // generation 1
    const std::string id = store.addProposal(proposalOn("v2024_01_01"));  // generation 2

    // A directory where the proposals table of generation 3 is staged makes
    // that write fail after the sets table has already been written.
    const fs::path blocker = dir_ / "gen-000003" / "proposals.tsv.tmp";
    fs::create_directories(blocker);
    EXPECT_THROW(store.approve(id, "ana", "", "2024-02-02T09:00:00Z"), StoreError);

    FileParameterStore reopened(dir_);
    const auto history = reopened.history();
    ASSERT_EQ(history.size(), 1u);
    EXPECT_TRUE(history[0].active());
    EXPECT_EQ(reopened.proposal(id).status, ProposalStatus::Pending);
    EXPECT_TRUE(reopened.auditLog().empty());
    EXPECT_FALSE(fs::exists(dir_ / ".lock"));

    fs::remove_all(blocker);
    reopened.approve(id, "ana", "", "2024-02-02T09:00:00Z");
    EXPECT_EQ(FileParameterStore(dir_).history().size(), 2u);
    EXPECT_EQ(FileParameterStore(dir_).auditLog().size(), 1u);
}

TEST_F(FileStore, KeepsOnlyTheLiveGeneration) {
    FileParameterStore store(dir_);
    store.seed(seedSet());
    const std::string id = store.addProposal(proposalOn("v2024_01_01"));
    store.approve(id, "ana", "", "t");

    int generations = 0;
    for (const auto &entry : fs::directory_iterator(dir_)) {
        if (entry.path().filename().string().rfind("gen-", 0) == 0) ++generations;
    }
    EXPECT_EQ(generations, 1);
    EXPECT_TRUE(fs::is_directory(dir_ / "gen-000003"));
}

TEST_F(FileStore, CorruptTablesAreStoreErrors) {
    fs::create_directories(dir_ / "gen-000001");
    std::ofstream(dir_ / "CURRENT") << "# generation\n1\n";
    std::ofstream(dir_ / "gen-000001" / "parameter_sets.tsv") << "v1\tnot-a-date\n";
    EXPECT_THROW(FileParameterStore(dir_).history(), StoreError);

    std::ofstream(dir_ / "CURRENT") << "# generation\n7\n";
    EXPECT_THROW(FileParameterStore(dir_).history(), StoreError);

    std::ofstream(dir_ / "CURRENT") << "# generation\nlatest\n";
    EXPECT_THROW(FileParameterStore(dir_).history(), StoreError);
}

// ============================================================================
// Series store
// ============================================================================

using SeriesFile = TempDir;

TEST_F(SeriesFile, UpsertMergesByDateAndIsIdempotent) {
    FileSeriesStore store(dir_ / "series.tsv");
    std::vector<SeriesRow> rows(3);
    for (int i = 0; i < 3; ++i) {
        rows[i].date = Date::fromCivil(2024, 1, 1) + i;
        rows[i].fatKg = 20.0 + 0.1 * i;
        rows[i].filteredKg = 20.05 + 0.1 * i;
        rows[i].measured = true;
    }
    store.upsert(rows);
    store.upsert(rows);
    auto got = store.rows();
    ASSERT_EQ(got.size(), 3u);
    EXPECT_DOUBLE_EQ(got[1].fatKg, 20.1);
    EXPECT_TRUE(got[1].measured);
    EXPECT_TRUE(std::isnan(got[1].trendKg));

    SeriesRow update = rows[2];
    update.fatKg = 19.0;
    SeriesRow later = rows[2];
    later.date = later.date + 5;
    store.upsert({update, later});
    got = store.rows();
    ASSERT_EQ(got.size(), 4u);
    EXPECT_DOUBLE_EQ(got[2].fatKg, 19.0);
    EXPECT_EQ(got[3].date, Date::fromCivil(2024, 1, 8));
}

TEST(MemorySeries, KeepsOneRowPerDate) {
    MemorySeriesStore store;
    SeriesRow r;
    r.date = Date::fromCivil(2024, 1, 2);
    r.fatKg = 20.0;
    store.upsert({r});
    r.fatKg = 21.0;
    store.upsert({r});
    r.date = Date::fromCivil(2024, 1, 1);
    store.upsert({r});
    const auto rows = store.rows();
    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(rows[0].date, Date::fromCivil(2024, 1, 1));
    EXPECT_DOUBLE_EQ(rows[1].fatKg, 21.0);
}
