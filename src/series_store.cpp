#include "series_store.h"

#include "errors.h"
#include "table.h"

namespace fmcal {

namespace fs = std::filesystem;

namespace {

const char *kSeriesHeader =
    "date\traw_fat\tfat\tlean\tfat_adjusted\tlean_adjusted\tfiltered\tvariance\t"
    "gain\tmeasured\tsmoothed\tsmoothed_variance\ttrend";
constexpr size_t kSeriesColumns = 13;

table::Row toRow(const SeriesRow &r) {
    using table::formatDouble;
    return {r.date.str(),
            formatDouble(r.rawFatKg),
            formatDouble(r.fatKg),
            formatDouble(r.leanKg),
            r.fatAdjusted ? "1" : "0",
            r.leanAdjusted ? "1" : "0",
            formatDouble(r.filteredKg),
            formatDouble(r.varianceKg2),
            formatDouble(r.gain),
            r.measured ? "1" : "0",
            formatDouble(r.smoothedKg),
            formatDouble(r.smoothedVarianceKg2),
            formatDouble(r.trendKg)};
}

SeriesRow fromRow(const table::Row &row) {
    using table::parseDouble;
    SeriesRow r;
    try {
        r.date = Date::parse(row[0]);
    } catch (const ParseError &e) {
        throw StoreError(std::string("Bad date in series table: ") + e.what());
    }
    r.rawFatKg = parseDouble(row[1]);
    r.fatKg = parseDouble(row[2]);
    r.leanKg = parseDouble(row[3]);
    r.fatAdjusted = row[4] == "1";
    r.leanAdjusted = row[5] == "1";
    r.filteredKg = parseDouble(row[6]);
    r.varianceKg2 = parseDouble(row[7]);
    r.gain = parseDouble(row[8]);
    r.measured = row[9] == "1";
    r.smoothedKg = parseDouble(row[10]);
    r.smoothedVarianceKg2 = parseDouble(row[11]);
    r.trendKg = parseDouble(row[12]);
    return r;
}

}  // namespace

void MemorySeriesStore::upsert(const std::vector<SeriesRow> &rows) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const SeriesRow &r : rows) rows_[r.date.days] = r;
}

std::vector<SeriesRow> MemorySeriesStore::rows() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<SeriesRow> out;
    out.reserve(rows_.size());
    for (const auto &kv : rows_) out.push_back(kv.second);
    return out;
}

FileSeriesStore::FileSeriesStore(fs::path file) : file_(std::move(file)) {
    if (file_.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(file_.parent_path(), ec);
        if (ec) throw StoreError("Failed to create " + file_.parent_path().string());
    }
}

void FileSeriesStore::upsert(const std::vector<SeriesRow> &rows) {
    fs::path lockPath = file_;
    lockPath += ".lock";
    table::DirectoryLock lock(lockPath);

    std::map<int, SeriesRow> merged;
    for (const auto &row : table::read(file_, kSeriesColumns)) {
        SeriesRow r = fromRow(row);
        merged[r.date.days] = r;
    }
    for (const SeriesRow &r : rows) merged[r.date.days] = r;

    std::vector<table::Row> out;
    out.reserve(merged.size());
    for (const auto &kv : merged) out.push_back(toRow(kv.second));
    table::writeAtomic(file_, kSeriesHeader, out);
}

std::vector<SeriesRow> FileSeriesStore::rows() const {
    std::vector<SeriesRow> out;
    for (const auto &row : table::read(file_, kSeriesColumns)) out.push_back(fromRow(row));
    return out;
}

}  // namespace fmcal
