#ifndef FMCAL_SERIES_STORE_H
#define FMCAL_SERIES_STORE_H

#include <filesystem>
#include <map>
#include <mutex>
#include <vector>

#include "date.h"
#include "observation.h"

namespace fmcal {

// One day of derived series: cleaned measurements, filter output and, when
// the decomposer ran, the fat trend.
struct SeriesRow {
    Date date;
    double rawFatKg = kMissing;
    double fatKg = kMissing;
    double leanKg = kMissing;
    bool fatAdjusted = false;
    bool leanAdjusted = false;
    double filteredKg = kMissing;
    double varianceKg2 = kMissing;
    double gain = 0.0;
    bool measured = false;
    double smoothedKg = kMissing;
    double smoothedVarianceKg2 = kMissing;
    double trendKg = kMissing;
};

// Derived series keyed by date. Upserting the same rows twice leaves the
// store unchanged.
class SeriesStore {
public:
    virtual ~SeriesStore() = default;
    virtual void upsert(const std::vector<SeriesRow> &rows) = 0;
    // Sorted by date.
    virtual std::vector<SeriesRow> rows() const = 0;
};

class MemorySeriesStore : public SeriesStore {
public:
    void upsert(const std::vector<SeriesRow> &rows) override;
    std::vector<SeriesRow> rows() const override;

private:
    mutable std::mutex mutex_;
    std::map<int, SeriesRow> rows_;
};

// Tab-separated table, replaced atomically on every upsert.
class FileSeriesStore : public SeriesStore {
public:
    explicit FileSeriesStore(std::filesystem::path file);
    void upsert(const std::vector<SeriesRow> &rows) override;
    std::vector<SeriesRow> rows() const override;

private:
    std::filesystem::path file_;
};

}  // namespace fmcal

#endif  // FMCAL_SERIES_STORE_H
