#include "frame.h"

#include "errors.h"

namespace fmcal {

long DailyFrame::indexOf(const Date &d) const {
    if (dates.empty() || d < dates.front() || d > dates.back()) return -1;
    return d - dates.front();
}

DailyFrame buildFrame(const std::vector<DailyObservation> &records,
                      const std::vector<CleanedObservation> &cleaned) {
    if (records.size() != cleaned.size()) {
        throw Error("buildFrame: cleaned series is not aligned with the records");
    }
    DailyFrame f;
    if (records.empty()) return f;

    const Date first = records.front().date;
    const int n = records.back().date - first + 1;
    f.dates.resize(n);
    for (int i = 0; i < n; ++i) f.dates[i] = first + i;
    f.intakeKcal.assign(n, kMissing);
    f.workoutKcal.assign(n, 0.0);
    f.carbohydrateG.assign(n, 0.0);
    f.rawFatKg.assign(n, kMissing);
    f.rawLeanKg.assign(n, kMissing);
    f.fatKg.assign(n, kMissing);
    f.leanKg.assign(n, kMissing);
    f.fatAdjusted.assign(n, false);
    f.leanAdjusted.assign(n, false);

    for (size_t j = 0; j < records.size(); ++j) {
        const DailyObservation &r = records[j];
        if (r.date != cleaned[j].date) {
            throw Error("buildFrame: cleaned series is not aligned with the records");
        }
        const int i = r.date - first;
        if (i < 0 || i >= n) throw Error("buildFrame: records are not sorted by date");
        f.intakeKcal[i] = r.intakeKcal;
        f.workoutKcal[i] = r.workoutKcal;
        f.carbohydrateG[i] = r.carbohydrateG;
        f.rawFatKg[i] = r.rawFatMassKg;
        f.rawLeanKg[i] = r.rawLeanMassKg;
        f.fatKg[i] = cleaned[j].fatMassKg;
        f.leanKg[i] = cleaned[j].leanMassKg;
        f.fatAdjusted[i] = cleaned[j].fatAdjusted;
        f.leanAdjusted[i] = cleaned[j].leanAdjusted;
    }
    return f;
}

}  // namespace fmcal
