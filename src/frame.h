#ifndef FMCAL_FRAME_H
#define FMCAL_FRAME_H

#include <vector>

#include "date.h"
#include "observation.h"

namespace fmcal {

// Dense per-day view from the first to the last record date. Days absent
// from the record stream have missing intake and mass, zero workout and
// zero carbohydrate.
struct DailyFrame {
    std::vector<Date> dates;
    std::vector<double> intakeKcal;
    std::vector<double> workoutKcal;
    std::vector<double> carbohydrateG;
    std::vector<double> rawFatKg;
    std::vector<double> rawLeanKg;
    std::vector<double> fatKg;   // cleaned
    std::vector<double> leanKg;  // cleaned
    std::vector<bool> fatAdjusted;
    std::vector<bool> leanAdjusted;

    size_t size() const { return dates.size(); }
    bool empty() const { return dates.empty(); }
    Date first() const { return dates.front(); }
    Date last() const { return dates.back(); }

    // Index of `d`, or -1 outside the frame.
    long indexOf(const Date &d) const;
};

// `cleaned` must be index-aligned with `records`, as cleanObservations
// returns it.
DailyFrame buildFrame(const std::vector<DailyObservation> &records,
                      const std::vector<CleanedObservation> &cleaned);

}  // namespace fmcal

#endif  // FMCAL_FRAME_H
