#ifndef FMCAL_OBSERVATION_H
#define FMCAL_OBSERVATION_H

#include <iosfwd>
#include <limits>
#include <vector>

#include "date.h"

namespace fmcal {

constexpr double kMissing = std::numeric_limits<double>::quiet_NaN();

// One day of the external record stream. Body-composition fields are NaN when
// the scale was not used that day.
struct DailyObservation {
    Date date;
    double intakeKcal = kMissing;
    double workoutKcal = 0.0;
    double carbohydrateG = 0.0;
    double rawFatMassKg = kMissing;
    double rawLeanMassKg = kMissing;
};

struct CleanedObservation {
    Date date;
    double fatMassKg = kMissing;
    double leanMassKg = kMissing;
    bool fatAdjusted = false;
    bool leanAdjusted = false;
};

// Reads "YYYY-MM-DD intake workout carbs fat lean" lines. "-", "na" and
// "nan" mark a missing field; workout and carbs read as 0 when missing.
// Lines starting with '#' and blank lines are skipped. Throws ParseError on
// malformed lines and duplicate dates. The result is sorted by date.
std::vector<DailyObservation> parseRecords(std::istream &input);

}  // namespace fmcal

#endif  // FMCAL_OBSERVATION_H
