#ifndef FMCAL_CALIBRATION_H
#define FMCAL_CALIBRATION_H

#include <string>
#include <vector>

#include "budget.h"
#include "cleaner.h"
#include "decomposer.h"
#include "estimator.h"
#include "frame.h"
#include "holdout.h"
#include "kalman.h"
#include "observation.h"
#include "series_store.h"
#include "store.h"
#include "validator.h"
#include "windows.h"
#include "workflow.h"

namespace fmcal {

struct CalibrationConfig {
    CleanerConfig cleaner;
    KalmanConfig kalman;
    DecomposerConfig decomposer;
    bool decompose = false;  // implied by FatSource::Trend
    WindowConfig windows;
    EstimatorConfig estimator;
    bool bootstrap = false;
    HoldoutConfig holdout;
    ValidatorConfig validator;
    WorkflowConfig workflow;
    int historyDays = 0;  // 0 keeps every record up to the as-of date
};

// Everything derived from the record stream before any fitting.
struct SeriesAnalysis {
    DailyFrame frame;
    std::vector<StateEstimate> estimates;
    FilterHealth health;
    bool decomposed = false;
    DecompositionResult decomposition;
    std::vector<double> fatKg;  // the configured window source, per day
    std::vector<Window> windows;
};

struct CalibrationResult {
    SeriesAnalysis series;
    ValidatedFit fit;
    bool hasInterval = false;
    ConfidenceInterval interval;
    ParameterProposal proposal;
};

// Clean -> filter (and decompose when asked) -> windows. Throws
// NoMeasurementsError when no fat-mass reading survives cleaning.
SeriesAnalysis analyzeSeries(const std::vector<DailyObservation> &records,
                             const CalibrationConfig &cfg);

// One calibration pass as of `asof`, using the parameter set active that
// day as the prior. With holdout enabled the proposal also carries the
// out-of-sample metrics; a history too short to split only logs a warning. The proposal (and the derived series, when `series` is
// given) is written only after every stage succeeded and the budget allows
// it. The returned proposal carries its assigned id.
CalibrationResult runCalibration(const std::vector<DailyObservation> &records,
                                 ParameterStore &store, const CalibrationConfig &cfg,
                                 const Date &asof, RunBudget &budget,
                                 SeriesStore *series = nullptr,
                                 const std::string &now = std::string());

std::vector<SeriesRow> seriesRows(const SeriesAnalysis &analysis);

// Current UTC time as "YYYY-MM-DDTHH:MM:SSZ".
std::string timestampNow();

}  // namespace fmcal

#endif  // FMCAL_CALIBRATION_H
