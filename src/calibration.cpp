#include "calibration.h"

#include <ctime>
#include <iomanip>
#include <sstream>

#include "errors.h"
#include "log.h"

namespace fmcal {

SeriesAnalysis analyzeSeries(const std::vector<DailyObservation> &records,
                             const CalibrationConfig &cfg) {
    if (records.empty()) throw NoMeasurementsError("No records to analyze");

    SeriesAnalysis a;
    const std::vector<CleanedObservation> cleaned = cleanObservations(records, cfg.cleaner);
    a.frame = buildFrame(records, cleaned);

    KalmanConfig kcfg = cfg.kalman;
    if (cfg.windows.source == FatSource::Smoothed) kcfg.smooth = true;
    a.estimates = kalman(a.frame.dates, a.frame.fatKg, kcfg);
    a.health = checkFilterHealth(a.estimates);

    if (cfg.decompose || cfg.windows.source == FatSource::Trend) {
        a.decomposition = decompose(a.frame.fatKg, a.frame.carbohydrateG, cfg.decomposer);
        a.decomposed = true;
    }

    a.fatKg = fatSeries(a.frame, a.estimates, a.decomposed ? &a.decomposition : nullptr,
                        cfg.windows.source);
    a.windows = buildWindows(a.frame, a.fatKg, cfg.windows);
    return a;
}

CalibrationResult runCalibration(const std::vector<DailyObservation> &records,
                                 ParameterStore &store, const CalibrationConfig &cfg,
                                 const Date &asof, RunBudget &budget, SeriesStore *series,
                                 const std::string &now) {
    std::vector<DailyObservation> history;
    for (const DailyObservation &r : records) {
        if (r.date > asof) continue;
        if (cfg.historyDays > 0 && asof - r.date >= cfg.historyDays) continue;
        history.push_back(r);
    }
    if (history.empty()) {
        throw NoMeasurementsError("No records on or before " + asof.str());
    }

    const std::optional<ParameterSet> base = store.activeAt(asof);
    if (!base) throw StoreError("No parameter set is active on " + asof.str());

    CalibrationResult res;
    res.series = analyzeSeries(history, cfg);
    const std::vector<Window> &windows = res.series.windows;
    if (windows.empty()) {
        throw Error("No eligible windows on or before " + asof.str());
    }

    res.fit = fitAndValidate(windows, base->params, cfg.estimator, cfg.validator);
    if (cfg.bootstrap) {
        res.interval = bootstrapIntervals(windows, base->params, cfg.estimator, budget);
        res.hasInterval = true;
    }

    const std::string created = now.empty() ? timestampNow() : now;
    res.proposal = buildProposal(*base, asof, res.fit, windows, cfg.workflow, created);
    if (cfg.holdout.enabled) {
        try {
            res.proposal.holdout = evaluateHoldout(windows, base->params, cfg.holdout,
                                                   cfg.estimator, cfg.validator);
        } catch (const Error &e) {
            log::warn(std::string("Holdout evaluation skipped: ") + e.what());
        }
    }

    budget.require("writing the proposal");
    if (series != nullptr) series->upsert(seriesRows(res.series));
    res.proposal.proposalId = store.addProposal(res.proposal);

    std::ostringstream msg;
    msg << "proposal " << res.proposal.proposalId << " against "
        << res.proposal.baseVersion << ": " << res.proposal.capReason;
    log::info(msg.str());
    return res;
}

std::vector<SeriesRow> seriesRows(const SeriesAnalysis &a) {
    std::vector<SeriesRow> rows(a.frame.size());
    for (size_t i = 0; i < rows.size(); ++i) {
        SeriesRow &r = rows[i];
        r.date = a.frame.dates[i];
        r.rawFatKg = a.frame.rawFatKg[i];
        r.fatKg = a.frame.fatKg[i];
        r.leanKg = a.frame.leanKg[i];
        r.fatAdjusted = a.frame.fatAdjusted[i];
        r.leanAdjusted = a.frame.leanAdjusted[i];
        if (i < a.estimates.size()) {
            const StateEstimate &e = a.estimates[i];
            r.filteredKg = e.fatMassKg;
            r.varianceKg2 = e.varianceKg2;
            r.gain = e.gain;
            r.measured = e.measured;
            r.smoothedKg = e.smoothedKg;
            r.smoothedVarianceKg2 = e.smoothedVarianceKg2;
        }
        if (a.decomposed) r.trendKg = a.decomposition.trend[i];
    }
    return rows;
}

std::string timestampNow() {
    const std::time_t t = std::time(nullptr);
    std::tm tm{};
    gmtime_r(&t, &tm);
    std::ostringstream os;
    os << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return os.str();
}

}  // namespace fmcal
