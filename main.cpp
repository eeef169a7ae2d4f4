#include <cmath>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <map>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include <CLI/CLI.hpp>

#include "calibration.h"
#include "errors.h"
#include "file_store.h"
#include "log.h"

using namespace fmcal;

namespace {

std::vector<DailyObservation> readRecords(const std::string &filename) {
    if (filename.empty() || filename == "-") return parseRecords(std::cin);
    std::ifstream file(filename);
    if (!file.is_open()) throw Error("Failed to open " + filename);
    return parseRecords(file);
}

void printParams(std::ostream &os, const ModelParams &p) {
    os << std::fixed << std::setprecision(1) << "alpha=" << p.alpha
       << " C=" << std::setprecision(4) << p.c << " BMR0=" << std::setprecision(1)
       << p.bmr0 << " k_LBM=" << std::setprecision(3) << p.kLbm;
}

void printMetrics(std::ostream &os, const FitMetrics &m) {
    os << std::fixed << std::setprecision(3) << "R2=" << m.r2 << " MAE=" << m.maeKg
       << " RMSE=" << m.rmseKg << " bias=" << m.biasKg << std::setprecision(1)
       << " cond=" << m.conditionNumber << " windows=" << m.windowCount;
}

void printSeries(const SeriesAnalysis &a) {
    for (size_t i = 0; i < a.frame.size(); ++i) {
        const StateEstimate &e = a.estimates[i];
        std::cout << a.frame.dates[i] << " " << std::fixed << std::setprecision(2)
                  << a.frame.rawFatKg[i] << " " << a.frame.fatKg[i]
                  << (a.frame.fatAdjusted[i] ? "*" : "") << " - EstF: " << e.fatMassKg
                  << " ± " << std::sqrt(e.varianceKg2) << "  K: " << std::setprecision(3)
                  << e.gain;
        if (!std::isnan(e.smoothedKg)) {
            std::cout << std::setprecision(2) << "  Smooth: " << e.smoothedKg << " ± "
                      << std::sqrt(e.smoothedVarianceKg2);
        }
        if (a.decomposed) {
            std::cout << std::setprecision(2) << "  Trend: " << a.decomposition.trend[i]
                      << "  Hyd: " << std::setprecision(3) << a.decomposition.hydration[i];
        }
        std::cout << "\n";
    }
    if (a.decomposed) {
        const DecompositionResult &d = a.decomposition;
        std::cout << "\nHydration: k_h=" << std::setprecision(4) << d.hydrationCoef
                  << " half-life=" << std::setprecision(0) << d.hydrationHalfLifeDays
                  << "d lag=" << d.hydrationLagDays << "d |corr|=" << std::setprecision(3)
                  << d.selectionCorr << " mean|resid|=" << d.meanAbsResidualKg << " kg"
                  << (d.converged ? "" : " (not converged)") << "\n";
    }
}

void printWindows(const std::vector<Window> &windows) {
    for (const Window &w : windows) {
        std::cout << w.startDate << " -> " << w.endDate << " " << std::setw(2)
                  << w.lengthDays << "d  ΔF: " << std::fixed << std::setprecision(3)
                  << w.deltaFatKg << " kg  intake: " << std::setprecision(0)
                  << w.intakeSumKcal << "  workout: " << w.workoutSumKcal
                  << "  lean: " << std::setprecision(1) << w.meanLeanKg
                  << "  valid: " << w.validFatDays << "/" << w.validLeanDays << "\n";
    }
    std::cout << windows.size() << " windows\n";
}

void printProposal(const ParameterProposal &p) {
    std::cout << p.proposalId << " [" << toString(p.status) << "] as-of " << p.asof
              << " base " << p.baseVersion << "\n  prior:  ";
    printParams(std::cout, p.prior);
    std::cout << "\n  fitted: ";
    printParams(std::cout, p.fitted);
    std::cout << "\n  capped: ";
    printParams(std::cout, p.capped);
    std::cout << "\n  ";
    printMetrics(std::cout, p.metrics);
    std::cout << "\n  implied alpha: " << std::setprecision(0) << p.impliedAlpha.min
              << " / " << p.impliedAlpha.median << " / " << p.impliedAlpha.max
              << "\n  method: " << p.method << "\n  " << p.capReason << "\n";
    if (p.holdout.evaluated) {
        const HoldoutMetrics &h = p.holdout;
        std::cout << "  holdout from " << h.cutoff << " (" << h.trainWindows << " train, "
                  << h.testWindows << " test, " << h.discardedWindows << " dropped): "
                  << std::setprecision(3) << "mae " << h.fittedMaeKg << " rmse "
                  << h.fittedRmseKg << " bias " << h.fittedBiasKg << " kg; prior mae "
                  << h.priorMaeKg << " rmse " << h.priorRmseKg << " bias "
                  << h.priorBiasKg << " kg\n";
    }
    if (!p.reviewer.empty()) {
        std::cout << "  reviewed by " << p.reviewer << " at " << p.reviewedAt << ": "
                  << p.notes << "\n";
    }
}

void printSet(const ParameterSet &s) {
    std::cout << s.versionId << " " << s.effectiveStart << " .. "
              << (s.hasEnd ? s.effectiveEnd.str() : std::string("open")) << "  ";
    printParams(std::cout, s.params);
    if (!s.sourceProposal.empty()) {
        std::cout << "  (" << s.sourceProposal << ", " << s.approvedBy << ")";
    }
    std::cout << "\n";
}

template <typename Enum>
CLI::CheckedTransformer enumOption(const std::map<std::string, Enum> &names) {
    return CLI::CheckedTransformer(names, CLI::ignore_case);
}

}  // namespace

int main(int argc, char **argv) {
    CLI::App app{"Fat-mass calibration engine"};
    app.set_config("--config", "", "Read options from an INI or TOML file");
    app.require_subcommand(1);
    app.fallthrough();

    CalibrationConfig cfg;
    bool verbose = false;
    bool quiet = false;
    app.add_flag("-v,--verbose", verbose, "Print debug diagnostics");
    app.add_flag("-q,--quiet", quiet, "Only print warnings and errors");

    // Cleaner
    app.add_option("--clean-window", cfg.cleaner.window, "Rolling median window (days)")
        ->capture_default_str();
    app.add_option("--clean-k", cfg.cleaner.k, "Outlier threshold in MADs")
        ->capture_default_str();
    app.add_option("--clean-mode", cfg.cleaner.mode, "damp or drop (default damp)")
        ->transform(enumOption<CleanMode>({{"damp", CleanMode::Damp},
                                           {"drop", CleanMode::Drop}}));
    app.add_option("--clean-centered", cfg.cleaner.centered,
                   "Centred rolling window; false uses a trailing one")
        ->capture_default_str();
    app.add_option("--max-drop-fraction", cfg.cleaner.maxDropFraction,
                   "Cap on the share of points drop mode may remove")
        ->capture_default_str();

    // State estimator
    app.add_option("--process-var", cfg.kalman.processVariance,
                   "Process variance Q per day (kg^2)")
        ->capture_default_str();
    app.add_option("--measurement-var", cfg.kalman.measurementVariance,
                   "Measurement variance R (kg^2)")
        ->capture_default_str();
    app.add_flag("-S,--smooth", cfg.kalman.smooth, "Apply Rauch-Tung-Striebel smoothing")
        ->capture_default_str();

    // Decomposer
    app.add_flag("--decompose", cfg.decompose, "Separate the fat trend from hydration")
        ->capture_default_str();
    app.add_option("--fat-half-life", cfg.decomposer.fatHalfLifeDays,
                   "Fat trend EWMA half-life (days)")
        ->capture_default_str();
    app.add_option("--hydration-half-life", cfg.decomposer.hydrationHalfLifeDays,
                   "Hydration half-life when the grid search finds none (days)")
        ->capture_default_str();
    app.add_option("--hydration-lag", cfg.decomposer.hydrationLagDays,
                   "Hydration lag when the grid search finds none (days)")
        ->capture_default_str();
    app.add_option("--carb-mass", cfg.decomposer.carbMassPerG,
                   "kg of water and glycogen per g of carbohydrate")
        ->capture_default_str();
    app.add_option("--huber-delta", cfg.decomposer.huberDelta,
                   "Huber threshold of the hydration regression (kg)")
        ->capture_default_str();

    // Windows
    app.add_option("--window-mode", cfg.windows.mode,
                   "anchored, rolling or blocks (default anchored)")
        ->transform(enumOption<WindowMode>({{"anchored", WindowMode::Anchored},
                                            {"rolling", WindowMode::Rolling},
                                            {"blocks", WindowMode::Blocks}}));
    app.add_option("--lengths", cfg.windows.lengthsDays, "Window lengths (days)")
        ->delimiter(',')
        ->capture_default_str();
    app.add_option("--anchor-stride", cfg.windows.anchorStrideDays,
                   "Days between anchors in anchored mode")
        ->capture_default_str();
    app.add_option("--lookback", cfg.windows.lookbackDays,
                   "Days an endpoint may reach back for a fat-mass reading")
        ->capture_default_str();
    app.add_option("--min-valid-days", cfg.windows.minValidDays,
                   "Days with fat and lean mass a window needs")
        ->capture_default_str();
    app.add_option("--max-daily-rate", cfg.windows.maxDailyRateKg,
                   "Largest plausible fat-mass change (kg/day)")
        ->capture_default_str();
    app.add_option("--fat-source", cfg.windows.source,
                   "filtered, smoothed, trend or cleaned (default filtered)")
        ->transform(enumOption<FatSource>({{"filtered", FatSource::Filtered},
                                           {"smoothed", FatSource::Smoothed},
                                           {"trend", FatSource::Trend},
                                           {"cleaned", FatSource::Cleaned}}));

    // Estimator
    app.add_option("--orthogonalize", cfg.estimator.variant.orthogonalize,
                   "Regress on workout residualized against intake")
        ->capture_default_str();
    app.add_option("--lean-term", cfg.estimator.variant.leanTerm,
                   "Fit k_LBM; false holds it at the prior")
        ->capture_default_str();
    app.add_option("--fixed", cfg.estimator.variant.fixed,
                   "Parameters held at the prior: none, alpha or alpha-klbm (default none)")
        ->transform(enumOption<FixedSet>({{"none", FixedSet::None},
                                          {"alpha", FixedSet::Alpha},
                                          {"alpha-klbm", FixedSet::AlphaKLbm}}));
    app.add_option("--huber-epsilon", cfg.estimator.huber.epsilon,
                   "Huber threshold in robust scale units")
        ->capture_default_str();
    app.add_option("--ridge", cfg.estimator.huber.ridge, "Ridge penalty on scaled features")
        ->capture_default_str();
    app.add_flag("--bootstrap", cfg.bootstrap, "Percentile bootstrap confidence intervals")
        ->capture_default_str();
    app.add_option("--resamples", cfg.estimator.bootstrapResamples, "Bootstrap resamples")
        ->capture_default_str();
    app.add_option("--seed", cfg.estimator.bootstrapSeed, "Bootstrap random seed")
        ->capture_default_str();
    app.add_flag("--holdout", cfg.holdout.enabled,
                 "Score a fit on earlier windows against later ones")
        ->capture_default_str();
    app.add_option("--holdout-fraction", cfg.holdout.testFraction,
                   "Share of windows held out for testing")
        ->check(CLI::Range(0.05, 0.95))
        ->capture_default_str();

    // Validator
    ParameterBounds &b = cfg.validator.bounds;
    app.add_option("--alpha-min", b.alpha.lo)->capture_default_str();
    app.add_option("--alpha-max", b.alpha.hi)->capture_default_str();
    app.add_option("--c-min", b.c.lo)->capture_default_str();
    app.add_option("--c-max", b.c.hi)->capture_default_str();
    app.add_option("--bmr0-min", b.bmr0.lo)->capture_default_str();
    app.add_option("--bmr0-max", b.bmr0.hi)->capture_default_str();
    app.add_option("--klbm-min", b.kLbm.lo)->capture_default_str();
    app.add_option("--klbm-max", b.kLbm.hi)->capture_default_str();
    app.add_option("--max-cond", cfg.validator.maxConditionNumber,
                   "Largest acceptable design condition number")
        ->capture_default_str();

    // Workflow
    app.add_option("--cap", cfg.workflow.capFraction, "Maximum relative change per update")
        ->capture_default_str();
    app.add_option("--max-bias", cfg.workflow.maxAbsBiasKg, "Guardrail on |bias| (kg)")
        ->capture_default_str();
    app.add_option("--min-windows", cfg.workflow.minWindows, "Guardrail on window count")
        ->capture_default_str();
    app.add_option("--max-mae", cfg.workflow.maxMaeKg, "Guardrail on MAE (kg)")
        ->capture_default_str();
    app.add_option("--history-days", cfg.historyDays,
                   "Days of history before the as-of date (0 = all)")
        ->capture_default_str();

    std::string filename;
    std::string storeDir = "fmcal-store";
    std::string seriesFile;
    std::string asofText;
    std::string proposalId;
    std::string reviewer;
    std::string notes;
    double budgetSeconds = 0.0;
    ModelParams seedParams;
    std::string seedFrom;

    auto filterCmd = app.add_subcommand("filter", "Clean and filter the fat-mass series");
    filterCmd->add_option("file", filename, "Daily log to read (default stdin)");

    auto windowsCmd = app.add_subcommand("windows", "List eligible windows");
    windowsCmd->add_option("file", filename, "Daily log to read (default stdin)");

    auto calibrateCmd = app.add_subcommand("calibrate", "Fit parameters and record a proposal");
    calibrateCmd->add_option("file", filename, "Daily log to read (default stdin)");
    calibrateCmd->add_option("--asof", asofText, "As-of date, YYYY-MM-DD (default: last record)");
    calibrateCmd->add_option("--series", seriesFile, "Also upsert the derived series here");
    calibrateCmd->add_option("--budget", budgetSeconds, "Wall-clock budget in seconds (0 = none)")
        ->capture_default_str();

    auto approveCmd = app.add_subcommand("approve", "Approve a pending proposal");
    approveCmd->add_option("proposal", proposalId, "Proposal id")->required();
    approveCmd->add_option("--reviewer", reviewer, "Who approves")->required();
    approveCmd->add_option("--notes", notes, "Rationale");

    auto rejectCmd = app.add_subcommand("reject", "Reject a pending proposal");
    rejectCmd->add_option("proposal", proposalId, "Proposal id")->required();
    rejectCmd->add_option("--reviewer", reviewer, "Who rejects")->required();
    rejectCmd->add_option("--notes", notes, "Rationale");

    auto seedCmd = app.add_subcommand("seed", "Insert the initial parameter set");
    seedCmd->add_option("--from", seedFrom, "Effective start date, YYYY-MM-DD")->required();
    seedCmd->add_option("--alpha", seedParams.alpha)->capture_default_str();
    seedCmd->add_option("--compensation", seedParams.c)->capture_default_str();
    seedCmd->add_option("--bmr0", seedParams.bmr0)->capture_default_str();
    seedCmd->add_option("--klbm", seedParams.kLbm)->capture_default_str();

    auto statusCmd = app.add_subcommand("status", "Show parameter history and proposals");

    for (auto *cmd : {calibrateCmd, approveCmd, rejectCmd, seedCmd, statusCmd}) {
        cmd->add_option("--store", storeDir, "Parameter store directory")->capture_default_str();
    }

    CLI11_PARSE(app, argc, argv);

    if (verbose) log::setLevel(log::Level::Debug);
    if (quiet) log::setLevel(log::Level::Warn);

    try {
        if (*filterCmd || *windowsCmd) {
            const SeriesAnalysis a = analyzeSeries(readRecords(filename), cfg);
            if (*filterCmd) printSeries(a);
            if (*windowsCmd) printWindows(a.windows);
        } else if (*calibrateCmd) {
            const auto records = readRecords(filename);
            if (records.empty()) throw NoMeasurementsError("No records to calibrate");
            const Date asof = asofText.empty() ? records.back().date : Date::parse(asofText);

            FileParameterStore store(storeDir);
            std::unique_ptr<FileSeriesStore> series;
            if (!seriesFile.empty()) series = std::make_unique<FileSeriesStore>(seriesFile);
            RunBudget budget(budgetSeconds);

            const CalibrationResult res =
                runCalibration(records, store, cfg, asof, budget, series.get());
            printWindows(res.series.windows);
            std::cout << "\n";
            printProposal(res.proposal);
            if (res.hasInterval) {
                std::cout << "  CI " << std::setprecision(1) << cfg.estimator.ciLowPercent
                          << "-" << cfg.estimator.ciHighPercent << "%: ";
                printParams(std::cout, res.interval.lo);
                std::cout << "\n      to  ";
                printParams(std::cout, res.interval.hi);
                std::cout << "\n  (" << res.interval.completed << " of "
                          << res.interval.requested << " resamples"
                          << (res.interval.truncated ? ", stopped by budget" : "") << ")\n";
            }
        } else if (*approveCmd) {
            FileParameterStore store(storeDir);
            const ParameterSet s = store.approve(proposalId, reviewer, notes, timestampNow());
            std::cout << "Approved " << proposalId << " as ";
            printSet(s);
        } else if (*rejectCmd) {
            FileParameterStore store(storeDir);
            store.reject(proposalId, reviewer, notes, timestampNow());
            std::cout << "Rejected " << proposalId << "\n";
        } else if (*seedCmd) {
            FileParameterStore store(storeDir);
            ParameterSet s;
            s.effectiveStart = Date::parse(seedFrom);
            s.params = seedParams;
            s.method = "seed";
            s.approvedAt = timestampNow();
            store.seed(s);
            for (const ParameterSet &h : store.history()) printSet(h);
        } else if (*statusCmd) {
            FileParameterStore store(storeDir);
            std::cout << "Parameter sets:\n";
            for (const ParameterSet &s : store.history()) printSet(s);
            std::cout << "\nProposals:\n";
            for (const ParameterProposal &p : store.proposals()) printProposal(p);
            std::cout << "\nAudit:\n";
            for (const AuditEntry &a : store.auditLog()) {
                std::cout << a.timestamp << " " << toString(a.action) << " " << a.actor
                          << " " << a.proposalId << " " << a.previousVersion << " -> "
                          << (a.newVersion.empty() ? "-" : a.newVersion) << "  "
                          << a.rationale << "\n";
            }
        }
    } catch (const Error &e) {
        log::error(e.what());
        return 1;
    } catch (const std::exception &e) {
        log::error(std::string("Unexpected failure: ") + e.what());
        return 1;
    }
    return 0;
}
