#ifndef FMCAL_BUDGET_H
#define FMCAL_BUDGET_H

#include <chrono>
#include <string>

namespace fmcal {

// Cooperative time/iteration limit for a calibration run. Loops call tick()
// and stop when it returns false; stages that must not start late call
// require().
class RunBudget {
public:
    using Clock = std::chrono::steady_clock;

    // Non-positive values mean no limit.
    explicit RunBudget(double wallSeconds = 0.0, long maxIterations = 0);

    bool expired() const;
    // Counts one unit of work. False once either limit is reached.
    bool tick();
    // Throws BudgetExceededError naming `stage` once the wall-clock limit has
    // passed. The iteration cap does not apply here.
    void require(const std::string &stage) const;

    double elapsedSeconds() const;
    long iterations() const { return iterations_; }

private:
    Clock::time_point start_;
    double wallSeconds_;
    long maxIterations_;
    long iterations_ = 0;
};

}  // namespace fmcal

#endif  // FMCAL_BUDGET_H
