#include "budget.h"

#include <sstream>

#include "errors.h"

namespace fmcal {

RunBudget::RunBudget(double wallSeconds, long maxIterations)
    : start_(Clock::now()), wallSeconds_(wallSeconds), maxIterations_(maxIterations) {}

double RunBudget::elapsedSeconds() const {
    return std::chrono::duration<double>(Clock::now() - start_).count();
}

bool RunBudget::expired() const {
    if (maxIterations_ > 0 && iterations_ >= maxIterations_) return true;
    return wallSeconds_ > 0 && elapsedSeconds() >= wallSeconds_;
}

bool RunBudget::tick() {
    if (expired()) return false;
    ++iterations_;
    return true;
}

void RunBudget::require(const std::string &stage) const {
    // Iteration caps only bound loops; the wall clock gates stages.
    if (wallSeconds_ > 0 && elapsedSeconds() >= wallSeconds_) {
        std::ostringstream msg;
        msg << "Run budget of " << wallSeconds_ << " s exceeded before " << stage;
        throw BudgetExceededError(msg.str());
    }
}

}  // namespace fmcal
