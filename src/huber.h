#ifndef FMCAL_HUBER_H
#define FMCAL_HUBER_H

#include <Eigen/Dense>

namespace fmcal {

struct HuberConfig {
    double epsilon = 1.35;
    double ridge = 0.0;
    // When false, residuals are compared to epsilon directly (scale 1).
    bool estimateScale = true;
    int maxIterations = 100;
    double tolerance = 1e-10;
};

struct HuberFit {
    Eigen::VectorXd beta;
    Eigen::VectorXd weights;
    Eigen::VectorXd residuals;
    double scale = 1.0;
    int iterations = 0;
    bool converged = false;
};

// 1.4826 * median(|r - median(r)|).
double madScale(const Eigen::VectorXd &r);

// Iteratively reweighted least squares with Huber weights
// w = min(1, epsilon / |r / scale|). No intercept column is added. The
// weighted solve is minimum-norm, so rank-deficient designs do not throw.
HuberFit huberRegression(const Eigen::MatrixXd &X, const Eigen::VectorXd &y,
                         const HuberConfig &cfg = HuberConfig());

}  // namespace fmcal

#endif  // FMCAL_HUBER_H
