#include "huber.h"

#include <algorithm>
#include <cmath>
#include <vector>

#include "errors.h"

namespace fmcal {

namespace {

double median(std::vector<double> v) {
    const size_t mid = v.size() / 2;
    std::nth_element(v.begin(), v.begin() + mid, v.end());
    double hi = v[mid];
    if (v.size() % 2 == 1) return hi;
    return 0.5 * (hi + *std::max_element(v.begin(), v.begin() + mid));
}

Eigen::VectorXd weightedSolve(const Eigen::MatrixXd &X, const Eigen::VectorXd &y,
                              const Eigen::VectorXd &w, double ridge) {
    using namespace Eigen;
    const VectorXd sw = w.array().sqrt().matrix();
    MatrixXd A = sw.asDiagonal() * X;
    VectorXd b = sw.asDiagonal() * y;
    if (ridge > 0) {
        const Index p = X.cols();
        MatrixXd Ar(A.rows() + p, p);
        Ar << A, std::sqrt(ridge) * MatrixXd::Identity(p, p);
        VectorXd br(b.size() + p);
        br << b, VectorXd::Zero(p);
        A.swap(Ar);
        b.swap(br);
    }
    return A.completeOrthogonalDecomposition().solve(b);
}

}  // namespace

double madScale(const Eigen::VectorXd &r) {
    if (r.size() == 0) return 0.0;
    std::vector<double> v(r.data(), r.data() + r.size());
    const double m = median(v);
    for (auto &x : v) x = std::abs(x - m);
    return 1.4826 * median(v);
}

HuberFit huberRegression(const Eigen::MatrixXd &X, const Eigen::VectorXd &y,
                         const HuberConfig &cfg) {
    using namespace Eigen;
    if (X.rows() != y.size()) {
        throw Error("huberRegression: design and target differ in length");
    }
    if (X.rows() == 0 || X.cols() == 0) {
        throw Error("huberRegression: empty design");
    }
    if (cfg.epsilon <= 0) throw Error("huberRegression: epsilon must be positive");

    HuberFit fit;
    fit.weights = VectorXd::Ones(y.size());
    fit.beta = weightedSolve(X, y, fit.weights, cfg.ridge);

    for (int it = 1; it <= cfg.maxIterations; ++it) {
        fit.iterations = it;
        fit.residuals = y - X * fit.beta;
        fit.scale = cfg.estimateScale ? madScale(fit.residuals) : 1.0;
        if (!(fit.scale > 0)) {
            // Exact fit on at least half the rows; nothing left to reweight.
            fit.converged = true;
            break;
        }

        for (Index i = 0; i < y.size(); ++i) {
            const double u = std::abs(fit.residuals[i]) / fit.scale;
            fit.weights[i] = u <= cfg.epsilon ? 1.0 : cfg.epsilon / u;
        }
        const VectorXd next = weightedSolve(X, y, fit.weights, cfg.ridge);
        const double step = (next - fit.beta).cwiseAbs().maxCoeff();
        const double size = 1.0 + fit.beta.cwiseAbs().maxCoeff();
        fit.beta = next;
        if (step <= cfg.tolerance * size) {
            fit.converged = true;
            break;
        }
    }
    fit.residuals = y - X * fit.beta;
    return fit;
}

}  // namespace fmcal
