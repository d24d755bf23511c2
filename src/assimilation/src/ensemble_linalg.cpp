/**
 * @file ensemble_linalg.cpp
 * @brief Implementation of matrix helpers for ensemble updates
 */

#include "ensemble_linalg.hpp"
#include "lenkf_errors.hpp"
#include <cmath>
#include <stdexcept>

namespace driftda {

Eigen::MatrixXd covariance_sqrt(const Eigen::MatrixXd& R) {
    if (R.rows() != R.cols()) {
        throw std::invalid_argument("Covariance must be square");
    }

    Eigen::LLT<Eigen::MatrixXd> llt(R);
    if (llt.info() != Eigen::Success) {
        throw LinearAlgebraFailure("Observation covariance is not positive definite");
    }

    return Eigen::MatrixXd(llt.matrixL());
}

Eigen::MatrixXd invert_covariance(const Eigen::MatrixXd& R) {
    if (R.rows() != R.cols()) {
        throw std::invalid_argument("Covariance must be square");
    }

    Eigen::FullPivLU<Eigen::MatrixXd> lu(R);
    if (!lu.isInvertible()) {
        throw LinearAlgebraFailure("Covariance matrix is singular");
    }

    return lu.inverse();
}

Eigen::MatrixXd build_observation_precision(const Eigen::Matrix2d& R, size_t n_obs) {
    const Eigen::Index n = static_cast<Eigen::Index>(n_obs);
    Eigen::MatrixXd R_full = Eigen::MatrixXd::Zero(2 * n, 2 * n);

    for (Eigen::Index l = 0; l < n; ++l) {
        R_full(l, l) = R(0, 0);
        R_full(n + l, n + l) = R(1, 1);
        R_full(l, n + l) = R(0, 1);
        R_full(n + l, l) = R(1, 0);
    }

    return invert_covariance(R_full);
}

Eigen::MatrixXd symmetric_inverse_sqrt(const Eigen::MatrixXd& A) {
    Eigen::SelfAdjointEigenSolver<Eigen::MatrixXd> eigen_solver(A);

    if (eigen_solver.info() != Eigen::Success) {
        throw LinearAlgebraFailure("Eigendecomposition of transform matrix failed");
    }

    const Eigen::VectorXd& sigma = eigen_solver.eigenvalues();
    if (sigma.minCoeff() <= 0.0) {
        throw LinearAlgebraFailure("Transform matrix has non-positive eigenvalues");
    }

    const Eigen::MatrixXd& V = eigen_solver.eigenvectors();
    return V * sigma.cwiseSqrt().cwiseInverse().asDiagonal() * V.transpose();
}

Eigen::MatrixXd draw_gaussian_samples(
    const Eigen::MatrixXd& sqrt_cov,
    size_t n_samples,
    std::mt19937& rng
) {
    std::normal_distribution<double> normal_dist(0.0, 1.0);

    Eigen::MatrixXd standard(sqrt_cov.cols(), static_cast<Eigen::Index>(n_samples));
    for (Eigen::Index j = 0; j < standard.cols(); ++j) {
        for (Eigen::Index i = 0; i < standard.rows(); ++i) {
            standard(i, j) = normal_dist(rng);
        }
    }

    return sqrt_cov * standard;
}

double ensemble_spread(const Eigen::MatrixXd& perturbation) {
    if (perturbation.cols() < 2) {
        throw std::invalid_argument("Spread needs at least two members");
    }

    return perturbation.squaredNorm() / static_cast<double>(perturbation.cols() - 1);
}

} // namespace driftda
