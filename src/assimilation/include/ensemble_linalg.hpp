/**
 * @file ensemble_linalg.hpp
 * @brief Matrix helpers for ensemble updates
 *
 * Cholesky factors and precision matrices for the observation error,
 * symmetric inverse square roots for the ensemble transform, and Gaussian
 * sampling for perturbed observations.
 */

#ifndef ENSEMBLE_LINALG_HPP
#define ENSEMBLE_LINALG_HPP

#include <Eigen/Dense>
#include <random>

namespace driftda {

/**
 * @brief Lower Cholesky factor L of a covariance (R = L * L^T)
 *
 * @param R Symmetric positive-definite covariance
 * @return Lower triangular factor
 * @throws LinearAlgebraFailure if R is not positive definite
 */
Eigen::MatrixXd covariance_sqrt(const Eigen::MatrixXd& R);

/**
 * @brief Inverse of a small covariance matrix
 * @throws LinearAlgebraFailure if R is singular
 */
Eigen::MatrixXd invert_covariance(const Eigen::MatrixXd& R);

/**
 * @brief Precision matrix for n_obs (hu, hv) observations sharing covariance R
 *
 * Observation vector ordering is [hu_0, ..., hu_{n-1}, hv_0, ..., hv_{n-1}],
 * so R occupies entries (l, l), (l, n+l), (n+l, l), (n+l, n+l) for each l.
 *
 * @param R 2x2 covariance of one observation
 * @param n_obs Number of observations
 * @return Inverse of the assembled (2n × 2n) covariance
 */
Eigen::MatrixXd build_observation_precision(const Eigen::Matrix2d& R, size_t n_obs);

/**
 * @brief Symmetric inverse square root A^{-1/2} = V diag(1/sqrt(s)) V^T
 *
 * @param A Symmetric positive-definite matrix
 * @return Inverse square root
 * @throws LinearAlgebraFailure on a failed decomposition or s <= 0
 */
Eigen::MatrixXd symmetric_inverse_sqrt(const Eigen::MatrixXd& A);

/**
 * @brief Draw zero-mean Gaussian samples with covariance L * L^T
 *
 * @param sqrt_cov Lower Cholesky factor L
 * @param n_samples Number of samples
 * @param rng Random engine
 * @return Matrix with one sample per column
 */
Eigen::MatrixXd draw_gaussian_samples(
    const Eigen::MatrixXd& sqrt_cov,
    size_t n_samples,
    std::mt19937& rng
);

/**
 * @brief Total ensemble variance, trace(X' X'^T) / (N - 1)
 *
 * @param perturbation Perturbation matrix (one member per column)
 */
double ensemble_spread(const Eigen::MatrixXd& perturbation);

} // namespace driftda

#endif // ENSEMBLE_LINALG_HPP
