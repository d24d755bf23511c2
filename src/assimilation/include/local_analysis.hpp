/**
 * @file local_analysis.hpp
 * @brief Local ensemble updates around a single drifter observation
 *
 * Extracts the forecast inside an observation's local window, computes the
 * analysis with the stochastic (SEnKF) or the deterministic transform (ETKF)
 * update, and scatters the kernel-weighted result into a global accumulator.
 */

#ifndef LOCAL_ANALYSIS_HPP
#define LOCAL_ANALYSIS_HPP

#include <Eigen/Dense>
#include <optional>
#include <random>
#include <string>
#include <vector>

#include "ensemble_state.hpp"
#include "localization.hpp"
#include "ocean_state.hpp"

namespace driftda {

/**
 * @brief Local update rule
 */
enum class FilterMethod {
    SEnKF,  ///< Stochastic EnKF with perturbed observations
    ETKF    ///< Ensemble transform Kalman filter
};

/**
 * @brief Parse "SEnKF" or "ETKF"
 * @throws UnsupportedMethod for any other name
 */
FilterMethod parse_filter_method(const std::string& name);

std::string to_string(FilterMethod method);

/**
 * @brief Forecast restricted to one local window
 *
 * Rows are [eta..., hu..., hv...] over the window cells in local row-major
 * order; one column per active particle.
 */
struct LocalForecast {
    Eigen::MatrixXd ensemble;
    Eigen::VectorXd mean;
    Eigen::MatrixXd perturbation;
};

/**
 * @brief Observed forecast (hu, hv) for one drifter
 */
struct LocalObservation {
    Eigen::Vector2d mean;          ///< H applied to the ensemble, averaged
    Eigen::MatrixXd perturbation;  ///< 2 × N_active deviations from the mean
};

/**
 * @brief Observed forecast for every drifter
 */
struct ObservedEnsemble {
    Eigen::MatrixXd mean;                       ///< N_d × 2
    std::vector<Eigen::MatrixXd> perturbation;  ///< N_d entries of 2 × N_active

    LocalObservation at(size_t drifter) const;
};

/**
 * @brief Flat index of the cell containing a position
 * @throws std::out_of_range outside the domain
 */
Eigen::Index containing_cell(const Eigen::Vector2d& position, const GridGeometry& grid);

/**
 * @brief Gather the forecast inside a patch
 *
 * @param X Global ensemble matrix
 * @param moments Mean and perturbations of X
 * @param patch Local window (roll already folded into its cell map)
 * @param n_cells Number of interior cells of the grid
 */
LocalForecast extract_local(
    const Eigen::MatrixXd& X,
    const EnsembleMoments& moments,
    const LocalPatch& patch,
    size_t n_cells
);

/**
 * @brief Observe (hu, hv) of every member at each drifter's cell
 *
 * The mean is a NaN-ignoring sum divided by the number of active members.
 *
 * @param X Global ensemble matrix
 * @param observations One row per drifter, columns (x, y, ...)
 * @param grid Grid geometry
 */
ObservedEnsemble observe(
    const Eigen::MatrixXd& X,
    const Eigen::MatrixXd& observations,
    const GridGeometry& grid
);

/**
 * @brief Add a kernel-weighted local analysis into a global accumulator
 *
 * @param local_analysis Local analysis, rows [eta, hu, hv] × window cells
 * @param patch Local window
 * @param kernel Localization weights (side × side)
 * @param accumulator Global matrix of the same shape as X
 * @param n_cells Number of interior cells of the grid
 */
void scatter_local(
    const Eigen::MatrixXd& local_analysis,
    const LocalPatch& patch,
    const GridField& kernel,
    Eigen::MatrixXd& accumulator,
    size_t n_cells
);

/**
 * @brief Local analysis engine
 *
 * Owns the update rule, the inflation setting, the observation covariance
 * and the random engine used for perturbed observations.
 */
class LocalAnalysis {
public:
    /**
     * @brief Constructor
     * @param method Update rule
     * @param inflation_factor Multiplicative inflation; 0 selects adaptive inflation in the ETKF
     * @param observation_covariance Covariance R of one (hu, hv) observation
     * @param seed Random seed (0 draws from std::random_device)
     */
    LocalAnalysis(
        FilterMethod method,
        double inflation_factor,
        const Eigen::Matrix2d& observation_covariance,
        unsigned int seed = 0
    );

    FilterMethod method() const { return method_; }
    double inflation_factor() const { return inflation_factor_; }
    bool adaptive_inflation() const { return inflation_factor_ == 0.0; }

    void set_observation_covariance(const Eigen::Matrix2d& R);
    const Eigen::Matrix2d& observation_covariance() const { return R_; }

    /**
     * @brief Innovations against perturbed observations, D = y + eps - HX
     * @return 2 × N_active matrix
     */
    Eigen::MatrixXd perturbed_innovations(
        const Eigen::Vector2d& y,
        const LocalObservation& observed
    );

    /**
     * @brief Perturbed innovations with observed momenta rescaled by
     *        (H + eta_k) / H for each member k
     *
     * @param eta_at_cell Forecast eta of every member at the drifter's cell
     * @param mean_depth Mean depth H (m)
     */
    Eigen::MatrixXd eta_compensated_innovations(
        const Eigen::Vector2d& y,
        const LocalObservation& observed,
        const Eigen::VectorXd& eta_at_cell,
        double mean_depth
    );

    /**
     * @brief Stochastic EnKF update
     *
     * F = infl^2/(N-1) HX' HX'^T + R,
     * X_a = X_f + 1/(N-1) X' HX'^T F^-1 D.
     *
     * @param D Innovations; drawn from N(0, R) when absent
     * @throws LinearAlgebraFailure if F is singular
     */
    Eigen::MatrixXd senkf_update(
        const LocalForecast& forecast,
        const LocalObservation& observed,
        const Eigen::Vector2d& y,
        const std::optional<Eigen::MatrixXd>& D = std::nullopt
    );

    /**
     * @brief Ensemble transform update
     *
     * A = (N-1) ff I + HX'^T R^-1 HX', K = X' A^-1 HX'^T R^-1,
     * mean_a = mean_f + K d, X'_a = X' (A/(N-1))^{-1/2}.
     *
     * @param D Innovations; their row average replaces y - H mean_f
     * @throws LinearAlgebraFailure if A is not positive definite
     */
    Eigen::MatrixXd etkf_update(
        const LocalForecast& forecast,
        const LocalObservation& observed,
        const Eigen::Vector2d& y,
        const std::optional<Eigen::MatrixXd>& D = std::nullopt
    );

    /**
     * @brief Apply the configured update rule
     */
    Eigen::MatrixXd update(
        const LocalForecast& forecast,
        const LocalObservation& observed,
        const Eigen::Vector2d& y,
        const std::optional<Eigen::MatrixXd>& D = std::nullopt
    );

    /**
     * @brief Forgetting factor 1/infl^2 with
     *        infl = sqrt(1 + trace(R^-1 d d^T) / (N - 2))
     *
     * @param innovation Mean innovation d
     * @param R_inv Observation precision
     * @param n_active Number of active members (at least 3)
     */
    static double adaptive_forgetting_factor(
        const Eigen::Vector2d& innovation,
        const Eigen::Matrix2d& R_inv,
        size_t n_active
    );

    /// Forgetting factor used by the most recent update
    double last_forgetting_factor() const { return last_forgetting_factor_; }

private:
    FilterMethod method_;
    double inflation_factor_;
    Eigen::Matrix2d R_;
    Eigen::MatrixXd R_sqrt_;  ///< Lower Cholesky factor of R
    Eigen::Matrix2d R_inv_;
    std::mt19937 rng_;
    double last_forgetting_factor_ = 1.0;

    /// Forgetting factor for this update, adaptive or fixed
    double forgetting_factor(const Eigen::Vector2d& innovation, size_t n_active);
};

} // namespace driftda

#endif // LOCAL_ANALYSIS_HPP
