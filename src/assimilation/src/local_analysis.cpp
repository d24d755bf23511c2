/**
 * @file local_analysis.cpp
 * @brief Implementation of local SEnKF and ETKF updates
 */

#include "local_analysis.hpp"
#include "ensemble_linalg.hpp"
#include "lenkf_errors.hpp"
#include "logging.hpp"
#include <cmath>
#include <limits>
#include <stdexcept>

namespace driftda {

FilterMethod parse_filter_method(const std::string& name) {
    if (name == "SEnKF") {
        return FilterMethod::SEnKF;
    }
    if (name == "ETKF") {
        return FilterMethod::ETKF;
    }
    throw UnsupportedMethod("Method '" + name + "' not supported. Choose among SEnKF, ETKF");
}

std::string to_string(FilterMethod method) {
    switch (method) {
        case FilterMethod::SEnKF: return "SEnKF";
        case FilterMethod::ETKF:  return "ETKF";
    }
    throw UnsupportedMethod("Unknown filter method");
}

LocalObservation ObservedEnsemble::at(size_t drifter) const {
    if (drifter >= perturbation.size()) {
        throw std::out_of_range("Drifter index out of range");
    }

    LocalObservation observed;
    observed.mean = mean.row(static_cast<Eigen::Index>(drifter)).transpose();
    observed.perturbation = perturbation[drifter];
    return observed;
}

Eigen::Index containing_cell(const Eigen::Vector2d& position, const GridGeometry& grid) {
    if (position.x() < 0.0 || position.x() >= grid.domain_x() ||
        position.y() < 0.0 || position.y() >= grid.domain_y()) {
        throw std::out_of_range("Observation lies outside the domain");
    }

    const Eigen::Index id_x = static_cast<Eigen::Index>(std::floor(position.x() / grid.dx));
    const Eigen::Index id_y = static_cast<Eigen::Index>(std::floor(position.y() / grid.dy));

    return id_y * static_cast<Eigen::Index>(grid.nx) + id_x;
}

LocalForecast extract_local(
    const Eigen::MatrixXd& X,
    const EnsembleMoments& moments,
    const LocalPatch& patch,
    size_t n_cells
) {
    const Eigen::Index n_local = static_cast<Eigen::Index>(patch.n_local());
    const Eigen::Index n = static_cast<Eigen::Index>(n_cells);
    const Eigen::Index n_members = X.cols();

    LocalForecast local;
    local.ensemble.resize(NUM_CHANNELS * n_local, n_members);
    local.mean.resize(NUM_CHANNELS * n_local);
    local.perturbation.resize(NUM_CHANNELS * n_local, n_members);

    for (int c = 0; c < NUM_CHANNELS; ++c) {
        for (Eigen::Index k = 0; k < n_local; ++k) {
            const Eigen::Index row = EnsembleState::state_index(
                static_cast<Channel>(c), patch.cells[k], n);
            const Eigen::Index local_row = c * n_local + k;

            local.ensemble.row(local_row) = X.row(row);
            local.mean(local_row) = moments.mean(row);
            local.perturbation.row(local_row) = moments.perturbation.row(row);
        }
    }

    return local;
}

ObservedEnsemble observe(
    const Eigen::MatrixXd& X,
    const Eigen::MatrixXd& observations,
    const GridGeometry& grid
) {
    if (observations.rows() > 0 && observations.cols() < 2) {
        throw std::invalid_argument("Observations need (x, y) columns");
    }

    const Eigen::Index n_drifters = observations.rows();
    const Eigen::Index n_members = X.cols();
    const Eigen::Index n = static_cast<Eigen::Index>(grid.n_cells());

    ObservedEnsemble observed;
    observed.mean = Eigen::MatrixXd::Zero(n_drifters, 2);
    observed.perturbation.reserve(static_cast<size_t>(n_drifters));

    for (Eigen::Index d = 0; d < n_drifters; ++d) {
        const Eigen::Index cell = containing_cell(
            observations.row(d).head<2>().transpose(), grid);

        Eigen::MatrixXd HX(2, n_members);
        HX.row(0) = X.row(EnsembleState::state_index(Channel::Hu, cell, n));
        HX.row(1) = X.row(EnsembleState::state_index(Channel::Hv, cell, n));

        // Undefined members contribute nothing to the sum
        for (Eigen::Index i = 0; i < 2; ++i) {
            double sum = 0.0;
            for (Eigen::Index k = 0; k < n_members; ++k) {
                if (!std::isnan(HX(i, k))) {
                    sum += HX(i, k);
                }
            }
            observed.mean(d, i) = sum / static_cast<double>(n_members);
        }

        const Eigen::Vector2d mean = observed.mean.row(d).transpose();
        observed.perturbation.push_back(Eigen::MatrixXd(HX.colwise() - mean));
    }

    return observed;
}

void scatter_local(
    const Eigen::MatrixXd& local_analysis,
    const LocalPatch& patch,
    const GridField& kernel,
    Eigen::MatrixXd& accumulator,
    size_t n_cells
) {
    const Eigen::Index n_local = static_cast<Eigen::Index>(patch.n_local());
    const Eigen::Index n = static_cast<Eigen::Index>(n_cells);

    if (kernel.size() != n_local || local_analysis.rows() != NUM_CHANNELS * n_local) {
        throw std::invalid_argument("Local analysis does not match the patch");
    }
    if (accumulator.cols() != local_analysis.cols()) {
        throw std::invalid_argument("Accumulator and local analysis member counts differ");
    }

    for (int c = 0; c < NUM_CHANNELS; ++c) {
        for (Eigen::Index k = 0; k < n_local; ++k) {
            const Eigen::Index row = EnsembleState::state_index(
                static_cast<Channel>(c), patch.cells[k], n);
            accumulator.row(row) += kernel.data()[k] * local_analysis.row(c * n_local + k);
        }
    }
}

// =======================
// LocalAnalysis
// =======================

LocalAnalysis::LocalAnalysis(
    FilterMethod method,
    double inflation_factor,
    const Eigen::Matrix2d& observation_covariance,
    unsigned int seed
)
    : method_(method)
    , inflation_factor_(inflation_factor)
    , rng_(seed == 0 ? std::random_device{}() : seed)
{
    if (inflation_factor < 0.0) {
        throw std::invalid_argument("Inflation factor must be non-negative");
    }
    set_observation_covariance(observation_covariance);
}

void LocalAnalysis::set_observation_covariance(const Eigen::Matrix2d& R) {
    R_sqrt_ = covariance_sqrt(R);
    R_inv_ = invert_covariance(R);
    R_ = R;
}

Eigen::MatrixXd LocalAnalysis::perturbed_innovations(
    const Eigen::Vector2d& y,
    const LocalObservation& observed
) {
    const Eigen::Index n_members = observed.perturbation.cols();
    const Eigen::MatrixXd eps = draw_gaussian_samples(R_sqrt_, static_cast<size_t>(n_members), rng_);

    const Eigen::MatrixXd Y = eps.colwise() + y;
    const Eigen::MatrixXd HX = observed.perturbation.colwise() + observed.mean;

    return Y - HX;
}

Eigen::MatrixXd LocalAnalysis::eta_compensated_innovations(
    const Eigen::Vector2d& y,
    const LocalObservation& observed,
    const Eigen::VectorXd& eta_at_cell,
    double mean_depth
) {
    const Eigen::Index n_members = observed.perturbation.cols();
    if (eta_at_cell.size() != n_members) {
        throw std::invalid_argument("eta samples do not match the ensemble size");
    }
    if (!(mean_depth > 0.0)) {
        throw std::invalid_argument("Mean depth must be positive");
    }

    const Eigen::MatrixXd eps = draw_gaussian_samples(R_sqrt_, static_cast<size_t>(n_members), rng_);
    Eigen::MatrixXd Y = eps.colwise() + y;

    const Eigen::VectorXd compensation = (eta_at_cell.array() + mean_depth) / mean_depth;
    Y = Y * compensation.asDiagonal();

    const Eigen::MatrixXd HX = observed.perturbation.colwise() + observed.mean;
    return Y - HX;
}

double LocalAnalysis::adaptive_forgetting_factor(
    const Eigen::Vector2d& innovation,
    const Eigen::Matrix2d& R_inv,
    size_t n_active
) {
    if (n_active < 3) {
        throw ConfigurationMismatch("Adaptive inflation needs at least three active particles");
    }

    const double trace = (R_inv * innovation * innovation.transpose()).trace();
    const double inflation = std::sqrt(1.0 + trace / static_cast<double>(n_active - 2));

    DRIFTDA_LOG_TRACE("Adaptive inflation {:.6f}", inflation);
    return 1.0 / (inflation * inflation);
}

double LocalAnalysis::forgetting_factor(const Eigen::Vector2d& innovation, size_t n_active) {
    if (adaptive_inflation()) {
        last_forgetting_factor_ = adaptive_forgetting_factor(innovation, R_inv_, n_active);
    } else {
        last_forgetting_factor_ = 1.0 / (inflation_factor_ * inflation_factor_);
    }
    return last_forgetting_factor_;
}

Eigen::MatrixXd LocalAnalysis::senkf_update(
    const LocalForecast& forecast,
    const LocalObservation& observed,
    const Eigen::Vector2d& y,
    const std::optional<Eigen::MatrixXd>& D
) {
    const Eigen::Index n_members = forecast.ensemble.cols();
    if (n_members < 2) {
        throw ConfigurationMismatch("SEnKF needs at least two active particles");
    }

    const Eigen::MatrixXd innovations = D ? *D : perturbed_innovations(y, observed);
    if (innovations.rows() != 2 || innovations.cols() != n_members) {
        throw std::invalid_argument("Innovation matrix must be 2 x N_active");
    }

    const Eigen::MatrixXd& HXp = observed.perturbation;
    const double scale = 1.0 / static_cast<double>(n_members - 1);

    // Inflation is applied as given; zero leaves F = R
    const double inflation_sq = inflation_factor_ * inflation_factor_;
    last_forgetting_factor_ = inflation_sq > 0.0 ? 1.0 / inflation_sq
                                                 : std::numeric_limits<double>::infinity();
    const Eigen::MatrixXd F = (inflation_sq * scale) * HXp * HXp.transpose() + R_;

    Eigen::FullPivLU<Eigen::MatrixXd> lu(F);
    if (!lu.isInvertible()) {
        throw LinearAlgebraFailure("Innovation covariance F is singular");
    }

    return forecast.ensemble +
           scale * forecast.perturbation * (HXp.transpose() * lu.solve(innovations));
}

Eigen::MatrixXd LocalAnalysis::etkf_update(
    const LocalForecast& forecast,
    const LocalObservation& observed,
    const Eigen::Vector2d& y,
    const std::optional<Eigen::MatrixXd>& D
) {
    const Eigen::Index n_members = forecast.ensemble.cols();
    if (n_members < 2) {
        throw ConfigurationMismatch("ETKF needs at least two active particles");
    }

    const Eigen::Vector2d d = D ? Eigen::Vector2d(D->rowwise().mean())
                                : Eigen::Vector2d(y - observed.mean);

    const Eigen::MatrixXd& HXp = observed.perturbation;
    const double n_minus_one = static_cast<double>(n_members - 1);
    const double ff = forgetting_factor(d, static_cast<size_t>(n_members));

    const Eigen::MatrixXd HXp_T_Rinv = HXp.transpose() * R_inv_;
    const Eigen::MatrixXd A =
        n_minus_one * ff * Eigen::MatrixXd::Identity(n_members, n_members) + HXp_T_Rinv * HXp;

    Eigen::LLT<Eigen::MatrixXd> llt(A);
    if (llt.info() != Eigen::Success) {
        throw LinearAlgebraFailure("Transform matrix A is not positive definite");
    }

    const Eigen::MatrixXd K = forecast.perturbation * llt.solve(HXp_T_Rinv);
    const Eigen::VectorXd analysis_mean = forecast.mean + K * d;

    const Eigen::MatrixXd transform = symmetric_inverse_sqrt(A / n_minus_one);
    Eigen::MatrixXd analysis = forecast.perturbation * transform;
    analysis.colwise() += analysis_mean;

    return analysis;
}

Eigen::MatrixXd LocalAnalysis::update(
    const LocalForecast& forecast,
    const LocalObservation& observed,
    const Eigen::Vector2d& y,
    const std::optional<Eigen::MatrixXd>& D
) {
    switch (method_) {
        case FilterMethod::SEnKF:
            return senkf_update(forecast, observed, y, D);
        case FilterMethod::ETKF:
            return etkf_update(forecast, observed, y, D);
    }
    throw UnsupportedMethod("Unknown filter method");
}

} // namespace driftda
