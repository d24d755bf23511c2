/**
 * @file lenkf.cpp
 * @brief Implementation of the localized EnKF driver
 */

#include "lenkf.hpp"
#include "ensemble_state.hpp"
#include "lenkf_errors.hpp"
#include "logging.hpp"
#include <chrono>
#include <stdexcept>
#include <string>

namespace driftda {

void LEnKFConfig::validate() const {
    if (relaxation_factor < 0.0) {
        throw std::invalid_argument("relaxation_factor must be non-negative");
    }
    if (inflation_factor < 0.0) {
        throw std::invalid_argument("inflation_factor must be non-negative");
    }
    if (!(localization_radius > 0.0)) {
        throw std::invalid_argument("localization_radius must be positive");
    }
}

LocalizedEnKF::LocalizedEnKF(
    std::shared_ptr<OceanEnsemble> ensemble,
    const LEnKFConfig& config
)
    : ensemble_(ensemble)
    , config_(config)
    , num_particles_(0)
    , num_drifters_(0)
    , num_active_(0)
    , planner_(config.relaxation_factor)
    , analysis_(config.method, config.inflation_factor,
                ensemble ? ensemble->observation_covariance()
                         : Eigen::Matrix2d(Eigen::Matrix2d::Identity()),
                config.seed)
{
    if (!ensemble_) {
        throw std::invalid_argument("Ensemble must not be null");
    }
    config_.validate();

    num_particles_ = ensemble_->num_particles();
    num_drifters_ = ensemble_->num_drifters();
    num_active_ = ensemble_->num_active_particles();
    grid_ = ensemble_->grid();
    grid_.validate();

    // Initialize statistics
    stats_.assimilation_count = 0;
    stats_.last_assimilation_time_ms = 0.0;
    stats_.avg_assimilation_time_ms = 0.0;
    stats_.num_groups = 0;
    stats_.planner_rebuilds = 0;
    stats_.last_forgetting_factor = 1.0;

    DRIFTDA_LOG_DEBUG("LocalizedEnKF bound to {} particles, {} drifters, {}x{} grid, method {}",
                      num_particles_, num_drifters_, grid_.nx, grid_.ny,
                      to_string(config_.method));
}

void LocalizedEnKF::assimilate(
    std::shared_ptr<OceanEnsemble> ensemble,
    std::optional<double> localization_radius
) {
    auto start = std::chrono::high_resolution_clock::now();

    if (ensemble) {
        check_configuration(*ensemble);
        ensemble_ = ensemble;
    } else {
        check_configuration(*ensemble_);
    }
    OceanEnsemble& target = *ensemble_;

    const double r_factor = localization_radius.value_or(config_.localization_radius);
    if (!(r_factor > 0.0)) {
        throw std::invalid_argument("localization_radius must be positive");
    }

    num_active_ = target.num_active_particles();
    analysis_.set_observation_covariance(target.observation_covariance());

    if (num_drifters_ == 0) {
        DRIFTDA_LOG_WARN("No observations to assimilate");
        return;
    }

    const Eigen::MatrixXd observations = target.observed_state();
    if (observations.rows() != static_cast<Eigen::Index>(num_drifters_) ||
        observations.cols() < 4) {
        DRIFTDA_LOG_ERROR("Observed state has shape {}x{}, expected {}x4",
                          observations.rows(), observations.cols(), num_drifters_);
        throw ConfigurationMismatch("Observed state must have one row per drifter and "
                                    "columns (x, y, hu, hv)");
    }

    const Eigen::MatrixXd positions = observation_positions(target, observations);
    planner_.prepare(positions, grid_, r_factor, is_stationary(target.observation_type()));

    const Eigen::Index n_cells = static_cast<Eigen::Index>(grid_.n_cells());
    const bool compensate_eta = target.eta_compensation_enabled();
    const ObservationGroups& groups = planner_.groups();

    DRIFTDA_LOG_DEBUG("Assimilating {} drifters into {} active particles ({} groups)",
                      num_drifters_, num_active_, groups.size());

    EnsembleState state(grid_, num_particles_, num_active_);

    for (size_t g = 0; g < groups.size(); ++g) {
        // Later groups continue from the blended forecast of the previous one
        if (g == 0) {
            state.download_all(target);
        }

        const Eigen::MatrixXd& X = state.matrix();
        const EnsembleMoments moments = state.mean_and_perturbation();
        const ObservedEnsemble observed = observe(X, positions, grid_);

        Eigen::MatrixXd accumulator = Eigen::MatrixXd::Zero(X.rows(), X.cols());

        for (size_t d : groups[g]) {
            const LocalPatch& patch = planner_.patches()[d];
            const LocalForecast local = extract_local(X, moments, patch, grid_.n_cells());
            const LocalObservation local_obs = observed.at(d);
            const Eigen::Index row = static_cast<Eigen::Index>(d);
            const Eigen::Vector2d y(observations(row, 2), observations(row, 3));

            std::optional<Eigen::MatrixXd> D;
            if (compensate_eta) {
                const Eigen::Index cell = containing_cell(
                    positions.row(row).transpose(), grid_);
                const Eigen::VectorXd eta_at_cell =
                    X.row(EnsembleState::state_index(Channel::Eta, cell, n_cells)).transpose();
                D = analysis_.eta_compensated_innovations(
                    y, local_obs, eta_at_cell, target.mean_depth());
            }

            const Eigen::MatrixXd local_analysis = analysis_.update(local, local_obs, y, D);
            scatter_local(local_analysis, patch, planner_.kernel(), accumulator,
                          grid_.n_cells());
        }

        state.set_matrix(blend(X, planner_.blend(g), accumulator));
    }

    state.upload_all(target);

    // Update statistics
    auto end = std::chrono::high_resolution_clock::now();
    const double duration_ms =
        std::chrono::duration<double, std::milli>(end - start).count();

    stats_.assimilation_count++;
    stats_.last_assimilation_time_ms = duration_ms;
    stats_.avg_assimilation_time_ms =
        (stats_.avg_assimilation_time_ms * (stats_.assimilation_count - 1) + duration_ms) /
        stats_.assimilation_count;
    stats_.num_groups = groups.size();
    stats_.planner_rebuilds = planner_.rebuild_count();
    stats_.last_forgetting_factor = analysis_.last_forgetting_factor();

    DRIFTDA_LOG_DEBUG("Assimilation cycle {} done in {:.2f} ms",
                      stats_.assimilation_count, duration_ms);
}

void LocalizedEnKF::check_configuration(const OceanEnsemble& ensemble) const {
    std::string problem;

    if (ensemble.num_particles() != num_particles_) {
        problem = "number of particles " + std::to_string(ensemble.num_particles()) +
                  " != " + std::to_string(num_particles_);
    } else if (ensemble.num_drifters() != num_drifters_) {
        problem = "number of drifters " + std::to_string(ensemble.num_drifters()) +
                  " != " + std::to_string(num_drifters_);
    } else {
        const GridGeometry other = ensemble.grid();
        if (other.nx != grid_.nx || other.ny != grid_.ny) {
            problem = "interior grid " + std::to_string(other.nx) + "x" +
                      std::to_string(other.ny) + " != " + std::to_string(grid_.nx) +
                      "x" + std::to_string(grid_.ny);
        } else if (other.padded_nx() != grid_.padded_nx() ||
                   other.padded_ny() != grid_.padded_ny()) {
            problem = "ghost-padded grid " + std::to_string(other.padded_nx()) + "x" +
                      std::to_string(other.padded_ny()) + " != " +
                      std::to_string(grid_.padded_nx()) + "x" +
                      std::to_string(grid_.padded_ny());
        }
    }

    if (!problem.empty()) {
        DRIFTDA_LOG_ERROR("Ensemble configuration mismatch: {}", problem);
        throw ConfigurationMismatch("Ensemble configuration mismatch: " + problem);
    }
}

Eigen::MatrixXd LocalizedEnKF::observation_positions(
    const OceanEnsemble& ensemble,
    const Eigen::MatrixXd& observations
) {
    if (ensemble.observation_type() == ObservationType::StaticBuoys) {
        const Eigen::MatrixXd buoys = ensemble.buoy_positions();
        if (buoys.rows() != observations.rows() || buoys.cols() < 2) {
            throw ConfigurationMismatch("Buoy positions do not match the observations");
        }
        return buoys.leftCols(2);
    }
    return observations.leftCols(2);
}

Eigen::MatrixXd LocalizedEnKF::blend(
    const Eigen::MatrixXd& X,
    const BlendWeights& weights,
    const Eigen::MatrixXd& accumulator
) {
    const Eigen::Index n = weights.forecast.size();
    const Eigen::Map<const Eigen::VectorXd> forecast(weights.forecast.data(), n);

    Eigen::MatrixXd blended(X.rows(), X.cols());
    for (int c = 0; c < NUM_CHANNELS; ++c) {
        blended.middleRows(c * n, n) =
            forecast.asDiagonal() * X.middleRows(c * n, n) + accumulator.middleRows(c * n, n);
    }
    return blended;
}

} // namespace driftda
