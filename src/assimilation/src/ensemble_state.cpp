/**
 * @file ensemble_state.cpp
 * @brief Implementation of the host-side ensemble matrix
 */

#include "ensemble_state.hpp"
#include "lenkf_errors.hpp"
#include "logging.hpp"
#include <stdexcept>
#include <string>

namespace driftda {

EnsembleState::EnsembleState(const GridGeometry& grid, size_t num_particles, size_t num_active)
    : grid_(grid)
    , num_particles_(num_particles)
    , num_active_(num_active)
{
    grid_.validate();
    if (num_active > num_particles) {
        throw std::invalid_argument("More active particles than particles");
    }

    X_ = Eigen::MatrixXd::Zero(NUM_CHANNELS * static_cast<Eigen::Index>(grid_.n_cells()),
                               static_cast<Eigen::Index>(num_active));
}

void EnsembleState::download_all(const OceanEnsemble& ensemble) {
    if (ensemble.num_particles() != num_particles_) {
        throw ConfigurationMismatch("Ensemble has " + std::to_string(ensemble.num_particles()) +
                                    " particles, expected " + std::to_string(num_particles_));
    }

    const std::vector<bool> active = ensemble.active_mask();
    size_t n_active = 0;
    for (bool a : active) {
        n_active += a ? 1 : 0;
    }
    if (active.size() != num_particles_ || n_active != num_active_) {
        throw ConfigurationMismatch("Ensemble has " + std::to_string(n_active) +
                                    " active particles, expected " + std::to_string(num_active_));
    }

    Eigen::Index idx = 0;
    for (size_t p = 0; p < num_particles_; ++p) {
        if (!active[p]) {
            continue;
        }

        const ParticleFields fields = ensemble.download(p, true);
        if (!fields.has_shape(grid_.ny, grid_.nx)) {
            throw ConfigurationMismatch("Particle " + std::to_string(p) +
                                        " returned fields of shape " +
                                        std::to_string(fields.rows()) + "x" +
                                        std::to_string(fields.cols()));
        }

        X_.col(idx) = fields.to_vector();
        ++idx;
    }

    downloaded_ = true;
    DRIFTDA_LOG_DEBUG("Downloaded {} active particles", num_active_);
}

EnsembleMoments EnsembleState::mean_and_perturbation() const {
    EnsembleMoments moments;
    moments.mean = X_.rowwise().mean();
    moments.perturbation = X_.colwise() - moments.mean;
    return moments;
}

void EnsembleState::upload_all(OceanEnsemble& ensemble) const {
    if (!downloaded_) {
        throw std::runtime_error("Ensemble state was never downloaded");
    }

    const std::vector<bool> active = ensemble.active_mask();
    if (active.size() != num_particles_) {
        throw ConfigurationMismatch("Ensemble changed its number of particles");
    }
    ParticleFields interior(grid_.ny, grid_.nx);

    Eigen::Index idx = 0;
    for (size_t p = 0; p < num_particles_; ++p) {
        if (!active[p]) {
            continue;
        }

        interior.from_vector(X_.col(idx));
        ensemble.upload(p, ParticleFields::embed(interior, grid_.ghost_x, grid_.ghost_y));
        ensemble.apply_boundary_conditions(p);
        ++idx;
    }
}

void EnsembleState::set_matrix(const Eigen::MatrixXd& X) {
    if (X.rows() != X_.rows() || X.cols() != X_.cols()) {
        throw std::invalid_argument("Ensemble matrix shape mismatch");
    }
    X_ = X;
}

GridField EnsembleState::channel(size_t member, Channel c) const {
    if (member >= num_active_) {
        throw std::out_of_range("Member index out of range");
    }

    const Eigen::Index n = static_cast<Eigen::Index>(grid_.n_cells());
    const Eigen::VectorXd slab = X_.col(static_cast<Eigen::Index>(member)).segment(
        state_index(c, 0, n), n);

    return Eigen::Map<const GridField>(slab.data(), grid_.ny, grid_.nx);
}

} // namespace driftda
