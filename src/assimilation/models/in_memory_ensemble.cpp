/**
 * @file in_memory_ensemble.cpp
 * @brief Implementation of the host-memory periodic ensemble
 */

#include "ocean_ensemble.hpp"
#include <stdexcept>
#include <string>

namespace driftda {

InMemoryEnsemble::InMemoryEnsemble(
    const GridGeometry& grid,
    size_t num_particles,
    const Eigen::Matrix2d& observation_covariance,
    double mean_depth
)
    : grid_(grid)
    , particles_(num_particles, ParticleFields(grid.padded_ny(), grid.padded_nx()))
    , active_(num_particles, true)
    , obs_cov_(observation_covariance)
    , observations_(0, 4)
    , mean_depth_(mean_depth)
{
    grid_.validate();
    if (grid_.ghost_x > grid_.nx || grid_.ghost_y > grid_.ny) {
        throw std::invalid_argument("Ghost halo wider than the interior");
    }
}

size_t InMemoryEnsemble::num_active_particles() const {
    size_t count = 0;
    for (bool a : active_) {
        count += a ? 1 : 0;
    }
    return count;
}

Eigen::MatrixXd InMemoryEnsemble::buoy_positions() const {
    return observations_.leftCols(2);
}

ParticleFields InMemoryEnsemble::download(size_t particle, bool interior_only) const {
    check_index(particle);
    if (interior_only) {
        return particles_[particle].interior(grid_.ghost_x, grid_.ghost_y);
    }
    return particles_[particle];
}

void InMemoryEnsemble::upload(size_t particle, const ParticleFields& fields) {
    check_index(particle);
    if (!fields.has_shape(grid_.padded_ny(), grid_.padded_nx())) {
        throw std::invalid_argument("Uploaded fields must be ghost-padded");
    }
    particles_[particle] = fields;
    ++upload_count_;
}

void InMemoryEnsemble::apply_boundary_conditions(size_t particle) {
    check_index(particle);

    const Eigen::Index nx = static_cast<Eigen::Index>(grid_.nx);
    const Eigen::Index ny = static_cast<Eigen::Index>(grid_.ny);
    const Eigen::Index gx = static_cast<Eigen::Index>(grid_.ghost_x);
    const Eigen::Index gy = static_cast<Eigen::Index>(grid_.ghost_y);

    for (int c = 0; c < NUM_CHANNELS; ++c) {
        GridField& field = particles_[particle].channel(static_cast<Channel>(c));

        // West/east halo over the interior rows
        if (gx > 0) {
            field.block(gy, 0, ny, gx) = field.block(gy, nx, ny, gx);
            field.block(gy, gx + nx, ny, gx) = field.block(gy, gx, ny, gx);
        }

        // South/north halo over full rows, which also fills the corners
        if (gy > 0) {
            field.middleRows(0, gy) = field.middleRows(ny, gy);
            field.middleRows(gy + ny, gy) = field.middleRows(gy, gy);
        }
    }
}

void InMemoryEnsemble::set_interior(size_t particle, const ParticleFields& interior) {
    check_index(particle);
    if (!interior.has_shape(grid_.ny, grid_.nx)) {
        throw std::invalid_argument("Interior fields have the wrong shape");
    }
    particles_[particle] = ParticleFields::embed(interior, grid_.ghost_x, grid_.ghost_y);
    apply_boundary_conditions(particle);
}

void InMemoryEnsemble::set_observations(const Eigen::MatrixXd& observations) {
    if (observations.rows() > 0 && observations.cols() < 4) {
        throw std::invalid_argument("Observations need columns (x, y, hu, hv)");
    }
    observations_ = observations;
}

void InMemoryEnsemble::set_active(size_t particle, bool active) {
    check_index(particle);
    active_[particle] = active;
}

void InMemoryEnsemble::check_index(size_t particle) const {
    if (particle >= particles_.size()) {
        throw std::out_of_range("Particle index " + std::to_string(particle) +
                                " out of range");
    }
}

} // namespace driftda
