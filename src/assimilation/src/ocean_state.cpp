/**
 * @file ocean_state.cpp
 * @brief Implementation of grid geometry and particle fields
 */

#include "ocean_state.hpp"
#include <stdexcept>
#include <utility>

namespace driftda {

void GridGeometry::validate() const {
    if (nx == 0 || ny == 0) {
        throw std::invalid_argument("Grid dimensions must be positive");
    }
    if (!(dx > 0.0) || !(dy > 0.0)) {
        throw std::invalid_argument("Grid spacing must be positive");
    }
}

ParticleFields::ParticleFields(size_t rows, size_t cols)
    : eta(GridField::Zero(rows, cols))
    , hu(GridField::Zero(rows, cols))
    , hv(GridField::Zero(rows, cols))
{
}

ParticleFields::ParticleFields(GridField eta_in, GridField hu_in, GridField hv_in)
    : eta(std::move(eta_in))
    , hu(std::move(hu_in))
    , hv(std::move(hv_in))
{
    if (eta.rows() != hu.rows() || eta.rows() != hv.rows() ||
        eta.cols() != hu.cols() || eta.cols() != hv.cols()) {
        throw std::invalid_argument("eta, hu and hv must share one shape");
    }
}

bool ParticleFields::has_shape(size_t rows, size_t cols) const {
    const auto r = static_cast<Eigen::Index>(rows);
    const auto c = static_cast<Eigen::Index>(cols);
    return eta.rows() == r && eta.cols() == c &&
           hu.rows() == r && hu.cols() == c &&
           hv.rows() == r && hv.cols() == c;
}

GridField& ParticleFields::channel(Channel c) {
    switch (c) {
        case Channel::Eta: return eta;
        case Channel::Hu:  return hu;
        case Channel::Hv:  return hv;
    }
    throw std::out_of_range("Unknown channel");
}

const GridField& ParticleFields::channel(Channel c) const {
    switch (c) {
        case Channel::Eta: return eta;
        case Channel::Hu:  return hu;
        case Channel::Hv:  return hv;
    }
    throw std::out_of_range("Unknown channel");
}

Eigen::VectorXd ParticleFields::to_vector() const {
    const Eigen::Index n = eta.size();
    Eigen::VectorXd vec(NUM_CHANNELS * n);

    // Row-major storage makes the reshaped view the flattened grid
    vec.segment(0, n) = Eigen::Map<const Eigen::VectorXd>(eta.data(), n);
    vec.segment(n, n) = Eigen::Map<const Eigen::VectorXd>(hu.data(), n);
    vec.segment(2 * n, n) = Eigen::Map<const Eigen::VectorXd>(hv.data(), n);

    return vec;
}

void ParticleFields::from_vector(const Eigen::VectorXd& vec) {
    const Eigen::Index n = eta.size();
    if (vec.size() != NUM_CHANNELS * n) {
        throw std::invalid_argument("Vector size mismatch");
    }

    Eigen::Map<Eigen::VectorXd>(eta.data(), n) = vec.segment(0, n);
    Eigen::Map<Eigen::VectorXd>(hu.data(), n) = vec.segment(n, n);
    Eigen::Map<Eigen::VectorXd>(hv.data(), n) = vec.segment(2 * n, n);
}

ParticleFields ParticleFields::interior(size_t ghost_x, size_t ghost_y) const {
    if (rows() < 2 * ghost_y || cols() < 2 * ghost_x) {
        throw std::invalid_argument("Ghost halo larger than the field");
    }

    const Eigen::Index r = static_cast<Eigen::Index>(rows() - 2 * ghost_y);
    const Eigen::Index c = static_cast<Eigen::Index>(cols() - 2 * ghost_x);
    const Eigen::Index gy = static_cast<Eigen::Index>(ghost_y);
    const Eigen::Index gx = static_cast<Eigen::Index>(ghost_x);

    return ParticleFields(
        GridField(eta.block(gy, gx, r, c)),
        GridField(hu.block(gy, gx, r, c)),
        GridField(hv.block(gy, gx, r, c))
    );
}

ParticleFields ParticleFields::embed(const ParticleFields& interior,
                                     size_t ghost_x, size_t ghost_y) {
    ParticleFields padded(interior.rows() + 2 * ghost_y,
                          interior.cols() + 2 * ghost_x);

    const Eigen::Index r = static_cast<Eigen::Index>(interior.rows());
    const Eigen::Index c = static_cast<Eigen::Index>(interior.cols());
    const Eigen::Index gy = static_cast<Eigen::Index>(ghost_y);
    const Eigen::Index gx = static_cast<Eigen::Index>(ghost_x);

    padded.eta.block(gy, gx, r, c) = interior.eta;
    padded.hu.block(gy, gx, r, c) = interior.hu;
    padded.hv.block(gy, gx, r, c) = interior.hv;

    return padded;
}

} // namespace driftda
