/**
 * @file ensemble_state.hpp
 * @brief Dense ensemble matrix pulled from the simulator
 *
 * One column per active particle, rows ordered [eta, hu, hv], each channel a
 * row-major flattened (ny × nx) grid.
 */

#ifndef ENSEMBLE_STATE_HPP
#define ENSEMBLE_STATE_HPP

#include <Eigen/Dense>
#include "ocean_ensemble.hpp"
#include "ocean_state.hpp"

namespace driftda {

/**
 * @brief Ensemble mean and perturbations
 */
struct EnsembleMoments {
    Eigen::VectorXd mean;          ///< Column average of X
    Eigen::MatrixXd perturbation;  ///< X minus the mean in every column
};

/**
 * @brief Host-side copy of the ensemble forecast for one assimilation cycle
 */
class EnsembleState {
public:
    /**
     * @brief Constructor
     * @param grid Grid geometry
     * @param num_particles Expected total number of particles
     * @param num_active Expected number of active particles
     */
    EnsembleState(const GridGeometry& grid, size_t num_particles, size_t num_active);

    /**
     * @brief Pull interior fields of every active particle into the matrix
     * @throws ConfigurationMismatch if particle counts or field shapes differ
     */
    void download_all(const OceanEnsemble& ensemble);

    /**
     * @brief Mean and perturbations of the current matrix
     */
    EnsembleMoments mean_and_perturbation() const;

    /**
     * @brief Write every active particle back, ghost-padded, and refill halos
     * @throws std::runtime_error if nothing was downloaded
     */
    void upload_all(OceanEnsemble& ensemble) const;

    const Eigen::MatrixXd& matrix() const { return X_; }

    /**
     * @brief Replace the ensemble matrix (shape must be unchanged)
     */
    void set_matrix(const Eigen::MatrixXd& X);

    /**
     * @brief One channel of one member as a grid
     */
    GridField channel(size_t member, Channel c) const;

    size_t num_active() const { return num_active_; }
    const GridGeometry& grid() const { return grid_; }
    Eigen::Index state_dimension() const { return X_.rows(); }
    bool is_downloaded() const { return downloaded_; }

    /**
     * @brief Row of channel c at a flat cell index
     */
    static Eigen::Index state_index(Channel c, Eigen::Index cell, Eigen::Index n_cells) {
        return static_cast<Eigen::Index>(c) * n_cells + cell;
    }

private:
    GridGeometry grid_;
    size_t num_particles_;
    size_t num_active_;
    Eigen::MatrixXd X_;
    bool downloaded_ = false;
};

} // namespace driftda

#endif // ENSEMBLE_STATE_HPP
