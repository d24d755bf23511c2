/**
 * @file ocean_ensemble.hpp
 * @brief Capability interface to the external ensemble simulator
 *
 * The filter never owns particle state: it downloads fields, computes the
 * analysis on the host, and uploads the result. Everything it needs from the
 * simulator and its drifter bookkeeping is listed here.
 */

#ifndef OCEAN_ENSEMBLE_HPP
#define OCEAN_ENSEMBLE_HPP

#include <Eigen/Dense>
#include <string>
#include <vector>
#include "ocean_state.hpp"

namespace driftda {

/**
 * @brief How drifter observations are produced
 *
 * Only static buoys keep their positions between cycles; every other type
 * moves with the flow.
 */
enum class ObservationType {
    DrifterPosition = 1,
    UnderlyingFlow = 2,
    DirectUnderlyingFlow = 3,
    StaticBuoys = 4
};

/**
 * @brief True if observation positions are fixed between cycles
 */
inline bool is_stationary(ObservationType type) {
    return type == ObservationType::StaticBuoys;
}

/**
 * @brief Abstract base class for ensembles of ocean models
 */
class OceanEnsemble {
public:
    virtual ~OceanEnsemble() = default;

    /// Total number of particles, active or not
    virtual size_t num_particles() const = 0;

    /// Number of particles that take part in the analysis
    virtual size_t num_active_particles() const = 0;

    /// Number of drifters (observations per cycle)
    virtual size_t num_drifters() const = 0;

    /// Activity flag per particle (length num_particles())
    virtual std::vector<bool> active_mask() const = 0;

    /// Observation error covariance of one (hu, hv) measurement
    virtual Eigen::Matrix2d observation_covariance() const = 0;

    /**
     * @brief Observed true state, one row per drifter
     * @return Matrix with columns (x, y, hu, hv, ...), at least four wide
     */
    virtual Eigen::MatrixXd observed_state() const = 0;

    /**
     * @brief Fixed positions of static buoys, one (x, y) row per buoy
     */
    virtual Eigen::MatrixXd buoy_positions() const = 0;

    virtual ObservationType observation_type() const = 0;

    /**
     * @brief Download the fields of one particle
     * @param particle Particle index in [0, num_particles())
     * @param interior_only Strip the ghost halo if true
     */
    virtual ParticleFields download(size_t particle, bool interior_only) const = 0;

    /**
     * @brief Replace the fields of one particle
     * @param particle Particle index
     * @param fields Ghost-padded fields
     */
    virtual void upload(size_t particle, const ParticleFields& fields) = 0;

    /// Refill the ghost halo of one particle
    virtual void apply_boundary_conditions(size_t particle) = 0;

    virtual GridGeometry grid() const = 0;

    /// Mean water depth H (m)
    virtual double mean_depth() const = 0;

    /// Scale observed momenta by (H + eta)/H before forming innovations
    virtual bool eta_compensation_enabled() const = 0;
};

/**
 * @brief Host-memory ensemble on a doubly periodic grid
 *
 * Stores ghost-padded fields per particle and refills the halo by copying
 * the opposite interior edge. Drifter observations are supplied directly.
 */
class InMemoryEnsemble : public OceanEnsemble {
public:
    /**
     * @brief Constructor
     * @param grid Grid geometry (including ghost widths)
     * @param num_particles Number of particles
     * @param observation_covariance Covariance of one (hu, hv) measurement
     * @param mean_depth Mean water depth (m)
     */
    InMemoryEnsemble(
        const GridGeometry& grid,
        size_t num_particles,
        const Eigen::Matrix2d& observation_covariance,
        double mean_depth = 10.0
    );

    size_t num_particles() const override { return particles_.size(); }
    size_t num_active_particles() const override;
    size_t num_drifters() const override { return static_cast<size_t>(observations_.rows()); }
    std::vector<bool> active_mask() const override { return active_; }
    Eigen::Matrix2d observation_covariance() const override { return obs_cov_; }
    Eigen::MatrixXd observed_state() const override { return observations_; }
    Eigen::MatrixXd buoy_positions() const override;
    ObservationType observation_type() const override { return observation_type_; }

    ParticleFields download(size_t particle, bool interior_only) const override;
    void upload(size_t particle, const ParticleFields& fields) override;
    void apply_boundary_conditions(size_t particle) override;

    GridGeometry grid() const override { return grid_; }
    double mean_depth() const override { return mean_depth_; }
    bool eta_compensation_enabled() const override { return compensate_for_eta_; }

    /**
     * @brief Set interior fields of a particle and refill its halo
     */
    void set_interior(size_t particle, const ParticleFields& interior);

    /**
     * @brief Set the observed state (columns x, y, hu, hv)
     */
    void set_observations(const Eigen::MatrixXd& observations);

    void set_observation_type(ObservationType type) { observation_type_ = type; }
    void set_active(size_t particle, bool active);
    void set_eta_compensation(bool enabled) { compensate_for_eta_ = enabled; }

    /// Number of upload() calls so far
    size_t upload_count() const { return upload_count_; }

private:
    GridGeometry grid_;
    std::vector<ParticleFields> particles_;  ///< Ghost-padded storage
    std::vector<bool> active_;
    Eigen::Matrix2d obs_cov_;
    Eigen::MatrixXd observations_;
    ObservationType observation_type_ = ObservationType::UnderlyingFlow;
    double mean_depth_;
    bool compensate_for_eta_ = false;
    size_t upload_count_ = 0;

    void check_index(size_t particle) const;
};

} // namespace driftda

#endif // OCEAN_ENSEMBLE_HPP
