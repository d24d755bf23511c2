/**
 * @file lenkf.hpp
 * @brief Localized ensemble Kalman filter for drifter observations
 *
 * Assimilates sparse (hu, hv) drifter observations into an ensemble of
 * shallow-water simulations. Observations are partitioned into groups whose
 * local windows do not overlap; each group is analysed in turn and blended
 * back into the forecast before the next group.
 */

#ifndef LENKF_HPP
#define LENKF_HPP

#include <Eigen/Dense>
#include <memory>
#include <optional>

#include "local_analysis.hpp"
#include "localization.hpp"
#include "ocean_ensemble.hpp"
#include "ocean_state.hpp"

namespace driftda {

/**
 * @brief Filter configuration
 */
struct LEnKFConfig {
    double relaxation_factor = 1.0;            ///< Scales the localization kernel
    double inflation_factor = 1.0;             ///< 0 selects adaptive inflation (ETKF)
    FilterMethod method = FilterMethod::SEnKF; ///< Local update rule
    double localization_radius = 15.0;         ///< Radius in grid cells (r_factor)
    unsigned int seed = 0;                     ///< 0 draws from std::random_device

    /**
     * @brief Check ranges
     * @throws std::invalid_argument on negative factors or non-positive radius
     */
    void validate() const;
};

/**
 * @brief Localized EnKF driver
 *
 * Binds to one ensemble at construction and caches its particle count,
 * drifter count and grid. Every later cycle is checked against that cache.
 */
class LocalizedEnKF {
public:
    /**
     * @brief Constructor
     * @param ensemble Ensemble to assimilate into
     * @param config Filter configuration
     */
    explicit LocalizedEnKF(
        std::shared_ptr<OceanEnsemble> ensemble,
        const LEnKFConfig& config = LEnKFConfig()
    );

    /**
     * @brief Run one assimilation cycle
     *
     * The ensemble is only written by the final upload; any failure leaves
     * it untouched.
     *
     * @param ensemble Replacement ensemble with the same configuration;
     *                 the bound ensemble is used when null
     * @param localization_radius Overrides the configured radius
     * @throws ConfigurationMismatch if the ensemble differs from the cached
     *         configuration
     */
    void assimilate(
        std::shared_ptr<OceanEnsemble> ensemble = nullptr,
        std::optional<double> localization_radius = std::nullopt
    );

    /**
     * @brief Get filter statistics
     */
    struct Statistics {
        size_t assimilation_count;
        double last_assimilation_time_ms;
        double avg_assimilation_time_ms;
        size_t num_groups;             ///< Groups in the most recent cycle
        size_t planner_rebuilds;       ///< Localization rebuilds so far
        double last_forgetting_factor; ///< 1/infl^2 of the most recent update
    };

    Statistics get_statistics() const { return stats_; }

    const LEnKFConfig& get_config() const { return config_; }
    const LocalizationPlanner& planner() const { return planner_; }
    const GridGeometry& grid() const { return grid_; }

    size_t num_particles() const { return num_particles_; }
    size_t num_drifters() const { return num_drifters_; }
    size_t num_active_particles() const { return num_active_; }

private:
    std::shared_ptr<OceanEnsemble> ensemble_;
    LEnKFConfig config_;

    // Cached configuration
    size_t num_particles_;
    size_t num_drifters_;
    size_t num_active_;
    GridGeometry grid_;

    LocalizationPlanner planner_;
    LocalAnalysis analysis_;

    Statistics stats_;

    /**
     * @brief Compare an ensemble with the cached configuration
     * @throws ConfigurationMismatch on any difference
     */
    void check_configuration(const OceanEnsemble& ensemble) const;

    /**
     * @brief Positions used for localization (N_d × 2)
     */
    static Eigen::MatrixXd observation_positions(
        const OceanEnsemble& ensemble,
        const Eigen::MatrixXd& observations
    );

    /**
     * @brief X = forecast ⊙ X + accumulator on every channel
     */
    static Eigen::MatrixXd blend(
        const Eigen::MatrixXd& X,
        const BlendWeights& weights,
        const Eigen::MatrixXd& accumulator
    );
};

} // namespace driftda

#endif // LENKF_HPP
