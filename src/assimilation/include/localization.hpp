/**
 * @file localization.hpp
 * @brief Observation localization on a doubly periodic grid
 *
 * Builds the Gaspari-Cohn weight stencil, the local patch of every
 * observation (with the periodic roll needed to read it across a domain
 * edge), the sequential observation groups, and the per-group weights used
 * to blend local analyses into the global forecast.
 */

#ifndef LOCALIZATION_HPP
#define LOCALIZATION_HPP

#include <Eigen/Dense>
#include <vector>
#include "ocean_state.hpp"

namespace driftda {

/**
 * @brief Local window of one observation
 *
 * The window is the (side × side) block of cells centred on the cell that
 * contains the observation. When it crosses a domain edge, mask covers the
 * wrapped segments and (xroll, yroll) is the shift that restores the local
 * order after slicing the mask in global row-major order.
 */
struct LocalPatch {
    GridMask mask;   ///< Cells of the window on the global grid
    int xroll = 0;   ///< Roll in x (negative: wrapped past the left edge)
    int yroll = 0;   ///< Roll in y (negative: wrapped past the bottom edge)
    size_t side = 0; ///< Window width in cells

    /// Global flat cell index (y * nx + x) of each local cell, local row-major
    std::vector<Eigen::Index> cells;

    bool wrapped() const { return xroll != 0 || yroll != 0; }
    size_t n_local() const { return side * side; }
};

/**
 * @brief Weights for blending one group's analysis into the forecast
 *
 * analysis + forecast == 1 at every cell, both in [0, 1].
 */
struct BlendWeights {
    GridField analysis;
    GridField forecast;
};

/// Sequential observation groups, each a list of observation indices
using ObservationGroups = std::vector<std::vector<size_t>>;

/**
 * @brief Gaspari-Cohn 5th-order piecewise polynomial correlation function
 *
 * @param r Normalized distance (distance / localization_radius)
 * @return Correlation coefficient [0, 1]; zero for |r| >= 2
 *
 * Reference: Gaspari & Cohn (1999) QJRMS, Eq. 4.10
 */
double gaspari_cohn_correlation(double r);

/**
 * @brief Gaspari-Cohn correlation for a physical distance
 * @param distance Distance (m)
 * @param radius Localization radius (m)
 */
double gaspari_cohn(double distance, double radius);

/**
 * @brief Minimum-image distance between two points on a periodic domain
 */
double periodic_distance(
    const Eigen::Vector2d& a,
    const Eigen::Vector2d& b,
    double domain_x,
    double domain_y
);

/**
 * @brief Half-width of the local window in cells, ceil(1.5 * r_factor)
 */
size_t local_half_width(double r_factor);

/**
 * @brief Minimum separation between observations of one group,
 *        2 * 1.5 * r_factor * dx
 */
double group_threshold(double r_factor, double dx);

/**
 * @brief Observation-independent stencil of localization weights
 *
 * Square of side 2*ceil(1.5 r_factor)+1. Cells farther than 1.5 r_factor dx
 * from the centre get zero weight; others min(1, GC(dist, r_factor dx)).
 *
 * @param r_factor Localization radius in cells
 * @param dx Cell width (m)
 * @param dy Cell height (m)
 * @param relaxation Scale applied to every weight
 */
GridField local_weight_kernel(double r_factor, double dx, double dy,
                              double relaxation = 1.0);

/**
 * @brief Local window of an observation
 *
 * @param obs_loc Observation position (x, y) in metres, inside the domain
 * @param r_factor Localization radius in cells
 * @param grid Grid geometry
 * @throws std::invalid_argument if the window is wider than the grid
 * @throws std::out_of_range if the observation lies outside the domain
 */
LocalPatch compute_local_patch(
    const Eigen::Vector2d& obs_loc,
    double r_factor,
    const GridGeometry& grid
);

/**
 * @brief Split observations into groups of mutually distant observations
 *
 * Greedy: while the current group holds a pair closer than the threshold,
 * the first minimum of its distance submatrix (row-major scan) is located
 * and the member in that entry's column moves to the next group. The next
 * group is then processed the same way.
 *
 * @param positions Observation positions, one (x, y) per row
 * @param r_factor Localization radius in cells
 * @param grid Grid geometry (periodic lengths)
 * @return Disjoint groups covering every index, in processing order
 */
ObservationGroups partition_groups(
    const Eigen::MatrixXd& positions,
    double r_factor,
    const GridGeometry& grid
);

/**
 * @brief Sum of the kernels of a group's members placed on the global grid
 */
GridField combined_weights(
    const std::vector<size_t>& group,
    const std::vector<LocalPatch>& patches,
    const GridField& kernel,
    const GridGeometry& grid
);

/**
 * @brief analysis = combined / max(combined, 1), forecast = 1 - analysis
 */
BlendWeights blend_weights(const GridField& combined);

/**
 * @brief Cached localization state for a sequence of assimilation cycles
 *
 * Holds the kernel, groups, patches and blend weights. The cache survives
 * between cycles for stationary observations and is rebuilt when the
 * localization radius or the grid changes, or on every cycle for moving
 * observations.
 */
class LocalizationPlanner {
public:
    /**
     * @brief Constructor
     * @param relaxation_factor Scale applied to the localization kernel
     */
    explicit LocalizationPlanner(double relaxation_factor = 1.0);

    /**
     * @brief Make the cached state match the given observations
     * @param positions Observation positions, one (x, y) per row
     * @param grid Grid geometry
     * @param r_factor Localization radius in cells
     * @param stationary Observation positions are fixed between cycles
     * @return True if the state was rebuilt
     */
    bool prepare(
        const Eigen::MatrixXd& positions,
        const GridGeometry& grid,
        double r_factor,
        bool stationary
    );

    /**
     * @brief Drop the cached state; the next prepare() rebuilds
     */
    void invalidate();

    bool is_valid() const { return valid_; }
    double r_factor() const { return r_factor_; }
    double relaxation_factor() const { return relaxation_factor_; }

    const GridField& kernel() const { return kernel_; }
    const ObservationGroups& groups() const { return groups_; }
    const std::vector<LocalPatch>& patches() const { return patches_; }
    const BlendWeights& blend(size_t group) const;

    /// Positions the cache was built for
    const Eigen::MatrixXd& positions() const { return positions_; }

    /// Number of rebuilds since construction
    size_t rebuild_count() const { return rebuild_count_; }

private:
    double relaxation_factor_;
    double r_factor_ = 0.0;
    bool valid_ = false;
    size_t rebuild_count_ = 0;

    GridGeometry grid_;
    Eigen::MatrixXd positions_;
    GridField kernel_;
    ObservationGroups groups_;
    std::vector<LocalPatch> patches_;
    std::vector<BlendWeights> blends_;

    void rebuild(const Eigen::MatrixXd& positions);
    bool same_grid(const GridGeometry& grid) const;
};

} // namespace driftda

#endif // LOCALIZATION_HPP
