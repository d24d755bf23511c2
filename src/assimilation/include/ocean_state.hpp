/**
 * @file ocean_state.hpp
 * @brief Grid geometry and per-particle ocean fields
 *
 * Represents the shallow-water state of one ensemble particle as three
 * row-major grids (eta, hu, hv) on a doubly periodic rectangular domain.
 */

#ifndef OCEAN_STATE_HPP
#define OCEAN_STATE_HPP

#include <Eigen/Dense>
#include <cstddef>

namespace driftda {

/// Row-major (ny × nx) grid, matching the simulator's memory layout
using GridField = Eigen::Matrix<double, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

/// Boolean cell mask over the grid
using GridMask = Eigen::Array<bool, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

/// Number of state channels per cell (eta, hu, hv)
constexpr int NUM_CHANNELS = 3;

/**
 * @brief Channels of the shallow-water state
 */
enum class Channel : int {
    Eta = 0,  ///< Sea-surface deviation (m)
    Hu = 1,   ///< x-momentum (m²/s)
    Hv = 2    ///< y-momentum (m²/s)
};

/**
 * @brief Geometry of the computational grid
 */
struct GridGeometry {
    size_t nx = 0;       ///< Interior cells in x
    size_t ny = 0;       ///< Interior cells in y
    double dx = 1.0;     ///< Cell width (m)
    double dy = 1.0;     ///< Cell height (m)
    size_t ghost_x = 0;  ///< Ghost cells on each side in x
    size_t ghost_y = 0;  ///< Ghost cells on each side in y

    double domain_x() const { return nx * dx; }
    double domain_y() const { return ny * dy; }
    size_t n_cells() const { return nx * ny; }

    /// Padded sizes, as exchanged with the simulator
    size_t padded_nx() const { return nx + 2 * ghost_x; }
    size_t padded_ny() const { return ny + 2 * ghost_y; }

    /**
     * @brief Throw std::invalid_argument unless sizes and spacings are positive
     */
    void validate() const;
};

/**
 * @brief The three fields of one particle
 *
 * Fields are either interior-only (ny × nx) or ghost-padded
 * (ny + 2*ghost_y × nx + 2*ghost_x), depending on where they came from.
 */
class ParticleFields {
public:
    ParticleFields() = default;

    /**
     * @brief Zero-initialized fields of the given size
     * @param rows Number of rows (y)
     * @param cols Number of columns (x)
     */
    ParticleFields(size_t rows, size_t cols);

    ParticleFields(GridField eta, GridField hu, GridField hv);

    size_t rows() const { return static_cast<size_t>(eta.rows()); }
    size_t cols() const { return static_cast<size_t>(eta.cols()); }

    /**
     * @brief True if all three fields have the given shape
     */
    bool has_shape(size_t rows, size_t cols) const;

    GridField& channel(Channel c);
    const GridField& channel(Channel c) const;

    /**
     * @brief Flatten to [eta..., hu..., hv...] in row-major order
     */
    Eigen::VectorXd to_vector() const;

    /**
     * @brief Fill from a flattened vector (must match 3 * rows * cols)
     */
    void from_vector(const Eigen::VectorXd& vec);

    /**
     * @brief Copy of the interior block without the ghost halo
     */
    ParticleFields interior(size_t ghost_x, size_t ghost_y) const;

    /**
     * @brief Embed interior fields into zeroed ghost-padded storage
     */
    static ParticleFields embed(const ParticleFields& interior,
                                size_t ghost_x, size_t ghost_y);

    GridField eta;
    GridField hu;
    GridField hv;
};

} // namespace driftda

#endif // OCEAN_STATE_HPP
