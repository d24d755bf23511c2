/**
 * @file localization.cpp
 * @brief Implementation of observation localization
 */

#include "localization.hpp"
#include "logging.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>
#include <stdexcept>
#include <utility>

namespace driftda {

namespace {

struct AxisRange {
    Eigen::Index begin;
    Eigen::Index end;
};

/**
 * Window [left, right) along one periodic axis of n cells. Returns the
 * in-domain ranges and the roll that reorders them into window order.
 */
std::vector<AxisRange> wrap_axis(Eigen::Index left, Eigen::Index right,
                                 Eigen::Index n, int& roll) {
    std::vector<AxisRange> ranges;
    roll = 0;

    if (left < 0) {
        ranges.push_back({n + left, n});
        roll = static_cast<int>(left);
        left = 0;
    } else if (right > n) {
        ranges.push_back({0, right - n});
        roll = static_cast<int>(right - n);
        right = n;
    }
    ranges.push_back({left, right});

    return ranges;
}

/// Sorted cell indices covered by the ranges
std::vector<Eigen::Index> covered_cells(const std::vector<AxisRange>& ranges) {
    std::vector<Eigen::Index> cells;
    for (const auto& range : ranges) {
        for (Eigen::Index i = range.begin; i < range.end; ++i) {
            cells.push_back(i);
        }
    }
    std::sort(cells.begin(), cells.end());
    return cells;
}

/// Python-style modulo for roll arithmetic
Eigen::Index wrap_index(Eigen::Index i, Eigen::Index n) {
    return ((i % n) + n) % n;
}

} // namespace

double gaspari_cohn_correlation(double r) {
    const double abs_r = std::abs(r);

    if (abs_r >= 2.0) {
        return 0.0;
    } else if (abs_r >= 1.0) {
        // 1 ≤ |r| < 2
        const double r2 = abs_r * abs_r;
        const double r3 = r2 * abs_r;
        const double r4 = r3 * abs_r;
        const double r5 = r4 * abs_r;

        return 4.0 - 5.0*abs_r + (5.0/3.0)*r2 + (5.0/8.0)*r3
               - 0.5*r4 + (1.0/12.0)*r5 - (2.0/(3.0*abs_r));
    } else {
        // 0 ≤ |r| < 1
        const double r2 = abs_r * abs_r;
        const double r3 = r2 * abs_r;
        const double r4 = r3 * abs_r;
        const double r5 = r4 * abs_r;

        return 1.0 - (5.0/3.0)*r2 + (5.0/8.0)*r3 + 0.5*r4 - 0.25*r5;
    }
}

double gaspari_cohn(double distance, double radius) {
    if (!(radius > 0.0)) {
        throw std::invalid_argument("Localization radius must be positive");
    }
    return gaspari_cohn_correlation(distance / radius);
}

double periodic_distance(
    const Eigen::Vector2d& a,
    const Eigen::Vector2d& b,
    double domain_x,
    double domain_y
) {
    double dx = std::abs(a.x() - b.x());
    if (dx > domain_x / 2.0) {
        dx = domain_x - dx;
    }
    double dy = std::abs(a.y() - b.y());
    if (dy > domain_y / 2.0) {
        dy = domain_y - dy;
    }
    return std::sqrt(dx * dx + dy * dy);
}

size_t local_half_width(double r_factor) {
    if (!(r_factor > 0.0)) {
        throw std::invalid_argument("Localization radius must be positive");
    }
    return static_cast<size_t>(std::ceil(1.5 * r_factor));
}

double group_threshold(double r_factor, double dx) {
    return 2.0 * 1.5 * r_factor * dx;
}

GridField local_weight_kernel(double r_factor, double dx, double dy,
                              double relaxation) {
    const Eigen::Index side = static_cast<Eigen::Index>(2 * local_half_width(r_factor) + 1);
    GridField weights = GridField::Zero(side, side);

    const Eigen::Vector2d centre(side * dx / 2.0, side * dy / 2.0);
    const double cutoff = 1.5 * r_factor * dx;
    const double radius = r_factor * dx;

    for (Eigen::Index y = 0; y < side; ++y) {
        for (Eigen::Index x = 0; x < side; ++x) {
            const Eigen::Vector2d loc((x + 0.5) * dx, (y + 0.5) * dy);
            const double dist = (centre - loc).norm();
            if (dist <= cutoff) {
                weights(y, x) = std::min(1.0, gaspari_cohn(dist, radius));
            }
        }
    }

    return relaxation * weights;
}

LocalPatch compute_local_patch(
    const Eigen::Vector2d& obs_loc,
    double r_factor,
    const GridGeometry& grid
) {
    const Eigen::Index nx = static_cast<Eigen::Index>(grid.nx);
    const Eigen::Index ny = static_cast<Eigen::Index>(grid.ny);
    const Eigen::Index half = static_cast<Eigen::Index>(local_half_width(r_factor));
    const Eigen::Index side = 2 * half + 1;

    if (side > nx || side > ny) {
        throw std::invalid_argument("Localization window is wider than the grid");
    }
    if (obs_loc.x() < 0.0 || obs_loc.x() >= grid.domain_x() ||
        obs_loc.y() < 0.0 || obs_loc.y() >= grid.domain_y()) {
        throw std::out_of_range("Observation lies outside the domain");
    }

    // The window is centred on the cell containing the observation
    const Eigen::Index cx = static_cast<Eigen::Index>(std::floor(obs_loc.x() / grid.dx));
    const Eigen::Index cy = static_cast<Eigen::Index>(std::floor(obs_loc.y() / grid.dy));

    LocalPatch patch;
    patch.side = static_cast<size_t>(side);
    patch.mask = GridMask::Constant(ny, nx, false);

    const auto xranges = wrap_axis(cx - half, cx + half + 1, nx, patch.xroll);
    const auto yranges = wrap_axis(cy - half, cy + half + 1, ny, patch.yroll);

    for (const auto& yr : yranges) {
        for (const auto& xr : xranges) {
            patch.mask.block(yr.begin, xr.begin, yr.end - yr.begin, xr.end - xr.begin)
                .setConstant(true);
        }
    }

    // Slicing the mask gives cells in global row-major order; rolling by
    // (-yroll, -xroll) puts them in window order.
    const auto xs = covered_cells(xranges);
    const auto ys = covered_cells(yranges);

    patch.cells.assign(patch.n_local(), 0);
    for (Eigen::Index i = 0; i < side; ++i) {
        const Eigen::Index li = wrap_index(i - patch.yroll, side);
        for (Eigen::Index j = 0; j < side; ++j) {
            const Eigen::Index lj = wrap_index(j - patch.xroll, side);
            patch.cells[li * side + lj] = ys[i] * nx + xs[j];
        }
    }

    return patch;
}

ObservationGroups partition_groups(
    const Eigen::MatrixXd& positions,
    double r_factor,
    const GridGeometry& grid
) {
    const size_t n_obs = static_cast<size_t>(positions.rows());
    ObservationGroups groups;
    if (n_obs == 0) {
        return groups;
    }
    if (positions.cols() < 2) {
        throw std::invalid_argument("Observation positions need (x, y) columns");
    }

    const double lx = grid.domain_x();
    const double ly = grid.domain_y();

    // Heavy diagonal so that self-distances never count as conflicts
    Eigen::MatrixXd dist(n_obs, n_obs);
    for (size_t i = 0; i < n_obs; ++i) {
        for (size_t j = 0; j < n_obs; ++j) {
            dist(i, j) = periodic_distance(positions.row(i).head<2>().transpose(),
                                           positions.row(j).head<2>().transpose(),
                                           lx, ly);
        }
    }
    dist.diagonal().setConstant(std::sqrt(lx * lx + ly * ly));

    const double threshold = group_threshold(r_factor, grid.dx);

    // First minimum of the group's distance submatrix in row-major order
    auto closest_pair = [&dist](const std::vector<size_t>& members, size_t& column) {
        double min_dist = std::numeric_limits<double>::infinity();
        if (members.size() < 2) {
            return min_dist;
        }
        for (size_t i = 0; i < members.size(); ++i) {
            for (size_t j = 0; j < members.size(); ++j) {
                const double d = dist(members[i], members[j]);
                if (d < min_dist) {
                    min_dist = d;
                    column = j;
                }
            }
        }
        return min_dist;
    };

    groups.emplace_back(n_obs);
    std::iota(groups[0].begin(), groups[0].end(), size_t{0});

    for (size_t g = 0; g < groups.size(); ++g) {
        size_t column = 0;
        while (closest_pair(groups[g], column) < threshold) {
            const size_t moved = groups[g][column];
            groups[g].erase(groups[g].begin() + static_cast<std::ptrdiff_t>(column));
            if (groups.size() < g + 2) {
                groups.emplace_back();
            }
            groups[g + 1].push_back(moved);
        }
    }

    return groups;
}

GridField combined_weights(
    const std::vector<size_t>& group,
    const std::vector<LocalPatch>& patches,
    const GridField& kernel,
    const GridGeometry& grid
) {
    GridField combined = GridField::Zero(grid.ny, grid.nx);

    for (size_t d : group) {
        const LocalPatch& patch = patches.at(d);
        if (static_cast<size_t>(kernel.size()) != patch.n_local()) {
            throw std::invalid_argument("Kernel and patch sizes differ");
        }
        for (size_t k = 0; k < patch.cells.size(); ++k) {
            combined.data()[patch.cells[k]] += kernel.data()[k];
        }
    }

    return combined;
}

BlendWeights blend_weights(const GridField& combined) {
    BlendWeights weights;
    weights.analysis = (combined.array() / combined.array().max(1.0)).matrix();
    weights.forecast = GridField::Ones(combined.rows(), combined.cols()) - weights.analysis;
    return weights;
}

// =======================
// LocalizationPlanner
// =======================

LocalizationPlanner::LocalizationPlanner(double relaxation_factor)
    : relaxation_factor_(relaxation_factor)
{
    if (relaxation_factor < 0.0) {
        throw std::invalid_argument("Relaxation factor must be non-negative");
    }
}

bool LocalizationPlanner::prepare(
    const Eigen::MatrixXd& positions,
    const GridGeometry& grid,
    double r_factor,
    bool stationary
) {
    grid.validate();
    local_half_width(r_factor);  // validates the radius

    if (valid_ && (r_factor != r_factor_ || !same_grid(grid))) {
        invalidate();
    }

    if (valid_ && stationary) {
        return false;
    }

    r_factor_ = r_factor;
    grid_ = grid;
    rebuild(positions);
    return true;
}

void LocalizationPlanner::invalidate() {
    valid_ = false;
    groups_.clear();
    patches_.clear();
    blends_.clear();
}

const BlendWeights& LocalizationPlanner::blend(size_t group) const {
    if (group >= blends_.size()) {
        throw std::out_of_range("Group index out of range");
    }
    return blends_[group];
}

void LocalizationPlanner::rebuild(const Eigen::MatrixXd& positions) {
    positions_ = positions;
    groups_ = partition_groups(positions, r_factor_, grid_);
    kernel_ = local_weight_kernel(r_factor_, grid_.dx, grid_.dy, relaxation_factor_);

    patches_.clear();
    patches_.reserve(static_cast<size_t>(positions.rows()));
    for (Eigen::Index d = 0; d < positions.rows(); ++d) {
        patches_.push_back(compute_local_patch(
            positions.row(d).head<2>().transpose(), r_factor_, grid_));
    }

    blends_.clear();
    blends_.reserve(groups_.size());
    for (const auto& group : groups_) {
        blends_.push_back(blend_weights(combined_weights(group, patches_, kernel_, grid_)));
    }

    valid_ = true;
    ++rebuild_count_;

    DRIFTDA_LOG_INFO("Localization rebuilt: {} observations in {} groups (r_factor={})",
                     positions.rows(), groups_.size(), r_factor_);
}

bool LocalizationPlanner::same_grid(const GridGeometry& grid) const {
    return grid.nx == grid_.nx && grid.ny == grid_.ny &&
           grid.dx == grid_.dx && grid.dy == grid_.dy;
}

} // namespace driftda
