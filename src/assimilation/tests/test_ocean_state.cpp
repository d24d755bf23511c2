/**
 * @file test_ocean_state.cpp
 * @brief Unit tests for grid geometry, particle fields and the in-memory ensemble
 */

#include <gtest/gtest.h>
#include <Eigen/Dense>
#include <stdexcept>

#include "ocean_ensemble.hpp"
#include "ocean_state.hpp"

using namespace driftda;

namespace {

GridGeometry make_grid(size_t nx, size_t ny, size_t ghost) {
    GridGeometry grid;
    grid.nx = nx;
    grid.ny = ny;
    grid.dx = 2.0;
    grid.dy = 3.0;
    grid.ghost_x = ghost;
    grid.ghost_y = ghost;
    return grid;
}

/// eta = 100*y + x, hu = eta + 1000, hv = eta + 2000
ParticleFields numbered_fields(size_t ny, size_t nx) {
    ParticleFields fields(ny, nx);
    for (size_t y = 0; y < ny; ++y) {
        for (size_t x = 0; x < nx; ++x) {
            const double v = 100.0 * y + x;
            fields.eta(y, x) = v;
            fields.hu(y, x) = v + 1000.0;
            fields.hv(y, x) = v + 2000.0;
        }
    }
    return fields;
}

} // namespace

TEST(GridGeometryTest, DomainAndPadding) {
    const GridGeometry grid = make_grid(10, 8, 2);

    EXPECT_DOUBLE_EQ(grid.domain_x(), 20.0);
    EXPECT_DOUBLE_EQ(grid.domain_y(), 24.0);
    EXPECT_EQ(grid.n_cells(), 80u);
    EXPECT_EQ(grid.padded_nx(), 14u);
    EXPECT_EQ(grid.padded_ny(), 12u);
    EXPECT_NO_THROW(grid.validate());
}

TEST(GridGeometryTest, RejectsDegenerateGrid) {
    GridGeometry grid = make_grid(0, 8, 0);
    EXPECT_THROW(grid.validate(), std::invalid_argument);

    grid = make_grid(4, 4, 0);
    grid.dy = 0.0;
    EXPECT_THROW(grid.validate(), std::invalid_argument);
}

TEST(ParticleFieldsTest, FlattenOrderIsChannelThenRowMajor) {
    const ParticleFields fields = numbered_fields(3, 4);
    const Eigen::VectorXd vec = fields.to_vector();

    ASSERT_EQ(vec.size(), 36);
    EXPECT_DOUBLE_EQ(vec(0), 0.0);
    EXPECT_DOUBLE_EQ(vec(1), 1.0);           // eta(0, 1)
    EXPECT_DOUBLE_EQ(vec(4), 100.0);         // eta(1, 0)
    EXPECT_DOUBLE_EQ(vec(12), 1000.0);       // hu(0, 0)
    EXPECT_DOUBLE_EQ(vec(24 + 11), 2203.0);  // hv(2, 3)

    ParticleFields copy(3, 4);
    copy.from_vector(vec);
    EXPECT_TRUE(copy.eta.isApprox(fields.eta));
    EXPECT_TRUE(copy.hu.isApprox(fields.hu));
    EXPECT_TRUE(copy.hv.isApprox(fields.hv));

    EXPECT_THROW(copy.from_vector(Eigen::VectorXd::Zero(35)), std::invalid_argument);
}

TEST(ParticleFieldsTest, EmbedAndStripHalo) {
    const ParticleFields interior = numbered_fields(3, 4);
    const ParticleFields padded = ParticleFields::embed(interior, 2, 1);

    EXPECT_TRUE(padded.has_shape(5, 8));
    EXPECT_DOUBLE_EQ(padded.eta(0, 0), 0.0);
    EXPECT_DOUBLE_EQ(padded.hu(1, 2), 1000.0);

    const ParticleFields stripped = padded.interior(2, 1);
    EXPECT_TRUE(stripped.has_shape(3, 4));
    EXPECT_TRUE(stripped.hv.isApprox(interior.hv));
}

TEST(ParticleFieldsTest, RejectsMismatchedShapes) {
    EXPECT_THROW(ParticleFields(GridField::Zero(3, 4), GridField::Zero(3, 4),
                                GridField::Zero(4, 3)),
                 std::invalid_argument);
}

TEST(InMemoryEnsembleTest, PeriodicHaloCopiesOppositeEdge) {
    const GridGeometry grid = make_grid(4, 3, 2);
    InMemoryEnsemble ensemble(grid, 1, Eigen::Matrix2d::Identity());

    ensemble.set_interior(0, numbered_fields(3, 4));
    const ParticleFields padded = ensemble.download(0, false);
    ASSERT_TRUE(padded.has_shape(7, 8));

    // Padded (row, col) maps to interior ((row - 2) mod 3, (col - 2) mod 4)
    for (Eigen::Index row = 0; row < 7; ++row) {
        for (Eigen::Index col = 0; col < 8; ++col) {
            const Eigen::Index y = ((row - 2) % 3 + 3) % 3;
            const Eigen::Index x = ((col - 2) % 4 + 4) % 4;
            EXPECT_DOUBLE_EQ(padded.eta(row, col), 100.0 * y + x)
                << "row " << row << " col " << col;
        }
    }

    const ParticleFields interior = ensemble.download(0, true);
    EXPECT_TRUE(interior.has_shape(3, 4));
    EXPECT_DOUBLE_EQ(interior.hu(2, 3), 1203.0);
}

TEST(InMemoryEnsembleTest, ActiveMaskAndObservations) {
    const GridGeometry grid = make_grid(4, 4, 1);
    InMemoryEnsemble ensemble(grid, 3, Eigen::Matrix2d::Identity());

    EXPECT_EQ(ensemble.num_active_particles(), 3u);
    ensemble.set_active(1, false);
    EXPECT_EQ(ensemble.num_active_particles(), 2u);
    EXPECT_FALSE(ensemble.active_mask()[1]);

    EXPECT_EQ(ensemble.num_drifters(), 0u);
    Eigen::MatrixXd obs(2, 4);
    obs << 1.0, 2.0, 0.1, 0.2,
           3.0, 4.0, 0.3, 0.4;
    ensemble.set_observations(obs);
    EXPECT_EQ(ensemble.num_drifters(), 2u);
    EXPECT_TRUE(ensemble.buoy_positions().isApprox(obs.leftCols(2)));

    EXPECT_THROW(ensemble.set_observations(Eigen::MatrixXd::Zero(2, 2)), std::invalid_argument);
    EXPECT_THROW(ensemble.download(3, true), std::out_of_range);
    EXPECT_THROW(ensemble.upload(0, ParticleFields(4, 4)), std::invalid_argument);
}
