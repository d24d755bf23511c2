/**
 * @file test_local_analysis.cpp
 * @brief Unit tests for local extraction, observation and SEnKF/ETKF updates
 */

#include <gtest/gtest.h>
#include <Eigen/Dense>
#include <cmath>
#include <limits>
#include <random>
#include <stdexcept>

#include "ensemble_state.hpp"
#include "lenkf_errors.hpp"
#include "local_analysis.hpp"
#include "localization.hpp"

using namespace driftda;

class LocalAnalysisTest : public ::testing::Test {
protected:
    void SetUp() override {
        grid_.nx = 10;
        grid_.ny = 10;
        grid_.dx = 1.0;
        grid_.dy = 1.0;

        std::mt19937 rng(7);
        std::uniform_real_distribution<double> uniform(-1.0, 1.0);
        X_.resize(3 * 100, 5);
        for (Eigen::Index i = 0; i < X_.size(); ++i) {
            X_.data()[i] = uniform(rng);
        }

        position_ << 5.5, 5.5;
        positions_ = position_.transpose();
    }

    EnsembleMoments moments_of(const Eigen::MatrixXd& X) const {
        EnsembleMoments moments;
        moments.mean = X.rowwise().mean();
        moments.perturbation = X.colwise() - moments.mean;
        return moments;
    }

    /// Exact innovations D_k = y - HX_k
    static Eigen::MatrixXd exact_innovations(const Eigen::Vector2d& y,
                                             const LocalObservation& observed) {
        const Eigen::MatrixXd HX = observed.perturbation.colwise() + observed.mean;
        return (-HX).colwise() + y;
    }

    GridGeometry grid_;
    Eigen::MatrixXd X_;
    Eigen::Vector2d position_;
    Eigen::MatrixXd positions_;

    static constexpr double kRFactor = 2.0;
    static constexpr Eigen::Index kCentre = 3 * 7 + 3;  // local index of the observed cell
    static constexpr Eigen::Index kLocal = 49;
};

TEST(FilterMethodTest, ParseNames) {
    EXPECT_EQ(parse_filter_method("SEnKF"), FilterMethod::SEnKF);
    EXPECT_EQ(parse_filter_method("ETKF"), FilterMethod::ETKF);
    EXPECT_EQ(to_string(FilterMethod::ETKF), "ETKF");
    EXPECT_THROW(parse_filter_method("EnKF"), UnsupportedMethod);
    EXPECT_THROW(parse_filter_method("etkf"), std::invalid_argument);
}

TEST_F(LocalAnalysisTest, ContainingCell) {
    EXPECT_EQ(containing_cell(Eigen::Vector2d(5.5, 5.5), grid_), 55);
    EXPECT_EQ(containing_cell(Eigen::Vector2d(0.0, 9.99), grid_), 90);
    EXPECT_THROW(containing_cell(Eigen::Vector2d(10.0, 1.0), grid_), std::out_of_range);
}

TEST_F(LocalAnalysisTest, ExtractThenScatterReproducesPatch) {
    // A window wrapped across both seams
    const LocalPatch patch = compute_local_patch(Eigen::Vector2d(0.5, 9.5), kRFactor, grid_);
    ASSERT_TRUE(patch.wrapped());

    const LocalForecast local = extract_local(X_, moments_of(X_), patch, grid_.n_cells());
    ASSERT_EQ(local.ensemble.rows(), 3 * kLocal);

    Eigen::MatrixXd accumulator = Eigen::MatrixXd::Zero(X_.rows(), X_.cols());
    const GridField unit = GridField::Ones(7, 7);
    scatter_local(local.ensemble, patch, unit, accumulator, grid_.n_cells());

    Eigen::MatrixXd expected = Eigen::MatrixXd::Zero(X_.rows(), X_.cols());
    for (int c = 0; c < NUM_CHANNELS; ++c) {
        for (Eigen::Index cell : patch.cells) {
            const Eigen::Index row = EnsembleState::state_index(static_cast<Channel>(c), cell, 100);
            expected.row(row) = X_.row(row);
        }
    }
    EXPECT_TRUE(accumulator.isApprox(expected, 1e-14));
}

TEST_F(LocalAnalysisTest, ExtractGathersMeanAndPerturbation) {
    const LocalPatch patch = compute_local_patch(position_, kRFactor, grid_);
    const EnsembleMoments moments = moments_of(X_);
    const LocalForecast local = extract_local(X_, moments, patch, grid_.n_cells());

    const Eigen::Index hu_row = EnsembleState::state_index(Channel::Hu, 55, 100);
    EXPECT_EQ(patch.cells[kCentre], 55);
    EXPECT_TRUE(local.ensemble.row(kLocal + kCentre).isApprox(X_.row(hu_row)));
    EXPECT_DOUBLE_EQ(local.mean(kLocal + kCentre), moments.mean(hu_row));
    EXPECT_TRUE(local.perturbation.row(kLocal + kCentre).isApprox(moments.perturbation.row(hu_row)));
}

TEST_F(LocalAnalysisTest, ObserveIgnoresUndefinedMembers) {
    const Eigen::Index hu_row = EnsembleState::state_index(Channel::Hu, 55, 100);
    const Eigen::Index hv_row = EnsembleState::state_index(Channel::Hv, 55, 100);

    Eigen::MatrixXd X = X_.leftCols(4);
    X.row(hu_row) << 1.0, 2.0, std::numeric_limits<double>::quiet_NaN(), 3.0;
    X.row(hv_row) << 1.0, 1.0, 1.0, 1.0;

    const ObservedEnsemble observed = observe(X, positions_, grid_);
    ASSERT_EQ(observed.perturbation.size(), 1u);

    // NaN-ignoring sum over all four members
    EXPECT_DOUBLE_EQ(observed.mean(0, 0), 1.5);
    EXPECT_DOUBLE_EQ(observed.mean(0, 1), 1.0);

    const LocalObservation local = observed.at(0);
    EXPECT_DOUBLE_EQ(local.perturbation(0, 0), -0.5);
    EXPECT_TRUE(std::isnan(local.perturbation(0, 2)));
    EXPECT_DOUBLE_EQ(local.perturbation(1, 3), 0.0);
    EXPECT_THROW(observed.at(1), std::out_of_range);
}

TEST_F(LocalAnalysisTest, SEnKFFitsObservationAsNoiseVanishes) {
    const LocalPatch patch = compute_local_patch(position_, kRFactor, grid_);
    const LocalForecast local = extract_local(X_, moments_of(X_), patch, grid_.n_cells());
    const LocalObservation observed = observe(X_, positions_, grid_).at(0);
    const Eigen::Vector2d y(0.3, -0.2);

    LocalAnalysis analysis(FilterMethod::SEnKF, 1.0, 1e-8 * Eigen::Matrix2d::Identity(), 42);
    const Eigen::MatrixXd Xa = analysis.senkf_update(local, observed, y,
                                                     exact_innovations(y, observed));

    for (Eigen::Index k = 0; k < Xa.cols(); ++k) {
        EXPECT_NEAR(Xa(kLocal + kCentre, k), y(0), 1e-5) << "member " << k;
        EXPECT_NEAR(Xa(2 * kLocal + kCentre, k), y(1), 1e-5) << "member " << k;
    }
}

TEST_F(LocalAnalysisTest, ETKFFitsObservationAsNoiseVanishes) {
    const LocalPatch patch = compute_local_patch(position_, kRFactor, grid_);
    const LocalForecast local = extract_local(X_, moments_of(X_), patch, grid_.n_cells());
    const LocalObservation observed = observe(X_, positions_, grid_).at(0);
    const Eigen::Vector2d y(0.3, -0.2);

    LocalAnalysis analysis(FilterMethod::ETKF, 1.0, 1e-8 * Eigen::Matrix2d::Identity(), 42);
    const Eigen::MatrixXd Xa = analysis.update(local, observed, y);
    const Eigen::VectorXd mean = Xa.rowwise().mean();

    EXPECT_NEAR(mean(kLocal + kCentre), y(0), 1e-4);
    EXPECT_NEAR(mean(2 * kLocal + kCentre), y(1), 1e-4);
}

TEST_F(LocalAnalysisTest, ETKFZeroInnovationKeepsMean) {
    const LocalPatch patch = compute_local_patch(position_, kRFactor, grid_);
    const LocalForecast local = extract_local(X_, moments_of(X_), patch, grid_.n_cells());
    const LocalObservation observed = observe(X_, positions_, grid_).at(0);

    LocalAnalysis analysis(FilterMethod::ETKF, 1.0, 0.5 * Eigen::Matrix2d::Identity(), 42);
    const Eigen::MatrixXd Xa = analysis.etkf_update(local, observed, observed.mean,
                                                    Eigen::MatrixXd(Eigen::MatrixXd::Zero(2, 5)));

    const Eigen::VectorXd mean = Xa.rowwise().mean();
    EXPECT_TRUE(mean.isApprox(local.mean, 1e-10));
    EXPECT_DOUBLE_EQ(analysis.last_forgetting_factor(), 1.0);
}

TEST_F(LocalAnalysisTest, ETKFWithoutObservedSpreadKeepsPerturbations) {
    // Every member sees the same (hu, hv) at the drifter
    Eigen::MatrixXd X = X_;
    X.row(EnsembleState::state_index(Channel::Hu, 55, 100)).setConstant(0.4);
    X.row(EnsembleState::state_index(Channel::Hv, 55, 100)).setConstant(-0.1);

    const LocalPatch patch = compute_local_patch(position_, kRFactor, grid_);
    const LocalForecast local = extract_local(X, moments_of(X), patch, grid_.n_cells());
    const LocalObservation observed = observe(X, positions_, grid_).at(0);
    EXPECT_NEAR(observed.perturbation.cwiseAbs().maxCoeff(), 0.0, 1e-14);

    LocalAnalysis analysis(FilterMethod::ETKF, 1.0, 0.5 * Eigen::Matrix2d::Identity(), 42);
    const Eigen::MatrixXd Xa = analysis.etkf_update(local, observed, Eigen::Vector2d(1.0, 1.0));

    EXPECT_TRUE(Xa.isApprox(local.ensemble, 1e-12));
}

TEST_F(LocalAnalysisTest, SEnKFDrawsPerturbedObservations) {
    const LocalPatch patch = compute_local_patch(position_, kRFactor, grid_);
    const LocalForecast local = extract_local(X_, moments_of(X_), patch, grid_.n_cells());
    const LocalObservation observed = observe(X_, positions_, grid_).at(0);
    const Eigen::Vector2d y(0.3, -0.2);

    // Same seed: drawing inside the update equals supplying the same draw
    LocalAnalysis drawn(FilterMethod::SEnKF, 1.0, 0.1 * Eigen::Matrix2d::Identity(), 5);
    LocalAnalysis supplied(FilterMethod::SEnKF, 1.0, 0.1 * Eigen::Matrix2d::Identity(), 5);

    const Eigen::MatrixXd D = supplied.perturbed_innovations(y, observed);
    ASSERT_EQ(D.rows(), 2);
    ASSERT_EQ(D.cols(), 5);
    EXPECT_FALSE(D.isApprox(exact_innovations(y, observed)));

    const Eigen::MatrixXd Xa_drawn = drawn.senkf_update(local, observed, y);
    const Eigen::MatrixXd Xa_supplied = supplied.senkf_update(local, observed, y, D);
    EXPECT_TRUE(Xa_drawn.isApprox(Xa_supplied, 1e-12));
}

TEST_F(LocalAnalysisTest, EtaCompensationWithFlatSurfaceIsPlainPerturbation) {
    const LocalObservation observed = observe(X_, positions_, grid_).at(0);
    const Eigen::Vector2d y(0.3, -0.2);

    LocalAnalysis plain(FilterMethod::SEnKF, 1.0, 0.1 * Eigen::Matrix2d::Identity(), 9);
    LocalAnalysis compensated(FilterMethod::SEnKF, 1.0, 0.1 * Eigen::Matrix2d::Identity(), 9);

    const Eigen::MatrixXd D_plain = plain.perturbed_innovations(y, observed);
    const Eigen::MatrixXd D_flat = compensated.eta_compensated_innovations(
        y, observed, Eigen::VectorXd::Zero(5), 10.0);
    EXPECT_TRUE(D_flat.isApprox(D_plain, 1e-14));

    // Raised surface scales the observed momenta by (H + eta)/H
    LocalAnalysis a(FilterMethod::SEnKF, 1.0, 0.1 * Eigen::Matrix2d::Identity(), 9);
    LocalAnalysis b(FilterMethod::SEnKF, 1.0, 0.1 * Eigen::Matrix2d::Identity(), 9);
    const Eigen::MatrixXd D0 = a.perturbed_innovations(y, observed);
    const Eigen::MatrixXd D1 = b.eta_compensated_innovations(
        y, observed, Eigen::VectorXd::Constant(5, 5.0), 10.0);
    const Eigen::MatrixXd HX = observed.perturbation.colwise() + observed.mean;
    EXPECT_TRUE((D1 + HX).isApprox(1.5 * (D0 + HX), 1e-12));

    EXPECT_THROW(b.eta_compensated_innovations(y, observed, Eigen::VectorXd::Zero(5), 0.0),
                 std::invalid_argument);
    EXPECT_THROW(b.eta_compensated_innovations(y, observed, Eigen::VectorXd::Zero(4), 10.0),
                 std::invalid_argument);
}

TEST(AdaptiveInflationTest, ForgettingFactor) {
    const Eigen::Matrix2d R_inv = Eigen::Matrix2d::Identity();

    EXPECT_NEAR(LocalAnalysis::adaptive_forgetting_factor(Eigen::Vector2d(1.0, 1.0), R_inv, 5),
                0.6, 1e-12);
    EXPECT_LT(LocalAnalysis::adaptive_forgetting_factor(Eigen::Vector2d(0.1, 0.0), R_inv, 5), 1.0);
    EXPECT_DOUBLE_EQ(LocalAnalysis::adaptive_forgetting_factor(Eigen::Vector2d::Zero(), R_inv, 5),
                     1.0);
    EXPECT_NEAR(LocalAnalysis::adaptive_forgetting_factor(Eigen::Vector2d(1e-6, 0.0), R_inv, 5),
                1.0, 1e-10);
    EXPECT_THROW(LocalAnalysis::adaptive_forgetting_factor(Eigen::Vector2d(1.0, 1.0), R_inv, 2),
                 ConfigurationMismatch);
}

TEST_F(LocalAnalysisTest, AdaptiveAndFixedInflation) {
    const LocalPatch patch = compute_local_patch(position_, kRFactor, grid_);
    const LocalForecast local = extract_local(X_, moments_of(X_), patch, grid_.n_cells());
    const LocalObservation observed = observe(X_, positions_, grid_).at(0);
    const Eigen::Vector2d y = observed.mean + Eigen::Vector2d(0.5, -0.5);

    LocalAnalysis adaptive(FilterMethod::ETKF, 0.0, 0.1 * Eigen::Matrix2d::Identity(), 1);
    EXPECT_TRUE(adaptive.adaptive_inflation());
    adaptive.update(local, observed, y);
    EXPECT_LT(adaptive.last_forgetting_factor(), 1.0);
    EXPECT_GT(adaptive.last_forgetting_factor(), 0.0);

    LocalAnalysis fixed(FilterMethod::SEnKF, 2.0, 0.1 * Eigen::Matrix2d::Identity(), 1);
    fixed.update(local, observed, y);
    EXPECT_DOUBLE_EQ(fixed.last_forgetting_factor(), 0.25);
}

TEST_F(LocalAnalysisTest, SEnKFZeroInflationUsesObservationCovarianceOnly) {
    const LocalPatch patch = compute_local_patch(position_, kRFactor, grid_);
    const Eigen::Vector2d y(0.3, -0.2);
    const Eigen::Matrix2d R = 0.01 * Eigen::Matrix2d::Identity();

    // F = R: X_a = X_f + 1/(N-1) X' HX'^T R^-1 D
    const LocalForecast local = extract_local(X_, moments_of(X_), patch, grid_.n_cells());
    const LocalObservation observed = observe(X_, positions_, grid_).at(0);
    const Eigen::MatrixXd D = exact_innovations(y, observed);

    LocalAnalysis analysis(FilterMethod::SEnKF, 0.0, R, 3);
    EXPECT_TRUE(analysis.adaptive_inflation());
    const Eigen::MatrixXd Xa = analysis.senkf_update(local, observed, y, D);

    const Eigen::MatrixXd expected =
        local.ensemble +
        0.25 * local.perturbation * (observed.perturbation.transpose() * (R.inverse() * D));
    EXPECT_TRUE(Xa.isApprox(expected, 1e-10));
    EXPECT_TRUE(std::isinf(analysis.last_forgetting_factor()));

    // Two members are enough when no inflation is estimated
    const Eigen::MatrixXd X2 = X_.leftCols(2);
    const LocalForecast local2 = extract_local(X2, moments_of(X2), patch, grid_.n_cells());
    const LocalObservation observed2 = observe(X2, positions_, grid_).at(0);

    LocalAnalysis pair(FilterMethod::SEnKF, 0.0, R, 3);
    Eigen::MatrixXd Xa2;
    EXPECT_NO_THROW(Xa2 = pair.update(local2, observed2, y));
    EXPECT_EQ(Xa2.rows(), local2.ensemble.rows());
    EXPECT_EQ(Xa2.cols(), 2);
    EXPECT_TRUE(Xa2.allFinite());
}

TEST_F(LocalAnalysisTest, RejectsBadConfiguration) {
    Eigen::Matrix2d indefinite;
    indefinite << 1.0, 2.0,
                  2.0, 1.0;
    EXPECT_THROW(LocalAnalysis(FilterMethod::SEnKF, 1.0, indefinite), LinearAlgebraFailure);
    EXPECT_THROW(LocalAnalysis(FilterMethod::SEnKF, -1.0, Eigen::Matrix2d::Identity()),
                 std::invalid_argument);

    // A single member has no spread to update
    const Eigen::MatrixXd X1 = X_.leftCols(1);
    const LocalPatch patch = compute_local_patch(position_, kRFactor, grid_);
    const LocalForecast local = extract_local(X1, moments_of(X1), patch, grid_.n_cells());
    const LocalObservation observed = observe(X1, positions_, grid_).at(0);

    LocalAnalysis senkf(FilterMethod::SEnKF, 1.0, Eigen::Matrix2d::Identity(), 1);
    EXPECT_THROW(senkf.update(local, observed, Eigen::Vector2d::Zero()), ConfigurationMismatch);
    LocalAnalysis etkf(FilterMethod::ETKF, 1.0, Eigen::Matrix2d::Identity(), 1);
    EXPECT_THROW(etkf.update(local, observed, Eigen::Vector2d::Zero()), ConfigurationMismatch);
}

TEST_F(LocalAnalysisTest, ScatterRejectsMismatchedShapes) {
    const LocalPatch patch = compute_local_patch(position_, kRFactor, grid_);
    Eigen::MatrixXd accumulator = Eigen::MatrixXd::Zero(X_.rows(), X_.cols());

    EXPECT_THROW(scatter_local(Eigen::MatrixXd::Zero(3 * kLocal, 5), patch,
                               GridField::Ones(5, 5), accumulator, grid_.n_cells()),
                 std::invalid_argument);
    EXPECT_THROW(scatter_local(Eigen::MatrixXd::Zero(3 * kLocal, 4), patch,
                               GridField::Ones(7, 7), accumulator, grid_.n_cells()),
                 std::invalid_argument);
}
