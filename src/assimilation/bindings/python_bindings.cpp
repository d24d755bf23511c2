/**
 * @file python_bindings.cpp
 * @brief pybind11 Python bindings for the drifter LEnKF
 *
 * Exposes the localized EnKF to Python so it can be driven from a
 * simulation loop. Python simulators implement OceanEnsemble by subclassing.
 */

#include <pybind11/pybind11.h>
#include <pybind11/eigen.h>
#include <pybind11/stl.h>

#include "lenkf.hpp"
#include "local_analysis.hpp"
#include "localization.hpp"
#include "logging.hpp"
#include "ocean_ensemble.hpp"
#include "ocean_state.hpp"

namespace py = pybind11;
using namespace driftda;

/**
 * @brief Trampoline so Python classes can implement OceanEnsemble
 */
class PyOceanEnsemble : public OceanEnsemble {
public:
    using OceanEnsemble::OceanEnsemble;

    size_t num_particles() const override {
        PYBIND11_OVERRIDE_PURE(size_t, OceanEnsemble, num_particles);
    }
    size_t num_active_particles() const override {
        PYBIND11_OVERRIDE_PURE(size_t, OceanEnsemble, num_active_particles);
    }
    size_t num_drifters() const override {
        PYBIND11_OVERRIDE_PURE(size_t, OceanEnsemble, num_drifters);
    }
    std::vector<bool> active_mask() const override {
        PYBIND11_OVERRIDE_PURE(std::vector<bool>, OceanEnsemble, active_mask);
    }
    Eigen::Matrix2d observation_covariance() const override {
        PYBIND11_OVERRIDE_PURE(Eigen::Matrix2d, OceanEnsemble, observation_covariance);
    }
    Eigen::MatrixXd observed_state() const override {
        PYBIND11_OVERRIDE_PURE(Eigen::MatrixXd, OceanEnsemble, observed_state);
    }
    Eigen::MatrixXd buoy_positions() const override {
        PYBIND11_OVERRIDE_PURE(Eigen::MatrixXd, OceanEnsemble, buoy_positions);
    }
    ObservationType observation_type() const override {
        PYBIND11_OVERRIDE_PURE(ObservationType, OceanEnsemble, observation_type);
    }
    ParticleFields download(size_t particle, bool interior_only) const override {
        PYBIND11_OVERRIDE_PURE(ParticleFields, OceanEnsemble, download, particle, interior_only);
    }
    void upload(size_t particle, const ParticleFields& fields) override {
        PYBIND11_OVERRIDE_PURE(void, OceanEnsemble, upload, particle, fields);
    }
    void apply_boundary_conditions(size_t particle) override {
        PYBIND11_OVERRIDE_PURE(void, OceanEnsemble, apply_boundary_conditions, particle);
    }
    GridGeometry grid() const override {
        PYBIND11_OVERRIDE_PURE(GridGeometry, OceanEnsemble, grid);
    }
    double mean_depth() const override {
        PYBIND11_OVERRIDE_PURE(double, OceanEnsemble, mean_depth);
    }
    bool eta_compensation_enabled() const override {
        PYBIND11_OVERRIDE_PURE(bool, OceanEnsemble, eta_compensation_enabled);
    }
};

PYBIND11_MODULE(driftda_lenkf, m) {
    m.doc() = "Localized ensemble Kalman filter for drifter observations";

    // ============================
    // Enums
    // ============================
    py::enum_<FilterMethod>(m, "FilterMethod")
        .value("SEnKF", FilterMethod::SEnKF)
        .value("ETKF", FilterMethod::ETKF);

    py::enum_<ObservationType>(m, "ObservationType")
        .value("DrifterPosition", ObservationType::DrifterPosition)
        .value("UnderlyingFlow", ObservationType::UnderlyingFlow)
        .value("DirectUnderlyingFlow", ObservationType::DirectUnderlyingFlow)
        .value("StaticBuoys", ObservationType::StaticBuoys);

    m.def("parse_filter_method", &parse_filter_method,
          py::arg("name"),
          "Parse 'SEnKF' or 'ETKF'");

    // ============================
    // Grid and fields
    // ============================
    py::class_<GridGeometry>(m, "GridGeometry")
        .def(py::init<>())
        .def_readwrite("nx", &GridGeometry::nx)
        .def_readwrite("ny", &GridGeometry::ny)
        .def_readwrite("dx", &GridGeometry::dx)
        .def_readwrite("dy", &GridGeometry::dy)
        .def_readwrite("ghost_x", &GridGeometry::ghost_x)
        .def_readwrite("ghost_y", &GridGeometry::ghost_y)
        .def("domain_x", &GridGeometry::domain_x)
        .def("domain_y", &GridGeometry::domain_y);

    py::class_<ParticleFields>(m, "ParticleFields")
        .def(py::init<size_t, size_t>(),
             py::arg("rows"), py::arg("cols"),
             "Zero fields of the given shape")
        .def(py::init<GridField, GridField, GridField>(),
             py::arg("eta"), py::arg("hu"), py::arg("hv"))
        .def_readwrite("eta", &ParticleFields::eta)
        .def_readwrite("hu", &ParticleFields::hu)
        .def_readwrite("hv", &ParticleFields::hv);

    // ============================
    // OceanEnsemble (abstract base)
    // ============================
    py::class_<OceanEnsemble, PyOceanEnsemble, std::shared_ptr<OceanEnsemble>>(m, "OceanEnsemble")
        .def(py::init<>())
        .def("num_particles", &OceanEnsemble::num_particles)
        .def("num_active_particles", &OceanEnsemble::num_active_particles)
        .def("num_drifters", &OceanEnsemble::num_drifters)
        .def("active_mask", &OceanEnsemble::active_mask)
        .def("observation_covariance", &OceanEnsemble::observation_covariance)
        .def("observed_state", &OceanEnsemble::observed_state)
        .def("buoy_positions", &OceanEnsemble::buoy_positions)
        .def("observation_type", &OceanEnsemble::observation_type)
        .def("download", &OceanEnsemble::download,
             py::arg("particle"), py::arg("interior_only") = true)
        .def("upload", &OceanEnsemble::upload,
             py::arg("particle"), py::arg("fields"))
        .def("apply_boundary_conditions", &OceanEnsemble::apply_boundary_conditions,
             py::arg("particle"))
        .def("grid", &OceanEnsemble::grid)
        .def("mean_depth", &OceanEnsemble::mean_depth)
        .def("eta_compensation_enabled", &OceanEnsemble::eta_compensation_enabled);

    // ============================
    // LocalizedEnKF configuration
    // ============================
    py::class_<LEnKFConfig>(m, "LEnKFConfig")
        .def(py::init<>())
        .def_readwrite("relaxation_factor", &LEnKFConfig::relaxation_factor)
        .def_readwrite("inflation_factor", &LEnKFConfig::inflation_factor)
        .def_readwrite("method", &LEnKFConfig::method)
        .def_readwrite("localization_radius", &LEnKFConfig::localization_radius)
        .def_readwrite("seed", &LEnKFConfig::seed);

    py::class_<LocalizedEnKF::Statistics>(m, "FilterStatistics")
        .def_readonly("assimilation_count", &LocalizedEnKF::Statistics::assimilation_count)
        .def_readonly("last_assimilation_time_ms", &LocalizedEnKF::Statistics::last_assimilation_time_ms)
        .def_readonly("avg_assimilation_time_ms", &LocalizedEnKF::Statistics::avg_assimilation_time_ms)
        .def_readonly("num_groups", &LocalizedEnKF::Statistics::num_groups)
        .def_readonly("planner_rebuilds", &LocalizedEnKF::Statistics::planner_rebuilds)
        .def_readonly("last_forgetting_factor", &LocalizedEnKF::Statistics::last_forgetting_factor);

    // ============================
    // LocalizedEnKF (Main class)
    // ============================
    py::class_<LocalizedEnKF>(m, "LocalizedEnKF")
        .def(py::init<std::shared_ptr<OceanEnsemble>, const LEnKFConfig&>(),
             py::arg("ensemble"),
             py::arg("config") = LEnKFConfig(),
             "Bind a localized EnKF to an ensemble")

        .def("assimilate", &LocalizedEnKF::assimilate,
             py::arg("ensemble") = nullptr,
             py::arg("localization_radius") = py::none(),
             "Assimilate the current drifter observations")

        .def("get_statistics", &LocalizedEnKF::get_statistics,
             "Get filter statistics")

        .def("get_config", &LocalizedEnKF::get_config,
             py::return_value_policy::reference_internal)

        .def("groups", [](const LocalizedEnKF& self) {
            return self.planner().groups();
        }, "Observation groups of the most recent cycle");

    // ============================
    // Utility Functions
    // ============================
    m.def("gaspari_cohn_correlation", &gaspari_cohn_correlation,
          py::arg("r"),
          "Compute Gaspari-Cohn correlation function");

    m.def("local_weight_kernel", &local_weight_kernel,
          py::arg("r_factor"), py::arg("dx"), py::arg("dy"),
          py::arg("relaxation") = 1.0,
          "Localization weights on the local window");

    m.def("init_logging", [](const std::string& level) {
        init_logging(spdlog::level::from_str(level));
    }, py::arg("level") = "info", "Configure library logging");

    // Version info
    m.attr("__version__") = "0.1.0";
}
