#include <pybind11/eigen.h>
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include "scvst/count_table.hpp"
#include "scvst/dispersion_derivatives.hpp"
#include "scvst/feature_fit.hpp"
#include "scvst/mean_model.hpp"
#include "scvst/theta_estimator.hpp"

#include <utility>
#include <vector>

namespace py = pybind11;
using namespace scvst;

namespace {
DerivativeMode mode_from_flag(bool fast) {
    return fast ? DerivativeMode::Fast : DerivativeMode::Exact;
}
}  // namespace

PYBIND11_MODULE(_scvst, m) {
    m.doc() = "scvst python bindings";

    py::enum_<DerivativeMode>(m, "DerivativeMode")
        .value("Fast", DerivativeMode::Fast)
        .value("Exact", DerivativeMode::Exact)
        .export_values();

    py::enum_<ThetaStatus>(m, "ThetaStatus")
        .value("Converged", ThetaStatus::Converged)
        .value("Unbounded", ThetaStatus::Unbounded)
        .value("Unconverged", ThetaStatus::Unconverged)
        .export_values();

    py::enum_<MeanModelMethod>(m, "MeanModelMethod")
        .value("Irls", MeanModelMethod::Irls)
        .value("DirectML", MeanModelMethod::DirectML)
        .export_values();

    py::class_<ThetaOptions>(m, "ThetaOptions")
        .def(py::init<>())
        .def_readwrite("max_iterations", &ThetaOptions::max_iterations)
        .def_readwrite("tolerance", &ThetaOptions::tolerance)
        .def_readwrite("mode", &ThetaOptions::mode)
        .def_readwrite("validate_inputs", &ThetaOptions::validate_inputs)
        .def_readwrite("verbose", &ThetaOptions::verbose);

    py::class_<ThetaFit>(m, "ThetaFit")
        .def(py::init<>())
        .def_readwrite("theta", &ThetaFit::theta)
        .def_readwrite("status", &ThetaFit::status)
        .def_readwrite("iterations", &ThetaFit::iterations)
        .def_readwrite("score", &ThetaFit::score)
        .def_property_readonly("converged", &ThetaFit::converged);

    py::class_<MeanModelOptions>(m, "MeanModelOptions")
        .def(py::init<>())
        .def_readwrite("method", &MeanModelOptions::method)
        .def_readwrite("max_iterations", &MeanModelOptions::max_iterations)
        .def_readwrite("tolerance", &MeanModelOptions::tolerance)
        .def_readwrite("gradient_tolerance", &MeanModelOptions::gradient_tolerance)
        .def_readwrite("verbose", &MeanModelOptions::verbose);

    py::class_<MeanModelFit>(m, "MeanModelFit")
        .def(py::init<>())
        .def_readwrite("coefficients", &MeanModelFit::coefficients)
        .def_readwrite("mu", &MeanModelFit::mu)
        .def_readwrite("eta", &MeanModelFit::eta)
        .def_readwrite("deviance", &MeanModelFit::deviance)
        .def_readwrite("log_likelihood", &MeanModelFit::log_likelihood)
        .def_readwrite("iterations", &MeanModelFit::iterations)
        .def_readwrite("converged", &MeanModelFit::converged);

    py::class_<FeatureFitOptions>(m, "FeatureFitOptions")
        .def(py::init<>())
        .def_readwrite("mean", &FeatureFitOptions::mean)
        .def_readwrite("theta", &FeatureFitOptions::theta);

    py::class_<FeatureFit>(m, "FeatureFit")
        .def(py::init<>())
        .def_readwrite("coefficients", &FeatureFit::coefficients)
        .def_readwrite("theta", &FeatureFit::theta)
        .def_readwrite("status", &FeatureFit::status)
        .def_readwrite("mean_converged", &FeatureFit::mean_converged)
        .def_readwrite("skipped", &FeatureFit::skipped);

    // Responses arrive as float arrays from numpy and are truncated to counts.
    m.def("lookup_table", [](const Eigen::VectorXd& y) {
        std::vector<std::pair<int, std::size_t>> rows;
        for (const auto& bin : build_count_table(coerce_counts(y))) {
            rows.emplace_back(bin.value, bin.multiplicity);
        }
        return rows;
    }, py::arg("y"));

    m.def("theta_nb_score", [](const Eigen::VectorXd& y, const Eigen::VectorXd& mu, double theta, bool fast) {
        return theta_nb_score(coerce_counts(y), mu, theta, mode_from_flag(fast));
    }, py::arg("y"), py::arg("mu"), py::arg("theta"), py::arg("fast") = true);

    m.def("theta_nb_hessian", [](const Eigen::VectorXd& y, const Eigen::VectorXd& mu, double theta, bool fast) {
        return theta_nb_hessian(coerce_counts(y), mu, theta, mode_from_flag(fast));
    }, py::arg("y"), py::arg("mu"), py::arg("theta"), py::arg("fast") = true);

    m.def("estimate_mean", [](const Eigen::VectorXd& y, const Eigen::MatrixXd& model_matrix, const MeanModelOptions& options) {
        return estimate_mean(coerce_counts(y), model_matrix, options);
    }, py::arg("y"), py::arg("model_matrix"), py::arg("options") = MeanModelOptions());

    m.def("estimate_dispersion", [](const Eigen::VectorXd& y, const Eigen::VectorXd& mu, std::size_t max_iters, double tol) {
        return estimate_dispersion(coerce_counts(y), mu, max_iters, tol);
    }, py::arg("y"), py::arg("mu"), py::arg("max_iters") = 20, py::arg("tol") = 1e-4);

    m.def("fit_theta", [](const Eigen::VectorXd& y, const Eigen::VectorXd& mu, const ThetaOptions& options) {
        return fit_theta(coerce_counts(y), mu, options);
    }, py::arg("y"), py::arg("mu"), py::arg("options") = ThetaOptions());

    m.def("fit_features", [](const Eigen::MatrixXi& counts, const Eigen::MatrixXd& model_matrix, const FeatureFitOptions& options) {
        return fit_features(counts, model_matrix, options);
    }, py::arg("counts"), py::arg("model_matrix"), py::arg("options") = FeatureFitOptions());
}
