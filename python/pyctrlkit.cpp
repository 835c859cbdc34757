#include <pybind11/complex.h>
#include <pybind11/eigen.h>
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include "../source/control.hpp"

namespace py = pybind11;
using namespace ctrlkit;

PYBIND11_MODULE(pyctrlkit, m) {
    m.doc() = "Python bindings for DC motor modelling, system identification and controller design";

    // Motor model
    py::class_<DcMotorParams>(m, "DcMotorParams")
        .def(py::init<>())
        .def(py::init([](double J, double b, double K, double R, double L) { return DcMotorParams{J, b, K, R, L}; }),
             py::arg("J"), py::arg("b"), py::arg("K"), py::arg("R"), py::arg("L"))
        .def_readwrite("J", &DcMotorParams::J)
        .def_readwrite("b", &DcMotorParams::b)
        .def_readwrite("K", &DcMotorParams::K)
        .def_readwrite("R", &DcMotorParams::R)
        .def_readwrite("L", &DcMotorParams::L);

    // LTI models
    py::class_<TransferFunction>(m, "TransferFunction")
        .def(py::init<Poly, Poly, std::optional<double>>(),
             py::arg("num"), py::arg("den"), py::arg("Ts") = std::nullopt)
        .def_readonly("num", &TransferFunction::num)
        .def_readonly("den", &TransferFunction::den)
        .def_readonly("Ts", &TransferFunction::Ts)
        .def("poles", &TransferFunction::poles)
        .def("zeros", &TransferFunction::zeros)
        .def("to_state_space", &TransferFunction::toStateSpace)
        .def("__repr__", [](const TransferFunction& sys) { return fmt::format("{}", sys); });

    py::class_<StateSpace>(m, "StateSpace")
        .def(py::init<Matrix, Matrix, Matrix, Matrix, std::optional<double>>(),
             py::arg("A"), py::arg("B"), py::arg("C"), py::arg("D"), py::arg("Ts") = std::nullopt)
        .def_readonly("A", &StateSpace::A)
        .def_readonly("B", &StateSpace::B)
        .def_readonly("C", &StateSpace::C)
        .def_readonly("D", &StateSpace::D)
        .def_readonly("Ts", &StateSpace::Ts)
        .def("poles", &StateSpace::poles)
        .def("to_transfer_function", &StateSpace::toTransferFunction, py::arg("output") = 0, py::arg("input") = 0)
        .def("__repr__", [](const StateSpace& sys) { return fmt::format("{}", sys); });

    m.def("speed_tf", &speedTf, py::arg("params") = DcMotorParams{}, "omega(s)/V(s) of the DC motor");
    m.def("position_tf", &positionTf, py::arg("params") = DcMotorParams{}, "theta(s)/V(s) of the DC motor");
    m.def("speed_ss", &speedSs, py::arg("params") = DcMotorParams{});
    m.def("position_ss", &positionSs, py::arg("params") = DcMotorParams{});

    // Data
    py::class_<IdData>(m, "IdData")
        .def(py::init<std::vector<double>, std::vector<double>, double, double>(),
             py::arg("y"), py::arg("u"), py::arg("Ts"), py::arg("t_start") = 0.0)
        .def_property_readonly("y", &IdData::output)
        .def_property_readonly("u", &IdData::input)
        .def_property_readonly("Ts", &IdData::sampleTime)
        .def_property_readonly("t", &IdData::time)
        .def("__len__", &IdData::size)
        .def("segment", &IdData::segment, py::arg("first"), py::arg("last"))
        .def("split", [](const IdData& data, double fraction) {
                 auto parts = data.split(fraction);
                 return py::make_tuple(parts.identification, parts.validation);
             },
             py::arg("fraction"), "Returns (identification, validation)")
        .def("__repr__", [](const IdData& data) { return fmt::format("{}", data); });

    m.def("read_csv", &readCsv, py::arg("path"));
    m.def("write_csv", &writeCsv, py::arg("path"), py::arg("data"));

    // Identification
    py::class_<IdPoly>(m, "IdPoly")
        .def_readonly("A", &IdPoly::A)
        .def_readonly("B", &IdPoly::B)
        .def_readonly("F", &IdPoly::F)
        .def_readonly("nk", &IdPoly::nk)
        .def_readonly("Ts", &IdPoly::Ts)
        .def_readonly("noise_variance", &IdPoly::noiseVariance)
        .def_readonly("loss_function", &IdPoly::lossFunction)
        .def_readonly("fit_percent", &IdPoly::fitPercent)
        .def_readonly("iterations", &IdPoly::iterations)
        .def_readonly("termination", &IdPoly::termination)
        .def("to_transfer_function", &IdPoly::toTransferFunction)
        .def("to_state_space", &IdPoly::toStateSpace)
        .def("simulate", &IdPoly::simulate, py::arg("u"))
        .def("__repr__", [](const IdPoly& model) { return fmt::format("{}", model); });

    py::class_<OeOptions>(m, "OeOptions")
        .def(py::init<>())
        .def_readwrite("max_function_evaluations", &OeOptions::maxFunctionEvaluations)
        .def_readwrite("function_tolerance", &OeOptions::functionTolerance)
        .def_readwrite("step_tolerance", &OeOptions::stepTolerance)
        .def_readwrite("enforce_stability", &OeOptions::enforceStability)
        .def_readwrite("initial_B", &OeOptions::initialB)
        .def_readwrite("initial_F", &OeOptions::initialF);

    m.def("arx", &arx, py::arg("data"), py::arg("na"), py::arg("nb"), py::arg("nk") = 1,
          "Least-squares ARX model A(q) y = B(q) u + e");
    m.def("oe", &oe, py::arg("data"), py::arg("nb"), py::arg("nf"), py::arg("nk") = 1, py::arg("options") = OeOptions{},
          "Output-error model y = B(q)/F(q) u + e by prediction-error minimization");
    m.def("n4sid", [](const IdData& data, size_t order, size_t horizon) {
              return n4sid(data, order, N4sidOptions{horizon});
          },
          py::arg("data"), py::arg("order"), py::arg("horizon") = 0);

    m.def("compare", py::overload_cast<const IdPoly&, const IdData&, size_t>(&compare),
          py::arg("model"), py::arg("data"), py::arg("horizon") = kSimulationHorizon,
          "NRMSE fit in percent. The default horizon is pure simulation.");
    m.def("compare", py::overload_cast<const StateSpace&, const IdData&>(&compare), py::arg("model"), py::arg("data"));

    // Design
    py::class_<RootLocusResponse>(m, "RootLocusResponse")
        .def_readonly("branches", &RootLocusResponse::branches)
        .def_readonly("gains", &RootLocusResponse::gains);

    m.def("place", &place, py::arg("A"), py::arg("B"), py::arg("poles"), "State feedback gain K with eig(A - B K) = poles");
    m.def("place_observer", &placeObserver, py::arg("A"), py::arg("C"), py::arg("poles"));
    m.def("rlocus", py::overload_cast<const TransferFunction&, double, double, size_t>(&rlocus),
          py::arg("sys"), py::arg("k_min") = 0.0, py::arg("k_max") = 100.0, py::arg("num_points") = 500);

    // Simulation
    py::class_<SimulationResult>(m, "SimulationResult")
        .def_readonly("t", &SimulationResult::time)
        .def_readonly("y", &SimulationResult::output)
        .def_readonly("x", &SimulationResult::state);

    m.def("lsim", [](const TransferFunction& sys, const std::vector<double>& u, const std::vector<double>& t) {
              return lsim(sys, u, t);
          },
          py::arg("sys"), py::arg("u"), py::arg("t"));
    m.def("lsim", [](const StateSpace& sys, const std::vector<double>& u, const std::vector<double>& t, const Eigen::VectorXd& x0) {
              return lsim(sys, u, t, ColVec(x0));
          },
          py::arg("sys"), py::arg("u"), py::arg("t"), py::arg("x0") = Eigen::VectorXd());
}
