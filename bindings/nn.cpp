#include <memory>
#include <stdexcept>
#include <string>
#include <vector>
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include "sg/all.hpp"

namespace py = pybind11;

namespace {

// Trampoline so Python subclasses can override forward() and describe().
struct PyModule : sg::nn::Module {
  using sg::nn::Module::Module;

  std::vector<sg::Value> forward(const std::vector<sg::Value>& x) override {
    PYBIND11_OVERRIDE_PURE(std::vector<sg::Value>, sg::nn::Module, forward, x);
  }
  std::string describe() const override {
    PYBIND11_OVERRIDE_PURE(std::string, sg::nn::Module, describe, );
  }

  // re-exported so Python subclasses can register their own parameters/children
  using sg::nn::Module::register_parameter;
  std::shared_ptr<sg::nn::Module> register_child(const std::string& name, std::shared_ptr<sg::nn::Module> m) {
    return register_module(name, std::move(m));
  }
};

} // anon

void bind_nn(py::module_ &m) {
  auto nn = m.def_submodule("nn", "Scalar neural-network modules");

  using sg::nn::Module;

  py::class_<Module, PyModule, std::shared_ptr<Module>>(nn, "Module")
    .def(py::init<>())
    .def("forward", [](Module& self, const std::vector<sg::Value>& x){ return self.forward(x); })
    .def("forward", [](Module& self, const std::vector<double>& x){ return self.forward(x); })
    .def("__call__", [](Module& self, const std::vector<sg::Value>& x){ return self.forward(x); })
    .def("__call__", [](Module& self, const std::vector<double>& x){ return self.forward(x); })
    .def("parameters", &Module::parameters)
    .def("named_parameters", &Module::named_parameters, py::arg("prefix") = "")
    .def("num_parameters", &Module::num_parameters)
    .def("zero_grad", &Module::zero_grad)
    .def("describe", &Module::describe)
    .def("__repr__", &Module::describe)
    .def("register_parameter", [](Module& self, const std::string& name, const sg::Value& v){
      auto* py_self = dynamic_cast<PyModule*>(&self);
      if (!py_self) throw std::invalid_argument("register_parameter is only available on Python subclasses");
      py_self->register_parameter(name, v);
    }, py::arg("name"), py::arg("value"))
    .def("register_module", [](Module& self, const std::string& name, std::shared_ptr<Module> child){
      auto* py_self = dynamic_cast<PyModule*>(&self);
      if (!py_self) throw std::invalid_argument("register_module is only available on Python subclasses");
      return py_self->register_child(name, std::move(child));
    }, py::arg("name"), py::arg("module"));

  py::class_<sg::nn::Neuron, Module, std::shared_ptr<sg::nn::Neuron>>(nn, "Neuron")
    .def(py::init<std::size_t, bool, unsigned long long>(),
         py::arg("nin"), py::arg("nonlin") = true, py::arg("seed") = 0xC0FFEEull)
    .def_property_readonly("w", &sg::nn::Neuron::weights)
    .def_property_readonly("b", &sg::nn::Neuron::bias)
    .def_property_readonly("nonlin", &sg::nn::Neuron::nonlin);

  py::class_<sg::nn::Layer, Module, std::shared_ptr<sg::nn::Layer>>(nn, "Layer")
    .def(py::init<std::size_t, std::size_t, bool, unsigned long long>(),
         py::arg("nin"), py::arg("nout"), py::arg("nonlin") = true, py::arg("seed") = 0xC0FFEEull)
    .def_property_readonly("neurons", &sg::nn::Layer::neurons);

  py::class_<sg::nn::MLP, Module, std::shared_ptr<sg::nn::MLP>>(nn, "MLP")
    .def(py::init<std::size_t, const std::vector<std::size_t>&, unsigned long long>(),
         py::arg("nin"), py::arg("nouts"), py::arg("seed") = 0xC0FFEEull)
    .def("__len__", &sg::nn::MLP::size);

  py::class_<sg::nn::SGD>(nn, "SGD")
    .def(py::init<double, double, double>(),
         py::arg("lr") = 0.05, py::arg("momentum") = 0.0, py::arg("weight_decay") = 0.0)
    .def_readwrite("lr", &sg::nn::SGD::lr)
    .def_readwrite("momentum", &sg::nn::SGD::momentum)
    .def_readwrite("weight_decay", &sg::nn::SGD::weight_decay)
    .def("step", &sg::nn::SGD::step, py::arg("module"));

  nn.def("mse_loss", &sg::nn::mse_loss, py::arg("pred"), py::arg("target"));
  nn.def("hinge_loss", &sg::nn::hinge_loss, py::arg("scores"), py::arg("labels"));
}
