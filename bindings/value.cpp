// value.cpp: pybind11 bindings for sg::Value, sg::Graph and the DOT renderer.
// The nn submodule lives in bindings/nn.cpp.
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include "sg/all.hpp"

namespace py = pybind11;

// implemented in bindings/nn.cpp
void bind_nn(py::module_ &m);

#ifndef SG_BINDINGS_VERSION
#define SG_BINDINGS_VERSION "0.1.0"
#endif

namespace {

std::string py_type_name(const py::handle& o) {
  return py::str(o.attr("__class__").attr("__name__")).cast<std::string>();
}

bool is_number(const py::handle& o) {
  return py::isinstance<py::bool_>(o) || py::isinstance<py::int_>(o) || py::isinstance<py::float_>(o);
}

// Python's dynamic operands: a Value, or anything int/float-like.
sg::Operand to_operand(const char* op, const py::object& o) {
  if (py::isinstance<sg::Value>(o)) return sg::Operand(o.cast<const sg::Value&>());
  if (is_number(o)) return sg::Operand(o.cast<double>());
  throw sg::InvalidOperand(op, py_type_name(o));
}

double to_exponent(const char* op, const py::object& o) {
  if (!is_number(o)) throw sg::InvalidExponent(op, py_type_name(o));
  return o.cast<double>();
}

// `with scalargrad.GraphScope() as g:` makes g current for the block. The
// C++ scope lives from __enter__ to __exit__.
struct PyGraphScope {
  std::shared_ptr<sg::Graph> graph;
  std::unique_ptr<sg::GraphScope> scope;
};

std::string repr(const sg::Value& v) {
  std::ostringstream oss;
  oss << v;
  return oss.str();
}

} // anon

PYBIND11_MODULE(scalargrad, m) {
  m.attr("__version__") = SG_BINDINGS_VERSION;

  py::register_exception<sg::InvalidOperand>(m, "InvalidOperand", PyExc_TypeError);
  py::register_exception<sg::InvalidExponent>(m, "InvalidExponent", PyExc_TypeError);

  // --- Config knobs ---
  m.def("set_check_finite", &sg::config::set_check_finite, py::arg("enabled"));
  m.def("check_finite_enabled", &sg::config::check_finite_enabled);
  m.def("set_trace", &sg::config::set_trace, py::arg("enabled"));
  m.def("trace_enabled", &sg::config::trace_enabled);

  // --- Graph arena ---
  py::class_<sg::Graph, std::shared_ptr<sg::Graph>>(m, "Graph",
      "Arena owning every node of a computation. Nodes are only released by\n"
      "rewind()/clear() or when the graph itself goes away, so a training loop\n"
      "on the current graph grows without bound unless it rewinds:\n\n"
      "    g = scalargrad.current_graph()\n"
      "    m = g.mark()            # after building the model\n"
      "    for step in range(n):\n"
      "        loss = ...; loss.backward(); opt.step(model)\n"
      "        g.rewind(m)         # drop this step's nodes\n\n"
      "Alternatively run each computation inside `with GraphScope():`.")
    .def(py::init<>())
    .def("mark", &sg::Graph::mark, "Current node count, for a later rewind().")
    .def("rewind", &sg::Graph::rewind, py::arg("mark"),
         "Drops every node created after mark; Values pointing at them become stale.")
    .def("clear", &sg::Graph::clear, "rewind(0)")
    .def("zero_grad", &sg::Graph::zero_grad)
    .def("__len__", &sg::Graph::size);

  py::class_<PyGraphScope>(m, "GraphScope",
      "Context manager making a fresh (or the given) Graph current for the block.\n"
      "The previous graph is restored on exit; the block's graph is freed once\n"
      "no Value refers to it.")
    .def(py::init([](std::shared_ptr<sg::Graph> g){
      return PyGraphScope{g ? std::move(g) : std::make_shared<sg::Graph>(), nullptr};
    }), py::arg("graph") = py::none())
    .def("__enter__", [](PyGraphScope& s){
      if (s.scope) throw std::logic_error("GraphScope is already active");
      s.scope = std::make_unique<sg::GraphScope>(s.graph);
      return s.graph;
    })
    .def("__exit__", [](PyGraphScope& s, py::object, py::object, py::object){
      s.scope.reset();
      return false;
    });

  m.def("current_graph", &sg::current_graph);
  m.def("set_current_graph", &sg::set_current_graph, py::arg("graph"));

  // --- Value ---
  py::class_<sg::Value>(m, "Value")
    .def(py::init([](double data, std::string label){ return sg::Value(data, std::move(label)); }),
         py::arg("data"), py::arg("label") = "")
    .def_property("data", &sg::Value::value, &sg::Value::set_value)
    .def_property_readonly("grad", &sg::Value::grad)
    .def_property("label",
                  [](const sg::Value& v){ return v.label(); },
                  [](sg::Value& v, std::string s){ v.set_label(std::move(s)); })
    .def_property_readonly("op", [](const sg::Value& v){ return sg::op_symbol(v); })
    .def_property_readonly("operands", &sg::Value::operands)
    .def_property_readonly("is_leaf", &sg::Value::is_leaf)
    .def("zero_grad", &sg::Value::zero_grad)
    .def("relu", [](const sg::Value& v){ return sg::relu(v); })
    .def("backward", &sg::Value::backward)
    .def("__add__",  [](const sg::Value& a, py::object b){ return sg::add(a, to_operand("add", b)); })
    .def("__radd__", [](const sg::Value& a, py::object b){ return sg::add(to_operand("add", b), a); })
    .def("__sub__",  [](const sg::Value& a, py::object b){ return sg::sub(a, to_operand("sub", b)); })
    .def("__rsub__", [](const sg::Value& a, py::object b){ return sg::sub(to_operand("sub", b), a); })
    .def("__mul__",  [](const sg::Value& a, py::object b){ return sg::mul(a, to_operand("mul", b)); })
    .def("__rmul__", [](const sg::Value& a, py::object b){ return sg::mul(to_operand("mul", b), a); })
    .def("__truediv__",  [](const sg::Value& a, py::object b){ return sg::div(a, to_operand("div", b)); })
    .def("__rtruediv__", [](const sg::Value& a, py::object b){ return sg::div(to_operand("div", b), a); })
    .def("__pow__", [](const sg::Value& a, py::object e){ return sg::pow(a, to_exponent("pow", e)); })
    .def("__neg__", [](const sg::Value& a){ return sg::neg(a); })
    .def("__repr__", &repr)
    .def("to_dot", [](const sg::Value& v, const std::string& rankdir){
      sg::viz::DotOptions opts;
      opts.rankdir = rankdir;
      return sg::viz::to_dot(v, opts);
    }, py::arg("rankdir") = "LR");

  // --- Graph helpers ---
  m.def("detach", &sg::detach, py::arg("x"));
  m.def("topo_order", &sg::topo_order, py::arg("root"));
  m.def("zero_grad_subgraph", &sg::zero_grad_subgraph, py::arg("root"));

  bind_nn(m);
}
