// ============================
// File: include/sg/nn/module.hpp
// ============================
#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "sg/core/value.hpp"

namespace sg::nn {

// Base class for scalar neural-network modules.
// - Pure-virtual forward() over a vector of scalars
// - Parameter registration + recursive collection
// - Named children/params (for debugging and describe())
// - zero_grad()
//
// Notes:
// * Copy/move are deleted to avoid dangling Module* registrations.
// * Derived classes that override forward() should add `using Module::forward;`
//   to keep the raw-input overload visible.
// * Derived classes implement _parameters() to return ONLY their own unnamed
//   params; anything passed to register_parameter() is collected already.
class Module {
public:
  Module() = default;
  virtual ~Module() = default;

  Module(const Module&)            = delete;
  Module& operator=(const Module&) = delete;
  Module(Module&&)                 = delete;
  Module& operator=(Module&&)      = delete;

  virtual std::vector<Value> forward(const std::vector<Value>& x) = 0;
  // Wraps raw inputs as leaves on the parameters' graph.
  std::vector<Value> forward(const std::vector<double>& x);

  std::vector<Value> operator()(const std::vector<Value>& x) { return forward(x); }
  std::vector<Value> operator()(const std::vector<double>& x) { return forward(x); }

  // Human-readable structure, e.g. "MLP of [Layer of [ReLU Neuron(2), ...]]".
  virtual std::string describe() const = 0;

  // Parameter utilities
  std::vector<Value> parameters();
  std::vector<std::pair<std::string, Value>> named_parameters(const std::string& prefix = "");
  std::size_t num_parameters() { return parameters().size(); }
  void zero_grad();

  // Graph the parameters live on (current_graph() at construction).
  const std::shared_ptr<Graph>& graph() const { return graph_; }

protected:
  // register a non-owning (member) child
  Module& register_module(const std::string& name, Module& m);
  // register an owning child
  std::shared_ptr<Module> register_module(const std::string& name, std::shared_ptr<Module> m);

  Module& register_parameter(const std::string& name, const Value& v);

  virtual std::vector<Value> _parameters() { return {}; }

private:
  std::shared_ptr<Graph> graph_ = current_graph();

  std::vector<Module*> children_;
  std::vector<std::string> child_names_;
  std::vector<std::shared_ptr<Module>> owned_;

  std::vector<std::pair<std::string, Value>> named_params_;
};

} // namespace sg::nn
