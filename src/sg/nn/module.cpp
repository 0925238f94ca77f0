// ============================
// File: src/sg/nn/module.cpp
// ============================
#include "sg/nn/module.hpp"
#include "sg/core/trace.hpp"
#include <stdexcept>
#include <set>

namespace sg::nn {

std::vector<Value> Module::forward(const std::vector<double>& x) {
  std::vector<Value> in;
  in.reserve(x.size());
  for (double xi : x) in.push_back(Value::leaf(graph_, xi));
  return forward(in);
}

std::vector<Value> Module::parameters() {
  std::vector<Value> out;
  out.reserve(16);

  for (auto& p : _parameters()) out.push_back(p);
  for (auto& np : named_params_) out.push_back(np.second);

  for (auto* child : children_) {
    auto child_params = child->parameters();
    out.insert(out.end(), child_params.begin(), child_params.end());
  }

  // Order-preserving dedup by node identity
  std::vector<Value> deduped;
  deduped.reserve(out.size());
  std::set<std::pair<const Graph*, NodeId>> seen;
  for (auto& p : out) {
    if (!p.defined()) continue;
    if (seen.emplace(p.graph().get(), p.id()).second) deduped.push_back(p);
  }
  return deduped;
}

std::vector<std::pair<std::string, Value>> Module::named_parameters(const std::string& prefix) {
  std::vector<std::pair<std::string, Value>> out;

  for (auto& p : _parameters()) out.emplace_back(prefix, p);

  for (auto& np : named_params_) {
    std::string full = prefix.empty() ? np.first : prefix + "." + np.first;
    out.emplace_back(std::move(full), np.second);
  }

  for (std::size_t i = 0; i < children_.size(); ++i) {
    const std::string& cname = child_names_[i];
    std::string child_prefix = prefix.empty() ? cname : (prefix + "." + cname);
    auto child_named = children_[i]->named_parameters(child_prefix);
    out.insert(out.end(), child_named.begin(), child_named.end());
  }
  return out;
}

void Module::zero_grad() {
  SG_TRACE_SCOPE(timer, "module.zero_grad");
  auto params = parameters();
  timer.items = params.size();
  for (auto& p : params) p.zero_grad();
}

Module& Module::register_module(const std::string& name, Module& m) {
  children_.push_back(&m);
  child_names_.push_back(name);
  return m;
}

std::shared_ptr<Module> Module::register_module(const std::string& name, std::shared_ptr<Module> m) {
  if (!m) throw std::invalid_argument("sg::nn::Module::register_module: null module");
  register_module(name, *m);
  owned_.push_back(m);
  return m;
}

Module& Module::register_parameter(const std::string& name, const Value& v) {
  named_params_.emplace_back(name, v);
  return *this;
}

} // namespace sg::nn
