#include "sg/viz/dot.hpp"
#include "sg/ops/checks.hpp"
#include <iomanip>
#include <ostream>
#include <set>
#include <sstream>
#include <utility>

namespace sg::viz {
namespace {

// Record labels treat these as field syntax.
std::string escape_record(const std::string& s) {
  std::string out;
  out.reserve(s.size());
  for (char c : s) {
    switch (c) {
      case '{': case '}': case '|': case '<': case '>': case '"': case '\\':
        out.push_back('\\');
        break;
      default: break;
    }
    out.push_back(c);
  }
  return out;
}

} // anon

void write_dot(std::ostream& os, const Value& root, const DotOptions& opts) {
  detail::check_handle("to_dot", root);
  const auto& g = root.graph();
  const auto order = g->topo_order(root.id());

  os << "digraph {\n";
  os << "  rankdir=" << opts.rankdir << ";\n";

  std::ostringstream num;
  num << std::fixed << std::setprecision(opts.precision);

  std::set<std::pair<NodeId, NodeId>> edges;
  for (NodeId id : order) {
    const Value v(g, id);
    num.str("");
    num << "{ " << escape_record(v.label()) << " | data " << v.value() << " | grad " << v.grad() << " }";
    os << "  n" << id << " [shape=record, label=\"" << num.str() << "\"];\n";
    if (v.is_leaf()) continue;
    os << "  n" << id << "_op [label=\"" << op_symbol(v) << "\"];\n";
    os << "  n" << id << "_op -> n" << id << ";\n";
    for (const Value& operand : v.operands()) edges.emplace(operand.id(), id);
  }
  for (const auto& e : edges) {
    os << "  n" << e.first << " -> n" << e.second << "_op;\n";
  }
  os << "}\n";
}

std::string to_dot(const Value& root, const DotOptions& opts) {
  std::ostringstream oss;
  write_dot(oss, root, opts);
  return oss.str();
}

} // namespace sg::viz
