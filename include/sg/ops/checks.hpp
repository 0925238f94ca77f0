#pragma once
#include "sg/core/value.hpp"

namespace sg { namespace detail {

// Throws InvalidOperand naming `op` when v is empty or has been rewound.
void check_handle(const char* op, const Value& v);

// check_handle on every node operand, then rejects two nodes on different
// graphs. Nothing is appended to any graph.
void check_pair(const char* op, const Operand& a, const Operand& b);

}} // namespace sg::detail
