#pragma once
#include <stdexcept>
#include <string>

namespace sg {

// Raised when an arithmetic op receives something that is not a usable node
// or number: an empty or stale handle, a node from another graph, or (from
// Python) an object of an unsupported type.
class InvalidOperand : public std::invalid_argument {
public:
  InvalidOperand(std::string op, std::string operand_type)
  : std::invalid_argument("sg::" + op + ": invalid operand of type '" + operand_type + "'"),
    op_(std::move(op)), operand_type_(std::move(operand_type)) {}

  const std::string& op() const { return op_; }
  const std::string& operand_type() const { return operand_type_; }

private:
  std::string op_;
  std::string operand_type_;
};

// Raised when pow() is given an exponent that is not a numeric constant.
class InvalidExponent : public std::invalid_argument {
public:
  InvalidExponent(std::string op, std::string exponent_type)
  : std::invalid_argument("sg::" + op + ": exponent must be a numeric constant, got '" + exponent_type + "'"),
    op_(std::move(op)), exponent_type_(std::move(exponent_type)) {}

  const std::string& op() const { return op_; }
  const std::string& exponent_type() const { return exponent_type_; }

private:
  std::string op_;
  std::string exponent_type_;
};

} // namespace sg
