#pragma once
#include "sg/core/value.hpp"

namespace sg {

// Scalar arithmetic. Either side may be a bare number.
Value add(const Operand& a, const Operand& b);
Value sub(const Operand& a, const Operand& b);   // a + (-b)
Value mul(const Operand& a, const Operand& b);
Value div(const Operand& a, const Operand& b);   // a * b^-1; b == 0 yields inf, also under SG_CHECK_FINITE
Value neg(const Operand& x);                     // x * -1

// base ** exponent. The exponent must be a numeric constant.
Value pow(const Value& base, const Operand& exponent);

inline Value operator+(const Operand& a, const Operand& b) { return add(a, b); }
inline Value operator-(const Operand& a, const Operand& b) { return sub(a, b); }
inline Value operator*(const Operand& a, const Operand& b) { return mul(a, b); }
inline Value operator/(const Operand& a, const Operand& b) { return div(a, b); }
inline Value operator-(const Value& x) { return neg(x); }

} // namespace sg
