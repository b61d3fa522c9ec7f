// Literal-time numeric conversion and assignability.
#pragma once
#include <string_view>
#include "gocore/value.hpp"

namespace gocore {

// Converts a numeric value to another numeric type.
//   int -> int      wraps to the target width (two's complement)
//   int -> float    round to nearest, ties to even; precision loss is silent
//   float -> float  round to nearest, ties to even
//   float -> int    truncates toward zero
// Same-type conversion returns v unchanged. Anything else panics (E2012).
value convert(TypeContext& ctx, const value& v, TypeId target);

// Converts an exact decimal constant ("1.1", "20000000000000000000", "-3e2") to target.
// Float targets round once from the exact decimal; integer targets panic (E2013) when
// the constant does not fit, and when it has a fractional part.
value convert_constant(TypeContext& ctx, std::string_view literal, TypeId target);

// Makes v assignable to target: boxes into any, turns untyped nil into the target's
// nil value, converts between numeric types; otherwise panics (E2011).
value coerce(TypeContext& ctx, const value& v, TypeId target);

} // namespace gocore
