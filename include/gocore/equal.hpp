// Equality and hashing over runtime values, dispatched per value kind.
#pragma once
#include <cstddef>
#include "gocore/value.hpp"

namespace gocore {

// Value equality as used by == and by map key matching.
// Both operands must share a static type; comparing arrays or maps is a usage error.
bool equal(const value& a, const value& b);

// Hash consistent with equal(): equal values always hash alike.
std::size_t hash(const value& v);

// Panics with "hash of unhashable type" when v (or anything boxed inside it) cannot be a map key.
void ensure_hashable(const TypeContext& ctx, const value& v);

} // namespace gocore
