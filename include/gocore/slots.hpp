// Storage slots addressed by pointer identity tokens.
#pragma once
#include <deque>
#include "gocore/value.hpp"

namespace gocore {

// Owns allocated storage. Slot ids start at 1 and are never reused, so a token
// stays a valid identity for the arena's lifetime whatever the slot holds.
class SlotArena {
public:
    // Stores init in a fresh slot; returns a *T pointer value to it.
    value allocate(TypeContext& ctx, value init);
    // new(T): a fresh slot holding T's zero value.
    value allocate_zero(TypeContext& ctx, TypeId t);

    const value& load(const value& ptr) const;
    value& load(const value& ptr);
    void store(const value& ptr, value v);

    size_t size() const { return slots_.size(); }

private:
    size_t index_of(const value& ptr) const;
    std::deque<value> slots_;
};

} // namespace gocore
