#include "gocore/slots.hpp"
#include "gocore/env.hpp"
#include "gocore/panic.hpp"

#include <llvm/Support/raw_ostream.h>

namespace gocore {

value SlotArena::allocate(TypeContext& ctx, value init){
    TypeId pointee = init.type;
    slots_.push_back(std::move(init));
    SlotId id = slots_.size();
    if(runtimeEnv().debugSlots)
        llvm::errs() << "[dbg][slot] alloc id=" << id << " type=" << ctx.to_string(pointee) << "\n";
    return make_pointer(ctx, pointee, id);
}

value SlotArena::allocate_zero(TypeContext& ctx, TypeId t){
    return allocate(ctx, zero_value(ctx, t));
}

size_t SlotArena::index_of(const value& ptr) const {
    if(!ptr.is_pointer())
        raise(codes::CannotUse, std::string("invalid indirect of non-pointer ") + kind_name(ptr));
    const auto& p = ptr.as_pointer();
    if(p.is_nil())
        raise(codes::NilDereference, "runtime error: invalid memory address or nil pointer dereference");
    if(*p.slot == 0 || *p.slot > slots_.size())
        raise(codes::DanglingPointer, "dangling pointer: slot " + std::to_string(*p.slot) + " was not allocated by this arena");
    return static_cast<size_t>(*p.slot - 1);
}

const value& SlotArena::load(const value& ptr) const { return slots_[index_of(ptr)]; }
value& SlotArena::load(const value& ptr){ return slots_[index_of(ptr)]; }

void SlotArena::store(const value& ptr, value v){
    value& slot = slots_[index_of(ptr)];
    if(v.type != slot.type)
        raise(codes::CannotUse, std::string("cannot store ") + kind_name(v) + " through pointer to " + kind_name(slot));
    slot = std::move(v);
}

} // namespace gocore
