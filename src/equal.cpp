// Structural equality + hashing for runtime values.
#include "gocore/equal.hpp"
#include "gocore/panic.hpp"

#include <llvm/ADT/Hashing.h>
#include <cstring>

namespace gocore {

static void not_comparable(const value& v){
    raise(codes::NotComparable, std::string("invalid operation: ") + kind_name(v) + " values are not comparable",
          "only base types, pointers, structs and any values can be compared");
}

static void not_hashable(const value& v){
    raise(codes::UnhashableKey, std::string("runtime error: hash of unhashable ") + kind_name(v));
}

static bool equal_impl(const value& a, const value& b){
    if(a.type != b.type){
        raise(codes::MismatchedTypes,
              std::string("invalid operation: mismatched types ") + kind_name(a) + " and " + kind_name(b),
              "type ids " + std::to_string(a.type) + " and " + std::to_string(b.type));
    }
    if(a.data.index() != b.data.index()){
        raise(codes::MismatchedTypes, std::string("invalid operation: mismatched value kinds ") + kind_name(a) + " and " + kind_name(b));
    }

    struct Visitor {
        const value& a; const value& b;
        bool operator()(std::monostate) const { return true; }
        bool operator()(bool x) const { return x == b.as_bool(); }
        bool operator()(const int_value& x) const { return x.bits == b.as_int().bits; }
        bool operator()(float x) const { return x == b.as_float32(); }
        bool operator()(double x) const { return x == b.as_float64(); }
        bool operator()(const std::string& x) const { return x == b.as_string(); }
        bool operator()(const pointer_value& x) const { return x.slot == b.as_pointer().slot; }
        bool operator()(const struct_value& x) const {
            const auto& rf = b.as_struct().fields;
            if(x.fields.size() != rf.size()) return false;
            for(size_t i=0;i<x.fields.size(); ++i) if(!equal_impl(x.fields[i], rf[i])) return false;
            return true;
        }
        bool operator()(const any_value& x) const {
            const auto& y = b.as_any();
            if(x.dynamic_type != y.dynamic_type) return false;
            if(x.is_nil() || y.is_nil()) return x.is_nil() && y.is_nil();
            return equal_impl(*x.boxed, *y.boxed);
        }
        bool operator()(const array_value&) const { not_comparable(a); return false; }
        bool operator()(const map_value&) const { not_comparable(a); return false; }
    };

    return std::visit(Visitor{a, b}, a.data);
}

bool equal(const value& a, const value& b){ return equal_impl(a, b); }

static llvm::hash_code hash_impl(const value& v){
    struct Visitor {
        const value& v;
        llvm::hash_code operator()(std::monostate) const { return llvm::hash_value(0); }
        llvm::hash_code operator()(bool x) const { return llvm::hash_value(x); }
        llvm::hash_code operator()(const int_value& x) const { return llvm::hash_combine(x.width, x.is_signed, x.bits); }
        llvm::hash_code operator()(float x) const {
            if(x == 0.0f) x = 0.0f; // -0 == +0
            uint32_t bits; std::memcpy(&bits, &x, sizeof bits);
            return llvm::hash_value(bits);
        }
        llvm::hash_code operator()(double x) const {
            if(x == 0.0) x = 0.0;
            uint64_t bits; std::memcpy(&bits, &x, sizeof bits);
            return llvm::hash_value(bits);
        }
        llvm::hash_code operator()(const std::string& x) const { return llvm::hash_value(x); }
        llvm::hash_code operator()(const pointer_value& x) const {
            if(x.is_nil()) return llvm::hash_value(0);
            return llvm::hash_combine(1, *x.slot);
        }
        llvm::hash_code operator()(const struct_value& x) const {
            llvm::hash_code h = llvm::hash_value(x.fields.size());
            for(auto& f : x.fields) h = llvm::hash_combine(h, hash_impl(f));
            return h;
        }
        llvm::hash_code operator()(const any_value& x) const {
            if(x.is_nil()) return llvm::hash_value(0);
            return llvm::hash_combine(x.dynamic_type, hash_impl(*x.boxed));
        }
        llvm::hash_code operator()(const array_value&) const { not_hashable(v); return {}; }
        llvm::hash_code operator()(const map_value&) const { not_hashable(v); return {}; }
    };
    return llvm::hash_combine(v.data.index(), std::visit(Visitor{v}, v.data));
}

std::size_t hash(const value& v){ return static_cast<std::size_t>(hash_impl(v)); }

void ensure_hashable(const TypeContext& ctx, const value& v){
    if(auto* s = std::get_if<struct_value>(&v.data)){
        for(auto& f : s->fields) ensure_hashable(ctx, f);
        return;
    }
    if(auto* a = std::get_if<any_value>(&v.data)){
        if(!a->is_nil()) ensure_hashable(ctx, *a->boxed);
        return;
    }
    if(v.is_array() || v.is_map())
        raise(codes::UnhashableKey, "runtime error: hash of unhashable type " + ctx.to_string(v.type));
}

} // namespace gocore
