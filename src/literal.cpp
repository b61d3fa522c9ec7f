#include "gocore/literal.hpp"
#include "gocore/env.hpp"
#include "gocore/map.hpp"
#include "gocore/numeric.hpp"
#include "gocore/panic.hpp"

#include <llvm/Support/raw_ostream.h>

namespace gocore {

SparseArrayBuilder::SparseArrayBuilder(TypeContext& ctx, TypeId elem, std::optional<uint64_t> fixed_length)
    : ctx_(ctx), elem_(elem), fixed_(fixed_length), zero_(zero_value(ctx, elem)) {
    if(fixed_) elems_.assign(*fixed_, zero_);
}

uint64_t SparseArrayBuilder::index_of(const value& key) const {
    if(!key.is_int())
        raise(codes::NegativeIndex, "index " + to_string(ctx_, key) + " must be non-negative integer constant");
    const int_value& iv = key.as_int();
    if(iv.is_negative())
        raise(codes::NegativeIndex, "index " + std::to_string(iv.as_signed()) + " must be non-negative integer constant");
    uint64_t idx = iv.is_signed ? static_cast<uint64_t>(iv.as_signed()) : iv.bits;
    if(idx > static_cast<uint64_t>(INT64_MAX))
        raise(codes::IndexOutOfRange, "index " + std::to_string(idx) + " overflows int");
    return idx;
}

void SparseArrayBuilder::grow_to(uint64_t n){
    if(n > elems_.size()) elems_.resize(n, zero_);
}

void SparseArrayBuilder::place(const std::optional<value>& key, const value& element){
    if(key){
        cursor_ = index_of(*key);
        if(runtimeEnv().debugLiterals)
            llvm::errs() << "[dbg][literal] cursor -> " << cursor_ << "\n";
    }
    if(fixed_ && cursor_ >= *fixed_)
        raise(codes::IndexOutOfRange, "array index " + std::to_string(cursor_) + " out of range [0:" + std::to_string(*fixed_) + "]");
    if(!fixed_){
        if(cursor_ >= max_literal_length)
            raise(codes::IndexOutOfRange, "array index " + std::to_string(cursor_) + " out of range: array too large",
                  "unsized literals hold at most " + std::to_string(max_literal_length) + " elements");
        if(runtimeEnv().debugLiterals && cursor_ > elems_.size())
            llvm::errs() << "[dbg][literal] zero fill [" << elems_.size() << "," << cursor_ << ")\n";
        grow_to(cursor_ + 1);
    }
    elems_[cursor_] = coerce(ctx_, element, elem_);
    ++cursor_;
}

uint64_t SparseArrayBuilder::length() const { return fixed_ ? *fixed_ : elems_.size(); }

array_value SparseArrayBuilder::finish(){
    return array_value{std::move(elems_)};
}

value build_struct(TypeContext& ctx, TypeId struct_type, const std::vector<literal_entry>& entries){
    if(ctx.at(struct_type).kind != Type::Kind::Struct)
        raise(codes::CannotUse, "invalid composite literal type " + ctx.to_string(struct_type));
    value out = zero_value(ctx, struct_type);
    std::vector<FieldInfo> fields = ctx.at(struct_type).fields;
    const std::string tname = ctx.to_string(struct_type);
    if(entries.empty()) return out;

    bool keyed = entries.front().key.has_value();
    for(const auto& e : entries){
        if(e.key.has_value() != keyed)
            raise(codes::MixedLiteral, "mixture of field:value and value elements in struct literal");
    }

    auto& slots = out.as_struct().fields;
    if(keyed){
        std::vector<bool> seen(fields.size(), false);
        for(const auto& e : entries){
            if(!e.key->is_string())
                raise(codes::UnknownField, "invalid field name " + to_string(ctx, *e.key) + " in struct literal");
            const std::string& name = e.key->as_string();
            int idx = ctx.field_index(struct_type, name);
            if(idx < 0)
                raise(codes::UnknownField, "unknown field " + name + " in struct literal of type " + tname);
            if(seen[idx])
                raise(codes::DuplicateField, "duplicate field name " + name + " in struct literal");
            seen[idx] = true;
            slots[idx] = coerce(ctx, e.element, fields[idx].type);
        }
    } else {
        if(entries.size() > fields.size())
            raise(codes::TooManyValues, "too many values in struct literal of type " + tname);
        if(entries.size() < fields.size())
            raise(codes::TooFewValues, "too few values in struct literal of type " + tname);
        for(size_t i = 0; i < entries.size(); ++i)
            slots[i] = coerce(ctx, entries[i].element, fields[i].type);
    }
    if(runtimeEnv().debugLiterals)
        llvm::errs() << "[dbg][literal] struct " << tname << (keyed ? " keyed" : " positional")
                     << " = " << to_string(ctx, out) << "\n";
    return out;
}

value build_array(TypeContext& ctx, TypeId array_type, const std::vector<literal_entry>& entries){
    const Type& t = ctx.at(array_type);
    if(t.kind != Type::Kind::Array && t.kind != Type::Kind::Slice)
        raise(codes::CannotUse, "invalid composite literal type " + ctx.to_string(array_type));
    bool slice = t.kind == Type::Kind::Slice;
    TypeId elem = t.elem;
    std::optional<uint64_t> fixed = slice ? std::nullopt : t.array_size;

    SparseArrayBuilder builder(ctx, elem, fixed);
    for(const auto& e : entries) builder.place(e.key, e.element);

    TypeId result = array_type;
    if(!slice && !fixed) result = ctx.get_array(elem, builder.length());
    value out{result, builder.finish()};
    if(runtimeEnv().debugLiterals)
        llvm::errs() << "[dbg][literal] " << ctx.to_string(result) << " len=" << length(out) << "\n";
    return out;
}

value build_map(TypeContext& ctx, TypeId map_type, const std::vector<literal_entry>& entries){
    value m = make_map(ctx, map_type, entries.size());
    for(const auto& e : entries){
        if(!e.key)
            raise(codes::MissingMapKey, "missing key in map literal");
        map_set(ctx, m, *e.key, e.element);
    }
    return m;
}

value build_literal(TypeContext& ctx, TypeId t, const std::vector<literal_entry>& entries){
    switch(ctx.at(t).kind){
        case Type::Kind::Struct: return build_struct(ctx, t, entries);
        case Type::Kind::Array:
        case Type::Kind::Slice: return build_array(ctx, t, entries);
        case Type::Kind::Map: return build_map(ctx, t, entries);
        default: break;
    }
    raise(codes::CannotUse, "invalid composite literal type " + ctx.to_string(t));
}

} // namespace gocore
