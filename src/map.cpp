#include "gocore/map.hpp"
#include "gocore/env.hpp"
#include "gocore/numeric.hpp"
#include "gocore/panic.hpp"

#include <llvm/Support/raw_ostream.h>

namespace gocore {

static const Type& map_type_of(const TypeContext& ctx, const value& m){
    const Type& t = ctx.at(m.type);
    if(t.kind != Type::Kind::Map || !m.is_map())
        raise(codes::CannotUse, "invalid operation: " + ctx.to_string(m.type) + " is not a map");
    return t;
}

// Brings the key to the map's key type and rejects keys that cannot be hashed,
// even when the map is nil: a lookup with such a key is a runtime error either way.
static value prepare_key(TypeContext& ctx, const value& m, const value& key){
    TypeId keyT = map_type_of(ctx, m).key;
    value k = coerce(ctx, key, keyT);
    ensure_hashable(ctx, k);
    return k;
}

value make_map(TypeContext& ctx, TypeId map_type, size_t hint){
    const Type& t = ctx.at(map_type);
    if(t.kind != Type::Kind::Map)
        raise(codes::CannotUse, "cannot make " + ctx.to_string(map_type) + "; type must be a map");
    TypeId keyT = t.key;
    TypeId elemT = t.elem;
    if(!ctx.is_comparable(keyT))
        raise(codes::InvalidMapKeyType, "invalid map key type " + ctx.to_string(keyT),
              "map keys must be comparable: base types, pointers, structs of comparable fields or any");
    value zero = zero_value(ctx, elemT);
    if(hint > max_map_hint) hint = 0;
    if(runtimeEnv().debugMaps)
        llvm::errs() << "[dbg][map] make type=" << ctx.to_string(map_type) << " hint=" << hint << "\n";
    return value{map_type, map_value{std::make_shared<MapTable>(map_type, keyT, elemT, std::move(zero), hint)}};
}

std::pair<value, bool> map_lookup(TypeContext& ctx, const value& m, const value& key){
    value k = prepare_key(ctx, m, key);
    const auto& table = m.as_map().table;
    if(!table) return {zero_value(ctx, map_type_of(ctx, m).elem), false};
    if(const value* found = table->find(k)) return {*found, true};
    return {table->zero(), false};
}

value map_get(TypeContext& ctx, const value& m, const value& key){
    return map_lookup(ctx, m, key).first;
}

void map_set(TypeContext& ctx, const value& m, const value& key, const value& elem){
    value k = prepare_key(ctx, m, key);
    const auto& table = m.as_map().table;
    if(!table)
        raise(codes::NilMapWrite, "assignment to entry in nil map", "initialize the map with make or a map literal");
    value e = coerce(ctx, elem, table->elem_type());
    if(runtimeEnv().debugMaps)
        llvm::errs() << "[dbg][map] set " << to_string(ctx, k) << " = " << to_string(ctx, e)
                     << " size=" << table->size() << "\n";
    table->insert_or_assign(std::move(k), std::move(e));
}

void map_delete(TypeContext& ctx, const value& m, const value& key){
    value k = prepare_key(ctx, m, key);
    const auto& table = m.as_map().table;
    if(!table) return;
    bool erased = table->erase(k);
    if(runtimeEnv().debugMaps)
        llvm::errs() << "[dbg][map] delete " << to_string(ctx, k) << (erased ? "" : " (absent)") << "\n";
}

int64_t map_len(const value& m){
    if(!m.is_map()) raise(codes::CannotUse, std::string("invalid argument: ") + kind_name(m) + " is not a map");
    const auto& table = m.as_map().table;
    return table ? static_cast<int64_t>(table->size()) : 0;
}

bool map_is_nil(const value& m){
    return m.is_map() && !m.as_map().table;
}

map_state state_of(const value& m){
    if(map_is_nil(m)) return map_state::uninitialized;
    return map_len(m) == 0 ? map_state::empty : map_state::populated;
}

void map_for_each(const value& m, const std::function<void(const value&, const value&)>& fn){
    if(!m.is_map()) raise(codes::CannotUse, std::string("cannot range over ") + kind_name(m));
    if(const auto& table = m.as_map().table) table->for_each(fn);
}

} // namespace gocore
