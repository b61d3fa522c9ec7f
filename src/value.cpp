#include "gocore/value.hpp"
#include "gocore/map.hpp"
#include "gocore/panic.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <sstream>

namespace gocore {

const char* kind_name(const value& v){
    static const char* names[] = {"nil","bool","int","float32","float64","string",
                                  "pointer","struct","array","any","map"};
    return names[v.data.index()];
}

value make_nil(){ return value{}; }

value make_bool(TypeContext& ctx, bool b){ return value{ctx.get_base(BaseType::Bool), b}; }

value make_uint(TypeContext& ctx, TypeId t, uint64_t v){
    if(!ctx.is_integer(t)) throw type_error("make_int: " + ctx.to_string(t) + " is not an integer type");
    const Type& ty = ctx.at(t);
    int_value iv;
    iv.width = static_cast<uint8_t>(base_width(ty.base));
    iv.is_signed = is_signed_base(ty.base);
    iv.bits = iv.width >= 64 ? v : (v & ((uint64_t{1} << iv.width) - 1));
    return value{t, iv};
}

value make_int(TypeContext& ctx, TypeId t, int64_t v){ return make_uint(ctx, t, static_cast<uint64_t>(v)); }

value make_int(TypeContext& ctx, int64_t v){ return make_int(ctx, ctx.get_base(BaseType::Int), v); }

value make_float32(TypeContext& ctx, float f){ return value{ctx.get_base(BaseType::Float32), f}; }

value make_float64(TypeContext& ctx, double d){ return value{ctx.get_base(BaseType::Float64), d}; }

value make_string(TypeContext& ctx, std::string s){ return value{ctx.get_base(BaseType::String), std::move(s)}; }

value make_pointer(TypeContext& ctx, TypeId pointee, std::optional<SlotId> slot){
    return value{ctx.get_pointer(pointee), pointer_value{slot}};
}

value box(TypeContext& ctx, const value& v){
    TypeId anyT = ctx.get_any();
    if(v.is_any()) return v;
    if(v.is_untyped_nil()) return value{anyT, any_value{}};
    return value{anyT, any_value{v.type, std::make_shared<const value>(v)}};
}

const value* unbox(const value& v){
    if(!v.is_any()) return nullptr;
    return v.as_any().boxed.get();
}

value zero_value(TypeContext& ctx, TypeId t){
    const Type& ty = ctx.at(t);
    switch(ty.kind){
        case Type::Kind::Base:
            switch(ty.base){
                case BaseType::UntypedNil: return make_nil();
                case BaseType::Bool: return value{t, false};
                case BaseType::Float32: return value{t, 0.0f};
                case BaseType::Float64: return value{t, 0.0};
                case BaseType::String: return value{t, std::string()};
                default: return make_uint(ctx, t, 0);
            }
        case Type::Kind::Pointer: return value{t, pointer_value{}};
        case Type::Kind::Struct: {
            struct_value s;
            // copy: zero_value may grow the type table and invalidate ty
            std::vector<FieldInfo> fields = ty.fields;
            s.fields.reserve(fields.size());
            for(const auto& f : fields) s.fields.push_back(zero_value(ctx, f.type));
            return value{t, std::move(s)};
        }
        case Type::Kind::Array: {
            if(!ty.array_size)
                throw type_error("zero value of " + ctx.to_string(t) + ": array length must come from a literal");
            uint64_t n = *ty.array_size;
            TypeId elem = ty.elem;
            value ez = zero_value(ctx, elem);
            return value{t, array_value{std::vector<value>(n, ez)}};
        }
        case Type::Kind::Slice: return value{t, array_value{}};
        case Type::Kind::Map: return value{t, map_value{}};
        case Type::Kind::Any: return value{t, any_value{}};
    }
    throw type_error("zero value: unknown type kind");
}

static size_t field_slot(const TypeContext& ctx, const value& s, const std::string& name){
    if(!s.is_struct())
        raise(codes::CannotUse, name + " undefined (" + kind_name(s) + " is not a struct)");
    int idx = ctx.field_index(s.type, name);
    if(idx < 0)
        raise(codes::UnknownField, "s." + name + " undefined (type " + ctx.to_string(s.type) + " has no field or method " + name + ")");
    return static_cast<size_t>(idx);
}

const value& field(const TypeContext& ctx, const value& s, const std::string& name){
    return s.as_struct().fields[field_slot(ctx, s, name)];
}

value& field(const TypeContext& ctx, value& s, const std::string& name){
    size_t i = field_slot(ctx, s, name);
    return s.as_struct().fields[i];
}

static size_t element_slot(const value& a, int64_t i){
    if(!a.is_array())
        raise(codes::CannotUse, std::string("invalid operation: cannot index ") + kind_name(a));
    size_t n = a.as_array().elems.size();
    if(i < 0 || static_cast<uint64_t>(i) >= n)
        raise(codes::IndexOutOfRange, "runtime error: index out of range [" + std::to_string(i) + "] with length " + std::to_string(n));
    return static_cast<size_t>(i);
}

const value& element(const value& a, int64_t i){ return a.as_array().elems[element_slot(a, i)]; }

value& element(value& a, int64_t i){
    size_t k = element_slot(a, i);
    return a.as_array().elems[k];
}

int64_t length(const value& v){
    if(v.is_array()) return static_cast<int64_t>(v.as_array().elems.size());
    if(v.is_string()) return static_cast<int64_t>(v.as_string().size());
    if(v.is_map()) return map_len(v);
    raise(codes::CannotUse, std::string("invalid argument: ") + kind_name(v) + " has no length");
}

namespace {

// Shortest round-trip digits, laid out the way %v prints floats:
// exponent form below 1e-4 and at or above 1e6.
std::string format_float(double d, bool single){
    if(std::isnan(d)) return "NaN";
    if(std::isinf(d)) return d > 0 ? "+Inf" : "-Inf";
    char buf[64];
    int prec = 1;
    for(; prec < 17; ++prec){
        std::snprintf(buf, sizeof(buf), "%.*e", prec - 1, d);
        bool same = single ? std::strtof(buf, nullptr) == static_cast<float>(d)
                           : std::strtod(buf, nullptr) == d;
        if(same) break;
    }
    std::snprintf(buf, sizeof(buf), "%.*e", prec - 1, d);
    const char* e = std::strchr(buf, 'e');
    int exp = e ? std::atoi(e + 1) : 0;
    if(exp < -4 || exp >= 6) return buf;
    int decimals = std::max(prec - 1 - exp, 0);
    std::snprintf(buf, sizeof(buf), "%.*f", decimals, d);
    return buf;
}

struct rendered_entry {
    const value* key;
    std::string k, v;
};

bool key_less(const rendered_entry& a, const rendered_entry& b){
    const value& x = *a.key;
    const value& y = *b.key;
    if(x.is_int() && y.is_int()){
        const auto& xi = x.as_int();
        const auto& yi = y.as_int();
        if(xi.is_signed) return xi.as_signed() < yi.as_signed();
        return xi.bits < yi.bits;
    }
    if(x.is_float64() && y.is_float64()) return x.as_float64() < y.as_float64();
    if(x.is_float32() && y.is_float32()) return x.as_float32() < y.as_float32();
    return a.k < b.k;
}

void render(const TypeContext& ctx, const value& v, std::ostringstream& os){
    std::visit([&](const auto& d){
        using T = std::decay_t<decltype(d)>;
        if constexpr(std::is_same_v<T, std::monostate>) os << "<nil>";
        else if constexpr(std::is_same_v<T, bool>) os << (d ? "true" : "false");
        else if constexpr(std::is_same_v<T, int_value>){
            if(d.is_signed) os << d.as_signed(); else os << d.bits;
        }
        else if constexpr(std::is_same_v<T, float>) os << format_float(d, true);
        else if constexpr(std::is_same_v<T, double>) os << format_float(d, false);
        else if constexpr(std::is_same_v<T, std::string>) os << d;
        else if constexpr(std::is_same_v<T, pointer_value>){
            if(d.is_nil()) os << "<nil>";
            else { char buf[32]; std::snprintf(buf, sizeof(buf), "0x%llx", static_cast<unsigned long long>(*d.slot)); os << buf; }
        }
        else if constexpr(std::is_same_v<T, struct_value>){
            os << '{';
            for(size_t i = 0; i < d.fields.size(); ++i){ if(i) os << ' '; render(ctx, d.fields[i], os); }
            os << '}';
        }
        else if constexpr(std::is_same_v<T, array_value>){
            os << '[';
            for(size_t i = 0; i < d.elems.size(); ++i){ if(i) os << ' '; render(ctx, d.elems[i], os); }
            os << ']';
        }
        else if constexpr(std::is_same_v<T, any_value>){
            if(d.is_nil()) os << "<nil>"; else render(ctx, *d.boxed, os);
        }
        else if constexpr(std::is_same_v<T, map_value>){
            std::vector<rendered_entry> entries;
            if(d.table){
                d.table->for_each([&](const value& k, const value& e){
                    entries.push_back(rendered_entry{&k, to_string(ctx, k), to_string(ctx, e)});
                });
            }
            std::stable_sort(entries.begin(), entries.end(), key_less);
            os << "map[";
            for(size_t i = 0; i < entries.size(); ++i){
                if(i) os << ' ';
                os << entries[i].k << ':' << entries[i].v;
            }
            os << ']';
        }
    }, v.data);
}

} // namespace

std::string to_string(const TypeContext& ctx, const value& v){
    std::ostringstream os;
    render(ctx, v, os);
    return os.str();
}

} // namespace gocore
