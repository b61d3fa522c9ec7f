// Tagged runtime value: one variant per value kind, plus the static type it was built for.
#pragma once
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "gocore/types.hpp"

namespace gocore
{

    class MapTable;
    struct value;

    // Integer of a given width; bits above the width are always zero.
    struct int_value
    {
        uint64_t bits = 0;
        uint8_t width = 64;
        bool is_signed = true;

        int64_t as_signed() const
        {
            if (width >= 64)
                return static_cast<int64_t>(bits);
            uint64_t sign = uint64_t{1} << (width - 1);
            return static_cast<int64_t>((bits ^ sign) - sign);
        }
        uint64_t as_unsigned() const { return bits; }
        bool is_negative() const { return is_signed && as_signed() < 0; }
    };

    using SlotId = uint64_t;

    // Identity token of a storage slot; equality never looks at the pointee.
    struct pointer_value
    {
        std::optional<SlotId> slot;
        bool is_nil() const { return !slot.has_value(); }
    };

    struct struct_value
    {
        std::vector<value> fields; // declaration order
    };

    // Fixed arrays, [...]T arrays and slices share this representation.
    struct array_value
    {
        std::vector<value> elems;
    };

    // Dynamically typed value: the dynamic type tag travels with the boxed value.
    struct any_value
    {
        TypeId dynamic_type = kUntypedNil;
        std::shared_ptr<const value> boxed;
        bool is_nil() const { return !boxed; }
    };

    // Reference to a map table; copies alias the same table. No table means a nil map.
    struct map_value
    {
        std::shared_ptr<MapTable> table;
    };

    enum class map_state
    {
        uninitialized,
        empty,
        populated
    };

    using value_data = std::variant<std::monostate, bool, int_value, float, double, std::string,
                                    pointer_value, struct_value, array_value, any_value, map_value>;

    struct value
    {
        TypeId type = kUntypedNil;
        value_data data;

        bool is_bool() const { return std::holds_alternative<bool>(data); }
        bool is_int() const { return std::holds_alternative<int_value>(data); }
        bool is_float32() const { return std::holds_alternative<float>(data); }
        bool is_float64() const { return std::holds_alternative<double>(data); }
        bool is_string() const { return std::holds_alternative<std::string>(data); }
        bool is_pointer() const { return std::holds_alternative<pointer_value>(data); }
        bool is_struct() const { return std::holds_alternative<struct_value>(data); }
        bool is_array() const { return std::holds_alternative<array_value>(data); }
        bool is_any() const { return std::holds_alternative<any_value>(data); }
        bool is_map() const { return std::holds_alternative<map_value>(data); }
        bool is_untyped_nil() const { return std::holds_alternative<std::monostate>(data); }

        bool as_bool() const { return std::get<bool>(data); }
        const int_value &as_int() const { return std::get<int_value>(data); }
        float as_float32() const { return std::get<float>(data); }
        double as_float64() const { return std::get<double>(data); }
        const std::string &as_string() const { return std::get<std::string>(data); }
        const pointer_value &as_pointer() const { return std::get<pointer_value>(data); }
        const struct_value &as_struct() const { return std::get<struct_value>(data); }
        struct_value &as_struct() { return std::get<struct_value>(data); }
        const array_value &as_array() const { return std::get<array_value>(data); }
        array_value &as_array() { return std::get<array_value>(data); }
        const any_value &as_any() const { return std::get<any_value>(data); }
        const map_value &as_map() const { return std::get<map_value>(data); }
    };

    // Kind name used in diagnostics ("int", "struct", "map", ...).
    const char *kind_name(const value &v);

    value make_nil();
    value make_bool(TypeContext &ctx, bool b);
    // Integer of type t, truncated to the type's width.
    value make_int(TypeContext &ctx, TypeId t, int64_t v);
    value make_int(TypeContext &ctx, int64_t v);
    value make_uint(TypeContext &ctx, TypeId t, uint64_t v);
    value make_float32(TypeContext &ctx, float f);
    value make_float64(TypeContext &ctx, double d);
    value make_string(TypeContext &ctx, std::string s);
    value make_pointer(TypeContext &ctx, TypeId pointee, std::optional<SlotId> slot);

    // Wraps v into an any value tagged with v's type. Boxing an any value returns it unchanged.
    value box(TypeContext &ctx, const value &v);
    // Boxed value of an any, or nullptr for a nil any.
    const value *unbox(const value &v);

    value zero_value(TypeContext &ctx, TypeId t);

    // Struct field access by name; panics when the field does not exist.
    const value &field(const TypeContext &ctx, const value &s, const std::string &name);
    value &field(const TypeContext &ctx, value &s, const std::string &name);
    // Array/slice element access; panics when i is out of range.
    const value &element(const value &a, int64_t i);
    value &element(value &a, int64_t i);
    // Length of an array, slice or string.
    int64_t length(const value &v);

    // Go %v-style rendering.
    std::string to_string(const TypeContext &ctx, const value &v);

} // namespace gocore
