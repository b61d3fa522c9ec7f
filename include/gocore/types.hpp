// Interned type descriptors for runtime values.
#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include <unordered_map>
#include <map>
#include <optional>
#include <tuple>
#include <stdexcept>
#include "gocore/edn.hpp"

namespace gocore
{

    using TypeId = uint32_t;

    // Type of the bare nil literal; always id 0.
    constexpr TypeId kUntypedNil = 0;

    struct type_error : std::runtime_error
    {
        using std::runtime_error::runtime_error;
    };

    enum class BaseType
    {
        UntypedNil,
        Bool,
        Int,
        Int8,
        Int16,
        Int32,
        Int64,
        Uint,
        Uint8,
        Uint16,
        Uint32,
        Uint64,
        Uintptr,
        Float32,
        Float64,
        String
    };

    inline bool is_integer_base(BaseType b) { return b >= BaseType::Int && b <= BaseType::Uintptr; }
    inline bool is_signed_base(BaseType b) { return b >= BaseType::Int && b <= BaseType::Int64; }
    inline bool is_float_base(BaseType b) { return b == BaseType::Float32 || b == BaseType::Float64; }
    unsigned base_width(BaseType b);
    const char *base_name(BaseType b);

    struct FieldInfo
    {
        std::string name;
        TypeId type;
    };

    struct Type
    {
        enum class Kind
        {
            Base,
            Pointer,
            Struct,
            Array,
            Slice,
            Map,
            Any
        } kind;
        BaseType base{};                  // Base
        TypeId pointee{0};                // Pointer
        std::string struct_name;          // Struct
        std::vector<FieldInfo> fields;    // Struct (declaration order)
        TypeId elem{0};                   // Array, Slice, Map value
        std::optional<uint64_t> array_size; // Array; empty for [...]T
        TypeId key{0};                    // Map
    };

    class TypeContext
    {
    public:
        TypeContext()
        { // seed base types; UntypedNil must land on id 0
            get_base(BaseType::UntypedNil);
            get_base(BaseType::Bool);
            get_base(BaseType::Int);
            get_base(BaseType::Int8);
            get_base(BaseType::Int16);
            get_base(BaseType::Int32);
            get_base(BaseType::Int64);
            get_base(BaseType::Uint);
            get_base(BaseType::Uint8);
            get_base(BaseType::Uint16);
            get_base(BaseType::Uint32);
            get_base(BaseType::Uint64);
            get_base(BaseType::Uintptr);
            get_base(BaseType::Float32);
            get_base(BaseType::Float64);
            get_base(BaseType::String);
            get_any();
        }

        TypeId get_base(BaseType b)
        {
            auto key = static_cast<int>(b);
            auto it = base_index_.find(key);
            if (it != base_index_.end())
                return it->second;
            Type t{};
            t.kind = Type::Kind::Base;
            t.base = b;
            TypeId id = add_type(std::move(t));
            base_index_[key] = id;
            return id;
        }
        TypeId get_pointer(TypeId to)
        {
            auto it = ptr_cache_.find(to);
            if (it != ptr_cache_.end())
                return it->second;
            Type t{};
            t.kind = Type::Kind::Pointer;
            t.pointee = to;
            TypeId id = add_type(std::move(t));
            ptr_cache_[to] = id;
            return id;
        }
        // Fixed-length array; pass std::nullopt for an inferred-length [...]T.
        TypeId get_array(TypeId elem, std::optional<uint64_t> size)
        {
            auto key = std::make_tuple(elem, size.has_value(), size.value_or(0));
            auto it = array_cache_.find(key);
            if (it != array_cache_.end())
                return it->second;
            Type t{};
            t.kind = Type::Kind::Array;
            t.elem = elem;
            t.array_size = size;
            TypeId id = add_type(std::move(t));
            array_cache_[key] = id;
            return id;
        }
        TypeId get_slice(TypeId elem)
        {
            auto it = slice_cache_.find(elem);
            if (it != slice_cache_.end())
                return it->second;
            Type t{};
            t.kind = Type::Kind::Slice;
            t.elem = elem;
            TypeId id = add_type(std::move(t));
            slice_cache_[elem] = id;
            return id;
        }
        TypeId get_map(TypeId key, TypeId value)
        {
            auto k = std::make_pair(key, value);
            auto it = map_cache_.find(k);
            if (it != map_cache_.end())
                return it->second;
            Type t{};
            t.kind = Type::Kind::Map;
            t.key = key;
            t.elem = value;
            TypeId id = add_type(std::move(t));
            map_cache_[k] = id;
            return id;
        }
        TypeId get_any()
        {
            if (any_id_)
                return *any_id_;
            Type t{};
            t.kind = Type::Kind::Any;
            any_id_ = add_type(std::move(t));
            return *any_id_;
        }

        // Registers a named struct. Re-declaring an identical field list returns the existing id.
        TypeId declare_struct(const std::string &name, std::vector<FieldInfo> fields);
        std::optional<TypeId> find_struct(const std::string &name) const
        {
            auto it = struct_cache_.find(name);
            if (it == struct_cache_.end())
                return std::nullopt;
            return it->second;
        }

        const Type &at(TypeId id) const { return types_.at(id); }
        size_t size() const { return types_.size(); }

        bool is_base(TypeId id, BaseType b) const { const Type &t = at(id); return t.kind == Type::Kind::Base && t.base == b; }
        bool is_integer(TypeId id) const { const Type &t = at(id); return t.kind == Type::Kind::Base && is_integer_base(t.base); }
        bool is_float(TypeId id) const { const Type &t = at(id); return t.kind == Type::Kind::Base && is_float_base(t.base); }
        bool is_numeric(TypeId id) const { return is_integer(id) || is_float(id); }
        bool is_any(TypeId id) const { return at(id).kind == Type::Kind::Any; }
        // Types whose zero value is nil and which accept the untyped nil literal.
        bool is_nilable(TypeId id) const
        {
            auto k = at(id).kind;
            return k == Type::Kind::Pointer || k == Type::Kind::Map || k == Type::Kind::Slice || k == Type::Kind::Any;
        }
        // Whether values of the type may be used as map keys.
        bool is_comparable(TypeId id) const;

        // Index of a struct field by name, or -1.
        int field_index(TypeId struct_id, const std::string &name) const;

        std::string to_string(TypeId id) const;

        // Parse an EDN type form -> TypeId
        TypeId parse_type(const edn::node_ptr &n);
        // Register a (struct :name N :fields [ (field :name f :type T) ... ]) form.
        TypeId parse_struct_decl(const edn::node_ptr &n);

    private:
        TypeId add_type(Type t)
        {
            types_.push_back(std::move(t));
            return static_cast<TypeId>(types_.size() - 1);
        }
        std::vector<Type> types_;
        std::unordered_map<int, TypeId> base_index_;
        std::unordered_map<TypeId, TypeId> ptr_cache_;
        std::unordered_map<TypeId, TypeId> slice_cache_;
        std::unordered_map<std::string, TypeId> struct_cache_;
        std::map<std::tuple<TypeId, bool, uint64_t>, TypeId> array_cache_;
        std::map<std::pair<TypeId, TypeId>, TypeId> map_cache_;
        std::optional<TypeId> any_id_;
    };

} // namespace gocore
