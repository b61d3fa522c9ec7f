// Composite literal construction: structs, arrays/slices and maps from ordered (key?, value) entries.
#pragma once
#include <cstdint>
#include <optional>
#include <vector>
#include "gocore/value.hpp"

namespace gocore
{

    // One element of a composite literal. key is a field name (string) for structs,
    // an integer index for arrays and slices, and any key value for maps.
    struct literal_entry
    {
        std::optional<value> key;
        value element;
    };

    // Upper bound on the length of a []T or [...]T literal; a larger index panics (E2006).
    inline constexpr uint64_t max_literal_length = uint64_t{1} << 28;

    // Places array literal elements with Go's cursor rule: an explicit index moves the
    // cursor, every element lands at the cursor, the cursor then advances by one.
    // Positions never written hold the element zero value.
    class SparseArrayBuilder
    {
    public:
        // fixed_length is empty for [...]T and []T, whose length comes from the literal.
        SparseArrayBuilder(TypeContext &ctx, TypeId elem, std::optional<uint64_t> fixed_length);

        void place(const std::optional<value> &key, const value &element);

        uint64_t cursor() const { return cursor_; }
        // One past the highest position written so far (or the fixed length).
        uint64_t length() const;

        array_value finish();

    private:
        uint64_t index_of(const value &key) const;
        void grow_to(uint64_t n);

        TypeContext &ctx_;
        TypeId elem_;
        std::optional<uint64_t> fixed_;
        value zero_;
        uint64_t cursor_ = 0;
        std::vector<value> elems_;
    };

    // T{...} for a struct type: fully keyed or fully positional.
    value build_struct(TypeContext &ctx, TypeId struct_type, const std::vector<literal_entry> &entries);
    // T{...} for [N]T, [...]T and []T. A [...]T literal yields a value of type [len]T.
    value build_array(TypeContext &ctx, TypeId array_type, const std::vector<literal_entry> &entries);
    // map[K]V{...}; every entry needs a key, later duplicates overwrite. Never nil.
    value build_map(TypeContext &ctx, TypeId map_type, const std::vector<literal_entry> &entries);
    // Dispatches on the kind of t.
    value build_literal(TypeContext &ctx, TypeId t, const std::vector<literal_entry> &entries);

} // namespace gocore
