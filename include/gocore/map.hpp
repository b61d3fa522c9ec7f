// Hash map with value-semantics keys and a fixed zero value for absent keys.
#pragma once
#include <cstddef>
#include <functional>
#include <unordered_map>
#include <utility>
#include <vector>
#include "gocore/equal.hpp"
#include "gocore/value.hpp"

namespace gocore
{

    class MapTable
    {
    public:
        MapTable(TypeId map_type, TypeId key_type, TypeId elem_type, value zero, size_t hint = 0)
            : map_type_(map_type), key_type_(key_type), elem_type_(elem_type), zero_(std::move(zero))
        {
            if (hint)
                entries_.reserve(hint);
        }

        TypeId map_type() const { return map_type_; }
        TypeId key_type() const { return key_type_; }
        TypeId elem_type() const { return elem_type_; }
        // Returned by lookups of absent keys.
        const value &zero() const { return zero_; }

        const value *find(const value &key) const
        {
            auto it = entries_.find(key);
            return it == entries_.end() ? nullptr : &it->second;
        }
        void insert_or_assign(value key, value elem) { entries_.insert_or_assign(std::move(key), std::move(elem)); }
        bool erase(const value &key) { return entries_.erase(key) > 0; }
        size_t size() const { return entries_.size(); }

        template <class F>
        void for_each(F &&f) const
        {
            for (const auto &kv : entries_)
                f(kv.first, kv.second);
        }

    private:
        struct KeyHash
        {
            std::size_t operator()(const value &v) const { return hash(v); }
        };
        struct KeyEqual
        {
            bool operator()(const value &a, const value &b) const { return equal(a, b); }
        };

        TypeId map_type_;
        TypeId key_type_;
        TypeId elem_type_;
        value zero_;
        std::unordered_map<value, value, KeyHash, KeyEqual> entries_;
    };

    // Size hints above this are treated as 0.
    inline constexpr size_t max_map_hint = size_t{1} << 24;

    // make(map[K]V, hint). Panics (E2016) when K is not comparable.
    value make_map(TypeContext &ctx, TypeId map_type, size_t hint = 0);

    // m[k]: the stored element, or the element type's zero value when absent or when m is nil.
    value map_get(TypeContext &ctx, const value &m, const value &key);
    // v, ok := m[k]
    std::pair<value, bool> map_lookup(TypeContext &ctx, const value &m, const value &key);
    // m[k] = v. Panics (E2001) on a nil map.
    void map_set(TypeContext &ctx, const value &m, const value &key, const value &elem);
    // delete(m, k). No-op on a nil map or an absent key.
    void map_delete(TypeContext &ctx, const value &m, const value &key);
    // len(m); 0 for a nil map.
    int64_t map_len(const value &m);
    bool map_is_nil(const value &m);
    map_state state_of(const value &m);
    // Visits entries in unspecified order.
    void map_for_each(const value &m, const std::function<void(const value &, const value &)> &fn);

} // namespace gocore
