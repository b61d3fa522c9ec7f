// EDN literal descriptors -> runtime values.
//
//   (lit T [e ...])      composite literal; an element (at K v) carries key K
//   [e ...]              composite literal whose type is implied by the enclosing literal
//   (conv T c)           numeric conversion (exact for constants)
//   (box v)              wrap v into any
//   (make T)             empty initialized map
//   (new T)              pointer to a fresh zero-valued slot
//   (get m k) (len x) (nil? m) (eq a b) (deref p) (index a i) (field s f)
//   name                 a value bound earlier with (let name v)
#pragma once
#include <optional>
#include <string>
#include <unordered_map>
#include "gocore/edn.hpp"
#include "gocore/slots.hpp"
#include "gocore/value.hpp"

namespace llvm { class raw_ostream; }

namespace gocore
{

    class LiteralReader
    {
    public:
        LiteralReader(TypeContext &ctx, SlotArena &slots) : ctx_(ctx), slots_(slots) {}

        // Evaluates a descriptor. When expected is set, untyped constants are converted to it
        // and bare vectors become composite literals of that type.
        value read(const edn::node_ptr &form, std::optional<TypeId> expected = std::nullopt);

        void bind(const std::string &name, value v) { bindings_[name] = std::move(v); }
        const value *lookup(const std::string &name) const
        {
            auto it = bindings_.find(name);
            return it == bindings_.end() ? nullptr : &it->second;
        }

        TypeContext &context() { return ctx_; }
        SlotArena &slots() { return slots_; }

    private:
        value read_constant(const edn::node &n, std::optional<TypeId> expected);
        value read_composite(TypeId t, const edn::vector_t &elems);
        value read_form(const edn::node_ptr &form, const edn::list &l);

        TypeContext &ctx_;
        SlotArena &slots_;
        std::unordered_map<std::string, value> bindings_;
    };

    // Registers every (struct ...) declared in a (types ...) form.
    void declare_types(TypeContext &ctx, const edn::node_ptr &form);

    // Evaluates one literal descriptor with a private slot arena.
    value read_literal(TypeContext &ctx, const edn::node_ptr &form);

    // Runs (program (types ...) (let n v) (print v ...) (set m k v) (delete m k) ...),
    // writing one line per print. Returns the number of statements executed.
    // Throws edn::parse_error / type_error for malformed input and runtime_panic for fatal conditions.
    int run_program(TypeContext &ctx, const edn::node_ptr &program, llvm::raw_ostream &out);

} // namespace gocore
