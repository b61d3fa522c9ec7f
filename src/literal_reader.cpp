#include "gocore/literal_reader.hpp"
#include "gocore/equal.hpp"
#include "gocore/literal.hpp"
#include "gocore/map.hpp"
#include "gocore/numeric.hpp"
#include "gocore/panic.hpp"

#include <llvm/Support/raw_ostream.h>
#include <cstdio>

namespace gocore {

using edn::where;

// Exact source spelling of a numeric constant node, if it is one.
static std::optional<std::string> constant_text(const edn::node& n){
    if(std::holds_alternative<int64_t>(n.data)) return std::to_string(std::get<int64_t>(n.data));
    if(std::holds_alternative<edn::big_int>(n.data)) return std::get<edn::big_int>(n.data).digits;
    if(std::holds_alternative<double>(n.data)){
        auto it = n.metadata.find("text");
        if(it != n.metadata.end() && it->second && std::holds_alternative<std::string>(it->second->data))
            return std::get<std::string>(it->second->data);
        char buf[32];
        std::snprintf(buf, sizeof(buf), "%.17g", std::get<double>(n.data));
        return std::string(buf);
    }
    return std::nullopt;
}

static const edn::list& expect_form(const edn::node_ptr& form, size_t min_args, size_t max_args){
    const edn::list* l = edn::as_list(*form);
    size_t args = l->elems.size() - 1;
    if(args < min_args || args > max_args)
        throw edn::parse_error("wrong number of arguments to " + edn::head_symbol(*form) + where(*form));
    return *l;
}

value LiteralReader::read_constant(const edn::node& n, std::optional<TypeId> expected){
    bool numericTarget = expected && ctx_.is_numeric(*expected);
    if(std::holds_alternative<std::monostate>(n.data)) return make_nil();
    if(std::holds_alternative<bool>(n.data)) return make_bool(ctx_, std::get<bool>(n.data));
    if(std::holds_alternative<std::string>(n.data)) return make_string(ctx_, std::get<std::string>(n.data));
    if(auto text = constant_text(n)){
        if(numericTarget) return convert_constant(ctx_, *text, *expected);
        if(std::holds_alternative<int64_t>(n.data)) return make_int(ctx_, std::get<int64_t>(n.data));
        if(std::holds_alternative<double>(n.data)) return make_float64(ctx_, std::get<double>(n.data));
        // untyped constant too large for the default int type
        return convert_constant(ctx_, *text, ctx_.get_base(BaseType::Int));
    }
    throw edn::parse_error("unexpected " + edn::to_string(n) + " in literal" + where(n));
}

value LiteralReader::read_composite(TypeId t, const edn::vector_t& elems){
    Type::Kind kind = ctx_.at(t).kind;
    if(kind != Type::Kind::Struct && kind != Type::Kind::Array && kind != Type::Kind::Slice && kind != Type::Kind::Map)
        throw edn::parse_error("invalid composite literal type " + ctx_.to_string(t));
    std::vector<FieldInfo> fields = ctx_.at(t).fields;
    TypeId keyT = ctx_.at(t).key;
    TypeId elemT = ctx_.at(t).elem;

    std::vector<literal_entry> entries;
    entries.reserve(elems.elems.size());
    for(size_t i = 0; i < elems.elems.size(); ++i){
        const edn::node_ptr& e = elems.elems[i];
        if(!e) throw edn::parse_error("null literal element");
        literal_entry entry;
        edn::node_ptr vnode = e;
        std::optional<TypeId> want;
        if(edn::head_symbol(*e) == "at"){
            const edn::list& l = expect_form(e, 2, 2);
            const edn::node_ptr& knode = l.elems[1];
            vnode = l.elems[2];
            if(kind == Type::Kind::Struct){
                const edn::symbol* s = edn::as_symbol(*knode);
                if(!s) throw edn::parse_error("struct literal key must be a field name" + where(*knode));
                entry.key = make_string(ctx_, s->name);
                int idx = ctx_.field_index(t, s->name);
                if(idx >= 0) want = fields[idx].type;
            } else if(kind == Type::Kind::Map){
                entry.key = read(knode, keyT);
            } else {
                entry.key = read(knode, ctx_.get_base(BaseType::Int));
            }
        }
        if(kind == Type::Kind::Struct){
            if(!entry.key && i < fields.size()) want = fields[i].type;
        } else {
            want = elemT;
        }
        entry.element = read(vnode, want);
        entries.push_back(std::move(entry));
    }
    return build_literal(ctx_, t, entries);
}

value LiteralReader::read_form(const edn::node_ptr& form, const edn::list& l){
    std::string head = edn::head_symbol(*form);
    if(head == "lit"){
        expect_form(form, 2, 2);
        TypeId t = ctx_.parse_type(l.elems[1]);
        const edn::vector_t* vec = edn::as_vector(*l.elems[2]);
        if(!vec) throw edn::parse_error("lit expects a vector of elements" + where(*form));
        return read_composite(t, *vec);
    }
    if(head == "conv"){
        expect_form(form, 2, 2);
        TypeId t = ctx_.parse_type(l.elems[1]);
        if(auto text = constant_text(*l.elems[2])) return convert_constant(ctx_, *text, t);
        return convert(ctx_, read(l.elems[2]), t);
    }
    if(head == "box"){
        expect_form(form, 1, 1);
        return box(ctx_, read(l.elems[1]));
    }
    if(head == "make"){
        expect_form(form, 1, 2);
        TypeId t = ctx_.parse_type(l.elems[1]);
        size_t hint = 0;
        if(l.elems.size() == 3){
            value h = read(l.elems[2], ctx_.get_base(BaseType::Int));
            if(!h.is_int() || h.as_int().is_negative()) throw edn::parse_error("make hint must be a non-negative integer" + where(*form));
            hint = static_cast<size_t>(h.as_int().as_signed());
        }
        return make_map(ctx_, t, hint);
    }
    if(head == "new"){
        expect_form(form, 1, 2);
        TypeId t = ctx_.parse_type(l.elems[1]);
        if(l.elems.size() == 3) return slots_.allocate(ctx_, coerce(ctx_, read(l.elems[2], t), t));
        return slots_.allocate_zero(ctx_, t);
    }
    if(head == "get"){
        expect_form(form, 2, 2);
        value m = read(l.elems[1]);
        std::optional<TypeId> keyT;
        if(ctx_.at(m.type).kind == Type::Kind::Map) keyT = ctx_.at(m.type).key;
        return map_get(ctx_, m, read(l.elems[2], keyT));
    }
    if(head == "len"){
        expect_form(form, 1, 1);
        return make_int(ctx_, length(read(l.elems[1])));
    }
    if(head == "nil?"){
        expect_form(form, 1, 1);
        value v = read(l.elems[1]);
        bool nil = v.is_untyped_nil() || map_is_nil(v) || (v.is_pointer() && v.as_pointer().is_nil()) ||
                   (v.is_any() && v.as_any().is_nil());
        return make_bool(ctx_, nil);
    }
    if(head == "eq"){
        expect_form(form, 2, 2);
        value a = read(l.elems[1]);
        value b = coerce(ctx_, read(l.elems[2], a.type), a.type);
        return make_bool(ctx_, equal(a, b));
    }
    if(head == "deref"){
        expect_form(form, 1, 1);
        return slots_.load(read(l.elems[1]));
    }
    if(head == "index"){
        expect_form(form, 2, 2);
        value a = read(l.elems[1]);
        value i = read(l.elems[2], ctx_.get_base(BaseType::Int));
        if(!i.is_int()) throw edn::parse_error("index must be an integer" + where(*form));
        return element(a, i.as_int().as_signed());
    }
    if(head == "field"){
        expect_form(form, 2, 2);
        value s = read(l.elems[1]);
        const edn::symbol* name = edn::as_symbol(*l.elems[2]);
        if(!name) throw edn::parse_error("field expects a field name" + where(*form));
        return field(ctx_, s, name->name);
    }
    throw edn::parse_error("unknown literal form " + edn::to_string(form) + where(*form));
}

value LiteralReader::read(const edn::node_ptr& form, std::optional<TypeId> expected){
    if(!form) throw edn::parse_error("null literal form");
    const edn::node& n = *form;
    if(const edn::symbol* s = edn::as_symbol(n)){
        if(const value* v = lookup(s->name)) return *v;
        throw edn::parse_error("undefined: " + s->name + where(n));
    }
    if(const edn::vector_t* vec = edn::as_vector(n)){
        if(!expected) throw edn::parse_error("missing type in composite literal" + where(n));
        return read_composite(*expected, *vec);
    }
    if(const edn::list* l = edn::as_list(n)){
        if(edn::head_symbol(n).empty()) throw edn::parse_error("expected a form head" + where(n));
        return read_form(form, *l);
    }
    return read_constant(n, expected);
}

void declare_types(TypeContext& ctx, const edn::node_ptr& form){
    if(!form || edn::head_symbol(*form) != "types")
        throw edn::parse_error("expected (types ...)");
    const edn::list& l = *edn::as_list(*form);
    for(size_t i = 1; i < l.elems.size(); ++i){
        const edn::node_ptr& d = l.elems[i];
        if(!d || edn::head_symbol(*d) != "struct")
            throw edn::parse_error("expected (struct ...) in types" + (d ? where(*d) : std::string()));
        ctx.parse_struct_decl(d);
    }
}

value read_literal(TypeContext& ctx, const edn::node_ptr& form){
    SlotArena arena;
    LiteralReader reader(ctx, arena);
    return reader.read(form);
}

int run_program(TypeContext& ctx, const edn::node_ptr& program, llvm::raw_ostream& out){
    if(!program || edn::head_symbol(*program) != "program")
        throw edn::parse_error("expected (program ...)");
    SlotArena arena;
    LiteralReader reader(ctx, arena);
    const edn::list& body = *edn::as_list(*program);
    int executed = 0;
    for(size_t i = 1; i < body.elems.size(); ++i){
        const edn::node_ptr& stmt = body.elems[i];
        std::string head = stmt ? edn::head_symbol(*stmt) : std::string();
        if(head == "types"){
            declare_types(ctx, stmt);
        } else if(head == "let"){
            const edn::list& l = expect_form(stmt, 2, 2);
            const edn::symbol* name = edn::as_symbol(*l.elems[1]);
            if(!name) throw edn::parse_error("let expects a name" + where(*stmt));
            reader.bind(name->name, reader.read(l.elems[2]));
        } else if(head == "var"){
            const edn::list& l = expect_form(stmt, 2, 3);
            const edn::symbol* name = edn::as_symbol(*l.elems[1]);
            if(!name) throw edn::parse_error("var expects a name" + where(*stmt));
            TypeId t = ctx.parse_type(l.elems[2]);
            value v = l.elems.size() == 4 ? coerce(ctx, reader.read(l.elems[3], t), t) : zero_value(ctx, t);
            reader.bind(name->name, std::move(v));
        } else if(head == "print"){
            const edn::list& l = *edn::as_list(*stmt);
            std::string line;
            for(size_t k = 1; k < l.elems.size(); ++k){
                if(k > 1) line += ' ';
                line += to_string(ctx, reader.read(l.elems[k]));
            }
            out << line << "\n";
        } else if(head == "set" || head == "delete"){
            const edn::list& l = head == "set" ? expect_form(stmt, 3, 3) : expect_form(stmt, 2, 2);
            value m = reader.read(l.elems[1]);
            std::optional<TypeId> keyT, elemT;
            if(ctx.at(m.type).kind == Type::Kind::Map){
                keyT = ctx.at(m.type).key;
                elemT = ctx.at(m.type).elem;
            }
            value k = reader.read(l.elems[2], keyT);
            if(head == "set") map_set(ctx, m, k, reader.read(l.elems[3], elemT));
            else map_delete(ctx, m, k);
        } else if(head == "store"){
            const edn::list& l = expect_form(stmt, 2, 2);
            value p = reader.read(l.elems[1]);
            std::optional<TypeId> pointee;
            if(ctx.at(p.type).kind == Type::Kind::Pointer) pointee = ctx.at(p.type).pointee;
            value v = reader.read(l.elems[2], pointee);
            arena.store(p, pointee ? coerce(ctx, v, *pointee) : v);
        } else {
            throw edn::parse_error("unknown statement " + edn::to_string(stmt) + (stmt ? where(*stmt) : std::string()));
        }
        ++executed;
    }
    return executed;
}

} // namespace gocore
