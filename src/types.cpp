#include "gocore/types.hpp"
#include <unordered_set>

namespace gocore {

unsigned base_width(BaseType b){
    switch(b){
        case BaseType::Int8: case BaseType::Uint8: return 8;
        case BaseType::Int16: case BaseType::Uint16: return 16;
        case BaseType::Int32: case BaseType::Uint32: case BaseType::Float32: return 32;
        case BaseType::Int: case BaseType::Int64: case BaseType::Uint: case BaseType::Uint64:
        case BaseType::Uintptr: case BaseType::Float64: return 64;
        case BaseType::Bool: return 1;
        case BaseType::UntypedNil: case BaseType::String: return 0;
    }
    return 0;
}

const char* base_name(BaseType b){
    switch(b){
        case BaseType::UntypedNil: return "nil";
        case BaseType::Bool: return "bool";
        case BaseType::Int: return "int";
        case BaseType::Int8: return "int8";
        case BaseType::Int16: return "int16";
        case BaseType::Int32: return "int32";
        case BaseType::Int64: return "int64";
        case BaseType::Uint: return "uint";
        case BaseType::Uint8: return "uint8";
        case BaseType::Uint16: return "uint16";
        case BaseType::Uint32: return "uint32";
        case BaseType::Uint64: return "uint64";
        case BaseType::Uintptr: return "uintptr";
        case BaseType::Float32: return "float32";
        case BaseType::Float64: return "float64";
        case BaseType::String: return "string";
    }
    return "<bad-base>";
}

static bool same_fields(const std::vector<FieldInfo>& a, const std::vector<FieldInfo>& b){
    if(a.size()!=b.size()) return false;
    for(size_t i=0;i<a.size(); ++i) if(a[i].name!=b[i].name || a[i].type!=b[i].type) return false;
    return true;
}

TypeId TypeContext::declare_struct(const std::string& name, std::vector<FieldInfo> fields){
    if(name.empty()) throw type_error("struct declaration missing name");
    std::unordered_set<std::string> seen;
    for(auto& f : fields){
        if(f.name.empty()) throw type_error("struct " + name + ": field missing name");
        if(!seen.insert(f.name).second) throw type_error("struct " + name + ": duplicate field " + f.name);
        if(f.type >= types_.size()) throw type_error("struct " + name + ": field " + f.name + " has unknown type");
    }
    if(auto it = struct_cache_.find(name); it != struct_cache_.end()){
        if(same_fields(types_[it->second].fields, fields)) return it->second;
        throw type_error("struct " + name + " redeclared with different fields");
    }
    Type t{};
    t.kind = Type::Kind::Struct;
    t.struct_name = name;
    t.fields = std::move(fields);
    TypeId id = add_type(std::move(t));
    struct_cache_[name] = id;
    return id;
}

bool TypeContext::is_comparable(TypeId id) const {
    const Type& t = at(id);
    switch(t.kind){
        case Type::Kind::Base: return t.base != BaseType::UntypedNil;
        case Type::Kind::Pointer:
        case Type::Kind::Any: return true;
        case Type::Kind::Struct:
            for(auto& f : t.fields) if(!is_comparable(f.type)) return false;
            return true;
        // arrays are deliberately not key-comparable (see DESIGN.md)
        case Type::Kind::Array:
        case Type::Kind::Slice:
        case Type::Kind::Map: return false;
    }
    return false;
}

int TypeContext::field_index(TypeId struct_id, const std::string& name) const {
    const Type& t = at(struct_id);
    if(t.kind != Type::Kind::Struct) return -1;
    for(size_t i=0;i<t.fields.size(); ++i) if(t.fields[i].name==name) return static_cast<int>(i);
    return -1;
}

std::string TypeContext::to_string(TypeId id) const {
    const Type& t = at(id);
    switch(t.kind){
        case Type::Kind::Base: return base_name(t.base);
        case Type::Kind::Pointer: return "*" + to_string(t.pointee);
        case Type::Kind::Struct: return t.struct_name;
        case Type::Kind::Array:
            if(!t.array_size) return "[...]" + to_string(t.elem);
            return "[" + std::to_string(*t.array_size) + "]" + to_string(t.elem);
        case Type::Kind::Slice: return "[]" + to_string(t.elem);
        case Type::Kind::Map: return "map[" + to_string(t.key) + "]" + to_string(t.elem);
        case Type::Kind::Any: return "any";
    }
    return "<bad-type>";
}

static const std::unordered_map<std::string, BaseType>& base_names(){
    static const std::unordered_map<std::string, BaseType> names = {
        {"bool", BaseType::Bool}, {"int", BaseType::Int}, {"int8", BaseType::Int8},
        {"int16", BaseType::Int16}, {"int32", BaseType::Int32}, {"rune", BaseType::Int32},
        {"int64", BaseType::Int64}, {"uint", BaseType::Uint}, {"uint8", BaseType::Uint8},
        {"byte", BaseType::Uint8}, {"uint16", BaseType::Uint16}, {"uint32", BaseType::Uint32},
        {"uint64", BaseType::Uint64}, {"uintptr", BaseType::Uintptr}, {"float32", BaseType::Float32},
        {"float64", BaseType::Float64}, {"string", BaseType::String}};
    return names;
}

TypeId TypeContext::parse_type(const edn::node_ptr& n){
    if(!n) throw edn::parse_error("null type form");
    if(auto* s = edn::as_symbol(*n)){
        auto& names = base_names();
        if(auto it = names.find(s->name); it != names.end()) return get_base(it->second);
        if(s->name == "any") return get_any();
        if(auto sid = find_struct(s->name)) return *sid;
        throw edn::parse_error("unknown type " + s->name + edn::where(*n));
    }
    auto* l = edn::as_list(*n);
    std::string head = edn::head_symbol(*n);
    if(!l || head.empty()) throw edn::parse_error("invalid type form " + edn::to_string(n) + edn::where(*n));
    if(head == "ptr"){
        // (ptr T) | (ptr :to T)
        if(l->elems.size()==2) return get_pointer(parse_type(l->elems[1]));
        if(auto to = edn::kwarg(*l, "to")) return get_pointer(parse_type(to));
        throw edn::parse_error("ptr expects a pointee type" + edn::where(*n));
    }
    if(head == "slice"){
        if(l->elems.size()!=2) throw edn::parse_error("slice expects an element type" + edn::where(*n));
        return get_slice(parse_type(l->elems[1]));
    }
    if(head == "map"){
        if(l->elems.size()!=3) throw edn::parse_error("map expects key and value types" + edn::where(*n));
        return get_map(parse_type(l->elems[1]), parse_type(l->elems[2]));
    }
    if(head == "array"){
        auto elem = edn::kwarg(*l, "elem");
        if(!elem) throw edn::parse_error("array missing :elem" + edn::where(*n));
        std::optional<uint64_t> size;
        if(auto sz = edn::kwarg(*l, "size")){
            if(!std::holds_alternative<int64_t>(sz->data) || std::get<int64_t>(sz->data) < 0)
                throw edn::parse_error("array :size must be a non-negative integer" + edn::where(*sz));
            size = static_cast<uint64_t>(std::get<int64_t>(sz->data));
        }
        return get_array(parse_type(elem), size);
    }
    if(head == "struct") return parse_struct_decl(n);
    throw edn::parse_error("unknown type form " + head + edn::where(*n));
}

TypeId TypeContext::parse_struct_decl(const edn::node_ptr& n){
    auto* l = n ? edn::as_list(*n) : nullptr;
    if(!l || edn::head_symbol(*n) != "struct") throw edn::parse_error("expected (struct :name N :fields [...])");
    auto nameNode = edn::kwarg(*l, "name");
    if(!nameNode || !edn::is_symbol(*nameNode)) throw edn::parse_error("struct missing :name" + edn::where(*n));
    auto fieldsNode = edn::kwarg(*l, "fields");
    auto* fv = fieldsNode ? edn::as_vector(*fieldsNode) : nullptr;
    if(!fv) throw edn::parse_error("struct missing :fields vector" + edn::where(*n));
    std::vector<FieldInfo> fields;
    for(auto& f : fv->elems){
        auto* fl = f ? edn::as_list(*f) : nullptr;
        if(!fl || edn::head_symbol(*f) != "field") throw edn::parse_error("malformed struct field, expected (field :name f :type T)" + (f ? edn::where(*f) : std::string()));
        auto fname = edn::kwarg(*fl, "name");
        auto ftype = edn::kwarg(*fl, "type");
        if(!fname || !edn::is_symbol(*fname)) throw edn::parse_error("struct field missing :name" + edn::where(*f));
        if(!ftype) throw edn::parse_error("struct field missing :type" + edn::where(*f));
        fields.push_back(FieldInfo{std::get<edn::symbol>(fname->data).name, parse_type(ftype)});
    }
    try {
        return declare_struct(std::get<edn::symbol>(nameNode->data).name, std::move(fields));
    } catch(const type_error& e){
        throw edn::parse_error(std::string(e.what()) + edn::where(*n));
    }
}

} // namespace gocore
