// Tests for the EDN reader used by literal descriptors
#include <cassert>
#include <iostream>
#include <string>
#include "gocore/edn.hpp"

using namespace gocore::edn;

static bool throws_parse_error(const char* src){
    try { (void)parse(src); } catch(const parse_error&){ return true; }
    return false;
}

void run_edn_reader_tests(){
    auto v = parse("[1 2 3 :kw true false nil]");
    auto* vec = as_vector(*v);
    assert(vec && vec->elems.size()==7);
    assert(std::get<int64_t>(vec->elems[0]->data)==1);
    assert(std::get<keyword>(vec->elems[3]->data).name=="kw");
    assert(std::get<bool>(vec->elems[4]->data)==true);
    assert(std::holds_alternative<std::monostate>(vec->elems[6]->data));
    (void)vec;

    // comments and commas are whitespace
    auto l = parse("; leading comment\n(lit T [1, 2, 3]) ; trailing");
    assert(head_symbol(*l)=="lit");
    assert(as_vector(*as_list(*l)->elems[2])->elems.size()==3);

    // integers beyond 64 bits keep their exact digits
    auto big = parse("20000000000000000000");
    assert(std::holds_alternative<big_int>(big->data));
    assert(std::get<big_int>(big->data).digits=="20000000000000000000");
    auto negBig = parse("-99999999999999999999");
    assert(std::get<big_int>(negBig->data).digits=="-99999999999999999999");

    // floats remember their spelling
    auto f = parse("1.10");
    assert(std::holds_alternative<double>(f->data));
    auto text = f->metadata.find("text");
    assert(text!=f->metadata.end() && std::get<std::string>(text->second->data)=="1.10");
    (void)text;

    // signs only start numbers when a digit follows
    auto neg = parse("-3");
    assert(std::get<int64_t>(neg->data)==-3);
    auto dash = parse("-");
    assert(as_symbol(*dash) && as_symbol(*dash)->name=="-");
    auto pred = parse("nil?");
    assert(as_symbol(*pred)->name=="nil?");

    // positions and keyword arguments
    auto form = parse("\n  (struct :name P :fields [])");
    assert(line(*form)==2 && col(*form)==3);
    assert(where(*form)==" (line 2:3)");
    auto name = kwarg(*as_list(*form), "name");
    assert(name && as_symbol(*name)->name=="P");
    assert(kwarg(*as_list(*form), "missing")==nullptr);
    (void)name;

    auto s = parse("\"a\\\"b\\n\"");
    assert(std::get<std::string>(s->data)=="a\"b\n");

    assert(throws_parse_error("(1 2"));
    assert(throws_parse_error("\"open"));
    assert(throws_parse_error(")"));
    assert(throws_parse_error(""));

    std::cout << "EDN reader tests passed\n";
}
