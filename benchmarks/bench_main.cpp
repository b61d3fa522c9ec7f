#include "gocore/literal.hpp"
#include "gocore/map.hpp"
#include "gocore/panic.hpp"
#include "gocore/slots.hpp"
#include <chrono>
#include <functional>
#include <iostream>
#include <vector>
#include <cstdlib>

using Clock = std::chrono::steady_clock;
using namespace gocore;

struct RunResult { double ms_insert; double ms_lookup; int64_t hits; };

// Inserts n keys produced by make_key, then looks every one of them up again.
static RunResult bench_case(const char* name, TypeContext& ctx, TypeId mapT, int n,
                            const std::function<value(int)>& make_key){
    std::vector<value> keys;
    keys.reserve(n);
    for(int i=0;i<n;++i) keys.push_back(make_key(i));

    value m = make_map(ctx, mapT, static_cast<size_t>(n));
    auto t0 = Clock::now();
    for(int i=0;i<n;++i) map_set(ctx, m, keys[i], make_int(ctx, i));
    auto t1 = Clock::now();
    int64_t hits = 0;
    for(int i=0;i<n;++i) if(map_lookup(ctx, m, keys[i]).second) ++hits;
    auto t2 = Clock::now();
    if(hits != map_len(m))
        std::cerr << "[bench] case '" << name << "' lost entries: " << hits << " of " << map_len(m) << "\n";
    return { std::chrono::duration<double, std::milli>(t1 - t0).count(),
             std::chrono::duration<double, std::milli>(t2 - t1).count(), hits };
}

int main(int argc, char** argv){
    int n = argc > 1 ? std::atoi(argv[1]) : 100000;
    if(n <= 0) n = 100000;

    TypeContext ctx;
    TypeId intT = ctx.get_base(BaseType::Int);
    TypeId strT = ctx.get_base(BaseType::String);
    TypeId keyT = ctx.declare_struct("Key", { FieldInfo{"N", intT}, FieldInfo{"S", strT} });
    SlotArena slots;

    struct Case { const char* name; TypeId mapT; std::function<value(int)> key; };
    std::vector<Case> cases;
    cases.push_back({ "int_key", ctx.get_map(intT, intT), [&](int i){ return make_int(ctx, i); } });
    cases.push_back({ "compound_key", ctx.get_map(keyT, intT), [&](int i){
        return build_struct(ctx, keyT, { literal_entry{std::nullopt, make_int(ctx, i)},
                                         literal_entry{std::nullopt, make_string(ctx, std::to_string(i % 97))} });
    }});
    cases.push_back({ "pointer_key", ctx.get_map(ctx.get_pointer(intT), intT), [&](int i){
        return slots.allocate(ctx, make_int(ctx, i));
    }});
    cases.push_back({ "any_key", ctx.get_map(ctx.get_any(), intT), [&](int i){
        return i % 2 ? box(ctx, make_int(ctx, i)) : box(ctx, make_string(ctx, std::to_string(i)));
    }});

    std::cout << "name,n,ms_insert,ms_lookup\n";
    try {
        for(const auto &c : cases){
            auto r = bench_case(c.name, ctx, c.mapT, n, c.key);
            std::cout << c.name << "," << n << "," << r.ms_insert << "," << r.ms_lookup << "\n";
        }
    } catch(const runtime_panic& p){
        std::cerr << "[bench] panic: " << p.what() << " [" << p.code << "]\n";
        return 2;
    }
    return 0;
}
