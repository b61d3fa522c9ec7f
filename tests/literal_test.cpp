#include <gtest/gtest.h>
#include "gocore/literal.hpp"
#include "gocore/map.hpp"
#include "test_support.hpp"

using namespace gocore;

namespace {

struct LiteralTest : ::testing::Test {
    TypeContext ctx;
    TypeId intT = ctx.get_base(BaseType::Int);
    TypeId strT = ctx.get_base(BaseType::String);
    TypeId tripleT = ctx.declare_struct("Triple", { FieldInfo{"A", intT}, FieldInfo{"B", intT}, FieldInfo{"C", intT} });
    TypeId pointT = ctx.declare_struct("Point", { FieldInfo{"X", intT}, FieldInfo{"Y", intT} });

    literal_entry pos(value v){ return literal_entry{std::nullopt, std::move(v)}; }
    literal_entry at(int64_t i, value v){ return literal_entry{make_int(ctx, i), std::move(v)}; }
    literal_entry named(const char* f, value v){ return literal_entry{make_string(ctx, f), std::move(v)}; }
    value num(int64_t v){ return make_int(ctx, v); }
    value point(int64_t x, int64_t y){ return build_struct(ctx, pointT, { pos(num(x)), pos(num(y)) }); }
};

} // namespace

TEST_F(LiteralTest, KeyedStructLeavesOtherFieldsZero){
    value t = build_struct(ctx, tripleT, { named("B", num(88)) });
    EXPECT_EQ(to_string(ctx, t), "{0 88 0}");
}

TEST_F(LiteralTest, PositionalStructFollowsDeclarationOrder){
    value t = build_struct(ctx, tripleT, { pos(num(8)), pos(num(9)), pos(num(10)) });
    EXPECT_EQ(to_string(ctx, t), "{8 9 10}");
    EXPECT_EQ(to_string(ctx, build_struct(ctx, tripleT, {})), "{0 0 0}");
}

TEST_F(LiteralTest, StructLiteralErrors){
    EXPECT_EQ(panic_code([&]{ build_struct(ctx, pointT, { pos(num(1)), pos(num(2)), pos(num(3)) }); }), codes::TooManyValues);
    EXPECT_EQ(panic_code([&]{ build_struct(ctx, pointT, { pos(num(1)) }); }), codes::TooFewValues);
    EXPECT_EQ(panic_code([&]{ build_struct(ctx, pointT, { named("X", num(1)), pos(num(2)) }); }), codes::MixedLiteral);
    EXPECT_EQ(panic_message([&]{ build_struct(ctx, pointT, { named("Z", num(1)) }); }),
              "unknown field Z in struct literal of type Point");
    EXPECT_EQ(panic_code([&]{ build_struct(ctx, pointT, { named("X", make_string(ctx, "no")) }); }), codes::CannotUse);
}

TEST_F(LiteralTest, DuplicateFieldPanics){
    EXPECT_EQ(panic_message([&]{ build_struct(ctx, pointT, { named("X", num(1)), named("X", num(2)) }); }),
              "duplicate field name X in struct literal");
    EXPECT_EQ(panic_code([&]{ build_struct(ctx, pointT, { named("Y", num(1)), named("X", num(2)), named("Y", num(3)) }); }),
              codes::DuplicateField);
}

TEST_F(LiteralTest, SparseCursorForward){
    value s = build_array(ctx, ctx.get_slice(pointT), { at(10, point(1, 1)), pos(point(2, 2)), at(1, point(3, 3)) });
    ASSERT_EQ(length(s), 12);
    EXPECT_EQ(to_string(ctx, element(s, 0)), "{0 0}");
    EXPECT_EQ(to_string(ctx, element(s, 1)), "{3 3}");
    EXPECT_EQ(to_string(ctx, element(s, 2)), "{0 0}");
    EXPECT_EQ(to_string(ctx, element(s, 10)), "{1 1}");
    EXPECT_EQ(to_string(ctx, element(s, 11)), "{2 2}");
}

TEST_F(LiteralTest, SparseCursorReordered){
    value s = build_array(ctx, ctx.get_slice(pointT), { at(1, point(1, 1)), pos(point(2, 2)), at(10, point(3, 3)) });
    ASSERT_EQ(length(s), 11);
    EXPECT_EQ(to_string(ctx, element(s, 0)), "{0 0}");
    EXPECT_EQ(to_string(ctx, element(s, 1)), "{1 1}");
    EXPECT_EQ(to_string(ctx, element(s, 2)), "{2 2}");
    EXPECT_EQ(to_string(ctx, element(s, 10)), "{3 3}");
}

TEST_F(LiteralTest, FixedArrays){
    TypeId arr4 = ctx.get_array(intT, 4);
    value a = build_array(ctx, arr4, { pos(num(1)), pos(num(2)) });
    EXPECT_EQ(a.type, arr4);
    EXPECT_EQ(to_string(ctx, a), "[1 2 0 0]");
    EXPECT_EQ(to_string(ctx, build_array(ctx, arr4, { at(3, num(7)), at(0, num(5)) })), "[5 0 0 7]");

    EXPECT_EQ(panic_message([&]{ build_array(ctx, arr4, { at(3, num(1)), pos(num(2)) }); }),
              "array index 4 out of range [0:4]");
    EXPECT_EQ(panic_code([&]{ build_array(ctx, arr4, { pos(num(1)), pos(num(2)), pos(num(3)), pos(num(4)), pos(num(5)) }); }),
              codes::IndexOutOfRange);
}

TEST_F(LiteralTest, InferredLengthArrayTakesLiteralLength){
    value a = build_array(ctx, ctx.get_array(intT, std::nullopt), { at(3, num(7)) });
    EXPECT_EQ(a.type, ctx.get_array(intT, 4));
    EXPECT_EQ(to_string(ctx, a), "[0 0 0 7]");
    EXPECT_EQ(length(build_array(ctx, ctx.get_slice(intT), {})), 0);
}

TEST_F(LiteralTest, NegativeOrNonIntegerIndexPanics){
    EXPECT_EQ(panic_code([&]{ build_array(ctx, ctx.get_slice(intT), { at(-1, num(1)) }); }), codes::NegativeIndex);
    EXPECT_EQ(panic_code([&]{ build_array(ctx, ctx.get_slice(intT), { literal_entry{make_string(ctx, "x"), num(1)} }); }),
              codes::NegativeIndex);
}

TEST_F(LiteralTest, HugeIndexPanicsInsteadOfGrowing){
    TypeId uint64T = ctx.get_base(BaseType::Uint64);
    TypeId sliceT = ctx.get_slice(intT);
    auto place_at = [&](value key){ return build_array(ctx, sliceT, { literal_entry{std::move(key), num(1)} }); };
    EXPECT_EQ(panic_code([&]{ place_at(make_uint(ctx, uint64T, UINT64_MAX)); }), codes::IndexOutOfRange);
    EXPECT_EQ(panic_message([&]{ place_at(make_uint(ctx, uint64T, UINT64_MAX)); }), "index 18446744073709551615 overflows int");
    EXPECT_EQ(panic_code([&]{ place_at(num(INT64_MAX)); }), codes::IndexOutOfRange);
    EXPECT_EQ(panic_code([&]{ place_at(num(static_cast<int64_t>(max_literal_length))); }), codes::IndexOutOfRange);
    EXPECT_EQ(panic_code([&]{
        build_array(ctx, ctx.get_array(intT, std::nullopt), { literal_entry{num(INT64_MAX), num(1)} });
    }), codes::IndexOutOfRange);

    // small unsigned keys place normally
    value last = place_at(make_uint(ctx, uint64T, 3));
    EXPECT_EQ(length(last), 4);
}

TEST_F(LiteralTest, RepeatedIndexOverwrites){
    value s = build_array(ctx, ctx.get_slice(intT), { at(0, num(1)), at(0, num(2)) });
    EXPECT_EQ(to_string(ctx, s), "[2]");
}

TEST_F(LiteralTest, ElementsAreConvertedToElementType){
    value s = build_array(ctx, ctx.get_slice(ctx.get_base(BaseType::Float32)), { pos(num(1)) });
    EXPECT_TRUE(element(s, 0).is_float32());
    value anys = build_array(ctx, ctx.get_slice(ctx.get_any()), { pos(num(1)), pos(make_string(ctx, "a")), pos(make_nil()) });
    EXPECT_EQ(to_string(ctx, anys), "[1 a <nil>]");
}

TEST_F(LiteralTest, SparseBuilderTracksCursor){
    SparseArrayBuilder b(ctx, intT, std::nullopt);
    b.place(make_int(ctx, 5), num(1));
    EXPECT_EQ(b.cursor(), 6u);
    EXPECT_EQ(b.length(), 6u);
    b.place(std::nullopt, num(2));
    b.place(make_int(ctx, 2), num(3));
    EXPECT_EQ(b.cursor(), 3u);
    EXPECT_EQ(b.length(), 7u);
    value out{ctx.get_slice(intT), b.finish()};
    EXPECT_EQ(to_string(ctx, out), "[0 0 3 0 0 1 2]");
}

TEST_F(LiteralTest, MapLiterals){
    TypeId mapT = ctx.get_map(strT, intT);
    value m = build_map(ctx, mapT, { literal_entry{make_string(ctx, "a"), num(1)}, literal_entry{make_string(ctx, "a"), num(2)} });
    EXPECT_EQ(map_len(m), 1);
    EXPECT_EQ(map_get(ctx, m, make_string(ctx, "a")).as_int().as_signed(), 2);

    value empty = build_map(ctx, mapT, {});
    EXPECT_FALSE(map_is_nil(empty));
    EXPECT_EQ(state_of(empty), map_state::empty);

    EXPECT_EQ(panic_code([&]{ build_map(ctx, mapT, { pos(num(1)) }); }), codes::MissingMapKey);
    EXPECT_EQ(build_literal(ctx, mapT, {}).type, mapT);
    EXPECT_EQ(panic_code([&]{ build_literal(ctx, intT, {}); }), codes::CannotUse);
}
