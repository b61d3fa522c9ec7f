#include <gtest/gtest.h>
#include "gocore/map.hpp"
#include "gocore/value.hpp"
#include "test_support.hpp"

using namespace gocore;

namespace {

struct ValueTest : ::testing::Test {
    TypeContext ctx;
    TypeId intT = ctx.get_base(BaseType::Int);
    TypeId strT = ctx.get_base(BaseType::String);
    TypeId pointT = ctx.declare_struct("Point", { FieldInfo{"X", intT}, FieldInfo{"Y", intT} });
};

} // namespace

TEST_F(ValueTest, ZeroValuesPerKind){
    value i8 = zero_value(ctx, ctx.get_base(BaseType::Int8));
    ASSERT_TRUE(i8.is_int());
    EXPECT_EQ(i8.as_int().width, 8);
    EXPECT_TRUE(i8.as_int().is_signed);
    EXPECT_EQ(i8.as_int().bits, 0u);
    EXPECT_FALSE(zero_value(ctx, ctx.get_base(BaseType::Uint16)).as_int().is_signed);
    EXPECT_EQ(zero_value(ctx, ctx.get_base(BaseType::Float32)).as_float32(), 0.0f);
    EXPECT_EQ(zero_value(ctx, strT).as_string(), "");
    EXPECT_FALSE(zero_value(ctx, ctx.get_base(BaseType::Bool)).as_bool());
    EXPECT_TRUE(zero_value(ctx, ctx.get_pointer(intT)).as_pointer().is_nil());
    EXPECT_TRUE(zero_value(ctx, ctx.get_any()).as_any().is_nil());
    EXPECT_TRUE(map_is_nil(zero_value(ctx, ctx.get_map(strT, intT))));
    EXPECT_EQ(length(zero_value(ctx, ctx.get_slice(intT))), 0);

    value arr = zero_value(ctx, ctx.get_array(pointT, 3));
    EXPECT_EQ(length(arr), 3);
    EXPECT_EQ(to_string(ctx, arr), "[{0 0} {0 0} {0 0}]");

    TypeId outer = ctx.declare_struct("Outer", { FieldInfo{"P", pointT}, FieldInfo{"Name", strT} });
    EXPECT_EQ(to_string(ctx, zero_value(ctx, outer)), "{{0 0} }");
}

TEST_F(ValueTest, InferredLengthArrayHasNoZeroValue){
    EXPECT_THROW(zero_value(ctx, ctx.get_array(intT, std::nullopt)), type_error);
}

TEST_F(ValueTest, IntegersTruncateToWidth){
    TypeId i8 = ctx.get_base(BaseType::Int8);
    TypeId u8 = ctx.get_base(BaseType::Uint8);
    EXPECT_EQ(make_int(ctx, i8, 300).as_int().as_signed(), 44);
    EXPECT_EQ(make_int(ctx, i8, -1).as_int().bits, 0xffu);
    EXPECT_EQ(make_int(ctx, i8, -1).as_int().as_signed(), -1);
    EXPECT_EQ(make_uint(ctx, u8, 256).as_int().bits, 0u);
    EXPECT_TRUE(make_int(ctx, -5).as_int().is_negative());
    EXPECT_FALSE(make_int(ctx, ctx.get_base(BaseType::Uint64), -5).as_int().is_negative());
    EXPECT_THROW(make_int(ctx, strT, 1), type_error);
}

TEST_F(ValueTest, BoxCarriesDynamicType){
    value one = make_int(ctx, 1);
    value boxed = box(ctx, one);
    ASSERT_TRUE(boxed.is_any());
    EXPECT_EQ(boxed.type, ctx.get_any());
    EXPECT_EQ(boxed.as_any().dynamic_type, intT);
    ASSERT_NE(unbox(boxed), nullptr);
    EXPECT_EQ(unbox(boxed)->as_int().as_signed(), 1);

    value twice = box(ctx, boxed);
    EXPECT_EQ(twice.as_any().dynamic_type, intT);

    value nilAny = box(ctx, make_nil());
    EXPECT_TRUE(nilAny.as_any().is_nil());
    EXPECT_EQ(unbox(nilAny), nullptr);
}

TEST_F(ValueTest, FieldAndElementAccess){
    value p = zero_value(ctx, pointT);
    field(ctx, p, "Y") = make_int(ctx, 7);
    EXPECT_EQ(field(ctx, p, "Y").as_int().as_signed(), 7);
    EXPECT_EQ(to_string(ctx, p), "{0 7}");
    EXPECT_EQ(panic_code([&]{ (void)field(ctx, p, "Z"); }), codes::UnknownField);

    value arr = zero_value(ctx, ctx.get_array(intT, 3));
    element(arr, 2) = make_int(ctx, 9);
    EXPECT_EQ(to_string(ctx, arr), "[0 0 9]");
    EXPECT_EQ(panic_message([&]{ (void)element(arr, 3); }), "runtime error: index out of range [3] with length 3");
    EXPECT_EQ(panic_code([&]{ (void)element(arr, -1); }), codes::IndexOutOfRange);
    EXPECT_EQ(length(make_string(ctx, "abc")), 3);
}

TEST_F(ValueTest, RendersLikePercentV){
    EXPECT_EQ(to_string(ctx, make_nil()), "<nil>");
    EXPECT_EQ(to_string(ctx, make_bool(ctx, true)), "true");
    EXPECT_EQ(to_string(ctx, make_int(ctx, ctx.get_base(BaseType::Uint64), -1)), "18446744073709551615");
    EXPECT_EQ(to_string(ctx, make_float64(ctx, 1.1)), "1.1");
    EXPECT_EQ(to_string(ctx, make_float64(ctx, 0.5)), "0.5");
    EXPECT_EQ(to_string(ctx, make_float64(ctx, 123.456)), "123.456");
    EXPECT_EQ(to_string(ctx, make_float64(ctx, 100000.0)), "100000");
    EXPECT_EQ(to_string(ctx, make_float64(ctx, 1e6)), "1e+06");
    EXPECT_EQ(to_string(ctx, make_float64(ctx, 1e-5)), "1e-05");
    EXPECT_EQ(to_string(ctx, make_float64(ctx, -0.0)), "-0");
    EXPECT_EQ(to_string(ctx, make_float32(ctx, 1.1f)), "1.1");
    EXPECT_EQ(to_string(ctx, make_float32(ctx, 2e19f)), "2e+19");
    EXPECT_EQ(to_string(ctx, make_pointer(ctx, intT, SlotId{26})), "0x1a");
    EXPECT_EQ(to_string(ctx, make_pointer(ctx, intT, std::nullopt)), "<nil>");
    EXPECT_EQ(to_string(ctx, box(ctx, make_string(ctx, "hi"))), "hi");
}

TEST_F(ValueTest, MapsRenderSortedByKey){
    value m = make_map(ctx, ctx.get_map(strT, intT));
    EXPECT_EQ(to_string(ctx, m), "map[]");
    map_set(ctx, m, make_string(ctx, "b"), make_int(ctx, 2));
    map_set(ctx, m, make_string(ctx, "a"), make_int(ctx, 1));
    EXPECT_EQ(to_string(ctx, m), "map[a:1 b:2]");

    value byInt = make_map(ctx, ctx.get_map(intT, strT));
    map_set(ctx, byInt, make_int(ctx, 10), make_string(ctx, "y"));
    map_set(ctx, byInt, make_int(ctx, 2), make_string(ctx, "x"));
    EXPECT_EQ(to_string(ctx, byInt), "map[2:x 10:y]");
    EXPECT_EQ(to_string(ctx, zero_value(ctx, ctx.get_map(intT, strT))), "map[]");
}
