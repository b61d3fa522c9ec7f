#include <gtest/gtest.h>
#include <llvm/Support/raw_ostream.h>
#include "gocore/literal_reader.hpp"
#include "gocore/map.hpp"
#include "test_support.hpp"

using namespace gocore;

namespace {

struct ReaderTest : ::testing::Test {
    TypeContext ctx;

    void SetUp() override {
        declare_types(ctx, edn::parse(
            "(types"
            "  (struct :name Point :fields [ (field :name X :type int) (field :name Y :type int) ])"
            "  (struct :name Key :fields [ (field :name N :type int) (field :name S :type string) ]))"));
    }

    value eval(const char* src){ return read_literal(ctx, edn::parse(src)); }
    std::string show(const char* src){ return to_string(ctx, eval(src)); }

    std::string run(const char* src){
        std::string out;
        llvm::raw_string_ostream os(out);
        run_program(ctx, edn::parse(src), os);
        return os.str();
    }
};

} // namespace

TEST_F(ReaderTest, ConstantsTakeDefaultTypes){
    EXPECT_EQ(eval("1").type, ctx.get_base(BaseType::Int));
    EXPECT_EQ(eval("1.5").type, ctx.get_base(BaseType::Float64));
    EXPECT_EQ(eval("\"s\"").type, ctx.get_base(BaseType::String));
    EXPECT_TRUE(eval("nil").is_untyped_nil());
    EXPECT_TRUE(eval("true").as_bool());
    EXPECT_EQ(panic_code([&]{ eval("20000000000000000000"); }), codes::ConstantOverflow);
}

TEST_F(ReaderTest, CompositeLiterals){
    EXPECT_EQ(show("(lit Point [ (at Y 88) ])"), "{0 88}");
    EXPECT_EQ(show("(lit Point [ 8 9 ])"), "{8 9}");
    EXPECT_EQ(show("(lit (slice Point) [ (at 3 [1 1]) [2 2] ])"), "[{0 0} {0 0} {0 0} {1 1} {2 2}]");
    EXPECT_EQ(show("(lit (array :elem int :size 3) [ (at 1 5) ])"), "[0 5 0]");
    EXPECT_EQ(show("(lit (array :elem float32) [ 1.1 2 ])"), "[1.1 2]");
    EXPECT_EQ(show("(lit (map string int) [ (at \"b\" 2) (at \"a\" 1) ])"), "map[a:1 b:2]");
    EXPECT_EQ(show("(lit (map Key int) [ (at [1 \"a\"] 10) ])"), "map[{1 a}:10]");
    EXPECT_EQ(show("(lit (slice any) [ 1 \"a\" nil (box 2.5) ])"), "[1 a <nil> 2.5]");
}

TEST_F(ReaderTest, LiteralPanicsSurface){
    EXPECT_EQ(panic_code([&]{ eval("(lit Point [ 1 2 3 ])"); }), codes::TooManyValues);
    EXPECT_EQ(panic_code([&]{ eval("(lit Point [ (at Z 1) ])"); }), codes::UnknownField);
    EXPECT_EQ(panic_code([&]{ eval("(lit (slice int) [ (at -1 0) ])"); }), codes::NegativeIndex);
    EXPECT_EQ(panic_code([&]{ eval("(lit (array :elem int :size 1) [ 1 2 ])"); }), codes::IndexOutOfRange);
    EXPECT_EQ(panic_code([&]{ eval("(lit (map string int) [ 1 ])"); }), codes::MissingMapKey);
    EXPECT_EQ(panic_code([&]{ eval("(lit (slice int8) [ 300 ])"); }), codes::ConstantOverflow);
}

TEST_F(ReaderTest, HugeLiteralIndexAndMakeHint){
    EXPECT_EQ(panic_code([&]{ eval("(lit (slice int) [ (at (conv uint64 18446744073709551615) 1) ])"); }),
              codes::IndexOutOfRange);
    EXPECT_EQ(panic_code([&]{ eval("(lit (slice int) [ (at 9223372036854775807 1) ])"); }), codes::IndexOutOfRange);
    EXPECT_EQ(run("(program (let m (make (map int int) 9223372036854775807)) (set m 1 2) (print (len m) (get m 1)))"),
              "1 2\n");
}

TEST_F(ReaderTest, ConversionsUseExactConstants){
    value f = eval("(conv float32 1.1)");
    EXPECT_EQ(f.as_float32(), 1.1f);
    EXPECT_EQ(eval("(conv float32 20000000000000000000)").as_float32(), 2e19f);
    EXPECT_EQ(show("(conv int8 (conv int 300))"), "44");
    EXPECT_EQ(show("(conv int (conv float64 -2.75))"), "-2");
    EXPECT_EQ(panic_code([&]{ eval("(conv int8 300)"); }), codes::ConstantOverflow);
}

TEST_F(ReaderTest, MalformedInputIsAParseError){
    EXPECT_THROW(eval("(lit Missing [])"), edn::parse_error);
    EXPECT_THROW(eval("(lit Point 1)"), edn::parse_error);
    EXPECT_THROW(eval("(frobnicate 1)"), edn::parse_error);
    EXPECT_THROW(eval("undefined_name"), edn::parse_error);
    EXPECT_THROW(eval("[1 2]"), edn::parse_error);
    EXPECT_THROW(eval(":kw"), edn::parse_error);
    EXPECT_THROW(declare_types(ctx, edn::parse("(types (enum :name E))")), edn::parse_error);
}

TEST_F(ReaderTest, ProgramPrintsEachLine){
    std::string out = run(
        "(program"
        "  (var m (map string int))"
        "  (print (nil? m) (get m \"k\") (len m))"
        "  (let e (make (map string int)))"
        "  (print (nil? e))"
        "  (set e \"k\" 3)"
        "  (print e (len e))"
        "  (delete e \"k\")"
        "  (print e))");
    EXPECT_EQ(out, "true 0 0\nfalse\nmap[k:3] 1\nmap[]\n");
}

TEST_F(ReaderTest, ProgramPointerIdentity){
    std::string out = run(
        "(program"
        "  (let p (new int 5))"
        "  (let alias p)"
        "  (let q (new int 5))"
        "  (let m (make (map (ptr int) string)))"
        "  (set m p \"first\")"
        "  (store alias 6)"
        "  (print (get m alias) (eq p alias) (eq p q) (deref p) (len m)))");
    EXPECT_EQ(out, "first true false 6 1\n");
}

TEST_F(ReaderTest, ProgramSparseLiterals){
    std::string out = run(
        "(program"
        "  (let s (lit (slice Point) [ (at 10 [1 1]) [2 2] (at 1 [3 3]) ]))"
        "  (print (len s) (index s 0) (index s 1) (index s 11) (field (index s 11) X)))");
    EXPECT_EQ(out, "12 {0 0} {3 3} {2 2} 2\n");
}

TEST_F(ReaderTest, ProgramNilMapWritePanics){
    const char* src = "(program (var m (map string int)) (set m \"k\" 1))";
    EXPECT_EQ(panic_code([&]{ run(src); }), codes::NilMapWrite);
    EXPECT_THROW(run("(module)"), edn::parse_error);
    EXPECT_THROW(run("(program (jump 1))"), edn::parse_error);
}
