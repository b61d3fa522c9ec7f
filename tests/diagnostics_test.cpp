#include <gtest/gtest.h>
#include "gocore/diagnostics_json.hpp"
#include "gocore/env.hpp"

using namespace gocore;

TEST(DiagnosticsTest, PanicSerializesToJson){
    runtime_panic p(codes::NilMapWrite, "assignment to entry in nil map", "use make");
    EXPECT_EQ(panic_to_json(p),
              "{\"code\":\"E2001\",\"message\":\"assignment to entry in nil map\",\"hint\":\"use make\"}");
}

TEST(DiagnosticsTest, JsonEscaping){
    EXPECT_EQ(json_escape("a\"b\\c\n"), "\"a\\\"b\\\\c\\n\"");
    EXPECT_EQ(json_escape(std::string("\x01", 1)), "\"\\u0001\"");
}

TEST(DiagnosticsTest, RuntimeEnvCanBeOverridden){
    RuntimeEnv saved = runtimeEnv();
    RuntimeEnv e{};
    e.debugMaps = true;
    setRuntimeEnv(e);
    EXPECT_TRUE(runtimeEnv().debugMaps);
    EXPECT_FALSE(runtimeEnv().diagJson);
    setRuntimeEnv(saved);
}
