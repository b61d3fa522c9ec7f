#include "gocore/env.hpp"
#include "gocore/edn.hpp"

namespace gocore {

RuntimeEnv detectEnv(){
    using edn::detail::env_flag_enabled;
    RuntimeEnv e{};
    e.debugLiterals = env_flag_enabled("GOCORE_DEBUG_LITERAL");
    e.debugMaps = env_flag_enabled("GOCORE_DEBUG_MAP");
    e.debugSlots = env_flag_enabled("GOCORE_DEBUG_SLOT");
    e.diagJson = env_flag_enabled("GOCORE_DIAG_JSON");
    e.installFatalHandler = env_flag_enabled("GOCORE_INSTALL_FATAL_HANDLER");
    return e;
}

static RuntimeEnv& current(){
    static RuntimeEnv env = detectEnv();
    return env;
}

const RuntimeEnv& runtimeEnv(){ return current(); }

void setRuntimeEnv(const RuntimeEnv& e){ current() = e; }

} // namespace gocore
