#pragma once

namespace gocore {

struct RuntimeEnv {
    bool debugLiterals = false;
    bool debugMaps = false;
    bool debugSlots = false;
    bool diagJson = false;
    bool installFatalHandler = false;
};

// Reads process env vars and constructs a RuntimeEnv.
//   GOCORE_DEBUG_LITERAL=1         trace literal construction
//   GOCORE_DEBUG_MAP=1             trace map make/set/delete
//   GOCORE_DEBUG_SLOT=1            trace slot allocation
//   GOCORE_DIAG_JSON=1             driver prints panics as JSON on stderr
//   GOCORE_INSTALL_FATAL_HANDLER=1 driver installs LLVM fatal/stack-trace handlers
RuntimeEnv detectEnv();

// Process-wide settings, detected on first use.
const RuntimeEnv& runtimeEnv();
void setRuntimeEnv(const RuntimeEnv& e);

} // namespace gocore
