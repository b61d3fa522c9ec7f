// diagnostics_json.hpp - JSON serialization for runtime panics
#pragma once
#include "gocore/panic.hpp"
#include <string>

namespace gocore {

// Escape a string for safe JSON output.
std::string json_escape(const std::string& s);

// Serialize a panic to {"code":..,"message":..,"hint":..}.
std::string panic_to_json(const runtime_panic& p);

// If GOCORE_DIAG_JSON=1 in the environment, print the panic JSON to stderr.
void maybe_print_json(const runtime_panic& p);

} // namespace gocore
