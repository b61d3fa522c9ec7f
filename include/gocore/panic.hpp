// Fatal runtime conditions raised by the value core.
#pragma once
#include <stdexcept>
#include <string>

namespace gocore {

namespace codes {
inline constexpr const char* NilMapWrite        = "E2001";
inline constexpr const char* TooManyValues      = "E2002";
inline constexpr const char* TooFewValues       = "E2003";
inline constexpr const char* MixedLiteral       = "E2004";
inline constexpr const char* UnknownField       = "E2005";
inline constexpr const char* IndexOutOfRange    = "E2006";
inline constexpr const char* NegativeIndex      = "E2007";
inline constexpr const char* MissingMapKey      = "E2008";
inline constexpr const char* UnhashableKey      = "E2009";
inline constexpr const char* MismatchedTypes    = "E2010";
inline constexpr const char* CannotUse          = "E2011";
inline constexpr const char* CannotConvert      = "E2012";
inline constexpr const char* ConstantOverflow   = "E2013";
inline constexpr const char* NilDereference     = "E2014";
inline constexpr const char* DanglingPointer    = "E2015";
inline constexpr const char* InvalidMapKeyType  = "E2016";
inline constexpr const char* NotComparable      = "E2017";
inline constexpr const char* DuplicateField     = "E2018";
} // namespace codes

// A fatal condition that terminates evaluation of the running program.
struct runtime_panic : std::runtime_error {
    std::string code;
    std::string hint;
    runtime_panic(std::string c, const std::string& message, std::string h = {})
        : std::runtime_error(message), code(std::move(c)), hint(std::move(h)) {}
};

[[noreturn]] inline void raise(const char* code, const std::string& message, std::string hint = {}){
    throw runtime_panic(code, message, std::move(hint));
}

} // namespace gocore
