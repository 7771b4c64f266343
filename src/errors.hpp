#pragma once

#include <string>

#include "types.hpp"

enum class ErrorKind : u8 {
    NONE = 0,
    UNKNOWN_INSTRUCTION,
    UNKNOWN_REGISTER,
    BAD_MVT_IMMEDIATE,   // mvt immediate has bits set in the low byte
    IMMEDIATE_TOO_LARGE,
    DEFINE_TOO_LARGE,
    SYMBOL_REDEFINED,
    UNDEFINED_SYMBOL,
    BAD_DEPTH,
    BAD_DATA,
    RESERVED_SYMBOL,     // attempt to bind DEPTH
    BRANCH_TOO_LARGE,
    BAD_INDIRECT,        // [rb] used with something other than ld/st
    BAD_SYNTAX,
    DEPTH_REDEFINED,
    PROGRAM_TOO_LARGE,

    UNKNOWN // Always the last one. Anything past it is reported as UNKNOWN.
};

// Context for a message. `depth` is the configured memory depth, except for
// BAD_DEPTH where it is the depth the line asked for. `instruction_count` is
// the number of words emitted before the failing line.
struct ErrorContext {
    u32 line;
    u64 depth;
    i32 instruction_count;
};

std::string error_message(ErrorKind kind, const ErrorContext &ctx);
