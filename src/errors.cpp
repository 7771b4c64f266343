#include "errors.hpp"

#include <algorithm>
#include <cstdio>

static const char *describe(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::UNKNOWN_INSTRUCTION: return "unknown instruction";
        case ErrorKind::UNKNOWN_REGISTER: return "unknown register";
        case ErrorKind::BAD_MVT_IMMEDIATE: return "the immediate value for mvt should be 0 in the eight least-significant bits";
        case ErrorKind::IMMEDIATE_TOO_LARGE: return "the immediate value is too large";
        case ErrorKind::DEFINE_TOO_LARGE: return "define value too large";
        case ErrorKind::SYMBOL_REDEFINED: return "define is being redefined";
        case ErrorKind::UNDEFINED_SYMBOL: return "undeclared identifier (label or define), or value error";
        case ErrorKind::BAD_DEPTH: return "memory depth must be an integer multiple of 2";
        case ErrorKind::BAD_DATA: return "missing or bad data";
        case ErrorKind::RESERVED_SYMBOL: return "symbol DEPTH is reserved, it cannot be redefined";
        case ErrorKind::BRANCH_TOO_LARGE: return "the branch target is too large";
        case ErrorKind::BAD_INDIRECT: return "only ld and st accept an indirect [register] operand";
        case ErrorKind::BAD_SYNTAX: return "can't parse assembly code";
        case ErrorKind::DEPTH_REDEFINED: return "memory depth can only be set once, before the first instruction";
        case ErrorKind::PROGRAM_TOO_LARGE: return "program does not fit in memory";
        default: return nullptr;
    }
}

std::string error_message(ErrorKind kind, const ErrorContext &ctx) {
    kind = std::min(kind, ErrorKind::UNKNOWN);

    if (kind == ErrorKind::NONE) return {};

    const char *text = describe(kind);
    if (!text) return "ERROR: UNKNOWN";

    char buf[256];
    switch (kind) {
        case ErrorKind::BAD_DEPTH:
        case ErrorKind::DEPTH_REDEFINED:
            std::snprintf(buf, sizeof(buf), "ERROR: line %u: %s (depth is %llu)", ctx.line, text,
                (unsigned long long)ctx.depth);
            break;
        case ErrorKind::BRANCH_TOO_LARGE:
        case ErrorKind::PROGRAM_TOO_LARGE:
            std::snprintf(buf, sizeof(buf), "ERROR: line %u: %s (depth is %llu, %d instruction%s before this line)",
                ctx.line, text, (unsigned long long)ctx.depth, ctx.instruction_count, ctx.instruction_count == 1 ? "" : "s");
            break;
        default:
            std::snprintf(buf, sizeof(buf), "ERROR: line %u: %s", ctx.line, text);
            break;
    }
    return buf;
}
