#pragma once

#include <string_view>

#include "types.hpp"

// Tested in this order, first match wins.
enum class LineKind : u8 {
    EMPTY,            // blank line or `// comment`
    DEPTH,            // DEPTH 512
    DEFINE,           // .define NAME value
    LABEL,            // name:
    REGISTER_INSTR,   // [label:] op ra, rb | op ra, [rb]
    IMMEDIATE_INSTR,  // [label:] op ra, #value | op ra, symbol
    BRANCH_INSTR,     // [label:] bcc #target | bcc label
    WORD,             // [label:] .word value
    UNRECOGNIZED
};

// All views point into the line passed to classify().
struct ClassifiedLine {
    LineKind kind = LineKind::UNRECOGNIZED;

    std::string_view label;     // leading `name:`, or the name of a label-only line
    std::string_view symbol;    // name bound by .define
    std::string_view mnemonic;
    std::string_view reg;       // first operand of the two-operand shapes
    std::string_view operand;   // second register, immediate/symbol, branch target, or directive value
    bool indirect = false;      // operand was written as [reg]
};

ClassifiedLine classify(std::string_view line);

// True for the kinds that occupy one word of memory.
constexpr bool emits_word(LineKind kind) {
    return kind == LineKind::REGISTER_INSTR
        || kind == LineKind::IMMEDIATE_INSTR
        || kind == LineKind::BRANCH_INSTR
        || kind == LineKind::WORD;
}

// Integer literal in decimal or with a 0x / 0b / 0o prefix. Decimal literals
// can't have leading zeros. Values that overflow saturate to the maximum u64
// so that range checks downstream still reject them.
bool parse_literal(std::string_view str, u64 &out);
