#pragma once

#include <string>
#include <vector>

#include "types.hpp"
#include "errors.hpp"

constexpr u32 DEFAULT_WIDTH_BITS = 16;
constexpr u32 DEFAULT_DEPTH_WORDS = 256;

struct SourceLine {
    std::string text;
    u32 number; // 1-based
};

struct MachineWord {
    u16 bits;
    bool is_instruction; // false for .word data
};

// Index into `words` is the memory address.
struct Program {
    std::vector<MachineWord> words;
    u32 width_bits = DEFAULT_WIDTH_BITS;
    u32 depth_words = DEFAULT_DEPTH_WORDS;
};

struct Diagnostic {
    ErrorKind kind; // ErrorKind::NONE for warnings
    u32 line;
    std::string message;
};

struct Diagnostics {
    std::vector<Diagnostic> errors;
    std::vector<Diagnostic> warnings;
    bool echo = true; // print to stdout as they are reported
};
