#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "tsl/robin_map.h"

#include "types.hpp"
#include "program.hpp"

// Can't be bound by .define or used as a label
constexpr std::string_view RESERVED_DEPTH_SYMBOL = "DEPTH";

// Labels and .defines share one namespace.
// Built by pass 1, read-only afterwards.
struct SymbolTable {
    tsl::robin_map<std::string, u32> symbols;
    u32 depth_words = DEFAULT_DEPTH_WORDS;
    bool depth_declared = false;

    std::optional<u32> lookup(std::string_view name) const;
};

struct AssembleOptions {
    bool lenient = false; // unrecognized lines are skipped with a warning instead of failing
};

namespace Assembler {
    std::vector<SourceLine> split_lines(std::string_view source_code);

    // Pass 1: assigns an address to every label and a value to every .define.
    bool build_symbol_table(const std::vector<SourceLine> &lines, const AssembleOptions &opts,
                            SymbolTable &out, Diagnostics &diag);

    // Pass 2: one word per instruction or .word line, in source order.
    bool encode_program(const std::vector<SourceLine> &lines, const SymbolTable &symbols,
                        const AssembleOptions &opts, Program &out, Diagnostics &diag);

    bool assemble(std::string_view source_code, const AssembleOptions &opts, Program &out, Diagnostics &diag);
}
