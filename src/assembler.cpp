#include "assembler.hpp"

#include <algorithm>
#include <cstdarg>
#include <cstdio>
#include <limits>

#include "classifier.hpp"
#include "instructions.hpp"

std::optional<u32> SymbolTable::lookup(std::string_view name) const {
    if (auto it = symbols.find(std::string{ name }); it != symbols.end()) {
        return it->second;
    }
    return std::nullopt;
}

// State shared by both passes. `address` is the address of the last word
// emitted, so it starts at -1 and a label binds to address + 1.
struct PassCtx {
    const AssembleOptions &opts;
    Diagnostics &diag;

    u32 current_line;
    u32 depth_words;
    i32 address;
};

class Message {
public:
    static Message error(PassCtx &ctx, ErrorKind kind) {
        return Message(ctx, kind);
    }

    static Message warning(PassCtx &ctx) {
        return Message(ctx, ErrorKind::NONE);
    }

    Message &with_hint(const char *format...) {
        char buf[128];
        va_list args;
        va_start(args, format);
        std::vsnprintf(buf, sizeof(buf), format, args);
        va_end(args);

        hint = buf;
        return *this;
    }

    // Reports this depth instead of the configured one
    Message &for_depth(u64 requested) {
        depth = requested;
        return *this;
    }

    // Errors: the text comes from error_message(), the hint is appended
    void report() {
        auto text = error_message(kind, ErrorContext {
            .line = ctx.current_line,
            .depth = depth.value_or(ctx.depth_words),
            .instruction_count = ctx.address + 1,
        });
        if (!hint.empty()) text += " (" + hint + ")";

        if (ctx.diag.echo) std::printf("%s\n", text.c_str());

        ctx.diag.errors.push_back(Diagnostic{ .kind = kind, .line = ctx.current_line, .message = std::move(text) });
    }

    // Warnings: free-form text
    void printf(const char *format...) {
        char buf[256];
        va_list args;
        va_start(args, format);
        std::vsnprintf(buf, sizeof(buf), format, args);
        va_end(args);

        char line[320];
        std::snprintf(line, sizeof(line), "Warning: line %u: %s", ctx.current_line, buf);

        if (ctx.diag.echo) std::printf("%s\n", line);

        ctx.diag.warnings.push_back(Diagnostic{ .kind = ErrorKind::NONE, .line = ctx.current_line, .message = line });
    }

private:
    Message(PassCtx &ctx, ErrorKind kind) : ctx(ctx), kind(kind) {}

    PassCtx &ctx;
    ErrorKind kind;
    std::string hint;
    std::optional<u64> depth;
};

// Same policy in both passes. Only pass 1 warns, pass 2 would repeat it.
static bool handle_unrecognized(PassCtx &ctx, const SourceLine &line, bool warn) {
    if (!ctx.opts.lenient) {
        Message::error(ctx, ErrorKind::BAD_SYNTAX)
            .with_hint("'%.*s'", (int)std::min<std::size_t>(line.text.length(), 64), line.text.data())
            .report();
        return false;
    }

    if (warn) {
        Message::warning(ctx).printf("can't parse assembly code, line ignored");
    }
    return true;
}

namespace SymbolPassFns {
    static bool check_name(PassCtx &ctx, const SymbolTable &table, std::string_view name) {
        if (name == RESERVED_DEPTH_SYMBOL) {
            Message::error(ctx, ErrorKind::RESERVED_SYMBOL).report();
            return false;
        }

        if (table.symbols.count(std::string{ name }) != 0) {
            Message::error(ctx, ErrorKind::SYMBOL_REDEFINED)
                .with_hint("'%.*s'", (int)name.length(), name.data())
                .report();
            return false;
        }
        return true;
    }

    static bool bind_symbol(PassCtx &ctx, SymbolTable &table, std::string_view name, u32 value) {
        if (!check_name(ctx, table, name)) return false;

        table.symbols.emplace(std::string{ name }, value);
        return true;
    }

    static bool set_depth(PassCtx &ctx, SymbolTable &table, std::string_view value_str) {
        if (table.depth_declared || ctx.address >= 0) {
            Message::error(ctx, ErrorKind::DEPTH_REDEFINED).report();
            return false;
        }

        // The operand is plain decimal digits, so leading zeros can't mean octal
        auto digits = value_str;
        while (digits.length() > 1 && digits[0] == '0') digits.remove_prefix(1);

        u64 depth{};
        if (!parse_literal(digits, depth)) {
            Message::error(ctx, ErrorKind::BAD_DEPTH)
                .with_hint("'%.*s' is not an integer", (int)value_str.length(), value_str.data())
                .report();
            return false;
        }

        // Only evenness is enforced, not a power of two.
        if (depth == 0 || depth % 2 != 0 || depth > std::numeric_limits<u32>::max()) {
            Message::error(ctx, ErrorKind::BAD_DEPTH).for_depth(depth).report();
            return false;
        }

        table.depth_words = u32(depth);
        table.depth_declared = true;
        ctx.depth_words = table.depth_words;
        return true;
    }

    static bool define_symbol(PassCtx &ctx, SymbolTable &table, std::string_view name, std::string_view value_str) {
        u64 value{};
        if (!parse_literal(value_str, value)) {
            Message::error(ctx, ErrorKind::BAD_DATA)
                .with_hint("'%.*s' is not an integer", (int)value_str.length(), value_str.data())
                .report();
            return false;
        }

        if (!check_name(ctx, table, name)) return false;

        if (value > MAX_WORD_VALUE) {
            Message::error(ctx, ErrorKind::DEFINE_TOO_LARGE)
                .with_hint("maximum is %u", MAX_WORD_VALUE)
                .report();
            return false;
        }

        table.symbols.emplace(std::string{ name }, u32(value));
        return true;
    }
}

namespace EncoderFns {
    // Literal first, then symbol.
    static bool resolve_value(PassCtx &ctx, const SymbolTable &symbols, std::string_view str, u64 &out) {
        if (parse_literal(str, out)) return true;

        if (auto value = symbols.lookup(str)) {
            out = *value;
            return true;
        }

        Message::error(ctx, ErrorKind::UNDEFINED_SYMBOL)
            .with_hint("'%.*s'", (int)str.length(), str.data())
            .report();
        return false;
    }

    static bool parse_register(PassCtx &ctx, std::string_view name, Register &out) {
        if (auto reg = lookup_register(name)) {
            out = *reg;
            return true;
        }

        Message::error(ctx, ErrorKind::UNKNOWN_REGISTER)
            .with_hint("'%.*s'", (int)name.length(), name.data())
            .report();
        return false;
    }

    static bool unknown_instruction(PassCtx &ctx, std::string_view mnemonic, const char *hint) {
        Message::error(ctx, ErrorKind::UNKNOWN_INSTRUCTION)
            .with_hint("'%.*s' %s", (int)mnemonic.length(), mnemonic.data(), hint)
            .report();
        return false;
    }

    // mv ra, rb / ld ra, [rb]
    static bool encode_register_instr(PassCtx &ctx, const ClassifiedLine &line, u16 &out) {
        // Brackets are rejected before the mnemonic is looked up
        if (line.indirect && line.mnemonic != "ld" && line.mnemonic != "st") {
            Message::error(ctx, ErrorKind::BAD_INDIRECT)
                .with_hint("'%.*s' with '[%.*s]'",
                    (int)line.mnemonic.length(), line.mnemonic.data(),
                    (int)line.operand.length(), line.operand.data())
                .report();
            return false;
        }

        auto info = lookup_mnemonic(line.mnemonic);
        if (!info || info->opcode == Opcode::MVT || info->opcode == Opcode::BRANCH) {
            return unknown_instruction(ctx, line.mnemonic, "does not take two register operands");
        }

        Register ra{}, rb{};
        if (!parse_register(ctx, line.reg, ra) || !parse_register(ctx, line.operand, rb)) {
            return false;
        }

        out = make_register_instr(info->opcode, ra, rb);
        return true;
    }

    // add ra, #imm / mvt ra, #imm / sub ra, SYMBOL
    static bool encode_immediate_instr(PassCtx &ctx, const SymbolTable &symbols, const ClassifiedLine &line, u16 &out) {
        auto info = lookup_mnemonic(line.mnemonic);
        if (!info || info->opcode == Opcode::LD || info->opcode == Opcode::ST || info->opcode == Opcode::BRANCH) {
            return unknown_instruction(ctx, line.mnemonic, "does not take an immediate operand");
        }

        Register ra{};
        if (!parse_register(ctx, line.reg, ra)) {
            return false;
        }

        u64 imm{};
        if (!resolve_value(ctx, symbols, line.operand, imm)) {
            return false;
        }

        if (info->opcode == Opcode::MVT) {
            // mvt loads the upper byte, so the low byte must be empty
            if (imm > MAX_WORD_VALUE) {
                Message::error(ctx, ErrorKind::IMMEDIATE_TOO_LARGE)
                    .with_hint("maximum for mvt is 0x%04x", MAX_WORD_VALUE & ~0xFFu)
                    .report();
                return false;
            }
            if ((imm & 0xFF) != 0) {
                Message::error(ctx, ErrorKind::BAD_MVT_IMMEDIATE).report();
                return false;
            }
        } else if (imm > MAX_IMMEDIATE) {
            Message::error(ctx, ErrorKind::IMMEDIATE_TOO_LARGE)
                .with_hint("maximum is 0x%x", MAX_IMMEDIATE)
                .report();
            return false;
        }

        out = make_immediate_instr(info->opcode, ra, u32(imm));
        return true;
    }

    // b #target / beq label
    static bool encode_branch_instr(PassCtx &ctx, const SymbolTable &symbols, const ClassifiedLine &line, u16 &out) {
        auto info = lookup_mnemonic(line.mnemonic);
        if (!info || info->opcode != Opcode::BRANCH) {
            return unknown_instruction(ctx, line.mnemonic, "is not a branch");
        }

        u64 target{};
        if (!resolve_value(ctx, symbols, line.operand, target)) {
            return false;
        }

        if (target >= ctx.depth_words) {
            Message::error(ctx, ErrorKind::BRANCH_TOO_LARGE).report();
            return false;
        }

        out = make_branch_instr(info->condition, u32(target));
        return true;
    }

    // .word value, stored as is
    static bool encode_data(PassCtx &ctx, const ClassifiedLine &line, u16 &out) {
        u64 value{};
        if (!parse_literal(line.operand, value)) {
            Message::error(ctx, ErrorKind::BAD_DATA)
                .with_hint("'%.*s' is not an integer", (int)line.operand.length(), line.operand.data())
                .report();
            return false;
        }

        if (value > MAX_WORD_VALUE) {
            Message::error(ctx, ErrorKind::BAD_DATA)
                .with_hint("does not fit in %u bits", WORD_BITS)
                .report();
            return false;
        }

        out = u16(value);
        return true;
    }
}

std::vector<SourceLine> Assembler::split_lines(std::string_view str) {
    auto lines = std::vector<SourceLine>{};

    u32 number = 1;
    while (!str.empty()) {
        std::string_view line{};
        if (auto idx = str.find_first_of('\n'); idx != str.npos) {
            line = str.substr(0, idx);
            str = str.substr(idx + 1);
        } else {
            line = str;
            str = {};
        }

        if (!line.empty() && line.back() == '\r') line.remove_suffix(1);

        lines.push_back(SourceLine{ .text = std::string{ line }, .number = number++ });
    }

    return lines;
}

bool Assembler::build_symbol_table(const std::vector<SourceLine> &lines, const AssembleOptions &opts,
                                   SymbolTable &out, Diagnostics &diag) {
    using namespace SymbolPassFns;

    auto table = SymbolTable{};
    auto ctx = PassCtx {
        .opts = opts,
        .diag = diag,
        .current_line = 0,
        .depth_words = table.depth_words,
        .address = -1,
    };

    for (const auto &line : lines) {
        ctx.current_line = line.number;
        const auto parsed = classify(line.text);

        bool ok = true;
        switch (parsed.kind) {
            case LineKind::EMPTY:
                break;
            case LineKind::DEPTH:
                ok = set_depth(ctx, table, parsed.operand);
                break;
            case LineKind::DEFINE:
                ok = define_symbol(ctx, table, parsed.symbol, parsed.operand);
                break;
            case LineKind::LABEL:
                ok = bind_symbol(ctx, table, parsed.label, u32(ctx.address + 1));
                break;
            case LineKind::UNRECOGNIZED:
                ok = handle_unrecognized(ctx, line, true);
                break;
            default:
                // Instruction or .word. The address is taken even if pass 2 rejects the line.
                if (!parsed.label.empty()) {
                    ok = bind_symbol(ctx, table, parsed.label, u32(ctx.address + 1));
                }
                ctx.address += 1;
                break;
        }

        if (!ok) return false;
    }

    out = std::move(table);
    return true;
}

bool Assembler::encode_program(const std::vector<SourceLine> &lines, const SymbolTable &symbols,
                               const AssembleOptions &opts, Program &out, Diagnostics &diag) {
    using namespace EncoderFns;

    auto program = Program {
        .words = {},
        .width_bits = DEFAULT_WIDTH_BITS,
        .depth_words = symbols.depth_words,
    };
    auto ctx = PassCtx {
        .opts = opts,
        .diag = diag,
        .current_line = 0,
        .depth_words = symbols.depth_words,
        .address = -1,
    };

    for (const auto &line : lines) {
        ctx.current_line = line.number;
        const auto parsed = classify(line.text);

        if (parsed.kind == LineKind::UNRECOGNIZED) {
            if (!handle_unrecognized(ctx, line, false)) return false;
            continue;
        }

        if (!emits_word(parsed.kind)) continue;

        if (u32(ctx.address + 1) >= program.depth_words) {
            Message::error(ctx, ErrorKind::PROGRAM_TOO_LARGE).report();
            return false;
        }

        u16 bits{};
        bool ok = false;
        switch (parsed.kind) {
            case LineKind::REGISTER_INSTR: ok = encode_register_instr(ctx, parsed, bits); break;
            case LineKind::IMMEDIATE_INSTR: ok = encode_immediate_instr(ctx, symbols, parsed, bits); break;
            case LineKind::BRANCH_INSTR: ok = encode_branch_instr(ctx, symbols, parsed, bits); break;
            case LineKind::WORD: ok = encode_data(ctx, parsed, bits); break;
            default: break;
        }

        if (!ok) return false;

        program.words.push_back(MachineWord{ .bits = bits, .is_instruction = parsed.kind != LineKind::WORD });
        ctx.address += 1;
    }

    out = std::move(program);
    return true;
}

bool Assembler::assemble(std::string_view source_code, const AssembleOptions &opts, Program &out, Diagnostics &diag) {
    const auto lines = split_lines(source_code);

    auto symbols = SymbolTable{};
    if (!build_symbol_table(lines, opts, symbols, diag)) {
        return false;
    }

    return encode_program(lines, symbols, opts, out, diag);
}
