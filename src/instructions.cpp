#include "instructions.hpp"

#include <cstdio>
#include <string>

#include "tsl/robin_map.h"

static tsl::robin_map<std::string_view, MnemonicInfo> &mnemonic_table() {
    static auto table = tsl::robin_map<std::string_view, MnemonicInfo>{
        { "mv",  { Opcode::MV,  Condition::NONE } },
        { "mvt", { Opcode::MVT, Condition::NONE } },
        { "add", { Opcode::ADD, Condition::NONE } },
        { "sub", { Opcode::SUB, Condition::NONE } },
        { "ld",  { Opcode::LD,  Condition::NONE } },
        { "st",  { Opcode::ST,  Condition::NONE } },
        { "and", { Opcode::AND, Condition::NONE } },

        { "b",   { Opcode::BRANCH, Condition::NONE } },
        { "beq", { Opcode::BRANCH, Condition::EQ } },
        { "bne", { Opcode::BRANCH, Condition::NE } },
        { "bcc", { Opcode::BRANCH, Condition::CC } },
        { "bcs", { Opcode::BRANCH, Condition::CS } },
    };
    return table;
}

static tsl::robin_map<std::string_view, Register> &register_table() {
    static auto table = tsl::robin_map<std::string_view, Register>{
        { "r0", Register::R0 },
        { "r1", Register::R1 },
        { "r2", Register::R2 },
        { "r3", Register::R3 },
        { "r4", Register::R4 },
        { "r5", Register::R5 },
        { "r6", Register::R6 },
        { "r7", Register::R7 },
        { "pc", Register::PC }, // alias of r7
    };
    return table;
}

std::optional<MnemonicInfo> lookup_mnemonic(std::string_view mnemonic) {
    auto &tbl = mnemonic_table();
    if (auto it = tbl.find(mnemonic); it != tbl.end()) {
        return it->second;
    }
    return std::nullopt;
}

std::optional<Register> lookup_register(std::string_view name) {
    auto &tbl = register_table();
    if (auto it = tbl.find(name); it != tbl.end()) {
        return it->second;
    }
    return std::nullopt;
}

std::string_view opcode_name(Opcode op) {
    switch (op) {
        case Opcode::MV: return "mv";
        case Opcode::MVT: return "mvt";
        case Opcode::ADD: return "add";
        case Opcode::SUB: return "sub";
        case Opcode::LD: return "ld";
        case Opcode::ST: return "st";
        case Opcode::AND: return "and";
        case Opcode::BRANCH: return "b";
        default: return "{unknown}";
    }
}

std::string_view register_name(Register reg) {
    switch (reg) {
        case Register::R0: return "r0";
        case Register::R1: return "r1";
        case Register::R2: return "r2";
        case Register::R3: return "r3";
        case Register::R4: return "r4";
        case Register::R5: return "r5";
        case Register::R6: return "r6";
        case Register::R7: return "r7";
        default: return "{??}";
    }
}

std::string_view condition_name(Condition cond) {
    switch (cond) {
        case Condition::NONE: return "";
        case Condition::EQ: return "eq";
        case Condition::NE: return "ne";
        case Condition::CC: return "cc";
        case Condition::CS: return "cs";
        default: return "{??}";
    }
}

std::string disassemble(u16 word) {
    const auto op = Opcode(decode_opcode(word));
    const bool immediate = decode_immediate_flag(word);

    std::string text{ opcode_name(op) };
    if (op == Opcode::BRANCH) {
        text += condition_name(Condition(decode_condition(word)));
        text += ' ';
    } else {
        text += ' ';
        text += register_name(Register(decode_reg_a(word)));
        text += ", ";
    }

    if (immediate) {
        u32 value = decode_immediate(word);
        if (op == Opcode::MVT) value <<= 8; // mvt only stores the upper byte

        char buf[16];
        std::snprintf(buf, sizeof(buf), "#0x%04x", value);
        text += buf;
    } else if (op == Opcode::LD || op == Opcode::ST) {
        text += '[';
        text += register_name(Register(decode_reg_b(word)));
        text += ']';
    } else {
        text += register_name(Register(decode_reg_b(word)));
    }

    return text;
}
