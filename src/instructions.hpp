#pragma once

#include "types.hpp"

#include <optional>
#include <string>
#include <string_view>

// The three-bit opcode. All conditional and unconditional branches share BRANCH
// and are told apart by the condition code stored where register A would be.
enum class Opcode : u8 {
    MV = 0,
    MVT = 1,
    ADD = 2,
    SUB = 3,
    LD = 4,
    ST = 5,
    AND = 6,
    BRANCH = 7,

    NUM_OPCODES // not an opcode.
};

enum class Register : u8 {
    R0 = 0, R1, R2, R3, R4, R5, R6, R7,

    /* Program counter */ PC = R7,

    NUM_REGISTERS = 8 // not a register
};

enum class Condition : u8 {
    NONE = 0, // b, always taken
    EQ = 1,
    NE = 2,
    CC = 3,
    CS = 4,

    NUM_CONDITIONS // not a condition.
};

// Format (bit 15 is the most significant)
// OOOIAAAB BBBBBBBB
// O = opcode bits (3)
// I = operand 2 is immediate (1)
// A = register A, or condition code for branches (3)
// B = register B in the low 3 bits (I = 0), or 9-bit immediate/offset (I = 1)

constexpr u32 WORD_BITS = 16;
constexpr u32 OPCODE_BITS = 3;
constexpr u32 IMM_FLAG_BITS = 1;
constexpr u32 REG_A_BITS = 3;
constexpr u32 REG_B_BITS = 3;
constexpr u32 IMMEDIATE_BITS = 9;

constexpr u32 MAX_IMMEDIATE = (1 << IMMEDIATE_BITS) - 1; // 0x1FF
constexpr u32 MAX_WORD_VALUE = (1 << WORD_BITS) - 1; // 65535

#define IMM_OFFSET 0
#define REGB_OFFSET 0
#define REGA_OFFSET (IMMEDIATE_BITS)
#define FLAG_OFFSET (REGA_OFFSET + REG_A_BITS)
#define OPC_OFFSET (FLAG_OFFSET + IMM_FLAG_BITS)

constexpr u16 encode_opcode(Opcode op) { return u16(u32(op) << OPC_OFFSET); }
constexpr u32 decode_opcode(u16 word) { return (word >> OPC_OFFSET) & ((1 << OPCODE_BITS) - 1); }

constexpr u16 encode_immediate_flag() { return u16(1 << FLAG_OFFSET); }
constexpr bool decode_immediate_flag(u16 word) { return (word >> FLAG_OFFSET) & ((1 << IMM_FLAG_BITS) - 1); }

constexpr u16 encode_reg_a(Register reg) { return u16(u32(reg) << REGA_OFFSET); }
constexpr u32 decode_reg_a(u16 word) { return (word >> REGA_OFFSET) & ((1 << REG_A_BITS) - 1); }

// Condition codes occupy the same bits as register A
constexpr u16 encode_condition(Condition cond) { return u16(u32(cond) << REGA_OFFSET); }
constexpr u32 decode_condition(u16 word) { return decode_reg_a(word); }

constexpr u16 encode_reg_b(Register reg) { return u16(u32(reg) << REGB_OFFSET); }
constexpr u32 decode_reg_b(u16 word) { return (word >> REGB_OFFSET) & ((1 << REG_B_BITS) - 1); }

constexpr u16 encode_immediate(u32 imm) { return u16((imm & MAX_IMMEDIATE) << IMM_OFFSET); }
constexpr u32 decode_immediate(u16 word) { return (word >> IMM_OFFSET) & MAX_IMMEDIATE; }

#undef OPC_OFFSET
#undef FLAG_OFFSET
#undef REGA_OFFSET
#undef REGB_OFFSET
#undef IMM_OFFSET

// Word builders for the three instruction shapes.
// `mv ra, rb` / `ld ra, [rb]`
constexpr u16 make_register_instr(Opcode op, Register ra, Register rb) {
    return u16(encode_reg_b(rb) | encode_reg_a(ra) | encode_opcode(op));
}

// `add ra, #imm`. For MVT, `imm` is the full 16-bit value and only its upper byte is kept.
constexpr u16 make_immediate_instr(Opcode op, Register ra, u32 imm) {
    if (op == Opcode::MVT) imm >>= 8;
    return u16(encode_immediate(imm) | encode_reg_a(ra) | encode_immediate_flag() | encode_opcode(op));
}

// `beq #target`
constexpr u16 make_branch_instr(Condition cond, u32 target) {
    return u16(encode_immediate(target) | encode_condition(cond) | encode_immediate_flag() | encode_opcode(Opcode::BRANCH));
}

// Mnemonic for a branch is "b" + condition suffix, everything else maps 1:1.
struct MnemonicInfo {
    Opcode opcode;
    Condition condition; // Only meaningful for Opcode::BRANCH
};

std::optional<MnemonicInfo> lookup_mnemonic(std::string_view mnemonic);

std::optional<Register> lookup_register(std::string_view name);

std::string_view opcode_name(Opcode op);

std::string_view register_name(Register reg);

std::string_view condition_name(Condition cond);

// Human-readable form of an instruction word, e.g. "add r1, #0x0004" or "ld r2, [r3]".
std::string disassemble(u16 word);
