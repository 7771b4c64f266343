#include <gtest/gtest.h>

#include <string_view>

#include "assembler.hpp"
#include "instructions.hpp"

namespace {
    struct Result {
        bool ok;
        Program program;
        Diagnostics diag;
    };

    Result assemble(std::string_view source, bool lenient = false) {
        auto result = Result{};
        result.diag.echo = false;
        result.ok = Assembler::assemble(source, AssembleOptions{ .lenient = lenient }, result.program, result.diag);
        return result;
    }

    void expect_error(std::string_view source, ErrorKind kind, u32 line) {
        auto result = assemble(source);
        EXPECT_FALSE(result.ok) << source;
        ASSERT_EQ(result.diag.errors.size(), 1u) << source;
        EXPECT_EQ(result.diag.errors[0].kind, kind) << source;
        EXPECT_EQ(result.diag.errors[0].line, line) << source;
        EXPECT_TRUE(result.program.words.empty());
    }

    u16 single_word(std::string_view source) {
        auto result = assemble(source);
        EXPECT_TRUE(result.ok) << source;
        EXPECT_EQ(result.program.words.size(), 1u) << source;
        return result.program.words.empty() ? 0 : result.program.words[0].bits;
    }
}

TEST(SplitLines, NumbersFromOne) {
    auto lines = Assembler::split_lines("mv r0, r1\r\n\nadd r0, r1");
    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(lines[0].text, "mv r0, r1");
    EXPECT_EQ(lines[0].number, 1u);
    EXPECT_EQ(lines[1].text, "");
    EXPECT_EQ(lines[2].number, 3u);

    EXPECT_TRUE(Assembler::split_lines("").empty());
    EXPECT_EQ(Assembler::split_lines("b #0\n").size(), 1u);
}

TEST(Assembler, ScenarioTwoInstructions) {
    auto result = assemble(
        "mv r0, #0x05\n"
        "add r1, r0\n");

    ASSERT_TRUE(result.ok);
    EXPECT_EQ(result.program.width_bits, 16u);
    EXPECT_EQ(result.program.depth_words, 256u);
    ASSERT_EQ(result.program.words.size(), 2u);

    EXPECT_EQ(result.program.words[0].bits, 0x1005);
    EXPECT_TRUE(result.program.words[0].is_instruction);
    EXPECT_EQ(disassemble(result.program.words[0].bits), "mv r0, #0x0005");

    EXPECT_EQ(result.program.words[1].bits, 0x4200);
    EXPECT_EQ(disassemble(result.program.words[1].bits), "add r1, r0");
}

TEST(Assembler, ScenarioSelfLoop) {
    auto lines = Assembler::split_lines("loop: beq loop");
    auto diag = Diagnostics{ .errors = {}, .warnings = {}, .echo = false };
    auto symbols = SymbolTable{};
    ASSERT_TRUE(Assembler::build_symbol_table(lines, AssembleOptions{}, symbols, diag));
    EXPECT_EQ(symbols.lookup("loop"), std::optional<u32>{ 0 });

    auto prog = Program{};
    ASSERT_TRUE(Assembler::encode_program(lines, symbols, AssembleOptions{}, prog, diag));
    ASSERT_EQ(prog.words.size(), 1u);

    const u16 word = prog.words[0].bits;
    EXPECT_EQ(decode_opcode(word), u32(Opcode::BRANCH));
    EXPECT_EQ(decode_condition(word), u32(Condition::EQ));
    EXPECT_EQ(decode_immediate(word), 0u);
}

TEST(Assembler, ScenarioReservedDefine) {
    expect_error(
        "mv r0, r1\n"
        "// reserved\n"
        ".define DEPTH 10\n",
        ErrorKind::RESERVED_SYMBOL, 3);
}

TEST(Assembler, ScenarioDataWord) {
    auto result = assemble(".word 0xFFFF");
    ASSERT_TRUE(result.ok);
    ASSERT_EQ(result.program.words.size(), 1u);
    EXPECT_EQ(result.program.words[0].bits, 0xFFFF);
    EXPECT_FALSE(result.program.words[0].is_instruction);
}

TEST(Assembler, ForwardReferencesResolveToNextWord) {
    auto lines = Assembler::split_lines(
        "    b end\n"
        "    .define X 3\n"
        "first:\n"
        "second:\n"
        "    mv r0, #X\n"
        "end:\n"
        "    // comment\n"
        "    .define Y 4\n"
        "last: add r0, r1\n");

    auto diag = Diagnostics{ .errors = {}, .warnings = {}, .echo = false };
    auto symbols = SymbolTable{};
    ASSERT_TRUE(Assembler::build_symbol_table(lines, AssembleOptions{}, symbols, diag));

    EXPECT_EQ(symbols.lookup("first"), std::optional<u32>{ 1 });
    EXPECT_EQ(symbols.lookup("second"), std::optional<u32>{ 1 });
    EXPECT_EQ(symbols.lookup("end"), std::optional<u32>{ 2 });
    EXPECT_EQ(symbols.lookup("last"), std::optional<u32>{ 2 });
    EXPECT_EQ(symbols.lookup("X"), std::optional<u32>{ 3 });
    EXPECT_EQ(symbols.lookup("Y"), std::optional<u32>{ 4 });
    EXPECT_FALSE(symbols.lookup("missing").has_value());

    auto prog = Program{};
    ASSERT_TRUE(Assembler::encode_program(lines, symbols, AssembleOptions{}, prog, diag));
    ASSERT_EQ(prog.words.size(), 3u);
    EXPECT_EQ(prog.words[0].bits, make_branch_instr(Condition::NONE, 2));
    EXPECT_EQ(prog.words[1].bits, make_immediate_instr(Opcode::MV, Register::R0, 3));
}

TEST(Assembler, DefineUsedBeforeItIsDeclared) {
    EXPECT_EQ(single_word("sub r2, COUNT\n.define COUNT 0x20"), 0x7420);
}

TEST(Assembler, AddressIsTakenEvenIfEncodingWouldFail) {
    auto lines = Assembler::split_lines("mv r9, r0\nnext: add r0, r1");
    auto diag = Diagnostics{ .errors = {}, .warnings = {}, .echo = false };
    auto symbols = SymbolTable{};
    ASSERT_TRUE(Assembler::build_symbol_table(lines, AssembleOptions{}, symbols, diag));
    EXPECT_EQ(symbols.lookup("next"), std::optional<u32>{ 1 });
}

TEST(Assembler, RegisterForms) {
    EXPECT_EQ(single_word("ld r1, [r2]"), 0x8202);
    EXPECT_EQ(single_word("ld r1, r2"), 0x8202);
    EXPECT_EQ(single_word("st r3, [ r4 ]"), 0xA604);
    EXPECT_EQ(single_word("and r5, r6"), 0xCA06);
    EXPECT_EQ(single_word("mv pc, r0"), single_word("mv r7, r0"));
}

TEST(Assembler, ImmediateRange) {
    EXPECT_EQ(single_word("add r0, #0x1FF"), 0x51FF);
    EXPECT_EQ(single_word("add r0, 0"), 0x5000);
    expect_error("add r0, #0x200", ErrorKind::IMMEDIATE_TOO_LARGE, 1);
    expect_error("mv r0, #99999999999999999999999", ErrorKind::IMMEDIATE_TOO_LARGE, 1);
}

TEST(Assembler, MvtTakesUpperByte) {
    EXPECT_EQ(single_word("mvt r0, #0xFF00"), 0x30FF);
    EXPECT_EQ(single_word(".define HI 0x1200\nmvt r2, HI"), 0x3412);
    expect_error("mvt r0, #0x0101", ErrorKind::BAD_MVT_IMMEDIATE, 1);
    expect_error("mvt r0, #0x10000", ErrorKind::IMMEDIATE_TOO_LARGE, 1);
}

TEST(Assembler, BranchTargetMustFitInMemory) {
    auto result = assemble("DEPTH 16\nb #15");
    ASSERT_TRUE(result.ok);
    EXPECT_EQ(result.program.depth_words, 16u);

    expect_error("DEPTH 16\nb #16", ErrorKind::BRANCH_TOO_LARGE, 2);
    expect_error("b #256", ErrorKind::BRANCH_TOO_LARGE, 1);
}

TEST(Assembler, UnknownInstructions) {
    expect_error("foo r1, r2", ErrorKind::UNKNOWN_INSTRUCTION, 1);
    expect_error("ld r1, #5", ErrorKind::UNKNOWN_INSTRUCTION, 1);
    expect_error("mvt r1, r2", ErrorKind::UNKNOWN_INSTRUCTION, 1);
    expect_error("mv #3", ErrorKind::UNKNOWN_INSTRUCTION, 1);
    expect_error("beq r1, r2", ErrorKind::UNKNOWN_INSTRUCTION, 1);
}

TEST(Assembler, UnknownRegisters) {
    expect_error("mv r8, r1", ErrorKind::UNKNOWN_REGISTER, 1);
    expect_error("add sp, #1", ErrorKind::UNKNOWN_REGISTER, 1);
}

TEST(Assembler, IndirectOnlyForLoadStore) {
    expect_error("add r1, [r2]", ErrorKind::BAD_INDIRECT, 1);
    expect_error("mv r1, [r2]", ErrorKind::BAD_INDIRECT, 1);
    expect_error("add r9, [r1]", ErrorKind::BAD_INDIRECT, 1);

    // Checked before the mnemonic itself
    expect_error("mvt r1, [r2]", ErrorKind::BAD_INDIRECT, 1);
    expect_error("beq r1, [r2]", ErrorKind::BAD_INDIRECT, 1);
    expect_error("foo r1, [r2]", ErrorKind::BAD_INDIRECT, 1);
}

TEST(Assembler, UndefinedSymbol) {
    expect_error("mv r0, r1\nadd r0, missing", ErrorKind::UNDEFINED_SYMBOL, 2);
    expect_error("bne nowhere", ErrorKind::UNDEFINED_SYMBOL, 1);
}

TEST(Assembler, Redefinitions) {
    expect_error("a:\na:", ErrorKind::SYMBOL_REDEFINED, 2);
    expect_error(".define A 1\nA: mv r0, r1", ErrorKind::SYMBOL_REDEFINED, 2);
    expect_error("A: mv r0, r1\n.define A 1", ErrorKind::SYMBOL_REDEFINED, 2);
    expect_error("DEPTH: mv r0, r1", ErrorKind::RESERVED_SYMBOL, 1);
    expect_error("DEPTH:", ErrorKind::RESERVED_SYMBOL, 1);
}

TEST(Assembler, DefineValues) {
    EXPECT_TRUE(assemble(".define MAX 65535").ok);
    expect_error(".define BIG 65536", ErrorKind::DEFINE_TOO_LARGE, 1);
    expect_error(".define BAD 0xZZ", ErrorKind::BAD_DATA, 1);
}

TEST(Assembler, DepthDirective) {
    // Even is enough, it doesn't have to be a power of two
    auto result = assemble("DEPTH 6\n.word 1");
    ASSERT_TRUE(result.ok);
    EXPECT_EQ(result.program.depth_words, 6u);

    expect_error("DEPTH 7", ErrorKind::BAD_DEPTH, 1);
    expect_error("DEPTH 0", ErrorKind::BAD_DEPTH, 1);
    expect_error("DEPTH 8589934592", ErrorKind::BAD_DEPTH, 1);
    expect_error("DEPTH 16\nDEPTH 32", ErrorKind::DEPTH_REDEFINED, 2);
    expect_error("mv r0, r1\nDEPTH 16", ErrorKind::DEPTH_REDEFINED, 2);
}

TEST(Assembler, DepthErrorShowsRequestedDepth) {
    auto result = assemble("DEPTH 7");
    ASSERT_EQ(result.diag.errors.size(), 1u);
    EXPECT_EQ(result.diag.errors[0].message,
        "ERROR: line 1: memory depth must be an integer multiple of 2 (depth is 7)");

    result = assemble("\nDEPTH 007");
    ASSERT_EQ(result.diag.errors.size(), 1u);
    EXPECT_EQ(result.diag.errors[0].message,
        "ERROR: line 2: memory depth must be an integer multiple of 2 (depth is 7)");
}

TEST(Assembler, DepthAllowsLeadingZeros) {
    auto result = assemble("DEPTH 064");
    ASSERT_TRUE(result.ok);
    EXPECT_EQ(result.program.depth_words, 64u);
}

TEST(Assembler, RecordedMessageKeepsDetail) {
    auto result = assemble("add r0, missing");
    ASSERT_EQ(result.diag.errors.size(), 1u);
    EXPECT_EQ(result.diag.errors[0].message,
        "ERROR: line 1: undeclared identifier (label or define), or value error ('missing')");

    result = assemble("mv r0, r1\n???");
    ASSERT_EQ(result.diag.errors.size(), 1u);
    EXPECT_EQ(result.diag.errors[0].message, "ERROR: line 2: can't parse assembly code ('???')");
}

TEST(Assembler, ProgramMustFitInMemory) {
    EXPECT_TRUE(assemble("DEPTH 2\n.word 1\n.word 2").ok);
    expect_error("DEPTH 2\n.word 1\n.word 2\n.word 3", ErrorKind::PROGRAM_TOO_LARGE, 4);
}

TEST(Assembler, DataWords) {
    auto result = assemble("table: .word 0b1010\n.word 65535\n.word 0");
    ASSERT_TRUE(result.ok);
    ASSERT_EQ(result.program.words.size(), 3u);
    EXPECT_EQ(result.program.words[0].bits, 0b1010);
    EXPECT_EQ(result.program.words[1].bits, 0xFFFF);
    for (const auto &word : result.program.words) {
        EXPECT_FALSE(word.is_instruction);
    }

    expect_error(".word 0x10000", ErrorKind::BAD_DATA, 1);
    expect_error(".word loop\nloop: b loop", ErrorKind::BAD_DATA, 1);
}

TEST(Assembler, UnrecognizedLineIsAnErrorByDefault) {
    expect_error("mv r0, r1\nthis is not assembly\nadd r0, r1", ErrorKind::BAD_SYNTAX, 2);
}

TEST(Assembler, LenientModeSkipsUnrecognizedLines) {
    auto result = assemble("mv r0, r1\nthis is not assembly\nnext: add r0, r1", true);
    ASSERT_TRUE(result.ok);
    EXPECT_TRUE(result.diag.errors.empty());
    ASSERT_EQ(result.diag.warnings.size(), 1u);
    EXPECT_EQ(result.diag.warnings[0].line, 2u);
    ASSERT_EQ(result.program.words.size(), 2u);
    EXPECT_EQ(result.program.words[1].bits, 0x4001);
}

TEST(Assembler, FirstPassErrorStopsBeforeEncoding) {
    // Line 1 would fail in pass 2, but pass 1 fails first on line 2
    expect_error("add r0, missing\n.define DEPTH 1", ErrorKind::RESERVED_SYMBOL, 2);
}

TEST(Assembler, SecondPassStopsAtFirstError) {
    expect_error("add r0, missing\nmv r9, r0\nadd r0, #0x400", ErrorKind::UNDEFINED_SYMBOL, 1);
}

TEST(Assembler, CommentsAndWhitespace) {
    auto result = assemble(
        "// header comment\n"
        "\n"
        "   mv   r0, #1    // load one\n"
        "\tadd r0,r0\n");
    ASSERT_TRUE(result.ok);
    ASSERT_EQ(result.program.words.size(), 2u);
    EXPECT_EQ(result.program.words[0].bits, 0x1001);
    EXPECT_EQ(result.program.words[1].bits, 0x4000);
}
