#include "classifier.hpp"

#include <cctype>
#include <charconv>
#include <limits>

#include "instructions.hpp"

// str.substr() does bounds checks that are redundant here
static std::string_view substring(std::string_view str, std::size_t start, std::size_t end) {
    return std::string_view { str.data() + start, end - start };
}

static std::string_view substring(std::string_view str, std::size_t start) {
    return std::string_view { str.data() + start, str.length() - start };
}

static bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c));
}

static void skip_spaces(std::string_view &str) {
    while (!str.empty() && is_space(str[0])) str = substring(str, 1);
}

static void trim_end(std::string_view &str) {
    while (!str.empty() && is_space(str.back())) str = substring(str, 0, str.length() - 1);
}

static bool is_identifier_start(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_' || c == '$';
}

static bool is_identifier_char(char c) {
    // Allow a-zA-Z0-9
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '$';
}

// Pops `[A-Za-z_$][A-Za-z0-9_$]*` off the front of str. Empty if there is none.
static std::string_view pop_identifier(std::string_view &str) {
    if (str.empty() || !is_identifier_start(str[0])) return {};

    std::size_t len = 1;
    while (len < str.length() && is_identifier_char(str[len])) len += 1;

    auto ident = substring(str, 0, len);
    str = substring(str, len);
    return ident;
}

static bool is_identifier(std::string_view str) {
    return !pop_identifier(str).empty() && str.empty();
}

// Literal or symbol: a run of identifier characters, may start with a digit.
static bool is_value_word(std::string_view str) {
    if (str.empty()) return false;
    for (char c : str) {
        if (!is_identifier_char(c)) return false;
    }
    return true;
}

// Requires at least one space, then consumes the rest of the spaces.
static bool pop_separator(std::string_view &str) {
    if (str.empty() || !is_space(str[0])) return false;
    skip_spaces(str);
    return true;
}

// `#value`, `value`. The # is optional everywhere it is allowed.
static bool pop_immediate(std::string_view str, std::string_view &out) {
    if (!str.empty() && str[0] == '#') str = substring(str, 1);
    if (!is_value_word(str)) return false;

    out = str;
    return true;
}

// DEPTH <decimal>
static bool match_depth(std::string_view line, ClassifiedLine &out) {
    if (!line.starts_with("DEPTH")) return false;
    line = substring(line, 5);

    if (!pop_separator(line) || line.empty()) return false;
    for (char c : line) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    }

    out.kind = LineKind::DEPTH;
    out.operand = line;
    return true;
}

// .define <name> <value>
static bool match_define(std::string_view line, ClassifiedLine &out) {
    if (!line.starts_with(".define")) return false;
    line = substring(line, 7);

    if (!pop_separator(line)) return false;
    auto name = pop_identifier(line);
    if (name.empty() || !pop_separator(line)) return false;
    if (!is_value_word(line)) return false;

    out.kind = LineKind::DEFINE;
    out.symbol = name;
    out.operand = line;
    return true;
}

// Pops a leading `name:` if there is one.
static std::string_view pop_label(std::string_view &line) {
    auto rest = line;
    auto name = pop_identifier(rest);
    if (name.empty() || rest.empty() || rest[0] != ':') return {};

    line = substring(rest, 1);
    skip_spaces(line);
    return name;
}

static bool match_instruction(std::string_view body, ClassifiedLine &out) {
    auto mnemonic = pop_identifier(body);
    if (mnemonic.empty() || !pop_separator(body)) return false;

    auto comma = body.find_first_of(',');
    if (comma == body.npos) {
        // Branch: one operand
        std::string_view target{};
        if (!pop_immediate(body, target)) return false;

        out.kind = LineKind::BRANCH_INSTR;
        out.mnemonic = mnemonic;
        out.operand = target;
        return true;
    }

    auto first = substring(body, 0, comma);
    auto second = substring(body, comma + 1);
    trim_end(first);
    skip_spaces(second);

    if (!is_identifier(first)) return false;

    out.mnemonic = mnemonic;
    out.reg = first;

    // Register operand, plain or [indirect]. Checked before the immediate form
    // so that `mv r0, r1` never reads r1 as a symbol.
    auto inner = second;
    bool bracketed = inner.starts_with('[') && inner.ends_with(']');
    if (bracketed) {
        inner = substring(inner, 1, inner.length() - 1);
        skip_spaces(inner);
        trim_end(inner);
    }

    if (lookup_register(inner)) {
        out.kind = LineKind::REGISTER_INSTR;
        out.operand = inner;
        out.indirect = bracketed;
        return true;
    }

    std::string_view value{};
    if (bracketed || !pop_immediate(second, value)) return false;

    out.kind = LineKind::IMMEDIATE_INSTR;
    out.operand = value;
    return true;
}

// .word <value>
static bool match_word(std::string_view body, ClassifiedLine &out) {
    if (!body.starts_with(".word")) return false;
    body = substring(body, 5);

    if (!pop_separator(body) || !is_value_word(body)) return false;

    out.kind = LineKind::WORD;
    out.operand = body;
    return true;
}

ClassifiedLine classify(std::string_view line) {
    auto result = ClassifiedLine{};

    skip_spaces(line);
    trim_end(line);

    if (line.empty() || line.starts_with("//")) {
        result.kind = LineKind::EMPTY;
        return result;
    }

    // Trailing comment
    if (auto idx = line.find("//"); idx != line.npos) {
        line = substring(line, 0, idx);
        trim_end(line);
    }

    if (match_depth(line, result)) return result;
    if (match_define(line, result)) return result;

    auto body = line;
    auto label = pop_label(body);
    if (!label.empty() && body.empty()) {
        result.kind = LineKind::LABEL;
        result.label = label;
        return result;
    }

    if (match_instruction(body, result) || match_word(body, result)) {
        result.label = label;
        return result;
    }

    return ClassifiedLine{};
}

bool parse_literal(std::string_view str, u64 &out) {
    int base = 10;
    if (str.length() > 2 && str[0] == '0') {
        switch (str[1]) {
            case 'x': case 'X': base = 16; break;
            case 'b': case 'B': base = 2; break;
            case 'o': case 'O': base = 8; break;
            default: break;
        }
        if (base != 10) str = substring(str, 2);
    }

    if (str.empty()) return false;

    if (base == 10 && str.length() > 1 && str[0] == '0') {
        // "0", "000" are fine, "012" is not
        for (char c : str) {
            if (c != '0') return false;
        }
    }

    u64 value{};
    auto result = std::from_chars(str.data(), str.data() + str.length(), value, base);
    if (result.ptr != str.data() + str.length()) return false;

    if (result.ec == std::errc::result_out_of_range) {
        value = std::numeric_limits<u64>::max();
    } else if (result.ec != std::errc{}) {
        return false;
    }

    out = value;
    return true;
}
