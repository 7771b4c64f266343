#include "mif.hpp"

#include <cstdio>

#include "instructions.hpp"

std::string format_mif(const Program &program) {
    std::string out{};
    char buf[128];

    std::snprintf(buf, sizeof(buf),
        "WIDTH = %u;\n"
        "DEPTH = %u;\n"
        "ADDRESS_RADIX = HEX;\n"
        "DATA_RADIX = HEX;\n"
        "\n"
        "CONTENT\n"
        "BEGIN\n",
        program.width_bits, program.depth_words);
    out += buf;

    const int digits = int(program.width_bits / 4);
    for (std::size_t address = 0; address < program.words.size(); ++address) {
        const auto &word = program.words[address];
        const auto comment = word.is_instruction ? disassemble(word.bits) : std::string{ "data" };

        // <address>\t\t: <word>;\t\t% <comment> %
        std::snprintf(buf, sizeof(buf), "%zx\t\t: %0*x;\t\t%% %s %%\n",
            address, digits, unsigned(word.bits), comment.c_str());
        out += buf;
    }

    out += "END;\n";
    return out;
}

std::string with_mif_extension(std::string_view file_name) {
    std::string name{ file_name };
    if (!file_name.ends_with(MIF_EXTENSION)) {
        name += MIF_EXTENSION;
    }
    return name;
}
