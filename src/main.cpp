#include <cstdio>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <string_view>

#include "types.hpp"
#include "assembler.hpp"
#include "mif.hpp"
#include "options.hpp"

static std::optional<std::string> read_file(std::string_view filename) {
    const auto path = std::filesystem::path(filename);

    std::error_code ec;
    if (filename.empty() || !std::filesystem::is_regular_file(path, ec)) {
        return std::nullopt;
    }

    std::ifstream stream(path, std::ios::in | std::ios::binary);
    if (!stream) {
        return std::nullopt;
    }

    auto buf = std::string();
    stream.seekg(0, std::ios::end);
    buf.resize(std::size_t(stream.tellg()));
    stream.seekg(0, std::ios::beg);
    stream.read(buf.data(), std::streamsize(buf.size()));

    if (!stream) {
        return std::nullopt;
    }
    return buf;
}

static bool write_file(const std::string &filename, const std::string &contents) {
    std::ofstream stream(filename, std::ios::out | std::ios::trunc);
    if (!stream) {
        return false;
    }

    stream << contents;
    stream.close();
    return bool(stream);
}

int main(int argc, char **argv) {
    auto opts = Options{};
    if (!parse_options(argc, argv, opts)) {
        return 1;
    }

    auto source = read_file(opts.input_file);
    if (!source) {
        std::printf("Input file: %.*s is invalid\n", (int)opts.input_file.length(), opts.input_file.data());
        return 1;
    }

    auto prog = Program{};
    auto diag = Diagnostics{};
    const auto assemble_opts = AssembleOptions{ .lenient = opts.lenient };

    if (!Assembler::assemble(*source, assemble_opts, prog, diag)) {
        return 1;
    }

    const auto mif = format_mif(prog);

    if (opts.print) {
        std::printf("%s", mif.c_str());
    }

    auto warns = diag.warnings.size();
    if (opts.dry_run) {
        std::printf("Dry run finished: %zu word%s, %zu warning%s\n",
            prog.words.size(), prog.words.size() == 1 ? "" : "s",
            warns, warns == 1 ? "" : "s");
        return 0;
    }

    if (!write_file(opts.output_file, mif)) {
        std::printf("Output file: %s is invalid\n", opts.output_file.c_str());
        return 1;
    }

    std::printf("Assembled %zu word%s into %s with %zu warning%s\n",
        prog.words.size(), prog.words.size() == 1 ? "" : "s",
        opts.output_file.c_str(),
        warns, warns == 1 ? "" : "s");

    return 0;
}
