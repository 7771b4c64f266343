#include "options.hpp"

#include <cstdio>
#include <cstdlib> // std::exit()

#include "args.hpp"
#include "mif.hpp"

namespace {
    struct OptionHelp {
        const char *short_name;
        const char *long_name;
        const char *text;
    };

    constexpr OptionHelp OPTION_HELP[] = {
        { "-d", "--dry",     "Assembles the file but does not write the output." },
        { "-l", "--lenient", "Skips lines that can't be parsed (with a warning) instead of failing." },
        { "-p", "--print",   "Also prints the generated MIF to stdout." },
        { "",   "--help",    "Shows this page." },
        { "-v", "--version", "Shows version information." },
    };
}

static void print_version() {
    std::printf("sbasm 1.0.0, assembler for the 16-bit educational processor\n");
}

static void print_usage() {
    std::printf("Usage: sbasm <input file> [output file, default %s] [option(s)]\n", DEFAULT_OUTPUT_NAME.data());
}

static void print_help() {
    print_version();
    std::printf("\n");
    print_usage();

    std::printf("\nOptions:\n");
    for (const auto &opt : OPTION_HELP) {
        std::printf("  %-3s %-10s  %s\n", opt.short_name, opt.long_name, opt.text);
    }
}

static void print_list(const char *prefix, const std::vector<std::string_view> &items) {
    std::printf("%s", prefix);
    for (std::size_t i = 0; i < items.size(); ++i) {
        std::printf("%s\"%.*s\"", i ? ", " : "", (int)items[i].length(), items[i].data());
    }
    std::printf("\n");
}

bool parse_options(int argc, char **argv, Options &out) {
    bool show_help = false, show_version = false;

    auto result = Args::parser()
        .add_arg("d", "dry", out.dry_run)
        .add_arg("l", "lenient", out.lenient)
        .add_arg("p", "print", out.print)
        .add_arg("help", show_help)
        .add_arg("v", "version", show_version)
        .parse(std::size_t(argc), argv);

    if (show_help) {
        print_help();
        std::exit(0);
    }

    if (show_version) {
        print_version();
        std::exit(0);
    }

    for (const auto &err : result.errors) {
        std::printf("ERROR: %s\n", err.c_str());
    }
    if (!result.errors.empty()) return false;

    if (!result.unrecognized_options.empty()) {
        print_list("Warning: Ignoring unrecognized options: ", result.unrecognized_options);
    }

    const auto &files = result.remaining_args;
    if (files.empty() || files.size() > 2) {
        std::printf("ERROR: Too %s arguments.\n", files.empty() ? "few" : "many");
        print_usage();
        return false;
    }

    out.input_file = files[0];

    const auto output = files.size() == 2 ? files[1] : DEFAULT_OUTPUT_NAME;
    if (output.find_first_not_of(" \t") == output.npos) {
        std::printf("Output file: %.*s is invalid\n", (int)output.length(), output.data());
        return false;
    }
    out.output_file = with_mif_extension(output);

    return true;
}
