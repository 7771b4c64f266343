#pragma once

#include <string>
#include <string_view>

// Assembler command line options

struct Options {
    std::string_view input_file;
    std::string output_file; // ".mif" already appended
    bool dry_run = false; // assemble only, don't write the output
    bool lenient = false; // skip unparseable lines with a warning
    bool print = false;   // also print the MIF to stdout
};

bool parse_options(int argc, char **argv, Options &out);
