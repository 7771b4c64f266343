#pragma once

#include <string>
#include <string_view>

#include "program.hpp"

constexpr std::string_view DEFAULT_OUTPUT_NAME = "a.mif";
constexpr std::string_view MIF_EXTENSION = ".mif";

// Memory Initialization File text for the program. Instruction words get their
// disassembly as a comment, data words get "data".
std::string format_mif(const Program &program);

// Appends ".mif" unless the name already ends with it.
std::string with_mif_extension(std::string_view file_name);
