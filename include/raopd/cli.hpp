#pragma once

#include "raopd/options.hpp"

namespace raopd
{
enum class CliResult { Run, Help, Error };

void print_usage(const char *prog);

// Parses argv into opt. Prints diagnostics (and usage for --help).
CliResult parse_args(int argc, char **argv, Options &opt);
} // namespace raopd
