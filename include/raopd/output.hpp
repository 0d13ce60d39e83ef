#pragma once

#include <string>

namespace raopd
{
struct Options;

// Startup banner (one line per setting, trailing newline on each line)
std::string format_header_text(const Options &opt);
} // namespace raopd
