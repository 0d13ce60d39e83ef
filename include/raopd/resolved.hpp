#pragma once

#include <memory>
#include <string>

#include "raopd/resolver.hpp"

namespace raopd
{
// Resolver backed by org.freedesktop.resolve1 on the system bus (sd-bus).
// Each instance owns its own bus connection; use one per thread.
// Returns nullptr and fills error when the connection cannot be opened.
std::unique_ptr<Resolver> open_resolved_bus(int timeout_ms, std::string &error);
} // namespace raopd
