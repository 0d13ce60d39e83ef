#pragma once

#include <string>

#include "raopd/rr.hpp"

namespace raopd {

enum class RrTextErrorKind {
    None = 0,
    NotAvailable,
    ParseFailed,
};

struct RrTextResult {
    int rc{};             // 0 on success, -1 on error
    std::string error;    // error message when rc != 0
    RrTextErrorKind kind{RrTextErrorKind::None};
    std::string text;     // presentation format, e.g. "x._raop._tcp.local. 120 IN PTR ..."
};

// Render one wire-format RR in presentation format using ldns when available.
// When ldns is not available at build time, returns rc = -1 and kind = NotAvailable.
RrTextResult format_rr_text(Bytes wire);

} // namespace raopd
