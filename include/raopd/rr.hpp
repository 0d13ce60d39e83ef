#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace raopd {

using Bytes = std::span<const std::uint8_t>;

inline constexpr std::uint16_t kClassIn = 1;
inline constexpr std::uint16_t kTypePtr = 12;

enum class DecodeErrorKind {
    None = 0,
    Truncated,     // buffer ended before a fixed-width field / terminator
    LabelOverrun,  // label length runs past the buffer
    PayloadOverrun // rdlength runs past the buffer
};

struct ResourceRecord {
    std::string               name;
    std::uint16_t             type{};
    std::uint16_t             klass{};
    std::uint32_t             ttl{};
    std::vector<std::uint8_t> payload;
};

struct NameResult {
    int             rc{};       // 0 on success, -1 on error
    std::string     error;      // when rc != 0
    DecodeErrorKind kind{DecodeErrorKind::None};
    std::size_t     offset{};   // byte offset of the failure (or bytes consumed)
    Bytes           rest;       // remaining input after the name
    std::string     name;
};

struct RecordResult {
    int             rc{};
    std::string     error;
    DecodeErrorKind kind{DecodeErrorKind::None};
    std::size_t     offset{};
    Bytes           rest;
    ResourceRecord  rr;
};

// 長さ付きラベル列を '.' で連結する。圧縮ポインタは非対応 (通常の長さとして扱う)
NameResult parse_name(Bytes input);

// name, type, class, ttl, rdlength, rdata の順に読む (big-endian)
RecordResult parse_rr(Bytes input);

const char *decode_error_str(DecodeErrorKind kind);

} // namespace raopd
