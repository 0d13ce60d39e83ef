#include "raopd/rr.hpp"

#include <format>

namespace raopd {

const char *decode_error_str(const DecodeErrorKind kind)
{
    switch (kind)
    {
        case DecodeErrorKind::None: return "none";
        case DecodeErrorKind::Truncated: return "truncated";
        case DecodeErrorKind::LabelOverrun: return "label overrun";
        case DecodeErrorKind::PayloadOverrun: return "payload overrun";
    }
    return "unknown";
}

namespace {

template <typename Result>
Result fail(DecodeErrorKind kind, std::size_t offset, std::string_view what)
{
    Result r{};
    r.rc = -1;
    r.kind = kind;
    r.offset = offset;
    r.error = std::format("{} at offset {}: {}", decode_error_str(kind), offset, what);
    return r;
}

std::uint16_t read_be16(Bytes in, std::size_t pos)
{
    return static_cast<std::uint16_t>((in[pos] << 8) | in[pos + 1]);
}

std::uint32_t read_be32(Bytes in, std::size_t pos)
{
    return (static_cast<std::uint32_t>(in[pos]) << 24) |
           (static_cast<std::uint32_t>(in[pos + 1]) << 16) |
           (static_cast<std::uint32_t>(in[pos + 2]) << 8) |
           static_cast<std::uint32_t>(in[pos + 3]);
}

} // namespace

NameResult parse_name(Bytes input)
{
    NameResult out{};
    std::size_t pos = 0;
    for (;;)
    {
        if (pos >= input.size())
        {
            return fail<NameResult>(DecodeErrorKind::Truncated, pos, "missing label length");
        }
        const std::size_t len = input[pos++];
        if (len == 0) break;
        if (len > input.size() - pos)
        {
            return fail<NameResult>(
                DecodeErrorKind::LabelOverrun,
                pos - 1,
                std::format("label of {} bytes, {} remaining", len, input.size() - pos));
        }
        if (!out.name.empty()) out.name.push_back('.');
        out.name.append(reinterpret_cast<const char *>(input.data() + pos), len);
        pos += len;
    }
    out.offset = pos;
    out.rest = input.subspan(pos);
    return out;
}

RecordResult parse_rr(Bytes input)
{
    NameResult nr = parse_name(input);
    if (nr.rc != 0)
    {
        RecordResult r{};
        r.rc = nr.rc;
        r.kind = nr.kind;
        r.offset = nr.offset;
        r.error = std::move(nr.error);
        return r;
    }

    // type(2) class(2) ttl(4) rdlength(2)
    constexpr std::size_t kFixed = 10;
    std::size_t pos = nr.offset;
    if (input.size() - pos < kFixed)
    {
        return fail<RecordResult>(
            DecodeErrorKind::Truncated,
            pos,
            std::format("need {} bytes of fixed fields, {} remaining", kFixed, input.size() - pos));
    }

    RecordResult out{};
    out.rr.name = std::move(nr.name);
    out.rr.type = read_be16(input, pos);
    out.rr.klass = read_be16(input, pos + 2);
    out.rr.ttl = read_be32(input, pos + 4);
    const std::size_t rdlength = read_be16(input, pos + 8);
    pos += kFixed;

    if (rdlength > input.size() - pos)
    {
        return fail<RecordResult>(
            DecodeErrorKind::PayloadOverrun,
            pos,
            std::format("rdlength {}, {} remaining", rdlength, input.size() - pos));
    }
    out.rr.payload.assign(input.begin() + pos, input.begin() + pos + rdlength);
    pos += rdlength;

    out.offset = pos;
    out.rest = input.subspan(pos);
    return out;
}

} // namespace raopd
