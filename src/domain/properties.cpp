#include "raopd/properties.hpp"

#include <cstdio>

#include <sys/socket.h>

#include "raopd/log.hpp"

namespace raopd {

namespace {
constexpr std::string_view kTag = "registry";

std::optional<std::string_view> strip_prefix(std::string_view s, std::string_view prefix)
{
    if (!s.starts_with(prefix)) return std::nullopt;
    return s.substr(prefix.size());
}

void append_quoted(std::string &out, std::string_view s)
{
    out.push_back('"');
    for (unsigned char uc : s)
    {
        switch (char c = static_cast<char>(uc))
        {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (uc < 0x20)
                {
                    char buf[7];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", uc);
                    out += buf;
                }
                else
                {
                    out += c;
                }
        }
    }
    out.push_back('"');
}
} // namespace

bool list_contains(std::string_view list, std::string_view v)
{
    std::size_t start = 0;
    for (;;)
    {
        const std::size_t comma = list.find(',', start);
        if (list.substr(start, comma - start) == v) return true;
        if (comma == std::string_view::npos) return false;
        start = comma + 1;
    }
}

ReceiverTraits parse_txt_traits(const std::vector<std::string> &txt)
{
    ReceiverTraits t{};
    bool seen_am = false, seen_tp = false, seen_et = false, seen_cn = false;

    for (const std::string &record : txt)
    {
        if (auto am = strip_prefix(record, "am="))
        {
            if (seen_am) continue;
            seen_am = true;
            t.name = std::string(*am);
        }
        else if (auto tp = strip_prefix(record, "tp="))
        {
            if (seen_tp) continue;
            seen_tp = true;
            if (list_contains(*tp, "UDP")) t.transport = "udp";
            else if (list_contains(*tp, "TCP")) t.transport = "tcp";
            else log_warn(kTag, "unknown transport: {}", *tp);
        }
        else if (auto et = strip_prefix(record, "et="))
        {
            if (seen_et) continue;
            seen_et = true;
            if (list_contains(*et, "1")) t.encryption = "RSA";
            else if (list_contains(*et, "4")) t.encryption = "auth_setup";
            else
            {
                log_warn(kTag, "unknown encryption type: {}", *et);
                t.encryption = "none";
            }
        }
        else if (auto cn = strip_prefix(record, "cn="))
        {
            if (seen_cn) continue;
            seen_cn = true;
            if (list_contains(*cn, "3")) t.codec = "AAC-ELD";
            else if (list_contains(*cn, "2")) t.codec = "AAC";
            else if (list_contains(*cn, "1")) t.codec = "ALAC";
            else if (list_contains(*cn, "0")) t.codec = "PCM";
            else log_warn(kTag, "unknown codec: {}", *cn);
        }
    }
    return t;
}

SinkProperties compose_sink_properties(const DiscoveredEndpoint &ep, const ReceiverTraits &traits)
{
    const bool v4 = ep.address.af == AF_INET;
    std::string name = traits.name;
    if (v4) name += " (IPv4)";

    SinkProperties props{
        {"raop.ip", ip_string(ep.address)},
        {"raop.ip.version", v4 ? "4" : "6"},
        {"raop.port", std::to_string(ep.address.port)},
        {"raop.name", std::move(name)},
        {"raop.hostname", ep.hostname},
    };
    if (traits.transport) props.emplace_back("raop.transport", *traits.transport);
    if (traits.encryption) props.emplace_back("raop.encryption.type", *traits.encryption);
    if (traits.codec) props.emplace_back("raop.audio.codec", *traits.codec);
    return props;
}

std::string serialize_properties(const SinkProperties &props)
{
    std::string out = "{";
    for (const auto &[key, value] : props)
    {
        out.push_back(' ');
        append_quoted(out, key);
        out += " = ";
        append_quoted(out, value);
    }
    out += " }";
    return out;
}

} // namespace raopd
