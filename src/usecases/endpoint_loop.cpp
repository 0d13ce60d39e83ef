#include "raopd/endpoint.hpp"

#include <algorithm>
#include <array>

#include <sys/socket.h>

#include "raopd/browse.hpp"
#include "raopd/log.hpp"

namespace raopd {

namespace {
constexpr std::string_view kTag = "resolve";

std::string hex_bytes(const std::vector<std::uint8_t> &bytes)
{
    std::string s;
    for (std::uint8_t b : bytes)
    {
        if (!s.empty()) s.push_back(' ');
        s += std::format("{:02x}", b);
    }
    return s;
}

constexpr std::string_view kReplacement = "\xEF\xBF\xBD"; // U+FFFD

// Length of the valid UTF-8 sequence at pos, or of the maximal invalid
// prefix (negated) that one U+FFFD replaces.
int utf8_sequence(const std::vector<std::uint8_t> &b, std::size_t pos)
{
    const std::uint8_t lead = b[pos];
    if (lead < 0x80) return 1;

    int need = 0;
    std::uint8_t lo = 0x80, hi = 0xBF;
    if (lead >= 0xC2 && lead <= 0xDF) need = 1;
    else if (lead == 0xE0) { need = 2; lo = 0xA0; }
    else if (lead >= 0xE1 && lead <= 0xEC) need = 2;
    else if (lead == 0xED) { need = 2; hi = 0x9F; }
    else if (lead >= 0xEE && lead <= 0xEF) need = 2;
    else if (lead == 0xF0) { need = 3; lo = 0x90; }
    else if (lead >= 0xF1 && lead <= 0xF3) need = 3;
    else if (lead == 0xF4) { need = 3; hi = 0x8F; }
    else return -1;

    int len = 1;
    for (int k = 0; k < need; ++k)
    {
        const std::size_t at = pos + 1 + k;
        if (at >= b.size()) return -len;
        const std::uint8_t c = b[at];
        if (c < lo || c > hi) return -len;
        lo = 0x80;
        hi = 0xBF;
        ++len;
    }
    return len;
}
} // namespace

int family_to_af(const Family f)
{
    switch (f)
    {
        case Family::IPv4: return AF_INET;
        case Family::IPv6: return AF_INET6;
    }
    return AF_INET;
}

const char *family_str(const Family f)
{
    switch (f)
    {
        case Family::IPv4: return "inet";
        case Family::IPv6: return "inet6";
    }
    return "inet";
}

std::optional<SocketAddress> make_socket_address(const ServiceAddress &a, const std::uint16_t port)
{
    if (a.af == AF_INET6 && a.bytes.size() == 16)
    {
        std::array<std::uint8_t, 16> raw{};
        std::ranges::copy(a.bytes, raw.begin());
        return make_ipv6(raw, port, static_cast<std::uint32_t>(a.ifindex));
    }
    if (a.af == AF_INET && a.bytes.size() == 4)
    {
        std::array<std::uint8_t, 4> raw{};
        std::ranges::copy(a.bytes, raw.begin());
        return make_ipv4(raw, port);
    }
    log_warn(kTag, "unknown address family: {} [{}]", a.af, hex_bytes(a.bytes));
    return std::nullopt;
}

std::vector<std::string> decode_txt(const std::vector<std::vector<std::uint8_t>> &txt)
{
    std::vector<std::string> out;
    out.reserve(txt.size());
    for (const auto &entry : txt)
    {
        std::string text;
        text.reserve(entry.size());
        for (std::size_t pos = 0; pos < entry.size();)
        {
            const int n = utf8_sequence(entry, pos);
            if (n > 0)
            {
                text.append(reinterpret_cast<const char *>(entry.data() + pos), n);
                pos += n;
            }
            else
            {
                text += kReplacement;
                pos += -n;
            }
        }
        out.push_back(std::move(text));
    }
    return out;
}

CycleStatus run_resolve_cycle(Resolver &resolver,
                              Sender<DiscoveredEndpoint> &tx,
                              const Options &opt)
{
    const std::uint64_t browse_flags = opt.family == Family::IPv4 ? kMdnsIpv4 : kMdnsIpv6;
    log_debug(kTag, "scanning, family = {}", family_str(opt.family));

    BrowseOutcome bo = browse_candidates(resolver, opt.service, browse_flags, opt.retries, kTag);
    if (bo.rc != 0)
    {
        log_warn(kTag, "browse {} failed: {}", opt.service, bo.error);
        return CycleStatus::BrowseFailed;
    }

    for (const CandidateHost &target : bo.hosts)
    {
        ServiceResult sr = resolver.resolve_service(
            kIfindexAny, "", "", target.domain, family_to_af(opt.family), 0);
        if (sr.rc != 0)
        {
            log_warn(kTag, "resolve {} failed: {}", target.domain, sr.error);
            continue;
        }

        log_debug(kTag, "{}: canonical {} / {} / {}, flags {:#x}, {:.3f} ms",
                  target.domain, sr.canonical_name, sr.canonical_type, sr.canonical_domain,
                  sr.flags, sr.ms);
        const std::vector<std::string> txt = decode_txt(sr.txt);

        for (const ServiceRecord &srv : sr.srvs)
        {
            log_debug(kTag, "{}: host {} port {} priority {} weight {} ({} address(es))",
                      srv.domain, srv.hostname, srv.port, srv.priority, srv.weight,
                      srv.addresses.size());
            for (const ServiceAddress &a : srv.addresses)
            {
                std::optional<SocketAddress> sa = make_socket_address(a, srv.port);
                if (!sa) continue;

                DiscoveredEndpoint ep{};
                ep.hostname = srv.hostname;
                ep.address = *sa;
                ep.txt = txt;
                if (!tx.send(std::move(ep)))
                {
                    log_error(kTag, "receiver is dead");
                    return CycleStatus::ChannelClosed;
                }
            }
        }
    }
    return CycleStatus::Ok;
}

void run_resolve_loop(Resolver &resolver,
                      Sender<DiscoveredEndpoint> tx,
                      const Options &opt,
                      const Cancellation *cancel)
{
    const auto interval = std::chrono::milliseconds(opt.interval_ms);
    while (!(cancel && cancel->is_cancelled()))
    {
        if (run_resolve_cycle(resolver, tx, opt) == CycleStatus::ChannelClosed) return;
        if (!sleep_or_cancel(interval, cancel)) break;
    }
    log_debug(kTag, "loop stopped");
}

} // namespace raopd
