#pragma once

#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "raopd/resolver.hpp"
#include "raopd/sink.hpp"

// Wire-format helpers and scripted collaborators shared by the tests.

inline void put_name(std::vector<std::uint8_t> &out, std::string_view dotted)
{
    std::size_t start = 0;
    while (start < dotted.size())
    {
        std::size_t dot = dotted.find('.', start);
        if (dot == std::string_view::npos) dot = dotted.size();
        out.push_back(static_cast<std::uint8_t>(dot - start));
        out.insert(out.end(), dotted.begin() + start, dotted.begin() + dot);
        start = dot + 1;
    }
    out.push_back(0);
}

inline void put_u16(std::vector<std::uint8_t> &out, std::uint16_t v)
{
    out.push_back(static_cast<std::uint8_t>(v >> 8));
    out.push_back(static_cast<std::uint8_t>(v & 0xff));
}

inline void put_u32(std::vector<std::uint8_t> &out, std::uint32_t v)
{
    put_u16(out, static_cast<std::uint16_t>(v >> 16));
    put_u16(out, static_cast<std::uint16_t>(v & 0xffff));
}

inline std::vector<std::uint8_t> encode_rr(std::string_view name,
                                           std::uint16_t type,
                                           std::uint16_t klass,
                                           std::uint32_t ttl,
                                           const std::vector<std::uint8_t> &payload)
{
    std::vector<std::uint8_t> out;
    put_name(out, name);
    put_u16(out, type);
    put_u16(out, klass);
    put_u32(out, ttl);
    put_u16(out, static_cast<std::uint16_t>(payload.size()));
    out.insert(out.end(), payload.begin(), payload.end());
    return out;
}

// PTR browse answer element pointing at `target`
inline raopd::BrowseItem ptr_item(int ifindex, std::string_view service, std::string_view target)
{
    std::vector<std::uint8_t> rdata;
    put_name(rdata, target);
    raopd::BrowseItem item{};
    item.ifindex = ifindex;
    item.klass = 1;
    item.type = 12;
    item.data = encode_rr(service, 12, 1, 4500, rdata);
    return item;
}

inline std::vector<std::uint8_t> bytes_of(std::string_view s)
{
    return {s.begin(), s.end()};
}

// Returns scripted browse results in order (the last one repeats) and
// service results by domain.
class FakeResolver final : public raopd::Resolver
{
public:
    std::deque<raopd::BrowseResult> browse_script;
    std::map<std::string, raopd::ServiceResult> services;

    int browse_calls = 0;
    std::vector<std::uint64_t> browse_flags;
    std::vector<std::string> resolved_domains;
    std::vector<int> resolved_families;

    raopd::BrowseResult resolve_record(int,
                                       const std::string &,
                                       std::uint16_t,
                                       std::uint16_t,
                                       std::uint64_t flags) override
    {
        ++browse_calls;
        browse_flags.push_back(flags);
        if (browse_script.empty()) return {};
        raopd::BrowseResult r = browse_script.front();
        if (browse_script.size() > 1) browse_script.pop_front();
        return r;
    }

    raopd::ServiceResult resolve_service(int,
                                         const std::string &,
                                         const std::string &,
                                         const std::string &domain,
                                         int family,
                                         std::uint64_t) override
    {
        resolved_domains.push_back(domain);
        resolved_families.push_back(family);
        auto it = services.find(domain);
        if (it == services.end())
        {
            raopd::ServiceResult r{};
            r.rc = -1;
            r.error = "org.freedesktop.resolve1.NoSuchRR: no such record";
            return r;
        }
        return it->second;
    }
};

class CountingSinkLoader final : public raopd::SinkLoader
{
public:
    int calls = 0;
    int fail_next = 0;
    std::vector<std::string> modules;
    std::vector<std::string> args;

    raopd::SinkLoadResult load(const std::string &module, const std::string &a) override
    {
        ++calls;
        modules.push_back(module);
        args.push_back(a);
        raopd::SinkLoadResult out{};
        if (fail_next > 0)
        {
            --fail_next;
            out.rc = -1;
            out.error = "module failed to initialize";
            return out;
        }
        out.handle = std::make_unique<raopd::SinkHandle>();
        return out;
    }
};
