#include "raopd/browse.hpp"

#include "raopd/log.hpp"
#include "raopd/rr.hpp"
#include "raopd/rrtext.hpp"

namespace raopd {

static void log_rejected(std::string_view tag, const BrowseItem &item, std::string_view why)
{
    log_warn(tag, "skipping record (ifindex {}, class {}, type {}): {}",
             item.ifindex, item.klass, item.type, why);
    if (!log_enabled(LogLevel::Debug)) return;
    RrTextResult txt = format_rr_text(item.data);
    if (txt.rc == 0) log_debug(tag, "  {}", txt.text);
}

BrowseOutcome browse_candidates(Resolver &resolver,
                                const std::string &service,
                                std::uint64_t flags,
                                int retries,
                                std::string_view tag)
{
    BrowseOutcome out{};
    BrowseResult br = resolver.resolve_record(kIfindexAny, service, kClassIn, kTypePtr, flags);
    if (br.rc != 0)
    {
        out.rc = -1;
        out.error = std::move(br.error);
        return out;
    }
    log_debug(tag, "browse {}: {} record(s) in {:.3f} ms, flags {:#x}",
              service, br.items.size(), br.ms, br.flags);

    for (const BrowseItem &item : br.items)
    {
        if (item.klass != kClassIn || item.type != kTypePtr)
        {
            log_rejected(tag, item, "unexpected class/type on ptr request");
            ++out.skipped;
            continue;
        }
        RecordResult rr = parse_rr(item.data);
        if (rr.rc != 0)
        {
            log_rejected(tag, item, rr.error);
            ++out.skipped;
            continue;
        }
        if (rr.rr.klass != kClassIn || rr.rr.type != kTypePtr)
        {
            log_rejected(tag, item, "unexpected class/type in record");
            ++out.skipped;
            continue;
        }
        NameResult target = parse_name(rr.rr.payload);
        if (target.rc != 0)
        {
            log_rejected(tag, item, target.error);
            ++out.skipped;
            continue;
        }
        CandidateHost h{};
        h.ifindex = item.ifindex;
        h.name = std::move(rr.rr.name);
        h.domain = std::move(target.name);
        h.retries = retries;
        out.hosts.push_back(std::move(h));
    }
    return out;
}

} // namespace raopd
