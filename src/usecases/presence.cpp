#include "raopd/presence.hpp"

#include <algorithm>
#include <format>
#include <iterator>

#include "raopd/browse.hpp"
#include "raopd/log.hpp"

namespace raopd {

namespace {
constexpr std::string_view kTag = "presence";
}

std::string to_string(const CandidateHost &h)
{
    return std::format("{} -> {} (ifindex {}, retries {})", h.name, h.domain, h.ifindex, h.retries);
}

PresenceTracker::PresenceTracker(int retries)
    : retries_(retries < 0 ? 0 : retries)
{}

ReconcileReport PresenceTracker::reconcile(const std::vector<CandidateHost> &seen)
{
    ReconcileReport report{};

    std::set<CandidateHost> now;
    for (CandidateHost h : seen)
    {
        h.retries = retries_;
        now.insert(std::move(h));
    }

    std::vector<CandidateHost> readd;
    std::ranges::set_difference(stable_, now, std::back_inserter(readd));
    for (CandidateHost &h : readd)
    {
        if (h.retries == 0)
        {
            report.removed.push_back(std::move(h));
            continue;
        }
        --h.retries;
        now.insert(std::move(h));
    }

    std::ranges::set_difference(now, stable_, std::back_inserter(report.added));

    stable_ = std::move(now);
    return report;
}

bool run_presence_cycle(Resolver &resolver, PresenceTracker &tracker, const Options &opt)
{
    BrowseOutcome bo = browse_candidates(
        resolver, opt.service, kMdnsIpv4 | kMdnsIpv6, tracker.retries(), kTag);
    if (bo.rc != 0)
    {
        log_warn(kTag, "browse {} failed: {}", opt.service, bo.error);
        return false;
    }

    ReconcileReport report = tracker.reconcile(bo.hosts);
    for (const CandidateHost &h : report.added) log_info(kTag, "added host: {}", to_string(h));
    for (const CandidateHost &h : report.removed) log_info(kTag, "removed host: {}", to_string(h));
    log_debug(kTag, "{} host(s) stable", tracker.stable().size());
    return true;
}

void run_presence_loop(Resolver &resolver,
                       PresenceTracker &tracker,
                       const Options &opt,
                       const Cancellation *cancel)
{
    const auto interval = std::chrono::milliseconds(opt.interval_ms);
    while (!(cancel && cancel->is_cancelled()))
    {
        (void) run_presence_cycle(resolver, tracker, opt);
        if (!sleep_or_cancel(interval, cancel)) break;
    }
    log_debug(kTag, "loop stopped");
}

} // namespace raopd
