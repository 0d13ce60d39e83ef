#include "raopd/registry.hpp"

#include <chrono>
#include <utility>

#include "raopd/log.hpp"
#include "raopd/properties.hpp"

namespace raopd {

namespace {
constexpr std::string_view kTag = "registry";
}

TunnelRegistry::TunnelRegistry(SinkLoader &loader, std::string module)
    : loader_(loader), module_(std::move(module))
{}

TickOutcome TunnelRegistry::tick(Receiver<DiscoveredEndpoint> &rx)
{
    auto t0 = std::chrono::steady_clock::now();
    std::optional<DiscoveredEndpoint> ep = rx.try_recv();
    if (!ep)
    {
        if (!producer_gone_ && rx.disconnected())
        {
            producer_gone_ = true;
            log_debug(kTag, "resolver loop gone, no further endpoints");
        }
        return TickOutcome::Idle;
    }

    TickOutcome outcome = handle(*ep);

    auto t1 = std::chrono::steady_clock::now();
    const double ms = std::chrono::duration<double, std::milli>(t1 - t0).count();
    if (ms >= 1.0) log_info(kTag, "took {:.3f} ms", ms);
    if (const std::size_t backlog = rx.pending(); backlog > 0)
    {
        log_debug(kTag, "{} endpoint(s) still queued", backlog);
    }
    return outcome;
}

TickOutcome TunnelRegistry::handle(const DiscoveredEndpoint &ep)
{
    TunnelKey key{ep.hostname, ep.address};
    if (tunnels_.contains(key)) return TickOutcome::Duplicate;

    const ReceiverTraits traits = parse_txt_traits(ep.txt);
    const std::string args = serialize_properties(compose_sink_properties(ep, traits));

    SinkLoadResult lr = loader_.load(module_, args);
    if (lr.rc != 0)
    {
        log_warn(kTag, "loading {} for {} failed: {}", module_, to_string(key), lr.error);
        return TickOutcome::Failed;
    }

    log_info(kTag, "discovered new tunnel: {} ({})", to_string(key), traits.name);
    tunnels_.emplace(std::move(key), Tunnel{std::move(lr.handle)});
    return TickOutcome::Created;
}

} // namespace raopd
