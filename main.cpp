// RAOP receiver discovery (C++23)
// Browses _raop._tcp.local through systemd-resolved and loads one
// libpipewire-module-raop-sink per discovered endpoint.

#include <csignal>
#include <ctime>
#include <memory>
#include <sstream>
#include <string>
#include <thread>

#include <pipewire/pipewire.h>

#include "raopd/cli.hpp"
#include "raopd/concurrency.hpp"
#include "raopd/endpoint.hpp"
#include "raopd/log.hpp"
#include "raopd/output.hpp"
#include "raopd/pipewire_sink.hpp"
#include "raopd/presence.hpp"
#include "raopd/registry.hpp"
#include "raopd/resolved.hpp"

using namespace raopd;

namespace
{
constexpr std::string_view kTag = "main";

struct DrainContext
{
    TunnelRegistry *registry;
    Receiver<DiscoveredEndpoint> *rx;
};

timespec to_timespec(int ms)
{
    timespec ts{};
    ts.tv_sec = ms / 1000;
    ts.tv_nsec = static_cast<long>(ms % 1000) * 1000000L;
    return ts;
}

void on_drain(void *data, uint64_t /*expirations*/)
{
    auto *ctx = static_cast<DrainContext *>(data);
    (void) ctx->registry->tick(*ctx->rx);
}

void on_signal(void *data, int signal_number)
{
    log_info(kTag, "signal {}, quitting", signal_number);
    pw_main_loop_quit(static_cast<pw_main_loop *>(data));
}
} // namespace

int main(int argc, char **argv)
{
    Options opt;
    switch (parse_args(argc, argv, opt))
    {
        case CliResult::Help: return 0;
        case CliResult::Error: return 1;
        case CliResult::Run: break;
    }
    set_log_level(opt.log_level);

    {
        std::istringstream header(format_header_text(opt));
        for (std::string line; std::getline(header, line);) log_info(kTag, "{}", line);
    }

    // Connection setup is the only fatal step; each loop owns its connection.
    std::string err;
    std::unique_ptr<Resolver> presence_bus;
    if (opt.presence)
    {
        presence_bus = open_resolved_bus(opt.timeout_ms, err);
        if (!presence_bus)
        {
            log_error(kTag, "{}", err);
            return 1;
        }
    }
    std::unique_ptr<Resolver> resolve_bus = open_resolved_bus(opt.timeout_ms, err);
    if (!resolve_bus)
    {
        log_error(kTag, "{}", err);
        return 1;
    }

    pw_init(&argc, &argv);
    pw_main_loop *main_loop = pw_main_loop_new(nullptr);
    if (!main_loop)
    {
        log_error(kTag, "pw_main_loop_new failed");
        pw_deinit();
        return 1;
    }
    pw_loop *loop = pw_main_loop_get_loop(main_loop);
    pw_context *context = pw_context_new(loop, nullptr, 0);
    if (!context)
    {
        log_error(kTag, "pw_context_new failed");
        pw_main_loop_destroy(main_loop);
        pw_deinit();
        return 1;
    }

    pw_loop_add_signal(loop, SIGINT, on_signal, main_loop);
    pw_loop_add_signal(loop, SIGTERM, on_signal, main_loop);

    auto channel = make_channel<DiscoveredEndpoint>();
    Sender<DiscoveredEndpoint> tx = std::move(channel.first);
    Receiver<DiscoveredEndpoint> rx = std::move(channel.second);
    Cancellation cancel;
    PresenceTracker tracker(opt.retries);

    std::thread presence_th;
    if (presence_bus)
    {
        presence_th = std::thread([&]
        {
            run_presence_loop(*presence_bus, tracker, opt, &cancel);
        });
    }
    std::thread resolve_th([&, tx = std::move(tx)]() mutable
    {
        run_resolve_loop(*resolve_bus, std::move(tx), opt, &cancel);
    });

    {
        std::unique_ptr<SinkLoader> loader;
        if (opt.dry_run) loader = std::make_unique<DryRunSinkLoader>();
        else loader = std::make_unique<PipewireSinkLoader>(context);

        // Bounded work per tick: one endpoint per expiry, the rest waits in
        // the channel.
        TunnelRegistry registry(*loader, opt.module);
        DrainContext drain{&registry, &rx};
        spa_source *timer = pw_loop_add_timer(loop, on_drain, &drain);
        timespec value = to_timespec(opt.drain_delay_ms);
        timespec interval = to_timespec(opt.drain_interval_ms);
        pw_loop_update_timer(loop, timer, &value, &interval, false);

        pw_main_loop_run(main_loop);

        pw_loop_destroy_source(loop, timer);
        cancel.cancel();
        if (presence_th.joinable()) presence_th.join();
        if (resolve_th.joinable()) resolve_th.join();
        log_info(kTag, "releasing {} tunnel(s)", registry.size());
    }

    pw_context_destroy(context);
    pw_main_loop_destroy(main_loop);
    pw_deinit();
    return 0;
}
