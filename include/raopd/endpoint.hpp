#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "raopd/concurrency.hpp"
#include "raopd/model.hpp"
#include "raopd/options.hpp"
#include "raopd/resolver.hpp"

namespace raopd {

int family_to_af(Family f);
const char *family_str(Family f);

// (ifindex, af, bytes) -> socket address. Link-local IPv6 carries ifindex
// as scope id. Unsupported family/length combinations yield nullopt.
std::optional<SocketAddress> make_socket_address(const ServiceAddress &a, std::uint16_t port);

// Invalid UTF-8 sequences become U+FFFD.
std::vector<std::string> decode_txt(const std::vector<std::vector<std::uint8_t>> &txt);

enum class CycleStatus {
    Ok,
    BrowseFailed,   // cycle abandoned
    ChannelClosed,  // consumer gone, loop must stop
};

// Browse, resolve every target and emit one endpoint per address.
CycleStatus run_resolve_cycle(Resolver &resolver,
                              Sender<DiscoveredEndpoint> &tx,
                              const Options &opt);

// Runs until the channel closes or cancel is set.
void run_resolve_loop(Resolver &resolver,
                      Sender<DiscoveredEndpoint> tx,
                      const Options &opt,
                      const Cancellation *cancel);

} // namespace raopd
