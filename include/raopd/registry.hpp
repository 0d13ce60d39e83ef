#pragma once

#include <cstddef>
#include <map>
#include <memory>
#include <string>

#include "raopd/concurrency.hpp"
#include "raopd/model.hpp"
#include "raopd/sink.hpp"

namespace raopd {

struct Tunnel {
    std::unique_ptr<SinkHandle> handle;
};

enum class TickOutcome {
    Idle,      // nothing pending
    Duplicate, // key already has a tunnel
    Created,
    Failed,    // loader error, key left unregistered
};

// Consumer-side state: one sink per (hostname, socket address).
// Owned and driven by a single thread.
class TunnelRegistry {
public:
    TunnelRegistry(SinkLoader &loader, std::string module);

    // Take at most one pending endpoint and process it. Never blocks.
    TickOutcome tick(Receiver<DiscoveredEndpoint> &rx);

    TickOutcome handle(const DiscoveredEndpoint &ep);

    bool contains(const TunnelKey &key) const { return tunnels_.contains(key); }
    std::size_t size() const { return tunnels_.size(); }

private:
    SinkLoader &loader_;
    std::string module_;
    std::map<TunnelKey, Tunnel> tunnels_;
    bool producer_gone_ = false; // reported once
};

} // namespace raopd
