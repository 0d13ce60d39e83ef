#pragma once

#include <array>
#include <compare>
#include <cstdint>
#include <string>
#include <tuple>
#include <vector>

namespace raopd {

struct SocketAddress {
    int                          af{};      // AF_INET or AF_INET6
    std::array<std::uint8_t, 16> addr{};    // AF_INET uses the first 4 bytes
    std::uint16_t                port{};
    std::uint32_t                scope_id{}; // AF_INET6 only

    auto operator<=>(const SocketAddress &) const = default;
};

// Address text without port or scope ("192.168.1.20", "fe80::1")
std::string ip_string(const SocketAddress &sa);
// "192.168.1.20:7000", "[fe80::1%3]:7000"
std::string to_string(const SocketAddress &sa);

SocketAddress make_ipv4(const std::array<std::uint8_t, 4> &bytes, std::uint16_t port);
// scope_id is applied only to link-local unicast (fe80::/10), otherwise 0
SocketAddress make_ipv6(const std::array<std::uint8_t, 16> &bytes,
                        std::uint16_t port,
                        std::uint32_t ifindex);

bool is_link_local_v6(const std::array<std::uint8_t, 16> &bytes);

// Identity is (ifindex, name, domain); retries is not part of it.
struct CandidateHost {
    int         ifindex{};
    std::string name;
    std::string domain;
    int         retries{};

    bool operator==(const CandidateHost &o) const { return key() == o.key(); }
    std::strong_ordering operator<=>(const CandidateHost &o) const { return key() <=> o.key(); }

private:
    auto key() const { return std::tie(ifindex, name, domain); }
};

struct DiscoveredEndpoint {
    std::string              hostname;
    SocketAddress            address;
    std::vector<std::string> txt;
};

struct TunnelKey {
    std::string   hostname;
    SocketAddress address;

    auto operator<=>(const TunnelKey &) const = default;
};

std::string to_string(const TunnelKey &key);

} // namespace raopd
