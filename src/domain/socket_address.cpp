#include "raopd/model.hpp"

#include <algorithm>
#include <format>

// POSIX networking
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>

namespace raopd
{
std::string ip_string(const SocketAddress &sa)
{
    char buf[INET6_ADDRSTRLEN]{};
    if (sa.af == AF_INET)
    {
        in_addr a{};
        std::copy_n(sa.addr.begin(), 4, reinterpret_cast<std::uint8_t *>(&a));
        if (inet_ntop(AF_INET, &a, buf, sizeof(buf))) return buf;
    }
    else if (sa.af == AF_INET6)
    {
        in6_addr a{};
        std::copy_n(sa.addr.begin(), 16, reinterpret_cast<std::uint8_t *>(&a));
        if (inet_ntop(AF_INET6, &a, buf, sizeof(buf))) return buf;
    }
    return {};
}

std::string to_string(const SocketAddress &sa)
{
    if (sa.af == AF_INET6)
    {
        if (sa.scope_id != 0)
        {
            return std::format("[{}%{}]:{}", ip_string(sa), sa.scope_id, sa.port);
        }
        return std::format("[{}]:{}", ip_string(sa), sa.port);
    }
    return std::format("{}:{}", ip_string(sa), sa.port);
}

SocketAddress make_ipv4(const std::array<std::uint8_t, 4> &bytes,
                        const std::uint16_t port)
{
    SocketAddress sa{};
    sa.af = AF_INET;
    std::ranges::copy(bytes, sa.addr.begin());
    sa.port = port;
    return sa;
}

bool is_link_local_v6(const std::array<std::uint8_t, 16> &bytes)
{
    in6_addr a{};
    std::ranges::copy(bytes, reinterpret_cast<std::uint8_t *>(&a));
    return IN6_IS_ADDR_LINKLOCAL(&a);
}

SocketAddress make_ipv6(const std::array<std::uint8_t, 16> &bytes,
                        const std::uint16_t port,
                        const std::uint32_t ifindex)
{
    SocketAddress sa{};
    sa.af = AF_INET6;
    sa.addr = bytes;
    sa.port = port;
    sa.scope_id = is_link_local_v6(bytes) ? ifindex : 0;
    return sa;
}

std::string to_string(const TunnelKey &key)
{
    return std::format("{} @ {}", key.hostname, to_string(key.address));
}
} // namespace raopd
