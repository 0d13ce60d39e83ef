#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace raopd
{
inline constexpr int kIfindexAny = 0;

// systemd-resolved SD_RESOLVED_* flags
inline constexpr std::uint64_t kMdnsIpv4 = 8;
inline constexpr std::uint64_t kMdnsIpv6 = 16;

struct BrowseItem
{
    int                       ifindex{};
    std::uint16_t             klass{};
    std::uint16_t             type{};
    std::vector<std::uint8_t> data; // wire-format RR
};

struct BrowseResult
{
    double                  ms{};
    int                     rc{};  // 0 on success, -1 on error
    std::string             error; // bus / method error when rc != 0
    std::vector<BrowseItem> items;
    std::uint64_t           flags{};
};

struct ServiceAddress
{
    int                       ifindex{};
    int                       af{};
    std::vector<std::uint8_t> bytes;
};

struct ServiceRecord
{
    std::uint16_t               priority{};
    std::uint16_t               weight{};
    std::uint16_t               port{};
    std::string                 hostname;
    std::vector<ServiceAddress> addresses;
    std::string                 domain;
};

struct ServiceResult
{
    double                                 ms{};
    int                                    rc{};
    std::string                            error;
    std::vector<ServiceRecord>             srvs;
    std::vector<std::vector<std::uint8_t>> txt;
    std::string                            canonical_name;
    std::string                            canonical_type;
    std::string                            canonical_domain;
    std::uint64_t                          flags{};
};

// org.freedesktop.resolve1.Manager の ResolveRecord / ResolveService 相当
// 実装はスレッドごとに1つ (接続を共有しない)
class Resolver
{
public:
    virtual ~Resolver() = default;

    virtual BrowseResult resolve_record(int ifindex,
                                        const std::string &name,
                                        std::uint16_t klass,
                                        std::uint16_t type,
                                        std::uint64_t flags) = 0;

    virtual ServiceResult resolve_service(int ifindex,
                                          const std::string &name,
                                          const std::string &type,
                                          const std::string &domain,
                                          int family,
                                          std::uint64_t flags) = 0;
};
} // namespace raopd
