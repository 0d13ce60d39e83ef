#include "raopd/resolved.hpp"

#include <cerrno>
#include <chrono>
#include <cstring>
#include <format>

#include <systemd/sd-bus.h>

namespace raopd
{
static constexpr const char *kDest = "org.freedesktop.resolve1";
static constexpr const char *kPath = "/org/freedesktop/resolve1";
static constexpr const char *kIface = "org.freedesktop.resolve1.Manager";

static std::string bus_error_str(const sd_bus_error &e, int r)
{
    if (sd_bus_error_is_set(&e))
    {
        return std::format("{}: {}", e.name, e.message ? e.message : "");
    }
    return std::strerror(-r);
}

static double elapsed_ms(std::chrono::steady_clock::time_point t0)
{
    auto t1 = std::chrono::steady_clock::now();
    return std::chrono::duration<double, std::milli>(t1 - t0).count();
}

namespace
{
class ResolvedBus final : public Resolver
{
public:
    ResolvedBus(sd_bus *bus, int timeout_ms)
        : bus_(bus), timeout_usec_(static_cast<std::uint64_t>(timeout_ms) * 1000)
    {}

    ~ResolvedBus() override
    {
        sd_bus_flush_close_unref(bus_);
    }

    ResolvedBus(const ResolvedBus &) = delete;
    ResolvedBus &operator=(const ResolvedBus &) = delete;

    BrowseResult resolve_record(int ifindex,
                                const std::string &name,
                                std::uint16_t klass,
                                std::uint16_t type,
                                std::uint64_t flags) override
    {
        BrowseResult out{};
        auto t0 = std::chrono::steady_clock::now();

        sd_bus_message *m = nullptr;
        int r = sd_bus_message_new_method_call(bus_, &m, kDest, kPath, kIface, "ResolveRecord");
        if (r >= 0) r = sd_bus_message_append(m, "isqqt", ifindex, name.c_str(), klass, type, flags);

        sd_bus_error err = SD_BUS_ERROR_NULL;
        sd_bus_message *reply = nullptr;
        if (r >= 0) r = sd_bus_call(bus_, m, timeout_usec_, &err, &reply);
        if (r >= 0) r = read_records(reply, out);

        out.ms = elapsed_ms(t0);
        if (r < 0)
        {
            out.rc = -1;
            out.error = bus_error_str(err, r);
            out.items.clear();
        }
        sd_bus_error_free(&err);
        sd_bus_message_unref(reply);
        sd_bus_message_unref(m);
        return out;
    }

    ServiceResult resolve_service(int ifindex,
                                  const std::string &name,
                                  const std::string &type,
                                  const std::string &domain,
                                  int family,
                                  std::uint64_t flags) override
    {
        ServiceResult out{};
        auto t0 = std::chrono::steady_clock::now();

        sd_bus_message *m = nullptr;
        int r = sd_bus_message_new_method_call(bus_, &m, kDest, kPath, kIface, "ResolveService");
        if (r >= 0)
        {
            r = sd_bus_message_append(m, "isssit", ifindex, name.c_str(), type.c_str(),
                                      domain.c_str(), family, flags);
        }

        sd_bus_error err = SD_BUS_ERROR_NULL;
        sd_bus_message *reply = nullptr;
        if (r >= 0) r = sd_bus_call(bus_, m, timeout_usec_, &err, &reply);
        if (r >= 0) r = read_service(reply, out);

        out.ms = elapsed_ms(t0);
        if (r < 0)
        {
            out.rc = -1;
            out.error = bus_error_str(err, r);
            out.srvs.clear();
            out.txt.clear();
        }
        sd_bus_error_free(&err);
        sd_bus_message_unref(reply);
        sd_bus_message_unref(m);
        return out;
    }

private:
    // a(iqqay) t
    static int read_records(sd_bus_message *reply, BrowseResult &out)
    {
        int r = sd_bus_message_enter_container(reply, SD_BUS_TYPE_ARRAY, "(iqqay)");
        if (r < 0) return r;
        for (;;)
        {
            r = sd_bus_message_enter_container(reply, SD_BUS_TYPE_STRUCT, "iqqay");
            if (r < 0) return r;
            if (r == 0) break;

            BrowseItem item{};
            r = sd_bus_message_read(reply, "iqq", &item.ifindex, &item.klass, &item.type);
            if (r < 0) return r;
            const void *p = nullptr;
            size_t sz = 0;
            r = sd_bus_message_read_array(reply, 'y', &p, &sz);
            if (r < 0) return r;
            const auto *bytes = static_cast<const std::uint8_t *>(p);
            item.data.assign(bytes, bytes + sz);

            r = sd_bus_message_exit_container(reply);
            if (r < 0) return r;
            out.items.push_back(std::move(item));
        }
        r = sd_bus_message_exit_container(reply);
        if (r < 0) return r;
        return sd_bus_message_read(reply, "t", &out.flags);
    }

    // a(iiay)
    static int read_addresses(sd_bus_message *reply, ServiceRecord &srv)
    {
        int r = sd_bus_message_enter_container(reply, SD_BUS_TYPE_ARRAY, "(iiay)");
        if (r < 0) return r;
        for (;;)
        {
            r = sd_bus_message_enter_container(reply, SD_BUS_TYPE_STRUCT, "iiay");
            if (r < 0) return r;
            if (r == 0) break;

            ServiceAddress a{};
            r = sd_bus_message_read(reply, "ii", &a.ifindex, &a.af);
            if (r < 0) return r;
            const void *p = nullptr;
            size_t sz = 0;
            r = sd_bus_message_read_array(reply, 'y', &p, &sz);
            if (r < 0) return r;
            const auto *bytes = static_cast<const std::uint8_t *>(p);
            a.bytes.assign(bytes, bytes + sz);

            r = sd_bus_message_exit_container(reply);
            if (r < 0) return r;
            srv.addresses.push_back(std::move(a));
        }
        return sd_bus_message_exit_container(reply);
    }

    // a(qqqsa(iiay)s) aay s s s t
    static int read_service(sd_bus_message *reply, ServiceResult &out)
    {
        int r = sd_bus_message_enter_container(reply, SD_BUS_TYPE_ARRAY, "(qqqsa(iiay)s)");
        if (r < 0) return r;
        for (;;)
        {
            r = sd_bus_message_enter_container(reply, SD_BUS_TYPE_STRUCT, "qqqsa(iiay)s");
            if (r < 0) return r;
            if (r == 0) break;

            ServiceRecord srv{};
            const char *hostname = nullptr;
            r = sd_bus_message_read(reply, "qqqs", &srv.priority, &srv.weight, &srv.port, &hostname);
            if (r < 0) return r;
            srv.hostname = hostname ? hostname : "";
            r = read_addresses(reply, srv);
            if (r < 0) return r;
            const char *domain = nullptr;
            r = sd_bus_message_read(reply, "s", &domain);
            if (r < 0) return r;
            srv.domain = domain ? domain : "";

            r = sd_bus_message_exit_container(reply);
            if (r < 0) return r;
            out.srvs.push_back(std::move(srv));
        }
        r = sd_bus_message_exit_container(reply);
        if (r < 0) return r;

        r = sd_bus_message_enter_container(reply, SD_BUS_TYPE_ARRAY, "ay");
        if (r < 0) return r;
        for (;;)
        {
            const void *p = nullptr;
            size_t sz = 0;
            r = sd_bus_message_read_array(reply, 'y', &p, &sz);
            if (r < 0) return r;
            if (r == 0) break;
            const auto *bytes = static_cast<const std::uint8_t *>(p);
            out.txt.emplace_back(bytes, bytes + sz);
        }
        r = sd_bus_message_exit_container(reply);
        if (r < 0) return r;

        const char *cname = nullptr;
        const char *ctype = nullptr;
        const char *cdomain = nullptr;
        r = sd_bus_message_read(reply, "ssst", &cname, &ctype, &cdomain, &out.flags);
        if (r < 0) return r;
        out.canonical_name = cname ? cname : "";
        out.canonical_type = ctype ? ctype : "";
        out.canonical_domain = cdomain ? cdomain : "";
        return 0;
    }

    sd_bus *bus_;
    std::uint64_t timeout_usec_;
};
} // namespace

std::unique_ptr<Resolver> open_resolved_bus(int timeout_ms, std::string &error)
{
    sd_bus *bus = nullptr;
    int r = sd_bus_open_system(&bus);
    if (r < 0)
    {
        error = std::format("system bus connection failed: {}", std::strerror(-r));
        return nullptr;
    }
    if (timeout_ms < 0) timeout_ms = 0;
    return std::make_unique<ResolvedBus>(bus, timeout_ms);
}
} // namespace raopd
