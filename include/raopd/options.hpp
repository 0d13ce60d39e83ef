#pragma once

#include <string>

namespace raopd
{
enum class Family { IPv4, IPv6 };

enum class LogLevel { Debug, Info, Warn, Error };

struct Options
{
    std::string service = "_raop._tcp.local"; // browse name (PTR)
    Family family = Family::IPv4;             // resolver loop address family
    int interval_ms = 3000;                   // polling interval of both loops
    int retries = 8;                          // presence hysteresis budget
    int timeout_ms = 2000;                    // per D-Bus method call
    // consumer timer: first expiry, then re-arm interval
    int drain_delay_ms = 1;
    int drain_interval_ms = 3000;
    std::string module = "libpipewire-module-raop-sink";
    bool dry_run = false;                     // log sink args, load nothing
    bool presence = true;                     // run the presence loop
    LogLevel log_level = LogLevel::Info;
};
} // namespace raopd
