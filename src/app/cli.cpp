#include "raopd/cli.hpp"

#include <print>
#include <stdexcept>
#include <string>
#include <string_view>

using namespace std::string_view_literals;

namespace raopd {

void print_usage(const char *prog)
{
    std::println("RAOP receiver discovery via systemd-resolved");
    std::println("Usage: {} [options]", prog);
    std::println("Options:");
    std::println(
        "  --service NAME       PTR name to browse (default: _raop._tcp.local)");
    std::println(
        "  --family F           Resolver family: inet|inet6 (default: inet)");
    std::println("  -4                   Shortcut for --family inet");
    std::println("  -6                   Shortcut for --family inet6");
    std::println(
        "  --interval MS        Polling interval of both loops (default: 3000)");
    std::println(
        "  --retries N          Empty cycles tolerated before removal (default: 8)");
    std::println(
        "  --timeout MS         D-Bus method call timeout (default: 2000)");
    std::println(
        "  --drain-delay MS     First sink-creation tick (default: 1)");
    std::println(
        "  --drain-interval MS  Sink-creation tick interval (default: 3000)");
    std::println(
        "  --module NAME        Sink module (default: libpipewire-module-raop-sink)");
    std::println("  --dry-run            Log sink arguments, load nothing");
    std::println("  --no-presence        Do not run the presence loop");
    std::println("  -v, --verbose        Debug logging");
    std::println("  -q, --quiet          Warnings and errors only");
    std::println("  -h, --help           Show this help");
    std::println("");
    std::println("Examples:");
    std::println("  {}", prog);
    std::println("  {} -6 --dry-run --verbose", prog);
}

// "--name value" or "--name=value"
static bool take_value(std::string_view a,
                       std::string_view name,
                       int &i,
                       int argc,
                       char **argv,
                       std::string &val)
{
    if (a == name && i + 1 < argc)
    {
        val = argv[++i];
        return true;
    }
    if (a.size() > name.size() + 1 && a.substr(name.size(), 1) == "="sv)
    {
        val = std::string(a.substr(name.size() + 1));
        return true;
    }
    std::println("invalid {} usage", name);
    return false;
}

static bool parse_int(std::string_view name, const std::string &val, int min, int &out)
{
    try
    {
        std::size_t used = 0;
        int v = std::stoi(val, &used);
        if (used != val.size()) throw std::invalid_argument(val);
        if (v < min)
        {
            std::println("{} must be >= {}: {}", name, min, v);
            return false;
        }
        out = v;
        return true;
    }
    catch (const std::exception &)
    {
        std::println("invalid {} value: {}", name, val);
        return false;
    }
}

CliResult parse_args(int argc, char **argv, Options &opt)
{
    for (int i = 1; i < argc; ++i)
    {
        std::string_view a = argv[i];
        std::string val;
        if (a == "-h"sv || a == "--help"sv)
        {
            print_usage(argv[0]);
            return CliResult::Help;
        }
        if (a == "-4"sv)
        {
            opt.family = Family::IPv4;
        }
        else if (a == "-6"sv)
        {
            opt.family = Family::IPv6;
        }
        else if (a == "-v"sv || a == "--verbose"sv)
        {
            opt.log_level = LogLevel::Debug;
        }
        else if (a == "-q"sv || a == "--quiet"sv)
        {
            opt.log_level = LogLevel::Warn;
        }
        else if (a == "--dry-run"sv)
        {
            opt.dry_run = true;
        }
        else if (a == "--no-presence"sv)
        {
            opt.presence = false;
        }
        else if (a.rfind("--family", 0) == 0)
        {
            if (!take_value(a, "--family", i, argc, argv, val)) return CliResult::Error;
            if (val == "inet") opt.family = Family::IPv4;
            else if (val == "inet6") opt.family = Family::IPv6;
            else
            {
                std::println("unknown family: {}", val);
                return CliResult::Error;
            }
        }
        else if (a.rfind("--service", 0) == 0)
        {
            if (!take_value(a, "--service", i, argc, argv, val)) return CliResult::Error;
            if (val.empty())
            {
                std::println("empty --service");
                return CliResult::Error;
            }
            opt.service = std::move(val);
        }
        else if (a.rfind("--module", 0) == 0)
        {
            if (!take_value(a, "--module", i, argc, argv, val)) return CliResult::Error;
            opt.module = std::move(val);
        }
        else if (a.rfind("--interval", 0) == 0)
        {
            if (!take_value(a, "--interval", i, argc, argv, val) ||
                !parse_int("--interval", val, 1, opt.interval_ms))
                return CliResult::Error;
        }
        else if (a.rfind("--retries", 0) == 0)
        {
            if (!take_value(a, "--retries", i, argc, argv, val) ||
                !parse_int("--retries", val, 0, opt.retries))
                return CliResult::Error;
        }
        else if (a.rfind("--timeout", 0) == 0)
        {
            if (!take_value(a, "--timeout", i, argc, argv, val) ||
                !parse_int("--timeout", val, 1, opt.timeout_ms))
                return CliResult::Error;
        }
        else if (a.rfind("--drain-interval", 0) == 0)
        {
            if (!take_value(a, "--drain-interval", i, argc, argv, val) ||
                !parse_int("--drain-interval", val, 1, opt.drain_interval_ms))
                return CliResult::Error;
        }
        else if (a.rfind("--drain-delay", 0) == 0)
        {
            if (!take_value(a, "--drain-delay", i, argc, argv, val) ||
                !parse_int("--drain-delay", val, 1, opt.drain_delay_ms))
                return CliResult::Error;
        }
        else
        {
            std::println("unknown option: {}", a);
            return CliResult::Error;
        }
    }
    return CliResult::Run;
}

} // namespace raopd
