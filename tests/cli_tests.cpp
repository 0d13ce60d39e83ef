#include <cstdlib>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

#include "raopd/cli.hpp"
#include "raopd/options.hpp"

using namespace raopd;

static void assert_true(bool cond, std::string_view msg)
{
    if (!cond)
    {
        std::cerr << "ASSERT FAILED: " << msg << std::endl;
        std::exit(1);
    }
}

// argv storage that outlives the parse
static CliResult parse(std::vector<std::string> args, Options &opt)
{
    args.insert(args.begin(), "raopd");
    std::vector<char *> argv;
    for (auto &a : args) argv.push_back(a.data());
    argv.push_back(nullptr);
    return parse_args(static_cast<int>(args.size()), argv.data(), opt);
}

static void test_defaults()
{
    Options opt{};
    assert_true(parse({}, opt) == CliResult::Run, "no args runs");
    assert_true(opt.service == "_raop._tcp.local", "default service");
    assert_true(opt.family == Family::IPv4, "default family");
    assert_true(opt.interval_ms == 3000 && opt.retries == 8, "default loop settings");
    assert_true(opt.drain_delay_ms == 1 && opt.drain_interval_ms == 3000, "default drain");
    assert_true(opt.presence && !opt.dry_run, "default switches");
}

static void test_values_both_forms()
{
    Options opt{};
    CliResult r = parse({"--family", "inet6", "--interval=250", "--retries", "0",
                         "--timeout=500", "--drain-delay", "10", "--drain-interval=100",
                         "--service=_airplay._tcp.local", "--module", "libpipewire-module-fake"},
                        opt);
    assert_true(r == CliResult::Run, "run");
    assert_true(opt.family == Family::IPv6, "family inet6");
    assert_true(opt.interval_ms == 250, "interval");
    assert_true(opt.retries == 0, "zero retries allowed");
    assert_true(opt.timeout_ms == 500, "timeout");
    assert_true(opt.drain_delay_ms == 10, "drain delay");
    assert_true(opt.drain_interval_ms == 100, "drain interval");
    assert_true(opt.service == "_airplay._tcp.local", "service");
    assert_true(opt.module == "libpipewire-module-fake", "module");
}

static void test_switches()
{
    Options opt{};
    assert_true(parse({"-6", "--dry-run", "--no-presence", "-v"}, opt) == CliResult::Run, "switches run");
    assert_true(opt.family == Family::IPv6, "-6");
    assert_true(opt.dry_run, "dry run");
    assert_true(!opt.presence, "no presence");
    assert_true(opt.log_level == LogLevel::Debug, "verbose");

    assert_true(parse({"-4", "-q"}, opt) == CliResult::Run, "later switches win");
    assert_true(opt.family == Family::IPv4, "-4");
    assert_true(opt.log_level == LogLevel::Warn, "quiet");
}

static void test_errors()
{
    Options opt{};
    assert_true(parse({"--family", "ipx"}, opt) == CliResult::Error, "unknown family");
    assert_true(parse({"--interval", "0"}, opt) == CliResult::Error, "interval below minimum");
    assert_true(parse({"--retries", "-1"}, opt) == CliResult::Error, "negative retries");
    assert_true(parse({"--timeout", "12ms"}, opt) == CliResult::Error, "trailing garbage");
    assert_true(parse({"--interval"}, opt) == CliResult::Error, "missing value");
    assert_true(parse({"--service="}, opt) == CliResult::Error, "empty service");
    assert_true(parse({"--bogus"}, opt) == CliResult::Error, "unknown option");
    assert_true(parse({"--help"}, opt) == CliResult::Help, "help");
}

int main()
{
    test_defaults();
    test_values_both_forms();
    test_switches();
    test_errors();

    std::cout << "cli tests: OK" << std::endl;
    return 0;
}
