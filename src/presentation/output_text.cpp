#include "raopd/output.hpp"

#include <sstream>

#include "raopd/endpoint.hpp"
#include "raopd/log.hpp"
#include "raopd/options.hpp"

namespace raopd {

std::string format_header_text(const Options& opt)
{
    std::ostringstream os;
    os << "Browsing: " << opt.service << '\n';
    os << "Family: " << family_str(opt.family)
       << "  Interval: " << opt.interval_ms << " ms"
       << "  Retries: " << opt.retries
       << "  Timeout: " << opt.timeout_ms << " ms" << '\n';
    os << "Drain: first=" << opt.drain_delay_ms << " ms"
       << " every=" << opt.drain_interval_ms << " ms" << '\n';
    os << "Module: " << opt.module
       << "  Dry-run: " << (opt.dry_run ? "on" : "off")
       << "  Presence: " << (opt.presence ? "on" : "off")
       << "  Log: " << log_level_str(opt.log_level) << '\n';
    return os.str();
}

} // namespace raopd
