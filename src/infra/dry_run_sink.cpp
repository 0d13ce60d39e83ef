#include "raopd/sink.hpp"

#include "raopd/log.hpp"

namespace raopd
{
SinkLoadResult DryRunSinkLoader::load(const std::string &module, const std::string &args)
{
    log_info("dry-run", "would load {} {}", module, args);
    SinkLoadResult out{};
    out.handle = std::make_unique<SinkHandle>();
    return out;
}
} // namespace raopd
