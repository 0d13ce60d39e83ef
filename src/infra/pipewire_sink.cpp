#include "raopd/pipewire_sink.hpp"

#include <cerrno>
#include <cstring>
#include <format>

#include <pipewire/impl.h>
#include <pipewire/pipewire.h>

namespace raopd
{
namespace
{
class PipewireModule final : public SinkHandle
{
public:
    explicit PipewireModule(pw_impl_module *module) : module_(module) {}
    ~PipewireModule() override
    {
        if (module_) pw_impl_module_destroy(module_);
    }

    PipewireModule(const PipewireModule &) = delete;
    PipewireModule &operator=(const PipewireModule &) = delete;

private:
    pw_impl_module *module_;
};
} // namespace

PipewireSinkLoader::PipewireSinkLoader(pw_context *context)
    : context_(context)
{}

SinkLoadResult PipewireSinkLoader::load(const std::string &module, const std::string &args)
{
    SinkLoadResult out{};
    errno = 0;
    pw_impl_module *m = pw_context_load_module(context_, module.c_str(), args.c_str(), nullptr);
    if (!m)
    {
        const int e = errno;
        out.rc = -1;
        out.error = std::format("pw_context_load_module: {}", e ? std::strerror(e) : "unknown error");
        return out;
    }
    out.handle = std::make_unique<PipewireModule>(m);
    return out;
}
} // namespace raopd
