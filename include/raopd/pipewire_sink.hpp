#pragma once

#include <string>

#include "raopd/sink.hpp"

struct pw_context;

namespace raopd
{
// Loads sink modules into a PipeWire context. Only the thread running the
// context's loop may call load() or destroy the returned handles.
class PipewireSinkLoader final : public SinkLoader
{
public:
    explicit PipewireSinkLoader(pw_context *context);

    SinkLoadResult load(const std::string &module, const std::string &args) override;

private:
    pw_context *context_;
};
} // namespace raopd
