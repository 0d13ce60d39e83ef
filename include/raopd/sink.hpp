#pragma once

#include <memory>
#include <string>

namespace raopd {

// Owned reference to one loaded sink instance; destroying it unloads the sink.
class SinkHandle {
public:
    virtual ~SinkHandle() = default;
};

struct SinkLoadResult {
    int rc{};             // 0 on success, -1 on error
    std::string error;
    std::unique_ptr<SinkHandle> handle;
};

class SinkLoader {
public:
    virtual ~SinkLoader() = default;

    // args is the serialized "{ key = value ... }" block
    virtual SinkLoadResult load(const std::string &module, const std::string &args) = 0;
};

// --dry-run: logs what would be loaded
class DryRunSinkLoader final : public SinkLoader {
public:
    SinkLoadResult load(const std::string &module, const std::string &args) override;
};

} // namespace raopd
