#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "raopd/model.hpp"

namespace raopd {

// Receiver capabilities advertised in TXT records (am=, tp=, et=, cn=)
struct ReceiverTraits {
    std::string name = "<unnamed>";
    std::optional<std::string> transport;  // "udp" / "tcp"
    std::optional<std::string> encryption; // "RSA" / "auth_setup" / "none"
    std::optional<std::string> codec;      // "AAC-ELD" / "AAC" / "ALAC" / "PCM"
};

// The first entry of each key decides; unknown values are logged.
ReceiverTraits parse_txt_traits(const std::vector<std::string> &txt);

// true when the comma-separated list has an element equal to v
bool list_contains(std::string_view list, std::string_view v);

using SinkProperties = std::vector<std::pair<std::string, std::string>>;

SinkProperties compose_sink_properties(const DiscoveredEndpoint &ep, const ReceiverTraits &traits);

// { "key" = "value" ... } as accepted by pw_context_load_module()
std::string serialize_properties(const SinkProperties &props);

} // namespace raopd
