#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "raopd/model.hpp"
#include "raopd/resolver.hpp"

namespace raopd {

struct BrowseOutcome {
    int rc{};           // -1 when the browse call itself failed
    std::string error;
    std::vector<CandidateHost> hosts; // one per decodable IN/PTR record
    int skipped{};      // records dropped (wrong class/type, decode error)
};

// PTR ブラウズを1回発行し、デコードできたレコードを候補として返す。
// 個々のレコードの失敗はログに出してスキップする。
BrowseOutcome browse_candidates(Resolver &resolver,
                                const std::string &service,
                                std::uint64_t flags,
                                int retries,
                                std::string_view tag);

} // namespace raopd
