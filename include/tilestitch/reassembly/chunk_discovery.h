#pragma once

#include <memory>
#include <string>
#include <vector>

#include "tilestitch/core/result.h"
#include "tilestitch/storage/object_store.h"

namespace tilestitch::reassembly {

/// @brief Which rule produced a discovery result.
enum class DiscoveryStrategy {
    kNone,
    kSessionMatch,
    kNamingFallback,
};

const char* DiscoveryStrategyName(DiscoveryStrategy strategy);

struct DiscoveryResult {
    std::vector<std::string> keys;
    DiscoveryStrategy strategy{DiscoveryStrategy::kNone};
    // Basename of the winning group for kNamingFallback.
    std::string base_name;

    bool empty() const { return keys.empty(); }
};

/// @brief Finds the chunk objects of a session under `{booking_id}/`.
///
/// The session stage unions path containment, session id containment anywhere in the key
/// and a tag match on keys that mention "part". When it finds nothing (or no session id is
/// given), keys named `<base>.partN` are grouped by base and the largest group wins. Callers
/// holding a manifest must not merge a naming-convention result.
class ChunkDiscovery {
public:
    ChunkDiscovery(std::shared_ptr<storage::ObjectStore> store, std::string session_tag);

    core::Result<DiscoveryResult> Discover(const std::string& booking_id,
                                           const std::string& session_id);

    /// Naming-convention grouping over an already listed, sorted set of keys.
    static DiscoveryResult GroupByBaseName(const std::vector<std::string>& keys);

private:
    std::vector<std::string> MatchSession(const std::string& booking_id,
                                          const std::string& session_id,
                                          const std::vector<std::string>& keys);

    std::shared_ptr<storage::ObjectStore> store_;
    std::string session_tag_;
};

}  // namespace tilestitch::reassembly
