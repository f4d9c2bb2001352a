#include "tilestitch/reassembly/chunk_discovery.h"

#include <algorithm>
#include <map>
#include <set>

#include <Poco/RegularExpression.h>

#include "tilestitch/core/logger.h"
#include "tilestitch/reassembly/part_order.h"

namespace tilestitch::reassembly {

namespace {

constexpr const char* kManifestMarker = "_manifest.json";

}  // namespace

const char* DiscoveryStrategyName(DiscoveryStrategy strategy) {
    switch (strategy) {
        case DiscoveryStrategy::kSessionMatch:
            return "session_match";
        case DiscoveryStrategy::kNamingFallback:
            return "naming_fallback";
        case DiscoveryStrategy::kNone:
            break;
    }
    return "none";
}

ChunkDiscovery::ChunkDiscovery(std::shared_ptr<storage::ObjectStore> store,
                               std::string session_tag)
    : store_(std::move(store)), session_tag_(std::move(session_tag)) {}

core::Result<DiscoveryResult> ChunkDiscovery::Discover(const std::string& booking_id,
                                                       const std::string& session_id) {
    auto listing = store_->ListObjects(booking_id + "/");
    if (!listing.ok()) {
        return listing.error();
    }

    std::vector<std::string> keys;
    keys.reserve(listing.value().size());
    for (const auto& object : listing.value()) {
        if (object.key.find(kManifestMarker) != std::string::npos) {
            continue;
        }
        keys.push_back(object.key);
    }
    std::sort(keys.begin(), keys.end());

    if (!session_id.empty()) {
        auto matched = MatchSession(booking_id, session_id, keys);
        if (!matched.empty()) {
            DiscoveryResult result;
            result.keys = std::move(matched);
            result.strategy = DiscoveryStrategy::kSessionMatch;
            return result;
        }
        core::LogDebug("No session-matched chunks for " + session_id +
                       ", falling back to naming convention");
    }
    return GroupByBaseName(keys);
}

std::vector<std::string> ChunkDiscovery::MatchSession(const std::string& booking_id,
                                                      const std::string& session_id,
                                                      const std::vector<std::string>& keys) {
    const auto session_path = booking_id + "/" + session_id;
    std::set<std::string> matched;
    for (const auto& key : keys) {
        if (key.find(session_path) != std::string::npos ||
            key.find(session_id) != std::string::npos) {
            matched.insert(key);
        }
    }

    for (const auto& key : keys) {
        if (matched.count(key) > 0 || key.find("part") == std::string::npos) {
            continue;
        }
        auto tags = store_->GetObjectTags(key);
        if (!tags.ok()) {
            core::LogWarning("Tag probe failed for " + key + ": " + tags.error().message);
            continue;
        }
        auto it = tags.value().find(session_tag_);
        if (it != tags.value().end() && it->second == session_id) {
            matched.insert(key);
        }
    }
    return std::vector<std::string>(matched.begin(), matched.end());
}

DiscoveryResult ChunkDiscovery::GroupByBaseName(const std::vector<std::string>& keys) {
    static const Poco::RegularExpression chunk_name("^(.+)\\.part\\d+$",
                                                    Poco::RegularExpression::RE_CASELESS);
    std::map<std::string, std::vector<std::string>> groups;
    for (const auto& key : keys) {
        std::vector<std::string> captures;
        if (chunk_name.split(BaseName(key), captures) >= 2 && captures.size() >= 2) {
            groups[captures[1]].push_back(key);
        }
    }

    DiscoveryResult result;
    // std::map iterates basenames in ascending order, so ties keep the first one.
    for (auto& group : groups) {
        if (group.second.size() > result.keys.size()) {
            result.base_name = group.first;
            result.keys = group.second;
        }
    }
    if (!result.keys.empty()) {
        result.strategy = DiscoveryStrategy::kNamingFallback;
    }
    return result;
}

}  // namespace tilestitch::reassembly
