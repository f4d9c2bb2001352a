#pragma once

#include <memory>
#include <string>
#include <vector>

#include "tilestitch/metadata/metadata_store.h"
#include "tilestitch/storage/object_store.h"

namespace tilestitch::reassembly {

struct Availability {
    bool ready{false};
    int chunks_found{0};
    int required_chunks{0};
    std::string reason;
};

/// @brief Decides whether a session's chunks are complete enough to merge.
///
/// Every check records the observed chunk count on the session, even when the verdict is
/// negative. A total of 0 means the expected count is unknown.
class AvailabilityChecker {
public:
    AvailabilityChecker(std::shared_ptr<storage::ObjectStore> store,
                        std::shared_ptr<metadata::MetadataStore> metadata);

    Availability Check(const std::string& booking_id, const std::string& session_id,
                       int total_chunks, const std::vector<std::string>& keys);

private:
    std::shared_ptr<storage::ObjectStore> store_;
    std::shared_ptr<metadata::MetadataStore> metadata_;
};

}  // namespace tilestitch::reassembly
