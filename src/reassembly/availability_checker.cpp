#include "tilestitch/reassembly/availability_checker.h"

#include "tilestitch/core/logger.h"
#include "tilestitch/reassembly/part_order.h"

namespace tilestitch::reassembly {

AvailabilityChecker::AvailabilityChecker(std::shared_ptr<storage::ObjectStore> store,
                                         std::shared_ptr<metadata::MetadataStore> metadata)
    : store_(std::move(store)), metadata_(std::move(metadata)) {}

Availability AvailabilityChecker::Check(const std::string& booking_id,
                                        const std::string& session_id, int total_chunks,
                                        const std::vector<std::string>& keys) {
    Availability availability;
    availability.chunks_found = static_cast<int>(keys.size());
    availability.required_chunks = total_chunks;

    if (!session_id.empty()) {
        auto persisted = metadata_->UpdateProgress(booking_id, session_id,
                                                   availability.chunks_found);
        if (!persisted.ok()) {
            core::LogWarning("Failed to record progress for session " + session_id + ": " +
                             persisted.error().message);
        }
    }

    if (keys.empty()) {
        availability.reason = "no chunks found";
        return availability;
    }
    if (availability.chunks_found < total_chunks) {
        availability.reason = "found " + std::to_string(availability.chunks_found) + " of " +
                              std::to_string(total_chunks) + " chunks";
        return availability;
    }

    const auto ordered = SortByPartIndex(keys);
    for (const auto& probe : {ordered.front(), ordered.back()}) {
        auto head = store_->HeadObject(probe);
        if (!head.ok()) {
            availability.reason = "chunk " + probe + " not readable: " + head.error().message;
            core::LogWarning("Availability probe failed for " + probe + ": " +
                             head.error().message);
            return availability;
        }
    }

    availability.ready = true;
    return availability;
}

}  // namespace tilestitch::reassembly
