#pragma once

#include <memory>
#include <optional>
#include <string>

#include "tilestitch/metadata/metadata_store.h"
#include "tilestitch/reassembly/reassembly_engine.h"
#include "tilestitch/reassembly/result.h"
#include "tilestitch/storage/object_store.h"

namespace tilestitch::reassembly {

struct FinalizerOptions {
    int url_ttl_seconds{1209600};
    std::string resource_type{"geotiff"};
    std::string content_type{"image/tiff"};
};

/// @brief Identity of the session being finalized and the claim held on it.
struct FinalizeContext {
    std::string booking_id;
    std::string session_id;
    std::string merge_owner;
    std::string resource_id;
    std::string original_resource_id;
    std::string resource_type;
};

/// @brief Records the outcome of a merge exactly once.
class Finalizer {
public:
    Finalizer(std::shared_ptr<storage::ObjectStore> store,
              std::shared_ptr<metadata::MetadataStore> metadata, FinalizerOptions options);

    /// Presigns the merged object, writes the resource record and completes the session.
    /// Bookkeeping failures are logged; the merged object is reported regardless.
    ReassemblyResult Finalize(const FinalizeContext& context, const MergeOutput& output);

    /// The recorded result of an already completed session, if its resource exists.
    std::optional<ReassemblyResult> ExistingResult(const metadata::ChunkSession& session);

    /// Marks the session failed; returns the failure result for the caller.
    ReassemblyResult RecordFailure(const FinalizeContext& context, const std::string& message);

private:
    std::shared_ptr<storage::ObjectStore> store_;
    std::shared_ptr<metadata::MetadataStore> metadata_;
    FinalizerOptions options_;
};

}  // namespace tilestitch::reassembly
