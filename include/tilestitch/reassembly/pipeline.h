#pragma once

#include <memory>
#include <optional>
#include <string>

#include "tilestitch/core/config.h"
#include "tilestitch/metadata/metadata_store.h"
#include "tilestitch/reassembly/availability_checker.h"
#include "tilestitch/reassembly/chunk_discovery.h"
#include "tilestitch/reassembly/finalizer.h"
#include "tilestitch/reassembly/manifest_resolver.h"
#include "tilestitch/reassembly/reassembly_engine.h"
#include "tilestitch/reassembly/result.h"
#include "tilestitch/storage/object_store.h"

namespace tilestitch::reassembly {

/// @brief Caller-supplied hints for a reassembly run.
struct RequestOptions {
    std::string manifest_key;
    std::string base_file_name;
    // Recorded on the resource as originalResourceId.
    std::string final_resource_id;
    std::string resource_type;
    // Lets an explicit request take over a failed session.
    bool allow_restart{false};
    // Marks a registered session failed when its chunks cannot be found.
    bool fail_if_not_found{false};
};

/// @brief Runs discovery, availability, merge and finalization for one session.
///
/// Three entry points cover the trigger shapes: a manifest key, a session id, or only a
/// booking id. All of them converge on the same claim-merge-finalize sequence.
class ReassemblyPipeline {
public:
    ReassemblyPipeline(std::shared_ptr<storage::ObjectStore> store,
                       std::shared_ptr<metadata::MetadataStore> metadata,
                       const core::ReassemblyConfig& config);

    ReassemblyResult ReassembleFromManifest(const std::string& booking_id,
                                            const std::string& manifest_key,
                                            const RequestOptions& options = {});
    /// Registers an already parsed manifest and reassembles its session.
    ReassemblyResult ReassembleManifest(const std::string& booking_id, const Manifest& manifest,
                                        const std::string& manifest_key,
                                        const RequestOptions& options = {});
    ReassemblyResult ReassembleSession(const std::string& booking_id,
                                       const std::string& session_id,
                                       const RequestOptions& options = {});
    ReassemblyResult ReassembleBooking(const std::string& booking_id,
                                       const RequestOptions& options = {});

    ManifestResolver& resolver() { return resolver_; }

private:
    struct SessionPlan {
        metadata::ChunkSession session;
        std::optional<DiscoveryResult> discovered;
    };

    ReassemblyResult Run(SessionPlan plan, const RequestOptions& options);
    ReassemblyResult CompletedResult(const metadata::ChunkSession& session);
    ReassemblyResult SessionWithoutManifest(const std::string& booking_id,
                                            const std::string& session_id,
                                            const RequestOptions& options);
    ReassemblyResult HandleNothingFound(const metadata::ChunkSession& session, bool registered,
                                        const RequestOptions& options);
    std::optional<ReassemblyResult> ReassembleByBaseFileName(const std::string& booking_id,
                                                             const RequestOptions& options);
    std::string ClaimCutoff() const;

    std::shared_ptr<storage::ObjectStore> store_;
    std::shared_ptr<metadata::MetadataStore> metadata_;
    core::ReassemblyConfig config_;
    ManifestResolver resolver_;
    ChunkDiscovery discovery_;
    AvailabilityChecker availability_;
    ReassemblyEngine engine_;
    Finalizer finalizer_;
};

}  // namespace tilestitch::reassembly
