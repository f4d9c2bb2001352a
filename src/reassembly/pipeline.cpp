#include "tilestitch/reassembly/pipeline.h"

#include <cctype>
#include <map>
#include <sstream>
#include <vector>

#include <Poco/UUIDGenerator.h>

#include "tilestitch/core/ids.h"
#include "tilestitch/core/logger.h"
#include "tilestitch/core/time.h"
#include "tilestitch/reassembly/part_order.h"

namespace tilestitch::reassembly {

namespace {

constexpr const char* kNothingFound = "Could not find chunks to reassemble";
constexpr std::size_t kSessionTokenMinDigits = 13;

bool EndsWith(const std::string& value, const std::string& suffix) {
    return value.size() >= suffix.size() &&
           value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool IsAllDigits(const std::string& value) {
    for (char c : value) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    return !value.empty();
}

// First `_`- or `/`-separated token that looks like an epoch-millisecond session id.
std::string SessionTokenOf(const std::string& relative_key) {
    std::string token;
    std::stringstream ss(relative_key);
    std::string segment;
    while (std::getline(ss, segment, '/')) {
        std::stringstream inner(segment);
        while (std::getline(inner, token, '_')) {
            if (token.size() >= kSessionTokenMinDigits && IsAllDigits(token)) {
                return token;
            }
        }
    }
    return "";
}

std::string NewMergeOwner() { return Poco::UUIDGenerator().createRandom().toString(); }

// Releases a merge claim on scope exit unless the session reached a terminal write.
class ClaimGuard {
public:
    ClaimGuard(metadata::MetadataStore& metadata, std::string booking_id, std::string session_id,
               std::string owner)
        : metadata_(metadata),
          booking_id_(std::move(booking_id)),
          session_id_(std::move(session_id)),
          owner_(std::move(owner)) {}
    ClaimGuard(const ClaimGuard&) = delete;
    ClaimGuard& operator=(const ClaimGuard&) = delete;

    ~ClaimGuard() {
        if (dismissed_) {
            return;
        }
        auto released = metadata_.ReleaseMergeClaim(booking_id_, session_id_, owner_);
        if (!released.ok()) {
            core::LogWarning("Failed to release merge claim on " + session_id_ + ": " +
                             released.error().message);
        }
    }

    void Dismiss() { dismissed_ = true; }

private:
    metadata::MetadataStore& metadata_;
    std::string booking_id_;
    std::string session_id_;
    std::string owner_;
    bool dismissed_{false};
};

EngineOptions ToEngineOptions(const core::ReassemblyConfig& config) {
    EngineOptions options;
    options.min_segment_bytes = config.min_segment_bytes;
    options.direct_max_bytes = config.direct_max_bytes;
    options.content_type = config.content_type;
    return options;
}

FinalizerOptions ToFinalizerOptions(const core::ReassemblyConfig& config) {
    FinalizerOptions options;
    options.url_ttl_seconds = config.url_ttl_seconds;
    options.resource_type = config.resource_type;
    options.content_type = config.content_type;
    return options;
}

}  // namespace

ReassemblyPipeline::ReassemblyPipeline(std::shared_ptr<storage::ObjectStore> store,
                                       std::shared_ptr<metadata::MetadataStore> metadata,
                                       const core::ReassemblyConfig& config)
    : store_(store),
      metadata_(metadata),
      config_(config),
      resolver_(store, metadata),
      discovery_(store, config.session_tag),
      availability_(store, metadata),
      engine_(store, ToEngineOptions(config)),
      finalizer_(store, metadata, ToFinalizerOptions(config)) {}

ReassemblyResult ReassemblyPipeline::ReassembleFromManifest(const std::string& booking_id,
                                                            const std::string& manifest_key,
                                                            const RequestOptions& options) {
    auto manifest = resolver_.Fetch(manifest_key);
    if (!manifest) {
        return ReassemblyResult::Failure(Outcome::kNotFound, booking_id, "",
                                         "Manifest file not found or invalid");
    }
    return ReassembleManifest(booking_id, *manifest, manifest_key, options);
}

ReassemblyResult ReassemblyPipeline::ReassembleManifest(const std::string& booking_id,
                                                        const Manifest& manifest,
                                                        const std::string& manifest_key,
                                                        const RequestOptions& options) {
    auto registered = resolver_.Register(booking_id, manifest, manifest_key);
    if (!registered.ok()) {
        const auto outcome = registered.error().code == core::ErrorCode::kInvalidArgument
                                 ? Outcome::kInvalid
                                 : Outcome::kFailed;
        return ReassemblyResult::Failure(outcome, booking_id, manifest.session_id,
                                         registered.error().message);
    }
    return Run(SessionPlan{registered.value(), std::nullopt}, options);
}

ReassemblyResult ReassemblyPipeline::ReassembleSession(const std::string& booking_id,
                                                       const std::string& session_id,
                                                       const RequestOptions& options) {
    if (!options.manifest_key.empty()) {
        auto manifest = resolver_.Fetch(options.manifest_key);
        if (manifest && manifest->session_id == session_id) {
            return ReassembleManifest(booking_id, *manifest, options.manifest_key, options);
        }
    }

    std::string manifest_key;
    auto existing = metadata_->GetSession(booking_id, session_id);
    if (existing.ok()) {
        manifest_key = existing.value().manifest_key;
    }
    if (manifest_key.empty()) {
        manifest_key = resolver_.FindManifestKey(booking_id, session_id).value_or("");
    }
    if (!manifest_key.empty() && manifest_key != options.manifest_key) {
        auto manifest = resolver_.Fetch(manifest_key);
        if (manifest && manifest->session_id == session_id) {
            return ReassembleManifest(booking_id, *manifest, manifest_key, options);
        }
    }
    return SessionWithoutManifest(booking_id, session_id, options);
}

ReassemblyResult ReassemblyPipeline::SessionWithoutManifest(const std::string& booking_id,
                                                            const std::string& session_id,
                                                            const RequestOptions& options) {
    auto existing = metadata_->GetSession(booking_id, session_id);
    if (!existing.ok() && existing.error().code != core::ErrorCode::kNotFound) {
        return ReassemblyResult::Failure(Outcome::kFailed, booking_id, session_id,
                                         "Failed to read session: " + existing.error().message);
    }
    if (existing.ok() && existing.value().status == metadata::kStatusCompleted) {
        return Run(SessionPlan{existing.value(), std::nullopt}, options);
    }

    auto discovered = discovery_.Discover(booking_id, session_id);
    if (!discovered.ok()) {
        return ReassemblyResult::Failure(Outcome::kNotReady, booking_id, session_id,
                                         "Chunk listing unavailable: " +
                                             discovered.error().message);
    }

    if (existing.ok()) {
        return Run(SessionPlan{existing.value(), discovered.value()}, options);
    }

    metadata::ChunkSession session;
    session.booking_id = booking_id;
    session.session_id = session_id;
    if (discovered.value().empty()) {
        return HandleNothingFound(session, false, options);
    }

    // No manifest: the discovered chunks define the session.
    session.chunk_id = metadata::SessionChunkId(session_id);
    session.total_chunks = static_cast<int>(discovered.value().keys.size());
    session.original_file_name =
        !options.base_file_name.empty()
            ? options.base_file_name
            : StripPartSuffix(BaseName(SortByPartIndex(discovered.value().keys).front()));
    session.manifest_timestamp = core::NowEpochMillis();
    auto registered = metadata_->RegisterSession(session);
    if (!registered.ok()) {
        return ReassemblyResult::Failure(Outcome::kFailed, booking_id, session_id,
                                         "Failed to register session: " +
                                             registered.error().message);
    }
    core::LogInfo("Registered manifest-less session " + session_id + " with " +
                  std::to_string(session.total_chunks) + " chunks (" +
                  DiscoveryStrategyName(discovered.value().strategy) + ")");
    return Run(SessionPlan{registered.value(), discovered.value()}, options);
}

ReassemblyResult ReassemblyPipeline::Run(SessionPlan plan, const RequestOptions& options) {
    const auto& session = plan.session;
    const auto& booking_id = session.booking_id;
    const auto& session_id = session.session_id;

    if (session.status == metadata::kStatusCompleted) {
        return CompletedResult(session);
    }
    if (session.status == metadata::kStatusFailed && !options.allow_restart) {
        return ReassemblyResult::Failure(Outcome::kFailed, booking_id, session_id,
                                         "Session previously failed: " + session.error_message);
    }

    if (!plan.discovered) {
        auto discovered = discovery_.Discover(booking_id, session_id);
        if (!discovered.ok()) {
            return ReassemblyResult::Failure(Outcome::kNotReady, booking_id, session_id,
                                             "Chunk listing unavailable: " +
                                                 discovered.error().message);
        }
        plan.discovered = discovered.value();
    }
    const auto& discovered = *plan.discovered;
    if (discovered.empty()) {
        return HandleNothingFound(session, true, options);
    }
    // A manifest names its session; chunks grouped only by file name belong to another upload.
    if (!session.manifest_key.empty() &&
        discovered.strategy == DiscoveryStrategy::kNamingFallback) {
        core::LogInfo("Ignoring naming-convention group " + discovered.base_name +
                      " for manifest session " + session_id);
        auto result = ReassemblyResult::Failure(Outcome::kNotReady, booking_id, session_id,
                                                "Not all chunks available yet: no chunks "
                                                "matched the session");
        result.required_chunks = session.total_chunks;
        result.chunks_found = 0;
        return result;
    }

    const auto availability =
        availability_.Check(booking_id, session_id, session.total_chunks, discovered.keys);
    if (!availability.ready) {
        auto result = ReassemblyResult::Failure(Outcome::kNotReady, booking_id, session_id,
                                                "Not all chunks available yet: " +
                                                    availability.reason);
        result.required_chunks = session.total_chunks;
        result.chunks_found = availability.chunks_found;
        return result;
    }

    const auto owner = NewMergeOwner();
    auto claimed = metadata_->TryClaimMerge(booking_id, session_id, owner, ClaimCutoff(),
                                            options.allow_restart);
    if (!claimed.ok()) {
        return ReassemblyResult::Failure(Outcome::kFailed, booking_id, session_id,
                                         "Failed to claim session: " + claimed.error().message);
    }
    if (!claimed.value()) {
        // The claim also fails when another invocation finished the session meanwhile.
        auto current = metadata_->GetSession(booking_id, session_id);
        if (current.ok() && current.value().status == metadata::kStatusCompleted) {
            return CompletedResult(current.value());
        }
        return ReassemblyResult::Failure(Outcome::kInProgress, booking_id, session_id,
                                         "Reassembly already in progress");
    }
    ClaimGuard guard(*metadata_, booking_id, session_id, owner);

    FinalizeContext context;
    context.booking_id = booking_id;
    context.session_id = session_id;
    context.merge_owner = owner;
    context.resource_type =
        options.resource_type.empty() ? config_.resource_type : options.resource_type;
    context.resource_id = core::GenerateResourceId(context.resource_type);
    context.original_resource_id = options.final_resource_id;

    MergeRequest request;
    request.booking_id = booking_id;
    request.resource_id = context.resource_id;
    request.original_file_name = session.original_file_name.empty()
                                     ? "reassembled_" + session_id + ".tif"
                                     : session.original_file_name;
    request.keys = discovered.keys;

    auto merged = engine_.Merge(request);
    if (!merged.ok()) {
        auto result = finalizer_.RecordFailure(context, merged.error().message);
        guard.Dismiss();
        return result;
    }
    auto result = finalizer_.Finalize(context, merged.value());
    guard.Dismiss();
    return result;
}

ReassemblyResult ReassemblyPipeline::CompletedResult(const metadata::ChunkSession& session) {
    auto existing = finalizer_.ExistingResult(session);
    if (existing) {
        return *existing;
    }
    ReassemblyResult result;
    result.outcome = Outcome::kAlreadyCompleted;
    result.success = true;
    result.message = "File already reassembled";
    result.booking_id = session.booking_id;
    result.session_id = session.session_id;
    result.resource_id = session.final_resource_id;
    result.url = session.reassembled_url;
    return result;
}

ReassemblyResult ReassemblyPipeline::HandleNothingFound(const metadata::ChunkSession& session,
                                                        bool registered,
                                                        const RequestOptions& options) {
    core::LogWarning("No chunks found for session " + session.session_id + " of booking " +
                     session.booking_id);
    if (registered && options.fail_if_not_found) {
        const auto owner = NewMergeOwner();
        auto claimed = metadata_->TryClaimMerge(session.booking_id, session.session_id, owner,
                                                ClaimCutoff(), options.allow_restart);
        if (claimed.ok() && claimed.value()) {
            FinalizeContext context;
            context.booking_id = session.booking_id;
            context.session_id = session.session_id;
            context.merge_owner = owner;
            finalizer_.RecordFailure(context, kNothingFound);
        } else if (!claimed.ok()) {
            core::LogWarning("Could not claim session " + session.session_id +
                             " to record failure: " + claimed.error().message);
        }
    }
    return ReassemblyResult::Failure(Outcome::kNotFound, session.booking_id, session.session_id,
                                     kNothingFound);
}

ReassemblyResult ReassemblyPipeline::ReassembleBooking(const std::string& booking_id,
                                                       const RequestOptions& options) {
    if (!options.final_resource_id.empty()) {
        auto session = metadata_->FindSessionByResourceId(booking_id, options.final_resource_id);
        if (session.ok()) {
            RequestOptions session_options = options;
            if (session_options.manifest_key.empty()) {
                session_options.manifest_key = session.value().manifest_key;
            }
            return ReassembleSession(booking_id, session.value().session_id, session_options);
        }
        if (session.error().code != core::ErrorCode::kNotFound) {
            core::LogWarning("Lookup by resource id failed: " + session.error().message);
        }
    }

    if (!options.base_file_name.empty()) {
        auto by_name = ReassembleByBaseFileName(booking_id, options);
        if (by_name) {
            return *by_name;
        }
    }

    auto pending = metadata_->ListBookingSessions(booking_id, metadata::kStatusPending);
    if (!pending.ok()) {
        core::LogWarning("Listing pending sessions of " + booking_id +
                         " failed: " + pending.error().message);
    } else if (!pending.value().empty()) {
        const auto& oldest = pending.value().front();
        RequestOptions session_options = options;
        if (session_options.manifest_key.empty()) {
            session_options.manifest_key = oldest.manifest_key;
        }
        return ReassembleSession(booking_id, oldest.session_id, session_options);
    }

    return ReassemblyResult::Failure(Outcome::kNotFound, booking_id, "", kNothingFound);
}

std::optional<ReassemblyResult> ReassemblyPipeline::ReassembleByBaseFileName(
    const std::string& booking_id, const RequestOptions& options) {
    const auto prefix = booking_id + "/";
    auto listing = store_->ListObjects(prefix + options.base_file_name);
    if (!listing.ok()) {
        core::LogWarning("Listing " + prefix + options.base_file_name +
                         " failed: " + listing.error().message);
        return std::nullopt;
    }

    std::map<std::string, std::vector<std::string>> groups;
    for (const auto& object : listing.value()) {
        const auto token = SessionTokenOf(object.key.substr(prefix.size()));
        if (!token.empty()) {
            groups[token].push_back(object.key);
        }
    }
    const std::pair<const std::string, std::vector<std::string>>* best = nullptr;
    for (const auto& group : groups) {
        if (!best || group.second.size() > best->second.size()) {
            best = &group;
        }
    }
    if (!best) {
        return std::nullopt;
    }

    const auto& session_id = best->first;
    for (const auto& key : best->second) {
        if (!EndsWith(key, "_manifest.json")) {
            continue;
        }
        auto manifest = resolver_.Fetch(key);
        if (manifest) {
            return ReassembleManifest(booking_id, *manifest, key, options);
        }
    }
    return SessionWithoutManifest(booking_id, session_id, options);
}

std::string ReassemblyPipeline::ClaimCutoff() const {
    return core::NowIso8601WithOffsetSeconds(-config_.merge_claim_ttl_seconds);
}

}  // namespace tilestitch::reassembly
