#include "tilestitch/reassembly/finalizer.h"

#include "tilestitch/core/logger.h"
#include "tilestitch/core/time.h"

namespace tilestitch::reassembly {

Finalizer::Finalizer(std::shared_ptr<storage::ObjectStore> store,
                     std::shared_ptr<metadata::MetadataStore> metadata, FinalizerOptions options)
    : store_(std::move(store)), metadata_(std::move(metadata)), options_(std::move(options)) {}

ReassemblyResult Finalizer::Finalize(const FinalizeContext& context, const MergeOutput& output) {
    auto result = ReassemblyResult::Completed(context.booking_id, context.session_id);
    result.resource_id = context.resource_id;
    result.file_name = output.file_name;
    result.blob_key = output.key;
    result.size = output.size;

    auto head = store_->HeadObject(output.key);
    if (head.ok()) {
        result.size = head.value().size_bytes;
    } else {
        core::LogWarning("Could not read size of " + output.key + ": " + head.error().message);
    }

    auto url = store_->PresignGetUrl(output.key, options_.url_ttl_seconds);
    if (url.ok()) {
        result.url = url.value();
    } else {
        core::LogWarning("Could not presign " + output.key + ": " + url.error().message);
    }

    const auto now = core::NowIso8601();
    metadata::ResourceRecord record;
    record.resource_id = context.resource_id;
    record.booking_id = context.booking_id;
    record.file_name = output.file_name;
    record.content_type = options_.content_type;
    record.resource_type =
        context.resource_type.empty() ? options_.resource_type : context.resource_type;
    record.blob_key = output.key;
    record.url = result.url;
    record.size = result.size;
    record.created_at = now;
    record.updated_at = now;
    record.session_id = context.session_id;
    record.original_resource_id = context.original_resource_id;

    auto stored = metadata_->UpsertResource(record);
    if (!stored.ok()) {
        core::LogWarning("Failed to record resource " + context.resource_id + ": " +
                         stored.error().message);
    }

    if (!context.session_id.empty()) {
        auto completed = metadata_->MarkSessionCompleted(context.booking_id, context.session_id,
                                                         context.merge_owner,
                                                         context.resource_id, result.url);
        if (!completed.ok()) {
            core::LogWarning("Failed to mark session " + context.session_id +
                             " completed: " + completed.error().message);
        } else if (!completed.value()) {
            core::LogWarning("Merge claim on session " + context.session_id +
                             " was lost before completion was recorded");
        }
    }

    core::LogEvent("reassembly_completed", {{"booking_id", context.booking_id},
                                            {"session_id", context.session_id},
                                            {"resource_id", context.resource_id},
                                            {"blob_key", output.key},
                                            {"strategy", MergeStrategyName(output.strategy)},
                                            {"size", std::to_string(result.size)}});
    return result;
}

std::optional<ReassemblyResult> Finalizer::ExistingResult(const metadata::ChunkSession& session) {
    if (session.status != metadata::kStatusCompleted || session.final_resource_id.empty()) {
        return std::nullopt;
    }
    auto resource = metadata_->GetResource(session.final_resource_id);
    if (!resource.ok()) {
        core::LogWarning("Completed session " + session.session_id + " has no resource " +
                         session.final_resource_id + ": " + resource.error().message);
        return std::nullopt;
    }

    ReassemblyResult result;
    result.outcome = Outcome::kAlreadyCompleted;
    result.success = true;
    result.message = "File already reassembled";
    result.booking_id = session.booking_id;
    result.session_id = session.session_id;
    result.resource_id = resource.value().resource_id;
    result.file_name = resource.value().file_name;
    result.url = resource.value().url;
    result.blob_key = resource.value().blob_key;
    result.size = resource.value().size;
    return result;
}

ReassemblyResult Finalizer::RecordFailure(const FinalizeContext& context,
                                          const std::string& message) {
    if (!context.session_id.empty()) {
        auto failed = metadata_->MarkSessionFailed(context.booking_id, context.session_id,
                                                   context.merge_owner, message);
        if (!failed.ok()) {
            core::LogWarning("Failed to mark session " + context.session_id +
                             " failed: " + failed.error().message);
        }
    }
    core::LogEvent("reassembly_failed", {{"booking_id", context.booking_id},
                                         {"session_id", context.session_id},
                                         {"error", message}});
    return ReassemblyResult::Failure(Outcome::kFailed, context.booking_id, context.session_id,
                                     "Error reassembling chunks: " + message);
}

}  // namespace tilestitch::reassembly
