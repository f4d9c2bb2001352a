#include "tilestitch/reassembly/reassembly_engine.h"

#include <algorithm>
#include <cctype>

#include "tilestitch/core/logger.h"
#include "tilestitch/reassembly/part_order.h"

namespace tilestitch::reassembly {

namespace {

std::string ToLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

bool EndsWith(const std::string& value, const std::string& suffix) {
    return value.size() >= suffix.size() &&
           value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// Aborts the multipart upload on scope exit unless Commit() was called.
class MultipartGuard {
public:
    MultipartGuard(storage::ObjectStore& store, std::string upload_id)
        : store_(store), upload_id_(std::move(upload_id)) {}
    MultipartGuard(const MultipartGuard&) = delete;
    MultipartGuard& operator=(const MultipartGuard&) = delete;

    ~MultipartGuard() {
        if (committed_) {
            return;
        }
        auto aborted = store_.AbortMultipartUpload(upload_id_);
        if (!aborted.ok()) {
            core::LogError("Failed to abort multipart upload " + upload_id_ + ": " +
                           aborted.error().message);
        }
    }

    void Commit() { committed_ = true; }

private:
    storage::ObjectStore& store_;
    std::string upload_id_;
    bool committed_{false};
};

}  // namespace

const char* MergeStrategyName(MergeStrategy strategy) {
    return strategy == MergeStrategy::kDirect ? "direct" : "segmented_copy";
}

ReassemblyEngine::ReassemblyEngine(std::shared_ptr<storage::ObjectStore> store,
                                   EngineOptions options)
    : store_(std::move(store)), options_(std::move(options)) {}

core::Result<MergeOutput> ReassemblyEngine::Merge(const MergeRequest& request) {
    if (request.keys.empty()) {
        return core::Error{core::ErrorCode::kInvalidArgument, "no chunks to merge"};
    }

    std::vector<storage::ObjectInfo> chunks;
    chunks.reserve(request.keys.size());
    for (const auto& key : SortByPartIndex(request.keys)) {
        auto head = store_->HeadObject(key);
        if (!head.ok()) {
            return core::Error{head.error().code,
                               "failed to inspect chunk " + key + ": " + head.error().message};
        }
        chunks.push_back(head.value());
    }

    MergeOutput output;
    output.file_name = CleanFileName(request.original_file_name);
    output.key = OutputKey(request.booking_id, request.resource_id, output.file_name);
    output.strategy = SelectStrategy(chunks, options_.min_segment_bytes);

    core::LogInfo("Merging " + std::to_string(chunks.size()) + " chunks into " + output.key +
                  " using " + MergeStrategyName(output.strategy));

    auto merged = output.strategy == MergeStrategy::kDirect ? DirectConcat(output.key, chunks)
                                                            : SegmentedCopy(output.key, chunks);
    if (!merged.ok()) {
        return merged.error();
    }
    output.size = merged.value().size_bytes;
    return output;
}

MergeStrategy ReassemblyEngine::SelectStrategy(const std::vector<storage::ObjectInfo>& chunks,
                                               std::uint64_t min_segment_bytes) {
    if (chunks.size() <= 1) {
        return MergeStrategy::kSegmentedCopy;
    }
    for (std::size_t i = 0; i + 1 < chunks.size(); ++i) {
        if (chunks[i].size_bytes < min_segment_bytes) {
            return MergeStrategy::kDirect;
        }
    }
    return MergeStrategy::kSegmentedCopy;
}

std::string ReassemblyEngine::CleanFileName(const std::string& original_file_name) {
    std::string name = original_file_name;
    const auto part_pos = ToLower(name).find(".part");
    if (part_pos != std::string::npos && part_pos > 0) {
        name = name.substr(0, part_pos);
    }
    const auto lowered = ToLower(name);
    if (!EndsWith(lowered, ".tif") && !EndsWith(lowered, ".tiff")) {
        name += ".tif";
    }
    return name;
}

std::string ReassemblyEngine::OutputKey(const std::string& booking_id,
                                        const std::string& resource_id,
                                        const std::string& clean_file_name) {
    return booking_id + "/reassembled_" + resource_id + "_" + clean_file_name;
}

core::Result<storage::ObjectInfo> ReassemblyEngine::SegmentedCopy(
    const std::string& output_key, const std::vector<storage::ObjectInfo>& chunks) {
    auto upload = store_->CreateMultipartUpload(output_key, options_.content_type);
    if (!upload.ok()) {
        return upload.error();
    }
    MultipartGuard guard(*store_, upload.value());

    std::vector<storage::CompletedPart> parts;
    parts.reserve(chunks.size());
    for (std::size_t i = 0; i < chunks.size(); ++i) {
        const int part_number = static_cast<int>(i) + 1;
        auto part = store_->UploadPartCopy(upload.value(), part_number, chunks[i].key);
        if (!part.ok()) {
            return core::Error{part.error().code, "failed to copy chunk " + chunks[i].key +
                                                      " as part " + std::to_string(part_number) +
                                                      ": " + part.error().message};
        }
        parts.push_back(part.value());
    }

    auto completed = store_->CompleteMultipartUpload(upload.value(), parts);
    if (!completed.ok()) {
        return completed.error();
    }
    guard.Commit();
    return completed;
}

core::Result<storage::ObjectInfo> ReassemblyEngine::DirectConcat(
    const std::string& output_key, const std::vector<storage::ObjectInfo>& chunks) {
    std::uint64_t total = 0;
    for (const auto& chunk : chunks) {
        total += chunk.size_bytes;
    }
    if (total > options_.direct_max_bytes) {
        return core::Error{core::ErrorCode::kTooLarge,
                           "direct merge of " + std::to_string(total) +
                               " bytes exceeds the limit of " +
                               std::to_string(options_.direct_max_bytes)};
    }

    std::string data;
    data.reserve(static_cast<std::size_t>(total));
    for (const auto& chunk : chunks) {
        auto body = store_->GetObject(chunk.key);
        if (!body.ok()) {
            return core::Error{body.error().code, "failed to download chunk " + chunk.key +
                                                      ": " + body.error().message};
        }
        data += body.value();
    }

    storage::PutOptions put_options;
    put_options.content_type = options_.content_type;
    return store_->PutObject(output_key, data, put_options);
}

}  // namespace tilestitch::reassembly
