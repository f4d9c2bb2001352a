#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "tilestitch/core/result.h"
#include "tilestitch/storage/object_store.h"

namespace tilestitch::reassembly {

enum class MergeStrategy {
    kSegmentedCopy,
    kDirect,
};

const char* MergeStrategyName(MergeStrategy strategy);

struct EngineOptions {
    std::uint64_t min_segment_bytes{5242880};
    std::uint64_t direct_max_bytes{536870912};
    std::string content_type{"image/tiff"};
};

struct MergeRequest {
    std::string booking_id;
    std::string resource_id;
    std::string original_file_name;
    std::vector<std::string> keys;
};

struct MergeOutput {
    std::string key;
    std::string file_name;
    std::uint64_t size{0};
    MergeStrategy strategy{MergeStrategy::kSegmentedCopy};
};

/// @brief Merges ordered chunk objects into one output object.
///
/// Chunks at or above the store's minimum segment size are stitched with a server-side
/// multipart copy; otherwise they are downloaded and concatenated, up to direct_max_bytes.
class ReassemblyEngine {
public:
    ReassemblyEngine(std::shared_ptr<storage::ObjectStore> store, EngineOptions options);

    core::Result<MergeOutput> Merge(const MergeRequest& request);

    static MergeStrategy SelectStrategy(const std::vector<storage::ObjectInfo>& chunks,
                                        std::uint64_t min_segment_bytes);
    /// "survey.tif.part0" -> "survey.tif"; names without a .tif/.tiff extension gain ".tif".
    static std::string CleanFileName(const std::string& original_file_name);
    static std::string OutputKey(const std::string& booking_id, const std::string& resource_id,
                                 const std::string& clean_file_name);

private:
    core::Result<storage::ObjectInfo> SegmentedCopy(const std::string& output_key,
                                                    const std::vector<storage::ObjectInfo>& chunks);
    core::Result<storage::ObjectInfo> DirectConcat(const std::string& output_key,
                                                   const std::vector<storage::ObjectInfo>& chunks);

    std::shared_ptr<storage::ObjectStore> store_;
    EngineOptions options_;
};

}  // namespace tilestitch::reassembly
