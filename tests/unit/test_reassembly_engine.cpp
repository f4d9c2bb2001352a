#include <memory>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "in_memory_object_store.h"
#include "tilestitch/reassembly/reassembly_engine.h"

namespace {

using tilestitch::reassembly::EngineOptions;
using tilestitch::reassembly::MergeRequest;
using tilestitch::reassembly::MergeStrategy;
using tilestitch::reassembly::ReassemblyEngine;
using tilestitch::storage::ObjectInfo;
using tilestitch::testing::InMemoryObjectStore;

constexpr std::uint64_t kMiB = 1024 * 1024;

std::vector<ObjectInfo> Sizes(const std::vector<std::uint64_t>& sizes) {
    std::vector<ObjectInfo> chunks;
    for (std::size_t i = 0; i < sizes.size(); ++i) {
        ObjectInfo info;
        info.key = "b/a.tif.part" + std::to_string(i);
        info.size_bytes = sizes[i];
        chunks.push_back(info);
    }
    return chunks;
}

EngineOptions SmallOptions() {
    EngineOptions options;
    options.min_segment_bytes = 8;
    options.direct_max_bytes = 64;
    options.content_type = "image/tiff";
    return options;
}

MergeRequest Request(const std::vector<std::string>& keys) {
    MergeRequest request;
    request.booking_id = "b1";
    request.resource_id = "geotiff_1700000000_0000abcd";
    request.original_file_name = "survey.tif";
    request.keys = keys;
    return request;
}

}  // namespace

TEST(ReassemblyEngine, SmallNonFinalChunkSelectsDirect) {
    EXPECT_EQ(ReassemblyEngine::SelectStrategy(Sizes({3 * kMiB, 3 * kMiB, 1 * kMiB}), 5 * kMiB),
              MergeStrategy::kDirect);
}

TEST(ReassemblyEngine, LargeChunksSelectSegmentedCopy) {
    EXPECT_EQ(ReassemblyEngine::SelectStrategy(Sizes({6 * kMiB, 6 * kMiB, 1 * kMiB}), 5 * kMiB),
              MergeStrategy::kSegmentedCopy);
    EXPECT_EQ(ReassemblyEngine::SelectStrategy(Sizes({1 * kMiB}), 5 * kMiB),
              MergeStrategy::kSegmentedCopy);
}

TEST(ReassemblyEngine, CleanFileNameAndOutputKey) {
    EXPECT_EQ(ReassemblyEngine::CleanFileName("survey.tif.part0"), "survey.tif");
    EXPECT_EQ(ReassemblyEngine::CleanFileName("survey.TIFF"), "survey.TIFF");
    EXPECT_EQ(ReassemblyEngine::CleanFileName("survey"), "survey.tif");
    EXPECT_EQ(ReassemblyEngine::OutputKey("b1", "geotiff_1", "survey.tif"),
              "b1/reassembled_geotiff_1_survey.tif");
}

TEST(ReassemblyEngine, SegmentedCopyOrdersByPartIndex) {
    auto store = std::make_shared<InMemoryObjectStore>();
    store->Put("b1/s/survey.tif.part0", "00000000");
    store->Put("b1/s/survey.tif.part1", "11111111");
    store->Put("b1/s/survey.tif.part2", "22");

    ReassemblyEngine engine(store, SmallOptions());
    auto merged = engine.Merge(
        Request({"b1/s/survey.tif.part0", "b1/s/survey.tif.part2", "b1/s/survey.tif.part1"}));
    ASSERT_TRUE(merged.ok());
    EXPECT_EQ(merged.value().strategy, MergeStrategy::kSegmentedCopy);
    EXPECT_EQ(merged.value().key, "b1/reassembled_geotiff_1700000000_0000abcd_survey.tif");
    EXPECT_EQ(merged.value().size, 18u);
    EXPECT_EQ(store->Data(merged.value().key), "000000001111111122");
    EXPECT_EQ(store->copy_calls(), 3);
    EXPECT_EQ(store->open_uploads(), 0);
}

TEST(ReassemblyEngine, DirectConcatOrdersByPartIndex) {
    auto store = std::make_shared<InMemoryObjectStore>();
    store->Put("b1/s/survey.tif.part0", "aa");
    store->Put("b1/s/survey.tif.part1", "bb");
    store->Put("b1/s/survey.tif.part10", "cc");

    ReassemblyEngine engine(store, SmallOptions());
    auto merged = engine.Merge(
        Request({"b1/s/survey.tif.part10", "b1/s/survey.tif.part1", "b1/s/survey.tif.part0"}));
    ASSERT_TRUE(merged.ok());
    EXPECT_EQ(merged.value().strategy, MergeStrategy::kDirect);
    EXPECT_EQ(store->Data(merged.value().key), "aabbcc");
    EXPECT_EQ(store->copy_calls(), 0);
}

TEST(ReassemblyEngine, CopyFailureAbortsUpload) {
    auto store = std::make_shared<InMemoryObjectStore>();
    store->Put("b1/s/survey.tif.part0", "00000000");
    store->Put("b1/s/survey.tif.part1", "11111111");
    store->Put("b1/s/survey.tif.part2", "22");
    store->FailCopyAtPart(2);

    ReassemblyEngine engine(store, SmallOptions());
    auto merged = engine.Merge(
        Request({"b1/s/survey.tif.part0", "b1/s/survey.tif.part1", "b1/s/survey.tif.part2"}));
    ASSERT_FALSE(merged.ok());
    EXPECT_NE(merged.error().message.find("survey.tif.part1"), std::string::npos);
    EXPECT_EQ(store->aborted_uploads(), 1);
    EXPECT_EQ(store->open_uploads(), 0);
    EXPECT_FALSE(store->Has("b1/reassembled_geotiff_1700000000_0000abcd_survey.tif"));
}

TEST(ReassemblyEngine, DirectMergeAboveLimitIsTooLarge) {
    auto store = std::make_shared<InMemoryObjectStore>();
    store->PutSized("b1/s/survey.tif.part0", 4, 'a');
    store->PutSized("b1/s/survey.tif.part1", 100, 'b');

    ReassemblyEngine engine(store, SmallOptions());
    auto merged = engine.Merge(Request({"b1/s/survey.tif.part0", "b1/s/survey.tif.part1"}));
    ASSERT_FALSE(merged.ok());
    EXPECT_EQ(merged.error().code, tilestitch::core::ErrorCode::kTooLarge);
    EXPECT_EQ(store->get_calls(), 0);
}

TEST(ReassemblyEngine, MissingChunkFailsBeforeWriting) {
    auto store = std::make_shared<InMemoryObjectStore>();
    store->Put("b1/s/survey.tif.part0", "aa");

    ReassemblyEngine engine(store, SmallOptions());
    auto merged = engine.Merge(Request({"b1/s/survey.tif.part0", "b1/s/survey.tif.part1"}));
    ASSERT_FALSE(merged.ok());
    EXPECT_EQ(merged.error().code, tilestitch::core::ErrorCode::kNotFound);
    EXPECT_EQ(store->KeysWithPrefix("b1/reassembled_").size(), 0u);
}
