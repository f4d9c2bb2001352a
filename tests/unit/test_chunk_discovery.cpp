#include <memory>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "in_memory_object_store.h"
#include "tilestitch/reassembly/chunk_discovery.h"

namespace {

using tilestitch::reassembly::ChunkDiscovery;
using tilestitch::reassembly::DiscoveryStrategy;
using tilestitch::testing::InMemoryObjectStore;

}  // namespace

TEST(ChunkDiscovery, MatchesSessionByPathAndName) {
    auto store = std::make_shared<InMemoryObjectStore>();
    store->Put("b1/1700000000001/survey.tif.part0", "a");
    store->Put("b1/1700000000001_survey.tif.part1", "b");
    store->Put("b1/1700000000001_manifest.json", "{}");
    store->Put("b1/1700000000002_other.tif.part0", "c");

    ChunkDiscovery discovery(store, "timestamp");
    auto found = discovery.Discover("b1", "1700000000001");
    ASSERT_TRUE(found.ok());
    EXPECT_EQ(found.value().strategy, DiscoveryStrategy::kSessionMatch);
    const std::vector<std::string> expected = {"b1/1700000000001/survey.tif.part0",
                                               "b1/1700000000001_survey.tif.part1"};
    EXPECT_EQ(found.value().keys, expected);
}

TEST(ChunkDiscovery, MatchesSessionInNestedDirectory) {
    auto store = std::make_shared<InMemoryObjectStore>();
    store->Put("b1/uploads/1700000000001/scan.tif.part0", "a");
    store->Put("b1/uploads/1700000000001/scan.tif.part1", "b");
    store->Put("b1/other.tif.part0", "c");
    store->Put("b1/other.tif.part1", "c");
    store->Put("b1/other.tif.part2", "c");

    ChunkDiscovery discovery(store, "timestamp");
    auto found = discovery.Discover("b1", "1700000000001");
    ASSERT_TRUE(found.ok());
    EXPECT_EQ(found.value().strategy, DiscoveryStrategy::kSessionMatch);
    const std::vector<std::string> expected = {"b1/uploads/1700000000001/scan.tif.part0",
                                               "b1/uploads/1700000000001/scan.tif.part1"};
    EXPECT_EQ(found.value().keys, expected);
}

TEST(ChunkDiscovery, MatchesSessionByTag) {
    auto store = std::make_shared<InMemoryObjectStore>();
    store->Put("b1/upload/survey.tif.part0", "a", {{"timestamp", "1700000000001"}});
    store->Put("b1/upload/survey.tif.part1", "b", {{"timestamp", "1700000000001"}});
    store->Put("b1/upload/survey.tif.part2", "c", {{"timestamp", "1700000000009"}});
    store->Put("b1/upload/readme.txt", "d", {{"timestamp", "1700000000001"}});

    ChunkDiscovery discovery(store, "timestamp");
    auto found = discovery.Discover("b1", "1700000000001");
    ASSERT_TRUE(found.ok());
    EXPECT_EQ(found.value().strategy, DiscoveryStrategy::kSessionMatch);
    ASSERT_EQ(found.value().keys.size(), 2u);
    EXPECT_EQ(found.value().keys[0], "b1/upload/survey.tif.part0");
    EXPECT_EQ(found.value().keys[1], "b1/upload/survey.tif.part1");
}

TEST(ChunkDiscovery, TagProbeFailuresAreSkipped) {
    auto store = std::make_shared<InMemoryObjectStore>();
    store->Put("b1/upload/survey.tif.part0", "a", {{"timestamp", "1700000000001"}});
    store->Put("b1/upload/survey.tif.part1", "b", {{"timestamp", "1700000000001"}});
    store->FailTagsFor("b1/upload/survey.tif.part0");

    ChunkDiscovery discovery(store, "timestamp");
    auto found = discovery.Discover("b1", "1700000000001");
    ASSERT_TRUE(found.ok());
    ASSERT_EQ(found.value().keys.size(), 1u);
    EXPECT_EQ(found.value().keys[0], "b1/upload/survey.tif.part1");
}

TEST(ChunkDiscovery, FallsBackToLargestNamingGroup) {
    auto store = std::make_shared<InMemoryObjectStore>();
    store->Put("b1/a.tif.part0", "a");
    store->Put("b1/a.tif.part1", "a");
    store->Put("b1/b.tif.part0", "b");
    store->Put("b1/b.tif.part1", "b");
    store->Put("b1/b.tif.part2", "b");
    store->Put("b1/notes.txt", "n");

    ChunkDiscovery discovery(store, "timestamp");
    auto found = discovery.Discover("b1", "1700000000001");
    ASSERT_TRUE(found.ok());
    EXPECT_EQ(found.value().strategy, DiscoveryStrategy::kNamingFallback);
    EXPECT_EQ(found.value().base_name, "b.tif");
    EXPECT_EQ(found.value().keys.size(), 3u);
}

TEST(ChunkDiscovery, GroupingIgnoresListingOrder) {
    const std::vector<std::string> forward = {"b1/a.tif.part0", "b1/b.tif.part0",
                                              "b1/b.tif.part1", "b1/a.tif.part1"};
    const std::vector<std::string> reversed(forward.rbegin(), forward.rend());

    const auto first = ChunkDiscovery::GroupByBaseName(forward);
    const auto second = ChunkDiscovery::GroupByBaseName(reversed);
    // Equal group sizes: the smallest basename wins regardless of input order.
    EXPECT_EQ(first.base_name, "a.tif");
    EXPECT_EQ(second.base_name, "a.tif");
    EXPECT_EQ(first.keys.size(), 2u);
}

TEST(ChunkDiscovery, NothingFoundAndListingFailure) {
    auto store = std::make_shared<InMemoryObjectStore>();
    store->Put("b1/1700000000001_manifest.json", "{}");

    ChunkDiscovery discovery(store, "timestamp");
    auto found = discovery.Discover("b1", "1700000000001");
    ASSERT_TRUE(found.ok());
    EXPECT_TRUE(found.value().empty());
    EXPECT_EQ(found.value().strategy, DiscoveryStrategy::kNone);

    store->FailListing(true);
    auto failed = discovery.Discover("b1", "1700000000001");
    ASSERT_FALSE(failed.ok());
    EXPECT_EQ(failed.error().code, tilestitch::core::ErrorCode::kUnavailable);
}
