#include <memory>
#include <string>

#include <gtest/gtest.h>

#include "in_memory_object_store.h"
#include "temp_database.h"
#include "tilestitch/reassembly/manifest_resolver.h"

namespace {

using tilestitch::reassembly::ManifestResolver;
using tilestitch::testing::InMemoryObjectStore;
using tilestitch::testing::TempDatabase;

}  // namespace

TEST(ManifestResolver, ParsesAllFields) {
    auto manifest = ManifestResolver::ParseManifest(
        R"({"sessionId":"1700000000001","originalFileName":"survey.tif","totalChunks":4,)"
        R"("checksum":"abc","timestamp":1700000000001})");
    ASSERT_TRUE(manifest.has_value());
    EXPECT_EQ(manifest->session_id, "1700000000001");
    EXPECT_EQ(manifest->original_file_name, "survey.tif");
    EXPECT_EQ(manifest->total_chunks, 4);
    EXPECT_EQ(manifest->checksum, "abc");
    EXPECT_EQ(manifest->timestamp, 1700000000001);
}

TEST(ManifestResolver, RejectsMalformedDocuments) {
    EXPECT_FALSE(ManifestResolver::ParseManifest("not json").has_value());
    EXPECT_FALSE(ManifestResolver::ParseManifest("[1,2]").has_value());
    EXPECT_FALSE(ManifestResolver::ParseManifest(R"({"sessionId":"s","totalChunks":-1})")
                     .has_value());
    // A missing sessionId still parses; registration rejects it.
    auto partial = ManifestResolver::ParseManifest(R"({"originalFileName":"a.tif"})");
    ASSERT_TRUE(partial.has_value());
    EXPECT_TRUE(partial->session_id.empty());
    EXPECT_EQ(partial->total_chunks, 0);
}

TEST(ManifestResolver, ResolveRegistersPendingSession) {
    TempDatabase db;
    auto store = std::make_shared<InMemoryObjectStore>();
    store->Put("b1/1700000000001_manifest.json",
               R"({"sessionId":"1700000000001","originalFileName":"survey.tif","totalChunks":2})");

    ManifestResolver resolver(store, db.store());
    auto session = resolver.Resolve("b1", "b1/1700000000001_manifest.json");
    ASSERT_TRUE(session.ok());
    EXPECT_EQ(session.value().status, "pending");
    EXPECT_EQ(session.value().total_chunks, 2);
    EXPECT_EQ(session.value().manifest_key, "b1/1700000000001_manifest.json");

    auto stored = db.store()->GetSession("b1", "1700000000001");
    ASSERT_TRUE(stored.ok());
    EXPECT_EQ(stored.value().original_file_name, "survey.tif");
}

TEST(ManifestResolver, MissingManifestAndMissingFields) {
    TempDatabase db;
    auto store = std::make_shared<InMemoryObjectStore>();
    store->Put("b1/nosession_manifest.json", R"({"originalFileName":"survey.tif"})");
    store->Put("b1/noname_manifest.json", R"({"sessionId":"1700000000001"})");

    ManifestResolver resolver(store, db.store());
    auto missing = resolver.Resolve("b1", "b1/absent_manifest.json");
    ASSERT_FALSE(missing.ok());
    EXPECT_EQ(missing.error().code, tilestitch::core::ErrorCode::kNotFound);

    auto no_session = resolver.Resolve("b1", "b1/nosession_manifest.json");
    ASSERT_FALSE(no_session.ok());
    EXPECT_EQ(no_session.error().code, tilestitch::core::ErrorCode::kInvalidArgument);
    EXPECT_EQ(no_session.error().message, "Manifest missing sessionId");

    auto no_name = resolver.Resolve("b1", "b1/noname_manifest.json");
    ASSERT_FALSE(no_name.ok());
    EXPECT_EQ(no_name.error().message, "Manifest missing originalFileName");
}

TEST(ManifestResolver, FindsNewestManifestForSession) {
    TempDatabase db;
    auto store = std::make_shared<InMemoryObjectStore>();
    store->Put("b1/1700000000001_a_manifest.json", "{}");
    store->Put("b1/1700000000001_b_manifest.json", "{}");
    store->Put("b1/1700000000001_survey.tif.part0", "x");

    ManifestResolver resolver(store, db.store());
    auto key = resolver.FindManifestKey("b1", "1700000000001");
    ASSERT_TRUE(key.has_value());
    EXPECT_EQ(*key, "b1/1700000000001_b_manifest.json");
    EXPECT_FALSE(resolver.FindManifestKey("b1", "1700000000002").has_value());
}
