#include <memory>
#include <string>

#include <gtest/gtest.h>

#include "in_memory_object_store.h"
#include "temp_database.h"
#include "tilestitch/core/config.h"
#include "tilestitch/reassembly/pipeline.h"
#include "tilestitch/reassembly/sweeper.h"

namespace {

using tilestitch::reassembly::ReassemblyPipeline;
using tilestitch::reassembly::Sweeper;
using tilestitch::testing::InMemoryObjectStore;
using tilestitch::testing::TempDatabase;

class SweeperTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_ = std::make_shared<InMemoryObjectStore>();
        tilestitch::core::ReassemblyConfig reassembly;
        reassembly.min_segment_bytes = 8;
        reassembly.direct_max_bytes = 1024;
        pipeline_ = std::make_shared<ReassemblyPipeline>(store_, db_.store(), reassembly);

        tilestitch::core::SweeperConfig sweeper;
        sweeper.stale_after_seconds = 0;
        sweeper.max_sessions_per_sweep = 10;
        sweeper_ = std::make_unique<Sweeper>(db_.store(), pipeline_, sweeper);
    }

    // Registers a manifest session of `total` chunks and uploads `present` of them.
    void Upload(const std::string& booking_id, const std::string& session_id, int total,
                int present) {
        const auto manifest_key = booking_id + "/" + session_id + "_manifest.json";
        store_->Put(manifest_key, R"({"sessionId":")" + session_id +
                                      R"(","originalFileName":"map.tif","totalChunks":)" +
                                      std::to_string(total) + "}");
        for (int i = 0; i < present; ++i) {
            store_->Put(booking_id + "/" + session_id + "_map.tif.part" + std::to_string(i),
                        i + 1 == total ? "tail" : "12345678");
        }
        ASSERT_TRUE(pipeline_->resolver().Resolve(booking_id, manifest_key).ok());
    }

    TempDatabase db_;
    std::shared_ptr<InMemoryObjectStore> store_;
    std::shared_ptr<ReassemblyPipeline> pipeline_;
    std::unique_ptr<Sweeper> sweeper_;
};

}  // namespace

TEST_F(SweeperTest, ProcessesEachSessionIndependently) {
    Upload("b1", "1700000000001", 2, 2);
    Upload("b2", "1700000000002", 3, 1);
    Upload("b3", "1700000000003", 3, 3);
    // The middle chunk of b3 cannot be inspected, so its merge fails.
    store_->FailHeadFor("b3/1700000000003_map.tif.part1");

    const auto report = sweeper_->RunOnce();
    EXPECT_EQ(report.checked, 3);
    EXPECT_EQ(report.reassembled, 1);
    EXPECT_EQ(report.not_ready, 1);
    EXPECT_EQ(report.failed, 1);
    EXPECT_EQ(report.results.size(), 3u);

    auto done = db_.store()->GetSession("b1", "1700000000001");
    ASSERT_TRUE(done.ok());
    EXPECT_EQ(done.value().status, "completed");
    auto failed = db_.store()->GetSession("b3", "1700000000003");
    ASSERT_TRUE(failed.ok());
    EXPECT_EQ(failed.value().status, "failed");
}

TEST_F(SweeperTest, SkipsTerminalSessionsOnLaterRuns) {
    Upload("b1", "1700000000001", 2, 2);
    Upload("b2", "1700000000002", 2, 1);

    const auto first = sweeper_->RunOnce();
    EXPECT_EQ(first.checked, 2);
    EXPECT_EQ(first.reassembled, 1);

    const auto second = sweeper_->RunOnce();
    EXPECT_EQ(second.checked, 1);
    EXPECT_EQ(second.not_ready, 1);
    ASSERT_EQ(second.results.size(), 1u);
    EXPECT_EQ(second.results[0].session_id, "1700000000002");
}

TEST_F(SweeperTest, ReportSerialisesCounts) {
    Upload("b1", "1700000000001", 2, 2);
    const auto report = sweeper_->RunOnce();
    auto json = report.ToJson();
    EXPECT_TRUE(json->getValue<bool>("success"));
    EXPECT_EQ(json->getValue<int>("checked"), 1);
    EXPECT_EQ(json->getValue<int>("reassembled"), 1);
    ASSERT_TRUE(json->getArray("results"));
    EXPECT_EQ(json->getArray("results")->size(), 1u);
}
