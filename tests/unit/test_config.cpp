#include <filesystem>
#include <fstream>
#include <string>

#include <gtest/gtest.h>
#include <Poco/UUIDGenerator.h>

#include "tilestitch/core/config.h"

namespace {

std::filesystem::path MakeTempConfigPath() {
    const auto name = "tilestitch_cfg_" + Poco::UUIDGenerator().createOne().toString() + ".json";
    return std::filesystem::temp_directory_path() / name;
}

void WriteConfig(const std::filesystem::path& path, const std::string& signing_secret,
                 long long min_segment_bytes = 5242880,
                 long long direct_max_bytes = 536870912) {
    std::ofstream out(path);
    out << "{\n"
        << "  \"server\": {\n"
        << "    \"host\": \"127.0.0.1\",\n"
        << "    \"port\": 9090,\n"
        << "    \"threads\": 2,\n"
        << "    \"tls\": {\"enabled\": false, \"certificate\": \"\", \"private_key\": \"\"},\n"
        << "    \"limits\": {\"max_body_bytes\": 4096}\n"
        << "  },\n"
        << "  \"storage\": {\n"
        << "    \"base_path\": \"blobs\",\n"
        << "    \"temp_path\": \"blobs/tmp\",\n"
        << "    \"bucket\": \"survey-uploads\",\n"
        << "    \"signing_secret\": \"" << signing_secret << "\"\n"
        << "  },\n"
        << "  \"reassembly\": {\n"
        << "    \"min_segment_bytes\": " << min_segment_bytes << ",\n"
        << "    \"direct_max_bytes\": " << direct_max_bytes << ",\n"
        << "    \"resource_type\": \"orthomosaic\"\n"
        << "  },\n"
        << "  \"sweeper\": {\"enabled\": false, \"stale_after_seconds\": 30},\n"
        << "  \"observability\": {\"log_level\": \"warning\"}\n"
        << "}\n";
}

}  // namespace

TEST(Config, LoadsValuesAndDefaults) {
    const auto path = MakeTempConfigPath();
    WriteConfig(path, "s3cret");

    auto config = tilestitch::core::LoadConfig(path.string());
    EXPECT_EQ(config.server.host, "127.0.0.1");
    EXPECT_EQ(config.server.port, 9090);
    EXPECT_EQ(config.server.limits.max_body_bytes, 4096u);
    EXPECT_EQ(config.storage.bucket, "survey-uploads");
    EXPECT_EQ(config.storage.signing_secret, "s3cret");
    EXPECT_EQ(config.reassembly.resource_type, "orthomosaic");
    EXPECT_FALSE(config.sweeper.enabled);
    EXPECT_EQ(config.sweeper.stale_after_seconds, 30);

    // Keys absent from the file keep their defaults.
    EXPECT_EQ(config.storage.min_part_bytes, 5242880u);
    EXPECT_EQ(config.reassembly.content_type, "image/tiff");
    EXPECT_EQ(config.reassembly.url_ttl_seconds, 1209600);
    EXPECT_EQ(config.reassembly.session_tag, "timestamp");
    EXPECT_EQ(config.sweeper.max_sessions_per_sweep, 100);
    EXPECT_EQ(config.observability.log_level, "warning");
    EXPECT_TRUE(config.observability.log_file.empty());

    std::filesystem::remove(path);
}

TEST(Config, BlankSigningSecretIsRejected) {
    const auto path = MakeTempConfigPath();
    WriteConfig(path, "   ");

    EXPECT_THROW({ (void)tilestitch::core::LoadConfig(path.string()); }, std::invalid_argument);

    std::filesystem::remove(path);
}

TEST(Config, DirectLimitBelowSegmentSizeIsRejected) {
    const auto path = MakeTempConfigPath();
    WriteConfig(path, "s3cret", 5242880, 1024);

    EXPECT_THROW({ (void)tilestitch::core::LoadConfig(path.string()); }, std::invalid_argument);

    std::filesystem::remove(path);
}

TEST(Config, NonPositiveSegmentSizeIsRejected) {
    const auto path = MakeTempConfigPath();
    WriteConfig(path, "s3cret", 0, 1024);

    EXPECT_THROW({ (void)tilestitch::core::LoadConfig(path.string()); }, std::invalid_argument);

    std::filesystem::remove(path);
}

TEST(Config, DatabasePathFallsBackToDefault) {
    const auto path = MakeTempConfigPath();
    {
        std::ofstream out(path);
        out << "{\"sqlite\": {}}\n";
    }
    EXPECT_EQ(tilestitch::core::LoadDatabasePath(path.string()), "data/metadata.db");

    {
        std::ofstream out(path);
        out << "{\"sqlite\": {\"path\": \"/var/lib/tilestitch/meta.db\"}}\n";
    }
    EXPECT_EQ(tilestitch::core::LoadDatabasePath(path.string()), "/var/lib/tilestitch/meta.db");

    std::filesystem::remove(path);
}
