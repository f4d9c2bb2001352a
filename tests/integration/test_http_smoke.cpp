#include <gtest/gtest.h>

#include <boost/asio.hpp>
#include <boost/beast.hpp>
#include <Poco/JSON/Object.h>
#include <Poco/JSON/Parser.h>
#include <Poco/Process.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <exception>
#include <string>
#include <thread>
#include <vector>

#include "tilestitch/storage/local_object_store.h"

#ifdef _WIN32
#include <windows.h>
#else
#include <unistd.h>
#endif

namespace {
namespace net = boost::asio;
namespace beast = boost::beast;
namespace http = boost::beast::http;
using tcp = net::ip::tcp;

constexpr const char* kSigningSecret = "integration-secret";
constexpr const char* kBucket = "tilestitch-it";

class ServerProcess {
public:
    explicit ServerProcess(Poco::ProcessHandle handle) : handle_(std::move(handle)) {}

    ~ServerProcess() {
        try {
            if (Poco::Process::isRunning(handle_)) {
                Poco::Process::kill(handle_);
                Poco::Process::wait(handle_);
            }
        } catch (const std::exception&) {
            // Best-effort shutdown; test cleanup should not throw.
        }
    }

    ServerProcess(const ServerProcess&) = delete;
    ServerProcess& operator=(const ServerProcess&) = delete;

private:
    Poco::ProcessHandle handle_;
};

unsigned short FindFreePort() {
    net::io_context ioc;
    tcp::acceptor acceptor(ioc, {tcp::v4(), 0});
    return acceptor.local_endpoint().port();
}

std::filesystem::path MakeTempDir() {
    const auto base = std::filesystem::temp_directory_path();
    const auto now = std::chrono::steady_clock::now().time_since_epoch().count();
#ifdef _WIN32
    const auto pid = static_cast<long>(GetCurrentProcessId());
#else
    const auto pid = static_cast<long>(getpid());
#endif
    const std::string name = "tilestitch_it_" + std::to_string(pid) + "_" + std::to_string(now);
    auto dir = base / name;
    std::filesystem::create_directories(dir);
    return dir;
}

void CleanupTempDir(const std::filesystem::path& dir) {
    std::error_code ec;
    for (int i = 0; i < 5; ++i) {
        std::filesystem::remove_all(dir, ec);
        if (!ec) {
            return;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
}

tilestitch::storage::LocalObjectStoreOptions StoreOptions(const std::filesystem::path& dir,
                                                          unsigned short port) {
    tilestitch::storage::LocalObjectStoreOptions options;
    options.base_path = (dir / "storage").generic_string();
    options.temp_path = (dir / "storage" / "tmp").generic_string();
    options.public_base_url = "http://127.0.0.1:" + std::to_string(port);
    options.signing_secret = kSigningSecret;
    options.min_part_bytes = 4;
    return options;
}

std::filesystem::path WriteServerConfig(const std::filesystem::path& dir, unsigned short port) {
    const auto options = StoreOptions(dir, port);
    std::filesystem::create_directories(options.temp_path);

    const auto config_path = dir / "server.json";
    std::ofstream out(config_path);
    out << "{\n"
        << "  \"server\": {\n"
        << "    \"host\": \"127.0.0.1\",\n"
        << "    \"port\": " << port << ",\n"
        << "    \"threads\": 1,\n"
        << "    \"tls\": {\n"
        << "      \"enabled\": false,\n"
        << "      \"certificate\": \"\",\n"
        << "      \"private_key\": \"\"\n"
        << "    },\n"
        << "    \"limits\": {\n"
        << "      \"max_body_bytes\": 1048576\n"
        << "    }\n"
        << "  },\n"
        << "  \"storage\": {\n"
        << "    \"base_path\": \"" << options.base_path << "\",\n"
        << "    \"temp_path\": \"" << options.temp_path << "\",\n"
        << "    \"bucket\": \"" << kBucket << "\",\n"
        << "    \"public_base_url\": \"" << options.public_base_url << "\",\n"
        << "    \"signing_secret\": \"" << kSigningSecret << "\",\n"
        << "    \"min_part_bytes\": " << options.min_part_bytes << "\n"
        << "  },\n"
        << "  \"reassembly\": {\n"
        << "    \"min_segment_bytes\": 4,\n"
        << "    \"direct_max_bytes\": 1048576\n"
        << "  },\n"
        << "  \"sweeper\": {\n"
        << "    \"enabled\": false\n"
        << "  },\n"
        << "  \"observability\": {\n"
        << "    \"log_level\": \"warning\"\n"
        << "  }\n"
        << "}\n";
    return config_path;
}

std::filesystem::path WriteDatabaseConfig(const std::filesystem::path& dir) {
    const auto db_path = dir / "metadata.db";
    const auto config_path = dir / "database.json";
    std::ofstream out(config_path);
    out << "{\n"
        << "  \"sqlite\": {\n"
        << "    \"path\": \"" << db_path.generic_string() << "\"\n"
        << "  }\n"
        << "}\n";
    return config_path;
}

http::response<http::string_body> SendRequest(
    http::verb method,
    const std::string& host,
    unsigned short port,
    const std::string& target,
    const std::string& body,
    const std::string& content_type,
    const std::vector<std::pair<std::string, std::string>>& headers = {}) {
    net::io_context ioc;
    tcp::resolver resolver(ioc);
    beast::tcp_stream stream(ioc);
    auto const results = resolver.resolve(host, std::to_string(port));
    stream.connect(results);

    http::request<http::string_body> req{method, target, 11};
    req.set(http::field::host, host);
    req.set(http::field::user_agent, "tilestitch-integration-tests");
    if (!content_type.empty()) {
        req.set(http::field::content_type, content_type);
    }
    for (const auto& header : headers) {
        req.set(header.first, header.second);
    }
    req.body() = body;
    req.prepare_payload();

    http::write(stream, req);

    beast::flat_buffer buffer;
    http::response<http::string_body> res;
    http::read(stream, buffer, res);

    beast::error_code ec;
    stream.socket().shutdown(tcp::socket::shutdown_both, ec);
    return res;
}

bool WaitForHealth(const std::string& host, unsigned short port) {
    for (int i = 0; i < 30; ++i) {
        try {
            auto res = SendRequest(http::verb::get, host, port, "/healthz", "", "");
            if (res.result() == http::status::ok) {
                return true;
            }
        } catch (const std::exception&) {
            // Server may not be ready yet.
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    return false;
}

std::string StorageEvent(const std::string& key) {
    return std::string(R"({"Records":[{"s3":{"bucket":{"name":")") + kBucket +
           R"("},"object":{"key":")" + key + R"("}}}]})";
}

Poco::JSON::Object::Ptr ParseBody(const std::string& body) {
    Poco::JSON::Parser parser;
    return parser.parse(body).extract<Poco::JSON::Object::Ptr>();
}

}  // namespace

TEST(IntegrationHttp, ManifestTriggerReassemblesAndServesDownload) {
    const auto port = FindFreePort();
    const auto temp_dir = MakeTempDir();
    const auto config_path = WriteServerConfig(temp_dir, port);
    const auto db_path = WriteDatabaseConfig(temp_dir);

    // Chunks land in the server's storage the way an uploader would leave them.
    tilestitch::storage::LocalObjectStore uploads(StoreOptions(temp_dir, port));
    tilestitch::storage::PutOptions chunk_options;
    chunk_options.tags["timestamp"] = "1700000000001";
    ASSERT_TRUE(uploads.PutObject("b42/1700000000001_ortho.tif.part0", "II*-head", chunk_options)
                    .ok());
    ASSERT_TRUE(uploads.PutObject("b42/1700000000001_ortho.tif.part1", "middle--", chunk_options)
                    .ok());
    ASSERT_TRUE(uploads.PutObject("b42/1700000000001_ortho.tif.part2", "tail", chunk_options)
                    .ok());
    ASSERT_TRUE(uploads
                    .PutObject("b42/1700000000001_manifest.json",
                               R"({"sessionId":"1700000000001","originalFileName":"ortho.tif",)"
                               R"("totalChunks":3,"timestamp":1700000000001})",
                               tilestitch::storage::PutOptions{})
                    .ok());

    std::vector<std::string> args = {"--config", config_path.string(), "--database",
                                     db_path.string()};
    auto handle = Poco::Process::launch(TILESTITCH_SERVER_PATH, args);
    {
        ServerProcess server(std::move(handle));

        ASSERT_TRUE(WaitForHealth("127.0.0.1", port));

        auto ignored = SendRequest(http::verb::post, "127.0.0.1", port, "/v1/invocations",
                                   StorageEvent("b42/1700000000001_ortho.tif.part0"),
                                   "application/json");
        EXPECT_EQ(ignored.result(), http::status::ok);

        auto invoked = SendRequest(http::verb::post, "127.0.0.1", port, "/v1/invocations",
                                   StorageEvent("b42/1700000000001_manifest.json"),
                                   "application/json");
        ASSERT_EQ(invoked.result(), http::status::ok) << invoked.body();
        auto result = ParseBody(invoked.body());
        EXPECT_TRUE(result->getValue<bool>("success"));
        EXPECT_EQ(result->getValue<std::string>("fileName"), "ortho.tif");
        const auto url = result->getValue<std::string>("url");
        const auto target_pos = url.find("/v1/objects/");
        ASSERT_NE(target_pos, std::string::npos);
        const auto target = url.substr(target_pos);

        auto download = SendRequest(http::verb::get, "127.0.0.1", port, target, "", "");
        EXPECT_EQ(download.result(), http::status::ok);
        EXPECT_EQ(download.body(), "II*-headmiddle--tail");

        auto range = SendRequest(http::verb::get, "127.0.0.1", port, target, "", "",
                                 {{"Range", "bytes=0-3"}});
        EXPECT_EQ(range.result(), http::status::partial_content);
        EXPECT_EQ(range.body(), "II*-");

        const auto tampered = target.substr(0, target.size() - 1) +
                              (target.back() == '0' ? "1" : "0");
        auto forbidden = SendRequest(http::verb::get, "127.0.0.1", port, tampered, "", "");
        EXPECT_EQ(forbidden.result(), http::status::forbidden);

        auto repeat = SendRequest(http::verb::post, "127.0.0.1", port, "/v1/reassembly",
                                  R"({"bookingId":"b42","sessionId":"1700000000001"})",
                                  "application/json");
        EXPECT_EQ(repeat.result(), http::status::ok);
        EXPECT_EQ(ParseBody(repeat.body())->getValue<std::string>("resourceId"),
                  result->getValue<std::string>("resourceId"));

        auto bad_json = SendRequest(http::verb::post, "127.0.0.1", port, "/v1/reassembly",
                                    "{oops", "application/json");
        EXPECT_EQ(bad_json.result(), http::status::bad_request);
    }

    CleanupTempDir(temp_dir);
}

TEST(IntegrationHttp, PendingUploadAndMetrics) {
    const auto port = FindFreePort();
    const auto temp_dir = MakeTempDir();
    const auto config_path = WriteServerConfig(temp_dir, port);
    const auto db_path = WriteDatabaseConfig(temp_dir);

    tilestitch::storage::LocalObjectStore uploads(StoreOptions(temp_dir, port));
    ASSERT_TRUE(uploads
                    .PutObject("b7/1700000000009_manifest.json",
                               R"({"sessionId":"1700000000009","originalFileName":"dem.tif",)"
                               R"("totalChunks":2})",
                               tilestitch::storage::PutOptions{})
                    .ok());
    ASSERT_TRUE(uploads
                    .PutObject("b7/1700000000009_dem.tif.part0", "chunk-0",
                               tilestitch::storage::PutOptions{})
                    .ok());

    std::vector<std::string> args = {"--config", config_path.string(), "--database",
                                     db_path.string()};
    auto handle = Poco::Process::launch(TILESTITCH_SERVER_PATH, args);
    {
        ServerProcess server(std::move(handle));
        ASSERT_TRUE(WaitForHealth("127.0.0.1", port));

        auto pending = SendRequest(http::verb::post, "127.0.0.1", port, "/v1/invocations",
                                   StorageEvent("b7/1700000000009_manifest.json"),
                                   "application/json");
        EXPECT_EQ(pending.result(), http::status::accepted);
        EXPECT_EQ(ParseBody(pending.body())->getValue<int>("requiredChunks"), 2);

        auto sweep = SendRequest(http::verb::post, "127.0.0.1", port, "/v1/invocations", "", "");
        EXPECT_EQ(sweep.result(), http::status::ok);

        auto metrics = SendRequest(http::verb::get, "127.0.0.1", port, "/metrics", "", "");
        EXPECT_EQ(metrics.result(), http::status::ok);
        EXPECT_NE(metrics.body().find("tilestitch_"), std::string::npos);

        auto missing = SendRequest(http::verb::get, "127.0.0.1", port, "/v1/nothing", "", "");
        EXPECT_EQ(missing.result(), http::status::not_found);
    }

    CleanupTempDir(temp_dir);
}
