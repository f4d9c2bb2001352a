#include <csignal>
#include <exception>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include "tilestitch/core/config.h"
#include "tilestitch/core/logger.h"
#include "tilestitch/http/http_server.h"
#include "tilestitch/http/route_registration.h"
#include "tilestitch/http/router.h"
#include "tilestitch/metadata/sqlite_metadata_store.h"
#include "tilestitch/reassembly/pipeline.h"
#include "tilestitch/reassembly/sweeper.h"
#include "tilestitch/reassembly/trigger_dispatcher.h"
#include "tilestitch/storage/local_object_store.h"

namespace {

std::string GetArgValue(int argc, char** argv, const std::string& key,
                        const std::string& default_value) {
    for (int i = 1; i < argc - 1; ++i) {
        if (argv[i] == key) {
            return argv[i + 1];
        }
    }
    return default_value;
}

}  // namespace

int main(int argc, char** argv) {
    const std::string config_path = GetArgValue(argc, argv, "--config", "config/server.json");
    const std::string db_path = GetArgValue(argc, argv, "--database", "config/database.json");

    tilestitch::core::Config config;
    std::string sqlite_path;
    try {
        config = tilestitch::core::LoadConfig(config_path);
        sqlite_path = tilestitch::core::LoadDatabasePath(db_path);
    } catch (const std::exception& ex) {
        std::cerr << "failed to load configuration: " << ex.what() << std::endl;
        return 1;
    }
    tilestitch::core::InitLogging(config.observability.log_level, config.observability.log_file);

    const auto db_dir = std::filesystem::path(sqlite_path).parent_path();
    if (!db_dir.empty()) {
        std::filesystem::create_directories(db_dir);
    }
    auto metadata = std::make_shared<tilestitch::metadata::SqliteMetadataStore>(sqlite_path);

    tilestitch::storage::LocalObjectStoreOptions store_options;
    store_options.base_path = config.storage.base_path;
    store_options.temp_path = config.storage.temp_path;
    store_options.public_base_url = config.storage.public_base_url;
    store_options.signing_secret = config.storage.signing_secret;
    store_options.min_part_bytes = config.storage.min_part_bytes;
    auto objects = std::make_shared<tilestitch::storage::LocalObjectStore>(store_options);

    auto pipeline = std::make_shared<tilestitch::reassembly::ReassemblyPipeline>(
        objects, metadata, config.reassembly);
    auto sweeper =
        std::make_shared<tilestitch::reassembly::Sweeper>(metadata, pipeline, config.sweeper);
    auto dispatcher = std::make_shared<tilestitch::reassembly::TriggerDispatcher>(
        pipeline, sweeper, config.storage.bucket);

    tilestitch::http::Router router;
    tilestitch::http::RegisterReassemblyRoutes(router, dispatcher);

    boost::asio::io_context ioc(config.server.threads);
    tilestitch::http::HttpServer server(ioc, config, std::move(router), objects, sweeper);
    try {
        server.Run();
    } catch (const std::exception& ex) {
        tilestitch::core::LogError(std::string("failed to start server: ") + ex.what());
        return 1;
    }

    boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
    signals.async_wait([&ioc](const boost::system::error_code&, int) {
        tilestitch::core::LogInfo("Shutting down");
        ioc.stop();
    });

    std::vector<std::thread> threads;
    threads.reserve(static_cast<size_t>(config.server.threads));
    for (int i = 0; i < config.server.threads; ++i) {
        threads.emplace_back([&ioc]() { ioc.run(); });
    }
    for (auto& t : threads) {
        t.join();
    }

    return 0;
}
