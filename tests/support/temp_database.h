#pragma once

#include <filesystem>
#include <memory>
#include <string>

#include <Poco/UUIDGenerator.h>

#include "tilestitch/metadata/sqlite_metadata_store.h"

namespace tilestitch::testing {

/// @brief SQLite metadata store on a throwaway file, removed on destruction.
class TempDatabase {
public:
    TempDatabase()
        : path_(std::filesystem::temp_directory_path() /
                ("tilestitch_test_" + Poco::UUIDGenerator().createOne().toString() + ".db")),
          store_(std::make_shared<metadata::SqliteMetadataStore>(path_.string())) {}

    ~TempDatabase() {
        store_.reset();
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }

    TempDatabase(const TempDatabase&) = delete;
    TempDatabase& operator=(const TempDatabase&) = delete;

    const std::shared_ptr<metadata::SqliteMetadataStore>& store() const { return store_; }

private:
    std::filesystem::path path_;
    std::shared_ptr<metadata::SqliteMetadataStore> store_;
};

}  // namespace tilestitch::testing
