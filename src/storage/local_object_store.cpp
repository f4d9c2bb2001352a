#include "tilestitch/storage/local_object_store.h"

#include <algorithm>
#include <array>
#include <filesystem>
#include <fstream>
#include <sstream>

#include <Poco/DigestEngine.h>
#include <Poco/HMACEngine.h>
#include <Poco/JSON/Object.h>
#include <Poco/JSON/Parser.h>
#include <Poco/SHA2Engine.h>
#include <Poco/URI.h>
#include <Poco/UUIDGenerator.h>

#include "tilestitch/core/time.h"

#ifdef _WIN32
#include <windows.h>
#else
#include <fcntl.h>
#include <unistd.h>
#endif

namespace tilestitch::storage {

namespace {

constexpr int kMaxPartNumber = 10000;
constexpr const char* kUploadInfoFile = "upload.json";

std::string AttributesPath(const std::string& base_path, const std::string& key) {
    return (std::filesystem::path(base_path) / "attributes" / (key + ".json")).string();
}

std::string PartPath(const std::string& upload_dir, int part_number) {
    return (std::filesystem::path(upload_dir) / ("part-" + std::to_string(part_number))).string();
}

core::Result<Poco::JSON::Object::Ptr> ReadJsonFile(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return core::Error{core::ErrorCode::kNotFound, "missing file " + path};
    }
    try {
        Poco::JSON::Parser parser;
        auto parsed = parser.parse(in);
        return parsed.extract<Poco::JSON::Object::Ptr>();
    } catch (const Poco::Exception& ex) {
        return core::Error{core::ErrorCode::kIoError, ex.displayText()};
    }
}

core::Result<void> WriteJsonFile(const std::string& path, const Poco::JSON::Object::Ptr& obj) {
    std::filesystem::create_directories(std::filesystem::path(path).parent_path());
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        return core::Error{core::ErrorCode::kIoError, "failed to open " + path};
    }
    obj->stringify(out);
    out.flush();
    if (!out) {
        return core::Error{core::ErrorCode::kIoError, "failed to write " + path};
    }
    return core::Ok();
}

// Streams `path` through SHA-256; returns the hex digest and byte count.
core::Result<std::pair<std::string, std::uint64_t>> HashFile(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return core::Error{core::ErrorCode::kIoError, "failed to open " + path};
    }
    Poco::SHA2Engine256 sha256;
    std::uint64_t total = 0;
    std::array<char, 8192> buffer{};
    while (in) {
        in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        const auto bytes = in.gcount();
        if (bytes <= 0) {
            break;
        }
        sha256.update(buffer.data(), static_cast<unsigned int>(bytes));
        total += static_cast<std::uint64_t>(bytes);
    }
    return std::make_pair(Poco::DigestEngine::digestToHex(sha256.digest()), total);
}

bool ConstantTimeEquals(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) {
        return false;
    }
    unsigned char diff = 0;
    for (std::size_t i = 0; i < a.size(); ++i) {
        diff |= static_cast<unsigned char>(a[i] ^ b[i]);
    }
    return diff == 0;
}

std::string FormatLastModified(const std::filesystem::path& path) {
    std::error_code ec;
    const auto ftime = std::filesystem::last_write_time(path, ec);
    if (ec) {
        return "";
    }
    const auto since_epoch = std::chrono::duration_cast<std::chrono::seconds>(
        ftime.time_since_epoch());
    return std::to_string(since_epoch.count());
}

}  // namespace

LocalObjectStore::LocalObjectStore(LocalObjectStoreOptions options)
    : options_(std::move(options)) {
    std::filesystem::create_directories(std::filesystem::path(options_.base_path) / "objects");
    std::filesystem::create_directories(std::filesystem::path(options_.base_path) / "attributes");
    std::filesystem::create_directories(std::filesystem::path(options_.temp_path) / "multipart");
}

core::Result<std::vector<ObjectInfo>> LocalObjectStore::ListObjects(const std::string& prefix) {
    const auto root = std::filesystem::path(options_.base_path) / "objects";
    std::vector<ObjectInfo> objects;
    std::error_code ec;
    for (std::filesystem::recursive_directory_iterator it(root, ec), end; it != end;
         it.increment(ec)) {
        if (ec) {
            return core::Error{core::ErrorCode::kIoError, ec.message()};
        }
        if (!it->is_regular_file()) {
            continue;
        }
        const auto key = std::filesystem::relative(it->path(), root).generic_string();
        if (key.compare(0, prefix.size(), prefix) != 0) {
            continue;
        }
        ObjectInfo info;
        info.key = key;
        info.size_bytes = static_cast<std::uint64_t>(it->file_size());
        info.last_modified = FormatLastModified(it->path());
        objects.push_back(std::move(info));
    }
    if (ec) {
        return core::Error{core::ErrorCode::kIoError, ec.message()};
    }
    std::sort(objects.begin(), objects.end(),
              [](const ObjectInfo& a, const ObjectInfo& b) { return a.key < b.key; });
    return objects;
}

core::Result<ObjectInfo> LocalObjectStore::HeadObject(const std::string& key) {
    auto path = ResolveObjectPath(key);
    if (!path.ok()) {
        return path.error();
    }
    ObjectInfo info;
    info.key = key;
    info.size_bytes = static_cast<std::uint64_t>(std::filesystem::file_size(path.value()));
    info.last_modified = FormatLastModified(path.value());
    info.content_type = "application/octet-stream";

    auto attributes = ReadJsonFile(AttributesPath(options_.base_path, key));
    if (attributes.ok()) {
        info.content_type = attributes.value()->optValue<std::string>("content_type",
                                                                      info.content_type);
        info.etag = attributes.value()->optValue<std::string>("etag", "");
    }
    return info;
}

core::Result<ObjectTags> LocalObjectStore::GetObjectTags(const std::string& key) {
    auto path = ResolveObjectPath(key);
    if (!path.ok()) {
        return path.error();
    }
    ObjectTags tags;
    auto attributes = ReadJsonFile(AttributesPath(options_.base_path, key));
    if (!attributes.ok()) {
        // Objects written by external uploaders may carry no sidecar at all.
        return tags;
    }
    auto tag_obj = attributes.value()->getObject("tags");
    if (!tag_obj) {
        return tags;
    }
    for (const auto& name : tag_obj->getNames()) {
        tags[name] = tag_obj->getValue<std::string>(name);
    }
    return tags;
}

core::Result<std::string> LocalObjectStore::GetObject(const std::string& key) {
    auto path = ResolveObjectPath(key);
    if (!path.ok()) {
        return path.error();
    }
    std::ifstream in(path.value(), std::ios::binary);
    if (!in.is_open()) {
        return core::Error{core::ErrorCode::kIoError, "failed to open object " + key};
    }
    std::ostringstream data;
    data << in.rdbuf();
    return data.str();
}

core::Result<ObjectInfo> LocalObjectStore::PutObject(const std::string& key,
                                                     const std::string& data,
                                                     const PutOptions& options) {
    if (!IsSafeKey(key)) {
        return core::Error{core::ErrorCode::kInvalidArgument, "invalid object key"};
    }

    // Write to a temp file first, then atomically rename into place.
    const auto temp_name = Poco::UUIDGenerator().createOne().toString();
    const auto temp_path = (std::filesystem::path(options_.temp_path) / temp_name).string();

    Poco::SHA2Engine256 sha256;
    sha256.update(data.data(), static_cast<unsigned int>(data.size()));

#ifdef _WIN32
    std::ofstream out(temp_path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        return core::Error{core::ErrorCode::kIoError, "failed to open temp file"};
    }
    out.write(data.data(), static_cast<std::streamsize>(data.size()));
    out.flush();
    if (!out) {
        return core::Error{core::ErrorCode::kIoError, "failed to write temp file"};
    }
#else
    const int fd = ::open(temp_path.c_str(), O_CREAT | O_WRONLY | O_TRUNC, 0644);
    if (fd < 0) {
        return core::Error{core::ErrorCode::kIoError, "failed to open temp file"};
    }
    std::size_t offset = 0;
    while (offset < data.size()) {
        const ssize_t written = ::write(fd, data.data() + offset, data.size() - offset);
        if (written < 0) {
            ::close(fd);
            std::filesystem::remove(temp_path);
            return core::Error{core::ErrorCode::kIoError, "failed to write temp file"};
        }
        offset += static_cast<std::size_t>(written);
    }
    ::fsync(fd);
    ::close(fd);
#endif

    return CommitTempFile(key, temp_path, Poco::DigestEngine::digestToHex(sha256.digest()),
                          static_cast<std::uint64_t>(data.size()), options);
}

core::Result<ObjectInfo> LocalObjectStore::CommitTempFile(const std::string& key,
                                                          const std::string& temp_path,
                                                          const std::string& etag,
                                                          std::uint64_t size,
                                                          const PutOptions& options) {
    Poco::JSON::Object::Ptr attributes = new Poco::JSON::Object();
    attributes->set("content_type", options.content_type);
    attributes->set("etag", etag);
    Poco::JSON::Object::Ptr tags = new Poco::JSON::Object();
    for (const auto& tag : options.tags) {
        tags->set(tag.first, tag.second);
    }
    attributes->set("tags", tags);
    auto written = WriteJsonFile(AttributesPath(options_.base_path, key), attributes);
    if (!written.ok()) {
        std::filesystem::remove(temp_path);
        return written.error();
    }

    const auto final_path = BuildObjectPath(options_.base_path, key);
    std::error_code ec;
    std::filesystem::create_directories(std::filesystem::path(final_path).parent_path(), ec);
    std::filesystem::rename(temp_path, final_path, ec);
    if (ec) {
        std::filesystem::remove(temp_path);
        return core::Error{core::ErrorCode::kIoError, "failed to commit object: " + ec.message()};
    }

    ObjectInfo info;
    info.key = key;
    info.size_bytes = size;
    info.etag = etag;
    info.content_type = options.content_type;
    info.last_modified = FormatLastModified(final_path);
    return info;
}

core::Result<std::string> LocalObjectStore::CreateMultipartUpload(
    const std::string& key, const std::string& content_type) {
    if (!IsSafeKey(key)) {
        return core::Error{core::ErrorCode::kInvalidArgument, "invalid object key"};
    }
    const auto upload_id = Poco::UUIDGenerator().createOne().toString();
    const auto dir = UploadDir(upload_id);
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        return core::Error{core::ErrorCode::kIoError, "failed to create upload dir: " + ec.message()};
    }

    Poco::JSON::Object::Ptr info = new Poco::JSON::Object();
    info->set("key", key);
    info->set("content_type", content_type);
    auto written = WriteJsonFile((std::filesystem::path(dir) / kUploadInfoFile).string(), info);
    if (!written.ok()) {
        std::filesystem::remove_all(dir, ec);
        return written.error();
    }
    return upload_id;
}

core::Result<CompletedPart> LocalObjectStore::UploadPartCopy(const std::string& upload_id,
                                                             int part_number,
                                                             const std::string& source_key) {
    const auto dir = UploadDir(upload_id);
    if (!std::filesystem::exists(std::filesystem::path(dir) / kUploadInfoFile)) {
        return core::Error{core::ErrorCode::kNotFound, "multipart upload not found"};
    }
    if (part_number <= 0 || part_number > kMaxPartNumber) {
        return core::Error{core::ErrorCode::kInvalidArgument, "invalid part number"};
    }
    auto source = ResolveObjectPath(source_key);
    if (!source.ok()) {
        return source.error();
    }

    const auto part_path = PartPath(dir, part_number);
    std::error_code ec;
    std::filesystem::copy_file(source.value(), part_path,
                               std::filesystem::copy_options::overwrite_existing, ec);
    if (ec) {
        return core::Error{core::ErrorCode::kIoError, "failed to copy part: " + ec.message()};
    }
    auto hashed = HashFile(part_path);
    if (!hashed.ok()) {
        return hashed.error();
    }
    std::ofstream etag_out(part_path + ".etag", std::ios::trunc);
    etag_out << hashed.value().first;
    if (!etag_out) {
        return core::Error{core::ErrorCode::kIoError, "failed to record part etag"};
    }
    return CompletedPart{part_number, hashed.value().first};
}

core::Result<ObjectInfo> LocalObjectStore::CompleteMultipartUpload(
    const std::string& upload_id, const std::vector<CompletedPart>& parts) {
    const auto dir = UploadDir(upload_id);
    auto info = ReadJsonFile((std::filesystem::path(dir) / kUploadInfoFile).string());
    if (!info.ok()) {
        return core::Error{core::ErrorCode::kNotFound, "multipart upload not found"};
    }
    if (parts.empty()) {
        return core::Error{core::ErrorCode::kInvalidArgument, "parts list is required"};
    }

    int previous = 0;
    for (std::size_t i = 0; i < parts.size(); ++i) {
        const auto& part = parts[i];
        if (part.part_number <= previous) {
            return core::Error{core::ErrorCode::kInvalidArgument,
                               "parts must be strictly increasing"};
        }
        previous = part.part_number;

        const auto part_path = PartPath(dir, part.part_number);
        if (!std::filesystem::exists(part_path)) {
            return core::Error{core::ErrorCode::kInvalidArgument,
                               "missing uploaded part " + std::to_string(part.part_number)};
        }
        std::ifstream etag_in(part_path + ".etag");
        std::string stored_etag;
        etag_in >> stored_etag;
        if (stored_etag != part.etag) {
            return core::Error{core::ErrorCode::kInvalidArgument,
                               "part etag mismatch for part " + std::to_string(part.part_number)};
        }
        // Every part except the last must meet the store's minimum part size.
        if (i + 1 < parts.size() &&
            static_cast<std::uint64_t>(std::filesystem::file_size(part_path)) <
                options_.min_part_bytes) {
            return core::Error{core::ErrorCode::kInvalidArgument,
                               "part " + std::to_string(part.part_number) +
                                   " is smaller than the minimum part size"};
        }
    }

    const auto final_temp_path =
        (std::filesystem::path(dir) / ("complete-" + Poco::UUIDGenerator().createOne().toString()))
            .string();
    std::ofstream out(final_temp_path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        return core::Error{core::ErrorCode::kIoError, "failed to open final temp file"};
    }

    Poco::SHA2Engine256 sha256;
    std::uint64_t total_size = 0;
    std::array<char, 8192> buffer{};
    for (const auto& part : parts) {
        std::ifstream in(PartPath(dir, part.part_number), std::ios::binary);
        if (!in.is_open()) {
            out.close();
            std::filesystem::remove(final_temp_path);
            return core::Error{core::ErrorCode::kIoError, "failed to read uploaded part"};
        }
        while (in) {
            in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
            const auto bytes = in.gcount();
            if (bytes <= 0) {
                break;
            }
            out.write(buffer.data(), bytes);
            sha256.update(buffer.data(), static_cast<unsigned int>(bytes));
            total_size += static_cast<std::uint64_t>(bytes);
        }
    }
    out.flush();
    if (!out) {
        out.close();
        std::filesystem::remove(final_temp_path);
        return core::Error{core::ErrorCode::kIoError, "failed to write final temp file"};
    }
    out.close();

    PutOptions options;
    options.content_type = info.value()->optValue<std::string>("content_type", options.content_type);
    const auto key = info.value()->getValue<std::string>("key");
    auto committed = CommitTempFile(key, final_temp_path,
                                    Poco::DigestEngine::digestToHex(sha256.digest()), total_size,
                                    options);
    if (!committed.ok()) {
        return committed.error();
    }

    std::error_code ec;
    std::filesystem::remove_all(dir, ec);
    return committed;
}

core::Result<void> LocalObjectStore::AbortMultipartUpload(const std::string& upload_id) {
    const auto dir = UploadDir(upload_id);
    if (!std::filesystem::exists(dir)) {
        return core::Error{core::ErrorCode::kNotFound, "multipart upload not found"};
    }
    std::error_code ec;
    std::filesystem::remove_all(dir, ec);
    if (ec) {
        return core::Error{core::ErrorCode::kIoError, "failed to abort upload: " + ec.message()};
    }
    return core::Ok();
}

core::Result<std::string> LocalObjectStore::PresignGetUrl(const std::string& key,
                                                          int expires_in_seconds) {
    if (!IsSafeKey(key)) {
        return core::Error{core::ErrorCode::kInvalidArgument, "invalid object key"};
    }
    if (expires_in_seconds <= 0) {
        return core::Error{core::ErrorCode::kInvalidArgument, "expiry must be positive"};
    }
    const auto expires = std::to_string(core::NowEpochSeconds() + expires_in_seconds);
    std::string encoded_key;
    Poco::URI::encode(key, "?#&=+;@:", encoded_key);
    return options_.public_base_url + "/v1/objects/" + encoded_key + "?expires=" + expires +
           "&signature=" + Sign(key, expires);
}

core::Result<void> LocalObjectStore::VerifyPresignedGet(const std::string& key,
                                                        const std::string& expires,
                                                        const std::string& signature) const {
    if (expires.empty() || signature.empty()) {
        return core::Error{core::ErrorCode::kInvalidArgument, "missing signature"};
    }
    std::int64_t expires_at = 0;
    try {
        std::size_t consumed = 0;
        expires_at = std::stoll(expires, &consumed);
        if (consumed != expires.size()) {
            return core::Error{core::ErrorCode::kInvalidArgument, "invalid expiry"};
        }
    } catch (const std::exception&) {
        return core::Error{core::ErrorCode::kInvalidArgument, "invalid expiry"};
    }
    if (!ConstantTimeEquals(Sign(key, expires), signature)) {
        return core::Error{core::ErrorCode::kInvalidArgument, "signature mismatch"};
    }
    if (core::NowEpochSeconds() > expires_at) {
        return core::Error{core::ErrorCode::kInvalidArgument, "url expired"};
    }
    return core::Ok();
}

core::Result<std::string> LocalObjectStore::ResolveObjectPath(const std::string& key) const {
    if (!IsSafeKey(key)) {
        return core::Error{core::ErrorCode::kInvalidArgument, "invalid object key"};
    }
    const auto path = BuildObjectPath(options_.base_path, key);
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return core::Error{core::ErrorCode::kNotFound, "object not found"};
    }
    return path;
}

std::string LocalObjectStore::Sign(const std::string& key, const std::string& expires) const {
    Poco::HMACEngine<Poco::SHA2Engine256> hmac(options_.signing_secret);
    hmac.update("GET\n" + key + "\n" + expires);
    return Poco::DigestEngine::digestToHex(hmac.digest());
}

std::string LocalObjectStore::UploadDir(const std::string& upload_id) const {
    return (std::filesystem::path(options_.temp_path) / "multipart" / upload_id).string();
}

bool LocalObjectStore::IsSafeKey(const std::string& key) {
    if (key.empty() || key.size() > 1024 || key.front() == '/' || key.back() == '/') {
        return false;
    }
    std::string segment;
    std::stringstream ss(key);
    while (std::getline(ss, segment, '/')) {
        if (segment.empty() || segment == "." || segment == "..") {
            return false;
        }
        for (char c : segment) {
            const auto uc = static_cast<unsigned char>(c);
            if (uc < 0x20 || uc == 0x7F || c == '\\') {
                return false;
            }
        }
    }
    return true;
}

std::string LocalObjectStore::BuildObjectPath(const std::string& base_path,
                                              const std::string& key) {
    return (std::filesystem::path(base_path) / "objects" / key).string();
}

}  // namespace tilestitch::storage
