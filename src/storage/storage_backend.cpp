// File: src/storage/storage_backend.cpp
#include "storage/storage_backend.hpp"
#include "core/errors.hpp"
#include "storage/json_backend.hpp"
#include "storage/sqlite_backend.hpp"

namespace p3if {

std::shared_ptr<StorageBackend> CreateStorageBackend(const std::string& type,
                                                     const std::string& path) {
    std::string lower = ToLower(Trim(type));

    if (lower.empty() || lower == "memory") {
        return nullptr;
    }

    if (path.empty()) {
        throw FrameworkError(ErrorCode::INVALID_ARGUMENT,
                             "Storage type '" + type + "' requires a path");
    }

    if (lower == "json") {
        JsonFileBackend::Config config;
        config.file_path = path;
        return std::make_shared<JsonFileBackend>(config);
    }

    if (lower == "sqlite") {
        SqliteBackend::Config config;
        config.db_path = path;
        return std::make_shared<SqliteBackend>(config);
    }

    throw FrameworkError(ErrorCode::INVALID_ARGUMENT, "Unknown storage type: " + type);
}

} // namespace p3if
