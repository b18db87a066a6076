#include "adapters/duckdb/DuckStore.hpp"

#include <array>
#include <exception>
#include <filesystem>
#include <string>
#include <system_error>
#include <utility>

#include <duckdb.hpp>

#include "common/Log.hpp"
#include "domain/Errors.hpp"

namespace fs = std::filesystem;

namespace adapters::duckdb {

namespace {

constexpr std::array<const char*, 5> kSchema{
    R"SQL(
        CREATE TABLE IF NOT EXISTS users (
            id BIGINT PRIMARY KEY,
            name TEXT NOT NULL,
            shard_id INTEGER NOT NULL
        )
    )SQL",
    R"SQL(
        CREATE TABLE IF NOT EXISTS messages (
            id TEXT PRIMARY KEY,
            from_user_id TEXT NOT NULL,
            to_user_id TEXT NOT NULL,
            content TEXT NOT NULL,
            created_at BIGINT NOT NULL,
            shard_id INTEGER NOT NULL
        )
    )SQL",
    "CREATE INDEX IF NOT EXISTS idx_messages_from_user ON messages(from_user_id)",
    "CREATE INDEX IF NOT EXISTS idx_messages_to_user ON messages(to_user_id)",
    "CREATE INDEX IF NOT EXISTS idx_messages_created_at ON messages(created_at)",
};

}  // namespace

DuckStore::DuckStore(std::string dbPath) : dbPath_(std::move(dbPath)) {
    const fs::path path{dbPath_};
    if (path.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(path.parent_path(), ec);
        if (ec) {
            throw domain::StoreError("DuckStore: unable to create directory '" + path.parent_path().string()
                                     + "': " + ec.message());
        }
    }

    try {
        database_ = std::make_unique<::duckdb::DuckDB>(path.string());
        connection_ = std::make_unique<::duckdb::Connection>(*database_);
    }
    catch (const std::exception& ex) {
        throw domain::StoreError("DuckStore: unable to open '" + dbPath_ + "': " + ex.what());
    }

    migrate();
}

DuckStore::~DuckStore() = default;

void DuckStore::migrate() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto* statement : kSchema) {
        auto result = connection_->Query(statement);
        if (!result || result->HasError()) {
            const std::string errorMessage = result ? result->GetError() : std::string("unknown migration error");
            throw domain::StoreError("DuckStore: migration of '" + dbPath_ + "' failed: " + errorMessage);
        }
    }
    LOG_INFO("DuckStore migration finished for " << dbPath_);
}

}  // namespace adapters::duckdb
