#pragma once

#include <memory>
#include <mutex>
#include <string>

namespace duckdb {
class DuckDB;
class Connection;
}  // namespace duckdb

namespace adapters::duckdb {

// One DuckDB database file with the shard schema applied. Connection use is
// serialized through mutex().
class DuckStore {
public:
    // Creates the parent directory, opens the file and migrates the schema.
    // Throws domain::StoreError.
    explicit DuckStore(std::string dbPath);
    ~DuckStore();

    DuckStore(const DuckStore&) = delete;
    DuckStore& operator=(const DuckStore&) = delete;

    const std::string& path() const noexcept { return dbPath_; }

    ::duckdb::Connection& connection() noexcept { return *connection_; }
    std::mutex& mutex() noexcept { return mutex_; }

private:
    void migrate();

    std::string dbPath_;
    std::unique_ptr<::duckdb::DuckDB> database_;
    std::unique_ptr<::duckdb::Connection> connection_;
    std::mutex mutex_;
};

}  // namespace adapters::duckdb
