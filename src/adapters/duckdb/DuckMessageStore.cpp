#include "adapters/duckdb/DuckMessageStore.hpp"

#include <algorithm>
#include <cstdint>
#include <limits>
#include <memory>
#include <mutex>
#include <string>

#include <duckdb.hpp>

#include "adapters/duckdb/DuckStore.hpp"
#include "domain/Errors.hpp"

namespace adapters::duckdb {
namespace {

// DuckDB exposes its own vector alias; using it keeps Execute(values) on the
// non-variadic overload.
using DuckdbValueVector = ::duckdb::vector<::duckdb::Value>;

constexpr const char* kMessageColumns = "id, from_user_id, to_user_id, content, created_at, shard_id";

::duckdb::Value bigint(std::int64_t value) {
    return ::duckdb::Value::BIGINT(value);
}

::duckdb::Value limitValue(std::size_t limit) {
    const auto clamped =
        std::min<std::size_t>(limit, static_cast<std::size_t>(std::numeric_limits<std::int64_t>::max()));
    return bigint(static_cast<std::int64_t>(clamped));
}

std::unique_ptr<::duckdb::QueryResult> execute(DuckStore& store,
                                               const std::string& sql,
                                               DuckdbValueVector& parameters,
                                               const char* operation) {
    auto& connection = store.connection();
    auto statement = connection.Prepare(sql);
    if (!statement || statement->HasError()) {
        const std::string errorMessage =
            statement ? statement->GetError() : std::string{"failed to prepare statement"};
        throw domain::StoreError(std::string{operation} + " on '" + store.path() + "' failed: " + errorMessage);
    }
    auto result = statement->Execute(parameters);
    if (!result || result->HasError()) {
        const std::string errorMessage = result ? result->GetError() : std::string{"failed to execute statement"};
        throw domain::StoreError(std::string{operation} + " on '" + store.path() + "' failed: " + errorMessage);
    }
    return result;
}

std::vector<domain::Message> readMessages(::duckdb::QueryResult& result) {
    std::vector<domain::Message> messages;
    while (auto chunk = result.Fetch()) {
        const auto count = chunk->size();
        for (::duckdb::idx_t row = 0; row < count; ++row) {
            domain::Message message;
            message.id = chunk->GetValue(0, row).GetValue<std::string>();
            message.fromUserId = chunk->GetValue(1, row).GetValue<std::string>();
            message.toUserId = chunk->GetValue(2, row).GetValue<std::string>();
            message.content = chunk->GetValue(3, row).GetValue<std::string>();
            message.createdAtMs = chunk->GetValue(4, row).GetValue<std::int64_t>();
            message.shardId = chunk->GetValue(5, row).GetValue<std::int32_t>();
            messages.push_back(std::move(message));
        }
    }
    return messages;
}

std::vector<domain::UserRecord> readUsers(::duckdb::QueryResult& result) {
    std::vector<domain::UserRecord> users;
    while (auto chunk = result.Fetch()) {
        const auto count = chunk->size();
        for (::duckdb::idx_t row = 0; row < count; ++row) {
            domain::UserRecord user;
            user.id = chunk->GetValue(0, row).GetValue<std::int64_t>();
            const auto name = chunk->GetValue(1, row);
            user.name = name.IsNull() ? std::string{} : name.GetValue<std::string>();
            user.shardId = chunk->GetValue(2, row).GetValue<std::int32_t>();
            users.push_back(std::move(user));
        }
    }
    return users;
}

DuckdbValueVector messageParameters(const domain::Message& message) {
    DuckdbValueVector parameters;
    parameters.reserve(6);
    parameters.emplace_back(message.id);
    parameters.emplace_back(message.fromUserId);
    parameters.emplace_back(message.toUserId);
    parameters.emplace_back(message.content);
    parameters.push_back(bigint(message.createdAtMs));
    parameters.push_back(::duckdb::Value::INTEGER(message.shardId));
    return parameters;
}

}  // namespace

DuckMessageStore::DuckMessageStore(DuckStore& store) : store_(store) {}

void DuckMessageStore::insertMessage(const domain::Message& message) {
    auto parameters = messageParameters(message);
    std::lock_guard<std::mutex> lock(store_.mutex());
    execute(store_,
            std::string{"INSERT INTO messages ("} + kMessageColumns + ") VALUES (?, ?, ?, ?, ?, ?)",
            parameters,
            "insert message");
}

std::vector<domain::Message> DuckMessageStore::messagesForUser(const domain::UserId& userId,
                                                               std::size_t limit) const {
    DuckdbValueVector parameters;
    parameters.emplace_back(userId);
    parameters.emplace_back(userId);
    parameters.push_back(limitValue(limit));

    std::lock_guard<std::mutex> lock(store_.mutex());
    auto result = execute(store_,
                          std::string{"SELECT "} + kMessageColumns
                              + " FROM messages WHERE from_user_id = ? OR to_user_id = ?"
                                " ORDER BY created_at DESC, id LIMIT ?",
                          parameters,
                          "messages for user");
    return readMessages(*result);
}

std::vector<domain::Message> DuckMessageStore::conversation(const domain::UserId& userId,
                                                            const domain::UserId& otherId,
                                                            std::size_t limit) const {
    DuckdbValueVector parameters;
    parameters.emplace_back(userId);
    parameters.emplace_back(otherId);
    parameters.emplace_back(otherId);
    parameters.emplace_back(userId);
    parameters.push_back(limitValue(limit));

    std::lock_guard<std::mutex> lock(store_.mutex());
    auto result = execute(store_,
                          std::string{"SELECT "} + kMessageColumns
                              + " FROM messages"
                                " WHERE (from_user_id = ? AND to_user_id = ?) OR (from_user_id = ? AND to_user_id = ?)"
                                " ORDER BY created_at ASC, id LIMIT ?",
                          parameters,
                          "conversation");
    return readMessages(*result);
}

std::vector<domain::UserRecord> DuckMessageStore::listUsers(domain::ShardId shardId) const {
    static constexpr auto kQuery = R"SQL(
        SELECT id, name, shard_id FROM users WHERE shard_id = ?
        UNION ALL
        SELECT DISTINCT TRY_CAST(from_user_id AS BIGINT) AS id, NULL AS name, CAST(? AS INTEGER) AS shard_id
        FROM messages
        WHERE shard_id = ?
          AND TRY_CAST(from_user_id AS BIGINT) IS NOT NULL
          AND TRY_CAST(from_user_id AS BIGINT) NOT IN (SELECT id FROM users)
        ORDER BY id
    )SQL";

    DuckdbValueVector parameters;
    parameters.push_back(::duckdb::Value::INTEGER(shardId));
    parameters.push_back(::duckdb::Value::INTEGER(shardId));
    parameters.push_back(::duckdb::Value::INTEGER(shardId));

    std::lock_guard<std::mutex> lock(store_.mutex());
    auto result = execute(store_, kQuery, parameters, "list users");
    return readUsers(*result);
}

std::vector<domain::UserRecord> DuckMessageStore::allUsers() const {
    DuckdbValueVector parameters;
    std::lock_guard<std::mutex> lock(store_.mutex());
    auto result = execute(store_, "SELECT id, name, shard_id FROM users ORDER BY id", parameters, "all users");
    return readUsers(*result);
}

std::vector<domain::Message> DuckMessageStore::messagesSince(domain::TimestampMs sinceMs) const {
    DuckdbValueVector parameters;
    parameters.push_back(bigint(sinceMs));

    std::lock_guard<std::mutex> lock(store_.mutex());
    auto result = execute(store_,
                          std::string{"SELECT "} + kMessageColumns
                              + " FROM messages WHERE created_at >= ? ORDER BY created_at DESC, id",
                          parameters,
                          "messages since");
    return readMessages(*result);
}

void DuckMessageStore::upsertUser(const domain::UserRecord& user) {
    DuckdbValueVector parameters;
    parameters.push_back(bigint(user.id));
    parameters.emplace_back(user.name);
    parameters.push_back(::duckdb::Value::INTEGER(user.shardId));

    std::lock_guard<std::mutex> lock(store_.mutex());
    execute(store_,
            "INSERT INTO users (id, name, shard_id) VALUES (?, ?, ?)"
            " ON CONFLICT (id) DO UPDATE SET name = excluded.name, shard_id = excluded.shard_id",
            parameters,
            "upsert user");
}

void DuckMessageStore::upsertMessage(const domain::Message& message) {
    auto parameters = messageParameters(message);
    std::lock_guard<std::mutex> lock(store_.mutex());
    execute(store_,
            std::string{"INSERT INTO messages ("} + kMessageColumns
                + ") VALUES (?, ?, ?, ?, ?, ?) ON CONFLICT (id) DO UPDATE SET content = excluded.content",
            parameters,
            "upsert message");
}

void DuckMessageStore::ping() const {
    DuckdbValueVector parameters;
    std::lock_guard<std::mutex> lock(store_.mutex());
    execute(store_, "SELECT 1", parameters, "ping");
}

}  // namespace adapters::duckdb
