#pragma once

#include <cstddef>
#include <vector>

#include "domain/Ports.hpp"

namespace adapters::duckdb {

class DuckStore;

// IMessageStore over one DuckDB file. Every failure surfaces as domain::StoreError.
class DuckMessageStore final : public domain::contracts::IMessageStore {
public:
    explicit DuckMessageStore(DuckStore& store);

    void insertMessage(const domain::Message& message) override;

    std::vector<domain::Message> messagesForUser(const domain::UserId& userId, std::size_t limit) const override;

    std::vector<domain::Message> conversation(const domain::UserId& userId,
                                              const domain::UserId& otherId,
                                              std::size_t limit) const override;

    std::vector<domain::UserRecord> listUsers(domain::ShardId shardId) const override;

    std::vector<domain::UserRecord> allUsers() const override;

    std::vector<domain::Message> messagesSince(domain::TimestampMs sinceMs) const override;

    void upsertUser(const domain::UserRecord& user) override;

    void upsertMessage(const domain::Message& message) override;

    void ping() const override;

private:
    DuckStore& store_;
};

}  // namespace adapters::duckdb
