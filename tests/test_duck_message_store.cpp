#include <filesystem>
#include <iostream>
#include <string>

#include "adapters/duckdb/DuckMessageStore.hpp"
#include "adapters/duckdb/DuckStore.hpp"
#include "domain/Errors.hpp"

namespace {

domain::Message message(const std::string& id,
                        const std::string& from,
                        const std::string& to,
                        domain::TimestampMs createdAt,
                        domain::ShardId shardId = 1) {
    return domain::Message{id, from, to, "content " + id, createdAt, shardId};
}

}  // namespace

int main() {
    const auto root = std::filesystem::temp_directory_path() / "chatshard-duck-test";
    std::filesystem::remove_all(root);
    const auto dbPath = (root / "nested" / "shard.duckdb").string();

    {
        adapters::duckdb::DuckStore db(dbPath);
        adapters::duckdb::DuckMessageStore store(db);
        store.ping();

        store.insertMessage(message("a", "1", "2", 100));
        store.insertMessage(message("b", "2", "1", 200));
        store.insertMessage(message("c", "1", "4", 300));
        store.insertMessage(message("d", "7", "1", 400));

        const auto inbox = store.messagesForUser("1", 3);
        if (inbox.size() != 3 || inbox[0].id != "d" || inbox[1].id != "c" || inbox[2].id != "b") {
            std::cerr << "Expected newest three messages d,c,b for user 1\n";
            return 1;
        }

        const auto conversation = store.conversation("2", "1", 10);
        if (conversation.size() != 2 || conversation[0].id != "a" || conversation[1].id != "b"
            || conversation[0].content != "content a" || conversation[0].createdAtMs != 100) {
            std::cerr << "Expected conversation a,b oldest first\n";
            return 1;
        }

        try {
            store.insertMessage(message("a", "1", "2", 999));
            std::cerr << "Expected duplicate id insert to fail\n";
            return 1;
        } catch (const domain::StoreError&) {
        }

        store.upsertUser(domain::UserRecord{4, "dora", 1});
        store.upsertUser(domain::UserRecord{2, "bob", 2});
        store.upsertUser(domain::UserRecord{4, "dora b", 1});
        const auto all = store.allUsers();
        if (all.size() != 2 || all[0].id != 2 || all[1].name != "dora b") {
            std::cerr << "Expected upsert to overwrite the user name\n";
            return 1;
        }

        // Records of shard 1 plus unrecorded senders of shard 1 messages.
        const auto users = store.listUsers(1);
        if (users.size() != 3 || users[0].id != 1 || users[1].id != 4 || users[2].id != 7 || !users[2].name.empty()
            || users[2].shardId != 1) {
            std::cerr << "Expected shard 1 users 1, 4 and 7, got " << users.size() << "\n";
            return 1;
        }

        const auto recent = store.messagesSince(250);
        if (recent.size() != 2 || recent[0].id != "d") {
            std::cerr << "Expected two messages since 250, newest first\n";
            return 1;
        }

        store.upsertMessage(message("c", "9", "9", 1));
        const auto updated = store.messagesSince(300);
        if (updated.size() != 2 || updated[1].id != "c" || updated[1].fromUserId != "1") {
            std::cerr << "Expected message upsert to keep sender and timestamp\n";
            return 1;
        }
        store.upsertMessage(message("e", "1", "2", 500));
        if (store.messagesSince(0).size() != 5) {
            std::cerr << "Expected upsert of a new id to insert it\n";
            return 1;
        }
    }

    // Reopening keeps the data.
    {
        adapters::duckdb::DuckStore db(dbPath);
        adapters::duckdb::DuckMessageStore store(db);
        if (store.messagesSince(0).size() != 5) {
            std::cerr << "Expected data to persist across reopen\n";
            return 1;
        }
    }

    std::filesystem::remove_all(root);
    std::cout << "test_duck_message_store passed\n";
    return 0;
}
