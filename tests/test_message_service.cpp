#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "app/ConnectionRegistry.hpp"
#include "app/MessageService.hpp"
#include "common/Metrics.hpp"
#include "domain/Errors.hpp"
#include "support/TestDoubles.hpp"

namespace {

using testing::FlakyCache;
using testing::InMemoryMessageStore;
using testing::RecordingChannel;

struct Fixture {
    InMemoryMessageStore store;
    FlakyCache cache;
    app::ConnectionRegistry registry;
    domain::TimestampMs clock{1000};
    int nextId{0};
    app::MessageService service{store, cache, registry, app::MessageService::Options{1, 3, std::chrono::seconds(300)},
                                [this]() { return clock; },
                                [this]() { return "msg-" + std::to_string(++nextId); }};
};

bool contains(const std::vector<std::string>& values, const std::string& value) {
    for (const auto& entry : values) {
        if (entry == value) {
            return true;
        }
    }
    return false;
}

template <typename Fn>
bool throwsValidation(Fn&& fn) {
    try {
        fn();
    } catch (const domain::ValidationError&) {
        return true;
    }
    return false;
}

}  // namespace

int main() {
    auto& metrics = chs::common::metrics::Registry::instance();

    // Write path: persisted, stamped, invalidates four keys, pushes to the recipient.
    {
        Fixture fixture;
        auto recipient = std::make_shared<RecordingChannel>(11);
        fixture.registry.bind("2", recipient);

        const auto message = fixture.service.sendMessage("1", "2", "hello");
        if (message.id != "msg-1" || message.createdAtMs != 1000 || message.shardId != 1) {
            std::cerr << "Expected id msg-1 at 1000 on shard 1\n";
            return 1;
        }
        if (fixture.store.messageCount() != 1) {
            std::cerr << "Expected message to be stored\n";
            return 1;
        }
        for (const char* key : {"conv:1:2", "conv:2:1", "user:messages:1", "user:messages:2"}) {
            if (!contains(fixture.cache.erased, key)) {
                std::cerr << "Expected cache key " << key << " to be invalidated\n";
                return 1;
            }
        }
        const auto pushed = recipient->payloads();
        if (pushed.size() != 1 || pushed[0].find(R"("type":"message")") == std::string::npos
            || pushed[0].find(R"("content":"hello")") == std::string::npos) {
            std::cerr << "Expected recipient to receive a message push\n";
            return 1;
        }
    }

    // Validation happens before any side effect.
    {
        Fixture fixture;
        if (!throwsValidation([&]() { fixture.service.sendMessage("", "2", "x"); })
            || !throwsValidation([&]() { fixture.service.sendMessage("1", "2", ""); })
            || !throwsValidation([&]() { fixture.service.sendMessage("1", "two", "x"); })
            || !throwsValidation([&]() { fixture.service.sendMessage("one", "2", "x"); })) {
            std::cerr << "Expected ValidationError for missing or non-numeric fields\n";
            return 1;
        }
        if (fixture.store.messageCount() != 0 || !fixture.cache.erased.empty()) {
            std::cerr << "Expected no side effects from rejected writes\n";
            return 1;
        }
    }

    // Store failure is fatal and nothing is invalidated or pushed.
    {
        Fixture fixture;
        auto recipient = std::make_shared<RecordingChannel>(3);
        fixture.registry.bind("2", recipient);
        fixture.store.failWrites = true;
        try {
            fixture.service.sendMessage("1", "2", "lost");
            std::cerr << "Expected StoreError to propagate\n";
            return 1;
        } catch (const domain::StoreError&) {
        }
        if (!fixture.cache.erased.empty() || !recipient->payloads().empty()) {
            std::cerr << "Expected no invalidation or push after a failed write\n";
            return 1;
        }
    }

    // Misrouted sender is accepted and counted; dead recipient channel does not fail the write.
    {
        Fixture fixture;
        auto gone = std::make_shared<RecordingChannel>(4);
        gone->closed = true;
        fixture.registry.bind("5", gone);

        const auto misroutedBefore = metrics.counter("write.misrouted");
        const auto pushFailedBefore = metrics.counter("push.failed");
        fixture.service.sendMessage("2", "5", "wrong shard");
        if (fixture.store.messageCount() != 1 || metrics.counter("write.misrouted") != misroutedBefore + 1) {
            std::cerr << "Expected misrouted write to be stored and counted\n";
            return 1;
        }
        if (metrics.counter("push.failed") != pushFailedBefore + 1) {
            std::cerr << "Expected failed push to be counted\n";
            return 1;
        }
    }

    // Cache-aside reads.
    {
        Fixture fixture;
        fixture.clock = 10;
        fixture.service.sendMessage("1", "2", "first");
        fixture.clock = 20;
        fixture.service.sendMessage("2", "1", "second");
        fixture.clock = 30;
        fixture.service.sendMessage("1", "4", "other");

        const auto readsBefore = fixture.store.reads;
        const auto inbox = fixture.service.messagesFor("1", 50);
        if (inbox.size() != 3 || inbox.front().content != "other") {
            std::cerr << "Expected 3 inbox messages newest first\n";
            return 1;
        }
        if (fixture.cache.lastTtl != std::chrono::seconds(300) || !fixture.cache.entries.count("user:messages:1")) {
            std::cerr << "Expected inbox to be cached with a 300s TTL\n";
            return 1;
        }

        // Smaller limit served from cache and truncated.
        const auto hitsBefore = metrics.counter("cache.hit");
        const auto truncated = fixture.service.messagesFor("1", 2);
        if (truncated.size() != 2 || fixture.store.reads != readsBefore + 1
            || metrics.counter("cache.hit") != hitsBefore + 1) {
            std::cerr << "Expected cache hit truncated to 2 without touching the store\n";
            return 1;
        }

        // Larger limit than cached must go back to the store.
        fixture.service.messagesFor("1", 80);
        if (fixture.store.reads != readsBefore + 2) {
            std::cerr << "Expected a larger limit to bypass the cached entry\n";
            return 1;
        }

        const auto conversation = fixture.service.conversation("1", "2", 100);
        if (conversation.size() != 2 || conversation[0].content != "first" || conversation[1].content != "second") {
            std::cerr << "Expected conversation oldest first\n";
            return 1;
        }

        // A write drops the cached conversation so the next read sees it.
        fixture.clock = 40;
        fixture.service.sendMessage("2", "1", "third");
        if (fixture.service.conversation("1", "2", 100).size() != 3) {
            std::cerr << "Expected conversation cache to be invalidated by a write\n";
            return 1;
        }
    }

    // Cache outage degrades to store-only reads.
    {
        Fixture fixture;
        fixture.service.sendMessage("1", "2", "x");
        fixture.cache.failing = true;
        fixture.service.sendMessage("1", "2", "y");
        if (fixture.service.messagesFor("1", 10).size() != 2 || fixture.service.conversation("1", "2", 10).size() != 2) {
            std::cerr << "Expected reads to succeed while the cache is down\n";
            return 1;
        }
    }

    // Corrupt cache entry is ignored.
    {
        Fixture fixture;
        fixture.service.sendMessage("1", "2", "x");
        fixture.cache.entries["user:messages:1"] = "not json";
        if (fixture.service.messagesFor("1", 10).size() != 1) {
            std::cerr << "Expected corrupt cache entry to fall back to the store\n";
            return 1;
        }
    }

    // Read validation and user listing.
    {
        Fixture fixture;
        if (!throwsValidation([&]() { fixture.service.messagesFor("x", 10); })
            || !throwsValidation([&]() { fixture.service.messagesFor("1", 0); })
            || !throwsValidation([&]() { fixture.service.conversation("1", "", 10); })) {
            std::cerr << "Expected read validation errors\n";
            return 1;
        }

        fixture.store.users.push_back(domain::UserRecord{4, "dora", 1});
        fixture.store.users.push_back(domain::UserRecord{2, "bob", 2});
        fixture.service.sendMessage("7", "2", "from an unknown sender");
        const auto users = fixture.service.listUsers();
        if (users.size() != 2 || users[0].id != 4 || users[1].id != 7 || !users[1].name.empty()) {
            std::cerr << "Expected shard 1 users 4 (record) and 7 (sender without record)\n";
            return 1;
        }
    }

    // Alternate spellings of an id address the same user everywhere.
    {
        Fixture fixture;
        auto recipient = std::make_shared<RecordingChannel>(12);
        fixture.registry.bind("2", recipient);

        const auto message = fixture.service.sendMessage("07", "+2", "padded");
        if (message.fromUserId != "7" || message.toUserId != "2") {
            std::cerr << "Expected stored ids 7 and 2 but got " << message.fromUserId << " and " << message.toUserId
                      << "\n";
            return 1;
        }
        if (recipient->payloads().size() != 1) {
            std::cerr << "Expected push to the channel bound as 2\n";
            return 1;
        }
        for (const char* key : {"conv:7:2", "conv:2:7", "user:messages:7", "user:messages:2"}) {
            if (!contains(fixture.cache.erased, key)) {
                std::cerr << "Expected normalized cache key " << key << " to be invalidated\n";
                return 1;
            }
        }
        const auto thread = fixture.service.conversation("7", "002", 10);
        if (thread.size() != 1 || thread[0].id != message.id) {
            std::cerr << "Expected conversation 7/002 to include the message sent as 07\n";
            return 1;
        }
        if (fixture.service.messagesFor("+7", 10).size() != 1 || !fixture.cache.entries.count("user:messages:7")) {
            std::cerr << "Expected inbox +7 to read and cache under user:messages:7\n";
            return 1;
        }
    }

    // Shard id outside 1..shardCount is a configuration error.
    {
        InMemoryMessageStore store;
        FlakyCache cache;
        app::ConnectionRegistry registry;
        if (!throwsValidation([&]() {
                app::MessageService service(store, cache, registry, app::MessageService::Options{4, 3, std::chrono::seconds(1)});
            })) {
            std::cerr << "Expected shard id 4 of 3 to be rejected\n";
            return 1;
        }
    }

    std::cout << "test_message_service passed\n";
    return 0;
}
