#include "http/MessageJson.hpp"

#include <cstdint>
#include <string>

#include "domain/Errors.hpp"
#include "domain/ShardMap.hpp"

namespace chs::http {

namespace {

std::int64_t required_int64(const boost::json::object& object, std::string_view key) {
    const auto* field = object.if_contains(key);
    if (!field) {
        throw domain::ValidationError("missing field '" + std::string{key} + "'");
    }
    if (field->is_int64()) {
        return field->get_int64();
    }
    if (field->is_uint64() && field->get_uint64() <= static_cast<std::uint64_t>(INT64_MAX)) {
        return static_cast<std::int64_t>(field->get_uint64());
    }
    throw domain::ValidationError("field '" + std::string{key} + "' must be an integer");
}

}  // namespace

const boost::json::object& as_object(const boost::json::value& value, std::string_view what) {
    if (!value.is_object()) {
        throw domain::ValidationError(std::string{what} + " must be a JSON object");
    }
    return value.get_object();
}

std::string required_id(const boost::json::object& object, std::string_view key) {
    const auto* field = object.if_contains(key);
    if (!field || field->is_null()) {
        throw domain::ValidationError("missing field '" + std::string{key} + "'");
    }
    if (field->is_string()) {
        const auto& text = field->get_string();
        if (text.empty()) {
            throw domain::ValidationError("field '" + std::string{key} + "' must not be empty");
        }
        return domain::normalizeUserId(std::string_view{text.data(), text.size()});
    }
    if (field->is_int64()) {
        return std::to_string(field->get_int64());
    }
    if (field->is_uint64()) {
        throw domain::ValidationError("field '" + std::string{key} + "' out of range");
    }
    throw domain::ValidationError("field '" + std::string{key} + "' must be a string or an integer");
}

std::string required_string(const boost::json::object& object, std::string_view key) {
    const auto* field = object.if_contains(key);
    if (!field || !field->is_string()) {
        throw domain::ValidationError("field '" + std::string{key} + "' must be a string");
    }
    const auto& text = field->get_string();
    return std::string{text.data(), text.size()};
}

boost::json::object to_json(const domain::Message& message) {
    boost::json::object object;
    object["id"] = message.id;
    object["from_user_id"] = message.fromUserId;
    object["to_user_id"] = message.toUserId;
    object["content"] = message.content;
    object["created_at"] = message.createdAtMs;
    object["shard_id"] = message.shardId;
    return object;
}

boost::json::array to_json(const std::vector<domain::Message>& messages) {
    boost::json::array array;
    array.reserve(messages.size());
    for (const auto& message : messages) {
        array.emplace_back(to_json(message));
    }
    return array;
}

boost::json::object to_json(const domain::UserRecord& user) {
    boost::json::object object;
    object["id"] = user.id;
    object["name"] = user.name;
    object["shard_id"] = user.shardId;
    return object;
}

boost::json::array to_json(const std::vector<domain::UserRecord>& users) {
    boost::json::array array;
    array.reserve(users.size());
    for (const auto& user : users) {
        array.emplace_back(to_json(user));
    }
    return array;
}

domain::Message message_from_json(const boost::json::value& value) {
    const auto& object = as_object(value, "message");
    domain::Message message;
    message.id = required_string(object, "id");
    message.fromUserId = required_id(object, "from_user_id");
    message.toUserId = required_id(object, "to_user_id");
    message.content = required_string(object, "content");
    message.createdAtMs = required_int64(object, "created_at");
    message.shardId = static_cast<domain::ShardId>(required_int64(object, "shard_id"));
    return message;
}

std::vector<domain::Message> messages_from_json(const boost::json::value& value) {
    if (!value.is_array()) {
        throw domain::ValidationError("messages must be a JSON array");
    }
    std::vector<domain::Message> messages;
    messages.reserve(value.get_array().size());
    for (const auto& item : value.get_array()) {
        messages.push_back(message_from_json(item));
    }
    return messages;
}

domain::UserRecord user_from_json(const boost::json::value& value) {
    const auto& object = as_object(value, "user");
    domain::UserRecord user;
    user.id = required_int64(object, "id");
    if (const auto* name = object.if_contains("name"); name && name->is_string()) {
        user.name = std::string{name->get_string().data(), name->get_string().size()};
    }
    user.shardId = static_cast<domain::ShardId>(required_int64(object, "shard_id"));
    return user;
}

std::vector<domain::UserRecord> users_from_json(const boost::json::value& value) {
    if (!value.is_array()) {
        throw domain::ValidationError("users must be a JSON array");
    }
    std::vector<domain::UserRecord> users;
    users.reserve(value.get_array().size());
    for (const auto& item : value.get_array()) {
        users.push_back(user_from_json(item));
    }
    return users;
}

}  // namespace chs::http
