#pragma once

#include <string>
#include <string_view>
#include <vector>

#include <boost/json/array.hpp>
#include <boost/json/object.hpp>
#include <boost/json/value.hpp>

#include "domain/Models.hpp"

namespace chs::http {

// Wire form: {"id","from_user_id","to_user_id","content","created_at","shard_id"}.
boost::json::object to_json(const domain::Message& message);
boost::json::array to_json(const std::vector<domain::Message>& messages);

boost::json::object to_json(const domain::UserRecord& user);
boost::json::array to_json(const std::vector<domain::UserRecord>& users);

// Throws domain::ValidationError when a required field is missing or mistyped.
domain::Message message_from_json(const boost::json::value& value);
std::vector<domain::Message> messages_from_json(const boost::json::value& value);
domain::UserRecord user_from_json(const boost::json::value& value);
std::vector<domain::UserRecord> users_from_json(const boost::json::value& value);

// User ids arrive either as JSON strings or integers; both map to the
// normalized decimal string. Throws domain::ValidationError for non-numeric ids.
std::string required_id(const boost::json::object& object, std::string_view key);
std::string required_string(const boost::json::object& object, std::string_view key);

const boost::json::object& as_object(const boost::json::value& value, std::string_view what);

}  // namespace chs::http
