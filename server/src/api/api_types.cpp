//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "api/api_types.hpp"

#include <boost/describe/class.hpp>
#include <boost/json/array.hpp>
#include <boost/json/object.hpp>
#include <boost/json/parse.hpp>
#include <boost/json/serialize.hpp>
#include <boost/json/value.hpp>
#include <boost/json/value_from.hpp>
#include <boost/json/value_to.hpp>
#include <boost/variant2/variant.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

#include "business_types.hpp"
#include "business_types_metadata.hpp"
#include "services/message_codec.hpp"
#include "timestamp.hpp"

using namespace msghub;

namespace msghub {

//
// BOOST_DESCRIBE_STRUCT is used to add reflection capabilities to structs.
// It's used by boost::json::value_to, value_from and try_value_from to
// automatically generate JSON parsing/serializing code.
//
// Describe metadata is defined in this .cpp file to reduce build times.
// Care must be taken to not redefine this metadata in other files, which is
// an ODR violation.
//

BOOST_DESCRIBE_STRUCT(batch_messages_request, (), (mids))

}  // namespace msghub

namespace {

// API error wire format
struct wire_api_error
{
    std::string_view id;
    std::string_view message;
};
BOOST_DESCRIBE_STRUCT(wire_api_error, (), (id, message))

}  // namespace

//
// Incoming types
//

// Parses a JSON string, returning an error if it's not valid
static result<boost::json::value> parse_json(std::string_view from)
{
    error_code ec;
    auto res = boost::json::parse(from, ec);
    if (ec)
        MSGHUB_RETURN_ERROR(ec)
    return res;
}

result<send_message_request> send_message_request::from_json(std::string_view from)
{
    // Parse the JSON
    auto jv = parse_json(from);
    if (jv.has_error())
        return jv.error();

    // Get the fields
    const auto* obj = jv->if_object();
    if (!obj)
        MSGHUB_RETURN_ERROR(errc::invalid_request)
    const auto* target = obj->if_contains("target");
    const auto* msg = obj->if_contains("msg");
    if (!target || !msg || !msg->is_string())
        MSGHUB_RETURN_ERROR(errc::invalid_request)

    // The target is a tagged union
    auto parsed_target = target_from_json(*target);
    if (parsed_target.has_error())
        return parsed_target.error();

    return send_message_request{*parsed_target, std::string(msg->get_string())};
}

result<batch_messages_request> batch_messages_request::from_json(std::string_view from)
{
    auto jv = parse_json(from);
    if (jv.has_error())
        return jv.error();
    return boost::json::try_value_to<batch_messages_request>(*jv);
}

result<read_index_request> read_index_request::from_json(std::string_view from)
{
    auto jv = parse_json(from);
    if (jv.has_error())
        return jv.error();

    // An object with a single key, naming the conversation kind
    const auto* obj = jv->if_object();
    if (!obj || obj->size() != 1u)
        MSGHUB_RETURN_ERROR(errc::invalid_request)
    const auto& kv = *obj->begin();

    if (kv.key() == "User")
    {
        auto res = boost::json::try_value_to<user_read_update>(kv.value());
        if (res.has_error())
            return res.error();
        return read_index_request{*res};
    }
    else if (kv.key() == "Group")
    {
        auto res = boost::json::try_value_to<group_read_update>(kv.value());
        if (res.has_error())
            return res.error();
        return read_index_request{*res};
    }
    else
    {
        MSGHUB_RETURN_ERROR(errc::invalid_request)
    }
}

//
// Outgoing types
//

static std::string_view to_string(api_error_id input)
{
    switch (input)
    {
    case api_error_id::blank_message: return "BLANK_MESSAGE";
    case api_error_id::unauthorized: return "UNAUTHORIZED";
    case api_error_id::not_a_member: return "NOT_A_MEMBER";
    case api_error_id::forbidden: return "FORBIDDEN";
    case api_error_id::bad_request:
    default: return "BAD_REQUEST";
    }
}

std::string api_error::to_json() const
{
    wire_api_error err{to_string(error_id), error_message};
    return boost::json::serialize(boost::json::value_from(err));
}

std::string send_message_response::to_json() const
{
    boost::json::object res;
    res.emplace("mid", mid);
    return boost::json::serialize(res);
}

static boost::json::object serialize_message(const chat_message& input)
{
    boost::json::object res;
    res.emplace("mid", input.mid);
    res.emplace("payload", payload_to_json(input.payload));
    return res;
}

std::string messages_response::to_json() const
{
    boost::json::array res;
    res.reserve(messages.size());
    for (const auto& msg : messages)
        res.push_back(serialize_message(msg));
    return boost::json::serialize(res);
}

// Unread counts are strings: "all", or the number of messages
static boost::json::value serialize_unread(const std::optional<unread>& input)
{
    if (!input.has_value())
        return nullptr;
    return boost::variant2::visit(
        [](const auto& v) -> boost::json::value {
            if constexpr (std::is_same_v<std::decay_t<decltype(v)>, unread_all>)
                return "all";
            else
                return boost::json::value(std::string_view(std::to_string(v)));
        },
        *input
    );
}

static boost::json::value serialize_optional(std::optional<std::int64_t> input)
{
    if (input.has_value())
        return *input;
    return nullptr;
}

std::string chat_list_response::to_json() const
{
    boost::json::array res;
    res.reserve(entries.size());
    for (const auto& entry : entries)
    {
        const auto& idx = entry.index;
        boost::json::object obj;
        obj.emplace("uid", idx.uid);
        obj.emplace("target_uid", serialize_optional(idx.target_uid));
        obj.emplace("target_gid", serialize_optional(idx.target_gid));
        obj.emplace("mid", serialize_optional(idx.mid));
        obj.emplace("latest_mid", idx.latest_mid);
        obj.emplace("uid_of_latest_msg", idx.uid_of_latest_msg);
        if (entry.latest.has_value())
            obj.emplace("latest_msg", serialize_message(*entry.latest));
        else
            obj.emplace("latest_msg", nullptr);
        obj.emplace("unread", serialize_unread(entry.unread_count));
        res.push_back(std::move(obj));
    }
    return boost::json::serialize(res);
}

std::string chat_message_frame::to_json() const
{
    boost::json::object res;
    res.emplace(event_name, serialize_message(message));
    return boost::json::serialize(res);
}

std::string heartbeat_frame::to_json() const
{
    boost::json::object inner;
    inner.emplace("time", format_timestamp(time));
    boost::json::object res;
    res.emplace(event_name, std::move(inner));
    return boost::json::serialize(res);
}
