//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "services/message_codec.hpp"

#include <boost/json/object.hpp>
#include <boost/json/parse.hpp>
#include <boost/json/serialize.hpp>
#include <boost/json/value.hpp>
#include <boost/json/value_from.hpp>
#include <boost/json/value_to.hpp>
#include <boost/variant2/variant.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

#include "business_types.hpp"
#include "business_types_metadata.hpp"
#include "error.hpp"
#include "timestamp.hpp"

using namespace msghub;

// Union tags
static constexpr std::string_view user_tag = "User";
static constexpr std::string_view group_tag = "Group";
static constexpr std::string_view normal_tag = "Normal";
static constexpr std::string_view reply_tag = "Reply";

// Builds an externally tagged union value
template <class T>
static boost::json::value make_tagged(std::string_view tag, const T& alternative)
{
    boost::json::object res;
    res.emplace(tag, boost::json::value_from(alternative));
    return res;
}

// Externally tagged unions are objects with a single key, the tag
static const boost::json::key_value_pair* get_tagged(const boost::json::value& input)
{
    const auto* obj = input.if_object();
    if (!obj || obj->size() != 1u)
        return nullptr;
    return &*obj->begin();
}

// Parses a described struct, reporting any mismatch as a serialization error
template <class T>
static result<T> parse_described(const boost::json::value& input)
{
    auto res = boost::json::try_value_to<T>(input);
    if (res.has_error())
        MSGHUB_RETURN_ERROR(errc::serialization_error)
    return std::move(res).value();
}

static boost::json::value detail_to_json(const message_detail& input)
{
    return boost::variant2::visit(
        [](const auto& d) -> boost::json::value {
            using T = std::decay_t<decltype(d)>;
            return make_tagged(std::is_same_v<T, normal_detail> ? normal_tag : reply_tag, d);
        },
        input
    );
}

static result<message_detail> detail_from_json(const boost::json::value& input)
{
    const auto* kv = get_tagged(input);
    if (!kv)
        MSGHUB_RETURN_ERROR(errc::serialization_error)

    if (kv->key() == normal_tag)
    {
        auto res = parse_described<normal_detail>(kv->value());
        if (res.has_error())
            return res.error();
        return message_detail(std::move(*res));
    }
    else if (kv->key() == reply_tag)
    {
        auto res = parse_described<reply_detail>(kv->value());
        if (res.has_error())
            return res.error();
        return message_detail(std::move(*res));
    }
    else
    {
        MSGHUB_RETURN_ERROR(errc::serialization_error)
    }
}

boost::json::value msghub::target_to_json(const message_target& input)
{
    return boost::variant2::visit(
        [](const auto& t) -> boost::json::value {
            using T = std::decay_t<decltype(t)>;
            return make_tagged(std::is_same_v<T, user_target> ? user_tag : group_tag, t);
        },
        input
    );
}

result<message_target> msghub::target_from_json(const boost::json::value& input)
{
    const auto* kv = get_tagged(input);
    if (!kv)
        MSGHUB_RETURN_ERROR(errc::serialization_error)

    if (kv->key() == user_tag)
    {
        auto res = parse_described<user_target>(kv->value());
        if (res.has_error())
            return res.error();
        return message_target(*res);
    }
    else if (kv->key() == group_tag)
    {
        auto res = parse_described<group_target>(kv->value());
        if (res.has_error())
            return res.error();
        return message_target(*res);
    }
    else
    {
        MSGHUB_RETURN_ERROR(errc::serialization_error)
    }
}

boost::json::value msghub::payload_to_json(const message_payload& input)
{
    boost::json::object res;
    res.emplace("from_uid", input.from_uid);
    res.emplace("created_at", format_timestamp(input.created_at));
    res.emplace("target", target_to_json(input.target));
    res.emplace("detail", detail_to_json(input.detail));
    return res;
}

result<message_payload> msghub::payload_from_json(const boost::json::value& input)
{
    // Get the top-level fields
    const auto* obj = input.if_object();
    if (!obj)
        MSGHUB_RETURN_ERROR(errc::serialization_error)
    const auto* from_uid = obj->if_contains("from_uid");
    const auto* created_at = obj->if_contains("created_at");
    const auto* target = obj->if_contains("target");
    const auto* detail = obj->if_contains("detail");
    if (!from_uid || !created_at || !target || !detail)
        MSGHUB_RETURN_ERROR(errc::serialization_error)

    // Sender
    auto uid = boost::json::try_value_to<std::int64_t>(*from_uid);
    if (uid.has_error())
        MSGHUB_RETURN_ERROR(errc::serialization_error)

    // Timestamp
    const auto* created_at_str = created_at->if_string();
    if (!created_at_str)
        MSGHUB_RETURN_ERROR(errc::serialization_error)
    auto ts = parse_timestamp(*created_at_str);
    if (ts.has_error())
        return ts.error();

    // Unions
    auto parsed_target = target_from_json(*target);
    if (parsed_target.has_error())
        return parsed_target.error();
    auto parsed_detail = detail_from_json(*detail);
    if (parsed_detail.has_error())
        return parsed_detail.error();

    return message_payload{
        *uid,
        *ts,
        std::move(*parsed_target),
        std::move(*parsed_detail),
    };
}

std::string msghub::serialize_payload(const message_payload& input)
{
    return boost::json::serialize(payload_to_json(input));
}

result<message_payload> msghub::parse_payload(std::string_view input)
{
    error_code ec;
    auto jv = boost::json::parse(input, ec);
    if (ec)
        MSGHUB_RETURN_ERROR(errc::serialization_error)
    return payload_from_json(jv);
}
