//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "api/messages.hpp"

#include <boost/asio/awaitable.hpp>
#include <boost/beast/http/status.hpp>
#include <boost/variant2/variant.hpp>

#include <algorithm>
#include <charconv>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

#include "api/api_types.hpp"
#include "business_types.hpp"
#include "error.hpp"
#include "request_context.hpp"
#include "services/messaging_service.hpp"
#include "services/session_registry.hpp"
#include "shared_state.hpp"
#include "timestamp.hpp"

using namespace msghub;
namespace asio = boost::asio;
namespace http = boost::beast::http;

static constexpr std::size_t default_page_size = 20u;
static constexpr std::size_t max_page_size = 100u;
static constexpr std::size_t max_batch_size = 100u;

// Authentication errors are 401s. Anything else is unexpected
static response_builder::response_type auth_failed(response_builder& resp, const error_with_message& err)
{
    if (err.ec == errc::requires_auth)
        return resp.unauthorized();
    return resp.internal_server_error(err);
}

// Parses an optional integer query parameter. Fails if it's present but malformed
static result<std::optional<std::int64_t>> int_param(const request_context& ctx, std::string_view name)
{
    auto value = ctx.query_param(name);
    if (!value.has_value())
        return std::optional<std::int64_t>();

    std::int64_t res{};
    const char* first = value->data();
    const char* last = first + value->size();
    auto [ptr, ec] = std::from_chars(first, last, res);
    if (ec != std::errc() || ptr != last)
        MSGHUB_RETURN_ERROR(errc::invalid_request)
    return std::optional<std::int64_t>(res);
}

// Parses the limit parameter. Values above the maximum are clamped
static result<std::size_t> limit_param(const request_context& ctx)
{
    auto limit = int_param(ctx, "limit");
    if (limit.has_error())
        return limit.error();
    if (!limit->has_value())
        return default_page_size;
    if (**limit <= 0)
        MSGHUB_RETURN_ERROR(errc::invalid_request)
    return std::min(static_cast<std::size_t>(**limit), max_page_size);
}

static bool is_blank(std::string_view msg)
{
    return msg.find_first_not_of(" \t\r\n") == std::string_view::npos;
}

asio::awaitable<response_builder::response_type> msghub::handle_send_message(
    request_context& ctx,
    shared_state& st
)
{
    // Authenticate
    auto uid = co_await st.sessions().resolve_session(ctx.session_token());
    if (uid.has_error())
        co_return auth_failed(ctx.response(), uid.error());

    // Parse params
    auto parse_result = ctx.parse_json_body<send_message_request>();
    if (parse_result.has_error())
        co_return ctx.response().bad_request_json("Invalid body provided");
    auto& req = parse_result.value();

    // Validate params
    if (is_blank(req.msg))
        co_return ctx.response().bad_request_json(api_error_id::blank_message, "msg is blank");
    if (const auto* dm = boost::variant2::get_if<user_target>(&req.target); dm && dm->uid == *uid)
        co_return ctx.response().bad_request_json("Can't send a message to yourself");

    // Execute the operation
    message_payload payload{
        *uid,
        timestamp_t::clock::now(),
        req.target,
        normal_detail{message_content{std::move(req.msg)}},
    };
    auto mid = co_await st.messaging().send_message(payload);
    if (mid.has_error())
    {
        const auto& ec = mid.error().ec;
        if (ec == errc::not_a_member)
            co_return ctx.response().json_error(
                http::status::not_found,
                api_error_id::not_a_member,
                "You are not a member of this group"
            );
        if (ec == errc::forbidden)
            co_return ctx.response().json_error(
                http::status::forbidden,
                api_error_id::forbidden,
                "You are not allowed to post in this group"
            );
        co_return ctx.response().internal_server_error(mid.error());
    }

    co_return ctx.response().json_response(send_message_response{*mid});
}

asio::awaitable<response_builder::response_type> msghub::handle_get_history(
    request_context& ctx,
    shared_state& st
)
{
    // Authenticate
    auto uid = co_await st.sessions().resolve_session(ctx.session_token());
    if (uid.has_error())
        co_return auth_failed(ctx.response(), uid.error());

    // Parse params. Exactly one of uid and gid must be present
    auto target_uid = int_param(ctx, "uid");
    auto target_gid = int_param(ctx, "gid");
    auto before = int_param(ctx, "before");
    auto limit = limit_param(ctx);
    if (target_uid.has_error() || target_gid.has_error() || before.has_error() || limit.has_error())
        co_return ctx.response().bad_request_json("Invalid query parameters");
    if (target_uid->has_value() == target_gid->has_value())
        co_return ctx.response().bad_request_json("Exactly one of uid and gid should be provided");

    history_request req{
        *uid,
        target_uid->has_value() ? message_target(user_target{**target_uid})
                                : message_target(group_target{**target_gid}),
        *before,
        *limit,
    };

    // Execute the operation
    auto msgs = st.messaging().get_history(req);
    if (msgs.has_error())
        co_return ctx.response().internal_server_error(msgs.error());

    co_return ctx.response().json_response(messages_response{*msgs});
}

asio::awaitable<response_builder::response_type> msghub::handle_sync_messages(
    request_context& ctx,
    shared_state& st
)
{
    auto uid = co_await st.sessions().resolve_session(ctx.session_token());
    if (uid.has_error())
        co_return auth_failed(ctx.response(), uid.error());

    auto after = int_param(ctx, "after");
    auto limit = limit_param(ctx);
    if (after.has_error() || limit.has_error())
        co_return ctx.response().bad_request_json("Invalid query parameters");

    auto msgs = st.messaging().get_feed(*uid, *after, *limit);
    if (msgs.has_error())
        co_return ctx.response().internal_server_error(msgs.error());

    co_return ctx.response().json_response(messages_response{*msgs});
}

asio::awaitable<response_builder::response_type> msghub::handle_batch_messages(
    request_context& ctx,
    shared_state& st
)
{
    auto uid = co_await st.sessions().resolve_session(ctx.session_token());
    if (uid.has_error())
        co_return auth_failed(ctx.response(), uid.error());

    auto parse_result = ctx.parse_json_body<batch_messages_request>();
    if (parse_result.has_error())
        co_return ctx.response().bad_request_json("Invalid body provided");
    const auto& req = parse_result.value();
    if (req.mids.size() > max_batch_size)
        co_return ctx.response().bad_request_json("mids: too many IDs");

    auto msgs = st.messaging().get_by_mids(req.mids);
    if (msgs.has_error())
        co_return ctx.response().internal_server_error(msgs.error());

    co_return ctx.response().json_response(messages_response{*msgs});
}

asio::awaitable<response_builder::response_type> msghub::handle_set_read_index(
    request_context& ctx,
    shared_state& st
)
{
    auto uid = co_await st.sessions().resolve_session(ctx.session_token());
    if (uid.has_error())
        co_return auth_failed(ctx.response(), uid.error());

    auto parse_result = ctx.parse_json_body<read_index_request>();
    if (parse_result.has_error())
        co_return ctx.response().bad_request_json("Invalid body provided");

    auto res = co_await st.messaging().set_read_index(*uid, parse_result->update);
    if (res.has_error())
        co_return ctx.response().internal_server_error(res.error());

    co_return ctx.response().empty_response();
}

asio::awaitable<response_builder::response_type> msghub::handle_get_chat_list(
    request_context& ctx,
    shared_state& st
)
{
    auto uid = co_await st.sessions().resolve_session(ctx.session_token());
    if (uid.has_error())
        co_return auth_failed(ctx.response(), uid.error());

    auto entries = co_await st.messaging().get_chat_list(*uid);
    if (entries.has_error())
        co_return ctx.response().internal_server_error(entries.error());

    co_return ctx.response().json_response(chat_list_response{*entries});
}

asio::awaitable<response_builder::response_type> msghub::handle_logout(request_context& ctx, shared_state& st)
{
    // Only valid sessions can be removed
    auto token = ctx.session_token();
    auto uid = co_await st.sessions().resolve_session(token);
    if (uid.has_error())
        co_return auth_failed(ctx.response(), uid.error());

    auto res = co_await st.sessions().remove_session(token);
    if (res.has_error())
        co_return ctx.response().internal_server_error(res.error());

    co_return ctx.response().empty_response();
}
