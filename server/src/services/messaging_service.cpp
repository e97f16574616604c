//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "services/messaging_service.hpp"

#include <boost/variant2/variant.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

#include "business_types.hpp"
#include "error.hpp"
#include "services/broadcast_hub.hpp"
#include "services/message_codec.hpp"
#include "services/message_store.hpp"
#include "services/mysql_client.hpp"

using namespace msghub;
namespace asio = boost::asio;

// Decodes a stored record. Corrupt records are logged and skipped
static std::optional<chat_message> decode_record(std::int64_t mid, std::string_view payload)
{
    auto res = parse_payload(payload);
    if (res.has_error())
    {
        log_error(res.error(), "Decoding message " + std::to_string(mid));
        return std::nullopt;
    }
    return chat_message{mid, std::move(*res)};
}

std::vector<chat_message> messaging_service::decode_all(const std::vector<stored_message>& records) const
{
    std::vector<chat_message> res;
    res.reserve(records.size());
    for (const auto& rec : records)
    {
        auto msg = decode_record(rec.mid, rec.payload);
        if (msg)
            res.push_back(std::move(*msg));
    }
    return res;
}

asio::awaitable<result_with_message<std::int64_t>> messaging_service::send_message(const message_payload& payload)
{
    // Payloads are opaque to the store
    auto serialized = serialize_payload(payload);
    const auto from = payload.from_uid;

    std::int64_t mid{};
    std::vector<std::int64_t> recipients;

    if (const auto* dm = boost::variant2::get_if<user_target>(&payload.target))
    {
        // Store
        auto mid_result = store_->send_to_dm(from, dm->uid, serialized);
        if (mid_result.has_error())
            co_return std::move(mid_result).error();
        mid = *mid_result;
        recipients = make_recipients({from, dm->uid});

        // Update read indices. The message is already stored, so failing here
        // shouldn't make the operation fail
        auto idx_result = co_await read_index_.set_read_index(from, user_read_update{dm->uid, mid});
        if (idx_result.has_error())
            log_error(idx_result.error(), "Updating read indices after sending a direct message");
    }
    else
    {
        const auto gid = boost::variant2::get<group_target>(payload.target).gid;

        // Only members that haven't been muted may post
        auto membership = co_await mysql_->get_group_membership(gid, from);
        if (membership.has_error())
        {
            log_error(membership.error(), "Checking group membership");
            MSGHUB_CO_RETURN_ERROR_WITH_MESSAGE(
                errc::recipient_resolution_failed,
                std::move(membership).error().msg
            )
        }
        if (*membership == group_membership::none)
            MSGHUB_CO_RETURN_ERROR_WITH_MESSAGE(errc::not_a_member, "The sender is not in the group")
        if (*membership == group_membership::forbidden)
            MSGHUB_CO_RETURN_ERROR_WITH_MESSAGE(errc::forbidden, "The sender is muted in the group")

        // Resolve members. The group's recipients are computed here,
        // and are not affected by later membership changes
        auto members = co_await mysql_->get_group_member_ids(gid);
        if (members.has_error())
        {
            log_error(members.error(), "Retrieving group members");
            MSGHUB_CO_RETURN_ERROR_WITH_MESSAGE(
                errc::recipient_resolution_failed,
                std::move(members).error().msg
            )
        }
        recipients = make_recipients(*members);

        // Store. Every recipient gets the message in their feed
        auto mid_result = store_->send_to_group(gid, recipients, serialized);
        if (mid_result.has_error())
            co_return std::move(mid_result).error();
        mid = *mid_result;

        // Update read indices
        auto idx_result = co_await read_index_.set_group_read_index(from, gid, mid, *members);
        if (idx_result.has_error())
            log_error(idx_result.error(), "Updating read indices after sending a group message");
    }

    // Notify connected clients
    hub_->publish(broadcast_event{
        std::move(recipients),
        std::make_shared<const chat_message>(chat_message{mid, payload}),
    });

    co_return mid;
}

result_with_message<std::vector<chat_message>> messaging_service::get_history(const history_request& req) const
{
    auto records = boost::variant2::visit(
        [this, &req](const auto& target) {
            using T = std::decay_t<decltype(target)>;
            if constexpr (std::is_same_v<T, user_target>)
                return store_->fetch_dm_messages_before(req.user_id, target.uid, req.before, req.limit);
            else
                return store_->fetch_group_messages_before(target.gid, req.before, req.limit);
        },
        req.conversation
    );
    if (records.has_error())
        return std::move(records).error();
    return decode_all(*records);
}

result_with_message<std::vector<chat_message>> messaging_service::get_feed(
    std::int64_t user_id,
    std::optional<std::int64_t> after,
    std::size_t limit
) const
{
    auto records = store_->fetch_user_messages_after(user_id, after, limit);
    if (records.has_error())
        return std::move(records).error();
    return decode_all(*records);
}

result_with_message<std::vector<chat_message>> messaging_service::get_by_mids(std::span<const std::int64_t> mids
) const
{
    std::vector<chat_message> res;
    res.reserve(mids.size());
    for (auto mid : mids)
    {
        auto record = store_->get(mid);
        if (record.has_error())
            return std::move(record).error();
        if (!record->has_value())
            continue;
        auto msg = decode_record(mid, **record);
        if (msg)
            res.push_back(std::move(*msg));
    }
    return res;
}

asio::awaitable<result_with_message<std::vector<chat_list_entry>>> messaging_service::get_chat_list(
    std::int64_t user_id
)
{
    auto rows = co_await mysql_->get_read_indexes(user_id);
    if (rows.has_error())
        co_return std::move(rows).error();

    std::vector<chat_list_entry> res;
    res.reserve(rows->size());
    for (auto& row : *rows)
    {
        chat_list_entry entry{std::move(row), std::nullopt, std::nullopt};

        // The latest message. If it can't be retrieved, the entry is still listed
        auto latest = store_->get(entry.index.latest_mid);
        if (latest.has_error())
            log_error(latest.error(), "Retrieving the latest message for the chat list");
        else if (latest->has_value())
            entry.latest = decode_record(entry.index.latest_mid, **latest);

        entry.unread_count = read_index_.count_unread(entry.index);
        res.push_back(std::move(entry));
    }

    co_return res;
}
