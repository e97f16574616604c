//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "services/read_index_service.hpp"

#include <boost/variant2/variant.hpp>

#include <cstdint>
#include <optional>
#include <span>
#include <vector>

#include "business_types.hpp"
#include "error.hpp"
#include "services/message_store.hpp"
#include "services/mysql_client.hpp"

using namespace msghub;
namespace asio = boost::asio;

// The index of the user that performed the action
static read_index make_own_index(std::int64_t user_id, const message_target& target, std::int64_t mid)
{
    read_index res{user_id, {}, {}, mid, mid, user_id};
    if (const auto* t = boost::variant2::get_if<user_target>(&target))
        res.target_uid = t->uid;
    else
        res.target_gid = boost::variant2::get<group_target>(target).gid;
    return res;
}

asio::awaitable<result_with_message<void>> read_index_service::set_read_index(
    std::int64_t user_id,
    const read_index_update& update
)
{
    if (const auto* dm = boost::variant2::get_if<user_read_update>(&update))
    {
        // Our own index
        auto res = co_await mysql_->upsert_read_index(make_own_index(user_id, user_target{dm->target_uid}, dm->mid));
        if (res.has_error())
            co_return res;

        // The counterpart's index. Its mid is left untouched
        const read_index other{dm->target_uid, user_id, {}, {}, dm->mid, user_id};
        co_return co_await mysql_->advance_latest_messages({&other, 1u});
    }
    else
    {
        const auto& group = boost::variant2::get<group_read_update>(update);

        // Look up members
        auto members = co_await mysql_->get_group_member_ids(group.target_gid);
        if (members.has_error())
        {
            log_error(members.error(), "Retrieving group members");
            MSGHUB_CO_RETURN_ERROR_WITH_MESSAGE(
                errc::recipient_resolution_failed,
                std::move(members).error().msg
            )
        }

        co_return co_await set_group_read_index(user_id, group.target_gid, group.mid, *members);
    }
}

asio::awaitable<result_with_message<void>> read_index_service::set_group_read_index(
    std::int64_t user_id,
    std::int64_t group_id,
    std::int64_t mid,
    std::span<const std::int64_t> member_ids
)
{
    // Our own index
    auto res = co_await mysql_->upsert_read_index(make_own_index(user_id, group_target{group_id}, mid));
    if (res.has_error())
        co_return res;

    // Every other member's index
    std::vector<read_index> others;
    others.reserve(member_ids.size());
    for (auto member_id : member_ids)
    {
        if (member_id != user_id)
            others.push_back(read_index{member_id, {}, group_id, {}, mid, user_id});
    }
    co_return co_await mysql_->advance_latest_messages(others);
}

std::optional<unread> read_index_service::count_unread(const read_index& row) const
{
    // Never read anything
    if (!row.mid.has_value())
        return unread(unread_all{});

    // Count messages after the acknowledged one
    result_with_message<std::size_t> count;
    if (row.target_uid.has_value() && !row.target_gid.has_value())
        count = store_->count_dm_messages_after(row.uid, *row.target_uid, *row.mid);
    else if (row.target_gid.has_value() && !row.target_uid.has_value())
        count = store_->count_group_messages_after(*row.target_gid, *row.mid);
    else
        return std::nullopt;

    if (count.has_error())
    {
        log_error(count.error(), "Counting unread messages");
        return std::nullopt;
    }
    if (*count == 0u)
        return std::nullopt;
    return unread(*count);
}
