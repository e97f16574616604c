//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef MSGHUB_SERVER_INCLUDE_SERVICES_READ_INDEX_SERVICE_HPP
#define MSGHUB_SERVER_INCLUDE_SERVICES_READ_INDEX_SERVICE_HPP

#include <boost/asio/awaitable.hpp>

#include <cstdint>
#include <optional>
#include <span>

#include "business_types.hpp"
#include "error.hpp"

// Maintains per (user, conversation) read indices, and computes
// unread counts from them.
// A read index tracks the last message a user acknowledged (mid) and the latest
// message in the conversation (latest_mid). Whenever a user acts on a
// conversation (sends or acknowledges), their own index moves to that message,
// and everyone else's latest_mid advances.

namespace msghub {

class mysql_client;
class message_store;

class read_index_service
{
    mysql_client* mysql_;
    message_store* store_;

public:
    read_index_service(mysql_client& mysql, message_store& store) noexcept : mysql_(&mysql), store_(&store) {}

    // Records that user_id acted on a conversation up to update.mid.
    // For groups, members are looked up in MySQL. If this fails,
    // errc::recipient_resolution_failed is returned.
    boost::asio::awaitable<result_with_message<void>> set_read_index(
        std::int64_t user_id,
        const read_index_update& update
    );

    // Same as set_read_index, for groups whose members are already known
    boost::asio::awaitable<result_with_message<void>> set_group_read_index(
        std::int64_t user_id,
        std::int64_t group_id,
        std::int64_t mid,
        std::span<const std::int64_t> member_ids
    );

    // Computes the number of unread messages for a read index. Returns
    //   - unread_all if the user never acknowledged anything in the conversation.
    //   - the number of messages after the acknowledged one, if non-zero.
    //   - an empty optional if everything was read, or the count could not be computed.
    std::optional<unread> count_unread(const read_index& row) const;
};

}  // namespace msghub

#endif
