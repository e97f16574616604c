//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef MSGHUB_SERVER_INCLUDE_SERVICES_MESSAGING_SERVICE_HPP
#define MSGHUB_SERVER_INCLUDE_SERVICES_MESSAGING_SERVICE_HPP

#include <boost/asio/awaitable.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

#include "business_types.hpp"
#include "error.hpp"
#include "services/read_index_service.hpp"

// High-level messaging operations: sending messages and retrieving them.
// Sending a message stores it, updates the read indices of everyone
// involved, and publishes it to connected clients.

namespace msghub {

class message_store;
class mysql_client;
class broadcast_hub;

// Selects the conversation to retrieve history for
struct history_request
{
    // The user asking for history
    std::int64_t user_id;

    // The conversation. For DMs, the other participant
    message_target conversation;

    // Pagination: only messages with ID < before are returned. Empty means "from the latest"
    std::optional<std::int64_t> before;

    // Maximum number of messages to retrieve
    std::size_t limit;
};

class messaging_service
{
    message_store* store_;
    mysql_client* mysql_;
    broadcast_hub* hub_;
    read_index_service read_index_;

    std::vector<chat_message> decode_all(const std::vector<stored_message>& records) const;

public:
    messaging_service(message_store& store, mysql_client& mysql, broadcast_hub& hub) noexcept
        : store_(&store), mysql_(&mysql), hub_(&hub), read_index_(mysql, store)
    {
    }

    // Stores a message, updates read indices and publishes it to connected clients.
    // Returns the ID of the newly created message.
    boost::asio::awaitable<result_with_message<std::int64_t>> send_message(const message_payload& payload);

    // Retrieves conversation history, newest first. Records that can't be decoded are skipped.
    result_with_message<std::vector<chat_message>> get_history(const history_request& req) const;

    // Retrieves messages sent by or addressed to user_id with ID > after, oldest first
    result_with_message<std::vector<chat_message>> get_feed(
        std::int64_t user_id,
        std::optional<std::int64_t> after,
        std::size_t limit
    ) const;

    // Retrieves messages by ID. Unknown IDs and undecodable records are skipped.
    result_with_message<std::vector<chat_message>> get_by_mids(std::span<const std::int64_t> mids) const;

    // Retrieves a user's conversations, with their latest message and unread counts
    boost::asio::awaitable<result_with_message<std::vector<chat_list_entry>>> get_chat_list(std::int64_t user_id);

    // Acknowledges messages in a conversation
    boost::asio::awaitable<result_with_message<void>> set_read_index(
        std::int64_t user_id,
        const read_index_update& update
    )
    {
        return read_index_.set_read_index(user_id, update);
    }
};

}  // namespace msghub

#endif
