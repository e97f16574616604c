//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef MSGHUB_SERVER_INCLUDE_SERVICES_MESSAGE_STORE_HPP
#define MSGHUB_SERVER_INCLUDE_SERVICES_MESSAGE_STORE_HPP

#include <boost/core/span.hpp>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "business_types.hpp"
#include "error.hpp"

// An embedded, append-only message log. Messages are partitioned by
// conversation: a direct-message pair or a group. Payloads are opaque
// to the store. All operations are serialized by a single lock, so message
// IDs are strictly increasing across the entire store.
// Operations are synchronous: they perform fast, local disk I/O.

namespace msghub {

// Using an interface to reduce build times and improve testability
class message_store
{
public:
    virtual ~message_store() {}

    // Appends a message to the conversation between from and to.
    // (from, to) and (to, from) designate the same conversation.
    // The message is also added to the feeds of both users.
    // Returns the ID of the inserted message, or errc::store_io_error.
    // Either the whole message is written, or nothing is.
    virtual result_with_message<std::int64_t> send_to_dm(
        std::int64_t from,
        std::int64_t to,
        std::string_view payload
    ) = 0;

    // Appends a message to a group. member_ids are only used to populate
    // user feeds (see fetch_user_messages_after); group membership is not
    // recorded by the store.
    virtual result_with_message<std::int64_t> send_to_group(
        std::int64_t group_id,
        boost::span<const std::int64_t> member_ids,
        std::string_view payload
    ) = 0;

    // Retrieves up to limit messages with ID < before_id (or the latest ones
    // if before_id is empty), newest first. Passing the ID of the last message
    // returned as before_id retrieves the next page.
    virtual result_with_message<std::vector<stored_message>> fetch_dm_messages_before(
        std::int64_t user_a,
        std::int64_t user_b,
        std::optional<std::int64_t> before_id,
        std::size_t limit
    ) = 0;

    // Same as fetch_dm_messages_before, for a group
    virtual result_with_message<std::vector<stored_message>> fetch_group_messages_before(
        std::int64_t group_id,
        std::optional<std::int64_t> before_id,
        std::size_t limit
    ) = 0;

    // Retrieves up to limit messages sent by or addressed to user_id,
    // with ID > after_id (or from the beginning if after_id is empty), oldest first.
    // Used to catch up after a reconnection.
    virtual result_with_message<std::vector<stored_message>> fetch_user_messages_after(
        std::int64_t user_id,
        std::optional<std::int64_t> after_id,
        std::size_t limit
    ) = 0;

    // Retrieves a message payload by ID. Returns an empty optional if it doesn't exist.
    virtual result_with_message<std::optional<std::string>> get(std::int64_t message_id) = 0;

    // Counts messages with ID > after_id in a conversation. Empty or
    // unknown conversations yield 0.
    virtual result_with_message<std::size_t> count_dm_messages_after(
        std::int64_t from,
        std::int64_t to,
        std::int64_t after_id
    ) = 0;
    virtual result_with_message<std::size_t> count_group_messages_after(
        std::int64_t group_id,
        std::int64_t after_id
    ) = 0;
};

// Computes the partition key for a conversation. DM keys are order-independent.
std::string dm_partition_key(std::int64_t user_a, std::int64_t user_b);
std::string group_partition_key(std::int64_t group_id);

// Creates a message store backed by an SQLite database at path, creating
// the database if it doesn't exist. Throws on failure.
std::unique_ptr<message_store> create_message_store(const std::string& path);

}  // namespace msghub

#endif
