//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef MSGHUB_SERVER_INCLUDE_SERVICES_MYSQL_CLIENT_HPP
#define MSGHUB_SERVER_INCLUDE_SERVICES_MYSQL_CLIENT_HPP

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>

#include <cstdint>
#include <memory>
#include <span>
#include <vector>

#include "business_types.hpp"
#include "config.hpp"
#include "error.hpp"

// A high-level, specialized MySQL client. It implements the operations
// required by our server, abstracting away the actual SQL operations.
// MySQL holds group membership and read indices.

namespace msghub {

// Using an interface to reduce build times and improve testability
class mysql_client
{
public:
    virtual ~mysql_client() {}

    // Starts the MySQL connection pool task, in detached mode. This must be called once
    // to allow other operations to make progress and keep the reconnection loop
    // running
    virtual void start_run() = 0;

    // Cancels the MySQL connection pool task. To be called at shutdown
    virtual void cancel() = 0;

    // Creates the tables we use, if they don't exist
    virtual boost::asio::awaitable<result_with_message<void>> setup_db() = 0;

    // Retrieves the IDs of the users that belong to a group.
    // An unknown group has no members.
    virtual boost::asio::awaitable<result_with_message<std::vector<std::int64_t>>> get_group_member_ids(
        std::int64_t group_id
    ) = 0;

    // Whether user_id belongs to group_id, and whether it's allowed to post there
    virtual boost::asio::awaitable<result_with_message<group_membership>> get_group_membership(
        std::int64_t group_id,
        std::int64_t user_id
    ) = 0;

    // Inserts or updates the read index of the user that performed an action
    // (sending a message or acknowledging it). On conflict, the acknowledged mid
    // is overwritten, and the latest message fields are advanced.
    virtual boost::asio::awaitable<result_with_message<void>> upsert_read_index(const read_index& row) = 0;

    // Inserts or updates the read indices of the other participants of
    // a conversation. New rows get a NULL mid (never read), regardless of rows[i].mid.
    // On conflict, only the latest message fields are advanced.
    virtual boost::asio::awaitable<result_with_message<void>> advance_latest_messages(
        std::span<const read_index> rows
    ) = 0;

    // Retrieves all the read indices for a user, most recently active first
    virtual boost::asio::awaitable<result_with_message<std::vector<read_index>>> get_read_indexes(
        std::int64_t user_id
    ) = 0;
};

// Creates a concrete implementation of mysql_client
std::unique_ptr<mysql_client> create_mysql_client(boost::asio::any_io_executor ex, const mysql_config& cfg);

}  // namespace msghub

#endif
