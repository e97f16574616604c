//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef MSGHUB_SERVER_INCLUDE_API_MESSAGES_HPP
#define MSGHUB_SERVER_INCLUDE_API_MESSAGES_HPP

#include <boost/asio/awaitable.hpp>

#include "request_context.hpp"

// API handler functions for messaging endpoints. All of them require
// a valid session token.

namespace msghub {

class shared_state;

// POST /messages
boost::asio::awaitable<response_builder::response_type> handle_send_message(
    request_context& ctx,
    shared_state& st
);

// GET /messages/history?uid=N|gid=N[&before=N][&limit=N]
boost::asio::awaitable<response_builder::response_type> handle_get_history(
    request_context& ctx,
    shared_state& st
);

// GET /messages/sync[?after=N][&limit=N]
boost::asio::awaitable<response_builder::response_type> handle_sync_messages(
    request_context& ctx,
    shared_state& st
);

// POST /messages/batch
boost::asio::awaitable<response_builder::response_type> handle_batch_messages(
    request_context& ctx,
    shared_state& st
);

// PUT /read-index
boost::asio::awaitable<response_builder::response_type> handle_set_read_index(
    request_context& ctx,
    shared_state& st
);

// GET /chat-list
boost::asio::awaitable<response_builder::response_type> handle_get_chat_list(
    request_context& ctx,
    shared_state& st
);

// DELETE /session
boost::asio::awaitable<response_builder::response_type> handle_logout(request_context& ctx, shared_state& st);

}  // namespace msghub

#endif
