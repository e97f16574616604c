//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef MSGHUB_SERVER_INCLUDE_API_API_TYPES_HPP
#define MSGHUB_SERVER_INCLUDE_API_API_TYPES_HPP

#include <boost/core/span.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "business_types.hpp"
#include "error.hpp"

// This file contains type definitions for HTTP API objects and event stream frames.
// Types for incoming requests are owning, since they're used after parsing.
// Types for responses and outgoing events are non-owning and lightweight,
// since they are only used as intermediate types for serialization.

namespace msghub {

//
// Incoming messages (HTTP requests)
//

// The request for POST /api/messages
struct send_message_request
{
    // Who the message is for
    message_target target;

    // Message content
    std::string msg;

    // Parses a request from a JSON string
    static result<send_message_request> from_json(std::string_view from);
};

// The request for POST /api/messages/batch
struct batch_messages_request
{
    // IDs of the messages to retrieve
    std::vector<std::int64_t> mids;

    // Parses a request from a JSON string
    static result<batch_messages_request> from_json(std::string_view from);
};

// The request for PUT /api/read-index
struct read_index_request
{
    read_index_update update;

    // Parses a request from a JSON string: {"User":{"target_uid":N,"mid":M}}
    // or {"Group":{"target_gid":N,"mid":M}}
    static result<read_index_request> from_json(std::string_view from);
};

//
// Outgoing messages (HTTP responses and event stream frames)
//

// Used within api_error, as a way to communicate specific error conditions
// to the client.
enum class api_error_id
{
    // generic, when there is not a more specific error ID
    bad_request = 0,

    // The message to send was empty or blank
    blank_message,

    // Missing, invalid or expired session token
    unauthorized,

    // Sending to a group the user doesn't belong to
    not_a_member,

    // Sending to a group where the user has been muted
    forbidden,
};

// A REST API error. Used within HTTP error responses.
struct api_error
{
    // An identifier for the error that occurred.
    api_error_id error_id;

    // A human-readable explanation of the error.
    std::string_view error_message;

    // Serializes the object as a JSON string.
    std::string to_json() const;
};

// Response to POST /api/messages
struct send_message_response
{
    std::int64_t mid;

    std::string to_json() const;
};

// A list of messages. Response to history, sync and batch requests
struct messages_response
{
    boost::span<const chat_message> messages;

    std::string to_json() const;
};

// Response to GET /api/chat-list
struct chat_list_response
{
    boost::span<const chat_list_entry> entries;

    std::string to_json() const;
};

// Pushed through the event stream when a message is sent
struct chat_message_frame
{
    const chat_message& message;

    // The SSE event name
    static constexpr std::string_view event_name = "ChatMessage";

    std::string to_json() const;
};

// Pushed through the event stream periodically
struct heartbeat_frame
{
    timestamp_t time;

    // The SSE event name
    static constexpr std::string_view event_name = "Heartbeat";

    std::string to_json() const;
};

}  // namespace msghub

#endif
