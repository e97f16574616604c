//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef MSGHUB_SERVER_INCLUDE_BUSINESS_TYPES_HPP
#define MSGHUB_SERVER_INCLUDE_BUSINESS_TYPES_HPP

#include <boost/variant2/variant.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "timestamp.hpp"

// This file contains business object definitions

namespace msghub {

// Message targets. A message is either sent to another user (direct message)
// or to a group.
struct user_target
{
    // ID of the receiving user
    std::int64_t uid;
};

struct group_target
{
    // ID of the receiving group
    std::int64_t gid;
};

using message_target = boost::variant2::variant<user_target, group_target>;

// The textual content of a message
struct message_content
{
    std::string content;
};

// Message details. A plain message, or a reply to a previous message
struct normal_detail
{
    message_content content;
};

struct reply_detail
{
    // ID of the message being replied to
    std::int64_t mid;
    message_content content;
};

using message_detail = boost::variant2::variant<normal_detail, reply_detail>;

// The user-visible content of a message, regardless of the kind of detail
inline const std::string& get_content(const message_detail& detail) noexcept
{
    return boost::variant2::visit([](const auto& d) -> const std::string& { return d.content.content; }, detail);
}

// The data we store for each message. The message store never looks into it:
// it's serialized before being handed to the store.
struct message_payload
{
    // ID of the user that sent the message
    std::int64_t from_uid{};

    // When the server received the message
    timestamp_t created_at;

    // Who the message is addressed to
    message_target target;

    // What the message says
    message_detail detail;
};

// A stored chat message
struct chat_message
{
    // Message ID, assigned by the store
    std::int64_t mid{};

    // The message data
    message_payload payload;
};

// A raw record, as returned by the message store
struct stored_message
{
    std::int64_t mid;
    std::string payload;
};

// Acknowledgement requests, as received by the read index endpoint
struct user_read_update
{
    std::int64_t target_uid;
    std::int64_t mid;
};

struct group_read_update
{
    std::int64_t target_gid;
    std::int64_t mid;
};

using read_index_update = boost::variant2::variant<user_read_update, group_read_update>;

// A per (user, conversation) bookmark, as stored in the relational database.
// Exactly one of target_uid and target_gid is set.
struct read_index
{
    // The user this bookmark belongs to
    std::int64_t uid{};

    // The conversation
    std::optional<std::int64_t> target_uid;
    std::optional<std::int64_t> target_gid;

    // Last message acknowledged by uid. Empty means "never read"
    std::optional<std::int64_t> mid;

    // Latest message in the conversation, and who sent it
    std::int64_t latest_mid{};
    std::int64_t uid_of_latest_msg{};
};

// A user's relationship with a group
enum class group_membership
{
    none,       // not a member, or the group doesn't exist
    member,     // may post
    forbidden,  // a member that has been muted
};

// Unread information for a conversation: either "everything is unread"
// (the user never acknowledged anything), or a number of unread messages
struct unread_all
{
};

using unread = boost::variant2::variant<unread_all, std::size_t>;

// An entry in the user's chat list
struct chat_list_entry
{
    // The read index row describing the conversation
    read_index index;

    // The latest message, if it could be retrieved
    std::optional<chat_message> latest;

    // Empty if there is nothing unread
    std::optional<unread> unread_count;
};

}  // namespace msghub

#endif
