//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef MSGHUB_SERVER_INCLUDE_SHARED_STATE_HPP
#define MSGHUB_SERVER_INCLUDE_SHARED_STATE_HPP

#include <boost/asio/any_io_executor.hpp>

#include <memory>

#include "config.hpp"

namespace msghub {

// Forward declaration
class message_store;
class broadcast_hub;
class redis_client;
class mysql_client;
class session_registry;
class messaging_service;

// Contains singleton objects shared by all sessions in the server
class shared_state
{
    struct
    {
        server_config config_;
        std::unique_ptr<message_store> store_;
        std::unique_ptr<broadcast_hub> hub_;
        std::unique_ptr<redis_client> redis_;
        std::unique_ptr<mysql_client> mysql_;
        std::unique_ptr<session_registry> sessions_;
        std::unique_ptr<messaging_service> messaging_;
    } impl_;

public:
    // Opens the message store and creates the database clients.
    // Throws if the message store can't be opened.
    shared_state(server_config config, boost::asio::any_io_executor ex);
    shared_state(const shared_state&) = delete;
    shared_state(shared_state&&) noexcept;
    shared_state& operator=(const shared_state&) = delete;
    shared_state& operator=(shared_state&&) noexcept;
    ~shared_state();

    const server_config& config() const noexcept { return impl_.config_; }
    message_store& store() noexcept { return *impl_.store_; }
    broadcast_hub& hub() noexcept { return *impl_.hub_; }
    redis_client& redis() noexcept { return *impl_.redis_; }
    mysql_client& mysql() noexcept { return *impl_.mysql_; }
    session_registry& sessions() noexcept { return *impl_.sessions_; }
    messaging_service& messaging() noexcept { return *impl_.messaging_; }
};

}  // namespace msghub

#endif
