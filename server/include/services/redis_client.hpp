//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef MSGHUB_SERVER_INCLUDE_SERVICES_REDIS_CLIENT_HPP
#define MSGHUB_SERVER_INCLUDE_SERVICES_REDIS_CLIENT_HPP

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include "error.hpp"

// The Redis operations the session registry needs. Keys hold user IDs.

namespace msghub {

class redis_client
{
public:
    virtual ~redis_client() {}

    // Launches the connection and its reconnection loop. Call once, before
    // anything else can complete
    virtual void start_run() = 0;

    // At shutdown
    virtual void cancel() = 0;

    // SET NX with a TTL. errc::already_exists if the key is taken
    virtual boost::asio::awaitable<result_with_message<void>> set_nonexisting_key(
        std::string_view key,
        std::string_view value,
        std::chrono::seconds ttl
    ) = 0;

    // Reads an integer key and extends its TTL. errc::not_found if missing
    virtual boost::asio::awaitable<result_with_message<std::int64_t>> get_int_key_refresh(
        std::string_view key,
        std::chrono::seconds ttl
    ) = 0;

    // Missing keys are not an error
    virtual boost::asio::awaitable<result_with_message<void>> delete_key(std::string_view key) = 0;
};

std::unique_ptr<redis_client> create_redis_client(boost::asio::any_io_executor ex, std::string host);

}  // namespace msghub

#endif
