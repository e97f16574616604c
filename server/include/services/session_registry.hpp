//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef MSGHUB_SERVER_INCLUDE_SERVICES_SESSION_REGISTRY_HPP
#define MSGHUB_SERVER_INCLUDE_SERVICES_SESSION_REGISTRY_HPP

#include <boost/asio/awaitable.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>

#include "error.hpp"

// Maps opaque session tokens to user IDs. A token alone is enough to
// authenticate a client. Sessions expire after being idle for a while:
// every successful lookup extends their lifetime.

namespace msghub {

class redis_client;

// Session expiration rules
struct session_policy
{
    // A session that isn't used for this long is removed
    std::chrono::seconds idle_timeout{604800};
};

// Using an interface to reduce build times and improve testability
class session_registry
{
public:
    virtual ~session_registry() {}

    // Allocates a new session for the given user, returning its token
    virtual boost::asio::awaitable<result_with_message<std::string>> create_session(std::int64_t user_id) = 0;

    // Retrieves the user that owns the session, refreshing its idle timeout.
    // Returns errc::requires_auth if the token is unknown or expired.
    virtual boost::asio::awaitable<result_with_message<std::int64_t>> resolve_session(std::string_view token) = 0;

    // Removes a session. Removing an unknown session is not an error.
    virtual boost::asio::awaitable<result_with_message<void>> remove_session(std::string_view token) = 0;
};

// Generates a random, URL-safe session token
std::string generate_session_token();

// A registry that stores sessions as Redis keys with a TTL
std::unique_ptr<session_registry> create_redis_session_registry(redis_client& redis, session_policy policy);

// A registry that keeps sessions in memory, for single-process setups that
// issue tokens themselves (like tests). clock is used to evaluate expiration
using session_clock = std::function<std::chrono::steady_clock::time_point()>;
std::unique_ptr<session_registry> create_memory_session_registry(
    session_policy policy,
    session_clock clock = [] { return std::chrono::steady_clock::now(); }
);

}  // namespace msghub

#endif
