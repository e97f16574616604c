//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "services/session_registry.hpp"

#include <boost/algorithm/hex.hpp>
#include <boost/asio/awaitable.hpp>

#include <array>
#include <chrono>
#include <iterator>
#include <openssl/rand.h>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>

#include "error.hpp"
#include "services/redis_client.hpp"

using namespace msghub;
namespace asio = boost::asio;

static constexpr std::size_t session_token_size = 16;  // bytes

std::string msghub::generate_session_token()
{
    // Generate a random session ID. This uses the public random generator
    // because this value is exposed to the user
    std::array<unsigned char, session_token_size> sid{};
    int ec = RAND_bytes(sid.data(), sid.size());
    if (ec <= 0)
        throw std::runtime_error("Generating session ID: RAND_bytes");

    // Hex-encode it, so it can be transmitted in headers and query strings
    std::string res;
    res.reserve(session_token_size * 2u);
    boost::algorithm::hex_lower(sid.begin(), sid.end(), std::back_inserter(res));
    return res;
}

static std::string get_redis_key(std::string_view token)
{
    constexpr std::string_view prefix = "session:";

    std::string res;
    res.reserve(prefix.size() + token.size());
    res += prefix;
    res += token;
    return res;
}

namespace {

class redis_session_registry final : public session_registry
{
    redis_client* redis_;
    session_policy policy_;

public:
    redis_session_registry(redis_client& redis, session_policy policy) noexcept : redis_(&redis), policy_(policy)
    {
    }

    asio::awaitable<result_with_message<std::string>> create_session(std::int64_t user_id) final override
    {
        // Convert the user ID to string
        auto user_id_str = std::to_string(user_id);

        while (true)
        {
            // Generate an identifier
            auto token = generate_session_token();

            // Try to insert it
            auto res = co_await redis_->set_nonexisting_key(get_redis_key(token), user_id_str, policy_.idle_timeout);

            // If we were successful, done. If we got a conflict (unlikely), generate a new ID.
            // Exit on unknown errors
            if (res.has_value())
                co_return token;
            else if (res.error().ec != errc::already_exists)
                co_return std::move(res).error();
        }
    }

    asio::awaitable<result_with_message<std::int64_t>> resolve_session(std::string_view token) final override
    {
        if (token.empty())
            MSGHUB_CO_RETURN_ERROR_WITH_MESSAGE(errc::requires_auth, "")

        auto res = co_await redis_->get_int_key_refresh(get_redis_key(token), policy_.idle_timeout);
        if (res.has_error())
        {
            auto err = std::move(res).error();
            if (err.ec == errc::not_found)
                MSGHUB_CO_RETURN_ERROR_WITH_MESSAGE(errc::requires_auth, std::move(err.msg))
            co_return err;
        }
        co_return res.value();
    }

    asio::awaitable<result_with_message<void>> remove_session(std::string_view token) final override
    {
        co_return co_await redis_->delete_key(get_redis_key(token));
    }
};

class memory_session_registry final : public session_registry
{
    struct session
    {
        std::int64_t user_id;
        std::chrono::steady_clock::time_point last_used;
    };

    session_policy policy_;
    session_clock clock_;
    std::unordered_map<std::string, session> sessions_;

    bool expired(const session& s, std::chrono::steady_clock::time_point now) const
    {
        return now - s.last_used >= policy_.idle_timeout;
    }

    // Expired sessions are removed lazily, when a new session is created
    void purge(std::chrono::steady_clock::time_point now)
    {
        for (auto it = sessions_.begin(); it != sessions_.end();)
        {
            if (expired(it->second, now))
                it = sessions_.erase(it);
            else
                ++it;
        }
    }

public:
    memory_session_registry(session_policy policy, session_clock clock)
        : policy_(policy), clock_(std::move(clock))
    {
    }

    asio::awaitable<result_with_message<std::string>> create_session(std::int64_t user_id) final override
    {
        auto now = clock_();
        purge(now);
        while (true)
        {
            auto token = generate_session_token();
            if (sessions_.emplace(token, session{user_id, now}).second)
                co_return token;
        }
    }

    asio::awaitable<result_with_message<std::int64_t>> resolve_session(std::string_view token) final override
    {
        auto now = clock_();
        auto it = sessions_.find(std::string(token));
        if (it == sessions_.end())
            MSGHUB_CO_RETURN_ERROR_WITH_MESSAGE(errc::requires_auth, "")
        if (expired(it->second, now))
        {
            sessions_.erase(it);
            MSGHUB_CO_RETURN_ERROR_WITH_MESSAGE(errc::requires_auth, "Session expired")
        }

        // Refresh
        it->second.last_used = now;
        co_return it->second.user_id;
    }

    asio::awaitable<result_with_message<void>> remove_session(std::string_view token) final override
    {
        sessions_.erase(std::string(token));
        co_return result_with_message<void>();
    }
};

}  // namespace

std::unique_ptr<session_registry> msghub::create_redis_session_registry(redis_client& redis, session_policy policy)
{
    return std::unique_ptr<session_registry>{new redis_session_registry(redis, policy)};
}

std::unique_ptr<session_registry> msghub::create_memory_session_registry(
    session_policy policy,
    session_clock clock
)
{
    return std::unique_ptr<session_registry>{new memory_session_registry(policy, std::move(clock))};
}
