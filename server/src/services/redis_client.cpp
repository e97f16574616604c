//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "services/redis_client.hpp"

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/redis/adapter/result.hpp>
#include <boost/redis/config.hpp>
#include <boost/redis/connection.hpp>
#include <boost/redis/request.hpp>
#include <boost/redis/response.hpp>

#include <chrono>
#include <optional>
#include <string>
#include <utility>

#include "error.hpp"

using namespace msghub;
namespace asio = boost::asio;
namespace redis = boost::redis;

namespace {

class redis_client_impl final : public redis_client
{
    redis::connection conn_;
    std::string host_;

    // Runs a request with a single command, returning its only response.
    // Server-side errors (like WRONGTYPE) are reported as server_errc
    template <class T>
    asio::awaitable<result_with_message<T>> exec_one(const redis::request& req, errc server_errc)
    {
        redis::response<T> res;
        error_code ec;
        co_await conn_.async_exec(req, res, asio::redirect_error(ec));
        if (ec)
            co_return error_with_message{ec};

        auto& adapted = std::get<0>(res);
        if (adapted.has_error())
            MSGHUB_CO_RETURN_ERROR_WITH_MESSAGE(server_errc, std::move(adapted).error().diagnostic)
        co_return std::move(adapted).value();
    }

public:
    redis_client_impl(asio::any_io_executor ex, std::string host) : conn_(std::move(ex)), host_(std::move(host))
    {
    }

    void start_run() final override
    {
        redis::config cfg;
        cfg.addr.host = host_;
        cfg.health_check_interval = std::chrono::seconds::zero();
        conn_.async_run(cfg, {}, asio::detached);
    }

    void cancel() final override { conn_.cancel(); }

    asio::awaitable<result_with_message<void>> set_nonexisting_key(
        std::string_view key,
        std::string_view value,
        std::chrono::seconds ttl
    ) final override
    {
        redis::request req;
        req.push("SET", key, value, "NX", "EX", ttl.count());

        // NX makes SET reply nil when the key is taken
        auto res = co_await exec_one<std::optional<std::string>>(req, errc::redis_command_failed);
        if (res.has_error())
            co_return std::move(res).error();
        if (!res->has_value())
            MSGHUB_CO_RETURN_ERROR_WITH_MESSAGE(errc::already_exists, "")
        co_return result_with_message<void>();
    }

    asio::awaitable<result_with_message<std::int64_t>> get_int_key_refresh(
        std::string_view key,
        std::chrono::seconds ttl
    ) final override
    {
        // GETEX reads and extends the TTL in one step
        redis::request req;
        req.push("GETEX", key, "EX", ttl.count());

        auto res = co_await exec_one<std::optional<std::int64_t>>(req, errc::redis_parse_error);
        if (res.has_error())
            co_return std::move(res).error();
        if (!res->has_value())
            MSGHUB_CO_RETURN_ERROR_WITH_MESSAGE(errc::not_found, "")
        co_return **res;
    }

    asio::awaitable<result_with_message<void>> delete_key(std::string_view key) final override
    {
        redis::request req;
        req.push("DEL", key);

        // The number of deleted keys is irrelevant
        auto res = co_await exec_one<std::int64_t>(req, errc::redis_command_failed);
        if (res.has_error())
            co_return std::move(res).error();
        co_return result_with_message<void>();
    }
};

}  // namespace

std::unique_ptr<redis_client> msghub::create_redis_client(asio::any_io_executor ex, std::string host)
{
    return std::unique_ptr<redis_client>{new redis_client_impl(std::move(ex), std::move(host))};
}
