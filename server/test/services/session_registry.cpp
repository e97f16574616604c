//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "services/session_registry.hpp"

#include <boost/asio/awaitable.hpp>
#include <boost/test/unit_test.hpp>

#include <chrono>
#include <memory>
#include <string>

#include "error.hpp"
#include "test_utils.hpp"

using namespace msghub;
using msghub::test::run_coroutine;
namespace asio = boost::asio;
using namespace std::chrono_literals;

namespace {

struct fixture
{
    // A clock we control
    std::chrono::steady_clock::time_point now{std::chrono::steady_clock::now()};
    std::unique_ptr<session_registry> registry{
        create_memory_session_registry(session_policy{60s}, [this] { return now; })
    };
};

}  // namespace

BOOST_AUTO_TEST_SUITE(session_registry_)

BOOST_AUTO_TEST_CASE(token_format)
{
    auto token1 = generate_session_token();
    auto token2 = generate_session_token();

    // 16 bytes, hex-encoded
    BOOST_TEST(token1.size() == 32u);
    BOOST_TEST(token1.find_first_not_of("0123456789abcdef") == std::string::npos);
    BOOST_TEST(token1 != token2);
}

BOOST_FIXTURE_TEST_CASE(create_resolve_remove, fixture)
{
    run_coroutine([this]() -> asio::awaitable<void> {
        auto token = co_await registry->create_session(42);
        BOOST_TEST_REQUIRE(token.has_value());

        auto uid = co_await registry->resolve_session(*token);
        BOOST_TEST_REQUIRE(uid.has_value());
        BOOST_TEST(*uid == 42);

        auto removed = co_await registry->remove_session(*token);
        BOOST_TEST(removed.has_value());

        uid = co_await registry->resolve_session(*token);
        BOOST_TEST(uid.error().ec == error_code(errc::requires_auth));
    });
}

BOOST_FIXTURE_TEST_CASE(sessions_are_independent, fixture)
{
    run_coroutine([this]() -> asio::awaitable<void> {
        auto token1 = co_await registry->create_session(1);
        auto token2 = co_await registry->create_session(1);
        auto token3 = co_await registry->create_session(2);
        BOOST_TEST_REQUIRE(token1.has_value());
        BOOST_TEST_REQUIRE(token2.has_value());
        BOOST_TEST_REQUIRE(token3.has_value());
        BOOST_TEST(*token1 != *token2);

        // Logging out from a session doesn't affect others
        co_await registry->remove_session(*token1);
        auto uid = co_await registry->resolve_session(*token2);
        BOOST_TEST(uid.value() == 1);
        uid = co_await registry->resolve_session(*token3);
        BOOST_TEST(uid.value() == 2);
    });
}

BOOST_FIXTURE_TEST_CASE(unknown_token, fixture)
{
    run_coroutine([this]() -> asio::awaitable<void> {
        auto uid = co_await registry->resolve_session("0123456789abcdef0123456789abcdef");
        BOOST_TEST(uid.error().ec == error_code(errc::requires_auth));

        uid = co_await registry->resolve_session("");
        BOOST_TEST(uid.error().ec == error_code(errc::requires_auth));

        // Removing an unknown session is not an error
        auto removed = co_await registry->remove_session("bad");
        BOOST_TEST(removed.has_value());
    });
}

BOOST_FIXTURE_TEST_CASE(idle_expiration, fixture)
{
    run_coroutine([this]() -> asio::awaitable<void> {
        auto token = co_await registry->create_session(42);
        BOOST_TEST_REQUIRE(token.has_value());

        // Using the session extends its lifetime
        now += 50s;
        auto uid = co_await registry->resolve_session(*token);
        BOOST_TEST(uid.value() == 42);
        now += 50s;
        uid = co_await registry->resolve_session(*token);
        BOOST_TEST(uid.value() == 42);

        // Not using it makes it expire
        now += 60s;
        uid = co_await registry->resolve_session(*token);
        BOOST_TEST(uid.error().ec == error_code(errc::requires_auth));
    });
}

BOOST_FIXTURE_TEST_CASE(expired_sessions_are_purged, fixture)
{
    run_coroutine([this]() -> asio::awaitable<void> {
        auto old_token = co_await registry->create_session(1);
        BOOST_TEST_REQUIRE(old_token.has_value());

        // Creating a session after the old one expired removes it
        now += 2min;
        auto new_token = co_await registry->create_session(2);
        BOOST_TEST_REQUIRE(new_token.has_value());

        // Going back in time doesn't resurrect it
        now -= 2min;
        auto uid = co_await registry->resolve_session(*old_token);
        BOOST_TEST(uid.error().ec == error_code(errc::requires_auth));
    });
}

BOOST_AUTO_TEST_SUITE_END()
