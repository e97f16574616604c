//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "api/event_stream.hpp"

#include <boost/asio/awaitable.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/json/parse.hpp>
#include <boost/json/value.hpp>
#include <boost/test/unit_test.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "business_types.hpp"
#include "error.hpp"
#include "services/broadcast_hub.hpp"
#include "test_utils.hpp"
#include "util/event_stream.hpp"

using namespace msghub;
using msghub::test::make_payload;
using msghub::test::run_coroutine;
namespace asio = boost::asio;

namespace {

// Records the events written to it
class recording_sink final : public event_sink
{
public:
    struct frame
    {
        std::string name;
        std::string data;
    };

    std::vector<frame> frames;

    // Returned by every write
    error_code write_result;

    // Invoked after each write
    std::function<void()> on_write;

    asio::awaitable<error_code> write_event(std::string_view event_name, std::string_view data) override
    {
        frames.push_back({std::string(event_name), std::string(data)});
        if (on_write)
            on_write();
        co_return write_result;
    }
};

broadcast_event make_event(std::int64_t mid, std::int64_t from, std::int64_t to)
{
    return broadcast_event{
        make_recipients({from, to}),
        std::make_shared<const chat_message>(chat_message{mid, make_payload(from, user_target{to}, "hello")}),
    };
}

// The mid carried by a ChatMessage frame
std::int64_t frame_mid(const recording_sink::frame& f)
{
    return boost::json::parse(f.data).at("ChatMessage").at("mid").as_int64();
}

// Never fires during a test
constexpr std::chrono::seconds long_interval{3600};

}  // namespace

BOOST_AUTO_TEST_SUITE(event_bridge)

BOOST_AUTO_TEST_CASE(delivers_messages_for_user)
{
    run_coroutine([]() -> asio::awaitable<void> {
        auto hub = create_broadcast_hub(co_await asio::this_coro::executor);
        auto sub = hub->subscribe();
        recording_sink sink;

        // Only events that include user 1 get through
        hub->publish(make_event(10, 1, 2));
        hub->publish(make_event(11, 3, 4));
        hub->publish(make_event(12, 5, 1));
        hub->close();

        auto ec = co_await run_event_bridge(sink, *sub, 1, long_interval);

        BOOST_TEST(ec == error_code());
        BOOST_TEST_REQUIRE(sink.frames.size() == 2u);
        BOOST_TEST(sink.frames[0].name == "ChatMessage");
        BOOST_TEST(frame_mid(sink.frames[0]) == 10);
        BOOST_TEST(sink.frames[1].name == "ChatMessage");
        BOOST_TEST(frame_mid(sink.frames[1]) == 12);
    });
}

BOOST_AUTO_TEST_CASE(frame_contents)
{
    run_coroutine([]() -> asio::awaitable<void> {
        auto hub = create_broadcast_hub(co_await asio::this_coro::executor);
        auto sub = hub->subscribe();
        recording_sink sink;

        hub->publish(make_event(10, 1, 2));
        hub->close();
        auto ec = co_await run_event_bridge(sink, *sub, 2, long_interval);

        BOOST_TEST(ec == error_code());
        BOOST_TEST_REQUIRE(sink.frames.size() == 1u);
        const char* expected = R"%({
            "ChatMessage": {
                "mid": 10,
                "payload": {
                    "from_uid": 1,
                    "created_at": "2024-09-17 20:00:00",
                    "target": {"User": {"uid": 2}},
                    "detail": {"Normal": {"content": {"content": "hello"}}}
                }
            }
        })%";
        BOOST_TEST(boost::json::parse(sink.frames[0].data) == boost::json::parse(expected));
    });
}

BOOST_AUTO_TEST_CASE(heartbeat)
{
    run_coroutine([]() -> asio::awaitable<void> {
        auto hub = create_broadcast_hub(co_await asio::this_coro::executor);
        auto sub = hub->subscribe();
        recording_sink sink;

        // Stop after the first heartbeat
        sink.on_write = [&hub] { hub->close(); };

        auto ec = co_await run_event_bridge(sink, *sub, 1, std::chrono::seconds(1));

        BOOST_TEST(ec == error_code());
        BOOST_TEST_REQUIRE(sink.frames.size() == 1u);
        BOOST_TEST(sink.frames[0].name == "Heartbeat");
        auto time = boost::json::parse(sink.frames[0].data).at("Heartbeat").at("time");
        BOOST_TEST(time.is_string());
    });
}

BOOST_AUTO_TEST_CASE(ends_when_hub_closed)
{
    run_coroutine([]() -> asio::awaitable<void> {
        auto hub = create_broadcast_hub(co_await asio::this_coro::executor);
        auto sub = hub->subscribe();
        recording_sink sink;
        hub->close();

        auto ec = co_await run_event_bridge(sink, *sub, 1, long_interval);

        BOOST_TEST(ec == error_code());
        BOOST_TEST(sink.frames.empty());
    });
}

// What happens at shutdown: the bridge is parked waiting for events
// and the hub gets closed from elsewhere
BOOST_AUTO_TEST_CASE(waiting_bridge_exits_when_hub_closed)
{
    run_coroutine([]() -> asio::awaitable<void> {
        auto ex = co_await asio::this_coro::executor;
        auto hub = create_broadcast_hub(ex);
        auto sub = hub->subscribe();
        recording_sink sink;

        asio::steady_timer timer(ex, std::chrono::milliseconds(10));
        timer.async_wait([&hub](error_code) { hub->close(); });

        auto ec = co_await run_event_bridge(sink, *sub, 1, long_interval);

        BOOST_TEST(ec == error_code());
        BOOST_TEST(sink.frames.empty());
    });
}

BOOST_AUTO_TEST_CASE(write_error)
{
    run_coroutine([]() -> asio::awaitable<void> {
        auto hub = create_broadcast_hub(co_await asio::this_coro::executor);
        auto sub = hub->subscribe();
        recording_sink sink;
        sink.write_result = asio::error::broken_pipe;

        // The second event is never written
        hub->publish(make_event(10, 1, 2));
        hub->publish(make_event(11, 1, 2));

        auto ec = co_await run_event_bridge(sink, *sub, 1, long_interval);

        BOOST_TEST(ec == error_code(asio::error::broken_pipe));
        BOOST_TEST(sink.frames.size() == 1u);
    });
}

BOOST_AUTO_TEST_CASE(continues_after_lag)
{
    run_coroutine([]() -> asio::awaitable<void> {
        auto hub = create_broadcast_hub(co_await asio::this_coro::executor, 2u);
        auto sub = hub->subscribe();
        recording_sink sink;

        // The first event is evicted before the bridge runs
        hub->publish(make_event(10, 1, 2));
        hub->publish(make_event(11, 1, 2));
        hub->publish(make_event(12, 1, 2));
        hub->close();

        auto ec = co_await run_event_bridge(sink, *sub, 1, long_interval);

        BOOST_TEST(ec == error_code());
        BOOST_TEST_REQUIRE(sink.frames.size() == 2u);
        BOOST_TEST(frame_mid(sink.frames[0]) == 11);
        BOOST_TEST(frame_mid(sink.frames[1]) == 12);
    });
}

BOOST_AUTO_TEST_SUITE_END()
