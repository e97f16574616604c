//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "api/api_types.hpp"

#include <boost/json/parse.hpp>
#include <boost/json/value.hpp>
#include <boost/test/tools/interface.hpp>
#include <boost/test/unit_test.hpp>
#include <boost/variant2/variant.hpp>

#include <optional>
#include <string_view>
#include <vector>

#include "business_types.hpp"
#include "error.hpp"
#include "test_utils.hpp"
#include "timestamp.hpp"

using namespace msghub;
using msghub::test::make_payload;

BOOST_AUTO_TEST_SUITE(api_types)

//
// Incoming types
//

// send_message_request
BOOST_AUTO_TEST_CASE(send_message_request_from_json_user)
{
    // Data
    const char* from = R"%({
        "target": {"User": {"uid": 2}},
        "msg": "hello"
    })%";

    // Call the function
    auto result = send_message_request::from_json(from);

    // Validate
    BOOST_TEST_REQUIRE(result.error() == error_code());
    BOOST_TEST(boost::variant2::get<user_target>(result->target).uid == 2);
    BOOST_TEST(result->msg == "hello");
}

BOOST_AUTO_TEST_CASE(send_message_request_from_json_group)
{
    auto result = send_message_request::from_json(R"%({"target":{"Group":{"gid":10}},"msg":""})%");

    BOOST_TEST_REQUIRE(result.error() == error_code());
    BOOST_TEST(boost::variant2::get<group_target>(result->target).gid == 10);
    BOOST_TEST(result->msg == "");
}

BOOST_AUTO_TEST_CASE(send_message_request_from_json_error)
{
    constexpr std::string_view inputs[] = {
        "",
        "{}",
        R"%({"target":{"User":{"uid":2}}})%",
        R"%({"msg":"hello"})%",
        R"%({"target":{"User":{"uid":2}},"msg":10})%",
        R"%({"target":{"Someone":{"uid":2}},"msg":"hello"})%",
        R"%({"target":{"User":{"uid":"2"}},"msg":"hello"})%",
        R"%([1, 2])%",
    };

    for (auto input : inputs)
    {
        BOOST_TEST_CONTEXT(input)
        {
            auto result = send_message_request::from_json(input);
            BOOST_TEST(result.has_error());
        }
    }
}

// batch_messages_request
BOOST_AUTO_TEST_CASE(batch_messages_request_from_json)
{
    auto result = batch_messages_request::from_json(R"%({"mids": [3, 1, 2]})%");

    BOOST_TEST_REQUIRE(result.error() == error_code());
    BOOST_TEST(result->mids == (std::vector<std::int64_t>{3, 1, 2}));
}

BOOST_AUTO_TEST_CASE(batch_messages_request_from_json_error)
{
    BOOST_TEST(batch_messages_request::from_json(R"%({"mids": ["a"]})%").has_error());
    BOOST_TEST(batch_messages_request::from_json(R"%({"ids": [1]})%").has_error());
    BOOST_TEST(batch_messages_request::from_json(R"%({"mids": 1})%").has_error());
}

// read_index_request
BOOST_AUTO_TEST_CASE(read_index_request_from_json_user)
{
    auto result = read_index_request::from_json(R"%({"User": {"target_uid": 2, "mid": 50}})%");

    BOOST_TEST_REQUIRE(result.error() == error_code());
    const auto& update = boost::variant2::get<user_read_update>(result->update);
    BOOST_TEST(update.target_uid == 2);
    BOOST_TEST(update.mid == 50);
}

BOOST_AUTO_TEST_CASE(read_index_request_from_json_group)
{
    auto result = read_index_request::from_json(R"%({"Group": {"target_gid": 7, "mid": 51}})%");

    BOOST_TEST_REQUIRE(result.error() == error_code());
    const auto& update = boost::variant2::get<group_read_update>(result->update);
    BOOST_TEST(update.target_gid == 7);
    BOOST_TEST(update.mid == 51);
}

BOOST_AUTO_TEST_CASE(read_index_request_from_json_error)
{
    constexpr std::string_view inputs[] = {
        "{}",
        R"%({"User": {"target_gid": 2, "mid": 50}})%",
        R"%({"User": {"target_uid": 2}})%",
        R"%({"Channel": {"target_uid": 2, "mid": 50}})%",
        R"%({"User": {"target_uid": 2, "mid": 50}, "Group": {"target_gid": 7, "mid": 51}})%",
    };

    for (auto input : inputs)
    {
        BOOST_TEST_CONTEXT(input) { BOOST_TEST(read_index_request::from_json(input).has_error()); }
    }
}

//
// Outgoing types
//

// api_error
BOOST_AUTO_TEST_CASE(api_error_to_json)
{
    // Data
    api_error err{api_error_id::blank_message, "msg is blank"};

    // Call the function
    auto serialized = err.to_json();

    // Validate
    const char* expected = R"%({
        "id": "BLANK_MESSAGE",
        "message": "msg is blank"
    })%";
    BOOST_TEST(boost::json::parse(serialized) == boost::json::parse(expected));
}

BOOST_AUTO_TEST_CASE(api_error_to_json_ids)
{
    struct
    {
        api_error_id input;
        std::string_view expected;
    } test_cases[] = {
        {api_error_id::bad_request,   "BAD_REQUEST"  },
        {api_error_id::blank_message, "BLANK_MESSAGE"},
        {api_error_id::unauthorized,  "UNAUTHORIZED" },
        {api_error_id::not_a_member,  "NOT_A_MEMBER" },
        {api_error_id::forbidden,     "FORBIDDEN"    },
    };

    for (const auto& tc : test_cases)
    {
        BOOST_TEST_CONTEXT(tc.expected)
        {
            auto serialized = boost::json::parse(api_error{tc.input, "msg"}.to_json());
            BOOST_TEST(serialized.at("id").as_string() == tc.expected);
        }
    }
}

// send_message_response
BOOST_AUTO_TEST_CASE(send_message_response_to_json)
{
    BOOST_TEST(boost::json::parse(send_message_response{42}.to_json()) == boost::json::parse(R"%({"mid":42})%"));
}

// messages_response
BOOST_AUTO_TEST_CASE(messages_response_to_json)
{
    // Data
    std::vector<chat_message> msgs{
        {10, make_payload(1, user_target{2}, "hello")},
        {11, make_payload(2, group_target{5}, "bye")},
    };

    // Call the function
    auto serialized = messages_response{msgs}.to_json();

    // Validate
    const char* expected = R"%([
        {
            "mid": 10,
            "payload": {
                "from_uid": 1,
                "created_at": "2024-09-17 20:00:00",
                "target": {"User": {"uid": 2}},
                "detail": {"Normal": {"content": {"content": "hello"}}}
            }
        },
        {
            "mid": 11,
            "payload": {
                "from_uid": 2,
                "created_at": "2024-09-17 20:00:00",
                "target": {"Group": {"gid": 5}},
                "detail": {"Normal": {"content": {"content": "bye"}}}
            }
        }
    ])%";
    BOOST_TEST(boost::json::parse(serialized) == boost::json::parse(expected));
}

BOOST_AUTO_TEST_CASE(messages_response_to_json_empty)
{
    BOOST_TEST(messages_response{}.to_json() == "[]");
}

// chat_list_response
BOOST_AUTO_TEST_CASE(chat_list_response_to_json)
{
    // Data
    std::vector<chat_list_entry> entries{
        {
         read_index{1, {}, 10, {}, 30, 3},
         chat_message{30, make_payload(3, group_target{10}, "group msg")},
         unread(unread_all{}),
         },
        {
         read_index{1, 2, {}, 20, 25, 2},
         std::nullopt,
         unread(std::size_t(4)),
         },
        {
         read_index{1, 5, {}, 8, 8, 1},
         std::nullopt,
         std::nullopt,
         },
    };

    // Call the function
    auto serialized = chat_list_response{entries}.to_json();

    // Validate
    const char* expected = R"%([
        {
            "uid": 1,
            "target_uid": null,
            "target_gid": 10,
            "mid": null,
            "latest_mid": 30,
            "uid_of_latest_msg": 3,
            "latest_msg": {
                "mid": 30,
                "payload": {
                    "from_uid": 3,
                    "created_at": "2024-09-17 20:00:00",
                    "target": {"Group": {"gid": 10}},
                    "detail": {"Normal": {"content": {"content": "group msg"}}}
                }
            },
            "unread": "all"
        },
        {
            "uid": 1,
            "target_uid": 2,
            "target_gid": null,
            "mid": 20,
            "latest_mid": 25,
            "uid_of_latest_msg": 2,
            "latest_msg": null,
            "unread": "4"
        },
        {
            "uid": 1,
            "target_uid": 5,
            "target_gid": null,
            "mid": 8,
            "latest_mid": 8,
            "uid_of_latest_msg": 1,
            "latest_msg": null,
            "unread": null
        }
    ])%";
    BOOST_TEST(boost::json::parse(serialized) == boost::json::parse(expected));
}

// Event stream frames
BOOST_AUTO_TEST_CASE(chat_message_frame_to_json)
{
    chat_message msg{12, make_payload(1, user_target{2}, "hi")};

    auto serialized = chat_message_frame{msg}.to_json();

    const char* expected = R"%({
        "ChatMessage": {
            "mid": 12,
            "payload": {
                "from_uid": 1,
                "created_at": "2024-09-17 20:00:00",
                "target": {"User": {"uid": 2}},
                "detail": {"Normal": {"content": {"content": "hi"}}}
            }
        }
    })%";
    BOOST_TEST(boost::json::parse(serialized) == boost::json::parse(expected));
    BOOST_TEST(chat_message_frame::event_name == "ChatMessage");
}

BOOST_AUTO_TEST_CASE(heartbeat_frame_to_json)
{
    auto ts = parse_timestamp("2024-09-17 20:01:02").value();

    auto serialized = heartbeat_frame{ts}.to_json();

    BOOST_TEST(serialized == R"%({"Heartbeat":{"time":"2024-09-17 20:01:02"}})%");
    BOOST_TEST(heartbeat_frame::event_name == "Heartbeat");
}

BOOST_AUTO_TEST_SUITE_END()
