//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "services/message_codec.hpp"

#include <boost/json/parse.hpp>
#include <boost/json/serialize.hpp>
#include <boost/json/value.hpp>
#include <boost/test/unit_test.hpp>
#include <boost/variant2/variant.hpp>

#include <string_view>

#include "business_types.hpp"
#include "error.hpp"
#include "test_utils.hpp"
#include "timestamp.hpp"

using namespace msghub;
using msghub::test::make_payload;

BOOST_AUTO_TEST_SUITE(message_codec)

BOOST_AUTO_TEST_CASE(serialize_dm)
{
    auto payload = make_payload(1, user_target{2}, "hi");

    auto res = serialize_payload(payload);

    BOOST_TEST(
        res == R"%({"from_uid":1,"created_at":"2024-09-17 20:00:00","target":{"User":{"uid":2}},)%"
               R"%("detail":{"Normal":{"content":{"content":"hi"}}}})%"
    );
}

BOOST_AUTO_TEST_CASE(serialize_group_reply)
{
    auto payload = make_payload(3, group_target{10}, "");
    payload.detail = reply_detail{42, message_content{"I agree"}};

    auto res = serialize_payload(payload);

    BOOST_TEST(
        res == R"%({"from_uid":3,"created_at":"2024-09-17 20:00:00","target":{"Group":{"gid":10}},)%"
               R"%("detail":{"Reply":{"mid":42,"content":{"content":"I agree"}}}})%"
    );
}

BOOST_AUTO_TEST_CASE(parse_success)
{
    constexpr std::string_view input = R"%({
        "from_uid": 7,
        "created_at": "2024-09-17 20:01:02",
        "target": {"Group": {"gid": 5}},
        "detail": {"Reply": {"mid": 100, "content": {"content": "hello"}}}
    })%";

    auto res = parse_payload(input);

    BOOST_TEST_REQUIRE(res.has_value());
    BOOST_TEST(res->from_uid == 7);
    BOOST_TEST(format_timestamp(res->created_at) == "2024-09-17 20:01:02");
    const auto* target = boost::variant2::get_if<group_target>(&res->target);
    BOOST_TEST_REQUIRE(target != nullptr);
    BOOST_TEST(target->gid == 5);
    const auto* detail = boost::variant2::get_if<reply_detail>(&res->detail);
    BOOST_TEST_REQUIRE(detail != nullptr);
    BOOST_TEST(detail->mid == 100);
    BOOST_TEST(get_content(res->detail) == "hello");
}

BOOST_AUTO_TEST_CASE(parse_serialized)
{
    auto payload = make_payload(1, user_target{2}, "with \"quotes\" and\nnewlines");

    auto res = parse_payload(serialize_payload(payload));

    BOOST_TEST_REQUIRE(res.has_value());
    BOOST_TEST(res->from_uid == 1);
    BOOST_TEST((res->created_at == payload.created_at));
    BOOST_TEST(boost::variant2::get<user_target>(res->target).uid == 2);
    BOOST_TEST(get_content(res->detail) == "with \"quotes\" and\nnewlines");
}

BOOST_AUTO_TEST_CASE(parse_error)
{
    constexpr std::string_view inputs[] = {
        "",
        "not json",
        "[]",
        R"%({"from_uid":1,"created_at":"2024-09-17 20:01:02","target":{"User":{"uid":2}}})%",
        R"%({"from_uid":"1","created_at":"2024-09-17 20:01:02","target":{"User":{"uid":2}},"detail":{"Normal":{"content":{"content":"a"}}}})%",
        R"%({"from_uid":1,"created_at":"yesterday","target":{"User":{"uid":2}},"detail":{"Normal":{"content":{"content":"a"}}}})%",
        R"%({"from_uid":1,"created_at":"2024-09-17 20:01:02","target":{"Channel":{"uid":2}},"detail":{"Normal":{"content":{"content":"a"}}}})%",
        R"%({"from_uid":1,"created_at":"2024-09-17 20:01:02","target":{"User":{"uid":2},"Group":{"gid":1}},"detail":{"Normal":{"content":{"content":"a"}}}})%",
        R"%({"from_uid":1,"created_at":"2024-09-17 20:01:02","target":{"User":{"gid":2}},"detail":{"Normal":{"content":{"content":"a"}}}})%",
        R"%({"from_uid":1,"created_at":"2024-09-17 20:01:02","target":{"User":{"uid":2}},"detail":{"Reply":{"content":{"content":"a"}}}})%",
        R"%({"from_uid":1,"created_at":"2024-09-17 20:01:02","target":{"User":{"uid":2}},"detail":{"Normal":{"content":"a"}}})%",
    };

    for (auto input : inputs)
    {
        BOOST_TEST_CONTEXT(input)
        {
            auto res = parse_payload(input);
            BOOST_TEST(res.error() == error_code(errc::serialization_error));
        }
    }
}

BOOST_AUTO_TEST_CASE(targets)
{
    BOOST_TEST(boost::json::serialize(target_to_json(user_target{4})) == R"%({"User":{"uid":4}})%");
    BOOST_TEST(boost::json::serialize(target_to_json(group_target{8})) == R"%({"Group":{"gid":8}})%");

    auto res = target_from_json(boost::json::parse(R"%({"Group":{"gid":8}})%"));
    BOOST_TEST_REQUIRE(res.has_value());
    BOOST_TEST(boost::variant2::get<group_target>(*res).gid == 8);

    res = target_from_json(boost::json::parse(R"%({})%"));
    BOOST_TEST(res.error() == error_code(errc::serialization_error));
}

BOOST_AUTO_TEST_SUITE_END()
