//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "services/message_store.hpp"

#include <boost/test/unit_test.hpp>

#include <cstdint>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "business_types.hpp"
#include "error.hpp"
#include "test_utils.hpp"

using namespace msghub;
using msghub::test::temp_store;

namespace {

// Extracts IDs and payloads, to simplify comparisons
std::vector<std::int64_t> get_mids(const std::vector<stored_message>& msgs)
{
    std::vector<std::int64_t> res;
    for (const auto& msg : msgs)
        res.push_back(msg.mid);
    return res;
}

std::vector<std::string> get_payloads(const std::vector<stored_message>& msgs)
{
    std::vector<std::string> res;
    for (const auto& msg : msgs)
        res.push_back(msg.payload);
    return res;
}

using mid_vector = std::vector<std::int64_t>;
using string_vector = std::vector<std::string>;

}  // namespace

BOOST_AUTO_TEST_SUITE(message_store_)

BOOST_AUTO_TEST_CASE(partition_keys)
{
    BOOST_TEST(dm_partition_key(1, 2) == dm_partition_key(2, 1));
    BOOST_TEST(dm_partition_key(1, 2) != dm_partition_key(1, 3));
    BOOST_TEST(dm_partition_key(1, 2) != group_partition_key(1));
    BOOST_TEST(group_partition_key(5) != group_partition_key(6));
}

BOOST_AUTO_TEST_CASE(ids_increase_across_partitions)
{
    temp_store store;
    const std::int64_t members[] = {1, 2, 3};

    auto id1 = store->send_to_dm(1, 2, "a");
    auto id2 = store->send_to_group(10, members, "b");
    auto id3 = store->send_to_dm(3, 4, "c");
    auto id4 = store->send_to_dm(2, 1, "d");

    BOOST_TEST_REQUIRE(id1.has_value());
    BOOST_TEST_REQUIRE(id2.has_value());
    BOOST_TEST_REQUIRE(id3.has_value());
    BOOST_TEST_REQUIRE(id4.has_value());
    BOOST_TEST(*id1 < *id2);
    BOOST_TEST(*id2 < *id3);
    BOOST_TEST(*id3 < *id4);
}

BOOST_AUTO_TEST_CASE(dm_symmetry)
{
    temp_store store;
    auto id1 = store->send_to_dm(1, 2, "hello").value();
    auto id2 = store->send_to_dm(2, 1, "hi back").value();

    auto from_1 = store->fetch_dm_messages_before(1, 2, std::nullopt, 10).value();
    auto from_2 = store->fetch_dm_messages_before(2, 1, std::nullopt, 10).value();

    // Newest first
    BOOST_TEST(get_mids(from_1) == (mid_vector{id2, id1}));
    BOOST_TEST(get_payloads(from_1) == (string_vector{"hi back", "hello"}));
    BOOST_TEST(get_mids(from_2) == get_mids(from_1));
}

BOOST_AUTO_TEST_CASE(partition_isolation)
{
    temp_store store;
    const std::int64_t members[] = {1, 2};

    auto dm12 = store->send_to_dm(1, 2, "dm 1-2").value();
    auto dm13 = store->send_to_dm(1, 3, "dm 1-3").value();
    auto g10 = store->send_to_group(10, members, "group 10").value();
    auto g11 = store->send_to_group(11, members, "group 11").value();

    BOOST_TEST(get_mids(store->fetch_dm_messages_before(1, 2, std::nullopt, 10).value()) == mid_vector{dm12});
    BOOST_TEST(get_mids(store->fetch_dm_messages_before(3, 1, std::nullopt, 10).value()) == mid_vector{dm13});
    BOOST_TEST(get_mids(store->fetch_group_messages_before(10, std::nullopt, 10).value()) == mid_vector{g10});
    BOOST_TEST(get_mids(store->fetch_group_messages_before(11, std::nullopt, 10).value()) == mid_vector{g11});

    // A DM between users 2 and 3 doesn't exist
    BOOST_TEST(store->fetch_dm_messages_before(2, 3, std::nullopt, 10).value().empty());

    // Group 10 is not confused with a DM involving user 10
    BOOST_TEST(store->fetch_dm_messages_before(1, 10, std::nullopt, 10).value().empty());
}

BOOST_AUTO_TEST_CASE(pagination)
{
    temp_store store;
    mid_vector all;
    for (int i = 0; i < 7; ++i)
        all.push_back(store->send_to_dm(1, 2, "msg " + std::to_string(i)).value());

    // Walk the history backwards, 3 at a time
    mid_vector walked;
    std::optional<std::int64_t> before;
    while (true)
    {
        auto page = store->fetch_dm_messages_before(1, 2, before, 3).value();
        BOOST_TEST(page.size() <= 3u);
        if (page.empty())
            break;
        for (const auto& msg : page)
            walked.push_back(msg.mid);
        before = page.back().mid;
    }

    mid_vector expected(all.rbegin(), all.rend());
    BOOST_TEST(walked == expected);
}

BOOST_AUTO_TEST_CASE(fetch_before_id)
{
    temp_store store;
    auto id1 = store->send_to_dm(1, 2, "1").value();
    auto id2 = store->send_to_dm(1, 2, "2").value();
    auto id3 = store->send_to_dm(1, 2, "3").value();

    // The ID itself is excluded
    BOOST_TEST(get_mids(store->fetch_dm_messages_before(1, 2, id3, 10).value()) == (mid_vector{id2, id1}));
    BOOST_TEST(get_mids(store->fetch_dm_messages_before(1, 2, id1, 10).value()) == mid_vector{});

    // Limits
    BOOST_TEST(get_mids(store->fetch_dm_messages_before(1, 2, std::nullopt, 1).value()) == mid_vector{id3});
    BOOST_TEST(store->fetch_dm_messages_before(1, 2, std::nullopt, 0).value().empty());
    BOOST_TEST(
        store->fetch_dm_messages_before(1, 2, std::nullopt, std::numeric_limits<std::size_t>::max()).value().size() ==
        3u
    );
}

BOOST_AUTO_TEST_CASE(user_feed)
{
    temp_store store;
    const std::int64_t members[] = {1, 3, 4};

    auto id1 = store->send_to_dm(1, 2, "to 2").value();
    auto id2 = store->send_to_group(10, members, "group").value();
    auto id3 = store->send_to_dm(3, 1, "from 3").value();
    store->send_to_dm(2, 3, "not involving 1").value();

    // Oldest first
    BOOST_TEST(get_mids(store->fetch_user_messages_after(1, std::nullopt, 10).value()) == (mid_vector{id1, id2, id3}));
    BOOST_TEST(get_mids(store->fetch_user_messages_after(1, id1, 10).value()) == (mid_vector{id2, id3}));
    BOOST_TEST(get_mids(store->fetch_user_messages_after(1, id1, 1).value()) == mid_vector{id2});
    BOOST_TEST(get_mids(store->fetch_user_messages_after(1, id3, 10).value()) == mid_vector{});

    // User 2 was only involved in direct messages
    BOOST_TEST(store->fetch_user_messages_after(2, std::nullopt, 10).value().size() == 2u);
}

BOOST_AUTO_TEST_CASE(duplicate_group_members)
{
    temp_store store;
    const std::int64_t members[] = {1, 2, 2, 1};

    auto id = store->send_to_group(10, members, "group").value();
    BOOST_TEST(get_mids(store->fetch_user_messages_after(2, std::nullopt, 10).value()) == mid_vector{id});
}

BOOST_AUTO_TEST_CASE(get)
{
    temp_store store;
    auto id = store->send_to_dm(1, 2, "some payload").value();

    auto found = store->get(id);
    BOOST_TEST_REQUIRE(found.has_value());
    BOOST_TEST_REQUIRE(found->has_value());
    BOOST_TEST(**found == "some payload");

    auto missing = store->get(id + 100);
    BOOST_TEST_REQUIRE(missing.has_value());
    BOOST_TEST(!missing->has_value());
}

BOOST_AUTO_TEST_CASE(count_after)
{
    temp_store store;
    const std::int64_t members[] = {1, 2};

    auto id1 = store->send_to_dm(1, 2, "1").value();
    store->send_to_dm(2, 1, "2").value();
    store->send_to_dm(1, 2, "3").value();
    auto gid1 = store->send_to_group(10, members, "g1").value();
    store->send_to_group(10, members, "g2").value();

    BOOST_TEST(store->count_dm_messages_after(1, 2, id1).value() == 2u);
    BOOST_TEST(store->count_dm_messages_after(2, 1, id1).value() == 2u);
    BOOST_TEST(store->count_dm_messages_after(1, 2, 0).value() == 3u);
    BOOST_TEST(store->count_group_messages_after(10, gid1).value() == 1u);

    // Unknown conversations
    BOOST_TEST(store->count_dm_messages_after(5, 6, 0).value() == 0u);
    BOOST_TEST(store->count_group_messages_after(99, 0).value() == 0u);
}

BOOST_AUTO_TEST_CASE(binary_payloads)
{
    temp_store store;
    const std::string payload("a\0b\xff", 4);

    auto id = store->send_to_dm(1, 2, payload).value();
    BOOST_TEST(store->get(id).value().value() == payload);
}

BOOST_AUTO_TEST_CASE(persistence)
{
    temp_store store;
    auto id1 = store->send_to_dm(1, 2, "before restart").value();

    store.reopen();

    BOOST_TEST(store->get(id1).value().value() == "before restart");

    // IDs are never reused
    auto id2 = store->send_to_dm(1, 2, "after restart").value();
    BOOST_TEST(id2 > id1);
}

BOOST_AUTO_TEST_CASE(open_error)
{
    BOOST_CHECK_THROW(create_message_store("/nonexistent-dir/msghub/test.db"), std::exception);
}

BOOST_AUTO_TEST_SUITE_END()
