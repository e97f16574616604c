//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef MSGHUB_SERVER_INCLUDE_SERVICES_BROADCAST_HUB_HPP
#define MSGHUB_SERVER_INCLUDE_SERVICES_BROADCAST_HUB_HPP

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

#include "business_types.hpp"
#include "error.hpp"

// An in-memory, bounded, single-channel publish-subscribe mechanism.
// Used to push newly created messages to connected event streams.
// Delivery is at-most-once: subscribers only see events published after
// they subscribed, and slow subscribers may miss events.
// Not thread-safe: the hub and its subscriptions must be used from
// the executor passed to create_broadcast_hub.

namespace msghub {

// An event, as published to the hub
struct broadcast_event
{
    // Users that should see this message. Sorted, no duplicates
    std::vector<std::int64_t> recipients;

    // The message. Shared between all subscribers
    std::shared_ptr<const chat_message> message;

    // Is user_id in the recipient set?
    bool is_recipient(std::int64_t user_id) const noexcept
    {
        return std::binary_search(recipients.begin(), recipients.end(), user_id);
    }
};

// Computes a sorted, unique recipient set from an arbitrary list of users
std::vector<std::int64_t> make_recipients(std::vector<std::int64_t> users);

// A cursor into the hub's event sequence. Destroying it unsubscribes.
class subscription
{
public:
    virtual ~subscription() {}

    // Waits for the next event. Returns:
    //   - the next event, if there is one.
    //   - errc::subscriber_lagged if some events were evicted before this
    //     subscriber could see them. The next call resumes from the
    //     oldest retained event.
    //   - errc::hub_closed if the hub was closed and all retained events
    //     were already received.
    // If the operation is cancelled, no event is lost.
    virtual boost::asio::awaitable<result<std::shared_ptr<const broadcast_event>>> receive() = 0;
};

// This is an interface to reduce compile times.
class broadcast_hub
{
public:
    virtual ~broadcast_hub() {}

    // Publishes an event. Never blocks. Returns the number of subscribers
    // that will see the event. If there are no subscribers, the event is dropped.
    // If the buffer is full, the oldest event is evicted.
    virtual std::size_t publish(broadcast_event evt) = 0;

    // Creates a subscription that will see events published after this call.
    // The hub must outlive all its subscriptions.
    virtual std::unique_ptr<subscription> subscribe() = 0;

    // Closes the hub, waking all subscribers. Further publishes are dropped.
    virtual void close() = 0;

    // The number of events the hub can buffer
    virtual std::size_t capacity() const noexcept = 0;
};

// The default capacity
inline constexpr std::size_t default_hub_capacity = 128u;

// Creates a concrete broadcast_hub. capacity must be > 0
std::unique_ptr<broadcast_hub> create_broadcast_hub(
    boost::asio::any_io_executor ex,
    std::size_t capacity = default_hub_capacity
);

}  // namespace msghub

#endif
