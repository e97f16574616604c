//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "services/broadcast_hub.hpp"

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/experimental/channel.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/multi_index/indexed_by.hpp>
#include <boost/multi_index/member.hpp>
#include <boost/multi_index/ordered_index.hpp>
#include <boost/multi_index_container.hpp>

#include <algorithm>
#include <cstdint>
#include <deque>
#include <memory>
#include <stdexcept>
#include <utility>
#include <vector>

#include "error.hpp"

using namespace msghub;
namespace asio = boost::asio;

namespace {

class broadcast_hub_impl;

class subscription_impl final : public subscription
{
    broadcast_hub_impl* hub_;

    // Acts as a condition variable, so the hub can wake us up when
    // an event is published or the hub is closed
    asio::experimental::channel<void(error_code)> chan_;

public:
    subscription_impl(broadcast_hub_impl& hub, asio::any_io_executor ex) : hub_(&hub), chan_(std::move(ex), 1) {}
    subscription_impl(const subscription_impl&) = delete;
    subscription_impl& operator=(const subscription_impl&) = delete;
    ~subscription_impl();

    // Wakes up a pending receive(), if any. If nobody is waiting,
    // the notification is kept until the next receive().
    void notify() noexcept { chan_.try_send(error_code()); }

    asio::awaitable<result<std::shared_ptr<const broadcast_event>>> receive() override final;
};

class broadcast_hub_impl final : public broadcast_hub
{
    // An event in the buffer, with its position in the global event sequence
    struct entry
    {
        std::uint64_t seq;
        std::shared_ptr<const broadcast_event> evt;
    };

    // The type of elements held by our subscriber container
    struct subscriber_entry
    {
        subscription_impl* sub;

        // Sequence number of the next event this subscriber will receive
        std::uint64_t cursor;
    };

    // We need to look up subscribers by identity (to update or remove them),
    // and to efficiently find the slowest one (to discard events everyone has seen).
    // clang-format off
    using container_type = boost::multi_index::multi_index_container<
        subscriber_entry,
        boost::multi_index::indexed_by<
            // Index by subscriber identity (comparing pointers)
            boost::multi_index::ordered_unique<
                boost::multi_index::member<subscriber_entry, subscription_impl*, &subscriber_entry::sub>
            >,
            // Index by cursor
            boost::multi_index::ordered_non_unique<
                boost::multi_index::member<subscriber_entry, std::uint64_t, &subscriber_entry::cursor>
            >
        >
    >;
    // clang-format on

    asio::any_io_executor ex_;
    std::size_t capacity_;
    std::deque<entry> buffer_;
    std::uint64_t next_seq_{0};
    bool closed_{false};
    container_type subscribers_;

    std::uint64_t oldest_seq() const noexcept { return next_seq_ - buffer_.size(); }

    // Discards events that all subscribers have already received
    void trim()
    {
        if (subscribers_.empty())
        {
            buffer_.clear();
            return;
        }
        auto min_cursor = subscribers_.get<1>().begin()->cursor;
        while (!buffer_.empty() && buffer_.front().seq < min_cursor)
            buffer_.pop_front();
    }

    void set_cursor(container_type::iterator it, std::uint64_t value)
    {
        subscribers_.modify(it, [value](subscriber_entry& e) { e.cursor = value; });
    }

public:
    broadcast_hub_impl(asio::any_io_executor ex, std::size_t capacity) : ex_(std::move(ex)), capacity_(capacity)
    {
        if (capacity_ == 0u)
            throw std::invalid_argument("broadcast_hub: capacity must be greater than zero");
    }

    std::size_t publish(broadcast_event evt) override final
    {
        // Nobody would ever see this event
        if (closed_ || subscribers_.empty())
            return 0u;

        // Add it to the buffer, evicting the oldest event if required.
        // Subscribers that didn't see the evicted event will get a lag error
        buffer_.push_back(entry{next_seq_++, std::make_shared<const broadcast_event>(std::move(evt))});
        if (buffer_.size() > capacity_)
            buffer_.pop_front();

        // Wake up everyone
        for (const auto& sub : subscribers_)
            sub.sub->notify();

        return subscribers_.size();
    }

    std::unique_ptr<subscription> subscribe() override final
    {
        std::unique_ptr<subscription_impl> res{new subscription_impl(*this, ex_)};
        subscribers_.insert(subscriber_entry{res.get(), next_seq_});
        if (closed_)
            res->notify();
        return res;
    }

    void close() override final
    {
        closed_ = true;
        for (const auto& sub : subscribers_)
            sub.sub->notify();
    }

    std::size_t capacity() const noexcept override final { return capacity_; }

    void unsubscribe(subscription_impl& sub)
    {
        subscribers_.erase(&sub);
        trim();
    }

    // Attempts to get an event for sub without suspending. Returns a null
    // pointer if there is nothing to receive yet.
    result<std::shared_ptr<const broadcast_event>> try_receive(subscription_impl& sub)
    {
        auto it = subscribers_.find(&sub);
        if (it == subscribers_.end())
            MSGHUB_RETURN_ERROR(errc::hub_closed)
        auto cursor = it->cursor;

        // Events this subscriber hasn't seen were evicted. Skip to the oldest one we have
        if (cursor < oldest_seq())
        {
            set_cursor(it, oldest_seq());
            MSGHUB_RETURN_ERROR(errc::subscriber_lagged)
        }

        // There is an event for us
        if (cursor < next_seq_)
        {
            auto evt = buffer_[cursor - oldest_seq()].evt;
            set_cursor(it, cursor + 1u);
            trim();
            return evt;
        }

        // Nothing left
        if (closed_)
            MSGHUB_RETURN_ERROR(errc::hub_closed)
        return std::shared_ptr<const broadcast_event>();
    }
};

subscription_impl::~subscription_impl() { hub_->unsubscribe(*this); }

asio::awaitable<result<std::shared_ptr<const broadcast_event>>> subscription_impl::receive()
{
    while (true)
    {
        // The cursor is only updated here, synchronously. If we get cancelled
        // while waiting below, no event is lost
        auto res = hub_->try_receive(*this);
        if (res.has_error() || *res)
            co_return res;

        // Wait to be notified
        error_code ec;
        co_await chan_.async_receive(asio::redirect_error(asio::use_awaitable, ec));
        if (ec)
            co_return ec;
    }
}

}  // namespace

std::vector<std::int64_t> msghub::make_recipients(std::vector<std::int64_t> users)
{
    std::sort(users.begin(), users.end());
    users.erase(std::unique(users.begin(), users.end()), users.end());
    return users;
}

std::unique_ptr<broadcast_hub> msghub::create_broadcast_hub(asio::any_io_executor ex, std::size_t capacity)
{
    return std::unique_ptr<broadcast_hub>{new broadcast_hub_impl(std::move(ex), capacity)};
}
