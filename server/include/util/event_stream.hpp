//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef MSGHUB_SERVER_INCLUDE_UTIL_EVENT_STREAM_HPP
#define MSGHUB_SERVER_INCLUDE_UTIL_EVENT_STREAM_HPP

#include <boost/asio/awaitable.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/system/error_code.hpp>

#include <chrono>
#include <memory>
#include <string>
#include <string_view>

// Server-sent events (text/event-stream) support.

namespace msghub {

// Something we can push named events to. Using an interface
// so the delivery loop can be tested without sockets
class event_sink
{
public:
    virtual ~event_sink() {}

    // Writes a single event. Only one write should be outstanding at each time
    virtual boost::asio::awaitable<boost::system::error_code> write_event(
        std::string_view event_name,
        std::string_view data
    ) = 0;
};

// Formats an event as a SSE frame. data may contain newlines,
// in which case it's split into several data: fields
std::string format_sse_frame(std::string_view event_name, std::string_view data);

// An event stream over a HTTP connection.
// Keeps Beast instantiations in a separate .cpp file to reduce build times.
class sse_stream final : public event_sink
{
    // pimpl idiom, to avoid including heavyweight Beast headers
    struct impl;
    std::unique_ptr<impl> impl_;

public:
    // http_version is the one in the client's request (10 or 11)
    sse_stream(boost::asio::ip::tcp::socket sock, unsigned http_version, std::chrono::seconds write_timeout);
    sse_stream(const sse_stream&) = delete;
    sse_stream(sse_stream&&) noexcept;
    sse_stream& operator=(const sse_stream&) = delete;
    sse_stream& operator=(sse_stream&&) noexcept;
    ~sse_stream();

    // Writes the response head. Must be called before any other operation
    boost::asio::awaitable<boost::system::error_code> start();

    boost::asio::awaitable<boost::system::error_code> write_event(
        std::string_view event_name,
        std::string_view data
    ) override;

    // Shuts down the connection. Errors are ignored
    void close() noexcept;
};

}  // namespace msghub

#endif
