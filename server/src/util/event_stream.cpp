//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "util/event_stream.hpp"

#include <boost/asio/as_tuple.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/buffer.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http/empty_body.hpp>
#include <boost/beast/http/field.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/serializer.hpp>
#include <boost/beast/http/status.hpp>
#include <boost/beast/http/write.hpp>

#include <cassert>
#include <chrono>
#include <memory>
#include <string>
#include <string_view>

#include "error.hpp"

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = boost::beast::http;
using namespace msghub;

std::string msghub::format_sse_frame(std::string_view event_name, std::string_view data)
{
    std::string res;
    res.reserve(event_name.size() + data.size() + 16u);
    res += "event: ";
    res += event_name;
    res += '\n';

    // Each line in data becomes a data: field. The client joins them back with newlines
    while (true)
    {
        auto pos = data.find('\n');
        res += "data: ";
        res += data.substr(0, pos);
        res += '\n';
        if (pos == std::string_view::npos)
            break;
        data = data.substr(pos + 1);
    }

    // A blank line terminates the event
    res += '\n';
    return res;
}

struct sse_stream::impl
{
    beast::tcp_stream stream;
    unsigned http_version;
    std::chrono::seconds write_timeout;
    bool started{false};

    impl(asio::ip::tcp::socket&& sock, unsigned version, std::chrono::seconds timeout)
        : stream(std::move(sock)), http_version(version), write_timeout(timeout)
    {
    }
};

sse_stream::sse_stream(asio::ip::tcp::socket sock, unsigned http_version, std::chrono::seconds write_timeout)
    : impl_(new impl(std::move(sock), http_version, write_timeout))
{
}

sse_stream::sse_stream(sse_stream&& rhs) noexcept : impl_(std::move(rhs.impl_)) {}

sse_stream& sse_stream::operator=(sse_stream&& rhs) noexcept
{
    impl_ = std::move(rhs.impl_);
    return *this;
}

sse_stream::~sse_stream() {}

asio::awaitable<error_code> sse_stream::start()
{
    assert(!impl_->started);

    // The body has no length: it lasts until the connection is closed
    http::response<http::empty_body> res{http::status::ok, impl_->http_version};
    res.set(http::field::server, "beast");
    res.set(http::field::content_type, "text/event-stream");
    res.set(http::field::cache_control, "no-cache");
    res.keep_alive(false);

    http::response_serializer<http::empty_body> sr{res};
    impl_->stream.expires_after(impl_->write_timeout);
    auto [ec, bytes_written] = co_await http::async_write_header(impl_->stream, sr, asio::as_tuple(asio::use_awaitable));
    if (!ec)
        impl_->started = true;
    co_return ec;
}

asio::awaitable<error_code> sse_stream::write_event(std::string_view event_name, std::string_view data)
{
    assert(impl_->started);

    auto frame = format_sse_frame(event_name, data);

    // A client that doesn't read shouldn't hold the connection forever
    impl_->stream.expires_after(impl_->write_timeout);
    auto [ec, bytes_written] = co_await asio::async_write(
        impl_->stream,
        asio::buffer(frame),
        asio::as_tuple(asio::use_awaitable)
    );
    co_return ec;
}

void sse_stream::close() noexcept
{
    error_code ignored;
    impl_->stream.socket().shutdown(asio::ip::tcp::socket::shutdown_send, ignored);
}
