//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef MSGHUB_SERVER_INCLUDE_REQUEST_CONTEXT_HPP
#define MSGHUB_SERVER_INCLUDE_REQUEST_CONTEXT_HPP

#include <boost/beast/http/field.hpp>
#include <boost/beast/http/fields.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/message_generator.hpp>
#include <boost/beast/http/status.hpp>
#include <boost/beast/http/string_body.hpp>
#include <boost/beast/http/verb.hpp>
#include <boost/url/url_view.hpp>

#include <cassert>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

#include "api/api_types.hpp"
#include "error.hpp"

// Request access and response construction for API handlers.

namespace msghub {

// Builds responses that match the request's HTTP version and keep-alive setting.
// At most one response may be built per request.
class response_builder
{
public:
    // Type-erased, so handlers can return different body types
    using response_type = boost::beast::http::message_generator;

    // 200 with T::to_json() as the body
    template <class T>
    response_type json_response(const T& value)
    {
        return json_response_impl(value.to_json());
    }

    // 204
    response_type empty_response();

    response_type method_not_allowed()
    {
        return plaintext_response(boost::beast::http::status::method_not_allowed, "Method not allowed");
    }

    response_type bad_request_text(std::string why)
    {
        return plaintext_response(boost::beast::http::status::bad_request, std::move(why));
    }

    response_type not_found_text()
    {
        return plaintext_response(boost::beast::http::status::not_found, "Not found");
    }

    // An error with an api_error JSON body
    response_type json_error(
        boost::beast::http::status status,
        api_error_id error_id,
        std::string_view error_message
    );

    response_type bad_request_json(api_error_id error_id, std::string_view error_message)
    {
        return json_error(boost::beast::http::status::bad_request, error_id, error_message);
    }

    response_type bad_request_json(std::string_view error_message)
    {
        return bad_request_json(api_error_id::bad_request, error_message);
    }

    // The token was missing or didn't resolve to a session
    response_type unauthorized()
    {
        return json_error(
            boost::beast::http::status::unauthorized,
            api_error_id::unauthorized,
            "Missing, invalid or expired token"
        );
    }

    // 500. Logs ec and what, which never reach the client
    response_type internal_server_error(error_code ec, std::string_view what);
    response_type internal_server_error(const error_with_message& err)
    {
        return internal_server_error(err.ec, err.msg);
    }

private:
    using header_type = boost::beast::http::response_header<boost::beast::http::fields>;

    bool keep_alive_;
    header_type header_;
    bool used_{};

    response_builder(unsigned version, bool keep_alive);
    void set_content_type(std::string_view value)
    {
        header_.set(boost::beast::http::field::content_type, value);
    }
    response_type plaintext_response(boost::beast::http::status status, std::string content);
    response_type json_response_impl(std::string serialized_json);

    header_type move_header()
    {
        assert(!used_);
        used_ = true;
        return std::move(header_);
    }

    template <class Body, class... Args>
    boost::beast::http::response<Body> build_response(Args&&... args)
    {
        boost::beast::http::response<Body> res{move_header(), std::forward<Args>(args)...};
        res.keep_alive(keep_alive_);
        return res;
    }

    friend class request_context;
};

// What an API handler sees of a request
class request_context
{
public:
    using request_type = boost::beast::http::request<boost::beast::http::string_body>;

    request_context(request_type&& req)
        : request_(std::move(req)), response_(request_.version(), request_.keep_alive())
    {
    }

    // Must succeed before any of the accessors below are used
    error_code parse_request_target();

    const boost::urls::url_view& request_target() const
    {
        assert(target_.has_value());
        return *target_;
    }

    boost::beast::http::verb request_method() const noexcept { return request_.method(); }

    // The HTTP version of the request, as 10 or 11
    unsigned http_version() const noexcept { return request_.version(); }

    // Percent-decoded
    std::optional<std::string> query_param(std::string_view name) const;

    // Returns the session token sent by the client. It can be sent in an
    // Authorization: Bearer header or in a token query parameter.
    // Clients that can't set headers (like EventSource) use the latter.
    // Returns an empty string if there is no token.
    std::string session_token() const;

    // Checks that the body is application/json and passes it to T::from_json
    template <class T>
    result<T> parse_json_body() const
    {
        if (!is_json_content_type())
            MSGHUB_RETURN_ERROR(errc::invalid_content_type)
        return T::from_json(request_.body());
    }

    response_builder& response() noexcept { return response_; }

private:
    request_type request_;
    response_builder response_;
    std::optional<boost::urls::url_view> target_;

    bool is_json_content_type() const;
};

}  // namespace msghub

#endif
