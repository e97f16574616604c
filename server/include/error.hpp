//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef MSGHUB_SERVER_INCLUDE_ERROR_HPP
#define MSGHUB_SERVER_INCLUDE_ERROR_HPP

#include <boost/assert/source_location.hpp>
#include <boost/system/error_category.hpp>
#include <boost/system/error_code.hpp>
#include <boost/system/result.hpp>

#include <string>
#include <string_view>
#include <utility>

// Error management infrastructure. Uses Boost.System error codes and categories.
// This is consistent with Asio, Beast, MySQL and Redis.

namespace msghub {

using boost::system::error_code;
using boost::system::result;

// Error code enum for errors originated within our application
enum class errc
{
    store_io_error = 1,           // The embedded message store failed (disk full, corruption...)
    serialization_error,          // A message payload could not be encoded or decoded
    subscriber_lagged,            // A hub subscriber missed events because it was too slow
    hub_closed,                   // The broadcast hub was closed
    recipient_resolution_failed,  // Looking up the members of a group failed
    not_a_member,                 // Posting to a group the sender doesn't belong to
    forbidden,                    // The sender was muted in the group
    redis_parse_error,            // Data retrieved from Redis didn't match the format we expected
    redis_command_failed,         // A Redis command failed execution
    not_found,                    // couldn't retrieve a certain resource, it doesn't exist
    already_exists,               // an entity can't be created because it already exists
    requires_auth,         // the requested resource requires authentication, but credentials haven't been
                           // provided or are invalid
    invalid_request,       // a request contained values outside the accepted range
    uncaught_exception,    // an API handler threw an unexpected exception
    invalid_content_type,  // an endpoint received an unsupported Content-Type
    invalid_config,        // the server configuration is not valid
};

// The error category for errc
const boost::system::error_category& get_msghub_category() noexcept;

// Allows constructing error_code from errc
inline error_code make_error_code(errc v) noexcept
{
    return error_code(static_cast<int>(v), get_msghub_category());
}

// An error code with a diagnostic string. Used by the operations that
// talk to a database, where the server may provide additional information.
struct error_with_message
{
    error_code ec;
    std::string msg;
};

// A result type holding either a value or an error_with_message
template <class T>
using result_with_message = boost::system::result<T, error_with_message>;

// Required by boost::system::result to throw when value() is called on an error
[[noreturn]] void throw_exception_from_error(const error_with_message& e, const boost::source_location& loc);

// Logs ec to stderr
void log_error(error_code ec, std::string_view what, std::string_view diagnostics = "");
inline void log_error(const error_with_message& err, std::string_view what)
{
    log_error(err.ec, what, err.msg);
}

// Logs an informational message to stdout
void log_info(std::string_view what);

}  // namespace msghub

// Allows constructing error_code from errc
namespace boost {
namespace system {

template <>
struct is_error_code_enum<msghub::errc>
{
    static constexpr bool value = true;
};
}  // namespace system
}  // namespace boost

// Returns an error_code with source-code location information on it
#define MSGHUB_RETURN_ERROR(e)                                                    \
    {                                                                             \
        static constexpr auto loc = BOOST_CURRENT_LOCATION;                       \
        return ::boost::system::error_code(::boost::system::error_code(e), &loc); \
    }

// Same, but for co_return
#define MSGHUB_CO_RETURN_ERROR(e)                                                    \
    {                                                                                \
        static constexpr auto loc = BOOST_CURRENT_LOCATION;                          \
        co_return ::boost::system::error_code(::boost::system::error_code(e), &loc); \
    }

// Returns an error_with_message with source-code location information on it
#define MSGHUB_RETURN_ERROR_WITH_MESSAGE(e, msg)                                                       \
    {                                                                                                  \
        static constexpr auto loc = BOOST_CURRENT_LOCATION;                                            \
        return ::msghub::error_with_message{::boost::system::error_code(::boost::system::error_code(e), &loc), \
                                            msg};                                                      \
    }

// Same, but for co_return
#define MSGHUB_CO_RETURN_ERROR_WITH_MESSAGE(e, msg)                                                       \
    {                                                                                                     \
        static constexpr auto loc = BOOST_CURRENT_LOCATION;                                               \
        co_return ::msghub::error_with_message{::boost::system::error_code(::boost::system::error_code(e), &loc), \
                                               msg};                                                      \
    }

#endif
