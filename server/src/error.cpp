//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "error.hpp"

#include <boost/asio/error.hpp>
#include <boost/describe/enum.hpp>
#include <boost/describe/enum_to_string.hpp>
#include <boost/system/system_error.hpp>

#include <iostream>
#include <string_view>

namespace msghub {

// Adds Boost.Describe metadata to errc. Required for describe::enum_to_string
BOOST_DESCRIBE_ENUM(
    errc,
    store_io_error,
    serialization_error,
    subscriber_lagged,
    hub_closed,
    recipient_resolution_failed,
    not_a_member,
    forbidden,
    redis_parse_error,
    redis_command_failed,
    not_found,
    already_exists,
    requires_auth,
    invalid_request,
    uncaught_exception,
    invalid_content_type,
    invalid_config
)

}  // namespace msghub

namespace {

static const char* to_string(msghub::errc v) noexcept
{
    return boost::describe::enum_to_string(v, "<unknown msghub error>");
}

// Custom category for msghub::errc. Exposed by get_msghub_category
class msghub_category final : public boost::system::error_category
{
public:
    const char* name() const noexcept final override { return "msghub"; }
    std::string message(int ev) const final override { return to_string(static_cast<msghub::errc>(ev)); }
};

static msghub_category cat;

}  // namespace

const boost::system::error_category& msghub::get_msghub_category() noexcept { return cat; }

[[noreturn]] void msghub::throw_exception_from_error(const error_with_message& e, const boost::source_location&)
{
    throw boost::system::system_error(e.ec, e.msg);
}

void msghub::log_error(error_code ec, std::string_view what, std::string_view diagnostics)
{
    // Don't report on canceled operations
    if (ec == boost::asio::error::operation_aborted)
        return;

    std::cerr << what << ": " << ec << ": " << ec.message();
    if (ec.has_location())
        std::cerr << " (" << ec.location() << ")";
    if (!diagnostics.empty())
        std::cerr << "\nDiagnostics: " << diagnostics;
    std::cerr << '\n';
}

void msghub::log_info(std::string_view what) { std::cout << what << std::endl; }
