//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef MSGHUB_SERVER_INCLUDE_TIMESTAMP_HPP
#define MSGHUB_SERVER_INCLUDE_TIMESTAMP_HPP

#include <chrono>
#include <string>
#include <string_view>

#include "error.hpp"

// Helpers to work with timestamps.
// The serialized representation of a timestamp is a "%Y-%m-%d %H:%M:%S"
// string, expressed in the fixed UTC+8 offset used by this deployment.
// Sub-second precision is not serialized.

namespace msghub {

// Timestamps are eventually shown to the user, so we need them to match the system clock
using timestamp_t = std::chrono::system_clock::time_point;

// The offset applied to serialized timestamps
inline constexpr std::chrono::hours timestamp_utc_offset{8};

// Converts a timestamp to its serialized representation
std::string format_timestamp(timestamp_t input);

// Creates a timestamp from its serialized representation.
// Returns errc::serialization_error if the input doesn't match the format.
result<timestamp_t> parse_timestamp(std::string_view input);

}  // namespace msghub

#endif
