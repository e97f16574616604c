//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef MSGHUB_SERVER_INCLUDE_SERVICES_MESSAGE_CODEC_HPP
#define MSGHUB_SERVER_INCLUDE_SERVICES_MESSAGE_CODEC_HPP

#include <boost/json/fwd.hpp>

#include <string>
#include <string_view>

#include "business_types.hpp"
#include "error.hpp"

// Functions to convert message payloads to and from their JSON representation.
// We store payloads in the message store as serialized JSON. The same
// representation is used by the HTTP API and the event stream.
// Unions are externally tagged: {"User":{"uid":2}}, {"Normal":{"content":{...}}}

namespace msghub {

// Targets
boost::json::value target_to_json(const message_target& input);
result<message_target> target_from_json(const boost::json::value& input);

// Whole payloads, as JSON values. Used when embedding payloads in other objects
boost::json::value payload_to_json(const message_payload& input);
result<message_payload> payload_from_json(const boost::json::value& input);

// Whole payloads, as strings. This is what we store.
// parse_payload returns errc::serialization_error if the input is not a valid payload.
std::string serialize_payload(const message_payload& input);
result<message_payload> parse_payload(std::string_view input);

}  // namespace msghub

#endif
