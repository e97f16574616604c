//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef MSGHUB_SERVER_INCLUDE_BUSINESS_TYPES_METADATA_HPP
#define MSGHUB_SERVER_INCLUDE_BUSINESS_TYPES_METADATA_HPP

#include <boost/describe/class.hpp>

#include "business_types.hpp"

// Contains Boost.Describe metadata for business types.
// Metadata is not included in the main header to reduce build times.
// Field names match the JSON wire format and the MySQL column names.

namespace msghub {

BOOST_DESCRIBE_STRUCT(user_target, (), (uid))
BOOST_DESCRIBE_STRUCT(group_target, (), (gid))
BOOST_DESCRIBE_STRUCT(message_content, (), (content))
BOOST_DESCRIBE_STRUCT(normal_detail, (), (content))
BOOST_DESCRIBE_STRUCT(reply_detail, (), (mid, content))
BOOST_DESCRIBE_STRUCT(user_read_update, (), (target_uid, mid))
BOOST_DESCRIBE_STRUCT(group_read_update, (), (target_gid, mid))
BOOST_DESCRIBE_STRUCT(read_index, (), (uid, target_uid, target_gid, mid, latest_mid, uid_of_latest_msg))

}  // namespace msghub

#endif
