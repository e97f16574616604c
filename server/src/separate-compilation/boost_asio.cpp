//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

// Compiled with BOOST_ASIO_SEPARATE_COMPILATION. Asio's implementation,
// including the SSL parts used by the MySQL and Redis clients, lives here.

#include <boost/asio/impl/src.hpp>
#include <boost/asio/ssl/impl/src.hpp>
