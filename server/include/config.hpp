//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef MSGHUB_SERVER_INCLUDE_CONFIG_HPP
#define MSGHUB_SERVER_INCLUDE_CONFIG_HPP

#include <boost/core/span.hpp>

#include <chrono>
#include <cstddef>
#include <functional>
#include <string>

#include "error.hpp"

// Server configuration. Network and storage parameters come from the command
// line, and tunables and credentials from environment variables.

namespace msghub {

// How to connect to MySQL
struct mysql_config
{
    std::string hostname{"localhost"};
    std::string username{"msghub_user"};
    std::string password{"temp_password"};
    std::string database{"msghub"};
};

struct server_config
{
    // Where to listen for HTTP connections
    std::string listen_address;
    unsigned short port{};

    // Path to the SQLite database holding messages
    std::string db_path;

    // How long an unused session stays valid. Sessions are always kept
    // in Redis, where the authentication service creates them
    std::chrono::seconds session_idle_timeout{604800};  // 7 days

    // How often event streams get a heartbeat frame
    std::chrono::seconds heartbeat_interval{30};

    // Capacity of the broadcast hub
    std::size_t hub_capacity{128};

    // Redis hostname. We use the default port
    std::string redis_host{"localhost"};

    mysql_config mysql;
};

// Looks up an environment variable. Returns nullptr if it's not defined
using env_lookup = std::function<const char*(const char*)>;

// Builds the configuration from command-line arguments (including argv[0]) and
// the environment. Returns errc::invalid_config, with a message, on bad input.
result_with_message<server_config> load_config(boost::span<const char* const> args, const env_lookup& getenv);

// Describes the expected command line
std::string usage(const char* program_name);

}  // namespace msghub

#endif
