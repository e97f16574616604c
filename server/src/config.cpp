//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "config.hpp"

#include <boost/core/span.hpp>

#include <charconv>
#include <chrono>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <string_view>

#include "error.hpp"

using namespace msghub;

// Parses a strictly positive integer, with an upper bound
static std::optional<std::uint64_t> parse_positive(std::string_view input, std::uint64_t max_value)
{
    std::uint64_t res{};
    auto [ptr, ec] = std::from_chars(input.data(), input.data() + input.size(), res);
    if (ec != std::errc() || ptr != input.data() + input.size() || res == 0u || res > max_value)
        return std::nullopt;
    return res;
}

static std::string invalid_value_msg(std::string_view name, std::string_view value)
{
    std::string res("Invalid value for ");
    res += name;
    res += ": '";
    res += value;
    res += '\'';
    return res;
}

// Overrides to with the value of an environment variable, if present
static void read_string(const env_lookup& getenv, const char* name, std::string& to)
{
    if (const char* value = getenv(name))
        to = value;
}

static result_with_message<void> read_seconds(const env_lookup& getenv, const char* name, std::chrono::seconds& to)
{
    const char* value = getenv(name);
    if (!value)
        return {};
    auto parsed = parse_positive(value, static_cast<std::uint64_t>(std::numeric_limits<std::int32_t>::max()));
    if (!parsed)
        MSGHUB_RETURN_ERROR_WITH_MESSAGE(errc::invalid_config, invalid_value_msg(name, value))
    to = std::chrono::seconds(*parsed);
    return {};
}

std::string msghub::usage(const char* program_name)
{
    std::string res("Usage: ");
    res += program_name;
    res += " <address> <port> <db_path>\nExample:\n    ";
    res += program_name;
    res += " 0.0.0.0 8080 msghub.db\n";
    return res;
}

result_with_message<server_config> msghub::load_config(
    boost::span<const char* const> args,
    const env_lookup& getenv
)
{
    server_config res;

    // Command line
    if (args.size() != 4u)
        MSGHUB_RETURN_ERROR_WITH_MESSAGE(errc::invalid_config, "Expected exactly 3 arguments")
    res.listen_address = args[1];
    auto port = parse_positive(args[2], std::numeric_limits<unsigned short>::max());
    if (!port)
        MSGHUB_RETURN_ERROR_WITH_MESSAGE(errc::invalid_config, invalid_value_msg("port", args[2]))
    res.port = static_cast<unsigned short>(*port);
    res.db_path = args[3];
    if (res.db_path.empty())
        MSGHUB_RETURN_ERROR_WITH_MESSAGE(errc::invalid_config, "db_path can't be empty")

    // Tokens are issued by writing Redis keys, so a process-local store
    // would never see a session. Reject anything else loudly
    if (const char* backend = getenv("MSGHUB_SESSION_BACKEND"))
    {
        std::string_view backend_sv(backend);
        if (backend_sv != "redis")
            MSGHUB_RETURN_ERROR_WITH_MESSAGE(
                errc::invalid_config,
                invalid_value_msg("MSGHUB_SESSION_BACKEND", backend_sv) + ": only 'redis' is supported"
            )
    }

    // Durations
    auto dur_result = read_seconds(getenv, "MSGHUB_SESSION_IDLE_SECONDS", res.session_idle_timeout);
    if (dur_result.has_error())
        return std::move(dur_result).error();
    dur_result = read_seconds(getenv, "MSGHUB_HEARTBEAT_SECONDS", res.heartbeat_interval);
    if (dur_result.has_error())
        return std::move(dur_result).error();

    // Hub capacity
    if (const char* capacity = getenv("MSGHUB_HUB_CAPACITY"))
    {
        auto parsed = parse_positive(capacity, 1024u * 1024u);
        if (!parsed)
            MSGHUB_RETURN_ERROR_WITH_MESSAGE(
                errc::invalid_config,
                invalid_value_msg("MSGHUB_HUB_CAPACITY", capacity)
            )
        res.hub_capacity = static_cast<std::size_t>(*parsed);
    }

    // Databases
    read_string(getenv, "REDIS_HOST", res.redis_host);
    read_string(getenv, "MYSQL_HOST", res.mysql.hostname);
    read_string(getenv, "MYSQL_USERNAME", res.mysql.username);
    read_string(getenv, "MYSQL_PASSWORD", res.mysql.password);
    read_string(getenv, "MYSQL_DATABASE", res.mysql.database);

    return res;
}
