//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "timestamp.hpp"

#include <charconv>
#include <chrono>
#include <cstdio>
#include <string>
#include <string_view>

#include "error.hpp"

using namespace msghub;
namespace chrono = std::chrono;

// "YYYY-MM-DD HH:MM:SS"
static constexpr std::size_t serialized_size = 19u;

std::string msghub::format_timestamp(timestamp_t input)
{
    // Move to the deployment's offset, then split into calendar and clock parts
    auto local = chrono::floor<chrono::seconds>(input) + timestamp_utc_offset;
    auto day = chrono::floor<chrono::days>(local);
    chrono::year_month_day ymd{day};
    chrono::hh_mm_ss<chrono::seconds> hms{local - day};

    char buff[32];
    std::snprintf(
        buff,
        sizeof(buff),
        "%04d-%02u-%02u %02d:%02d:%02d",
        static_cast<int>(ymd.year()),
        static_cast<unsigned>(ymd.month()),
        static_cast<unsigned>(ymd.day()),
        static_cast<int>(hms.hours().count()),
        static_cast<int>(hms.minutes().count()),
        static_cast<int>(hms.seconds().count())
    );
    return buff;
}

// Parses a fixed-size, all-digits field
static bool parse_field(std::string_view input, std::size_t offset, std::size_t size, int& to)
{
    auto field = input.substr(offset, size);
    auto res = std::from_chars(field.data(), field.data() + field.size(), to);
    return res.ec == std::errc() && res.ptr == field.data() + field.size();
}

result<timestamp_t> msghub::parse_timestamp(std::string_view input)
{
    // Check separators
    if (input.size() != serialized_size || input[4] != '-' || input[7] != '-' || input[10] != ' ' ||
        input[13] != ':' || input[16] != ':')
        MSGHUB_RETURN_ERROR(errc::serialization_error)

    // Parse the numeric fields
    int year{}, month{}, day{}, hour{}, minute{}, second{};
    if (!parse_field(input, 0, 4, year) || !parse_field(input, 5, 2, month) || !parse_field(input, 8, 2, day) ||
        !parse_field(input, 11, 2, hour) || !parse_field(input, 14, 2, minute) ||
        !parse_field(input, 17, 2, second))
        MSGHUB_RETURN_ERROR(errc::serialization_error)

    // Validate ranges
    chrono::year_month_day ymd{
        chrono::year(year),
        chrono::month(static_cast<unsigned>(month)),
        chrono::day(static_cast<unsigned>(day))
    };
    if (!ymd.ok() || hour < 0 || hour > 23 || minute < 0 || minute > 59 || second < 0 || second > 59)
        MSGHUB_RETURN_ERROR(errc::serialization_error)

    // Compose the time point, undoing the offset
    auto local = chrono::sys_days(ymd) + chrono::hours(hour) + chrono::minutes(minute) + chrono::seconds(second);
    return timestamp_t(local - timestamp_utc_offset);
}
