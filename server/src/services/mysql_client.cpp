//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "services/mysql_client.hpp"

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/mysql/any_address.hpp>
#include <boost/mysql/any_connection.hpp>
#include <boost/mysql/connection_pool.hpp>
#include <boost/mysql/diagnostics.hpp>
#include <boost/mysql/format_sql.hpp>
#include <boost/mysql/results.hpp>
#include <boost/mysql/sequence.hpp>
#include <boost/mysql/static_results.hpp>
#include <boost/mysql/with_params.hpp>

#include <cstdint>
#include <exception>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <tuple>
#include <vector>

#include "business_types.hpp"
#include "business_types_metadata.hpp"  // Required by static_results
#include "config.hpp"
#include "error.hpp"

using namespace msghub;
namespace mysql = boost::mysql;
namespace asio = boost::asio;

namespace {

// Table definitions. Rows in read_index are unique per (user, conversation).
// Since NULLs never compare equal in unique indices, a group row (NULL target_uid)
// never conflicts with a DM row, and vice versa.
constexpr const char* create_user_group_rel_sql =
    "CREATE TABLE IF NOT EXISTS user_group_rel ("
    "  id BIGINT NOT NULL AUTO_INCREMENT PRIMARY KEY,"
    "  group_id BIGINT NOT NULL,"
    "  user_id BIGINT NOT NULL,"
    "  c_time DATETIME NOT NULL DEFAULT CURRENT_TIMESTAMP,"
    "  forbid BOOLEAN NOT NULL DEFAULT FALSE,"
    "  UNIQUE KEY user_group_rel_group_user (group_id, user_id)"
    ")";

constexpr const char* create_read_index_sql =
    "CREATE TABLE IF NOT EXISTS read_index ("
    "  id BIGINT NOT NULL AUTO_INCREMENT PRIMARY KEY,"
    "  uid BIGINT NOT NULL,"
    "  target_uid BIGINT NULL,"
    "  target_gid BIGINT NULL,"
    "  mid BIGINT NULL,"
    "  latest_mid BIGINT NOT NULL,"
    "  uid_of_latest_msg BIGINT NOT NULL,"
    "  UNIQUE KEY read_index_uid_target_uid (uid, target_uid),"
    "  UNIQUE KEY read_index_uid_target_gid (uid, target_gid)"
    ")";

// Extracts the diagnostic string from a diagnostics object
std::string get_message(const mysql::diagnostics& diag)
{
    return diag.client_message().empty() ? diag.server_message() : diag.client_message();
}

// Returns the pool params to use
mysql::pool_params get_pool_params(const mysql_config& cfg)
{
    return {
        // The server address. We use the default port.
        .server_address = mysql::host_and_port{cfg.hostname},

        // The username to log in as
        .username = cfg.username,

        // The password
        .password = cfg.password,

        // The database to use
        .database = cfg.database,
    };
}

// Formats a read index row as a VALUES tuple. mid is always NULL,
// since these rows are inserted for users that haven't read anything
void format_unread_row(const read_index& row, mysql::format_context_base& ctx)
{
    mysql::format_sql_to(
        ctx,
        "({}, {}, {}, NULL, {}, {})",
        row.uid,
        row.target_uid,
        row.target_gid,
        row.latest_mid,
        row.uid_of_latest_msg
    );
}

class mysql_client_impl final : public mysql_client
{
    mysql::connection_pool pool_;

public:
    mysql_client_impl(asio::any_io_executor ex, const mysql_config& cfg) : pool_(std::move(ex), get_pool_params(cfg))
    {
    }

    void start_run() override final
    {
        asio::co_spawn(
            pool_.get_executor(),
            [pool = &pool_]() { return pool->async_run(asio::use_awaitable); },
            [](std::exception_ptr exc) {
                if (exc)
                    std::rethrow_exception(exc);
            }
        );
    }

    void cancel() override final { pool_.cancel(); }

    asio::awaitable<result_with_message<void>> setup_db() final override
    {
        error_code ec;
        mysql::diagnostics diag;
        mysql::results result;

        // Get a connection
        auto conn = co_await pool_.async_get_connection(diag, asio::redirect_error(ec));
        if (ec)
            co_return error_with_message{ec, get_message(diag)};

        // Create the tables, one at a time. Multi-queries are disabled by default
        for (std::string_view sql : {create_user_group_rel_sql, create_read_index_sql})
        {
            co_await conn->async_execute(sql, result, diag, asio::redirect_error(ec));
            if (ec)
                co_return error_with_message{ec, get_message(diag)};
        }

        co_return result_with_message<void>();
    }

    asio::awaitable<result_with_message<std::vector<std::int64_t>>> get_group_member_ids(std::int64_t group_id
    ) final override
    {
        mysql::diagnostics diag;
        error_code ec;

        // Get a connection
        auto conn = co_await pool_.async_get_connection(diag, asio::redirect_error(ec));
        if (ec)
            co_return error_with_message{ec, get_message(diag)};

        // Run the query
        mysql::static_results<std::tuple<std::int64_t>> result;
        co_await conn->async_execute(
            mysql::with_params(
                "SELECT user_id FROM user_group_rel WHERE group_id = {} ORDER BY user_id",
                group_id
            ),
            result,
            diag,
            asio::redirect_error(ec)
        );
        if (ec)
            co_return error_with_message{ec, get_message(diag)};

        // We didn't do anything modifying the connection state, so we can
        // explicitly return it, indicating that no reset is required.
        conn.return_without_reset();

        std::vector<std::int64_t> res;
        res.reserve(result.rows().size());
        for (const auto& row : result.rows())
            res.push_back(std::get<0>(row));
        co_return res;
    }

    asio::awaitable<result_with_message<group_membership>> get_group_membership(
        std::int64_t group_id,
        std::int64_t user_id
    ) final override
    {
        mysql::diagnostics diag;
        error_code ec;

        auto conn = co_await pool_.async_get_connection(diag, asio::redirect_error(ec));
        if (ec)
            co_return error_with_message{ec, get_message(diag)};

        // (group_id, user_id) is unique, so there is at most one row
        mysql::static_results<std::tuple<bool>> result;
        co_await conn->async_execute(
            mysql::with_params(
                "SELECT forbid FROM user_group_rel WHERE group_id = {} AND user_id = {}",
                group_id,
                user_id
            ),
            result,
            diag,
            asio::redirect_error(ec)
        );
        if (ec)
            co_return error_with_message{ec, get_message(diag)};

        conn.return_without_reset();

        if (result.rows().empty())
            co_return group_membership::none;
        co_return std::get<0>(result.rows()[0]) ? group_membership::forbidden : group_membership::member;
    }

    asio::awaitable<result_with_message<void>> upsert_read_index(const read_index& row) final override
    {
        mysql::diagnostics diag;
        error_code ec;
        mysql::results result;

        // Get a connection
        auto conn = co_await pool_.async_get_connection(diag, asio::redirect_error(ec));
        if (ec)
            co_return error_with_message{ec, get_message(diag)};

        // Assignments in ON DUPLICATE KEY UPDATE are evaluated left to right,
        // so uid_of_latest_msg must be computed before latest_mid is updated.
        // latest_mid never goes backwards.
        co_await conn->async_execute(
            mysql::with_params(
                "INSERT INTO read_index (uid, target_uid, target_gid, mid, latest_mid, uid_of_latest_msg) "
                "VALUES ({}, {}, {}, {}, {}, {}) AS new "
                "ON DUPLICATE KEY UPDATE "
                "  mid = new.mid,"
                "  uid_of_latest_msg = IF(new.latest_mid >= read_index.latest_mid, new.uid_of_latest_msg, "
                "read_index.uid_of_latest_msg),"
                "  latest_mid = GREATEST(read_index.latest_mid, new.latest_mid)",
                row.uid,
                row.target_uid,
                row.target_gid,
                row.mid,
                row.latest_mid,
                row.uid_of_latest_msg
            ),
            result,
            diag,
            asio::redirect_error(ec)
        );
        if (ec)
            co_return error_with_message{ec, get_message(diag)};

        co_return result_with_message<void>();
    }

    asio::awaitable<result_with_message<void>> advance_latest_messages(std::span<const read_index> rows
    ) final override
    {
        // Check that we have one row, at least.
        // Otherwise, the generated query may not be valid.
        if (rows.empty())
            co_return result_with_message<void>();

        mysql::diagnostics diag;
        error_code ec;
        mysql::results result;

        // Get a connection
        auto conn = co_await pool_.async_get_connection(diag, asio::redirect_error(ec));
        if (ec)
            co_return error_with_message{ec, get_message(diag)};

        // A single, batched insertion. Existing rows keep their mid
        co_await conn->async_execute(
            mysql::with_params(
                "INSERT INTO read_index (uid, target_uid, target_gid, mid, latest_mid, uid_of_latest_msg) "
                "VALUES {} AS new "
                "ON DUPLICATE KEY UPDATE "
                "  uid_of_latest_msg = IF(new.latest_mid >= read_index.latest_mid, new.uid_of_latest_msg, "
                "read_index.uid_of_latest_msg),"
                "  latest_mid = GREATEST(read_index.latest_mid, new.latest_mid)",
                mysql::sequence(rows, format_unread_row)
            ),
            result,
            diag,
            asio::redirect_error(ec)
        );
        if (ec)
            co_return error_with_message{ec, get_message(diag)};

        co_return result_with_message<void>();
    }

    asio::awaitable<result_with_message<std::vector<read_index>>> get_read_indexes(std::int64_t user_id
    ) final override
    {
        mysql::diagnostics diag;
        error_code ec;

        // Get a connection
        auto conn = co_await pool_.async_get_connection(diag, asio::redirect_error(ec));
        if (ec)
            co_return error_with_message{ec, get_message(diag)};

        // static_results requires that SQL field names match with C++ struct field names
        mysql::static_results<read_index> result;
        co_await conn->async_execute(
            mysql::with_params(
                "SELECT uid, target_uid, target_gid, mid, latest_mid, uid_of_latest_msg "
                "FROM read_index WHERE uid = {} ORDER BY latest_mid DESC",
                user_id
            ),
            result,
            diag,
            asio::redirect_error(ec)
        );
        if (ec)
            co_return error_with_message{ec, get_message(diag)};

        conn.return_without_reset();

        auto rows = result.rows();
        co_return std::vector<read_index>(rows.begin(), rows.end());
    }
};

}  // namespace

std::unique_ptr<mysql_client> msghub::create_mysql_client(asio::any_io_executor ex, const mysql_config& cfg)
{
    return std::unique_ptr<mysql_client>{new mysql_client_impl(std::move(ex), cfg)};
}
