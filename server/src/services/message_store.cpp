//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "services/message_store.hpp"

#include <boost/core/span.hpp>

#include <algorithm>
#include <cstdint>
#include <limits>
#include <memory>
#include <mutex>
#include <optional>
#include <sqlite3.h>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "business_types.hpp"
#include "error.hpp"

using namespace msghub;

namespace {

// Layout:
//   messages: one row per message. mid is an AUTOINCREMENT key, so SQLite
//             never reuses an ID, even after deletions. The (partition_key, mid)
//             index makes history pagination a contiguous range scan.
//   user_feed: (uid, mid) pairs, one per participant of each message. Backs
//             fetch_user_messages_after.
constexpr const char* schema_sql =
    "CREATE TABLE IF NOT EXISTS messages ("
    "  mid           INTEGER PRIMARY KEY AUTOINCREMENT,"
    "  partition_key TEXT NOT NULL,"
    "  payload       BLOB NOT NULL"
    ");"
    "CREATE INDEX IF NOT EXISTS messages_partition_mid ON messages (partition_key, mid);"
    "CREATE TABLE IF NOT EXISTS user_feed ("
    "  uid INTEGER NOT NULL,"
    "  mid INTEGER NOT NULL,"
    "  PRIMARY KEY (uid, mid)"
    ") WITHOUT ROWID;";

constexpr const char* insert_message_sql = "INSERT INTO messages (partition_key, payload) VALUES (?1, ?2)";
constexpr const char* insert_feed_sql = "INSERT OR IGNORE INTO user_feed (uid, mid) VALUES (?1, ?2)";
constexpr const char* select_before_sql =
    "SELECT mid, payload FROM messages WHERE partition_key = ?1 AND mid < ?2 ORDER BY mid DESC LIMIT ?3";
constexpr const char* select_feed_after_sql =
    "SELECT m.mid, m.payload FROM user_feed f JOIN messages m ON m.mid = f.mid "
    "WHERE f.uid = ?1 AND f.mid > ?2 ORDER BY f.mid ASC LIMIT ?3";
constexpr const char* select_by_id_sql = "SELECT payload FROM messages WHERE mid = ?1";
constexpr const char* count_after_sql = "SELECT COUNT(*) FROM messages WHERE partition_key = ?1 AND mid > ?2";

// RAII wrappers around SQLite handles
struct sqlite_deleter
{
    void operator()(sqlite3* db) const noexcept { sqlite3_close(db); }
    void operator()(sqlite3_stmt* stmt) const noexcept { sqlite3_finalize(stmt); }
};
using db_ptr = std::unique_ptr<sqlite3, sqlite_deleter>;
using stmt_ptr = std::unique_ptr<sqlite3_stmt, sqlite_deleter>;

// Resets a cached statement when it goes out of scope, so it can be reused
struct stmt_reset_deleter
{
    void operator()(sqlite3_stmt* stmt) const noexcept
    {
        sqlite3_reset(stmt);
        sqlite3_clear_bindings(stmt);
    }
};
using stmt_guard = std::unique_ptr<sqlite3_stmt, stmt_reset_deleter>;

// SQLite uses a negative LIMIT for "no limit"
sqlite3_int64 to_sql_limit(std::size_t limit) noexcept
{
    return limit > static_cast<std::size_t>(std::numeric_limits<sqlite3_int64>::max())
               ? -1
               : static_cast<sqlite3_int64>(limit);
}

class sqlite_message_store final : public message_store
{
    // Serializes all access to the database. Appends and reads happen
    // behind the same lock, so IDs are totally ordered.
    std::mutex mtx_;

    db_ptr db_;
    stmt_ptr insert_message_;
    stmt_ptr insert_feed_;
    stmt_ptr select_before_;
    stmt_ptr select_feed_after_;
    stmt_ptr select_by_id_;
    stmt_ptr count_after_;

    error_with_message make_error(std::string_view what) const
    {
        std::string msg(what);
        msg += ": ";
        msg += sqlite3_errmsg(db_.get());
        return error_with_message{errc::store_io_error, std::move(msg)};
    }

    stmt_ptr prepare(const char* sql)
    {
        sqlite3_stmt* stmt = nullptr;
        int rc = sqlite3_prepare_v2(db_.get(), sql, -1, &stmt, nullptr);
        if (rc != SQLITE_OK)
            throw std::runtime_error(make_error("Preparing statement").msg);
        return stmt_ptr(stmt);
    }

    // Runs a statement without results (e.g. BEGIN)
    bool exec(const char* sql) noexcept
    {
        return sqlite3_exec(db_.get(), sql, nullptr, nullptr, nullptr) == SQLITE_OK;
    }

    // Rolls back the current transaction unless commit() succeeds
    class transaction
    {
        sqlite_message_store* self_;
        bool done_{false};

    public:
        explicit transaction(sqlite_message_store& self) noexcept : self_(&self) {}
        transaction(const transaction&) = delete;
        transaction& operator=(const transaction&) = delete;
        ~transaction()
        {
            if (!done_)
                self_->exec("ROLLBACK");
        }

        bool commit() noexcept
        {
            done_ = self_->exec("COMMIT");
            return done_;
        }
    };

    // Appends a message and its feed entries atomically. Must be called with the lock held
    result_with_message<std::int64_t> append(
        const std::string& partition_key,
        boost::span<const std::int64_t> feed_uids,
        std::string_view payload
    )
    {
        if (!exec("BEGIN IMMEDIATE"))
            return make_error("Beginning transaction");
        transaction tx(*this);

        // The message itself
        stmt_guard insert_msg(insert_message_.get());
        sqlite3_bind_text(insert_msg.get(), 1, partition_key.data(), partition_key.size(), SQLITE_TRANSIENT);
        sqlite3_bind_blob(insert_msg.get(), 2, payload.data(), payload.size(), SQLITE_TRANSIENT);
        if (sqlite3_step(insert_msg.get()) != SQLITE_DONE)
            return make_error("Inserting message");
        std::int64_t mid = sqlite3_last_insert_rowid(db_.get());

        // Feed entries for all participants
        for (auto uid : feed_uids)
        {
            stmt_guard insert_feed(insert_feed_.get());
            sqlite3_bind_int64(insert_feed.get(), 1, uid);
            sqlite3_bind_int64(insert_feed.get(), 2, mid);
            if (sqlite3_step(insert_feed.get()) != SQLITE_DONE)
                return make_error("Inserting feed entry");
        }

        if (!tx.commit())
            return make_error("Committing transaction");
        return mid;
    }

    // Collects (mid, payload) rows from a statement that has been bound
    result_with_message<std::vector<stored_message>> collect_rows(sqlite3_stmt* stmt, std::string_view what)
    {
        std::vector<stored_message> res;
        int rc;
        while ((rc = sqlite3_step(stmt)) == SQLITE_ROW)
        {
            const auto* data = static_cast<const char*>(sqlite3_column_blob(stmt, 1));
            auto size = static_cast<std::size_t>(sqlite3_column_bytes(stmt, 1));
            res.push_back(stored_message{
                sqlite3_column_int64(stmt, 0),
                data ? std::string(data, size) : std::string(),
            });
        }
        if (rc != SQLITE_DONE)
            return make_error(what);
        return res;
    }

    result_with_message<std::vector<stored_message>> fetch_before(
        const std::string& partition_key,
        std::optional<std::int64_t> before_id,
        std::size_t limit
    )
    {
        if (limit == 0u)
            return std::vector<stored_message>{};

        std::lock_guard<std::mutex> lock(mtx_);
        stmt_guard stmt(select_before_.get());
        sqlite3_bind_text(stmt.get(), 1, partition_key.data(), partition_key.size(), SQLITE_TRANSIENT);
        sqlite3_bind_int64(stmt.get(), 2, before_id.value_or(std::numeric_limits<std::int64_t>::max()));
        sqlite3_bind_int64(stmt.get(), 3, to_sql_limit(limit));
        return collect_rows(stmt.get(), "Fetching conversation history");
    }

    result_with_message<std::size_t> count_after(const std::string& partition_key, std::int64_t after_id)
    {
        std::lock_guard<std::mutex> lock(mtx_);
        stmt_guard stmt(count_after_.get());
        sqlite3_bind_text(stmt.get(), 1, partition_key.data(), partition_key.size(), SQLITE_TRANSIENT);
        sqlite3_bind_int64(stmt.get(), 2, after_id);
        if (sqlite3_step(stmt.get()) != SQLITE_ROW)
            return make_error("Counting messages");
        return static_cast<std::size_t>(sqlite3_column_int64(stmt.get(), 0));
    }

public:
    explicit sqlite_message_store(const std::string& path)
    {
        // Open the database
        sqlite3* db = nullptr;
        int rc = sqlite3_open(path.c_str(), &db);
        db_.reset(db);  // sqlite3_open may allocate a handle even on failure
        if (rc != SQLITE_OK)
            throw std::runtime_error("Opening message store at " + path + ": " + sqlite3_errstr(rc));

        // Write-ahead logging makes appends cheaper. Wait if other processes lock the file
        sqlite3_busy_timeout(db_.get(), 5000);
        if (!exec("PRAGMA journal_mode=WAL") || !exec(schema_sql))
            throw std::runtime_error(make_error("Setting up message store").msg);

        // Statements are prepared once and reused
        insert_message_ = prepare(insert_message_sql);
        insert_feed_ = prepare(insert_feed_sql);
        select_before_ = prepare(select_before_sql);
        select_feed_after_ = prepare(select_feed_after_sql);
        select_by_id_ = prepare(select_by_id_sql);
        count_after_ = prepare(count_after_sql);
    }

    ~sqlite_message_store()
    {
        // Statements must be finalized before the connection is closed
        insert_message_.reset();
        insert_feed_.reset();
        select_before_.reset();
        select_feed_after_.reset();
        select_by_id_.reset();
        count_after_.reset();
    }

    result_with_message<std::int64_t> send_to_dm(std::int64_t from, std::int64_t to, std::string_view payload)
        final override
    {
        const std::int64_t participants[] = {from, to};
        std::lock_guard<std::mutex> lock(mtx_);
        return append(dm_partition_key(from, to), participants, payload);
    }

    result_with_message<std::int64_t> send_to_group(
        std::int64_t group_id,
        boost::span<const std::int64_t> member_ids,
        std::string_view payload
    ) final override
    {
        std::lock_guard<std::mutex> lock(mtx_);
        return append(group_partition_key(group_id), member_ids, payload);
    }

    result_with_message<std::vector<stored_message>> fetch_dm_messages_before(
        std::int64_t user_a,
        std::int64_t user_b,
        std::optional<std::int64_t> before_id,
        std::size_t limit
    ) final override
    {
        return fetch_before(dm_partition_key(user_a, user_b), before_id, limit);
    }

    result_with_message<std::vector<stored_message>> fetch_group_messages_before(
        std::int64_t group_id,
        std::optional<std::int64_t> before_id,
        std::size_t limit
    ) final override
    {
        return fetch_before(group_partition_key(group_id), before_id, limit);
    }

    result_with_message<std::vector<stored_message>> fetch_user_messages_after(
        std::int64_t user_id,
        std::optional<std::int64_t> after_id,
        std::size_t limit
    ) final override
    {
        if (limit == 0u)
            return std::vector<stored_message>{};

        std::lock_guard<std::mutex> lock(mtx_);
        stmt_guard stmt(select_feed_after_.get());
        sqlite3_bind_int64(stmt.get(), 1, user_id);
        sqlite3_bind_int64(stmt.get(), 2, after_id.value_or(std::numeric_limits<std::int64_t>::min()));
        sqlite3_bind_int64(stmt.get(), 3, to_sql_limit(limit));
        return collect_rows(stmt.get(), "Fetching user feed");
    }

    result_with_message<std::optional<std::string>> get(std::int64_t message_id) final override
    {
        std::lock_guard<std::mutex> lock(mtx_);
        stmt_guard stmt(select_by_id_.get());
        sqlite3_bind_int64(stmt.get(), 1, message_id);
        int rc = sqlite3_step(stmt.get());
        if (rc == SQLITE_DONE)
            return std::optional<std::string>();
        else if (rc != SQLITE_ROW)
            return make_error("Retrieving message");

        const auto* data = static_cast<const char*>(sqlite3_column_blob(stmt.get(), 0));
        auto size = static_cast<std::size_t>(sqlite3_column_bytes(stmt.get(), 0));
        return std::optional<std::string>(data ? std::string(data, size) : std::string());
    }

    result_with_message<std::size_t> count_dm_messages_after(
        std::int64_t from,
        std::int64_t to,
        std::int64_t after_id
    ) final override
    {
        return count_after(dm_partition_key(from, to), after_id);
    }

    result_with_message<std::size_t> count_group_messages_after(std::int64_t group_id, std::int64_t after_id)
        final override
    {
        return count_after(group_partition_key(group_id), after_id);
    }
};

}  // namespace

std::string msghub::dm_partition_key(std::int64_t user_a, std::int64_t user_b)
{
    // Sort the pair, so both participants hit the same partition
    auto [low, high] = std::minmax(user_a, user_b);
    std::string res = "dm:";
    res += std::to_string(low);
    res += ':';
    res += std::to_string(high);
    return res;
}

std::string msghub::group_partition_key(std::int64_t group_id) { return "group:" + std::to_string(group_id); }

std::unique_ptr<message_store> msghub::create_message_store(const std::string& path)
{
    return std::unique_ptr<message_store>{new sqlite_message_store(path)};
}
