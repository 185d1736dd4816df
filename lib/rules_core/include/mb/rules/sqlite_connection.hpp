/*
Module Name:
- sqlite_connection.hpp

Abstract:
- Thin RAII layer over the SQLite C API used by the storage engine.
- Connection owns one sqlite3 handle, Statement owns one prepared statement,
  Transaction holds a write lock (BEGIN IMMEDIATE) until commit() or scope exit.
- Every SQLite failure is raised as StorageUnavailable with the engine's message.

Notes:
- A Connection is confined to the call that opened it and is never shared
  between threads, so handles are opened with SQLITE_OPEN_NOMUTEX.
*/
#pragma once

// C++ Standard Library
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

// SQLite
#include <sqlite3.h>

namespace mod_bot::sqlite
{

    class Statement;

    class Connection
    {
    public:
        // Open 'path' read-write, creating the file when missing.
        // busy_timeout bounds how long a call waits on another writer's lock.
        Connection(const std::filesystem::path& path, std::chrono::milliseconds busy_timeout);

        Connection(const Connection&) = delete;
        Connection& operator=(const Connection&) = delete;
        Connection(Connection&&) noexcept = default;
        Connection& operator=(Connection&&) noexcept = default;
        ~Connection() = default;

        // Run one or more statements that produce no rows.
        void exec(std::string_view sql);

        [[nodiscard]] Statement prepare(std::string_view sql);

        [[nodiscard]] sqlite3* handle() const noexcept
        {
            return db_.get();
        }

        [[nodiscard]] const std::string& path() const noexcept
        {
            return path_;
        }

    private:
        struct Closer
        {
            void operator()(sqlite3* db) const noexcept
            {
                (void)sqlite3_close_v2(db);
            }
        };

        std::string path_;
        std::unique_ptr<sqlite3, Closer> db_;
    };

    class Statement
    {
    public:
        Statement(Connection& conn, std::string_view sql);

        Statement(const Statement&) = delete;
        Statement& operator=(const Statement&) = delete;
        Statement(Statement&&) noexcept = default;
        Statement& operator=(Statement&&) noexcept = default;
        ~Statement() = default;

        // Parameter indices are 1-based, as in sqlite3_bind_*.
        Statement& bind_int64(int index, std::int64_t value);
        Statement& bind_double(int index, double value);
        Statement& bind_text(int index, std::string_view value);

        // Advance one row. True while a row is available, false once done.
        [[nodiscard]] bool step();

        // Step a statement that must not produce rows.
        void run();

        [[nodiscard]] std::int64_t column_int64(int index) const noexcept;
        [[nodiscard]] double column_double(int index) const noexcept;
        [[nodiscard]] std::string column_text(int index) const;

    private:
        struct Finalizer
        {
            void operator()(sqlite3_stmt* stmt) const noexcept
            {
                (void)sqlite3_finalize(stmt);
            }
        };

        void check_bind(int rc, int index) const;

        Connection* conn_;
        std::unique_ptr<sqlite3_stmt, Finalizer> stmt_;
    };

    // Write transaction. Rolls back on destruction unless commit() succeeded.
    class Transaction
    {
    public:
        explicit Transaction(Connection& conn);
        ~Transaction();

        Transaction(const Transaction&) = delete;
        Transaction& operator=(const Transaction&) = delete;

        void commit();

    private:
        Connection& conn_;
        bool finished_{ false };
    };

    // Build the StorageUnavailable message for a failing call on 'conn'.
    [[nodiscard]] std::string describe_error(const Connection& conn, std::string_view action, int rc);

} // namespace mod_bot::sqlite
