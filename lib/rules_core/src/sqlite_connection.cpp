/*
Module Name:
- sqlite_connection.cpp

Abstract:
- SQLite handle management for the storage engine.

Why:
- Handles are released by unique_ptr deleters so no connection or statement
  outlives the call that created it, on success and on every error path.
- BEGIN IMMEDIATE takes the write lock up front so two upserts never
  interleave their delete and insert.
*/

// C++ Standard Library
#include <algorithm>
#include <iostream>
#include <limits>

// GSL
#include <gsl/gsl>

// Core
#include <mb/rules/error.hpp>
#include <mb/rules/sqlite_connection.hpp>

namespace mod_bot::sqlite
{

    std::string describe_error(const Connection& conn, std::string_view action, int rc)
    {
        std::string msg;
        msg.reserve(96 + conn.path().size());
        msg.append(action).append(" failed on '").append(conn.path()).append("': ");
        if (conn.handle() != nullptr)
            msg.append(sqlite3_errmsg(conn.handle()));
        else
            msg.append(sqlite3_errstr(rc));
        msg.append(" (").append(std::to_string(rc)).append(")");
        return msg;
    }

    // ------------------ Connection ------------------

    Connection::Connection(const std::filesystem::path& path, std::chrono::milliseconds busy_timeout) :
        path_{ path.string() }
    {
        sqlite3* raw = nullptr;
        const int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_NOMUTEX;
        const int rc = sqlite3_open_v2(path_.c_str(), &raw, flags, nullptr);
        db_.reset(raw); // sqlite hands back a handle even on failure; it must still be closed
        if (rc != SQLITE_OK)
            throw StorageUnavailable(describe_error(*this, "open", rc));

        const auto ms = std::min<std::chrono::milliseconds::rep>(busy_timeout.count(),
                                                                 std::numeric_limits<int>::max());
        const int timeout_rc = sqlite3_busy_timeout(db_.get(), gsl::narrow_cast<int>(ms));
        if (timeout_rc != SQLITE_OK)
            throw StorageUnavailable(describe_error(*this, "busy_timeout", timeout_rc));
    }

    void Connection::exec(std::string_view sql)
    {
        const std::string text{ sql };
        char* err = nullptr;
        const int rc = sqlite3_exec(db_.get(), text.c_str(), nullptr, nullptr, &err);
        auto release = gsl::finally([err] { sqlite3_free(err); });
        if (rc != SQLITE_OK)
        {
            std::string msg = "exec failed on '" + path_ + "': ";
            msg.append(err != nullptr ? err : sqlite3_errstr(rc));
            throw StorageUnavailable(msg);
        }
    }

    Statement Connection::prepare(std::string_view sql)
    {
        return Statement{ *this, sql };
    }

    // ------------------ Statement ------------------

    Statement::Statement(Connection& conn, std::string_view sql) :
        conn_{ &conn }
    {
        sqlite3_stmt* raw = nullptr;
        const int rc = sqlite3_prepare_v2(
            conn.handle(), sql.data(), gsl::narrow<int>(sql.size()), &raw, nullptr);
        stmt_.reset(raw);
        if (rc != SQLITE_OK)
            throw StorageUnavailable(describe_error(conn, "prepare", rc));
    }

    void Statement::check_bind(int rc, int index) const
    {
        if (rc != SQLITE_OK)
            throw StorageUnavailable(describe_error(*conn_, "bind #" + std::to_string(index), rc));
    }

    Statement& Statement::bind_int64(int index, std::int64_t value)
    {
        check_bind(sqlite3_bind_int64(stmt_.get(), index, value), index);
        return *this;
    }

    Statement& Statement::bind_double(int index, double value)
    {
        check_bind(sqlite3_bind_double(stmt_.get(), index, value), index);
        return *this;
    }

    Statement& Statement::bind_text(int index, std::string_view value)
    {
        check_bind(sqlite3_bind_text(stmt_.get(),
                                     index,
                                     value.data(),
                                     gsl::narrow<int>(value.size()),
                                     SQLITE_TRANSIENT),
                   index);
        return *this;
    }

    bool Statement::step()
    {
        const int rc = sqlite3_step(stmt_.get());
        if (rc == SQLITE_ROW)
            return true;
        if (rc == SQLITE_DONE)
            return false;
        throw StorageUnavailable(describe_error(*conn_, "step", rc));
    }

    void Statement::run()
    {
        if (step())
            throw StorageUnavailable("statement on '" + conn_->path() + "' returned unexpected rows");
    }

    std::int64_t Statement::column_int64(int index) const noexcept
    {
        return sqlite3_column_int64(stmt_.get(), index);
    }

    double Statement::column_double(int index) const noexcept
    {
        return sqlite3_column_double(stmt_.get(), index);
    }

    std::string Statement::column_text(int index) const
    {
        const auto* text = sqlite3_column_text(stmt_.get(), index);
        if (text == nullptr)
            return {};
        const int len = sqlite3_column_bytes(stmt_.get(), index);
        return std::string(reinterpret_cast<const char*>(text), static_cast<std::size_t>(len));
    }

    // ------------------ Transaction ------------------

    Transaction::Transaction(Connection& conn) :
        conn_{ conn }
    {
        conn_.exec("BEGIN IMMEDIATE;");
    }

    void Transaction::commit()
    {
        conn_.exec("COMMIT;");
        finished_ = true;
    }

    Transaction::~Transaction()
    {
        if (finished_)
            return;

        // Destructors must not throw; a failed rollback leaves the journal for SQLite to recover.
        const int rc = sqlite3_exec(conn_.handle(), "ROLLBACK;", nullptr, nullptr, nullptr);
        if (rc != SQLITE_OK)
        {
            std::cerr << "[Transaction] rollback failed on '" << conn_.path()
                      << "': " << sqlite3_errmsg(conn_.handle()) << '\n';
        }
    }

} // namespace mod_bot::sqlite
