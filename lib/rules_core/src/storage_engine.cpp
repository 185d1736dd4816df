/*
Module Name:
- storage_engine.cpp

Abstract:
- SQL and row mapping for StorageEngine.

Why:
- One connection per call keeps the engine free of shared handle state; SQLite's
  file locking plus the busy timeout is the only coordination between threads.
- Upserts delete then insert inside BEGIN IMMEDIATE, so the write lock is held
  for the whole replace and a rollback restores the previous row on any failure.
- Composite primary keys back the one-row-per-key invariant in the schema itself.
*/

// C++ Standard Library
#include <iostream>
#include <string>
#include <system_error>
#include <utility>

// Core
#include <mb/rules/error.hpp>
#include <mb/rules/sqlite_connection.hpp>
#include <mb/rules/storage_engine.hpp>
#include <mb/utils/timer.hpp>

namespace mod_bot
{

    namespace
    {
        constexpr std::string_view kSchemaSql = R"SQL(
            CREATE TABLE IF NOT EXISTS channel_configs (
                guild_id         INTEGER NOT NULL,
                channel_id       INTEGER NOT NULL,
                event_expectancy REAL    NOT NULL,
                event_duration   INTEGER NOT NULL,
                event_cooldown   REAL    NOT NULL,
                last_event       INTEGER NOT NULL,
                max_offenses     INTEGER NOT NULL,
                timeout_duration INTEGER NOT NULL,
                prefixes         TEXT    NOT NULL,
                PRIMARY KEY (guild_id, channel_id)
            );

            CREATE TABLE IF NOT EXISTS user_offenses (
                guild_id         INTEGER NOT NULL,
                channel_id       INTEGER NOT NULL,
                user_id          INTEGER NOT NULL,
                current_offenses INTEGER NOT NULL,
                total_offenses   INTEGER NOT NULL,
                last_offense     INTEGER NOT NULL,
                PRIMARY KEY (guild_id, channel_id, user_id)
            );
        )SQL";

        constexpr std::string_view kSelectConfig =
            "SELECT guild_id, channel_id, event_expectancy, event_duration, event_cooldown, "
            "last_event, max_offenses, timeout_duration, prefixes "
            "FROM channel_configs WHERE guild_id = ?1 AND channel_id = ?2;";

        constexpr std::string_view kDeleteConfig =
            "DELETE FROM channel_configs WHERE guild_id = ?1 AND channel_id = ?2;";

        constexpr std::string_view kInsertConfig =
            "INSERT INTO channel_configs (guild_id, channel_id, event_expectancy, event_duration, "
            "event_cooldown, last_event, max_offenses, timeout_duration, prefixes) "
            "VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9);";

        constexpr std::string_view kSelectUser =
            "SELECT guild_id, channel_id, user_id, current_offenses, total_offenses, last_offense "
            "FROM user_offenses WHERE guild_id = ?1 AND channel_id = ?2 AND user_id = ?3;";

        constexpr std::string_view kSelectUserTotal =
            "SELECT total_offenses FROM user_offenses "
            "WHERE guild_id = ?1 AND channel_id = ?2 AND user_id = ?3;";

        constexpr std::string_view kDeleteUser =
            "DELETE FROM user_offenses WHERE guild_id = ?1 AND channel_id = ?2 AND user_id = ?3;";

        constexpr std::string_view kInsertUser =
            "INSERT INTO user_offenses (guild_id, channel_id, user_id, current_offenses, "
            "total_offenses, last_offense) VALUES (?1, ?2, ?3, ?4, ?5, ?6);";

        constexpr std::string_view kSelectUsers =
            "SELECT guild_id, channel_id, user_id, current_offenses, total_offenses, last_offense "
            "FROM user_offenses WHERE guild_id = ?1 AND channel_id = ?2;";

        ChannelConfig read_config(const sqlite::Statement& stmt)
        {
            return ChannelConfig{
                .guild_id = stmt.column_int64(0),
                .channel_id = stmt.column_int64(1),
                .event_expectancy = stmt.column_double(2),
                .event_duration = stmt.column_int64(3),
                .event_cooldown = stmt.column_double(4),
                .last_event = stmt.column_int64(5),
                .max_offenses = stmt.column_int64(6),
                .timeout_duration = stmt.column_int64(7),
                .prefixes = stmt.column_text(8),
            };
        }

        UserOffenses read_user(const sqlite::Statement& stmt) noexcept
        {
            return UserOffenses{
                .guild_id = stmt.column_int64(0),
                .channel_id = stmt.column_int64(1),
                .user_id = stmt.column_int64(2),
                .current_offenses = stmt.column_int64(3),
                .total_offenses = stmt.column_int64(4),
                .last_offense = stmt.column_int64(5),
            };
        }

        // Reports the wrapped operation on stderr when it outlives the threshold.
        class SlowOperationReport
        {
        public:
            SlowOperationReport(std::string_view operation, std::chrono::milliseconds threshold) noexcept :
                operation_{ operation }, threshold_{ threshold }
            {
            }

            ~SlowOperationReport()
            {
                if (threshold_.count() <= 0 || !timer_.exceeded(threshold_))
                    return;
                std::cerr << "[StorageEngine] slow " << operation_ << ": "
                          << timer_.elapsed_count<std::chrono::milliseconds>() << " ms\n";
            }

            SlowOperationReport(const SlowOperationReport&) = delete;
            SlowOperationReport& operator=(const SlowOperationReport&) = delete;

        private:
            std::string_view operation_;
            std::chrono::milliseconds threshold_;
            Timer timer_;
        };
    } // namespace

    StorageEngine::StorageEngine(std::filesystem::path path, StorageOptions options) :
        path_{ std::move(path) }, options_{ options }
    {
        if (path_.empty())
            throw StorageUnavailable("storage path must not be empty");

        if (const auto parent = path_.parent_path(); !parent.empty())
        {
            std::error_code ec;
            std::filesystem::create_directories(parent, ec);
            if (ec)
            {
                throw StorageUnavailable("cannot create directory '" + parent.string() +
                                         "': " + ec.message());
            }
        }

        create_schema();
    }

    sqlite::Connection StorageEngine::connect() const
    {
        return sqlite::Connection{ path_, options_.busy_timeout };
    }

    void StorageEngine::create_schema() const
    {
        auto conn = connect();
        conn.exec(kSchemaSql);
    }

    std::optional<ChannelConfig> StorageEngine::get_config(std::int64_t guild_id,
                                                           std::int64_t channel_id) const
    {
        SlowOperationReport report{ "get_config", options_.slow_operation_threshold };

        auto conn = connect();
        auto stmt = conn.prepare(kSelectConfig);
        stmt.bind_int64(1, guild_id).bind_int64(2, channel_id);
        if (!stmt.step())
            return std::nullopt;
        return read_config(stmt);
    }

    void StorageEngine::put_config(const ChannelConfig& config) const
    {
        SlowOperationReport report{ "put_config", options_.slow_operation_threshold };

        auto conn = connect();
        sqlite::Transaction tx{ conn };

        conn.prepare(kDeleteConfig)
            .bind_int64(1, config.guild_id)
            .bind_int64(2, config.channel_id)
            .run();

        conn.prepare(kInsertConfig)
            .bind_int64(1, config.guild_id)
            .bind_int64(2, config.channel_id)
            .bind_double(3, config.event_expectancy)
            .bind_int64(4, config.event_duration)
            .bind_double(5, config.event_cooldown)
            .bind_int64(6, config.last_event)
            .bind_int64(7, config.max_offenses)
            .bind_int64(8, config.timeout_duration)
            .bind_text(9, config.prefixes)
            .run();

        tx.commit();
    }

    std::optional<UserOffenses> StorageEngine::get_user(std::int64_t guild_id,
                                                        std::int64_t channel_id,
                                                        std::int64_t user_id) const
    {
        SlowOperationReport report{ "get_user", options_.slow_operation_threshold };

        auto conn = connect();
        auto stmt = conn.prepare(kSelectUser);
        stmt.bind_int64(1, guild_id).bind_int64(2, channel_id).bind_int64(3, user_id);
        if (!stmt.step())
            return std::nullopt;
        return read_user(stmt);
    }

    void StorageEngine::put_user(const UserOffenses& user) const
    {
        SlowOperationReport report{ "put_user", options_.slow_operation_threshold };

        auto conn = connect();
        sqlite::Transaction tx{ conn };

        // Checked under the write lock so no other writer can slip a higher total in between.
        {
            auto stmt = conn.prepare(kSelectUserTotal);
            stmt.bind_int64(1, user.guild_id).bind_int64(2, user.channel_id).bind_int64(3, user.user_id);
            if (stmt.step() && user.total_offenses < stmt.column_int64(0))
            {
                throw InvalidRecord("UserOffenses: total_offenses would decrease from " +
                                    std::to_string(stmt.column_int64(0)) + " to " +
                                    std::to_string(user.total_offenses));
            }
        }

        conn.prepare(kDeleteUser)
            .bind_int64(1, user.guild_id)
            .bind_int64(2, user.channel_id)
            .bind_int64(3, user.user_id)
            .run();

        conn.prepare(kInsertUser)
            .bind_int64(1, user.guild_id)
            .bind_int64(2, user.channel_id)
            .bind_int64(3, user.user_id)
            .bind_int64(4, user.current_offenses)
            .bind_int64(5, user.total_offenses)
            .bind_int64(6, user.last_offense)
            .run();

        tx.commit();
    }

    std::vector<UserOffenses> StorageEngine::list_users(std::int64_t guild_id,
                                                        std::int64_t channel_id) const
    {
        SlowOperationReport report{ "list_users", options_.slow_operation_threshold };

        auto conn = connect();
        auto stmt = conn.prepare(kSelectUsers);
        stmt.bind_int64(1, guild_id).bind_int64(2, channel_id);

        std::vector<UserOffenses> users;
        while (stmt.step())
            users.push_back(read_user(stmt));
        return users;
    }

} // namespace mod_bot
