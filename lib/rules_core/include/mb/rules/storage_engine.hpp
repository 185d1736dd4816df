/*
Module Name:
- storage_engine.hpp

Abstract:
- Durable CRUD over the two moderation tables in a single SQLite file:
  channel_configs keyed by (guild_id, channel_id) and user_offenses keyed by
  (guild_id, channel_id, user_id).
- Writes replace the whole row: delete then insert inside one immediate
  transaction, so concurrent writers never observe or leave a half-written key.
- Each call opens its own connection and closes it before returning.

Notes:
- Calls block on file I/O. Coroutine callers should go through AsyncRulesStore.
- Failures surface as StorageUnavailable; absence is std::nullopt or an empty vector.
*/
#pragma once

// C++ Standard Library
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string_view>
#include <vector>

// Core
#include <mb/rules/records.hpp>

namespace mod_bot
{

    namespace sqlite
    {
        class Connection;
    }

    struct StorageOptions
    {
        // How long a writer waits for another writer's lock before failing.
        std::chrono::milliseconds busy_timeout{ 5000 };

        // Operations slower than this are reported on stderr. Zero disables the report.
        std::chrono::milliseconds slow_operation_threshold{ 250 };
    };

    class StorageEngine
    {
    public:
        // Create parent directories and the database file when missing, then
        // create both tables if they do not exist yet.
        // Throws StorageUnavailable when the directory or file cannot be created or opened.
        explicit StorageEngine(std::filesystem::path path, StorageOptions options = {});

        StorageEngine(const StorageEngine&) = delete;
        StorageEngine& operator=(const StorageEngine&) = delete;

        [[nodiscard]] std::optional<ChannelConfig> get_config(std::int64_t guild_id,
                                                              std::int64_t channel_id) const;

        // Replace the row for config.key().
        void put_config(const ChannelConfig& config) const;

        [[nodiscard]] std::optional<UserOffenses>
        get_user(std::int64_t guild_id, std::int64_t channel_id, std::int64_t user_id) const;

        // Replace the row for user.key(). Throws InvalidRecord when user.total_offenses
        // is below the stored total for the same key.
        void put_user(const UserOffenses& user) const;

        // All users recorded under (guild_id, channel_id), in no particular order.
        [[nodiscard]] std::vector<UserOffenses> list_users(std::int64_t guild_id,
                                                           std::int64_t channel_id) const;

        [[nodiscard]] const std::filesystem::path& path() const noexcept
        {
            return path_;
        }

        [[nodiscard]] const StorageOptions& options() const noexcept
        {
            return options_;
        }

    private:
        [[nodiscard]] sqlite::Connection connect() const;
        void create_schema() const;

        const std::filesystem::path path_;
        const StorageOptions options_;
    };

} // namespace mod_bot
