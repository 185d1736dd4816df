/*
Module Name:
- rules_store.hpp

Abstract:
- Public entry point of the moderation rules store. Command handlers call only this.
- Reads go through per-operation read-through caches; writes go to the storage
  engine and then evict every cache entry the write could have made stale.
- All public operations are safe to call concurrently.

Notes:
- There are no partial updates. Read the record, build a modified copy with
  copy_with(), and pass the whole record to update_config() or update_user().
- Absence is std::nullopt or an empty vector, never an exception.
*/
#pragma once

// C++ Standard Library
#include <cstdint>
#include <optional>
#include <vector>

// Core
#include <mb/rules/read_through_cache.hpp>
#include <mb/rules/records.hpp>
#include <mb/rules/storage_engine.hpp>

namespace mod_bot
{

    struct RulesStoreOptions
    {
        // When false every read goes straight to the storage engine.
        bool cache_enabled{ true };
    };

    class RulesStore
    {
    public:
        // The engine must outlive the store. Caches are owned by this instance.
        explicit RulesStore(const StorageEngine& storage, RulesStoreOptions options = {});

        RulesStore(const RulesStore&) = delete;
        RulesStore& operator=(const RulesStore&) = delete;

        // Replace the stored policy for config.key().
        // Throws InvalidRecord for a malformed record and StorageUnavailable on I/O failure.
        void update_config(const ChannelConfig& config);

        [[nodiscard]] std::optional<ChannelConfig> get_config(std::int64_t guild_id, std::int64_t channel_id);

        // Replace the stored counters for user.key(); also evicts that channel's user list.
        void update_user(const UserOffenses& user);

        [[nodiscard]] std::optional<UserOffenses>
        get_user(std::int64_t guild_id, std::int64_t channel_id, std::int64_t user_id);

        [[nodiscard]] std::vector<UserOffenses> get_users(std::int64_t guild_id, std::int64_t channel_id);

        [[nodiscard]] CacheInfo config_cache_info() const
        {
            return config_cache_.info();
        }
        [[nodiscard]] CacheInfo user_cache_info() const
        {
            return user_cache_.info();
        }
        [[nodiscard]] CacheInfo users_cache_info() const
        {
            return users_cache_.info();
        }

        // Drop all cached entries and counters. Storage is untouched.
        void clear_caches() noexcept;

        [[nodiscard]] const StorageEngine& storage() const noexcept
        {
            return storage_;
        }

        [[nodiscard]] bool cache_enabled() const noexcept
        {
            return options_.cache_enabled;
        }

    private:
        const StorageEngine& storage_;
        const RulesStoreOptions options_;

        ReadThroughCache<ChannelKey, std::optional<ChannelConfig>, ChannelKeyHash> config_cache_;
        ReadThroughCache<UserKey, std::optional<UserOffenses>, UserKeyHash> user_cache_;
        ReadThroughCache<ChannelKey, std::vector<UserOffenses>, ChannelKeyHash> users_cache_;
    };

} // namespace mod_bot
