/*
Module Name:
- rules_store.cpp

Abstract:
- Combines StorageEngine and the three read caches.

Why:
- Eviction is scheduled with gsl::finally before the storage call, so it runs on
  every exit path. A write that failed after touching the file still drops the
  cached row, and no reader can see a pre-write value once update_* has returned.
- Storage comes first, eviction second. The cache generation check covers the
  window in between, so a concurrent miss cannot store the old row.
*/

// GSL
#include <gsl/gsl>

// Core
#include <mb/rules/rules_store.hpp>

namespace mod_bot
{

    RulesStore::RulesStore(const StorageEngine& storage, RulesStoreOptions options) :
        storage_{ storage },
        options_{ options },
        config_cache_{ "get_config" },
        user_cache_{ "get_user" },
        users_cache_{ "get_users" }
    {
    }

    void RulesStore::update_config(const ChannelConfig& config)
    {
        validate(config);

        const auto key = config.key();
        auto evict = gsl::finally([this, key]() noexcept { config_cache_.invalidate(key); });
        storage_.put_config(config);
    }

    std::optional<ChannelConfig> RulesStore::get_config(std::int64_t guild_id, std::int64_t channel_id)
    {
        auto load = [&] { return storage_.get_config(guild_id, channel_id); };
        if (!options_.cache_enabled)
            return load();
        return config_cache_.get_or_load(ChannelKey{ guild_id, channel_id }, load);
    }

    void RulesStore::update_user(const UserOffenses& user)
    {
        validate(user);

        const auto key = user.key();
        const auto list_key = user.channel_key();
        auto evict = gsl::finally([this, key, list_key]() noexcept {
            user_cache_.invalidate(key);
            users_cache_.invalidate(list_key);
        });
        storage_.put_user(user);
    }

    std::optional<UserOffenses> RulesStore::get_user(std::int64_t guild_id,
                                                     std::int64_t channel_id,
                                                     std::int64_t user_id)
    {
        auto load = [&] { return storage_.get_user(guild_id, channel_id, user_id); };
        if (!options_.cache_enabled)
            return load();
        return user_cache_.get_or_load(UserKey{ guild_id, channel_id, user_id }, load);
    }

    std::vector<UserOffenses> RulesStore::get_users(std::int64_t guild_id, std::int64_t channel_id)
    {
        auto load = [&] { return storage_.list_users(guild_id, channel_id); };
        if (!options_.cache_enabled)
            return load();
        return users_cache_.get_or_load(ChannelKey{ guild_id, channel_id }, load);
    }

    void RulesStore::clear_caches() noexcept
    {
        config_cache_.clear();
        user_cache_.clear();
        users_cache_.clear();
    }

} // namespace mod_bot
