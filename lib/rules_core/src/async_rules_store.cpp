/*
Module Name:
- async_rules_store.cpp

Abstract:
- Each operation copies its arguments into the pool task so nothing refers to
  the caller's frame once the coroutine is suspended.
*/

// Core
#include <mb/rules/async_rules_store.hpp>

namespace mod_bot
{

    AsyncRulesStore::AsyncRulesStore(RulesStore& store, std::size_t threads) :
        store_{ store }, pool_{ threads > 0 ? threads : 1 }
    {
    }

    AsyncRulesStore::~AsyncRulesStore()
    {
        join();
    }

    void AsyncRulesStore::join()
    {
        pool_.join();
    }

    boost::asio::awaitable<void> AsyncRulesStore::update_config(ChannelConfig config)
    {
        co_await run_blocking([this, config = std::move(config)] { store_.update_config(config); });
    }

    boost::asio::awaitable<std::optional<ChannelConfig>>
    AsyncRulesStore::get_config(std::int64_t guild_id, std::int64_t channel_id)
    {
        co_return co_await run_blocking([this, guild_id, channel_id] {
            return store_.get_config(guild_id, channel_id);
        });
    }

    boost::asio::awaitable<void> AsyncRulesStore::update_user(UserOffenses user)
    {
        co_await run_blocking([this, user] { store_.update_user(user); });
    }

    boost::asio::awaitable<std::optional<UserOffenses>>
    AsyncRulesStore::get_user(std::int64_t guild_id, std::int64_t channel_id, std::int64_t user_id)
    {
        co_return co_await run_blocking([this, guild_id, channel_id, user_id] {
            return store_.get_user(guild_id, channel_id, user_id);
        });
    }

    boost::asio::awaitable<std::vector<UserOffenses>>
    AsyncRulesStore::get_users(std::int64_t guild_id, std::int64_t channel_id)
    {
        co_return co_await run_blocking([this, guild_id, channel_id] {
            return store_.get_users(guild_id, channel_id);
        });
    }

} // namespace mod_bot
