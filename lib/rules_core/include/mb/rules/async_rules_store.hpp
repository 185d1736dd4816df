/*
Module Name:
- async_rules_store.hpp

Abstract:
- Coroutine front end for RulesStore. Every storage call blocks on file I/O, so
  each operation is shipped to a small dedicated thread pool and the awaiting
  coroutine resumes with the result, or with the exception the call raised.
- Keeps event-loop threads (chat handlers, timers) free of disk waits.

Notes:
- The wrapped RulesStore must outlive this object.
- Calls are not cancellable once started; a caller that stops awaiting leaves
  the operation to finish on the pool.
*/
#pragma once

// C++ Standard Library
#include <cstddef>
#include <cstdint>
#include <optional>
#include <type_traits>
#include <utility>
#include <vector>

// Boost.Asio
#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/thread_pool.hpp>
#include <boost/asio/use_awaitable.hpp>

// Core
#include <mb/rules/records.hpp>
#include <mb/rules/rules_store.hpp>

namespace mod_bot
{

    inline constexpr std::size_t kDefaultStorageThreads = 2;

    class AsyncRulesStore
    {
    public:
        explicit AsyncRulesStore(RulesStore& store, std::size_t threads = kDefaultStorageThreads);

        // Joins the pool: outstanding storage calls finish before destruction completes.
        ~AsyncRulesStore();

        AsyncRulesStore(const AsyncRulesStore&) = delete;
        AsyncRulesStore& operator=(const AsyncRulesStore&) = delete;

        [[nodiscard]] boost::asio::awaitable<void> update_config(ChannelConfig config);

        [[nodiscard]] boost::asio::awaitable<std::optional<ChannelConfig>>
        get_config(std::int64_t guild_id, std::int64_t channel_id);

        [[nodiscard]] boost::asio::awaitable<void> update_user(UserOffenses user);

        [[nodiscard]] boost::asio::awaitable<std::optional<UserOffenses>>
        get_user(std::int64_t guild_id, std::int64_t channel_id, std::int64_t user_id);

        [[nodiscard]] boost::asio::awaitable<std::vector<UserOffenses>>
        get_users(std::int64_t guild_id, std::int64_t channel_id);

        // Wait for every queued call to complete. No new work may be submitted afterwards.
        void join();

        [[nodiscard]] RulesStore& store() noexcept
        {
            return store_;
        }

    private:
        // Body of the pool task. fn is a coroutine parameter, so it lives in the
        // coroutine frame rather than in a capturing coroutine lambda.
        template<class Fn>
        static boost::asio::awaitable<std::invoke_result_t<Fn&>> invoke_on_pool(Fn fn)
        {
            if constexpr (std::is_void_v<std::invoke_result_t<Fn&>>)
            {
                fn();
                co_return;
            }
            else
            {
                co_return fn();
            }
        }

        // Run fn on the pool and resume the caller on its own executor with the result.
        template<class Fn>
        boost::asio::awaitable<std::invoke_result_t<Fn&>> run_blocking(Fn fn)
        {
            if constexpr (std::is_void_v<std::invoke_result_t<Fn&>>)
            {
                co_await boost::asio::co_spawn(
                    pool_.get_executor(), invoke_on_pool(std::move(fn)), boost::asio::use_awaitable);
            }
            else
            {
                co_return co_await boost::asio::co_spawn(
                    pool_.get_executor(), invoke_on_pool(std::move(fn)), boost::asio::use_awaitable);
            }
        }

        RulesStore& store_;
        boost::asio::thread_pool pool_; // storage workers
    };

} // namespace mod_bot
