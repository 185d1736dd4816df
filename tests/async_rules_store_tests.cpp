// C++ Standard Library
#include <filesystem>
#include <future>
#include <optional>
#include <utility>
#include <vector>

// Boost.Asio
#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/use_future.hpp>

// GoogleTest
#include <gtest/gtest.h>

// Core
#include <mb/rules/async_rules_store.hpp>
#include <mb/rules/error.hpp>
#include <mb/rules/storage_engine.hpp>

#include "test_support.hpp"

namespace mod_bot
{

    namespace asio = boost::asio;

    class AsyncRulesStoreTest : public ::testing::Test
    {
    protected:
        // Run one coroutine to completion on a private io_context and return its result.
        template<class T>
        T run(asio::awaitable<T> op)
        {
            asio::io_context ioc;
            auto fut = asio::co_spawn(ioc, std::move(op), asio::use_future);
            ioc.run();
            return fut.get();
        }

        test::ScratchDir dir_;
        StorageEngine engine_{ dir_ / "rules.db" };
        RulesStore rules_{ engine_ };
        AsyncRulesStore async_{ rules_ };
    };

    TEST_F(AsyncRulesStoreTest, ConfigRoundTrip)
    {
        const auto cfg = test::sample_config();
        run(async_.update_config(cfg));
        EXPECT_EQ(run(async_.get_config(cfg.guild_id, cfg.channel_id)), cfg);
    }

    TEST_F(AsyncRulesStoreTest, UserAndListRoundTrip)
    {
        run(async_.update_user(test::sample_user(1, 1, 10)));
        run(async_.update_user(test::sample_user(1, 1, 11)));

        EXPECT_EQ(run(async_.get_user(1, 1, 10)), test::sample_user(1, 1, 10));
        EXPECT_EQ(run(async_.get_users(1, 1)).size(), 2u);
        EXPECT_EQ(run(async_.get_user(1, 1, 99)), std::nullopt);
    }

    TEST_F(AsyncRulesStoreTest, SharesCacheWithWrappedStore)
    {
        run(async_.update_config(test::sample_config()));
        (void)run(async_.get_config(1234, 5678));
        (void)rules_.get_config(1234, 5678);

        EXPECT_EQ(rules_.config_cache_info().hits, 1u);
        EXPECT_EQ(&async_.store(), &rules_);
    }

    TEST_F(AsyncRulesStoreTest, ErrorsResumeTheAwaitingCoroutine)
    {
        auto bad = copy_with(test::sample_user(), [](UserOffenses& u) { u.guild_id = 0; });
        EXPECT_THROW(run(async_.update_user(bad)), InvalidRecord);
    }

    TEST_F(AsyncRulesStoreTest, ManyCoroutinesOnOneContext)
    {
        asio::io_context ioc;
        std::vector<std::future<void>> writes;
        for (std::int64_t user = 1; user <= 8; ++user)
            writes.push_back(asio::co_spawn(ioc, async_.update_user(test::sample_user(3, 3, user)), asio::use_future));
        ioc.run();
        for (auto& w : writes)
            w.get();

        EXPECT_EQ(run(async_.get_users(3, 3)).size(), 8u);
    }

} // namespace mod_bot
