// C++ Standard Library
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

// GoogleTest
#include <gtest/gtest.h>

// Core
#include <mb/rules/error.hpp>
#include <mb/rules/rules_store.hpp>
#include <mb/rules/storage_engine.hpp>

// App
#include <app/rules_commands.hpp>

#include "test_support.hpp"

namespace app
{

    class RulesCommandsTest : public ::testing::Test
    {
    protected:
        std::string run(std::vector<std::string_view> args, OutputFormat format = OutputFormat::text)
        {
            std::ostringstream out;
            run_command(rules_, args, format, out);
            return out.str();
        }

        mod_bot::test::ScratchDir dir_;
        mod_bot::StorageEngine engine_{ dir_ / "rules.db" };
        mod_bot::RulesStore rules_{ engine_ };
    };

    TEST_F(RulesCommandsTest, ConfigSetCreatesFromDefaults)
    {
        const auto text = run({ "config", "set", "10", "20", "max_offenses=5", "prefixes=3pseat,3pfeet" });
        EXPECT_NE(text.find("max_offenses: 5"), std::string::npos);

        const auto stored = rules_.get_config(10, 20);
        ASSERT_TRUE(stored.has_value());
        EXPECT_EQ(stored->max_offenses, 5);
        EXPECT_EQ(stored->timeout_duration, default_config(10, 20).timeout_duration);
        EXPECT_EQ(stored->prefix_list(), (std::vector<std::string>{ "3pseat", "3pfeet" }));
    }

    TEST_F(RulesCommandsTest, ConfigSetKeepsUnmentionedFields)
    {
        rules_.update_config(mod_bot::test::sample_config(10, 20));
        (void)run({ "config", "set", "10", "20", "event_expectancy=0.25" });

        const auto stored = rules_.get_config(10, 20);
        ASSERT_TRUE(stored.has_value());
        EXPECT_DOUBLE_EQ(stored->event_expectancy, 0.25);
        EXPECT_EQ(stored->prefixes, "3pseat 3pfeet");
    }

    TEST_F(RulesCommandsTest, ConfigGetReportsAbsence)
    {
        EXPECT_EQ(run({ "config", "get", "1", "2" }), "no record\n");
        EXPECT_EQ(run({ "config", "get", "1", "2" }, OutputFormat::json), "null\n");
    }

    TEST_F(RulesCommandsTest, KeyFieldsAreReadOnly)
    {
        EXPECT_THROW(run({ "config", "set", "1", "2", "guild_id=3" }), UsageError);
        EXPECT_THROW(run({ "config", "set", "1", "2", "max_offenses=abc" }), UsageError);
        EXPECT_THROW(run({ "config", "set", "1", "2", "max_offenses" }), UsageError);
        EXPECT_EQ(rules_.get_config(1, 2), std::nullopt);
    }

    TEST_F(RulesCommandsTest, OffendCountsBothCounters)
    {
        (void)run({ "user", "offend", "1", "2", "3", "100" });
        (void)run({ "user", "offend", "1", "2", "3", "200" });

        const auto user = rules_.get_user(1, 2, 3);
        ASSERT_TRUE(user.has_value());
        EXPECT_EQ(user->current_offenses, 2);
        EXPECT_EQ(user->total_offenses, 2);
        EXPECT_EQ(user->last_offense, 200);
    }

    TEST_F(RulesCommandsTest, ResetClearsCurrentButKeepsTotal)
    {
        (void)record_offense(rules_, 1, 2, 3, 100);
        (void)record_offense(rules_, 1, 2, 4, 100);
        (void)record_offense(rules_, 1, 9, 3, 100);

        EXPECT_EQ(run({ "users", "reset", "1", "2" }), "reset 2 users\n");

        for (const auto& u : rules_.get_users(1, 2))
        {
            EXPECT_EQ(u.current_offenses, 0);
            EXPECT_EQ(u.total_offenses, 1);
        }
        EXPECT_EQ(rules_.get_user(1, 9, 3)->current_offenses, 1);
        EXPECT_EQ(reset_current_offenses(rules_, 1, 2), 0u);
    }

    TEST_F(RulesCommandsTest, JsonOutputUsesColumnNames)
    {
        (void)record_offense(rules_, 1, 2, 3, 100);
        const auto json = run({ "user", "get", "1", "2", "3" }, OutputFormat::json);

        EXPECT_NE(json.find("\"user_id\":3"), std::string::npos);
        EXPECT_NE(json.find("\"total_offenses\":1"), std::string::npos);

        const auto list = run({ "users", "list", "1", "2" }, OutputFormat::json);
        EXPECT_EQ(list.front(), '[');
    }

    TEST_F(RulesCommandsTest, ZeroIdsSurfaceAsInvalidRecord)
    {
        EXPECT_THROW(run({ "user", "offend", "0", "2", "3", "1" }), mod_bot::InvalidRecord);
    }

    TEST_F(RulesCommandsTest, BadCommandLinesAreUsageErrors)
    {
        EXPECT_THROW(run({}), UsageError);
        EXPECT_THROW(run({ "config" }), UsageError);
        EXPECT_THROW(run({ "config", "drop", "1", "2" }), UsageError);
        EXPECT_THROW(run({ "users", "list", "1" }), UsageError);
        EXPECT_THROW(run({ "user", "get", "x", "2", "3" }), UsageError);
    }

} // namespace app
