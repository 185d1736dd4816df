// C++ Standard Library
#include <chrono>
#include <filesystem>

// GoogleTest
#include <gtest/gtest.h>

// Core
#include <mb/rules/config.hpp>

#include "test_support.hpp"

namespace env
{

    using namespace std::chrono_literals;

    class ConfigTest : public ::testing::Test
    {
    protected:
        mod_bot::test::ScratchDir dir_;
    };

    TEST_F(ConfigTest, MinimalFileUsesDefaults)
    {
        const auto file = dir_.write_file("rules.toml", "[storage]\npath = \"data/rules.db\"\n");
        const auto cfg = Config::load_file(file);

        EXPECT_EQ(cfg.storage().busy_timeout, 5000ms);
        EXPECT_EQ(cfg.storage().slow_operation, 250ms);
        EXPECT_TRUE(cfg.cache().enabled);
        EXPECT_TRUE(cfg.rules_options().cache_enabled);
        EXPECT_TRUE(cfg.path().is_absolute());
    }

    TEST_F(ConfigTest, RelativeStoragePathFollowsConfigFile)
    {
        const auto file = dir_.write_file("rules.toml", "[storage]\npath = \"data/rules.db\"\n");
        const auto cfg = Config::load_file(file);

        EXPECT_EQ(cfg.storage().path, std::filesystem::absolute(dir_.path()) / "data/rules.db");
    }

    TEST_F(ConfigTest, AbsoluteStoragePathIsKept)
    {
        const auto target = std::filesystem::absolute(dir_.path()) / "elsewhere.db";
        const auto file = dir_.write_file("rules.toml", "[storage]\npath = '" + target.string() + "'\n");

        EXPECT_EQ(Config::load_file(file).storage().path, target);
    }

    TEST_F(ConfigTest, ExplicitValuesOverrideDefaults)
    {
        const auto file = dir_.write_file("rules.toml",
                                          "[storage]\n"
                                          "path = \"x.db\"\n"
                                          "busy_timeout_ms = 100\n"
                                          "slow_operation_ms = 0\n"
                                          "[cache]\n"
                                          "enabled = false\n");
        const auto cfg = Config::load_file(file);

        EXPECT_EQ(cfg.storage_options().busy_timeout, 100ms);
        EXPECT_EQ(cfg.storage_options().slow_operation_threshold, 0ms);
        EXPECT_FALSE(cfg.rules_options().cache_enabled);
    }

    TEST_F(ConfigTest, MissingFileIsRejected)
    {
        EXPECT_THROW((void)Config::load_file(dir_ / "absent.toml"), EnvError);
        EXPECT_THROW((void)Config::load_file(""), EnvError);
    }

    TEST_F(ConfigTest, MissingStoragePathIsRejected)
    {
        const auto file = dir_.write_file("rules.toml", "[cache]\nenabled = true\n");
        EXPECT_THROW((void)Config::load_file(file), EnvError);
    }

    TEST_F(ConfigTest, EmptyStoragePathIsRejected)
    {
        const auto file = dir_.write_file("rules.toml", "[storage]\npath = \"\"\n");
        EXPECT_THROW((void)Config::load_file(file), EnvError);
    }

    TEST_F(ConfigTest, WrongTypesAreRejected)
    {
        const auto timeout = dir_.write_file("a.toml", "[storage]\npath = \"x.db\"\nbusy_timeout_ms = \"soon\"\n");
        EXPECT_THROW((void)Config::load_file(timeout), EnvError);

        const auto enabled = dir_.write_file("b.toml", "[storage]\npath = \"x.db\"\n[cache]\nenabled = 1\n");
        EXPECT_THROW((void)Config::load_file(enabled), EnvError);

        const auto negative = dir_.write_file("c.toml", "[storage]\npath = \"x.db\"\nbusy_timeout_ms = -5\n");
        EXPECT_THROW((void)Config::load_file(negative), EnvError);
    }

    TEST_F(ConfigTest, MalformedTomlIsRejected)
    {
        const auto file = dir_.write_file("rules.toml", "[storage\npath = ");
        EXPECT_THROW((void)Config::load_file(file), EnvError);
    }

} // namespace env
