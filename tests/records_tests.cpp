// C++ Standard Library
#include <string>
#include <vector>

// GoogleTest
#include <gtest/gtest.h>

// Core
#include <mb/rules/error.hpp>
#include <mb/rules/records.hpp>

#include "test_support.hpp"

namespace mod_bot
{

    using Tokens = std::vector<std::string>;

    TEST(SplitTokens, EmptyAndBlankInputGiveNoTokens)
    {
        EXPECT_EQ(split_tokens(""), Tokens{});
        EXPECT_EQ(split_tokens("   "), Tokens{});
        EXPECT_EQ(split_tokens(" , ,, "), Tokens{});
    }

    TEST(SplitTokens, SingleToken)
    {
        EXPECT_EQ(split_tokens("abc"), Tokens{ "abc" });
    }

    TEST(SplitTokens, MixedDelimitersAndPadding)
    {
        EXPECT_EQ(split_tokens(" abc, def "), (Tokens{ "abc", "def" }));
        EXPECT_EQ(split_tokens("a,b c,,d"), (Tokens{ "a", "b", "c", "d" }));
    }

    TEST(SplitTokens, CustomDelimiters)
    {
        EXPECT_EQ(split_tokens("a;b c", ";"), (Tokens{ "a", "b c" }));
    }

    TEST(ChannelConfigRecord, PrefixListSplitsStoredPrefixes)
    {
        const auto cfg = test::sample_config();
        EXPECT_EQ(cfg.prefix_list(), (Tokens{ "3pseat", "3pfeet" }));

        auto empty = cfg;
        empty.prefixes.clear();
        EXPECT_TRUE(empty.prefix_list().empty());
    }

    TEST(ChannelConfigRecord, KeyIsGuildAndChannel)
    {
        const auto cfg = test::sample_config(7, 8);
        EXPECT_EQ(cfg.key(), (ChannelKey{ 7, 8 }));
    }

    TEST(UserOffensesRecord, KeysCoverRowAndChannel)
    {
        const auto user = test::sample_user(1, 2, 3);
        EXPECT_EQ(user.key(), (UserKey{ 1, 2, 3 }));
        EXPECT_EQ(user.channel_key(), (ChannelKey{ 1, 2 }));
    }

    TEST(CopyWith, OverridesApplyToCopyOnly)
    {
        const auto base = test::sample_config();
        const auto next = copy_with(base, [](ChannelConfig& c) { c.max_offenses = 9; });

        EXPECT_EQ(base.max_offenses, 3);
        EXPECT_EQ(next.max_offenses, 9);
        EXPECT_EQ(next.prefixes, base.prefixes);
        EXPECT_NE(next, base);
    }

    TEST(KeyHash, DistinguishesFieldOrder)
    {
        ChannelKeyHash hash;
        EXPECT_NE(hash(ChannelKey{ 1, 2 }), hash(ChannelKey{ 2, 1 }));
        EXPECT_EQ(hash(ChannelKey{ 1, 2 }), hash(ChannelKey{ 1, 2 }));
    }

    TEST(Validate, AcceptsWellFormedRecords)
    {
        EXPECT_NO_THROW(validate(test::sample_config()));
        EXPECT_NO_THROW(validate(test::sample_user()));

        UserOffenses fresh{ .guild_id = 1, .channel_id = 2, .user_id = 3 };
        EXPECT_NO_THROW(validate(fresh));
    }

    TEST(Validate, RejectsZeroKeyIds)
    {
        EXPECT_THROW(validate(copy_with(test::sample_config(), [](ChannelConfig& c) { c.guild_id = 0; })),
                     InvalidRecord);
        EXPECT_THROW(validate(copy_with(test::sample_config(), [](ChannelConfig& c) { c.channel_id = 0; })),
                     InvalidRecord);
        EXPECT_THROW(validate(copy_with(test::sample_user(), [](UserOffenses& u) { u.user_id = 0; })),
                     InvalidRecord);
    }

    TEST(Validate, RejectsNegativeCountsAndDurations)
    {
        EXPECT_THROW(validate(copy_with(test::sample_config(), [](ChannelConfig& c) { c.timeout_duration = -1; })),
                     InvalidRecord);
        EXPECT_THROW(validate(copy_with(test::sample_config(), [](ChannelConfig& c) { c.max_offenses = -1; })),
                     InvalidRecord);
        EXPECT_THROW(validate(copy_with(test::sample_user(), [](UserOffenses& u) { u.current_offenses = -1; })),
                     InvalidRecord);
    }

    TEST(ErrorCodes, CarryRulesCategory)
    {
        try
        {
            throw InvalidRecord("bad");
        }
        catch (const RulesError& e)
        {
            EXPECT_EQ(e.code(), errc::invalid_record);
            EXPECT_STREQ(e.code().category().name(), "mb.rules");
        }

        const std::error_code ec = errc::storage_unavailable;
        EXPECT_EQ(ec.message(), "storage unavailable");
    }

} // namespace mod_bot
