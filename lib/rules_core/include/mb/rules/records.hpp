/*
Module Name:
- records.hpp

Abstract:
- Value records persisted by the rules store: per-channel moderation policy
  (ChannelConfig) and per-user offense counters (UserOffenses).
- Records are plain values. A change is expressed by copying a record with
  copy_with(), then writing the whole row back through the facade.
- Composite keys (ChannelKey, UserKey) with hashes for the cache maps.
*/
#pragma once

// C++ Standard Library
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

// Core
#include <mb/utils/attributes.hpp>

namespace mod_bot
{

    // (guild, channel) scope shared by configs and user lists.
    struct ChannelKey
    {
        std::int64_t guild_id{ 0 };
        std::int64_t channel_id{ 0 };

        friend bool operator==(const ChannelKey&, const ChannelKey&) = default;
    };

    // (guild, channel, user) scope of one offense row.
    struct UserKey
    {
        std::int64_t guild_id{ 0 };
        std::int64_t channel_id{ 0 };
        std::int64_t user_id{ 0 };

        friend bool operator==(const UserKey&, const UserKey&) = default;
    };

    namespace detail
    {
        MB_FORCE_INLINE std::size_t hash_combine(std::size_t seed, std::int64_t v) noexcept
        {
            const auto x = static_cast<std::uint64_t>(v);
            seed ^= static_cast<std::size_t>(x + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2));
            return seed;
        }
    } // namespace detail

    struct ChannelKeyHash
    {
        std::size_t operator()(const ChannelKey& k) const noexcept
        {
            return detail::hash_combine(detail::hash_combine(0, k.guild_id), k.channel_id);
        }
    };

    struct UserKeyHash
    {
        std::size_t operator()(const UserKey& k) const noexcept
        {
            std::size_t seed = detail::hash_combine(0, k.guild_id);
            seed = detail::hash_combine(seed, k.channel_id);
            return detail::hash_combine(seed, k.user_id);
        }
    };

    /// Moderation policy for one channel of one guild.
    struct ChannelConfig
    {
        std::int64_t guild_id{ 0 };
        std::int64_t channel_id{ 0 };
        double event_expectancy{ 0.0 }; ///< probability in [0, 1]
        std::int64_t event_duration{ 0 }; ///< hours
        double event_cooldown{ 0.0 }; ///< hours
        std::int64_t last_event{ 0 }; ///< Unix timestamp
        std::int64_t max_offenses{ 0 };
        std::int64_t timeout_duration{ 0 }; ///< seconds
        std::string prefixes; ///< space or comma delimited

        [[nodiscard]] ChannelKey key() const noexcept
        {
            return { guild_id, channel_id };
        }

        /// Tokens of 'prefixes' with empty entries and whitespace removed.
        [[nodiscard]] std::vector<std::string> prefix_list() const;

        friend bool operator==(const ChannelConfig&, const ChannelConfig&) = default;
    };

    /// Offense counters for one user in one channel.
    struct UserOffenses
    {
        std::int64_t guild_id{ 0 };
        std::int64_t channel_id{ 0 };
        std::int64_t user_id{ 0 };
        std::int64_t current_offenses{ 0 }; ///< reset periodically by callers
        std::int64_t total_offenses{ 0 }; ///< never decreases for a given key
        std::int64_t last_offense{ 0 }; ///< Unix timestamp

        [[nodiscard]] UserKey key() const noexcept
        {
            return { guild_id, channel_id, user_id };
        }

        // Scope of the get_users() list this row belongs to.
        [[nodiscard]] ChannelKey channel_key() const noexcept
        {
            return { guild_id, channel_id };
        }

        friend bool operator==(const UserOffenses&, const UserOffenses&) = default;
    };

    // Copy 'base' and apply 'overrides' to the copy. 'base' is never touched.
    //   auto next = copy_with(cfg, [](ChannelConfig& c) { c.max_offenses = 5; });
    template<class Record, std::invocable<Record&> Overrides>
    [[nodiscard]] Record copy_with(const Record& base, Overrides&& overrides)
    {
        Record next{ base };
        std::invoke(std::forward<Overrides>(overrides), next);
        return next;
    }

    // Split on any character in 'delimiters'; trims whitespace and drops empty tokens.
    [[nodiscard]] std::vector<std::string> split_tokens(std::string_view text,
                                                        std::string_view delimiters = " ,");

    // Throw InvalidRecord when a record breaks the data model contract
    // (zero key ids, negative counts or durations).
    void validate(const ChannelConfig& config);
    void validate(const UserOffenses& user);

} // namespace mod_bot
