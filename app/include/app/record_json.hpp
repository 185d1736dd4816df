#pragma once

// JSON rendering of rules records for rules_ctl --json.
// Field names match the SQLite column names so output can be diffed against the store.

// C++ Standard Library
#include <stdexcept>
#include <string>

// Glaze
#include <glaze/json.hpp>

// Core
#include <mb/rules/records.hpp>

template<>
struct glz::meta<mod_bot::ChannelConfig>
{
    using T = mod_bot::ChannelConfig;
    static constexpr auto value = glz::object("guild_id", &T::guild_id,
                                              "channel_id", &T::channel_id,
                                              "event_expectancy", &T::event_expectancy,
                                              "event_duration", &T::event_duration,
                                              "event_cooldown", &T::event_cooldown,
                                              "last_event", &T::last_event,
                                              "max_offenses", &T::max_offenses,
                                              "timeout_duration", &T::timeout_duration,
                                              "prefixes", &T::prefixes);
};

template<>
struct glz::meta<mod_bot::UserOffenses>
{
    using T = mod_bot::UserOffenses;
    static constexpr auto value = glz::object("guild_id", &T::guild_id,
                                              "channel_id", &T::channel_id,
                                              "user_id", &T::user_id,
                                              "current_offenses", &T::current_offenses,
                                              "total_offenses", &T::total_offenses,
                                              "last_offense", &T::last_offense);
};

namespace app
{

    // Serialise any record, optional record or vector of records.
    template<class T>
    [[nodiscard]] std::string to_json(const T& value)
    {
        std::string buffer;
        if (glz::error_ctx ec = glz::write_json(value, buffer); ec)
        {
            throw std::runtime_error("JSON encoding failed");
        }
        return buffer;
    }

} // namespace app
