#pragma once

/*
Module: rules_commands.hpp

Purpose:
- Operator commands over the rules store, shared by rules_ctl and its tests.

Why:
- These are the read-modify-write flows a moderation handler runs: read the
  current record, build a modified copy, write the whole row back.

Commands:
- config get   <guild> <channel>
- config set   <guild> <channel> <field>=<value>...
- user get     <guild> <channel> <user>
- user offend  <guild> <channel> <user> [<unix_ts>]
- users list   <guild> <channel>
- users reset  <guild> <channel>
*/

// C++ Standard Library
#include <cstddef>
#include <cstdint>
#include <ostream>
#include <stdexcept>
#include <string_view>
#include <vector>

// Core
#include <mb/rules/records.hpp>
#include <mb/rules/rules_store.hpp>

namespace app
{

    enum class OutputFormat
    {
        text,
        json,
    };

    // Bad command line: unknown command, wrong arity, unparsable number or field.
    class UsageError final : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

    // Policy used for a channel that has no stored row yet.
    [[nodiscard]] mod_bot::ChannelConfig default_config(std::int64_t guild_id, std::int64_t channel_id);

    // Set one non-key field of config from its text form. Throws UsageError.
    void apply_config_field(mod_bot::ChannelConfig& config, std::string_view field, std::string_view value);

    // Count one offense for the user and return the stored record.
    mod_bot::UserOffenses record_offense(mod_bot::RulesStore& store,
                                         std::int64_t guild_id,
                                         std::int64_t channel_id,
                                         std::int64_t user_id,
                                         std::int64_t now);

    // Zero current_offenses for every user of the channel; returns the number of rows rewritten.
    std::size_t reset_current_offenses(mod_bot::RulesStore& store, std::int64_t guild_id, std::int64_t channel_id);

    // Parse and run one command. args excludes the program name and global flags.
    void run_command(mod_bot::RulesStore& store,
                     const std::vector<std::string_view>& args,
                     OutputFormat format,
                     std::ostream& out);

} // namespace app
