/*
Module: rules_commands.cpp

Purpose:
- Implement the rules_ctl commands on top of mod_bot::RulesStore.

Notes:
- Numbers are parsed with std::from_chars: no locale, no partial matches.
- "config set" starts from the stored row, or default_config() for a new channel,
  so unspecified fields keep their current values.
- "users reset" rewrites each row with current_offenses = 0 and leaves
  total_offenses untouched.
*/

// C++ Standard Library
#include <charconv>
#include <chrono>
#include <optional>
#include <string>
#include <system_error>

// App
#include <app/record_json.hpp>
#include <app/rules_commands.hpp>

namespace app
{

    using mod_bot::ChannelConfig;
    using mod_bot::UserOffenses;

    namespace
    {
        template<class T>
        T parse_number(std::string_view what, std::string_view text)
        {
            T value{};
            const auto* first = text.data();
            const auto* last = text.data() + text.size();
            const auto [ptr, ec] = std::from_chars(first, last, value);
            if (ec != std::errc{} || ptr != last || text.empty())
                throw UsageError("invalid " + std::string{ what } + ": '" + std::string{ text } + "'");
            return value;
        }

        std::int64_t parse_id(std::string_view what, std::string_view text)
        {
            return parse_number<std::int64_t>(what, text);
        }

        void expect_args(const std::vector<std::string_view>& args, std::size_t min, std::size_t max)
        {
            if (args.size() < min || args.size() > max)
            {
                std::string msg{ "wrong number of arguments for '" };
                msg.append(args[0]).append(" ").append(args[1]).append("'");
                throw UsageError(msg);
            }
        }

        void print(std::ostream& out, const ChannelConfig& c)
        {
            out << "guild_id: " << c.guild_id << '\n'
                << "channel_id: " << c.channel_id << '\n'
                << "event_expectancy: " << c.event_expectancy << '\n'
                << "event_duration: " << c.event_duration << '\n'
                << "event_cooldown: " << c.event_cooldown << '\n'
                << "last_event: " << c.last_event << '\n'
                << "max_offenses: " << c.max_offenses << '\n'
                << "timeout_duration: " << c.timeout_duration << '\n'
                << "prefixes: " << c.prefixes << '\n';
        }

        void print(std::ostream& out, const UserOffenses& u)
        {
            out << "guild_id: " << u.guild_id << '\n'
                << "channel_id: " << u.channel_id << '\n'
                << "user_id: " << u.user_id << '\n'
                << "current_offenses: " << u.current_offenses << '\n'
                << "total_offenses: " << u.total_offenses << '\n'
                << "last_offense: " << u.last_offense << '\n';
        }

        template<class Record>
        void emit(std::ostream& out, OutputFormat format, const std::optional<Record>& record)
        {
            if (format == OutputFormat::json)
            {
                out << to_json(record) << '\n';
                return;
            }
            if (!record)
            {
                out << "no record\n";
                return;
            }
            print(out, *record);
        }

        void emit(std::ostream& out, OutputFormat format, const std::vector<UserOffenses>& users)
        {
            if (format == OutputFormat::json)
            {
                out << to_json(users) << '\n';
                return;
            }
            out << users.size() << (users.size() == 1 ? " user\n" : " users\n");
            for (const auto& u : users)
            {
                out << '\n';
                print(out, u);
            }
        }
    } // namespace

    ChannelConfig default_config(std::int64_t guild_id, std::int64_t channel_id)
    {
        return ChannelConfig{
            .guild_id = guild_id,
            .channel_id = channel_id,
            .event_expectancy = 0.0,
            .event_duration = 0,
            .event_cooldown = 0.0,
            .last_event = 0,
            .max_offenses = 3,
            .timeout_duration = 300,
            .prefixes = {},
        };
    }

    void apply_config_field(ChannelConfig& config, std::string_view field, std::string_view value)
    {
        if (field == "event_expectancy")
            config.event_expectancy = parse_number<double>(field, value);
        else if (field == "event_duration")
            config.event_duration = parse_number<std::int64_t>(field, value);
        else if (field == "event_cooldown")
            config.event_cooldown = parse_number<double>(field, value);
        else if (field == "last_event")
            config.last_event = parse_number<std::int64_t>(field, value);
        else if (field == "max_offenses")
            config.max_offenses = parse_number<std::int64_t>(field, value);
        else if (field == "timeout_duration")
            config.timeout_duration = parse_number<std::int64_t>(field, value);
        else if (field == "prefixes")
            config.prefixes = std::string{ value };
        else
            throw UsageError("unknown or read-only config field '" + std::string{ field } + "'");
    }

    UserOffenses record_offense(mod_bot::RulesStore& store,
                                std::int64_t guild_id,
                                std::int64_t channel_id,
                                std::int64_t user_id,
                                std::int64_t now)
    {
        const auto current = store.get_user(guild_id, channel_id, user_id)
                                 .value_or(UserOffenses{ .guild_id = guild_id, .channel_id = channel_id, .user_id = user_id });

        const auto next = mod_bot::copy_with(current, [now](UserOffenses& u) {
            ++u.current_offenses;
            ++u.total_offenses;
            u.last_offense = now;
        });
        store.update_user(next);
        return next;
    }

    std::size_t reset_current_offenses(mod_bot::RulesStore& store, std::int64_t guild_id, std::int64_t channel_id)
    {
        std::size_t changed = 0;
        for (const auto& user : store.get_users(guild_id, channel_id))
        {
            if (user.current_offenses == 0)
                continue;
            store.update_user(mod_bot::copy_with(user, [](UserOffenses& u) { u.current_offenses = 0; }));
            ++changed;
        }
        return changed;
    }

    void run_command(mod_bot::RulesStore& store,
                     const std::vector<std::string_view>& args,
                     OutputFormat format,
                     std::ostream& out)
    {
        if (args.size() < 2)
            throw UsageError("missing command");

        const auto noun = args[0];
        const auto verb = args[1];

        // ---------- config ----------------------------------------------------------
        if (noun == "config" && verb == "get")
        {
            expect_args(args, 4, 4);
            emit(out, format, store.get_config(parse_id("guild", args[2]), parse_id("channel", args[3])));
            return;
        }
        if (noun == "config" && verb == "set")
        {
            expect_args(args, 5, args.size());
            const auto guild_id = parse_id("guild", args[2]);
            const auto channel_id = parse_id("channel", args[3]);

            const auto base = store.get_config(guild_id, channel_id).value_or(default_config(guild_id, channel_id));
            const auto next = mod_bot::copy_with(base, [&args](ChannelConfig& c) {
                for (std::size_t i = 4; i < args.size(); ++i)
                {
                    const auto pos = args[i].find('=');
                    if (pos == std::string_view::npos)
                        throw UsageError("expected <field>=<value>, got '" + std::string{ args[i] } + "'");
                    apply_config_field(c, args[i].substr(0, pos), args[i].substr(pos + 1));
                }
            });
            store.update_config(next);
            emit(out, format, std::optional<ChannelConfig>{ next });
            return;
        }

        // ---------- user ------------------------------------------------------------
        if (noun == "user" && verb == "get")
        {
            expect_args(args, 5, 5);
            emit(out,
                 format,
                 store.get_user(parse_id("guild", args[2]), parse_id("channel", args[3]), parse_id("user", args[4])));
            return;
        }
        if (noun == "user" && verb == "offend")
        {
            expect_args(args, 5, 6);
            const auto now = args.size() == 6
                                 ? parse_id("timestamp", args[5])
                                 : static_cast<std::int64_t>(std::chrono::duration_cast<std::chrono::seconds>(
                                                                 std::chrono::system_clock::now().time_since_epoch())
                                                                 .count());
            const auto stored = record_offense(
                store, parse_id("guild", args[2]), parse_id("channel", args[3]), parse_id("user", args[4]), now);
            emit(out, format, std::optional<UserOffenses>{ stored });
            return;
        }

        // ---------- users -----------------------------------------------------------
        if (noun == "users" && verb == "list")
        {
            expect_args(args, 4, 4);
            emit(out, format, store.get_users(parse_id("guild", args[2]), parse_id("channel", args[3])));
            return;
        }
        if (noun == "users" && verb == "reset")
        {
            expect_args(args, 4, 4);
            const auto changed = reset_current_offenses(store, parse_id("guild", args[2]), parse_id("channel", args[3]));
            if (format == OutputFormat::json)
                out << "{\"reset\":" << changed << "}\n";
            else
                out << "reset " << changed << (changed == 1 ? " user\n" : " users\n");
            return;
        }

        throw UsageError("unknown command '" + std::string{ noun } + " " + std::string{ verb } + "'");
    }

} // namespace app
