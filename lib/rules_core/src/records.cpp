// C++ Standard Library
#include <string>

// Core
#include <mb/rules/error.hpp>
#include <mb/rules/records.hpp>

namespace mod_bot
{

    namespace
    {
        bool is_space(char c) noexcept
        {
            return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
        }

        std::string_view trim(std::string_view s) noexcept
        {
            while (!s.empty() && is_space(s.front()))
                s.remove_prefix(1);
            while (!s.empty() && is_space(s.back()))
                s.remove_suffix(1);
            return s;
        }

        void require(bool ok, std::string_view record, std::string_view what)
        {
            if (!ok)
                throw InvalidRecord(std::string{ record } + ": " + std::string{ what });
        }
    } // namespace

    std::vector<std::string> split_tokens(std::string_view text, std::string_view delimiters)
    {
        std::vector<std::string> out;
        while (!text.empty())
        {
            const auto pos = text.find_first_of(delimiters);
            const auto token = trim(text.substr(0, pos));
            if (!token.empty())
                out.emplace_back(token);
            if (pos == std::string_view::npos)
                break;
            text.remove_prefix(pos + 1);
        }
        return out;
    }

    std::vector<std::string> ChannelConfig::prefix_list() const
    {
        return split_tokens(prefixes);
    }

    void validate(const ChannelConfig& config)
    {
        require(config.guild_id != 0, "ChannelConfig", "guild_id is not set");
        require(config.channel_id != 0, "ChannelConfig", "channel_id is not set");
        require(config.event_duration >= 0, "ChannelConfig", "event_duration is negative");
        require(config.max_offenses >= 0, "ChannelConfig", "max_offenses is negative");
        require(config.timeout_duration >= 0, "ChannelConfig", "timeout_duration is negative");
    }

    void validate(const UserOffenses& user)
    {
        require(user.guild_id != 0, "UserOffenses", "guild_id is not set");
        require(user.channel_id != 0, "UserOffenses", "channel_id is not set");
        require(user.user_id != 0, "UserOffenses", "user_id is not set");
        require(user.current_offenses >= 0, "UserOffenses", "current_offenses is negative");
        require(user.total_offenses >= 0, "UserOffenses", "total_offenses is negative");
    }

} // namespace mod_bot
