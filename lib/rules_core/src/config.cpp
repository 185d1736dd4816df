// C++ Standard Library
#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

// TOML++
#include <toml++/toml.hpp>

// Core
#include <mb/rules/config.hpp>

namespace env
{

    namespace
    {
        // Walk a dotted key path. Returns nullptr when any segment is missing.
        const toml::node* find_node(const toml::table& root, std::initializer_list<std::string_view> keys)
        {
            const toml::node* node = &root;
            for (auto key : keys)
            {
                const auto* table_ptr = node->as_table();
                if (!table_ptr)
                    return nullptr;
                node = table_ptr->get(key);
                if (!node)
                    return nullptr;
            }
            return node;
        }

        std::string dotted(std::initializer_list<std::string_view> keys)
        {
            std::string out;
            for (auto key : keys)
            {
                if (!out.empty())
                    out.push_back('.');
                out.append(key);
            }
            return out;
        }

        // Return a non-empty string at dotted key path or throw EnvError.
        std::string fetch_string(const toml::table& root,
                                 std::initializer_list<std::string_view> keys,
                                 const std::string& path_str)
        {
            const auto* node = find_node(root, keys);
            if (!node)
                throw EnvError("Missing key '" + dotted(keys) + "' in " + path_str);

            if (auto opt = node->value<std::string>(); opt && !opt->empty())
                return *opt;

            throw EnvError("Invalid value for '" + dotted(keys) + "' in " + path_str);
        }

        // Return the value at dotted key path when present; throw EnvError if it has the wrong type.
        template<class T>
        std::optional<T> fetch_optional(const toml::table& root,
                                        std::initializer_list<std::string_view> keys,
                                        const std::string& path_str)
        {
            const auto* node = find_node(root, keys);
            if (!node)
                return std::nullopt;
            if constexpr (std::is_same_v<T, bool>)
            {
                if (!node->is_boolean())
                    throw EnvError("Expected boolean for '" + dotted(keys) + "' in " + path_str);
            }
            else
            {
                if (!node->is_integer())
                    throw EnvError("Expected integer for '" + dotted(keys) + "' in " + path_str);
            }
            return node->value<T>();
        }

        std::chrono::milliseconds fetch_millis(const toml::table& root,
                                               std::initializer_list<std::string_view> keys,
                                               const std::string& path_str,
                                               std::chrono::milliseconds fallback)
        {
            const auto value = fetch_optional<std::int64_t>(root, keys, path_str);
            if (!value)
                return fallback;
            if (*value < 0)
                throw EnvError("Negative value for '" + dotted(keys) + "' in " + path_str);
            return std::chrono::milliseconds{ *value };
        }
    } // namespace

    // Read, validate and convert the TOML file at path.
    Config Config::parse_config(const std::filesystem::path& path)
    {
        const auto abs_path = std::filesystem::absolute(path);
        const auto path_str = abs_path.string();
        toml::table tbl;

        try
        {
            tbl = toml::parse_file(path_str);
        }
        catch (const toml::parse_error& e)
        {
            throw EnvError("TOML parse error in '" + path_str + "': " + std::string{ e.what() });
        }
        catch (const std::filesystem::filesystem_error& e)
        {
            throw EnvError("Cannot read config file '" + path_str + "': " + std::string{ e.what() });
        }

        StorageConfig storage_cfg{
            .path = fetch_string(tbl, { "storage", "path" }, path_str),
            .busy_timeout = fetch_millis(tbl, { "storage", "busy_timeout_ms" }, path_str, std::chrono::milliseconds{ 5000 }),
            .slow_operation = fetch_millis(tbl, { "storage", "slow_operation_ms" }, path_str, std::chrono::milliseconds{ 250 }),
        };
        // Relative store paths follow the config file, not the working directory.
        if (storage_cfg.path.is_relative())
            storage_cfg.path = abs_path.parent_path() / storage_cfg.path;

        CacheConfig cache_cfg{
            .enabled = fetch_optional<bool>(tbl, { "cache", "enabled" }, path_str).value_or(true),
        };

        return Config(abs_path, std::move(storage_cfg), cache_cfg);
    }

    Config Config::load_file(const std::filesystem::path& path)
    {
        if (path.string().empty())
            throw EnvError("Config file path must not be empty");
        if (!std::filesystem::exists(path))
            throw EnvError("Config file not found at '" + path.string() + "'");
        return parse_config(path);
    }

    Config Config::load()
    {
        const auto default_path = std::filesystem::current_path() / "rules.toml";
        if (!std::filesystem::exists(default_path))
            throw EnvError("Config file not found at '" + default_path.string() + "'");
        return parse_config(default_path);
    }

    EnvError::EnvError(const std::string& msg) noexcept :
        std::runtime_error{ msg }
    {
    }

} // namespace env
