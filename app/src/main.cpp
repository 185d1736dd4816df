/*
Module: main.cpp

Purpose:
- Entry point for rules_ctl: load configuration, open the store, run one command.

Notes:
- Config is loaded from --config <file>, or ./rules.toml (see env::Config). Fails fast with EnvError.
- Exit codes: 0 ok, 1 usage or configuration error, 2 storage unavailable, 3 invalid record.
*/

// C++ Standard Library
#include <iostream>
#include <string_view>
#include <vector>

// Core
#include <mb/rules/config.hpp>
#include <mb/rules/error.hpp>
#include <mb/rules/rules_store.hpp>
#include <mb/rules/storage_engine.hpp>

// App
#include <app/rules_commands.hpp>

namespace
{
    constexpr int kExitOk = 0;
    constexpr int kExitUsage = 1;
    constexpr int kExitStorage = 2;
    constexpr int kExitInvalidRecord = 3;

    void print_usage(std::ostream& out)
    {
        out << "usage: rules_ctl [--config <file>] [--json] <command>\n"
               "\n"
               "commands:\n"
               "  config get   <guild> <channel>\n"
               "  config set   <guild> <channel> <field>=<value>...\n"
               "  user get     <guild> <channel> <user>\n"
               "  user offend  <guild> <channel> <user> [<unix_ts>]\n"
               "  users list   <guild> <channel>\n"
               "  users reset  <guild> <channel>\n";
    }
} // namespace

int main(int argc, char** argv)
{
    std::string_view config_file;
    auto format = app::OutputFormat::text;
    std::vector<std::string_view> args;

    for (int i = 1; i < argc; ++i)
    {
        const std::string_view arg{ argv[i] };
        if (arg == "-h" || arg == "--help")
        {
            print_usage(std::cout);
            return kExitOk;
        }
        if (arg == "--json")
        {
            format = app::OutputFormat::json;
            continue;
        }
        if (arg == "--config")
        {
            if (i + 1 >= argc)
            {
                std::cerr << "[rules_ctl] --config needs a file\n";
                print_usage(std::cerr);
                return kExitUsage;
            }
            config_file = argv[++i];
            continue;
        }
        args.push_back(arg);
    }

    try
    {
        // 1) Load immutable configuration.
        const auto cfg = config_file.empty() ? env::Config::load() : env::Config::load_file(config_file);

        // 2) Open the store; the schema is created on first use.
        const mod_bot::StorageEngine engine{ cfg.storage().path, cfg.storage_options() };
        mod_bot::RulesStore store{ engine, cfg.rules_options() };

        // 3) Run the command.
        app::run_command(store, args, format, std::cout);
        return kExitOk;
    }
    catch (const app::UsageError& e)
    {
        std::cerr << "[rules_ctl] " << e.what() << '\n';
        print_usage(std::cerr);
        return kExitUsage;
    }
    catch (const env::EnvError& e)
    {
        std::cerr << "[rules_ctl] Configuration error: " << e.what() << '\n';
        return kExitUsage;
    }
    catch (const mod_bot::StorageUnavailable& e)
    {
        std::cerr << "[rules_ctl] Storage unavailable: " << e.what() << '\n';
        return kExitStorage;
    }
    catch (const mod_bot::InvalidRecord& e)
    {
        std::cerr << "[rules_ctl] Invalid record: " << e.what() << '\n';
        return kExitInvalidRecord;
    }
    catch (const std::exception& e)
    {
        std::cerr << "[rules_ctl] Fatal: " << e.what() << '\n';
        return kExitUsage;
    }
}
