/*
Module Name:
- config.hpp

Abstract:
- Immutable configuration for the rules store loaded from a single TOML file.
- Surfaces strongly typed sections (storage, cache) and the absolute file path.
- Fails fast with EnvError on invalid or missing configuration.

File shape:
    [storage]
    path = "data/rules.db"      # required, relative paths resolve against the file's directory
    busy_timeout_ms = 5000      # optional
    slow_operation_ms = 250     # optional, 0 disables slow-call reports

    [cache]
    enabled = true              # optional
*/
#pragma once

// C++ Standard Library
#include <chrono>
#include <filesystem>
#include <stdexcept>
#include <string>

// Core
#include <mb/rules/rules_store.hpp>
#include <mb/rules/storage_engine.hpp>

namespace env
{

    /// Configuration-loading failure. Prefer specific errors over generic runtime_error.
    class EnvError final : public std::runtime_error
    {
    public:
        explicit EnvError(const std::string& msg) noexcept;
    };

    /// Location and tuning of the SQLite store.
    struct StorageConfig
    {
        std::filesystem::path path; ///< absolute after loading
        std::chrono::milliseconds busy_timeout{ 5000 };
        std::chrono::milliseconds slow_operation{ 250 };
    };

    /// Read cache switch.
    struct CacheConfig
    {
        bool enabled{ true };
    };

    /// Immutable application configuration (single TOML file).
    class Config
    {
    public:
        /// Load from the file at path.
        /// Pre: !path.empty()
        static Config load_file(const std::filesystem::path& path);

        /// Load from "./rules.toml".
        static Config load();

        [[nodiscard]] const StorageConfig& storage() const noexcept
        {
            return storage_;
        }
        [[nodiscard]] const CacheConfig& cache() const noexcept
        {
            return cache_;
        }
        /// Absolute path to the loaded config file.
        [[nodiscard]] const std::filesystem::path& path() const noexcept
        {
            return path_;
        }

        [[nodiscard]] mod_bot::StorageOptions storage_options() const noexcept
        {
            return { .busy_timeout = storage_.busy_timeout, .slow_operation_threshold = storage_.slow_operation };
        }
        [[nodiscard]] mod_bot::RulesStoreOptions rules_options() const noexcept
        {
            return { .cache_enabled = cache_.enabled };
        }

    private:
        static Config parse_config(const std::filesystem::path& path);

        // Store is immutable after construction to keep call sites simple and thread friendly.
        Config(std::filesystem::path path, StorageConfig storage_cfg, CacheConfig cache_cfg) noexcept :
            path_{ std::move(path) }, storage_{ std::move(storage_cfg) }, cache_{ cache_cfg }
        {
        }

        std::filesystem::path path_;
        StorageConfig storage_;
        CacheConfig cache_;
    };

} // namespace env
