/*
Module Name:
- read_through_cache.hpp

Abstract:
- Keyed memo for one read operation of the rules store. A hit returns the stored
  value; a miss runs the caller's loader, stores the result (absent results and
  empty lists included) and returns it.
- invalidate(key) evicts exactly one key. There is no size bound and no other eviction.
- Hit and miss counters are exposed through info() so invalidation is observable.

Why:
- Each slot carries a generation. A miss snapshots it before loading and only
  stores the loaded value if no invalidation bumped it meanwhile, so a reader that
  raced a writer cannot park the pre-write row in the cache after the write returned.
- A fault inside the cache itself (allocation, a throwing copy) is reported and the
  call falls back to the loader; the cache never fails a read. Loader exceptions
  are not cache faults and propagate untouched.
*/
#pragma once

// C++ Standard Library
#include <atomic>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <functional>
#include <iostream>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>

// Core
#include <mb/utils/attributes.hpp>

namespace mod_bot
{

    // Counters for one cache.
    struct CacheInfo
    {
        std::uint64_t hits{ 0 };
        std::uint64_t misses{ 0 };
        std::size_t size{ 0 }; ///< keys currently holding a value

        friend bool operator==(const CacheInfo&, const CacheInfo&) = default;
    };

    template<class Key, class Value, class Hash = std::hash<Key>>
    class ReadThroughCache
    {
    public:
        explicit ReadThroughCache(std::string name) :
            name_{ std::move(name) }
        {
        }

        ReadThroughCache(const ReadThroughCache&) = delete;
        ReadThroughCache& operator=(const ReadThroughCache&) = delete;

        // Return the cached value for key, or load, remember and return it.
        template<std::invocable Loader>
            requires std::convertible_to<std::invoke_result_t<Loader&>, Value>
        [[nodiscard]] Value get_or_load(const Key& key, Loader&& load)
        {
            std::uint64_t generation = 0;
            try
            {
                {
                    std::shared_lock guard{ mutex_ };
                    if (auto it = slots_.find(key); it != slots_.end() && it->second.value)
                    {
                        Value copy{ *it->second.value };
                        hits_.fetch_add(1, std::memory_order_relaxed);
                        return copy;
                    }
                }

                std::lock_guard guard{ mutex_ };
                auto& slot = slots_[key];
                if (MB_UNLIKELY(slot.value.has_value())) // filled by another reader in between
                {
                    Value copy{ *slot.value };
                    hits_.fetch_add(1, std::memory_order_relaxed);
                    return copy;
                }
                generation = slot.generation;
                misses_.fetch_add(1, std::memory_order_relaxed);
            }
            catch (const std::exception& e)
            {
                report_fault("lookup", e);
                misses_.fetch_add(1, std::memory_order_relaxed);
                return std::invoke(load);
            }

            Value loaded = std::invoke(load);
            remember(key, generation, loaded);
            return loaded;
        }

        // Evict key. Loads already in flight for key will not be stored.
        void invalidate(const Key& key) noexcept
        {
            std::lock_guard guard{ mutex_ };
            if (auto it = slots_.find(key); it != slots_.end())
            {
                it->second.value.reset();
                ++it->second.generation;
            }
        }

        // Drop every entry and reset the counters.
        void clear() noexcept
        {
            std::lock_guard guard{ mutex_ };
            slots_.clear();
            hits_.store(0, std::memory_order_relaxed);
            misses_.store(0, std::memory_order_relaxed);
        }

        [[nodiscard]] CacheInfo info() const
        {
            std::shared_lock guard{ mutex_ };
            CacheInfo out{ hits_.load(std::memory_order_relaxed), misses_.load(std::memory_order_relaxed), 0 };
            for (const auto& [key, slot] : slots_)
            {
                if (slot.value)
                    ++out.size;
            }
            return out;
        }

        [[nodiscard]] const std::string& name() const noexcept
        {
            return name_;
        }

    private:
        struct Slot
        {
            std::optional<Value> value;
            std::uint64_t generation{ 0 };
        };

        void remember(const Key& key, std::uint64_t generation, const Value& loaded) noexcept
        {
            try
            {
                std::lock_guard guard{ mutex_ };
                // A missing slot means clear() ran while loading; treat it like an invalidation.
                if (auto it = slots_.find(key); it != slots_.end() && it->second.generation == generation)
                    it->second.value.emplace(loaded);
            }
            catch (const std::exception& e)
            {
                report_fault("store", e);
            }
        }

        MB_NOINLINE void report_fault(std::string_view stage, const std::exception& e) const noexcept
        {
            std::cerr << "[ReadThroughCache] " << name_ << ' ' << stage
                      << " fault, serving from storage: " << e.what() << '\n';
        }

        const std::string name_;

        mutable std::shared_mutex mutex_;
        std::unordered_map<Key, Slot, Hash> slots_;

        std::atomic<std::uint64_t> hits_{ 0 };
        std::atomic<std::uint64_t> misses_{ 0 };
    };

} // namespace mod_bot
