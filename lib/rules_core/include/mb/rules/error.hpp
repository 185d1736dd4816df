/*
Module Name:
- error.hpp

Abstract:
- Error codes and exceptions raised by the rules store.
- Defines mod_bot::errc with a std::error_category so callers can branch on
  std::error_code, and exception types that carry those codes.
- Absence of a record is never an error; lookups return std::nullopt instead.
*/
#pragma once

// C++ Standard Library
#include <string>
#include <system_error>

namespace mod_bot
{

    enum class errc
    {
        storage_unavailable = 1, // store cannot be opened, read or written
        invalid_record, // record violates the data model contract
    };

    // Category for mod_bot rules errors.
    struct error_category_impl final : std::error_category
    {
        const char* name() const noexcept override
        {
            return "mb.rules";
        }
        std::string message(int ev) const override
        {
            switch (static_cast<errc>(ev))
            {
            case errc::storage_unavailable:
                return "storage unavailable";
            case errc::invalid_record:
                return "invalid record";
            }
            return "unknown mb.rules error";
        }
    };

    inline const std::error_category& error_category()
    {
        static error_category_impl cat;
        return cat;
    }

    inline std::error_code make_error_code(errc e) noexcept
    {
        return { static_cast<int>(e), error_category() };
    }

} // namespace mod_bot

// Enable implicit conversion to std::error_code for mod_bot::errc.
namespace std
{
    template<>
    struct is_error_code_enum<mod_bot::errc> : true_type
    {
    };
} // namespace std

namespace mod_bot
{

    // Base for every failure the rules store reports.
    class RulesError : public std::system_error
    {
    public:
        RulesError(errc code, const std::string& what_arg) :
            std::system_error{ make_error_code(code), what_arg }
        {
        }
    };

    // The backing store could not be opened or written. Fatal to the calling operation.
    class StorageUnavailable final : public RulesError
    {
    public:
        explicit StorageUnavailable(const std::string& what_arg) :
            RulesError{ errc::storage_unavailable, what_arg }
        {
        }
    };

    // Programming-contract violation at the facade boundary. Never retried.
    class InvalidRecord final : public RulesError
    {
    public:
        explicit InvalidRecord(const std::string& what_arg) :
            RulesError{ errc::invalid_record, what_arg }
        {
        }
    };

} // namespace mod_bot
