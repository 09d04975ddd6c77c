/*
Module Name:
- error.hpp

Abstract:
- dm::net error codes and their std::error_category, for conditions the
  HTTP client detects itself (as opposed to socket or TLS failures, which
  surface as Boost error codes).
- make_error_code and is_error_code_enum let callers throw std::system_error
  and compare against dm::net::errc directly.
*/
#pragma once

// C++ Standard Library
#include <string>
#include <system_error>

namespace dm::net
{

    enum class errc
    {
        malformed_url = 1,
        unsupported_scheme,
        deadline_exceeded,
    };

    struct error_category_impl final : std::error_category
    {
        const char* name() const noexcept override
        {
            return "dm.net";
        }
        std::string message(int ev) const override
        {
            switch (static_cast<errc>(ev))
            {
            case errc::malformed_url:
                return "malformed url";
            case errc::unsupported_scheme:
                return "only https urls are supported";
            case errc::deadline_exceeded:
                return "request deadline exceeded";
            }
            return "unknown dm.net error";
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

} // namespace dm::net

namespace std
{
    template<>
    struct is_error_code_enum<dm::net::errc> : true_type
    {
    };
} // namespace std
