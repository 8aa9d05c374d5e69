/*
Module Name:
- error.hpp

Abstract:
- Defines redir::net error codes and a std::error_category so callers can use
  std::error_code with the redirect helpers. Provides make_error_code and enables
  implicit conversion via is_error_code_enum.
- RedirectError is the exception type thrown out of a redirect exchange.
  InvalidLocationError additionally carries the offending Location text.
*/
#pragma once

// C++ Standard Library
#include <string>
#include <system_error>
#include <utility>

namespace redir::net
{

    enum class errc
    {
        invalid_location = 1,
        body_read_failed,
        request_build_failed,
        unsupported_scheme,
    };

    // Category for redir::net errors.
    struct error_category_impl final : std::error_category
    {
        const char* name() const noexcept override
        {
            return "redir.net";
        }
        std::string message(int ev) const override
        {
            switch (static_cast<errc>(ev))
            {
            case errc::invalid_location:
                return "invalid Location header";
            case errc::body_read_failed:
                return "request body read failed";
            case errc::request_build_failed:
                return "request could not be built";
            case errc::unsupported_scheme:
                return "unsupported URI scheme";
            }
            return "unknown redir.net error";
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

    /// Terminal failure of a redirect exchange.
    class RedirectError : public std::system_error
    {
    public:
        explicit RedirectError(errc e) :
            std::system_error{ make_error_code(e) }
        {
        }
        RedirectError(errc e, const std::string& detail) :
            std::system_error{ make_error_code(e), detail }
        {
        }
    };

    /// A Location value that could not be resolved into an absolute URI.
    class InvalidLocationError final : public RedirectError
    {
    public:
        explicit InvalidLocationError(std::string location) :
            RedirectError{ errc::invalid_location, "'" + location + "'" }, location_{ std::move(location) }
        {
        }

        [[nodiscard]] const std::string& location() const noexcept
        {
            return location_;
        }

    private:
        std::string location_;
    };

} // namespace redir::net

// Enable implicit conversion to std::error_code for redir::net::errc.
namespace std
{
    template<>
    struct is_error_code_enum<redir::net::errc> : true_type
    {
    };
} // namespace std
