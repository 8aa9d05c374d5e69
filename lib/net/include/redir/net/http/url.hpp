/*
Module Name:
- url.hpp

Abstract:
- URL parse helpers and Location resolution for the redirect follower.
- resolve_redirect supports absolute, scheme-relative and absolute-path references.
  Scheme and authority are inherited from the current URL; path and query are taken
  verbatim from the Location value and never merged with the previous path.
- Query is stored with a leading '?' so target() can concatenate cheaply.
- same_host is the trust-boundary check used to decide when credentials are dropped.
*/
#pragma once

// C++ Standard Library
#include <string>
#include <string_view>
#include <system_error>

namespace redir::net
{

    /// How ports are compared when deciding whether two URLs share a host.
    enum class PortMatch
    {
        literal, ///< port text as written; "a.com" and "a.com:80" differ
        default_port_equivalent ///< an omitted port equals the scheme default
    };

    struct Url
    {
        std::string scheme; // lowercase
        std::string host;
        std::string port; // empty when not written
        std::string path;
        std::string query; // includes leading '?' when present

        [[nodiscard]] bool is_absolute() const noexcept
        {
            return !scheme.empty() && !host.empty();
        }

        [[nodiscard]] std::string authority() const
        {
            std::string out = host;
            if (!port.empty())
            {
                out.push_back(':');
                out += port;
            }
            return out;
        }

        [[nodiscard]] std::string target() const
        {
            std::string out = path.empty() ? std::string{ "/" } : path;
            out += query; // query already has leading '?'
            return out;
        }

        [[nodiscard]] std::string to_string() const
        {
            std::string out = scheme;
            out += "://";
            out += authority();
            out += target();
            return out;
        }

        friend bool operator==(const Url&, const Url&) = default;
    };

    // Default port string for a scheme; empty when unknown.
    [[nodiscard]] std::string_view default_port_for_scheme(std::string_view scheme) noexcept;

    /// Port to connect to: the written port, else the scheme default.
    [[nodiscard]] std::string_view effective_port(const Url& u) noexcept;

    /// Parse an absolute URL ("scheme://authority[/path][?query][#fragment]").
    /// The fragment is dropped and a missing path becomes "/".
    [[nodiscard]] bool parse_url(std::string_view text, Url& out, std::error_code& ec);

    /// Throwing overload; raises RedirectError(errc::request_build_failed).
    [[nodiscard]] Url parse_url(std::string_view text);

    /// Resolve a raw Location value against the absolute URL of the current hop.
    /// Fails with errc::invalid_location when the value is not visible ASCII, does not
    /// parse, or is a relative-path reference that has no absolute path of its own.
    [[nodiscard]] bool
    resolve_redirect(const Url& current, std::string_view location, Url& out, std::error_code& ec);

    /// Throwing overload; raises InvalidLocationError carrying the raw value.
    [[nodiscard]] Url resolve_redirect(const Url& current, std::string_view location);

    /// True when host and port match under the given port policy.
    [[nodiscard]] bool same_host(const Url& a, const Url& b, PortMatch mode = PortMatch::literal) noexcept;

} // namespace redir::net
