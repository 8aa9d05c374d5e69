/*
Module Name:
- config.hpp

Abstract:
- Immutable configuration for the redirect-following client loaded from a single TOML file.
- Surfaces strongly typed sections (redirects, transport) and the absolute file path.
- Every key is optional; a missing key keeps the library default.
- Fails fast with ConfigError on values of the wrong type or out of range.
*/
#pragma once

// C++ Standard Library
#include <filesystem>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

// Project
#include <redir/net/http/beast_transport.hpp>
#include <redir/net/http/redirect_policy.hpp>

namespace redir::config
{

    /// Configuration-loading failure. Prefer specific errors over generic runtime_error.
    class ConfigError final : public std::runtime_error
    {
    public:
        explicit ConfigError(const std::string& msg) noexcept;
    };

    /// Immutable client configuration (single TOML file).
    ///
    ///   [redirects]
    ///   max = 10
    ///   port_match = "literal"        # or "default_port_equivalent"
    ///
    ///   [transport]
    ///   connect_timeout_ms = 30000
    ///   handshake_timeout_ms = 10000
    ///   write_timeout_ms = 10000
    ///   read_timeout_ms = 10000
    ///   user_agent = "..."
    class Config
    {
    public:
        /// Load from the file at path.
        /// Pre: !path.empty()
        static Config load_file(const std::filesystem::path& path);

        /// Load from "./redir.toml".
        static Config load();

        /// Parse TOML text already in memory. source names it in error messages.
        static Config parse(std::string_view text, std::string_view source = "<memory>");

        [[nodiscard]] const net::RedirectPolicy& redirects() const noexcept
        {
            return redirects_;
        }
        [[nodiscard]] const net::TransportOptions& transport() const noexcept
        {
            return transport_;
        }
        /// Absolute path to the loaded config file; empty when parsed from memory.
        [[nodiscard]] const std::filesystem::path& path() const noexcept
        {
            return path_;
        }

    private:
        Config(std::filesystem::path path, net::RedirectPolicy redirects, net::TransportOptions transport) noexcept
            :
            path_{ std::move(path) }, redirects_{ redirects }, transport_{ std::move(transport) }
        {
        }

        std::filesystem::path path_;
        net::RedirectPolicy redirects_;
        net::TransportOptions transport_;
    };

} // namespace redir::config
