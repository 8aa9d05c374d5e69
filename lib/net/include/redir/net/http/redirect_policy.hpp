/*
Module Name:
- redirect_policy.hpp

Abstract:
- Redirect handling policy for the redirect-following client.
- Encodes the hop limit and how ports are compared at the trust boundary.
- next_method applies the follow rules: 301/302/307/308 keep the method and body;
  303 becomes GET and drops the body.
- Lists the credential headers that never cross to another host or port.
*/
#pragma once

// C++ Standard Library
#include <array>
#include <cstddef>
#include <string_view>

// Project
#include <redir/net/http/url.hpp>

namespace redir::net
{

    /// Hop limit used when the caller does not choose one. Earlier releases of
    /// comparable clients used 21; 10 is kept here.
    inline constexpr std::size_t k_default_max_redirects = 10;

    inline constexpr bool is_redirect_status(int s) noexcept
    {
        return s == 301 || s == 302 || s == 303 || s == 307 || s == 308;
    }

    inline constexpr bool drops_body_on_redirect(int s) noexcept
    {
        return s == 303;
    }

    // Matched case-insensitively.
    inline constexpr std::array<std::string_view, 4> k_sensitive_headers{
        "Authorization",
        "Cookie",
        "Cookie2",
        "WWW-Authenticate",
    };

    class RedirectPolicy
    {
    public:
        explicit RedirectPolicy(std::size_t max_redirects = k_default_max_redirects,
                                PortMatch port_match = PortMatch::literal) noexcept
            :
            max_redirects_(max_redirects), port_match_(port_match)
        {
        }

        std::size_t max_redirects() const noexcept
        {
            return max_redirects_;
        }
        void set_max_redirects(std::size_t n) noexcept
        {
            max_redirects_ = n;
        }

        PortMatch port_match() const noexcept
        {
            return port_match_;
        }
        void set_port_match(PortMatch m) noexcept
        {
            port_match_ = m;
        }

        // Method for the next hop. Only 303 rewrites.
        static std::string_view next_method(std::string_view cur, int status) noexcept
        {
            if (drops_body_on_redirect(status))
            {
                return "GET";
            }
            return cur;
        }

        // Credentials are stripped whenever host or port change.
        bool crosses_trust_boundary(const Url& from, const Url& to) const noexcept
        {
            return !same_host(from, to, port_match_);
        }

    private:
        std::size_t max_redirects_;
        PortMatch port_match_;
    };

} // namespace redir::net
