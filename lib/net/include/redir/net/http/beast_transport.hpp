/*
Module Name:
- beast_transport.hpp

Abstract:
- Production Transport on Boost.Beast: one connection per request over TCP, or TLS
  for https URLs (SNI and host name verification through the caller's ssl::context).
- Converts the absolute-form target it receives into origin-form on the wire.
- Never follows redirects; the response is returned exactly as read.
- Per-phase timeouts; failures surface as boost::system::system_error.
*/
#pragma once

// C++ standard library
#include <chrono>
#include <string>
#include <utility>

// Boost.Asio
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/ssl/context.hpp>

// Boost.Beast
#include <boost/beast/version.hpp>

// Project
#include <redir/net/http/transport.hpp>

namespace redir::net
{

    inline constexpr auto k_tcp_connect_timeout = std::chrono::seconds{ 30 };
    inline constexpr auto k_handshake_timeout = std::chrono::seconds{ 10 };
    inline constexpr auto k_http_write_timeout = std::chrono::seconds{ 10 };
    inline constexpr auto k_http_read_timeout = std::chrono::seconds{ 10 };

    struct TransportOptions
    {
        std::chrono::steady_clock::duration connect_timeout{ k_tcp_connect_timeout };
        std::chrono::steady_clock::duration handshake_timeout{ k_handshake_timeout };
        std::chrono::steady_clock::duration write_timeout{ k_http_write_timeout };
        std::chrono::steady_clock::duration read_timeout{ k_http_read_timeout };

        // Sent when the request carries no User-Agent of its own.
        std::string user_agent{ BOOST_BEAST_VERSION_STRING };
    };

    class BeastTransport final : public Transport
    {
    public:
        BeastTransport(boost::asio::any_io_executor executor,
                       boost::asio::ssl::context& ssl_context,
                       TransportOptions options = {}) noexcept;

        boost::asio::awaitable<WireResponse> send(WireRequest req) override;

        [[nodiscard]] const TransportOptions& options() const noexcept
        {
            return options_;
        }

    private:
        boost::asio::any_io_executor executor_;
        boost::asio::ssl::context* ssl_context_; // non-null
        TransportOptions options_;
    };

} // namespace redir::net
