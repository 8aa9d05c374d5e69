// C++ standard library
#include <iostream>
#include <string>
#include <string_view>
#include <utility>

// Boost.Asio
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/asio/use_awaitable.hpp>

// Boost.Beast
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/system/system_error.hpp>

// OpenSSL
#include <openssl/err.h>
#include <openssl/ssl.h>

// GSL
#include <gsl/gsl>

// Project
#include <redir/net/http/beast_transport.hpp>
#include <redir/net/http/error.hpp>
#include <redir/net/http/url.hpp>

namespace redir::net
{

    namespace asio = boost::asio;
    namespace beast = boost::beast;
    namespace http = beast::http;

    namespace
    {
        // Write the request and read one full response on an established stream.
        template<class Stream>
        asio::awaitable<WireResponse> write_and_read(Stream& stream, WireRequest req, const TransportOptions& opts)
        {
            beast::get_lowest_layer(stream).expires_after(opts.write_timeout);
            co_await http::async_write(stream, req, asio::use_awaitable);

            beast::flat_buffer buffer;
            http::response_parser<http::string_body> parser;
            // A response to HEAD announces a body it never sends.
            if (req.method() == http::verb::head)
            {
                parser.skip(true);
            }
            beast::get_lowest_layer(stream).expires_after(opts.read_timeout);
            co_await http::async_read(stream, buffer, parser, asio::use_awaitable);
            co_return parser.release();
        }

        template<class Stream>
        void close_socket(Stream& stream) noexcept
        {
            beast::error_code ec;
            beast::get_lowest_layer(stream).socket().close(ec);
            if (ec)
            {
                std::cerr << "[BeastTransport] close failed: " << ec.message() << '\n';
            }
        }
    } // namespace

    BeastTransport::BeastTransport(asio::any_io_executor executor,
                                   asio::ssl::context& ssl_context,
                                   TransportOptions options) noexcept :
        executor_{ std::move(executor) }, ssl_context_{ &ssl_context }, options_{ std::move(options) }
    {
        Expects(ssl_context_ != nullptr);
    }

    asio::awaitable<WireResponse> BeastTransport::send(WireRequest req)
    {
        const Url url = parse_url(std::string_view{ req.target().data(), req.target().size() });
        if (url.scheme != "http" && url.scheme != "https")
        {
            throw RedirectError(errc::unsupported_scheme, url.scheme);
        }

        req.target(url.target());
        req.keep_alive(false);
        if (req.find(http::field::user_agent) == req.end())
        {
            req.set(http::field::user_agent, options_.user_agent);
        }

        const std::string port{ effective_port(url) };
        // Bracketed IPv6 literals are resolved without their brackets.
        const std::string host = (!url.host.empty() && url.host.front() == '[')
                                     ? url.host.substr(1, url.host.size() - 2)
                                     : url.host;

        // Resolve DNS and establish the TCP connection
        asio::ip::tcp::resolver resolver{ executor_ };
        beast::tcp_stream tcp{ executor_ };
        try
        {
            auto endpoints = co_await resolver.async_resolve(host, port, asio::use_awaitable);
            tcp.expires_after(options_.connect_timeout);
            co_await tcp.async_connect(endpoints, asio::use_awaitable);
        }
        catch (const boost::system::system_error& e)
        {
            std::cerr << "[BeastTransport] connect " << url.authority() << " failed: " << e.code().message()
                      << '\n';
            throw;
        }

        // Disable Nagle's algorithm
        tcp.socket().set_option(asio::ip::tcp::no_delay{ true });

        if (url.scheme == "http")
        {
            auto close = gsl::finally([&] { close_socket(tcp); });
            co_return co_await write_and_read(tcp, std::move(req), options_);
        }

        // Upgrade to TLS
        beast::ssl_stream<beast::tcp_stream> ssl{ std::move(tcp), *ssl_context_ };
        auto close = gsl::finally([&] { close_socket(ssl); });

        // SNI requires NUL-terminated host and is not sent for IP literals
        if (url.host.front() != '[' && !::SSL_set_tlsext_host_name(ssl.native_handle(), host.c_str()))
        {
            throw boost::system::system_error{
                boost::system::error_code{ static_cast<int>(::ERR_get_error()), asio::error::get_ssl_category() },
                "SNI failure" };
        }
        ssl.set_verify_callback(asio::ssl::host_name_verification(host));

        beast::get_lowest_layer(ssl).expires_after(options_.handshake_timeout);
        try
        {
            co_await ssl.async_handshake(asio::ssl::stream_base::client, asio::use_awaitable);
        }
        catch (const boost::system::system_error& e)
        {
            std::cerr << "[BeastTransport] TLS handshake with " << url.authority()
                      << " failed: " << e.code().message() << '\n';
            throw;
        }

        co_return co_await write_and_read(ssl, std::move(req), options_);
    }

} // namespace redir::net
