/*
Module Name:
- transport.hpp

Abstract:
- The send capability the redirect follower drives.
- A Transport sends exactly the request it is given and hands back the response as
  received. It must not follow redirects itself.
- Requests carry an absolute-form target ("http://host:port/path?query") so the
  transport knows where to connect; the Host header is already set.
*/
#pragma once

// C++ Standard Library
#include <utility>

// Boost.Asio
#include <boost/asio/awaitable.hpp>

// Boost.Beast
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/string_body.hpp>

namespace redir::net
{

    using WireRequest = boost::beast::http::request<boost::beast::http::string_body>;
    using WireResponse = boost::beast::http::response<boost::beast::http::string_body>;

    class Transport
    {
    public:
        virtual ~Transport() = default;

        /// Send one request. Failures are thrown and reach the caller unchanged.
        virtual boost::asio::awaitable<WireResponse> send(WireRequest req) = 0;
    };

} // namespace redir::net
