/*
Module Name:
- redirect_client.hpp

Abstract:
- Client: wraps a Transport so that every request follows redirects.
- RedirectOperation: the asynchronous driver behind one call. It buffers the body once,
  then alternates send and decide until the state machine says finish.
    Lazy -> Buffering -> Requesting -> Requesting ... -> result
  Swapping is the placeholder held only while one state is being replaced by the next.
- Any failure ends the whole call: body read, request build, transport, bad Location.
  Hop-limit exhaustion and a missing Location are not failures; the redirect response
  is returned so the caller can inspect its status.
- Destroying the awaiting coroutine destroys the operation and whatever it was waiting on.
*/
#pragma once

// C++ Standard Library
#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <variant>
#include <utility>

// Boost.Asio
#include <boost/asio/awaitable.hpp>

// Boost.Beast
#include <boost/beast/http/message.hpp>

// Project
#include <redir/net/http/body.hpp>
#include <redir/net/http/body_buffer.hpp>
#include <redir/net/http/redirect_policy.hpp>
#include <redir/net/http/redirect_state.hpp>
#include <redir/net/http/transport.hpp>

namespace redir::net
{

    inline constexpr unsigned k_http_version = 11;

    /// One followed redirect, reported after the state moved to the next hop.
    struct RedirectHop
    {
        int status{ 0 };
        std::string from;
        std::string to;
        std::size_t remaining_redirects{ 0 };
        bool stripped_credentials{ false };
    };

    using HopCallback = std::function<void(const RedirectHop&)>;

    class RedirectOperation
    {
    public:
        RedirectOperation(std::shared_ptr<Transport> transport,
                          boost::beast::http::request_header<> header,
                          std::unique_ptr<BodySource> body,
                          RedirectPolicy policy,
                          HopCallback on_hop = {});

        /// Drive the exchange to its final response. May be awaited once.
        [[nodiscard]] boost::asio::awaitable<WireResponse> run();

        /// Number of requests handed to the transport so far.
        [[nodiscard]] std::size_t sends() const noexcept
        {
            return sends_;
        }

    private:
        struct Lazy
        {
            boost::beast::http::request_header<> header;
            std::unique_ptr<BodySource> body;
        };
        struct Buffering
        {
            RedirectStateMachine state;
            BodyBuffer buffer;
        };
        struct Requesting
        {
            RedirectStateMachine state;
            WireRequest req;
        };
        struct Swapping
        {
        };

        using State = std::variant<Lazy, Buffering, Requesting, Swapping>;

        void notify_hop(int status, std::string from, const RedirectStateMachine& state) const;

        std::shared_ptr<Transport> transport_;
        RedirectPolicy policy_;
        HopCallback on_hop_;
        State state_;
        std::size_t sends_{ 0 };
    };

    /// A client that follows redirects.
    /// The client must outlive the operations it starts.
    class Client
    {
    public:
        explicit Client(std::shared_ptr<Transport> transport, RedirectPolicy policy = RedirectPolicy{}) noexcept;

        /// GET an absolute URL.
        [[nodiscard]] boost::asio::awaitable<WireResponse> get(std::string url);

        /// Send a request whose target is an absolute URL. The body is replayed on
        /// 301/302/307/308 and dropped on 303.
        [[nodiscard]] boost::asio::awaitable<WireResponse> request(WireRequest req);

        /// Same, with a body that is streamed in and buffered before the first send.
        [[nodiscard]] boost::asio::awaitable<WireResponse> request(boost::beast::http::request_header<> header,
                                                                   std::unique_ptr<BodySource> body);

        [[nodiscard]] std::size_t max_redirects() const noexcept
        {
            return policy_.max_redirects();
        }
        void set_max_redirects(std::size_t n) noexcept
        {
            policy_.set_max_redirects(n);
        }

        [[nodiscard]] PortMatch port_match() const noexcept
        {
            return policy_.port_match();
        }
        void set_port_match(PortMatch m) noexcept
        {
            policy_.set_port_match(m);
        }

        [[nodiscard]] const RedirectPolicy& policy() const noexcept
        {
            return policy_;
        }

        void set_hop_callback(HopCallback cb)
        {
            on_hop_ = std::move(cb);
        }

    private:
        std::shared_ptr<Transport> transport_; // non-null
        RedirectPolicy policy_;
        HopCallback on_hop_{};
    };

    /// Wrap a transport with the default hop limit.
    [[nodiscard]] Client follow_redirects(std::shared_ptr<Transport> transport);

    /// Wrap a transport with an explicit hop limit.
    [[nodiscard]] Client follow_redirects_max(std::shared_ptr<Transport> transport, std::size_t max_redirects);

} // namespace redir::net
