// C++ Standard Library
#include <exception>
#include <iostream>
#include <stdexcept>
#include <utility>

// GSL
#include <gsl/gsl>

// Project
#include <redir/net/http/redirect_client.hpp>

namespace redir::net
{

    namespace http = boost::beast::http;

    RedirectOperation::RedirectOperation(std::shared_ptr<Transport> transport,
                                         http::request_header<> header,
                                         std::unique_ptr<BodySource> body,
                                         RedirectPolicy policy,
                                         HopCallback on_hop) :
        transport_{ std::move(transport) },
        policy_{ policy },
        on_hop_{ std::move(on_hop) },
        state_{ Lazy{ std::move(header), std::move(body) } }
    {
        Expects(transport_ != nullptr);
    }

    boost::asio::awaitable<WireResponse> RedirectOperation::run()
    {
        Expects(std::holds_alternative<Lazy>(state_));

        for (;;)
        {
            // The current state is moved out for the transition and anything it owns
            // lives in this frame until the next state is stored.
            State current = std::exchange(state_, Swapping{});

            if (auto* lazy = std::get_if<Lazy>(&current))
            {
                RedirectStateMachine state{ lazy->header, policy_ };
                state_ = Buffering{ std::move(state), BodyBuffer{ std::move(lazy->body) } };
            }
            else if (auto* buffering = std::get_if<Buffering>(&current))
            {
                buffering->state.set_body(co_await buffering->buffer.collect());
                auto req = buffering->state.materialize();
                state_ = Requesting{ std::move(buffering->state), std::move(req) };
            }
            else if (auto* requesting = std::get_if<Requesting>(&current))
            {
                auto from = requesting->state.url().to_string();
                ++sends_;
                WireResponse res = co_await transport_->send(std::move(requesting->req));

                if (requesting->state.handle_response(res) == RedirectStateMachine::Decision::finish)
                {
                    co_return res;
                }

                notify_hop(res.result_int(), std::move(from), requesting->state);
                auto next = requesting->state.materialize();
                state_ = Requesting{ std::move(requesting->state), std::move(next) };
            }
            else
            {
                throw std::logic_error("RedirectOperation resumed mid-transition");
            }
        }
    }

    void RedirectOperation::notify_hop(int status, std::string from, const RedirectStateMachine& state) const
    {
        if (!on_hop_)
        {
            return;
        }

        RedirectHop hop{
            .status = status,
            .from = std::move(from),
            .to = state.url().to_string(),
            .remaining_redirects = state.remaining_redirects(),
            .stripped_credentials = state.stripped_credentials(),
        };
        try
        {
            on_hop_(hop);
        }
        catch (const std::exception& e)
        {
            std::cerr << "[RedirectOperation] hop callback threw: " << e.what() << '\n';
        }
    }

    Client::Client(std::shared_ptr<Transport> transport, RedirectPolicy policy) noexcept :
        transport_{ std::move(transport) }, policy_{ policy }
    {
        Expects(transport_ != nullptr);
    }

    boost::asio::awaitable<WireResponse> Client::get(std::string url)
    {
        http::request_header<> header;
        header.method(http::verb::get);
        header.target(url);
        header.version(k_http_version);
        co_return co_await request(std::move(header), nullptr);
    }

    boost::asio::awaitable<WireResponse> Client::request(WireRequest req)
    {
        auto body = std::make_unique<StringBodySource>(std::move(req.body()));
        co_return co_await request(std::move(req.base()), std::move(body));
    }

    boost::asio::awaitable<WireResponse> Client::request(http::request_header<> header,
                                                         std::unique_ptr<BodySource> body)
    {
        RedirectOperation op{ transport_, std::move(header), std::move(body), policy_, on_hop_ };
        co_return co_await op.run();
    }

    Client follow_redirects(std::shared_ptr<Transport> transport)
    {
        return Client{ std::move(transport) };
    }

    Client follow_redirects_max(std::shared_ptr<Transport> transport, std::size_t max_redirects)
    {
        Client client{ std::move(transport) };
        client.set_max_redirects(max_redirects);
        return client;
    }

} // namespace redir::net
