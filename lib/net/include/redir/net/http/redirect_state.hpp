/*
Module Name:
- redirect_state.hpp

Abstract:
- The in-flight logical request of one redirect exchange and the per-response decision.
- Owns method, URL, version, headers and the buffered body; mutated in place from hop
  to hop and discarded when the exchange completes.
- Decision table:
    301, 302, 307, 308  keep method and body, follow Location
    303                 switch to GET, drop the body, follow Location
    anything else       finish
  A redirect is not followed once the hop budget is spent or when Location is absent;
  the redirect response itself is then the result.
- Crossing to another host or port strips the credential headers listed in
  redirect_policy.hpp before the next hop is built.
*/
#pragma once

// C++ Standard Library
#include <cstddef>
#include <optional>
#include <string>

// Boost.Beast
#include <boost/beast/http/fields.hpp>
#include <boost/beast/http/message.hpp>

// Project
#include <redir/net/http/body.hpp>
#include <redir/net/http/redirect_policy.hpp>
#include <redir/net/http/transport.hpp>
#include <redir/net/http/url.hpp>

namespace redir::net
{

    class RedirectStateMachine
    {
    public:
        enum class Decision
        {
            follow, ///< state now describes the next hop; send again
            finish ///< hand the response to the caller
        };

        /// Captures method, target and version and takes the headers by move;
        /// the original request is left with empty fields.
        RedirectStateMachine(boost::beast::http::request_header<>& original, const RedirectPolicy& policy);

        /// Called once the body has been buffered, before the first send.
        void set_body(BufferedBody body);

        /// Build the request for the current hop.
        /// Throws RedirectError(errc::request_build_failed) when the state cannot be encoded.
        [[nodiscard]] WireRequest materialize() const;

        /// Throws InvalidLocationError for a Location that does not resolve.
        [[nodiscard]] Decision handle_response(const WireResponse& res);

        [[nodiscard]] const std::string& method() const noexcept
        {
            return method_;
        }
        [[nodiscard]] const Url& url() const noexcept
        {
            return url_;
        }
        [[nodiscard]] const boost::beast::http::fields& headers() const noexcept
        {
            return headers_;
        }
        [[nodiscard]] const std::optional<BufferedBody>& body() const noexcept
        {
            return body_;
        }
        [[nodiscard]] std::size_t remaining_redirects() const noexcept
        {
            return remaining_redirects_;
        }
        /// Whether the last followed hop crossed the trust boundary.
        [[nodiscard]] bool stripped_credentials() const noexcept
        {
            return stripped_credentials_;
        }

    private:
        Decision follow_redirect(const WireResponse& res);
        void strip_sensitive_headers();

        std::string method_;
        std::string target_; // as given by the caller; url_ is parsed from it
        unsigned version_;
        boost::beast::http::fields headers_;
        std::optional<BufferedBody> body_;
        Url url_;
        bool url_valid_{ false };
        RedirectPolicy policy_;
        std::size_t remaining_redirects_;
        bool stripped_credentials_{ false };
    };

} // namespace redir::net
