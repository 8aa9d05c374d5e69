// C++ Standard Library
#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <string_view>
#include <system_error>
#include <utility>

// Project
#include <redir/net/http/error.hpp>
#include <redir/net/http/redirect_state.hpp>

namespace redir::net
{

    namespace http = boost::beast::http;

    namespace
    {
        // Produce Host header value, appending :port when port is non-default for the scheme
        std::string host_header_value(const Url& u)
        {
            if (!u.port.empty() && u.port != default_port_for_scheme(u.scheme))
            {
                return u.authority();
            }
            return u.host;
        }

        bool is_tchar(char c) noexcept
        {
            if (std::isalnum(static_cast<unsigned char>(c)))
            {
                return true;
            }
            return std::string_view{ "!#$%&'*+-.^_`|~" }.find(c) != std::string_view::npos;
        }

        bool is_token(std::string_view s) noexcept
        {
            return !s.empty() && std::all_of(s.begin(), s.end(), is_tchar);
        }

        bool is_field_value(std::string_view s) noexcept
        {
            return s.find_first_of(std::string_view{ "\r\n\0", 3 }) == std::string_view::npos;
        }

        std::string_view to_std(boost::beast::string_view sv) noexcept
        {
            return { sv.data(), sv.size() };
        }
    } // namespace

    RedirectStateMachine::RedirectStateMachine(http::request_header<>& original, const RedirectPolicy& policy) :
        method_{ to_std(original.method_string()) },
        target_{ to_std(original.target()) },
        version_{ original.version() },
        headers_{ std::move(static_cast<http::fields&>(original)) },
        policy_{ policy },
        remaining_redirects_{ policy.max_redirects() }
    {
        std::error_code ec;
        url_valid_ = parse_url(target_, url_, ec);
    }

    void RedirectStateMachine::set_body(BufferedBody body)
    {
        body_ = std::move(body);
    }

    WireRequest RedirectStateMachine::materialize() const
    {
        if (!url_valid_)
        {
            throw RedirectError(errc::request_build_failed, "request target is not an absolute URL: '" + target_ + "'");
        }
        if (!is_token(method_))
        {
            throw RedirectError(errc::request_build_failed, "invalid method '" + method_ + "'");
        }
        for (const auto& f : headers_)
        {
            if (!is_token(to_std(f.name_string())) || !is_field_value(to_std(f.value())))
            {
                throw RedirectError(errc::request_build_failed,
                                    "invalid header '" + std::string(to_std(f.name_string())) + "'");
            }
        }

        WireRequest req;
        // Copying the fields also copies the caller's start line; overwrite it after.
        static_cast<http::fields&>(req) = headers_;
        req.method_string(method_);
        req.target(url_.to_string());
        req.version(version_);
        req.set(http::field::host, host_header_value(url_));

        // Framing follows the body of this hop, not the caller's original request.
        req.erase(http::field::content_length);
        req.erase(http::field::transfer_encoding);
        if (body_)
        {
            req.body().assign(body_->view().data(), body_->size());
        }

        try
        {
            req.prepare_payload();
        }
        catch (const std::invalid_argument& e)
        {
            throw RedirectError(errc::request_build_failed, e.what());
        }
        return req;
    }

    auto RedirectStateMachine::handle_response(const WireResponse& res) -> Decision
    {
        const int status = res.result_int();
        if (!is_redirect_status(status))
        {
            return Decision::finish;
        }

        if (drops_body_on_redirect(status))
        {
            method_ = RedirectPolicy::next_method(method_, status);
            body_.reset();
        }
        return follow_redirect(res);
    }

    auto RedirectStateMachine::follow_redirect(const WireResponse& res) -> Decision
    {
        stripped_credentials_ = false;
        if (remaining_redirects_ == 0)
        {
            return Decision::finish;
        }
        --remaining_redirects_;

        const auto loc = res.find(http::field::location);
        if (loc == res.end())
        {
            return Decision::finish;
        }

        Url next = resolve_redirect(url_, to_std(loc->value()));
        if (policy_.crosses_trust_boundary(url_, next))
        {
            strip_sensitive_headers();
            stripped_credentials_ = true;
        }
        url_ = std::move(next);
        return Decision::follow;
    }

    void RedirectStateMachine::strip_sensitive_headers()
    {
        for (const auto name : k_sensitive_headers)
        {
            headers_.erase(boost::beast::string_view{ name.data(), name.size() });
        }
    }

} // namespace redir::net
