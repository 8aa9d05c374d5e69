// C++ Standard Library
#include <algorithm>
#include <cctype>
#include <charconv>
#include <utility>

// Project
#include <redir/net/http/error.hpp>
#include <redir/net/http/url.hpp>

namespace redir::net
{

    namespace
    {
        // Only visible ASCII may appear in a URI as received on the wire. This also
        // rejects anything that is not UTF-8, since non-ASCII bytes never pass.
        bool is_uri_text(std::string_view s) noexcept
        {
            if (s.empty())
            {
                return false;
            }
            return std::all_of(s.begin(), s.end(), [](char c) {
                const auto u = static_cast<unsigned char>(c);
                return u > 0x20 && u < 0x7F;
            });
        }

        bool is_scheme(std::string_view s) noexcept
        {
            if (s.empty() || !std::isalpha(static_cast<unsigned char>(s.front())))
            {
                return false;
            }
            return std::all_of(s.begin() + 1, s.end(), [](char c) {
                const auto u = static_cast<unsigned char>(c);
                return std::isalnum(u) || c == '+' || c == '-' || c == '.';
            });
        }

        std::string lower(std::string_view sv)
        {
            std::string out;
            out.reserve(sv.size());
            for (unsigned char c : sv)
            {
                out.push_back(static_cast<char>(std::tolower(c)));
            }
            return out;
        }

        bool is_port(std::string_view s) noexcept
        {
            unsigned value = 0;
            const auto* end = s.data() + s.size();
            auto [ptr, ec] = std::from_chars(s.data(), end, value);
            return !s.empty() && ec == std::errc{} && ptr == end && value <= 65535;
        }

        // RFC 3986 reg-name / IPv4: unreserved, pct-encoded and sub-delims only.
        bool is_reg_name(std::string_view s) noexcept
        {
            for (std::size_t i = 0; i < s.size(); ++i)
            {
                const auto u = static_cast<unsigned char>(s[i]);
                if (std::isalnum(u) || std::string_view{ "-._~!$&'()*+,;=" }.find(s[i]) != std::string_view::npos)
                {
                    continue;
                }
                if (s[i] == '%' && i + 2 < s.size() && std::isxdigit(static_cast<unsigned char>(s[i + 1]))
                    && std::isxdigit(static_cast<unsigned char>(s[i + 2])))
                {
                    i += 2;
                    continue;
                }
                return false;
            }
            return !s.empty();
        }

        // "[" IPv6 "]": hex digits, ':' and '.' for an embedded IPv4 tail.
        bool is_ip_literal(std::string_view s) noexcept
        {
            if (s.size() < 3 || s.front() != '[' || s.back() != ']')
            {
                return false;
            }
            const auto inner = s.substr(1, s.size() - 2);
            return std::all_of(inner.begin(), inner.end(), [](char c) {
                return std::isxdigit(static_cast<unsigned char>(c)) || c == ':' || c == '.';
            });
        }

        // host[:port], with bracketed IPv6 literals. Userinfo is refused.
        bool parse_authority(std::string_view auth, Url& out) noexcept
        {
            if (auth.empty() || auth.find('@') != std::string_view::npos)
            {
                return false;
            }

            std::string_view host = auth;
            std::string_view port;
            if (auth.front() == '[')
            {
                const auto close = auth.find(']');
                if (close == std::string_view::npos)
                {
                    return false;
                }
                host = auth.substr(0, close + 1);
                auto rest = auth.substr(close + 1);
                if (!rest.empty())
                {
                    if (rest.front() != ':')
                    {
                        return false;
                    }
                    port = rest.substr(1);
                    if (!is_port(port))
                    {
                        return false;
                    }
                }
            }
            else if (const auto colon = auth.rfind(':'); colon != std::string_view::npos)
            {
                host = auth.substr(0, colon);
                port = auth.substr(colon + 1);
                if (!is_port(port))
                {
                    return false;
                }
            }

            if (host.empty() || (host.front() == '[' ? !is_ip_literal(host) : !is_reg_name(host)))
            {
                return false;
            }
            out.host.assign(host);
            out.port.assign(port);
            return true;
        }

        // "[/path][?query][#fragment]"; fragment dropped, empty path becomes "/".
        bool parse_target(std::string_view s, Url& out)
        {
            if (const auto hash = s.find('#'); hash != std::string_view::npos)
            {
                s = s.substr(0, hash);
            }
            if (s.find('\\') != std::string_view::npos)
            {
                return false;
            }

            const auto q = s.find('?');
            if (q == std::string_view::npos)
            {
                out.path.assign(s);
                out.query.clear();
            }
            else
            {
                out.path.assign(s.substr(0, q));
                out.query.assign(s.substr(q));
            }

            if (out.path.empty())
            {
                out.path = "/";
            }
            return true;
        }

        // "authority[/path...]" following "scheme://" or "//".
        bool parse_authority_and_target(std::string_view s, Url& out)
        {
            const auto end = s.find_first_of("/?#");
            const auto auth = (end == std::string_view::npos) ? s : s.substr(0, end);
            if (!parse_authority(auth, out))
            {
                return false;
            }
            return parse_target(end == std::string_view::npos ? std::string_view{} : s.substr(end), out);
        }
    } // namespace

    std::string_view default_port_for_scheme(std::string_view scheme) noexcept
    {
        if (scheme == "https")
        {
            return "443";
        }
        if (scheme == "http")
        {
            return "80";
        }
        return {};
    }

    std::string_view effective_port(const Url& u) noexcept
    {
        return u.port.empty() ? default_port_for_scheme(u.scheme) : std::string_view{ u.port };
    }

    bool parse_url(std::string_view text, Url& out, std::error_code& ec)
    {
        ec = {};
        const auto sep = is_uri_text(text) ? text.find("://") : std::string_view::npos;
        if (sep == std::string_view::npos || !is_scheme(text.substr(0, sep)))
        {
            ec = errc::invalid_location;
            return false;
        }

        Url u;
        u.scheme = lower(text.substr(0, sep));
        if (!parse_authority_and_target(text.substr(sep + 3), u))
        {
            ec = errc::invalid_location;
            return false;
        }
        out = std::move(u);
        return true;
    }

    Url parse_url(std::string_view text)
    {
        Url out;
        std::error_code ec;
        if (!parse_url(text, out, ec))
        {
            throw RedirectError(errc::request_build_failed, "not an absolute URL: '" + std::string(text) + "'");
        }
        return out;
    }

    bool resolve_redirect(const Url& current, std::string_view location, Url& out, std::error_code& ec)
    {
        ec = errc::invalid_location;
        if (!current.is_absolute() || !is_uri_text(location))
        {
            return false;
        }

        // scheme-relative: "//host/..."
        if (location.rfind("//", 0) == 0)
        {
            Url next;
            next.scheme = current.scheme;
            if (!parse_authority_and_target(location.substr(2), next))
            {
                return false;
            }
            out = std::move(next);
            ec = {};
            return true;
        }

        // absolute-path: keep scheme and authority
        if (location.front() == '/')
        {
            Url next;
            next.scheme = current.scheme;
            next.host = current.host;
            next.port = current.port;
            if (!parse_target(location, next))
            {
                return false;
            }
            out = std::move(next);
            ec = {};
            return true;
        }

        // absolute; anything else has no path of its own
        return parse_url(location, out, ec);
    }

    Url resolve_redirect(const Url& current, std::string_view location)
    {
        Url out;
        std::error_code ec;
        if (!resolve_redirect(current, location, out, ec))
        {
            throw InvalidLocationError(std::string(location));
        }
        return out;
    }

    bool same_host(const Url& a, const Url& b, PortMatch mode) noexcept
    {
        if (a.host != b.host)
        {
            return false;
        }
        if (mode == PortMatch::literal)
        {
            return a.port == b.port;
        }
        return effective_port(a) == effective_port(b);
    }

} // namespace redir::net
