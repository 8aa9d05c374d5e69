// C++ Standard Library
#include <chrono>
#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string>
#include <utility>

// TOML++
#include <toml++/toml.hpp>

// Project
#include <redir/config/config.hpp>

namespace redir::config
{

    namespace
    {
        std::string dotted(std::initializer_list<std::string_view> keys)
        {
            std::string out;
            for (auto key : keys)
            {
                if (!out.empty())
                    out.push_back('.');
                out.append(key);
            }
            return out;
        }

        // Node at dotted key path, or nullptr when any part is missing.
        const toml::node* find_node(const toml::table& root, std::initializer_list<std::string_view> keys)
        {
            const toml::node* node = &root;
            for (auto key : keys)
            {
                const auto* table_ptr = node->as_table();
                if (!table_ptr)
                    return nullptr;
                node = table_ptr->get(key);
                if (!node)
                    return nullptr;
            }
            return node;
        }

        // Optional non-negative integer; present with the wrong type or sign throws.
        std::optional<std::int64_t> fetch_optional_count(const toml::table& root,
                                                         std::initializer_list<std::string_view> keys,
                                                         const std::string& source)
        {
            const auto* node = find_node(root, keys);
            if (!node)
                return std::nullopt;

            auto opt = node->value<std::int64_t>();
            if (!opt || *opt < 0)
                throw ConfigError("Invalid value for '" + dotted(keys) + "' in " + source
                                  + ": expected a non-negative integer");
            return opt;
        }

        // Optional non-empty string.
        std::optional<std::string> fetch_optional_string(const toml::table& root,
                                                         std::initializer_list<std::string_view> keys,
                                                         const std::string& source)
        {
            const auto* node = find_node(root, keys);
            if (!node)
                return std::nullopt;

            auto opt = node->value<std::string>();
            if (!opt || opt->empty())
                throw ConfigError("Invalid value for '" + dotted(keys) + "' in " + source
                                  + ": expected a non-empty string");
            return opt;
        }

        void apply_timeout(const toml::table& root,
                           std::initializer_list<std::string_view> keys,
                           const std::string& source,
                           std::chrono::steady_clock::duration& out)
        {
            if (auto ms = fetch_optional_count(root, keys, source))
            {
                if (*ms == 0)
                    throw ConfigError("Invalid value for '" + dotted(keys) + "' in " + source
                                      + ": timeout must be positive");
                constexpr auto max_ms =
                    std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::duration::max());
                if (*ms > max_ms.count())
                    throw ConfigError("Invalid value for '" + dotted(keys) + "' in " + source
                                      + ": timeout exceeds " + std::to_string(max_ms.count()) + " ms");
                out = std::chrono::milliseconds{ *ms };
            }
        }

        net::PortMatch parse_port_match(std::string_view value, const std::string& source)
        {
            if (value == "literal")
                return net::PortMatch::literal;
            if (value == "default_port_equivalent")
                return net::PortMatch::default_port_equivalent;
            throw ConfigError("Unknown redirects.port_match '" + std::string{ value } + "' in " + source);
        }

        std::pair<net::RedirectPolicy, net::TransportOptions> read_tables(const toml::table& tbl,
                                                                          const std::string& source)
        {
            net::RedirectPolicy redirects;
            if (auto max = fetch_optional_count(tbl, { "redirects", "max" }, source))
                redirects.set_max_redirects(static_cast<std::size_t>(*max));
            if (auto pm = fetch_optional_string(tbl, { "redirects", "port_match" }, source))
                redirects.set_port_match(parse_port_match(*pm, source));

            net::TransportOptions transport;
            apply_timeout(tbl, { "transport", "connect_timeout_ms" }, source, transport.connect_timeout);
            apply_timeout(tbl, { "transport", "handshake_timeout_ms" }, source, transport.handshake_timeout);
            apply_timeout(tbl, { "transport", "write_timeout_ms" }, source, transport.write_timeout);
            apply_timeout(tbl, { "transport", "read_timeout_ms" }, source, transport.read_timeout);
            if (auto ua = fetch_optional_string(tbl, { "transport", "user_agent" }, source))
                transport.user_agent = std::move(*ua);

            return { redirects, std::move(transport) };
        }
    } // namespace

    Config Config::parse(std::string_view text, std::string_view source)
    {
        const std::string source_str{ source };
        toml::table tbl;
        try
        {
            tbl = toml::parse(text, source);
        }
        catch (const toml::parse_error& e)
        {
            throw ConfigError("TOML parse error in '" + source_str + "': " + std::string{ e.what() });
        }

        auto [redirects, transport] = read_tables(tbl, source_str);
        return Config({}, redirects, std::move(transport));
    }

    Config Config::load_file(const std::filesystem::path& path)
    {
        if (path.string().empty())
            throw ConfigError("Config file path must not be empty");

        const auto abs = std::filesystem::absolute(path);
        const auto path_str = abs.string();
        toml::table tbl;
        try
        {
            tbl = toml::parse_file(path_str);
        }
        catch (const toml::parse_error& e)
        {
            throw ConfigError("TOML parse error in '" + path_str + "': " + std::string{ e.what() });
        }
        catch (const std::filesystem::filesystem_error& e)
        {
            throw ConfigError("Cannot read config file '" + path_str + "': " + std::string{ e.what() });
        }

        auto [redirects, transport] = read_tables(tbl, path_str);
        return Config(abs, redirects, std::move(transport));
    }

    Config Config::load()
    {
        const auto default_path = std::filesystem::current_path() / "redir.toml";
        if (!std::filesystem::exists(default_path))
            throw ConfigError("Config file not found at '" + default_path.string() + "'");
        return load_file(default_path);
    }

    ConfigError::ConfigError(const std::string& msg) noexcept :
        std::runtime_error{ msg }
    {
    }

} // namespace redir::config
