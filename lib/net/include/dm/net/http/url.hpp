/*
Module Name:
- url.hpp

Abstract:
- Splits absolute URLs such as the per-broadcast telemetry endpoint scraped
  from a channel page into host, port and request target.
- Query is stored with a leading '?' so target() can concatenate cheaply.
- Relative references are rejected; callers only ever hold absolute URLs.
*/
#pragma once

// C++ Standard Library
#include <optional>
#include <string>
#include <string_view>

namespace dm::net
{

    struct Url
    {
        std::string scheme;
        std::string host;
        std::string port;
        std::string path;
        std::string query; // includes leading '?' when present

        [[nodiscard]] std::string target() const
        {
            std::string out = path.empty() ? std::string{ "/" } : path;
            out += query;
            return out;
        }

        [[nodiscard]] std::string origin() const
        {
            std::string out = scheme;
            out += "://";
            out += host;
            if (!port.empty())
            {
                out.push_back(':');
                out += port;
            }
            return out;
        }
    };

    inline std::string_view default_port_for_scheme(std::string_view scheme) noexcept
    {
        if (scheme == "https")
            return "443";
        if (scheme == "http")
            return "80";
        return {};
    }

    // Parse "scheme://host[:port][/path][?query][#fragment]".
    // Port defaults from the scheme. Returns nullopt when scheme or host is missing.
    inline std::optional<Url> parse_url(std::string_view s)
    {
        Url u;

        const auto pos = s.find("://");
        if (pos == std::string_view::npos || pos == 0)
        {
            return std::nullopt;
        }
        u.scheme.assign(s.substr(0, pos));
        s.remove_prefix(pos + 3);

        if (const auto hash = s.find('#'); hash != std::string_view::npos)
        {
            s = s.substr(0, hash);
        }

        const auto slash = s.find_first_of("/?");
        const std::string_view auth = (slash == std::string_view::npos) ? s : s.substr(0, slash);
        s = (slash == std::string_view::npos) ? std::string_view{} : s.substr(slash);

        // split host[:port] using last ':'
        if (const auto colon = auth.rfind(':'); colon != std::string_view::npos)
        {
            u.host.assign(auth.substr(0, colon));
            u.port.assign(auth.substr(colon + 1));
        }
        else
        {
            u.host.assign(auth);
        }
        if (u.host.empty())
        {
            return std::nullopt;
        }
        if (u.port.empty())
        {
            u.port.assign(default_port_for_scheme(u.scheme));
        }

        const auto q = s.find('?');
        if (q == std::string_view::npos)
        {
            u.path.assign(s);
        }
        else
        {
            u.path.assign(s.substr(0, q));
            u.query.assign(s.substr(q));
        }
        if (u.path.empty() || u.path.front() != '/')
        {
            u.path.insert(u.path.begin(), '/');
        }
        return u;
    }

} // namespace dm::net
