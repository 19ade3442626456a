#pragma once

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>

#include "result.hpp"

namespace wireline {

    struct UrlComponents {
        bool https{false};
        /// Host without brackets (IPv6 literals are stored bare), lower-case.
        std::string host;
        std::string port;
        // For a parsed absolute URL: full target (path + optional query).
        // For a parsed base URL (via parse_base_url): normalized prefix path
        // ("" or "/api"). For a resolved URL: full request target.
        std::string target;

        bool default_port() const noexcept {
            return port == (https ? "443" : "80");
        }

        /// @brief Value for the Host header: brackets for IPv6, port only
        /// when it is not the scheme default.
        std::string host_header() const {
            std::string out;
            const bool v6 = host.find(':') != std::string::npos;
            if (v6) out.push_back('[');
            out += host;
            if (v6) out.push_back(']');
            if (!default_port()) {
                out.push_back(':');
                out += port;
            }
            return out;
        }
    };

    /// @brief "scheme://host[:port]" with the port omitted when default.
    inline std::string origin_of(const UrlComponents& u) {
        return (u.https ? "https://" : "http://") + u.host_header();
    }

    /// @brief Absolute form of a resolved URL: origin followed by target.
    inline std::string absolute_url(const UrlComponents& u) {
        return origin_of(u) + u.target;
    }

    namespace url_utils {

        /// @brief Check if a URL is an absolute HTTP or HTTPS URL.
        inline bool is_absolute_url_with_protocol(std::string_view s) {
            return (s.rfind("https://", 0) == 0) ||
                   (s.rfind("http://", 0) == 0);
        }

        inline std::string trim_trailing_slashes(std::string s) {
            while (!s.empty() && s.back() == '/') s.pop_back();
            return s;
        }

        inline bool is_valid_port(std::string_view p) {
            if (p.empty() || p.size() > 5) return false;
            unsigned value = 0;
            for (char c : p) {
                if (c < '0' || c > '9') return false;
                value = value * 10 + static_cast<unsigned>(c - '0');
            }
            return value > 0 && value <= 65535;
        }

        inline Result<UrlComponents> parse_base_url(std::string_view base_url);

        /// @brief Resolve a request URL (absolute or relative) into
        /// UrlComponents.
        /// - absolute => parsed
        /// - relative => requires base (parsed via parse_base_url), then
        ///   joins prefix + relative
        inline Result<UrlComponents> resolve_url(
            std::string_view uri_or_url,
            const UrlComponents* base /*nullable*/);

    }  // namespace url_utils

    /// @brief Parse an absolute http(s) URL into its components.
    inline Result<UrlComponents> parse_url(std::string_view url) {
        auto make_err = [&](std::string msg) -> Result<UrlComponents> {
            Error e{};
            e.message = std::move(msg);
            e.code = Error::Code::InvalidUrl;
            return Result<UrlComponents>::err(std::move(e));
        };

        std::string_view s(url);

        bool https = false;
        if (s.rfind("https://", 0) == 0) {
            https = true;
            s.remove_prefix(std::string_view("https://").size());
        } else if (s.rfind("http://", 0) == 0) {
            s.remove_prefix(std::string_view("http://").size());
        } else {
            return make_err("URL must start with http:// or https://");
        }

        // Fragments never go on the wire.
        if (auto hash = s.find('#'); hash != std::string_view::npos) {
            s = s.substr(0, hash);
        }

        std::string_view hostport = s;
        std::string_view path = "/";
        if (auto cut = s.find_first_of("/?"); cut != std::string_view::npos) {
            hostport = s.substr(0, cut);
            path = s.substr(cut);
        }

        if (hostport.empty()) {
            return make_err("URL missing host");
        }
        if (hostport.find('@') != std::string_view::npos) {
            return make_err("URL userinfo is not supported");
        }

        std::string_view host;
        std::string_view port;

        if (hostport.front() == '[') {
            auto close = hostport.find(']');
            if (close == std::string_view::npos) {
                return make_err("URL has unterminated IPv6 literal");
            }
            host = hostport.substr(1, close - 1);
            auto rest = hostport.substr(close + 1);
            if (!rest.empty()) {
                if (rest.front() != ':') {
                    return make_err("URL has garbage after IPv6 literal");
                }
                port = rest.substr(1);
                if (port.empty()) return make_err("URL has empty port");
            }
        } else if (auto colon = hostport.rfind(':');
                   colon != std::string_view::npos) {
            host = hostport.substr(0, colon);
            port = hostport.substr(colon + 1);
            if (port.empty()) {
                return make_err("URL has empty port");
            }
        } else {
            host = hostport;
        }

        if (host.empty()) {
            return make_err("URL has empty host");
        }
        if (!port.empty() && !url_utils::is_valid_port(port)) {
            return make_err("URL has invalid port");
        }

        UrlComponents out;
        out.https = https;
        out.host.assign(host);
        std::transform(out.host.begin(), out.host.end(), out.host.begin(),
                       [](unsigned char c) { return std::tolower(c); });
        out.port = port.empty() ? (https ? "443" : "80") : std::string(port);
        if (path.front() == '?') {
            out.target = "/";
            out.target.append(path);
        } else {
            out.target.assign(path);
        }
        return Result<UrlComponents>::ok(std::move(out));
    }

    // ---- url_utils implementations ----

    namespace url_utils {

        inline Result<UrlComponents> parse_base_url(std::string_view base_url) {
            auto make_err = [&](std::string msg) -> Result<UrlComponents> {
                Error e{};
                e.message = std::move(msg);
                e.code = Error::Code::InvalidUrl;
                return Result<UrlComponents>::err(std::move(e));
            };

            if (base_url.empty()) {
                return make_err("base_url is empty");
            }

            auto parsed = wireline::parse_url(base_url);
            if (parsed.has_error()) return parsed;

            UrlComponents b = std::move(parsed).value();

            b.target = trim_trailing_slashes(std::move(b.target));

            // Keep joining simple: reject query in base prefix
            if (b.target.find('?') != std::string::npos) {
                return make_err("base_url must not include query parameters");
            }

            return Result<UrlComponents>::ok(std::move(b));
        }

        inline Result<UrlComponents> resolve_url(std::string_view uri_or_url,
                                                 const UrlComponents* base) {
            if (is_absolute_url_with_protocol(uri_or_url)) {
                return wireline::parse_url(uri_or_url);
            }

            if (base == nullptr || base->host.empty() || base->port.empty()) {
                Error e{};
                e.code = Error::Code::InvalidUrl;
                e.message = "Relative URI provided but base_url is empty";
                return Result<UrlComponents>::err(std::move(e));
            }

            // "" => "/", "health" => "/health"
            std::string rel;
            if (uri_or_url.empty() || uri_or_url.front() != '/') {
                rel.push_back('/');
            }
            rel.append(uri_or_url);

            UrlComponents out;
            out.https = base->https;
            out.host = base->host;
            out.port = base->port;
            out.target = base->target + rel;
            return Result<UrlComponents>::ok(std::move(out));
        }

    }  // namespace url_utils

}  // namespace wireline
