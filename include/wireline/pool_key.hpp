#pragma once

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <string>
#include <string_view>

#include "url.hpp"

namespace wireline {

    /**
     * @brief Identity of a reusable connection: (scheme, host, port,
     * TLS-verification mode).
     *
     * Connections are only handed out for requests carrying an equal key.
     */
    struct PoolKey {
        bool https{false};
        std::string host;
        std::string port;
        /// Only meaningful for https; plain keys always store true.
        bool verify_tls{true};

        void clear() {
            host.clear();
            port.clear();
            https = false;
            verify_tls = true;
        }

        inline void normalize_default_port() {
            if (port.empty()) port = https ? "443" : "80";
        }

        inline void normalize_host() {
            if (host.empty()) host = "localhost";
            std::transform(host.begin(), host.end(), host.begin(),
                           [](unsigned char c) { return std::tolower(c); });
        }

        /// @brief Default port, lower-case host, verification folded for
        /// plain http.
        void normalize() {
            normalize_default_port();
            normalize_host();
            if (!https) verify_tls = true;
        }

        /// @brief "https://host:443" (plus "+noverify" when verification is
        /// disabled), used in logs and Error::endpoint.
        std::string to_string() const {
            std::string out = https ? "https://" : "http://";
            if (host.find(':') != std::string::npos) {
                out += '[';
                out += host;
                out += ']';
            } else {
                out += host;
            }
            out += ':';
            out += port;
            if (https && !verify_tls) out += "+noverify";
            return out;
        }

        friend bool operator==(PoolKey const& a, PoolKey const& b) noexcept {
            return a.https == b.https && a.verify_tls == b.verify_tls &&
                   a.host == b.host && a.port == b.port;
        }

        friend bool operator!=(PoolKey const& a, PoolKey const& b) noexcept {
            return !(a == b);
        }
    };

    /// @brief Build the normalized key for a parsed URL.
    inline PoolKey pool_key_from_url(const UrlComponents& u, bool verify_tls) {
        PoolKey key;
        key.https = u.https;
        key.host = u.host;
        key.port = u.port;
        key.verify_tls = verify_tls;
        key.normalize();
        return key;
    }

}  // namespace wireline

namespace std {
    template <>
    struct hash<wireline::PoolKey> {
        size_t operator()(wireline::PoolKey const& k) const noexcept {
            // FNV-1a over the fields; any stable combination works.
            size_t h = 1469598103934665603ull;
            auto mix = [&](std::string_view s) {
                for (unsigned char c : s) {
                    h ^= c;
                    h *= 1099511628211ull;
                }
            };
            h ^= static_cast<size_t>(k.https) |
                 (static_cast<size_t>(k.verify_tls) << 1);
            h *= 1099511628211ull;
            mix(k.host);
            mix(k.port);
            return h;
        }
    };
}  // namespace std
