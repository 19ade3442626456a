#pragma once
#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace wireline {

    class Middleware;

    /**
     * @brief Limits and sizes used by the HTTP/1.1 codec.
     */
    struct CodecConfiguration {
        /** @brief Bodies smaller than this are written together with the
         * head in a single transport write. */
        std::size_t coalesce_threshold{4096};

        /** @brief Maximum length of the start line. */
        std::size_t max_line_size{8190};

        /** @brief Maximum length of a single header field line. */
        std::size_t max_field_size{8190};

        /** @brief Maximum number of header (or trailer) fields. */
        std::size_t max_headers{128};
    };

    /**
     * @brief Configuration for the connection pool.
     */
    struct PoolConfiguration {
        /** @brief Maximum connections (live or being established) overall. */
        std::size_t max_total_connections{100};

        /** @brief Maximum connections per pool key. */
        std::size_t max_connections_per_key{10};

        /** @brief Idle connections older than this are closed. */
        std::chrono::milliseconds idle_timeout{15000};

        /** @brief Period of the background idle sweep. */
        std::chrono::milliseconds idle_sweep_interval{5000};

        /** @brief Deadline for establishing one connection (all address
         * candidates and the TLS handshake). */
        std::chrono::milliseconds connect_timeout{10000};

        /** @brief Stagger between address candidates when racing. */
        std::chrono::milliseconds happy_eyeballs_delay{250};

        /** @brief Lifetime of cached DNS results. */
        std::chrono::milliseconds dns_ttl{10000};

        /** @brief Whether to close connections on pool shutdown. */
        bool close_on_shutdown{true};
    };

    /**
     * @brief Configuration for the HttpClient request pipeline.
     */
    struct ClientConfiguration {
        /** @brief Optional base URL for relative request URLs. */
        std::optional<std::string> base_url;

        /** @brief User-Agent string sent with each request. */
        std::string user_agent{"wireline/1.0"};

        /** @brief Default headers added to every request that does not set
         * them itself. */
        std::vector<std::pair<std::string, std::string>> default_headers;

        /** @brief Per-attempt deadline covering acquire, send and the
         * response head. */
        std::chrono::milliseconds attempt_timeout{30000};

        /** @brief Maximum size of buffered response bodies in bytes. */
        std::size_t max_body_bytes{static_cast<std::size_t>(8) * 1024U * 1024U};

        /** @brief Whether to verify TLS certificates. Part of the pool key. */
        bool verify_tls{true};

        /** @brief Middleware chain, outermost first. */
        std::vector<std::shared_ptr<Middleware>> middlewares;

        PoolConfiguration pool;

        CodecConfiguration codec;
    };

    /**
     * @brief Configuration for the server handler loop.
     */
    struct ServerConfiguration {
        /** @brief Close a kept-alive connection after this much inactivity
         * between requests. */
        std::chrono::milliseconds keep_alive_timeout{75000};

        /** @brief Maximum size of request bodies in bytes. */
        std::size_t max_body_bytes{static_cast<std::size_t>(8) * 1024U * 1024U};

        /** @brief Value of the Server header; empty disables it. */
        std::string server_header{"wireline"};

        CodecConfiguration codec;
    };

}  // namespace wireline
