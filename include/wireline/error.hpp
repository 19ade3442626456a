#pragma once
#include <utility>

#include <boost/system/error_code.hpp>
#include <cstdint>
#include <string>

namespace wireline {
    /**
     * @brief Represents an error that occurred during an HTTP operation.
     *
     * Besides the code and message, an Error records the transport-level
     * cause (if any) and the pool key / connection that was involved, so a
     * caller can tell a network failure from a protocol violation from a
     * timeout.
     */
    struct Error {
        /** @brief Enumeration of error codes. */
        enum class Code {
            InvalidUrl,     /**< The provided URL is malformed or invalid. */
            InvalidRequest, /**< The request cannot be serialized. */
            Resolution,     /**< Name lookup failed. */
            Connect,        /**< Every address candidate failed. */
            Tls,            /**< TLS handshake failed. */
            Timeout,        /**< Acquire or per-attempt deadline exceeded. */
            Protocol,       /**< Malformed or conflicting HTTP framing. */
            PeerClosed,     /**< Peer closed before a complete message. */
            AuthChallenge,  /**< Malformed or unsupported Digest challenge. */
            Cancelled,      /**< The operation was cancelled by the caller. */
            Shutdown,       /**< The pool or client has been shut down. */
            BodyTooLarge,   /**< A body exceeded the configured limit. */
            SendFailed,     /**< Writing the request failed. */
            ReceiveFailed,  /**< Reading the response failed. */
        };

        /** @brief The error code. */
        Code code{Code::ReceiveFailed};
        /** @brief A descriptive error message. */
        std::string message;
        /** @brief Underlying transport error, if any. */
        boost::system::error_code cause{};
        /** @brief Pool key of the exchange ("https://host:443"), if known. */
        std::string endpoint{};
        /** @brief Connection identity, 0 when no connection was involved. */
        std::uint64_t connection_id{0};

        /// @brief True for failures of the network path (DNS, connect, TLS,
        /// peer close, socket I/O).
        bool is_network() const noexcept {
            switch (code) {
                case Code::Resolution:
                case Code::Connect:
                case Code::Tls:
                case Code::PeerClosed:
                case Code::SendFailed:
                case Code::ReceiveFailed:
                    return true;
                default:
                    return false;
            }
        }

        bool is_protocol() const noexcept { return code == Code::Protocol; }

        bool is_timeout() const noexcept { return code == Code::Timeout; }
    };

    /// @brief Stable name of an error code, for logs and diagnostics.
    const char* to_string(Error::Code code) noexcept;

    /// @brief "<code>: <message>" plus endpoint and cause when present.
    std::string describe(const Error& error);

}  // namespace wireline
