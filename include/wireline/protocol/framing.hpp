#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

#include "wireline/protocol/message.hpp"
#include "wireline/result.hpp"

namespace wireline::protocol {

    /**
     * @brief How the end of a message body is found.
     *
     * Decided from the head alone, before any body byte is read.
     */
    struct BodyFraming {
        enum class Kind : std::uint8_t {
            None,        ///< No body
            Length,      ///< Content-Length bytes
            Chunked,     ///< Chunked transfer coding
            UntilClose,  ///< Body ends when the peer closes (responses only)
        };

        Kind kind{Kind::None};
        std::uint64_t length{0};

        static BodyFraming none() noexcept { return {}; }
        static BodyFraming fixed(std::uint64_t n) noexcept {
            return {Kind::Length, n};
        }
        static BodyFraming chunked() noexcept { return {Kind::Chunked, 0}; }
        static BodyFraming until_close() noexcept {
            return {Kind::UntilClose, 0};
        }

        friend bool operator==(BodyFraming const& a,
                               BodyFraming const& b) noexcept {
            return a.kind == b.kind && a.length == b.length;
        }
    };

    const char* to_string(BodyFraming::Kind kind) noexcept;

    /// @brief Parse every Content-Length line. Values must be plain digit
    /// strings and all equal.
    /// @return nullopt when the header is absent.
    Result<std::optional<std::uint64_t>> parse_content_length(
        const Headers& headers);

    /// @brief Whether a status never carries a body (1xx, 204, 304).
    constexpr bool status_has_no_body(unsigned status) noexcept {
        return (status >= 100 && status < 200) || status == 204 ||
               status == 304;
    }

    /// @brief Body framing of a request.
    /// Transfer-Encoding together with Content-Length is rejected, as is a
    /// Transfer-Encoding whose final coding is not chunked.
    Result<BodyFraming> request_framing(const RequestHead& head);

    /// @brief Body framing of a response to a request with the given method.
    /// HEAD responses and 1xx/204/304 have no body; a final coding other
    /// than chunked means the body runs until close.
    Result<BodyFraming> response_framing(const ResponseHead& head,
                                         std::string_view request_method);

}  // namespace wireline::protocol
