#pragma once

#include <utility>

#include <boost/asio/awaitable.hpp>
#include <cstddef>
#include <optional>
#include <string_view>

#include "wireline/config.hpp"
#include "wireline/connection/connection.hpp"
#include "wireline/protocol/message.hpp"
#include "wireline/result.hpp"

namespace wireline::protocol {

    /// @brief Build an Error::Code::Protocol error.
    Error protocol_error(std::string message);

    /// @brief Locate the blank line ending a head.
    /// @return Offset one past the terminating CRLF, nullopt when more bytes
    /// are needed, or a Protocol error for bare LF line endings and lines
    /// exceeding the configured limits.
    Result<std::optional<std::size_t>> find_head_end(
        std::string_view data, const CodecConfiguration& cfg);

    /// @brief Number of leading CRLF bytes (empty lines tolerated before a
    /// request line).
    std::size_t leading_empty_lines(std::string_view data) noexcept;

    /// @brief Parse header field lines (each terminated by CRLF, no blank
    /// line) into out. Used for heads and chunked trailers.
    Result<void> parse_field_lines(std::string_view block, Headers& out,
                                   const CodecConfiguration& cfg);

    /// @brief Parse a complete request head (request line, fields, blank
    /// line).
    Result<RequestHead> parse_request_head(std::string_view head,
                                           const CodecConfiguration& cfg);

    /// @brief Parse a complete response head (status line, fields, blank
    /// line).
    Result<ResponseHead> parse_response_head(std::string_view head,
                                             const CodecConfiguration& cfg);

    /// @brief Parse "HTTP/d.d" into 10 * major + minor.
    std::optional<unsigned> parse_http_version(std::string_view s) noexcept;

    /// @brief Read and parse a request head off the connection (server
    /// mode). Bytes after the head stay in the connection buffer.
    /// @note PeerClosed with an empty cause means the peer closed cleanly
    /// between messages.
    boost::asio::awaitable<Result<RequestHead>> read_request_head(
        Connection& conn, const CodecConfiguration& cfg);

    /// @brief Read and parse a response head off the connection (client
    /// mode).
    boost::asio::awaitable<Result<ResponseHead>> read_response_head(
        Connection& conn, const CodecConfiguration& cfg);

    /// @brief Readable bytes of the connection buffer.
    std::string_view buffered(Connection& conn) noexcept;

}  // namespace wireline::protocol
