#pragma once

#include <utility>

#include <boost/asio/awaitable.hpp>
#include <cstdint>
#include <limits>
#include <string>

#include "wireline/config.hpp"
#include "wireline/connection/connection.hpp"
#include "wireline/protocol/framing.hpp"
#include "wireline/protocol/message.hpp"
#include "wireline/result.hpp"

namespace wireline::protocol {

    /// @brief unread_remaining() value when the size of the rest of the body
    /// is not known yet.
    inline constexpr std::uint64_t kUnknownRemaining =
        std::numeric_limits<std::uint64_t>::max();

    /**
     * @brief Lazy reader of one message body off a connection.
     *
     * Pieces are produced in order and only once; a consumer that stops
     * early must call discard() or the connection must be closed instead of
     * reused. Bytes past the end of the body are left in the connection
     * buffer for the next message.
     */
    class BodyReader {
       public:
        BodyReader(Connection& conn, BodyFraming framing,
                   CodecConfiguration cfg);

        /// @brief Next piece of the body, at most max_bytes long.
        /// @return An empty string once the body is complete.
        boost::asio::awaitable<Result<std::string>> read_some(
            std::size_t max_bytes = 64 * 1024);

        /// @brief Read the rest of the body.
        /// @return BodyTooLarge when more than limit bytes arrive.
        boost::asio::awaitable<Result<std::string>> read_all(std::size_t limit);

        /// @brief Consume and drop the rest of the body.
        boost::asio::awaitable<Result<void>> discard(
            std::uint64_t limit = kUnknownRemaining);

        /// @brief True once the end of the body (and any trailers) was read.
        bool done() const noexcept { return m_state == State::Done; }

        /// @brief Trailer fields of a chunked body, available once done().
        const Headers& trailers() const noexcept { return m_trailers; }

        /// @brief 0 when done(), the remaining byte count for Content-Length
        /// bodies, kUnknownRemaining otherwise.
        std::uint64_t unread_remaining() const noexcept;

        std::uint64_t bytes_read() const noexcept { return m_bytes_read; }

        BodyFraming framing() const noexcept { return m_framing; }

       private:
        enum class State : std::uint8_t {
            Length,
            ChunkSize,
            ChunkData,
            ChunkDataEnd,
            Trailers,
            UntilClose,
            Done,
        };

        boost::asio::awaitable<Result<void>> fill_more(bool eof_is_end);

        Result<bool> parse_chunk_size();
        Result<bool> parse_trailers();

        Connection& m_conn;
        BodyFraming m_framing;
        CodecConfiguration m_cfg;
        State m_state;
        std::uint64_t m_remaining{0};
        std::uint64_t m_bytes_read{0};
        Headers m_trailers;
    };

}  // namespace wireline::protocol
