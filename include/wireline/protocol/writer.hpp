#pragma once

#include <utility>

#include <boost/asio/awaitable.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "wireline/config.hpp"
#include "wireline/connection/connection.hpp"
#include "wireline/protocol/framing.hpp"
#include "wireline/protocol/message.hpp"
#include "wireline/result.hpp"

namespace wireline::protocol {

    /// @brief What a write operation put on the transport.
    struct WriteReport {
        /// Number of Transport::write calls issued.
        std::size_t writes{0};
        std::uint64_t bytes{0};
        /// Head and body went out in a single write.
        bool coalesced{false};
    };

    /// @brief Request line, fields and blank line.
    std::string serialize_head(const RequestHead& head);

    /// @brief Status line, fields and blank line.
    std::string serialize_head(const ResponseHead& head);

    /// @brief Chunk size line ("1a\r\n").
    std::string chunk_size_line(std::size_t size);

    /// @brief Zero-length chunk, trailer fields and the final CRLF.
    std::string last_chunk(const Headers& trailers);

    /**
     * @brief Producer of a streamed body whose pieces are not known when
     * the head is written.
     */
    class BodySource {
       public:
        virtual ~BodySource() = default;

        /// @brief Next piece, or nullopt at the end of the body.
        virtual boost::asio::awaitable<Result<std::optional<std::string>>>
        next() = 0;

        /// @brief Trailer fields sent after the last chunk.
        virtual Headers trailers() const { return {}; }
    };

    /// @brief BodySource over pieces held in memory.
    class ChunkListSource : public BodySource {
       public:
        explicit ChunkListSource(std::vector<std::string> pieces,
                                 Headers trailers = {})
            : m_pieces(std::move(pieces)), m_trailers(std::move(trailers)) {}

        boost::asio::awaitable<Result<std::optional<std::string>>> next()
            override;

        Headers trailers() const override { return m_trailers; }

       private:
        std::vector<std::string> m_pieces;
        std::size_t m_next{0};
        Headers m_trailers;
    };

    /// @brief Write a head and a fully buffered body.
    ///
    /// A body smaller than cfg.coalesce_threshold goes out in the same
    /// write as the head (one vectored write). Larger bodies are written
    /// after the head. With chunked framing the body becomes one chunk
    /// followed by the last chunk.
    /// @note With BodyFraming::Kind::None the body is not sent (HEAD
    /// responses keep their Content-Length but carry no bytes).
    boost::asio::awaitable<Result<WriteReport>> write_buffered(
        Connection& conn, const std::string& head, std::string_view body,
        BodyFraming framing, const CodecConfiguration& cfg);

    /// @brief Write the head immediately, then each piece as it becomes
    /// available. With chunked framing every piece is one write of size
    /// line, data and CRLF; empty pieces are skipped.
    boost::asio::awaitable<Result<WriteReport>> write_streamed(
        Connection& conn, const std::string& head, BodySource& source,
        BodyFraming framing);

}  // namespace wireline::protocol
