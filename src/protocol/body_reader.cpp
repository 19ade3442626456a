#include "wireline/protocol/body_reader.hpp"

#include <algorithm>
#include <boost/asio/error.hpp>

#include "wireline/protocol/parser.hpp"

namespace net = boost::asio;

namespace wireline::protocol {

    namespace {

        int hex_value(char c) noexcept {
            if (c >= '0' && c <= '9') return c - '0';
            if (c >= 'a' && c <= 'f') return c - 'a' + 10;
            if (c >= 'A' && c <= 'F') return c - 'A' + 10;
            return -1;
        }

        // Largest chunk size we accept: 16 hex digits.
        constexpr std::size_t kMaxChunkSizeDigits = 16;

    }  // namespace

    BodyReader::BodyReader(Connection& conn, BodyFraming framing,
                           CodecConfiguration cfg)
        : m_conn(conn), m_framing(framing), m_cfg(cfg), m_state(State::Done) {
        switch (framing.kind) {
            case BodyFraming::Kind::None:
                m_state = State::Done;
                break;
            case BodyFraming::Kind::Length:
                m_remaining = framing.length;
                m_state = framing.length == 0 ? State::Done : State::Length;
                break;
            case BodyFraming::Kind::Chunked:
                m_state = State::ChunkSize;
                break;
            case BodyFraming::Kind::UntilClose:
                m_state = State::UntilClose;
                break;
        }
    }

    std::uint64_t BodyReader::unread_remaining() const noexcept {
        if (m_state == State::Done) return 0;
        if (m_state == State::Length) return m_remaining;
        return kUnknownRemaining;
    }

    net::awaitable<Result<void>> BodyReader::fill_more(bool eof_is_end) {
        boost::system::error_code ec;
        co_await m_conn.fill(ec);
        if (!ec) co_return Result<void>::ok();

        if (ec == net::error::eof) {
            if (eof_is_end) {
                m_state = State::Done;
                m_conn.set_peer_will_close(true);
                co_return Result<void>::ok();
            }
            co_return Result<void>::err(
                Error{Error::Code::PeerClosed,
                      "connection closed inside message body", ec});
        }
        co_return Result<void>::err(Error{Error::Code::ReceiveFailed,
                                          "read failed: " + ec.message(), ec});
    }

    Result<bool> BodyReader::parse_chunk_size() {
        std::string_view data = buffered(m_conn);
        auto eol = data.find("\r\n");
        if (eol == std::string_view::npos) {
            if (data.find('\n') != std::string_view::npos) {
                return Result<bool>::err(
                    protocol_error("bare LF in chunk size line"));
            }
            if (data.size() > m_cfg.max_line_size) {
                return Result<bool>::err(
                    protocol_error("chunk size line too long"));
            }
            return Result<bool>::ok(false);
        }

        std::string_view line = data.substr(0, eol);
        if (line.find('\n') != std::string_view::npos) {
            return Result<bool>::err(
                protocol_error("bare LF in chunk size line"));
        }

        std::uint64_t size = 0;
        std::size_t digits = 0;
        while (digits < line.size() && hex_value(line[digits]) >= 0) {
            if (digits == kMaxChunkSizeDigits) {
                return Result<bool>::err(
                    protocol_error("chunk size out of range"));
            }
            size = (size << 4) | static_cast<std::uint64_t>(
                                     hex_value(line[digits]));
            ++digits;
        }
        if (digits == 0) {
            return Result<bool>::err(protocol_error("invalid chunk size"));
        }

        // chunk-ext is ignored, but must be introduced by ';'.
        std::string_view ext = trim_ows(line.substr(digits));
        if (!ext.empty() && (ext.front() != ';' || !is_field_value(ext))) {
            return Result<bool>::err(protocol_error("invalid chunk size"));
        }

        m_conn.buffer().consume(eol + 2);
        if (size == 0) {
            m_state = State::Trailers;
        } else {
            m_remaining = size;
            m_state = State::ChunkData;
        }
        return Result<bool>::ok(true);
    }

    Result<bool> BodyReader::parse_trailers() {
        std::string_view data = buffered(m_conn);
        if (data.substr(0, 2) == "\r\n") {
            m_conn.buffer().consume(2);
            m_state = State::Done;
            return Result<bool>::ok(true);
        }

        auto end = data.find("\r\n\r\n");
        if (end == std::string_view::npos) {
            if (data.size() >= 1 && data.substr(0, 1) == "\n") {
                return Result<bool>::err(
                    protocol_error("bare LF after last chunk"));
            }
            if (data.size() > m_cfg.max_field_size * (m_cfg.max_headers + 1)) {
                return Result<bool>::err(
                    protocol_error("trailer section too large"));
            }
            return Result<bool>::ok(false);
        }

        auto parsed =
            parse_field_lines(data.substr(0, end + 2), m_trailers, m_cfg);
        if (!parsed) return parsed.forward_error<bool>();
        m_conn.buffer().consume(end + 4);
        m_state = State::Done;
        return Result<bool>::ok(true);
    }

    net::awaitable<Result<std::string>> BodyReader::read_some(
        std::size_t max_bytes) {
        if (max_bytes == 0) max_bytes = 1;
        for (;;) {
            switch (m_state) {
                case State::Done:
                    co_return Result<std::string>::ok();

                case State::Length:
                case State::ChunkData:
                case State::UntilClose: {
                    std::string_view data = buffered(m_conn);
                    if (data.empty()) {
                        auto filled =
                            co_await fill_more(m_state == State::UntilClose);
                        if (!filled) {
                            co_return filled.forward_error<std::string>();
                        }
                        continue;
                    }
                    std::size_t n = std::min(data.size(), max_bytes);
                    if (m_state != State::UntilClose) {
                        n = static_cast<std::size_t>(
                            std::min<std::uint64_t>(n, m_remaining));
                    }
                    std::string out(data.substr(0, n));
                    m_conn.buffer().consume(n);
                    m_bytes_read += n;
                    if (m_state != State::UntilClose) {
                        m_remaining -= n;
                        if (m_remaining == 0) {
                            m_state = m_state == State::Length
                                          ? State::Done
                                          : State::ChunkDataEnd;
                        }
                    }
                    co_return Result<std::string>::ok(std::move(out));
                }

                case State::ChunkDataEnd: {
                    std::string_view data = buffered(m_conn);
                    if (data.size() < 2) {
                        auto filled = co_await fill_more(false);
                        if (!filled) {
                            co_return filled.forward_error<std::string>();
                        }
                        continue;
                    }
                    if (data.substr(0, 2) != "\r\n") {
                        co_return Result<std::string>::err(
                            protocol_error("missing CRLF after chunk data"));
                    }
                    m_conn.buffer().consume(2);
                    m_state = State::ChunkSize;
                    continue;
                }

                case State::ChunkSize:
                case State::Trailers: {
                    auto parsed = m_state == State::ChunkSize
                                      ? parse_chunk_size()
                                      : parse_trailers();
                    if (!parsed) co_return parsed.forward_error<std::string>();
                    if (!parsed.value()) {
                        auto filled = co_await fill_more(false);
                        if (!filled) {
                            co_return filled.forward_error<std::string>();
                        }
                    }
                    continue;
                }
            }
        }
    }

    net::awaitable<Result<std::string>> BodyReader::read_all(std::size_t limit) {
        std::string body;
        if (m_state == State::Length) {
            body.reserve(static_cast<std::size_t>(
                std::min<std::uint64_t>(m_remaining, limit)));
        }
        while (!done()) {
            auto piece = co_await read_some();
            if (!piece) co_return std::move(piece);
            if (body.size() + piece.value().size() > limit) {
                co_return Result<std::string>::err(
                    Error{Error::Code::BodyTooLarge,
                          "body exceeds " + std::to_string(limit) + " bytes"});
            }
            body += piece.value();
        }
        co_return Result<std::string>::ok(std::move(body));
    }

    net::awaitable<Result<void>> BodyReader::discard(std::uint64_t limit) {
        std::uint64_t dropped = 0;
        while (!done()) {
            auto piece = co_await read_some();
            if (!piece) co_return piece.forward_error<void>();
            dropped += piece.value().size();
            if (dropped > limit) {
                co_return Result<void>::err(Error{
                    Error::Code::BodyTooLarge, "body too large to discard"});
            }
        }
        co_return Result<void>::ok();
    }

}  // namespace wireline::protocol
