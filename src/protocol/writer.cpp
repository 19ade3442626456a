#include "wireline/protocol/writer.hpp"

#include <boost/asio/buffer.hpp>
#include <cstdio>

namespace net = boost::asio;

namespace wireline::protocol {

    namespace {

        constexpr std::string_view kCrlf = "\r\n";

        void append_fields(std::string& out, const Headers& headers) {
            for (auto const& f : headers) {
                out += to_std(f.name_string());
                out += ": ";
                out += to_std(f.value());
                out += kCrlf;
            }
        }

        void append_version(std::string& out, unsigned version) {
            out += "HTTP/";
            out += static_cast<char>('0' + version / 10);
            out += '.';
            out += static_cast<char>('0' + version % 10);
        }

        net::const_buffer view(std::string_view s) noexcept {
            return net::buffer(s.data(), s.size());
        }

        // One transport write, accounted in the report.
        net::awaitable<Result<void>> put(Connection& conn,
                                         const Transport::ConstBuffers& bufs,
                                         WriteReport& report) {
            boost::system::error_code ec;
            std::size_t n = co_await conn.write(bufs, ec);
            report.bytes += n;
            ++report.writes;
            if (ec) {
                co_return Result<void>::err(Error{
                    Error::Code::SendFailed, "write failed: " + ec.message(),
                    ec});
            }
            co_return Result<void>::ok();
        }

    }  // namespace

    std::string serialize_head(const RequestHead& head) {
        std::string out;
        out.reserve(256);
        out += head.method;
        out += ' ';
        out += head.target;
        out += ' ';
        append_version(out, head.version);
        out += kCrlf;
        append_fields(out, head.headers);
        out += kCrlf;
        return out;
    }

    std::string serialize_head(const ResponseHead& head) {
        std::string out;
        out.reserve(256);
        append_version(out, head.version);
        out += ' ';
        out += std::to_string(head.status);
        out += ' ';
        out += head.reason;
        out += kCrlf;
        append_fields(out, head.headers);
        out += kCrlf;
        return out;
    }

    std::string chunk_size_line(std::size_t size) {
        char buf[32];
        int n = std::snprintf(buf, sizeof(buf), "%zx\r\n", size);
        return std::string(buf, static_cast<std::size_t>(n));
    }

    std::string last_chunk(const Headers& trailers) {
        std::string out = "0\r\n";
        append_fields(out, trailers);
        out += kCrlf;
        return out;
    }

    net::awaitable<Result<std::optional<std::string>>> ChunkListSource::next() {
        if (m_next >= m_pieces.size()) {
            co_return Result<std::optional<std::string>>::ok(std::nullopt);
        }
        co_return Result<std::optional<std::string>>::ok(
            std::move(m_pieces[m_next++]));
    }

    net::awaitable<Result<WriteReport>> write_buffered(
        Connection& conn, const std::string& head, std::string_view body,
        BodyFraming framing, const CodecConfiguration& cfg) {
        WriteReport report;
        const bool small = body.size() < cfg.coalesce_threshold;

        switch (framing.kind) {
            case BodyFraming::Kind::None:
            case BodyFraming::Kind::UntilClose:
                if (framing.kind == BodyFraming::Kind::None || body.empty()) {
                    const Transport::ConstBuffers head_only{view(head)};
                    auto r = co_await put(conn, head_only, report);
                    if (!r) co_return r.forward_error<WriteReport>();
                    break;
                }
                [[fallthrough]];
            case BodyFraming::Kind::Length:
                if (small) {
                    const Transport::ConstBuffers head_and_body{view(head), view(body)};
                    auto r = co_await put(conn, head_and_body, report);
                    if (!r) co_return r.forward_error<WriteReport>();
                    report.coalesced = true;
                } else {
                    const Transport::ConstBuffers head_only{view(head)};
                    auto r = co_await put(conn, head_only, report);
                    if (!r) co_return r.forward_error<WriteReport>();
                    const Transport::ConstBuffers body_only{view(body)};
                    r = co_await put(conn, body_only, report);
                    if (!r) co_return r.forward_error<WriteReport>();
                }
                break;

            case BodyFraming::Kind::Chunked: {
                const std::string size_line = chunk_size_line(body.size());
                const std::string tail = last_chunk({});
                if (small) {
                    Transport::ConstBuffers bufs{view(head)};
                    if (!body.empty()) {
                        bufs.push_back(view(size_line));
                        bufs.push_back(view(body));
                        bufs.push_back(view(kCrlf));
                    }
                    bufs.push_back(view(tail));
                    auto r = co_await put(conn, bufs, report);
                    if (!r) co_return r.forward_error<WriteReport>();
                    report.coalesced = true;
                } else {
                    const Transport::ConstBuffers head_only{view(head)};
                    auto r = co_await put(conn, head_only, report);
                    if (!r) co_return r.forward_error<WriteReport>();
                    const Transport::ConstBuffers chunk{view(size_line), view(body),
                                                        view(kCrlf)};
                    r = co_await put(conn, chunk, report);
                    if (!r) co_return r.forward_error<WriteReport>();
                    const Transport::ConstBuffers tail_only{view(tail)};
                    r = co_await put(conn, tail_only, report);
                    if (!r) co_return r.forward_error<WriteReport>();
                }
                break;
            }
        }
        co_return Result<WriteReport>::ok(report);
    }

    net::awaitable<Result<WriteReport>> write_streamed(
        Connection& conn, const std::string& head, BodySource& source,
        BodyFraming framing) {
        WriteReport report;
        const Transport::ConstBuffers head_only{view(head)};
        auto r = co_await put(conn, head_only, report);
        if (!r) co_return r.forward_error<WriteReport>();

        const bool chunked = framing.kind == BodyFraming::Kind::Chunked;
        std::uint64_t total = 0;
        for (;;) {
            auto piece = co_await source.next();
            if (!piece) co_return piece.forward_error<WriteReport>();
            if (!piece.value()) break;
            const std::string& data = *piece.value();
            // A zero-length chunk would terminate the body.
            if (data.empty()) continue;

            total += data.size();
            if (chunked) {
                const std::string size_line = chunk_size_line(data.size());
                const Transport::ConstBuffers chunk{view(size_line), view(data),
                                                    view(kCrlf)};
                r = co_await put(conn, chunk, report);
            } else {
                if (framing.kind != BodyFraming::Kind::Length ||
                    total > framing.length) {
                    co_return Result<WriteReport>::err(
                        Error{Error::Code::InvalidRequest,
                              "streamed body exceeds its Content-Length"});
                }
                const Transport::ConstBuffers data_only{view(data)};
                r = co_await put(conn, data_only, report);
            }
            if (!r) co_return r.forward_error<WriteReport>();
        }

        if (chunked) {
            const std::string tail = last_chunk(source.trailers());
            const Transport::ConstBuffers tail_only{view(tail)};
            r = co_await put(conn, tail_only, report);
            if (!r) co_return r.forward_error<WriteReport>();
        } else if (framing.kind == BodyFraming::Kind::Length &&
                   total != framing.length) {
            co_return Result<WriteReport>::err(
                Error{Error::Code::InvalidRequest,
                      "streamed body shorter than its Content-Length"});
        }
        co_return Result<WriteReport>::ok(report);
    }

}  // namespace wireline::protocol
