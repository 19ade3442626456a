#include "wireline/protocol/parser.hpp"

#include <boost/asio/error.hpp>

namespace net = boost::asio;

namespace wireline::protocol {

    namespace {

        bool is_digit(char c) noexcept { return c >= '0' && c <= '9'; }

        // Splits the head into its first line and the field block (without
        // the final blank line).
        Result<std::pair<std::string_view, std::string_view>> split_head(
            std::string_view head) {
            auto eol = head.find("\r\n");
            if (eol == std::string_view::npos || head.size() < eol + 2 ||
                head.substr(head.size() - 2) != "\r\n") {
                return Result<std::pair<std::string_view, std::string_view>>::
                    err(protocol_error("incomplete message head"));
            }
            std::string_view first = head.substr(0, eol);
            std::string_view fields = head.substr(eol + 2);
            // Drop the blank line.
            fields.remove_suffix(2);
            return Result<std::pair<std::string_view, std::string_view>>::ok(
                first, fields);
        }

        template <class Head>
        net::awaitable<Result<Head>> read_head(
            Connection& conn, const CodecConfiguration& cfg, bool request,
            Result<Head> (*parse)(std::string_view,
                                  const CodecConfiguration&)) {
            for (;;) {
                if (request) {
                    auto skip = leading_empty_lines(buffered(conn));
                    if (skip > 0) conn.buffer().consume(skip);
                }

                std::string_view data = buffered(conn);
                auto end = find_head_end(data, cfg);
                if (end.has_error()) {
                    co_return Result<Head>::err(std::move(end).error());
                }
                if (auto const& pos = end.value(); pos.has_value()) {
                    auto parsed = parse(data.substr(0, *pos), cfg);
                    if (parsed) conn.buffer().consume(*pos);
                    co_return std::move(parsed);
                }

                const bool nothing_yet = data.empty();
                boost::system::error_code ec;
                co_await conn.fill(ec);
                if (!ec) continue;

                if (ec == net::error::eof) {
                    Error e{Error::Code::PeerClosed,
                            nothing_yet
                                ? "connection closed before message head"
                                : "connection closed inside message head"};
                    if (!nothing_yet) e.cause = ec;
                    co_return Result<Head>::err(std::move(e));
                }
                co_return Result<Head>::err(Error{
                    Error::Code::ReceiveFailed,
                    "read failed: " + ec.message(), ec});
            }
        }

    }  // namespace

    Error protocol_error(std::string message) {
        return Error{Error::Code::Protocol, std::move(message)};
    }

    std::string_view buffered(Connection& conn) noexcept {
        auto b = conn.buffer().data();
        return {static_cast<const char*>(b.data()), b.size()};
    }

    std::size_t leading_empty_lines(std::string_view data) noexcept {
        std::size_t n = 0;
        while (data.substr(n, 2) == "\r\n") n += 2;
        return n;
    }

    Result<std::optional<std::size_t>> find_head_end(
        std::string_view data, const CodecConfiguration& cfg) {
        using R = Result<std::optional<std::size_t>>;
        std::size_t pos = 0;
        std::size_t line_no = 0;
        for (;;) {
            const std::size_t limit =
                line_no == 0 ? cfg.max_line_size : cfg.max_field_size;
            auto nl = data.find('\n', pos);
            if (nl == std::string_view::npos) {
                if (data.size() - pos > limit + 1) {
                    return R::err(protocol_error(
                        line_no == 0 ? "start line too long"
                                     : "header line too long"));
                }
                return R::ok(std::nullopt);
            }
            if (nl == pos || data[nl - 1] != '\r') {
                return R::err(protocol_error("bare LF in message head"));
            }
            const std::size_t len = nl - 1 - pos;
            if (len == 0) {
                if (line_no == 0) {
                    return R::err(protocol_error("empty start line"));
                }
                return R::ok(std::optional<std::size_t>(nl + 1));
            }
            if (len > limit) {
                return R::err(protocol_error(line_no == 0
                                                 ? "start line too long"
                                                 : "header line too long"));
            }
            if (line_no > cfg.max_headers) {
                return R::err(protocol_error("too many header fields"));
            }
            ++line_no;
            pos = nl + 1;
        }
    }

    std::optional<unsigned> parse_http_version(std::string_view s) noexcept {
        if (s.size() != 8 || s.substr(0, 5) != "HTTP/" || !is_digit(s[5]) ||
            s[6] != '.' || !is_digit(s[7])) {
            return std::nullopt;
        }
        return static_cast<unsigned>((s[5] - '0') * 10 + (s[7] - '0'));
    }

    Result<void> parse_field_lines(std::string_view block, Headers& out,
                                   const CodecConfiguration& cfg) {
        std::size_t count = 0;
        while (!block.empty()) {
            auto eol = block.find("\r\n");
            if (eol == std::string_view::npos) {
                return Result<void>::err(
                    protocol_error("header line without CRLF"));
            }
            std::string_view line = block.substr(0, eol);
            block.remove_prefix(eol + 2);

            if (line.size() > cfg.max_field_size) {
                return Result<void>::err(
                    protocol_error("header line too long"));
            }
            if (!line.empty() && (line.front() == ' ' || line.front() == '\t')) {
                return Result<void>::err(
                    protocol_error("obsolete header line folding"));
            }
            auto colon = line.find(':');
            if (colon == std::string_view::npos) {
                return Result<void>::err(
                    protocol_error("header line without colon"));
            }
            std::string_view name = line.substr(0, colon);
            if (!is_token(name)) {
                return Result<void>::err(
                    protocol_error("invalid header name"));
            }
            std::string_view value = trim_ows(line.substr(colon + 1));
            if (!is_field_value(value)) {
                return Result<void>::err(
                    protocol_error("invalid character in header value"));
            }
            if (++count > cfg.max_headers) {
                return Result<void>::err(
                    protocol_error("too many header fields"));
            }
            out.insert(to_beast(name), to_beast(value));
        }
        return Result<void>::ok();
    }

    Result<RequestHead> parse_request_head(std::string_view head,
                                           const CodecConfiguration& cfg) {
        auto parts = split_head(head);
        if (!parts) return parts.forward_error<RequestHead>();
        auto [line, fields] = parts.value();

        auto sp1 = line.find(' ');
        auto sp2 = line.rfind(' ');
        if (sp1 == std::string_view::npos || sp1 == sp2) {
            return Result<RequestHead>::err(
                protocol_error("malformed request line"));
        }
        std::string_view method = line.substr(0, sp1);
        std::string_view target = line.substr(sp1 + 1, sp2 - sp1 - 1);
        std::string_view version = line.substr(sp2 + 1);

        if (!is_token(method)) {
            return Result<RequestHead>::err(
                protocol_error("invalid request method"));
        }
        if (target.empty()) {
            return Result<RequestHead>::err(
                protocol_error("empty request target"));
        }
        for (char ch : target) {
            auto c = static_cast<unsigned char>(ch);
            if (c <= 0x20 || c == 0x7f) {
                return Result<RequestHead>::err(
                    protocol_error("invalid character in request target"));
            }
        }
        auto v = parse_http_version(version);
        if (!v) {
            return Result<RequestHead>::err(
                protocol_error("malformed HTTP version"));
        }
        if (*v / 10 != 1) {
            return Result<RequestHead>::err(
                protocol_error("unsupported HTTP version"));
        }

        RequestHead out;
        out.method.assign(method);
        out.target.assign(target);
        out.version = *v;
        auto parsed = parse_field_lines(fields, out.headers, cfg);
        if (!parsed) return parsed.forward_error<RequestHead>();
        return Result<RequestHead>::ok(std::move(out));
    }

    Result<ResponseHead> parse_response_head(std::string_view head,
                                             const CodecConfiguration& cfg) {
        auto parts = split_head(head);
        if (!parts) return parts.forward_error<ResponseHead>();
        auto [line, fields] = parts.value();

        // HTTP/1.1 SP 200 [SP reason]
        if (line.size() < 12 || line[8] != ' ') {
            return Result<ResponseHead>::err(
                protocol_error("malformed status line"));
        }
        auto v = parse_http_version(line.substr(0, 8));
        if (!v) {
            return Result<ResponseHead>::err(
                protocol_error("malformed HTTP version"));
        }
        if (*v / 10 != 1) {
            return Result<ResponseHead>::err(
                protocol_error("unsupported HTTP version"));
        }
        std::string_view code = line.substr(9, 3);
        unsigned status = 0;
        for (char c : code) {
            if (!is_digit(c)) {
                return Result<ResponseHead>::err(
                    protocol_error("malformed status code"));
            }
            status = status * 10 + static_cast<unsigned>(c - '0');
        }
        if (status < 100) {
            return Result<ResponseHead>::err(
                protocol_error("status code out of range"));
        }
        std::string_view reason;
        if (line.size() > 12) {
            if (line[12] != ' ') {
                return Result<ResponseHead>::err(
                    protocol_error("malformed status line"));
            }
            reason = line.substr(13);
            if (!is_field_value(reason)) {
                return Result<ResponseHead>::err(
                    protocol_error("invalid character in reason phrase"));
            }
        }

        ResponseHead out;
        out.status = status;
        out.reason.assign(reason);
        out.version = *v;
        auto parsed = parse_field_lines(fields, out.headers, cfg);
        if (!parsed) return parsed.forward_error<ResponseHead>();
        return Result<ResponseHead>::ok(std::move(out));
    }

    net::awaitable<Result<RequestHead>> read_request_head(
        Connection& conn, const CodecConfiguration& cfg) {
        return read_head<RequestHead>(conn, cfg, true, &parse_request_head);
    }

    net::awaitable<Result<ResponseHead>> read_response_head(
        Connection& conn, const CodecConfiguration& cfg) {
        return read_head<ResponseHead>(conn, cfg, false, &parse_response_head);
    }

}  // namespace wireline::protocol
