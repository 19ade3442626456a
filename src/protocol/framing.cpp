#include "wireline/protocol/framing.hpp"

#include <boost/beast/http/field.hpp>
#include <limits>
#include <string>
#include <vector>

#include "wireline/protocol/parser.hpp"

namespace http = boost::beast::http;

namespace wireline::protocol {

    namespace {

        enum class Coding { Absent, ChunkedLast, OtherLast };

        // Classifies the Transfer-Encoding list. "chunked" may only appear
        // once and only as the final coding.
        Result<Coding> classify_transfer_encoding(const Headers& headers) {
            if (headers.find(http::field::transfer_encoding) == headers.end()) {
                return Result<Coding>::ok(Coding::Absent);
            }
            auto codings = header_tokens(headers, "Transfer-Encoding");
            if (codings.empty()) {
                return Result<Coding>::err(
                    protocol_error("empty Transfer-Encoding"));
            }
            for (std::size_t i = 0; i + 1 < codings.size(); ++i) {
                if (codings[i] == "chunked") {
                    return Result<Coding>::err(protocol_error(
                        "chunked is not the final transfer coding"));
                }
            }
            for (auto const& c : codings) {
                if (!is_token(c)) {
                    return Result<Coding>::err(
                        protocol_error("invalid transfer coding"));
                }
            }
            return Result<Coding>::ok(codings.back() == "chunked"
                                          ? Coding::ChunkedLast
                                          : Coding::OtherLast);
        }

    }  // namespace

    const char* to_string(BodyFraming::Kind kind) noexcept {
        switch (kind) {
            case BodyFraming::Kind::None:
                return "None";
            case BodyFraming::Kind::Length:
                return "Length";
            case BodyFraming::Kind::Chunked:
                return "Chunked";
            case BodyFraming::Kind::UntilClose:
                return "UntilClose";
        }
        return "Unknown";
    }

    Result<std::optional<std::uint64_t>> parse_content_length(
        const Headers& headers) {
        using R = Result<std::optional<std::uint64_t>>;
        std::optional<std::uint64_t> seen;
        bool any = false;
        for (auto const& line : header_values(headers, "Content-Length")) {
            any = true;
            std::string_view rest(line);
            // A list of identical values ("42, 42") is tolerated.
            while (true) {
                auto comma = rest.find(',');
                auto item = trim_ows(rest.substr(0, comma));
                if (item.empty()) {
                    return R::err(protocol_error("empty Content-Length"));
                }
                std::uint64_t v = 0;
                for (char c : item) {
                    if (c < '0' || c > '9') {
                        return R::err(
                            protocol_error("invalid Content-Length value"));
                    }
                    const auto digit = static_cast<std::uint64_t>(c - '0');
                    if (v > (std::numeric_limits<std::uint64_t>::max() - digit) /
                                10) {
                        return R::err(
                            protocol_error("Content-Length out of range"));
                    }
                    v = v * 10 + digit;
                }
                if (seen && *seen != v) {
                    return R::err(
                        protocol_error("conflicting Content-Length values"));
                }
                seen = v;
                if (comma == std::string_view::npos) break;
                rest.remove_prefix(comma + 1);
            }
        }
        if (!any) return R::ok(std::nullopt);
        return R::ok(seen);
    }

    Result<BodyFraming> request_framing(const RequestHead& head) {
        auto coding = classify_transfer_encoding(head.headers);
        if (!coding) return coding.forward_error<BodyFraming>();
        auto length = parse_content_length(head.headers);
        if (!length) return length.forward_error<BodyFraming>();

        if (coding.value() != Coding::Absent) {
            if (length.value()) {
                return Result<BodyFraming>::err(protocol_error(
                    "both Transfer-Encoding and Content-Length present"));
            }
            if (coding.value() != Coding::ChunkedLast) {
                return Result<BodyFraming>::err(protocol_error(
                    "request transfer coding must end with chunked"));
            }
            return Result<BodyFraming>::ok(BodyFraming::chunked());
        }
        if (length.value()) {
            const auto n = *length.value();
            return Result<BodyFraming>::ok(n == 0 ? BodyFraming::none()
                                                  : BodyFraming::fixed(n));
        }
        return Result<BodyFraming>::ok(BodyFraming::none());
    }

    Result<BodyFraming> response_framing(const ResponseHead& head,
                                         std::string_view request_method) {
        // Framing headers are still validated for bodiless responses so a
        // corrupt head never reaches the pool.
        auto coding = classify_transfer_encoding(head.headers);
        if (!coding) return coding.forward_error<BodyFraming>();
        auto length = parse_content_length(head.headers);
        if (!length) return length.forward_error<BodyFraming>();

        if (coding.value() != Coding::Absent && length.value()) {
            return Result<BodyFraming>::err(protocol_error(
                "both Transfer-Encoding and Content-Length present"));
        }
        if (iequals(request_method, "HEAD") || status_has_no_body(head.status)) {
            return Result<BodyFraming>::ok(BodyFraming::none());
        }
        if (coding.value() == Coding::ChunkedLast) {
            return Result<BodyFraming>::ok(BodyFraming::chunked());
        }
        if (coding.value() == Coding::OtherLast) {
            return Result<BodyFraming>::ok(BodyFraming::until_close());
        }
        if (length.value()) {
            const auto n = *length.value();
            return Result<BodyFraming>::ok(n == 0 ? BodyFraming::none()
                                                  : BodyFraming::fixed(n));
        }
        return Result<BodyFraming>::ok(BodyFraming::until_close());
    }

}  // namespace wireline::protocol
