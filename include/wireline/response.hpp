#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "wireline/protocol/message.hpp"
#include "wireline/protocol/writer.hpp"

namespace wireline {

    /**
     * @brief Represents an HTTP response.
     */
    struct Response {
        /** @brief HTTP status code (e.g., 200, 404). */
        int status_code{200};
        /** @brief Reason phrase; the server fills in a standard one when
         * empty. */
        std::string reason;
        /** @brief 11 for HTTP/1.1, 10 for HTTP/1.0. */
        unsigned version{11};
        /** @brief HTTP response headers, in wire order. */
        Headers headers;
        /** @brief HTTP response body as a string. */
        std::string body;
        /** @brief Trailer fields of a chunked body. */
        Headers trailers;
        /** @brief Server side only: stream the body chunked instead of
         * sending `body`. */
        std::shared_ptr<protocol::BodySource> body_stream;

        std::optional<std::string> header(std::string_view name) const {
            return protocol::header_value(headers, name);
        }

        Response& set_header(std::string_view name, std::string_view value) {
            headers.set(protocol::to_beast(name), protocol::to_beast(value));
            return *this;
        }
    };

    /// @brief Standard reason phrase for a status code ("" if unknown).
    std::string_view reason_phrase(int status) noexcept;

}  // namespace wireline
