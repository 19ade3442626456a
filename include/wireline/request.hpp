#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "wireline/http_method.hpp"
#include "wireline/protocol/message.hpp"
#include "wireline/protocol/writer.hpp"

namespace wireline {

    /**
     * @brief An outgoing HTTP request.
     *
     * `url` is absolute or, with a configured base URL, relative. A request
     * carries either a buffered `body` (sent with Content-Length) or a
     * `body_stream` (sent chunked), never both.
     */
    struct Request {
        HttpMethod method{HttpMethod::Get};
        std::string url;
        Headers headers;
        std::optional<std::string> body;
        /// Streamed body; cannot be replayed, so middleware that resends
        /// (Digest auth) and the stale-connection retry skip such requests.
        std::shared_ptr<protocol::BodySource> body_stream;

        /// @brief Replace any existing values of name.
        Request& set_header(std::string_view name, std::string_view value) {
            headers.set(protocol::to_beast(name), protocol::to_beast(value));
            return *this;
        }

        std::optional<std::string> header(std::string_view name) const {
            return protocol::header_value(headers, name);
        }

        bool replayable() const noexcept { return body_stream == nullptr; }
    };

}  // namespace wireline
