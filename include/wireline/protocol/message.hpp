#pragma once

#include <utility>

#include <boost/beast/core/string.hpp>
#include <boost/beast/http/fields.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace wireline {

    /// @brief Ordered, case-insensitive header list. Duplicates (e.g.
    /// several Set-Cookie lines) keep their order.
    using Headers = boost::beast::http::fields;

    namespace protocol {

        /// @brief Start line and headers of a request.
        struct RequestHead {
            std::string method;
            std::string target;
            /// Beast convention: 10 for HTTP/1.0, 11 for HTTP/1.1.
            unsigned version{11};
            Headers headers;
        };

        /// @brief Status line and headers of a response.
        struct ResponseHead {
            unsigned status{200};
            std::string reason;
            unsigned version{11};
            Headers headers;
        };

        inline boost::beast::string_view to_beast(std::string_view s) noexcept {
            return {s.data(), s.size()};
        }

        inline std::string_view to_std(boost::beast::string_view s) noexcept {
            return {s.data(), s.size()};
        }

        /// @brief ASCII case-insensitive comparison.
        bool iequals(std::string_view a, std::string_view b) noexcept;

        /// @brief Lower-case ASCII copy.
        std::string to_lower(std::string_view s);

        /// @brief Strip spaces and tabs at both ends.
        std::string_view trim_ows(std::string_view s) noexcept;

        /// @brief First value of a header, if present.
        std::optional<std::string> header_value(const Headers& headers,
                                                std::string_view name);

        /// @brief Every value of a header, in order.
        std::vector<std::string> header_values(const Headers& headers,
                                               std::string_view name);

        /// @brief Split a comma separated list into trimmed, lower-case,
        /// non-empty elements, across every line of the header.
        std::vector<std::string> header_tokens(const Headers& headers,
                                               std::string_view name);

        /// @brief Whether a comma separated header contains token
        /// (case-insensitive).
        bool has_token(const Headers& headers, std::string_view name,
                       std::string_view token);

        /// @brief tchar per RFC 7230 section 3.2.6.
        bool is_tchar(char c) noexcept;

        bool is_token(std::string_view s) noexcept;

        /// @brief Whether s is a valid field value (no CTL except HTAB).
        bool is_field_value(std::string_view s) noexcept;

        /// @brief Add a header unless one with that name exists already.
        void set_default(Headers& headers, std::string_view name,
                         std::string_view value);

    }  // namespace protocol

}  // namespace wireline
