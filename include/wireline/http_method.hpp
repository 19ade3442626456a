#pragma once
#include <optional>
#include <string_view>

namespace wireline {
    enum class HttpMethod {
        Get,
        Post,
        Put,
        Patch,
        Delete,
        Head,
        Options,
        Trace,
    };

    /// @brief Wire token of a method ("GET", "POST", ...); empty for values
    /// outside the enumeration.
    inline constexpr std::string_view to_string(HttpMethod method) {
        switch (method) {
            case HttpMethod::Get:
                return "GET";
            case HttpMethod::Post:
                return "POST";
            case HttpMethod::Put:
                return "PUT";
            case HttpMethod::Patch:
                return "PATCH";
            case HttpMethod::Delete:
                return "DELETE";
            case HttpMethod::Head:
                return "HEAD";
            case HttpMethod::Options:
                return "OPTIONS";
            case HttpMethod::Trace:
                return "TRACE";
            default:
                return {};
        }
    }

    /// @brief Parse a method token. Method names are case-sensitive.
    inline std::optional<HttpMethod> method_from_string(std::string_view s) {
        for (auto m : {HttpMethod::Get, HttpMethod::Post, HttpMethod::Put,
                       HttpMethod::Patch, HttpMethod::Delete, HttpMethod::Head,
                       HttpMethod::Options, HttpMethod::Trace}) {
            if (to_string(m) == s) return m;
        }
        return std::nullopt;
    }

    /// @brief RFC 7231 section 4.2.2 idempotent methods.
    inline constexpr bool is_idempotent(HttpMethod method) {
        return method != HttpMethod::Post && method != HttpMethod::Patch;
    }

}  // namespace wireline
