#include "wireline/protocol/message.hpp"

#include <algorithm>
#include <cctype>

namespace wireline::protocol {

    namespace {
        char lower(char c) noexcept {
            return static_cast<char>(
                std::tolower(static_cast<unsigned char>(c)));
        }
    }  // namespace

    bool iequals(std::string_view a, std::string_view b) noexcept {
        if (a.size() != b.size()) return false;
        for (std::size_t i = 0; i < a.size(); ++i) {
            if (lower(a[i]) != lower(b[i])) return false;
        }
        return true;
    }

    std::string to_lower(std::string_view s) {
        std::string out(s);
        std::transform(out.begin(), out.end(), out.begin(), lower);
        return out;
    }

    std::string_view trim_ows(std::string_view s) noexcept {
        while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) {
            s.remove_prefix(1);
        }
        while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) {
            s.remove_suffix(1);
        }
        return s;
    }

    std::optional<std::string> header_value(const Headers& headers,
                                            std::string_view name) {
        auto it = headers.find(to_beast(name));
        if (it == headers.end()) return std::nullopt;
        return std::string(to_std(it->value()));
    }

    std::vector<std::string> header_values(const Headers& headers,
                                           std::string_view name) {
        std::vector<std::string> out;
        auto range = headers.equal_range(to_beast(name));
        for (auto it = range.first; it != range.second; ++it) {
            out.emplace_back(to_std(it->value()));
        }
        return out;
    }

    std::vector<std::string> header_tokens(const Headers& headers,
                                           std::string_view name) {
        std::vector<std::string> out;
        for (auto const& line : header_values(headers, name)) {
            std::string_view rest(line);
            while (!rest.empty()) {
                auto comma = rest.find(',');
                auto item = trim_ows(rest.substr(0, comma));
                if (!item.empty()) out.push_back(to_lower(item));
                if (comma == std::string_view::npos) break;
                rest.remove_prefix(comma + 1);
            }
        }
        return out;
    }

    bool has_token(const Headers& headers, std::string_view name,
                   std::string_view token) {
        for (auto const& t : header_tokens(headers, name)) {
            if (iequals(t, token)) return true;
        }
        return false;
    }

    bool is_tchar(char c) noexcept {
        if (std::isalnum(static_cast<unsigned char>(c))) return true;
        switch (c) {
            case '!':
            case '#':
            case '$':
            case '%':
            case '&':
            case '\'':
            case '*':
            case '+':
            case '-':
            case '.':
            case '^':
            case '_':
            case '`':
            case '|':
            case '~':
                return true;
            default:
                return false;
        }
    }

    bool is_token(std::string_view s) noexcept {
        return !s.empty() && std::all_of(s.begin(), s.end(), is_tchar);
    }

    bool is_field_value(std::string_view s) noexcept {
        for (char ch : s) {
            auto c = static_cast<unsigned char>(ch);
            if (c == '\t') continue;
            if (c < 0x20 || c == 0x7f) return false;
        }
        return true;
    }

    void set_default(Headers& headers, std::string_view name,
                     std::string_view value) {
        if (headers.find(to_beast(name)) == headers.end()) {
            headers.insert(to_beast(name), to_beast(value));
        }
    }

}  // namespace wireline::protocol
