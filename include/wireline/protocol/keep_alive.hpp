#pragma once

#include <cstdint>

#include "wireline/protocol/message.hpp"

namespace wireline::protocol {

    /// @brief Persistence as announced by one message: HTTP/1.1 persists
    /// unless "Connection: close"; HTTP/1.0 only with
    /// "Connection: keep-alive".
    bool should_keep_alive(unsigned version, const Headers& headers);

    /// @brief Whether a connection can carry another exchange after a
    /// response.
    ///
    /// True only if the version and headers permit persistence, no unread
    /// body bytes remain, and the exchange did not switch protocols.
    bool is_reusable(unsigned status, const Headers& headers, unsigned version,
                     std::uint64_t unread_body_remaining);

}  // namespace wireline::protocol
