#include "wireline/protocol/keep_alive.hpp"

namespace wireline::protocol {

    bool should_keep_alive(unsigned version, const Headers& headers) {
        if (has_token(headers, "Connection", "close")) return false;
        if (version >= 11) return true;
        return has_token(headers, "Connection", "keep-alive");
    }

    bool is_reusable(unsigned status, const Headers& headers, unsigned version,
                     std::uint64_t unread_body_remaining) {
        if (status == 101) return false;
        if (unread_body_remaining != 0) return false;
        return should_keep_alive(version, headers);
    }

}  // namespace wireline::protocol
