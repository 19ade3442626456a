#include "wireline/connection/connection.hpp"

namespace net = boost::asio;

namespace wireline {

    namespace {
        constexpr std::size_t kReadChunk = 16 * 1024;
    }

    const char* to_string(ConnectionState s) noexcept {
        switch (s) {
            case ConnectionState::Idle:
                return "Idle";
            case ConnectionState::Active:
                return "Active";
            case ConnectionState::Draining:
                return "Draining";
            case ConnectionState::Closed:
                return "Closed";
        }
        return "Unknown";
    }

    void Connection::close() noexcept {
        m_state = ConnectionState::Closed;
        if (m_transport) m_transport->close();
    }

    void Connection::begin_exchange() noexcept {
        m_bytes_written = 0;
        m_bytes_read = 0;
        ++m_exchanges;
        m_peer_will_close = false;
        m_state = m_state == ConnectionState::Closed ? ConnectionState::Closed
                                                     : ConnectionState::Active;
        touch();
    }

    net::awaitable<std::size_t> Connection::write(
        const Transport::ConstBuffers& buffers, boost::system::error_code& ec) {
        if (!is_open()) {
            ec = net::error::not_connected;
            co_return 0;
        }
        std::size_t n = co_await m_transport->write(buffers, ec);
        m_bytes_written += n;
        co_return n;
    }

    net::awaitable<std::size_t> Connection::fill(boost::system::error_code& ec) {
        if (!is_open()) {
            ec = net::error::not_connected;
            co_return 0;
        }
        auto space = m_buffer.prepare(kReadChunk);
        std::size_t n = co_await m_transport->read_some(space, ec);
        m_buffer.commit(n);
        m_bytes_read += n;
        if (n == 0 && !ec) ec = net::error::eof;
        co_return n;
    }

    CancellationToken::Registration Connection::close_on_cancel(
        const CancellationToken& token) {
        if (!token.can_be_cancelled()) return {};
        return token.on_cancel([this] { close(); });
    }

}  // namespace wireline
