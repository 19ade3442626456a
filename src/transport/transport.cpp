#include "wireline/transport/transport.hpp"

#include <boost/asio/read.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>

namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace wireline {

    namespace {
        // TLS records are at most 16 KiB; gathering small pieces into one
        // record avoids a record per buffer.
        constexpr std::size_t kTlsGatherLimit = 16 * 1024;

        enum class PeekState { Quiet, Readable, Closed };

        /// MSG_PEEK one byte without blocking.
        PeekState peek(tcp::socket& socket) noexcept {
            if (!socket.is_open()) return PeekState::Closed;
            boost::system::error_code ec;
            static_cast<void>(socket.non_blocking(true, ec));
            if (ec) return PeekState::Quiet;
            char byte = 0;
            const std::size_t n = socket.receive(
                net::buffer(&byte, 1), tcp::socket::message_peek, ec);
            boost::system::error_code restore;
            static_cast<void>(socket.non_blocking(false, restore));
            if (ec == net::error::would_block || ec == net::error::try_again) {
                return PeekState::Quiet;
            }
            if (ec) return PeekState::Closed;
            return n > 0 ? PeekState::Readable : PeekState::Closed;
        }
    }  // namespace

    std::string format_endpoint(const tcp::endpoint& ep) {
        std::string out;
        const auto addr = ep.address();
        if (addr.is_v6()) {
            out.push_back('[');
            out += addr.to_string();
            out.push_back(']');
        } else {
            out += addr.to_string();
        }
        out.push_back(':');
        out += std::to_string(ep.port());
        return out;
    }

    // -------------------------
    // TcpTransport
    // -------------------------

    net::awaitable<std::size_t> TcpTransport::read_some(
        net::mutable_buffer buffer, boost::system::error_code& ec) {
        ec.clear();
        std::size_t n = co_await m_socket.async_read_some(
            buffer, net::redirect_error(net::use_awaitable, ec));
        co_return n;
    }

    net::awaitable<std::size_t> TcpTransport::write(
        const ConstBuffers& buffers, boost::system::error_code& ec) {
        ec.clear();
        std::size_t n = co_await net::async_write(
            m_socket, buffers, net::redirect_error(net::use_awaitable, ec));
        co_return n;
    }

    void TcpTransport::close() noexcept {
        if (!m_socket.is_open()) return;
        boost::system::error_code ec;
        static_cast<void>(m_socket.shutdown(tcp::socket::shutdown_both, ec));
        static_cast<void>(m_socket.close(ec));
    }

    bool TcpTransport::peer_closed() noexcept {
        return peek(m_socket) != PeekState::Quiet;
    }

    std::string TcpTransport::remote_address() const {
        boost::system::error_code ec;
        auto ep = m_socket.remote_endpoint(ec);
        if (ec) return "unconnected";
        return format_endpoint(ep);
    }

    // -------------------------
    // TlsTransport
    // -------------------------

    net::awaitable<std::size_t> TlsTransport::read_some(
        net::mutable_buffer buffer, boost::system::error_code& ec) {
        ec.clear();
        std::size_t n = co_await m_stream.async_read_some(
            buffer, net::redirect_error(net::use_awaitable, ec));
        // Peers that skip close_notify are the norm for HTTP; treat a
        // truncated stream like a plain EOF.
        if (ec == net::ssl::error::stream_truncated) ec = net::error::eof;
        co_return n;
    }

    net::awaitable<std::size_t> TlsTransport::write(
        const ConstBuffers& buffers, boost::system::error_code& ec) {
        ec.clear();
        const std::size_t total = net::buffer_size(buffers);
        if (buffers.size() > 1 && total <= kTlsGatherLimit) {
            m_scratch.clear();
            m_scratch.reserve(total);
            for (auto const& b : buffers) {
                m_scratch.append(static_cast<const char*>(b.data()), b.size());
            }
            std::size_t n = co_await net::async_write(
                m_stream, net::buffer(m_scratch),
                net::redirect_error(net::use_awaitable, ec));
            co_return n;
        }
        std::size_t n = co_await net::async_write(
            m_stream, buffers, net::redirect_error(net::use_awaitable, ec));
        co_return n;
    }

    void TlsTransport::close() noexcept {
        auto& sock = m_stream.lowest_layer();
        if (!sock.is_open()) return;
        boost::system::error_code ec;
        static_cast<void>(sock.shutdown(tcp::socket::shutdown_both, ec));
        static_cast<void>(sock.close(ec));
    }

    bool TlsTransport::peer_closed() noexcept {
        return peek(m_stream.next_layer()) == PeekState::Closed;
    }

    std::string TlsTransport::remote_address() const {
        boost::system::error_code ec;
        auto ep = m_stream.lowest_layer().remote_endpoint(ec);
        if (ec) return "unconnected";
        return format_endpoint(ep);
    }

}  // namespace wireline
