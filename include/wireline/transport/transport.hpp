#pragma once

#include <utility>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/buffer.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/stream.hpp>
#include <boost/system/error_code.hpp>
#include <cstddef>
#include <string>
#include <vector>

namespace wireline {

    /**
     * @brief A connected byte stream (plain TCP or TLS).
     *
     * The codec only talks to this interface, so tests can substitute an
     * in-memory transport and count write calls.
     */
    class Transport {
       public:
        using ConstBuffers = std::vector<boost::asio::const_buffer>;

        virtual ~Transport() = default;

        /// @brief Read at most buffer.size() bytes.
        /// @note End of stream is reported as 0 bytes with
        /// boost::asio::error::eof in ec.
        virtual boost::asio::awaitable<std::size_t> read_some(
            boost::asio::mutable_buffer buffer,
            boost::system::error_code& ec) = 0;

        /// @brief Write every byte of buffers as one logical write call.
        /// @return Bytes written; fewer than requested only with ec set.
        virtual boost::asio::awaitable<std::size_t> write(
            const ConstBuffers& buffers, boost::system::error_code& ec) = 0;

        /// @brief Close without any protocol-level goodbye. Aborts pending
        /// operations.
        virtual void close() noexcept = 0;

        virtual bool is_open() const noexcept = 0;

        /// @brief Non-blocking check made before an idle transport is
        /// reused: true when the peer has already closed or reset it.
        /// @note Never suspends and never consumes bytes.
        virtual bool peer_closed() noexcept { return false; }

        virtual bool is_tls() const noexcept { return false; }

        /// @brief Peer address for diagnostics ("127.0.0.1:8080").
        virtual std::string remote_address() const = 0;
    };

    /// @brief Plain TCP transport.
    class TcpTransport : public Transport {
       public:
        explicit TcpTransport(boost::asio::ip::tcp::socket socket)
            : m_socket(std::move(socket)) {}

        ~TcpTransport() override { close(); }

        boost::asio::awaitable<std::size_t> read_some(
            boost::asio::mutable_buffer buffer,
            boost::system::error_code& ec) override;

        boost::asio::awaitable<std::size_t> write(
            const ConstBuffers& buffers,
            boost::system::error_code& ec) override;

        void close() noexcept override;

        bool is_open() const noexcept override { return m_socket.is_open(); }

        /// @note Unsolicited bytes on an idle connection (e.g. a 408 sent
        /// before closing) also count as closed.
        bool peer_closed() noexcept override;

        std::string remote_address() const override;

        /// @brief Give up the socket (used to layer TLS on top).
        boost::asio::ip::tcp::socket release_socket() {
            return std::move(m_socket);
        }

       private:
        boost::asio::ip::tcp::socket m_socket;
    };

    /// @brief TLS over TCP.
    /// @note No TLS close_notify is sent on close(); the TCP socket is just
    /// closed, as HTTP/1.1 framing never depends on it.
    class TlsTransport : public Transport {
       public:
        using stream_type =
            boost::asio::ssl::stream<boost::asio::ip::tcp::socket>;

        explicit TlsTransport(stream_type stream) : m_stream(std::move(stream)) {}

        ~TlsTransport() override { close(); }

        boost::asio::awaitable<std::size_t> read_some(
            boost::asio::mutable_buffer buffer,
            boost::system::error_code& ec) override;

        boost::asio::awaitable<std::size_t> write(
            const ConstBuffers& buffers,
            boost::system::error_code& ec) override;

        void close() noexcept override;

        bool is_open() const noexcept override {
            return m_stream.lowest_layer().is_open();
        }

        /// @note Pending bytes are not a close here: TLS 1.3 servers send
        /// session tickets after the handshake.
        bool peer_closed() noexcept override;

        bool is_tls() const noexcept override { return true; }

        std::string remote_address() const override;

       private:
        stream_type m_stream;
        std::string m_scratch;
    };

    /// @brief "host:port" text for an endpoint, IPv6 in brackets.
    std::string format_endpoint(const boost::asio::ip::tcp::endpoint& ep);

}  // namespace wireline
