#pragma once

#include <utility>

#include <boost/asio/awaitable.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <chrono>
#include <cstdint>
#include <memory>

#include "wireline/cancellation.hpp"
#include "wireline/pool_key.hpp"
#include "wireline/transport/transport.hpp"

namespace wireline {

    /// @brief Protocol state of a connection.
    enum class ConnectionState : std::uint8_t {
        Idle,      ///< Owned by the pool, no exchange in progress
        Active,    ///< Loaned out, request being written or head being read
        Draining,  ///< Loaned out, response body still being consumed
        Closed,    ///< Transport closed, never reused
    };

    const char* to_string(ConnectionState s) noexcept;

    /**
     * @brief One physical transport plus its HTTP framing state.
     *
     * A Connection is single-owner: the pool while idle, exactly one
     * exchange while Active or Draining. It owns the read buffer so bytes
     * that arrived past the end of one message stay available to the next
     * exchange.
     */
    class Connection {
       public:
        using clock_type = std::chrono::steady_clock;

        Connection(std::uint64_t id, PoolKey key,
                   std::unique_ptr<Transport> transport)
            : m_id(id),
              m_key(std::move(key)),
              m_transport(std::move(transport)),
              m_created(clock_type::now()),
              m_last_used(m_created) {}

        ~Connection() { close(); }

        Connection(Connection const&) = delete;
        Connection& operator=(Connection const&) = delete;

        std::uint64_t id() const noexcept { return m_id; }

        PoolKey const& key() const noexcept { return m_key; }

        ConnectionState state() const noexcept { return m_state; }

        void set_state(ConnectionState s) noexcept {
            if (m_state != ConnectionState::Closed) m_state = s;
        }

        clock_type::time_point created() const noexcept { return m_created; }

        clock_type::time_point last_used() const noexcept { return m_last_used; }

        void touch() noexcept { m_last_used = clock_type::now(); }

        /// @brief Set when the peer announced it closes after this message
        /// (Connection: close or HTTP/1.0 without keep-alive).
        bool peer_will_close() const noexcept { return m_peer_will_close; }

        void set_peer_will_close(bool v) noexcept { m_peer_will_close = v; }

        bool is_open() const noexcept {
            return m_state != ConnectionState::Closed && m_transport &&
                   m_transport->is_open();
        }

        /// @brief Close the transport and mark the connection Closed.
        void close() noexcept;

        Transport& transport() noexcept { return *m_transport; }

        boost::beast::flat_buffer& buffer() noexcept { return m_buffer; }

        /// @brief Reset per-exchange counters; called when a new exchange
        /// takes the connection.
        void begin_exchange() noexcept;

        /// @brief Request bytes written during the current exchange.
        std::uint64_t bytes_written() const noexcept { return m_bytes_written; }

        /// @brief Bytes read from the transport in the current exchange.
        std::uint64_t bytes_read() const noexcept { return m_bytes_read; }

        /// @brief Completed exchanges on this connection (0 for a fresh one).
        std::uint64_t exchanges() const noexcept { return m_exchanges; }

        /// @brief Whether the connection has served an exchange before.
        bool reused() const noexcept { return m_exchanges > 1; }

        /// @brief Write through the transport, counting bytes.
        boost::asio::awaitable<std::size_t> write(
            const Transport::ConstBuffers& buffers,
            boost::system::error_code& ec);

        /// @brief Read more bytes from the transport into buffer().
        /// @return Bytes appended; 0 with ec set at end of stream.
        boost::asio::awaitable<std::size_t> fill(boost::system::error_code& ec);

        /// @brief Close the connection when token fires.
        [[nodiscard]] CancellationToken::Registration close_on_cancel(
            const CancellationToken& token);

       private:
        std::uint64_t m_id;
        PoolKey m_key;
        std::unique_ptr<Transport> m_transport;
        boost::beast::flat_buffer m_buffer;
        ConnectionState m_state{ConnectionState::Active};
        clock_type::time_point m_created;
        clock_type::time_point m_last_used;
        bool m_peer_will_close{false};
        std::uint64_t m_bytes_written{0};
        std::uint64_t m_bytes_read{0};
        std::uint64_t m_exchanges{0};
    };

}  // namespace wireline
