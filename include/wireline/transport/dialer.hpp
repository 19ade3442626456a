#pragma once

#include <utility>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/context.hpp>
#include <memory>
#include <string>

#include "wireline/cancellation.hpp"
#include "wireline/result.hpp"
#include "wireline/transport/transport.hpp"

namespace wireline {

    /**
     * @brief Capability that opens raw byte streams and layers TLS on them.
     *
     * The pool only creates transports through a Dialer, so tests can
     * replace the network with scripted transports.
     */
    class Dialer {
       public:
        virtual ~Dialer() = default;

        /// @brief Open a TCP connection to one address.
        /// @note Cancelling the token aborts the attempt with
        /// Error::Code::Cancelled (or Timeout, when that is the reason).
        virtual boost::asio::awaitable<Result<std::unique_ptr<Transport>>>
        connect(const boost::asio::ip::tcp::endpoint& endpoint,
                CancellationToken token) = 0;

        /// @brief Perform a client TLS handshake over a connected raw
        /// transport.
        /// @param host Server name for SNI and certificate verification.
        /// @param verify Whether the peer certificate must validate.
        virtual boost::asio::awaitable<Result<std::unique_ptr<Transport>>>
        handshake(std::unique_ptr<Transport> raw, const std::string& host,
                  bool verify, CancellationToken token) = 0;
    };

    /// @brief Dialer on real Asio sockets and an OpenSSL-backed context.
    class AsioDialer : public Dialer {
       public:
        /// @throws std::runtime_error if the system CA store cannot be
        /// loaded.
        explicit AsioDialer(boost::asio::any_io_executor ex);

        boost::asio::awaitable<Result<std::unique_ptr<Transport>>> connect(
            const boost::asio::ip::tcp::endpoint& endpoint,
            CancellationToken token) override;

        boost::asio::awaitable<Result<std::unique_ptr<Transport>>> handshake(
            std::unique_ptr<Transport> raw, const std::string& host,
            bool verify, CancellationToken token) override;

        /// @brief Context used for verified handshakes (add CAs here).
        boost::asio::ssl::context& verifying_context() noexcept {
            return m_verify_ctx;
        }

       private:
        boost::asio::any_io_executor m_ex;
        boost::asio::ssl::context m_verify_ctx;
        boost::asio::ssl::context m_insecure_ctx;
    };

    /// @brief Load the system CA store and require peer verification.
    void init_tls_on_ssl_context(boost::asio::ssl::context& ssl_context);

}  // namespace wireline
