#include "wireline/transport/dialer.hpp"

#include <openssl/err.h>
#include <openssl/ssl.h>

#include <boost/asio/ip/address.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <stdexcept>

#include "wireline/log.hpp"

namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
using tcp = net::ip::tcp;

namespace wireline {

    namespace {

        bool is_ip_literal(const std::string& host) {
            boost::system::error_code ec;
            static_cast<void>(net::ip::make_address(host, ec));
            return !ec;
        }

        bool set_sni(TlsTransport::stream_type& stream, const std::string& host,
                     boost::system::error_code& ec) {
            if (!SSL_set_tlsext_host_name(stream.native_handle(),
                                          host.c_str())) {
                ec = boost::system::error_code(
                    static_cast<int>(::ERR_get_error()),
                    net::error::get_ssl_category());
                return false;
            }
            return true;
        }

        Result<std::unique_ptr<Transport>> dial_error(Error::Code code,
                                                      std::string message,
                                                      boost::system::error_code
                                                          cause,
                                                      std::string endpoint) {
            Error e{code, std::move(message), cause, std::move(endpoint)};
            return Result<std::unique_ptr<Transport>>::err(std::move(e));
        }

    }  // namespace

    void init_tls_on_ssl_context(ssl::context& ssl_context) {
        try {
            ssl_context.set_default_verify_paths();
        } catch (const boost::system::system_error& e) {
            throw std::runtime_error(
                std::string("Failed to set default verify paths: ") + e.what());
        }
        static_cast<void>(ssl_context.set_verify_mode(ssl::verify_peer));
    }

    AsioDialer::AsioDialer(net::any_io_executor ex)
        : m_ex(std::move(ex)),
          m_verify_ctx(ssl::context::tls_client),
          m_insecure_ctx(ssl::context::tls_client) {
        init_tls_on_ssl_context(m_verify_ctx);
        static_cast<void>(m_insecure_ctx.set_verify_mode(ssl::verify_none));
    }

    net::awaitable<Result<std::unique_ptr<Transport>>> AsioDialer::connect(
        const tcp::endpoint& endpoint, CancellationToken token) {
        const std::string where = format_endpoint(endpoint);
        if (token.cancelled()) {
            co_return dial_error(cancel_code(token), "connect cancelled", {},
                                 where);
        }

        tcp::socket sock(m_ex);
        boost::system::error_code ec;
        {
            // Closing the socket aborts the pending connect.
            auto reg = token.on_cancel([&sock] {
                boost::system::error_code ignored;
                static_cast<void>(sock.close(ignored));
            });
            co_await sock.async_connect(
                endpoint, net::redirect_error(net::use_awaitable, ec));
        }

        if (token.cancelled()) {
            co_return dial_error(cancel_code(token), "connect cancelled", ec,
                                 where);
        }
        if (ec) {
            log::logger()->debug("connect to {} failed: {}", where,
                                 ec.message());
            co_return dial_error(Error::Code::Connect,
                                 "connect failed: " + ec.message(), ec, where);
        }

        boost::system::error_code opt_ec;
        static_cast<void>(sock.set_option(tcp::no_delay(true), opt_ec));

        co_return Result<std::unique_ptr<Transport>>::ok(
            std::make_unique<TcpTransport>(std::move(sock)));
    }

    net::awaitable<Result<std::unique_ptr<Transport>>> AsioDialer::handshake(
        std::unique_ptr<Transport> raw, const std::string& host, bool verify,
        CancellationToken token) {
        auto* tcp_transport = dynamic_cast<TcpTransport*>(raw.get());
        if (tcp_transport == nullptr) {
            co_return dial_error(Error::Code::Tls,
                                 "transport does not support TLS upgrade", {},
                                 host);
        }
        const std::string where = raw->remote_address();

        TlsTransport::stream_type stream(tcp_transport->release_socket(),
                                         verify ? m_verify_ctx : m_insecure_ctx);
        raw.reset();

        boost::system::error_code ec;
        if (!is_ip_literal(host) && !set_sni(stream, host, ec)) {
            co_return dial_error(Error::Code::Tls, "failed to set SNI", ec,
                                 where);
        }
        if (verify) {
            stream.set_verify_callback(ssl::host_name_verification(host));
        }

        {
            auto reg = token.on_cancel([&stream] {
                boost::system::error_code ignored;
                static_cast<void>(stream.lowest_layer().close(ignored));
            });
            co_await stream.async_handshake(
                ssl::stream_base::client,
                net::redirect_error(net::use_awaitable, ec));
        }

        if (token.cancelled()) {
            co_return dial_error(cancel_code(token), "TLS handshake cancelled",
                                 ec, where);
        }
        if (ec) {
            co_return dial_error(Error::Code::Tls,
                                 "TLS handshake failed: " + ec.message(), ec,
                                 where);
        }

        co_return Result<std::unique_ptr<Transport>>::ok(
            std::make_unique<TlsTransport>(std::move(stream)));
    }

}  // namespace wireline
