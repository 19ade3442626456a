#include "wireline/server/server.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/socket_base.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <chrono>
#include <exception>
#include <stdexcept>

#include "wireline/connection/connection.hpp"
#include "wireline/deadline.hpp"
#include "wireline/log.hpp"
#include "wireline/protocol/body_reader.hpp"
#include "wireline/protocol/framing.hpp"
#include "wireline/protocol/keep_alive.hpp"
#include "wireline/protocol/parser.hpp"
#include "wireline/protocol/writer.hpp"

namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace wireline {

    namespace {

        namespace http = boost::beast::http;
        using protocol::BodyFraming;
        using protocol::to_beast;

        // Keeps the active connection count in step with serve_().
        struct ActiveGuard {
            std::atomic<std::size_t>& count;
            explicit ActiveGuard(std::atomic<std::size_t>& c) : count(c) { ++count; }
            ~ActiveGuard() { --count; }
        };

        bool is_resource_exhaustion(const boost::system::error_code& ec) {
            return ec == net::error::no_descriptors ||
                   ec == net::error::no_buffer_space ||
                   ec == net::error::no_memory;
        }

        // Best-effort error response; the connection is closed afterwards.
        net::awaitable<void> send_error(Connection& conn, unsigned status,
                                        const ServerConfiguration& cfg) {
            protocol::ResponseHead head;
            head.status = status;
            head.reason = std::string(reason_phrase(static_cast<int>(status)));
            const std::string body = head.reason + "\n";
            head.headers.set(http::field::content_type, "text/plain");
            head.headers.set(http::field::content_length,
                             std::to_string(body.size()));
            head.headers.set(http::field::connection, "close");
            if (!cfg.server_header.empty()) {
                head.headers.set(http::field::server, to_beast(cfg.server_header));
            }
            auto written = co_await protocol::write_buffered(
                conn, protocol::serialize_head(head), body,
                BodyFraming::fixed(body.size()), cfg.codec);
            if (!written) {
                log::logger()->debug("error response {} not delivered: {}",
                                     status, describe(written.error()));
            }
        }

        // Waiting for the next request is bounded by the keep-alive
        // timeout and cut short by shutdown.
        net::awaitable<Result<protocol::RequestHead>> read_head(
            Connection& conn, net::any_io_executor ex,
            CancellationToken shutdown, const ServerConfiguration& cfg) {
            Deadline idle(std::move(ex), shutdown, cfg.keep_alive_timeout);
            auto reg = conn.close_on_cancel(idle.token());
            auto head = co_await protocol::read_request_head(conn, cfg.codec);
            if (!head && idle.token().cancelled()) {
                co_return Result<protocol::RequestHead>::err(
                    Error{Error::Code::Timeout, "idle keep-alive connection closed",
                          head.error().cause});
            }
            co_return std::move(head);
        }

        // Drain a streamed body into memory (HTTP/1.0 peers cannot take
        // chunked coding).
        net::awaitable<Result<std::string>> collect(protocol::BodySource& src) {
            std::string out;
            for (;;) {
                auto piece = co_await src.next();
                if (!piece) co_return piece.forward_error<std::string>();
                if (!piece.value()) break;
                out += *piece.value();
            }
            co_return Result<std::string>::ok(std::move(out));
        }

        /// Serialize and write the handler's response.
        net::awaitable<Result<protocol::WriteReport>> write_response(
            Connection& conn, const protocol::RequestHead& req, Response& resp,
            bool keep_alive, const ServerConfiguration& cfg) {
            protocol::ResponseHead head;
            head.status = static_cast<unsigned>(resp.status_code);
            head.reason = resp.reason.empty()
                              ? std::string(reason_phrase(resp.status_code))
                              : resp.reason;
            head.version = resp.version == 10 ? 10 : 11;
            head.headers = std::move(resp.headers);

            const bool is_head = req.method == "HEAD";
            const bool no_body =
                is_head || protocol::status_has_no_body(head.status);
            const bool stream = resp.body_stream != nullptr;

            head.headers.erase(http::field::transfer_encoding);
            if (!is_head && head.status != 304) {
                head.headers.erase(http::field::content_length);
            }
            if (!cfg.server_header.empty()) {
                protocol::set_default(head.headers, "Server", cfg.server_header);
            }
            head.headers.erase(http::field::connection);
            if (!keep_alive) {
                head.headers.set(http::field::connection, "close");
            } else if (req.version == 10) {
                head.headers.set(http::field::connection, "keep-alive");
            }

            if (no_body) {
                if (is_head && !stream &&
                    !protocol::header_value(head.headers, "Content-Length")) {
                    head.headers.set(http::field::content_length,
                                     std::to_string(resp.body.size()));
                }
                co_return co_await protocol::write_buffered(
                    conn, protocol::serialize_head(head), {},
                    BodyFraming::none(), cfg.codec);
            }

            if (stream && req.version >= 11) {
                head.headers.set(http::field::transfer_encoding, "chunked");
                co_return co_await protocol::write_streamed(
                    conn, protocol::serialize_head(head), *resp.body_stream,
                    BodyFraming::chunked());
            }
            if (stream) {
                auto drained = co_await collect(*resp.body_stream);
                if (!drained) {
                    co_return drained.forward_error<protocol::WriteReport>();
                }
                resp.body = std::move(drained).value();
            }

            head.headers.set(http::field::content_length,
                             std::to_string(resp.body.size()));
            co_return co_await protocol::write_buffered(
                conn, protocol::serialize_head(head), resp.body,
                BodyFraming::fixed(resp.body.size()), cfg.codec);
        }

    }  // namespace

    Server::Server(net::any_io_executor ex, Handler handler,
                   ServerConfiguration cfg)
        : state_(std::make_shared<State>()) {
        if (!handler) throw std::invalid_argument("Server requires a handler");
        state_->ex = std::move(ex);
        state_->handler = std::move(handler);
        state_->cfg = std::move(cfg);
    }

    Server::~Server() { stop(); }

    Result<void> Server::listen(const tcp::endpoint& endpoint) {
        auto& st = *state_;
        auto fail = [&](const char* what, boost::system::error_code ec) {
            if (st.acceptor) {
                boost::system::error_code ignored;
                static_cast<void>(st.acceptor->close(ignored));
                st.acceptor.reset();
            }
            return Result<void>::err(
                Error{Error::Code::Connect,
                      std::string(what) + " failed: " + ec.message(), ec,
                      endpoint.address().to_string() + ":" +
                          std::to_string(endpoint.port())});
        };

        if (st.stopped) {
            return Result<void>::err(
                Error{Error::Code::Shutdown, "server has been stopped"});
        }
        if (st.acceptor) {
            return Result<void>::err(
                Error{Error::Code::InvalidRequest, "server is already listening"});
        }

        boost::system::error_code ec;
        st.acceptor.emplace(st.ex);
        static_cast<void>(st.acceptor->open(endpoint.protocol(), ec));
        if (ec) return fail("open", ec);
        static_cast<void>(
            st.acceptor->set_option(net::socket_base::reuse_address(true), ec));
        if (ec) return fail("set_option(reuse_address)", ec);
        static_cast<void>(st.acceptor->bind(endpoint, ec));
        if (ec) return fail("bind", ec);
        static_cast<void>(
            st.acceptor->listen(net::socket_base::max_listen_connections, ec));
        if (ec) return fail("listen", ec);

        log::logger()->info("listening on {}", format_endpoint(local_endpoint()));
        net::co_spawn(st.ex, accept_loop_(state_), [](std::exception_ptr e) {
            log::report_exception(e, "server accept loop");
        });
        return Result<void>::ok();
    }

    tcp::endpoint Server::local_endpoint() const {
        if (!state_->acceptor || !state_->acceptor->is_open()) return {};
        boost::system::error_code ec;
        auto ep = state_->acceptor->local_endpoint(ec);
        return ec ? tcp::endpoint{} : ep;
    }

    void Server::stop() {
        auto& st = *state_;
        if (st.stopped.exchange(true)) return;
        if (st.acceptor && st.acceptor->is_open()) {
            boost::system::error_code ignored;
            static_cast<void>(st.acceptor->close(ignored));
        }
        // Wakes connections parked between requests.
        st.shutdown.cancel(CancelReason::Shutdown);
        log::logger()->debug("server stopped, {} connection(s) winding down",
                             st.active.load());
    }

    net::awaitable<void> Server::serve(std::unique_ptr<Transport> transport) {
        co_await serve_(state_, std::move(transport));
    }

    std::size_t Server::active_connections() const { return state_->active.load(); }

    std::uint64_t Server::requests_served() const noexcept {
        return state_->served.load();
    }

    net::awaitable<void> Server::accept_loop_(std::shared_ptr<State> st) {
        while (!st->stopped) {
            tcp::socket socket(st->ex);
            boost::system::error_code ec;
            co_await st->acceptor->async_accept(
                socket, net::redirect_error(net::use_awaitable, ec));

            if (ec) {
                if (ec == net::error::operation_aborted || st->stopped) {
                    log::logger()->debug("accept loop finished");
                    co_return;
                }
                log::logger()->error("accept failed: {}", ec.message());
                if (is_resource_exhaustion(ec)) {
                    net::steady_timer backoff(st->ex, std::chrono::milliseconds(100));
                    co_await backoff.async_wait(
                        net::redirect_error(net::use_awaitable, ec));
                }
                continue;
            }

            boost::system::error_code opt_ec;
            static_cast<void>(socket.set_option(tcp::no_delay(true), opt_ec));
            if (opt_ec) {
                log::logger()->warn("TCP_NODELAY not set: {}", opt_ec.message());
            }

            net::co_spawn(st->ex,
                          serve_(st, std::make_unique<TcpTransport>(std::move(socket))),
                          [](std::exception_ptr e) {
                              log::report_exception(e, "server connection");
                          });
        }
    }

    net::awaitable<void> Server::serve_(std::shared_ptr<State> st,
                                        std::unique_ptr<Transport> transport) {
        ActiveGuard active(st->active);
        const ServerConfiguration& cfg = st->cfg;
        const std::string remote = transport->remote_address();
        Connection conn(st->next_id++, PoolKey{}, std::move(transport));
        log::logger()->debug("connection #{} from {}", conn.id(), remote);

        while (!st->stopped && conn.is_open()) {
            conn.begin_exchange();

            auto head = co_await read_head(conn, st->ex, st->shutdown.token(), cfg);

            if (!head) {
                const Error& e = head.error();
                if (e.code == Error::Code::Protocol) {
                    log::logger()->warn("connection #{}: bad request head: {}",
                                        conn.id(), e.message);
                    co_await send_error(conn, 400, cfg);
                } else if (e.code == Error::Code::PeerClosed && !e.cause) {
                    log::logger()->debug("connection #{} closed by peer", conn.id());
                } else {
                    log::logger()->debug("connection #{} ended: {}", conn.id(),
                                         describe(e));
                }
                break;
            }

            auto framing = protocol::request_framing(head.value());
            if (!framing) {
                log::logger()->warn("connection #{}: {}", conn.id(),
                                     framing.error().message);
                co_await send_error(conn, 400, cfg);
                break;
            }

            IncomingRequest req;
            req.method = head.value().method;
            req.target = head.value().target;
            req.version = head.value().version;
            req.headers = head.value().headers;
            req.remote = remote;

            if (framing.value().kind != BodyFraming::Kind::None &&
                req.version >= 11 &&
                protocol::has_token(req.headers, "Expect", "100-continue")) {
                static constexpr std::string_view kContinue =
                    "HTTP/1.1 100 Continue\r\n\r\n";
                boost::system::error_code ec;
                const Transport::ConstBuffers interim{
                    net::buffer(kContinue.data(), kContinue.size())};
                co_await conn.write(interim, ec);
                if (ec) break;
            }

            protocol::BodyReader reader(conn, framing.value(), cfg.codec);
            auto body = co_await reader.read_all(cfg.max_body_bytes);
            if (!body) {
                const Error& e = body.error();
                if (e.code == Error::Code::BodyTooLarge) {
                    co_await send_error(conn, 413, cfg);
                } else if (e.code == Error::Code::Protocol) {
                    log::logger()->warn("connection #{}: bad request body: {}",
                                        conn.id(), e.message);
                    co_await send_error(conn, 400, cfg);
                } else {
                    log::logger()->debug("connection #{} ended in body: {}",
                                         conn.id(), describe(e));
                }
                break;
            }
            req.body = std::move(body).value();
            req.trailers = reader.trailers();

            bool keep_alive =
                protocol::should_keep_alive(req.version, req.headers) &&
                !st->stopped;

            Response resp;
            bool handled = false;
            try {
                resp = co_await st->handler(req);
                handled = true;
            } catch (const std::exception& ex) {
                log::logger()->error("handler failed for {} {}: {}", req.method,
                                     req.target, ex.what());
            }
            if (!handled) {
                resp = Response{};
                resp.status_code = 500;
                resp.body = "Internal Server Error\n";
                resp.set_header("Content-Type", "text/plain");
                keep_alive = false;
            }
            if (protocol::has_token(resp.headers, "Connection", "close") ||
                st->stopped) {
                keep_alive = false;
            }

            conn.set_state(ConnectionState::Draining);
            auto written =
                co_await write_response(conn, head.value(), resp, keep_alive, cfg);
            ++st->served;
            if (!written) {
                log::logger()->debug("connection #{}: response not delivered: {}",
                                     conn.id(), describe(written.error()));
                break;
            }
            log::logger()->debug("{} {} -> {} on connection #{}", req.method,
                                 req.target, resp.status_code, conn.id());
            if (!keep_alive) break;
            conn.set_state(ConnectionState::Idle);
        }
        conn.close();
    }

}  // namespace wireline
