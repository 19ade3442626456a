#pragma once

// In-memory stand-ins for the network and a driver for coroutines.
//
// Everything here runs on one io_context driven by the test thread, so the
// fakes need no locking. A hard watchdog aborts a test that wedges instead
// of hanging CI.

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <deque>
#include <exception>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "wireline/cancellation.hpp"
#include "wireline/connection/resolver_cache.hpp"
#include "wireline/transport/dialer.hpp"
#include "wireline/transport/transport.hpp"

namespace wireline::testing {

    namespace net = boost::asio;
    using tcp = net::ip::tcp;
    using namespace std::chrono_literals;

    // ---------------------
    // Hard watchdog (non-Asio)
    // ---------------------
    class HardWatchdog {
       public:
        explicit HardWatchdog(std::chrono::milliseconds timeout)
            : timeout_(timeout), start_(std::chrono::steady_clock::now()) {
            thread_ = std::thread([this] {
                while (!done_.load(std::memory_order_relaxed)) {
                    if (std::chrono::steady_clock::now() - start_ >= timeout_) {
                        std::fprintf(stderr,
                                     "\n[ WATCHDOG ] test exceeded %lld ms; "
                                     "aborting\n",
                                     static_cast<long long>(timeout_.count()));
                        std::fflush(stderr);
                        std::abort();
                    }
                    std::this_thread::sleep_for(10ms);
                }
            });
        }

        ~HardWatchdog() {
            done_.store(true, std::memory_order_relaxed);
            if (thread_.joinable()) thread_.join();
        }

        HardWatchdog(HardWatchdog const&) = delete;
        HardWatchdog& operator=(HardWatchdog const&) = delete;

       private:
        std::chrono::milliseconds timeout_;
        std::chrono::steady_clock::time_point start_;
        std::atomic<bool> done_{false};
        std::thread thread_;
    };

    // ---------------------
    // Coroutine driver
    // ---------------------

    /// Outcome of a spawned coroutine, filled in when it finishes.
    template <class T>
    struct Pending {
        std::optional<T> value;
        std::exception_ptr error;

        bool done() const noexcept { return value.has_value() || error; }
    };

    template <class T>
    std::shared_ptr<Pending<T>> spawn(net::io_context& ioc,
                                      net::awaitable<T> aw) {
        auto out = std::make_shared<Pending<T>>();
        net::co_spawn(
            ioc,
            [aw = std::move(aw), out]() mutable -> net::awaitable<void> {
                try {
                    out->value.emplace(co_await std::move(aw));
                } catch (...) {
                    out->error = std::current_exception();
                }
            },
            net::detached);
        return out;
    }

    /// Run handlers until pred() holds or timeout passes.
    template <class Pred>
    bool drive_until(net::io_context& ioc, Pred pred,
                     std::chrono::milliseconds timeout = 5000ms) {
        const auto until = std::chrono::steady_clock::now() + timeout;
        while (!pred()) {
            if (std::chrono::steady_clock::now() >= until) return false;
            if (ioc.stopped()) ioc.restart();
            ioc.run_one_for(5ms);
        }
        return true;
    }

    /// Let ready handlers and short timers run.
    inline void settle(net::io_context& ioc,
                       std::chrono::milliseconds span = 20ms) {
        const auto until = std::chrono::steady_clock::now() + span;
        while (std::chrono::steady_clock::now() < until) {
            if (ioc.stopped()) ioc.restart();
            ioc.run_one_for(1ms);
        }
    }

    /// Spawn aw and drive the io_context until it completes.
    template <class T>
    T run(net::io_context& ioc, net::awaitable<T> aw,
          std::chrono::milliseconds timeout = 5000ms) {
        HardWatchdog wd(timeout + 1500ms);
        auto p = spawn(ioc, std::move(aw));
        if (!drive_until(ioc, [&] { return p->done(); }, timeout)) {
            ADD_FAILURE() << "coroutine did not finish within "
                          << timeout.count() << " ms";
            std::abort();
        }
        if (p->error) std::rethrow_exception(p->error);
        return std::move(*p->value);
    }

    inline void run(net::io_context& ioc, net::awaitable<void> aw,
                    std::chrono::milliseconds timeout = 5000ms) {
        auto wrapped = [](net::awaitable<void> inner) -> net::awaitable<bool> {
            co_await std::move(inner);
            co_return true;
        };
        static_cast<void>(run(ioc, wrapped(std::move(aw)), timeout));
    }

    // ---------------------
    // Scripted transport
    // ---------------------

    /// Both ends of an in-memory connection, as seen by the test.
    struct Wire {
        /// Bytes the peer will deliver, one read at most per element.
        std::deque<std::string> inbound;
        /// Every Transport::write call, in order.
        std::vector<std::string> writes;
        /// The peer closes once inbound is drained.
        bool eof{false};
        bool open{true};
        /// Writes fail with this error and write nothing.
        std::optional<boost::system::error_code> write_error;
        /// Called after every successful write (e.g. to push a response).
        std::function<void(Wire&)> on_write;
        std::string remote{"10.0.0.1:80"};

        std::shared_ptr<net::steady_timer> signal;

        void push(std::string data) {
            inbound.push_back(std::move(data));
            notify();
        }

        void finish() {
            eof = true;
            notify();
        }

        void notify() {
            if (signal) signal->cancel();
        }

        std::string written() const {
            std::string all;
            for (auto const& w : writes) all += w;
            return all;
        }
    };

    class ScriptedTransport : public Transport {
       public:
        explicit ScriptedTransport(std::shared_ptr<Wire> wire)
            : wire_(std::move(wire)) {}

        ~ScriptedTransport() override { close(); }

        net::awaitable<std::size_t> read_some(
            net::mutable_buffer buffer, boost::system::error_code& ec) override {
            for (;;) {
                if (!wire_->open) {
                    ec = net::error::operation_aborted;
                    co_return 0;
                }
                if (!wire_->inbound.empty()) {
                    std::string& front = wire_->inbound.front();
                    const std::size_t n = std::min(front.size(), buffer.size());
                    std::memcpy(buffer.data(), front.data(), n);
                    front.erase(0, n);
                    if (front.empty()) wire_->inbound.pop_front();
                    co_return n;
                }
                if (wire_->eof) {
                    ec = net::error::eof;
                    co_return 0;
                }
                auto ex = co_await net::this_coro::executor;
                auto timer = std::make_shared<net::steady_timer>(
                    ex, net::steady_timer::time_point::max());
                wire_->signal = timer;
                boost::system::error_code wait_ec;
                co_await timer->async_wait(
                    net::redirect_error(net::use_awaitable, wait_ec));
                if (wire_->signal == timer) wire_->signal.reset();
            }
        }

        net::awaitable<std::size_t> write(const ConstBuffers& buffers,
                                          boost::system::error_code& ec) override {
            if (!wire_->open) {
                ec = net::error::not_connected;
                co_return 0;
            }
            if (wire_->write_error) {
                ec = *wire_->write_error;
                co_return 0;
            }
            std::string data;
            for (auto const& b : buffers) {
                data.append(static_cast<const char*>(b.data()), b.size());
            }
            wire_->writes.push_back(data);
            if (wire_->on_write) wire_->on_write(*wire_);
            co_return data.size();
        }

        void close() noexcept override {
            if (!wire_->open) return;
            wire_->open = false;
            wire_->notify();
        }

        bool is_open() const noexcept override { return wire_->open; }

        bool peer_closed() noexcept override {
            return !wire_->open || (wire_->eof && wire_->inbound.empty());
        }

        std::string remote_address() const override { return wire_->remote; }

       private:
        std::shared_ptr<Wire> wire_;
    };

    /// Whether the last write carried a request head.
    inline bool wrote_request_head(const Wire& w) {
        const std::string& last = w.writes.back();
        return last.find(" HTTP/1.1\r\n") != std::string::npos &&
               last.find("\r\n\r\n") != std::string::npos;
    }

    /// Answer each written request head with the next canned response.
    inline void respond_in_order(Wire& wire, std::vector<std::string> responses) {
        auto queue = std::make_shared<std::deque<std::string>>(
            responses.begin(), responses.end());
        wire.on_write = [queue](Wire& w) {
            if (!wrote_request_head(w) || queue->empty()) return;
            w.push(std::move(queue->front()));
            queue->pop_front();
        };
    }

    /// Answer every written request head with the same response.
    inline void respond_always(Wire& wire, std::string response) {
        wire.on_write = [response = std::move(response)](Wire& w) {
            if (wrote_request_head(w)) w.push(response);
        };
    }

    // ---------------------
    // Fake dialer / resolver
    // ---------------------

    class FakeDialer : public Dialer {
       public:
        /// Prepares the wire of every new connection.
        std::function<void(Wire&, const tcp::endpoint&)> on_connect;

        /// Endpoints that refuse connections.
        std::set<tcp::endpoint> refuse;

        /// Per-endpoint connect latency.
        std::map<tcp::endpoint, std::chrono::milliseconds> latency;

        std::vector<std::shared_ptr<Wire>> wires;
        std::vector<tcp::endpoint> attempts;
        int handshakes{0};

        int connects() const noexcept { return static_cast<int>(wires.size()); }

        net::awaitable<Result<std::unique_ptr<Transport>>> connect(
            const tcp::endpoint& endpoint, CancellationToken token) override {
            using R = Result<std::unique_ptr<Transport>>;
            attempts.push_back(endpoint);
            const std::string where =
                endpoint.address().to_string() + ":" + std::to_string(endpoint.port());

            if (auto it = latency.find(endpoint);
                it != latency.end() && !token.cancelled()) {
                auto ex = co_await net::this_coro::executor;
                net::steady_timer timer(ex, it->second);
                auto reg = token.on_cancel([&timer] { timer.cancel(); });
                boost::system::error_code ec;
                co_await timer.async_wait(net::redirect_error(net::use_awaitable, ec));
            }
            if (token.cancelled()) {
                co_return R::err(Error{cancel_code(token), "connect cancelled",
                                       {}, where});
            }
            if (refuse.count(endpoint)) {
                co_return R::err(Error{Error::Code::Connect, "connect refused",
                                       net::error::connection_refused, where});
            }

            auto wire = std::make_shared<Wire>();
            wire->remote = where;
            if (on_connect) on_connect(*wire, endpoint);
            wires.push_back(wire);
            co_return R::ok(std::make_unique<ScriptedTransport>(wire));
        }

        net::awaitable<Result<std::unique_ptr<Transport>>> handshake(
            std::unique_ptr<Transport> raw, const std::string&, bool,
            CancellationToken) override {
            ++handshakes;
            co_return Result<std::unique_ptr<Transport>>::ok(std::move(raw));
        }
    };

    class FakeResolver : public Resolver {
       public:
        std::map<std::string, AddressList> hosts;
        std::chrono::milliseconds latency{0};
        int lookups{0};
        /// Lookups whose token fired before they finished.
        int aborted{0};

        net::awaitable<Result<AddressList>> resolve(const std::string& host,
                                                    const std::string& port,
                                                    CancellationToken token) override {
            ++lookups;
            if (latency.count() > 0) {
                auto ex = co_await net::this_coro::executor;
                auto timer = std::make_shared<net::steady_timer>(ex, latency);
                auto abort = token.on_cancel([timer] {
                    net::post(timer->get_executor(), [timer] { timer->cancel(); });
                });
                boost::system::error_code ec;
                co_await timer->async_wait(net::redirect_error(net::use_awaitable, ec));
                if (token.cancelled()) {
                    ++aborted;
                    co_return Result<AddressList>::err(
                        Error{Error::Code::Resolution, "lookup aborted", ec,
                              host + ":" + port});
                }
            }
            auto it = hosts.find(host);
            if (it == hosts.end()) {
                co_return Result<AddressList>::err(
                    Error{Error::Code::Resolution, "unknown host " + host, {},
                          host + ":" + port});
            }
            co_return Result<AddressList>::ok(it->second);
        }
    };

    // ---------------------
    // Misc
    // ---------------------

    /// Value of one auth-param in an Authorization header, unquoted.
    inline std::string auth_param(const std::string& header, const std::string& name) {
        const std::string needle = name + "=";
        std::size_t pos = 0;
        for (;;) {
            pos = header.find(needle, pos);
            if (pos == std::string::npos) return {};
            if (pos == 0 || header[pos - 1] == ' ' || header[pos - 1] == ',') break;
            pos += needle.size();
        }
        pos += needle.size();
        if (pos < header.size() && header[pos] == '"') {
            const auto end = header.find('"', pos + 1);
            return header.substr(pos + 1, end - pos - 1);
        }
        const auto end = header.find(',', pos);
        return header.substr(pos, end == std::string::npos ? end : end - pos);
    }

    inline tcp::endpoint ep(const char* ip, unsigned short port = 80) {
        return {net::ip::make_address(ip), port};
    }

}  // namespace wireline::testing
