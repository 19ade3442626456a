#include "wireline/connection/happy_eyeballs.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <algorithm>
#include <mutex>
#include <optional>

#include "wireline/log.hpp"

namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace wireline {

    namespace {

        struct RaceState {
            RaceState(const CancellationToken& parent, net::any_io_executor ex)
                : losers(parent), wake(std::move(ex)) {}

            std::mutex mu;
            /// Linked to the caller's token; fired on the first success.
            CancellationSource losers;
            /// Parks the coordinator between stagger steps.
            net::steady_timer wake;
            std::unique_ptr<Transport> winner;
            std::optional<Error> last_error;
            std::size_t running{0};
        };

        void poke(const std::shared_ptr<RaceState>& st) {
            net::post(st->wake.get_executor(), [st] { st->wake.cancel(); });
        }

        net::awaitable<void> attempt(std::shared_ptr<RaceState> st,
                                     Dialer& dialer, tcp::endpoint ep) {
            auto r = co_await dialer.connect(ep, st->losers.token());

            std::unique_ptr<Transport> late;
            bool won = false;
            {
                std::lock_guard<std::mutex> lk(st->mu);
                --st->running;
                if (r) {
                    if (!st->winner && !st->losers.cancelled()) {
                        st->winner = std::move(r.value());
                        won = true;
                    } else {
                        late = std::move(r.value());
                    }
                } else if (!st->last_error ||
                           r.error().code != Error::Code::Cancelled) {
                    st->last_error = std::move(r).error();
                }
            }

            if (late) late->close();
            if (won) st->losers.cancel();
            poke(st);
        }

    }  // namespace

    net::awaitable<Result<std::unique_ptr<Transport>>> race_connect(
        Dialer& dialer, const AddressList& candidates,
        std::chrono::milliseconds delay, CancellationToken token) {
        using R = Result<std::unique_ptr<Transport>>;
        if (candidates.empty()) {
            co_return R::err(
                Error{Error::Code::Connect, "no address candidates"});
        }

        auto ex = co_await net::this_coro::executor;
        auto st = std::make_shared<RaceState>(token, ex);
        auto outer = token.on_cancel([st] { poke(st); });

        std::size_t next = 0;
        auto spawn_next = [&] {
            {
                std::lock_guard<std::mutex> lk(st->mu);
                ++st->running;
            }
            net::co_spawn(ex, attempt(st, dialer, candidates[next++]),
                          [](std::exception_ptr e) {
                              log::report_exception(e, "connect attempt");
                          });
        };

        spawn_next();
        for (;;) {
            std::unique_ptr<Transport> won;
            bool all_failed = false;
            bool start_now = false;
            const bool more = next < candidates.size();
            {
                std::lock_guard<std::mutex> lk(st->mu);
                if (st->winner) {
                    won = std::move(st->winner);
                } else if (st->running == 0) {
                    all_failed = !more;
                    start_now = more;
                } else if (more) {
                    st->wake.expires_after(delay);
                } else {
                    // Bounded so a poke landing before the wait starts
                    // only costs one period.
                    st->wake.expires_after(
                        std::max(delay, std::chrono::milliseconds(50)));
                }
            }

            if (token.cancelled()) {
                st->losers.cancel(token.reason());
                co_return R::err(Error{cancel_code(token), "connect cancelled"});
            }
            if (won) co_return R::ok(std::move(won));
            if (all_failed) {
                Error e = st->last_error.value_or(
                    Error{Error::Code::Connect, "all connection attempts failed"});
                if (e.code != Error::Code::Cancelled) {
                    e.code = Error::Code::Connect;
                }
                co_return R::err(std::move(e));
            }
            if (start_now) {
                // The previous attempt failed; do not wait for the stagger.
                spawn_next();
                continue;
            }

            boost::system::error_code ec;
            co_await st->wake.async_wait(
                net::redirect_error(net::use_awaitable, ec));
            if (!ec && next < candidates.size()) spawn_next();
        }
    }

}  // namespace wireline
