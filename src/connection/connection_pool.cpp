#include "wireline/connection/connection_pool.hpp"

#include <algorithm>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/system/error_code.hpp>
#include <vector>

#include "wireline/connection/happy_eyeballs.hpp"
#include "wireline/deadline.hpp"
#include "wireline/log.hpp"

namespace net = boost::asio;

namespace wireline {

    using LeaseResult = Result<ConnectionPool::Lease>;

    namespace {

        Error pool_error(Error::Code code, std::string message,
                         PoolKey const& key) {
            Error e{code, std::move(message)};
            e.endpoint = key.to_string();
            return e;
        }

    }  // namespace

    ConnectionPool::ConnectionPool(net::any_io_executor ex, Dialer& dialer,
                                   Resolver& resolver, PoolConfiguration cfg)
        : ex_(std::move(ex)),
          dialer_(dialer),
          cfg_(cfg),
          resolver_cache_(ex_, resolver, cfg.dns_ttl),
          state_(std::make_shared<Lease::State>()) {}

    ConnectionPool::~ConnectionPool() {
        close_all();
        // Leases and parked coroutines check this before calling back in.
        state_->alive.store(false, std::memory_order_release);
    }

    ConnectionPool::Lease ConnectionPool::make_lease_(PoolKey const& key,
                                                      Connection* conn) {
        conn->set_state(ConnectionState::Active);
        return Lease(state_, conn, key, conn->id(),
                     [this](PoolKey const& k, std::uint64_t id, bool reusable) {
                         release_(k, id, reusable);
                     });
    }

    void ConnectionPool::wake_all(Timers& timers) {
        for (auto& t : timers) t->cancel();
        timers.clear();
    }

    net::awaitable<LeaseResult> ConnectionPool::acquire(PoolKey key,
                                                        AcquireOptions opts) {
        key.normalize();
        // Keeps the liveness flag readable after a suspension even if the
        // pool object is gone by then.
        auto st = state_;

        Deadline deadline(ex_, opts.token, opts.timeout);
        auto shutdown_link = shutdown_.token().on_cancel(
            [&deadline] { deadline.cancel(CancelReason::Shutdown); });
        const CancellationToken token = deadline.token();

        auto count_failure = [this](Error::Code code) {
            switch (code) {
                case Error::Code::Timeout:
                    metrics_.acquire_timeout.fetch_add(1, std::memory_order_relaxed);
                    break;
                case Error::Code::Cancelled:
                    metrics_.acquire_cancelled.fetch_add(1,
                                                         std::memory_order_relaxed);
                    break;
                case Error::Code::Shutdown:
                    metrics_.acquire_shutdown.fetch_add(1, std::memory_order_relaxed);
                    break;
                default:
                    break;
            }
        };
        auto fail = [&](Error::Code code, std::string message) {
            count_failure(code);
            return LeaseResult::err(pool_error(code, std::move(message), key));
        };

        std::shared_ptr<Waiter> waiter;
        {
            std::lock_guard<std::mutex> lk(mu_);
            if (closed_.load(std::memory_order_acquire)) {
                co_return fail(Error::Code::Shutdown, "pool is closed");
            }
            if (token.cancelled()) {
                co_return fail(cancel_code(token), "acquire cancelled");
            }
            if (!opts.fresh) {
                if (auto lease = take_idle_locked_(key)) {
                    metrics_.acquire_success.fetch_add(1, std::memory_order_relaxed);
                    co_return LeaseResult::ok(std::move(*lease));
                }
            }
            // Newcomers do not overtake waiters already queued for the key.
            if (has_waiter_locked_(key) || !reserve_slot_locked_(key, opts.fresh)) {
                waiter = std::make_shared<Waiter>();
                waiter->key = key;
                waiter->timer = std::make_shared<net::steady_timer>(ex_);
                waiter->timer->expires_at(net::steady_timer::time_point::max());
                waiters_.push_back(waiter);
            }
            update_gauges_locked_();
        }

        if (waiter) {
            auto wake_on_cancel = token.on_cancel([t = waiter->timer] {
                net::post(t->get_executor(), [t] { t->cancel(); });
            });

            for (;;) {
                boost::system::error_code ec;
                co_await waiter->timer->async_wait(
                    net::redirect_error(net::use_awaitable, ec));

                if (!st->alive.load(std::memory_order_acquire)) {
                    co_return LeaseResult::err(
                        pool_error(Error::Code::Shutdown, "pool destroyed", key));
                }

                std::unique_lock<std::mutex> lk(mu_);
                switch (waiter->status) {
                    case Waiter::Status::Waiting:
                        if (!token.cancelled()) {
                            // Spurious wake; park again.
                            continue;
                        }
                        drop_waiter_locked_(waiter);
                        waiter->status = Waiter::Status::Abandoned;
                        update_gauges_locked_();
                        lk.unlock();
                        co_return fail(cancel_code(token),
                                       token.reason() == CancelReason::Timeout
                                           ? "timed out waiting for a connection"
                                           : "acquire cancelled");

                    case Waiter::Status::Shutdown:
                    case Waiter::Status::Abandoned:
                        lk.unlock();
                        co_return fail(Error::Code::Shutdown, "pool is closed");

                    case Waiter::Status::GrantedConnection: {
                        const std::uint64_t id = waiter->conn_id;
                        if (token.cancelled()) {
                            lk.unlock();
                            // Pass the connection on instead of dropping it.
                            release_(key, id, true);
                            co_return fail(cancel_code(token), "acquire cancelled");
                        }
                        auto& bucket = buckets_[key];
                        auto it = bucket.in_use.find(id);
                        if (it == bucket.in_use.end()) {
                            lk.unlock();
                            co_return fail(Error::Code::Shutdown,
                                           "granted connection vanished");
                        }
                        metrics_.acquire_success.fetch_add(1, std::memory_order_relaxed);
                        metrics_.connection_reused.fetch_add(1,
                                                             std::memory_order_relaxed);
                        co_return LeaseResult::ok(make_lease_(key, it->second.get()));
                    }

                    case Waiter::Status::GrantedSlot:
                        if (token.cancelled()) {
                            lk.unlock();
                            release_slot_(key);
                            co_return fail(cancel_code(token), "acquire cancelled");
                        }
                        break;
                }
                break;
            }
        }

        // We hold a reserved connecting slot from here on.
        auto transport = co_await establish_(key, token);

        if (!st->alive.load(std::memory_order_acquire)) {
            co_return LeaseResult::err(
                pool_error(Error::Code::Shutdown, "pool destroyed", key));
        }

        Timers wake;
        std::unique_lock<std::mutex> lk(mu_);
        auto& bucket = buckets_[key];
        if (bucket.connecting) --bucket.connecting;

        if (!transport || closed_.load(std::memory_order_acquire)) {
            grant_capacity_locked_(wake, &key);
            update_gauges_locked_();
            lk.unlock();
            wake_all(wake);

            if (!transport) {
                metrics_.connect_failed.fetch_add(1, std::memory_order_relaxed);
                Error e = std::move(transport).error();
                if (token.cancelled() && (e.code == Error::Code::Cancelled ||
                                          e.code == Error::Code::Connect)) {
                    e.code = cancel_code(token);
                }
                if (e.endpoint.empty()) e.endpoint = key.to_string();
                log::logger()->debug("connect to {} failed: {}", key.to_string(),
                                     describe(e));
                count_failure(e.code);
                co_return LeaseResult::err(std::move(e));
            }
            co_return fail(Error::Code::Shutdown, "pool closed while connecting");
        }

        auto conn = std::make_unique<Connection>(next_id_++, key,
                                                 std::move(transport).value());
        Connection* raw = conn.get();
        bucket.in_use.emplace(raw->id(), std::move(conn));
        metrics_.connection_created.fetch_add(1, std::memory_order_relaxed);
        metrics_.acquire_success.fetch_add(1, std::memory_order_relaxed);
        update_gauges_locked_();
        log::logger()->debug("opened connection #{} to {}", raw->id(),
                             key.to_string());
        co_return LeaseResult::ok(make_lease_(key, raw));
    }

    std::optional<ConnectionPool::Lease> ConnectionPool::try_acquire_idle(
        PoolKey key) {
        key.normalize();
        std::lock_guard<std::mutex> lk(mu_);
        if (closed_.load(std::memory_order_acquire)) return std::nullopt;
        auto lease = take_idle_locked_(key);
        if (lease) {
            metrics_.acquire_success.fetch_add(1, std::memory_order_relaxed);
            update_gauges_locked_();
        }
        return lease;
    }

    std::optional<ConnectionPool::Lease> ConnectionPool::take_idle_locked_(
        PoolKey const& key) {
        auto bit = buckets_.find(key);
        if (bit == buckets_.end()) return std::nullopt;
        auto& bucket = bit->second;

        const auto now = clock_type::now();
        // Most recently used first: the least likely to have been dropped
        // by the peer.
        while (!bucket.idle.empty()) {
            IdleEntry entry = std::move(bucket.idle.back());
            bucket.idle.pop_back();

            if (!entry.conn->is_open() || entry.conn->peer_will_close() ||
                now - entry.idle_since >= cfg_.idle_timeout ||
                entry.conn->transport().peer_closed()) {
                metrics_.connection_pruned.fetch_add(1, std::memory_order_relaxed);
                continue;  // destructor closes it
            }

            Connection* raw = entry.conn.get();
            bucket.in_use.emplace(raw->id(), std::move(entry.conn));
            metrics_.connection_reused.fetch_add(1, std::memory_order_relaxed);
            return make_lease_(key, raw);
        }
        return std::nullopt;
    }

    std::size_t ConnectionPool::total_outstanding_locked_() const {
        std::size_t total = 0;
        for (auto const& [k, b] : buckets_) total += b.outstanding();
        return total;
    }

    bool ConnectionPool::has_waiter_locked_(PoolKey const& key) const {
        return std::any_of(waiters_.begin(), waiters_.end(),
                           [&](auto const& w) {
                               return w->status == Waiter::Status::Waiting &&
                                      w->key == key;
                           });
    }

    bool ConnectionPool::reserve_slot_locked_(PoolKey const& key, bool fresh) {
        auto& bucket = buckets_[key];

        if (bucket.outstanding() >= cfg_.max_connections_per_key) {
            if (!fresh || bucket.idle.empty()) return false;
            // A fresh connection replaces the oldest idle one of this key.
            bucket.idle.pop_front();
            metrics_.connection_evicted.fetch_add(1, std::memory_order_relaxed);
        }

        if (total_outstanding_locked_() >= cfg_.max_total_connections) {
            // Only the global limit blocks: close the longest idle
            // connection of any key.
            Bucket* victim = nullptr;
            for (auto& [k, b] : buckets_) {
                if (b.idle.empty()) continue;
                if (!victim ||
                    b.idle.front().idle_since < victim->idle.front().idle_since) {
                    victim = &b;
                }
            }
            if (!victim) return false;
            victim->idle.pop_front();
            metrics_.connection_evicted.fetch_add(1, std::memory_order_relaxed);
        }

        ++bucket.connecting;
        return true;
    }

    void ConnectionPool::drop_waiter_locked_(const std::shared_ptr<Waiter>& w) {
        waiters_.remove(w);
    }

    void ConnectionPool::grant_capacity_locked_(Timers& wake,
                                                PoolKey const* preferred) {
        auto grant = [&](std::list<std::shared_ptr<Waiter>>::iterator it) {
            auto& w = *it;
            w->status = Waiter::Status::GrantedSlot;
            wake.push_back(w->timer);
            metrics_.handoff_slot.fetch_add(1, std::memory_order_relaxed);
            return waiters_.erase(it);
        };

        if (preferred) {
            for (auto it = waiters_.begin(); it != waiters_.end(); ++it) {
                if ((*it)->status != Waiter::Status::Waiting ||
                    (*it)->key != *preferred) {
                    continue;
                }
                if (reserve_slot_locked_(*preferred, false)) grant(it);
                // Only the oldest waiter of the key is eligible.
                break;
            }
        }

        for (auto it = waiters_.begin(); it != waiters_.end();) {
            if ((*it)->status != Waiter::Status::Waiting) {
                ++it;
                continue;
            }
            auto& bucket = buckets_[(*it)->key];
            if (bucket.outstanding() >= cfg_.max_connections_per_key) {
                ++it;
                continue;
            }
            if (!reserve_slot_locked_((*it)->key, false)) break;
            it = grant(it);
        }
    }

    void ConnectionPool::release_(PoolKey const& key, std::uint64_t id,
                                  bool reusable) noexcept {
        std::unique_ptr<Connection> doomed;
        Timers wake;
        {
            std::lock_guard<std::mutex> lk(mu_);
            auto bit = buckets_.find(key);
            if (bit == buckets_.end()) {
                metrics_.release_invalid_id.fetch_add(1, std::memory_order_relaxed);
                return;
            }
            auto& bucket = bit->second;
            auto cit = bucket.in_use.find(id);
            if (cit == bucket.in_use.end()) {
                metrics_.release_invalid_id.fetch_add(1, std::memory_order_relaxed);
                return;
            }
            Connection* conn = cit->second.get();

            bool keep = reusable && !closed_.load(std::memory_order_acquire) &&
                        conn->is_open() && !conn->peer_will_close();

            if (keep) {
                conn->touch();
                // Same-key waiter: hand the connection over directly.
                auto wit = std::find_if(waiters_.begin(), waiters_.end(),
                                        [&](auto const& w) {
                                            return w->status ==
                                                       Waiter::Status::Waiting &&
                                                   w->key == key;
                                        });
                if (wit != waiters_.end()) {
                    (*wit)->status = Waiter::Status::GrantedConnection;
                    (*wit)->conn_id = id;
                    wake.push_back((*wit)->timer);
                    waiters_.erase(wit);
                    metrics_.handoff_connection.fetch_add(1,
                                                          std::memory_order_relaxed);
                } else {
                    // A waiter of another key blocked only by the global
                    // limit gets the capacity instead of an idle entry.
                    const bool global_full =
                        total_outstanding_locked_() >= cfg_.max_total_connections;
                    const bool other_waiting =
                        global_full &&
                        std::any_of(waiters_.begin(), waiters_.end(),
                                    [&](auto const& w) {
                                        return w->status ==
                                                   Waiter::Status::Waiting &&
                                               buckets_[w->key].outstanding() <
                                                   cfg_.max_connections_per_key;
                                    });
                    if (other_waiting) {
                        keep = false;
                    } else {
                        conn->set_state(ConnectionState::Idle);
                        bucket.idle.push_back(
                            IdleEntry{std::move(cit->second), clock_type::now()});
                        bucket.in_use.erase(cit);
                    }
                }
            }

            if (!keep) {
                doomed = std::move(cit->second);
                bucket.in_use.erase(cit);
                metrics_.connection_retired.fetch_add(1, std::memory_order_relaxed);
                grant_capacity_locked_(wake, &key);
            }
            update_gauges_locked_();
        }

        if (doomed) {
            log::logger()->debug("retired connection #{} to {} after {} exchange(s)",
                                 doomed->id(), key.to_string(),
                                 doomed->exchanges());
            doomed->close();
        }
        wake_all(wake);
    }

    void ConnectionPool::release_slot_(PoolKey const& key) noexcept {
        Timers wake;
        {
            std::lock_guard<std::mutex> lk(mu_);
            auto& bucket = buckets_[key];
            if (bucket.connecting) --bucket.connecting;
            if (!closed_.load(std::memory_order_acquire)) {
                grant_capacity_locked_(wake, &key);
            }
            update_gauges_locked_();
        }
        wake_all(wake);
    }

    net::awaitable<Result<std::unique_ptr<Transport>>> ConnectionPool::establish_(
        PoolKey const& key, CancellationToken token) {
        using R = Result<std::unique_ptr<Transport>>;

        auto addresses =
            co_await resolver_cache_.resolve(key.host, key.port, token);
        if (!addresses) {
            co_return std::move(addresses)
                .forward_error<std::unique_ptr<Transport>>();
        }
        if (token.cancelled()) {
            co_return R::err(Error{cancel_code(token), "connect cancelled"});
        }

        Deadline connect_deadline(ex_, token, cfg_.connect_timeout);
        auto raw = co_await race_connect(
            dialer_, interleave_address_families(addresses.value()),
            cfg_.happy_eyeballs_delay, connect_deadline.token());
        if (!raw || !key.https) co_return std::move(raw);

        co_return co_await dialer_.handshake(std::move(raw).value(), key.host,
                                             key.verify_tls,
                                             connect_deadline.token());
    }

    void ConnectionPool::close_all() {
        Timers wake;
        std::vector<std::unique_ptr<Connection>> doomed;
        std::shared_ptr<net::steady_timer> sweep;
        {
            std::lock_guard<std::mutex> lk(mu_);
            if (closed_.exchange(true, std::memory_order_acq_rel)) return;

            for (auto& w : waiters_) {
                w->status = Waiter::Status::Shutdown;
                wake.push_back(w->timer);
            }
            waiters_.clear();

            for (auto& [k, bucket] : buckets_) {
                for (auto& e : bucket.idle) doomed.push_back(std::move(e.conn));
                bucket.idle.clear();
                if (cfg_.close_on_shutdown) {
                    // Leases keep their pointers; the exchanges fail.
                    for (auto& [id, c] : bucket.in_use) c->close();
                }
            }
            sweep = std::move(sweep_timer_);
            update_gauges_locked_();
        }

        log::logger()->debug("pool closed: {} idle connection(s), {} waiter(s)",
                             doomed.size(), wake.size());

        // Aborts connects and handshakes in flight.
        shutdown_.cancel(CancelReason::Shutdown);
        if (sweep) sweep->cancel();
        doomed.clear();
        wake_all(wake);
    }

    std::size_t ConnectionPool::prune_idle() {
        Timers wake;
        std::vector<std::unique_ptr<Connection>> doomed;
        {
            std::lock_guard<std::mutex> lk(mu_);
            const auto now = clock_type::now();
            for (auto& [k, bucket] : buckets_) {
                auto& idle = bucket.idle;
                for (auto it = idle.begin(); it != idle.end();) {
                    if (!it->conn->is_open() ||
                        now - it->idle_since >= cfg_.idle_timeout ||
                        it->conn->transport().peer_closed()) {
                        doomed.push_back(std::move(it->conn));
                        it = idle.erase(it);
                    } else {
                        ++it;
                    }
                }
            }
            if (!doomed.empty()) {
                metrics_.connection_pruned.fetch_add(doomed.size(),
                                                     std::memory_order_relaxed);
                if (!closed_.load(std::memory_order_acquire)) {
                    grant_capacity_locked_(wake, nullptr);
                }
                update_gauges_locked_();
            }
        }
        const std::size_t n = doomed.size();
        doomed.clear();
        wake_all(wake);
        return n;
    }

    void ConnectionPool::start_idle_sweep() {
        std::shared_ptr<net::steady_timer> timer;
        {
            std::lock_guard<std::mutex> lk(mu_);
            if (sweep_timer_ || closed_.load(std::memory_order_acquire)) return;
            sweep_timer_ = std::make_shared<net::steady_timer>(ex_);
            timer = sweep_timer_;
        }
        net::co_spawn(ex_, sweep_loop_(this, std::move(timer), state_),
                      [](std::exception_ptr e) {
                          log::report_exception(e, "idle sweep");
                      });
    }

    net::awaitable<void> ConnectionPool::sweep_loop_(
        ConnectionPool* self, std::shared_ptr<net::steady_timer> t,
        std::shared_ptr<Lease::State> st) {
        const auto interval = self->cfg_.idle_sweep_interval;
        for (;;) {
            t->expires_after(interval);
            boost::system::error_code ec;
            co_await t->async_wait(net::redirect_error(net::use_awaitable, ec));
            if (ec || !st->alive.load(std::memory_order_acquire) ||
                self->closed()) {
                co_return;
            }
            const std::size_t n = self->prune_idle();
            if (n) log::logger()->debug("idle sweep closed {} connection(s)", n);
        }
    }

    std::size_t ConnectionPool::outstanding(PoolKey key) const {
        key.normalize();
        std::lock_guard<std::mutex> lk(mu_);
        auto it = buckets_.find(key);
        return it == buckets_.end() ? 0 : it->second.outstanding();
    }

    PoolStats ConnectionPool::stats() const {
        std::lock_guard<std::mutex> lk(mu_);
        PoolStats s;
        for (auto const& [k, b] : buckets_) {
            s.in_use += b.in_use.size();
            s.idle += b.idle.size();
            s.connecting += b.connecting;
        }
        s.waiters = waiters_.size();
        return s;
    }

    void ConnectionPool::update_gauges_locked_() {
        PoolStats s;
        for (auto const& [k, b] : buckets_) {
            s.in_use += b.in_use.size();
            s.idle += b.idle.size();
            s.connecting += b.connecting;
        }
        metrics_.total_in_use.store(s.in_use, std::memory_order_relaxed);
        metrics_.total_idle.store(s.idle, std::memory_order_relaxed);
        metrics_.connecting.store(s.connecting, std::memory_order_relaxed);
        metrics_.waiters_total.store(waiters_.size(), std::memory_order_relaxed);
    }

}  // namespace wireline
