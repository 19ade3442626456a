#pragma once

#include <atomic>
#include <utility>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/steady_timer.hpp>
#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>

#include "wireline/cancellation.hpp"
#include "wireline/config.hpp"
#include "wireline/connection/connection.hpp"
#include "wireline/connection/connection_pool_types.hpp"
#include "wireline/connection/resolver_cache.hpp"
#include "wireline/pool_key.hpp"
#include "wireline/result.hpp"
#include "wireline/transport/dialer.hpp"

namespace wireline {

    /**
     * Thread-safe connection pool keyed by PoolKey.
     *
     * SAFETY:
     * - All public methods are thread-safe and can be called from any thread
     * - Internal state protected by mutex, never held across a suspension
     * - Waiter timers are cancelled outside the lock
     *
     * INVARIANTS:
     * 1. For each key: outstanding == in_use + idle + connecting <= per-key
     *    limit, and the sum over keys <= global limit
     * 2. No connection exists in both idle and in_use
     * 3. A connection is loaned to at most one Lease
     * 4. Waiters of one key are served in arrival order
     * 5. A waiter that timed out or was cancelled never receives a grant
     * 6. A failed connection attempt never counts as a created connection
     *
     * ERRORS:
     * - Timeout: acquire deadline expired
     * - Cancelled: caller's token fired
     * - Shutdown: close_all() was called, all future operations fail
     * - Resolution / Connect / Tls: establishing a new connection failed
     *
     * LIFECYCLE:
     * 1. Construction: pool is alive and ready
     * 2. Operation: acquire() and Lease::release() work normally
     * 3. close_all(): marks pool as closed, fails all waiters, closes idle
     *    and in-flight connections
     * 4. Destruction: calls close_all()
     */
    class ConnectionPool {
       public:
        using clock_type = std::chrono::steady_clock;

        class Lease {
           public:
            Lease() = default;

            Lease(Lease&& other) noexcept { move_from(std::move(other)); }

            /// @brief Move lease from another
            Lease& operator=(Lease&& other) noexcept {
                if (this != &other) {
                    reset();
                    move_from(std::move(other));
                }
                return *this;
            }

            Lease(Lease const&) = delete;
            Lease& operator=(Lease const&) = delete;

            /// @note A lease dropped without release() closes its
            /// connection: its protocol state is unknown.
            ~Lease() { reset(); }

            Connection* operator->() const noexcept { return get(); }

            Connection& operator*() const { return *get(); }

            /// @brief Get the underlying connection, or nullptr if inert
            Connection* get() const noexcept {
                auto st = state_.lock();
                if (!st || !st->alive.load(std::memory_order_acquire))
                    return nullptr;
                return conn_;
            }

            explicit operator bool() const noexcept { return get() != nullptr; }

            PoolKey const& key() const noexcept { return key_; }

            std::uint64_t id() const noexcept { return id_; }

            /// @brief Give the connection back to the pool.
            /// @param reusable The caller's view; the pool still refuses
            /// closed connections and peers that announced a close.
            void release(bool reusable) noexcept {
                auto st = state_.lock();
                if (!conn_) return;
                // If the pool is already gone, do not call back into it.
                if (st && st->alive.load(std::memory_order_acquire) &&
                    return_to_pool_) {
                    return_to_pool_(key_, id_, reusable);
                }
                conn_ = nullptr;
            }

           private:
            friend class ConnectionPool;

            /// @brief Internal state shared with the pool
            /// @note Used to detect pool destruction; alive turns false in
            /// the pool destructor only
            struct State {
                std::atomic<bool> alive{true};
            };

            Lease(std::weak_ptr<State> st, Connection* c, PoolKey key,
                  std::uint64_t id,
                  std::function<void(PoolKey const&, std::uint64_t, bool)> ret)
                : state_(std::move(st)),
                  conn_(c),
                  key_(std::move(key)),
                  id_(id),
                  return_to_pool_(std::move(ret)) {}

            void reset() noexcept { release(false); }

            void move_from(Lease&& other) noexcept {
                state_ = std::move(other.state_);
                conn_ = other.conn_;
                key_ = std::move(other.key_);
                id_ = other.id_;
                return_to_pool_ = std::move(other.return_to_pool_);
                other.conn_ = nullptr;
                other.id_ = 0;
            }

            std::weak_ptr<State> state_;
            Connection* conn_{nullptr};
            PoolKey key_{};
            std::uint64_t id_{0};
            std::function<void(PoolKey const&, std::uint64_t, bool)>
                return_to_pool_;
        };

        /// @brief Options for one acquire() call.
        struct AcquireOptions {
            /// Deadline for the whole acquisition, including connecting.
            clock_type::duration timeout{clock_type::duration::max()};
            CancellationToken token{};
            /// Skip idle connections and establish a new one.
            bool fresh{false};
        };

        ConnectionPool(boost::asio::any_io_executor ex, Dialer& dialer,
                       Resolver& resolver, PoolConfiguration cfg);

        ~ConnectionPool();

        ConnectionPool(ConnectionPool const&) = delete;
        ConnectionPool& operator=(ConnectionPool const&) = delete;

        /// @brief Obtain a connection for key: an idle one if available, a
        /// new one if capacity allows, otherwise wait in arrival order.
        boost::asio::awaitable<Result<Lease>> acquire(PoolKey key,
                                                      AcquireOptions opts);

        boost::asio::awaitable<Result<Lease>> acquire(PoolKey key) {
            return acquire(std::move(key), AcquireOptions{});
        }

        /// @brief Take an idle connection without waiting or connecting.
        std::optional<Lease> try_acquire_idle(PoolKey key);

        /// @brief Close every idle and in-flight connection and fail all
        /// waiters with Shutdown. The pool refuses further acquisitions.
        void close_all();

        /// @brief Close idle connections unused for longer than the idle
        /// timeout or already closed by the peer.
        /// @return Number of connections closed.
        std::size_t prune_idle();

        /// @brief Run prune_idle() every idle_sweep_interval until
        /// close_all().
        void start_idle_sweep();

        /// @brief Connections counted against key's limit.
        std::size_t outstanding(PoolKey key) const;

        PoolStats stats() const;

        /// @brief Access metrics for monitoring
        PoolMetrics const& metrics() const noexcept { return metrics_; }

        ResolverCache& resolver_cache() noexcept { return resolver_cache_; }

        PoolConfiguration const& config() const noexcept { return cfg_; }

        bool closed() const noexcept {
            return closed_.load(std::memory_order_acquire);
        }

       private:
        struct IdleEntry {
            std::unique_ptr<Connection> conn;
            clock_type::time_point idle_since;
        };

        /// @brief Per-key bucket
        struct Bucket {
            std::deque<IdleEntry> idle;  ///< Idle connections, oldest first
            std::unordered_map<std::uint64_t, std::unique_ptr<Connection>>
                in_use;                ///< Loaned connections
            std::size_t connecting{0};  ///< Reserved slots being connected

            std::size_t outstanding() const noexcept {
                return idle.size() + in_use.size() + connecting;
            }
        };

        /// @brief A pending acquisition
        struct Waiter {
            enum class Status : std::uint8_t {
                Waiting,
                GrantedConnection,  ///< conn_id moved into in_use for us
                GrantedSlot,        ///< a connecting slot reserved for us
                Abandoned,          ///< timed out or cancelled
                Shutdown,
            };

            PoolKey key;
            std::shared_ptr<boost::asio::steady_timer> timer;
            Status status{Status::Waiting};
            std::uint64_t conn_id{0};
        };

        using Timers = std::vector<std::shared_ptr<boost::asio::steady_timer>>;

        Lease make_lease_(PoolKey const& key, Connection* conn);

        std::optional<Lease> take_idle_locked_(PoolKey const& key);

        /// @brief Reserve a connecting slot if limits allow, evicting an
        /// idle connection of another key when only the global limit
        /// blocks.
        bool reserve_slot_locked_(PoolKey const& key, bool fresh);

        bool has_waiter_locked_(PoolKey const& key) const;

        std::size_t total_outstanding_locked_() const;

        /// @brief Give freed capacity to the oldest waiter that can use it,
        /// trying waiters of `preferred` first.
        void grant_capacity_locked_(Timers& wake, PoolKey const* preferred);

        /// @brief Remove a waiter from the queue.
        void drop_waiter_locked_(const std::shared_ptr<Waiter>& w);

        void update_gauges_locked_();

        void release_(PoolKey const& key, std::uint64_t id,
                      bool reusable) noexcept;

        /// @brief Give back a reserved slot whose connect failed or whose
        /// waiter left.
        void release_slot_(PoolKey const& key) noexcept;

        boost::asio::awaitable<Result<std::unique_ptr<Transport>>> establish_(
            PoolKey const& key, CancellationToken token);

        static void wake_all(Timers& timers);

        static boost::asio::awaitable<void> sweep_loop_(
            ConnectionPool* self, std::shared_ptr<boost::asio::steady_timer> t,
            std::shared_ptr<Lease::State> st);

        boost::asio::any_io_executor ex_;  ///< Executor for async operations
        Dialer& dialer_;
        PoolConfiguration cfg_;  ///< Pool configuration
        ResolverCache resolver_cache_;

        mutable std::mutex mu_;  ///< Mutex for protecting internal state
        std::unordered_map<PoolKey, Bucket> buckets_;  ///< Per-key buckets
        std::list<std::shared_ptr<Waiter>> waiters_;  ///< Arrival order

        std::uint64_t next_id_{1};  ///< Next connection ID

        std::shared_ptr<Lease::State> state_;  ///< Shared pool state
        std::atomic<bool> closed_{false};      ///< Set by close_all()
        CancellationSource shutdown_;  ///< Fired by close_all()
        std::shared_ptr<boost::asio::steady_timer> sweep_timer_;
        PoolMetrics metrics_;  ///< Metrics for monitoring
    };

}  // namespace wireline
