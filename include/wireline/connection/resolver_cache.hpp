#pragma once

#include <atomic>
#include <utility>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/steady_timer.hpp>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "wireline/cancellation.hpp"
#include "wireline/result.hpp"

namespace wireline {

    using AddressList = std::vector<boost::asio::ip::tcp::endpoint>;

    /// @brief Name lookup capability: host + port -> ordered addresses.
    class Resolver {
       public:
        virtual ~Resolver() = default;

        /// @note When token fires the lookup should finish promptly; its
        /// outcome is discarded.
        virtual boost::asio::awaitable<Result<AddressList>> resolve(
            const std::string& host, const std::string& port,
            CancellationToken token) = 0;
    };

    /// @brief Resolver backed by boost::asio::ip::tcp::resolver.
    class AsioResolver : public Resolver {
       public:
        explicit AsioResolver(boost::asio::any_io_executor ex)
            : m_ex(std::move(ex)) {}

        boost::asio::awaitable<Result<AddressList>> resolve(
            const std::string& host, const std::string& port,
            CancellationToken token) override;

       private:
        boost::asio::any_io_executor m_ex;
    };

    /**
     * @brief Memoizes lookups for a TTL and coalesces concurrent misses.
     *
     * SAFETY:
     * - Thread-safe; the mutex is never held across a suspension point.
     *
     * INVARIANTS:
     * - At most one underlying lookup per (host, port) is in flight.
     * - Failed lookups are never cached.
     * - A caller whose token fires returns at once; the lookup keeps
     *   running while other callers wait on it and is cancelled when the
     *   last one leaves.
     *
     * The Resolver must outlive the cache; lookups still in flight when
     * the cache is destroyed are cancelled.
     */
    class ResolverCache {
       public:
        using clock_type = std::chrono::steady_clock;

        ResolverCache(boost::asio::any_io_executor ex, Resolver& resolver,
                      std::chrono::milliseconds ttl)
            : ex_(std::move(ex)), resolver_(resolver), ttl_(ttl) {}

        ~ResolverCache();

        ResolverCache(ResolverCache const&) = delete;
        ResolverCache& operator=(ResolverCache const&) = delete;

        /// @brief Cached or fresh addresses for host:port.
        /// @note Literal IP addresses are returned without a lookup.
        /// @return Timeout, Cancelled or Shutdown (per the token's reason)
        /// when token fires first.
        boost::asio::awaitable<Result<AddressList>> resolve(
            const std::string& host, const std::string& port,
            CancellationToken token = {});

        /// @brief Drop every cached entry.
        void clear();

        /// @brief Number of cached (possibly expired) entries.
        std::size_t size() const;

        /// @brief Underlying lookups performed so far.
        std::uint64_t lookups() const noexcept {
            return lookups_.load(std::memory_order_relaxed);
        }

       private:
        struct Entry {
            AddressList addresses;
            clock_type::time_point expires;
        };

        /// @brief A lookup in flight; every caller parks on a timer.
        /// Shared with the detached lookup, which touches nothing else.
        struct Pending {
            std::mutex mu;
            std::vector<std::shared_ptr<boost::asio::steady_timer>> waiters;
            std::optional<Result<AddressList>> outcome;
            /// Callers still waiting; guarded by the cache mutex.
            std::size_t callers{0};
            CancellationSource lookup_cancel;
        };

        static boost::asio::awaitable<void> run_lookup_(
            Resolver& resolver, std::shared_ptr<Pending> pending,
            std::string host, std::string port);

        boost::asio::any_io_executor ex_;
        Resolver& resolver_;
        std::chrono::milliseconds ttl_;

        mutable std::mutex mu_;
        std::unordered_map<std::string, Entry> cache_;
        std::unordered_map<std::string, std::shared_ptr<Pending>> inflight_;
        std::atomic<std::uint64_t> lookups_{0};
    };

    /// @brief Reorder addresses so families alternate, starting with the
    /// family of the first address (RFC 8305 section 4).
    AddressList interleave_address_families(const AddressList& addresses);

}  // namespace wireline
