#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>

namespace wireline {

    /// @brief Metrics for monitoring connection pool behavior
    struct PoolMetrics {
        // Gauges (current state)
        std::atomic<std::size_t> total_in_use{0};  ///< Currently leased out
        std::atomic<std::size_t> total_idle{0};    ///< Currently idle
        std::atomic<std::size_t> connecting{0};    ///< Slots being connected
        std::atomic<std::size_t> waiters_total{
            0};  ///< Currently waiting for a connection

        // Counters (cumulative)
        std::atomic<std::uint64_t> acquire_success{0};  ///< Successful acquires
        std::atomic<std::uint64_t> acquire_timeout{0};  ///< Acquire timed out
        std::atomic<std::uint64_t> acquire_cancelled{0};  ///< Caller cancelled
        std::atomic<std::uint64_t> acquire_shutdown{0};   ///< Pool shut down
        std::atomic<std::uint64_t> connect_failed{0};  ///< Establishment failed
        std::atomic<std::uint64_t> connection_created{0};  ///< New connections
        std::atomic<std::uint64_t> connection_reused{0};   ///< Reused idle
        std::atomic<std::uint64_t> connection_pruned{0};   ///< Pruned idle
        std::atomic<std::uint64_t> connection_evicted{
            0};  ///< Idle closed to make room for another key
        std::atomic<std::uint64_t> connection_retired{
            0};  ///< Closed on release (not reusable)
        std::atomic<std::uint64_t> handoff_connection{
            0};  ///< Released connection passed straight to a waiter
        std::atomic<std::uint64_t> handoff_slot{
            0};  ///< Freed capacity passed straight to a waiter

        std::atomic<std::uint64_t> release_invalid_id{
            0};  ///< Released unknown connection
    };

    /// @brief Point-in-time view of pool accounting.
    struct PoolStats {
        std::size_t in_use{0};
        std::size_t idle{0};
        std::size_t connecting{0};
        std::size_t waiters{0};

        /// @brief Connections counted against the global limit.
        std::size_t outstanding() const noexcept {
            return in_use + idle + connecting;
        }
    };

}  // namespace wireline
