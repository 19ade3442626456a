#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>

#include "wireline/error.hpp"

namespace wireline {

    /// @brief Why a cancellation token fired.
    enum class CancelReason : std::uint8_t {
        None,       ///< Not cancelled
        Requested,  ///< Caller asked for cancellation
        Timeout,    ///< A deadline owned by the library expired
        Shutdown,   ///< The owning pool or client is shutting down
    };

    namespace detail {
        struct CancelState;
    }

    /**
     * @brief Read side of a cooperative cancellation signal.
     *
     * Operations that can suspend (pool waits, connects, reads, writes)
     * take a token and register a callback that aborts the pending I/O.
     * A default constructed token is never cancelled.
     *
     * Callbacks run on the thread that calls CancellationSource::cancel().
     */
    class CancellationToken {
       public:
        /// @brief RAII handle for a registered callback.
        class Registration {
           public:
            Registration() = default;
            Registration(Registration&& other) noexcept;
            Registration& operator=(Registration&& other) noexcept;
            Registration(Registration const&) = delete;
            Registration& operator=(Registration const&) = delete;
            ~Registration() { reset(); }

            /// @brief Deregister the callback. Safe to call repeatedly.
            void reset() noexcept;

           private:
            friend class CancellationToken;
            Registration(std::weak_ptr<detail::CancelState> st,
                         std::uint64_t id)
                : state_(std::move(st)), id_(id) {}

            std::weak_ptr<detail::CancelState> state_;
            std::uint64_t id_{0};
        };

        CancellationToken() = default;

        bool cancelled() const noexcept;

        CancelReason reason() const noexcept;

        /// @brief Whether this token can ever fire.
        bool can_be_cancelled() const noexcept { return state_ != nullptr; }

        /// @brief Register fn to run when the token fires.
        /// @note If the token already fired, fn runs immediately and the
        /// returned registration is empty.
        [[nodiscard]] Registration on_cancel(std::function<void()> fn) const;

       private:
        friend class CancellationSource;
        explicit CancellationToken(std::shared_ptr<detail::CancelState> st)
            : state_(std::move(st)) {}

        std::shared_ptr<detail::CancelState> state_;
    };

    /**
     * @brief Write side of a cancellation signal.
     *
     * A source may be linked to a parent token; cancelling the parent
     * cancels the source with the parent's reason.
     */
    class CancellationSource {
       public:
        CancellationSource();
        explicit CancellationSource(const CancellationToken& parent);

        CancellationSource(CancellationSource const&) = delete;
        CancellationSource& operator=(CancellationSource const&) = delete;

        CancellationToken token() const { return CancellationToken(state_); }

        /// @brief Fire the token. Only the first reason is kept.
        void cancel(CancelReason reason = CancelReason::Requested);

        bool cancelled() const noexcept;

        CancelReason reason() const noexcept;

       private:
        static void fire(const std::shared_ptr<detail::CancelState>& st,
                         CancelReason reason);

        std::shared_ptr<detail::CancelState> state_;
        CancellationToken::Registration parent_link_;
    };

    /// @brief Map a cancelled token to the matching error code.
    inline Error::Code cancel_code(const CancellationToken& token) noexcept {
        return token.reason() == CancelReason::Timeout
                   ? Error::Code::Timeout
                   : (token.reason() == CancelReason::Shutdown
                          ? Error::Code::Shutdown
                          : Error::Code::Cancelled);
    }

    namespace detail {
        struct CancelState {
            mutable std::mutex mu;
            CancelReason reason{CancelReason::None};
            std::uint64_t next_id{1};
            std::map<std::uint64_t, std::function<void()>> callbacks;
        };
    }  // namespace detail

}  // namespace wireline
