#pragma once

#include <utility>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/steady_timer.hpp>
#include <chrono>
#include <memory>

#include "wireline/cancellation.hpp"

namespace wireline {

    /**
     * @brief A cancellation source linked to a parent token that also fires
     * with CancelReason::Timeout when a timer expires.
     *
     * Destroying the Deadline disarms the timer. A duration of
     * steady_clock::duration::max() means "no deadline".
     */
    class Deadline {
       public:
        using clock_type = std::chrono::steady_clock;

        Deadline(boost::asio::any_io_executor ex,
                 const CancellationToken& parent,
                 clock_type::duration timeout);

        ~Deadline();

        Deadline(Deadline const&) = delete;
        Deadline& operator=(Deadline const&) = delete;

        CancellationToken token() const { return source_->token(); }

        bool expired() const noexcept {
            return source_->reason() == CancelReason::Timeout;
        }

        void cancel(CancelReason reason = CancelReason::Requested) {
            source_->cancel(reason);
        }

       private:
        std::shared_ptr<CancellationSource> source_;
        boost::asio::steady_timer timer_;
        bool armed_{false};
    };

}  // namespace wireline
