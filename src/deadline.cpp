#include "wireline/deadline.hpp"

namespace wireline {

    Deadline::Deadline(boost::asio::any_io_executor ex,
                       const CancellationToken& parent,
                       clock_type::duration timeout)
        : source_(std::make_shared<CancellationSource>(parent)), timer_(ex) {
        if (timeout == clock_type::duration::max()) return;

        armed_ = true;
        timer_.expires_after(timeout);
        timer_.async_wait([src = source_](boost::system::error_code ec) {
            if (!ec) src->cancel(CancelReason::Timeout);
        });
    }

    Deadline::~Deadline() {
        if (armed_) timer_.cancel();
    }

}  // namespace wireline
