#pragma once

#include <utility>

#include <boost/asio/awaitable.hpp>
#include <chrono>
#include <memory>

#include "wireline/cancellation.hpp"
#include "wireline/connection/resolver_cache.hpp"
#include "wireline/result.hpp"
#include "wireline/transport/dialer.hpp"

namespace wireline {

    /**
     * @brief Race connection attempts over candidate addresses.
     *
     * The first candidate is tried at once; each further candidate starts
     * after `delay`, or immediately when every running attempt has failed.
     * The first attempt to connect wins and the others are cancelled (a
     * late success is closed). When all fail, the error of the last failure
     * is returned with Error::Code::Connect.
     *
     * @note Attempts run as coroutines spawned on the caller's executor and
     * only share state through a reference-counted block, so the caller may
     * return before cancelled losers finish. The dialer must outlive them.
     */
    boost::asio::awaitable<Result<std::unique_ptr<Transport>>> race_connect(
        Dialer& dialer, const AddressList& candidates,
        std::chrono::milliseconds delay, CancellationToken token);

}  // namespace wireline
