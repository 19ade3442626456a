#include "wireline/connection/resolver_cache.hpp"

#include <algorithm>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/ip/address.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <charconv>
#include <deque>

#include "wireline/log.hpp"

namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace wireline {

    net::awaitable<Result<AddressList>> AsioResolver::resolve(
        const std::string& host, const std::string& port,
        CancellationToken token) {
        auto resolver = std::make_shared<tcp::resolver>(m_ex);
        auto abort = token.on_cancel([resolver] {
            net::post(resolver->get_executor(), [resolver] { resolver->cancel(); });
        });
        boost::system::error_code ec;
        auto results = co_await resolver->async_resolve(
            host, port, net::redirect_error(net::use_awaitable, ec));
        if (ec) {
            co_return Result<AddressList>::err(
                Error{Error::Code::Resolution,
                      "failed to resolve " + host + ": " + ec.message(), ec,
                      host + ":" + port});
        }
        AddressList out;
        for (auto const& r : results) out.push_back(r.endpoint());
        co_return Result<AddressList>::ok(std::move(out));
    }

    AddressList interleave_address_families(const AddressList& addresses) {
        if (addresses.size() < 2) return addresses;
        std::deque<tcp::endpoint> first;
        std::deque<tcp::endpoint> second;
        const bool lead_v6 = addresses.front().address().is_v6();
        for (auto const& a : addresses) {
            if (a.address().is_v6() == lead_v6) {
                first.push_back(a);
            } else {
                second.push_back(a);
            }
        }
        AddressList out;
        out.reserve(addresses.size());
        while (!first.empty() || !second.empty()) {
            if (!first.empty()) {
                out.push_back(first.front());
                first.pop_front();
            }
            if (!second.empty()) {
                out.push_back(second.front());
                second.pop_front();
            }
        }
        return out;
    }

    net::awaitable<Result<AddressList>> ResolverCache::resolve(
        const std::string& host, const std::string& port,
        CancellationToken token) {
        // Literal addresses need no lookup and are not cached.
        {
            boost::system::error_code ec;
            auto addr = net::ip::make_address(host, ec);
            if (!ec) {
                unsigned short p = 0;
                auto [end, perr] =
                    std::from_chars(port.data(), port.data() + port.size(), p);
                if (perr != std::errc{} || end != port.data() + port.size()) {
                    co_return Result<AddressList>::err(
                        Error{Error::Code::Resolution, "invalid port " + port,
                              {}, host + ":" + port});
                }
                co_return Result<AddressList>::ok(
                    AddressList{tcp::endpoint(addr, p)});
            }
        }

        if (token.cancelled()) {
            co_return Result<AddressList>::err(
                Error{cancel_code(token), "resolution cancelled", {},
                      host + ":" + port});
        }

        const std::string key = host + ":" + port;
        auto ex = co_await net::this_coro::executor;
        std::shared_ptr<Pending> pending;
        bool start_lookup = false;
        std::optional<Result<AddressList>> outcome;
        auto my_timer = std::make_shared<net::steady_timer>(
            ex, net::steady_timer::time_point::max());
        {
            std::lock_guard<std::mutex> lk(mu_);
            auto hit = cache_.find(key);
            if (hit != cache_.end()) {
                if (clock_type::now() < hit->second.expires) {
                    co_return Result<AddressList>::ok(hit->second.addresses);
                }
                cache_.erase(hit);
            }

            auto in = inflight_.find(key);
            if (in != inflight_.end()) {
                pending = in->second;
            } else {
                pending = std::make_shared<Pending>();
                inflight_.emplace(key, pending);
                start_lookup = true;
                lookups_.fetch_add(1, std::memory_order_relaxed);
            }
            ++pending->callers;
            std::lock_guard<std::mutex> plk(pending->mu);
            if (pending->outcome) {
                outcome = pending->outcome;
            } else {
                pending->waiters.push_back(my_timer);
            }
        }

        if (start_lookup) {
            net::co_spawn(ex_, run_lookup_(resolver_, pending, host, port),
                          [](std::exception_ptr e) {
                              log::report_exception(e, "name resolution");
                          });
        }

        if (!outcome) {
            auto wake = token.on_cancel([t = my_timer] {
                net::post(t->get_executor(), [t] { t->cancel(); });
            });
            for (;;) {
                {
                    std::lock_guard<std::mutex> plk(pending->mu);
                    if (pending->outcome) {
                        outcome = pending->outcome;
                        break;
                    }
                }
                if (token.cancelled()) break;
                boost::system::error_code ec;
                co_await my_timer->async_wait(
                    net::redirect_error(net::use_awaitable, ec));
            }
        }

        bool abandon_lookup = false;
        {
            std::lock_guard<std::mutex> lk(mu_);
            --pending->callers;
            auto in = inflight_.find(key);
            const bool current = in != inflight_.end() && in->second == pending;
            if (outcome) {
                if (current) {
                    inflight_.erase(in);
                    if (*outcome && ttl_.count() > 0) {
                        cache_[key] =
                            Entry{outcome->value(), clock_type::now() + ttl_};
                    }
                }
            } else {
                {
                    std::lock_guard<std::mutex> plk(pending->mu);
                    auto& w = pending->waiters;
                    w.erase(std::remove(w.begin(), w.end(), my_timer), w.end());
                }
                if (pending->callers == 0 && current) {
                    inflight_.erase(in);
                    abandon_lookup = true;
                }
            }
        }

        if (outcome) co_return std::move(*outcome);

        if (abandon_lookup) {
            log::logger()->debug("resolution of {} abandoned", key);
            pending->lookup_cancel.cancel(token.reason());
        }
        co_return Result<AddressList>::err(
            Error{cancel_code(token),
                  token.reason() == CancelReason::Timeout
                      ? "timed out resolving " + key
                      : "resolution of " + key + " cancelled",
                  {}, key});
    }

    net::awaitable<void> ResolverCache::run_lookup_(
        Resolver& resolver, std::shared_ptr<Pending> pending, std::string host,
        std::string port) {
        auto result =
            co_await resolver.resolve(host, port, pending->lookup_cancel.token());
        if (result && result.value().empty()) {
            result = Result<AddressList>::err(
                Error{Error::Code::Resolution, "no addresses for " + host, {},
                      host + ":" + port});
        }
        if (!result && !pending->lookup_cancel.cancelled()) {
            log::logger()->debug("resolution of {}:{} failed: {}", host, port,
                                 result.error().message);
        }

        std::vector<std::shared_ptr<net::steady_timer>> to_wake;
        {
            std::lock_guard<std::mutex> lk(pending->mu);
            pending->outcome = std::move(result);
            to_wake.swap(pending->waiters);
        }
        for (auto& t : to_wake) t->cancel();
    }

    ResolverCache::~ResolverCache() {
        std::unordered_map<std::string, std::shared_ptr<Pending>> inflight;
        {
            std::lock_guard<std::mutex> lk(mu_);
            inflight.swap(inflight_);
        }
        for (auto& [key, pending] : inflight) {
            pending->lookup_cancel.cancel(CancelReason::Shutdown);
        }
    }

    void ResolverCache::clear() {
        std::lock_guard<std::mutex> lk(mu_);
        cache_.clear();
    }

    std::size_t ResolverCache::size() const {
        std::lock_guard<std::mutex> lk(mu_);
        return cache_.size();
    }

}  // namespace wireline
