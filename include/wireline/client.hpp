#pragma once

#include <utility>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "wireline/cancellation.hpp"
#include "wireline/config.hpp"
#include "wireline/connection/connection_pool.hpp"
#include "wireline/connection/resolver_cache.hpp"
#include "wireline/middleware.hpp"
#include "wireline/protocol/body_reader.hpp"
#include "wireline/protocol/framing.hpp"
#include "wireline/request.hpp"
#include "wireline/response.hpp"
#include "wireline/result.hpp"
#include "wireline/transport/dialer.hpp"
#include "wireline/url.hpp"

namespace wireline {

    /// @brief Per-call options for HttpClient::send() and stream().
    struct SendOptions {
        /// Overrides ClientConfiguration::attempt_timeout.
        std::optional<std::chrono::milliseconds> timeout;
        /// Cancels the call, including the body drain.
        CancellationToken token{};
    };

    /**
     * @brief A response whose head has been parsed and whose body is read
     * on demand.
     *
     * Owns the connection lease until the body is fully read (the
     * connection then goes back to the pool when reusable) or until the
     * object is closed or destroyed (the connection is then closed).
     */
    class StreamedResponse {
       public:
        StreamedResponse(StreamedResponse&&) = default;
        StreamedResponse& operator=(StreamedResponse&&) = default;
        StreamedResponse(StreamedResponse const&) = delete;
        StreamedResponse& operator=(StreamedResponse const&) = delete;

        ~StreamedResponse() { close(); }

        int status_code() const noexcept { return static_cast<int>(head_.status); }
        std::string const& reason() const noexcept { return head_.reason; }
        unsigned version() const noexcept { return head_.version; }
        Headers const& headers() const noexcept { return head_.headers; }

        std::optional<std::string> header(std::string_view name) const {
            return protocol::header_value(head_.headers, name);
        }

        /// @brief Next piece of the body; an empty string once complete.
        boost::asio::awaitable<Result<std::string>> read_some(
            std::size_t max_bytes = 64 * 1024);

        /// @brief Read the remaining body, failing with BodyTooLarge past
        /// limit.
        boost::asio::awaitable<Result<std::string>> read_all(std::size_t limit);

        /// @brief Read and drop the rest of the body so the connection can
        /// go back to the pool.
        /// @param limit Most bytes to drop; past it the connection is
        /// closed and BodyTooLarge is returned.
        /// @return Success once the connection was released.
        boost::asio::awaitable<Result<void>> discard(
            std::uint64_t limit = protocol::kUnknownRemaining);

        bool done() const noexcept {
            return !reader_ || released_ || reader_->done();
        }

        /// @brief Trailer fields; complete once done().
        Headers const& trailers() const noexcept;

        /// @brief Abandon the rest of the body and close the connection.
        void close() noexcept;

       private:
        friend class HttpClient;

        StreamedResponse(ConnectionPool::Lease lease, protocol::ResponseHead head,
                         protocol::BodyFraming framing, bool keep_alive,
                         CodecConfiguration codec, CancellationToken token);

        void finish_(bool ok) noexcept;

        ConnectionPool::Lease lease_;
        protocol::ResponseHead head_;
        std::unique_ptr<protocol::BodyReader> reader_;
        bool keep_alive_{false};
        bool released_{false};
        bool failed_{false};
        CancellationToken token_;
        std::string endpoint_;
        std::uint64_t connection_id_{0};
    };

    /**
     * @brief An asynchronous HTTP/1.1 client using C++20 coroutines.
     *
     * Each call runs the configured middleware chain and then one exchange
     * on a pooled connection. Concurrent calls never share a connection.
     */
    class HttpClient {
       public:
        /**
         * @brief Constructs an HttpClient on real sockets.
         * @param ex The executor for all asynchronous operations.
         * @param cfg Client, pool and codec configuration.
         * @throws std::invalid_argument if cfg.base_url is malformed.
         */
        HttpClient(boost::asio::any_io_executor ex, ClientConfiguration cfg);

        /// @brief Constructs an HttpClient over the given capabilities.
        HttpClient(boost::asio::any_io_executor ex, ClientConfiguration cfg,
                   std::shared_ptr<Dialer> dialer,
                   std::shared_ptr<Resolver> resolver);

        ~HttpClient();

        HttpClient(HttpClient const&) = delete;
        HttpClient& operator=(HttpClient const&) = delete;

        /**
         * @brief Sends a request through the middleware chain and buffers
         * the response body.
         */
        boost::asio::awaitable<Result<Response>> send(Request request,
                                                      SendOptions opts = {});

        /**
         * @brief Sends a request and returns once the response head is
         * parsed.
         * @note Bypasses the middleware chain: middleware observe buffered
         * responses only.
         */
        boost::asio::awaitable<Result<StreamedResponse>> stream(
            Request request, SendOptions opts = {});

        boost::asio::awaitable<Result<Response>> get(std::string url,
                                                     SendOptions opts = {});

        boost::asio::awaitable<Result<Response>> head(std::string url,
                                                      SendOptions opts = {});

        boost::asio::awaitable<Result<Response>> post(std::string url,
                                                      std::string body,
                                                      SendOptions opts = {});

        boost::asio::awaitable<Result<Response>> put(std::string url,
                                                     std::string body,
                                                     SendOptions opts = {});

        boost::asio::awaitable<Result<Response>> del(std::string url,
                                                     SendOptions opts = {});

        /// @brief Shut the pool down; pending and later calls fail with
        /// Shutdown.
        void close();

        ConnectionPool& pool() noexcept { return *pool_; }

        [[nodiscard]] ClientConfiguration const& config() const noexcept {
            return cfg_;
        }

       private:
        /// @brief An exchange whose response head has been read.
        struct Started {
            ConnectionPool::Lease lease;
            protocol::ResponseHead head;
            protocol::BodyFraming framing;
            bool keep_alive{false};
        };

        Result<UrlComponents> resolve_request_url(std::string_view url) const;

        /// @brief Serialize the request head and pick the body framing.
        Result<std::string> prepare_head_(const Request& req,
                                          const UrlComponents& url,
                                          protocol::BodyFraming& framing) const;

        boost::asio::awaitable<Result<Response>> exchange_(Request& req,
                                                           SendOptions opts);

        /// @brief Acquire, send and read the head, retrying once on a
        /// fresh connection when the first one turned out to be stale.
        boost::asio::awaitable<Result<Started>> start_(const Request& req,
                                                       const SendOptions& opts);

        /// @param replayable Set when a failure may be retried: nothing
        /// was written, or a reused connection was closed before any
        /// response byte arrived and the request is idempotent.
        boost::asio::awaitable<Result<Started>> attempt_(
            const Request& req, const std::string& head,
            protocol::BodyFraming framing, const PoolKey& key,
            const SendOptions& opts, bool fresh, bool& replayable);

        boost::asio::any_io_executor ex_;
        ClientConfiguration cfg_;
        std::optional<UrlComponents> base_url_;

        std::shared_ptr<Dialer> dialer_;
        std::shared_ptr<Resolver> resolver_;
        std::unique_ptr<ConnectionPool> pool_;
    };

}  // namespace wireline
