#pragma once

#include <utility>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "wireline/cancellation.hpp"
#include "wireline/config.hpp"
#include "wireline/protocol/message.hpp"
#include "wireline/response.hpp"
#include "wireline/result.hpp"
#include "wireline/transport/transport.hpp"

namespace wireline {

    /// @brief A parsed inbound request, body fully read.
    struct IncomingRequest {
        std::string method;
        std::string target;
        unsigned version{11};
        Headers headers;
        std::string body;
        Headers trailers;
        /// Peer address as "ip:port".
        std::string remote;

        std::optional<std::string> header(std::string_view name) const {
            return protocol::header_value(headers, name);
        }
    };

    /// @brief Application callback producing the response for one request.
    /// An escaping exception is answered with 500.
    using Handler = std::function<boost::asio::awaitable<Response>(IncomingRequest&)>;

    /**
     * @brief HTTP/1.1 server loop: accepts connections and answers requests
     * on each one while keep-alive holds.
     *
     * Coroutines spawned by the server keep its shared state alive, so the
     * Server object may be destroyed while connections wind down.
     */
    class Server {
       public:
        Server(boost::asio::any_io_executor ex, Handler handler,
               ServerConfiguration cfg = {});

        ~Server();

        Server(Server const&) = delete;
        Server& operator=(Server const&) = delete;

        /**
         * @brief Bind, listen and start accepting on endpoint.
         * @note Port 0 picks an ephemeral port; see local_endpoint().
         */
        Result<void> listen(const boost::asio::ip::tcp::endpoint& endpoint);

        boost::asio::ip::tcp::endpoint local_endpoint() const;

        /// @brief Stop accepting and close idle keep-alive connections.
        /// Requests already being handled complete, then their connections
        /// close.
        void stop();

        /// @brief Run the request loop on an already accepted transport
        /// (e.g. after a TLS handshake done by the caller).
        boost::asio::awaitable<void> serve(std::unique_ptr<Transport> transport);

        /// @brief Connections currently being served.
        std::size_t active_connections() const;

        /// @brief Requests answered since construction.
        std::uint64_t requests_served() const noexcept;

       private:
        struct State {
            boost::asio::any_io_executor ex;
            Handler handler;
            ServerConfiguration cfg;
            std::optional<boost::asio::ip::tcp::acceptor> acceptor;
            std::atomic<bool> stopped{false};
            CancellationSource shutdown;

            std::atomic<std::uint64_t> next_id{1};
            std::atomic<std::size_t> active{0};
            std::atomic<std::uint64_t> served{0};
        };

        static boost::asio::awaitable<void> accept_loop_(std::shared_ptr<State> st);

        static boost::asio::awaitable<void> serve_(
            std::shared_ptr<State> st, std::unique_ptr<Transport> transport);

        std::shared_ptr<State> state_;
    };

}  // namespace wireline
