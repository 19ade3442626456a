#pragma once

#include <utility>

#include <boost/asio/awaitable.hpp>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "wireline/request.hpp"
#include "wireline/response.hpp"
#include "wireline/result.hpp"

namespace wireline {

    /// @brief Continuation of the chain: the next middleware, or the
    /// request pipeline itself for the innermost one.
    using Next =
        std::function<boost::asio::awaitable<Result<Response>>(Request&)>;

    /**
     * @brief Interceptor around every exchange.
     *
     * A middleware may modify the request, call `next` zero or more times
     * (short-circuiting or retrying), and inspect or replace the response.
     * Middleware run in configuration order: the first configured is the
     * outermost.
     */
    class Middleware {
       public:
        virtual ~Middleware() = default;

        virtual boost::asio::awaitable<Result<Response>> handle(Request& req,
                                                                Next next) = 0;
    };

    /// @brief Compose middlewares around terminal, outermost first.
    Next make_chain(const std::vector<std::shared_ptr<Middleware>>& middlewares,
                    Next terminal);

    /**
     * @brief Adds `Authorization: Bearer <token>` unless the request sets
     * its own Authorization header.
     */
    class BearerAuthMiddleware : public Middleware {
       public:
        explicit BearerAuthMiddleware(std::string token)
            : token_(std::move(token)) {}

        boost::asio::awaitable<Result<Response>> handle(Request& req,
                                                        Next next) override;

       private:
        std::string token_;
    };

}  // namespace wireline
