#include "wireline/middleware.hpp"

namespace wireline {

    Next make_chain(const std::vector<std::shared_ptr<Middleware>>& middlewares,
                    Next terminal) {
        Next chain = std::move(terminal);
        // Wrap from the innermost outwards so the first configured runs
        // first.
        for (auto it = middlewares.rbegin(); it != middlewares.rend(); ++it) {
            std::shared_ptr<Middleware> mw = *it;
            if (!mw) continue;
            chain = [mw, inner = std::move(chain)](Request& req) {
                return mw->handle(req, inner);
            };
        }
        return chain;
    }

    boost::asio::awaitable<Result<Response>> BearerAuthMiddleware::handle(
        Request& req, Next next) {
        if (!req.header("Authorization")) {
            req.set_header("Authorization", "Bearer " + token_);
        }
        co_return co_await next(req);
    }

}  // namespace wireline
