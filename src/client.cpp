#include "wireline/client.hpp"

#include <stdexcept>

#include "wireline/deadline.hpp"
#include "wireline/log.hpp"
#include "wireline/protocol/keep_alive.hpp"
#include "wireline/protocol/parser.hpp"
#include "wireline/protocol/writer.hpp"

namespace net = boost::asio;
namespace http = boost::beast::http;

namespace wireline {

    namespace {

        bool is_stale_connection_error(const Error& e) noexcept {
            return e.code == Error::Code::SendFailed ||
                   e.code == Error::Code::ReceiveFailed ||
                   e.code == Error::Code::PeerClosed;
        }

        bool expects_body(HttpMethod m) noexcept {
            return m == HttpMethod::Post || m == HttpMethod::Put ||
                   m == HttpMethod::Patch;
        }

        const Headers& empty_headers() {
            static const Headers empty;
            return empty;
        }

    }  // namespace

    // ---- StreamedResponse ----

    StreamedResponse::StreamedResponse(ConnectionPool::Lease lease,
                                       protocol::ResponseHead head,
                                       protocol::BodyFraming framing,
                                       bool keep_alive, CodecConfiguration codec,
                                       CancellationToken token)
        : lease_(std::move(lease)),
          head_(std::move(head)),
          keep_alive_(keep_alive),
          token_(std::move(token)),
          endpoint_(lease_.key().to_string()),
          connection_id_(lease_.id()) {
        reader_ = std::make_unique<protocol::BodyReader>(*lease_, framing, codec);
        if (reader_->done()) finish_(true);
    }

    void StreamedResponse::finish_(bool ok) noexcept {
        if (released_) return;
        released_ = true;
        const bool reusable =
            ok && keep_alive_ && reader_ &&
            protocol::is_reusable(head_.status, head_.headers, head_.version,
                                  reader_->unread_remaining());
        lease_.release(reusable);
    }

    void StreamedResponse::close() noexcept {
        if (!released_ && reader_ && !reader_->done()) failed_ = true;
        finish_(false);
    }

    Headers const& StreamedResponse::trailers() const noexcept {
        return reader_ ? reader_->trailers() : empty_headers();
    }

    net::awaitable<Result<std::string>> StreamedResponse::read_some(
        std::size_t max_bytes) {
        using R = Result<std::string>;
        if (failed_) {
            co_return R::err(Error{Error::Code::ReceiveFailed,
                                   "response body was abandoned", {}, endpoint_,
                                   connection_id_});
        }
        if (done()) co_return R::ok();

        Connection* conn = lease_.get();
        if (!conn) {
            failed_ = true;
            co_return R::err(Error{Error::Code::Shutdown, "client was closed",
                                   {}, endpoint_, connection_id_});
        }

        auto cancel_reg = conn->close_on_cancel(token_);
        auto piece = co_await reader_->read_some(max_bytes);
        cancel_reg.reset();

        if (!piece) {
            Error e = std::move(piece).error();
            if (token_.cancelled()) e.code = cancel_code(token_);
            e.endpoint = endpoint_;
            e.connection_id = connection_id_;
            failed_ = true;
            finish_(false);
            co_return R::err(std::move(e));
        }
        if (reader_->done()) finish_(true);
        co_return std::move(piece);
    }

    net::awaitable<Result<std::string>> StreamedResponse::read_all(
        std::size_t limit) {
        using R = Result<std::string>;
        std::string body;
        while (!done()) {
            auto piece = co_await read_some();
            if (!piece) co_return std::move(piece);
            if (body.size() + piece.value().size() > limit) {
                close();
                co_return R::err(Error{Error::Code::BodyTooLarge,
                                       "body exceeds " + std::to_string(limit) +
                                           " bytes",
                                       {}, endpoint_, connection_id_});
            }
            body += piece.value();
        }
        if (failed_) {
            co_return R::err(Error{Error::Code::ReceiveFailed,
                                   "response body was abandoned", {}, endpoint_,
                                   connection_id_});
        }
        co_return R::ok(std::move(body));
    }

    net::awaitable<Result<void>> StreamedResponse::discard(std::uint64_t limit) {
        using R = Result<void>;
        if (failed_) {
            co_return R::err(Error{Error::Code::ReceiveFailed,
                                   "response body was abandoned", {}, endpoint_,
                                   connection_id_});
        }
        if (done()) co_return R::ok();

        Connection* conn = lease_.get();
        if (!conn) {
            failed_ = true;
            co_return R::err(Error{Error::Code::Shutdown, "client was closed",
                                   {}, endpoint_, connection_id_});
        }

        auto cancel_reg = conn->close_on_cancel(token_);
        auto drained = co_await reader_->discard(limit);
        cancel_reg.reset();

        if (!drained) {
            Error e = std::move(drained).error();
            if (token_.cancelled()) e.code = cancel_code(token_);
            e.endpoint = endpoint_;
            e.connection_id = connection_id_;
            failed_ = true;
            finish_(false);
            co_return R::err(std::move(e));
        }
        finish_(true);
        co_return R::ok();
    }

    // ---- HttpClient ----

    HttpClient::HttpClient(net::any_io_executor ex, ClientConfiguration cfg)
        : HttpClient(ex, std::move(cfg), std::make_shared<AsioDialer>(ex),
                     std::make_shared<AsioResolver>(ex)) {}

    HttpClient::HttpClient(net::any_io_executor ex, ClientConfiguration cfg,
                           std::shared_ptr<Dialer> dialer,
                           std::shared_ptr<Resolver> resolver)
        : ex_(std::move(ex)),
          cfg_(std::move(cfg)),
          dialer_(std::move(dialer)),
          resolver_(std::move(resolver)) {
        if (!dialer_ || !resolver_) {
            throw std::invalid_argument("HttpClient needs a dialer and a resolver");
        }
        if (cfg_.base_url) {
            auto base_res = url_utils::parse_base_url(*cfg_.base_url);
            if (base_res.has_error()) {
                throw std::invalid_argument("Invalid base_url: " +
                                            base_res.error().message);
            }
            base_url_ = std::move(base_res).value();
        }
        // Idle expiry is also checked on checkout; the periodic sweep is
        // opt-in through pool().start_idle_sweep().
        pool_ = std::make_unique<ConnectionPool>(ex_, *dialer_, *resolver_,
                                                 cfg_.pool);
    }

    HttpClient::~HttpClient() { close(); }

    void HttpClient::close() {
        if (pool_) pool_->close_all();
    }

    Result<UrlComponents> HttpClient::resolve_request_url(
        std::string_view url) const {
        const UrlComponents* base = base_url_ ? &*base_url_ : nullptr;
        return url_utils::resolve_url(url, base);
    }

    Result<std::string> HttpClient::prepare_head_(
        const Request& req, const UrlComponents& url,
        protocol::BodyFraming& framing) const {
        auto invalid = [](std::string msg) {
            return Result<std::string>::err(
                Error{Error::Code::InvalidRequest, std::move(msg)});
        };

        for (auto const& f : req.headers) {
            if (!protocol::is_token(protocol::to_std(f.name_string()))) {
                return invalid("invalid header name: " +
                               std::string(protocol::to_std(f.name_string())));
            }
            if (!protocol::is_field_value(protocol::to_std(f.value()))) {
                return invalid("invalid value for header " +
                               std::string(protocol::to_std(f.name_string())));
            }
        }
        if (req.body && req.body_stream) {
            return invalid("request has both a body and a body stream");
        }

        protocol::RequestHead head;
        head.method = std::string(to_string(req.method));
        head.target = url.target;
        head.headers = req.headers;

        protocol::set_default(head.headers, "Host", url.host_header());
        if (!cfg_.user_agent.empty()) {
            protocol::set_default(head.headers, "User-Agent", cfg_.user_agent);
        }
        for (auto const& [name, value] : cfg_.default_headers) {
            protocol::set_default(head.headers, name, value);
        }

        // Framing headers are always ours.
        std::optional<std::uint64_t> declared;
        if (req.body_stream) {
            auto cl = protocol::parse_content_length(req.headers);
            if (!cl) return invalid(cl.error().message);
            declared = cl.value();
        }
        head.headers.erase(http::field::content_length);
        head.headers.erase(http::field::transfer_encoding);

        if (req.body_stream) {
            if (declared) {
                framing = protocol::BodyFraming::fixed(*declared);
                head.headers.set(http::field::content_length,
                                 std::to_string(*declared));
            } else {
                framing = protocol::BodyFraming::chunked();
                head.headers.set(http::field::transfer_encoding, "chunked");
            }
        } else if (req.body) {
            framing = req.body->empty()
                          ? protocol::BodyFraming::none()
                          : protocol::BodyFraming::fixed(req.body->size());
            head.headers.set(http::field::content_length,
                             std::to_string(req.body->size()));
        } else {
            framing = protocol::BodyFraming::none();
            if (expects_body(req.method)) {
                head.headers.set(http::field::content_length, "0");
            }
        }

        return Result<std::string>::ok(protocol::serialize_head(head));
    }

    net::awaitable<Result<HttpClient::Started>> HttpClient::attempt_(
        const Request& req, const std::string& head,
        protocol::BodyFraming framing, const PoolKey& key,
        const SendOptions& opts, bool fresh, bool& replayable) {
        using R = Result<Started>;
        replayable = false;

        Deadline deadline(ex_, opts.token,
                          opts.timeout.value_or(cfg_.attempt_timeout));
        const CancellationToken token = deadline.token();

        std::uint64_t conn_id = 0;
        auto fail = [&](Error e) {
            if (token.cancelled() &&
                (e.is_network() || e.code == Error::Code::Cancelled)) {
                e.code = cancel_code(token);
            }
            if (e.endpoint.empty()) e.endpoint = key.to_string();
            if (!e.connection_id) e.connection_id = conn_id;
            if (e.code == Error::Code::Protocol) {
                log::logger()->warn("protocol error on connection #{} to {}: {}",
                                    conn_id, key.to_string(), e.message);
            }
            return R::err(std::move(e));
        };

        ConnectionPool::AcquireOptions acquire_opts;
        acquire_opts.token = token;
        acquire_opts.fresh = fresh;
        auto leased = co_await pool_->acquire(key, acquire_opts);
        if (!leased) co_return fail(std::move(leased).error());

        ConnectionPool::Lease lease = std::move(leased).value();
        Connection* conn = lease.get();
        if (!conn) co_return fail(Error{Error::Code::Shutdown, "pool destroyed"});
        conn_id = conn->id();
        conn->begin_exchange();
        auto cancel_reg = conn->close_on_cancel(token);

        std::optional<Result<protocol::WriteReport>> written;
        if (req.body_stream) {
            written.emplace(co_await protocol::write_streamed(
                *conn, head, *req.body_stream, framing));
        } else {
            const std::string_view body =
                req.body ? std::string_view(*req.body) : std::string_view{};
            written.emplace(co_await protocol::write_buffered(
                *conn, head, body, framing, cfg_.codec));
        }
        if (!*written) {
            replayable = conn->bytes_written() == 0;
            co_return fail(std::move(*written).error());
        }

        protocol::ResponseHead response;
        for (;;) {
            auto parsed = co_await protocol::read_response_head(*conn, cfg_.codec);
            if (!parsed) {
                // A keep-alive peer may close an idle connection just as
                // the request goes out (RFC 7230 section 6.3.1).
                replayable = conn->reused() && conn->bytes_read() == 0 &&
                             is_idempotent(req.method) && req.replayable();
                co_return fail(std::move(parsed).error());
            }
            response = std::move(parsed).value();
            // Interim responses precede the final one; 101 is final.
            if (response.status >= 200 || response.status == 101) break;
        }

        auto body_framing = protocol::response_framing(
            response, to_string(req.method));
        if (!body_framing) co_return fail(std::move(body_framing).error());

        const bool keep_alive =
            protocol::should_keep_alive(11, req.headers) &&
            body_framing.value().kind != protocol::BodyFraming::Kind::UntilClose;
        if (!protocol::should_keep_alive(response.version, response.headers) ||
            body_framing.value().kind == protocol::BodyFraming::Kind::UntilClose) {
            conn->set_peer_will_close(true);
        }
        conn->set_state(ConnectionState::Draining);
        cancel_reg.reset();

        co_return R::ok(Started{std::move(lease), std::move(response),
                                body_framing.value(), keep_alive});
    }

    net::awaitable<Result<HttpClient::Started>> HttpClient::start_(
        const Request& req, const SendOptions& opts) {
        using R = Result<Started>;

        auto url = resolve_request_url(req.url);
        if (!url) co_return std::move(url).forward_error<Started>();

        protocol::BodyFraming framing;
        auto head = prepare_head_(req, url.value(), framing);
        if (!head) co_return std::move(head).forward_error<Started>();

        const PoolKey key = pool_key_from_url(url.value(), cfg_.verify_tls);

        bool replayable = false;
        auto first = co_await attempt_(req, head.value(), framing, key, opts,
                                       false, replayable);
        if (first || !replayable || opts.token.cancelled() ||
            !is_stale_connection_error(first.error())) {
            co_return std::move(first);
        }

        log::logger()->info("retrying {} {} on a fresh connection: {}",
                            to_string(req.method), key.to_string(),
                            describe(first.error()));
        co_return co_await attempt_(req, head.value(), framing, key, opts, true,
                                    replayable);
    }

    net::awaitable<Result<Response>> HttpClient::exchange_(Request& req,
                                                           SendOptions opts) {
        using R = Result<Response>;

        auto started = co_await start_(req, opts);
        if (!started) co_return std::move(started).forward_error<Response>();
        Started st = std::move(started).value();

        Connection& conn = *st.lease;
        const std::string endpoint = st.lease.key().to_string();

        // The body drain is outside the attempt deadline but still
        // honours the caller's token.
        protocol::BodyReader reader(conn, st.framing, cfg_.codec);
        auto cancel_reg = conn.close_on_cancel(opts.token);
        auto body = co_await reader.read_all(cfg_.max_body_bytes);
        cancel_reg.reset();

        if (!body) {
            Error e = std::move(body).error();
            if (opts.token.cancelled() && e.code != Error::Code::BodyTooLarge) {
                e.code = cancel_code(opts.token);
            }
            e.endpoint = endpoint;
            e.connection_id = conn.id();
            st.lease.release(false);
            co_return R::err(std::move(e));
        }

        Response out;
        out.status_code = static_cast<int>(st.head.status);
        out.reason = std::move(st.head.reason);
        out.version = st.head.version;
        out.body = std::move(body).value();
        out.trailers = reader.trailers();

        const bool reusable =
            st.keep_alive &&
            protocol::is_reusable(st.head.status, st.head.headers,
                                  st.head.version, reader.unread_remaining());
        out.headers = std::move(st.head.headers);
        st.lease.release(reusable);

        co_return R::ok(std::move(out));
    }

    net::awaitable<Result<Response>> HttpClient::send(Request request,
                                                      SendOptions opts) {
        // Middleware see absolute URLs whatever the base URL is.
        auto url = resolve_request_url(request.url);
        if (!url) co_return std::move(url).forward_error<Response>();
        request.url = absolute_url(url.value());

        Next terminal = [this, opts](Request& r) { return exchange_(r, opts); };
        Next chain = make_chain(cfg_.middlewares, std::move(terminal));
        co_return co_await chain(request);
    }

    net::awaitable<Result<StreamedResponse>> HttpClient::stream(
        Request request, SendOptions opts) {
        using R = Result<StreamedResponse>;
        auto started = co_await start_(request, opts);
        if (!started) co_return std::move(started).forward_error<StreamedResponse>();
        Started st = std::move(started).value();
        co_return R::ok(StreamedResponse(std::move(st.lease), std::move(st.head),
                                         st.framing, st.keep_alive, cfg_.codec,
                                         opts.token));
    }

    net::awaitable<Result<Response>> HttpClient::get(std::string url,
                                                     SendOptions opts) {
        Request r;
        r.method = HttpMethod::Get;
        r.url = std::move(url);
        co_return co_await send(std::move(r), std::move(opts));
    }

    net::awaitable<Result<Response>> HttpClient::head(std::string url,
                                                      SendOptions opts) {
        Request r;
        r.method = HttpMethod::Head;
        r.url = std::move(url);
        co_return co_await send(std::move(r), std::move(opts));
    }

    net::awaitable<Result<Response>> HttpClient::post(std::string url,
                                                      std::string body,
                                                      SendOptions opts) {
        Request r;
        r.method = HttpMethod::Post;
        r.url = std::move(url);
        r.body = std::move(body);
        co_return co_await send(std::move(r), std::move(opts));
    }

    net::awaitable<Result<Response>> HttpClient::put(std::string url,
                                                     std::string body,
                                                     SendOptions opts) {
        Request r;
        r.method = HttpMethod::Put;
        r.url = std::move(url);
        r.body = std::move(body);
        co_return co_await send(std::move(r), std::move(opts));
    }

    net::awaitable<Result<Response>> HttpClient::del(std::string url,
                                                     SendOptions opts) {
        Request r;
        r.method = HttpMethod::Delete;
        r.url = std::move(url);
        co_return co_await send(std::move(r), std::move(opts));
    }

}  // namespace wireline
