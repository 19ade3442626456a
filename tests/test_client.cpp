#include <gtest/gtest.h>

#include <boost/asio/error.hpp>
#include <boost/asio/io_context.hpp>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "support/test_support.hpp"
#include "wireline/auth/digest_auth.hpp"
#include "wireline/client.hpp"
#include "wireline/protocol/writer.hpp"
#include "wireline/server/server.hpp"

using namespace wireline;
using namespace std::chrono_literals;
using wireline::testing::auth_param;
using wireline::testing::ep;
using wireline::testing::FakeDialer;
using wireline::testing::FakeResolver;
using wireline::testing::Wire;

namespace {

    namespace net = boost::asio;
    using tcp = net::ip::tcp;

    constexpr const char* kHi = "HTTP/1.1 200 OK\r\nContent-Length: 2\r\n\r\nhi";

    /// A client over the in-memory network; every connection answers kHi
    /// unless the test installs another responder.
    class ClientTest : public ::testing::Test {
       protected:
        ClientTest()
            : dialer_(std::make_shared<FakeDialer>()),
              resolver_(std::make_shared<FakeResolver>()) {
            resolver_->hosts["svc.test"] = {ep("10.0.0.1")};
            dialer_->on_connect = [this](Wire& w, const tcp::endpoint&) {
                wireline::testing::respond_always(w, response_);
            };
        }

        void TearDown() override {
            if (client_) client_->close();
            wireline::testing::settle(io_);
        }

        HttpClient& make_client(ClientConfiguration cfg = {}) {
            client_ = std::make_unique<HttpClient>(io_.get_executor(),
                                                   std::move(cfg), dialer_,
                                                   resolver_);
            return *client_;
        }

        Result<Response> get(std::string url, SendOptions opts = {}) {
            return wireline::testing::run(io_, client_->get(std::move(url), opts));
        }

        Result<Response> send(Request req, SendOptions opts = {}) {
            return wireline::testing::run(io_, client_->send(std::move(req), opts));
        }

        net::io_context io_;
        std::shared_ptr<FakeDialer> dialer_;
        std::shared_ptr<FakeResolver> resolver_;
        std::string response_{kHi};
        std::unique_ptr<HttpClient> client_;
    };

    TEST_F(ClientTest, GetSendsRequestHeadAndReadsBody) {
        make_client();
        auto r = get("http://svc.test/path?q=1");
        ASSERT_TRUE(r.has_value()) << describe(r.error());
        EXPECT_EQ(r.value().status_code, 200);
        EXPECT_EQ(r.value().reason, "OK");
        EXPECT_EQ(r.value().body, "hi");

        ASSERT_EQ(dialer_->wires.size(), 1u);
        const std::string sent = dialer_->wires[0]->written();
        EXPECT_EQ(sent.rfind("GET /path?q=1 HTTP/1.1\r\n", 0), 0u);
        EXPECT_NE(sent.find("Host: svc.test\r\n"), std::string::npos);
        EXPECT_NE(sent.find("User-Agent: wireline/1.0\r\n"), std::string::npos);
        EXPECT_EQ(sent.find("Content-Length"), std::string::npos);
    }

    TEST_F(ClientTest, SequentialRequestsShareOneConnection) {
        auto& client = make_client();
        for (int i = 0; i < 3; ++i) {
            auto r = get("http://svc.test/");
            ASSERT_TRUE(r.has_value()) << describe(r.error());
        }
        EXPECT_EQ(dialer_->connects(), 1);
        EXPECT_EQ(client.pool().metrics().connection_created.load(), 1u);
        EXPECT_EQ(client.pool().stats().idle, 1u);
    }

    TEST_F(ClientTest, BaseUrlJoinsRelativeTargets) {
        ClientConfiguration cfg;
        cfg.base_url = "http://svc.test/api/";
        make_client(cfg);
        ASSERT_TRUE(get("items/7"));
        EXPECT_EQ(dialer_->wires[0]->written().rfind("GET /api/items/7 HTTP/1.1\r\n", 0),
                  0u);
    }

    TEST_F(ClientTest, RelativeUrlWithoutBaseIsInvalid) {
        make_client();
        auto r = get("items");
        ASSERT_TRUE(r.has_error());
        EXPECT_EQ(r.error().code, Error::Code::InvalidUrl);
        EXPECT_EQ(dialer_->connects(), 0);
    }

    TEST_F(ClientTest, MalformedBaseUrlThrows) {
        ClientConfiguration cfg;
        cfg.base_url = "ftp://svc.test";
        EXPECT_THROW(make_client(cfg), std::invalid_argument);
    }

    TEST_F(ClientTest, DefaultHeadersDoNotOverrideRequestHeaders) {
        ClientConfiguration cfg;
        cfg.default_headers = {{"Accept", "text/plain"}, {"X-Team", "core"}};
        make_client(cfg);
        Request req;
        req.url = "http://svc.test/";
        req.set_header("Accept", "application/json");
        ASSERT_TRUE(send(req));
        const std::string sent = dialer_->wires[0]->written();
        EXPECT_NE(sent.find("Accept: application/json\r\n"), std::string::npos);
        EXPECT_EQ(sent.find("text/plain"), std::string::npos);
        EXPECT_NE(sent.find("X-Team: core\r\n"), std::string::npos);
    }

    TEST_F(ClientTest, PostFramesBodyWithContentLength) {
        make_client();
        auto r = wireline::testing::run(
            io_, client_->post("http://svc.test/items", "{\"a\":1}"));
        ASSERT_TRUE(r.has_value());
        const std::string sent = dialer_->wires[0]->written();
        EXPECT_EQ(sent.rfind("POST /items HTTP/1.1\r\n", 0), 0u);
        EXPECT_NE(sent.find("Content-Length: 7\r\n\r\n{\"a\":1}"), std::string::npos);
        // Head and small body leave in one write.
        EXPECT_EQ(dialer_->wires[0]->writes.size(), 1u);
    }

    TEST_F(ClientTest, BodyAndBodyStreamTogetherAreRejected) {
        make_client();
        Request req;
        req.method = HttpMethod::Post;
        req.url = "http://svc.test/";
        req.body = "x";
        req.body_stream = std::make_shared<protocol::ChunkListSource>(
            std::vector<std::string>{"y"});
        auto r = send(req);
        ASSERT_TRUE(r.has_error());
        EXPECT_EQ(r.error().code, Error::Code::InvalidRequest);
    }

    TEST_F(ClientTest, HeadResponseBodyIsNotRead) {
        response_ = "HTTP/1.1 200 OK\r\nContent-Length: 100\r\n\r\n";
        auto& client = make_client();
        auto r = wireline::testing::run(io_, client.head("http://svc.test/"));
        ASSERT_TRUE(r.has_value()) << describe(r.error());
        EXPECT_EQ(r.value().body, "");
        EXPECT_EQ(r.value().header("Content-Length"), std::optional<std::string>("100"));
        EXPECT_EQ(client.pool().stats().idle, 1u);
    }

    TEST_F(ClientTest, ConnectionCloseResponseIsNotPooled) {
        response_ = "HTTP/1.1 200 OK\r\nContent-Length: 2\r\nConnection: close\r\n\r\nhi";
        auto& client = make_client();
        ASSERT_TRUE(get("http://svc.test/"));
        EXPECT_EQ(client.pool().stats().idle, 0u);
        EXPECT_FALSE(dialer_->wires[0]->open);
        ASSERT_TRUE(get("http://svc.test/"));
        EXPECT_EQ(dialer_->connects(), 2);
    }

    TEST_F(ClientTest, InterimResponsesAreSkipped) {
        response_ =
            "HTTP/1.1 100 Continue\r\n\r\n"
            "HTTP/1.1 103 Early Hints\r\nLink: </s.css>\r\n\r\n"
            "HTTP/1.1 201 Created\r\nContent-Length: 0\r\n\r\n";
        make_client();
        auto r = get("http://svc.test/");
        ASSERT_TRUE(r.has_value()) << describe(r.error());
        EXPECT_EQ(r.value().status_code, 201);
    }

    TEST_F(ClientTest, ChunkedResponseWithTrailers) {
        response_ =
            "HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\n"
            "5\r\nhello\r\n6\r\n world\r\n0\r\nX-Checksum: 42\r\n\r\n";
        auto& client = make_client();
        auto r = get("http://svc.test/");
        ASSERT_TRUE(r.has_value()) << describe(r.error());
        EXPECT_EQ(r.value().body, "hello world");
        EXPECT_EQ(protocol::header_value(r.value().trailers, "X-Checksum"),
                  std::optional<std::string>("42"));
        EXPECT_EQ(client.pool().stats().idle, 1u);
    }

    TEST_F(ClientTest, OversizedResponseBodyFails) {
        response_ = "HTTP/1.1 200 OK\r\nContent-Length: 10\r\n\r\n0123456789";
        ClientConfiguration cfg;
        cfg.max_body_bytes = 4;
        auto& client = make_client(cfg);
        auto r = get("http://svc.test/");
        ASSERT_TRUE(r.has_error());
        EXPECT_EQ(r.error().code, Error::Code::BodyTooLarge);
        EXPECT_EQ(client.pool().stats().idle, 0u);
    }

    TEST_F(ClientTest, StaleIdleConnectionIsRetriedOnce) {
        auto& client = make_client();
        ASSERT_TRUE(get("http://svc.test/"));
        ASSERT_EQ(client.pool().stats().idle, 1u);

        // The peer dropped the idle connection: nothing can be written.
        dialer_->wires[0]->write_error = net::error::broken_pipe;
        auto r = get("http://svc.test/");
        ASSERT_TRUE(r.has_value()) << describe(r.error());
        EXPECT_EQ(r.value().body, "hi");
        EXPECT_EQ(dialer_->connects(), 2);
        EXPECT_FALSE(dialer_->wires[0]->open);
    }

    TEST_F(ClientTest, NoRetryOnceRequestBytesWereSent) {
        make_client();
        dialer_->on_connect = [](Wire& w, const tcp::endpoint&) {
            // Reads the request, then hangs up without answering.
            w.on_write = [](Wire& wire) { wire.finish(); };
        };
        auto r = get("http://svc.test/");
        ASSERT_TRUE(r.has_error());
        EXPECT_EQ(r.error().code, Error::Code::PeerClosed);
        EXPECT_EQ(dialer_->connects(), 1);
        EXPECT_EQ(r.error().connection_id, 1u);
        EXPECT_FALSE(r.error().endpoint.empty());
    }

    TEST_F(ClientTest, SecondStaleFailureIsReturned) {
        make_client();
        dialer_->on_connect = [](Wire& w, const tcp::endpoint&) {
            w.write_error = net::error::connection_reset;
        };
        auto r = get("http://svc.test/");
        ASSERT_TRUE(r.has_error());
        EXPECT_EQ(r.error().code, Error::Code::SendFailed);
        EXPECT_EQ(dialer_->connects(), 2);
    }

    TEST_F(ClientTest, AttemptTimeoutIsTimeoutError) {
        make_client();
        dialer_->on_connect = [](Wire&, const tcp::endpoint&) {};
        SendOptions opts;
        opts.timeout = 50ms;
        const auto start = std::chrono::steady_clock::now();
        auto r = get("http://svc.test/", opts);
        ASSERT_TRUE(r.has_error());
        EXPECT_EQ(r.error().code, Error::Code::Timeout);
        EXPECT_LT(std::chrono::steady_clock::now() - start, 2s);
        EXPECT_FALSE(dialer_->wires[0]->open);
    }

    TEST_F(ClientTest, CallerCancellationIsCancelledError) {
        auto& client = make_client();
        dialer_->on_connect = [](Wire&, const tcp::endpoint&) {};
        CancellationSource cancel;
        SendOptions opts;
        opts.token = cancel.token();
        auto pending = wireline::testing::spawn(io_, client.get("http://svc.test/", opts));
        wireline::testing::settle(io_);
        EXPECT_FALSE(pending->done());

        cancel.cancel();
        ASSERT_TRUE(wireline::testing::drive_until(io_, [&] { return pending->done(); }));
        ASSERT_TRUE(pending->value->has_error());
        EXPECT_EQ(pending->value->error().code, Error::Code::Cancelled);
        EXPECT_EQ(dialer_->connects(), 1);
    }

    TEST_F(ClientTest, SlowResolutionHonoursAttemptTimeout) {
        resolver_->latency = 2000ms;
        ClientConfiguration cfg;
        cfg.attempt_timeout = 100ms;
        make_client(cfg);
        const auto start = std::chrono::steady_clock::now();
        auto r = get("http://svc.test/");
        ASSERT_TRUE(r.has_error());
        EXPECT_EQ(r.error().code, Error::Code::Timeout);
        EXPECT_LT(std::chrono::steady_clock::now() - start, 1s);
        EXPECT_EQ(dialer_->connects(), 0);

        // Nobody waits for the lookup any more, so it is abandoned.
        wireline::testing::settle(io_);
        EXPECT_EQ(resolver_->lookups, 1);
        EXPECT_EQ(resolver_->aborted, 1);
    }

    TEST_F(ClientTest, CancelDuringResolutionIsCancelled) {
        resolver_->latency = 2000ms;
        auto& client = make_client();
        CancellationSource cancel;
        SendOptions opts;
        opts.token = cancel.token();
        auto pending = wireline::testing::spawn(io_, client.get("http://svc.test/", opts));
        wireline::testing::settle(io_, 50ms);
        ASSERT_FALSE(pending->done());

        const auto start = std::chrono::steady_clock::now();
        cancel.cancel();
        ASSERT_TRUE(wireline::testing::drive_until(
            io_, [&] { return pending->done(); }, 1000ms));
        EXPECT_LT(std::chrono::steady_clock::now() - start, 500ms);
        ASSERT_TRUE(pending->value->has_error());
        EXPECT_EQ(pending->value->error().code, Error::Code::Cancelled);
        EXPECT_EQ(dialer_->connects(), 0);
    }

    TEST_F(ClientTest, CloseDuringResolutionFailsPromptly) {
        resolver_->latency = 2000ms;
        auto& client = make_client();
        auto pending = wireline::testing::spawn(io_, client.get("http://svc.test/"));
        wireline::testing::settle(io_, 50ms);
        ASSERT_FALSE(pending->done());

        client.close();
        ASSERT_TRUE(wireline::testing::drive_until(
            io_, [&] { return pending->done(); }, 1000ms));
        ASSERT_TRUE(pending->value->has_error());
        EXPECT_EQ(pending->value->error().code, Error::Code::Shutdown);
    }

    TEST_F(ClientTest, IdleConnectionClosedByPeerIsNotReused) {
        auto& client = make_client();
        ASSERT_TRUE(get("http://svc.test/a"));
        ASSERT_EQ(client.pool().stats().idle, 1u);

        // Keep-alive timeout on the server: FIN while idle.
        dialer_->wires[0]->finish();
        auto r = get("http://svc.test/b");
        ASSERT_TRUE(r.has_value()) << describe(r.error());
        EXPECT_EQ(r.value().body, "hi");
        EXPECT_EQ(dialer_->connects(), 2);
        EXPECT_EQ(dialer_->wires[0]->writes.size(), 1u);
    }

    TEST_F(ClientTest, ReusedConnectionClosedBeforeResponseRetriesIdempotentRequest) {
        auto& client = make_client();
        ASSERT_TRUE(get("http://svc.test/"));

        // The peer reads the next request and hangs up without answering.
        dialer_->wires[0]->on_write = [](Wire& w) { w.finish(); };
        auto r = get("http://svc.test/");
        ASSERT_TRUE(r.has_value()) << describe(r.error());
        EXPECT_EQ(r.value().body, "hi");
        EXPECT_EQ(dialer_->connects(), 2);
        EXPECT_EQ(dialer_->wires[0]->writes.size(), 2u);
        EXPECT_EQ(client.pool().metrics().connection_created.load(), 2u);
    }

    TEST_F(ClientTest, ReusedConnectionClosedBeforeResponseFailsPost) {
        make_client();
        ASSERT_TRUE(get("http://svc.test/"));

        dialer_->wires[0]->on_write = [](Wire& w) {
            if (wireline::testing::wrote_request_head(w)) w.finish();
        };
        auto r = wireline::testing::run(io_, client_->post("http://svc.test/", "x"));
        ASSERT_TRUE(r.has_error());
        EXPECT_EQ(r.error().code, Error::Code::PeerClosed);
        EXPECT_EQ(dialer_->connects(), 1);
    }

    TEST_F(ClientTest, ConflictingResponseFramingRetiresConnection) {
        auto& client = make_client();
        dialer_->on_connect = [this](Wire& w, const tcp::endpoint&) {
            if (dialer_->connects() == 0) {
                wireline::testing::respond_always(
                    w,
                    "HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n"
                    "Content-Length: 2\r\n\r\n2\r\nhi\r\n0\r\n\r\n");
            } else {
                wireline::testing::respond_always(w, kHi);
            }
        };

        auto bad = get("http://svc.test/");
        ASSERT_TRUE(bad.has_error());
        EXPECT_EQ(bad.error().code, Error::Code::Protocol);
        EXPECT_FALSE(dialer_->wires[0]->open);
        EXPECT_EQ(client.pool().stats().idle, 0u);

        auto next = get("http://svc.test/");
        ASSERT_TRUE(next.has_value()) << describe(next.error());
        EXPECT_EQ(next.value().body, "hi");
        EXPECT_EQ(client.pool().metrics().connection_retired.load(), 1u);
        EXPECT_EQ(client.pool().metrics().connection_created.load(), 2u);
    }

    TEST_F(ClientTest, StreamReadsBodyOnDemand) {
        response_ =
            "HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\n"
            "5\r\nhello\r\n0\r\nX-Done: yes\r\n\r\n";
        auto& client = make_client();
        Request req;
        req.url = "http://svc.test/feed";
        auto started = wireline::testing::run(io_, client.stream(req));
        ASSERT_TRUE(started.has_value()) << describe(started.error());
        StreamedResponse res = std::move(started).value();
        EXPECT_EQ(res.status_code(), 200);
        EXPECT_FALSE(res.done());
        EXPECT_EQ(client.pool().stats().in_use, 1u);

        auto body = wireline::testing::run(io_, res.read_all(1024));
        ASSERT_TRUE(body.has_value()) << describe(body.error());
        EXPECT_EQ(body.value(), "hello");
        EXPECT_TRUE(res.done());
        EXPECT_EQ(protocol::header_value(res.trailers(), "X-Done"),
                  std::optional<std::string>("yes"));
        EXPECT_EQ(client.pool().stats().idle, 1u);
    }

    TEST_F(ClientTest, AbandonedStreamClosesConnection) {
        response_ = "HTTP/1.1 200 OK\r\nContent-Length: 10\r\n\r\n01234";
        auto& client = make_client();
        Request req;
        req.url = "http://svc.test/";
        {
            auto started = wireline::testing::run(io_, client.stream(req));
            ASSERT_TRUE(started.has_value());
        }
        EXPECT_EQ(client.pool().stats().outstanding(), 0u);
        EXPECT_FALSE(dialer_->wires[0]->open);
    }

    TEST_F(ClientTest, DiscardedStreamReturnsConnectionToPool) {
        response_ = "HTTP/1.1 200 OK\r\nContent-Length: 10\r\n\r\n0123456789";
        auto& client = make_client();
        Request req;
        req.url = "http://svc.test/";
        auto started = wireline::testing::run(io_, client.stream(req));
        ASSERT_TRUE(started.has_value()) << describe(started.error());
        StreamedResponse res = std::move(started).value();

        auto dropped = wireline::testing::run(io_, res.discard());
        ASSERT_TRUE(dropped.has_value()) << describe(dropped.error());
        EXPECT_TRUE(res.done());
        EXPECT_EQ(client.pool().stats().idle, 1u);

        ASSERT_TRUE(get("http://svc.test/"));
        EXPECT_EQ(dialer_->connects(), 1);
        EXPECT_EQ(client.pool().metrics().connection_reused.load(), 1u);
    }

    TEST_F(ClientTest, DiscardPastLimitClosesConnection) {
        response_ = "HTTP/1.1 200 OK\r\nContent-Length: 10\r\n\r\n0123456789";
        auto& client = make_client();
        Request req;
        req.url = "http://svc.test/";
        auto started = wireline::testing::run(io_, client.stream(req));
        ASSERT_TRUE(started.has_value()) << describe(started.error());
        StreamedResponse res = std::move(started).value();

        auto dropped = wireline::testing::run(io_, res.discard(4));
        ASSERT_TRUE(dropped.has_error());
        EXPECT_EQ(dropped.error().code, Error::Code::BodyTooLarge);
        EXPECT_EQ(client.pool().stats().outstanding(), 0u);
        EXPECT_FALSE(dialer_->wires[0]->open);
    }

    /// Records the order it runs in and the URL it sees.
    class Recorder : public Middleware {
       public:
        Recorder(std::string name, std::vector<std::string>& log)
            : name_(std::move(name)), log_(log) {}

        net::awaitable<Result<Response>> handle(Request& req, Next next) override {
            log_.push_back(name_ + " " + req.url);
            req.set_header("X-Seen-By", name_);
            co_return co_await next(req);
        }

       private:
        std::string name_;
        std::vector<std::string>& log_;
    };

    /// Answers without touching the network.
    class ShortCircuit : public Middleware {
       public:
        net::awaitable<Result<Response>> handle(Request&, Next) override {
            Response res;
            res.status_code = 418;
            co_return Result<Response>::ok(std::move(res));
        }
    };

    TEST_F(ClientTest, MiddlewareRunOutermostFirstWithAbsoluteUrls) {
        std::vector<std::string> log;
        ClientConfiguration cfg;
        cfg.base_url = "http://svc.test/v1";
        cfg.middlewares = {std::make_shared<Recorder>("outer", log),
                           std::make_shared<Recorder>("inner", log)};
        make_client(cfg);
        ASSERT_TRUE(get("ping"));
        EXPECT_EQ(log, (std::vector<std::string>{"outer http://svc.test/v1/ping",
                                                 "inner http://svc.test/v1/ping"}));
        // The innermost write wins.
        EXPECT_NE(dialer_->wires[0]->written().find("X-Seen-By: inner\r\n"),
                  std::string::npos);
    }

    TEST_F(ClientTest, MiddlewareCanShortCircuit) {
        ClientConfiguration cfg;
        cfg.middlewares = {std::make_shared<ShortCircuit>()};
        make_client(cfg);
        auto r = get("http://svc.test/");
        ASSERT_TRUE(r.has_value());
        EXPECT_EQ(r.value().status_code, 418);
        EXPECT_EQ(dialer_->connects(), 0);
    }

    TEST_F(ClientTest, ClosedClientFailsWithShutdown) {
        auto& client = make_client();
        client.close();
        auto r = get("http://svc.test/");
        ASSERT_TRUE(r.has_error());
        EXPECT_EQ(r.error().code, Error::Code::Shutdown);
    }

    TEST_F(ClientTest, UnknownHostIsResolutionError) {
        make_client();
        auto r = get("http://nowhere.test/");
        ASSERT_TRUE(r.has_error());
        EXPECT_EQ(r.error().code, Error::Code::Resolution);
        EXPECT_TRUE(r.error().is_network());
    }

    // ---- against a live server ----

    class ClientServerTest : public ::testing::Test {
       protected:
        void start(Handler handler, ServerConfiguration cfg = {}) {
            server_ = std::make_unique<Server>(io_.get_executor(), std::move(handler),
                                               std::move(cfg));
            auto listening = server_->listen({net::ip::make_address("127.0.0.1"), 0});
            ASSERT_TRUE(listening.has_value()) << describe(listening.error());
            base_ = "http://127.0.0.1:" +
                    std::to_string(server_->local_endpoint().port());
        }

        void TearDown() override {
            if (client_) client_->close();
            if (server_) server_->stop();
            wireline::testing::settle(io_, 50ms);
        }

        HttpClient& make_client(ClientConfiguration cfg = {}) {
            cfg.base_url = base_;
            client_ = std::make_unique<HttpClient>(io_.get_executor(), std::move(cfg));
            return *client_;
        }

        net::io_context io_;
        std::unique_ptr<Server> server_;
        std::unique_ptr<HttpClient> client_;
        std::string base_;
    };

    Handler echo_request() {
        return [](IncomingRequest& req) -> net::awaitable<Response> {
            Response res;
            res.body = req.method + " " + req.target + " " + req.body;
            res.set_header("X-Framing",
                           req.header("Transfer-Encoding").value_or("length"));
            co_return res;
        };
    }

    TEST_F(ClientServerTest, RoundTripsReuseOneConnection) {
        start(echo_request());
        auto& client = make_client();

        auto first = wireline::testing::run(io_, client.get("/hello"));
        ASSERT_TRUE(first.has_value()) << describe(first.error());
        EXPECT_EQ(first.value().body, "GET /hello ");
        EXPECT_EQ(first.value().header("Server"), std::optional<std::string>("wireline"));

        auto second = wireline::testing::run(io_, client.put("/item", "data"));
        ASSERT_TRUE(second.has_value()) << describe(second.error());
        EXPECT_EQ(second.value().body, "PUT /item data");

        EXPECT_EQ(client.pool().metrics().connection_created.load(), 1u);
        EXPECT_EQ(server_->requests_served(), 2u);
    }

    TEST_F(ClientServerTest, ConnectionTimedOutByServerIsReplaced) {
        ServerConfiguration server_cfg;
        server_cfg.keep_alive_timeout = 100ms;
        start(echo_request(), server_cfg);
        auto& client = make_client();

        auto first = wireline::testing::run(io_, client.get("/a"));
        ASSERT_TRUE(first.has_value()) << describe(first.error());
        EXPECT_EQ(client.pool().stats().idle, 1u);

        // The server closes the idle connection meanwhile.
        wireline::testing::settle(io_, 400ms);

        auto second = wireline::testing::run(io_, client.get("/b"));
        ASSERT_TRUE(second.has_value()) << describe(second.error());
        EXPECT_EQ(second.value().body, "GET /b ");
        EXPECT_EQ(client.pool().metrics().connection_created.load(), 2u);
        EXPECT_EQ(server_->requests_served(), 2u);
    }

    TEST_F(ClientServerTest, StreamedRequestBodyIsChunked) {
        start(echo_request());
        auto& client = make_client();

        Request req;
        req.method = HttpMethod::Post;
        req.url = "/upload";
        req.body_stream = std::make_shared<protocol::ChunkListSource>(
            std::vector<std::string>{"hello ", "", "world"});
        auto r = wireline::testing::run(io_, client.send(req));
        ASSERT_TRUE(r.has_value()) << describe(r.error());
        EXPECT_EQ(r.value().body, "POST /upload hello world");
        EXPECT_EQ(r.value().header("X-Framing"), std::optional<std::string>("chunked"));
    }

    TEST_F(ClientServerTest, StreamedResponseFromServer) {
        start([](IncomingRequest&) -> net::awaitable<Response> {
            Response res;
            res.body_stream = std::make_shared<protocol::ChunkListSource>(
                std::vector<std::string>{"a", "bc", "def"});
            co_return res;
        });
        auto& client = make_client();

        Request req;
        req.url = "/s";
        auto started = wireline::testing::run(io_, client.stream(req));
        ASSERT_TRUE(started.has_value()) << describe(started.error());
        StreamedResponse res = std::move(started).value();
        std::string body;
        while (!res.done()) {
            auto piece = wireline::testing::run(io_, res.read_some());
            ASSERT_TRUE(piece.has_value()) << describe(piece.error());
            body += piece.value();
        }
        EXPECT_EQ(body, "abcdef");
    }

    TEST_F(ClientServerTest, DigestAuthenticationEndToEnd) {
        int hits = 0;
        std::vector<std::string> nonce_counts;
        start([&](IncomingRequest& req) -> net::awaitable<Response> {
            ++hits;
            DigestChallenge ch;
            ch.realm = "wireline-test";
            ch.nonce = "server-nonce";
            ch.algorithm = DigestAlgorithm::Sha256;
            ch.qop_options = {"auth"};

            Response res;
            bool authorized = false;
            if (auto auth = req.header("Authorization")) {
                DigestInput in;
                in.username = "alice";
                in.password = "s3cret";
                in.method = req.method;
                in.uri = auth_param(*auth, "uri");
                in.qop = auth_param(*auth, "qop");
                in.cnonce = auth_param(*auth, "cnonce");
                in.nonce_count = static_cast<std::uint32_t>(
                    std::stoul(auth_param(*auth, "nc"), nullptr, 16));
                in.body = req.body;
                auto expected = compute_digest_response(ch, in);
                authorized = expected && in.uri == req.target &&
                             auth_param(*auth, "response") == expected.value();
                nonce_counts.push_back(auth_param(*auth, "nc"));
            }
            if (!authorized) {
                res.status_code = 401;
                res.set_header("WWW-Authenticate",
                               "Digest realm=\"wireline-test\", qop=\"auth\", "
                               "algorithm=SHA-256, nonce=\"server-nonce\"");
                co_return res;
            }
            res.body = "granted";
            co_return res;
        });

        ClientConfiguration cfg;
        cfg.middlewares = {std::make_shared<DigestAuthMiddleware>("alice", "s3cret")};
        auto& client = make_client(cfg);

        auto first = wireline::testing::run(io_, client.get("/private?x=1"));
        ASSERT_TRUE(first.has_value()) << describe(first.error());
        EXPECT_EQ(first.value().status_code, 200);
        EXPECT_EQ(first.value().body, "granted");
        EXPECT_EQ(hits, 2);

        auto second = wireline::testing::run(io_, client.get("/private?x=2"));
        ASSERT_TRUE(second.has_value());
        EXPECT_EQ(second.value().status_code, 200);
        EXPECT_EQ(hits, 3);
        EXPECT_EQ(nonce_counts, (std::vector<std::string>{"00000001", "00000002"}));
        EXPECT_EQ(client.pool().metrics().connection_created.load(), 1u);
    }

    TEST_F(ClientServerTest, WrongPasswordSurfaces401) {
        start([](IncomingRequest&) -> net::awaitable<Response> {
            Response res;
            res.status_code = 401;
            res.set_header("WWW-Authenticate",
                           "Digest realm=\"r\", qop=\"auth\", nonce=\"n\"");
            co_return res;
        });
        ClientConfiguration cfg;
        cfg.middlewares = {std::make_shared<DigestAuthMiddleware>("bob", "nope")};
        auto& client = make_client(cfg);

        auto r = wireline::testing::run(io_, client.get("/"));
        ASSERT_TRUE(r.has_value());
        EXPECT_EQ(r.value().status_code, 401);
        EXPECT_EQ(server_->requests_served(), 2u);
    }

    TEST_F(ClientServerTest, ConnectionRefusedIsConnectError) {
        // Grab a free port, then close it again.
        std::string url;
        {
            tcp::acceptor spare(io_, {net::ip::make_address("127.0.0.1"), 0});
            url = "http://127.0.0.1:" + std::to_string(spare.local_endpoint().port()) +
                  "/";
        }
        ClientConfiguration cfg;
        client_ = std::make_unique<HttpClient>(io_.get_executor(), cfg);
        auto r = wireline::testing::run(io_, client_->get(url));
        ASSERT_TRUE(r.has_error());
        EXPECT_EQ(r.error().code, Error::Code::Connect);
    }

}  // namespace
