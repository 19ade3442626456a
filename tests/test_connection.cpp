#include <gtest/gtest.h>

#include <boost/asio/buffer.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/io_context.hpp>
#include <memory>
#include <string>
#include <unordered_set>

#include "support/test_support.hpp"
#include "wireline/cancellation.hpp"
#include "wireline/connection/connection.hpp"
#include "wireline/pool_key.hpp"
#include "wireline/url.hpp"

using namespace wireline;
using wireline::testing::ScriptedTransport;
using wireline::testing::Wire;

namespace {

    namespace net = boost::asio;

    TEST(PoolKeyTest, ClearResetsFields) {
        PoolKey key{true, "example.com", "443", false};
        key.clear();
        EXPECT_EQ(key.host, "");
        EXPECT_EQ(key.port, "");
        EXPECT_FALSE(key.https);
        EXPECT_TRUE(key.verify_tls);
    }

    TEST(PoolKeyTest, NormalizeFillsDefaultsAndLowercases) {
        PoolKey plain{false, "Example.COM", "", false};
        plain.normalize();
        EXPECT_EQ(plain.host, "example.com");
        EXPECT_EQ(plain.port, "80");
        // Verification is meaningless without TLS.
        EXPECT_TRUE(plain.verify_tls);

        PoolKey tls{true, "", "", false};
        tls.normalize();
        EXPECT_EQ(tls.host, "localhost");
        EXPECT_EQ(tls.port, "443");
        EXPECT_FALSE(tls.verify_tls);
    }

    TEST(PoolKeyTest, EqualityCoversEveryField) {
        const PoolKey base{true, "h", "443", true};
        EXPECT_EQ(base, (PoolKey{true, "h", "443", true}));
        EXPECT_NE(base, (PoolKey{false, "h", "443", true}));
        EXPECT_NE(base, (PoolKey{true, "g", "443", true}));
        EXPECT_NE(base, (PoolKey{true, "h", "8443", true}));
        EXPECT_NE(base, (PoolKey{true, "h", "443", false}));

        std::unordered_set<PoolKey> keys{base, PoolKey{true, "h", "443", false}};
        EXPECT_EQ(keys.size(), 2u);
        EXPECT_EQ(keys.count(PoolKey{true, "h", "443", true}), 1u);
    }

    TEST(PoolKeyTest, ToStringNamesSchemeAndVerification) {
        EXPECT_EQ((PoolKey{false, "h", "80", true}).to_string(), "http://h:80");
        EXPECT_EQ((PoolKey{true, "h", "443", false}).to_string(),
                  "https://h:443+noverify");
        EXPECT_EQ((PoolKey{false, "::1", "8080", true}).to_string(),
                  "http://[::1]:8080");
    }

    TEST(PoolKeyTest, FromUrl) {
        auto url = parse_url("https://API.example.com/v1");
        ASSERT_TRUE(url.has_value());
        PoolKey key = pool_key_from_url(url.value(), false);
        EXPECT_TRUE(key.https);
        EXPECT_EQ(key.host, "api.example.com");
        EXPECT_EQ(key.port, "443");
        EXPECT_FALSE(key.verify_tls);
    }

    TEST(ConnectionTest, ExchangeCountersAndState) {
        auto wire = std::make_shared<Wire>();
        Connection conn(7, PoolKey{}, std::make_unique<ScriptedTransport>(wire));
        EXPECT_EQ(conn.id(), 7u);
        EXPECT_EQ(conn.state(), ConnectionState::Active);
        EXPECT_EQ(conn.exchanges(), 0u);

        conn.begin_exchange();
        EXPECT_FALSE(conn.reused());
        conn.set_peer_will_close(true);
        conn.set_state(ConnectionState::Idle);
        conn.begin_exchange();
        EXPECT_TRUE(conn.reused());
        EXPECT_FALSE(conn.peer_will_close());
        EXPECT_EQ(conn.state(), ConnectionState::Active);
        EXPECT_STREQ(to_string(conn.state()), "Active");
    }

    TEST(ConnectionTest, ClosedIsTerminal) {
        auto wire = std::make_shared<Wire>();
        Connection conn(1, PoolKey{}, std::make_unique<ScriptedTransport>(wire));
        conn.close();
        EXPECT_FALSE(conn.is_open());
        EXPECT_FALSE(wire->open);
        conn.set_state(ConnectionState::Idle);
        conn.begin_exchange();
        EXPECT_EQ(conn.state(), ConnectionState::Closed);
    }

    TEST(ConnectionTest, WriteCountsBytesAndFillBuffers) {
        net::io_context io;
        auto wire = std::make_shared<Wire>();
        wire->push("HTTP/1.1 200 OK\r\n");
        Connection conn(1, PoolKey{}, std::make_unique<ScriptedTransport>(wire));
        conn.begin_exchange();

        auto io_round = [&]() -> net::awaitable<std::size_t> {
            boost::system::error_code ec;
            const std::string out = "GET / HTTP/1.1\r\n\r\n";
            const wireline::Transport::ConstBuffers bufs{net::buffer(out)};
            co_await conn.write(bufs, ec);
            EXPECT_FALSE(ec);
            const std::size_t n = co_await conn.fill(ec);
            EXPECT_FALSE(ec);
            co_return n;
        };
        const std::size_t filled = wireline::testing::run(io, io_round());
        EXPECT_EQ(filled, 17u);
        EXPECT_EQ(conn.buffer().size(), 17u);
        EXPECT_EQ(conn.bytes_written(), 18u);
        EXPECT_EQ(conn.bytes_read(), 17u);
        EXPECT_EQ(wire->written(), "GET / HTTP/1.1\r\n\r\n");

        conn.begin_exchange();
        EXPECT_EQ(conn.bytes_written(), 0u);
        EXPECT_EQ(conn.bytes_read(), 0u);
    }

    TEST(ConnectionTest, PeerClosedSeesFinWithoutConsumingData) {
        auto wire = std::make_shared<Wire>();
        Connection conn(1, PoolKey{}, std::make_unique<ScriptedTransport>(wire));
        EXPECT_FALSE(conn.transport().peer_closed());

        wire->push("late");
        wire->finish();
        EXPECT_FALSE(conn.transport().peer_closed());
        EXPECT_EQ(wire->inbound.size(), 1u);

        wire->inbound.clear();
        EXPECT_TRUE(conn.transport().peer_closed());
    }

    TEST(ConnectionTest, FillReportsEndOfStream) {
        net::io_context io;
        auto wire = std::make_shared<Wire>();
        wire->finish();
        Connection conn(1, PoolKey{}, std::make_unique<ScriptedTransport>(wire));

        auto read = [&]() -> net::awaitable<bool> {
            boost::system::error_code ec;
            const std::size_t n = co_await conn.fill(ec);
            co_return n == 0 && ec == net::error::eof;
        };
        EXPECT_TRUE(wireline::testing::run(io, read()));
    }

    TEST(ConnectionTest, CloseOnCancelAbortsPendingRead) {
        net::io_context io;
        auto wire = std::make_shared<Wire>();
        Connection conn(1, PoolKey{}, std::make_unique<ScriptedTransport>(wire));
        CancellationSource cancel;
        auto reg = conn.close_on_cancel(cancel.token());

        auto read = [&]() -> net::awaitable<bool> {
            boost::system::error_code ec;
            co_await conn.fill(ec);
            co_return static_cast<bool>(ec);
        };
        auto pending = wireline::testing::spawn(io, read());
        wireline::testing::settle(io);
        EXPECT_FALSE(pending->done());

        cancel.cancel();
        ASSERT_TRUE(wireline::testing::drive_until(io, [&] { return pending->done(); }));
        EXPECT_TRUE(*pending->value);
        EXPECT_FALSE(conn.is_open());
    }

    TEST(ConnectionTest, CloseOnUncancellableTokenIsInert) {
        auto wire = std::make_shared<Wire>();
        Connection conn(1, PoolKey{}, std::make_unique<ScriptedTransport>(wire));
        auto reg = conn.close_on_cancel(CancellationToken{});
        EXPECT_TRUE(conn.is_open());
    }

}  // namespace
