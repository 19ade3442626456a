#include <gtest/gtest.h>

#include <boost/asio/io_context.hpp>
#include <chrono>

#include "support/test_support.hpp"
#include "wireline/cancellation.hpp"
#include "wireline/deadline.hpp"

using namespace wireline;
using namespace std::chrono_literals;

namespace {

    TEST(CancellationTest, DefaultTokenNeverFires) {
        CancellationToken t;
        EXPECT_FALSE(t.can_be_cancelled());
        EXPECT_FALSE(t.cancelled());
        int calls = 0;
        auto reg = t.on_cancel([&] { ++calls; });
        EXPECT_EQ(calls, 0);
    }

    TEST(CancellationTest, CallbacksRunOnceWithFirstReason) {
        CancellationSource src;
        int calls = 0;
        auto reg = src.token().on_cancel([&] { ++calls; });
        src.cancel(CancelReason::Timeout);
        src.cancel(CancelReason::Requested);
        EXPECT_EQ(calls, 1);
        EXPECT_EQ(src.token().reason(), CancelReason::Timeout);
    }

    TEST(CancellationTest, LateRegistrationRunsImmediately) {
        CancellationSource src;
        src.cancel();
        int calls = 0;
        auto reg = src.token().on_cancel([&] { ++calls; });
        EXPECT_EQ(calls, 1);
    }

    TEST(CancellationTest, ResetRegistrationDoesNotRun) {
        CancellationSource src;
        int calls = 0;
        auto reg = src.token().on_cancel([&] { ++calls; });
        reg.reset();
        src.cancel();
        EXPECT_EQ(calls, 0);
    }

    TEST(CancellationTest, ChildInheritsParentReason) {
        CancellationSource parent;
        CancellationSource child(parent.token());
        parent.cancel(CancelReason::Shutdown);
        EXPECT_TRUE(child.cancelled());
        EXPECT_EQ(child.reason(), CancelReason::Shutdown);
    }

    TEST(CancellationTest, ChildDoesNotCancelParent) {
        CancellationSource parent;
        CancellationSource child(parent.token());
        child.cancel();
        EXPECT_FALSE(parent.cancelled());
    }

    TEST(DeadlineTest, FiresWithTimeoutReason) {
        boost::asio::io_context io;
        Deadline d(io.get_executor(), {}, 10ms);
        EXPECT_TRUE(wireline::testing::drive_until(io, [&] { return d.token().cancelled(); },
                                         1000ms));
        EXPECT_TRUE(d.expired());
        EXPECT_EQ(cancel_code(d.token()), Error::Code::Timeout);
    }

    TEST(DeadlineTest, UnboundedDeadlineFollowsParentOnly) {
        boost::asio::io_context io;
        CancellationSource parent;
        Deadline d(io.get_executor(), parent.token(),
                   Deadline::clock_type::duration::max());
        wireline::testing::settle(io);
        EXPECT_FALSE(d.token().cancelled());
        parent.cancel();
        EXPECT_TRUE(d.token().cancelled());
        EXPECT_FALSE(d.expired());
        EXPECT_EQ(cancel_code(d.token()), Error::Code::Cancelled);
    }

}  // namespace
