#include <gtest/gtest.h>

#include "wireline/response.hpp"

using namespace wireline;

TEST(ResponseTest, Defaults) {
    Response res;
    EXPECT_EQ(res.status_code, 200);
    EXPECT_EQ(res.version, 11u);
    EXPECT_TRUE(res.reason.empty());
    EXPECT_TRUE(res.body.empty());
    EXPECT_EQ(res.body_stream, nullptr);
}

TEST(ResponseTest, SetHeaderAndLookup) {
    Response res;
    res.set_header("X-Request-Id", "1").set_header("x-request-id", "2");
    EXPECT_EQ(res.header("X-REQUEST-ID"), "2");
    EXPECT_FALSE(res.header("Missing").has_value());
}

TEST(ResponseTest, ReasonPhrase) {
    EXPECT_EQ(reason_phrase(200), "OK");
    EXPECT_EQ(reason_phrase(204), "No Content");
    EXPECT_EQ(reason_phrase(401), "Unauthorized");
    EXPECT_EQ(reason_phrase(413), "Payload Too Large");
    EXPECT_EQ(reason_phrase(500), "Internal Server Error");
    EXPECT_TRUE(reason_phrase(299).empty());
}
