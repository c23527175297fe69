#include <urlbridge/headers.hpp>
#include <gtest/gtest.h>

using namespace URLBRIDGE_NAMESPACE;

TEST(Headers, Basic) {
    HttpHeaders headers {
        {"Content-Type", "text/html"},
        {"Set-Cookie", "a=1"},
    };
    ASSERT_TRUE(headers.contains("content-type"));
    ASSERT_TRUE(headers.contains(HttpHeaders::ContentType));
    ASSERT_EQ(headers.value("CONTENT-TYPE"), "text/html");
    ASSERT_EQ(headers.value("X-Missing"), "");
    ASSERT_TRUE(headers.values("X-Missing").empty());

    headers.append("set-cookie", "b=2");
    auto cookies = headers.values("Set-Cookie");
    ASSERT_EQ(cookies.size(), 2);
    ASSERT_EQ(cookies[0], "a=1");
    ASSERT_EQ(cookies[1], "b=2");
    ASSERT_EQ(headers.size(), 3);

    headers.remove("SET-COOKIE");
    ASSERT_FALSE(headers.contains("Set-Cookie"));
    ASSERT_EQ(headers.size(), 1);
}

TEST(Headers, FromList) {
    std::vector<HttpHeader> list {
        {"Via", "1"}, {"Accept", "*/*"}, {"via", "2"}, {"VIA", "3"},
    };
    auto headers = HttpHeaders::fromList(list);
    auto via = headers.values("Via");
    ASSERT_EQ(via.size(), 3);
    ASSERT_EQ(via[0], "1");
    ASSERT_EQ(via[1], "2");
    ASSERT_EQ(via[2], "3");
    ASSERT_EQ(headers.value(HttpHeaders::Accept), "*/*");
}

TEST(Headers, WellKnown) {
    ASSERT_EQ(HttpHeaders::stringOf(HttpHeaders::UserAgent), "User-Agent");
    ASSERT_EQ(HttpHeaders::stringOf(HttpHeaders::AcceptEncoding), "Accept-Encoding");
    ASSERT_EQ(fmtlib::format("{}", HttpHeaders::Location), "Location");
    ASSERT_EQ(fmtlib::format("{}", HttpHeader {"Host", "example.com"}), "Host: example.com");
}

auto main(int argc, char **argv) -> int {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
