#include <urlbridge/ordered_request.hpp>
#include <urlbridge/upload.hpp>
#include <gtest/gtest.h>

using namespace URLBRIDGE_NAMESPACE;

TEST(OrderedRequest, Defaults) {
    auto request = OrderedRequestFactory::builder().build();
    ASSERT_TRUE(request);
    ASSERT_EQ(request->method(), "GET");
    ASSERT_EQ(request->uri(), "/");
    ASSERT_EQ(request->version(), "HTTP/1.1");
    ASSERT_TRUE(request->headers().empty());
    ASSERT_FALSE(request->body());
}

TEST(OrderedRequest, HeaderOrder) {
    auto request = OrderedRequestFactory::builder()
        .method("POST")
        .uri("https://example.com/api?x=1")
        .version("HTTP/2")
        .header("X-B", "2")
        .header("X-A", "1")
        .header("x-b", "3")
        .header("X-Empty", "")
        .body(Body::fromString("{}"))
        .build();
    ASSERT_TRUE(request);
    std::vector<HttpHeader> expected {
        {"X-B", "2"}, {"X-A", "1"}, {"x-b", "3"}, {"X-Empty", ""}
    };
    ASSERT_EQ(request->headers(), expected);
    ASSERT_EQ(request->version(), "HTTP/2");
    ASSERT_EQ(request->body()->length(), 2);
}

TEST(OrderedRequest, FirstErrorWins) {
    auto builder = OrderedRequestFactory::builder();
    builder.method("  ").uri("").header("", "x");
    ASSERT_EQ(builder.error(), "Method cannot be null or empty");
    auto request = builder.build();
    ASSERT_FALSE(request);
    ASSERT_EQ(request.error().message, "Failed to build OrderedRequest");
    ASSERT_EQ(request.error().cause, "Method cannot be null or empty");
    ASSERT_EQ(request.error().toString(), "Failed to build OrderedRequest: Method cannot be null or empty");
}

TEST(OrderedRequest, Errors) {
    auto check = [](OrderedRequestBuilder &builder, std::string_view cause) {
        auto request = builder.build();
        ASSERT_FALSE(request);
        ASSERT_EQ(request.error().cause, cause);
    };
    {
        auto builder = OrderedRequestFactory::builder();
        builder.uri(" ");
        check(builder, "URI cannot be null or empty");
    }
    {
        auto builder = OrderedRequestFactory::builder();
        builder.uri("http://exa mple.com");
        check(builder, "Invalid URI: http://exa mple.com");
    }
    {
        auto builder = OrderedRequestFactory::builder();
        builder.version("");
        check(builder, "Version cannot be null or empty");
    }
    {
        auto builder = OrderedRequestFactory::builder();
        builder.header("X-Bad", "a\r\nInjected: 1");
        check(builder, "Header value cannot contain CR or LF");
    }
}

TEST(OrderedRequest, ValidUri) {
    ASSERT_TRUE(isValidUri("/"));
    ASSERT_TRUE(isValidUri("/path?q=1#frag"));
    ASSERT_TRUE(isValidUri("https://example.com:8443/a/b"));
    ASSERT_TRUE(isValidUri("mailto:someone@example.com"));
    ASSERT_FALSE(isValidUri(""));
    ASSERT_FALSE(isValidUri("http://a b"));
    ASSERT_FALSE(isValidUri("1http://example.com"));
    ASSERT_FALSE(isValidUri("http://example.com/<x>"));
    ASSERT_FALSE(isValidUri("ht_tp://example.com"));
}

TEST(OrderedRequest, Construct) {
    ASSERT_THROW(OrderedRequest("", "/"), std::invalid_argument);
    ASSERT_THROW(OrderedRequest("GET", " "), std::invalid_argument);
    OrderedRequest request("DELETE", "/item/1");
    ASSERT_EQ(request.method(), "DELETE");
}

TEST(OrderedRequest, ToUrlRequestParams) {
    auto request = OrderedRequestFactory::builder()
        .method("PUT")
        .uri("http://example.com/")
        .header("Content-Type", "text/plain")
        .body(Body::fromString("hello"))
        .build();
    ASSERT_TRUE(request);
    auto params = std::move(*request).toUrlRequestParams();
    ASSERT_EQ(params.method, "PUT");
    ASSERT_EQ(params.headers.size(), 1);
    ASSERT_EQ(params.headers[0].name, "Content-Type");
    ASSERT_TRUE(params.uploadDataProvider);
    ASSERT_EQ(params.uploadDataProvider->length(), 5);
    ASSERT_EQ(params.uploadDataProviderExecutor, nullptr);

    // Empty bodies are not uploaded
    auto empty = OrderedRequestFactory::builder().method("POST").body(Body::fromString("")).build();
    ASSERT_TRUE(empty);
    ASSERT_FALSE(std::move(*empty).toUrlRequestParams().uploadDataProvider);
}

auto main(int argc, char **argv) -> int {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
