/**
 * @file ordered_request.hpp
 * @brief The request whose headers keep their exact insertion order, and its fluent builder
 * @version 0.1
 * @date 2026-03-02
 * 
 * @copyright Copyright (c) 2026
 * 
 */
#pragma once

#include <urlbridge/headers.hpp>
#include <urlbridge/engine.hpp>
#include <urlbridge/body.hpp>
#include <optional>
#include <string>
#include <vector>

URLBRIDGE_NS_BEGIN

/**
 * @brief The error of OrderedRequestBuilder::build, keeps the first validation failure
 * 
 */
struct BuilderError {
    std::string message;   //< "Failed to build OrderedRequest"
    std::string cause;     //< The first recorded validation message

    auto toString() const -> std::string {
        return fmtlib::format("{}: {}", message, cause);
    }
};

/**
 * @brief A request with an ordered header list, duplicates stay where they were inserted
 * 
 */
class URLBRIDGE_API OrderedRequest {
public:
    /**
     * @brief Construct a new Ordered Request object
     * 
     * @param method Must not be blank
     * @param uri Must not be blank
     * @param body 
     * @throws std::invalid_argument on a blank method or uri
     */
    OrderedRequest(std::string method, std::string uri, std::optional<Body> body = std::nullopt);
    OrderedRequest(const OrderedRequest &) = delete;
    OrderedRequest(OrderedRequest &&) = default;

    auto method() const -> const std::string & { return mMethod; }
    auto uri() const -> const std::string & { return mUri; }
    auto version() const -> const std::string & { return mVersion; }
    auto headers() const -> const std::vector<HttpHeader> & { return mHeaders; }
    auto body() const -> const std::optional<Body> & { return mBody; }

    /**
     * @brief Convert to the engine parameters, headers in order
     * 
     * The body (if it has a known positive length) is handed to an UploadStreamer, rewindable when the body can be cloned.
     * 
     * @param executor The executor for the upload reads (nullptr for the request's executor)
     * @return UrlRequestParams 
     */
    auto toUrlRequestParams(Executor *executor = nullptr) && -> UrlRequestParams;

    auto operator =(const OrderedRequest &) -> OrderedRequest & = delete;
    auto operator =(OrderedRequest &&) -> OrderedRequest & = default;
private:
    std::string mMethod;
    std::string mUri;
    std::string mVersion = "HTTP/1.1";
    std::vector<HttpHeader> mHeaders;
    std::optional<Body> mBody;
friend class OrderedRequestBuilder;
};

/**
 * @brief The fluent builder of OrderedRequest
 * 
 * The first validation failure is recorded and every later setter becomes a no-op,
 * build() reports it. Defaults: GET, "/", HTTP/1.1.
 */
class URLBRIDGE_API OrderedRequestBuilder {
public:
    OrderedRequestBuilder() = default;
    OrderedRequestBuilder(const OrderedRequestBuilder &) = delete;
    OrderedRequestBuilder(OrderedRequestBuilder &&) = default;

    auto method(std::string_view method) -> OrderedRequestBuilder &;
    auto uri(std::string_view uri) -> OrderedRequestBuilder &;
    auto version(std::string_view version) -> OrderedRequestBuilder &;

    /**
     * @brief Append a header, after everything added before it
     * 
     * @param name Must not be blank
     * @param value Must not contain CR or LF
     * @return OrderedRequestBuilder& 
     */
    auto header(std::string_view name, std::string_view value) -> OrderedRequestBuilder &;
    auto body(Body body) -> OrderedRequestBuilder &;

    /**
     * @brief Build the request, the builder's body is moved into it
     * 
     * @return Result<OrderedRequest, BuilderError> 
     */
    auto build() -> Result<OrderedRequest, BuilderError>;

    /**
     * @brief Get the recorded validation error
     * 
     * @return const std::optional<std::string>& 
     */
    auto error() const -> const std::optional<std::string> & { return mError; }
private:
    std::string mMethod = "GET";
    std::string mUri = "/";
    std::string mVersion = "HTTP/1.1";
    std::vector<HttpHeader> mHeaders;
    std::optional<Body> mBody;
    std::optional<std::string> mError;
};

/**
 * @brief Entry of the fluent chain, OrderedRequestFactory::builder().method("POST")...build()
 * 
 */
class OrderedRequestFactory {
public:
    static auto builder() -> OrderedRequestBuilder {
        return OrderedRequestBuilder();
    }
};

/**
 * @brief Check the uri is usable as an absolute or relative reference
 * 
 * @param uri 
 * @return true 
 * @return false 
 */
extern auto URLBRIDGE_API isValidUri(std::string_view uri) -> bool;

URLBRIDGE_NS_END

URLBRIDGE_FORMATTER(BuilderError) {
    auto format(const auto &err, auto &ctxt) const {
        return format_to(ctxt.out(), "{}", err.toString());
    }
};
