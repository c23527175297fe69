/**
 * @file engine.hpp
 * @brief The interfaces of the asynchronous url request engine the client is built on
 * @version 0.1
 * @date 2026-03-02
 * 
 * @copyright Copyright (c) 2026
 * 
 */
#pragma once

#include <urlbridge/detail/functional.hpp>
#include <urlbridge/request_status.hpp>
#include <urlbridge/headers.hpp>
#include <urlbridge/buffer.hpp>
#include <urlbridge/error.hpp>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

URLBRIDGE_NS_BEGIN

/**
 * @brief The place lifecycle callbacks and upload reads run on
 * 
 */
class Executor {
public:
    virtual ~Executor() = default;

    /**
     * @brief Queue the function, it will be called later on the executor's context
     * 
     * @param fn 
     */
    virtual auto execute(detail::MoveOnlyFunction<void()> fn) -> void = 0;
};

/**
 * @brief The metadata of a response, one per redirect leg
 * 
 */
struct UrlResponseInfo {
    std::string url;                      //< The url of this leg
    std::vector<std::string> urlChain;    //< The urls visited so far, the original one first
    int httpStatusCode = 0;
    std::string httpStatusText;
    std::vector<HttpHeader> allHeaders;   //< In arrival order, duplicates kept
    bool wasCached = false;
    std::string negotiatedProtocol;
    int64_t receivedByteCount = 0;
};

/**
 * @brief The buffer handed to UrlRequest::read, given back in onReadCompleted
 * 
 */
class ReadBuffer {
public:
    explicit ReadBuffer(size_t size) : mData(size) { }
    ReadBuffer(const ReadBuffer &) = delete;

    auto data() noexcept -> MutableBuffer { return mData; }
    auto data() const noexcept -> Buffer { return mData; }
    auto size() const noexcept -> size_t { return mData.size(); }
private:
    std::vector<std::byte> mData;
};

class UrlRequest;

/**
 * @brief The six lifecycle events of a request
 * 
 * Delivered on the request's executor, one at a time, in the order
 * [onRedirectReceived]* -> onResponseStarted -> onReadCompleted* -> onSucceeded | onFailed | onCanceled.
 * onFailed and onCanceled may arrive at any point, and nothing follows a terminal event.
 */
class UrlRequestCallback {
public:
    virtual ~UrlRequestCallback() = default;

    /**
     * @brief A redirect was received, call followRedirect() to follow it or cancel() to stop
     * 
     * @param request 
     * @param info The response carrying the redirect
     * @param newLocationUrl The absolute url to redirect to
     */
    virtual auto onRedirectReceived(UrlRequest &request, const UrlResponseInfo &info, std::string_view newLocationUrl) -> void = 0;

    /**
     * @brief The final response headers are received, call read() to get the body
     * 
     * @param request 
     * @param info 
     */
    virtual auto onResponseStarted(UrlRequest &request, const UrlResponseInfo &info) -> void = 0;

    /**
     * @brief A read() completed
     * 
     * @param request 
     * @param info 
     * @param buffer The buffer passed to read()
     * @param bytesRead The number of valid bytes at the front of the buffer
     */
    virtual auto onReadCompleted(UrlRequest &request, const UrlResponseInfo &info, std::unique_ptr<ReadBuffer> buffer, size_t bytesRead) -> void = 0;

    virtual auto onSucceeded(UrlRequest &request, const UrlResponseInfo &info) -> void = 0;

    /**
     * @brief The request failed
     * 
     * @param request 
     * @param info The last response info (nullptr if no response was received)
     * @param error 
     */
    virtual auto onFailed(UrlRequest &request, const UrlResponseInfo *info, const NetError &error) -> void = 0;

    virtual auto onCanceled(UrlRequest &request, const UrlResponseInfo *info) -> void = 0;
};

/**
 * @brief A live request
 * 
 */
class UrlRequest {
public:
    virtual ~UrlRequest() = default;

    /**
     * @brief Start the request, failures detected synchronously are returned without any callback
     * 
     * @return EngineResult 
     */
    virtual auto start() -> EngineResult = 0;

    /**
     * @brief Follow the pending redirect, only valid inside onRedirectReceived
     * 
     * @return EngineResult 
     */
    virtual auto followRedirect() -> EngineResult = 0;

    /**
     * @brief Read the next part of the body into the buffer, completion comes through onReadCompleted
     * 
     * @param buffer 
     * @return EngineResult 
     */
    virtual auto read(std::unique_ptr<ReadBuffer> buffer) -> EngineResult = 0;

    /**
     * @brief Cancel the request, onCanceled will be delivered unless a terminal event already was
     * 
     */
    virtual auto cancel() -> void = 0;

    virtual auto isDone() const -> bool = 0;

    /**
     * @brief Ask where the request is, the answer goes to the listener on the request's executor
     *
     * A request not started yet, or already done, reports UrlRequestStatus::Invalid.
     *
     * @param listener
     * @return EngineResult NullPointerCallback if listener is null, the listener is not called then
     */
    virtual auto getStatus(std::shared_ptr<UrlRequestStatusListener> listener) -> EngineResult = 0;
};

/**
 * @brief The engine side of an upload read / rewind
 * 
 * Valid until the request delivers its terminal event.
 */
class UploadDataSink {
public:
    virtual auto onReadSucceeded(size_t bytesRead, bool finalChunk) -> void = 0;
    virtual auto onReadError(std::string_view message) -> void = 0;
    virtual auto onRewindSucceeded() -> void = 0;
    virtual auto onRewindError(std::string_view message) -> void = 0;
protected:
    ~UploadDataSink() = default;
};

/**
 * @brief The pull based source of a request body
 * 
 */
class UploadDataProvider {
public:
    virtual ~UploadDataProvider() = default;

    /**
     * @brief Get the total length
     * 
     * @return int64_t (-1 if unknown, the upload is chunked)
     */
    virtual auto length() const -> int64_t = 0;

    /**
     * @brief Fill the buffer, then signal the sink exactly once
     * 
     * @param sink 
     * @param buffer Valid until the sink is signaled
     */
    virtual auto read(UploadDataSink &sink, MutableBuffer buffer) -> void = 0;

    /**
     * @brief Restart from the beginning, then signal the sink exactly once
     * 
     * @param sink 
     */
    virtual auto rewind(UploadDataSink &sink) -> void = 0;

    /**
     * @brief The engine is done with the provider
     * 
     */
    virtual auto close() -> void = 0;
};

enum class RequestPriority : int {
    Idle,
    Lowest,
    Low,
    Medium,
    Highest,
};

/**
 * @brief The per request parameters
 * 
 */
struct UrlRequestParams {
    std::string method = "GET";
    std::vector<HttpHeader> headers;      //< Sent in this order, duplicates kept
    bool disableCache = false;
    RequestPriority priority = RequestPriority::Medium;
    std::shared_ptr<UploadDataProvider> uploadDataProvider;
    Executor *uploadDataProviderExecutor = nullptr; //< nullptr to use the request's executor
};

/**
 * @brief The per engine parameters
 * 
 */
struct EngineParams {
    std::string userAgent = "urlbridge/" URLBRIDGE_VERSION_STRING;
    bool enableHttp2 = true;
    std::string proxyUrl;                 //< Passed through as is, e.g. "http://host:port" or "socks5://host:port"
    std::string proxyUsername;
    std::string proxyPassword;
    std::string acceptLanguage;
    bool enableCheckResult = true;        //< Validate arguments, return non Success results instead of misbehaving
};

/**
 * @brief The url request engine
 * 
 */
class Engine {
public:
    virtual ~Engine() = default;

    /**
     * @brief Start the engine, must be called before any request is created
     * 
     * @param params 
     * @return EngineResult 
     */
    virtual auto start(const EngineParams &params) -> EngineResult = 0;

    /**
     * @brief Shutdown the engine, fails while requests are in flight
     * 
     * @return EngineResult 
     */
    virtual auto shutdown() -> EngineResult = 0;

    virtual auto versionString() const -> std::string = 0;

    /**
     * @brief Create a new request, not started yet
     * 
     * @param url The absolute url
     * @param callback The lifecycle callbacks, kept alive until the terminal event is delivered
     * @param executor The executor the callbacks run on, must outlive the request
     * @param params 
     * @return Result<std::shared_ptr<UrlRequest>, EngineResult> 
     */
    virtual auto newUrlRequest(std::string_view url, std::shared_ptr<UrlRequestCallback> callback, Executor &executor, UrlRequestParams params) 
        -> Result<std::shared_ptr<UrlRequest>, EngineResult> = 0;
};

URLBRIDGE_NS_END
