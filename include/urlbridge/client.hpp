/**
 * @file client.hpp
 * @brief The HttpClient, one request end to end over an Engine
 * @version 0.1
 * @date 2026-03-02
 * 
 * @copyright Copyright (c) 2026
 * 
 */
#pragma once

#include <urlbridge/ordered_request.hpp>
#include <urlbridge/executor.hpp>
#include <urlbridge/response.hpp>
#include <urlbridge/bridge.hpp>
#include <urlbridge/engine.hpp>
#include <stop_token>
#include <optional>
#include <future>
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>

URLBRIDGE_NS_BEGIN

/**
 * @brief The Http Client of sending requests and waiting for the responses
 * 
 * Each client owns one engine and one executor thread. A client is meant to be used by
 * one caller flow at a time, create more clients for concurrency.
 */
class URLBRIDGE_API HttpClient {
public:
    using Response = Result<HttpResponse, ClientError>;

    static constexpr auto DefaultTimeout = std::chrono::milliseconds(30000);
    static constexpr auto CancelAckTimeout = std::chrono::milliseconds(1000);
    static constexpr size_t SoftInstanceLimit = 50;

    /**
     * @brief Construct a new Http Client object on the curl engine, HTTP/2 enabled
     * 
     * @throws std::system_error if the engine fails to start
     */
    HttpClient();

    /**
     * @brief Construct a new Http Client object on the curl engine
     * 
     * @param params The engine parameters (user agent, proxy ...)
     * @throws std::system_error if the engine fails to start
     */
    explicit HttpClient(EngineParams params);

    /**
     * @brief Construct a new Http Client object on the given engine, it is started here
     * 
     * @param engine 
     * @param params 
     * @throws std::system_error if the engine fails to start
     */
    HttpClient(std::unique_ptr<Engine> engine, EngineParams params = {});
    HttpClient(const HttpClient &) = delete;
    ~HttpClient();

    /**
     * @brief Send the request and block until the response, an error or the timeout
     * 
     * @param url The absolute url
     * @param method 
     * @param body Uploaded if its length is known and positive
     * @param headers Sent in this order
     * @return Response 
     * @throws std::invalid_argument on an empty url, std::logic_error after dispose()
     */
    auto send(std::string_view url, std::string_view method = "GET", std::optional<Body> body = std::nullopt, 
              const std::vector<HttpHeader> &headers = {}) -> Response;

    /**
     * @brief Send a built request, the uri is used as the url
     * 
     * @param request 
     * @return Response 
     */
    auto send(OrderedRequest request) -> Response;

    /**
     * @brief Send the request without blocking
     * 
     * When the token is stopped, the future resolves with a cancellation error at once,
     * the engine may still be finishing the request in the background.
     * 
     * @param url 
     * @param method 
     * @param body 
     * @param headers 
     * @param token 
     * @return std::future<Response> 
     */
    auto sendAsync(std::string url, std::string method = "GET", std::optional<Body> body = std::nullopt, 
                   std::vector<HttpHeader> headers = {}, std::stop_token token = {}) -> std::future<Response>;

    auto get(std::string_view url) -> Response { 
        return send(url, "GET"); 
    }

    auto post(std::string_view url, Body body, const std::vector<HttpHeader> &headers = {}) -> Response { 
        return send(url, "POST", std::move(body), headers); 
    }

    auto getAsync(std::string url, std::stop_token token = {}) -> std::future<Response> {
        return sendAsync(std::move(url), "GET", std::nullopt, {}, std::move(token));
    }

    auto postAsync(std::string url, Body body, std::stop_token token = {}) -> std::future<Response> {
        return sendAsync(std::move(url), "POST", std::move(body), {}, std::move(token));
    }

    /**
     * @brief Set the timeout of each request
     * 
     * @param timeout nullopt to wait forever
     */
    auto setTimeout(std::optional<std::chrono::milliseconds> timeout) -> void;
    auto timeout() const -> std::optional<std::chrono::milliseconds>;

    /**
     * @brief Set the redirect policy
     * 
     * @param policy Empty to follow every redirect
     */
    auto setRedirectPolicy(RedirectPolicy policy) -> void;

    /**
     * @brief Set the size of the response read buffers (default 512)
     * 
     * @param size Must not be zero
     */
    auto setReadBufferSize(size_t size) -> void;

    /**
     * @brief Shutdown the engine (forcefully if requests are still in flight) and the executor
     * 
     */
    auto dispose() -> void;

    auto isDisposed() const noexcept -> bool { return mDisposed.load(); }

    /**
     * @brief Get the number of clients alive in the process
     * 
     * @return size_t 
     */
    static auto liveInstances() noexcept -> size_t;
private:
    struct Dispatch {
        std::shared_ptr<RequestLifecycleBridge> bridge;
        std::shared_ptr<UrlRequest> request;
    };

    auto checkUsable(std::string_view url) const -> void;
    auto makeParams(std::string_view method, std::optional<Body> body, std::vector<HttpHeader> headers) -> UrlRequestParams;
    auto dispatch(std::string_view url, UrlRequestParams params) -> Result<Dispatch, ClientError>;
    auto wait(Dispatch &dispatch) -> Response;

    static auto finish(RequestOutcome outcome) -> Response;

    std::unique_ptr<ThreadExecutor> mExecutor; //< Declared before the engine, so it outlives it
    std::unique_ptr<Engine> mEngine;

    mutable std::mutex mMutex; //< Protect the configuration below
    RedirectPolicy mPolicy;
    std::optional<std::chrono::milliseconds> mTimeout = DefaultTimeout;
    size_t mReadBufferSize = RequestLifecycleBridge::DefaultReadBufferSize;
    std::atomic<bool> mDisposed {false};
};

URLBRIDGE_NS_END
