/**
 * @file curl_engine.hpp
 * @brief The Engine implemented on the libcurl multi interface
 * @version 0.1
 * @date 2026-03-02
 * 
 * @copyright Copyright (c) 2026
 * 
 */
#pragma once

#include <urlbridge/engine.hpp>
#include <memory>
#include <mutex>

URLBRIDGE_NS_BEGIN

namespace detail {
    class CurlCore;
} // namespace detail

/**
 * @brief The engine driving every transfer on one network thread
 * 
 * Redirects are reported through onRedirectReceived instead of being followed by curl,
 * gzip / deflate bodies are inflated before they are handed to read().
 * Destroying the engine cancels the requests still in flight, each gets onCanceled.
 */
class URLBRIDGE_API CurlEngine final : public Engine {
public:
    static constexpr int MaxRedirects = 20;
    static constexpr size_t MaxBufferedBytes = 1024 * 1024; //< Pause the transfer above it

    CurlEngine();
    CurlEngine(const CurlEngine &) = delete;
    ~CurlEngine();

    auto start(const EngineParams &params) -> EngineResult override;
    auto shutdown() -> EngineResult override;
    auto versionString() const -> std::string override;
    auto newUrlRequest(std::string_view url, std::shared_ptr<UrlRequestCallback> callback, Executor &executor, UrlRequestParams params) 
        -> Result<std::shared_ptr<UrlRequest>, EngineResult> override;

    /**
     * @brief Get the number of started requests not finished yet
     * 
     * @return size_t 
     */
    auto activeRequests() const -> size_t;
private:
    mutable std::mutex mMutex;
    std::shared_ptr<detail::CurlCore> mCore;
    bool mShutdown = false;
};

/**
 * @brief Check the method is a valid HTTP token
 * 
 */
extern auto URLBRIDGE_API isValidHttpMethod(std::string_view method) -> bool;

/**
 * @brief Check the header name is a token and the value has no CR, LF or NUL
 * 
 */
extern auto URLBRIDGE_API isValidHttpHeader(std::string_view name, std::string_view value) -> bool;

URLBRIDGE_NS_END
