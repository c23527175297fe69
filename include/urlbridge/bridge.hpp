/**
 * @file bridge.hpp
 * @brief Turns the six lifecycle callbacks of a request into one resolved outcome
 * @version 0.1
 * @date 2026-03-02
 * 
 * @copyright Copyright (c) 2026
 * 
 */
#pragma once

#include <urlbridge/sync/oneshot.hpp>
#include <urlbridge/response.hpp>
#include <urlbridge/engine.hpp>
#include <functional>
#include <optional>
#include <atomic>
#include <chrono>

URLBRIDGE_NS_BEGIN

/**
 * @brief The predicate deciding whether a redirect to the url is followed
 * 
 */
using RedirectPolicy = std::function<bool(std::string_view url)>;

/**
 * @brief The terminal outcome kinds
 * 
 */
enum class ResponseStatus {
    Success,
    Canceled,
    Error,
};

/**
 * @brief What a request resolved to, the response on Success, the error otherwise
 * 
 */
struct RequestOutcome {
    ResponseStatus status;
    std::optional<HttpResponse> response;
    std::optional<ClientError> error;
};

/**
 * @brief The callback-to-future bridge of one request
 * 
 * Drives the read loop, applies the redirect policy and accumulates the body,
 * then resolves exactly once. Events arriving after the resolution are ignored,
 * and an exception thrown while handling an event resolves the bridge with an error
 * instead of reaching the engine.
 */
class URLBRIDGE_API RequestLifecycleBridge final : public UrlRequestCallback {
public:
    enum class State : int {
        Pending,
        Succeeded,
        Canceled,
        Failed,
    };

    static constexpr size_t DefaultReadBufferSize = 512;

    /**
     * @brief Construct a new Request Lifecycle Bridge object
     * 
     * @param policy The redirect policy (empty to follow every redirect)
     * @param readBufferSize The size of each read buffer
     */
    explicit RequestLifecycleBridge(RedirectPolicy policy = {}, size_t readBufferSize = DefaultReadBufferSize);
    RequestLifecycleBridge(const RequestLifecycleBridge &) = delete;
    ~RequestLifecycleBridge();

    /**
     * @brief Set the size of the read buffers, larger is better for large responses
     * 
     * @param size Must not be zero
     */
    auto setReadBufferSize(size_t size) -> void;

    auto readBufferSize() const noexcept -> size_t { return mReadBufferSize.load(); }

    auto state() const noexcept -> State { return mState.load(); }

    /**
     * @brief Block until the bridge resolved
     * 
     * @return RequestOutcome& 
     */
    auto wait() -> RequestOutcome & { return mOutcome.wait(); }

    /**
     * @brief Block until the bridge resolved or the timeout expired
     * 
     * @return true Resolved
     */
    template <typename Rep, typename Period>
    auto waitFor(std::chrono::duration<Rep, Period> timeout) -> bool { return mOutcome.waitFor(timeout); }

    /**
     * @brief Move the outcome out once resolved
     * 
     * @return std::optional<RequestOutcome> 
     */
    auto takeOutcome() -> std::optional<RequestOutcome> { return mOutcome.take(); }

    /**
     * @brief Register a callback called on the resolving thread once resolved
     * 
     * @param fn 
     */
    auto onResolved(detail::MoveOnlyFunction<void()> fn) -> void { mOutcome.onResolved(std::move(fn)); }

    auto isResolved() const noexcept -> bool { return mOutcome.isResolved(); }

    // UrlRequestCallback
    auto onRedirectReceived(UrlRequest &request, const UrlResponseInfo &info, std::string_view newLocationUrl) -> void override;
    auto onResponseStarted(UrlRequest &request, const UrlResponseInfo &info) -> void override;
    auto onReadCompleted(UrlRequest &request, const UrlResponseInfo &info, std::unique_ptr<ReadBuffer> buffer, size_t bytesRead) -> void override;
    auto onSucceeded(UrlRequest &request, const UrlResponseInfo &info) -> void override;
    auto onFailed(UrlRequest &request, const UrlResponseInfo *info, const NetError &error) -> void override;
    auto onCanceled(UrlRequest &request, const UrlResponseInfo *info) -> void override;
private:
    /**
     * @brief Try to move from Pending to the terminal state and publish the outcome
     * 
     * @return true The bridge is resolved by this call
     */
    auto resolve(State state, RequestOutcome outcome) -> bool;
    auto fail(ClientError error) -> bool;
    auto updateResponse(const UrlResponseInfo &info) -> void;
    auto readNext(UrlRequest &request) -> void;

    /**
     * @brief Run an event handler, converting any exception into a failed resolution
     * 
     * @tparam Fn 
     * @param request Canceled when the handler throws
     * @param event The event name, for logging
     * @param fn 
     */
    template <typename Fn>
    auto invoke(UrlRequest &request, std::string_view event, Fn &&fn) -> void;

    RedirectPolicy mPolicy;
    std::atomic<size_t> mReadBufferSize;
    std::atomic<State> mState {State::Pending};
    HttpResponse mResponse;            //< The response under construction
    std::vector<std::byte> mBody;      //< The accumulated body
    oneshot::Cell<RequestOutcome> mOutcome;
};

URLBRIDGE_NS_END

URLBRIDGE_FORMATTER(RequestLifecycleBridge::State) {
    auto format(const auto &state, auto &ctxt) const {
        using State = URLBRIDGE_NAMESPACE::RequestLifecycleBridge::State;
        switch (state) {
            case State::Pending:   return format_to(ctxt.out(), "Pending");
            case State::Succeeded: return format_to(ctxt.out(), "Succeeded");
            case State::Canceled:  return format_to(ctxt.out(), "Canceled");
            case State::Failed:    return format_to(ctxt.out(), "Failed");
            default:               return format_to(ctxt.out(), "Unknown");
        }
    }
};
