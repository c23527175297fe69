#include <urlbridge/bridge.hpp>
#include <urlbridge/log.hpp>
#include <algorithm>
#include <stdexcept>

URLBRIDGE_NS_BEGIN

RequestLifecycleBridge::RequestLifecycleBridge(RedirectPolicy policy, size_t readBufferSize) : 
    mPolicy(std::move(policy)), mReadBufferSize(readBufferSize == 0 ? DefaultReadBufferSize : readBufferSize)
{
    if (!mPolicy) { // Follow everything by default
        mPolicy = [](std::string_view) { return true; };
    }
}

RequestLifecycleBridge::~RequestLifecycleBridge() {
    if (mState.load() == State::Pending) {
        URLBRIDGE_TRACE("Bridge", "Bridge {} destroyed while pending", (void *) this);
    }
}

auto RequestLifecycleBridge::setReadBufferSize(size_t size) -> void {
    if (size == 0) {
        URLBRIDGE_THROW(std::invalid_argument("Read buffer size must not be zero"));
    }
    mReadBufferSize.store(size);
}

template <typename Fn>
inline auto RequestLifecycleBridge::invoke(UrlRequest &request, std::string_view event, Fn &&fn) -> void {
    if (mState.load() != State::Pending) {
        URLBRIDGE_TRACE("Bridge", "Ignore {} on bridge in state {}", event, mState.load());
        return;
    }
    try {
        fn();
    }
    catch (const std::exception &e) {
        URLBRIDGE_ERROR("Bridge", "Exception in {}: {}", event, e.what());
        if (fail(ClientError::fromException(e))) {
            request.cancel();
        }
    }
    catch (...) {
        URLBRIDGE_ERROR("Bridge", "Unknown exception in {}", event);
        if (fail(ClientError::fromException(std::current_exception()))) {
            request.cancel();
        }
    }
}

auto RequestLifecycleBridge::onRedirectReceived(UrlRequest &request, const UrlResponseInfo &info, std::string_view newLocationUrl) -> void {
    invoke(request, "onRedirectReceived", [&]() {
        if (mPolicy(newLocationUrl)) {
            URLBRIDGE_DEBUG("Bridge", "Follow redirect {} -> {}", info.url, newLocationUrl);
            if (auto res = request.followRedirect(); res != EngineResult::Success) {
                fail(ClientError::fromEngineResult(res));
                request.cancel();
            }
            return;
        }
        // Blocked, the 3xx itself is the final response
        URLBRIDGE_DEBUG("Bridge", "Redirect {} -> {} blocked by policy", info.url, newLocationUrl);
        updateResponse(info);
        auto response = std::move(mResponse);
        if (resolve(State::Succeeded, RequestOutcome {ResponseStatus::Success, std::move(response), std::nullopt})) {
            request.cancel(); // Release the engine side, the late onCanceled is ignored
        }
    });
}

auto RequestLifecycleBridge::onResponseStarted(UrlRequest &request, const UrlResponseInfo &info) -> void {
    invoke(request, "onResponseStarted", [&]() {
        URLBRIDGE_DEBUG("Bridge", "Response started {} {} ({})", info.httpStatusCode, info.httpStatusText, info.url);
        updateResponse(info);
        readNext(request);
    });
}

auto RequestLifecycleBridge::onReadCompleted(UrlRequest &request, const UrlResponseInfo &, std::unique_ptr<ReadBuffer> buffer, size_t bytesRead) -> void {
    invoke(request, "onReadCompleted", [&]() {
        if (bytesRead == 0) { // The engine decides when the body ends
            return;
        }
        if (buffer) {
            auto data = buffer->data();
            auto n = std::min(bytesRead, data.size()); // Never take more than was read
            mBody.insert(mBody.end(), data.begin(), data.begin() + n);
        }
        readNext(request);
    });
}

auto RequestLifecycleBridge::onSucceeded(UrlRequest &request, const UrlResponseInfo &info) -> void {
    invoke(request, "onSucceeded", [&]() {
        URLBRIDGE_DEBUG("Bridge", "Request succeeded {} bytes ({})", mBody.size(), info.url);
        mResponse.mBody = Body::fromBytes(std::move(mBody));
        auto response = std::move(mResponse);
        resolve(State::Succeeded, RequestOutcome {ResponseStatus::Success, std::move(response), std::nullopt});
    });
}

auto RequestLifecycleBridge::onFailed(UrlRequest &request, const UrlResponseInfo *, const NetError &error) -> void {
    invoke(request, "onFailed", [&]() {
        URLBRIDGE_DEBUG("Bridge", "Request failed: {} ({})", error.message, error.code);
        fail(ClientError::fromNetError(error));
    });
}

auto RequestLifecycleBridge::onCanceled(UrlRequest &request, const UrlResponseInfo *) -> void {
    invoke(request, "onCanceled", [&]() {
        URLBRIDGE_DEBUG("Bridge", "Request canceled");
        resolve(State::Canceled, RequestOutcome {ResponseStatus::Canceled, std::nullopt, ClientError::fromCancellation()});
    });
}

auto RequestLifecycleBridge::resolve(State state, RequestOutcome outcome) -> bool {
    auto expected = State::Pending;
    if (!mState.compare_exchange_strong(expected, state)) {
        URLBRIDGE_TRACE("Bridge", "Already resolved as {}, drop {}", expected, state);
        return false;
    }
    return mOutcome.trySet(std::move(outcome));
}

auto RequestLifecycleBridge::fail(ClientError error) -> bool {
    return resolve(State::Failed, RequestOutcome {ResponseStatus::Error, std::nullopt, std::move(error)});
}

auto RequestLifecycleBridge::updateResponse(const UrlResponseInfo &info) -> void {
    mResponse.mStatusCode = info.httpStatusCode;
    mResponse.mStatusText = info.httpStatusText;
    mResponse.mUrl = info.url;
    mResponse.mWasCached = info.wasCached;
    mResponse.mNegotiatedProtocol = info.negotiatedProtocol;
    mResponse.mHeaderList = info.allHeaders;
    mResponse.mHeaders = HttpHeaders::fromList(info.allHeaders);
}

auto RequestLifecycleBridge::readNext(UrlRequest &request) -> void {
    auto res = request.read(std::make_unique<ReadBuffer>(mReadBufferSize.load()));
    if (res != EngineResult::Success) {
        URLBRIDGE_WARN("Bridge", "read() rejected: {}", res);
        fail(ClientError::fromEngineResult(res));
        request.cancel();
    }
}

URLBRIDGE_NS_END
