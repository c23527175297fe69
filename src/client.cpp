#include <urlbridge/curl_engine.hpp>
#include <urlbridge/client.hpp>
#include <urlbridge/upload.hpp>
#include <urlbridge/log.hpp>
#include <stdexcept>

URLBRIDGE_NS_BEGIN

namespace {
    std::atomic<size_t> liveClients {0};

    auto followAll(std::string_view) -> bool {
        return true;
    }

    // The shared state of one sendAsync, completed by the bridge, the timer or the stop token
    struct AsyncState {
        std::promise<HttpClient::Response> promise;
        std::atomic<bool> done {false};
        std::shared_ptr<UrlRequest> request;
        std::optional<std::stop_callback<std::function<void()> > > stopCallback;
        ThreadExecutor::TimerId timer = 0;

        auto complete(HttpClient::Response response) -> bool {
            if (done.exchange(true)) {
                return false;
            }
            promise.set_value(std::move(response));
            return true;
        }
    };
}

HttpClient::HttpClient() : HttpClient(EngineParams {}) { }

HttpClient::HttpClient(EngineParams params) : HttpClient(std::make_unique<CurlEngine>(), std::move(params)) { }

HttpClient::HttpClient(std::unique_ptr<Engine> engine, EngineParams params) : 
    mExecutor(std::make_unique<ThreadExecutor>()), mEngine(std::move(engine)), mPolicy(followAll)
{
    if (!mEngine) {
        URLBRIDGE_THROW(std::invalid_argument("Engine must not be null"));
    }
    if (auto res = mEngine->start(params); res != EngineResult::Success) {
        URLBRIDGE_ERROR("Client", "Failed to start engine: {}", res);
        URLBRIDGE_THROW(std::system_error(make_error_code(res), "Failed to start engine"));
    }
    auto n = ++liveClients;
    if (n > SoftInstanceLimit) {
        URLBRIDGE_WARN("Client", "{} clients alive, more than the recommended {}", n, SoftInstanceLimit);
    }
    URLBRIDGE_DEBUG("Client", "Client created on engine {}", mEngine->versionString());
}

HttpClient::~HttpClient() {
    dispose();
    --liveClients;
}

auto HttpClient::liveInstances() noexcept -> size_t {
    return liveClients.load();
}

auto HttpClient::setTimeout(std::optional<std::chrono::milliseconds> timeout) -> void {
    std::lock_guard locker(mMutex);
    mTimeout = timeout;
}

auto HttpClient::timeout() const -> std::optional<std::chrono::milliseconds> {
    std::lock_guard locker(mMutex);
    return mTimeout;
}

auto HttpClient::setRedirectPolicy(RedirectPolicy policy) -> void {
    std::lock_guard locker(mMutex);
    mPolicy = policy ? std::move(policy) : RedirectPolicy(followAll);
}

auto HttpClient::setReadBufferSize(size_t size) -> void {
    if (size == 0) {
        URLBRIDGE_THROW(std::invalid_argument("Read buffer size must not be zero"));
    }
    std::lock_guard locker(mMutex);
    mReadBufferSize = size;
}

auto HttpClient::checkUsable(std::string_view url) const -> void {
    if (mem::trim(url).empty()) {
        URLBRIDGE_THROW(std::invalid_argument("url must not be empty"));
    }
    if (mDisposed.load()) {
        URLBRIDGE_THROW(std::logic_error("HttpClient is disposed"));
    }
}

auto HttpClient::makeParams(std::string_view method, std::optional<Body> body, std::vector<HttpHeader> headers) -> UrlRequestParams {
    UrlRequestParams params;
    params.method = method;
    params.headers = std::move(headers);
    params.uploadDataProviderExecutor = mExecutor.get();
    if (!body) {
        return params;
    }
    auto length = body->length();
    if (!length) {
        URLBRIDGE_WARN("Client", "Body of unknown length is not uploaded");
        return params;
    }
    if (*length == 0) {
        return params;
    }
    params.uploadDataProvider = UploadStreamer::replayable(std::move(*body));
    return params;
}

auto HttpClient::dispatch(std::string_view url, UrlRequestParams params) -> Result<Dispatch, ClientError> {
    RedirectPolicy policy;
    size_t readBufferSize;
    {
        std::lock_guard locker(mMutex);
        policy = mPolicy;
        readBufferSize = mReadBufferSize;
    }
    auto method = params.method;
    auto bridge = std::make_shared<RequestLifecycleBridge>(std::move(policy), readBufferSize);
    auto request = mEngine->newUrlRequest(url, bridge, *mExecutor, std::move(params));
    if (!request) {
        URLBRIDGE_WARN("Client", "Failed to create request {} {}: {}", method, url, request.error());
        return Unexpected(ClientError::fromEngineResult(request.error()));
    }
    if (auto res = (*request)->start(); res != EngineResult::Success) {
        URLBRIDGE_WARN("Client", "Failed to start request {} {}: {}", method, url, res);
        return Unexpected(ClientError::fromEngineResult(res));
    }
    URLBRIDGE_INFO("Client", "{} {}", method, url);
    return Dispatch {std::move(bridge), std::move(*request)};
}

auto HttpClient::wait(Dispatch &dispatch) -> Response {
    auto timeout = this->timeout();
    if (!timeout) {
        dispatch.bridge->wait();
        return finish(*dispatch.bridge->takeOutcome());
    }
    if (!dispatch.bridge->waitFor(*timeout)) {
        URLBRIDGE_WARN("Client", "Request timed out after {}, canceling", *timeout);
        dispatch.request->cancel();
        if (!dispatch.bridge->waitFor(CancelAckTimeout)) {
            URLBRIDGE_WARN("Client", "Cancellation not acknowledged in {}", CancelAckTimeout);
        }
        return Unexpected(ClientError::fromTimeout());
    }
    return finish(*dispatch.bridge->takeOutcome());
}

auto HttpClient::finish(RequestOutcome outcome) -> Response {
    switch (outcome.status) {
        case ResponseStatus::Success: {
            if (!outcome.response) {
                return Unexpected(ClientError::fromEngineResult(EngineResult::IllegalState));
            }
            return std::move(*outcome.response);
        }
        case ResponseStatus::Canceled: {
            return Unexpected(outcome.error.value_or(ClientError::fromCancellation()));
        }
        case ResponseStatus::Error: {
            if (!outcome.error) {
                return Unexpected(ClientError::fromEngineResult(EngineResult::IllegalState));
            }
            return Unexpected(std::move(*outcome.error));
        }
        default: URLBRIDGE_UNREACHABLE();
    }
}

auto HttpClient::send(std::string_view url, std::string_view method, std::optional<Body> body, const std::vector<HttpHeader> &headers) -> Response {
    checkUsable(url);
    if (mExecutor->isCurrentThread()) { // The callbacks run there, waiting would never end
        URLBRIDGE_THROW(std::logic_error("send() must not be called on the client's executor thread"));
    }
    auto dispatch = this->dispatch(url, makeParams(method, std::move(body), headers));
    if (!dispatch) {
        return Unexpected(std::move(dispatch.error()));
    }
    return wait(*dispatch);
}

auto HttpClient::send(OrderedRequest request) -> Response {
    checkUsable(request.uri());
    if (mExecutor->isCurrentThread()) {
        URLBRIDGE_THROW(std::logic_error("send() must not be called on the client's executor thread"));
    }
    auto url = request.uri();
    auto dispatch = this->dispatch(url, std::move(request).toUrlRequestParams(mExecutor.get()));
    if (!dispatch) {
        return Unexpected(std::move(dispatch.error()));
    }
    return wait(*dispatch);
}

auto HttpClient::sendAsync(std::string url, std::string method, std::optional<Body> body, std::vector<HttpHeader> headers, std::stop_token token) 
    -> std::future<Response> 
{
    checkUsable(url);
    auto state = std::make_shared<AsyncState>();
    auto future = state->promise.get_future();
    if (token.stop_requested()) {
        state->complete(Unexpected(ClientError::fromCancellation()));
        return future;
    }
    auto dispatch = this->dispatch(url, makeParams(method, std::move(body), std::move(headers)));
    if (!dispatch) {
        state->complete(Unexpected(std::move(dispatch.error())));
        return future;
    }
    state->request = dispatch->request;
    std::weak_ptr<AsyncState> weak = state;
    auto executor = mExecutor.get();

    // The timer and the stop token may win the race, the bridge is authoritative otherwise
    if (auto timeout = this->timeout(); timeout) {
        state->timer = executor->executeAfter(*timeout, [weak, delay = *timeout]() {
            auto state = weak.lock();
            if (!state || state->done.load()) {
                return;
            }
            URLBRIDGE_WARN("Client", "Async request timed out after {}, canceling", delay);
            state->request->cancel();
            state->complete(Unexpected(ClientError::fromTimeout()));
        });
    }
    if (token.stop_possible()) {
        state->stopCallback.emplace(std::move(token), [weak]() {
            auto state = weak.lock();
            if (!state || state->done.load()) {
                return;
            }
            URLBRIDGE_DEBUG("Client", "Async request stopped by the caller");
            state->request->cancel();
            state->complete(Unexpected(ClientError::fromCancellation()));
        });
    }
    std::weak_ptr<RequestLifecycleBridge> weakBridge = dispatch->bridge;
    dispatch->bridge->onResolved([state, weakBridge, executor]() {
        auto bridge = weakBridge.lock();
        if (!bridge) {
            return;
        }
        if (auto outcome = bridge->takeOutcome(); outcome) {
            state->complete(finish(std::move(*outcome)));
        }
        if (state->timer != 0) {
            executor->cancelTimer(state->timer);
        }
    });
    return future;
}

auto HttpClient::dispose() -> void {
    if (mDisposed.exchange(true)) {
        return;
    }
    if (mEngine) {
        if (auto res = mEngine->shutdown(); res != EngineResult::Success) {
            URLBRIDGE_WARN("Client", "Engine shutdown failed: {}, forcing", res);
        }
        mEngine.reset(); // Cancels whatever is still in flight
    }
    mExecutor->shutdown();
    URLBRIDGE_DEBUG("Client", "Client disposed");
}

URLBRIDGE_NS_END
