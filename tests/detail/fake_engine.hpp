#pragma once

#include <urlbridge/engine.hpp>
#include <functional>
#include <algorithm>
#include <optional>
#include <cstring>
#include <atomic>
#include <mutex>

namespace testing_detail {

using namespace URLBRIDGE_NAMESPACE;

/**
 * @brief The request recording what the bridge asks of it, events are driven by the test
 *
 */
class RecordingRequest final : public UrlRequest {
public:
    auto start() -> EngineResult override { ++starts; return EngineResult::Success; }
    auto followRedirect() -> EngineResult override { ++follows; return followResult; }
    auto read(std::unique_ptr<ReadBuffer> buffer) -> EngineResult override {
        if (readResult != EngineResult::Success) {
            return readResult;
        }
        reads.push_back(std::move(buffer));
        return EngineResult::Success;
    }
    auto cancel() -> void override { ++cancels; }
    auto isDone() const -> bool override { return false; }
    auto getStatus(std::shared_ptr<UrlRequestStatusListener> listener) -> EngineResult override {
        if (!listener) {
            return EngineResult::NullPointerCallback;
        }
        notifyStatus(*listener, UrlRequestStatus::Idle);
        return EngineResult::Success;
    }

    // Take the last buffer given to read(), filled with the text
    auto fill(std::string_view text) -> std::unique_ptr<ReadBuffer> {
        auto buffer = std::move(reads.back());
        reads.pop_back();
        auto data = buffer->data();
        ::memcpy(data.data(), text.data(), std::min(text.size(), data.size()));
        return buffer;
    }

    int starts = 0;
    int follows = 0;
    int cancels = 0;
    EngineResult followResult = EngineResult::Success;
    EngineResult readResult = EngineResult::Success;
    std::vector<std::unique_ptr<ReadBuffer> > reads;
};

/**
 * @brief One leg the scripted engine answers with
 *
 */
struct ScriptedReply {
    int status = 200;
    std::string statusText = "OK";
    std::vector<HttpHeader> headers;
    std::string body;
    std::string redirectTo; //< Not empty to answer with a redirect
};

class ScriptedEngine;

/**
 * @brief The request playing the engine's script on the executor
 *
 */
class ScriptedRequest final : public UrlRequest, public UploadDataSink, public std::enable_shared_from_this<ScriptedRequest> {
public:
    ScriptedRequest(ScriptedEngine &engine, std::string url, std::shared_ptr<UrlRequestCallback> callback, Executor &executor, UrlRequestParams params) :
        mEngine(engine), mUrl(std::move(url)), mCallback(std::move(callback)), mExecutor(executor), mParams(std::move(params))
    {
        mInfo.urlChain.push_back(mUrl);
    }

    auto start() -> EngineResult override;
    auto followRedirect() -> EngineResult override;
    auto read(std::unique_ptr<ReadBuffer> buffer) -> EngineResult override;
    auto cancel() -> void override;
    auto isDone() const -> bool override { return mDone.load(); }
    auto getStatus(std::shared_ptr<UrlRequestStatusListener> listener) -> EngineResult override {
        if (!listener) {
            return EngineResult::NullPointerCallback;
        }
        auto status = mDone.load() ? UrlRequestStatus::Invalid : UrlRequestStatus::WaitingForResponse;
        mExecutor.execute([listener = std::move(listener), status]() { notifyStatus(*listener, status); });
        return EngineResult::Success;
    }

    auto onReadSucceeded(size_t bytesRead, bool finalChunk) -> void override;
    auto onReadError(std::string_view message) -> void override;
    auto onRewindSucceeded() -> void override { }
    auto onRewindError(std::string_view) -> void override { }

    auto params() const -> const UrlRequestParams & { return mParams; }
private:
    auto respond() -> void;
    auto post(std::function<void(ScriptedRequest &, UrlRequestCallback &)> fn) -> void {
        mExecutor.execute([self = shared_from_this(), fn = std::move(fn)]() {
            fn(*self, *self->mCallback);
        });
    }
    auto terminal() -> bool { return mDone.exchange(true); }

    ScriptedEngine &mEngine;
    std::string mUrl;
    std::shared_ptr<UrlRequestCallback> mCallback;
    Executor &mExecutor;
    UrlRequestParams mParams;
    UrlResponseInfo mInfo;
    size_t mLeg = 0;
    size_t mOffset = 0;
    std::atomic<bool> mDone {false};
    std::vector<std::byte> mUploadBuffer;
    size_t mUploaded = 0;
};

/**
 * @brief The engine answering every request with the same script
 *
 */
class ScriptedEngine final : public Engine {
public:
    auto start(const EngineParams &params) -> EngineResult override {
        startedWith = params;
        return startResult;
    }
    auto shutdown() -> EngineResult override {
        ++shutdowns;
        return EngineResult::Success;
    }
    auto versionString() const -> std::string override { return "scripted/1.0"; }
    auto newUrlRequest(std::string_view url, std::shared_ptr<UrlRequestCallback> callback, Executor &executor, UrlRequestParams params)
        -> Result<std::shared_ptr<UrlRequest>, EngineResult> override
    {
        if (createResult != EngineResult::Success) {
            return Unexpected(createResult);
        }
        auto request = std::make_shared<ScriptedRequest>(*this, std::string(url), std::move(callback), executor, std::move(params));
        std::lock_guard locker(mutex);
        requests.push_back(request);
        return request;
    }

    auto lastRequest() -> std::shared_ptr<ScriptedRequest> {
        std::lock_guard locker(mutex);
        return requests.empty() ? nullptr : requests.back();
    }

    // Script
    std::vector<ScriptedReply> replies {ScriptedReply {}};
    std::optional<NetError> failure; //< Fail instead of answering
    bool hang = false;               //< Never answer, only cancel() ends the request
    EngineResult startResult = EngineResult::Success;
    EngineResult createResult = EngineResult::Success;
    EngineResult requestStartResult = EngineResult::Success;

    // Observed
    std::optional<EngineParams> startedWith;
    std::atomic<int> shutdowns {0};
    std::mutex mutex;
    std::vector<std::shared_ptr<ScriptedRequest> > requests;
    std::string uploaded;            //< The body pulled from the upload provider
    std::atomic<bool> uploadDone {false};
};

inline auto ScriptedRequest::start() -> EngineResult {
    if (mEngine.requestStartResult != EngineResult::Success) {
        return mEngine.requestStartResult;
    }
    if (mParams.uploadDataProvider) { // Pull the whole body first, like a real upload
        mUploadBuffer.resize(3);
        auto executor = mParams.uploadDataProviderExecutor ? mParams.uploadDataProviderExecutor : &mExecutor;
        executor->execute([self = shared_from_this()]() {
            self->mParams.uploadDataProvider->read(*self, self->mUploadBuffer);
        });
        return EngineResult::Success;
    }
    mExecutor.execute([self = shared_from_this()]() { self->respond(); });
    return EngineResult::Success;
}

inline auto ScriptedRequest::onReadSucceeded(size_t bytesRead, bool finalChunk) -> void {
    mEngine.uploaded.append(reinterpret_cast<const char *>(mUploadBuffer.data()), bytesRead);
    mUploaded += bytesRead;
    if (!finalChunk && mUploaded < size_t(mParams.uploadDataProvider->length())) {
        mParams.uploadDataProvider->read(*this, mUploadBuffer);
        return;
    }
    mEngine.uploadDone = true;
    respond();
}

inline auto ScriptedRequest::onReadError(std::string_view message) -> void {
    if (terminal()) {
        return;
    }
    post([error = NetError {NetErrorCode::Other, 0, std::string(message)}](ScriptedRequest &self, UrlRequestCallback &callback) {
        callback.onFailed(self, nullptr, error);
    });
}

inline auto ScriptedRequest::respond() -> void {
    if (mDone.load() || mEngine.hang) {
        return;
    }
    if (mEngine.failure) {
        terminal();
        post([error = *mEngine.failure](ScriptedRequest &self, UrlRequestCallback &callback) {
            callback.onFailed(self, nullptr, error);
        });
        return;
    }
    const auto &reply = mEngine.replies.at(mLeg);
    mInfo.url = mInfo.urlChain.back();
    mInfo.httpStatusCode = reply.status;
    mInfo.httpStatusText = reply.statusText;
    mInfo.allHeaders = reply.headers;
    mInfo.negotiatedProtocol = "http/1.1";
    if (!reply.redirectTo.empty()) {
        post([info = mInfo, location = reply.redirectTo](ScriptedRequest &self, UrlRequestCallback &callback) {
            callback.onRedirectReceived(self, info, location);
        });
        return;
    }
    post([info = mInfo](ScriptedRequest &self, UrlRequestCallback &callback) {
        callback.onResponseStarted(self, info);
    });
}

inline auto ScriptedRequest::followRedirect() -> EngineResult {
    mExecutor.execute([self = shared_from_this()]() {
        self->mInfo.urlChain.push_back(self->mEngine.replies.at(self->mLeg).redirectTo);
        self->mLeg += 1;
        self->respond();
    });
    return EngineResult::Success;
}

inline auto ScriptedRequest::read(std::unique_ptr<ReadBuffer> buffer) -> EngineResult {
    auto holder = std::make_shared<std::unique_ptr<ReadBuffer> >(std::move(buffer));
    mExecutor.execute([self = shared_from_this(), holder]() {
        if (self->mDone.load()) {
            return;
        }
        const auto &body = self->mEngine.replies.at(self->mLeg).body;
        if (self->mOffset >= body.size()) {
            self->terminal();
            self->mCallback->onSucceeded(*self, self->mInfo);
            return;
        }
        auto &buf = *holder;
        auto n = std::min(buf->size(), body.size() - self->mOffset);
        ::memcpy(buf->data().data(), body.data() + self->mOffset, n);
        self->mOffset += n;
        self->mCallback->onReadCompleted(*self, self->mInfo, std::move(buf), n);
    });
    return EngineResult::Success;
}

inline auto ScriptedRequest::cancel() -> void {
    if (terminal()) {
        return;
    }
    post([](ScriptedRequest &self, UrlRequestCallback &callback) {
        callback.onCanceled(self, nullptr);
    });
}

} // namespace testing_detail
