#include <urlbridge/detail/mem.hpp>
#include <urlbridge/curl_engine.hpp>
#include <urlbridge/zlib.hpp>
#include <urlbridge/log.hpp>
#include <curl/curl.h>
#include <unordered_map>
#include <algorithm>
#include <charconv>
#include <cstring>
#include <thread>
#include <atomic>
#include <deque>
#include <cerrno>

URLBRIDGE_NS_BEGIN

namespace detail {

using Command = MoveOnlyFunction<void(CurlCore &)>;

class CurlRequest;

/**
 * @brief The network thread, owns the multi handle and every transfer in flight
 *
 * Everything touching curl runs on the thread, other threads talk to it by post().
 */
class CurlCore final {
public:
    CurlCore(const EngineParams &params, CURLM *multi) : mParams(params), mMulti(multi) { }
    CurlCore(const CurlCore &) = delete;
    ~CurlCore() {
        if (mThread.joinable()) {
            stop(true);
        }
        ::curl_multi_cleanup(mMulti);
    }

    auto launch() -> void {
        mThread = std::thread(&CurlCore::run, this);
        mThreadId = mThread.get_id();
    }

    /**
     * @brief Queue the command on the network thread
     *
     * @param cmd
     * @return true The command will run
     * @return false The core is stopping, the command is dropped
     */
    auto post(Command cmd) -> bool {
        {
            std::lock_guard locker(mMutex);
            if (mStopping) {
                return false;
            }
            mCommands.emplace_back(std::move(cmd));
        }
        if (auto code = ::curl_multi_wakeup(mMulti); code != CURLM_OK) {
            URLBRIDGE_ERROR("Curl", "Failed to wakeup the network thread: {}", ::curl_multi_strerror(code));
        }
        return true;
    }

    /**
     * @brief Stop the network thread and join it
     *
     * @param cancelActive Cancel the requests still in flight, they get onCanceled
     */
    auto stop(bool cancelActive) -> void;

    auto isNetworkThread() const -> bool {
        return std::this_thread::get_id() == mThreadId;
    }

    auto params() const -> const EngineParams & { return mParams; }
    auto activeRequests() const -> size_t { return mActive.load(); }

    // Counted from start() to the terminal event
    auto acquire() -> void { ++mActive; }
    auto release() -> void { --mActive; }

    // Network thread only
    auto attach(std::shared_ptr<CurlRequest> request) -> void;
    auto detach(CurlRequest *request) -> void;
    auto addHandle(CURL *easy) -> CURLMcode { return ::curl_multi_add_handle(mMulti, easy); }
    auto removeHandle(CURL *easy) -> void {
        if (auto code = ::curl_multi_remove_handle(mMulti, easy); code != CURLM_OK) {
            URLBRIDGE_WARN("Curl", "Failed to remove the easy handle: {}", ::curl_multi_strerror(code));
        }
    }
private:
    auto run() -> void;
    auto processMessages() -> void;
    auto cancelAll() -> void;

    EngineParams mParams;
    CURLM *mMulti;
    std::thread mThread;
    std::thread::id mThreadId;
    std::atomic<size_t> mActive {0};

    std::mutex mMutex; //< Protect the command queue and the stopping flag
    std::deque<Command> mCommands;
    bool mStopping = false;

    std::unordered_map<CurlRequest *, std::shared_ptr<CurlRequest> > mRequests; //< Keep the started requests alive
};

/**
 * @brief One request, its legs run as easy handles on the core
 *
 */
class CurlRequest final : public UrlRequest, public UploadDataSink, public std::enable_shared_from_this<CurlRequest> {
public:
    enum class Phase {
        Created,
        Started,
        Done,
    };

    static constexpr size_t UploadChunkSize = 16 * 1024;

    CurlRequest(std::weak_ptr<CurlCore> core, bool checkResult, std::string url, std::shared_ptr<UrlRequestCallback> callback, Executor &executor, UrlRequestParams params) :
        mCore(std::move(core)), mCheckResult(checkResult), mCallback(std::move(callback)), mExecutor(executor),
        mUploadExecutor(params.uploadDataProviderExecutor ? *params.uploadDataProviderExecutor : executor),
        mParams(std::move(params)), mUrl(std::move(url))
    {
        mUrlChain.push_back(mUrl);
    }

    ~CurlRequest() {
        if (mHeaderList) {
            ::curl_slist_free_all(mHeaderList);
        }
    }

    // UrlRequest
    auto start() -> EngineResult override;
    auto followRedirect() -> EngineResult override;
    auto read(std::unique_ptr<ReadBuffer> buffer) -> EngineResult override;
    auto cancel() -> void override;
    auto isDone() const -> bool override { return mPhase.load() == Phase::Done; }
    auto getStatus(std::shared_ptr<UrlRequestStatusListener> listener) -> EngineResult override;

    // UploadDataSink, called on the upload executor
    auto onReadSucceeded(size_t bytesRead, bool finalChunk) -> void override;
    auto onReadError(std::string_view message) -> void override;
    auto onRewindSucceeded() -> void override;
    auto onRewindError(std::string_view message) -> void override;

    // Network thread
    auto begin(CurlCore &core) -> void;
    auto onTransferDone(CurlCore &core, CURLcode code) -> void;
    auto doCancel(CurlCore &core) -> void;
private:
    auto post(Command cmd) -> bool;
    auto beginLeg(CurlCore &core) -> void;
    auto finishLeg(CurlCore &core) -> void;
    auto configure(const EngineParams &engine) -> CURLcode;
    auto buildHeaders(const EngineParams &engine) -> bool;
    auto followLeg(CurlCore &core) -> void;
    auto finish(CurlCore &core) -> void;
    auto fail(CurlCore &core, NetError error) -> void;
    auto succeed(CurlCore &core) -> void;
    auto serveRead() -> void;
    auto updatePause() -> void;
    auto closeUpload() -> void;
    auto requestUpload() -> void;
    auto snapshot() const -> std::shared_ptr<const UrlResponseInfo>;
    auto lastInfo() const -> std::shared_ptr<const UrlResponseInfo>;
    auto toNetError(CURLcode code) const -> NetError;
    auto buffered() const -> size_t { return mPending.size() - mPendingOffset; }
    auto currentStatus() const -> UrlRequestStatus;

    auto onHeaderLine(std::string_view line) -> void;
    auto onHeadersComplete() -> void;
    auto onBody(std::string_view data) -> size_t;
    auto onUploadRead(char *buffer, size_t size) -> size_t;

    static auto headerCallback(char *data, size_t size, size_t n, void *self) -> size_t;
    static auto writeCallback(char *data, size_t size, size_t n, void *self) -> size_t;
    static auto readCallback(char *data, size_t size, size_t n, void *self) -> size_t;
    static auto prereqCallback(void *self, char *remoteIp, char *localIp, int remotePort, int localPort) -> int;

    /**
     * @brief Run the callback on the request's executor, the request and the callback are kept alive until it ran
     *
     * @param fn void(CurlRequest &, UrlRequestCallback &)
     */
    template <typename Fn>
    auto deliver(Fn fn) -> void {
        mExecutor.execute([self = shared_from_this(), callback = mCallback, fn = std::move(fn)]() mutable {
            fn(*self, *callback);
        });
    }

    std::weak_ptr<CurlCore> mCore;
    bool mCheckResult;
    std::shared_ptr<UrlRequestCallback> mCallback;
    Executor &mExecutor;
    Executor &mUploadExecutor;
    UrlRequestParams mParams;
    std::string mUrl; //< The url of the current leg
    std::vector<std::string> mUrlChain;

    // Touched by any thread
    std::atomic<Phase> mPhase {Phase::Created};
    std::atomic<bool> mCancelRequested {false};
    std::atomic<bool> mRedirectPending {false}; //< Waiting for followRedirect()
    std::atomic<bool> mReadable {false}; //< The response started and no read is pending
    std::atomic<UrlRequestStatus> mStatus {UrlRequestStatus::Idle}; //< Of the current leg, written by the network thread

    // Network thread only
    CURL *mEasy = nullptr;
    curl_slist *mHeaderList = nullptr;
    char mErrorBuffer[CURL_ERROR_SIZE] {};
    UrlResponseInfo mInfo;
    int64_t mReceived = 0;
    int mRedirectCount = 0;
    std::string mRedirectUrl;
    bool mRedirect = false; //< The current leg ends in a redirect
    bool mResponseStarted = false;
    bool mTransferDone = false;
    bool mPaused = false;
    bool mTerminal = false;
    std::optional<std::string> mDecodeError;
    std::unique_ptr<zlib::Decompressor> mDecompressor;
    std::vector<std::byte> mPending; //< The decoded body not read yet
    size_t mPendingOffset = 0;
    std::unique_ptr<ReadBuffer> mReadBuffer;

    // Upload, the buffer is owned by the provider while mUploadReading
    std::vector<std::byte> mUploadBuffer;
    size_t mUploadOffset = 0;
    size_t mUploadAvail = 0;
    bool mUploadFinal = false;
    bool mUploadReading = false;
    bool mUploadPaused = false;
    std::optional<std::string> mUploadError;
};

// Core
auto CurlCore::stop(bool cancelActive) -> void {
    {
        std::lock_guard locker(mMutex);
        if (!mStopping) {
            mStopping = true;
            if (cancelActive) {
                mCommands.emplace_back([](CurlCore &core) { core.cancelAll(); });
            }
        }
    }
    if (auto code = ::curl_multi_wakeup(mMulti); code != CURLM_OK) {
        URLBRIDGE_ERROR("Curl", "Failed to wakeup the network thread: {}", ::curl_multi_strerror(code));
    }
    if (mThread.joinable()) {
        mThread.join();
    }
}

auto CurlCore::attach(std::shared_ptr<CurlRequest> request) -> void {
    auto ptr = request.get();
    mRequests.emplace(ptr, std::move(request));
}

auto CurlCore::detach(CurlRequest *request) -> void {
    if (mRequests.erase(request) != 0) {
        release();
    }
}

auto CurlCore::cancelAll() -> void {
    if (mRequests.empty()) {
        return;
    }
    URLBRIDGE_INFO("Curl", "Cancel {} requests in flight", mRequests.size());
    auto requests = mRequests; // doCancel() detaches
    for (auto &[_, request] : requests) {
        request->doCancel(*this);
    }
}

auto CurlCore::run() -> void {
    URLBRIDGE_DEBUG("Curl", "Network thread started");
    while (true) {
        std::deque<Command> commands;
        bool stopping = false;
        {
            std::lock_guard locker(mMutex);
            commands.swap(mCommands);
            stopping = mStopping;
        }
        for (auto &cmd : commands) {
            cmd(*this);
        }
        if (stopping) {
            break;
        }
        int running = 0;
        if (auto code = ::curl_multi_perform(mMulti, &running); code != CURLM_OK) {
            URLBRIDGE_ERROR("Curl", "curl_multi_perform failed: {}", ::curl_multi_strerror(code));
        }
        processMessages();
        if (auto code = ::curl_multi_poll(mMulti, nullptr, 0, 1000, nullptr); code != CURLM_OK) {
            URLBRIDGE_ERROR("Curl", "curl_multi_poll failed: {}", ::curl_multi_strerror(code));
        }
    }
    URLBRIDGE_DEBUG("Curl", "Network thread quit");
}

auto CurlCore::processMessages() -> void {
    int left = 0;
    while (auto msg = ::curl_multi_info_read(mMulti, &left)) {
        if (msg->msg != CURLMSG_DONE) {
            continue;
        }
        auto easy = msg->easy_handle;
        auto code = msg->data.result;
        char *priv = nullptr;
        ::curl_easy_getinfo(easy, CURLINFO_PRIVATE, &priv);
        auto it = mRequests.find(reinterpret_cast<CurlRequest *>(priv));
        if (it == mRequests.end()) {
            URLBRIDGE_WARN("Curl", "Transfer done for an unknown handle");
            removeHandle(easy);
            continue;
        }
        auto request = it->second; // onTransferDone() may detach it
        request->onTransferDone(*this, code);
    }
}

// Request, any thread
auto CurlRequest::post(Command cmd) -> bool {
    auto core = mCore.lock();
    if (!core) {
        return false;
    }
    return core->post(std::move(cmd));
}

auto CurlRequest::start() -> EngineResult {
    if (mPhase.load() != Phase::Created) {
        return EngineResult::IllegalStateRequestAlreadyStarted;
    }
    if (mCheckResult) {
        if (!isValidHttpMethod(mParams.method)) {
            return EngineResult::IllegalArgumentInvalidHttpMethod;
        }
        for (const auto &header : mParams.headers) {
            if (!isValidHttpHeader(header.name, header.value)) {
                return EngineResult::IllegalArgumentInvalidHttpHeader;
            }
        }
    }
    auto core = mCore.lock();
    if (!core) {
        return EngineResult::IllegalStateEngineNotStarted;
    }
    auto expected = Phase::Created;
    if (!mPhase.compare_exchange_strong(expected, Phase::Started)) {
        return EngineResult::IllegalStateRequestAlreadyStarted;
    }
    core->acquire();
    if (!core->post([self = shared_from_this()](CurlCore &core) { self->begin(core); })) {
        core->release();
        mPhase = Phase::Done;
        return EngineResult::IllegalStateEngineNotStarted;
    }
    return EngineResult::Success;
}

auto CurlRequest::getStatus(std::shared_ptr<UrlRequestStatusListener> listener) -> EngineResult {
    if (!listener) {
        return EngineResult::NullPointerCallback;
    }
    mExecutor.execute([listener = std::move(listener), status = currentStatus()]() {
        notifyStatus(*listener, status);
    });
    return EngineResult::Success;
}

auto CurlRequest::currentStatus() const -> UrlRequestStatus {
    if (mPhase.load() != Phase::Started) {
        return UrlRequestStatus::Invalid;
    }
    if (mRedirectPending.load()) { // The callback decides
        return UrlRequestStatus::Idle;
    }
    return mStatus.load();
}

auto CurlRequest::followRedirect() -> EngineResult {
    if (!mRedirectPending.exchange(false)) {
        return EngineResult::IllegalStateUnexpectedRedirect;
    }
    if (!post([self = shared_from_this()](CurlCore &core) { self->followLeg(core); })) {
        return EngineResult::IllegalStateEngineNotStarted;
    }
    return EngineResult::Success;
}

auto CurlRequest::read(std::unique_ptr<ReadBuffer> buffer) -> EngineResult {
    if (!buffer) {
        return EngineResult::NullPointerBuffer;
    }
    if (buffer->size() == 0) {
        return EngineResult::IllegalArgument;
    }
    if (mPhase.load() == Phase::Created) {
        return EngineResult::IllegalStateRequestNotStarted;
    }
    if (!mReadable.exchange(false)) {
        return EngineResult::IllegalStateUnexpectedRead;
    }
    auto cmd = [self = shared_from_this(), buffer = std::move(buffer)](CurlCore &) mutable {
        if (self->mTerminal) {
            return;
        }
        self->mReadBuffer = std::move(buffer);
        self->serveRead();
    };
    if (!post(std::move(cmd))) {
        return EngineResult::IllegalStateEngineNotStarted;
    }
    return EngineResult::Success;
}

auto CurlRequest::cancel() -> void {
    auto expected = Phase::Created;
    if (mPhase.compare_exchange_strong(expected, Phase::Done)) {
        return; // Never started, nothing to report
    }
    if (mPhase.load() == Phase::Done || mCancelRequested.exchange(true)) {
        return;
    }
    // The engine is gone, it canceled the request on its way out
    post([self = shared_from_this()](CurlCore &core) { self->doCancel(core); });
}

// Upload sink, any thread
auto CurlRequest::onReadSucceeded(size_t bytesRead, bool finalChunk) -> void {
    post([self = shared_from_this(), bytesRead, finalChunk](CurlCore &) {
        if (self->mTerminal) {
            return;
        }
        self->mUploadReading = false;
        if (bytesRead > self->mUploadBuffer.size()) {
            self->mUploadError = fmtlib::format("The provider read {} bytes into a buffer of {}", bytesRead, self->mUploadBuffer.size());
        }
        else {
            self->mUploadAvail = bytesRead;
            self->mUploadOffset = 0;
            self->mUploadFinal = finalChunk;
        }
        if (self->mUploadPaused) {
            self->mUploadPaused = false;
            self->updatePause();
        }
    });
}

auto CurlRequest::onReadError(std::string_view message) -> void {
    post([self = shared_from_this(), message = std::string(message)](CurlCore &) mutable {
        if (self->mTerminal) {
            return;
        }
        URLBRIDGE_WARN("Curl", "Upload read failed: {}", message);
        self->mUploadReading = false;
        self->mUploadError = std::move(message);
        if (self->mUploadPaused) {
            self->mUploadPaused = false;
            self->updatePause(); // The read callback aborts the transfer
        }
    });
}

auto CurlRequest::onRewindSucceeded() -> void {
    post([self = shared_from_this()](CurlCore &core) {
        if (self->mTerminal) {
            return;
        }
        self->beginLeg(core);
    });
}

auto CurlRequest::onRewindError(std::string_view message) -> void {
    post([self = shared_from_this(), message = std::string(message)](CurlCore &core) {
        self->fail(core, NetError {
            .code = NetErrorCode::Other,
            .internalErrorCode = 0,
            .message = fmtlib::format("Failed to rewind the upload: {}", message)
        });
    });
}

// Request, network thread
auto CurlRequest::begin(CurlCore &core) -> void {
    core.attach(shared_from_this());
    if (mCancelRequested.load()) { // cancel() raced with start(), its command follows
        return;
    }
    beginLeg(core);
}

auto CurlRequest::beginLeg(CurlCore &core) -> void {
    mRedirect = false;
    mRedirectUrl.clear();
    mResponseStarted = false;
    mTransferDone = false;
    mPaused = false;
    mDecodeError.reset();
    mDecompressor.reset();
    mPending.clear();
    mPendingOffset = 0;
    mUploadOffset = 0;
    mUploadAvail = 0;
    mUploadFinal = false;
    mUploadReading = false;
    mUploadPaused = false;
    mUploadError.reset();
    mErrorBuffer[0] = '\0';

    mEasy = ::curl_easy_init();
    if (!mEasy) {
        fail(core, NetError {NetErrorCode::Other, static_cast<int>(CURLE_FAILED_INIT), "Failed to create the curl handle"});
        return;
    }
    if (auto code = configure(core.params()); code != CURLE_OK) {
        fail(core, NetError {NetErrorCode::Other, static_cast<int>(code), fmtlib::format("Failed to setup the request: {}", ::curl_easy_strerror(code))});
        return;
    }
    if (auto code = core.addHandle(mEasy); code != CURLM_OK) {
        ::curl_easy_cleanup(mEasy);
        mEasy = nullptr;
        fail(core, NetError {NetErrorCode::Other, static_cast<int>(code), fmtlib::format("Failed to add the request: {}", ::curl_multi_strerror(code))});
        return;
    }
    mStatus = UrlRequestStatus::Connecting; // Name resolution included, curl does not tell them apart
    URLBRIDGE_DEBUG("Curl", "{} {} started", mParams.method, mUrl);
}

auto CurlRequest::finishLeg(CurlCore &core) -> void {
    if (mEasy) {
        core.removeHandle(mEasy);
        ::curl_easy_cleanup(mEasy);
        mEasy = nullptr;
    }
    if (mHeaderList) {
        ::curl_slist_free_all(mHeaderList);
        mHeaderList = nullptr;
    }
}

auto CurlRequest::buildHeaders(const EngineParams &engine) -> bool {
    auto append = [this](const std::string &line) {
        auto list = ::curl_slist_append(mHeaderList, line.c_str());
        if (!list) {
            return false;
        }
        mHeaderList = list;
        return true;
    };
    auto headers = HttpHeaders::fromList(mParams.headers);
    for (const auto &header : mParams.headers) {
        // "Name;" is how curl spells a header with an empty value
        auto line = header.value.empty() ? fmtlib::format("{};", header.name) : fmtlib::format("{}: {}", header.name, header.value);
        if (!append(line)) {
            return false;
        }
    }
    if (!engine.acceptLanguage.empty() && !headers.contains(HttpHeaders::AcceptLanguage)) {
        if (!append(fmtlib::format("Accept-Language: {}", engine.acceptLanguage))) {
            return false;
        }
    }
    if (!headers.contains(HttpHeaders::AcceptEncoding)) {
        if (!append("Accept-Encoding: gzip, deflate")) {
            return false;
        }
    }
    if (mParams.disableCache && !headers.contains("Cache-Control")) {
        if (!append("Cache-Control: no-cache")) {
            return false;
        }
    }
    if (mParams.uploadDataProvider) {
        if (!append("Expect:")) { // No 100-continue round trip
            return false;
        }
    }
    return true;
}

auto CurlRequest::configure(const EngineParams &engine) -> CURLcode {
    CURLcode code = CURLE_OK;
    auto set = [&, this](CURLoption option, auto value) {
        if (code == CURLE_OK) {
            code = ::curl_easy_setopt(mEasy, option, value);
        }
    };
    set(CURLOPT_URL, mUrl.c_str());
    set(CURLOPT_PRIVATE, static_cast<void *>(this));
    set(CURLOPT_NOSIGNAL, 1L);
    set(CURLOPT_ERRORBUFFER, mErrorBuffer);
    set(CURLOPT_FOLLOWLOCATION, 0L); // Redirects go through onRedirectReceived
    set(CURLOPT_HTTP_VERSION, engine.enableHttp2 ? long(CURL_HTTP_VERSION_2TLS) : long(CURL_HTTP_VERSION_1_1));
    set(CURLOPT_HEADERFUNCTION, &CurlRequest::headerCallback);
    set(CURLOPT_HEADERDATA, static_cast<void *>(this));
    set(CURLOPT_WRITEFUNCTION, &CurlRequest::writeCallback);
    set(CURLOPT_WRITEDATA, static_cast<void *>(this));
    set(CURLOPT_PREREQFUNCTION, &CurlRequest::prereqCallback);
    set(CURLOPT_PREREQDATA, static_cast<void *>(this));
    if (!engine.userAgent.empty()) {
        set(CURLOPT_USERAGENT, engine.userAgent.c_str());
    }
    if (!engine.proxyUrl.empty()) {
        set(CURLOPT_PROXY, engine.proxyUrl.c_str());
        set(CURLOPT_SUPPRESS_CONNECT_HEADERS, 1L);
        if (!engine.proxyUsername.empty()) {
            set(CURLOPT_PROXYUSERNAME, engine.proxyUsername.c_str());
            set(CURLOPT_PROXYPASSWORD, engine.proxyPassword.c_str());
        }
    }

    const auto &method = mParams.method;
    if (mParams.uploadDataProvider) {
        set(CURLOPT_POST, 1L);
        set(CURLOPT_READFUNCTION, &CurlRequest::readCallback);
        set(CURLOPT_READDATA, static_cast<void *>(this));
        // -1 makes curl send it chunked
        set(CURLOPT_POSTFIELDSIZE_LARGE, curl_off_t(mParams.uploadDataProvider->length()));
        if (method != "POST") {
            set(CURLOPT_CUSTOMREQUEST, method.c_str());
        }
    }
    else if (method == "GET") {
        set(CURLOPT_HTTPGET, 1L);
    }
    else if (method == "HEAD") {
        set(CURLOPT_NOBODY, 1L);
    }
    else if (method == "POST") {
        set(CURLOPT_POST, 1L);
        set(CURLOPT_POSTFIELDS, "");
        set(CURLOPT_POSTFIELDSIZE_LARGE, curl_off_t(0));
    }
    else {
        set(CURLOPT_CUSTOMREQUEST, method.c_str());
    }
    if (code != CURLE_OK) {
        return code;
    }
    if (!buildHeaders(engine)) {
        return CURLE_OUT_OF_MEMORY;
    }
    set(CURLOPT_HTTPHEADER, mHeaderList);
    return code;
}

auto CurlRequest::onTransferDone(CurlCore &core, CURLcode code) -> void {
    if (mTerminal) {
        return;
    }
    if (code != CURLE_OK) {
        fail(core, toNetError(code));
        return;
    }
    if (mRedirect) {
        finishLeg(core);
        if (++mRedirectCount > CurlEngine::MaxRedirects) {
            fail(core, NetError {
                .code = NetErrorCode::TooManyRedirects,
                .internalErrorCode = static_cast<int>(CURLE_TOO_MANY_REDIRECTS),
                .message = fmtlib::format("Too many redirects, more than {}", CurlEngine::MaxRedirects)
            });
            return;
        }
        URLBRIDGE_DEBUG("Curl", "{} redirect to {}", mInfo.httpStatusCode, mRedirectUrl);
        deliver([info = snapshot(), location = mRedirectUrl](CurlRequest &self, UrlRequestCallback &callback) {
            self.mRedirectPending = true;
            callback.onRedirectReceived(self, *info, location);
        });
        return;
    }
    if (!mResponseStarted) {
        fail(core, NetError {NetErrorCode::ConnectionClosed, static_cast<int>(CURLE_GOT_NOTHING), "The transfer ended without a response"});
        return;
    }
    if (mDecompressor && !mDecompressor->isFinished()) {
        URLBRIDGE_WARN("Curl", "The encoded body of {} is truncated", mUrl);
    }
    mTransferDone = true;
    finishLeg(core); // The connection goes back to the pool, the body stays buffered
    serveRead();
}

auto CurlRequest::followLeg(CurlCore &core) -> void {
    if (mTerminal) {
        return;
    }
    auto status = mInfo.httpStatusCode;
    auto &method = mParams.method;
    bool toGet = (status == 303 && method != "HEAD") || ((status == 301 || status == 302) && method == "POST");
    mUrl = mRedirectUrl;
    mUrlChain.push_back(mUrl);
    mStatus = UrlRequestStatus::Idle; // Until the next leg is added
    if (toGet) {
        method = "GET";
        closeUpload();
        std::erase_if(mParams.headers, [](const HttpHeader &header) {
            return mem::iequals(header.name, "Content-Type") || mem::iequals(header.name, "Content-Length") ||
                mem::iequals(header.name, "Content-Encoding");
        });
        beginLeg(core);
        return;
    }
    if (mParams.uploadDataProvider) { // 307 / 308 send the body again
        mUploadExecutor.execute([self = shared_from_this(), provider = mParams.uploadDataProvider]() {
            try {
                provider->rewind(*self);
            }
            catch (const std::exception &e) {
                self->onRewindError(e.what());
            }
        });
        return;
    }
    beginLeg(core);
}

auto CurlRequest::doCancel(CurlCore &core) -> void {
    if (mTerminal) {
        return;
    }
    URLBRIDGE_DEBUG("Curl", "{} {} canceled", mParams.method, mUrl);
    auto info = lastInfo();
    finish(core);
    deliver([info](CurlRequest &self, UrlRequestCallback &callback) {
        callback.onCanceled(self, info.get());
    });
}

auto CurlRequest::fail(CurlCore &core, NetError error) -> void {
    if (mTerminal) {
        return;
    }
    URLBRIDGE_WARN("Curl", "{} {} failed: {}", mParams.method, mUrl, error.message);
    auto info = lastInfo();
    finish(core);
    deliver([info, error = std::move(error)](CurlRequest &self, UrlRequestCallback &callback) {
        callback.onFailed(self, info.get(), error);
    });
}

auto CurlRequest::succeed(CurlCore &core) -> void {
    URLBRIDGE_DEBUG("Curl", "{} {} succeeded with {} bytes received", mParams.method, mUrl, mReceived);
    auto info = snapshot();
    finish(core);
    deliver([info](CurlRequest &self, UrlRequestCallback &callback) {
        callback.onSucceeded(self, *info);
    });
}

auto CurlRequest::finish(CurlCore &core) -> void {
    auto self = shared_from_this(); // detach() drops the core's reference
    mTerminal = true;
    mPhase = Phase::Done;
    mReadable = false;
    mRedirectPending = false;
    mReadBuffer.reset();
    finishLeg(core);
    closeUpload();
    core.detach(this);
}

auto CurlRequest::closeUpload() -> void {
    if (!mParams.uploadDataProvider) {
        return;
    }
    mUploadExecutor.execute([provider = std::move(mParams.uploadDataProvider)]() {
        provider->close();
    });
    mParams.uploadDataProvider.reset();
}

auto CurlRequest::serveRead() -> void {
    if (!mReadBuffer || mTerminal) {
        return;
    }
    if (auto available = buffered(); available > 0) {
        auto buffer = std::move(mReadBuffer);
        auto n = std::min(available, buffer->size());
        ::memcpy(buffer->data().data(), mPending.data() + mPendingOffset, n);
        mPendingOffset += n;
        if (mPendingOffset == mPending.size()) {
            mPending.clear();
            mPendingOffset = 0;
        }
        deliver([info = snapshot(), buffer = std::move(buffer), n](CurlRequest &self, UrlRequestCallback &callback) mutable {
            self.mReadable = true;
            callback.onReadCompleted(self, *info, std::move(buffer), n);
        });
        if (mPaused && buffered() <= CurlEngine::MaxBufferedBytes) {
            mPaused = false;
            updatePause();
        }
        return;
    }
    if (mTransferDone) { // A read at the end of the body
        auto core = mCore.lock();
        if (core) {
            succeed(*core);
        }
        return;
    }
    if (mPaused) {
        mPaused = false;
        updatePause();
    }
}

auto CurlRequest::updatePause() -> void {
    if (!mEasy) {
        return;
    }
    int mask = (mPaused ? CURLPAUSE_RECV : 0) | (mUploadPaused ? CURLPAUSE_SEND : 0);
    if (auto code = ::curl_easy_pause(mEasy, mask); code != CURLE_OK) {
        URLBRIDGE_WARN("Curl", "curl_easy_pause failed: {}", ::curl_easy_strerror(code));
    }
}

auto CurlRequest::requestUpload() -> void {
    mUploadReading = true;
    if (mUploadBuffer.empty()) {
        mUploadBuffer.resize(UploadChunkSize);
    }
    mUploadExecutor.execute([self = shared_from_this(), provider = mParams.uploadDataProvider]() {
        try {
            provider->read(*self, MutableBuffer(self->mUploadBuffer));
        }
        catch (const std::exception &e) {
            self->onReadError(e.what());
        }
    });
}

auto CurlRequest::snapshot() const -> std::shared_ptr<const UrlResponseInfo> {
    auto info = std::make_shared<UrlResponseInfo>(mInfo);
    info->receivedByteCount = mReceived;
    return info;
}

auto CurlRequest::lastInfo() const -> std::shared_ptr<const UrlResponseInfo> {
    if (mInfo.httpStatusCode == 0) {
        return nullptr;
    }
    return snapshot();
}

auto CurlRequest::toNetError(CURLcode code) const -> NetError {
    if (mDecodeError) {
        return NetError {NetErrorCode::Other, static_cast<int>(code), fmtlib::format("Failed to decode the response body: {}", *mDecodeError)};
    }
    if (mUploadError) {
        return NetError {NetErrorCode::Other, static_cast<int>(code), fmtlib::format("Upload failed: {}", *mUploadError)};
    }
    long osErrno = 0;
    curl_off_t connectTime = 0;
    if (mEasy) {
        ::curl_easy_getinfo(mEasy, CURLINFO_OS_ERRNO, &osErrno);
        ::curl_easy_getinfo(mEasy, CURLINFO_CONNECT_TIME_T, &connectTime);
    }
    NetErrorCode kind = NetErrorCode::Other;
    switch (code) {
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:
            kind = NetErrorCode::HostnameNotResolved;
            break;
        case CURLE_COULDNT_CONNECT: {
            switch (osErrno) {
                case ENETUNREACH:
                case EHOSTUNREACH: kind = NetErrorCode::AddressUnreachable; break;
                case ENETDOWN: kind = NetErrorCode::InternetDisconnected; break;
                default: kind = NetErrorCode::ConnectionRefused; break;
            }
            break;
        }
        case CURLE_OPERATION_TIMEDOUT:
            kind = connectTime == 0 ? NetErrorCode::ConnectionTimedOut : NetErrorCode::TimedOut;
            break;
        case CURLE_SEND_ERROR:
        case CURLE_RECV_ERROR:
            kind = NetErrorCode::ConnectionReset;
            break;
        case CURLE_GOT_NOTHING:
        case CURLE_PARTIAL_FILE:
            kind = NetErrorCode::ConnectionClosed;
            break;
        case CURLE_HTTP3:
        case CURLE_QUIC_CONNECT_ERROR:
            kind = NetErrorCode::QuicProtocolFailed;
            break;
        default:
            break;
    }
    std::string message = mErrorBuffer[0] ? std::string(mErrorBuffer) : std::string(::curl_easy_strerror(code));
    return NetError {kind, static_cast<int>(code), std::move(message)};
}

// Curl callbacks, inside curl_multi_perform
auto CurlRequest::onHeaderLine(std::string_view line) -> void {
    mReceived += line.size();
    if (line.starts_with("HTTP/")) { // A new response, interim ones included
        mStatus = UrlRequestStatus::ReadingResponse;
        mInfo.httpStatusCode = 0;
        mInfo.httpStatusText.clear();
        mInfo.allHeaders.clear();
        auto status = mem::trim(line);
        auto space = status.find(' ');
        if (space == std::string_view::npos) {
            return;
        }
        status.remove_prefix(space + 1);
        int code = 0;
        std::from_chars(status.data(), status.data() + status.size(), code);
        mInfo.httpStatusCode = code;
        if (auto reason = status.find(' '); reason != std::string_view::npos) {
            mInfo.httpStatusText = mem::trim(status.substr(reason + 1));
        }
        return;
    }
    auto text = mem::trim(line);
    if (text.empty()) {
        onHeadersComplete();
        return;
    }
    if (line.front() == ' ' || line.front() == '\t') { // Folded into the previous header
        if (!mInfo.allHeaders.empty()) {
            auto &value = mInfo.allHeaders.back().value;
            value += ' ';
            value += text;
        }
        return;
    }
    auto colon = text.find(':');
    if (colon == std::string_view::npos) {
        URLBRIDGE_DEBUG("Curl", "Ignore the malformed header line {}", text);
        return;
    }
    mInfo.allHeaders.push_back(HttpHeader {
        .name = std::string(mem::trim(text.substr(0, colon))),
        .value = std::string(mem::trim(text.substr(colon + 1)))
    });
}

auto CurlRequest::onHeadersComplete() -> void {
    long status = 0;
    ::curl_easy_getinfo(mEasy, CURLINFO_RESPONSE_CODE, &status);
    if (status < 200) { // Interim, the real response follows
        return;
    }
    long version = 0;
    ::curl_easy_getinfo(mEasy, CURLINFO_HTTP_VERSION, &version);
    switch (version) {
        case CURL_HTTP_VERSION_1_0: mInfo.negotiatedProtocol = "http/1.0"; break;
        case CURL_HTTP_VERSION_1_1: mInfo.negotiatedProtocol = "http/1.1"; break;
        case CURL_HTTP_VERSION_2_0: mInfo.negotiatedProtocol = "h2"; break;
        case CURL_HTTP_VERSION_3: mInfo.negotiatedProtocol = "h3"; break;
        default: mInfo.negotiatedProtocol.clear(); break;
    }
    mInfo.httpStatusCode = int(status);
    mInfo.url = mUrl;
    mInfo.urlChain = mUrlChain;
    mInfo.wasCached = false;

    char *location = nullptr;
    ::curl_easy_getinfo(mEasy, CURLINFO_REDIRECT_URL, &location);
    if (status >= 300 && status < 400 && location) {
        mRedirect = true; // The body of the redirect is dropped
        mRedirectUrl = location;
        return;
    }

    auto headers = HttpHeaders::fromList(mInfo.allHeaders);
    auto encoding = mem::trim(headers.value(HttpHeaders::ContentEncoding));
    if (mem::iequals(encoding, "gzip") || mem::iequals(encoding, "x-gzip")) {
        mDecompressor = std::make_unique<zlib::Decompressor>(zlib::GzipFormat);
    }
    else if (mem::iequals(encoding, "deflate")) {
        mDecompressor = std::make_unique<zlib::Decompressor>(zlib::DeflateFormat);
    }
    mResponseStarted = true;
    URLBRIDGE_DEBUG("Curl", "{} {} response started, status {}", mParams.method, mUrl, status);
    deliver([info = snapshot()](CurlRequest &self, UrlRequestCallback &callback) {
        self.mReadable = true;
        callback.onResponseStarted(self, *info);
    });
}

auto CurlRequest::onBody(std::string_view data) -> size_t {
    if (mRedirect || !mResponseStarted) {
        mReceived += data.size();
        return data.size();
    }
    if (buffered() > CurlEngine::MaxBufferedBytes) { // curl hands the same data again after the resume
        mPaused = true;
        return CURL_WRITEFUNC_PAUSE;
    }
    mReceived += data.size();
    auto bytes = std::as_bytes(std::span(data));
    if (mDecompressor) {
        if (auto ret = mDecompressor->decompressTo(bytes, mPending); !ret) {
            mDecodeError = ret.error().message();
            return 0; // Abort with CURLE_WRITE_ERROR
        }
    }
    else {
        mPending.insert(mPending.end(), bytes.begin(), bytes.end());
    }
    serveRead();
    return data.size();
}

auto CurlRequest::onUploadRead(char *buffer, size_t size) -> size_t {
    if (mUploadError) {
        return CURL_READFUNC_ABORT;
    }
    if (mUploadAvail > 0) {
        auto n = std::min(mUploadAvail, size);
        ::memcpy(buffer, mUploadBuffer.data() + mUploadOffset, n);
        mUploadOffset += n;
        mUploadAvail -= n;
        return n;
    }
    if (mUploadFinal) {
        mStatus = UrlRequestStatus::WaitingForResponse;
        return 0;
    }
    if (!mUploadReading) {
        requestUpload();
    }
    mUploadPaused = true;
    return CURL_READFUNC_PAUSE;
}

auto CurlRequest::headerCallback(char *data, size_t size, size_t n, void *self) -> size_t {
    static_cast<CurlRequest *>(self)->onHeaderLine(std::string_view(data, size * n));
    return size * n;
}

auto CurlRequest::writeCallback(char *data, size_t size, size_t n, void *self) -> size_t {
    return static_cast<CurlRequest *>(self)->onBody(std::string_view(data, size * n));
}

auto CurlRequest::readCallback(char *data, size_t size, size_t n, void *self) -> size_t {
    return static_cast<CurlRequest *>(self)->onUploadRead(data, size * n);
}

// Connected, the request is about to go out
auto CurlRequest::prereqCallback(void *self, char *, char *, int, int) -> int {
    auto request = static_cast<CurlRequest *>(self);
    request->mStatus = request->mParams.uploadDataProvider ? UrlRequestStatus::SendingRequest : UrlRequestStatus::WaitingForResponse;
    return CURL_PREREQFUNC_OK;
}

} // namespace detail

using detail::CurlCore;
using detail::CurlRequest;

namespace {
    auto initGlobal() -> bool {
        static const CURLcode code = ::curl_global_init(CURL_GLOBAL_DEFAULT);
        if (code != CURLE_OK) {
            URLBRIDGE_ERROR("Curl", "curl_global_init failed: {}", ::curl_easy_strerror(code));
        }
        return code == CURLE_OK;
    }

    auto isTokenChar(char ch) -> bool {
        if ((ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') || (ch >= '0' && ch <= '9')) {
            return true;
        }
        return std::string_view("!#$%&'*+-.^_`|~").find(ch) != std::string_view::npos;
    }

    auto isToken(std::string_view str) -> bool {
        return !str.empty() && std::all_of(str.begin(), str.end(), isTokenChar);
    }
}

auto isValidHttpMethod(std::string_view method) -> bool {
    return isToken(method);
}

auto isValidHttpHeader(std::string_view name, std::string_view value) -> bool {
    return isToken(name) && value.find_first_of(std::string_view("\r\n\0", 3)) == std::string_view::npos;
}

CurlEngine::CurlEngine() = default;

CurlEngine::~CurlEngine() {
    std::lock_guard locker(mMutex);
    if (mCore) {
        mCore->stop(true);
        mCore.reset();
    }
}

auto CurlEngine::start(const EngineParams &params) -> EngineResult {
    std::lock_guard locker(mMutex);
    if (mCore || mShutdown) {
        return EngineResult::IllegalStateEngineAlreadyStarted;
    }
    if (!initGlobal()) {
        return EngineResult::IllegalState;
    }
    auto multi = ::curl_multi_init();
    if (!multi) {
        URLBRIDGE_ERROR("Curl", "curl_multi_init failed");
        return EngineResult::IllegalState;
    }
    if (auto code = ::curl_multi_setopt(multi, CURLMOPT_PIPELINING, long(CURLPIPE_MULTIPLEX)); code != CURLM_OK) {
        URLBRIDGE_WARN("Curl", "Failed to enable multiplexing: {}", ::curl_multi_strerror(code));
    }
    mCore = std::make_shared<CurlCore>(params, multi);
    mCore->launch();
    URLBRIDGE_INFO("Curl", "Engine started, {}", versionString());
    return EngineResult::Success;
}

auto CurlEngine::shutdown() -> EngineResult {
    std::lock_guard locker(mMutex);
    if (!mCore) {
        return EngineResult::IllegalStateEngineNotStarted;
    }
    if (mCore->isNetworkThread()) {
        return EngineResult::IllegalStateCannotShutdownFromNetworkThread;
    }
    if (auto n = mCore->activeRequests(); n > 0) {
        URLBRIDGE_WARN("Curl", "Cannot shutdown with {} requests in flight", n);
        return EngineResult::IllegalStateShutdownWithActiveRequests;
    }
    mCore->stop(false);
    mCore.reset();
    mShutdown = true;
    URLBRIDGE_INFO("Curl", "Engine shutdown");
    return EngineResult::Success;
}

auto CurlEngine::versionString() const -> std::string {
    auto info = ::curl_version_info(CURLVERSION_NOW);
    return fmtlib::format("urlbridge-curl/{}", info ? info->version : "unknown");
}

auto CurlEngine::newUrlRequest(std::string_view url, std::shared_ptr<UrlRequestCallback> callback, Executor &executor, UrlRequestParams params)
    -> Result<std::shared_ptr<UrlRequest>, EngineResult>
{
    std::lock_guard locker(mMutex);
    if (!mCore) {
        return Unexpected(EngineResult::IllegalStateEngineNotStarted);
    }
    if (url.empty()) {
        return Unexpected(EngineResult::NullPointerUrl);
    }
    if (!callback) {
        return Unexpected(EngineResult::NullPointerCallback);
    }
    auto checkResult = mCore->params().enableCheckResult;
    return std::make_shared<CurlRequest>(mCore, checkResult, std::string(url), std::move(callback), executor, std::move(params));
}

auto CurlEngine::activeRequests() const -> size_t {
    std::lock_guard locker(mMutex);
    return mCore ? mCore->activeRequests() : 0;
}

URLBRIDGE_NS_END
