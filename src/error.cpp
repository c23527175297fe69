#include <urlbridge/error.hpp>

URLBRIDGE_NS_BEGIN

auto toString(EngineResult res) -> std::string_view {
    switch (res) {
        case EngineResult::Success                                     : return "Success";
        case EngineResult::IllegalArgument                             : return "IllegalArgument";
        case EngineResult::IllegalArgumentInvalidHttpMethod            : return "IllegalArgumentInvalidHttpMethod";
        case EngineResult::IllegalArgumentInvalidHttpHeader            : return "IllegalArgumentInvalidHttpHeader";
        case EngineResult::IllegalState                                : return "IllegalState";
        case EngineResult::IllegalStateCannotShutdownFromNetworkThread : return "IllegalStateCannotShutdownFromNetworkThread";
        case EngineResult::IllegalStateEngineAlreadyStarted            : return "IllegalStateEngineAlreadyStarted";
        case EngineResult::IllegalStateRequestAlreadyStarted           : return "IllegalStateRequestAlreadyStarted";
        case EngineResult::IllegalStateRequestNotStarted               : return "IllegalStateRequestNotStarted";
        case EngineResult::IllegalStateUnexpectedRedirect              : return "IllegalStateUnexpectedRedirect";
        case EngineResult::IllegalStateUnexpectedRead                  : return "IllegalStateUnexpectedRead";
        case EngineResult::IllegalStateReadFailed                      : return "IllegalStateReadFailed";
        case EngineResult::IllegalStateShutdownWithActiveRequests      : return "IllegalStateShutdownWithActiveRequests";
        case EngineResult::IllegalStateEngineNotStarted                : return "IllegalStateEngineNotStarted";
        case EngineResult::NullPointer                                 : return "NullPointer";
        case EngineResult::NullPointerUrl                              : return "NullPointerUrl";
        case EngineResult::NullPointerCallback                         : return "NullPointerCallback";
        case EngineResult::NullPointerExecutor                         : return "NullPointerExecutor";
        case EngineResult::NullPointerBuffer                           : return "NullPointerBuffer";
        default                                                        : return "Unknown";
    }
}

auto toString(NetErrorCode code) -> std::string_view {
    switch (code) {
        case NetErrorCode::Callback             : return "Callback";
        case NetErrorCode::HostnameNotResolved  : return "HostnameNotResolved";
        case NetErrorCode::InternetDisconnected : return "InternetDisconnected";
        case NetErrorCode::NetworkChanged       : return "NetworkChanged";
        case NetErrorCode::TimedOut             : return "TimedOut";
        case NetErrorCode::ConnectionClosed     : return "ConnectionClosed";
        case NetErrorCode::ConnectionTimedOut   : return "ConnectionTimedOut";
        case NetErrorCode::ConnectionRefused    : return "ConnectionRefused";
        case NetErrorCode::ConnectionReset      : return "ConnectionReset";
        case NetErrorCode::AddressUnreachable   : return "AddressUnreachable";
        case NetErrorCode::QuicProtocolFailed   : return "QuicProtocolFailed";
        case NetErrorCode::Other                : return "Other";
        case NetErrorCode::TooManyRedirects     : return "TooManyRedirects";
        default                                 : return "Unknown";
    }
}

// --- EngineCategory
auto EngineCategory::name() const noexcept -> const char * {
    return "engine";
}

auto EngineCategory::message(int value) const -> std::string {
    return std::string(toString(EngineResult(value)));
}

auto EngineCategory::instance() noexcept -> const EngineCategory & {
    static constinit EngineCategory instance;
    return instance;
}

// --- NetCategory
auto NetCategory::name() const noexcept -> const char * {
    return "net";
}

auto NetCategory::message(int value) const -> std::string {
    return std::string(toString(NetErrorCode(value)));
}

auto NetCategory::instance() noexcept -> const NetCategory & {
    static constinit NetCategory instance;
    return instance;
}

// --- ClientError
auto ClientError::fromNetError(NetError err) -> ClientError {
    auto msg = err.message.empty() ? std::string("Network error occurred") : err.message;
    ClientError ret(Net, std::move(msg));
    ret.mNetError = std::move(err);
    return ret;
}

auto ClientError::fromCancellation() -> ClientError {
    return ClientError(Cancellation, "Request was cancelled");
}

auto ClientError::fromEngineResult(EngineResult res) -> ClientError {
    ClientError ret(Engine, fmtlib::format("Unexpected engine result: {}", URLBRIDGE_NAMESPACE::toString(res)));
    ret.mEngineResult = res;
    return ret;
}

auto ClientError::fromTimeout() -> ClientError {
    return ClientError(Timeout, "Request timed out");
}

auto ClientError::fromException(const std::exception &e) -> ClientError {
    return fromNetError(NetError {
        .code = NetErrorCode::Callback,
        .internalErrorCode = 0,
        .message = fmtlib::format("Exception in callback: {}", e.what()),
    });
}

auto ClientError::fromException(std::exception_ptr ptr) -> ClientError {
    if (!ptr) {
        return fromNetError(NetError {NetErrorCode::Callback, 0, "Exception in callback: unknown exception"});
    }
    try {
        std::rethrow_exception(ptr);
    }
    catch (const std::exception &e) {
        return fromException(e);
    }
    catch (...) {
        return fromNetError(NetError {
            .code = NetErrorCode::Callback,
            .internalErrorCode = 0,
            .message = "Exception in callback: unknown exception",
        });
    }
}

auto ClientError::code() const -> std::error_code {
    switch (mKind) {
        case Net:          return make_error_code(mNetError ? mNetError->code : NetErrorCode::Other);
        case Engine:       return make_error_code(mEngineResult.value_or(EngineResult::IllegalState));
        case Timeout:      return std::make_error_code(std::errc::timed_out);
        case Cancellation: return std::make_error_code(std::errc::operation_canceled);
        default:           URLBRIDGE_UNREACHABLE();
    }
}

auto ClientError::toString() const -> std::string {
    std::string_view kind;
    switch (mKind) {
        case Net:          kind = "NetError"; break;
        case Cancellation: kind = "CancellationError"; break;
        case Engine:       kind = "EngineError"; break;
        case Timeout:      kind = "TimeoutError"; break;
    }
    return fmtlib::format("{}: {}", kind, mMessage);
}

URLBRIDGE_NS_END
