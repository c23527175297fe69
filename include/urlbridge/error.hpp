/**
 * @file error.hpp
 * @brief Error codes reported by the engine and the typed error returned by the client
 * @version 0.1
 * @date 2026-03-02
 * 
 * @copyright Copyright (c) 2026
 * 
 */
#pragma once

#include <urlbridge/defines.hpp>
#include <urlbridge/result.hpp>
#include <system_error>
#include <exception>
#include <optional>
#include <string>

/**
 * @brief Macro to bind an error code enum to its std::error_category
 * 
 * @param errc Error code type
 * @param category Error category type with instance() static method
 * 
 */
#define URLBRIDGE_DECLARE_ERROR(errc, category)                                     \
    inline auto _urlbridge_error_category_of(errc) -> const std::error_category & { \
        return category::instance();                                                \
    }                                                                               \

URLBRIDGE_NS_BEGIN

// Result for doing file and stream operations
template <typename T>
using IoResult = Result<T, std::error_code>;

// Interop with std::error_code
template <typename T>
concept IntoError = requires(T t) {
    _urlbridge_error_category_of(t);  // Get the error category of T
};

/**
 * @brief The synchronous result of an engine call, 0 on success, negative values grouped by family
 * 
 */
enum class EngineResult : int {
    Success                                     = 0,

    IllegalArgument                             = -100,
    IllegalArgumentInvalidHttpMethod            = -104,
    IllegalArgumentInvalidHttpHeader            = -105,

    IllegalState                                = -200,
    IllegalStateCannotShutdownFromNetworkThread = -202,
    IllegalStateEngineAlreadyStarted            = -203,
    IllegalStateRequestAlreadyStarted           = -204,
    IllegalStateRequestNotStarted               = -207,
    IllegalStateUnexpectedRedirect              = -208,
    IllegalStateUnexpectedRead                  = -209,
    IllegalStateReadFailed                      = -210,
    IllegalStateShutdownWithActiveRequests      = -211,
    IllegalStateEngineNotStarted                = -212,

    NullPointer                                 = -300,
    NullPointerUrl                              = -306,
    NullPointerCallback                         = -307,
    NullPointerExecutor                         = -308,
    NullPointerBuffer                           = -309,
};

/**
 * @brief The transport / protocol error reported asynchronously through onFailed
 * 
 */
enum class NetErrorCode : int {
    Callback = 1,           //< A lifecycle callback threw
    HostnameNotResolved,    //< DNS lookup failed
    InternetDisconnected,   //< No network
    NetworkChanged,         //< Network changed during the request
    TimedOut,               //< The transfer timed out
    ConnectionClosed,       //< The peer closed the connection unexpectedly
    ConnectionTimedOut,     //< Connecting timed out
    ConnectionRefused,      //< Connection refused by peer
    ConnectionReset,        //< Connection reset by peer
    AddressUnreachable,     //< Host or network unreachable
    QuicProtocolFailed,     //< QUIC / HTTP3 failure
    Other,                  //< Anything else
    TooManyRedirects,       //< The redirect chain was too long
};

class URLBRIDGE_API EngineCategory final : public std::error_category {
public:
    auto name() const noexcept -> const char * override;
    auto message(int value) const -> std::string override;

    static auto instance() noexcept -> const EngineCategory &;
};

class URLBRIDGE_API NetCategory final : public std::error_category {
public:
    auto name() const noexcept -> const char * override;
    auto message(int value) const -> std::string override;

    static auto instance() noexcept -> const NetCategory &;
};

URLBRIDGE_DECLARE_ERROR(EngineResult, EngineCategory);
URLBRIDGE_DECLARE_ERROR(NetErrorCode, NetCategory);

template <IntoError T>
inline auto make_error_code(T t) -> std::error_code {
    return std::error_code(static_cast<int>(t), _urlbridge_error_category_of(t));
}

extern auto URLBRIDGE_API toString(EngineResult res) -> std::string_view;
extern auto URLBRIDGE_API toString(NetErrorCode code) -> std::string_view;

/**
 * @brief The error reported by the engine when a request fails
 * 
 */
struct NetError {
    NetErrorCode code = NetErrorCode::Other;
    int internalErrorCode = 0; //< The engine specific code (the curl code for CurlEngine)
    std::string message;

    auto operator ==(const NetError &other) const -> bool = default;
};

/**
 * @brief The typed error of a failed request, exactly one kind per instance
 * 
 */
class URLBRIDGE_API ClientError {
public:
    enum Kind : int {
        Net,            //< The engine reported a transport / protocol failure
        Cancellation,   //< The request was canceled
        Engine,         //< The engine refused to start or dispatch the request
        Timeout,        //< The client side deadline passed
    };

    /**
     * @brief Wrap an engine reported error
     * 
     * @param err 
     * @return ClientError 
     */
    static auto fromNetError(NetError err) -> ClientError;

    static auto fromCancellation() -> ClientError;

    /**
     * @brief Wrap an unexpected synchronous engine result
     * 
     * @param res 
     * @return ClientError 
     */
    static auto fromEngineResult(EngineResult res) -> ClientError;

    static auto fromTimeout() -> ClientError;

    /**
     * @brief Convert an exception raised inside a lifecycle handler, reported as NetErrorCode::Callback
     * 
     * @param e 
     * @return ClientError 
     */
    static auto fromException(const std::exception &e) -> ClientError;

    /**
     * @brief Convert a captured exception, non std exceptions get a generic message
     * 
     * @param ptr 
     * @return ClientError 
     */
    static auto fromException(std::exception_ptr ptr) -> ClientError;

    auto kind() const noexcept -> Kind { return mKind; }
    auto message() const noexcept -> const std::string & { return mMessage; }
    auto netError() const noexcept -> const std::optional<NetError> & { return mNetError; }
    auto engineResult() const noexcept -> std::optional<EngineResult> { return mEngineResult; }

    auto isNetError() const noexcept -> bool { return mKind == Net; }
    auto isCancellation() const noexcept -> bool { return mKind == Cancellation; }
    auto isEngineError() const noexcept -> bool { return mKind == Engine; }
    auto isTimeout() const noexcept -> bool { return mKind == Timeout; }

    /**
     * @brief Get the std::error_code view of the error
     * 
     * @return std::error_code 
     */
    auto code() const -> std::error_code;

    /**
     * @brief Get the human readable form "<Kind>: <message>"
     * 
     * @return std::string 
     */
    auto toString() const -> std::string;

    auto operator ==(const ClientError &other) const -> bool = default;
private:
    ClientError(Kind kind, std::string message) : mKind(kind), mMessage(std::move(message)) { }

    Kind mKind;
    std::string mMessage;
    std::optional<NetError> mNetError;
    std::optional<EngineResult> mEngineResult;
};

URLBRIDGE_NS_END

template <URLBRIDGE_NAMESPACE::IntoError T> 
struct std::is_error_code_enum<T> : std::true_type {};

URLBRIDGE_FORMATTER(ClientError) {
    auto format(const auto &err, auto &ctxt) const {
        return format_to(ctxt.out(), "{}", err.toString());
    }
};

URLBRIDGE_FORMATTER(EngineResult) {
    auto format(const auto &res, auto &ctxt) const {
        return format_to(ctxt.out(), "{}", URLBRIDGE_NAMESPACE::toString(res));
    }
};

URLBRIDGE_FORMATTER(NetErrorCode) {
    auto format(const auto &code, auto &ctxt) const {
        return format_to(ctxt.out(), "{}", URLBRIDGE_NAMESPACE::toString(code));
    }
};
