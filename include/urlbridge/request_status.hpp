/**
 * @file request_status.hpp
 * @brief Where a request currently is, reported on demand through a listener
 * @version 0.1
 * @date 2026-03-02
 *
 */
#pragma once

#include <urlbridge/detail/functional.hpp>
#include <string_view>
#include <memory>

URLBRIDGE_NS_BEGIN

/**
 * @brief The load state of a request, the values follow Chromium's net::LoadState
 *
 */
enum class UrlRequestStatus : int {
    Invalid                     = -1, //< Not started, or already completed / canceled
    Idle                        = 0,  //< Started, but waiting for the consumer (a redirect decision)
    WaitingForStalledSocketPool = 1,
    WaitingForAvailableSocket   = 2,
    WaitingForDelegate          = 3,
    WaitingForCache             = 4,
    DownloadingPacFile          = 5,
    ResolvingProxyForUrl        = 6,
    ResolvingHostInPacFile      = 7,
    EstablishingProxyTunnel     = 8,
    ResolvingHost               = 9,
    Connecting                  = 10,
    SslHandshake                = 11,
    SendingRequest              = 12,
    WaitingForResponse          = 13,
    ReadingResponse             = 14,
};

/**
 * @brief Receives the answer of UrlRequest::getStatus(), once per call, on the request's executor
 *
 */
class UrlRequestStatusListener {
public:
    virtual ~UrlRequestStatusListener() = default;

    virtual auto onStatus(UrlRequestStatus status) -> void = 0;

    /**
     * @brief Make a listener from a function
     *
     * @param fn Must not be empty
     * @return std::shared_ptr<UrlRequestStatusListener>
     */
    static auto URLBRIDGE_API create(detail::MoveOnlyFunction<void(UrlRequestStatus)> fn) -> std::shared_ptr<UrlRequestStatusListener>;
};

extern auto URLBRIDGE_API toString(UrlRequestStatus status) -> std::string_view;

/**
 * @brief One line for humans, "Unknown status" for values outside the enum
 *
 */
extern auto URLBRIDGE_API describe(UrlRequestStatus status) -> std::string_view;

/// Started and not waiting on the consumer
extern auto URLBRIDGE_API isActive(UrlRequestStatus status) -> bool;

/// Connecting, or moving request or response bytes
extern auto URLBRIDGE_API isNetworkActive(UrlRequestStatus status) -> bool;

/**
 * @brief Hand the status to the listener, an exception it throws is logged and goes no further
 *
 * @param listener
 * @param status
 */
extern auto URLBRIDGE_API notifyStatus(UrlRequestStatusListener &listener, UrlRequestStatus status) -> void;

URLBRIDGE_NS_END

URLBRIDGE_FORMATTER(UrlRequestStatus) {
    auto format(const auto &status, auto &ctxt) const {
        return format_to(ctxt.out(), "{}", URLBRIDGE_NAMESPACE::toString(status));
    }
};
