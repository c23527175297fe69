#include <urlbridge/request_status.hpp>
#include <urlbridge/log.hpp>
#include <stdexcept>
#include <exception>

URLBRIDGE_NS_BEGIN

namespace {
    class FunctionStatusListener final : public UrlRequestStatusListener {
    public:
        explicit FunctionStatusListener(detail::MoveOnlyFunction<void(UrlRequestStatus)> fn) : mFn(std::move(fn)) { }

        auto onStatus(UrlRequestStatus status) -> void override {
            mFn(status);
        }
    private:
        detail::MoveOnlyFunction<void(UrlRequestStatus)> mFn;
    };
}

auto UrlRequestStatusListener::create(detail::MoveOnlyFunction<void(UrlRequestStatus)> fn) -> std::shared_ptr<UrlRequestStatusListener> {
    if (!fn) {
        URLBRIDGE_THROW(std::invalid_argument("The status listener function is empty"));
    }
    return std::make_shared<FunctionStatusListener>(std::move(fn));
}

auto toString(UrlRequestStatus status) -> std::string_view {
    using enum UrlRequestStatus;
    switch (status) {
        case Invalid: return "Invalid";
        case Idle: return "Idle";
        case WaitingForStalledSocketPool: return "WaitingForStalledSocketPool";
        case WaitingForAvailableSocket: return "WaitingForAvailableSocket";
        case WaitingForDelegate: return "WaitingForDelegate";
        case WaitingForCache: return "WaitingForCache";
        case DownloadingPacFile: return "DownloadingPacFile";
        case ResolvingProxyForUrl: return "ResolvingProxyForUrl";
        case ResolvingHostInPacFile: return "ResolvingHostInPacFile";
        case EstablishingProxyTunnel: return "EstablishingProxyTunnel";
        case ResolvingHost: return "ResolvingHost";
        case Connecting: return "Connecting";
        case SslHandshake: return "SslHandshake";
        case SendingRequest: return "SendingRequest";
        case WaitingForResponse: return "WaitingForResponse";
        case ReadingResponse: return "ReadingResponse";
    }
    return "Unknown";
}

auto describe(UrlRequestStatus status) -> std::string_view {
    using enum UrlRequestStatus;
    switch (status) {
        case Invalid: return "The request is completed, canceled, or not started";
        case Idle: return "The request has not yet begun or is waiting for the consumer";
        case WaitingForStalledSocketPool: return "Waiting for a socket from a stalled pool";
        case WaitingForAvailableSocket: return "Waiting for an available socket from the pool";
        case WaitingForDelegate: return "The delegate has chosen to block this request";
        case WaitingForCache: return "Waiting for access to a cache resource";
        case DownloadingPacFile: return "Downloading the PAC (Proxy Auto-Config) script";
        case ResolvingProxyForUrl: return "Waiting for proxy autoconfig script to return a proxy";
        case ResolvingHostInPacFile: return "Resolving host name in proxy autoconfig script";
        case EstablishingProxyTunnel: return "Establishing a tunnel through the proxy server";
        case ResolvingHost: return "Resolving the host name";
        case Connecting: return "Establishing a TCP/network connection";
        case SslHandshake: return "Performing SSL/TLS handshake";
        case SendingRequest: return "Uploading request data to the server";
        case WaitingForResponse: return "Waiting for response headers from the server";
        case ReadingResponse: return "Reading response body from the server";
    }
    return "Unknown status";
}

auto isActive(UrlRequestStatus status) -> bool {
    return status != UrlRequestStatus::Invalid && status != UrlRequestStatus::Idle;
}

auto isNetworkActive(UrlRequestStatus status) -> bool {
    switch (status) {
        case UrlRequestStatus::Connecting:
        case UrlRequestStatus::SslHandshake:
        case UrlRequestStatus::SendingRequest:
        case UrlRequestStatus::WaitingForResponse:
        case UrlRequestStatus::ReadingResponse:
            return true;
        default:
            return false;
    }
}

auto notifyStatus(UrlRequestStatusListener &listener, UrlRequestStatus status) -> void {
    try {
        listener.onStatus(status);
    }
    catch (const std::exception &e) {
        URLBRIDGE_WARN("Status", "Exception in the status listener for {}: {}", status, e.what());
    }
}

URLBRIDGE_NS_END
