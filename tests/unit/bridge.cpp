#include "../detail/fake_engine.hpp"
#include <urlbridge/bridge.hpp>
#include <gtest/gtest.h>
#include <stdexcept>
#include <thread>

using namespace URLBRIDGE_NAMESPACE;
using testing_detail::RecordingRequest;

namespace {
    auto makeInfo(int status, std::string url = "http://example.com/") -> UrlResponseInfo {
        UrlResponseInfo info;
        info.url = url;
        info.urlChain = {url};
        info.httpStatusCode = status;
        info.httpStatusText = status == 200 ? "OK" : "Found";
        info.allHeaders = {{"Content-Type", "text/plain"}, {"Set-Cookie", "a=1"}, {"Set-Cookie", "b=2"}};
        info.negotiatedProtocol = "http/1.1";
        return info;
    }
}

TEST(Bridge, Success) {
    RecordingRequest request;
    RequestLifecycleBridge bridge({}, 4);
    auto info = makeInfo(200);

    bridge.onResponseStarted(request, info);
    ASSERT_EQ(request.reads.size(), 1);
    ASSERT_EQ(request.reads[0]->size(), 4);

    bridge.onReadCompleted(request, info, request.fill("Hell"), 4);
    bridge.onReadCompleted(request, info, request.fill("o\0\0\0"), 1);
    ASSERT_FALSE(bridge.isResolved());
    bridge.onSucceeded(request, info);

    ASSERT_TRUE(bridge.isResolved());
    ASSERT_EQ(bridge.state(), RequestLifecycleBridge::State::Succeeded);
    auto outcome = bridge.takeOutcome();
    ASSERT_TRUE(outcome);
    ASSERT_EQ(outcome->status, ResponseStatus::Success);
    ASSERT_FALSE(outcome->error);
    auto &response = *outcome->response;
    ASSERT_EQ(response.statusCode(), 200);
    ASSERT_EQ(response.statusText(), "OK");
    ASSERT_EQ(response.text(), "Hello");
    ASSERT_EQ(response.url(), "http://example.com/");
    ASSERT_EQ(response.negotiatedProtocol(), "http/1.1");
    ASSERT_EQ(response.headerList().size(), 3);
    ASSERT_EQ(response.headers().values("set-cookie").size(), 2);
    ASSERT_EQ(response.headers().value("content-type"), "text/plain");

    // Only once
    ASSERT_FALSE(bridge.takeOutcome());
}

TEST(Bridge, ZeroByteReadIsIgnored) {
    RecordingRequest request;
    RequestLifecycleBridge bridge;
    auto info = makeInfo(200);
    bridge.onResponseStarted(request, info);
    bridge.onReadCompleted(request, info, request.fill(""), 0);
    ASSERT_TRUE(request.reads.empty()); // No new read issued
    ASSERT_FALSE(bridge.isResolved());
}

TEST(Bridge, OverReportedRead) {
    RecordingRequest request;
    RequestLifecycleBridge bridge({}, 2);
    auto info = makeInfo(200);
    bridge.onResponseStarted(request, info);
    bridge.onReadCompleted(request, info, request.fill("ab"), 100);
    bridge.onSucceeded(request, info);
    ASSERT_EQ(bridge.takeOutcome()->response->text(), "ab");
}

TEST(Bridge, FollowRedirect) {
    RecordingRequest request;
    std::vector<std::string> seen;
    RequestLifecycleBridge bridge([&](std::string_view url) {
        seen.emplace_back(url);
        return true;
    });
    bridge.onRedirectReceived(request, makeInfo(302), "http://example.com/next");
    ASSERT_EQ(request.follows, 1);
    ASSERT_EQ(seen, std::vector<std::string> {"http://example.com/next"});
    ASSERT_FALSE(bridge.isResolved());
}

TEST(Bridge, BlockRedirect) {
    RecordingRequest request;
    RequestLifecycleBridge bridge([](std::string_view) { return false; });
    bridge.onRedirectReceived(request, makeInfo(302), "http://example.com/next");
    ASSERT_EQ(request.follows, 0);
    ASSERT_EQ(request.cancels, 1);

    auto outcome = bridge.takeOutcome();
    ASSERT_EQ(outcome->status, ResponseStatus::Success);
    ASSERT_EQ(outcome->response->statusCode(), 302);
    ASSERT_TRUE(outcome->response->text().empty());

    // The cancellation caused by the block changes nothing
    bridge.onCanceled(request, nullptr);
    ASSERT_EQ(bridge.state(), RequestLifecycleBridge::State::Succeeded);
}

TEST(Bridge, FollowRejected) {
    RecordingRequest request;
    request.followResult = EngineResult::IllegalStateUnexpectedRedirect;
    RequestLifecycleBridge bridge;
    bridge.onRedirectReceived(request, makeInfo(302), "http://example.com/next");
    ASSERT_EQ(request.cancels, 1);
    auto outcome = bridge.takeOutcome();
    ASSERT_EQ(outcome->status, ResponseStatus::Error);
    ASSERT_TRUE(outcome->error->isEngineError());
}

TEST(Bridge, ReadRejected) {
    RecordingRequest request;
    request.readResult = EngineResult::IllegalStateReadFailed;
    RequestLifecycleBridge bridge;
    bridge.onResponseStarted(request, makeInfo(200));
    ASSERT_EQ(request.cancels, 1);
    auto outcome = bridge.takeOutcome();
    ASSERT_EQ(outcome->error->engineResult(), EngineResult::IllegalStateReadFailed);
}

TEST(Bridge, Failed) {
    RecordingRequest request;
    RequestLifecycleBridge bridge;
    bridge.onFailed(request, nullptr, NetError {NetErrorCode::HostnameNotResolved, 6, "Could not resolve host"});
    ASSERT_EQ(bridge.state(), RequestLifecycleBridge::State::Failed);
    auto outcome = bridge.takeOutcome();
    ASSERT_EQ(outcome->status, ResponseStatus::Error);
    ASSERT_FALSE(outcome->response);
    ASSERT_EQ(outcome->error->netError()->code, NetErrorCode::HostnameNotResolved);
    ASSERT_EQ(outcome->error->message(), "Could not resolve host");
}

TEST(Bridge, Canceled) {
    RecordingRequest request;
    RequestLifecycleBridge bridge;
    bridge.onResponseStarted(request, makeInfo(200));
    bridge.onCanceled(request, nullptr);
    auto outcome = bridge.takeOutcome();
    ASSERT_EQ(outcome->status, ResponseStatus::Canceled);
    ASSERT_TRUE(outcome->error->isCancellation());
}

TEST(Bridge, FirstResolutionWins) {
    RecordingRequest request;
    RequestLifecycleBridge bridge;
    auto info = makeInfo(200);
    bridge.onFailed(request, nullptr, NetError {NetErrorCode::ConnectionReset, 56, "reset"});
    bridge.onSucceeded(request, info);
    bridge.onCanceled(request, &info);
    bridge.onResponseStarted(request, info);
    ASSERT_TRUE(request.reads.empty()); // Events after resolution are dropped
    ASSERT_EQ(bridge.state(), RequestLifecycleBridge::State::Failed);
    ASSERT_EQ(bridge.takeOutcome()->error->netError()->code, NetErrorCode::ConnectionReset);
}

TEST(Bridge, PolicyThrows) {
    RecordingRequest request;
    RequestLifecycleBridge bridge([](std::string_view) -> bool { throw std::runtime_error("bad policy"); });
    bridge.onRedirectReceived(request, makeInfo(302), "http://example.com/next");
    auto outcome = bridge.takeOutcome();
    ASSERT_EQ(outcome->status, ResponseStatus::Error);
    ASSERT_EQ(outcome->error->netError()->code, NetErrorCode::Callback);
    ASSERT_EQ(outcome->error->message(), "Exception in callback: bad policy");
    ASSERT_EQ(request.cancels, 1);
}

TEST(Bridge, WaitAcrossThreads) {
    RecordingRequest request;
    RequestLifecycleBridge bridge;
    ASSERT_FALSE(bridge.waitFor(std::chrono::milliseconds(10)));
    std::jthread thread([&]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        bridge.onCanceled(request, nullptr);
    });
    auto &outcome = bridge.wait();
    ASSERT_EQ(outcome.status, ResponseStatus::Canceled);
}

TEST(Bridge, OnResolved) {
    RecordingRequest request;
    RequestLifecycleBridge bridge;
    int called = 0;
    bridge.onResolved([&]() { ++called; });
    bridge.onCanceled(request, nullptr);
    ASSERT_EQ(called, 1);
    bridge.onResolved([&]() { ++called; }); // Already resolved, runs at once
    ASSERT_EQ(called, 2);
}

TEST(Bridge, ReadBufferSize) {
    RequestLifecycleBridge bridge;
    ASSERT_EQ(bridge.readBufferSize(), RequestLifecycleBridge::DefaultReadBufferSize);
    bridge.setReadBufferSize(1024);
    ASSERT_EQ(bridge.readBufferSize(), 1024);
    ASSERT_THROW(bridge.setReadBufferSize(0), std::invalid_argument);
}

auto main(int argc, char **argv) -> int {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
