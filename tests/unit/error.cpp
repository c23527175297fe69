#include <urlbridge/error.hpp>
#include <urlbridge/log.hpp>
#include <gtest/gtest.h>
#include <stdexcept>

using namespace URLBRIDGE_NAMESPACE;

TEST(Error, EngineResult) {
    std::error_code ec = EngineResult::IllegalStateUnexpectedRead;
    ASSERT_TRUE(ec);
    ASSERT_EQ(ec.category().name(), std::string_view("engine"));
    ASSERT_EQ(ec.message(), "IllegalStateUnexpectedRead");
    ASSERT_EQ(ec.value(), -209);
    ASSERT_EQ(fmtlib::format("{}", EngineResult::NullPointerUrl), "NullPointerUrl");
}

TEST(Error, NetErrorCode) {
    std::error_code ec = NetErrorCode::Callback;
    ASSERT_TRUE(ec); // Callback is the first code, it must still be an error
    ASSERT_EQ(ec.category().name(), std::string_view("net"));
    ASSERT_EQ(fmtlib::format("{}", NetErrorCode::TooManyRedirects), "TooManyRedirects");
}

TEST(ClientError, NetError) {
    auto err = ClientError::fromNetError(NetError {NetErrorCode::ConnectionRefused, 7, "Connection refused"});
    ASSERT_TRUE(err.isNetError());
    ASSERT_FALSE(err.isCancellation() || err.isEngineError() || err.isTimeout());
    ASSERT_EQ(err.message(), "Connection refused");
    ASSERT_EQ(err.netError()->internalErrorCode, 7);
    ASSERT_EQ(err.code(), NetErrorCode::ConnectionRefused);
    ASSERT_EQ(err.toString(), "NetError: Connection refused");

    auto empty = ClientError::fromNetError(NetError {NetErrorCode::Other, 0, ""});
    ASSERT_EQ(empty.message(), "Network error occurred");
}

TEST(ClientError, Kinds) {
    auto canceled = ClientError::fromCancellation();
    ASSERT_TRUE(canceled.isCancellation());
    ASSERT_EQ(canceled.message(), "Request was cancelled");
    ASSERT_EQ(canceled.code(), std::errc::operation_canceled);

    auto engine = ClientError::fromEngineResult(EngineResult::IllegalStateEngineNotStarted);
    ASSERT_TRUE(engine.isEngineError());
    ASSERT_EQ(engine.engineResult(), EngineResult::IllegalStateEngineNotStarted);
    ASSERT_EQ(engine.message(), "Unexpected engine result: IllegalStateEngineNotStarted");
    ASSERT_EQ(engine.code(), EngineResult::IllegalStateEngineNotStarted);

    auto timeout = ClientError::fromTimeout();
    ASSERT_TRUE(timeout.isTimeout());
    ASSERT_EQ(timeout.code(), std::errc::timed_out);
    ASSERT_EQ(fmtlib::format("{}", timeout), "TimeoutError: Request timed out");
}

TEST(ClientError, Exception) {
    auto err = ClientError::fromException(std::runtime_error("boom"));
    ASSERT_TRUE(err.isNetError());
    ASSERT_EQ(err.netError()->code, NetErrorCode::Callback);
    ASSERT_EQ(err.message(), "Exception in callback: boom");

    auto unknown = ClientError::fromException(std::make_exception_ptr(42));
    ASSERT_EQ(unknown.message(), "Exception in callback: unknown exception");
}

TEST(Log, Levels) {
    URLBRIDGE_LOG_SET_LEVEL(URLBRIDGE_TRACE_LEVEL);

    URLBRIDGE_TRACE("Test", "Error is => {}", ClientError::fromTimeout());
    URLBRIDGE_INFO("Test", "Error is => {}", EngineResult::IllegalState);
    URLBRIDGE_WARN("Test", "Error is => {}", NetErrorCode::Other);
    URLBRIDGE_ERROR("Test", "Error is => {}", 42);

    URLBRIDGE_LOG_ADD_BLACKLIST("Test");
    URLBRIDGE_TRACE("test", "This should not be printed");
    URLBRIDGE_LOG_SET_LEVEL(URLBRIDGE_INFO_LEVEL);
}

auto main(int argc, char **argv) -> int {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
