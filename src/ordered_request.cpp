#include <urlbridge/ordered_request.hpp>
#include <urlbridge/detail/mem.hpp>
#include <urlbridge/upload.hpp>
#include <urlbridge/log.hpp>
#include <stdexcept>

URLBRIDGE_NS_BEGIN

namespace {
    auto isBlank(std::string_view str) -> bool {
        return mem::trim(str).empty();
    }

    auto isSchemeChar(char ch) -> bool {
        return std::isalnum(static_cast<unsigned char>(ch)) || ch == '+' || ch == '-' || ch == '.';
    }
}

auto isValidUri(std::string_view uri) -> bool {
    if (uri.empty()) {
        return false;
    }
    for (auto ch : uri) {
        auto c = static_cast<unsigned char>(ch);
        if (c <= 0x20 || c == 0x7f) { // Controls and spaces
            return false;
        }
        switch (ch) {
            case '"': case '<': case '>': case '\\': case '^': case '`': case '{': case '|': case '}':
                return false;
            default:
                break;
        }
    }
    // Absolute form "scheme:...", the scheme starts with a letter
    auto colon = uri.find(':');
    auto slash = uri.find_first_of("/?#");
    if (colon != std::string_view::npos && (slash == std::string_view::npos || colon < slash)) {
        auto scheme = uri.substr(0, colon);
        if (scheme.empty() || !std::isalpha(static_cast<unsigned char>(scheme.front()))) {
            return false;
        }
        for (auto ch : scheme) {
            if (!isSchemeChar(ch)) {
                return false;
            }
        }
    }
    return true;
}

// --- OrderedRequest
OrderedRequest::OrderedRequest(std::string method, std::string uri, std::optional<Body> body) : 
    mMethod(std::move(method)), mUri(std::move(uri)), mBody(std::move(body))
{
    if (isBlank(mMethod)) {
        URLBRIDGE_THROW(std::invalid_argument("Method cannot be null or empty"));
    }
    if (isBlank(mUri)) {
        URLBRIDGE_THROW(std::invalid_argument("URI cannot be null or empty"));
    }
}

auto OrderedRequest::toUrlRequestParams(Executor *executor) && -> UrlRequestParams {
    UrlRequestParams params;
    params.method = mMethod;
    params.headers = std::move(mHeaders);
    if (mBody && mBody->length().value_or(0) > 0) {
        params.uploadDataProvider = UploadStreamer::replayable(std::move(*mBody));
        params.uploadDataProviderExecutor = executor;
        mBody.reset();
    }
    return params;
}

// --- OrderedRequestBuilder
auto OrderedRequestBuilder::method(std::string_view method) -> OrderedRequestBuilder & {
    if (mError) {
        return *this;
    }
    if (isBlank(method)) {
        mError = "Method cannot be null or empty";
        return *this;
    }
    mMethod = method;
    return *this;
}

auto OrderedRequestBuilder::uri(std::string_view uri) -> OrderedRequestBuilder & {
    if (mError) {
        return *this;
    }
    if (isBlank(uri)) {
        mError = "URI cannot be null or empty";
        return *this;
    }
    if (!isValidUri(uri)) {
        mError = fmtlib::format("Invalid URI: {}", uri);
        return *this;
    }
    mUri = uri;
    return *this;
}

auto OrderedRequestBuilder::version(std::string_view version) -> OrderedRequestBuilder & {
    if (mError) {
        return *this;
    }
    if (isBlank(version)) {
        mError = "Version cannot be null or empty";
        return *this;
    }
    mVersion = version;
    return *this;
}

auto OrderedRequestBuilder::header(std::string_view name, std::string_view value) -> OrderedRequestBuilder & {
    if (mError) {
        return *this;
    }
    if (isBlank(name)) {
        mError = "Header name cannot be null or empty";
        return *this;
    }
    if (value.find_first_of("\r\n") != std::string_view::npos) {
        mError = "Header value cannot contain CR or LF";
        return *this;
    }
    mHeaders.emplace_back(HttpHeader {std::string(name), std::string(value)});
    return *this;
}

auto OrderedRequestBuilder::body(Body body) -> OrderedRequestBuilder & {
    if (mError) {
        return *this;
    }
    mBody = std::move(body);
    return *this;
}

auto OrderedRequestBuilder::build() -> Result<OrderedRequest, BuilderError> {
    if (mError) {
        return Unexpected(BuilderError {"Failed to build OrderedRequest", *mError});
    }
    OrderedRequest request(mMethod, mUri, std::move(mBody));
    request.mVersion = mVersion;
    request.mHeaders = mHeaders;
    mBody.reset();
    return request;
}

URLBRIDGE_NS_END
