/**
 * @file response.hpp
 * @brief The HttpResponse produced by a successful request
 * @version 0.1
 * @date 2026-03-02
 * 
 * @copyright Copyright (c) 2026
 * 
 */
#pragma once

#include <urlbridge/headers.hpp>
#include <urlbridge/body.hpp>
#include <string>
#include <vector>

URLBRIDGE_NS_BEGIN

/**
 * @brief The Http Response, immutable once produced
 * 
 */
class HttpResponse final {
public:
    HttpResponse() = default;
    HttpResponse(const HttpResponse &) = delete;
    HttpResponse(HttpResponse &&) = default;
    ~HttpResponse() = default;

    /**
     * @brief Get the status code, 3xx when a redirect was blocked by the policy
     * 
     * @return int 
     */
    auto statusCode() const -> int { return mStatusCode; }

    /**
     * @brief Get the reason phrase (may be empty on HTTP/2 and later)
     * 
     * @return const std::string& 
     */
    auto statusText() const -> const std::string & { return mStatusText; }

    /**
     * @brief Get the headers, values of the same name in arrival order
     * 
     * @return const HttpHeaders& 
     */
    auto headers() const -> const HttpHeaders & { return mHeaders; }

    /**
     * @brief Get the headers as received, in order
     * 
     * @return const std::vector<HttpHeader>& 
     */
    auto headerList() const -> const std::vector<HttpHeader> & { return mHeaderList; }

    /**
     * @brief Get the final url (may not same as the request's url because of redirects)
     * 
     * @return const std::string& 
     */
    auto url() const -> const std::string & { return mUrl; }

    auto body() const -> const Body & { return mBody; }

    /**
     * @brief Get the body bytes (the body of a response is always buffered)
     * 
     * @return Buffer 
     */
    auto content() const -> Buffer { return mBody.asBytes().value_or(Buffer {}); }

    /**
     * @brief Get the body as a string
     * 
     * @return std::string 
     */
    auto text() const -> std::string { return std::string(viewAsText(content())); }

    auto wasCached() const -> bool { return mWasCached; }
    auto negotiatedProtocol() const -> const std::string & { return mNegotiatedProtocol; }

    auto operator =(const HttpResponse &) -> HttpResponse & = delete;
    auto operator =(HttpResponse &&) -> HttpResponse & = default;
private:
    int mStatusCode = 0;
    std::string mStatusText;
    HttpHeaders mHeaders;
    std::vector<HttpHeader> mHeaderList;
    std::string mUrl;
    Body mBody;
    bool mWasCached = false;
    std::string mNegotiatedProtocol;
friend class RequestLifecycleBridge;
};

URLBRIDGE_NS_END
