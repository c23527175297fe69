#include <urlbridge/detail/handle_registry.hpp>
#include <urlbridge/detail/mem.hpp>
#include <urlbridge/ordered_request.hpp>
#include <urlbridge/client.hpp>
#include <urlbridge/base64.hpp>
#include <urlbridge/log.hpp>
#include <urlbridge/capi.h>
#include <cstdlib>
#include <cstring>
#include <new>

URLBRIDGE_NS_BEGIN

namespace {
    auto clients() -> detail::HandleRegistry<HttpClient> & {
        static detail::HandleRegistry<HttpClient> registry;
        return registry;
    }

    auto statusDescription(int status) -> std::string_view {
        switch (status) {
            case 200: return "OK";
            case 201: return "Created";
            case 204: return "No Content";
            case 301: return "Moved Permanently";
            case 302: return "Found";
            case 304: return "Not Modified";
            case 400: return "Bad Request";
            case 401: return "Unauthorized";
            case 403: return "Forbidden";
            case 404: return "Not Found";
            case 405: return "Method Not Allowed";
            case 500: return "Internal Server Error";
            case 502: return "Bad Gateway";
            case 503: return "Service Unavailable";
            default: return "Unknown";
        }
    }

    // Allocated by malloc, the C side gives it back by urlbridge_response_free
    auto duplicate(std::string_view str) -> char * {
        auto ptr = static_cast<char *>(::malloc(str.size() + 1));
        if (!ptr) {
            throw std::bad_alloc();
        }
        ::memcpy(ptr, str.data(), str.size());
        ptr[str.size()] = '\0';
        return ptr;
    }

    // Decode it, or take it as is if it is not valid base64
    auto decodeOrRaw(std::string_view text, bool isBase64) -> std::string {
        if (!isBase64) {
            return std::string(text);
        }
        if (auto decoded = base64::decode<std::string>(text); decoded) {
            return std::move(*decoded);
        }
        URLBRIDGE_DEBUG("CApi", "The input is not valid base64, use it as is");
        return std::string(text);
    }

    struct Record {
        int status = -1;
        std::string body;
        size_t bodyLength = 0;
        std::string requestHeaders;
        std::string requestBody;
        std::string responseHeaders;
    };

    auto allocate(const Record &record) -> urlbridge_response * {
        auto response = static_cast<urlbridge_response *>(::calloc(1, sizeof(urlbridge_response)));
        if (!response) {
            return nullptr;
        }
        try {
            response->status_code = record.status;
            response->response_body = duplicate(record.body);
            response->response_body_len = record.bodyLength;
            response->request_headers = duplicate(record.requestHeaders);
            response->request_body = duplicate(record.requestBody);
            response->response_headers = duplicate(record.responseHeaders);
        }
        catch (const std::bad_alloc &) {
            urlbridge_response_free(response);
            return nullptr;
        }
        return response;
    }

    auto failure(std::string_view message) -> urlbridge_response * {
        URLBRIDGE_WARN("CApi", "Request failed: {}", message);
        Record record;
        record.body = fmtlib::format("Request failed: {}", message);
        return allocate(record);
    }

    auto send(HttpClient &client, std::string_view url, std::string_view method, const char *body, const char *headers, bool isBodyBase64, bool isHeadersBase64)
        -> urlbridge_response *
    {
        auto builder = OrderedRequestFactory::builder();
        builder.method(method).uri(url).version("HTTP/1.1");

        Record record;
        if (headers && *headers) {
            record.requestHeaders = decodeOrRaw(headers, isHeadersBase64);
            std::string_view text = record.requestHeaders;
            while (!text.empty()) {
                auto end = text.find_first_of("\r\n");
                auto line = text.substr(0, end);
                text = end == std::string_view::npos ? std::string_view() : text.substr(end + 1);
                auto colon = line.find(':');
                if (colon == std::string_view::npos || colon == 0) {
                    continue;
                }
                builder.header(mem::trim(line.substr(0, colon)), mem::trim(line.substr(colon + 1)));
            }
        }
        if (body && *body) {
            record.requestBody = decodeOrRaw(body, isBodyBase64);
            builder.body(Body::fromString(record.requestBody));
        }
        auto request = builder.build();
        if (!request) {
            return failure(request.error().toString());
        }
        auto response = client.send(std::move(*request));
        if (!response) {
            return failure(response.error().message());
        }
        auto content = response->content();
        record.status = response->statusCode();
        record.body = std::string(viewAsText(content));
        record.bodyLength = content.size();
        record.responseHeaders = fmtlib::format("HTTP/1.1 {} {}\n", response->statusCode(), statusDescription(response->statusCode()));
        for (const auto &header : response->headerList()) {
            record.responseHeaders += fmtlib::format("{}: {}\n", header.name, header.value);
        }
        return allocate(record);
    }
}

URLBRIDGE_NS_END

using namespace URLBRIDGE_NAMESPACE;

extern "C" {

urlbridge_client_t urlbridge_client_create(const char *proxy) {
    try {
        EngineParams params;
        if (proxy && *proxy) {
            params.proxyUrl = proxy;
            params.enableCheckResult = false;
        }
        auto handle = clients().insert(std::make_shared<HttpClient>(std::move(params)));
        URLBRIDGE_DEBUG("CApi", "Client {} created", handle);
        return handle;
    }
    catch (const std::exception &e) {
        URLBRIDGE_ERROR("CApi", "Failed to create the client: {}", e.what());
        return 0;
    }
}

void urlbridge_client_free(urlbridge_client_t handle) {
    auto client = clients().remove(handle);
    if (!client) {
        return;
    }
    client->dispose();
    URLBRIDGE_DEBUG("CApi", "Client {} freed", handle);
}

urlbridge_response *urlbridge_send_request(urlbridge_client_t handle, const char *url, const char *method, const char *body,
                                           const char *headers, int is_body_base64, int is_headers_base64)
{
    auto client = clients().get(handle);
    if (!client || !url || !*url) {
        return nullptr;
    }
    std::string_view methodText = (method && *method) ? method : "GET";
    try {
        return send(*client, url, methodText, body, headers, is_body_base64 != 0, is_headers_base64 != 0);
    }
    catch (const std::exception &e) {
        return failure(e.what());
    }
}

void urlbridge_response_free(urlbridge_response *response) {
    if (!response) {
        return;
    }
    ::free(response->response_body);
    ::free(response->request_headers);
    ::free(response->request_body);
    ::free(response->response_headers);
    ::free(response);
}

}
