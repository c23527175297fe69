/**
 * @file capi.h
 * @brief The plain C interface of the client, for callers outside C++
 * @version 0.1
 * @date 2026-03-02
 * 
 * @copyright Copyright (c) 2026
 * 
 */
#ifndef URLBRIDGE_CAPI_H
#define URLBRIDGE_CAPI_H

#include <stddef.h>
#include <stdint.h>

#if defined(_WIN32)
    #if defined(_URLBRIDGE_SOURCE)
        #define URLBRIDGE_CAPI __declspec(dllexport)
    #else
        #define URLBRIDGE_CAPI __declspec(dllimport)
    #endif
#else
    #define URLBRIDGE_CAPI __attribute__((visibility("default")))
#endif

#ifdef __cplusplus
extern "C" {
#endif

/* The opaque client handle, 0 is never a valid one */
typedef uint64_t urlbridge_client_t;

/* The record of one request, free it by urlbridge_response_free */
typedef struct urlbridge_response {
    int status_code;              /* -1 if the request failed */
    char *response_body;          /* NUL terminated, the body may hold NUL bytes too */
    size_t response_body_len;
    char *request_headers;        /* The header text as sent, after base64 decoding */
    char *request_body;           /* The body as sent, after base64 decoding */
    char *response_headers;       /* "HTTP/1.1 <code> <reason>" then one "Name: Value" line per header */
} urlbridge_response;

/**
 * Create a client, the proxy (may be NULL or empty) is handed to the engine as is.
 * Return 0 on failure.
 */
URLBRIDGE_CAPI urlbridge_client_t urlbridge_client_create(const char *proxy);

/* Dispose the client, unknown handles are ignored */
URLBRIDGE_CAPI void urlbridge_client_free(urlbridge_client_t client);

/**
 * Send a request and wait for the response.
 * headers is "Name: Value" lines, method defaults to GET when NULL or empty.
 * A base64 input failing to decode is used as is.
 * Return NULL for an unknown client or a missing url, a record with status -1 if the request failed.
 */
URLBRIDGE_CAPI urlbridge_response *urlbridge_send_request(
    urlbridge_client_t client,
    const char *url,
    const char *method,
    const char *body,
    const char *headers,
    int is_body_base64,
    int is_headers_base64
);

URLBRIDGE_CAPI void urlbridge_response_free(urlbridge_response *response);

#ifdef __cplusplus
}
#endif

#endif /* URLBRIDGE_CAPI_H */
