#pragma once

#include <string>
#include <vector>
#include <cstddef> // for size_t
#include <curl/curl.h>
#include "result.h"

namespace facegate {
namespace utils {

/**
 * @brief One field of a multipart/form-data request
 *
 * A part with a non-empty filename is sent as a file upload whose bytes are
 * held in value.
 */
struct MultipartPart {
    std::string name;
    std::string value;
    std::string filename;
    std::string contentType;

    static MultipartPart text(const std::string& name, const std::string& value) {
        return MultipartPart{name, value, std::string(), std::string()};
    }

    static MultipartPart jpeg(const std::string& name, const std::vector<unsigned char>& bytes,
                              const std::string& filename = "image.jpg") {
        return MultipartPart{name, std::string(bytes.begin(), bytes.end()), filename, "image/jpeg"};
    }
};

/**
 * @brief Status and body of a completed HTTP exchange
 */
struct HttpResponse {
    long statusCode = 0;
    std::string body;

    bool isOk() const { return statusCode >= 200 && statusCode < 300; }
};

/**
 * @brief CURL callback for writing response data
 *
 * @param contents Response data
 * @param size Size of each item
 * @param nmemb Number of items
 * @param response Output string to store response
 * @return size_t Total bytes processed
 */
size_t curlWriteCallback(void* contents, size_t size, size_t nmemb, std::string* response);

/**
 * @brief Map a libcurl transfer error onto the pipeline error kinds
 *
 * @param code libcurl result code (not CURLE_OK)
 * @return ErrorKind NetworkTimeout for timeouts, NetworkUnreachable otherwise
 */
ErrorKind classifyCurlError(CURLcode code);

/**
 * @brief Join a base URL and a route with exactly one slash between them
 */
std::string joinUrl(const std::string& base, const std::string& route);

/**
 * @brief POST a multipart/form-data request
 *
 * Uses a dedicated easy handle per call so it is safe from any thread once
 * curl_global_init() has run. Transport failures are returned as errors;
 * any HTTP status, including non-2xx, is returned as a response.
 *
 * @param url Target URL
 * @param parts Form fields
 * @param timeoutMs Total transfer timeout
 * @param connectTimeoutMs Connection establishment timeout
 * @return Result<HttpResponse> Response or transport error
 */
Result<HttpResponse> postMultipart(const std::string& url,
                                   const std::vector<MultipartPart>& parts,
                                   long timeoutMs,
                                   long connectTimeoutMs);

} // namespace utils
} // namespace facegate
