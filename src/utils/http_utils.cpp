#include "utils/http_utils.h"
#include "logger.h"
#include <memory>

namespace facegate {
namespace utils {

size_t curlWriteCallback(void* contents, size_t size, size_t nmemb, std::string* response) {
    size_t totalSize = size * nmemb;
    response->append(static_cast<char*>(contents), totalSize);
    return totalSize;
}

ErrorKind classifyCurlError(CURLcode code) {
    switch (code) {
        case CURLE_OPERATION_TIMEDOUT:
            return ErrorKind::NetworkTimeout;
        case CURLE_URL_MALFORMAT:
        case CURLE_UNSUPPORTED_PROTOCOL:
            return ErrorKind::InvalidConfig;
        default:
            return ErrorKind::NetworkUnreachable;
    }
}

std::string joinUrl(const std::string& base, const std::string& route) {
    if (base.empty()) {
        return route;
    }
    if (route.empty()) {
        return base;
    }

    bool baseSlash = base.back() == '/';
    bool routeSlash = route.front() == '/';
    if (baseSlash && routeSlash) {
        return base + route.substr(1);
    }
    if (!baseSlash && !routeSlash) {
        return base + "/" + route;
    }
    return base + route;
}

Result<HttpResponse> postMultipart(const std::string& url,
                                   const std::vector<MultipartPart>& parts,
                                   long timeoutMs,
                                   long connectTimeoutMs) {
    std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl(curl_easy_init(), &curl_easy_cleanup);
    if (!curl) {
        return Result<HttpResponse>::error(ErrorKind::IoError, "Failed to initialize CURL");
    }

    std::unique_ptr<curl_mime, decltype(&curl_mime_free)> mime(curl_mime_init(curl.get()), &curl_mime_free);
    if (!mime) {
        return Result<HttpResponse>::error(ErrorKind::IoError, "Failed to create multipart form");
    }

    for (const auto& part : parts) {
        curl_mimepart* field = curl_mime_addpart(mime.get());
        curl_mime_name(field, part.name.c_str());
        curl_mime_data(field, part.value.data(), part.value.size());
        if (!part.filename.empty()) {
            curl_mime_filename(field, part.filename.c_str());
        }
        if (!part.contentType.empty()) {
            curl_mime_type(field, part.contentType.c_str());
        }
    }

    std::string responseBody;
    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_MIMEPOST, mime.get());
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, timeoutMs);
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT_MS, connectTimeoutMs);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, curlWriteCallback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &responseBody);

    CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        return Result<HttpResponse>::error(classifyCurlError(res),
                                            std::string("CURL request failed: ") + curl_easy_strerror(res));
    }

    HttpResponse response;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.statusCode);
    response.body = std::move(responseBody);

    // URL is not logged, it may carry a bot token
    LOG_TRACE("HttpUtils", "POST completed with status " + std::to_string(response.statusCode) +
              " (" + std::to_string(response.body.size()) + " bytes)");
    return Result<HttpResponse>::success(std::move(response));
}

} // namespace utils
} // namespace facegate
