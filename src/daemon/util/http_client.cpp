#include "util/http_client.hpp"

#include <algorithm>
#include <format>
#include <memory>
#include <mutex>

namespace http {

namespace {

size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* resp = static_cast<std::string*>(userdata);
    resp->append(ptr, size * nmemb);
    return size * nmemb;
}

struct CurlDeleter {
    void operator()(CURL* c) const { curl_easy_cleanup(c); }
};
using CurlHandle = std::unique_ptr<CURL, CurlDeleter>;

Result<Response> perform(CURL* curl, const std::string& url, std::chrono::milliseconds timeout,
                         const std::string& what) {
    Response resp;
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &resp.body);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(std::min<long long>(timeout.count(), 10000)));
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, user_agent().c_str());

    CURLcode res = curl_easy_perform(curl);
    if (res != CURLE_OK) {
        return std::unexpected(classify(res, what));
    }
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &resp.status);
    return resp;
}

} // namespace

void global_init() {
    static std::once_flag once;
    std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

std::string user_agent() {
    return std::string("speechlink/") + SPEECHLINK_VERSION;
}

Error classify(CURLcode code, const std::string& what) {
    auto msg = std::format("{}: {}", what, curl_easy_strerror(code));
    switch (code) {
        case CURLE_COULDNT_CONNECT:
        case CURLE_SEND_ERROR:
        case CURLE_RECV_ERROR:
        case CURLE_SSL_CONNECT_ERROR:
            return {.code = ErrorCode::ConnectionFailed, .message = std::move(msg)};
        case CURLE_OPERATION_TIMEDOUT:
            return {.code = ErrorCode::Timeout, .message = std::move(msg)};
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:
            return {.code = ErrorCode::DnsFailure, .message = std::move(msg)};
        case CURLE_GOT_NOTHING:
            return {.code = ErrorCode::PrematureClose, .message = std::move(msg)};
        case CURLE_PARTIAL_FILE:
            return {.code = ErrorCode::IncompleteTransfer, .message = std::move(msg)};
        case CURLE_ABORTED_BY_CALLBACK:
            return {.code = ErrorCode::Cancelled, .message = what + ": cancelled"};
        case CURLE_WRITE_ERROR:
            return {.code = ErrorCode::Io, .message = std::move(msg)};
        default:
            return {.code = ErrorCode::Protocol, .message = std::move(msg)};
    }
}

Result<Response> get(const std::string& url, std::chrono::milliseconds timeout) {
    global_init();
    CurlHandle curl(curl_easy_init());
    if (!curl) return make_error(ErrorCode::Io, "curl_easy_init failed");
    return perform(curl.get(), url, timeout, "GET " + url);
}

Result<Response> post_multipart(const std::string& url,
                                const std::vector<MultipartField>& fields,
                                std::chrono::milliseconds timeout) {
    global_init();
    CurlHandle curl(curl_easy_init());
    if (!curl) return make_error(ErrorCode::Io, "curl_easy_init failed");

    curl_mime* mime = curl_mime_init(curl.get());
    for (auto& f : fields) {
        curl_mimepart* part = curl_mime_addpart(mime);
        curl_mime_name(part, f.name.c_str());
        curl_mime_data(part, f.data.data(), f.data.size());
        if (!f.filename.empty()) curl_mime_filename(part, f.filename.c_str());
        if (!f.content_type.empty()) curl_mime_type(part, f.content_type.c_str());
    }
    curl_easy_setopt(curl.get(), CURLOPT_MIMEPOST, mime);

    auto result = perform(curl.get(), url, timeout, "POST " + url);
    curl_mime_free(mime);
    return result;
}

} // namespace http
