#pragma once

#include "util/error.hpp"

#include <chrono>
#include <curl/curl.h>
#include <string>
#include <vector>

// Thin blocking wrappers over libcurl easy handles.
namespace http {

struct Response {
    long status = 0;
    std::string body;
};

struct MultipartField {
    std::string name;
    std::string data;
    std::string filename;      // set for file parts
    std::string content_type;
};

// curl_global_init, once per process.
void global_init();

std::string user_agent();

Error classify(CURLcode code, const std::string& what);

Result<Response> get(const std::string& url, std::chrono::milliseconds timeout);

Result<Response> post_multipart(const std::string& url,
                                const std::vector<MultipartField>& fields,
                                std::chrono::milliseconds timeout);

} // namespace http
