#include "blobxl/storage/HttpClient.hpp"
#include "blobxl/core/Exception.hpp"
#include "blobxl/utils/ModuleLoggers.hpp"
#include "blobxl/utils/TextUtils.hpp"
#include <curl/curl.h>
#include <fmt/format.h>
#include <cctype>
#include <memory>

namespace blobxl {
namespace storage {

namespace {

size_t writeBody(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* body = static_cast<std::string*>(userdata);
    body->append(ptr, size * nmemb);
    return size * nmemb;
}

size_t writeHeader(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* headers = static_cast<std::map<std::string, std::string>*>(userdata);
    const size_t length = size * nitems;
    std::string_view line(buffer, length);
    const size_t colon = line.find(':');
    if (colon != std::string_view::npos) {
        std::string name(line.substr(0, colon));
        for (auto& ch : name) {
            ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
        }
        std::string_view value = line.substr(colon + 1);
        while (!value.empty() && (value.front() == ' ' || value.front() == '\t')) {
            value.remove_prefix(1);
        }
        while (!value.empty() && (value.back() == '\r' || value.back() == '\n' || value.back() == ' ')) {
            value.remove_suffix(1);
        }
        (*headers)[name] = std::string(value);
    }
    return length;
}

struct CurlDeleter {
    void operator()(CURL* curl) const { curl_easy_cleanup(curl); }
};

struct SlistDeleter {
    void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};

} // namespace

void HttpRequest::setHeader(const std::string& name, const std::string& value) {
    for (auto& header : headers) {
        if (utils::TextUtils::equalsIgnoreCase(header.first, name)) {
            header.second = value;
            return;
        }
    }
    headers.emplace_back(name, value);
}

std::string HttpRequest::header(std::string_view name) const {
    for (const auto& header : headers) {
        if (utils::TextUtils::equalsIgnoreCase(header.first, name)) {
            return header.second;
        }
    }
    return {};
}

std::string urlEncode(std::string_view text, bool keep_slash) {
    std::string out;
    out.reserve(text.size() * 3);
    for (unsigned char ch : text) {
        if (std::isalnum(ch) || ch == '-' || ch == '_' || ch == '.' || ch == '~' || (keep_slash && ch == '/')) {
            out.push_back(static_cast<char>(ch));
        } else {
            out += fmt::format("%{:02X}", ch);
        }
    }
    return out;
}

std::vector<std::string> curlHeaderLines(const HttpRequest& request) {
    std::vector<std::string> lines;
    lines.reserve(request.headers.size() + 2);
    bool has_content_type = false;
    for (const auto& [name, value] : request.headers) {
        if (utils::TextUtils::equalsIgnoreCase(name, "Content-Type")) {
            has_content_type = true;
        }
        lines.push_back(name + ": " + value);
    }
    if (request.method != "GET" && !has_content_type) {
        lines.push_back("Content-Type:");
    }
    lines.push_back("Expect:");
    return lines;
}

std::string buildUrl(const HttpRequest& request) {
    std::string url = request.url;
    char separator = '?';
    for (const auto& [name, value] : request.query) {
        url.push_back(separator);
        url += urlEncode(name);
        url.push_back('=');
        url += urlEncode(value);
        separator = '&';
    }
    if (!request.raw_query.empty()) {
        url.push_back(separator);
        url += request.raw_query;
    }
    return url;
}

std::string urlPath(const std::string& url) {
    size_t start = url.find("://");
    start = start == std::string::npos ? 0 : start + 3;
    const size_t slash = url.find('/', start);
    if (slash == std::string::npos) {
        return "/";
    }
    const size_t query = url.find('?', slash);
    return url.substr(slash, query == std::string::npos ? std::string::npos : query - slash);
}

CurlTransport::CurlTransport(HttpOptions options)
    : options_(std::move(options)) {
}

HttpResponse CurlTransport::perform(const HttpRequest& request) {
    std::unique_ptr<CURL, CurlDeleter> curl(curl_easy_init());
    if (!curl) {
        throw core::StorageException("curl_easy_init failed", 0, core::ErrorCode::StorageAccess, __FILE__, __LINE__);
    }

    HttpResponse response;
    const std::string url = buildUrl(request);

    std::unique_ptr<curl_slist, SlistDeleter> header_list;
    for (const auto& line : curlHeaderLines(request)) {
        curl_slist* appended = curl_slist_append(header_list.get(), line.c_str());
        if (appended == nullptr) {
            throw core::StorageException("curl_slist_append failed", 0, core::ErrorCode::StorageAccess,
                                         __FILE__, __LINE__);
        }
        header_list.release();
        header_list.reset(appended);
    }

    CURL* handle = curl.get();
    curl_easy_setopt(handle, CURLOPT_URL, url.c_str());
    curl_easy_setopt(handle, CURLOPT_HTTPHEADER, header_list.get());
    curl_easy_setopt(handle, CURLOPT_WRITEFUNCTION, writeBody);
    curl_easy_setopt(handle, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(handle, CURLOPT_HEADERFUNCTION, writeHeader);
    curl_easy_setopt(handle, CURLOPT_HEADERDATA, &response.headers);
    curl_easy_setopt(handle, CURLOPT_USERAGENT, options_.user_agent.c_str());
    curl_easy_setopt(handle, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(handle, CURLOPT_CONNECTTIMEOUT, options_.connect_timeout_seconds);
    curl_easy_setopt(handle, CURLOPT_TIMEOUT, options_.timeout_seconds);
    curl_easy_setopt(handle, CURLOPT_SSL_VERIFYPEER, options_.verify_tls ? 1L : 0L);
    curl_easy_setopt(handle, CURLOPT_SSL_VERIFYHOST, options_.verify_tls ? 2L : 0L);

    if (request.method == "GET") {
        curl_easy_setopt(handle, CURLOPT_HTTPGET, 1L);
    } else {
        curl_easy_setopt(handle, CURLOPT_CUSTOMREQUEST, request.method.c_str());
        curl_easy_setopt(handle, CURLOPT_POSTFIELDS, request.body.data());
        curl_easy_setopt(handle, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(request.body.size()));
    }

    STORAGE_DEBUG("{} {} ({} bytes)", request.method, request.url, request.body.size());
    const CURLcode res = curl_easy_perform(handle);
    if (res != CURLE_OK) {
        throw core::StorageException(fmt::format("{} {} failed: {}", request.method, request.url,
                                                 curl_easy_strerror(res)),
                                     0, core::ErrorCode::StorageAccess, __FILE__, __LINE__);
    }
    curl_easy_getinfo(handle, CURLINFO_RESPONSE_CODE, &response.status);
    STORAGE_DEBUG("{} {} -> HTTP {}", request.method, request.url, response.status);
    return response;
}

}} // namespace blobxl::storage
