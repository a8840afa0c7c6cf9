#include "owl/net/http_client.hpp"
#include "owl/log.hpp"

#include <curl/curl.h>
#include <memory>
#include <mutex>

namespace owl {
namespace net {

namespace {

std::once_flag g_curl_init_flag;

size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    const size_t total = size * nmemb;
    auto* buffer = static_cast<std::string*>(userdata);
    buffer->append(ptr, total);
    return total;
}

struct EasyDeleter {
    void operator()(CURL* handle) const { curl_easy_cleanup(handle); }
};

struct SlistDeleter {
    void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};

} // namespace

HttpClient::HttpClient() {
    std::call_once(g_curl_init_flag, []() {
        curl_global_init(CURL_GLOBAL_DEFAULT);
    });
}

Expected<HttpResponse> HttpClient::get(
    const std::string& url,
    const Headers& headers,
    const Timeouts& timeouts
) const {
    return perform("GET", url, nullptr, headers, timeouts);
}

Expected<HttpResponse> HttpClient::post_json(
    const std::string& url,
    const std::string& body,
    const Headers& headers,
    const Timeouts& timeouts
) const {
    Headers all = headers;
    all.emplace_back("Content-Type", "application/json");
    return perform("POST", url, &body, all, timeouts);
}

std::string HttpClient::escape(const std::string& component) {
    std::unique_ptr<CURL, EasyDeleter> handle(curl_easy_init());
    if (!handle) {
        return component;
    }
    char* escaped = curl_easy_escape(handle.get(), component.c_str(), static_cast<int>(component.size()));
    if (escaped == nullptr) {
        return component;
    }
    std::string out(escaped);
    curl_free(escaped);
    return out;
}

std::string HttpClient::with_query(
    const std::string& base,
    const std::vector<std::pair<std::string, std::string>>& params
) {
    std::string url = base;
    char separator = base.find('?') == std::string::npos ? '?' : '&';
    for (const auto& [key, value] : params) {
        url += separator;
        url += escape(key);
        url += '=';
        url += escape(value);
        separator = '&';
    }
    return url;
}

Expected<HttpResponse> HttpClient::perform(
    const std::string& method,
    const std::string& url,
    const std::string* body,
    const Headers& headers,
    const Timeouts& timeouts
) const {
    std::unique_ptr<CURL, EasyDeleter> handle(curl_easy_init());
    if (!handle) {
        return tl::unexpected(Error{ErrorCode::FetchFailed, "curl_easy_init failed", url});
    }

    HttpResponse response;
    CURL* h = handle.get();
    curl_easy_setopt(h, CURLOPT_URL, url.c_str());
    curl_easy_setopt(h, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(h, CURLOPT_MAXREDIRS, 5L);
    curl_easy_setopt(h, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(h, CURLOPT_ACCEPT_ENCODING, "");
    curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(h, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(h, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(timeouts.connect.count()));
    curl_easy_setopt(h, CURLOPT_TIMEOUT_MS, static_cast<long>(timeouts.total.count()));

    if (method == "POST" && body != nullptr) {
        curl_easy_setopt(h, CURLOPT_POST, 1L);
        curl_easy_setopt(h, CURLOPT_POSTFIELDS, body->c_str());
        curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE, static_cast<long>(body->size()));
    }

    curl_slist* raw_list = nullptr;
    for (const auto& [name, value] : headers) {
        const std::string line = name + ": " + value;
        raw_list = curl_slist_append(raw_list, line.c_str());
    }
    std::unique_ptr<curl_slist, SlistDeleter> header_list(raw_list);
    if (header_list) {
        curl_easy_setopt(h, CURLOPT_HTTPHEADER, header_list.get());
    }

    const CURLcode code = curl_easy_perform(h);
    if (code == CURLE_OPERATION_TIMEDOUT) {
        OWL_LOG_DEBUG("%s %s timed out", method.c_str(), url.c_str());
        return tl::unexpected(Error{ErrorCode::FetchTimeout, curl_easy_strerror(code), url});
    }
    if (code != CURLE_OK) {
        OWL_LOG_DEBUG("%s %s failed: %s", method.c_str(), url.c_str(), curl_easy_strerror(code));
        return tl::unexpected(Error{ErrorCode::FetchFailed, curl_easy_strerror(code), url});
    }

    curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &response.status);
    return response;
}

} // namespace net
} // namespace owl
