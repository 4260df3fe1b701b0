#include "HttpClient.h"
#include <curl/curl.h>
#include <regex>
#include <stdexcept>

namespace tvsort {

// libcurl write callback - accumulates response body
static size_t WriteCallback(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t total_size = size * nmemb;
    auto* buffer = static_cast<std::string*>(userp);
    buffer->append(static_cast<const char*>(contents), total_size);
    return total_size;
}

HttpClient::HttpClient(const ClientConfig& config)
    : config_(config) {

    curl_handle_ = curl_easy_init();
    if (!curl_handle_) {
        throw std::runtime_error("Failed to initialize libcurl");
    }
}

HttpClient::~HttpClient() {
    if (curl_handle_) {
        curl_easy_cleanup(static_cast<CURL*>(curl_handle_));
    }
}

FetchResult HttpClient::FetchText(const std::string& url) {
    std::string request_url = ExtractUrl(url);
    if (request_url.empty()) {
        Log("Invalid URL format: " + url);
        return FetchResult::Failure("Invalid URL format: " + url);
    }

    std::lock_guard<std::mutex> lock(curl_mutex_);

    CURL* curl = static_cast<CURL*>(curl_handle_);
    std::string response_data;
    long http_code = 0;

    Log("Fetching " + request_url);

    // Reset and configure curl
    curl_easy_reset(curl);
    curl_easy_setopt(curl, CURLOPT_URL, request_url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, WriteCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_data);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, config_.user_agent.c_str());
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, config_.follow_redirects ? 1L : 0L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    // Servers that honour it send gzip; curl decodes transparently
    curl_easy_setopt(curl, CURLOPT_ACCEPT_ENCODING, "");

    long timeout_seconds = config_.timeout_seconds;
    if (timeout_seconds < 1) timeout_seconds = 10;
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeout_seconds);

    CURLcode res = curl_easy_perform(curl);

    if (res != CURLE_OK) {
        std::string error_msg = curl_easy_strerror(res);
        Log("libcurl error: " + error_msg);
        return FetchResult::Failure("Request failed: " + error_msg);
    }

    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);

    if (http_code < 200 || http_code >= 300) {
        Log("HTTP " + std::to_string(http_code) + " from " + request_url);
        return FetchResult::Failure("HTTP status " + std::to_string(http_code), http_code);
    }

    Log("HTTP " + std::to_string(http_code) + " (" +
        std::to_string(response_data.size()) + " bytes) from " + request_url);

    FetchResult result;
    result.success = true;
    result.status_code = http_code;
    result.body = std::move(response_data);
    return result;
}

std::string HttpClient::ExtractUrl(const std::string& text) {
    static const std::regex url_pattern(R"(https?://[^\s]+)", std::regex::icase);
    std::smatch match;
    if (std::regex_search(text, match, url_pattern)) {
        return match.str(0);
    }
    return "";
}

void HttpClient::SetLogCallback(LogCallback callback) {
    log_callback_ = callback;
}

void HttpClient::Log(const std::string& message) {
    if (log_callback_) {
        log_callback_("[HttpClient] " + message);
    }
}

} // namespace tvsort
