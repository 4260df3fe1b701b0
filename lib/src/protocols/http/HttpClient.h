#pragma once

#include <string>
#include <functional>
#include <mutex>

namespace tvsort {

/**
 * Outcome of one playlist download.
 * success is false on transport errors and non-2xx responses;
 * error then carries a human-readable reason.
 */
struct FetchResult {
    bool success = false;
    long status_code = 0;
    std::string body;
    std::string error;

    static FetchResult Failure(const std::string& reason, long status_code = 0) {
        FetchResult result;
        result.status_code = status_code;
        result.error = reason;
        return result;
    }
};

/**
 * HttpClient
 *
 * Downloads playlist sources over HTTP(S) using libcurl.
 *
 * Features:
 * - Thread-safe curl handle management (one handle reused per client)
 * - Redirect following and a bounded per-request timeout
 * - Transport failures and HTTP error statuses reported as FetchResult,
 *   never thrown
 */
class HttpClient {
public:
    using LogCallback = std::function<void(const std::string& message)>;

    struct ClientConfig {
        int timeout_seconds = 10;                // Whole-request timeout
        std::string user_agent = "tvsort/1.0";
        bool follow_redirects = true;
    };

    /**
     * Constructor
     * @param config Client configuration
     * @throws std::runtime_error if libcurl cannot be initialized
     */
    explicit HttpClient(const ClientConfig& config);

    /**
     * Destructor - cleanup libcurl resources
     */
    ~HttpClient();

    // Non-copyable
    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    /**
     * Perform HTTP GET and return the body as text
     * @param url Source line; the first http(s) URL in it is requested
     * @return Fetch result
     */
    FetchResult FetchText(const std::string& url);

    /**
     * Extract the first http:// or https:// URL from a line
     * @param text Line possibly carrying annotations around the URL
     * @return URL, or empty string if none is present
     */
    static std::string ExtractUrl(const std::string& text);

    /**
     * Set logging callback
     * @param callback Logging function
     */
    void SetLogCallback(LogCallback callback);

private:
    void Log(const std::string& message);

    ClientConfig config_;
    LogCallback log_callback_;

    // libcurl handle (reused for performance)
    void* curl_handle_ = nullptr;  // CURL*
    std::mutex curl_mutex_;
};

} // namespace tvsort
