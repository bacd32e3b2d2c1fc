#pragma once

#include <string>
#include <map>
#include <functional>
#include <memory>
#include <curl/curl.h>

/// @brief HTTP response structure
struct HttpResponse {
    long status_code = 0;
    std::string body;
    std::map<std::string, std::string> headers;
    std::string error_message;
    bool aborted = false;  // Stream callback asked to stop

    bool is_success() const {
        return status_code >= 200 && status_code < 300;
    }

    bool is_error() const {
        return status_code >= 400 || status_code == 0;
    }

    // Value of a response header, case-insensitive name match
    std::string header(const std::string& name) const;
};

/// @brief Callback for streaming responses
/// @param chunk The chunk of data received
/// @return true to continue streaming, false to abort
using StreamCallback = std::function<bool(const std::string& chunk)>;

/// @brief Upstream HTTP client (one per request, a curl easy handle is not shareable)
class HttpClient {
public:
    HttpClient();
    ~HttpClient();

    // Disable copy
    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    /// @brief Perform HTTP GET request
    HttpResponse get(const std::string& url,
                     const std::map<std::string, std::string>& headers = {});

    /// @brief Perform HTTP POST request
    HttpResponse post(const std::string& url,
                      const std::string& body,
                      const std::map<std::string, std::string>& headers = {});

    /// @brief Perform HTTP POST request with streaming response
    /// @param callback Called for each received chunk, return false to abort
    /// @return Response object (body stays empty, data went to the callback)
    HttpResponse post_stream(const std::string& url,
                             const std::string& body,
                             const std::map<std::string, std::string>& headers,
                             StreamCallback callback);

    /// @brief Set total request timeout in seconds (0 = no timeout)
    void set_timeout(long timeout_seconds);

    /// @brief Set connect timeout in seconds (0 = curl default)
    void set_connect_timeout(long timeout_seconds);

    /// @brief Enable/disable curl verbose output
    void set_verbose(bool verbose);

private:
    CURL* curl_ = nullptr;
    long timeout_seconds_ = 0;
    long connect_timeout_seconds_ = 10;
    bool verbose_ = false;

    /// @brief Configure curl handle with common options
    void configure_curl();

    /// @brief Run the configured request and fill in status / error
    void perform(const char* what, const std::string& url,
                 const std::map<std::string, std::string>& headers, HttpResponse& response);

    /// @brief Build a curl header list, caller frees
    struct curl_slist* set_headers(const std::map<std::string, std::string>& headers);

    static size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata);
    static size_t header_callback(char* ptr, size_t size, size_t nmemb, void* userdata);
    static size_t stream_callback(char* ptr, size_t size, size_t nmemb, void* userdata);

    struct StreamCallbackData {
        StreamCallback callback;
        HttpResponse* response = nullptr;
        bool continue_streaming = true;
    };
};
