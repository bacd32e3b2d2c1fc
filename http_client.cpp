#include "bridge.h"
#include "http_client.h"

#include <cstring>
#include <strings.h>

std::string HttpResponse::header(const std::string& name) const {
    for (const auto& [key, value] : headers) {
        if (strcasecmp(key.c_str(), name.c_str()) == 0) {
            return value;
        }
    }
    return "";
}

HttpClient::HttpClient() {
    curl_ = curl_easy_init();
    if (!curl_) {
        LOG_ERROR("Failed to initialize CURL for HttpClient");
    }
    dout(2) << "HttpClient initialized" << std::endl;
}

HttpClient::~HttpClient() {
    if (curl_) {
        curl_easy_cleanup(curl_);
        curl_ = nullptr;
    }
}

void HttpClient::set_timeout(long timeout_seconds) {
    timeout_seconds_ = timeout_seconds;
}

void HttpClient::set_connect_timeout(long timeout_seconds) {
    connect_timeout_seconds_ = timeout_seconds;
}

void HttpClient::set_verbose(bool verbose) {
    verbose_ = verbose;
}

void HttpClient::configure_curl() {
    curl_easy_reset(curl_);

    if (timeout_seconds_ > 0) {
        curl_easy_setopt(curl_, CURLOPT_TIMEOUT, timeout_seconds_);
    }
    if (connect_timeout_seconds_ > 0) {
        curl_easy_setopt(curl_, CURLOPT_CONNECTTIMEOUT, connect_timeout_seconds_);
    }

    // Worker threads must not get SIGPIPE / SIGALRM from curl
    curl_easy_setopt(curl_, CURLOPT_NOSIGNAL, 1L);

    if (verbose_) {
        curl_easy_setopt(curl_, CURLOPT_VERBOSE, 1L);
    }

    curl_easy_setopt(curl_, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl_, CURLOPT_MAXREDIRS, 5L);
}

struct curl_slist* HttpClient::set_headers(const std::map<std::string, std::string>& headers) {
    struct curl_slist* header_list = nullptr;

    for (const auto& [key, value] : headers) {
        std::string header = key + ": " + value;
        header_list = curl_slist_append(header_list, header.c_str());
    }

    return header_list;
}

size_t HttpClient::write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    size_t total_size = size * nmemb;
    auto* response = static_cast<HttpResponse*>(userdata);
    response->body.append(ptr, total_size);
    return total_size;
}

size_t HttpClient::header_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    size_t total_size = size * nmemb;
    auto* response = static_cast<HttpResponse*>(userdata);

    std::string header_line(ptr, total_size);

    // Parse header line (format: "Key: Value\r\n")
    size_t colon_pos = header_line.find(':');
    if (colon_pos != std::string::npos) {
        std::string key = header_line.substr(0, colon_pos);
        response->headers[key] = bridge::trim(header_line.substr(colon_pos + 1));
    }

    return total_size;
}

size_t HttpClient::stream_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    size_t total_size = size * nmemb;
    auto* data = static_cast<StreamCallbackData*>(userdata);

    if (!data->continue_streaming) {
        return 0; // Abort transfer
    }

    if (data->callback) {
        data->continue_streaming = data->callback(std::string(ptr, total_size));
        if (!data->continue_streaming) {
            data->response->aborted = true;
        }
    }

    return data->continue_streaming ? total_size : 0;
}

void HttpClient::perform(const char* what, const std::string& url,
                         const std::map<std::string, std::string>& headers, HttpResponse& response) {
    curl_easy_setopt(curl_, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl_, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(curl_, CURLOPT_HEADERDATA, &response);

    struct curl_slist* header_list = set_headers(headers);
    if (header_list) {
        curl_easy_setopt(curl_, CURLOPT_HTTPHEADER, header_list);
    }

    CURLcode res = curl_easy_perform(curl_);
    curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &response.status_code);

    if (header_list) {
        curl_slist_free_all(header_list);
    }

    if (res != CURLE_OK) {
        response.error_message = curl_easy_strerror(res);
        // CURLE_WRITE_ERROR happens when the stream callback returns false
        if (res == CURLE_WRITE_ERROR && response.aborted) {
            dout(1) << "HTTP " << what << " stopped by callback" << std::endl;
        } else {
            LOG_WARN(std::string("HTTP ") + what + " " + url + " failed: " + response.error_message);
        }
    } else {
        dout(1) << "HTTP " << what << " completed with status: " << response.status_code << std::endl;
    }
}

HttpResponse HttpClient::get(const std::string& url,
                             const std::map<std::string, std::string>& headers) {
    HttpResponse response;
    if (!curl_) {
        response.error_message = "CURL not initialized";
        return response;
    }

    dout(1) << "HTTP GET: " << url << std::endl;

    configure_curl();
    curl_easy_setopt(curl_, CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl_, CURLOPT_WRITEDATA, &response);

    perform("GET", url, headers, response);
    return response;
}

HttpResponse HttpClient::post(const std::string& url,
                              const std::string& body,
                              const std::map<std::string, std::string>& headers) {
    HttpResponse response;
    if (!curl_) {
        response.error_message = "CURL not initialized";
        return response;
    }

    dout(1) << "HTTP POST: " << url << " (" << body.length() << " bytes)" << std::endl;
    if (g_debug_level >= 5 && body.length() < 50000) {
        dout(5) << "POST body:\n" << body << std::endl;
    }

    configure_curl();
    curl_easy_setopt(curl_, CURLOPT_POST, 1L);
    curl_easy_setopt(curl_, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl_, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.length()));
    curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl_, CURLOPT_WRITEDATA, &response);

    perform("POST", url, headers, response);

    if (response.error_message.empty()) {
        dout(2) << "Response body: " << bridge::preview(response.body, 100) << std::endl;
    }
    return response;
}

HttpResponse HttpClient::post_stream(const std::string& url,
                                     const std::string& body,
                                     const std::map<std::string, std::string>& headers,
                                     StreamCallback callback) {
    HttpResponse response;
    if (!curl_) {
        response.error_message = "CURL not initialized";
        return response;
    }

    dout(1) << "HTTP POST (streaming): " << url << " (" << body.length() << " bytes)" << std::endl;
    if (g_debug_level >= 5 && body.length() < 50000) {
        dout(5) << "POST body:\n" << body << std::endl;
    }

    configure_curl();
    curl_easy_setopt(curl_, CURLOPT_POST, 1L);
    curl_easy_setopt(curl_, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl_, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.length()));

    StreamCallbackData callback_data;
    callback_data.callback = std::move(callback);
    callback_data.response = &response;
    curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, stream_callback);
    curl_easy_setopt(curl_, CURLOPT_WRITEDATA, &callback_data);

    // Generation can run far longer than a normal request
    curl_easy_setopt(curl_, CURLOPT_TIMEOUT, 0L);

    perform("POST (streaming)", url, headers, response);
    return response;
}
